#include <tvscan/vendors.hpp>

#include <array>

std::string AndroidTvDiscovery::name() const {
    return "Android TV";
}

const MacPrefixTable& AndroidTvDiscovery::mac_prefixes() const {
    static const MacPrefixTable table = {
        // Sony Bravia
        {"00:1D:BA", "Sony Android TV"},
        {"04:5D:4B", "Sony Android TV"},
        {"10:4F:A8", "Sony Android TV"},
        {"AC:9B:0A", "Sony Android TV"},
        {"BC:60:A7", "Sony Android TV"},
        {"FC:F1:52", "Sony Android TV"},

        // Xiaomi Mi TV and Mi Box
        {"28:6C:07", "Xiaomi Android TV"},
        {"64:09:80", "Xiaomi Android TV"},
        {"78:11:DC", "Xiaomi Android TV"},
        {"F8:A4:5F", "Xiaomi Android TV"},

        // NVIDIA Shield
        {"00:04:4B", "NVIDIA Shield TV"},
        {"48:B0:2D", "NVIDIA Shield TV"},

        // Google TV streamer and Chromecast with Google TV
        {"3C:5A:B4", "Google TV"},
        {"54:60:09", "Google TV"},
        {"A4:77:33", "Google TV"},
        {"F4:F5:D8", "Google TV"},
    };
    return table;
}

bool AndroidTvDiscovery::is_match_by_description(const std::optional<std::string>& description) const {
    if (!description) {
        return false;
    }
    static constexpr std::array<const char*, 5> tokens = {"Android", "Sony", "Xiaomi", "NVIDIA", "Google"};
    for (auto token : tokens) {
        if (description->find(token) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::optional<std::string> AndroidTvDiscovery::warning_message() const {
    return "Android TV support is experimental and has not been tested on real devices";
}

void AndroidTvDiscovery::enrich(DiscoveredDevice& device) const {
    device.extra["platform"] = "android";
    device.extra["adb_port"] = "5555";
}

std::vector<uint16_t> AndroidTvDiscovery::control_ports() const {
    return {5555, 6466, 6467, 8008, 8009};
}
