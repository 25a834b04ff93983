#include <tvscan/vendors.hpp>

#include <array>

std::string TizenDiscovery::name() const {
    return "Samsung Tizen";
}

const MacPrefixTable& TizenDiscovery::mac_prefixes() const {
    static const MacPrefixTable table = {
        {"00:00:F0", "Samsung Electronics"},
        {"00:12:FB", "Samsung Electronics"},
        {"00:15:99", "Samsung Electronics"},
        {"00:16:32", "Samsung Electronics"},
        {"00:1E:E1", "Samsung Electronics"},
        {"00:21:19", "Samsung Electronics"},
        {"00:23:39", "Samsung Electronics"},
        {"00:24:54", "Samsung Electronics"},
        {"00:26:37", "Samsung Electronics"},
        {"5C:0A:5B", "Samsung Electronics"},
        {"64:1C:AE", "Samsung Smart TV"},
        {"8C:71:F8", "Samsung Smart TV"},
        {"8C:79:F5", "Samsung Smart TV"},
        {"90:F1:AA", "Samsung Smart TV"},
        {"94:35:0A", "Samsung Smart TV"},
        {"F4:7B:5E", "Samsung Smart TV"},
        {"F8:3F:51", "Samsung Tizen TV"},
    };
    return table;
}

bool TizenDiscovery::is_match_by_description(const std::optional<std::string>& description) const {
    if (!description) {
        return false;
    }
    static constexpr std::array<const char*, 2> tokens = {"Samsung", "Tizen"};
    for (auto token : tokens) {
        if (description->find(token) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::optional<std::string> TizenDiscovery::warning_message() const {
    return "Samsung Tizen support is experimental and has not been tested on real devices";
}

void TizenDiscovery::enrich(DiscoveredDevice& device) const {
    device.extra["platform"] = "tizen";
    device.extra["remote_port"] = "8002";
}

std::vector<uint16_t> TizenDiscovery::control_ports() const {
    return {8001, 8002, 8080, 9197};
}
