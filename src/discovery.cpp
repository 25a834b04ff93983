#include <tvscan/discovery.hpp>

#include <spdlog/spdlog.h>

#include <exception>

std::optional<std::string> VendorDiscovery::warning_message() const {
    return std::nullopt;
}

void VendorDiscovery::enrich(DiscoveredDevice&) const {}

bool is_vendor_device(const VendorDiscovery& discovery, const ScanRecord& record) {
    const auto& table = discovery.mac_prefixes();
    if (table.find(mac_prefix(record.mac)) != table.end()) {
        return true;
    }
    return discovery.is_match_by_description(record.description);
}

DiscoveredDevice classify(const VendorDiscovery& discovery, const ScanRecord& record) {
    const auto& table = discovery.mac_prefixes();
    auto entry = table.find(mac_prefix(record.mac));
    auto warning = discovery.warning_message();
    if (warning && warning->empty()) {
        warning.reset();
    }

    DiscoveredDevice device;
    device.ip = record.ip;
    device.mac = canonical_mac(record.mac);
    if (record.description && !record.description->empty()) {
        device.description = *record.description;
    } else if (entry != table.end()) {
        device.description = entry->second;
    } else {
        device.description = discovery.name() + " Device";
    }
    if (entry != table.end()) {
        device.device_type = entry->second;
    } else {
        device.device_type = "Unknown " + discovery.name() + " Model";
    }
    device.untested = warning.has_value();
    device.warning = std::move(warning);
    return device;
}

std::vector<DiscoveredDevice> scan_network(const VendorDiscovery& discovery,
                                           ScanSource& source,
                                           const Blacklist& blacklist) {
    std::vector<DiscoveredDevice> devices;
    try {
        for (const auto& record : source.scan()) {
            if (record.mac.empty()) {
                continue;
            }
            if (blacklist.contains(record.mac)) {
                spdlog::debug("skipping blacklisted device {}", record.mac);
                continue;
            }
            if (!is_vendor_device(discovery, record)) {
                continue;
            }

            auto device = classify(discovery, record);
            discovery.enrich(device);
            spdlog::info("found {} device: {} ({}) - {}", discovery.name(), device.ip, device.mac, device.description);
            if (device.warning) {
                spdlog::warn("{}", *device.warning);
            }
            devices.push_back(std::move(device));
        }
    } catch (const std::exception& e) {
        spdlog::error("error during {} network scan: {}", discovery.name(), e.what());
        return {};
    }
    return devices;
}
