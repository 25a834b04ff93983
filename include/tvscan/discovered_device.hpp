#ifndef TVSCAN_DISCOVERED_DEVICE_HPP
#define TVSCAN_DISCOVERED_DEVICE_HPP

#include <map>
#include <optional>
#include <string>

struct DiscoveredDevice {
    std::string ip;
    std::string mac;
    std::string description;
    std::string device_type;
    bool untested{false};
    std::optional<std::string> warning;
    std::map<std::string, std::string> extra;
};

#endif
