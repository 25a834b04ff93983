#ifndef TVSCAN_CONFIG_HPP
#define TVSCAN_CONFIG_HPP

#include <string>

struct Config {
    std::string vendor;
    std::string ip;
    std::string iface;
    std::string settings{"settings.json"};
    std::string arp_scan{"arp-scan"};
    std::string nc{"nc"};
    int probe_timeout_ms{1000};
};

#endif
