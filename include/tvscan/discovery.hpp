#ifndef TVSCAN_DISCOVERY_HPP
#define TVSCAN_DISCOVERY_HPP

#include <tvscan/arp_scanner.hpp>
#include <tvscan/blacklist.hpp>
#include <tvscan/discovered_device.hpp>
#include <tvscan/mac.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

class VendorDiscovery {
  public:
    virtual ~VendorDiscovery() = default;

    virtual std::string name() const = 0;
    virtual const MacPrefixTable& mac_prefixes() const = 0;

    virtual bool is_match_by_description(const std::optional<std::string>& description) const = 0;

    virtual std::optional<std::string> warning_message() const;

    virtual void enrich(DiscoveredDevice& device) const;

    // Known control ports, most likely first.
    virtual std::vector<uint16_t> control_ports() const = 0;
};

DiscoveredDevice classify(const VendorDiscovery& discovery, const ScanRecord& record);

bool is_vendor_device(const VendorDiscovery& discovery, const ScanRecord& record);

std::vector<DiscoveredDevice> scan_network(const VendorDiscovery& discovery,
                                           ScanSource& source,
                                           const Blacklist& blacklist);

#endif
