#ifndef TVSCAN_VENDORS_HPP
#define TVSCAN_VENDORS_HPP

#include <tvscan/discovery.hpp>

class WebOSDiscovery : public VendorDiscovery {
  public:
    std::string name() const override;
    const MacPrefixTable& mac_prefixes() const override;
    bool is_match_by_description(const std::optional<std::string>& description) const override;
    std::vector<uint16_t> control_ports() const override;
};

class TizenDiscovery : public VendorDiscovery {
  public:
    std::string name() const override;
    const MacPrefixTable& mac_prefixes() const override;
    bool is_match_by_description(const std::optional<std::string>& description) const override;
    std::optional<std::string> warning_message() const override;
    void enrich(DiscoveredDevice& device) const override;
    std::vector<uint16_t> control_ports() const override;
};

class AndroidTvDiscovery : public VendorDiscovery {
  public:
    std::string name() const override;
    const MacPrefixTable& mac_prefixes() const override;
    bool is_match_by_description(const std::optional<std::string>& description) const override;
    std::optional<std::string> warning_message() const override;
    void enrich(DiscoveredDevice& device) const override;
    std::vector<uint16_t> control_ports() const override;
};

#endif
