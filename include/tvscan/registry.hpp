#ifndef TVSCAN_REGISTRY_HPP
#define TVSCAN_REGISTRY_HPP

#include <tvscan/discovery.hpp>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class DiscoveryRegistry {
  public:
    using Factory = std::function<std::shared_ptr<VendorDiscovery>()>;

    DiscoveryRegistry();
    DiscoveryRegistry(const DiscoveryRegistry&) = delete;
    DiscoveryRegistry(DiscoveryRegistry&&) = delete;
    DiscoveryRegistry& operator=(const DiscoveryRegistry&) = delete;
    DiscoveryRegistry& operator=(DiscoveryRegistry&&) = delete;

    static DiscoveryRegistry& global();

    // Null for an unknown key.
    std::shared_ptr<VendorDiscovery> get(const std::string& key);

    void register_discovery(const std::string& key, std::shared_ptr<VendorDiscovery> discovery);

    void register_factory(const std::string& key, Factory factory);

    std::vector<std::string> keys() const;

  private:
    mutable std::mutex mut_;
    std::map<std::string, Factory> factories_;
    std::map<std::string, std::shared_ptr<VendorDiscovery>> instances_;
};

std::shared_ptr<VendorDiscovery> get_discovery(const std::string& key);

#endif
