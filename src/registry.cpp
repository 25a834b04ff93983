#include <tvscan/registry.hpp>
#include <tvscan/vendors.hpp>

#include <spdlog/spdlog.h>

#include <set>

DiscoveryRegistry::DiscoveryRegistry() {
    factories_.emplace("webos", [] { return std::make_shared<WebOSDiscovery>(); });
    factories_.emplace("tizen", [] { return std::make_shared<TizenDiscovery>(); });
    factories_.emplace("android", [] { return std::make_shared<AndroidTvDiscovery>(); });
}

DiscoveryRegistry& DiscoveryRegistry::global() {
    static DiscoveryRegistry registry;
    return registry;
}

std::shared_ptr<VendorDiscovery> DiscoveryRegistry::get(const std::string& key) {
    std::lock_guard<std::mutex> lock{mut_};
    auto it = instances_.find(key);
    if (it != instances_.end()) {
        return it->second;
    }

    auto factory = factories_.find(key);
    if (factory == factories_.end()) {
        spdlog::debug("no discovery implementation for '{}'", key);
        return nullptr;
    }

    auto discovery = factory->second();
    if (!discovery) {
        spdlog::error("factory for '{}' produced no discovery implementation", key);
        return nullptr;
    }
    spdlog::debug("created {} discovery for '{}'", discovery->name(), key);
    instances_.emplace(key, discovery);
    return discovery;
}

void DiscoveryRegistry::register_discovery(const std::string& key, std::shared_ptr<VendorDiscovery> discovery) {
    std::lock_guard<std::mutex> lock{mut_};
    if (discovery) {
        instances_[key] = std::move(discovery);
    } else {
        instances_.erase(key);
    }
}

void DiscoveryRegistry::register_factory(const std::string& key, Factory factory) {
    std::lock_guard<std::mutex> lock{mut_};
    factories_[key] = std::move(factory);
    instances_.erase(key);
}

std::vector<std::string> DiscoveryRegistry::keys() const {
    std::lock_guard<std::mutex> lock{mut_};
    std::set<std::string> keys;
    for (const auto& entry : factories_) {
        keys.insert(entry.first);
    }
    for (const auto& entry : instances_) {
        keys.insert(entry.first);
    }
    return std::vector<std::string>(keys.begin(), keys.end());
}

std::shared_ptr<VendorDiscovery> get_discovery(const std::string& key) {
    return DiscoveryRegistry::global().get(key);
}
