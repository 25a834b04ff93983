#include <tvscan/blacklist.hpp>
#include <tvscan/mac.hpp>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <initializer_list>
#include <system_error>

Blacklist::Blacklist(const std::vector<std::string>& macs) {
    for (const auto& mac : macs) {
        add(mac);
    }
}

void Blacklist::add(std::string_view mac) {
    auto canon = canonical_mac(mac);
    if (!canon.empty()) {
        macs_.insert(std::move(canon));
    }
}

bool Blacklist::contains(std::string_view mac) const {
    return macs_.find(canonical_mac(mac)) != macs_.end();
}

size_t Blacklist::size() const {
    return macs_.size();
}

bool Blacklist::empty() const {
    return macs_.empty();
}

static YAML::Node find_path(YAML::Node node, std::initializer_list<const char*> path) {
    for (auto key : path) {
        if (!node.IsMap()) {
            return YAML::Node{};
        }
        node.reset(node[key]);
    }
    return node;
}

Blacklist load_blacklist(const std::string& settings_path) {
    Blacklist blacklist;
    std::error_code ec;
    if (!std::filesystem::exists(settings_path, ec)) {
        if (ec) {
            spdlog::warn("cannot access settings file {}: {}", settings_path, ec.message());
        } else {
            spdlog::debug("settings file {} not found, blacklist is empty", settings_path);
        }
        return blacklist;
    }

    try {
        auto root = YAML::LoadFile(settings_path);
        auto macs = find_path(root, {"clients", "tvs", "blacklist", "mac_addresses"});
        if (!macs.IsSequence()) {
            spdlog::debug("no TV blacklist in {}", settings_path);
            return blacklist;
        }
        for (const auto& entry : macs) {
            if (entry.IsScalar()) {
                blacklist.add(entry.as<std::string>());
            }
        }
    } catch (const YAML::Exception& e) {
        spdlog::warn("failed to read blacklist from {}: {}", settings_path, e.what());
        return Blacklist{};
    }

    spdlog::debug("loaded {} blacklisted MAC addresses", blacklist.size());
    return blacklist;
}
