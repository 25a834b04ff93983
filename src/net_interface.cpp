#include <tvscan/net_interface.hpp>
#include <tvscan/utils.hpp>

#include <spdlog/spdlog.h>

#include <pcap.h>

#include <net/if.h>
#include <sys/socket.h>

NetInterface::NetInterface(const std::string& name)
    : id_(static_cast<int>(if_nametoindex(name.c_str()))) {}

bool NetInterface::valid() const {
    return id_ > 0;
}

std::optional<std::string> default_interface() {
    char err_buf[PCAP_ERRBUF_SIZE];
    pcap_if_t* devs = nullptr;
    if (pcap_findalldevs(&devs, err_buf) != 0) {
        spdlog::warn("unable to list network interfaces: {}", err_buf);
        return std::nullopt;
    }
    auto guard = finally([devs] {
        if (devs != nullptr) {
            pcap_freealldevs(devs);
        }
    });

    for (auto dev = devs; dev != nullptr; dev = dev->next) {
        if ((dev->flags & PCAP_IF_LOOPBACK) != 0 || (dev->flags & PCAP_IF_UP) == 0) {
            continue;
        }
        for (auto addr = dev->addresses; addr != nullptr; addr = addr->next) {
            if (addr->addr != nullptr && addr->addr->sa_family == AF_INET) {
                spdlog::debug("selected interface {}", dev->name);
                return std::string(dev->name);
            }
        }
    }
    spdlog::debug("no up, non-loopback IPv4 interface found");
    return std::nullopt;
}
