#include <tvscan/probe.hpp>
#include <tvscan/discovery.hpp>
#include <tvscan/process.hpp>
#include <tvscan/utils.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <exception>
#include <stdexcept>
#include <system_error>
#include <thread>

// joins every port check before returning
template <typename F>
static bool probe_ports(const std::vector<uint16_t>& ports, const std::string& ip, const std::string& method, F check) {
    std::vector<std::future<bool>> futures;
    futures.reserve(ports.size());
    for (auto port : ports) {
        futures.push_back(std::async(std::launch::async, check, port));
    }

    bool reachable = false;
    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            if (futures[i].get() && !reachable) {
                spdlog::info("{} connected to {}:{}", method, ip, ports[i]);
                reachable = true;
            }
        } catch (const std::exception& e) {
            spdlog::debug("{} to {}:{} failed: {}", method, ip, ports[i], e.what());
        }
    }
    return reachable;
}

ExternalPortProbe::ExternalPortProbe(std::vector<uint16_t> ports, ProbeOptions options)
    : ports_(std::move(ports)),
      options_(std::move(options)) {}

std::string ExternalPortProbe::name() const {
    return options_.nc_command;
}

bool ExternalPortProbe::attempt(const std::string& ip) {
    if (!is_command_available(options_.nc_command)) {
        throw std::runtime_error(fmt::format("{} is not installed", options_.nc_command));
    }

    // nc only takes whole seconds
    auto secs = (options_.timeout.count() + 999) / 1000;
    if (secs < 1) {
        secs = 1;
    }
    auto host = escape_shell_arg(ip);
    const auto& nc = options_.nc_command;
    return probe_ports(ports_, ip, name(), [&nc, &host, secs](uint16_t port) {
        auto cmd = fmt::format("{} -z -w{} {} {} >/dev/null 2>&1", nc, secs, host, port);
        return run_command(cmd).exit_code == 0;
    });
}

SocketPortProbe::SocketPortProbe(std::vector<uint16_t> ports, ProbeOptions options)
    : ports_(std::move(ports)),
      options_(std::move(options)) {}

std::string SocketPortProbe::name() const {
    return "socket";
}

bool SocketPortProbe::attempt(const std::string& ip) {
    auto timeout = options_.timeout;
    return probe_ports(ports_, ip, name(), [&ip, timeout](uint16_t port) {
        return tcp_connect(ip, port, timeout);
    });
}

ReverseDnsProbe::ReverseDnsProbe(ProbeOptions options) : options_(std::move(options)) {}

std::string ReverseDnsProbe::name() const {
    return "reverse DNS";
}

bool ReverseDnsProbe::attempt(const std::string& ip) {
    // getnameinfo has no timeout; the detached thread must not log
    auto result = std::make_shared<std::promise<HostLookup>>();
    auto future = result->get_future();
    std::thread([result, ip] {
        try {
            result->set_value(reverse_lookup(ip));
        } catch (...) {
            result->set_exception(std::current_exception());
        }
    }).detach();

    if (future.wait_for(options_.timeout) != std::future_status::ready) {
        spdlog::debug("reverse lookup of {} timed out", ip);
        return false;
    }
    auto lookup = future.get();
    if (!lookup.host) {
        spdlog::debug("no hostname for {}: {}", ip, lookup.error);
        return false;
    }
    spdlog::info("{} resolves to {}, considering it reachable", ip, *lookup.host);
    return true;
}

void ProbeChain::add(std::unique_ptr<ProbeMethod> method) {
    methods_.push_back(std::move(method));
}

size_t ProbeChain::size() const {
    return methods_.size();
}

bool ProbeChain::run(const std::string& ip) const {
    for (const auto& method : methods_) {
        try {
            if (method->attempt(ip)) {
                return true;
            }
            spdlog::debug("{} probe found no sign of {}", method->name(), ip);
        } catch (const std::exception& e) {
            spdlog::debug("{} probe of {} failed: {}", method->name(), ip, e.what());
        }
    }
    return false;
}

ReachabilityProber::ReachabilityProber(std::vector<uint16_t> ports, ProbeOptions options) {
    chain_.add(std::make_unique<ExternalPortProbe>(ports, options));
    chain_.add(std::make_unique<SocketPortProbe>(ports, options));
    chain_.add(std::make_unique<ReverseDnsProbe>(options));
}

ReachabilityProber::ReachabilityProber(ProbeChain chain) : chain_(std::move(chain)) {}

bool ReachabilityProber::is_reachable(const std::string& ip) const {
    spdlog::info("testing connection to {}", ip);
    if (chain_.run(ip)) {
        return true;
    }
    spdlog::info("{} is not reachable", ip);
    return false;
}

std::future<bool> ReachabilityProber::is_reachable_async(const std::string& ip) const {
    return std::async(std::launch::async, [this, ip] { return is_reachable(ip); });
}

ReachabilityProber make_prober(const VendorDiscovery& discovery, ProbeOptions options) {
    return ReachabilityProber(discovery.control_ports(), std::move(options));
}

bool tcp_connect(const std::string& ip, uint16_t port, std::chrono::milliseconds timeout) {
    in_addr addr{};
    if (inet_pton(AF_INET, ip.c_str(), &addr) != 1) {
        throw std::invalid_argument(fmt::format("'{}' is not an IPv4 address", ip));
    }

    int fd = socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "socket");
    }
    auto guard = finally([fd] { close(fd); });

    sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port = htons(port);
    sa.sin_addr = addr;
    if (connect(fd, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) == 0) {
        return true;
    }
    if (errno != EINPROGRESS) {
        spdlog::trace("connect to {}:{}: {}", ip, port, strerror(errno));
        return false;
    }

    pollfd event{fd, POLLOUT, 0};
    switch (poll(&event, 1, static_cast<int>(timeout.count()))) {
        case -1:
            spdlog::trace("poll on {}:{}: {}", ip, port, strerror(errno));
            return false;
        case 0:
            return false;
        default:
            break;
    }

    int err = 0;
    socklen_t len = sizeof(err);
    if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) != 0) {
        return false;
    }
    return err == 0;
}

HostLookup reverse_lookup(const std::string& ip) {
    sockaddr_in sa{};
    sa.sin_family = AF_INET;
    if (inet_pton(AF_INET, ip.c_str(), &sa.sin_addr) != 1) {
        throw std::invalid_argument(fmt::format("'{}' is not an IPv4 address", ip));
    }

    char host[NI_MAXHOST];
    auto rc = getnameinfo(reinterpret_cast<sockaddr*>(&sa), sizeof(sa), host, sizeof(host), nullptr, 0, NI_NAMEREQD);
    HostLookup lookup;
    if (rc != 0) {
        lookup.error = gai_strerror(rc);
    } else {
        lookup.host = std::string(host);
    }
    return lookup;
}
