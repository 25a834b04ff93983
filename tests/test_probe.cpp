#include <gtest/gtest.h>

#include <tvscan/probe.hpp>
#include <tvscan/vendors.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

class FakeMethod : public ProbeMethod {
  public:
    enum class Outcome { Success, Failure, Throw };

    FakeMethod(std::string name, Outcome outcome, int* calls)
        : name_(std::move(name)), outcome_(outcome), calls_(calls) {}

    std::string name() const override {
        return name_;
    }

    bool attempt(const std::string&) override {
        ++*calls_;
        if (outcome_ == Outcome::Throw) {
            throw std::runtime_error("tool missing");
        }
        return outcome_ == Outcome::Success;
    }

  private:
    std::string name_;
    Outcome outcome_;
    int* calls_;
};

// Loopback TCP listener on an ephemeral port.
class Listener {
  public:
    Listener() {
        fd_ = socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        listen(fd_, 8);
        socklen_t len = sizeof(addr);
        getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
    }

    ~Listener() {
        close();
    }

    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    uint16_t port() const {
        return port_;
    }

  private:
    int fd_{-1};
    uint16_t port_{0};
};

ProbeOptions short_timeout() {
    ProbeOptions options;
    options.timeout = std::chrono::milliseconds(300);
    options.nc_command = "/nonexistent/nc";
    return options;
}

}  // namespace

TEST(ProbeChainTest, StopsAtFirstSuccess) {
    int external = 0;
    int socket = 0;
    int dns = 0;
    ProbeChain chain;
    chain.add(std::make_unique<FakeMethod>("external", FakeMethod::Outcome::Throw, &external));
    chain.add(std::make_unique<FakeMethod>("socket", FakeMethod::Outcome::Success, &socket));
    chain.add(std::make_unique<FakeMethod>("dns", FakeMethod::Outcome::Success, &dns));

    EXPECT_TRUE(chain.run("192.168.1.5"));
    EXPECT_EQ(external, 1);
    EXPECT_EQ(socket, 1);
    EXPECT_EQ(dns, 0);
}

TEST(ProbeChainTest, ExhaustionIsNotReachable) {
    int external = 0;
    int socket = 0;
    int dns = 0;
    ProbeChain chain;
    chain.add(std::make_unique<FakeMethod>("external", FakeMethod::Outcome::Failure, &external));
    chain.add(std::make_unique<FakeMethod>("socket", FakeMethod::Outcome::Throw, &socket));
    chain.add(std::make_unique<FakeMethod>("dns", FakeMethod::Outcome::Failure, &dns));

    EXPECT_FALSE(chain.run("192.168.1.5"));
    EXPECT_EQ(external, 1);
    EXPECT_EQ(socket, 1);
    EXPECT_EQ(dns, 1);
}

TEST(ProbeChainTest, EmptyChainIsNotReachable) {
    ProbeChain chain;
    EXPECT_FALSE(chain.run("192.168.1.5"));
}

TEST(ReachabilityTest, SocketSuccessSkipsReverseDns) {
    Listener listener;
    int dns = 0;
    ProbeChain chain;
    chain.add(std::make_unique<ExternalPortProbe>(std::vector<uint16_t>{listener.port()}, short_timeout()));
    chain.add(std::make_unique<SocketPortProbe>(std::vector<uint16_t>{listener.port()}, short_timeout()));
    chain.add(std::make_unique<FakeMethod>("dns", FakeMethod::Outcome::Success, &dns));

    ReachabilityProber prober{std::move(chain)};
    EXPECT_TRUE(prober.is_reachable("127.0.0.1"));
    EXPECT_EQ(dns, 0);
}

TEST(ReachabilityTest, AllMethodsFailingCompletesWithinTimeouts) {
    Listener listener;
    auto port = listener.port();
    listener.close();

    int dns = 0;
    ProbeChain chain;
    chain.add(std::make_unique<ExternalPortProbe>(std::vector<uint16_t>{port}, short_timeout()));
    chain.add(std::make_unique<SocketPortProbe>(std::vector<uint16_t>{port, port}, short_timeout()));
    chain.add(std::make_unique<FakeMethod>("dns", FakeMethod::Outcome::Failure, &dns));
    ReachabilityProber prober{std::move(chain)};

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(prober.is_reachable("127.0.0.1"));
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_EQ(dns, 1);
    EXPECT_LT(elapsed, std::chrono::milliseconds(3 * 300 + 500));
}

TEST(ReachabilityTest, AsyncProbeReportsResult) {
    int calls = 0;
    ProbeChain chain;
    chain.add(std::make_unique<FakeMethod>("socket", FakeMethod::Outcome::Success, &calls));
    ReachabilityProber prober{std::move(chain)};

    auto result = prober.is_reachable_async("10.0.0.2");
    EXPECT_TRUE(result.get());
    EXPECT_EQ(calls, 1);
}

TEST(ExternalPortProbeTest, MissingToolThrows) {
    ExternalPortProbe probe{{3000}, short_timeout()};
    EXPECT_THROW(probe.attempt("127.0.0.1"), std::runtime_error);
}

TEST(ExternalPortProbeTest, ZeroExitIsReachable) {
    auto options = short_timeout();
    options.nc_command = "true";
    ExternalPortProbe probe{{3000, 3001}, options};
    EXPECT_TRUE(probe.attempt("127.0.0.1"));
}

TEST(ExternalPortProbeTest, NonZeroExitIsNotReachable) {
    auto options = short_timeout();
    options.nc_command = "false";
    ExternalPortProbe probe{{3000, 3001}, options};
    EXPECT_FALSE(probe.attempt("127.0.0.1"));
}

TEST(ExternalPortProbeTest, CommandWithWrapperRuns) {
    auto options = short_timeout();
    options.nc_command = "env true";
    ExternalPortProbe probe{{3000}, options};
    EXPECT_TRUE(probe.attempt("127.0.0.1"));
}

TEST(ReverseDnsProbeTest, LookupReportsHostOrError) {
    auto lookup = reverse_lookup("127.0.0.1");
    if (lookup.host) {
        EXPECT_TRUE(lookup.error.empty());
    } else {
        EXPECT_FALSE(lookup.error.empty());
    }
}

TEST(SocketPortProbeTest, ConnectsToOpenPort) {
    Listener listener;
    SocketPortProbe probe{{1, listener.port()}, short_timeout()};
    EXPECT_TRUE(probe.attempt("127.0.0.1"));
}

TEST(SocketPortProbeTest, ClosedPortIsNotReachable) {
    Listener listener;
    auto port = listener.port();
    listener.close();
    EXPECT_FALSE(tcp_connect("127.0.0.1", port, std::chrono::milliseconds(300)));
}

TEST(SocketPortProbeTest, InvalidAddressThrows) {
    EXPECT_THROW(tcp_connect("not-an-ip", 3000, std::chrono::milliseconds(100)), std::invalid_argument);

    SocketPortProbe probe{{3000}, short_timeout()};
    EXPECT_FALSE(probe.attempt("not-an-ip"));
}

TEST(ReverseDnsProbeTest, InvalidAddressThrows) {
    ReverseDnsProbe probe{short_timeout()};
    EXPECT_THROW(probe.attempt("not-an-ip"), std::invalid_argument);
}

TEST(ReachabilityTest, VendorPortsFeedTheProber) {
    WebOSDiscovery webos;
    EXPECT_EQ(webos.control_ports(), (std::vector<uint16_t>{3000, 3001, 8080, 8001, 8002}));
    auto prober = make_prober(webos, short_timeout());
    EXPECT_FALSE(prober.is_reachable("not-an-ip"));
}
