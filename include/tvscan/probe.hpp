#ifndef TVSCAN_PROBE_HPP
#define TVSCAN_PROBE_HPP

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class VendorDiscovery;

struct ProbeOptions {
    std::chrono::milliseconds timeout{1000};
    std::string nc_command{"nc"};
};

class ProbeMethod {
  public:
    virtual ~ProbeMethod() = default;

    virtual std::string name() const = 0;
    virtual bool attempt(const std::string& ip) = 0;
};

class ExternalPortProbe : public ProbeMethod {
  private:
    std::vector<uint16_t> ports_;
    ProbeOptions options_;

  public:
    ExternalPortProbe(std::vector<uint16_t> ports, ProbeOptions options);

    std::string name() const override;
    bool attempt(const std::string& ip) override;
};

class SocketPortProbe : public ProbeMethod {
  private:
    std::vector<uint16_t> ports_;
    ProbeOptions options_;

  public:
    SocketPortProbe(std::vector<uint16_t> ports, ProbeOptions options);

    std::string name() const override;
    bool attempt(const std::string& ip) override;
};

class ReverseDnsProbe : public ProbeMethod {
  private:
    ProbeOptions options_;

  public:
    explicit ReverseDnsProbe(ProbeOptions options);

    std::string name() const override;
    bool attempt(const std::string& ip) override;
};

class ProbeChain {
  private:
    std::vector<std::unique_ptr<ProbeMethod>> methods_;

  public:
    ProbeChain() = default;
    ProbeChain(ProbeChain&&) = default;
    ProbeChain& operator=(ProbeChain&&) = default;

    void add(std::unique_ptr<ProbeMethod> method);
    size_t size() const;

    bool run(const std::string& ip) const;
};

class ReachabilityProber {
  private:
    ProbeChain chain_;

  public:
    ReachabilityProber(std::vector<uint16_t> ports, ProbeOptions options);
    explicit ReachabilityProber(ProbeChain chain);

    bool is_reachable(const std::string& ip) const;

    // prober must outlive the future
    std::future<bool> is_reachable_async(const std::string& ip) const;
};

ReachabilityProber make_prober(const VendorDiscovery& discovery, ProbeOptions options = {});

bool tcp_connect(const std::string& ip, uint16_t port, std::chrono::milliseconds timeout);

struct HostLookup {
    std::optional<std::string> host;
    std::string error;
};

HostLookup reverse_lookup(const std::string& ip);

#endif
