#ifndef TVSCAN_NET_INTERFACE_HPP
#define TVSCAN_NET_INTERFACE_HPP

#include <optional>
#include <string>

class NetInterface {
  private:
    int id_;

  public:
    explicit NetInterface(const std::string& name);

    bool valid() const;
};

// first up, non-loopback interface with an IPv4 address
std::optional<std::string> default_interface();

#endif
