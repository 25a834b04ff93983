#ifndef TVSCAN_ARP_SCANNER_HPP
#define TVSCAN_ARP_SCANNER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct ScanRecord {
    std::string ip;
    std::string mac;
    std::optional<std::string> description;
};

class ScanSource {
  public:
    virtual ~ScanSource() = default;

    virtual std::vector<ScanRecord> scan() = 0;
};

std::vector<ScanRecord> parse_arp_scan(std::string_view output);

struct ArpScanOptions {
    std::string command{"arp-scan"};
    std::string iface;
};

class ArpScanner : public ScanSource {
  public:
    ArpScanner() = default;
    explicit ArpScanner(ArpScanOptions options);

    std::vector<ScanRecord> scan() override;

    std::string command_line() const;

  private:
    ArpScanOptions options_;
};

#endif
