#include <tvscan/arp_scanner.hpp>
#include <tvscan/net_interface.hpp>
#include <tvscan/process.hpp>
#include <tvscan/utils.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <exception>

std::vector<ScanRecord> parse_arp_scan(std::string_view output) {
    std::vector<ScanRecord> records;
    for (auto line : split_all(output, '\n')) {
        if (line.find('\t') == std::string_view::npos) {
            continue;
        }
        auto fields = split_all(trim(line), '\t');
        ScanRecord rec;
        rec.ip = std::string(fields[0]);
        if (fields.size() >= 2) {
            rec.mac = std::string(fields[1]);
        }
        if (fields.size() >= 3) {
            rec.description = std::string(fields[2]);
        }
        records.push_back(std::move(rec));
    }
    return records;
}

ArpScanner::ArpScanner(ArpScanOptions options) : options_(std::move(options)) {}

std::string ArpScanner::command_line() const {
    auto iface = options_.iface;
    if (iface.empty()) {
        iface = default_interface().value_or(std::string());
    }
    if (iface.empty()) {
        return fmt::format("{} --localnet", options_.command);
    }
    return fmt::format("{} --localnet --interface={}", options_.command, escape_shell_arg(iface));
}

std::vector<ScanRecord> ArpScanner::scan() {
    if (!is_command_available(options_.command)) {
        spdlog::error("{} not found, cannot scan the local network", options_.command);
        return {};
    }

    try {
        auto cmd = command_line();
        spdlog::debug("running {}", cmd);
        auto result = run_command(cmd + " 2>/dev/null");
        if (result.exit_code != 0) {
            spdlog::error("error running {}: exit status {}", options_.command, result.exit_code);
            return {};
        }
        auto records = parse_arp_scan(result.output);
        spdlog::debug("{} reported {} hosts", options_.command, records.size());
        return records;
    } catch (const std::exception& e) {
        spdlog::error("error during network scan: {}", e.what());
        return {};
    }
}
