#include <tvscan/arp_scanner.hpp>
#include <tvscan/blacklist.hpp>
#include <tvscan/config.hpp>
#include <tvscan/discovery.hpp>
#include <tvscan/net_interface.hpp>
#include <tvscan/probe.hpp>
#include <tvscan/registry.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>

static spdlog::level::level_enum parse_level(const std::string& log_level) {
    if (log_level == "trace") {
        return spdlog::level::trace;
    } else if (log_level == "debug") {
        return spdlog::level::debug;
    } else if (log_level == "warning") {
        return spdlog::level::warn;
    } else if (log_level == "error") {
        return spdlog::level::err;
    } else if (log_level == "off") {
        return spdlog::level::off;
    }
    return spdlog::level::info;
}

static void print_device(const DiscoveredDevice& device) {
    std::cout << device.ip << '\t' << device.mac << '\t' << device.device_type << '\t' << device.description;
    if (device.untested) {
        std::cout << "\t(untested)";
    }
    for (const auto& [key, value] : device.extra) {
        std::cout << '\t' << key << '=' << value;
    }
    std::cout << '\n';
}

static int scan(const Config& config) {
    auto discovery = get_discovery(config.vendor);
    if (!discovery) {
        spdlog::error("unknown TV type '{}'", config.vendor);
        return 1;
    }

    if (!config.iface.empty()) {
        NetInterface iface{config.iface};
        if (!iface.valid()) {
            spdlog::error("no such interface {}", config.iface);
            return 1;
        }
    }

    auto blacklist = load_blacklist(config.settings);
    ArpScanner scanner{ArpScanOptions{config.arp_scan, config.iface}};
    auto devices = scan_network(*discovery, scanner, blacklist);
    for (const auto& device : devices) {
        print_device(device);
    }
    spdlog::info("found {} {} device(s)", devices.size(), discovery->name());
    return 0;
}

static int probe(const Config& config) {
    auto discovery = get_discovery(config.vendor);
    if (!discovery) {
        spdlog::error("unknown TV type '{}'", config.vendor);
        return 1;
    }

    ProbeOptions options;
    options.timeout = std::chrono::milliseconds(config.probe_timeout_ms);
    options.nc_command = config.nc;
    auto prober = make_prober(*discovery, options);
    auto reachable = prober.is_reachable_async(config.ip).get();
    std::cout << config.ip << (reachable ? " is reachable\n" : " is not reachable\n");
    return reachable ? 0 : 1;
}

int tvscan(int argc, const char* const* argv) {
    Config config;
    std::string log_level{"info"};
    std::string log_file;

    CLI::App app("Smart TV discovery");
    app.add_option("-l,--log-level", log_level, "Logging level: trace, debug, info, warning, error, off")->capture_default_str();
    app.add_option("--log-file", log_file, "File to write logs to (stderr if not specified)");
    app.add_option("-s,--settings", config.settings, "Settings file holding the TV blacklist")->capture_default_str();

    auto scan_cmd = app.add_subcommand("scan", "Scan the local network for TVs of one type")->fallthrough();
    scan_cmd->add_option("type", config.vendor, "TV type: webos, tizen, android")->required();
    scan_cmd->add_option("-i,--interface", config.iface, "Interface to scan on (first usable interface if not specified)");
    scan_cmd->add_option("--arp-scan", config.arp_scan, "arp-scan command")->capture_default_str();

    auto probe_cmd = app.add_subcommand("probe", "Check whether a TV is reachable")->fallthrough();
    probe_cmd->add_option("type", config.vendor, "TV type: webos, tizen, android")->required();
    probe_cmd->add_option("ip", config.ip, "Address of the TV")->required();
    probe_cmd->add_option("-t,--timeout", config.probe_timeout_ms, "Timeout per probe attempt in milliseconds")->capture_default_str()->check(CLI::PositiveNumber);
    probe_cmd->add_option("--nc", config.nc, "netcat command")->capture_default_str();

    auto vendors_cmd = app.add_subcommand("vendors", "List supported TV types");

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    spdlog::init_thread_pool(8192, 1);
    auto lvl = parse_level(log_level);
    if (app.count("--log-file") > 0) {
        auto logger = spdlog::create_async<spdlog::sinks::basic_file_sink_mt>("logfile", log_file);
        logger->set_level(lvl);
        spdlog::set_default_logger(std::move(logger));
    } else {
        auto logger = spdlog::create_async<spdlog::sinks::stderr_color_sink_mt>("console");
        logger->set_level(lvl);
        spdlog::set_default_logger(std::move(logger));
    }

    if (app.got_subcommand(scan_cmd)) {
        return scan(config);
    } else if (app.got_subcommand(probe_cmd)) {
        return probe(config);
    } else if (app.got_subcommand(vendors_cmd)) {
        for (const auto& key : DiscoveryRegistry::global().keys()) {
            std::cout << key << '\n';
        }
        return 0;
    }
    spdlog::error("unknown command");
    return 1;
}

int main(int argc, char** argv) {
    try {
        try {
            return tvscan(argc, argv);
        } catch (const std::exception& e) {
            spdlog::error("{}", e.what());
        } catch (...) {
            spdlog::error("unknown error");
        }
    } catch (...) {
    }
    return 1;
}
