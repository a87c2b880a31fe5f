#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "aranet_error.h"
#include "ble_session.h"
#include "format.h"
#include "logging.h"
#include "monitor.h"
#include "settings.h"
#include "simpleble_adapter.h"

namespace {

struct CommandLine {
    std::string command;
    std::string device;
    std::optional<long> timeout;
    bool verbose = false;
    std::optional<std::string> config;
};

void print_usage() {
    std::cout << "Usage: aranetctl [--verbose|-v] [--config <file>] [--timeout|-t N] <command>\n"
              << "\n"
              << "Commands:\n"
              << "  scan                 Scan for nearby Aranet devices for N seconds\n"
              << "  read <device>        Read current sensor values\n"
              << "  monitor <device>     Read again each time the device takes a measurement\n"
              << "\n"
              << "<device> is a device id or part of its name. For read and monitor,\n"
              << "--timeout sets how long to scan for the device.\n";
}

bool parse_command_line(int argc, char* argv[], CommandLine& out) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            out.verbose = true;
        } else if (arg == "--config") {
            if (++i >= argc) return false;
            out.config = argv[i];
        } else if (arg.rfind("--config=", 0) == 0) {
            out.config = arg.substr(9);
        } else if (arg == "--timeout" || arg == "-t") {
            if (++i >= argc) return false;
            try {
                out.timeout = std::stol(argv[i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid timeout: " << argv[i] << std::endl;
                return false;
            }
            if (*out.timeout <= 0) return false;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            return false;
        } else if (out.command.empty()) {
            out.command = arg;
        } else if (out.device.empty()) {
            out.device = arg;
        } else {
            return false;
        }
    }

    if (out.command == "scan") return out.device.empty();
    if (out.command == "read" || out.command == "monitor") return !out.device.empty();
    return false;
}

aranet::Settings load_cli_settings(const CommandLine& cli) {
    aranet::Settings settings;
    const std::string cfgName = cli.config.value_or(aranet::DEFAULT_CONFIG_FILENAME);
    const std::string cfgPath = aranet::resolve_config_path(cfgName);
    if (cfgPath.empty()) {
        // Only worth a warning when the user asked for a file.
        if (cli.config) {
            std::cerr << "Config '" << cfgName << "' not found. CWD="
                      << std::filesystem::current_path().string() << "\n";
        }
    } else {
        aranet::load_settings_file(cfgPath, settings);
    }

    if (cli.verbose) settings.verbose = true;
    if (cli.timeout && !settings.apply_timeout_override(cli.command, std::chrono::seconds(*cli.timeout))) {
        std::cerr << "--timeout has no effect on '" << cli.command << "'" << std::endl;
    }
    return settings;
}

int run_scan(aranet::Session& session, const aranet::Settings& settings) {
    std::cout << "Scanning for Aranet devices..." << std::endl;
    auto devices = session.scan(settings.scan_timeout);

    if (devices.empty()) {
        std::cout << "No devices found." << std::endl;
        return EXIT_SUCCESS;
    }
    std::cout << "Found " << devices.size() << " device(s):\n" << std::endl;
    for (size_t i = 0; i < devices.size(); ++i) {
        std::cout << (i + 1) << ". " << devices[i].display_name() << " (" << devices[i].id << ")" << std::endl;
    }
    return EXIT_SUCCESS;
}

aranet::DeviceIdentity locate(aranet::Session& session, const aranet::Settings& settings,
                              const std::string& query) {
    std::cout << "Scanning for device '" << query << "'..." << std::endl;
    auto devices = session.scan(settings.device_scan_timeout);
    auto device = aranet::find_device(devices, query);
    std::cout << "Connecting to " << device.display_name() << "..." << std::endl;
    return device;
}

int run_read(aranet::Session& session, const aranet::Settings& settings, const std::string& query) {
    auto device = locate(session, settings, query);
    auto reading = session.read(device);
    std::cout << aranet::format_reading(reading);
    return EXIT_SUCCESS;
}

int run_monitor(aranet::Session& session, const aranet::Settings& settings, const std::string& query) {
    auto device = locate(session, settings, query);
    auto monitor = std::make_shared<aranet::Monitor>(session, settings.monitor_options());

    std::cout << "Monitoring started. Press Enter to stop." << std::endl;
    std::thread([monitor]() {
        std::string line;
        std::getline(std::cin, line);
        monitor->stop();
    }).detach();

    monitor->run(device, [](const aranet::Reading& reading) {
        std::cout << aranet::format_reading(reading) << std::endl;
    });
    std::cout << "Monitoring stopped." << std::endl;
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char* argv[]) {
    CommandLine cli;
    if (!parse_command_line(argc, argv, cli)) {
        print_usage();
        return EXIT_FAILURE;
    }

    const aranet::Settings settings = load_cli_settings(cli);
    aranet::set_debug_enabled(settings.verbose);

    try {
        aranet::SimpleBleAdapter adapter;
        aranet::Session session(adapter, settings.session_options());

        if (cli.command == "scan") return run_scan(session, settings);
        if (cli.command == "read") return run_read(session, settings, cli.device);
        return run_monitor(session, settings, cli.device);
    } catch (const aranet::Error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
