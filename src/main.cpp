/**
 * wifirig
 * Brings up a test AP (or IBSS) on the router host and holds it until signalled
 */

#include <iostream>
#include <fstream>
#include <atomic>
#include <csignal>
#include <memory>
#include <string>
#include <thread>
#include <chrono>

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/lifecycle_controller.hpp"
#include "core/logger.hpp"
#include "services/hostap_config.hpp"

// Command line argument parsing
#include <getopt.h>

namespace wifirig {

/**
 * Cleared by the signal handler; the main loop then tears the session down
 */
std::atomic<bool> g_running{true};

void signal_handler(int) {
    g_running = false;
}

void setup_signal_handlers() {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGQUIT, signal_handler);
}

/**
 * Print usage information
 */
void print_usage(const char* program_name) {
    std::cout << "wifirig - AP/station lifecycle manager\n\n";
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE        Configuration file path (default: rig_config.json)\n";
    std::cout << "  -a, --ap FILE            AP description (JSON); default is an open AP on channel 1\n";
    std::cout << "  -i, --ibss               Join an IBSS network instead of running an AP\n";
    std::cout << "  -p, --peer               Connect a managed peer station to the AP\n";
    std::cout << "  -v, --verbose            Increase verbosity (-v for INFO, -vv for DEBUG)\n";
    std::cout << "  -l, --log-file FILE      Log to file instead of console\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "  --version                Show version information\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " -c rig.json               # Open AP on channel 1\n";
    std::cout << "  " << program_name << " -a wpa2_ch36.json -p      # WPA2 AP plus a local peer\n";
    std::cout << "  " << program_name << " -i -vv                    # IBSS with debug logging\n";
    std::cout << std::endl;
}

void print_version() {
    std::cout << "wifirig v0.1.0" << std::endl;
    std::cout << "Drives hostapd, wpa_supplicant and dnsmasq on Linux routers" << std::endl;
}

/**
 * Parse command line arguments
 */
struct Arguments {
    std::string config_file = "rig_config.json";
    std::string ap_file;
    bool ibss = false;
    bool peer = false;
    int verbosity = 0;
    std::string log_file;
    bool help = false;
    bool version = false;
};

Arguments parse_arguments(int argc, char* argv[]) {
    Arguments args;

    static struct option long_options[] = {
        {"config",   required_argument, 0, 'c'},
        {"ap",       required_argument, 0, 'a'},
        {"ibss",     no_argument,       0, 'i'},
        {"peer",     no_argument,       0, 'p'},
        {"verbose",  no_argument,       0, 'v'},
        {"log-file", required_argument, 0, 'l'},
        {"help",     no_argument,       0, 'h'},
        {"version",  no_argument,       0, 0},
        {0, 0, 0, 0}
    };

    int c;
    int option_index = 0;

    while ((c = getopt_long(argc, argv, "c:a:ipvl:h", long_options, &option_index)) != -1) {
        switch (c) {
            case 'c':
                args.config_file = optarg;
                break;
            case 'a':
                args.ap_file = optarg;
                break;
            case 'i':
                args.ibss = true;
                break;
            case 'p':
                args.peer = true;
                break;
            case 'v':
                args.verbosity++;
                break;
            case 'l':
                args.log_file = optarg;
                break;
            case 'h':
                args.help = true;
                break;
            case 0:
                if (option_index == 7) { // --version
                    args.version = true;
                }
                break;
            case '?':
                // getopt_long already printed an error message
                exit(1);
                break;
            default:
                std::cerr << "Unknown option: " << c << std::endl;
                exit(1);
        }
    }

    return args;
}

services::HostapConfig load_ap_config(const std::string& path) {
    if (path.empty()) {
        return services::HostapConfig{};
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open AP description: " + path);
    }
    nlohmann::json j;
    file >> j;
    return services::HostapConfig::from_json(j);
}

} // namespace wifirig

int main(int argc, char* argv[]) {
    using namespace wifirig;

    try {
        auto args = parse_arguments(argc, argv);

        if (args.help) {
            print_usage(argv[0]);
            return 0;
        }

        if (args.version) {
            print_version();
            return 0;
        }

        if (args.ibss && args.peer) {
            std::cerr << "ERROR: --peer needs an AP and cannot be combined with --ibss" << std::endl;
            return 1;
        }

        // Load configuration
        std::unique_ptr<core::RigConfig> config;
        try {
            config = core::RigConfig::from_file(args.config_file);
        } catch (const std::exception& e) {
            std::cerr << "Failed to load configuration " << args.config_file << ": " << e.what() << std::endl;
            return 1;
        }

        // Command-line verbosity wins over the configured level
        core::LogLevel log_level = core::LoggerManager::string_to_level(config->logging.log_level);
        if (args.verbosity == 1) {
            log_level = core::LogLevel::INFO;
        } else if (args.verbosity >= 2) {
            log_level = core::LogLevel::DEBUG;
        }
        std::string log_file = args.log_file.empty() ? config->logging.log_file : args.log_file;

        core::setup_logging(log_level, log_file, log_file.empty());
        auto logger = core::get_logger("main");

        if (!config->validate()) {
            logger->error("Configuration validation failed");
            return 1;
        }

        services::HostapConfig ap_config;
        try {
            ap_config = load_ap_config(args.ap_file);
            ap_config.validate();
        } catch (const std::exception& e) {
            logger->error("Invalid AP description",
                          core::LogContext().add("file", args.ap_file).add("error", e.what()));
            return 1;
        }

        setup_signal_handlers();

        logger->info("Starting wifirig",
                     core::LogContext().add("test_name", config->test_name).add("config_file", args.config_file));

        core::LifecycleController controller(std::move(config));

        try {
            controller.start();

            if (args.ibss) {
                controller.join_ibss(ap_config);
            } else {
                controller.configure(ap_config);
                if (args.peer) {
                    controller.connect_managed();
                }
            }
        } catch (const core::RigError& e) {
            logger->error("Failed to bring up the network", core::LogContext().add("error", e.what()));
            controller.close();
            return 1;
        }

        std::cout << "SSID: " << controller.get_ssid() << std::endl;
        std::cout << "IP:   " << controller.wifi_ip() << std::endl;
        if (args.peer) {
            std::cout << "Peer: " << core::LifecycleController::local_peer_ip_address(0) << std::endl;
        }

        // Hold the network until signalled
        while (g_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        logger->info("Shutting down");
        controller.close();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
