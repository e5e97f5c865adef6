/**
 * capture_ap
 * Stands up a local Wi-Fi access point bridged to an internet-connected interface
 */

#include <iostream>
#include <memory>
#include <string>

#include "cli/arguments.hpp"
#include "config/ap_settings.hpp"
#include "config/config_reconciler.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/run_state.hpp"
#include "infrastructure/command_runner.hpp"
#include "infrastructure/linux_system_state.hpp"
#include "services/access_point_service.hpp"

namespace captureap {

/**
 * Print usage information
 */
void print_usage(const char* program_name) {
    std::cout << "[USAGE]\n";
    std::cout << "    " << program_name << " [OPTIONS] <internet-interface> <AP-interface>\n\n";
    std::cout << "[DESCRIPTION]\n";
    std::cout << "Creates a local Wi-Fi access point on <AP-interface> and shares the internet\n";
    std::cout << "connection of <internet-interface> with it (ethernet or Wi-Fi).\n\n";
    std::cout << "Uses <hostapd> for the AP, <dnsmasq> for DHCP and DNS, <iptables> for IP\n";
    std::cout << "masquerading and <NetworkManager> to release the AP interface. Routing and\n";
    std::cout << "masquerading stay enabled until the AP is removed with -r.\n\n";
    std::cout << "Missing or incomplete hostapd and dnsmasq configuration files are generated\n";
    std::cout << "with default settings. Values changed with the flags below are kept in those\n";
    std::cout << "files and reused by later runs.\n\n";
    std::cout << "[OPTIONS]\n";
    std::cout << "    -h, --help                 Show this help message and exit\n";
    std::cout << "    -a, --apaddress <ip>       Access point IP address (default: 10.0.0.1)\n";
    std::cout << "    -s, --dhcpstart <ip>       DHCP range start (default: 10.0.0.10)\n";
    std::cout << "    -e, --dhcpend <ip>         DHCP range end (default: 10.0.0.20)\n";
    std::cout << "    -n, --netmask <netmask>    DHCP netmask (default: 255.255.255.0)\n";
    std::cout << "    -l, --dhcplease <time>     DHCP lease time, 1-3 digits and h (default: 12h)\n";
    std::cout << "    -r, --remove               Remove the AP, disable routing and IP masquerading\n";
    std::cout << "    -c, --config <file>        Tool configuration (default: " << core::ToolConfig::DEFAULT_PATH << ")\n";
    std::cout << "    -v, --verbose              Increase verbosity (-v for INFO, -vv for DEBUG)\n";
    std::cout << "        --log-file <file>      Also append log lines to file\n";
    std::cout << "        --version              Show version information\n\n";
    std::cout << "[EXAMPLES]\n";
    std::cout << "    " << program_name << " wlan0 wlan1\n";
    std::cout << "    " << program_name << " eth0 wlan0\n";
    std::cout << "    " << program_name << " -e 10.0.0.50 wlan0 wlan1\n";
    std::cout << "    " << program_name << " -r\n";
    std::cout << std::endl;
}

/**
 * Print version information
 */
void print_version() {
    std::cout << "capture_ap v1.1.0" << std::endl;
    std::cout << "Requires hostapd, dnsmasq, iptables and NetworkManager" << std::endl;
}

} // namespace captureap

/**
 * Main entry point
 */
int main(int argc, char* argv[]) {
    using namespace captureap;

    auto logger = core::get_logger("main");

    try {
        const auto args = cli::parse_arguments(argc, argv);

        if (auto status = cli::early_exit_status(args)) {
            if (args.action == cli::Action::ShowVersion) {
                print_version();
            } else {
                print_usage(argv[0]);
            }
            return *status;
        }

        // Load configuration
        auto config = core::ToolConfig::load(args.config_file);
        config->validate();

        // Setup logging
        core::LogLevel log_level = core::LoggerManager::string_to_level(config->logging.log_level);
        if (args.verbosity == 1) {
            log_level = core::LogLevel::INFO;
        } else if (args.verbosity >= 2) {
            log_level = core::LogLevel::DEBUG;
        }
        std::string log_file = args.log_file.empty() ? config->logging.log_file : args.log_file;
        core::setup_logging(log_level, log_file, true);

        auto runner = std::make_shared<infrastructure::ProcessCommandRunner>();
        auto system = std::make_shared<infrastructure::LinuxSystemState>(runner);
        auto reconciler = std::make_shared<config::ConfigReconciler>(config->paths.hostapd_config,
                                                                     config->paths.dnsmasq_config);
        auto run_state = std::make_shared<core::RunStateStore>(config->paths.state_file);

        services::AccessPointService service(system, reconciler, run_state);
        service.check_environment();

        if (args.action == cli::Action::Remove) {
            service.tear_down();
            std::cout << "Finished." << std::endl;
            return 0;
        }

        auto settings = config::ApSettings::from_tool_config(*config);
        reconciler->load_persisted(settings);
        cli::apply_overrides(args, settings);

        logger->info("Bringing up access point",
                     core::LogContext()
                         .add("internet_interface", settings.internet_interface)
                         .add("ap_interface", settings.ap_interface));

        service.bring_up(settings);

        std::cout << "Finished." << std::endl;
        std::cout << services::AccessPointService::format_summary(settings) << std::flush;
        return 0;

    } catch (const core::ExternalCommandError& e) {
        logger->error(e.what(), core::LogContext()
                                    .add("step", e.step())
                                    .add("exit_status", e.exit_status()));
        return 1;
    } catch (const core::CaptureApError& e) {
        logger->error(e.what());
        return 1;
    } catch (const std::exception& e) {
        logger->critical(std::string("Fatal error: ") + e.what());
        return 1;
    }
}
