/**
 * Access point bring-up and teardown
 */

#include "services/access_point_service.hpp"
#include "config/config_reconciler.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/run_state.hpp"
#include "core/validators.hpp"
#include "infrastructure/system_state.hpp"

#include <sstream>
#include <utility>

namespace captureap
{
    namespace services
    {

        std::string to_string(BringUpStage stage)
        {
            switch (stage)
            {
            case BringUpStage::Idle:
                return "Idle";
            case BringUpStage::RoutingEnabled:
                return "RoutingEnabled";
            case BringUpStage::MasqueradeEnabled:
                return "MasqueradeEnabled";
            case BringUpStage::InterfaceDetached:
                return "InterfaceDetached";
            case BringUpStage::BeaconLaunched:
                return "BeaconLaunched";
            case BringUpStage::IPAssigned:
                return "IPAssigned";
            case BringUpStage::DhcpRunning:
                return "DhcpRunning";
            case BringUpStage::Ready:
                return "Ready";
            }
            return "Unknown";
        }

        const std::vector<std::string> &AccessPointService::required_executables()
        {
            static const std::vector<std::string> executables = {
                "hostapd", "dnsmasq", "iptables", "nmcli", "ip", "sysctl", "pgrep", "pkill"};
            return executables;
        }

        AccessPointService::AccessPointService(std::shared_ptr<infrastructure::SystemState> system,
                                               std::shared_ptr<config::ConfigReconciler> reconciler,
                                               std::shared_ptr<core::RunStateStore> run_state)
            : system_(std::move(system)),
              reconciler_(std::move(reconciler)),
              run_state_(std::move(run_state)),
              logger_(core::get_logger("AccessPointService"))
        {
        }

        void AccessPointService::check_environment() const
        {
            if (!system_->is_privileged())
            {
                throw core::PrivilegeError("Must be run with super user privileges (root). Exiting.");
            }

            std::string missing;
            for (const auto &executable : required_executables())
            {
                if (!system_->has_executable(executable))
                {
                    logger_->error("<" + executable + "> package missing.");
                    missing += missing.empty() ? executable : ", " + executable;
                }
            }

            if (!missing.empty())
            {
                throw core::DependencyError("Missing required tools: " + missing);
            }
        }

        void AccessPointService::bring_up(const config::ApSettings &settings)
        {
            stage_ = BringUpStage::Idle;

            core::validate_interfaces(*system_, settings.internet_interface, settings.ap_interface);

            auto prefix_length = core::netmask_prefix_length(settings.netmask);
            if (!prefix_length)
            {
                throw core::ValidationError("Invalid value supplied for <DHCP-netmask>: " + settings.netmask +
                                            " is not a contiguous netmask");
            }

            // Range order was never enforced; only point it out
            auto range_start = core::ipv4_to_integer(settings.dhcp_start);
            auto range_end = core::ipv4_to_integer(settings.dhcp_end);
            if (range_start && range_end && *range_start > *range_end)
            {
                logger_->warning("DHCP range start is after its end",
                                 core::LogContext().add("dhcp-range", config::ConfigReconciler::dhcp_range_value(settings)));
            }

            stop_stale_access_point();
            reconciler_->reconcile(settings);

            enable_routing();
            enable_masquerade(settings);
            detach_interface(settings);
            launch_beacon();
            persist_run_state(settings);
            assign_address(settings, *prefix_length);
            start_dhcp_server(settings);

            advance(BringUpStage::Ready);
            logger_->info("Finished.");
        }

        void AccessPointService::advance(BringUpStage next)
        {
            logger_->debug("Bring-up stage reached", core::LogContext()
                                                         .add("from", to_string(stage_))
                                                         .add("to", to_string(next)));
            stage_ = next;
        }

        void AccessPointService::stop_stale_access_point()
        {
            if (system_->is_access_point_running())
            {
                logger_->warning("Killing still-running AP...");
                if (!system_->stop_access_point().succeeded())
                {
                    logger_->warning("Could not stop the running AP");
                }
            }
        }

        void AccessPointService::enable_routing()
        {
            auto result = system_->set_forwarding(true);
            if (!result.succeeded())
            {
                throw core::ExternalCommandError(to_string(BringUpStage::RoutingEnabled), "problem enabling routing", result.exit_status);
            }
            logger_->info("Enabling routing... [OK]");
            advance(BringUpStage::RoutingEnabled);
        }

        void AccessPointService::enable_masquerade(const config::ApSettings &settings)
        {
            // A previous run may have had the interfaces the other way round
            if (system_->has_masquerade_rule(settings.ap_interface))
            {
                logger_->warning("Removing old iptables rule", core::LogContext().add("interface", settings.ap_interface));
                if (!system_->remove_masquerade_rule(settings.ap_interface).succeeded())
                {
                    logger_->warning("Could not remove old iptables rule", core::LogContext().add("interface", settings.ap_interface));
                }
            }

            if (system_->has_masquerade_rule(settings.internet_interface))
            {
                logger_->info("IP masquerading already in place.");
            }
            else
            {
                auto result = system_->add_masquerade_rule(settings.internet_interface);
                if (!result.succeeded())
                {
                    throw core::ExternalCommandError(to_string(BringUpStage::MasqueradeEnabled),
                                                     "could not append IP masquerade rule into <iptables>", result.exit_status);
                }
                logger_->info("Enabling IP masquerading... [OK]");
            }
            advance(BringUpStage::MasqueradeEnabled);
        }

        void AccessPointService::detach_interface(const config::ApSettings &settings)
        {
            auto result = system_->set_interface_managed(settings.ap_interface, false);
            if (!result.succeeded())
            {
                throw core::ExternalCommandError(to_string(BringUpStage::InterfaceDetached),
                                                 "could not prevent <NetworkManager> from managing <" + settings.ap_interface + ">",
                                                 result.exit_status);
            }
            logger_->info("Disallowing AP interface from being managed by <NetworkManager>... [OK]");
            advance(BringUpStage::InterfaceDetached);
        }

        void AccessPointService::launch_beacon()
        {
            auto result = system_->start_access_point(reconciler_->hostapd_path().string());
            if (!result.succeeded())
            {
                throw core::ExternalCommandError(to_string(BringUpStage::BeaconLaunched), "could not launch AP.", result.exit_status);
            }
            logger_->info("Launching AP... [OK]");
            advance(BringUpStage::BeaconLaunched);
        }

        void AccessPointService::persist_run_state(const config::ApSettings &settings)
        {
            core::RunState state;
            state.internet_interface = settings.internet_interface;
            state.ap_interface = settings.ap_interface;
            run_state_->save(state);
        }

        void AccessPointService::assign_address(const config::ApSettings &settings, int prefix_length)
        {
            if (!system_->flush_addresses(settings.ap_interface).succeeded())
            {
                logger_->warning("Could not flush addresses", core::LogContext().add("interface", settings.ap_interface));
            }

            auto result = system_->assign_address(settings.ap_interface, settings.ap_address, prefix_length);
            if (!result.succeeded())
            {
                throw core::ExternalCommandError(to_string(BringUpStage::IPAssigned),
                                                 "could not assign IP address to interface <" + settings.ap_interface + ">",
                                                 result.exit_status);
            }
            logger_->info("Configuring AP's IP address <" + settings.ap_address + ">... [OK]");
            advance(BringUpStage::IPAssigned);
        }

        void AccessPointService::start_dhcp_server(const config::ApSettings &settings)
        {
            const auto config_path = reconciler_->dnsmasq_path().string();

            if (!system_->is_dhcp_server_running())
            {
                auto result = system_->start_dhcp_server(config_path, settings.ap_interface);
                if (!result.succeeded())
                {
                    throw core::ExternalCommandError(to_string(BringUpStage::DhcpRunning), "could not start <dnsmasq> service",
                                                     result.exit_status);
                }
                logger_->info("Starting <dnsmasq> service for DHCP and DNS hosting... [OK]");
            }
            else
            {
                // A running instance may still hold an older config
                logger_->warning("<dnsmasq> service already started, restarting it");
                if (!system_->stop_dhcp_server().succeeded())
                {
                    logger_->warning("Could not stop the running <dnsmasq>");
                }
                auto result = system_->start_dhcp_server(config_path, settings.ap_interface);
                if (!result.succeeded())
                {
                    throw core::ExternalCommandError(to_string(BringUpStage::DhcpRunning), "could not restart <dnsmasq> service",
                                                     result.exit_status);
                }
                logger_->info("Restarting <dnsmasq> service for DHCP and DNS hosting... [OK]");
            }
            advance(BringUpStage::DhcpRunning);
        }

        void AccessPointService::tear_down()
        {
            auto state = run_state_->load();
            if (state.empty())
            {
                throw core::StateError("No access point was brought up by a previous run. "
                                       "AP interface and/or internet interface cannot be restored because it is unknown.");
            }

            logger_->info("Stopping AP...");
            if (!system_->stop_access_point().succeeded())
            {
                logger_->warning("Could not stop hostapd");
            }

            logger_->info("Flushing access point IP address...");
            if (!system_->flush_addresses(state.ap_interface).succeeded())
            {
                logger_->warning("Could not flush addresses", core::LogContext().add("interface", state.ap_interface));
            }

            logger_->info("Allowing AP interface to be managed...");
            if (!system_->set_interface_managed(state.ap_interface, true).succeeded())
            {
                logger_->warning("Could not hand the interface back to NetworkManager",
                                 core::LogContext().add("interface", state.ap_interface));
            }

            logger_->info("Stopping <dnsmasq> service...");
            if (!system_->stop_dhcp_server().succeeded())
            {
                logger_->warning("Could not stop dnsmasq");
            }

            if (system_->has_masquerade_rule(state.internet_interface))
            {
                logger_->info("Removing <iptables> IP masquerading rule...");
                if (!system_->remove_masquerade_rule(state.internet_interface).succeeded())
                {
                    logger_->warning("Could not remove the masquerade rule",
                                     core::LogContext().add("interface", state.internet_interface));
                }
            }
            else
            {
                logger_->info("<iptables> IP masquerading rule already removed.");
            }

            logger_->info("Disabling routing...");
            if (!system_->set_forwarding(false).succeeded())
            {
                logger_->warning("Could not disable routing");
            }

            run_state_->clear();
            stage_ = BringUpStage::Idle;
            logger_->info("Finished.");
        }

        std::string AccessPointService::format_summary(const config::ApSettings &settings)
        {
            std::ostringstream summary;
            summary << "\n";
            summary << "NOTE: if the AP is not visible, run the command again. It is a known issue.\n";
            summary << "To remove the AP, run again with -r or --remove.\n";
            summary << "\n";
            summary << "AP:\n";
            summary << "       Network Name: " << settings.ssid << "\n";
            summary << "         IP Address: " << settings.ap_address << "\n";
            summary << "            Netmask: " << settings.netmask << "\n";
            summary << "\n";
            summary << "         DHCP Start: " << settings.dhcp_start << "\n";
            summary << "           DHCP End: " << settings.dhcp_end << "\n";
            summary << "    DHCP Lease Time: " << settings.lease_time << "\n";
            return summary.str();
        }

    } // namespace services
} // namespace captureap
