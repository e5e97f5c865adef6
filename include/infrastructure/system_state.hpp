#ifndef CAPTUREAP_INFRASTRUCTURE_SYSTEM_STATE_HPP
#define CAPTUREAP_INFRASTRUCTURE_SYSTEM_STATE_HPP

#include "infrastructure/command_runner.hpp"

#include <string>

namespace captureap
{
    namespace infrastructure
    {

        /**
         * Machine-wide state touched by an access point bring-up
         *
         * Covers the IPv4 forwarding toggle, the NAT table, the NetworkManager
         * "managed" flag, interface addressing and the two daemons. Every mutation
         * is idempotent and has a matching query. Mutations return the result of
         * the command that carried them out; a step that had nothing to do succeeds
         * with exit status 0.
         */
        class SystemState
        {
        public:
            virtual ~SystemState() = default;

            // Environment
            virtual bool is_privileged() const = 0;
            virtual bool has_executable(const std::string &name) const = 0;

            // Interfaces
            virtual bool interface_exists(const std::string &interface) const = 0;
            virtual bool is_wireless_interface(const std::string &interface) const = 0;

            // Routing
            virtual bool is_forwarding_enabled() const = 0;
            virtual CommandResult set_forwarding(bool enabled) = 0;

            // NAT
            virtual bool has_masquerade_rule(const std::string &interface) const = 0;
            virtual CommandResult add_masquerade_rule(const std::string &interface) = 0;
            virtual CommandResult remove_masquerade_rule(const std::string &interface) = 0;

            // Interface management
            virtual bool is_interface_managed(const std::string &interface) const = 0;
            virtual CommandResult set_interface_managed(const std::string &interface, bool managed) = 0;

            // Addressing
            virtual CommandResult flush_addresses(const std::string &interface) = 0;
            virtual CommandResult assign_address(const std::string &interface, const std::string &address, int prefix_length) = 0;

            // Beacon daemon
            virtual bool is_access_point_running() const = 0;
            virtual CommandResult start_access_point(const std::string &config_path) = 0;
            virtual CommandResult stop_access_point() = 0;

            // DHCP/DNS daemon
            virtual bool is_dhcp_server_running() const = 0;
            virtual CommandResult start_dhcp_server(const std::string &config_path, const std::string &interface) = 0;
            virtual CommandResult stop_dhcp_server() = 0;
        };

    } // namespace infrastructure
} // namespace captureap

#endif // CAPTUREAP_INFRASTRUCTURE_SYSTEM_STATE_HPP
