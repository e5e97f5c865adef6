#ifndef CAPTUREAP_INFRASTRUCTURE_LINUX_SYSTEM_STATE_HPP
#define CAPTUREAP_INFRASTRUCTURE_LINUX_SYSTEM_STATE_HPP

#include "infrastructure/system_state.hpp"
#include "infrastructure/access_point_daemon.hpp"
#include "infrastructure/dhcp_server.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace captureap
{
    namespace core
    {
        class Logger;
    }
    namespace infrastructure
    {
        class CommandRunner;
    }
}

namespace captureap
{
    namespace infrastructure
    {

        /**
         * SystemState backed by sysctl, iptables, nmcli, ip and sysfs
         */
        class LinuxSystemState : public SystemState
        {
        public:
            explicit LinuxSystemState(std::shared_ptr<CommandRunner> runner,
                                      std::filesystem::path sysfs_net_dir = "/sys/class/net");

            bool is_privileged() const override;
            bool has_executable(const std::string &name) const override;

            bool interface_exists(const std::string &interface) const override;
            bool is_wireless_interface(const std::string &interface) const override;

            bool is_forwarding_enabled() const override;
            CommandResult set_forwarding(bool enabled) override;

            bool has_masquerade_rule(const std::string &interface) const override;
            CommandResult add_masquerade_rule(const std::string &interface) override;
            CommandResult remove_masquerade_rule(const std::string &interface) override;

            bool is_interface_managed(const std::string &interface) const override;
            CommandResult set_interface_managed(const std::string &interface, bool managed) override;

            CommandResult flush_addresses(const std::string &interface) override;
            CommandResult assign_address(const std::string &interface, const std::string &address, int prefix_length) override;

            bool is_access_point_running() const override;
            CommandResult start_access_point(const std::string &config_path) override;
            CommandResult stop_access_point() override;

            bool is_dhcp_server_running() const override;
            CommandResult start_dhcp_server(const std::string &config_path, const std::string &interface) override;
            CommandResult stop_dhcp_server() override;

        private:
            static std::vector<std::string> masquerade_command(const std::string &action, const std::string &interface);
            static bool is_safe_interface_name(const std::string &interface);

            std::shared_ptr<CommandRunner> runner_;
            std::shared_ptr<core::Logger> logger_;
            std::filesystem::path sysfs_net_dir_;
            HostapdDaemon hostapd_;
            DnsmasqServer dnsmasq_;
        };

    } // namespace infrastructure
} // namespace captureap

#endif // CAPTUREAP_INFRASTRUCTURE_LINUX_SYSTEM_STATE_HPP
