/**
 * Linux implementation of the machine-wide state used by an access point
 */

#include "infrastructure/linux_system_state.hpp"
#include "infrastructure/command_runner.hpp"
#include "core/logger.hpp"

#include <cstdlib>
#include <sstream>
#include <unistd.h>
#include <utility>

namespace captureap
{
    namespace infrastructure
    {

        namespace
        {
            constexpr const char *FORWARDING_KEY = "net.ipv4.conf.all.forwarding";

            std::string trim(const std::string &value)
            {
                auto begin = value.find_first_not_of(" \t\r\n");
                if (begin == std::string::npos)
                {
                    return "";
                }
                auto end = value.find_last_not_of(" \t\r\n");
                return value.substr(begin, end - begin + 1);
            }
        }

        LinuxSystemState::LinuxSystemState(std::shared_ptr<CommandRunner> runner,
                                           std::filesystem::path sysfs_net_dir)
            : runner_(runner),
              logger_(core::get_logger("SystemState")),
              sysfs_net_dir_(std::move(sysfs_net_dir)),
              hostapd_(runner),
              dnsmasq_(runner)
        {
        }

        bool LinuxSystemState::is_privileged() const
        {
            return geteuid() == 0;
        }

        bool LinuxSystemState::has_executable(const std::string &name) const
        {
            const char *path_env = std::getenv("PATH");
            std::string search_path = path_env ? path_env : "";
            // sbin is not always on a sudo user's PATH
            search_path += ":/usr/local/sbin:/usr/sbin:/sbin";

            std::istringstream stream(search_path);
            std::string directory;
            while (std::getline(stream, directory, ':'))
            {
                if (directory.empty())
                {
                    continue;
                }

                std::error_code ec;
                auto candidate = std::filesystem::path(directory) / name;
                if (std::filesystem::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0)
                {
                    return true;
                }
            }
            return false;
        }

        bool LinuxSystemState::interface_exists(const std::string &interface) const
        {
            if (!is_safe_interface_name(interface))
            {
                return false;
            }
            std::error_code ec;
            return std::filesystem::exists(sysfs_net_dir_ / interface, ec);
        }

        bool LinuxSystemState::is_wireless_interface(const std::string &interface) const
        {
            if (!is_safe_interface_name(interface))
            {
                return false;
            }
            std::error_code ec;
            auto device_dir = sysfs_net_dir_ / interface;
            return std::filesystem::exists(device_dir / "wireless", ec) ||
                   std::filesystem::exists(device_dir / "phy80211", ec);
        }

        bool LinuxSystemState::is_forwarding_enabled() const
        {
            auto result = runner_->run({"sysctl", "-n", FORWARDING_KEY});
            return result.succeeded() && trim(result.output) == "1";
        }

        CommandResult LinuxSystemState::set_forwarding(bool enabled)
        {
            std::string setting = std::string(FORWARDING_KEY) + (enabled ? "=1" : "=0");
            auto result = runner_->run({"sysctl", "-q", setting});
            if (!result.succeeded())
            {
                logger_->debug("sysctl failed", core::LogContext()
                                                    .add("setting", setting)
                                                    .add("output", trim(result.output)));
            }
            return result;
        }

        std::vector<std::string> LinuxSystemState::masquerade_command(const std::string &action, const std::string &interface)
        {
            return {"iptables", "-t", "nat", action, "POSTROUTING", "-o", interface, "-j", "MASQUERADE"};
        }

        bool LinuxSystemState::has_masquerade_rule(const std::string &interface) const
        {
            return runner_->run(masquerade_command("-C", interface)).succeeded();
        }

        CommandResult LinuxSystemState::add_masquerade_rule(const std::string &interface)
        {
            if (has_masquerade_rule(interface))
            {
                return CommandResult{0, ""};
            }
            auto result = runner_->run(masquerade_command("-A", interface));
            if (!result.succeeded())
            {
                logger_->debug("iptables append failed", core::LogContext()
                                                             .add("interface", interface)
                                                             .add("output", trim(result.output)));
            }
            return result;
        }

        CommandResult LinuxSystemState::remove_masquerade_rule(const std::string &interface)
        {
            if (!has_masquerade_rule(interface))
            {
                return CommandResult{0, ""};
            }
            auto result = runner_->run(masquerade_command("-D", interface));
            if (!result.succeeded())
            {
                logger_->debug("iptables delete failed", core::LogContext()
                                                             .add("interface", interface)
                                                             .add("output", trim(result.output)));
            }
            return result;
        }

        bool LinuxSystemState::is_interface_managed(const std::string &interface) const
        {
            auto result = runner_->run({"nmcli", "-g", "GENERAL.STATE", "device", "show", interface});
            if (!result.succeeded())
            {
                return false;
            }
            return result.output.find("unmanaged") == std::string::npos;
        }

        CommandResult LinuxSystemState::set_interface_managed(const std::string &interface, bool managed)
        {
            auto result = runner_->run({"nmcli", "dev", "set", interface, "managed", managed ? "yes" : "no"});
            if (!result.succeeded())
            {
                logger_->debug("nmcli refused", core::LogContext()
                                                    .add("interface", interface)
                                                    .add("output", trim(result.output)));
            }
            return result;
        }

        CommandResult LinuxSystemState::flush_addresses(const std::string &interface)
        {
            return runner_->run({"ip", "addr", "flush", "dev", interface});
        }

        CommandResult LinuxSystemState::assign_address(const std::string &interface, const std::string &address, int prefix_length)
        {
            auto result = runner_->run({"ip", "addr", "add", address + "/" + std::to_string(prefix_length), "dev", interface});
            if (!result.succeeded())
            {
                logger_->debug("ip addr add failed", core::LogContext()
                                                         .add("interface", interface)
                                                         .add("output", trim(result.output)));
            }
            return result;
        }

        bool LinuxSystemState::is_access_point_running() const
        {
            return hostapd_.is_running();
        }

        CommandResult LinuxSystemState::start_access_point(const std::string &config_path)
        {
            return hostapd_.start(config_path);
        }

        CommandResult LinuxSystemState::stop_access_point()
        {
            return hostapd_.stop();
        }

        bool LinuxSystemState::is_dhcp_server_running() const
        {
            return dnsmasq_.is_running();
        }

        CommandResult LinuxSystemState::start_dhcp_server(const std::string &config_path, const std::string &interface)
        {
            return dnsmasq_.start(config_path, interface);
        }

        CommandResult LinuxSystemState::stop_dhcp_server()
        {
            return dnsmasq_.stop();
        }

        bool LinuxSystemState::is_safe_interface_name(const std::string &interface)
        {
            return !interface.empty() && interface != "." && interface != ".." &&
                   interface.find('/') == std::string::npos;
        }

    } // namespace infrastructure
} // namespace captureap
