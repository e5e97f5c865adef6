#ifndef CAPTUREAP_INFRASTRUCTURE_DHCP_SERVER_HPP
#define CAPTUREAP_INFRASTRUCTURE_DHCP_SERVER_HPP

#include "infrastructure/command_runner.hpp"

#include <memory>
#include <string>

namespace captureap
{
    namespace core
    {
        class Logger;
    }
}

namespace captureap
{
    namespace infrastructure
    {

        /**
         * DHCP/DNS server (dnsmasq)
         * dnsmasq daemonizes itself; it is stopped through systemd and pkill so that
         * both the distribution service and a previous manual launch go away.
         */
        class DnsmasqServer
        {
        public:
            explicit DnsmasqServer(std::shared_ptr<CommandRunner> runner);

            CommandResult start(const std::string &config_path, const std::string &interface);
            CommandResult stop();
            bool is_running() const;

        private:
            std::shared_ptr<CommandRunner> runner_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace infrastructure
} // namespace captureap

#endif // CAPTUREAP_INFRASTRUCTURE_DHCP_SERVER_HPP
