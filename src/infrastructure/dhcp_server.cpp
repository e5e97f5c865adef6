/**
 * dnsmasq process control
 */

#include "infrastructure/dhcp_server.hpp"
#include "infrastructure/command_runner.hpp"
#include "core/logger.hpp"

#include <utility>

namespace captureap
{
    namespace infrastructure
    {

        DnsmasqServer::DnsmasqServer(std::shared_ptr<CommandRunner> runner)
            : runner_(std::move(runner)), logger_(core::get_logger("DnsmasqServer"))
        {
        }

        CommandResult DnsmasqServer::start(const std::string &config_path, const std::string &interface)
        {
            std::vector<std::string> command = {
                "dnsmasq",
                "--conf-file=" + config_path,
                "--interface=" + interface};

            logger_->debug("Starting dnsmasq", core::LogContext().add("command", format_command(command)));

            // dnsmasq forks into the background; nothing may hold a pipe to it
            auto result = runner_->run(command, OutputMode::Discard);
            if (!result.succeeded())
            {
                logger_->debug("dnsmasq failed to start", core::LogContext().add("exit_status", result.exit_status));
            }
            return result;
        }

        CommandResult DnsmasqServer::stop()
        {
            // The distribution unit may not exist or may not be running
            auto unit = runner_->run({"systemctl", "stop", "dnsmasq"});
            if (!unit.succeeded())
            {
                logger_->debug("systemctl stop dnsmasq failed", core::LogContext().add("exit_status", unit.exit_status));
            }

            auto result = runner_->run({"pkill", "dnsmasq"});
            if (result.exit_status == 1)
            {
                result.exit_status = 0;
            }
            if (!result.succeeded())
            {
                logger_->debug("pkill dnsmasq failed", core::LogContext().add("exit_status", result.exit_status));
            }
            return result;
        }

        bool DnsmasqServer::is_running() const
        {
            return runner_->run({"pgrep", "dnsmasq"}).succeeded();
        }

    } // namespace infrastructure
} // namespace captureap
