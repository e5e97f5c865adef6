/**
 * hostapd process control
 */

#include "infrastructure/access_point_daemon.hpp"
#include "infrastructure/command_runner.hpp"
#include "core/logger.hpp"

#include <utility>

namespace captureap
{
    namespace infrastructure
    {

        HostapdDaemon::HostapdDaemon(std::shared_ptr<CommandRunner> runner)
            : runner_(std::move(runner)), logger_(core::get_logger("HostapdDaemon"))
        {
        }

        CommandResult HostapdDaemon::start(const std::string &config_path)
        {
            logger_->debug("Starting hostapd", core::LogContext().add("config", config_path));

            auto result = runner_->run({"hostapd", "-B", config_path}, OutputMode::Discard);
            if (!result.succeeded())
            {
                logger_->debug("hostapd failed to start", core::LogContext().add("exit_status", result.exit_status));
            }
            return result;
        }

        CommandResult HostapdDaemon::stop()
        {
            auto result = runner_->run({"pkill", "hostapd"});
            // pkill exits 1 when nothing matched, which is fine here
            if (result.exit_status == 1)
            {
                result.exit_status = 0;
            }
            if (!result.succeeded())
            {
                logger_->debug("pkill hostapd failed", core::LogContext().add("exit_status", result.exit_status));
            }
            return result;
        }

        bool HostapdDaemon::is_running() const
        {
            return runner_->run({"pgrep", "hostapd"}).succeeded();
        }

    } // namespace infrastructure
} // namespace captureap
