#ifndef CAPTUREAP_INFRASTRUCTURE_ACCESS_POINT_DAEMON_HPP
#define CAPTUREAP_INFRASTRUCTURE_ACCESS_POINT_DAEMON_HPP

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
         * Access point beacon daemon (hostapd)
         *
         * hostapd is started in the background with -B, so a successful start only
         * means the configuration was accepted. Whether the radio is actually
         * beaconing cannot be told from the exit status.
         */
        class HostapdDaemon
        {
        public:
            explicit HostapdDaemon(std::shared_ptr<CommandRunner> runner);

            CommandResult start(const std::string &config_path);
            CommandResult stop();
            bool is_running() const;

        private:
            std::shared_ptr<CommandRunner> runner_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace infrastructure
} // namespace captureap

#endif // CAPTUREAP_INFRASTRUCTURE_ACCESS_POINT_DAEMON_HPP
