#ifndef CAPTUREAP_INFRASTRUCTURE_COMMAND_RUNNER_HPP
#define CAPTUREAP_INFRASTRUCTURE_COMMAND_RUNNER_HPP

#include <memory>
#include <string>
#include <vector>

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
         * Exit status and combined stdout/stderr of one external command
         */
        struct CommandResult
        {
            int exit_status = -1;
            std::string output;

            bool succeeded() const { return exit_status == 0; }
        };

        enum class OutputMode
        {
            Capture,
            Discard
        };

        /**
         * Runs external executables synchronously.
         * Abstract so tests can script the results instead of touching the host.
         */
        class CommandRunner
        {
        public:
            virtual ~CommandRunner() = default;

            /**
             * Run argv[0] (looked up on PATH) and block until it exits.
             * @return exit status; 127 when the executable could not be started,
             *         128 + signal number when it was killed
             */
            virtual CommandResult run(const std::vector<std::string> &argv, OutputMode mode) = 0;

            CommandResult run(const std::vector<std::string> &argv) { return run(argv, OutputMode::Capture); }
        };

        /**
         * fork/execvp based runner
         */
        class ProcessCommandRunner : public CommandRunner
        {
        public:
            ProcessCommandRunner();

            using CommandRunner::run;
            CommandResult run(const std::vector<std::string> &argv, OutputMode mode) override;

        private:
            std::shared_ptr<core::Logger> logger_;
        };

        // "iptables -t nat -C POSTROUTING ..." for log lines
        std::string format_command(const std::vector<std::string> &argv);

    } // namespace infrastructure
} // namespace captureap

#endif // CAPTUREAP_INFRASTRUCTURE_COMMAND_RUNNER_HPP
