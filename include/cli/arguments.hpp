#ifndef CAPTUREAP_CLI_ARGUMENTS_HPP
#define CAPTUREAP_CLI_ARGUMENTS_HPP

#include <optional>
#include <string>
#include <vector>

namespace captureap
{
    namespace config
    {
        struct ApSettings;
    }
}

namespace captureap
{
    namespace cli
    {

        /**
         * What a command line asks for, in order of precedence
         */
        enum class Action
        {
            ShowUsage,   // Missing or malformed arguments
            ShowHelp,    // -h, --help
            ShowVersion, // --version
            Remove,      // -r, --remove
            BringUp      // <internet-interface> <AP-interface>
        };

        /**
         * Parsed command line
         */
        struct Arguments
        {
            Action action = Action::ShowUsage;

            std::string config_file;
            int verbosity = 0;
            std::string log_file;

            std::optional<std::string> ap_address;
            std::optional<std::string> dhcp_start;
            std::optional<std::string> dhcp_end;
            std::optional<std::string> netmask;
            std::optional<std::string> lease_time;

            std::vector<std::string> interfaces;
        };

        /**
         * Parse command line arguments
         *
         * Options are only recognised before the first interface name. Option
         * values are validated here; a bad one throws ValidationError. Anything
         * other than exactly two interface names without -r is ShowUsage.
         */
        Arguments parse_arguments(int argc, char *argv[]);

        /**
         * Exit status for actions that finish without touching the system, or
         * nothing when the action has work to do
         */
        std::optional<int> early_exit_status(const Arguments &args);

        /**
         * Layer the command-line flags and interface names over settings that
         * already carry the configured and persisted values
         */
        void apply_overrides(const Arguments &args, config::ApSettings &settings);

    } // namespace cli
} // namespace captureap

#endif // CAPTUREAP_CLI_ARGUMENTS_HPP
