#include "cli/arguments.hpp"
#include "config/ap_settings.hpp"
#include "core/validators.hpp"

#include <getopt.h>

namespace captureap
{
    namespace cli
    {

        namespace
        {
            enum
            {
                OPT_LOG_FILE = 1000,
                OPT_VERSION
            };

            const struct option long_options[] = {
                {"help", no_argument, nullptr, 'h'},
                {"apaddress", required_argument, nullptr, 'a'},
                {"dhcpstart", required_argument, nullptr, 's'},
                {"dhcpend", required_argument, nullptr, 'e'},
                {"netmask", required_argument, nullptr, 'n'},
                {"dhcplease", required_argument, nullptr, 'l'},
                {"remove", no_argument, nullptr, 'r'},
                {"config", required_argument, nullptr, 'c'},
                {"verbose", no_argument, nullptr, 'v'},
                {"log-file", required_argument, nullptr, OPT_LOG_FILE},
                {"version", no_argument, nullptr, OPT_VERSION},
                {nullptr, 0, nullptr, 0}};
        }

        Arguments parse_arguments(int argc, char *argv[])
        {
            Arguments args;
            if (argc < 2)
            {
                return args;
            }

            bool help = false;
            bool version = false;
            bool remove = false;

            // Zero makes getopt start over, so the parser can run more than once per process
            optind = 0;

            int c;
            int option_index = 0;

            // '+' stops at the first interface name, so options must come before them
            while ((c = getopt_long(argc, argv, "+ha:s:e:n:l:rc:v", long_options, &option_index)) != -1)
            {
                switch (c)
                {
                case 'h':
                    help = true;
                    break;
                case 'a':
                    args.ap_address = core::require_ip_address("AP-IP-address", optarg);
                    break;
                case 's':
                    args.dhcp_start = core::require_ip_address("DHCP-range-start", optarg);
                    break;
                case 'e':
                    args.dhcp_end = core::require_ip_address("DHCP-range-end", optarg);
                    break;
                case 'n':
                    args.netmask = core::require_ip_address("DHCP-netmask", optarg);
                    break;
                case 'l':
                    args.lease_time = core::require_lease_time(optarg);
                    break;
                case 'r':
                    remove = true;
                    break;
                case 'c':
                    args.config_file = optarg;
                    break;
                case 'v':
                    args.verbosity++;
                    break;
                case OPT_LOG_FILE:
                    args.log_file = optarg;
                    break;
                case OPT_VERSION:
                    version = true;
                    break;
                default:
                    // getopt_long already printed an error message
                    args.action = Action::ShowUsage;
                    return args;
                }
            }

            for (int i = optind; i < argc; ++i)
            {
                args.interfaces.emplace_back(argv[i]);
            }

            if (help)
                args.action = Action::ShowHelp;
            else if (version)
                args.action = Action::ShowVersion;
            else if (remove)
                args.action = Action::Remove;
            else if (args.interfaces.size() == 2)
                args.action = Action::BringUp;
            else
                args.action = Action::ShowUsage;

            return args;
        }

        std::optional<int> early_exit_status(const Arguments &args)
        {
            switch (args.action)
            {
            case Action::ShowUsage:
            case Action::ShowHelp:
                return 1;
            case Action::ShowVersion:
                return 0;
            case Action::Remove:
            case Action::BringUp:
                break;
            }
            return std::nullopt;
        }

        void apply_overrides(const Arguments &args, config::ApSettings &settings)
        {
            if (args.ap_address)
                settings.ap_address = *args.ap_address;
            if (args.dhcp_start)
                settings.dhcp_start = *args.dhcp_start;
            if (args.dhcp_end)
                settings.dhcp_end = *args.dhcp_end;
            if (args.netmask)
                settings.netmask = *args.netmask;
            if (args.lease_time)
                settings.lease_time = *args.lease_time;

            if (args.interfaces.size() == 2)
            {
                settings.internet_interface = args.interfaces[0];
                settings.ap_interface = args.interfaces[1];
            }
        }

    } // namespace cli
} // namespace captureap
