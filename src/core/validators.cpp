#include "core/validators.hpp"
#include "core/errors.hpp"
#include "infrastructure/system_state.hpp"

#include <cstdint>
#include <regex>
#include <sstream>

namespace captureap
{
    namespace core
    {

        namespace
        {
            std::string missing_value_message(const std::string &name)
            {
                return "No value supplied for: <" + name + ">";
            }

            std::string invalid_value_message(const std::string &name, const std::string &value)
            {
                return "Invalid value supplied for <" + name + ">: " + value;
            }
        }

        bool is_ip_address(const std::string &value)
        {
            static const std::regex ip_regex(
                R"(^((25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\.){3}(25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)$)");
            return std::regex_match(value, ip_regex);
        }

        bool is_valid_lease_time(const std::string &value)
        {
            static const std::regex lease_regex(R"(^[0-9]{1,3}[hH]$)");
            return std::regex_match(value, lease_regex);
        }

        std::optional<uint32_t> ipv4_to_integer(const std::string &value)
        {
            if (!is_ip_address(value))
            {
                return std::nullopt;
            }

            // Octets may carry leading zeros here, so they are parsed by hand
            uint32_t address = 0;
            std::istringstream stream(value);
            std::string octet;
            while (std::getline(stream, octet, '.'))
            {
                address = (address << 8) | static_cast<uint32_t>(std::stoul(octet));
            }
            return address;
        }

        std::optional<int> netmask_prefix_length(const std::string &netmask)
        {
            auto mask = ipv4_to_integer(netmask);
            if (!mask)
            {
                return std::nullopt;
            }

            int prefix = 0;
            while (prefix < 32 && (*mask & (0x80000000u >> prefix)))
            {
                ++prefix;
            }

            uint32_t expected = prefix == 0 ? 0 : (0xFFFFFFFFu << (32 - prefix));
            if (*mask != expected)
            {
                return std::nullopt;
            }
            return prefix;
        }

        std::string require_ip_address(const std::string &option_name, const std::string &value)
        {
            if (value.empty())
            {
                throw ValidationError(missing_value_message(option_name));
            }
            if (!is_ip_address(value))
            {
                throw ValidationError(invalid_value_message(option_name, value));
            }
            return value;
        }

        std::string require_lease_time(const std::string &value)
        {
            if (value.empty())
            {
                throw ValidationError(missing_value_message("DHCP-lease"));
            }
            if (!is_valid_lease_time(value))
            {
                throw ValidationError(invalid_value_message("DHCP-lease", value));
            }
            return value;
        }

        void validate_interfaces(const infrastructure::SystemState &system,
                                 const std::string &internet_interface,
                                 const std::string &ap_interface)
        {
            if (internet_interface.empty())
            {
                throw ValidationError(missing_value_message("internet-interface"));
            }
            if (ap_interface.empty())
            {
                throw ValidationError(missing_value_message("AP-interface"));
            }
            if (!system.interface_exists(internet_interface) || !system.interface_exists(ap_interface))
            {
                throw ValidationError("One or more passed arguments is not a valid network interface");
            }
            if (internet_interface == ap_interface)
            {
                throw ValidationError("Must use 2 different network interfaces.");
            }
            if (!system.is_wireless_interface(ap_interface))
            {
                throw ValidationError("The AP interface must be wireless.");
            }
        }

    } // namespace core
} // namespace captureap
