#ifndef CAPTUREAP_CORE_VALIDATORS_HPP
#define CAPTUREAP_CORE_VALIDATORS_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace captureap
{
    namespace infrastructure
    {
        class SystemState;
    }
}

namespace captureap
{
    namespace core
    {

        /**
         * Dotted-quad IPv4 address, every octet 0-255.
         * CIDR suffixes, hostnames and missing or extra octets are rejected.
         */
        bool is_ip_address(const std::string &value);

        /**
         * DHCP lease time: one to three digits followed by 'h' or 'H', e.g. "12h".
         */
        bool is_valid_lease_time(const std::string &value);

        // Host-order value of a dotted quad, empty if is_ip_address rejects it
        std::optional<uint32_t> ipv4_to_integer(const std::string &value);

        /**
         * Prefix length of a contiguous netmask ("255.255.255.0" -> 24).
         * Empty for anything that is not an IPv4 address or has holes in its mask.
         */
        std::optional<int> netmask_prefix_length(const std::string &netmask);

        // Return the value or throw ValidationError naming the option
        std::string require_ip_address(const std::string &option_name, const std::string &value);
        std::string require_lease_time(const std::string &value);

        /**
         * Check the interface pair given on the command line.
         * Throws ValidationError if either name is empty or unknown, both are the
         * same, or the AP interface has no wireless extensions.
         */
        void validate_interfaces(const infrastructure::SystemState &system,
                                 const std::string &internet_interface,
                                 const std::string &ap_interface);

    } // namespace core
} // namespace captureap

#endif // CAPTUREAP_CORE_VALIDATORS_HPP
