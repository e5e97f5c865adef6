#ifndef CAPTUREAP_CONFIG_AP_SETTINGS_HPP
#define CAPTUREAP_CONFIG_AP_SETTINGS_HPP

#include <string>

namespace captureap
{
    namespace core
    {
        class ToolConfig;
    }
}

namespace captureap
{
    namespace config
    {

        /**
         * Everything one bring-up needs, after defaults, persisted configs and
         * command-line flags have been layered on top of each other
         */
        struct ApSettings
        {
            std::string internet_interface;
            std::string ap_interface;

            // Addressing
            std::string ap_address = "10.0.0.1";
            std::string dhcp_start = "10.0.0.10";
            std::string dhcp_end = "10.0.0.20";
            std::string netmask = "255.255.255.0";
            std::string lease_time = "12h";

            // Radio
            std::string ssid = "2.4GHz_Capture_Network";
            int channel = 2;
            std::string hw_mode = "g";
            std::string country_code = "US";
            std::string passphrase = "changeme";

            static ApSettings from_tool_config(const core::ToolConfig &config);
        };

    } // namespace config
} // namespace captureap

#endif // CAPTUREAP_CONFIG_AP_SETTINGS_HPP
