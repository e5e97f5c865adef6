#include "config/ap_settings.hpp"
#include "core/config.hpp"

namespace captureap
{
    namespace config
    {

        ApSettings ApSettings::from_tool_config(const core::ToolConfig &config)
        {
            ApSettings settings;

            settings.ap_address = config.defaults.ap_address;
            settings.dhcp_start = config.defaults.dhcp_start;
            settings.dhcp_end = config.defaults.dhcp_end;
            settings.netmask = config.defaults.netmask;
            settings.lease_time = config.defaults.lease_time;

            settings.ssid = config.access_point.ssid;
            settings.channel = config.access_point.channel;
            settings.hw_mode = config.access_point.hw_mode;
            settings.country_code = config.access_point.country_code;
            settings.passphrase = config.access_point.passphrase;

            return settings;
        }

    } // namespace config
} // namespace captureap
