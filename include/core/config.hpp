#ifndef CAPTUREAP_CORE_CONFIG_HPP
#define CAPTUREAP_CORE_CONFIG_HPP

#include <string>
#include <memory>
#include <nlohmann/json.hpp>

namespace captureap
{
    namespace core
    {

        /**
         * Where the generated configs and the run state live
         */
        struct PathsConfig
        {
            std::string hostapd_config = "hostapd.conf";
            std::string dnsmasq_config = "dnsmasq.conf";
            std::string state_file = "/var/lib/capture_ap/state.json";

            void from_json(const nlohmann::json &j);
        };

        /**
         * Radio settings used when a hostapd config has to be generated
         */
        struct AccessPointConfig
        {
            std::string ssid = "2.4GHz_Capture_Network";
            int channel = 2;
            std::string hw_mode = "g";
            std::string country_code = "US";
            std::string passphrase = "changeme"; // Empty means an open network

            void from_json(const nlohmann::json &j);
        };

        /**
         * Addressing used unless the command line or a persisted dnsmasq config says otherwise
         */
        struct NetworkDefaults
        {
            std::string ap_address = "10.0.0.1";
            std::string dhcp_start = "10.0.0.10";
            std::string dhcp_end = "10.0.0.20";
            std::string netmask = "255.255.255.0";
            std::string lease_time = "12h";

            void from_json(const nlohmann::json &j);
        };

        /**
         * Logging configuration
         */
        struct LoggingConfig
        {
            std::string log_level = "WARNING";
            std::string log_file; // Empty means console only

            void from_json(const nlohmann::json &j);
        };

        /**
         * Complete tool configuration
         */
        class ToolConfig
        {
        public:
            static constexpr const char *DEFAULT_PATH = "/etc/capture_ap/capture_ap.json";

            PathsConfig paths;
            AccessPointConfig access_point;
            NetworkDefaults defaults;
            LoggingConfig logging;

        public:
            ToolConfig() = default;

            // Factory methods
            static std::unique_ptr<ToolConfig> from_file(const std::string &config_path);
            static std::unique_ptr<ToolConfig> from_json(const nlohmann::json &j);
            static std::unique_ptr<ToolConfig> create_default();

            /**
             * Load config_path if given, otherwise DEFAULT_PATH when it exists,
             * otherwise the built-in defaults.
             */
            static std::unique_ptr<ToolConfig> load(const std::string &config_path);

            // Throws ValidationError describing the first bad field
            void validate() const;
        };

    } // namespace core
} // namespace captureap

#endif // CAPTUREAP_CORE_CONFIG_HPP
