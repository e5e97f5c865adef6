#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/validators.hpp"

#include <filesystem>
#include <fstream>

namespace captureap
{
    namespace core
    {

        // PathsConfig implementation
        void PathsConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("hostapd_config"))
                hostapd_config = j["hostapd_config"].get<std::string>();
            if (j.contains("dnsmasq_config"))
                dnsmasq_config = j["dnsmasq_config"].get<std::string>();
            if (j.contains("state_file"))
                state_file = j["state_file"].get<std::string>();
        }

        // AccessPointConfig implementation
        void AccessPointConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("ssid"))
                ssid = j["ssid"].get<std::string>();
            if (j.contains("channel"))
                channel = j["channel"].get<int>();
            if (j.contains("hw_mode"))
                hw_mode = j["hw_mode"].get<std::string>();
            if (j.contains("country_code"))
                country_code = j["country_code"].get<std::string>();
            if (j.contains("passphrase") && !j["passphrase"].is_null())
                passphrase = j["passphrase"].get<std::string>();
        }

        // NetworkDefaults implementation
        void NetworkDefaults::from_json(const nlohmann::json &j)
        {
            if (j.contains("ap_address"))
                ap_address = j["ap_address"].get<std::string>();
            if (j.contains("dhcp_start"))
                dhcp_start = j["dhcp_start"].get<std::string>();
            if (j.contains("dhcp_end"))
                dhcp_end = j["dhcp_end"].get<std::string>();
            if (j.contains("netmask"))
                netmask = j["netmask"].get<std::string>();
            if (j.contains("lease_time"))
                lease_time = j["lease_time"].get<std::string>();
        }

        // LoggingConfig implementation
        void LoggingConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("log_level"))
                log_level = j["log_level"].get<std::string>();
            if (j.contains("log_file") && !j["log_file"].is_null())
                log_file = j["log_file"].get<std::string>();
        }

        // ToolConfig implementation
        std::unique_ptr<ToolConfig> ToolConfig::from_file(const std::string &config_path)
        {
            std::ifstream file(config_path);
            if (!file.is_open())
            {
                throw ValidationError("Configuration file not found: " + config_path);
            }

            nlohmann::json j;
            try
            {
                file >> j;
            }
            catch (const nlohmann::json::parse_error &e)
            {
                throw ValidationError("Invalid JSON in configuration file " + config_path + ": " + e.what());
            }

            return from_json(j);
        }

        std::unique_ptr<ToolConfig> ToolConfig::from_json(const nlohmann::json &j)
        {
            if (!j.is_object())
            {
                throw ValidationError("Configuration must be a JSON object");
            }

            auto config = create_default();

            try
            {
                if (j.contains("paths"))
                {
                    config->paths.from_json(j["paths"]);
                }
                if (j.contains("access_point"))
                {
                    config->access_point.from_json(j["access_point"]);
                }
                if (j.contains("defaults"))
                {
                    config->defaults.from_json(j["defaults"]);
                }
                if (j.contains("logging"))
                {
                    config->logging.from_json(j["logging"]);
                }
            }
            catch (const nlohmann::json::exception &e)
            {
                throw ValidationError("Invalid configuration value: " + std::string(e.what()));
            }

            return config;
        }

        std::unique_ptr<ToolConfig> ToolConfig::create_default()
        {
            return std::make_unique<ToolConfig>();
        }

        std::unique_ptr<ToolConfig> ToolConfig::load(const std::string &config_path)
        {
            if (!config_path.empty())
            {
                return from_file(config_path);
            }

            std::error_code ec;
            if (std::filesystem::exists(DEFAULT_PATH, ec))
            {
                return from_file(DEFAULT_PATH);
            }
            return create_default();
        }

        void ToolConfig::validate() const
        {
            if (paths.hostapd_config.empty() || paths.dnsmasq_config.empty() || paths.state_file.empty())
            {
                throw ValidationError("Configuration validation error: paths must not be empty");
            }

            if (access_point.ssid.empty() || access_point.ssid.size() > 32)
            {
                throw ValidationError("Configuration validation error: access_point.ssid must be 1-32 characters");
            }

            if (access_point.channel < 1 || access_point.channel > 196)
            {
                throw ValidationError("Configuration validation error: access_point.channel must be between 1 and 196");
            }

            if (access_point.hw_mode != "a" && access_point.hw_mode != "b" && access_point.hw_mode != "g")
            {
                throw ValidationError("Configuration validation error: access_point.hw_mode must be a, b or g");
            }

            if (!access_point.passphrase.empty() &&
                (access_point.passphrase.size() < 8 || access_point.passphrase.size() > 63))
            {
                throw ValidationError("Configuration validation error: access_point.passphrase must be 8-63 characters");
            }

            const std::pair<const char *, const std::string *> addresses[] = {
                {"defaults.ap_address", &defaults.ap_address},
                {"defaults.dhcp_start", &defaults.dhcp_start},
                {"defaults.dhcp_end", &defaults.dhcp_end},
                {"defaults.netmask", &defaults.netmask}};
            for (const auto &[name, value] : addresses)
            {
                if (!is_ip_address(*value))
                {
                    throw ValidationError(std::string("Configuration validation error: ") + name + " is not an IPv4 address");
                }
            }

            if (!is_valid_lease_time(defaults.lease_time))
            {
                throw ValidationError("Configuration validation error: defaults.lease_time must look like 12h");
            }
        }

    } // namespace core
} // namespace captureap
