/**
 * hostapd / dnsmasq config reconciliation
 */

#include "config/config_reconciler.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/validators.hpp"

#include <sstream>
#include <utility>
#include <vector>

namespace captureap
{
    namespace config
    {

        namespace
        {
            constexpr const char *GATEWAY_OPTION = "3,";
            constexpr const char *DNS_OPTION = "6,";

            std::vector<std::string> split(const std::string &value, char delimiter)
            {
                std::vector<std::string> fields;
                std::istringstream stream(value);
                std::string field;
                while (std::getline(stream, field, delimiter))
                {
                    fields.push_back(field);
                }
                // getline drops an empty trailing field
                if (!value.empty() && value.back() == delimiter)
                {
                    fields.emplace_back();
                }
                return fields;
            }
        }

        ConfigReconciler::ConfigReconciler(std::filesystem::path hostapd_path, std::filesystem::path dnsmasq_path)
            : hostapd_path_(std::move(hostapd_path)),
              dnsmasq_path_(std::move(dnsmasq_path)),
              logger_(core::get_logger("ConfigReconciler"))
        {
        }

        void ConfigReconciler::load_persisted(ApSettings &settings) const
        {
            if (auto dnsmasq = KeyValueDocument::load(dnsmasq_path_))
            {
                if (auto range = dnsmasq->get("dhcp-range"))
                {
                    auto fields = split(*range, ',');
                    if (fields.size() == 4 &&
                        core::is_ip_address(fields[0]) &&
                        core::is_ip_address(fields[1]) &&
                        core::is_ip_address(fields[2]) &&
                        core::is_valid_lease_time(fields[3]))
                    {
                        settings.dhcp_start = fields[0];
                        settings.dhcp_end = fields[1];
                        settings.netmask = fields[2];
                        settings.lease_time = fields[3];
                    }
                    else
                    {
                        logger_->warning("Ignoring malformed dhcp-range in persisted config",
                                         core::LogContext()
                                             .add("file", dnsmasq_path_.string())
                                             .add("dhcp-range", *range));
                    }
                }

                if (auto gateway = dnsmasq->find_with_prefix("dhcp-option", GATEWAY_OPTION))
                {
                    auto address = gateway->substr(gateway->find_last_of(',') + 1);
                    if (core::is_ip_address(address))
                    {
                        settings.ap_address = address;
                    }
                    else
                    {
                        logger_->warning("Ignoring malformed gateway option in persisted config",
                                         core::LogContext()
                                             .add("file", dnsmasq_path_.string())
                                             .add("dhcp-option", *gateway));
                    }
                }
            }

            if (auto hostapd = KeyValueDocument::load(hostapd_path_))
            {
                auto ssid = hostapd->get("ssid");
                if (ssid && !ssid->empty())
                {
                    settings.ssid = *ssid;
                }
            }

            logger_->debug("Settings after persisted configs",
                           core::LogContext()
                               .add("ap_address", settings.ap_address)
                               .add("dhcp_range", dhcp_range_value(settings))
                               .add("ssid", settings.ssid));
        }

        bool ConfigReconciler::has_value(const KeyValueDocument &document, const std::string &key)
        {
            auto value = document.get(key);
            return value && !value->empty();
        }

        bool ConfigReconciler::hostapd_config_is_valid() const
        {
            auto document = KeyValueDocument::load(hostapd_path_);
            if (!document)
            {
                return false;
            }
            return has_value(*document, "interface") &&
                   has_value(*document, "channel") &&
                   has_value(*document, "ssid");
        }

        bool ConfigReconciler::dnsmasq_config_is_valid() const
        {
            auto document = KeyValueDocument::load(dnsmasq_path_);
            if (!document)
            {
                return false;
            }

            auto gateway = document->find_with_prefix("dhcp-option", GATEWAY_OPTION);
            auto dns = document->find_with_prefix("dhcp-option", DNS_OPTION);

            return has_value(*document, "interface") &&
                   has_value(*document, "dhcp-range") &&
                   gateway && gateway->size() > 2 &&
                   dns && dns->size() > 2;
        }

        ConfigReconciler::Result ConfigReconciler::reconcile(const ApSettings &settings) const
        {
            Result result;

            if (!dnsmasq_config_is_valid())
            {
                logger_->warning("Missing or misconfigured file, creating it with default settings. Check for accuracy.",
                                 core::LogContext().add("file", dnsmasq_path_.string()));
                make_dnsmasq_config(settings).save(dnsmasq_path_);
                result.dnsmasq_generated = true;
            }
            else
            {
                logger_->info("Checking dnsmasq config... [OK]", core::LogContext().add("file", dnsmasq_path_.string()));
            }

            if (!hostapd_config_is_valid())
            {
                logger_->warning("Missing or misconfigured file, creating it with default settings. Check for accuracy.",
                                 core::LogContext().add("file", hostapd_path_.string()));
                make_hostapd_config(settings).save(hostapd_path_);
                result.hostapd_generated = true;
            }
            else
            {
                logger_->info("Checking hostapd config... [OK]", core::LogContext().add("file", hostapd_path_.string()));
            }

            auto dnsmasq = KeyValueDocument::load(dnsmasq_path_);
            if (!dnsmasq)
            {
                throw core::CaptureApError("<" + dnsmasq_path_.string() + "> could not be found for updating");
            }
            update_dnsmasq_config(*dnsmasq, settings);
            dnsmasq->save(dnsmasq_path_);

            auto hostapd = KeyValueDocument::load(hostapd_path_);
            if (!hostapd)
            {
                throw core::CaptureApError("<" + hostapd_path_.string() + "> could not be found for updating");
            }
            update_hostapd_config(*hostapd, settings);
            hostapd->save(hostapd_path_);

            return result;
        }

        std::string ConfigReconciler::dhcp_range_value(const ApSettings &settings)
        {
            return settings.dhcp_start + "," + settings.dhcp_end + "," + settings.netmask + "," + settings.lease_time;
        }

        KeyValueDocument ConfigReconciler::make_hostapd_config(const ApSettings &settings)
        {
            KeyValueDocument document;
            document.add_comment("Generated by capture_ap. Only the interface line is rewritten on later runs.")
                .add_blank()
                .add_comment("wireless interface hostapd drives")
                .add("interface", settings.ap_interface)
                .add_blank()
                .add_comment("g = 2.4GHz, a = 5GHz")
                .add("hw_mode", settings.hw_mode)
                .add("channel", std::to_string(settings.channel))
                .add_blank()
                .add_comment("WMM is required for full 802.11n/ac throughput")
                .add("wmm_enabled", "1")
                .add("country_code", settings.country_code)
                .add("ieee80211n", "1")
                .add("ieee80211ac", "1")
                .add_blank()
                .add("ssid", settings.ssid);

            if (!settings.passphrase.empty())
            {
                document.add_blank()
                    .add_comment("WPA2-PSK with CCMP; remove this block for an open network")
                    .add("auth_algs", "1")
                    .add("wpa", "2")
                    .add("wpa_key_mgmt", "WPA-PSK")
                    .add("rsn_pairwise", "CCMP")
                    .add("wpa_passphrase", settings.passphrase);
            }

            return document;
        }

        KeyValueDocument ConfigReconciler::make_dnsmasq_config(const ApSettings &settings)
        {
            KeyValueDocument document;
            document.add_comment("Generated by capture_ap. interface, dhcp-range and both dhcp-option lines are rewritten on later runs.")
                .add_blank()
                .add("interface", settings.ap_interface)
                .add_blank()
                .add("dhcp-range", dhcp_range_value(settings))
                .add_comment("default gateway handed to clients")
                .add("dhcp-option", GATEWAY_OPTION + settings.ap_address)
                .add_comment("DNS server handed to clients")
                .add("dhcp-option", DNS_OPTION + settings.ap_address);
            return document;
        }

        void ConfigReconciler::update_dnsmasq_config(KeyValueDocument &document, const ApSettings &settings)
        {
            document.set("interface", settings.ap_interface);
            document.set("dhcp-range", dhcp_range_value(settings));
            document.set("dhcp-option", GATEWAY_OPTION + settings.ap_address, GATEWAY_OPTION);
            document.set("dhcp-option", DNS_OPTION + settings.ap_address, DNS_OPTION);
        }

        void ConfigReconciler::update_hostapd_config(KeyValueDocument &document, const ApSettings &settings)
        {
            document.set("interface", settings.ap_interface);
        }

    } // namespace config
} // namespace captureap
