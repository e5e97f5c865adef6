#ifndef CAPTUREAP_CONFIG_CONFIG_RECONCILER_HPP
#define CAPTUREAP_CONFIG_CONFIG_RECONCILER_HPP

#include "config/ap_settings.hpp"
#include "config/key_value_document.hpp"

#include <filesystem>
#include <memory>

namespace captureap
{
    namespace core
    {
        class Logger;
    }
}

namespace captureap
{
    namespace config
    {

        /**
         * Keeps the hostapd and dnsmasq configs in step with the current settings
         *
         * A config is only checked for the presence of its key lines, not for the
         * meaning of their values. A missing or incomplete file is regenerated from
         * the settings. A complete one only has its interface, range, gateway and
         * DNS lines rewritten so hand edits (security, channel, ...) survive.
         */
        class ConfigReconciler
        {
        public:
            struct Result
            {
                bool hostapd_generated = false;
                bool dnsmasq_generated = false;
            };

            ConfigReconciler(std::filesystem::path hostapd_path, std::filesystem::path dnsmasq_path);

            /**
             * Overlay the values stored by a previous run onto settings: the dnsmasq
             * range, netmask, lease and gateway, and the hostapd SSID. A dhcp-range
             * that does not split into exactly four valid fields is ignored.
             */
            void load_persisted(ApSettings &settings) const;

            bool hostapd_config_is_valid() const;
            bool dnsmasq_config_is_valid() const;

            // Generate missing or incomplete files, then rewrite the tracked fields of both
            Result reconcile(const ApSettings &settings) const;

            static KeyValueDocument make_hostapd_config(const ApSettings &settings);
            static KeyValueDocument make_dnsmasq_config(const ApSettings &settings);

            // Rewrite interface, dhcp-range and both dhcp-options of an existing dnsmasq document
            static void update_dnsmasq_config(KeyValueDocument &document, const ApSettings &settings);
            // Rewrite the interface of an existing hostapd document
            static void update_hostapd_config(KeyValueDocument &document, const ApSettings &settings);

            static std::string dhcp_range_value(const ApSettings &settings);

            const std::filesystem::path &hostapd_path() const { return hostapd_path_; }
            const std::filesystem::path &dnsmasq_path() const { return dnsmasq_path_; }

        private:
            static bool has_value(const KeyValueDocument &document, const std::string &key);

            std::filesystem::path hostapd_path_;
            std::filesystem::path dnsmasq_path_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace config
} // namespace captureap

#endif // CAPTUREAP_CONFIG_CONFIG_RECONCILER_HPP
