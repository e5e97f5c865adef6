#ifndef CAPTUREAP_SERVICES_ACCESS_POINT_SERVICE_HPP
#define CAPTUREAP_SERVICES_ACCESS_POINT_SERVICE_HPP

#include "config/ap_settings.hpp"

#include <memory>
#include <string>
#include <vector>

namespace captureap
{
    namespace core
    {
        class Logger;
        class RunStateStore;
    }
    namespace config
    {
        class ConfigReconciler;
    }
    namespace infrastructure
    {
        class SystemState;
    }
}

namespace captureap
{
    namespace services
    {

        /**
         * Bring-up progress. Each transition is one external command.
         */
        enum class BringUpStage
        {
            Idle,
            RoutingEnabled,
            MasqueradeEnabled,
            InterfaceDetached,
            BeaconLaunched,
            IPAssigned,
            DhcpRunning,
            Ready
        };

        std::string to_string(BringUpStage stage);

        /**
         * Access point orchestrator
         *
         * Brings the access point up in a fixed order and tears it down in reverse.
         * Any failed bring-up step throws ExternalCommandError and leaves the steps
         * already taken in place; there is no rollback. Teardown works from the
         * persisted run state only and keeps going past failed steps.
         */
        class AccessPointService
        {
        public:
            static const std::vector<std::string> &required_executables();

            AccessPointService(std::shared_ptr<infrastructure::SystemState> system,
                               std::shared_ptr<config::ConfigReconciler> reconciler,
                               std::shared_ptr<core::RunStateStore> run_state);

            // Throws PrivilegeError when not root, DependencyError naming every missing tool
            void check_environment() const;

            /**
             * Validate the interfaces, reconcile the configs and run every bring-up
             * step. Throws ValidationError before any command runs if the settings
             * are unusable.
             */
            void bring_up(const config::ApSettings &settings);

            // Throws StateError, without running anything, if no bring-up is recorded
            void tear_down();

            BringUpStage stage() const { return stage_; }

            // Operator summary printed after a successful bring-up
            static std::string format_summary(const config::ApSettings &settings);

        private:
            void stop_stale_access_point();
            void enable_routing();
            void enable_masquerade(const config::ApSettings &settings);
            void detach_interface(const config::ApSettings &settings);
            void launch_beacon();
            void assign_address(const config::ApSettings &settings, int prefix_length);
            void start_dhcp_server(const config::ApSettings &settings);
            void persist_run_state(const config::ApSettings &settings);

            void advance(BringUpStage next);

            std::shared_ptr<infrastructure::SystemState> system_;
            std::shared_ptr<config::ConfigReconciler> reconciler_;
            std::shared_ptr<core::RunStateStore> run_state_;
            std::shared_ptr<core::Logger> logger_;

            BringUpStage stage_ = BringUpStage::Idle;
        };

    } // namespace services
} // namespace captureap

#endif // CAPTUREAP_SERVICES_ACCESS_POINT_SERVICE_HPP
