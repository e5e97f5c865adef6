#ifndef CAPTUREAP_CORE_RUN_STATE_HPP
#define CAPTUREAP_CORE_RUN_STATE_HPP

#include <filesystem>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace captureap
{
    namespace core
    {
        class Logger;

        /**
         * Interfaces of the access point that is currently up
         */
        struct RunState
        {
            std::string internet_interface;
            std::string ap_interface;

            // Teardown needs both names
            bool empty() const { return internet_interface.empty() || ap_interface.empty(); }

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * JSON file holding the RunState between invocations
         */
        class RunStateStore
        {
        public:
            explicit RunStateStore(std::filesystem::path path);

            // Empty state if the file is missing. Throws StateError if it cannot be parsed.
            RunState load() const;
            void save(const RunState &state) const;
            void clear() const;

            const std::filesystem::path &path() const { return path_; }

        private:
            std::filesystem::path path_;
            std::shared_ptr<Logger> logger_;
        };

    } // namespace core
} // namespace captureap

#endif // CAPTUREAP_CORE_RUN_STATE_HPP
