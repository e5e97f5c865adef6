#include "core/run_state.hpp"
#include "core/errors.hpp"
#include "core/file_util.hpp"
#include "core/logger.hpp"

#include <utility>

namespace captureap
{
    namespace core
    {

        void RunState::from_json(const nlohmann::json &j)
        {
            if (j.contains("internet_interface") && j["internet_interface"].is_string())
                internet_interface = j["internet_interface"].get<std::string>();
            if (j.contains("ap_interface") && j["ap_interface"].is_string())
                ap_interface = j["ap_interface"].get<std::string>();
        }

        nlohmann::json RunState::to_json() const
        {
            return nlohmann::json{
                {"internet_interface", internet_interface},
                {"ap_interface", ap_interface}};
        }

        RunStateStore::RunStateStore(std::filesystem::path path)
            : path_(std::move(path)), logger_(get_logger("RunStateStore"))
        {
        }

        RunState RunStateStore::load() const
        {
            RunState state;

            auto content = read_file(path_);
            if (!content || content->empty())
            {
                return state;
            }

            try
            {
                auto j = nlohmann::json::parse(*content);
                if (j.is_object())
                {
                    state.from_json(j);
                }
            }
            catch (const nlohmann::json::parse_error &e)
            {
                throw StateError("Run state file " + path_.string() + " is corrupt: " + e.what());
            }

            logger_->debug("Loaded run state",
                           LogContext()
                               .add("internet_interface", state.internet_interface)
                               .add("ap_interface", state.ap_interface));
            return state;
        }

        void RunStateStore::save(const RunState &state) const
        {
            write_file_atomically(path_, state.to_json().dump(4) + "\n");
            logger_->debug("Saved run state", LogContext().add("file", path_.string()));
        }

        void RunStateStore::clear() const
        {
            save(RunState{});
        }

    } // namespace core
} // namespace captureap
