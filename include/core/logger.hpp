#ifndef CAPTUREAP_CORE_LOGGER_HPP
#define CAPTUREAP_CORE_LOGGER_HPP

#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <sstream>
#include <map>
#include <vector>
#include <utility>

namespace captureap
{
    namespace core
    {

        /**
         * Log levels
         */
        enum class LogLevel
        {
            DEBUG = 0,
            INFO = 1,
            WARNING = 2,
            ERROR = 3,
            CRITICAL = 4
        };

        /**
         * Ordered key-value pairs appended to a log line
         */
        class LogContext
        {
        public:
            LogContext() = default;

            template <typename T>
            LogContext &add(const std::string &key, const T &value)
            {
                std::ostringstream ss;
                ss << value;
                fields_.emplace_back(key, ss.str());
                return *this;
            }

            std::string format() const;
            bool empty() const { return fields_.empty(); }

        private:
            std::vector<std::pair<std::string, std::string>> fields_;
        };

        /**
         * Named logger
         *
         * Console lines carry only the severity tag, e.g. "[WARNING] message key=value",
         * since this is an operator-facing tool. File lines carry a timestamp and the
         * logger name as well.
         */
        class Logger
        {
        public:
            Logger(const std::string &name, LogLevel level = LogLevel::WARNING);
            ~Logger();

            void set_level(LogLevel level) { level_ = level; }
            LogLevel level() const { return level_; }
            void set_output_file(const std::string &filename);
            void set_console_output(bool enabled) { console_output_ = enabled; }

            void debug(const std::string &message, const LogContext &context = LogContext{});
            void info(const std::string &message, const LogContext &context = LogContext{});
            void warning(const std::string &message, const LogContext &context = LogContext{});
            void error(const std::string &message, const LogContext &context = LogContext{});
            void critical(const std::string &message, const LogContext &context = LogContext{});

            bool is_enabled(LogLevel level) const { return level >= level_; }

            const std::string &name() const { return name_; }

        private:
            void log(LogLevel level, const std::string &message, const LogContext &context);
            std::string format_console(LogLevel level, const std::string &message, const LogContext &context) const;
            std::string format_file(LogLevel level, const std::string &message, const LogContext &context) const;

            std::string name_;
            LogLevel level_;
            bool console_output_;
            std::unique_ptr<std::ofstream> file_output_;
            mutable std::mutex mutex_;
        };

        /**
         * Logger registry
         */
        class LoggerManager
        {
        public:
            static LoggerManager &instance();

            void setup_logging(LogLevel level = LogLevel::WARNING,
                               const std::string &log_file = "",
                               bool console_output = true);

            std::shared_ptr<Logger> get_logger(const std::string &name);

            static LogLevel string_to_level(const std::string &level_str);
            static std::string level_to_string(LogLevel level);

        private:
            LoggerManager() = default;

            LogLevel default_level_ = LogLevel::WARNING;
            std::string default_log_file_;
            bool default_console_output_ = true;
            std::map<std::string, std::shared_ptr<Logger>> loggers_;
            std::mutex mutex_;
        };

        std::shared_ptr<Logger> get_logger(const std::string &name);
        void setup_logging(LogLevel level = LogLevel::WARNING,
                           const std::string &log_file = "",
                           bool console_output = true);

    } // namespace core
} // namespace captureap

#endif // CAPTUREAP_CORE_LOGGER_HPP
