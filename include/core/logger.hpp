#ifndef WIFIRIG_CORE_LOGGER_HPP
#define WIFIRIG_CORE_LOGGER_HPP

#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <sstream>
#include <map>
#include <vector>

namespace wifirig
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
         * Structured key=value context attached to a log line
         */
        class LogContext
        {
        public:
            LogContext() = default;

            template <typename T>
            LogContext &add(const std::string &key, const T &value)
            {
                std::ostringstream ss;
                ss << std::boolalpha << value;
                context_[key] = ss.str();
                return *this;
            }

            std::string format() const;
            bool empty() const { return context_.empty(); }

        private:
            std::map<std::string, std::string> context_;
        };

        /**
         * Named logger writing to console, an optional file and an optional
         * capture buffer
         */
        class Logger
        {
        public:
            Logger(const std::string &name, LogLevel level = LogLevel::INFO);
            ~Logger();

            void set_level(LogLevel level) { level_ = level; }
            void set_output_file(const std::string &filename);
            void set_console_output(bool enabled) { console_output_ = enabled; }

            // Formatted lines are appended to |buffer| until it is reset with nullptr.
            void set_capture(std::shared_ptr<std::vector<std::string>> buffer);

            void debug(const std::string &message, const LogContext &context = LogContext{});
            void info(const std::string &message, const LogContext &context = LogContext{});
            void warning(const std::string &message, const LogContext &context = LogContext{});
            void error(const std::string &message, const LogContext &context = LogContext{});
            void critical(const std::string &message, const LogContext &context = LogContext{});

            bool is_enabled(LogLevel level) const { return level >= level_; }

            const std::string &name() const { return name_; }

        private:
            void log(LogLevel level, const std::string &message, const LogContext &context);
            std::string format_message(LogLevel level, const std::string &message, const LogContext &context) const;

            std::string name_;
            LogLevel level_;
            bool console_output_;
            std::unique_ptr<std::ofstream> file_output_;
            std::shared_ptr<std::vector<std::string>> capture_;
            mutable std::mutex mutex_;
        };

        /**
         * Registry of named loggers sharing one default setup
         */
        class LoggerManager
        {
        public:
            static LoggerManager &instance();

            void setup_logging(LogLevel level = LogLevel::INFO,
                               const std::string &log_file = "",
                               bool console_output = true);

            std::shared_ptr<Logger> get_logger(const std::string &name);

            // Attaches |buffer| to every existing and future logger.
            void capture_all(std::shared_ptr<std::vector<std::string>> buffer);

            static LogLevel string_to_level(const std::string &level_str);
            static std::string level_to_string(LogLevel level);

        private:
            LoggerManager() = default;

            LogLevel default_level_ = LogLevel::INFO;
            std::string default_log_file_;
            bool default_console_output_ = true;
            std::shared_ptr<std::vector<std::string>> default_capture_;
            std::map<std::string, std::shared_ptr<Logger>> loggers_;
            std::mutex mutex_;
        };

        std::shared_ptr<Logger> get_logger(const std::string &name);
        void setup_logging(LogLevel level = LogLevel::INFO,
                           const std::string &log_file = "",
                           bool console_output = true);

    } // namespace core
} // namespace wifirig

#endif // WIFIRIG_CORE_LOGGER_HPP
