#include "infrastructure/remote_executor.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <cstring>
#include <stdexcept>

namespace wifirig
{
    namespace infrastructure
    {

        RemoteExecutor::RemoteExecutor(std::chrono::seconds default_timeout)
            : logger_(core::get_logger("RemoteExecutor")), default_timeout_(default_timeout)
        {
        }

        CommandResult RemoteExecutor::run(const std::string &command, std::chrono::seconds timeout, bool ignore_status)
        {
            if (timeout.count() <= 0)
            {
                timeout = default_timeout_;
            }

            logger_->debug("Running command", core::LogContext()
                                                  .add("host", describe())
                                                  .add("command", command)
                                                  .add("timeout", timeout.count()));

            CommandResult result = execute(command, timeout);

            if (!result.ok())
            {
                logger_->debug("Command returned non-zero status",
                               core::LogContext().add("status", result.exit_status).add("ignored", ignore_status));
                if (!ignore_status)
                {
                    throw core::CommandFailed(command, result.exit_status, result.stdout_text);
                }
            }

            return result;
        }

        std::string shell_quote(const std::string &value)
        {
            std::string quoted = "'";
            for (char c : value)
            {
                if (c == '\'')
                {
                    quoted += "'\\''";
                }
                else
                {
                    quoted += c;
                }
            }
            quoted += "'";
            return quoted;
        }

        std::string process_pattern(const std::string &process, const std::string &instance)
        {
            if (process.empty())
            {
                throw std::invalid_argument("Process name must not be empty");
            }

            // "[h]ostapd" never matches the shell that carries the pattern itself.
            std::string pattern = "[" + process.substr(0, 1) + "]" + process.substr(1);
            if (instance.empty())
            {
                return pattern;
            }

            pattern += ".*";
            for (char c : instance)
            {
                if (std::strchr(".[](){}*+?|^$\\", c) != nullptr)
                {
                    pattern += '\\';
                }
                pattern += c;
            }
            // The instance must end an argument, so "x1" never matches "x10".
            pattern += "( |$)";
            return pattern;
        }

        void kill_process_instance(RemoteExecutor &executor,
                                   const std::string &process,
                                   const std::string &instance,
                                   std::chrono::seconds wait)
        {
            std::string search_arg = process;
            if (!instance.empty())
            {
                search_arg = "-f " + shell_quote(process_pattern(process, instance));
            }

            std::string command = "pkill " + search_arg + " >/dev/null 2>&1";
            if (wait.count() > 0)
            {
                command += " && while pgrep " + search_arg + " >/dev/null 2>&1; do sleep 1; done";
                executor.run(command, wait, true);
            }
            else
            {
                executor.run(command, std::chrono::seconds(0), true);
            }
        }

        bool path_exists(RemoteExecutor &executor, const std::string &path)
        {
            return executor.run("test -e " + path, std::chrono::seconds(0), true).ok();
        }

        void write_remote_file(RemoteExecutor &executor, const std::string &path, const std::string &content)
        {
            // Quoted delimiter: the shell must not expand $, backticks or backslashes in |content|.
            executor.run("cat <<'EOF' >" + path + "\n" + content + "\nEOF\n");
        }

        bool is_installed(RemoteExecutor &executor, const std::string &path)
        {
            return executor.run("test -x " + path, std::chrono::seconds(0), true).ok();
        }

        std::string must_be_installed(RemoteExecutor &executor, const std::string &path)
        {
            if (!is_installed(executor, path))
            {
                throw core::RigError("Required tool is not installed on " + executor.describe() + ": " + path);
            }
            return path;
        }

    } // namespace infrastructure
} // namespace wifirig
