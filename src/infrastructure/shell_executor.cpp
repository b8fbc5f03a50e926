/**
 * Shell-backed command executors
 * Local commands go through popen, remote ones through the ssh client
 */

#include "infrastructure/shell_executor.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"

#include <cstdio>
#include <filesystem>
#include <sys/wait.h>

namespace wifirig
{
    namespace infrastructure
    {

        namespace
        {
            CommandResult run_pipe(const std::string &command_line)
            {
                CommandResult result;

                FILE *pipe = popen(command_line.c_str(), "r");
                if (!pipe)
                {
                    result.exit_status = -1;
                    return result;
                }

                char buffer[256];
                while (fgets(buffer, sizeof(buffer), pipe))
                {
                    result.stdout_text += buffer;
                }

                int status = pclose(pipe);
                if (status == -1)
                {
                    result.exit_status = -1;
                }
                else if (WIFEXITED(status))
                {
                    result.exit_status = WEXITSTATUS(status);
                }
                else
                {
                    result.exit_status = 128 + WTERMSIG(status);
                }
                return result;
            }

            bool ensure_parent_directory(const std::string &local_path)
            {
                std::error_code ec;
                auto parent = std::filesystem::path(local_path).parent_path();
                if (!parent.empty())
                {
                    std::filesystem::create_directories(parent, ec);
                }
                return !ec;
            }
        }

        // LocalShellExecutor implementation
        LocalShellExecutor::LocalShellExecutor(std::chrono::seconds default_timeout)
            : RemoteExecutor(default_timeout)
        {
        }

        CommandResult LocalShellExecutor::execute(const std::string &command, std::chrono::seconds timeout)
        {
            return run_pipe("timeout " + std::to_string(timeout.count()) + " /bin/sh -c " + shell_quote(command));
        }

        bool LocalShellExecutor::get_file(const std::string &remote_path, const std::string &local_path)
        {
            if (!ensure_parent_directory(local_path))
            {
                logger_->error("Cannot create results directory", core::LogContext().add("path", local_path));
                return false;
            }

            std::error_code ec;
            std::filesystem::copy_file(remote_path, local_path,
                                       std::filesystem::copy_options::overwrite_existing, ec);
            if (ec)
            {
                logger_->error("Failed to copy file",
                               core::LogContext().add("source", remote_path).add("error", ec.message()));
                return false;
            }
            return true;
        }

        // SshExecutor implementation
        SshExecutor::SshExecutor(const core::RouterHostConfig &host, std::chrono::seconds default_timeout)
            : RemoteExecutor(default_timeout),
              address_(host.address),
              user_(host.user),
              port_(host.port),
              connect_timeout_(host.connect_timeout)
        {
        }

        std::string SshExecutor::describe() const
        {
            return user_ + "@" + address_;
        }

        std::string SshExecutor::ssh_options() const
        {
            return "-o BatchMode=yes -o StrictHostKeyChecking=no -o UserKnownHostsFile=/dev/null"
                   " -o LogLevel=ERROR -o ConnectTimeout=" +
                   std::to_string(connect_timeout_);
        }

        CommandResult SshExecutor::execute(const std::string &command, std::chrono::seconds timeout)
        {
            std::string command_line = "timeout " + std::to_string(timeout.count()) +
                                       " ssh " + ssh_options() +
                                       " -p " + std::to_string(port_) + " " +
                                       describe() + " " + shell_quote(command);
            return run_pipe(command_line);
        }

        bool SshExecutor::get_file(const std::string &remote_path, const std::string &local_path)
        {
            if (!ensure_parent_directory(local_path))
            {
                logger_->error("Cannot create results directory", core::LogContext().add("path", local_path));
                return false;
            }

            auto result = run_pipe("scp -q " + ssh_options() + " -P " + std::to_string(port_) + " " +
                                   describe() + ":" + shell_quote(remote_path) + " " +
                                   shell_quote(local_path) + " 2>&1");
            if (!result.ok())
            {
                logger_->error("scp failed",
                               core::LogContext().add("source", remote_path).add("output", result.stdout_text));
                return false;
            }
            return true;
        }

        std::unique_ptr<RemoteExecutor> make_executor(const core::RouterHostConfig &host,
                                                      std::chrono::seconds default_timeout)
        {
            if (host.is_local())
            {
                return std::make_unique<LocalShellExecutor>(default_timeout);
            }
            return std::make_unique<SshExecutor>(host, default_timeout);
        }

    } // namespace infrastructure
} // namespace wifirig
