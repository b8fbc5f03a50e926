#ifndef WIFIRIG_INFRASTRUCTURE_SHELL_EXECUTOR_HPP
#define WIFIRIG_INFRASTRUCTURE_SHELL_EXECUTOR_HPP

#include "infrastructure/remote_executor.hpp"

#include <memory>
#include <string>

namespace wifirig
{
    namespace core
    {
        struct RouterHostConfig;
    }
}

namespace wifirig
{
    namespace infrastructure
    {

        /**
         * Runs router commands through /bin/sh on this machine
         */
        class LocalShellExecutor : public RemoteExecutor
        {
        public:
            explicit LocalShellExecutor(std::chrono::seconds default_timeout);

            bool get_file(const std::string &remote_path, const std::string &local_path) override;
            std::string describe() const override { return "localhost"; }

        protected:
            CommandResult execute(const std::string &command, std::chrono::seconds timeout) override;
        };

        /**
         * Runs router commands over ssh and fetches files with scp
         */
        class SshExecutor : public RemoteExecutor
        {
        public:
            SshExecutor(const core::RouterHostConfig &host, std::chrono::seconds default_timeout);

            bool get_file(const std::string &remote_path, const std::string &local_path) override;
            std::string describe() const override;

        protected:
            CommandResult execute(const std::string &command, std::chrono::seconds timeout) override;

        private:
            std::string ssh_options() const;

            std::string address_;
            std::string user_;
            int port_;
            int connect_timeout_;
        };

        // Picks the local or ssh executor for |host|.
        std::unique_ptr<RemoteExecutor> make_executor(const core::RouterHostConfig &host,
                                                      std::chrono::seconds default_timeout);

    } // namespace infrastructure
} // namespace wifirig

#endif // WIFIRIG_INFRASTRUCTURE_SHELL_EXECUTOR_HPP
