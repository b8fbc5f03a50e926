#ifndef WIFIRIG_INFRASTRUCTURE_REMOTE_EXECUTOR_HPP
#define WIFIRIG_INFRASTRUCTURE_REMOTE_EXECUTOR_HPP

#include <chrono>
#include <memory>
#include <string>

namespace wifirig
{
    namespace core
    {
        class Logger;
    }
}

namespace wifirig
{
    namespace infrastructure
    {

        /**
         * Outcome of one command on the router host
         */
        struct CommandResult
        {
            int exit_status = 0;
            std::string stdout_text;

            bool ok() const { return exit_status == 0; }
        };

        /**
         * Synchronous command channel to the router host
         *
         * Every call blocks until the command returns or its timeout
         * expires. Implementations only provide execute() and get_file();
         * status checking and command logging live here.
         */
        class RemoteExecutor
        {
        public:
            explicit RemoteExecutor(std::chrono::seconds default_timeout);
            virtual ~RemoteExecutor() = default;

            /**
             * Run a shell command on the router
             * @param command Shell command line, may span several lines
             * @param timeout Zero selects the executor default
             * @param ignore_status Return non-zero statuses instead of throwing
             * @throws core::CommandFailed on non-zero exit unless ignore_status
             */
            CommandResult run(const std::string &command,
                              std::chrono::seconds timeout = std::chrono::seconds(0),
                              bool ignore_status = false);

            /**
             * Copy a file from the router host to a local path
             * @return false if the copy did not succeed
             */
            virtual bool get_file(const std::string &remote_path, const std::string &local_path) = 0;

            virtual std::string describe() const = 0;

        protected:
            virtual CommandResult execute(const std::string &command, std::chrono::seconds timeout) = 0;

            std::shared_ptr<core::Logger> logger_;

        private:
            std::chrono::seconds default_timeout_;
        };

        // Single-quote |value| for /bin/sh.
        std::string shell_quote(const std::string &value);

        /**
         * pgrep/pkill -f extended regex for |process| started with the
         * argument |instance|. The instance is matched literally and must end
         * an argument; the pattern never matches its own shell command line.
         * @throws std::invalid_argument if |process| is empty
         */
        std::string process_pattern(const std::string &process, const std::string &instance);

        /**
         * Kill |process| on the router, optionally only the one whose command
         * line carries the argument |instance| (see process_pattern). With a
         * non-zero |wait| the command keeps polling pgrep on the router until
         * the process is gone or |wait| expires. Never throws on a non-zero
         * status.
         */
        void kill_process_instance(RemoteExecutor &executor,
                                   const std::string &process,
                                   const std::string &instance = "",
                                   std::chrono::seconds wait = std::chrono::seconds(0));

        bool path_exists(RemoteExecutor &executor, const std::string &path);

        // Write |content| verbatim to |path| on the router through a quoted here-document.
        void write_remote_file(RemoteExecutor &executor, const std::string &path, const std::string &content);

        // @throws core::RigError if |path| is not executable on the router
        std::string must_be_installed(RemoteExecutor &executor, const std::string &path);

        bool is_installed(RemoteExecutor &executor, const std::string &path);

    } // namespace infrastructure
} // namespace wifirig

#endif // WIFIRIG_INFRASTRUCTURE_REMOTE_EXECUTOR_HPP
