#ifndef WIFIRIG_CORE_ERRORS_HPP
#define WIFIRIG_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace wifirig
{
    namespace core
    {

        /**
         * Base class for every failure raised by a router session
         */
        class RigError : public std::runtime_error
        {
        public:
            explicit RigError(const std::string &what) : std::runtime_error(what) {}
        };

        /**
         * hostapd did not come up on an interface
         */
        class StartupError : public RigError
        {
        public:
            StartupError(const std::string &what, const std::string &interface)
                : RigError(what), interface_(interface) {}

            const std::string &interface() const { return interface_; }

        private:
            std::string interface_;
        };

        // No success marker within the startup window.
        class StartupTimeout : public StartupError
        {
        public:
            using StartupError::StartupError;
        };

        // hostapd logged that interface initialization failed.
        class BadConfiguration : public StartupError
        {
        public:
            using StartupError::StartupError;
        };

        // The daemon pid disappeared while we were polling.
        class ProcessDied : public StartupError
        {
        public:
            using StartupError::StartupError;
        };

        class ResourceExhausted : public RigError
        {
        public:
            using RigError::RigError;
        };

        class NotConfigured : public RigError
        {
        public:
            using RigError::RigError;
        };

        class AmbiguousInstance : public RigError
        {
        public:
            using RigError::RigError;
        };

        class InvalidInstance : public RigError
        {
        public:
            using RigError::RigError;
        };

        class AlreadyConfigured : public RigError
        {
        public:
            using RigError::RigError;
        };

        class VerificationFailed : public RigError
        {
        public:
            using RigError::RigError;
        };

        class MissingCapability : public RigError
        {
        public:
            using RigError::RigError;
        };

        /**
         * A remote command exited non-zero while its status mattered
         */
        class CommandFailed : public RigError
        {
        public:
            CommandFailed(const std::string &command, int exit_status, const std::string &output)
                : RigError("Command failed with status " + std::to_string(exit_status) + ": " + command),
                  command_(command), exit_status_(exit_status), output_(output) {}

            const std::string &command() const { return command_; }
            int exit_status() const { return exit_status_; }
            const std::string &output() const { return output_; }

        private:
            std::string command_;
            int exit_status_;
            std::string output_;
        };

    } // namespace core
} // namespace wifirig

#endif // WIFIRIG_CORE_ERRORS_HPP
