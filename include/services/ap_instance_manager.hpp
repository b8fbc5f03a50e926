#ifndef WIFIRIG_SERVICES_AP_INSTANCE_MANAGER_HPP
#define WIFIRIG_SERVICES_AP_INSTANCE_MANAGER_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "services/hostap_config.hpp"

namespace wifirig
{
    namespace core
    {
        struct CommandPaths;
        struct LifecycleConfig;
        class Clock;
        class Logger;
    }
    namespace infrastructure
    {
        class RemoteExecutor;
        class InterfaceAllocator;
    }
    namespace services
    {
        class SsidBuilder;
    }
}

namespace wifirig
{
    namespace services
    {

        /**
         * One running hostapd bound to one interface
         */
        struct APInstance
        {
            std::string ssid;
            std::string interface;
            ParamList params;
            std::string conf_file;
            std::string log_file;
            std::string pid_file;
            std::string ctrl_interface;
            int pid = 0;
        };

        /**
         * Access Point Instance Manager
         * Starts hostapd on a freshly allocated interface, waits until it
         * reports the interface as initialized and stops it again
         */
        class APInstanceManager
        {
        public:
            static constexpr const char *SUCCESS_MARKER = "Completing interface initialization";
            static constexpr const char *FAILURE_MARKER = "Interface initialization failed";

            // Invoked as soon as the interface is known, before hostapd runs.
            using BindCallback = std::function<void(const std::string &interface)>;

            APInstanceManager(infrastructure::RemoteExecutor &executor,
                              infrastructure::InterfaceAllocator &allocator,
                              const ConfigGenerator &generator,
                              const SsidBuilder &ssid_builder,
                              const core::CommandPaths &commands,
                              const core::LifecycleConfig &lifecycle,
                              core::Clock &clock);

            /**
             * Start hostapd for |config|
             * @return The instance, only once hostapd reported success
             * @throws core::BadConfiguration hostapd logged an initialization failure
             * @throws core::ProcessDied hostapd exited while starting
             * @throws core::StartupTimeout no verdict within the startup timeout
             */
            APInstance start(const HostapConfig &config, const BindCallback &on_bound = nullptr);

            /**
             * Stop |instance| and give its interface back. Never throws.
             * @param silent Remove the interface first so no deauth frames go out
             * @param log_tag Distinguishes log files of repeated sessions
             */
            void stop(const APInstance &instance, bool silent, bool collect_logs, size_t log_tag);

            // Kill every hostapd on the router.
            void kill_all();

            // grep the hostapd log of |instance| for |pattern|.
            bool log_contains(const APInstance &instance, const std::string &pattern, bool ignore_case = false);

            static std::string conf_file_for(const std::string &interface);
            static std::string log_file_for(const std::string &interface);
            static std::string pid_file_for(const std::string &interface);
            static std::string ctrl_interface_for(const std::string &interface);

        private:
            void launch(APInstance &instance);
            void wait_for_startup(const APInstance &instance);
            void abandon(const APInstance &instance);
            void collect_log(const APInstance &instance, size_t log_tag);

            infrastructure::RemoteExecutor &executor_;
            infrastructure::InterfaceAllocator &allocator_;
            const ConfigGenerator &generator_;
            const SsidBuilder &ssid_builder_;
            const core::CommandPaths &commands_;
            const core::LifecycleConfig &lifecycle_;
            core::Clock &clock_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace services
} // namespace wifirig

#endif // WIFIRIG_SERVICES_AP_INSTANCE_MANAGER_HPP
