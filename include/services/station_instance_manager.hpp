#ifndef WIFIRIG_SERVICES_STATION_INSTANCE_MANAGER_HPP
#define WIFIRIG_SERVICES_STATION_INSTANCE_MANAGER_HPP

#include <memory>
#include <string>

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
        struct APInstance;
        struct HostapConfig;
        class LocalServerPool;
        class SsidBuilder;
    }
}

namespace wifirig
{
    namespace services
    {

        enum class StationKind
        {
            IBSS,
            MANAGED,
            EXTERNALLY_MANAGED
        };

        std::string to_string(StationKind kind);

        /**
         * A client-mode association held by the router itself
         */
        struct StationInstance
        {
            std::string ssid;
            std::string interface;
            StationKind kind;
        };

        /**
         * Station Instance Manager
         * Joins IBSS networks and connects wpa_supplicant peers to local APs
         */
        class StationInstanceManager
        {
        public:
            StationInstanceManager(infrastructure::RemoteExecutor &executor,
                                   infrastructure::InterfaceAllocator &allocator,
                                   LocalServerPool &local_servers,
                                   const SsidBuilder &ssid_builder,
                                   const core::CommandPaths &commands,
                                   const core::LifecycleConfig &lifecycle,
                                   core::Clock &clock);

            // Join the IBSS described by |config| and serve DHCP on it.
            StationInstance join_ibss(const HostapConfig &config);

            /**
             * Associate a wpa_supplicant client with |target|
             * @param peer_index Index of the local server of |target|; selects
             *        the 192.168.<peer_index>.253 peer address
             * @throws core::StartupTimeout if the link does not come up in time
             */
            StationInstance connect_managed(const APInstance &target, size_t peer_index);

            // Tear |station| down. Never throws.
            void leave(const StationInstance &station);

            static std::string conf_file_for(const std::string &interface);
            static std::string log_file_for(const std::string &interface);
            static std::string pid_file_for(const std::string &interface);

        private:
            void wait_for_link(const std::string &interface);
            void bring_down(const std::string &interface);

            infrastructure::RemoteExecutor &executor_;
            infrastructure::InterfaceAllocator &allocator_;
            LocalServerPool &local_servers_;
            const SsidBuilder &ssid_builder_;
            const core::CommandPaths &commands_;
            const core::LifecycleConfig &lifecycle_;
            core::Clock &clock_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace services
} // namespace wifirig

#endif // WIFIRIG_SERVICES_STATION_INSTANCE_MANAGER_HPP
