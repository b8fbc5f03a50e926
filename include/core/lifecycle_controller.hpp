#ifndef WIFIRIG_CORE_LIFECYCLE_CONTROLLER_HPP
#define WIFIRIG_CORE_LIFECYCLE_CONTROLLER_HPP

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/instance_state.hpp"
#include "infrastructure/interface_allocator.hpp"
#include "infrastructure/remote_executor.hpp"
#include "services/ap_instance_manager.hpp"
#include "services/hostap_config.hpp"
#include "services/station_instance_manager.hpp"

// Forward declarations
namespace wifirig
{
    namespace core
    {
        class Logger;
    }
    namespace services
    {
        class LocalServerPool;
        class SsidBuilder;
        struct LocalServer;
    }
}

namespace wifirig
{
    namespace core
    {

        enum class Capability
        {
            IBSS,
            SEND_MANAGEMENT_FRAME
        };

        /**
         * Parameters of one detached management frame injection
         */
        struct ManagementFrameRequest
        {
            std::string interface;
            std::string frame_type;
            int channel = 1;
            std::optional<std::string> ssid_prefix;
            std::optional<int> num_bss;
            std::optional<int> frame_count;
            std::optional<int> delay_ms;
        };

        /**
         * Lifecycle Controller
         * Owns every AP, station and local server of one router session and
         * sequences their setup and teardown
         *
         * Not thread-safe: a session must be driven from one call site.
         */
        class LifecycleController
        {
        public:
            static constexpr const char *MGMT_FRAME_SENDER_LOG_FILE = "/tmp/send_management_frame-test.log";

            /**
             * Null collaborators are replaced by the production ones built
             * from |config|.
             */
            explicit LifecycleController(std::unique_ptr<RigConfig> config,
                                         std::unique_ptr<infrastructure::RemoteExecutor> executor = nullptr,
                                         std::unique_ptr<infrastructure::InterfaceAllocator> allocator = nullptr,
                                         std::unique_ptr<services::ConfigGenerator> generator = nullptr,
                                         std::unique_ptr<Clock> clock = nullptr);
            ~LifecycleController();

            LifecycleController(const LifecycleController &) = delete;
            LifecycleController &operator=(const LifecycleController &) = delete;

            // Session lifecycle
            void start();
            void close();
            bool is_started() const { return started_; }
            bool has_capability(Capability capability) const;

            // Access points
            void configure(const services::HostapConfig &config, bool allow_multi = false);
            void deconfig(std::optional<size_t> instance = std::nullopt, bool silent = false);

            // Stations
            void join_ibss(const services::HostapConfig &config);
            void connect_managed(size_t instance = 0);
            void leave();

            // Queries
            std::string get_ssid(std::optional<size_t> instance = std::nullopt) const;
            std::string wifi_ip() const;
            std::string get_wifi_ip(size_t index) const;
            std::string get_wifi_ip_subnet(size_t index) const;
            int get_wifi_channel(size_t instance) const;
            bool has_local_server() const;
            std::string get_hostapd_interface(size_t instance) const;
            std::string get_hostapd_mac(size_t instance);
            std::string get_hostapd_phy(size_t instance);
            std::string local_peer_mac_address();

            static std::string local_server_address(size_t index);
            static std::string local_peer_ip_address(size_t index);

            // hostapd interaction
            void deauth_client(const std::string &client_mac);
            void confirm_pmksa_cache_use(size_t instance = 0);
            bool detect_client_deauth(const std::string &client_mac, size_t instance = 0);
            bool detect_client_coexistence_report(const std::string &client_mac, size_t instance = 0);

            // Management frame injection
            int send_management_frame(const ManagementFrameRequest &request);
            std::string setup_management_frame_interface(int channel);
            void send_management_frame_on_ap(const std::string &frame_type, int channel, size_t instance = 0);
            void release_interface(const std::string &interface);

            // Session state
            const std::vector<services::APInstance> &ap_instances() const { return ap_instances_; }
            const std::vector<services::StationInstance> &station_instances() const { return station_instances_; }
            const std::vector<services::LocalServer> &local_servers() const;
            InstanceState state(const std::string &interface) const;
            size_t torn_down_count() const { return total_ap_instances_; }

        private:
            const services::APInstance &ap_at(size_t instance) const;
            void require_capability(Capability capability, const std::string &operation) const;
            std::string read_sysfs(const std::string &interface, const std::string &attribute);

            void begin_slot(const std::string &interface);
            void transition(const std::string &interface, InstanceState to);

            // Configuration and logging
            std::unique_ptr<RigConfig> config_;
            std::shared_ptr<Logger> logger_;

            // Collaborators
            std::unique_ptr<infrastructure::RemoteExecutor> executor_;
            std::unique_ptr<infrastructure::InterfaceAllocator> allocator_;
            std::unique_ptr<services::ConfigGenerator> generator_;
            std::unique_ptr<Clock> clock_;
            std::unique_ptr<services::SsidBuilder> ssid_builder_;

            // Managers
            std::unique_ptr<services::LocalServerPool> local_servers_;
            std::unique_ptr<services::APInstanceManager> ap_manager_;
            std::unique_ptr<services::StationInstanceManager> station_manager_;

            // Session state
            std::vector<services::APInstance> ap_instances_;
            std::vector<services::StationInstance> station_instances_;
            std::map<std::string, InstanceState> slot_states_;
            std::set<Capability> capabilities_;
            size_t total_ap_instances_ = 0;
            bool started_ = false;
        };

    } // namespace core
} // namespace wifirig

#endif // WIFIRIG_CORE_LIFECYCLE_CONTROLLER_HPP
