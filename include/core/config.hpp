#ifndef WIFIRIG_CORE_CONFIG_HPP
#define WIFIRIG_CORE_CONFIG_HPP

#include <string>
#include <memory>
#include <vector>
#include <nlohmann/json.hpp>

namespace wifirig
{
    namespace core
    {

        /**
         * How to reach the router host
         */
        struct RouterHostConfig
        {
            std::string address; // Empty or "localhost" runs commands locally
            std::string user = "root";
            int port = 22;
            int connect_timeout = 10;

            bool is_local() const { return address.empty() || address == "localhost"; }

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Absolute paths of the tools used on the router host
         */
        struct CommandPaths
        {
            std::string hostapd = "/usr/sbin/hostapd";
            std::string hostapd_cli = "/usr/sbin/hostapd_cli";
            std::string wpa_supplicant = "/usr/sbin/wpa_supplicant";
            std::string ip = "/usr/sbin/ip";
            std::string iw = "/usr/sbin/iw";
            std::string dnsmasq = "dnsmasq";
            std::string send_management_frame = "/usr/bin/send_management_frame";

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Timing and placement knobs for the AP/station lifecycle
         */
        struct LifecycleConfig
        {
            int startup_timeout_seconds = 10;
            int startup_poll_interval_ms = 500;
            int hostapd_kill_wait_seconds = 30;
            int link_timeout_seconds = 30; // 0 waits for the link forever
            int command_timeout_seconds = 60;
            std::string results_dir = "debug";
            std::string regulatory_domain = "US";

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * One radio on the router and the bands it can serve
         */
        struct PhyConfig
        {
            std::string name;
            std::vector<std::string> bands{"2.4", "5"};

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        struct LoggingConfig
        {
            std::string log_level = "INFO";
            std::string log_file; // Empty means console output

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Complete configuration of one router session
         */
        class RigConfig
        {
        public:
            // Used to build SSIDs; see SsidBuilder
            std::string test_name;

            RouterHostConfig router_host;
            CommandPaths commands;
            LifecycleConfig lifecycle;
            std::vector<PhyConfig> phys;
            LoggingConfig logging;

        public:
            RigConfig() = default;
            explicit RigConfig(const std::string &test_name);

            static std::unique_ptr<RigConfig> from_file(const std::string &config_path);
            static std::unique_ptr<RigConfig> from_json(const nlohmann::json &j);
            static std::unique_ptr<RigConfig> create_default(const std::string &test_name);

            nlohmann::json to_json() const;
            void save_to_file(const std::string &config_path) const;

            bool validate() const;
        };

    } // namespace core
} // namespace wifirig

#endif // WIFIRIG_CORE_CONFIG_HPP
