#ifndef WIFIRIG_SERVICES_HOSTAP_CONFIG_HPP
#define WIFIRIG_SERVICES_HOSTAP_CONFIG_HPP

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace wifirig
{
    namespace services
    {

        // Ordered hostapd key/value pairs, written one "key=value" per line.
        using ParamList = std::vector<std::pair<std::string, std::string>>;

        std::optional<std::string> find_param(const ParamList &params, const std::string &key);

        // Replaces the value of |key| in place, or appends it.
        void set_param(ParamList &params, const std::string &key, const std::string &value);

        enum class HwMode
        {
            B,
            G,
            A
        };

        enum class SecurityMode
        {
            OPEN,
            WPA,
            WPA2,
            WPA_MIXED
        };

        /**
         * Description of the network an AP should serve
         */
        struct HostapConfig
        {
            int frequency = 2412;
            std::optional<HwMode> hw_mode; // Derived from the band when unset
            bool n_mode = false;
            std::vector<std::string> n_capabilities;

            std::string ssid;        // Explicit SSID, generated when empty
            std::string ssid_suffix; // Appended to generated SSIDs

            SecurityMode security = SecurityMode::OPEN;
            std::string passphrase;

            std::optional<int> beacon_interval;
            std::optional<int> dtim_period;
            bool hide_ssid = false;

            ParamList extra_params;

            int channel() const;
            HwMode effective_hw_mode() const;

            // @throws std::invalid_argument describing the first problem found
            void validate() const;

            static HostapConfig from_json(const nlohmann::json &j);

            // @throws std::invalid_argument for channels outside the table
            static int frequency_for_channel(int channel);
            static int channel_for_frequency(int frequency);
        };

        /**
         * Turns a HostapConfig into the parameters handed to hostapd
         */
        class ConfigGenerator
        {
        public:
            virtual ~ConfigGenerator() = default;

            virtual ParamList generate(const HostapConfig &config,
                                       const std::string &interface,
                                       const std::string &ctrl_interface,
                                       const std::string &ssid) const = 0;
        };

        class HostapdConfigGenerator : public ConfigGenerator
        {
        public:
            static constexpr const char *DRIVER_NAME = "nl80211";

            ParamList generate(const HostapConfig &config,
                               const std::string &interface,
                               const std::string &ctrl_interface,
                               const std::string &ssid) const override;

        private:
            void add_security(const HostapConfig &config, ParamList &params) const;
        };

    } // namespace services
} // namespace wifirig

#endif // WIFIRIG_SERVICES_HOSTAP_CONFIG_HPP
