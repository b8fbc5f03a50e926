#include "services/hostap_config.hpp"

#include <algorithm>
#include <map>
#include <sstream>
#include <stdexcept>

namespace wifirig
{
    namespace services
    {

        namespace
        {
            const std::map<int, int> &channel_table()
            {
                static const std::map<int, int> table = [] {
                    std::map<int, int> t;
                    for (int channel = 1; channel <= 13; ++channel)
                    {
                        t[channel] = 2407 + 5 * channel;
                    }
                    t[14] = 2484;
                    for (int channel : {36, 38, 40, 42, 44, 46, 48, 52, 56, 60, 64,
                                        100, 104, 108, 112, 116, 120, 124, 128, 132, 136, 140, 144,
                                        149, 153, 157, 161, 165})
                    {
                        t[channel] = 5000 + 5 * channel;
                    }
                    return t;
                }();
                return table;
            }

            HwMode parse_hw_mode(const std::string &mode)
            {
                if (mode == "a")
                    return HwMode::A;
                if (mode == "b")
                    return HwMode::B;
                if (mode == "g")
                    return HwMode::G;
                throw std::invalid_argument("Unknown hw_mode: " + mode);
            }

            SecurityMode parse_security(const std::string &security)
            {
                if (security == "open")
                    return SecurityMode::OPEN;
                if (security == "wpa")
                    return SecurityMode::WPA;
                if (security == "wpa2")
                    return SecurityMode::WPA2;
                if (security == "wpa_mixed")
                    return SecurityMode::WPA_MIXED;
                throw std::invalid_argument("Unknown security mode: " + security);
            }

            std::string hw_mode_name(HwMode mode)
            {
                switch (mode)
                {
                case HwMode::A:
                    return "a";
                case HwMode::B:
                    return "b";
                case HwMode::G:
                    return "g";
                }
                return "g";
            }
        }

        std::optional<std::string> find_param(const ParamList &params, const std::string &key)
        {
            for (const auto &[name, value] : params)
            {
                if (name == key)
                {
                    return value;
                }
            }
            return std::nullopt;
        }

        void set_param(ParamList &params, const std::string &key, const std::string &value)
        {
            for (auto &entry : params)
            {
                if (entry.first == key)
                {
                    entry.second = value;
                    return;
                }
            }
            params.emplace_back(key, value);
        }

        int HostapConfig::frequency_for_channel(int channel)
        {
            auto it = channel_table().find(channel);
            if (it == channel_table().end())
            {
                throw std::invalid_argument("Unknown channel: " + std::to_string(channel));
            }
            return it->second;
        }

        int HostapConfig::channel_for_frequency(int frequency)
        {
            for (const auto &[channel, freq] : channel_table())
            {
                if (freq == frequency)
                {
                    return channel;
                }
            }
            throw std::invalid_argument("Unknown frequency: " + std::to_string(frequency));
        }

        int HostapConfig::channel() const
        {
            return channel_for_frequency(frequency);
        }

        HwMode HostapConfig::effective_hw_mode() const
        {
            if (hw_mode)
            {
                return *hw_mode;
            }
            return frequency < 3000 ? HwMode::G : HwMode::A;
        }

        void HostapConfig::validate() const
        {
            channel_for_frequency(frequency);

            HwMode mode = effective_hw_mode();
            bool five_ghz = frequency > 3000;
            if (five_ghz && mode != HwMode::A)
            {
                throw std::invalid_argument("hw_mode " + hw_mode_name(mode) + " cannot run at " +
                                            std::to_string(frequency) + " MHz");
            }
            if (!five_ghz && mode == HwMode::A)
            {
                throw std::invalid_argument("hw_mode a cannot run at " + std::to_string(frequency) + " MHz");
            }

            if (security != SecurityMode::OPEN && (passphrase.size() < 8 || passphrase.size() > 63))
            {
                throw std::invalid_argument("WPA passphrase must be 8 to 63 characters");
            }

            if (ssid.size() > 32)
            {
                throw std::invalid_argument("SSID longer than 32 bytes: " + ssid);
            }
        }

        HostapConfig HostapConfig::from_json(const nlohmann::json &j)
        {
            HostapConfig config;

            if (j.contains("channel"))
                config.frequency = frequency_for_channel(j["channel"].get<int>());
            if (j.contains("frequency"))
                config.frequency = j["frequency"];
            if (j.contains("hw_mode"))
                config.hw_mode = parse_hw_mode(j["hw_mode"].get<std::string>());
            if (j.contains("n_mode"))
                config.n_mode = j["n_mode"];
            if (j.contains("n_capabilities"))
                config.n_capabilities = j["n_capabilities"].get<std::vector<std::string>>();
            if (j.contains("ssid"))
                config.ssid = j["ssid"];
            if (j.contains("ssid_suffix"))
                config.ssid_suffix = j["ssid_suffix"];
            if (j.contains("security"))
                config.security = parse_security(j["security"].get<std::string>());
            if (j.contains("passphrase"))
                config.passphrase = j["passphrase"];
            if (j.contains("beacon_interval"))
                config.beacon_interval = j["beacon_interval"].get<int>();
            if (j.contains("dtim_period"))
                config.dtim_period = j["dtim_period"].get<int>();
            if (j.contains("hide_ssid"))
                config.hide_ssid = j["hide_ssid"];
            if (j.contains("extra_params"))
            {
                for (const auto &[key, value] : j["extra_params"].items())
                {
                    config.extra_params.emplace_back(key, value.is_string() ? value.get<std::string>() : value.dump());
                }
            }

            config.validate();
            return config;
        }

        ParamList HostapdConfigGenerator::generate(const HostapConfig &config,
                                                   const std::string &interface,
                                                   const std::string &ctrl_interface,
                                                   const std::string &ssid) const
        {
            config.validate();

            ParamList params;
            params.emplace_back("hw_mode", hw_mode_name(config.effective_hw_mode()));
            params.emplace_back("channel", std::to_string(config.channel()));

            if (config.n_mode)
            {
                params.emplace_back("ieee80211n", "1");
                if (!config.n_capabilities.empty())
                {
                    std::ostringstream caps;
                    for (const auto &cap : config.n_capabilities)
                    {
                        caps << cap;
                    }
                    params.emplace_back("ht_capab", caps.str());
                }
                params.emplace_back("wmm_enabled", "1");
            }

            if (config.beacon_interval)
            {
                params.emplace_back("beacon_int", std::to_string(*config.beacon_interval));
            }
            if (config.dtim_period)
            {
                params.emplace_back("dtim_period", std::to_string(*config.dtim_period));
            }
            if (config.hide_ssid)
            {
                params.emplace_back("ignore_broadcast_ssid", "1");
            }

            add_security(config, params);

            params.emplace_back("driver", DRIVER_NAME);
            params.emplace_back("logger_syslog", "-1");
            params.emplace_back("logger_syslog_level", "0");

            for (const auto &[key, value] : config.extra_params)
            {
                set_param(params, key, value);
            }

            set_param(params, "interface", interface);
            set_param(params, "ctrl_interface", ctrl_interface);
            set_param(params, "ssid", config.ssid.empty() ? ssid : config.ssid);
            return params;
        }

        void HostapdConfigGenerator::add_security(const HostapConfig &config, ParamList &params) const
        {
            switch (config.security)
            {
            case SecurityMode::OPEN:
                return;
            case SecurityMode::WPA:
                params.emplace_back("wpa", "1");
                params.emplace_back("wpa_pairwise", "TKIP");
                break;
            case SecurityMode::WPA2:
                params.emplace_back("wpa", "2");
                params.emplace_back("rsn_pairwise", "CCMP");
                break;
            case SecurityMode::WPA_MIXED:
                params.emplace_back("wpa", "3");
                params.emplace_back("wpa_pairwise", "TKIP");
                params.emplace_back("rsn_pairwise", "CCMP");
                break;
            }
            params.emplace_back("wpa_key_mgmt", "WPA-PSK");
            params.emplace_back("wpa_passphrase", config.passphrase);
        }

    } // namespace services
} // namespace wifirig
