#include "core/config.hpp"
#include <fstream>
#include <stdexcept>
#include <iostream>

namespace wifirig
{
    namespace core
    {

        // RouterHostConfig implementation
        void RouterHostConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("address"))
                address = j["address"];
            if (j.contains("user"))
                user = j["user"];
            if (j.contains("port"))
                port = j["port"];
            if (j.contains("connect_timeout"))
                connect_timeout = j["connect_timeout"];
        }

        nlohmann::json RouterHostConfig::to_json() const
        {
            return nlohmann::json{
                {"address", address},
                {"user", user},
                {"port", port},
                {"connect_timeout", connect_timeout}};
        }

        // CommandPaths implementation
        void CommandPaths::from_json(const nlohmann::json &j)
        {
            if (j.contains("hostapd"))
                hostapd = j["hostapd"];
            if (j.contains("hostapd_cli"))
                hostapd_cli = j["hostapd_cli"];
            if (j.contains("wpa_supplicant"))
                wpa_supplicant = j["wpa_supplicant"];
            if (j.contains("ip"))
                ip = j["ip"];
            if (j.contains("iw"))
                iw = j["iw"];
            if (j.contains("dnsmasq"))
                dnsmasq = j["dnsmasq"];
            if (j.contains("send_management_frame"))
                send_management_frame = j["send_management_frame"];
        }

        nlohmann::json CommandPaths::to_json() const
        {
            return nlohmann::json{
                {"hostapd", hostapd},
                {"hostapd_cli", hostapd_cli},
                {"wpa_supplicant", wpa_supplicant},
                {"ip", ip},
                {"iw", iw},
                {"dnsmasq", dnsmasq},
                {"send_management_frame", send_management_frame}};
        }

        // LifecycleConfig implementation
        void LifecycleConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("startup_timeout_seconds"))
                startup_timeout_seconds = j["startup_timeout_seconds"];
            if (j.contains("startup_poll_interval_ms"))
                startup_poll_interval_ms = j["startup_poll_interval_ms"];
            if (j.contains("hostapd_kill_wait_seconds"))
                hostapd_kill_wait_seconds = j["hostapd_kill_wait_seconds"];
            if (j.contains("link_timeout_seconds"))
                link_timeout_seconds = j["link_timeout_seconds"];
            if (j.contains("command_timeout_seconds"))
                command_timeout_seconds = j["command_timeout_seconds"];
            if (j.contains("results_dir"))
                results_dir = j["results_dir"];
            if (j.contains("regulatory_domain"))
                regulatory_domain = j["regulatory_domain"];
        }

        nlohmann::json LifecycleConfig::to_json() const
        {
            return nlohmann::json{
                {"startup_timeout_seconds", startup_timeout_seconds},
                {"startup_poll_interval_ms", startup_poll_interval_ms},
                {"hostapd_kill_wait_seconds", hostapd_kill_wait_seconds},
                {"link_timeout_seconds", link_timeout_seconds},
                {"command_timeout_seconds", command_timeout_seconds},
                {"results_dir", results_dir},
                {"regulatory_domain", regulatory_domain}};
        }

        // PhyConfig implementation
        void PhyConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("name"))
                name = j["name"];
            if (j.contains("bands"))
                bands = j["bands"].get<std::vector<std::string>>();
        }

        nlohmann::json PhyConfig::to_json() const
        {
            return nlohmann::json{
                {"name", name},
                {"bands", bands}};
        }

        // LoggingConfig implementation
        void LoggingConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("log_level"))
                log_level = j["log_level"];
            if (j.contains("log_file") && !j["log_file"].is_null())
                log_file = j["log_file"];
        }

        nlohmann::json LoggingConfig::to_json() const
        {
            nlohmann::json j{{"log_level", log_level}};
            if (!log_file.empty())
            {
                j["log_file"] = log_file;
            }
            return j;
        }

        // RigConfig implementation
        RigConfig::RigConfig(const std::string &test_name)
            : test_name(test_name)
        {
        }

        std::unique_ptr<RigConfig> RigConfig::from_file(const std::string &config_path)
        {
            std::ifstream file(config_path);
            if (!file.is_open())
            {
                throw std::runtime_error("Configuration file not found: " + config_path);
            }

            nlohmann::json j;
            try
            {
                file >> j;
            }
            catch (const nlohmann::json::parse_error &e)
            {
                throw std::runtime_error("Invalid JSON in configuration file: " + std::string(e.what()));
            }

            return from_json(j);
        }

        std::unique_ptr<RigConfig> RigConfig::from_json(const nlohmann::json &j)
        {
            if (!j.contains("test_name") || !j["test_name"].is_string() || j["test_name"].get<std::string>().empty())
            {
                throw std::invalid_argument("test_name is required");
            }

            auto config = std::make_unique<RigConfig>(j["test_name"].get<std::string>());

            if (j.contains("router_host"))
            {
                config->router_host.from_json(j["router_host"]);
            }
            if (j.contains("commands"))
            {
                config->commands.from_json(j["commands"]);
            }
            if (j.contains("lifecycle"))
            {
                config->lifecycle.from_json(j["lifecycle"]);
            }
            if (j.contains("phys"))
            {
                for (const auto &entry : j["phys"])
                {
                    PhyConfig phy;
                    phy.from_json(entry);
                    config->phys.push_back(phy);
                }
            }
            if (j.contains("logging"))
            {
                config->logging.from_json(j["logging"]);
            }

            return config;
        }

        std::unique_ptr<RigConfig> RigConfig::create_default(const std::string &test_name)
        {
            auto config = std::make_unique<RigConfig>(test_name);
            PhyConfig phy;
            phy.name = "phy0";
            config->phys.push_back(phy);
            return config;
        }

        nlohmann::json RigConfig::to_json() const
        {
            nlohmann::json phy_list = nlohmann::json::array();
            for (const auto &phy : phys)
            {
                phy_list.push_back(phy.to_json());
            }

            return nlohmann::json{
                {"test_name", test_name},
                {"router_host", router_host.to_json()},
                {"commands", commands.to_json()},
                {"lifecycle", lifecycle.to_json()},
                {"phys", phy_list},
                {"logging", logging.to_json()}};
        }

        void RigConfig::save_to_file(const std::string &config_path) const
        {
            std::ofstream file(config_path);
            if (!file.is_open())
            {
                throw std::runtime_error("Cannot open configuration file for writing: " + config_path);
            }

            file << to_json().dump(4);
        }

        bool RigConfig::validate() const
        {
            if (test_name.empty())
            {
                std::cerr << "Configuration validation error: test_name cannot be empty" << std::endl;
                return false;
            }

            if (!router_host.is_local() && (router_host.port < 1 || router_host.port > 65535))
            {
                std::cerr << "Configuration validation error: router_host.port must be between 1 and 65535" << std::endl;
                return false;
            }

            if (lifecycle.startup_timeout_seconds <= 0)
            {
                std::cerr << "Configuration validation error: lifecycle.startup_timeout_seconds must be positive" << std::endl;
                return false;
            }

            if (lifecycle.startup_poll_interval_ms <= 0)
            {
                std::cerr << "Configuration validation error: lifecycle.startup_poll_interval_ms must be positive" << std::endl;
                return false;
            }

            if (lifecycle.link_timeout_seconds < 0 || lifecycle.hostapd_kill_wait_seconds < 0)
            {
                std::cerr << "Configuration validation error: lifecycle waits cannot be negative" << std::endl;
                return false;
            }

            if (phys.empty())
            {
                std::cerr << "Configuration validation error: at least one phy must be configured" << std::endl;
                return false;
            }

            for (const auto &phy : phys)
            {
                if (phy.name.empty())
                {
                    std::cerr << "Configuration validation error: phy name cannot be empty" << std::endl;
                    return false;
                }
                for (const auto &band : phy.bands)
                {
                    if (band != "2.4" && band != "5")
                    {
                        std::cerr << "Configuration validation error: unknown band " << band
                                  << " on " << phy.name << std::endl;
                        return false;
                    }
                }
            }

            return true;
        }

    } // namespace core
} // namespace wifirig
