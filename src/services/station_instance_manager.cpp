#include "services/station_instance_manager.hpp"
#include "services/ap_instance_manager.hpp"
#include "services/hostap_config.hpp"
#include "services/local_server_pool.hpp"
#include "services/ssid_builder.hpp"
#include "infrastructure/interface_allocator.hpp"
#include "infrastructure/remote_executor.hpp"
#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

namespace wifirig
{
    namespace services
    {

        std::string to_string(StationKind kind)
        {
            switch (kind)
            {
            case StationKind::IBSS:
                return "ibss";
            case StationKind::MANAGED:
                return "managed";
            case StationKind::EXTERNALLY_MANAGED:
                return "externally-managed";
            }
            return "unknown";
        }

        StationInstanceManager::StationInstanceManager(infrastructure::RemoteExecutor &executor,
                                                       infrastructure::InterfaceAllocator &allocator,
                                                       LocalServerPool &local_servers,
                                                       const SsidBuilder &ssid_builder,
                                                       const core::CommandPaths &commands,
                                                       const core::LifecycleConfig &lifecycle,
                                                       core::Clock &clock)
            : executor_(executor),
              allocator_(allocator),
              local_servers_(local_servers),
              ssid_builder_(ssid_builder),
              commands_(commands),
              lifecycle_(lifecycle),
              clock_(clock),
              logger_(core::get_logger("StationInstanceManager"))
        {
        }

        std::string StationInstanceManager::conf_file_for(const std::string &interface)
        {
            return "/tmp/wpa-supplicant-test-" + interface + ".conf";
        }

        std::string StationInstanceManager::log_file_for(const std::string &interface)
        {
            return "/tmp/wpa-supplicant-test-" + interface + ".log";
        }

        std::string StationInstanceManager::pid_file_for(const std::string &interface)
        {
            return "/tmp/wpa-supplicant-test-" + interface + ".pid";
        }

        StationInstance StationInstanceManager::join_ibss(const HostapConfig &config)
        {
            config.validate();

            StationInstance station;
            station.kind = StationKind::IBSS;
            station.interface = allocator_.get_interface(config.frequency, infrastructure::InterfaceMode::IBSS);
            station.ssid = config.ssid.empty() ? ssid_builder_.build(config.ssid_suffix) : config.ssid;

            try
            {
                executor_.run(commands_.ip + " link set " + station.interface + " up");
                executor_.run(commands_.iw + " dev " + station.interface + " ibss join " +
                              infrastructure::shell_quote(station.ssid) + " " + std::to_string(config.frequency));

                // IBSS peers always get a DHCP server.
                local_servers_.allocate(station.interface);
            }
            catch (const std::exception &e)
            {
                logger_->error("Failed to join IBSS",
                               core::LogContext().add("interface", station.interface).add("error", e.what()));
                leave(station);
                throw;
            }

            logger_->info("Joined IBSS",
                          core::LogContext()
                              .add("interface", station.interface)
                              .add("ssid", station.ssid)
                              .add("frequency", config.frequency));
            return station;
        }

        StationInstance StationInstanceManager::connect_managed(const APInstance &target, size_t peer_index)
        {
            auto channel = find_param(target.params, "channel");
            if (!channel)
            {
                throw core::NotConfigured("AP on " + target.interface + " has no channel configured");
            }
            const int frequency = HostapConfig::frequency_for_channel(std::stoi(*channel));

            StationInstance station;
            station.kind = StationKind::MANAGED;
            station.ssid = target.ssid;
            station.interface = allocator_.get_interface(frequency, infrastructure::InterfaceMode::MANAGED);

            const std::string &interface = station.interface;
            const std::string conf_file = conf_file_for(interface);

            // Open network only; PSK and HT settings are not needed by current users.
            std::string supplicant_config =
                "network={\n"
                "  ssid=\"" + station.ssid + "\"\n"
                "  key_mgmt=NONE\n"
                "}";

            try
            {
                infrastructure::write_remote_file(executor_, conf_file, supplicant_config);

                executor_.run(commands_.ip + " link set " + interface + " up");
                executor_.run(commands_.wpa_supplicant + " -dd -t -i" + interface +
                              " -P" + pid_file_for(interface) +
                              " -c" + conf_file +
                              " -D" + HostapdConfigGenerator::DRIVER_NAME +
                              " >" + log_file_for(interface) + " 2>&1 &");
                wait_for_link(interface);

                executor_.run(commands_.ip + " addr add " + LocalServerPool::peer_address(peer_index) +
                              "/24 dev " + interface);

                // Two interfaces now share one segment: accept traffic arriving
                // on the "wrong" one and keep each from answering ARP for the other.
                executor_.run("echo 2 > /proc/sys/net/ipv4/conf/" + interface + "/rp_filter");
                executor_.run("echo 1 > /proc/sys/net/ipv4/conf/" + interface + "/arp_ignore");
                executor_.run("echo 1 > /proc/sys/net/ipv4/conf/" + target.interface + "/arp_ignore");
            }
            catch (const std::exception &e)
            {
                logger_->error("Failed to connect managed peer",
                               core::LogContext().add("interface", interface).add("error", e.what()));
                leave(station);
                throw;
            }

            logger_->info("Connected managed peer",
                          core::LogContext()
                              .add("interface", interface)
                              .add("ssid", station.ssid)
                              .add("address", LocalServerPool::peer_address(peer_index)));
            return station;
        }

        void StationInstanceManager::wait_for_link(const std::string &interface)
        {
            const auto timeout = std::chrono::seconds(lifecycle_.link_timeout_seconds);
            const auto interval = std::chrono::milliseconds(lifecycle_.startup_poll_interval_ms);
            const auto start_time = clock_.now();

            while (true)
            {
                auto link = executor_.run(commands_.iw + " dev " + interface + " link", std::chrono::seconds(0), true);
                if (link.ok() && link.stdout_text.find("Connected to") != std::string::npos)
                {
                    return;
                }

                if (timeout.count() > 0 && clock_.now() - start_time >= timeout)
                {
                    throw core::StartupTimeout("Timed out waiting for link on " + interface, interface);
                }

                clock_.sleep_for(interval);
            }
        }

        void StationInstanceManager::leave(const StationInstance &station)
        {
            logger_->info("Leaving station",
                          core::LogContext().add("interface", station.interface).add("kind", to_string(station.kind)));

            try
            {
                switch (station.kind)
                {
                case StationKind::IBSS:
                    executor_.run(commands_.iw + " dev " + station.interface + " ibss leave",
                                  std::chrono::seconds(0), true);
                    break;
                case StationKind::MANAGED:
                    infrastructure::kill_process_instance(executor_, "wpa_supplicant",
                                                          "-c" + conf_file_for(station.interface));
                    break;
                case StationKind::EXTERNALLY_MANAGED:
                    executor_.run(commands_.iw + " dev " + station.interface + " disconnect",
                                  std::chrono::seconds(0), true);
                    break;
                }
            }
            catch (const std::exception &e)
            {
                logger_->warning("Failed to disassociate station",
                                 core::LogContext().add("interface", station.interface).add("error", e.what()));
            }

            bring_down(station.interface);
            local_servers_.release(station.interface);

            try
            {
                allocator_.release(station.interface);
            }
            catch (const std::exception &e)
            {
                logger_->warning("Failed to release interface",
                                 core::LogContext().add("interface", station.interface).add("error", e.what()));
            }
        }

        void StationInstanceManager::bring_down(const std::string &interface)
        {
            try
            {
                auto result = executor_.run(commands_.ip + " link set " + interface + " down",
                                            std::chrono::seconds(0), true);
                if (!result.ok())
                {
                    logger_->warning("Failed to bring link down", core::LogContext().add("interface", interface));
                }
            }
            catch (const std::exception &e)
            {
                logger_->warning("Failed to bring link down",
                                 core::LogContext().add("interface", interface).add("error", e.what()));
            }
        }

    } // namespace services
} // namespace wifirig
