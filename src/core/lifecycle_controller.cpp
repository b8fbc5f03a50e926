#include "core/lifecycle_controller.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "infrastructure/shell_executor.hpp"
#include "services/local_server_pool.hpp"
#include "services/ssid_builder.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace wifirig
{
    namespace core
    {

        namespace
        {
            std::string trim(const std::string &value)
            {
                auto begin = value.find_first_not_of(" \t\r\n");
                if (begin == std::string::npos)
                {
                    return "";
                }
                auto end = value.find_last_not_of(" \t\r\n");
                return value.substr(begin, end - begin + 1);
            }
        }

        LifecycleController::LifecycleController(std::unique_ptr<RigConfig> config,
                                                 std::unique_ptr<infrastructure::RemoteExecutor> executor,
                                                 std::unique_ptr<infrastructure::InterfaceAllocator> allocator,
                                                 std::unique_ptr<services::ConfigGenerator> generator,
                                                 std::unique_ptr<Clock> clock)
            : config_(std::move(config)), logger_(get_logger("LifecycleController"))
        {
            if (!config_)
            {
                throw std::invalid_argument("Router configuration cannot be null");
            }

            executor_ = std::move(executor);
            if (!executor_)
            {
                executor_ = infrastructure::make_executor(
                    config_->router_host, std::chrono::seconds(config_->lifecycle.command_timeout_seconds));
            }

            allocator_ = std::move(allocator);
            if (!allocator_)
            {
                allocator_ = std::make_unique<infrastructure::PhyInterfaceAllocator>(*executor_, config_->phys,
                                                                                     config_->commands.iw);
            }

            generator_ = std::move(generator);
            if (!generator_)
            {
                generator_ = std::make_unique<services::HostapdConfigGenerator>();
            }

            clock_ = std::move(clock);
            if (!clock_)
            {
                clock_ = std::make_unique<SystemClock>();
            }

            ssid_builder_ = std::make_unique<services::SsidBuilder>(config_->test_name);

            local_servers_ = std::make_unique<services::LocalServerPool>(*executor_, config_->commands);
            ap_manager_ = std::make_unique<services::APInstanceManager>(*executor_, *allocator_, *generator_,
                                                                        *ssid_builder_, config_->commands,
                                                                        config_->lifecycle, *clock_);
            station_manager_ = std::make_unique<services::StationInstanceManager>(*executor_, *allocator_,
                                                                                  *local_servers_, *ssid_builder_,
                                                                                  config_->commands,
                                                                                  config_->lifecycle, *clock_);

            logger_->info("Lifecycle controller initialized",
                          LogContext()
                              .add("router", executor_->describe())
                              .add("ssid_prefix", ssid_builder_->prefix()));
        }

        LifecycleController::~LifecycleController()
        {
            close();
        }

        void LifecycleController::start()
        {
            if (started_)
            {
                return;
            }

            infrastructure::must_be_installed(*executor_, config_->commands.hostapd);
            infrastructure::must_be_installed(*executor_, config_->commands.hostapd_cli);
            infrastructure::must_be_installed(*executor_, config_->commands.wpa_supplicant);

            capabilities_ = {Capability::IBSS};
            if (infrastructure::is_installed(*executor_, config_->commands.send_management_frame))
            {
                capabilities_.insert(Capability::SEND_MANAGEMENT_FRAME);
            }

            // Leftovers from an earlier session would hold interfaces and ports.
            ap_manager_->kill_all();
            local_servers_->stop_all();

            executor_->run(config_->commands.iw + " reg set " + config_->lifecycle.regulatory_domain);

            started_ = true;
            logger_->info("Router session started",
                          LogContext()
                              .add("router", executor_->describe())
                              .add("send_management_frame", has_capability(Capability::SEND_MANAGEMENT_FRAME)));
        }

        void LifecycleController::close()
        {
            try
            {
                deconfig();
            }
            catch (const std::exception &e)
            {
                logger_->error("Error while closing router session", LogContext().add("error", e.what()));
            }
            started_ = false;
        }

        bool LifecycleController::has_capability(Capability capability) const
        {
            return capabilities_.count(capability) > 0;
        }

        void LifecycleController::configure(const services::HostapConfig &config, bool allow_multi)
        {
            if (!allow_multi && (!ap_instances_.empty() || !station_instances_.empty()))
            {
                deconfig();
            }

            std::string bound;
            services::APInstance instance;
            try
            {
                instance = ap_manager_->start(config, [this, &bound](const std::string &interface) {
                    begin_slot(interface);
                    bound = interface;
                });
            }
            catch (const std::exception &)
            {
                if (!bound.empty())
                {
                    transition(bound, InstanceState::FAILED);
                }
                throw;
            }

            transition(instance.interface, InstanceState::ACTIVE);
            ap_instances_.push_back(instance);

            executor_->run(config_->commands.iw + " dev " + instance.interface + " set txpower auto");
            local_servers_->allocate(instance.interface);

            logger_->info("AP configured",
                          LogContext()
                              .add("interface", instance.interface)
                              .add("ssid", instance.ssid)
                              .add("instances", ap_instances_.size()));
        }

        void LifecycleController::deconfig(std::optional<size_t> instance, bool silent)
        {
            if (ap_instances_.empty() && station_instances_.empty())
            {
                return;
            }

            if (!ap_instances_.empty())
            {
                std::vector<services::APInstance> targets;
                if (instance)
                {
                    ap_at(*instance);
                    targets.push_back(ap_instances_[*instance]);
                    ap_instances_.erase(ap_instances_.begin() + static_cast<std::ptrdiff_t>(*instance));
                }
                else
                {
                    targets.swap(ap_instances_);
                }

                // Routes must be gone before hostapd starts shutting down.
                for (const auto &target : targets)
                {
                    local_servers_->release(target.interface);
                }

                for (const auto &target : targets)
                {
                    transition(target.interface, InstanceState::TEARING_DOWN);
                    ap_manager_->stop(target, silent, true, total_ap_instances_);
                    ++total_ap_instances_;
                    transition(target.interface, InstanceState::UNCONFIGURED);
                }
            }

            if (!station_instances_.empty())
            {
                services::StationInstance station = station_instances_.back();
                station_instances_.pop_back();
                station_manager_->leave(station);
            }
        }

        void LifecycleController::join_ibss(const services::HostapConfig &config)
        {
            if (!station_instances_.empty() || !ap_instances_.empty())
            {
                deconfig();
            }

            station_instances_.push_back(station_manager_->join_ibss(config));
        }

        void LifecycleController::connect_managed(size_t instance)
        {
            if (ap_instances_.empty())
            {
                throw NotConfigured("Hostapd is not configured");
            }
            if (!station_instances_.empty())
            {
                throw AlreadyConfigured("Station is already configured");
            }

            const auto &target = ap_at(instance);
            const auto *server = local_servers_->find(target.interface);
            if (!server)
            {
                throw NotConfigured("No local server runs on " + target.interface);
            }

            station_instances_.push_back(station_manager_->connect_managed(target, server->index));
        }

        void LifecycleController::leave()
        {
            if (station_instances_.empty())
            {
                return;
            }

            services::StationInstance station = station_instances_.back();
            station_instances_.pop_back();
            station_manager_->leave(station);
        }

        std::string LifecycleController::get_ssid(std::optional<size_t> instance) const
        {
            if (!instance)
            {
                if (ap_instances_.size() > 1)
                {
                    throw AmbiguousInstance("No instance of hostapd specified with multiple instances present");
                }
                instance = 0;
            }

            if (!ap_instances_.empty())
            {
                return ap_at(*instance).ssid;
            }

            if (!station_instances_.empty())
            {
                return station_instances_.front().ssid;
            }

            throw NotConfigured("Requested ssid of an unconfigured AP");
        }

        std::string LifecycleController::wifi_ip() const
        {
            if (local_servers_->empty())
            {
                throw NotConfigured("No IP address assigned");
            }
            if (local_servers_->size() > 1)
            {
                throw AmbiguousInstance("Could not pick a WiFi IP to return");
            }
            return get_wifi_ip(0);
        }

        std::string LifecycleController::get_wifi_ip(size_t index) const
        {
            if (local_servers_->empty())
            {
                throw NotConfigured("No IP address assigned");
            }
            return local_servers_->at(index).gateway();
        }

        std::string LifecycleController::get_wifi_ip_subnet(size_t index) const
        {
            if (local_servers_->empty())
            {
                throw NotConfigured("No APs configured");
            }
            return local_servers_->at(index).netblock.subnet();
        }

        int LifecycleController::get_wifi_channel(size_t instance) const
        {
            auto channel = services::find_param(ap_at(instance).params, "channel");
            if (!channel)
            {
                throw NotConfigured("AP " + std::to_string(instance) + " has no channel");
            }
            return std::stoi(*channel);
        }

        bool LifecycleController::has_local_server() const
        {
            return !local_servers_->empty();
        }

        const std::vector<services::LocalServer> &LifecycleController::local_servers() const
        {
            return local_servers_->servers();
        }

        std::string LifecycleController::get_hostapd_interface(size_t instance) const
        {
            return ap_at(instance).interface;
        }

        std::string LifecycleController::get_hostapd_mac(size_t instance)
        {
            return read_sysfs(get_hostapd_interface(instance), "address");
        }

        std::string LifecycleController::get_hostapd_phy(size_t instance)
        {
            return read_sysfs(get_hostapd_interface(instance), "phy80211/name");
        }

        std::string LifecycleController::local_peer_mac_address()
        {
            if (station_instances_.empty())
            {
                throw NotConfigured("No peer station is configured");
            }
            return read_sysfs(station_instances_.front().interface, "address");
        }

        std::string LifecycleController::local_server_address(size_t index)
        {
            return services::LocalServerPool::server_address(index);
        }

        std::string LifecycleController::local_peer_ip_address(size_t index)
        {
            return services::LocalServerPool::peer_address(index);
        }

        void LifecycleController::deauth_client(const std::string &client_mac)
        {
            if (ap_instances_.empty())
            {
                throw NotConfigured("Cannot deauthenticate without a running AP");
            }

            const auto &instance = ap_instances_.back();
            std::string control_if = services::find_param(instance.params, "ctrl_interface")
                                         .value_or(instance.ctrl_interface);
            executor_->run(config_->commands.hostapd_cli + " -p" + control_if + " deauthenticate " + client_mac);
        }

        void LifecycleController::confirm_pmksa_cache_use(size_t instance)
        {
            if (!ap_manager_->log_contains(ap_at(instance), "PMK from PMKSA cache"))
            {
                throw VerificationFailed("PMKSA cache was not used in roaming");
            }
        }

        bool LifecycleController::detect_client_deauth(const std::string &client_mac, size_t instance)
        {
            const auto &ap = ap_at(instance);
            return ap_manager_->log_contains(ap, ap.interface + ": deauthentication: STA=" + client_mac, true);
        }

        bool LifecycleController::detect_client_coexistence_report(const std::string &client_mac, size_t instance)
        {
            std::string mac_bytes = client_mac;
            std::replace(mac_bytes.begin(), mac_bytes.end(), ':', ' ');

            // 20/40 MHz BSS coexistence action frame sent by |client_mac|.
            std::string pattern = "nl80211: MLME event frame - hexdump(len=.*): "
                                  ".. .. .. .. .. .. .. .. .. .. " +
                                  mac_bytes +
                                  " .. .. .. .. .. .. .. .. 04 00.*48 01 ..";
            return ap_manager_->log_contains(ap_at(instance), pattern, true);
        }

        int LifecycleController::send_management_frame(const ManagementFrameRequest &request)
        {
            require_capability(Capability::SEND_MANAGEMENT_FRAME, "send_management_frame");

            std::ostringstream command;
            command << config_->commands.send_management_frame
                    << " -i " << request.interface
                    << " -t " << request.frame_type
                    << " -c " << request.channel;
            if (request.ssid_prefix)
            {
                command << " -s " << *request.ssid_prefix;
            }
            if (request.num_bss)
            {
                command << " -b " << *request.num_bss;
            }
            if (request.frame_count)
            {
                command << " -n " << *request.frame_count;
            }
            if (request.delay_ms)
            {
                command << " -d " << *request.delay_ms;
            }
            command << " > " << MGMT_FRAME_SENDER_LOG_FILE << " 2>&1 & echo $!";

            auto result = executor_->run(command.str());
            try
            {
                int pid = std::stoi(result.stdout_text);
                logger_->info("Management frame sender started",
                              LogContext().add("interface", request.interface).add("pid", pid));
                return pid;
            }
            catch (const std::exception &)
            {
                throw RigError("Could not read pid of management frame sender: " + result.stdout_text);
            }
        }

        std::string LifecycleController::setup_management_frame_interface(int channel)
        {
            const int frequency = services::HostapConfig::frequency_for_channel(channel);
            std::string interface = allocator_->get_interface(frequency, infrastructure::InterfaceMode::MONITOR);
            executor_->run(config_->commands.iw + " dev " + interface + " set freq " + std::to_string(frequency));
            executor_->run(config_->commands.ip + " link set " + interface + " up");
            return interface;
        }

        void LifecycleController::send_management_frame_on_ap(const std::string &frame_type, int channel, size_t instance)
        {
            require_capability(Capability::SEND_MANAGEMENT_FRAME, "send_management_frame_on_ap");

            const std::string hostap_interface = ap_at(instance).interface;
            std::string interface = allocator_->get_interface(0, infrastructure::InterfaceMode::MONITOR, hostap_interface);
            try
            {
                executor_->run(config_->commands.ip + " link set " + interface + " up");
                executor_->run(config_->commands.send_management_frame + " -i " + interface +
                               " -t " + frame_type + " -c " + std::to_string(channel));
            }
            catch (const std::exception &)
            {
                allocator_->release(interface);
                throw;
            }
            allocator_->release(interface);
        }

        void LifecycleController::release_interface(const std::string &interface)
        {
            allocator_->release(interface);
        }

        InstanceState LifecycleController::state(const std::string &interface) const
        {
            auto it = slot_states_.find(interface);
            return it == slot_states_.end() ? InstanceState::UNCONFIGURED : it->second;
        }

        const services::APInstance &LifecycleController::ap_at(size_t instance) const
        {
            if (instance >= ap_instances_.size())
            {
                throw InvalidInstance("Invalid instance number (" + std::to_string(instance) + ") with " +
                                      std::to_string(ap_instances_.size()) + " instances configured");
            }
            return ap_instances_[instance];
        }

        void LifecycleController::require_capability(Capability capability, const std::string &operation) const
        {
            if (!has_capability(capability))
            {
                throw MissingCapability(operation + " is not supported by this router");
            }
        }

        std::string LifecycleController::read_sysfs(const std::string &interface, const std::string &attribute)
        {
            return trim(executor_->run("cat /sys/class/net/" + interface + "/" + attribute).stdout_text);
        }

        void LifecycleController::begin_slot(const std::string &interface)
        {
            // A failed slot is kept for inspection until its interface is reused.
            auto current = state(interface);
            if (current == InstanceState::FAILED)
            {
                slot_states_.erase(interface);
            }
            else if (current != InstanceState::UNCONFIGURED)
            {
                throw std::logic_error("Interface " + interface + " already hosts an AP (" + to_string(current) + ")");
            }
            transition(interface, InstanceState::STARTING);
        }

        void LifecycleController::transition(const std::string &interface, InstanceState to)
        {
            auto from = state(interface);
            if (!is_valid_transition(from, to))
            {
                throw std::logic_error("Invalid transition on " + interface + ": " + to_string(from) + " -> " +
                                       to_string(to));
            }

            logger_->debug("Slot transition",
                           LogContext().add("interface", interface).add("from", to_string(from)).add("to", to_string(to)));

            if (to == InstanceState::UNCONFIGURED)
            {
                slot_states_.erase(interface);
            }
            else
            {
                slot_states_[interface] = to;
            }
        }

    } // namespace core
} // namespace wifirig
