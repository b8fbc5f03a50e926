/**
 * Access Point Instance Manager Implementation
 * Runs hostapd instances on the router and health-checks their startup
 */

#include "services/ap_instance_manager.hpp"
#include "services/ssid_builder.hpp"
#include "infrastructure/interface_allocator.hpp"
#include "infrastructure/remote_executor.hpp"
#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <sstream>

namespace wifirig
{
    namespace services
    {

        APInstanceManager::APInstanceManager(infrastructure::RemoteExecutor &executor,
                                             infrastructure::InterfaceAllocator &allocator,
                                             const ConfigGenerator &generator,
                                             const SsidBuilder &ssid_builder,
                                             const core::CommandPaths &commands,
                                             const core::LifecycleConfig &lifecycle,
                                             core::Clock &clock)
            : executor_(executor),
              allocator_(allocator),
              generator_(generator),
              ssid_builder_(ssid_builder),
              commands_(commands),
              lifecycle_(lifecycle),
              clock_(clock),
              logger_(core::get_logger("APInstanceManager"))
        {
        }

        std::string APInstanceManager::conf_file_for(const std::string &interface)
        {
            return "/tmp/hostapd-test-" + interface + ".conf";
        }

        std::string APInstanceManager::log_file_for(const std::string &interface)
        {
            return "/tmp/hostapd-test-" + interface + ".log";
        }

        std::string APInstanceManager::pid_file_for(const std::string &interface)
        {
            return "/tmp/hostapd-test-" + interface + ".pid";
        }

        std::string APInstanceManager::ctrl_interface_for(const std::string &interface)
        {
            return "/tmp/hostapd-test-" + interface + ".ctrl";
        }

        APInstance APInstanceManager::start(const HostapConfig &config, const BindCallback &on_bound)
        {
            config.validate();

            APInstance instance;
            instance.interface = allocator_.get_interface(config.frequency, infrastructure::InterfaceMode::MANAGED);
            instance.conf_file = conf_file_for(instance.interface);
            instance.log_file = log_file_for(instance.interface);
            instance.pid_file = pid_file_for(instance.interface);
            instance.ctrl_interface = ctrl_interface_for(instance.interface);

            try
            {
                if (on_bound)
                {
                    on_bound(instance.interface);
                }

                std::string ssid = config.ssid.empty() ? ssid_builder_.build(config.ssid_suffix) : config.ssid;
                instance.params = generator_.generate(config, instance.interface, instance.ctrl_interface, ssid);
                instance.ssid = find_param(instance.params, "ssid").value_or(ssid);

                launch(instance);
                wait_for_startup(instance);
            }
            catch (const std::exception &e)
            {
                logger_->error("hostapd failed to start",
                               core::LogContext().add("interface", instance.interface).add("error", e.what()));
                abandon(instance);
                throw;
            }

            logger_->info("AP started",
                          core::LogContext()
                              .add("interface", instance.interface)
                              .add("ssid", instance.ssid)
                              .add("pid", instance.pid));
            return instance;
        }

        void APInstanceManager::launch(APInstance &instance)
        {
            std::ostringstream conf;
            bool first = true;
            for (const auto &[key, value] : instance.params)
            {
                if (!first)
                {
                    conf << "\n";
                }
                conf << key << "=" << value;
                first = false;
            }

            core::LogContext params_context;
            for (const auto &[key, value] : instance.params)
            {
                params_context.add(key, value);
            }
            logger_->info("Starting hostapd with parameters", params_context);

            infrastructure::write_remote_file(executor_, instance.conf_file, conf.str());

            executor_.run("rm " + instance.log_file, std::chrono::seconds(0), true);
            executor_.run("rm " + instance.pid_file, std::chrono::seconds(0), true);
            // A system supplicant would fight hostapd over the radio.
            executor_.run("stop wpasupplicant", std::chrono::seconds(0), true);

            executor_.run(commands_.hostapd + " -dd -B -t -f " + instance.log_file +
                          " -P " + instance.pid_file + " " + instance.conf_file);

            auto pid_result = executor_.run("cat " + instance.pid_file, std::chrono::seconds(0), true);
            try
            {
                instance.pid = pid_result.ok() ? std::stoi(pid_result.stdout_text) : 0;
            }
            catch (const std::exception &)
            {
                instance.pid = 0;
            }

            if (instance.pid == 0)
            {
                logger_->warning("hostapd pid unknown, liveness probe disabled",
                                 core::LogContext().add("pid_file", instance.pid_file));
            }
        }

        void APInstanceManager::wait_for_startup(const APInstance &instance)
        {
            const auto timeout = std::chrono::seconds(lifecycle_.startup_timeout_seconds);
            const auto interval = std::chrono::milliseconds(lifecycle_.startup_poll_interval_ms);

            logger_->info("Waiting for hostapd to startup", core::LogContext().add("interface", instance.interface));

            const auto start_time = clock_.now();
            while (clock_.now() - start_time < timeout)
            {
                if (log_contains(instance, SUCCESS_MARKER))
                {
                    return;
                }

                // An invalid configuration is the common failure, bail out early.
                if (log_contains(instance, FAILURE_MARKER))
                {
                    throw core::BadConfiguration("hostapd failed to initialize AP interface " + instance.interface,
                                                 instance.interface);
                }

                if (instance.pid != 0)
                {
                    auto probe = executor_.run("kill -0 " + std::to_string(instance.pid), std::chrono::seconds(0), true);
                    if (!probe.ok())
                    {
                        throw core::ProcessDied("hostapd process terminated on " + instance.interface,
                                                instance.interface);
                    }
                }

                clock_.sleep_for(interval);
            }

            throw core::StartupTimeout("Timed out while waiting for hostapd to start on " + instance.interface,
                                       instance.interface);
        }

        void APInstanceManager::abandon(const APInstance &instance)
        {
            try
            {
                infrastructure::kill_process_instance(executor_, "hostapd", instance.conf_file);
            }
            catch (const std::exception &e)
            {
                logger_->warning("Failed to kill hostapd", core::LogContext().add("error", e.what()));
            }

            try
            {
                allocator_.release(instance.interface);
            }
            catch (const std::exception &e)
            {
                logger_->warning("Failed to release interface",
                                 core::LogContext().add("interface", instance.interface).add("error", e.what()));
            }
        }

        void APInstanceManager::stop(const APInstance &instance, bool silent, bool collect_logs, size_t log_tag)
        {
            logger_->info("Stopping AP",
                          core::LogContext()
                              .add("interface", instance.interface)
                              .add("ssid", instance.ssid)
                              .add("silent", silent));

            if (silent)
            {
                // Without its interface hostapd cannot send beacons or DEAUTH frames.
                try
                {
                    allocator_.remove(instance.interface);
                }
                catch (const std::exception &e)
                {
                    logger_->warning("Failed to remove interface before stopping hostapd",
                                     core::LogContext().add("interface", instance.interface).add("error", e.what()));
                }
            }

            try
            {
                infrastructure::kill_process_instance(executor_, "hostapd", instance.conf_file,
                                                      std::chrono::seconds(lifecycle_.hostapd_kill_wait_seconds));
            }
            catch (const std::exception &e)
            {
                logger_->warning("Failed to kill hostapd",
                                 core::LogContext().add("interface", instance.interface).add("error", e.what()));
            }

            if (collect_logs)
            {
                collect_log(instance, log_tag);
            }

            try
            {
                allocator_.release(instance.interface);
            }
            catch (const std::exception &e)
            {
                logger_->warning("Failed to release interface",
                                 core::LogContext().add("interface", instance.interface).add("error", e.what()));
            }
        }

        void APInstanceManager::collect_log(const APInstance &instance, size_t log_tag)
        {
            try
            {
                if (!infrastructure::path_exists(executor_, instance.log_file))
                {
                    logger_->warning("Did not collect hostapd log file because it was missing",
                                     core::LogContext().add("log_file", instance.log_file));
                    return;
                }

                std::string destination = lifecycle_.results_dir + "/hostapd_router_" + std::to_string(log_tag) +
                                          "_" + instance.interface + ".log";
                if (!executor_.get_file(instance.log_file, destination))
                {
                    logger_->warning("Failed to collect hostapd log file",
                                     core::LogContext().add("log_file", instance.log_file));
                    return;
                }
                logger_->debug("Collected hostapd log", core::LogContext().add("destination", destination));
            }
            catch (const std::exception &e)
            {
                logger_->warning("Failed to collect hostapd log file",
                                 core::LogContext().add("log_file", instance.log_file).add("error", e.what()));
            }
        }

        void APInstanceManager::kill_all()
        {
            try
            {
                infrastructure::kill_process_instance(executor_, "hostapd", "",
                                                      std::chrono::seconds(lifecycle_.hostapd_kill_wait_seconds));
            }
            catch (const std::exception &e)
            {
                logger_->warning("Failed to kill hostapd processes", core::LogContext().add("error", e.what()));
            }
        }

        bool APInstanceManager::log_contains(const APInstance &instance, const std::string &pattern, bool ignore_case)
        {
            std::string command = std::string("grep -q") + (ignore_case ? "i " : " ") +
                                  infrastructure::shell_quote(pattern) + " " + instance.log_file;
            return executor_.run(command, std::chrono::seconds(0), true).ok();
        }

    } // namespace services
} // namespace wifirig
