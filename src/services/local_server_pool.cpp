/**
 * Local Server Pool Implementation
 * Static addressing and dnsmasq DHCP servers for router interfaces
 */

#include "services/local_server_pool.hpp"
#include "infrastructure/remote_executor.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <sstream>

namespace wifirig
{
    namespace services
    {

        namespace
        {
            constexpr int SUBNET_PREFIX_LEN = 24;
            constexpr int GATEWAY_OCTET = 254;
            constexpr int PEER_OCTET = 253;

            std::string subnet_address(size_t index, int last_octet)
            {
                return "192.168." + std::to_string(index) + "." + std::to_string(last_octet);
            }
        }

        LocalServerPool::LocalServerPool(infrastructure::RemoteExecutor &executor, const core::CommandPaths &commands)
            : executor_(executor), commands_(commands), logger_(core::get_logger("LocalServerPool"))
        {
        }

        std::string LocalServerPool::server_address(size_t index)
        {
            return subnet_address(index, GATEWAY_OCTET);
        }

        std::string LocalServerPool::peer_address(size_t index)
        {
            return subnet_address(index, PEER_OCTET);
        }

        const LocalServer &LocalServerPool::allocate(const std::string &interface)
        {
            logger_->info("Starting up local server...", core::LogContext().add("interface", interface));

            if (servers_.size() >= MAX_SERVERS)
            {
                throw core::ResourceExhausted("Exhausted available local servers");
            }

            const size_t index = servers_.size();
            auto netblock = infrastructure::Netblock::from_addr(server_address(index), SUBNET_PREFIX_LEN);

            LocalServer server{
                index,
                netblock,
                netblock.addr_in_block(DHCP_LOW_OFFSET),
                netblock.addr_in_block(DHCP_HIGH_OFFSET),
                interface,
                netblock.netblock() + " broadcast " + netblock.broadcast() + " dev " + interface,
                "/tmp/dhcpd." + interface + ".conf",
                "/tmp/dhcpd." + interface + ".leases"};
            servers_.push_back(server);

            try
            {
                executor_.run(commands_.ip + " addr flush " + interface);
                executor_.run(commands_.ip + " addr add " + server.ip_params);
                executor_.run(commands_.ip + " link set " + interface + " up");

                infrastructure::write_remote_file(executor_, server.conf_file, build_dhcp_config(server));
                executor_.run(commands_.dnsmasq + " --conf-file=" + server.conf_file);
            }
            catch (const std::exception &e)
            {
                logger_->error("Failed to start local server",
                               core::LogContext().add("interface", interface).add("error", e.what()));
                release(interface);
                throw;
            }

            logger_->info("Local server started",
                          core::LogContext()
                              .add("interface", interface)
                              .add("index", index)
                              .add("address", server.netblock.netblock())
                              .add("dhcp_range", server.dhcp_low + "-" + server.dhcp_high));
            return servers_.back();
        }

        bool LocalServerPool::release(const std::string &interface)
        {
            for (auto it = servers_.begin(); it != servers_.end(); ++it)
            {
                if (it->interface == interface)
                {
                    LocalServer server = *it;
                    servers_.erase(it);
                    reindex();
                    teardown(server);
                    return true;
                }
            }

            logger_->debug("No local server bound to interface", core::LogContext().add("interface", interface));
            return false;
        }

        void LocalServerPool::release_all()
        {
            std::vector<LocalServer> servers;
            servers.swap(servers_);
            for (const auto &server : servers)
            {
                teardown(server);
            }
        }

        void LocalServerPool::stop_all()
        {
            try
            {
                infrastructure::kill_process_instance(executor_, "dnsmasq");
            }
            catch (const std::exception &e)
            {
                logger_->warning("Failed to stop dnsmasq processes", core::LogContext().add("error", e.what()));
            }
        }

        const LocalServer &LocalServerPool::at(size_t index) const
        {
            if (index >= servers_.size())
            {
                throw core::InvalidInstance("Invalid local server number (" + std::to_string(index) + ") with " +
                                            std::to_string(servers_.size()) + " servers configured");
            }
            return servers_[index];
        }

        const LocalServer *LocalServerPool::find(const std::string &interface) const
        {
            for (const auto &server : servers_)
            {
                if (server.interface == interface)
                {
                    return &server;
                }
            }
            return nullptr;
        }

        std::string LocalServerPool::build_dhcp_config(const LocalServer &server) const
        {
            std::ostringstream conf;
            conf << "port=0\n"; // no DNS responder, instances would collide on :53
            conf << "bind-interfaces\n";
            conf << "log-dhcp\n";
            conf << "dhcp-range=" << server.dhcp_low << "," << server.dhcp_high << "\n";
            conf << "interface=" << server.interface << "\n";
            conf << "dhcp-leasefile=" << server.lease_file;
            return conf.str();
        }

        void LocalServerPool::teardown(const LocalServer &server)
        {
            // The interface or the daemon may already be gone; nothing here may throw.
            try
            {
                infrastructure::kill_process_instance(executor_, "dnsmasq", "--conf-file=" + server.conf_file);
            }
            catch (const std::exception &e)
            {
                logger_->warning("Failed to stop dnsmasq",
                                 core::LogContext().add("interface", server.interface).add("error", e.what()));
            }

            try
            {
                auto result = executor_.run(commands_.ip + " addr del " + server.ip_params,
                                            std::chrono::seconds(0), true);
                if (!result.ok())
                {
                    logger_->warning("Failed to remove local server address",
                                     core::LogContext()
                                         .add("interface", server.interface)
                                         .add("status", result.exit_status));
                }
            }
            catch (const std::exception &e)
            {
                logger_->warning("Failed to remove local server address",
                                 core::LogContext().add("interface", server.interface).add("error", e.what()));
            }

            logger_->info("Local server stopped", core::LogContext().add("interface", server.interface));
        }

        void LocalServerPool::reindex()
        {
            for (size_t i = 0; i < servers_.size(); ++i)
            {
                servers_[i].index = i;
            }
        }

    } // namespace services
} // namespace wifirig
