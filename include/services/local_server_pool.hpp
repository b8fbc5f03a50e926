#ifndef WIFIRIG_SERVICES_LOCAL_SERVER_POOL_HPP
#define WIFIRIG_SERVICES_LOCAL_SERVER_POOL_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "infrastructure/netblock.hpp"

namespace wifirig
{
    namespace core
    {
        struct CommandPaths;
        class Logger;
    }
    namespace infrastructure
    {
        class RemoteExecutor;
    }
}

namespace wifirig
{
    namespace services
    {

        /**
         * Static addressing plus the dnsmasq instance serving one interface
         */
        struct LocalServer
        {
            size_t index;
            infrastructure::Netblock netblock; // Gateway address, /24
            std::string dhcp_low;
            std::string dhcp_high;
            std::string interface;
            std::string ip_params; // Arguments of "ip addr add"/"ip addr del"
            std::string conf_file;
            std::string lease_file;

            std::string gateway() const { return netblock.addr(); }
        };

        /**
         * Local Server Pool
         * Hands out one 192.168.<n>.0/24 subnet and a dnsmasq DHCP server per
         * interface brought up on the router
         *
         * Servers are indexed by list position. Releasing a server shifts the
         * ones after it down, and the next allocation derives its subnet from
         * the active count, so an index is not a stable identifier.
         */
        class LocalServerPool
        {
        public:
            static constexpr size_t MAX_SERVERS = 256;
            static constexpr int DHCP_LOW_OFFSET = 1;
            static constexpr int DHCP_HIGH_OFFSET = 128;

            LocalServerPool(infrastructure::RemoteExecutor &executor, const core::CommandPaths &commands);
            ~LocalServerPool() = default;

            LocalServerPool(const LocalServerPool &) = delete;
            LocalServerPool &operator=(const LocalServerPool &) = delete;

            /**
             * Address |interface|, bring it up and start dnsmasq on it
             * @throws core::ResourceExhausted with MAX_SERVERS already active
             */
            const LocalServer &allocate(const std::string &interface);

            // Best effort; returns false if no server is bound to |interface|.
            bool release(const std::string &interface);
            void release_all();

            // Kill every dnsmasq on the router, tracked or not.
            void stop_all();

            const LocalServer &at(size_t index) const;
            const LocalServer *find(const std::string &interface) const;
            const std::vector<LocalServer> &servers() const { return servers_; }
            size_t size() const { return servers_.size(); }
            bool empty() const { return servers_.empty(); }

            // 192.168.<index>.254
            static std::string server_address(size_t index);
            // 192.168.<index>.253, handed to a local peer station
            static std::string peer_address(size_t index);

        private:
            std::string build_dhcp_config(const LocalServer &server) const;
            void teardown(const LocalServer &server);
            void reindex();

            infrastructure::RemoteExecutor &executor_;
            const core::CommandPaths &commands_;
            std::shared_ptr<core::Logger> logger_;

            std::vector<LocalServer> servers_;
        };

    } // namespace services
} // namespace wifirig

#endif // WIFIRIG_SERVICES_LOCAL_SERVER_POOL_HPP
