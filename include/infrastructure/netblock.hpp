#ifndef WIFIRIG_INFRASTRUCTURE_NETBLOCK_HPP
#define WIFIRIG_INFRASTRUCTURE_NETBLOCK_HPP

#include <cstdint>
#include <string>

namespace wifirig
{
    namespace infrastructure
    {

        /**
         * An IPv4 address together with the prefix length of its subnet
         */
        class Netblock
        {
        public:
            // @throws std::invalid_argument on a malformed address or prefix
            static Netblock from_addr(const std::string &addr, int prefix_len);

            // "a.b.c.d/len"
            static Netblock parse(const std::string &cidr);

            std::string addr() const;
            int prefix_len() const { return prefix_len_; }

            // Address in slash notation, e.g. 192.168.0.254/24
            std::string netblock() const;

            // Network address in slash notation, e.g. 192.168.0.0/24
            std::string subnet() const;

            std::string broadcast() const;
            std::string netmask() const;

            // The |offset|-th address of the subnet, 1 is the first host.
            std::string addr_in_block(uint32_t offset) const;

            bool operator==(const Netblock &other) const
            {
                return addr_ == other.addr_ && prefix_len_ == other.prefix_len_;
            }

        private:
            Netblock(uint32_t addr, int prefix_len) : addr_(addr), prefix_len_(prefix_len) {}

            uint32_t mask() const;
            static std::string to_string(uint32_t addr);

            uint32_t addr_;
            int prefix_len_;
        };

    } // namespace infrastructure
} // namespace wifirig

#endif // WIFIRIG_INFRASTRUCTURE_NETBLOCK_HPP
