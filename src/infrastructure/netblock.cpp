#include "infrastructure/netblock.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <stdexcept>

namespace wifirig
{
    namespace infrastructure
    {

        Netblock Netblock::from_addr(const std::string &addr, int prefix_len)
        {
            if (prefix_len < 0 || prefix_len > 32)
            {
                throw std::invalid_argument("Invalid prefix length: " + std::to_string(prefix_len));
            }

            in_addr parsed{};
            if (inet_pton(AF_INET, addr.c_str(), &parsed) != 1)
            {
                throw std::invalid_argument("Invalid IPv4 address: " + addr);
            }

            return Netblock(ntohl(parsed.s_addr), prefix_len);
        }

        Netblock Netblock::parse(const std::string &cidr)
        {
            auto slash = cidr.find('/');
            if (slash == std::string::npos)
            {
                return from_addr(cidr, 32);
            }

            int prefix_len = 0;
            try
            {
                prefix_len = std::stoi(cidr.substr(slash + 1));
            }
            catch (const std::exception &)
            {
                throw std::invalid_argument("Invalid netblock: " + cidr);
            }
            return from_addr(cidr.substr(0, slash), prefix_len);
        }

        uint32_t Netblock::mask() const
        {
            if (prefix_len_ == 0)
            {
                return 0;
            }
            return 0xFFFFFFFFu << (32 - prefix_len_);
        }

        std::string Netblock::to_string(uint32_t addr)
        {
            in_addr raw{};
            raw.s_addr = htonl(addr);

            char buffer[INET_ADDRSTRLEN];
            inet_ntop(AF_INET, &raw, buffer, sizeof(buffer));
            return buffer;
        }

        std::string Netblock::addr() const
        {
            return to_string(addr_);
        }

        std::string Netblock::netblock() const
        {
            return addr() + "/" + std::to_string(prefix_len_);
        }

        std::string Netblock::subnet() const
        {
            return to_string(addr_ & mask()) + "/" + std::to_string(prefix_len_);
        }

        std::string Netblock::broadcast() const
        {
            return to_string((addr_ & mask()) | ~mask());
        }

        std::string Netblock::netmask() const
        {
            return to_string(mask());
        }

        std::string Netblock::addr_in_block(uint32_t offset) const
        {
            if (offset > ~mask())
            {
                throw std::out_of_range("Offset " + std::to_string(offset) + " outside of " + subnet());
            }
            return to_string((addr_ & mask()) + offset);
        }

    } // namespace infrastructure
} // namespace wifirig
