#include "services/ssid_builder.hpp"

#include <array>
#include <stdexcept>
#include <openssl/rand.h>

namespace wifirig
{
    namespace services
    {

        namespace
        {
            // Most test names share this prefix; dropping it leaves more unique bytes.
            constexpr const char *KNOWN_TEST_PREFIX = "network_WiFi";
            constexpr const char *SALT_LETTERS = "abcdefghijklmnopqrstuvwxyz0123456789";
            constexpr size_t SALT_LETTER_COUNT = 36;
        }

        SsidBuilder::SsidBuilder(const std::string &test_name)
        {
            prefix_ = test_name;
            const std::string known(KNOWN_TEST_PREFIX);
            if (prefix_.compare(0, known.size(), known) == 0)
            {
                prefix_ = prefix_.substr(known.size());
            }
            prefix_.erase(0, prefix_.find_first_not_of('_') == std::string::npos
                                 ? prefix_.size()
                                 : prefix_.find_first_not_of('_'));
            prefix_ += "_";
        }

        std::string SsidBuilder::build(const std::string &suffix) const
        {
            std::string ssid = prefix_ + random_salt() + suffix;
            if (ssid.size() > MAX_SSID_LENGTH)
            {
                ssid = ssid.substr(ssid.size() - MAX_SSID_LENGTH);
            }
            return ssid;
        }

        std::string SsidBuilder::random_salt()
        {
            std::array<unsigned char, SALT_LENGTH> bytes{};
            if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1)
            {
                throw std::runtime_error("Failed to generate SSID salt");
            }

            std::string salt;
            for (unsigned char byte : bytes)
            {
                salt += SALT_LETTERS[byte % SALT_LETTER_COUNT];
            }
            return salt;
        }

    } // namespace services
} // namespace wifirig
