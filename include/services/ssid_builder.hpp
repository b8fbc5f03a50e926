#ifndef WIFIRIG_SERVICES_SSID_BUILDER_HPP
#define WIFIRIG_SERVICES_SSID_BUILDER_HPP

#include <cstddef>
#include <string>

namespace wifirig
{
    namespace services
    {

        /**
         * Builds unique SSIDs of the form <test prefix>_<salt><suffix>
         */
        class SsidBuilder
        {
        public:
            static constexpr size_t MAX_SSID_LENGTH = 32;
            static constexpr size_t SALT_LENGTH = 5;

            explicit SsidBuilder(const std::string &test_name);

            // Keeps the rightmost 32 bytes, so the salt and suffix survive.
            std::string build(const std::string &suffix) const;

            const std::string &prefix() const { return prefix_; }

        private:
            static std::string random_salt();

            std::string prefix_;
        };

    } // namespace services
} // namespace wifirig

#endif // WIFIRIG_SERVICES_SSID_BUILDER_HPP
