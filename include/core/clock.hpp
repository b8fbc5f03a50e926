#ifndef WIFIRIG_CORE_CLOCK_HPP
#define WIFIRIG_CORE_CLOCK_HPP

#include <chrono>
#include <thread>

namespace wifirig
{
    namespace core
    {

        /**
         * Time source for the bounded waits (startup poll, link wait)
         */
        class Clock
        {
        public:
            virtual ~Clock() = default;

            virtual std::chrono::steady_clock::time_point now() const = 0;
            virtual void sleep_for(std::chrono::milliseconds duration) = 0;
        };

        class SystemClock : public Clock
        {
        public:
            std::chrono::steady_clock::time_point now() const override
            {
                return std::chrono::steady_clock::now();
            }

            void sleep_for(std::chrono::milliseconds duration) override
            {
                std::this_thread::sleep_for(duration);
            }
        };

    } // namespace core
} // namespace wifirig

#endif // WIFIRIG_CORE_CLOCK_HPP
