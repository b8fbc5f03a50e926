#ifndef WIFIRIG_CORE_INSTANCE_STATE_HPP
#define WIFIRIG_CORE_INSTANCE_STATE_HPP

#include <string>

namespace wifirig
{
    namespace core
    {

        /**
         * Lifecycle of one interface slot on the router
         *
         * UNCONFIGURED -> STARTING -> ACTIVE -> TEARING_DOWN -> UNCONFIGURED
         * STARTING -> FAILED (terminal)
         */
        enum class InstanceState
        {
            UNCONFIGURED,
            STARTING,
            ACTIVE,
            TEARING_DOWN,
            FAILED
        };

        inline std::string to_string(InstanceState state)
        {
            switch (state)
            {
            case InstanceState::UNCONFIGURED:
                return "UNCONFIGURED";
            case InstanceState::STARTING:
                return "STARTING";
            case InstanceState::ACTIVE:
                return "ACTIVE";
            case InstanceState::TEARING_DOWN:
                return "TEARING_DOWN";
            case InstanceState::FAILED:
                return "FAILED";
            }
            return "UNKNOWN";
        }

        inline bool is_valid_transition(InstanceState from, InstanceState to)
        {
            switch (from)
            {
            case InstanceState::UNCONFIGURED:
                return to == InstanceState::STARTING;
            case InstanceState::STARTING:
                return to == InstanceState::ACTIVE || to == InstanceState::FAILED;
            case InstanceState::ACTIVE:
                return to == InstanceState::TEARING_DOWN;
            case InstanceState::TEARING_DOWN:
                return to == InstanceState::UNCONFIGURED;
            case InstanceState::FAILED:
                return false;
            }
            return false;
        }

    } // namespace core
} // namespace wifirig

#endif // WIFIRIG_CORE_INSTANCE_STATE_HPP
