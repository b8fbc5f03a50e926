#ifndef WIFIRIG_INFRASTRUCTURE_INTERFACE_ALLOCATOR_HPP
#define WIFIRIG_INFRASTRUCTURE_INTERFACE_ALLOCATOR_HPP

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace wifirig
{
    namespace core
    {
        struct PhyConfig;
        class Logger;
    }

    namespace infrastructure
    {
        class RemoteExecutor;

        enum class InterfaceMode
        {
            MANAGED,
            IBSS,
            MONITOR
        };

        std::string to_string(InterfaceMode mode);

        /**
         * Hands out wireless interfaces on the router's phys
         */
        class InterfaceAllocator
        {
        public:
            virtual ~InterfaceAllocator() = default;

            /**
             * Get an interface able to operate at |frequency| in |mode|
             * @param frequency MHz, 0 when |same_phy_as| pins the phy
             * @param same_phy_as Existing interface whose phy must be reused
             * @throws core::ResourceExhausted if no phy can serve the request
             */
            virtual std::string get_interface(int frequency, InterfaceMode mode,
                                              const std::string &same_phy_as = "") = 0;

            // Give |name| back. Safe to call after remove().
            virtual void release(const std::string &name) = 0;

            // Delete |name| from the host right now while keeping it allocated.
            virtual void remove(const std::string &name) = 0;
        };

        /**
         * Allocator creating virtual interfaces with iw on configured phys
         */
        class PhyInterfaceAllocator : public InterfaceAllocator
        {
        public:
            PhyInterfaceAllocator(RemoteExecutor &executor,
                                  const std::vector<core::PhyConfig> &phys,
                                  const std::string &iw_command);

            std::string get_interface(int frequency, InterfaceMode mode,
                                      const std::string &same_phy_as = "") override;
            void release(const std::string &name) override;
            void remove(const std::string &name) override;

            std::string phy_of(const std::string &name) const;
            size_t allocated_count() const { return allocated_.size(); }

        private:
            struct Allocation
            {
                std::string phy;
                InterfaceMode mode;
                bool removed = false;
            };

            std::string pick_phy(int frequency) const;
            std::string next_name(InterfaceMode mode) const;
            void delete_interface(const std::string &name);

            RemoteExecutor &executor_;
            std::vector<core::PhyConfig> phys_;
            std::string iw_;
            std::shared_ptr<core::Logger> logger_;

            std::map<std::string, Allocation> allocated_;
        };

    } // namespace infrastructure
} // namespace wifirig

#endif // WIFIRIG_INFRASTRUCTURE_INTERFACE_ALLOCATOR_HPP
