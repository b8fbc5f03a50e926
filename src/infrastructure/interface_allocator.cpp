#include "infrastructure/interface_allocator.hpp"
#include "infrastructure/remote_executor.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <limits>

namespace wifirig
{
    namespace infrastructure
    {

        std::string to_string(InterfaceMode mode)
        {
            switch (mode)
            {
            case InterfaceMode::MANAGED:
                return "managed";
            case InterfaceMode::IBSS:
                return "ibss";
            case InterfaceMode::MONITOR:
                return "monitor";
            }
            return "managed";
        }

        PhyInterfaceAllocator::PhyInterfaceAllocator(RemoteExecutor &executor,
                                                     const std::vector<core::PhyConfig> &phys,
                                                     const std::string &iw_command)
            : executor_(executor), phys_(phys), iw_(iw_command), logger_(core::get_logger("InterfaceAllocator"))
        {
        }

        std::string PhyInterfaceAllocator::get_interface(int frequency, InterfaceMode mode,
                                                         const std::string &same_phy_as)
        {
            std::string phy;
            if (!same_phy_as.empty())
            {
                phy = phy_of(same_phy_as);
                if (phy.empty())
                {
                    throw core::ResourceExhausted("Interface " + same_phy_as + " was not allocated here");
                }
            }
            else
            {
                phy = pick_phy(frequency);
            }

            std::string name = next_name(mode);
            executor_.run(iw_ + " phy " + phy + " interface add " + name + " type " + to_string(mode));

            allocated_[name] = Allocation{phy, mode, false};
            logger_->info("Allocated interface",
                          core::LogContext()
                              .add("interface", name)
                              .add("phy", phy)
                              .add("mode", to_string(mode))
                              .add("frequency", frequency));
            return name;
        }

        void PhyInterfaceAllocator::release(const std::string &name)
        {
            auto it = allocated_.find(name);
            if (it == allocated_.end())
            {
                logger_->warning("Releasing unknown interface", core::LogContext().add("interface", name));
                return;
            }

            if (!it->second.removed)
            {
                delete_interface(name);
            }
            allocated_.erase(it);
            logger_->debug("Released interface", core::LogContext().add("interface", name));
        }

        void PhyInterfaceAllocator::remove(const std::string &name)
        {
            auto it = allocated_.find(name);
            if (it == allocated_.end() || it->second.removed)
            {
                return;
            }

            delete_interface(name);
            it->second.removed = true;
        }

        std::string PhyInterfaceAllocator::phy_of(const std::string &name) const
        {
            auto it = allocated_.find(name);
            return it == allocated_.end() ? "" : it->second.phy;
        }

        std::string PhyInterfaceAllocator::pick_phy(int frequency) const
        {
            const std::string band = frequency < 3000 ? "2.4" : "5";

            // Spread interfaces across phys: take the least used capable one.
            std::string best;
            size_t best_load = std::numeric_limits<size_t>::max();
            for (const auto &phy : phys_)
            {
                if (std::find(phy.bands.begin(), phy.bands.end(), band) == phy.bands.end())
                {
                    continue;
                }

                size_t load = std::count_if(allocated_.begin(), allocated_.end(),
                                            [&phy](const auto &entry) { return entry.second.phy == phy.name; });
                if (load < best_load)
                {
                    best = phy.name;
                    best_load = load;
                }
            }

            if (best.empty())
            {
                throw core::ResourceExhausted("No phy supports frequency " + std::to_string(frequency));
            }
            return best;
        }

        std::string PhyInterfaceAllocator::next_name(InterfaceMode mode) const
        {
            for (int index = 0;; ++index)
            {
                std::string candidate = to_string(mode) + std::to_string(index);
                if (allocated_.find(candidate) == allocated_.end())
                {
                    return candidate;
                }
            }
        }

        void PhyInterfaceAllocator::delete_interface(const std::string &name)
        {
            auto result = executor_.run(iw_ + " dev " + name + " del", std::chrono::seconds(0), true);
            if (!result.ok())
            {
                logger_->warning("Failed to delete interface",
                                 core::LogContext().add("interface", name).add("status", result.exit_status));
            }
        }

    } // namespace infrastructure
} // namespace wifirig
