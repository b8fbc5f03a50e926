#ifndef WIFIRIG_TESTS_FAKES_HPP
#define WIFIRIG_TESTS_FAKES_HPP

#include <algorithm>
#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "core/clock.hpp"
#include "core/errors.hpp"
#include "infrastructure/interface_allocator.hpp"
#include "infrastructure/remote_executor.hpp"

namespace wifirig
{
    namespace fakes
    {

        /**
         * Executor answering from scripted rules instead of a router
         *
         * The most recently scripted rule whose pattern is a substring of
         * the command wins. A rule with several responses hands them out in
         * order and keeps repeating the last one. Unmatched commands succeed
         * with empty output.
         */
        class FakeExecutor : public infrastructure::RemoteExecutor
        {
        public:
            explicit FakeExecutor(std::shared_ptr<std::vector<std::string>> journal = nullptr)
                : RemoteExecutor(std::chrono::seconds(60)), journal_(std::move(journal))
            {
            }

            void script(const std::string &pattern, std::vector<infrastructure::CommandResult> responses)
            {
                rules_.push_back(Rule{pattern, std::move(responses), 0});
            }

            void script(const std::string &pattern, int exit_status, const std::string &output = "")
            {
                script(pattern, {infrastructure::CommandResult{exit_status, output}});
            }

            bool get_file(const std::string &remote_path, const std::string &local_path) override
            {
                fetched.emplace_back(remote_path, local_path);
                return true;
            }

            std::string describe() const override { return "fake-router"; }

            size_t count(const std::string &pattern) const
            {
                return std::count_if(commands.begin(), commands.end(), [&pattern](const std::string &command) {
                    return command.find(pattern) != std::string::npos;
                });
            }

            bool ran(const std::string &pattern) const { return count(pattern) > 0; }

            // Position of the first command containing |pattern|, or -1.
            long index_of(const std::string &pattern) const
            {
                for (size_t i = 0; i < commands.size(); ++i)
                {
                    if (commands[i].find(pattern) != std::string::npos)
                    {
                        return static_cast<long>(i);
                    }
                }
                return -1;
            }

            std::vector<std::string> commands;
            std::vector<std::pair<std::string, std::string>> fetched;

        protected:
            infrastructure::CommandResult execute(const std::string &command, std::chrono::seconds) override
            {
                commands.push_back(command);
                if (journal_)
                {
                    journal_->push_back("run: " + command);
                }

                for (auto rule = rules_.rbegin(); rule != rules_.rend(); ++rule)
                {
                    if (command.find(rule->pattern) == std::string::npos)
                    {
                        continue;
                    }
                    size_t next = std::min(rule->served, rule->responses.size() - 1);
                    ++rule->served;
                    return rule->responses[next];
                }
                return infrastructure::CommandResult{0, ""};
            }

        private:
            struct Rule
            {
                std::string pattern;
                std::vector<infrastructure::CommandResult> responses;
                size_t served;
            };

            std::vector<Rule> rules_;
            std::shared_ptr<std::vector<std::string>> journal_;
        };

        /**
         * Allocator handing out wlan<N> names, lowest free number first
         */
        class FakeAllocator : public infrastructure::InterfaceAllocator
        {
        public:
            explicit FakeAllocator(std::shared_ptr<std::vector<std::string>> journal = nullptr,
                                   size_t capacity = 8)
                : journal_(std::move(journal)), capacity_(capacity)
            {
            }

            std::string get_interface(int frequency, infrastructure::InterfaceMode mode,
                                      const std::string &same_phy_as = "") override
            {
                if (allocated.size() >= capacity_)
                {
                    throw core::ResourceExhausted("No free interface");
                }

                std::string name;
                for (int index = 0;; ++index)
                {
                    name = "wlan" + std::to_string(index);
                    if (allocated.count(name) == 0)
                    {
                        break;
                    }
                }

                allocated.insert(name);
                requests.push_back(Request{name, frequency, mode, same_phy_as});
                record("get " + name);
                return name;
            }

            void release(const std::string &name) override
            {
                allocated.erase(name);
                released.push_back(name);
                record("release " + name);
            }

            void remove(const std::string &name) override
            {
                removed.push_back(name);
                record("remove " + name);
            }

            struct Request
            {
                std::string name;
                int frequency;
                infrastructure::InterfaceMode mode;
                std::string same_phy_as;
            };

            std::set<std::string> allocated;
            std::vector<Request> requests;
            std::vector<std::string> released;
            std::vector<std::string> removed;

        private:
            void record(const std::string &event)
            {
                if (journal_)
                {
                    journal_->push_back("alloc: " + event);
                }
            }

            std::shared_ptr<std::vector<std::string>> journal_;
            size_t capacity_;
        };

        /**
         * Clock that only moves when something sleeps on it
         */
        class FakeClock : public core::Clock
        {
        public:
            std::chrono::steady_clock::time_point now() const override { return now_; }

            void sleep_for(std::chrono::milliseconds duration) override
            {
                now_ += duration;
                ++sleeps;
            }

            size_t sleeps = 0;

        private:
            std::chrono::steady_clock::time_point now_{};
        };

        // Index of the first journal entry containing |pattern|, or -1.
        inline long journal_index(const std::vector<std::string> &journal, const std::string &pattern)
        {
            for (size_t i = 0; i < journal.size(); ++i)
            {
                if (journal[i].find(pattern) != std::string::npos)
                {
                    return static_cast<long>(i);
                }
            }
            return -1;
        }

    } // namespace fakes
} // namespace wifirig

#endif // WIFIRIG_TESTS_FAKES_HPP
