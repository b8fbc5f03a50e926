#include <gtest/gtest.h>

#include "fakes.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "services/ap_instance_manager.hpp"
#include "services/hostap_config.hpp"
#include "services/local_server_pool.hpp"
#include "services/ssid_builder.hpp"
#include "services/station_instance_manager.hpp"

using namespace wifirig;
using infrastructure::CommandResult;
using infrastructure::InterfaceMode;
using services::APInstance;
using services::HostapConfig;
using services::StationInstance;
using services::StationKind;

namespace
{
    const CommandResult kNotConnected{0, "Not connected.\n"};
    const CommandResult kConnected{0, "Connected to 00:11:22:33:44:55 (on wlan1)\n\tSSID: Demo_abcde\n"};
}

class StationInstanceManagerTest : public ::testing::Test
{
protected:
    // An AP already running on wlan0, channel 6.
    APInstance running_ap()
    {
        APInstance ap;
        ap.interface = allocator.get_interface(2437, InterfaceMode::MANAGED);
        ap.ssid = "Demo_abcde";
        ap.params = {{"channel", "6"}, {"ssid", "Demo_abcde"}};
        return ap;
    }

    std::shared_ptr<std::vector<std::string>> journal = std::make_shared<std::vector<std::string>>();

    fakes::FakeExecutor executor{journal};
    fakes::FakeAllocator allocator{journal};
    fakes::FakeClock clock;
    services::SsidBuilder ssid_builder{"network_WiFi_Demo"};
    core::CommandPaths commands;
    core::LifecycleConfig lifecycle;
    services::LocalServerPool local_servers{executor, commands};

    services::StationInstanceManager manager{executor, allocator, local_servers, ssid_builder,
                                             commands, lifecycle, clock};
};

TEST_F(StationInstanceManagerTest, JoinsIbssWithDhcp)
{
    HostapConfig config;
    config.ssid = "AdHocNet";

    StationInstance station = manager.join_ibss(config);

    EXPECT_EQ(station.kind, StationKind::IBSS);
    EXPECT_EQ(station.interface, "wlan0");
    EXPECT_EQ(station.ssid, "AdHocNet");
    EXPECT_EQ(allocator.requests[0].mode, InterfaceMode::IBSS);
    EXPECT_TRUE(executor.ran("/usr/sbin/iw dev wlan0 ibss join 'AdHocNet' 2412"));
    ASSERT_NE(local_servers.find("wlan0"), nullptr);
    EXPECT_EQ(local_servers.find("wlan0")->gateway(), "192.168.0.254");
}

TEST_F(StationInstanceManagerTest, GeneratedIbssSsid)
{
    StationInstance station = manager.join_ibss(HostapConfig{});
    EXPECT_EQ(station.ssid.substr(0, 5), "Demo_");
}

TEST_F(StationInstanceManagerTest, FailedIbssJoinCleansUp)
{
    executor.script("ibss join", 1);

    EXPECT_THROW(manager.join_ibss(HostapConfig{}), core::CommandFailed);
    EXPECT_TRUE(allocator.allocated.empty());
    EXPECT_TRUE(local_servers.empty());
    EXPECT_TRUE(executor.ran("ibss leave"));
}

TEST_F(StationInstanceManagerTest, ConnectsManagedPeer)
{
    APInstance ap = running_ap();
    executor.script("/usr/sbin/iw dev wlan1 link", {kNotConnected, kConnected});

    StationInstance station = manager.connect_managed(ap, 2);

    EXPECT_EQ(station.kind, StationKind::MANAGED);
    EXPECT_EQ(station.interface, "wlan1");
    EXPECT_EQ(station.ssid, "Demo_abcde");
    EXPECT_EQ(allocator.requests[1].frequency, 2437);
    EXPECT_EQ(clock.sleeps, 1u);

    const std::string &conf =
        executor.commands[static_cast<size_t>(executor.index_of("/tmp/wpa-supplicant-test-wlan1.conf"))];
    EXPECT_NE(conf.find("ssid=\"Demo_abcde\""), std::string::npos);
    EXPECT_NE(conf.find("key_mgmt=NONE"), std::string::npos);

    EXPECT_TRUE(executor.ran("/usr/sbin/wpa_supplicant -dd -t -iwlan1 -P/tmp/wpa-supplicant-test-wlan1.pid "
                             "-c/tmp/wpa-supplicant-test-wlan1.conf -Dnl80211"));
    EXPECT_TRUE(executor.ran("/usr/sbin/ip addr add 192.168.2.253/24 dev wlan1"));
    EXPECT_TRUE(executor.ran("echo 2 > /proc/sys/net/ipv4/conf/wlan1/rp_filter"));
    EXPECT_TRUE(executor.ran("echo 1 > /proc/sys/net/ipv4/conf/wlan1/arp_ignore"));
    EXPECT_TRUE(executor.ran("echo 1 > /proc/sys/net/ipv4/conf/wlan0/arp_ignore"));
}

TEST_F(StationInstanceManagerTest, TargetWithoutChannel)
{
    APInstance ap = running_ap();
    ap.params.clear();

    EXPECT_THROW(manager.connect_managed(ap, 0), core::NotConfigured);
    EXPECT_EQ(allocator.requests.size(), 1u);
}

TEST_F(StationInstanceManagerTest, LinkTimeoutTearsDownPeer)
{
    APInstance ap = running_ap();
    executor.script("dev wlan1 link", 0, "Not connected.\n");

    try
    {
        manager.connect_managed(ap, 0);
        FAIL() << "expected StartupTimeout";
    }
    catch (const core::StartupTimeout &e)
    {
        EXPECT_EQ(e.interface(), "wlan1");
    }

    EXPECT_EQ(clock.sleeps, 60u);
    EXPECT_TRUE(executor.ran("pkill -f '[w]pa_supplicant.*-c/tmp/wpa-supplicant-test-wlan1\\.conf( |$)'"));
    EXPECT_EQ(allocator.released, std::vector<std::string>{"wlan1"});
    EXPECT_FALSE(executor.ran("addr add 192.168.0.253"));
}

TEST_F(StationInstanceManagerTest, ZeroLinkTimeoutWaitsIndefinitely)
{
    lifecycle.link_timeout_seconds = 0;
    APInstance ap = running_ap();
    std::vector<CommandResult> responses(100, kNotConnected);
    responses.push_back(kConnected);
    executor.script("dev wlan1 link", responses);

    EXPECT_NO_THROW(manager.connect_managed(ap, 0));
    EXPECT_EQ(clock.sleeps, 100u);
}

TEST_F(StationInstanceManagerTest, LeaveManagedPeer)
{
    APInstance ap = running_ap();
    executor.script("dev wlan1 link", 0, "Connected to 00:11:22:33:44:55\n");
    StationInstance station = manager.connect_managed(ap, 0);
    journal->clear();

    manager.leave(station);

    long killed = fakes::journal_index(*journal,
                                       "pkill -f '[w]pa_supplicant.*-c/tmp/wpa-supplicant-test-wlan1\\.conf( |$)'");
    long down = fakes::journal_index(*journal, "/usr/sbin/ip link set wlan1 down");
    long released = fakes::journal_index(*journal, "alloc: release wlan1");
    ASSERT_GE(killed, 0);
    EXPECT_LT(killed, down);
    EXPECT_LT(down, released);
}

TEST_F(StationInstanceManagerTest, LeaveIbssReleasesServer)
{
    StationInstance station = manager.join_ibss(HostapConfig{});

    manager.leave(station);

    EXPECT_TRUE(executor.ran("/usr/sbin/iw dev wlan0 ibss leave"));
    EXPECT_TRUE(local_servers.empty());
    EXPECT_TRUE(allocator.allocated.empty());
}

TEST_F(StationInstanceManagerTest, LeaveExternallyManagedStation)
{
    StationInstance station{"Demo_abcde", allocator.get_interface(2412, InterfaceMode::MANAGED),
                            StationKind::EXTERNALLY_MANAGED};

    manager.leave(station);

    EXPECT_TRUE(executor.ran("/usr/sbin/iw dev wlan0 disconnect"));
}

TEST_F(StationInstanceManagerTest, LeaveNeverThrows)
{
    StationInstance station = manager.join_ibss(HostapConfig{});
    executor.script("ibss leave", 1);
    executor.script("link set wlan0 down", 2);
    executor.script("addr del", 2);

    EXPECT_NO_THROW(manager.leave(station));
    EXPECT_TRUE(allocator.allocated.empty());
}
