#include <gtest/gtest.h>

#include "fakes.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/lifecycle_controller.hpp"
#include "services/hostap_config.hpp"
#include "services/local_server_pool.hpp"

#include <stdexcept>

using namespace wifirig;
using core::InstanceState;
using core::LifecycleController;
using services::HostapConfig;

namespace
{
    HostapConfig channel_config(int channel)
    {
        HostapConfig config;
        config.frequency = HostapConfig::frequency_for_channel(channel);
        return config;
    }
}

class LifecycleControllerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        journal = std::make_shared<std::vector<std::string>>();
        auto executor_owner = std::make_unique<fakes::FakeExecutor>(journal);
        auto allocator_owner = std::make_unique<fakes::FakeAllocator>(journal);
        auto clock_owner = std::make_unique<fakes::FakeClock>();
        executor = executor_owner.get();
        allocator = allocator_owner.get();
        clock = clock_owner.get();

        controller = std::make_unique<LifecycleController>(core::RigConfig::create_default("network_WiFi_Demo"),
                                                           std::move(executor_owner),
                                                           std::move(allocator_owner),
                                                           nullptr,
                                                           std::move(clock_owner));
    }

    void TearDown() override
    {
        controller.reset();
    }

    // Makes the next hostapd start on |interface| fail with a configuration error.
    void fail_next_start(const std::string &interface)
    {
        executor->script("Completing interface initialization' /tmp/hostapd-test-" + interface, 1);
        executor->script("Interface initialization failed' /tmp/hostapd-test-" + interface, 0);
    }

    void allow_start(const std::string &interface)
    {
        executor->script("Completing interface initialization' /tmp/hostapd-test-" + interface, 0);
    }

    std::shared_ptr<std::vector<std::string>> journal;
    fakes::FakeExecutor *executor = nullptr;
    fakes::FakeAllocator *allocator = nullptr;
    fakes::FakeClock *clock = nullptr;
    std::unique_ptr<LifecycleController> controller;
};

TEST_F(LifecycleControllerTest, NullConfigRejected)
{
    EXPECT_THROW(LifecycleController(nullptr), std::invalid_argument);
}

TEST_F(LifecycleControllerTest, StartPreparesRouter)
{
    controller->start();

    EXPECT_TRUE(controller->is_started());
    EXPECT_TRUE(executor->ran("test -x /usr/sbin/hostapd"));
    EXPECT_TRUE(executor->ran("test -x /usr/sbin/wpa_supplicant"));
    EXPECT_TRUE(executor->ran("pkill hostapd"));
    EXPECT_TRUE(executor->ran("pkill dnsmasq"));
    EXPECT_TRUE(executor->ran("/usr/sbin/iw reg set US"));
    EXPECT_TRUE(controller->has_capability(core::Capability::IBSS));
    EXPECT_TRUE(controller->has_capability(core::Capability::SEND_MANAGEMENT_FRAME));
}

TEST_F(LifecycleControllerTest, StartRequiresHostapd)
{
    executor->script("test -x /usr/sbin/hostapd", 1);

    EXPECT_THROW(controller->start(), core::RigError);
    EXPECT_FALSE(controller->is_started());
}

TEST_F(LifecycleControllerTest, ConfigureBringsUpApAndServer)
{
    controller->configure(channel_config(6));

    ASSERT_EQ(controller->ap_instances().size(), 1u);
    EXPECT_EQ(controller->get_hostapd_interface(0), "wlan0");
    EXPECT_EQ(controller->get_ssid().substr(0, 5), "Demo_");
    EXPECT_EQ(controller->get_wifi_channel(0), 6);
    EXPECT_EQ(controller->wifi_ip(), "192.168.0.254");
    EXPECT_EQ(controller->get_wifi_ip_subnet(0), "192.168.0.0/24");
    EXPECT_TRUE(controller->has_local_server());
    EXPECT_EQ(controller->state("wlan0"), InstanceState::ACTIVE);
    EXPECT_TRUE(executor->ran("/usr/sbin/iw dev wlan0 set txpower auto"));
    EXPECT_LT(executor->index_of("/usr/sbin/hostapd -dd"), executor->index_of("dnsmasq --conf-file"));
}

TEST_F(LifecycleControllerTest, ConfigureThenDeconfigLeavesNothing)
{
    controller->configure(channel_config(1));
    controller->deconfig();

    EXPECT_TRUE(controller->ap_instances().empty());
    EXPECT_TRUE(controller->local_servers().empty());
    EXPECT_FALSE(controller->has_local_server());
    EXPECT_TRUE(allocator->allocated.empty());
    EXPECT_EQ(controller->state("wlan0"), InstanceState::UNCONFIGURED);
    EXPECT_EQ(controller->torn_down_count(), 1u);
}

TEST_F(LifecycleControllerTest, ReconfigureReplacesRunningAp)
{
    controller->configure(channel_config(1));
    std::string first_ssid = controller->get_ssid();

    controller->configure(channel_config(11));

    ASSERT_EQ(controller->ap_instances().size(), 1u);
    EXPECT_NE(controller->get_ssid(), first_ssid);
    EXPECT_EQ(controller->get_wifi_channel(0), 11);
    EXPECT_EQ(controller->local_servers().size(), 1u);
    EXPECT_EQ(controller->torn_down_count(), 1u);
}

TEST_F(LifecycleControllerTest, DeconfigWithNothingConfiguredIsNoop)
{
    controller->deconfig();
    controller->deconfig(3);

    EXPECT_TRUE(executor->commands.empty());
    EXPECT_EQ(controller->torn_down_count(), 0u);
}

TEST_F(LifecycleControllerTest, ServersStopBeforeHostapd)
{
    controller->configure(channel_config(1));
    journal->clear();

    controller->deconfig();

    long dnsmasq = fakes::journal_index(*journal,
                                        "pkill -f '[d]nsmasq.*--conf-file=/tmp/dhcpd\\.wlan0\\.conf( |$)'");
    long hostapd = fakes::journal_index(*journal,
                                        "pkill -f '[h]ostapd.*/tmp/hostapd-test-wlan0\\.conf( |$)'");
    long released = fakes::journal_index(*journal, "alloc: release wlan0");
    ASSERT_GE(dnsmasq, 0);
    EXPECT_LT(dnsmasq, hostapd);
    EXPECT_LT(hostapd, released);
}

TEST_F(LifecycleControllerTest, MultipleApInstances)
{
    controller->configure(channel_config(1));
    controller->configure(channel_config(36), true);

    ASSERT_EQ(controller->ap_instances().size(), 2u);
    EXPECT_THROW(controller->get_ssid(), core::AmbiguousInstance);
    EXPECT_THROW(controller->wifi_ip(), core::AmbiguousInstance);
    EXPECT_EQ(controller->get_wifi_ip(1), "192.168.1.254");
    EXPECT_NE(controller->get_ssid(0), controller->get_ssid(1));

    controller->deconfig(0);

    ASSERT_EQ(controller->ap_instances().size(), 1u);
    EXPECT_EQ(controller->get_hostapd_interface(0), "wlan1");
    EXPECT_EQ(controller->local_servers()[0].interface, "wlan1");
    EXPECT_EQ(controller->local_servers()[0].index, 0u);
    EXPECT_EQ(controller->wifi_ip(), "192.168.1.254");
    EXPECT_EQ(controller->get_wifi_channel(0), 36);
}

TEST_F(LifecycleControllerTest, DeconfigRejectsBadIndex)
{
    controller->configure(channel_config(1));

    EXPECT_THROW(controller->deconfig(1), core::InvalidInstance);
    EXPECT_EQ(controller->ap_instances().size(), 1u);
}

TEST_F(LifecycleControllerTest, TearDownCounterTagsCollectedLogs)
{
    controller->configure(channel_config(1));
    controller->configure(channel_config(6));
    controller->deconfig();

    EXPECT_EQ(controller->torn_down_count(), 2u);
    ASSERT_EQ(executor->fetched.size(), 2u);
    EXPECT_EQ(executor->fetched[0].second, "debug/hostapd_router_0_wlan0.log");
    EXPECT_EQ(executor->fetched[1].second, "debug/hostapd_router_1_wlan0.log");
}

TEST_F(LifecycleControllerTest, SilentDeconfigRemovesInterfaceFirst)
{
    controller->configure(channel_config(1));
    journal->clear();

    controller->deconfig(std::nullopt, true);

    EXPECT_LT(fakes::journal_index(*journal, "alloc: remove wlan0"),
              fakes::journal_index(*journal, "pkill -f '[h]ostapd.*"));
}

TEST_F(LifecycleControllerTest, FailedStartMarksSlotFailed)
{
    fail_next_start("wlan0");

    EXPECT_THROW(controller->configure(channel_config(1)), core::BadConfiguration);

    EXPECT_TRUE(controller->ap_instances().empty());
    EXPECT_FALSE(controller->has_local_server());
    EXPECT_EQ(controller->state("wlan0"), InstanceState::FAILED);
    EXPECT_TRUE(allocator->allocated.empty());

    allow_start("wlan0");
    controller->configure(channel_config(1));
    EXPECT_EQ(controller->state("wlan0"), InstanceState::ACTIVE);
}

TEST_F(LifecycleControllerTest, StartupTimeoutPropagates)
{
    executor->script("Completing interface initialization", 1);
    executor->script("Interface initialization failed", 1);

    EXPECT_THROW(controller->configure(channel_config(1)), core::StartupTimeout);
    EXPECT_TRUE(controller->ap_instances().empty());
}

TEST_F(LifecycleControllerTest, InvalidConfigLeavesNoSlot)
{
    HostapConfig config = channel_config(36);
    config.hw_mode = services::HwMode::G;

    EXPECT_THROW(controller->configure(config), std::invalid_argument);
    EXPECT_EQ(controller->state("wlan0"), InstanceState::UNCONFIGURED);
}

TEST_F(LifecycleControllerTest, SsidQueriesWithoutNetwork)
{
    EXPECT_THROW(controller->get_ssid(), core::NotConfigured);
    EXPECT_THROW(controller->get_ssid(0), core::NotConfigured);
    EXPECT_THROW(controller->wifi_ip(), core::NotConfigured);
    EXPECT_THROW(controller->get_hostapd_interface(0), core::InvalidInstance);
}

TEST_F(LifecycleControllerTest, ExplicitSsidIsKept)
{
    HostapConfig config;
    config.ssid = "FixedName";
    controller->configure(config);

    EXPECT_EQ(controller->get_ssid(), "FixedName");
}

TEST_F(LifecycleControllerTest, IbssSession)
{
    controller->join_ibss(channel_config(6));

    ASSERT_EQ(controller->station_instances().size(), 1u);
    EXPECT_TRUE(controller->ap_instances().empty());
    EXPECT_EQ(controller->get_ssid().substr(0, 5), "Demo_");
    EXPECT_EQ(controller->wifi_ip(), "192.168.0.254");

    controller->deconfig();

    EXPECT_TRUE(controller->station_instances().empty());
    EXPECT_FALSE(controller->has_local_server());
    EXPECT_TRUE(executor->ran("ibss leave"));
}

TEST_F(LifecycleControllerTest, ManagedPeerLifecycle)
{
    controller->configure(channel_config(6));
    executor->script("dev wlan1 link", 0, "Connected to 00:11:22:33:44:55\n");

    controller->connect_managed();

    ASSERT_EQ(controller->station_instances().size(), 1u);
    EXPECT_EQ(controller->station_instances()[0].interface, "wlan1");
    EXPECT_TRUE(executor->ran("addr add 192.168.0.253/24 dev wlan1"));
    EXPECT_THROW(controller->connect_managed(), core::AlreadyConfigured);

    controller->deconfig();

    EXPECT_TRUE(controller->station_instances().empty());
    EXPECT_TRUE(executor->ran("pkill -f '[w]pa_supplicant.*-c/tmp/wpa-supplicant-test-wlan1\\.conf( |$)'"));
    EXPECT_TRUE(allocator->allocated.empty());
}

TEST_F(LifecycleControllerTest, ManagedPeerNeedsAp)
{
    EXPECT_THROW(controller->connect_managed(), core::NotConfigured);
}

TEST_F(LifecycleControllerTest, LeaveDropsOnlyStation)
{
    controller->configure(channel_config(6));
    executor->script("dev wlan1 link", 0, "Connected to 00:11:22:33:44:55\n");
    controller->connect_managed();

    controller->leave();

    EXPECT_TRUE(controller->station_instances().empty());
    EXPECT_EQ(controller->ap_instances().size(), 1u);
    EXPECT_TRUE(controller->has_local_server());
}

TEST_F(LifecycleControllerTest, InterfaceQueries)
{
    controller->configure(channel_config(1));
    executor->script("cat /sys/class/net/wlan0/address", 0, "02:00:00:00:01:00\n");
    executor->script("cat /sys/class/net/wlan0/phy80211/name", 0, "phy0\n");

    EXPECT_EQ(controller->get_hostapd_mac(0), "02:00:00:00:01:00");
    EXPECT_EQ(controller->get_hostapd_phy(0), "phy0");
    EXPECT_EQ(LifecycleController::local_server_address(4), "192.168.4.254");
    EXPECT_EQ(LifecycleController::local_peer_ip_address(4), "192.168.4.253");
    EXPECT_THROW(controller->local_peer_mac_address(), core::NotConfigured);
}

TEST_F(LifecycleControllerTest, HostapdClientControl)
{
    controller->configure(channel_config(1));

    controller->deauth_client("aa:bb:cc:dd:ee:ff");

    EXPECT_TRUE(executor->ran("/usr/sbin/hostapd_cli -p/tmp/hostapd-test-wlan0.ctrl deauthenticate aa:bb:cc:dd:ee:ff"));
}

TEST_F(LifecycleControllerTest, HostapdLogChecks)
{
    controller->configure(channel_config(1));

    executor->script("PMK from PMKSA cache", 1);
    EXPECT_THROW(controller->confirm_pmksa_cache_use(), core::VerificationFailed);

    executor->script("PMK from PMKSA cache", 0);
    EXPECT_NO_THROW(controller->confirm_pmksa_cache_use());

    executor->script("deauthentication: STA=", 1);
    EXPECT_FALSE(controller->detect_client_deauth("aa:bb:cc:dd:ee:ff"));
    EXPECT_TRUE(executor->ran("grep -qi 'wlan0: deauthentication: STA=aa:bb:cc:dd:ee:ff'"));

    EXPECT_TRUE(controller->detect_client_coexistence_report("aa:bb:cc:dd:ee:ff"));
    EXPECT_TRUE(executor->ran(".. .. aa bb cc dd ee ff .. .. .. .. .. .. .. .. 04 00.*48 01 .."));
}

TEST_F(LifecycleControllerTest, ManagementFramesNeedTool)
{
    executor->script("test -x /usr/bin/send_management_frame", 1);
    controller->start();

    core::ManagementFrameRequest request;
    request.interface = "wlan0";
    request.frame_type = "beacon";

    EXPECT_FALSE(controller->has_capability(core::Capability::SEND_MANAGEMENT_FRAME));
    EXPECT_THROW(controller->send_management_frame(request), core::MissingCapability);
}

TEST_F(LifecycleControllerTest, SendsManagementFrames)
{
    controller->start();
    executor->script("/usr/bin/send_management_frame -i", 0, "4321\n");

    core::ManagementFrameRequest request;
    request.interface = "monitor0";
    request.frame_type = "probe_request";
    request.channel = 6;
    request.num_bss = 4;

    EXPECT_EQ(controller->send_management_frame(request), 4321);
    EXPECT_TRUE(executor->ran("/usr/bin/send_management_frame -i monitor0 -t probe_request -c 6 -b 4 "
                              "> /tmp/send_management_frame-test.log 2>&1 & echo $!"));
}

TEST_F(LifecycleControllerTest, ManagementFramesOnApPhy)
{
    controller->start();
    controller->configure(channel_config(1));

    controller->send_management_frame_on_ap("beacon", 1);

    ASSERT_EQ(allocator->requests.size(), 2u);
    EXPECT_EQ(allocator->requests[1].mode, infrastructure::InterfaceMode::MONITOR);
    EXPECT_EQ(allocator->requests[1].same_phy_as, "wlan0");
    EXPECT_EQ(allocator->released.back(), "wlan1");
}

TEST_F(LifecycleControllerTest, CloseTearsEverythingDown)
{
    controller->start();
    controller->configure(channel_config(1));
    controller->configure(channel_config(6), true);

    controller->close();

    EXPECT_FALSE(controller->is_started());
    EXPECT_TRUE(controller->ap_instances().empty());
    EXPECT_TRUE(allocator->allocated.empty());
}

TEST_F(LifecycleControllerTest, MonitorInterfaceForFrameInjection)
{
    std::string interface = controller->setup_management_frame_interface(36);

    EXPECT_EQ(allocator->requests[0].mode, infrastructure::InterfaceMode::MONITOR);
    EXPECT_EQ(allocator->requests[0].frequency, 5180);
    EXPECT_TRUE(executor->ran("/usr/sbin/iw dev " + interface + " set freq 5180"));
    EXPECT_TRUE(executor->ran("/usr/sbin/ip link set " + interface + " up"));

    controller->release_interface(interface);
    EXPECT_TRUE(allocator->allocated.empty());
}
