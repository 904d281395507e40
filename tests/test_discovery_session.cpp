#include <atomic>
#include <gtest/gtest.h>

#include "core/discovery_session.hpp"
#include "fake_bus_client.hpp"

using namespace core;

namespace
{
SessionConfig cfg_for(FakeBusClient &bus, int secs)
{
    SessionConfig c;
    c.duration_s = secs;
    c.now        = bus.now_fn();
    return c;
}
}  // namespace

TEST(SessionDuration, Bounds)
{
    btctl::Error err;
    EXPECT_FALSE(validate_duration(0, err));
    EXPECT_EQ(err.kind, btctl::ErrorKind::InvalidDuration);
    err.clear();
    EXPECT_FALSE(validate_duration(61, err));
    EXPECT_EQ(err.kind, btctl::ErrorKind::InvalidDuration);
    err.clear();
    EXPECT_TRUE(validate_duration(1, err));
    EXPECT_TRUE(validate_duration(60, err));
    EXPECT_FALSE(err);
}

TEST(DiscoverySession, InvalidDurationNeverTouchesBus)
{
    FakeBusClient    bus;
    DiscoverySession s(bus, cfg_for(bus, 61));
    SessionResult    res;
    btctl::Error     err;

    EXPECT_FALSE(s.run(res, err));
    EXPECT_EQ(err.kind, btctl::ErrorKind::InvalidDuration);
    EXPECT_TRUE(bus.calls.empty());
    EXPECT_EQ(s.state(), SessionState::Closed);
}

TEST(DiscoverySession, SeedsThenFoldsThenDrains)
{
    FakeBusClient bus;
    bus.known = {make_props("11:22:33:44:55:66", "Mouse")};
    bus.scans = {{added("AA:BB:CC:DD:EE:FF", "Phone", -50), changed_rssi("11:22:33:44:55:66", -70)}};

    DiscoverySession s(bus, cfg_for(bus, 2));
    SessionResult    res;
    btctl::Error     err;
    ASSERT_TRUE(s.run(res, err));

    EXPECT_EQ(s.state(), SessionState::Closed);
    EXPECT_FALSE(res.cancelled);
    EXPECT_FALSE(res.stop_failed);
    ASSERT_EQ(res.snapshot.size(), 2u);
    EXPECT_EQ(res.snapshot[0].alias, "Mouse");
    EXPECT_EQ(res.snapshot[0].origin, Origin::Known);
    EXPECT_EQ(*res.snapshot[0].rssi, -70);
    EXPECT_EQ(res.snapshot[1].alias, "Phone");
    EXPECT_EQ(res.snapshot[1].origin, Origin::Discovered);

    EXPECT_EQ(bus.count("start_discovery"), 1);
    EXPECT_EQ(bus.count("stop_discovery"), 1);
    EXPECT_FALSE(bus.discovering);
    EXPECT_EQ(bus.open_streams, 0);
}

TEST(DiscoverySession, RunsForConfiguredDuration)
{
    FakeBusClient bus;
    const auto    t0 = bus.clock;

    DiscoverySession s(bus, cfg_for(bus, 3));
    SessionResult    res;
    btctl::Error     err;
    ASSERT_TRUE(s.run(res, err));

    EXPECT_EQ(bus.clock - t0, std::chrono::seconds(3));
}

TEST(DiscoverySession, StartFailureFailsFast)
{
    FakeBusClient bus;
    bus.fail["start_discovery"].set(btctl::ErrorKind::AdapterUnavailable, "adapter is powered off");

    DiscoverySession s(bus, cfg_for(bus, 5));
    SessionResult    res;
    btctl::Error     err;

    testing::internal::CaptureStderr();
    EXPECT_FALSE(s.run(res, err));
    (void)testing::internal::GetCapturedStderr();

    EXPECT_EQ(err.kind, btctl::ErrorKind::AdapterUnavailable);
    EXPECT_EQ(s.state(), SessionState::Closed);
    EXPECT_EQ(bus.count("list_known_devices"), 0);
    EXPECT_EQ(bus.count("stop_discovery"), 0);
    EXPECT_EQ(bus.open_streams, 0);
}

TEST(DiscoverySession, StopFailureStillReturnsSnapshot)
{
    FakeBusClient bus;
    bus.known = {make_props("11:22:33:44:55:66", "Mouse")};
    bus.fail["stop_discovery"].set(btctl::ErrorKind::DiscoveryStopFailed, "org.bluez.Error.Failed");

    DiscoverySession s(bus, cfg_for(bus, 1));
    SessionResult    res;
    btctl::Error     err;

    testing::internal::CaptureStderr();
    ASSERT_TRUE(s.run(res, err));
    std::string log = testing::internal::GetCapturedStderr();

    EXPECT_TRUE(res.stop_failed);
    EXPECT_EQ(res.stop_error.kind, btctl::ErrorKind::DiscoveryStopFailed);
    ASSERT_EQ(res.snapshot.size(), 1u);
    EXPECT_NE(log.find("StopDiscovery failed"), std::string::npos);
    EXPECT_EQ(bus.open_streams, 0);
}

TEST(DiscoverySession, CancelStillDrains)
{
    FakeBusClient    bus;
    std::atomic_bool cancel{false};
    int              ticks = 0;
    bus.on_next            = [&] {
        if (++ticks == 3)
            cancel.store(true);
    };

    DiscoverySession s(bus, cfg_for(bus, 60), &cancel);
    SessionResult    res;
    btctl::Error     err;
    ASSERT_TRUE(s.run(res, err));

    EXPECT_TRUE(res.cancelled);
    EXPECT_EQ(bus.count("stop_discovery"), 1);
    EXPECT_FALSE(bus.discovering);
    EXPECT_EQ(bus.open_streams, 0);
    EXPECT_LT(bus.clock.time_since_epoch(), std::chrono::seconds(60));
}

TEST(DiscoverySession, LostSubscriptionEndsEarly)
{
    FakeBusClient bus;
    bus.scans             = {{added("AA:BB:CC:DD:EE:FF", "Phone", -50),
                              added("AA:BB:CC:DD:EE:01", "Watch", -60)}};
    bus.drop_stream_after = 1;

    DiscoverySession s(bus, cfg_for(bus, 10));
    SessionResult    res;
    btctl::Error     err;

    testing::internal::CaptureStderr();
    ASSERT_TRUE(s.run(res, err));
    (void)testing::internal::GetCapturedStderr();

    ASSERT_EQ(res.snapshot.size(), 1u);
    EXPECT_EQ(res.snapshot[0].alias, "Phone");
    EXPECT_EQ(bus.count("stop_discovery"), 1);
}

TEST(DiscoverySession, SecondSessionTearsDownStaleStream)
{
    FakeBusClient bus;

    btctl::Error err;
    auto         stale = bus.subscribe_device_events(err);
    ASSERT_TRUE(stale);
    EXPECT_EQ(bus.open_streams, 1);

    DiscoverySession s(bus, cfg_for(bus, 1));
    SessionResult    res;
    ASSERT_TRUE(s.run(res, err));

    EXPECT_EQ(bus.stale_closed, 1);
    EXPECT_FALSE(stale->is_open());
    EXPECT_EQ(bus.open_streams, 0);
}

TEST(DiscoverySession, RunsOnlyOnce)
{
    FakeBusClient    bus;
    DiscoverySession s(bus, cfg_for(bus, 1));
    SessionResult    res;
    btctl::Error     err;
    ASSERT_TRUE(s.run(res, err));

    testing::internal::CaptureStderr();
    EXPECT_FALSE(s.run(res, err));
    (void)testing::internal::GetCapturedStderr();
    EXPECT_EQ(bus.count("start_discovery"), 1);
}
