#include <gtest/gtest.h>

#include "gatt/characteristics.hpp"
#include "gatt/device_registry.hpp"
#include "gatt/loopback_gatt.hpp"
#include "gatt/notify_gate.hpp"
#include "proto/codec.hpp"

using namespace gatt;

namespace
{
// Loopback server exporting one notifiable characteristic
struct GateFixture : ::testing::Test
{
    void SetUp() override
    {
        ServiceDef svc{0x1849, "MCS", {{CharId::TrackTitle, 0x2B97, FLAG_READ | FLAG_NOTIFY}}};
        ASSERT_TRUE(server.open({svc}, ServerCallbacks{}));
    }

    LoopbackGattServer server;
    DeviceRegistry     reg;
    NotificationGate   gate;
};
}  // namespace

TEST(DeviceRegistry, RecentIsSubsetOfConnected)
{
    DeviceRegistry reg;
    reg.mark_recent("AA:AA:AA:AA:AA:AA");  // not connected: ignored
    EXPECT_FALSE(reg.is_recent("AA:AA:AA:AA:AA:AA"));

    EXPECT_TRUE(reg.add("AA:AA:AA:AA:AA:AA"));
    EXPECT_FALSE(reg.add("AA:AA:AA:AA:AA:AA"));
    EXPECT_FALSE(reg.add(""));
    reg.mark_recent("AA:AA:AA:AA:AA:AA");
    EXPECT_TRUE(reg.is_recent("AA:AA:AA:AA:AA:AA"));

    EXPECT_TRUE(reg.remove("AA:AA:AA:AA:AA:AA"));
    EXPECT_FALSE(reg.is_recent("AA:AA:AA:AA:AA:AA"));
    EXPECT_TRUE(reg.empty());
}

TEST(DeviceRegistry, Subscriptions)
{
    DeviceRegistry reg;
    EXPECT_FALSE(reg.any_subscription());
    reg.set_subscribed(CharId::CallState, true);
    EXPECT_TRUE(reg.subscribed(CharId::CallState));
    reg.set_subscribed(CharId::CallState, false);
    EXPECT_FALSE(reg.any_subscription());
}

TEST_F(GateFixture, ChangedValueGoesToEveryDevice)
{
    reg.add("AA:AA:AA:AA:AA:AA");
    reg.add("BB:BB:BB:BB:BB:BB");

    auto v = codec::encode_string("Song A");
    EXPECT_EQ(gate.publish(server, CharId::TrackTitle, v, reg), 2u);
    EXPECT_EQ(server.sent_to("AA:AA:AA:AA:AA:AA", CharId::TrackTitle).size(), 1u);
    EXPECT_EQ(server.sent_to("BB:BB:BB:BB:BB:BB", CharId::TrackTitle).size(), 1u);
    ASSERT_NE(server.value(CharId::TrackTitle), nullptr);
    EXPECT_EQ(*server.value(CharId::TrackTitle), v);
    ASSERT_NE(gate.cached(CharId::TrackTitle), nullptr);
    EXPECT_EQ(*gate.cached(CharId::TrackTitle), v);
}

TEST_F(GateFixture, UnchangedValueIsSuppressed)
{
    reg.add("AA:AA:AA:AA:AA:AA");
    auto v = codec::encode_string("Song A");
    gate.publish(server, CharId::TrackTitle, v, reg);
    server.clear_sent();

    EXPECT_EQ(gate.publish(server, CharId::TrackTitle, v, reg), 0u);
    EXPECT_TRUE(server.sent().empty());
}

TEST_F(GateFixture, UnchangedValueReachesOnlyRecentDevices)
{
    reg.add("AA:AA:AA:AA:AA:AA");
    auto v = codec::encode_string("Song A");
    gate.publish(server, CharId::TrackTitle, v, reg);
    server.clear_sent();

    reg.add("BB:BB:BB:BB:BB:BB");
    reg.mark_recent("BB:BB:BB:BB:BB:BB");
    auto d = gate.decide(CharId::TrackTitle, v, reg);
    EXPECT_FALSE(d.changed);
    ASSERT_EQ(d.recipients.size(), 1u);
    EXPECT_EQ(d.recipients[0], "BB:BB:BB:BB:BB:BB");

    EXPECT_EQ(gate.publish(server, CharId::TrackTitle, v, reg), 1u);
    EXPECT_TRUE(server.sent_to("AA:AA:AA:AA:AA:AA", CharId::TrackTitle).empty());
    EXPECT_EQ(server.sent_to("BB:BB:BB:BB:BB:BB", CharId::TrackTitle).size(), 1u);
}

TEST_F(GateFixture, ChangeWithNoDevicesStillUpdatesCacheAndValue)
{
    auto v = codec::encode_string("Song B");
    EXPECT_EQ(gate.publish(server, CharId::TrackTitle, v, reg), 0u);
    ASSERT_NE(gate.cached(CharId::TrackTitle), nullptr);
    ASSERT_NE(server.value(CharId::TrackTitle), nullptr);
    EXPECT_EQ(*server.value(CharId::TrackTitle), v);
}

TEST_F(GateFixture, ForceBypassesCache)
{
    reg.add("AA:AA:AA:AA:AA:AA");
    auto v = codec::encode_string("Song A");
    gate.publish(server, CharId::TrackTitle, v, reg);
    server.clear_sent();

    EXPECT_EQ(gate.publish(server, CharId::TrackTitle, v, reg, true), 1u);
    EXPECT_EQ(server.sent().size(), 1u);
}

TEST_F(GateFixture, FailedNotifyIsCountedNotRetried)
{
    reg.add("AA:AA:AA:AA:AA:AA");
    server.set_notify_fails(true);
    EXPECT_EQ(gate.publish(server, CharId::TrackTitle, codec::encode_string("x"), reg), 0u);
    server.set_notify_fails(false);
    // cache was updated anyway: the same value is not re-sent
    EXPECT_EQ(gate.publish(server, CharId::TrackTitle, codec::encode_string("x"), reg), 0u);
    EXPECT_TRUE(server.sent().empty());
}
