#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "BLETimeoutSweeper.h"
#include "mocks/TestSupport.h"

using Bluewatch::BLE::BLEDeviceRoster;
using Bluewatch::BLE::BLETimeoutSweeper;
using Bluewatch::BLE::Device;
using Bluewatch::BLE::Mocks::makeDevice;

// Default window matches the watcher default of 30 seconds.
TEST(BLETimeoutSweeper, DefaultHeartbeat) {
    BLEDeviceRoster roster;
    BLETimeoutSweeper sweeper(roster);

    EXPECT_EQ(sweeper.heartbeatTimeout(), 30);
    EXPECT_DOUBLE_EQ(sweeper.threshold(100.0), 70.0);
}

// A device older than the window is evicted; one inside it stays.
TEST(BLETimeoutSweeper, EvictsPastHeartbeat) {
    BLEDeviceRoster roster;
    BLETimeoutSweeper sweeper(roster, 30);
    roster.upsert(makeDevice("stale", "", 100.0));
    roster.upsert(makeDevice("fresh", "", 120.0));

    std::vector<Device> evicted = sweeper.sweep(131.0);

    ASSERT_EQ(evicted.size(), 1u);
    EXPECT_EQ(evicted[0].id, "stale");
    EXPECT_EQ(roster.size(), 1u);
}

// Exactly at the window boundary the device is still present.
TEST(BLETimeoutSweeper, BoundaryIsNotExpired) {
    BLEDeviceRoster roster;
    BLETimeoutSweeper sweeper(roster, 30);
    roster.upsert(makeDevice("edge", "", 100.0));

    EXPECT_TRUE(sweeper.sweep(130.0).empty());
    EXPECT_EQ(roster.size(), 1u);
}

// Shrinking the window only matters from the next sweep on.
TEST(BLETimeoutSweeper, HeartbeatChangeAppliesToNextSweep) {
    BLEDeviceRoster roster;
    BLETimeoutSweeper sweeper(roster, 30);
    roster.upsert(makeDevice("d", "", 100.0));

    EXPECT_TRUE(sweeper.sweep(110.0).empty());

    ASSERT_TRUE(sweeper.setHeartbeatTimeout(5));
    EXPECT_EQ(roster.size(), 1u) << "changing the window must not evict by itself";

    EXPECT_EQ(sweeper.sweep(110.0).size(), 1u);
}

// Negative windows are refused at runtime and at construction.
TEST(BLETimeoutSweeper, RejectsNegativeHeartbeat) {
    BLEDeviceRoster roster;
    BLETimeoutSweeper sweeper(roster, 30);

    EXPECT_FALSE(sweeper.setHeartbeatTimeout(-1));
    EXPECT_EQ(sweeper.heartbeatTimeout(), 30);

    EXPECT_THROW(BLETimeoutSweeper(roster, -5), std::invalid_argument);
}

// A zero window evicts anything not stamped with the current time.
TEST(BLETimeoutSweeper, ZeroHeartbeat) {
    BLEDeviceRoster roster;
    BLETimeoutSweeper sweeper(roster, 0);
    roster.upsert(makeDevice("now", "", 50.0));
    roster.upsert(makeDevice("before", "", 49.5));

    std::vector<Device> evicted = sweeper.sweep(50.0);
    ASSERT_EQ(evicted.size(), 1u);
    EXPECT_EQ(evicted[0].id, "before");
}

// sweepAndSnapshot never returns a device it would evict.
TEST(BLETimeoutSweeper, SweepAndSnapshot) {
    BLEDeviceRoster roster;
    BLETimeoutSweeper sweeper(roster, 10);
    roster.upsert(makeDevice("a", "", 0.0));
    roster.upsert(makeDevice("b", "", 95.0));

    std::vector<Device> evicted;
    std::vector<Device> remaining = sweeper.sweepAndSnapshot(100.0, evicted);

    ASSERT_EQ(evicted.size(), 1u);
    EXPECT_EQ(evicted[0].id, "a");
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0].id, "b");
}
