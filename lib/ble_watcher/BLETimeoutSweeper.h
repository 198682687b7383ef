/**
 * @file BLETimeoutSweeper.h
 * @brief Heartbeat-based eviction of silent devices
 *
 * Evicts roster entries whose last advertisement is older than the heartbeat
 * window. The window can be changed at runtime; a change applies from the
 * next sweep and never retroactively.
 */
#pragma once

#include "BLETypes.h"
#include "BLEDeviceRoster.h"

#include <atomic>
#include <vector>

namespace Bluewatch { namespace BLE {

class BLETimeoutSweeper {
public:
    /**
     * @param roster Roster to sweep (must outlive the sweeper)
     * @param heartbeat_timeout Initial window in seconds
     */
    explicit BLETimeoutSweeper(BLEDeviceRoster& roster,
                               int heartbeat_timeout = Timing::HEARTBEAT_TIMEOUT);

    /**
     * @brief Evict devices older than now - heartbeat
     * @return Evicted devices ordered by id
     */
    std::vector<Device> sweep(double now);

    /**
     * @brief Evict, then snapshot the survivors atomically
     *
     * @param now Current time (seconds)
     * @param evicted Receives the evicted devices
     * @return Remaining devices ordered by id
     */
    std::vector<Device> sweepAndSnapshot(double now, std::vector<Device>& evicted);

    /**
     * @brief Change the heartbeat window
     * @return false (value unchanged) if seconds is negative
     */
    bool setHeartbeatTimeout(int seconds);
    int heartbeatTimeout() const { return _heartbeat_timeout.load(); }

    /**
     * @brief Eviction cutoff for the given time
     */
    double threshold(double now) const { return now - static_cast<double>(_heartbeat_timeout.load()); }

private:
    BLEDeviceRoster& _roster;
    std::atomic<int> _heartbeat_timeout;
};

}} // namespace Bluewatch::BLE
