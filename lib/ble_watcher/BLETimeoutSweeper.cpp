/**
 * @file BLETimeoutSweeper.cpp
 * @brief Heartbeat-based eviction of silent devices
 */

#include "BLETimeoutSweeper.h"
#include "Log.h"

#include <stdexcept>

namespace Bluewatch { namespace BLE {

BLETimeoutSweeper::BLETimeoutSweeper(BLEDeviceRoster& roster, int heartbeat_timeout)
    : _roster(roster), _heartbeat_timeout(heartbeat_timeout) {
    if (heartbeat_timeout < 0) {
        throw std::invalid_argument("BLETimeoutSweeper: heartbeat timeout must not be negative");
    }
}

std::vector<Device> BLETimeoutSweeper::sweep(double now) {
    std::vector<Device> evicted = _roster.evictOlderThan(threshold(now));

    if (!evicted.empty()) {
        TRACE("BLETimeoutSweeper: Evicted " + std::to_string(evicted.size()) + " device(s)");
    }
    return evicted;
}

std::vector<Device> BLETimeoutSweeper::sweepAndSnapshot(double now, std::vector<Device>& evicted) {
    std::vector<Device> remaining = _roster.evictAndSnapshot(threshold(now), evicted);

    if (!evicted.empty()) {
        TRACE("BLETimeoutSweeper: Evicted " + std::to_string(evicted.size()) + " device(s) before read");
    }
    return remaining;
}

bool BLETimeoutSweeper::setHeartbeatTimeout(int seconds) {
    if (seconds < 0) {
        WARNING("BLETimeoutSweeper: Ignoring negative heartbeat timeout " + std::to_string(seconds));
        return false;
    }

    _heartbeat_timeout.store(seconds);
    DEBUG("BLETimeoutSweeper: Heartbeat timeout set to " + std::to_string(seconds) + "s");
    return true;
}

}} // namespace Bluewatch::BLE
