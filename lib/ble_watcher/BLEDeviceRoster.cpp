/**
 * @file BLEDeviceRoster.cpp
 * @brief Thread-safe roster of currently visible BLE devices
 */

#include "BLEDeviceRoster.h"
#include "Log.h"

namespace Bluewatch { namespace BLE {

//=============================================================================
// Mutation
//=============================================================================

ChangeKind BLEDeviceRoster::upsert(const Device& device) {
    std::lock_guard<std::mutex> lock(_mutex);

    auto it = _devices.find(device.id);
    if (it == _devices.end()) {
        _devices.emplace(device.id, device);
        return ChangeKind::NEW;
    }

    ChangeKind kind = classify(&it->second, device);
    it->second = device;
    return kind;
}

std::vector<Device> BLEDeviceRoster::evictOlderThan(double threshold) {
    std::lock_guard<std::mutex> lock(_mutex);
    return evictLocked(threshold);
}

std::vector<Device> BLEDeviceRoster::evictAndSnapshot(double threshold, std::vector<Device>& evicted) {
    std::lock_guard<std::mutex> lock(_mutex);

    evicted = evictLocked(threshold);

    std::vector<Device> result;
    result.reserve(_devices.size());
    for (const auto& kv : _devices) {
        result.push_back(kv.second);
    }
    return result;
}

void BLEDeviceRoster::clear() {
    std::lock_guard<std::mutex> lock(_mutex);
    _devices.clear();
}

//=============================================================================
// Queries
//=============================================================================

std::vector<Device> BLEDeviceRoster::snapshot() const {
    std::lock_guard<std::mutex> lock(_mutex);

    std::vector<Device> result;
    result.reserve(_devices.size());
    for (const auto& kv : _devices) {
        result.push_back(kv.second);
    }
    return result;
}

bool BLEDeviceRoster::find(const std::string& id, Device& device) const {
    std::lock_guard<std::mutex> lock(_mutex);

    auto it = _devices.find(id);
    if (it == _devices.end()) {
        return false;
    }
    device = it->second;
    return true;
}

bool BLEDeviceRoster::isEmpty() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _devices.empty();
}

size_t BLEDeviceRoster::size() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _devices.size();
}

size_t BLEDeviceRoster::countNotOlderThan(double threshold) const {
    std::lock_guard<std::mutex> lock(_mutex);

    size_t count = 0;
    for (const auto& kv : _devices) {
        if (kv.second.last_seen >= threshold) {
            count++;
        }
    }
    return count;
}

ChangeKind BLEDeviceRoster::classify(const Device* prior, const Device& next) {
    if (!prior) {
        return ChangeKind::NEW;
    }

    // A name appearing or disappearing is not a rename
    if (prior->hasName() && next.hasName() && prior->name != next.name) {
        return ChangeKind::NAME_CHANGED;
    }

    if (*prior == next) {
        return ChangeKind::UNCHANGED;
    }

    return ChangeKind::UPDATED;
}

//=============================================================================
// Private Methods
//=============================================================================

std::vector<Device> BLEDeviceRoster::evictLocked(double threshold) {
    std::vector<Device> evicted;

    for (auto it = _devices.begin(); it != _devices.end(); ) {
        if (it->second.last_seen < threshold) {
            char buf[96];
            snprintf(buf, sizeof(buf), "BLEDeviceRoster: Removed stale device %s (last seen %.3f)",
                     it->first.c_str(), it->second.last_seen);
            TRACE(buf);

            evicted.push_back(it->second);
            it = _devices.erase(it);
        } else {
            ++it;
        }
    }

    return evicted;
}

}} // namespace Bluewatch::BLE
