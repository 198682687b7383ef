#pragma once

#include "BLEPlatform.h"

#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace Bluewatch { namespace BLE { namespace Mocks {

/**
 * @brief Resolver answering synchronously from a table.
 *
 * Unknown addresses complete with NOT_FOUND. Thread-safe.
 */
class StaticDeviceResolver : public IDeviceResolver {
public:
    void resolveDevice(uint64_t address, Callbacks::OnResolved callback) override {
        DeviceInfo info;
        bool known = false;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            auto it = _devices.find(address);
            if (it != _devices.end()) {
                info = it->second;
                known = true;
            }
        }
        callback(known ? ResolveStatus::SUCCESS : ResolveStatus::NOT_FOUND, info);
    }

    void setDevice(uint64_t address, const std::string& name,
                   bool connected = false, bool pairable = true, bool paired = false) {
        DeviceInfo info;
        info.address = address;
        info.name = name;
        info.connected = connected;
        info.pairable = pairable;
        info.paired = paired;

        std::lock_guard<std::mutex> lock(_mutex);
        _devices[address] = info;
    }

    void setDevice(const DeviceInfo& info) {
        std::lock_guard<std::mutex> lock(_mutex);
        _devices[info.address] = info;
    }

    void removeDevice(uint64_t address) {
        std::lock_guard<std::mutex> lock(_mutex);
        _devices.erase(address);
    }

private:
    std::map<uint64_t, DeviceInfo> _devices;
    std::mutex _mutex;
};

/**
 * @brief Resolver that parks every lookup until the test completes it.
 *
 * Completions run on the thread calling complete*(), outside the internal lock.
 */
class DeferredDeviceResolver : public IDeviceResolver {
public:
    void resolveDevice(uint64_t address, Callbacks::OnResolved callback) override {
        std::lock_guard<std::mutex> lock(_mutex);
        _pending.emplace_back(address, std::move(callback));
    }

    size_t pendingCount() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _pending.size();
    }

    // Completes the oldest parked lookup; false if none
    bool completeNext(ResolveStatus status, const DeviceInfo& info) {
        Callbacks::OnResolved callback;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (_pending.empty()) {
                return false;
            }
            callback = std::move(_pending.front().second);
            _pending.pop_front();
        }
        callback(status, info);
        return true;
    }

    // Completes the newest parked lookup; false if none
    bool completeLast(ResolveStatus status, const DeviceInfo& info) {
        Callbacks::OnResolved callback;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (_pending.empty()) {
                return false;
            }
            callback = std::move(_pending.back().second);
            _pending.pop_back();
        }
        callback(status, info);
        return true;
    }

    // Fails every parked lookup
    void failAll() {
        while (completeNext(ResolveStatus::ERROR, DeviceInfo())) {
        }
    }

private:
    std::deque<std::pair<uint64_t, Callbacks::OnResolved>> _pending;
    mutable std::mutex _mutex;
};

inline DeviceInfo makeInfo(uint64_t address, const std::string& name) {
    DeviceInfo info;
    info.address = address;
    info.name = name;
    info.pairable = true;
    return info;
}

}}} // namespace Bluewatch::BLE::Mocks
