#pragma once

#include "BLETypes.h"

#include <atomic>
#include <mutex>
#include <vector>

namespace Bluewatch { namespace BLE { namespace Mocks {

/**
 * @brief Hand-driven clock for deterministic timeout tests.
 */
class ManualClock {
public:
    explicit ManualClock(double start = 1000.0) : _now(start) {}

    double now() const { return _now.load(); }
    void set(double value) { _now.store(value); }
    void advance(double seconds) { _now.store(_now.load() + seconds); }

    Callbacks::Clock clock() {
        return [this]() { return now(); };
    }

private:
    std::atomic<double> _now;
};

/**
 * @brief Subscriber that records every delivered event.
 */
class EventRecorder {
public:
    Callbacks::OnWatcherEvent callback() {
        return [this](const WatcherEvent& event) {
            std::lock_guard<std::mutex> lock(_mutex);
            _events.push_back(event);
        };
    }

    std::vector<WatcherEvent> events() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _events;
    }

    std::vector<EventType> types() const {
        std::lock_guard<std::mutex> lock(_mutex);
        std::vector<EventType> result;
        for (const auto& event : _events) {
            result.push_back(event.type);
        }
        return result;
    }

    size_t count(EventType type) const {
        std::lock_guard<std::mutex> lock(_mutex);
        size_t n = 0;
        for (const auto& event : _events) {
            if (event.type == type) {
                n++;
            }
        }
        return n;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(_mutex);
        _events.clear();
    }

private:
    std::vector<WatcherEvent> _events;
    mutable std::mutex _mutex;
};

inline Device makeDevice(const std::string& id, const std::string& name, double last_seen,
                         int16_t rssi = -60) {
    Device device;
    device.id = id;
    device.name = name;
    device.last_seen = last_seen;
    device.rssi = rssi;
    return device;
}

}}} // namespace Bluewatch::BLE::Mocks
