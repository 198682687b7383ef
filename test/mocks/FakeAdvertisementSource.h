#pragma once

#include "BLEPlatform.h"

#include <atomic>
#include <functional>
#include <mutex>

namespace Bluewatch { namespace BLE { namespace Mocks {

/**
 * @brief In-memory advertisement source.
 *
 * Tests push advertisements with emit() as the radio would; they are delivered
 * synchronously on the calling thread to whatever handler the watcher has
 * registered.
 */
class FakeAdvertisementSource : public IAdvertisementSource {
public:
    bool startScan(ScanMode mode) override {
        start_calls++;
        last_mode = mode;
        if (on_start_scan) {
            // Radio activity racing the scan request
            on_start_scan();
        }
        if (refuse_start.load()) {
            return false;
        }
        scanning = true;
        return true;
    }

    void stopScan() override {
        stop_calls++;
        scanning = false;
    }

    bool isScanning() const override { return scanning.load(); }

    void setOnAdvertisement(Callbacks::OnAdvertisement callback) override {
        std::lock_guard<std::mutex> lock(_mutex);
        _callback = std::move(callback);
    }

    void setOnScanStopped(Callbacks::OnScanStopped callback) override {
        std::lock_guard<std::mutex> lock(_mutex);
        _scan_stopped = std::move(callback);
    }

    bool hasHandler() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return static_cast<bool>(_callback);
    }

    bool hasScanStoppedHandler() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return static_cast<bool>(_scan_stopped);
    }

    // Ends the scan as the platform would; returns false when nobody is registered
    bool dropScan() {
        Callbacks::OnScanStopped callback;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            callback = _scan_stopped;
        }
        scanning = false;
        if (!callback) {
            return false;
        }
        callback();
        return true;
    }

    // Returns false when nobody is registered
    bool emit(uint64_t address, double timestamp, int16_t rssi = -60) {
        Callbacks::OnAdvertisement callback;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            callback = _callback;
        }
        if (!callback) {
            return false;
        }

        AdvertisementEvent event;
        event.address = address;
        event.timestamp = timestamp;
        event.rssi = rssi;
        callback(event);
        return true;
    }

    std::atomic<bool> refuse_start{false};
    std::atomic<bool> scanning{false};
    std::atomic<int> start_calls{0};
    std::atomic<int> stop_calls{0};
    std::atomic<ScanMode> last_mode{ScanMode::PASSIVE};

    // Invoked inside startScan() before it returns; set before start()
    std::function<void()> on_start_scan;

private:
    Callbacks::OnAdvertisement _callback;
    Callbacks::OnScanStopped _scan_stopped;
    mutable std::mutex _mutex;
};

}}} // namespace Bluewatch::BLE::Mocks
