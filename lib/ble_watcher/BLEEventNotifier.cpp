/**
 * @file BLEEventNotifier.cpp
 * @brief Fan-out of watcher events to subscribers
 */

#include "BLEEventNotifier.h"
#include "Log.h"

#include <exception>

namespace Bluewatch { namespace BLE {

//=============================================================================
// Subscription
//=============================================================================

BLEEventNotifier::Handle BLEEventNotifier::subscribe(Callbacks::OnWatcherEvent callback) {
    if (!callback) {
        WARNING("BLEEventNotifier: Ignoring empty subscriber");
        return 0;
    }

    std::lock_guard<std::mutex> lock(_mutex);

    Handle handle = _next_handle++;
    if (_next_handle == 0) {
        _next_handle = 1;
    }
    _subscribers.emplace_back(handle, std::move(callback));
    return handle;
}

bool BLEEventNotifier::unsubscribe(Handle handle) {
    std::lock_guard<std::mutex> lock(_mutex);

    for (auto it = _subscribers.begin(); it != _subscribers.end(); ++it) {
        if (it->first == handle) {
            _subscribers.erase(it);
            return true;
        }
    }
    return false;
}

size_t BLEEventNotifier::subscriberCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _subscribers.size();
}

//=============================================================================
// Delivery
//=============================================================================

void BLEEventNotifier::publish(const WatcherEvent& event) {
    std::vector<std::pair<Handle, Callbacks::OnWatcherEvent>> subscribers;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        subscribers = _subscribers;
    }

    for (const auto& subscriber : subscribers) {
        try {
            subscriber.second(event);
        } catch (const std::exception& e) {
            WARNING("BLEEventNotifier: Subscriber " + std::to_string(subscriber.first) +
                    " threw on " + eventTypeToString(event.type) + ": " + std::string(e.what()));
        } catch (...) {
            WARNING("BLEEventNotifier: Subscriber " + std::to_string(subscriber.first) +
                    " threw unknown exception on " + eventTypeToString(event.type));
        }
    }
}

void BLEEventNotifier::notifyStartedListening() {
    publish(EventType::STARTED_LISTENING, Device());
}

void BLEEventNotifier::notifyStoppedListening() {
    publish(EventType::STOPPED_LISTENING, Device());
}

void BLEEventNotifier::notifyDiscovered(const Device& device) {
    publish(EventType::DEVICE_DISCOVERED, device);
}

void BLEEventNotifier::notifyNewDevice(const Device& device) {
    publish(EventType::NEW_DEVICE_DISCOVERED, device);
}

void BLEEventNotifier::notifyNameChanged(const Device& device) {
    publish(EventType::DEVICE_NAME_CHANGED, device);
}

void BLEEventNotifier::notifyTimeout(const Device& device) {
    publish(EventType::DEVICE_TIMEOUT, device);
}

void BLEEventNotifier::notifyChange(const Device& device, ChangeKind kind) {
    notifyDiscovered(device);

    if (kind == ChangeKind::NAME_CHANGED) {
        notifyNameChanged(device);
    }
    if (kind == ChangeKind::NEW) {
        notifyNewDevice(device);
    }
}

void BLEEventNotifier::notifyTimeouts(const std::vector<Device>& evicted) {
    for (const Device& device : evicted) {
        notifyTimeout(device);
    }
}

//=============================================================================
// Private Methods
//=============================================================================

void BLEEventNotifier::publish(EventType type, const Device& device) {
    WatcherEvent event;
    event.type = type;
    event.device = device;
    publish(event);
}

}} // namespace Bluewatch::BLE
