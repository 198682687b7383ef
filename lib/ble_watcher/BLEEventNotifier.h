/**
 * @file BLEEventNotifier.h
 * @brief Fan-out of watcher events to subscribers
 *
 * Subscribers are plain callbacks identified by a handle. Delivery happens on
 * the calling thread with no lock held, so a subscriber may subscribe,
 * unsubscribe, or call back into the watcher. A subscriber that throws does
 * not affect the others.
 */
#pragma once

#include "BLETypes.h"

#include <cstdint>
#include <mutex>
#include <utility>
#include <vector>

namespace Bluewatch { namespace BLE {

class BLEEventNotifier {
public:
    using Handle = uint32_t;

    BLEEventNotifier() = default;

    BLEEventNotifier(const BLEEventNotifier&) = delete;
    BLEEventNotifier& operator=(const BLEEventNotifier&) = delete;

    //=========================================================================
    // Subscription
    //=========================================================================

    /**
     * @brief Add a subscriber
     * @return Non-zero handle, or 0 if callback is empty
     */
    Handle subscribe(Callbacks::OnWatcherEvent callback);

    /**
     * @brief Remove a subscriber
     * @return true if the handle was registered
     */
    bool unsubscribe(Handle handle);

    size_t subscriberCount() const;

    //=========================================================================
    // Delivery
    //=========================================================================

    /**
     * @brief Deliver an event to every current subscriber
     */
    void publish(const WatcherEvent& event);

    void notifyStartedListening();
    void notifyStoppedListening();
    void notifyDiscovered(const Device& device);
    void notifyNewDevice(const Device& device);
    void notifyNameChanged(const Device& device);
    void notifyTimeout(const Device& device);

    /**
     * @brief Deliver the events for one committed upsert
     *
     * Order: DEVICE_DISCOVERED, then DEVICE_NAME_CHANGED if renamed,
     * then NEW_DEVICE_DISCOVERED if new.
     */
    void notifyChange(const Device& device, ChangeKind kind);

    /**
     * @brief Deliver DEVICE_TIMEOUT for each device in order
     */
    void notifyTimeouts(const std::vector<Device>& evicted);

private:
    void publish(EventType type, const Device& device);

    std::vector<std::pair<Handle, Callbacks::OnWatcherEvent>> _subscribers;
    Handle _next_handle = 1;
    mutable std::mutex _mutex;
};

}} // namespace Bluewatch::BLE
