/**
 * @file BLETypes.h
 * @brief BLE advertisement watcher types, constants, and common structures
 *
 * This file defines the core types used throughout the watcher implementation.
 * It includes timing defaults, addressing helpers, the raw advertisement event,
 * resolver metadata, the roster's device snapshot, and the callback signatures
 * shared by all watcher components.
 */
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <cstdint>
#include <cstdio>

namespace Bluewatch { namespace BLE {

//=============================================================================
// Timing Defaults
//=============================================================================

namespace Timing {
    static constexpr int HEARTBEAT_TIMEOUT = 30;          // Seconds of silence before a device times out
    static constexpr double RESOLVE_TIMEOUT = 10.0;       // Seconds to wait for a device lookup
    static constexpr double SWEEP_INTERVAL = 1.0;         // Seconds between periodic sweeps
    static constexpr uint32_t TASK_PERIOD_MS = 10;        // Maintenance task loop period
}

//=============================================================================
// Limits
//=============================================================================

namespace Limits {
    static constexpr uint64_t ADDRESS_MASK = 0xFFFFFFFFFFFFULL;   // 48-bit address space
}

//=============================================================================
// Enumerations
//=============================================================================

/**
 * @brief Scan mode requested from the advertisement source
 */
enum class ScanMode : uint8_t {
    PASSIVE,
    ACTIVE               // Request scan responses (carries names on most peripherals)
};

/**
 * @brief Watcher state machine states
 */
enum class WatcherState : uint8_t {
    STOPPED,
    STARTING,            // Scan requested, STARTED_LISTENING not yet delivered
    LISTENING
};

/**
 * @brief Outcome of a device metadata lookup
 */
enum class ResolveStatus : uint8_t {
    SUCCESS,
    NOT_FOUND,           // Device vanished before it could be queried
    ERROR,               // Platform API failure
    TIMEOUT              // Lookup did not complete in time
};

/**
 * @brief Classification of a roster upsert
 *
 * NAME_CHANGED implies the entry was also updated.
 */
enum class ChangeKind : uint8_t {
    NEW,
    UPDATED,
    NAME_CHANGED,
    UNCHANGED
};

/**
 * @brief Notification kinds delivered to subscribers
 */
enum class EventType : uint8_t {
    STARTED_LISTENING,
    STOPPED_LISTENING,
    DEVICE_DISCOVERED,
    NEW_DEVICE_DISCOVERED,
    DEVICE_NAME_CHANGED,
    DEVICE_TIMEOUT
};

//=============================================================================
// Data Structures
//=============================================================================

/**
 * @brief BLE address (6 bytes)
 */
struct BLEAddress {
    uint8_t addr[6] = {0};

    /**
     * @brief Build from the 48-bit numeric form used by advertisement events
     * addr[0] receives the most significant byte
     */
    static BLEAddress fromUInt64(uint64_t value) {
        BLEAddress result;
        for (int i = 0; i < 6; i++) {
            result.addr[i] = static_cast<uint8_t>((value >> (8 * (5 - i))) & 0xFF);
        }
        return result;
    }

    /**
     * @brief Convert to colon-separated hex string (XX:XX:XX:XX:XX:XX)
     * addr[0] is MSB (first displayed), addr[5] is LSB (last displayed)
     */
    std::string toString() const {
        char buf[18];
        snprintf(buf, sizeof(buf), "%02X:%02X:%02X:%02X:%02X:%02X",
                 addr[0], addr[1], addr[2], addr[3], addr[4], addr[5]);
        return std::string(buf);
    }
};

/**
 * @brief Raw advertisement reception as reported by the radio
 *
 * timestamp shares the watcher clock's timebase (seconds).
 */
struct AdvertisementEvent {
    uint64_t address = 0;
    double timestamp = 0.0;
    int16_t rssi = 0;                   // dBm
};

/**
 * @brief Device metadata returned by a resolver lookup
 */
struct DeviceInfo {
    std::string id;                     // Stable identifier; derived from address when empty
    uint64_t address = 0;
    std::string name;                   // Empty when the device has no name
    bool connected = false;
    bool pairable = false;
    bool paired = false;
};

/**
 * @brief Point-in-time snapshot of a visible device
 */
struct Device {
    std::string id;
    uint64_t address = 0;
    std::string name;
    double last_seen = 0.0;
    int16_t rssi = 0;
    bool connected = false;
    bool pairable = false;
    bool paired = false;

    // Empty string stands for "no name"
    bool hasName() const { return !name.empty(); }

    bool operator==(const Device& other) const {
        return id == other.id &&
               address == other.address &&
               name == other.name &&
               last_seen == other.last_seen &&
               rssi == other.rssi &&
               connected == other.connected &&
               pairable == other.pairable &&
               paired == other.paired;
    }

    bool operator!=(const Device& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Notification payload
 *
 * device is default-constructed for STARTED_LISTENING / STOPPED_LISTENING.
 */
struct WatcherEvent {
    EventType type = EventType::DEVICE_DISCOVERED;
    Device device;
};

/**
 * @brief Watcher configuration
 */
struct WatcherConfig {
    ScanMode scan_mode = ScanMode::ACTIVE;

    // Seconds a device may stay silent before it is evicted (runtime-mutable)
    int heartbeat_timeout = Timing::HEARTBEAT_TIMEOUT;

    // Seconds before an outstanding lookup is abandoned
    double resolve_timeout = Timing::RESOLVE_TIMEOUT;

    // Minimum spacing of periodic sweeps run from loop()
    double sweep_interval = Timing::SWEEP_INTERVAL;
};

//=============================================================================
// Callback Type Definitions
//=============================================================================

namespace Callbacks {
    // Advertisement source
    using OnAdvertisement = std::function<void(const AdvertisementEvent& event)>;
    using OnScanStopped = std::function<void()>;

    // Resolver completion (invoked at most once per lookup, on any thread)
    using OnResolved = std::function<void(ResolveStatus status, const DeviceInfo& info)>;

    // Watcher notifications
    using OnWatcherEvent = std::function<void(const WatcherEvent& event)>;

    // Time source in seconds
    using Clock = std::function<double()>;
}

//=============================================================================
// Utility Functions
//=============================================================================

/**
 * @brief Roster key for a resolved device
 */
inline std::string deviceIdFor(const DeviceInfo& info) {
    if (!info.id.empty()) {
        return info.id;
    }
    return BLEAddress::fromUInt64(info.address & Limits::ADDRESS_MASK).toString();
}

/**
 * @brief Convert WatcherState to string for logging
 */
inline const char* stateToString(WatcherState state) {
    switch (state) {
        case WatcherState::STOPPED:   return "STOPPED";
        case WatcherState::STARTING:  return "STARTING";
        case WatcherState::LISTENING: return "LISTENING";
        default:                      return "UNKNOWN";
    }
}

/**
 * @brief Convert ResolveStatus to string for logging
 */
inline const char* resolveStatusToString(ResolveStatus status) {
    switch (status) {
        case ResolveStatus::SUCCESS:   return "SUCCESS";
        case ResolveStatus::NOT_FOUND: return "NOT_FOUND";
        case ResolveStatus::ERROR:     return "ERROR";
        case ResolveStatus::TIMEOUT:   return "TIMEOUT";
        default:                       return "UNKNOWN";
    }
}

/**
 * @brief Convert ChangeKind to string for logging
 */
inline const char* changeKindToString(ChangeKind kind) {
    switch (kind) {
        case ChangeKind::NEW:          return "NEW";
        case ChangeKind::UPDATED:      return "UPDATED";
        case ChangeKind::NAME_CHANGED: return "NAME_CHANGED";
        case ChangeKind::UNCHANGED:    return "UNCHANGED";
        default:                       return "UNKNOWN";
    }
}

/**
 * @brief Convert EventType to string for logging
 */
inline const char* eventTypeToString(EventType type) {
    switch (type) {
        case EventType::STARTED_LISTENING:     return "STARTED_LISTENING";
        case EventType::STOPPED_LISTENING:     return "STOPPED_LISTENING";
        case EventType::DEVICE_DISCOVERED:     return "DEVICE_DISCOVERED";
        case EventType::NEW_DEVICE_DISCOVERED: return "NEW_DEVICE_DISCOVERED";
        case EventType::DEVICE_NAME_CHANGED:   return "DEVICE_NAME_CHANGED";
        case EventType::DEVICE_TIMEOUT:        return "DEVICE_TIMEOUT";
        default:                               return "UNKNOWN";
    }
}

}} // namespace Bluewatch::BLE
