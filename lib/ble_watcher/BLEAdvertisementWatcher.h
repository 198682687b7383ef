/**
 * @file BLEAdvertisementWatcher.h
 * @brief Advertisement-to-roster reconciliation engine
 *
 * Turns a concurrent stream of raw advertisements into a deduplicated roster of
 * visible devices. Each advertisement triggers a metadata lookup; successful
 * lookups are merged into the roster and classified as new, updated, or
 * renamed. Devices silent for longer than the heartbeat window are evicted
 * lazily on every read and advertisement, and periodically from loop().
 *
 * Usage:
 *   BLEAdvertisementWatcher watcher(source, resolver);
 *   watcher.subscribe([](const WatcherEvent& event) { ... });
 *   watcher.start();
 *   watcher.start_task();
 *   ...
 *   for (const Device& device : watcher.discoveredDevices()) { ... }
 *
 * Resolver completions capture the watcher; a resolver must not complete a
 * lookup after the watcher has been destroyed.
 */
#pragma once

#include "BLETypes.h"
#include "BLEPlatform.h"
#include "BLEDeviceRoster.h"
#include "BLETimeoutSweeper.h"
#include "BLEEventNotifier.h"

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace Bluewatch { namespace BLE {

class BLEAdvertisementWatcher {
public:
    /**
     * @brief Construct a watcher
     *
     * @param source Advertisement source (required)
     * @param resolver Device metadata resolver (required)
     * @param config Tunables
     * @param clock Time source in seconds; defaults to RNS::Utilities::OS::time()
     * @throws std::invalid_argument on a null collaborator or an out-of-range setting
     */
    BLEAdvertisementWatcher(IAdvertisementSource::Ptr source,
                            IDeviceResolver::Ptr resolver,
                            const WatcherConfig& config = WatcherConfig(),
                            Callbacks::Clock clock = nullptr);

    virtual ~BLEAdvertisementWatcher();

    BLEAdvertisementWatcher(const BLEAdvertisementWatcher&) = delete;
    BLEAdvertisementWatcher& operator=(const BLEAdvertisementWatcher&) = delete;

    //=========================================================================
    // Lifecycle
    //=========================================================================

    /**
     * @brief Begin listening for advertisements
     *
     * No-op returning true if already started. STARTED_LISTENING is delivered
     * before any advertisement is accepted; advertisements arriving while the
     * scan is still starting are dropped.
     *
     * @return false if the source refused to start scanning or the scan ended
     *         before it was established
     */
    bool start();

    /**
     * @brief Stop listening and clear the roster
     *
     * No-op if already stopped, including after the platform ended the scan.
     * In-flight lookups are not cancelled; their results are discarded when
     * they complete.
     */
    void stop();

    bool isListening() const;
    WatcherState state() const;

    /**
     * @brief Periodic processing, call from the application loop
     *
     * Runs a timeout sweep once every sweep_interval seconds.
     */
    void loop();

    //=========================================================================
    // Roster Access
    //=========================================================================

    /**
     * @brief Currently visible devices ordered by id
     *
     * Evicts stale entries first and delivers DEVICE_TIMEOUT for each one.
     */
    std::vector<Device> discoveredDevices();

    //=========================================================================
    // Configuration
    //=========================================================================

    /**
     * @brief Change the heartbeat window (applies from the next sweep)
     * @return false if seconds is negative
     */
    bool setHeartbeatTimeout(int seconds);
    int heartbeatTimeout() const;

    const WatcherConfig& config() const { return _config; }

    //=========================================================================
    // Notifications
    //=========================================================================

    BLEEventNotifier::Handle subscribe(Callbacks::OnWatcherEvent callback);
    bool unsubscribe(BLEEventNotifier::Handle handle);

    //=========================================================================
    // Event Input
    //=========================================================================

    /**
     * @brief Process one advertisement
     *
     * Registered with the source while listening. Safe to call concurrently.
     * Never throws on lookup failure.
     */
    void onAdvertisement(const AdvertisementEvent& event);

    //=========================================================================
    // Synchronization
    //=========================================================================

    /**
     * @brief Block until no lookup is outstanding or being committed
     *
     * @param timeout_seconds Wall-clock limit
     * @return true if idle, false on timeout
     */
    bool waitForIdle(double timeout_seconds);

    size_t inFlightCount() const;

    //=========================================================================
    // Statistics
    //=========================================================================

    std::map<std::string, float> get_stats() const;

    //=========================================================================
    // Task Support
    //=========================================================================

    /**
     * @brief Run loop() on a dedicated thread
     *
     * @param period_ms Sleep between iterations
     * @return true if the task is running
     */
    bool start_task(uint32_t period_ms = Timing::TASK_PERIOD_MS);

    /**
     * @brief Stop and join the task thread
     */
    void stop_task();

    bool is_task_running() const { return _task_running.load(); }

private:
    static const WatcherConfig& validated(const WatcherConfig& config);

    double now() const;

    void onScanStopped();

    void onResolved(uint64_t ticket, uint64_t session, const AdvertisementEvent& event,
                    ResolveStatus status, const DeviceInfo& info);
    void commitResolution(uint64_t session, const AdvertisementEvent& event,
                          ResolveStatus status, const DeviceInfo& info);

    void sweepTimeouts(double now);
    void publishTimeouts(const std::vector<Device>& evicted);

    // In-flight bookkeeping
    uint64_t beginResolution(uint64_t address, double started_at);
    bool claimResolution(uint64_t ticket);
    void abandonResolution(uint64_t ticket);
    void finishResolution();
    void expireResolutions(double now);

    /**
     * @brief Marks a claimed resolution finished when it leaves scope
     */
    class CompletionScope {
    public:
        explicit CompletionScope(BLEAdvertisementWatcher& watcher) : _watcher(watcher) {}
        ~CompletionScope() { _watcher.finishResolution(); }
        CompletionScope(const CompletionScope&) = delete;
        CompletionScope& operator=(const CompletionScope&) = delete;
    private:
        BLEAdvertisementWatcher& _watcher;
    };

    //=========================================================================
    // Collaborators
    //=========================================================================

    IAdvertisementSource::Ptr _source;
    IDeviceResolver::Ptr _resolver;
    WatcherConfig _config;
    Callbacks::Clock _clock;

    //=========================================================================
    // Components
    //=========================================================================

    BLEDeviceRoster _roster;
    BLETimeoutSweeper _sweeper;
    BLEEventNotifier _notifier;

    //=========================================================================
    // State
    //=========================================================================

    // Lock order: _control_mutex -> _state_mutex -> roster
    // _control_mutex is held across STARTED_LISTENING so a subscriber may call stop()
    std::recursive_mutex _control_mutex;
    mutable std::mutex _state_mutex;
    WatcherState _state = WatcherState::STOPPED;
    uint64_t _session = 0;      // Bumped on every stop; lookups only commit into their own session
    bool _scan_lost_while_starting = false;

    std::atomic<double> _last_sweep;

    struct PendingResolution {
        uint64_t address = 0;
        double started_at = 0.0;
    };

    mutable std::mutex _inflight_mutex;
    std::condition_variable _idle_cv;
    std::map<uint64_t, PendingResolution> _in_flight;
    uint64_t _next_ticket = 1;
    size_t _completing = 0;

    //=========================================================================
    // Statistics
    //=========================================================================

    std::atomic<uint32_t> _advertisements{0};
    std::atomic<uint32_t> _resolved{0};
    std::atomic<uint32_t> _resolve_failures{0};
    std::atomic<uint32_t> _resolve_timeouts{0};
    std::atomic<uint32_t> _discarded{0};
    std::atomic<uint32_t> _timeouts{0};

    //=========================================================================
    // Task Support
    //=========================================================================

    void watcher_task(uint32_t period_ms);

    std::mutex _task_mutex;
    std::thread _task;
    std::atomic<bool> _task_running{false};
    std::mutex _task_wake_mutex;
    std::condition_variable _task_wake;
};

}} // namespace Bluewatch::BLE
