/**
 * @file BLEAdvertisementWatcher.cpp
 * @brief Advertisement-to-roster reconciliation engine
 */

#include "BLEAdvertisementWatcher.h"
#include "Log.h"
#include "Utilities/OS.h"

#include <chrono>
#include <exception>
#include <stdexcept>
#include <system_error>

namespace Bluewatch { namespace BLE {

BLEAdvertisementWatcher::BLEAdvertisementWatcher(IAdvertisementSource::Ptr source,
                                                 IDeviceResolver::Ptr resolver,
                                                 const WatcherConfig& config,
                                                 Callbacks::Clock clock)
    : _source(std::move(source)),
      _resolver(std::move(resolver)),
      _config(validated(config)),
      _clock(std::move(clock)),
      _sweeper(_roster, _config.heartbeat_timeout),
      _last_sweep(0.0) {
    if (!_source) {
        throw std::invalid_argument("BLEAdvertisementWatcher: advertisement source is required");
    }
    if (!_resolver) {
        throw std::invalid_argument("BLEAdvertisementWatcher: device resolver is required");
    }
    if (!_clock) {
        _clock = []() { return RNS::Utilities::OS::time(); };
    }
}

BLEAdvertisementWatcher::~BLEAdvertisementWatcher() {
    stop_task();
    stop();

    // stop() leaves the handlers alone when the platform already ended the scan
    _source->setOnAdvertisement(nullptr);
    _source->setOnScanStopped(nullptr);

    if (!waitForIdle(_config.resolve_timeout)) {
        WARNING("BLEAdvertisementWatcher: Destroyed with " + std::to_string(inFlightCount()) +
                " lookup(s) still outstanding");
    }
}

const WatcherConfig& BLEAdvertisementWatcher::validated(const WatcherConfig& config) {
    if (config.heartbeat_timeout < 0) {
        throw std::invalid_argument("BLEAdvertisementWatcher: heartbeat_timeout must not be negative");
    }
    if (!(config.resolve_timeout > 0.0)) {
        throw std::invalid_argument("BLEAdvertisementWatcher: resolve_timeout must be positive");
    }
    if (!(config.sweep_interval > 0.0)) {
        throw std::invalid_argument("BLEAdvertisementWatcher: sweep_interval must be positive");
    }
    return config;
}

//=============================================================================
// Lifecycle
//=============================================================================

bool BLEAdvertisementWatcher::start() {
    std::lock_guard<std::recursive_mutex> control(_control_mutex);

    {
        std::lock_guard<std::mutex> lock(_state_mutex);
        if (_state != WatcherState::STOPPED) {
            DEBUG("BLEAdvertisementWatcher: start() ignored, state " + std::string(stateToString(_state)));
            return true;
        }
        _state = WatcherState::STARTING;
        _scan_lost_while_starting = false;
    }

    _source->setOnAdvertisement([this](const AdvertisementEvent& event) {
        onAdvertisement(event);
    });
    _source->setOnScanStopped([this]() {
        onScanStopped();
    });

    bool scanning = false;
    try {
        scanning = _source->startScan(_config.scan_mode);
    } catch (const std::exception& e) {
        ERROR("BLEAdvertisementWatcher: Exception starting scan: " + std::string(e.what()));
    } catch (...) {
        ERROR("BLEAdvertisementWatcher: Unknown exception starting scan");
    }

    if (scanning) {
        std::lock_guard<std::mutex> lock(_state_mutex);
        if (_state != WatcherState::STARTING) {
            WARNING("BLEAdvertisementWatcher: Scan ended while starting");
            scanning = false;
        }
    }

    if (!scanning) {
        _source->setOnAdvertisement(nullptr);
        _source->setOnScanStopped(nullptr);
        {
            std::lock_guard<std::mutex> lock(_state_mutex);
            _state = WatcherState::STOPPED;
            _session++;
            _roster.clear();
            _scan_lost_while_starting = false;
        }
        ERROR("BLEAdvertisementWatcher: Failed to start scanning");
        return false;
    }

    _last_sweep.store(now());

    INFO("BLEAdvertisementWatcher: Started listening, scan mode: " +
         std::string(_config.scan_mode == ScanMode::ACTIVE ? "active" : "passive") +
         ", heartbeat: " + std::to_string(heartbeatTimeout()) + "s");

    // Advertisements are still dropped here, so nothing can precede this event
    _notifier.notifyStartedListening();

    bool lost = false;
    {
        std::lock_guard<std::mutex> lock(_state_mutex);
        if (_state == WatcherState::STARTING) {
            _state = WatcherState::LISTENING;
        } else {
            // Stopped by a subscriber (already reported) or by the platform (not yet)
            lost = _scan_lost_while_starting;
        }
        _scan_lost_while_starting = false;
    }

    if (lost) {
        INFO("BLEAdvertisementWatcher: Scan stopped by platform");
        _notifier.notifyStoppedListening();
    }
    return true;
}

void BLEAdvertisementWatcher::stop() {
    std::unique_lock<std::recursive_mutex> control(_control_mutex);

    {
        std::lock_guard<std::mutex> lock(_state_mutex);
        if (_state == WatcherState::STOPPED) {
            return;
        }
        _state = WatcherState::STOPPED;
        _session++;
        _roster.clear();
    }

    try {
        _source->stopScan();
    } catch (const std::exception& e) {
        WARNING("BLEAdvertisementWatcher: Exception stopping scan: " + std::string(e.what()));
    } catch (...) {
        WARNING("BLEAdvertisementWatcher: Unknown exception stopping scan");
    }
    _source->setOnAdvertisement(nullptr);
    _source->setOnScanStopped(nullptr);

    INFO("BLEAdvertisementWatcher: Stopped listening");

    control.unlock();
    _notifier.notifyStoppedListening();
}

void BLEAdvertisementWatcher::onScanStopped() {
    WatcherState prior;
    {
        std::lock_guard<std::mutex> lock(_state_mutex);
        if (_state == WatcherState::STOPPED) {
            return;
        }
        prior = _state;
        _state = WatcherState::STOPPED;
        _session++;
        _roster.clear();

        if (prior == WatcherState::STARTING) {
            // Reported by start() once STARTED_LISTENING is out, or folded into its failure
            _scan_lost_while_starting = true;
            return;
        }
    }

    INFO("BLEAdvertisementWatcher: Scan stopped by platform");
    _notifier.notifyStoppedListening();
}

bool BLEAdvertisementWatcher::isListening() const {
    return state() == WatcherState::LISTENING;
}

WatcherState BLEAdvertisementWatcher::state() const {
    std::lock_guard<std::mutex> lock(_state_mutex);
    return _state;
}

void BLEAdvertisementWatcher::loop() {
    double current = now();

    if (current - _last_sweep.load() >= _config.sweep_interval) {
        _last_sweep.store(current);
        sweepTimeouts(current);
    }
}

//=============================================================================
// Roster Access
//=============================================================================

std::vector<Device> BLEAdvertisementWatcher::discoveredDevices() {
    double current = now();

    std::vector<Device> evicted;
    std::vector<Device> devices = _sweeper.sweepAndSnapshot(current, evicted);

    expireResolutions(current);
    publishTimeouts(evicted);

    return devices;
}

//=============================================================================
// Configuration
//=============================================================================

bool BLEAdvertisementWatcher::setHeartbeatTimeout(int seconds) {
    return _sweeper.setHeartbeatTimeout(seconds);
}

int BLEAdvertisementWatcher::heartbeatTimeout() const {
    return _sweeper.heartbeatTimeout();
}

//=============================================================================
// Notifications
//=============================================================================

BLEEventNotifier::Handle BLEAdvertisementWatcher::subscribe(Callbacks::OnWatcherEvent callback) {
    return _notifier.subscribe(std::move(callback));
}

bool BLEAdvertisementWatcher::unsubscribe(BLEEventNotifier::Handle handle) {
    return _notifier.unsubscribe(handle);
}

//=============================================================================
// Event Input
//=============================================================================

void BLEAdvertisementWatcher::onAdvertisement(const AdvertisementEvent& event) {
    uint64_t session;
    {
        std::lock_guard<std::mutex> lock(_state_mutex);
        if (_state != WatcherState::LISTENING) {
            TRACE("BLEAdvertisementWatcher: Not listening, dropping advertisement");
            return;
        }
        session = _session;
    }

    _advertisements++;

    {
        char buf[96];
        snprintf(buf, sizeof(buf), "BLEAdvertisementWatcher: Advertisement from %s rssi=%d",
                 BLEAddress::fromUInt64(event.address).toString().c_str(), event.rssi);
        TRACE(buf);
    }

    double current = now();
    sweepTimeouts(current);

    uint64_t ticket = beginResolution(event.address, current);

    try {
        _resolver->resolveDevice(event.address,
            [this, ticket, session, event](ResolveStatus status, const DeviceInfo& info) {
                onResolved(ticket, session, event, status, info);
            });
    } catch (const std::exception& e) {
        WARNING("BLEAdvertisementWatcher: Lookup of " + BLEAddress::fromUInt64(event.address).toString() +
                " threw: " + std::string(e.what()));
        abandonResolution(ticket);
    } catch (...) {
        WARNING("BLEAdvertisementWatcher: Lookup of " + BLEAddress::fromUInt64(event.address).toString() +
                " threw unknown exception");
        abandonResolution(ticket);
    }
}

//=============================================================================
// Resolution Handling
//=============================================================================

void BLEAdvertisementWatcher::onResolved(uint64_t ticket, uint64_t session, const AdvertisementEvent& event,
                                         ResolveStatus status, const DeviceInfo& info) {
    if (!claimResolution(ticket)) {
        DEBUG("BLEAdvertisementWatcher: Ignoring late completion for " +
              BLEAddress::fromUInt64(event.address).toString());
        return;
    }

    CompletionScope scope(*this);

    try {
        commitResolution(session, event, status, info);
    } catch (const std::exception& e) {
        WARNING("BLEAdvertisementWatcher: Failed to process lookup result for " +
                BLEAddress::fromUInt64(event.address).toString() + ": " + std::string(e.what()));
        _resolve_failures++;
    } catch (...) {
        WARNING("BLEAdvertisementWatcher: Failed to process lookup result for " +
                BLEAddress::fromUInt64(event.address).toString() + ": unknown exception");
        _resolve_failures++;
    }
}

void BLEAdvertisementWatcher::commitResolution(uint64_t session, const AdvertisementEvent& event,
                                               ResolveStatus status, const DeviceInfo& info) {
    if (status != ResolveStatus::SUCCESS) {
        _resolve_failures++;
        DEBUG("BLEAdvertisementWatcher: Lookup of " + BLEAddress::fromUInt64(event.address).toString() +
              " failed: " + resolveStatusToString(status));
        return;
    }

    Device device;
    device.id = deviceIdFor(info);
    device.address = event.address;
    device.name = info.name;
    device.last_seen = event.timestamp;
    device.rssi = event.rssi;
    device.connected = info.connected;
    device.pairable = info.pairable;
    device.paired = info.paired;

    ChangeKind kind;
    Device prior;
    bool had_prior = false;
    {
        std::lock_guard<std::mutex> lock(_state_mutex);
        if (_state != WatcherState::LISTENING || _session != session) {
            _discarded++;
            DEBUG("BLEAdvertisementWatcher: Discarding result for " + device.id + ", not listening");
            return;
        }
        had_prior = _roster.find(device.id, prior);
        kind = _roster.upsert(device);
    }

    _resolved++;

    switch (kind) {
        case ChangeKind::NEW:
            INFO("BLEAdvertisementWatcher: New device " + device.id +
                 (device.hasName() ? " (" + device.name + ")" : std::string()));
            break;
        case ChangeKind::NAME_CHANGED:
            INFO("BLEAdvertisementWatcher: Device " + device.id + " renamed " +
                 (had_prior ? prior.name : std::string()) + " -> " + device.name);
            break;
        default:
            DEBUG("BLEAdvertisementWatcher: Device " + device.id + " " + changeKindToString(kind));
            break;
    }

    _notifier.notifyChange(device, kind);
}

//=============================================================================
// Timeouts
//=============================================================================

void BLEAdvertisementWatcher::sweepTimeouts(double now) {
    std::vector<Device> evicted = _sweeper.sweep(now);
    expireResolutions(now);
    publishTimeouts(evicted);
}

void BLEAdvertisementWatcher::publishTimeouts(const std::vector<Device>& evicted) {
    if (evicted.empty()) {
        return;
    }

    _timeouts += static_cast<uint32_t>(evicted.size());
    for (const Device& device : evicted) {
        INFO("BLEAdvertisementWatcher: Device " + device.id + " timed out");
    }
    _notifier.notifyTimeouts(evicted);
}

//=============================================================================
// In-flight Bookkeeping
//=============================================================================

uint64_t BLEAdvertisementWatcher::beginResolution(uint64_t address, double started_at) {
    std::lock_guard<std::mutex> lock(_inflight_mutex);

    uint64_t ticket = _next_ticket++;
    PendingResolution pending;
    pending.address = address;
    pending.started_at = started_at;
    _in_flight[ticket] = pending;
    return ticket;
}

bool BLEAdvertisementWatcher::claimResolution(uint64_t ticket) {
    std::lock_guard<std::mutex> lock(_inflight_mutex);

    auto it = _in_flight.find(ticket);
    if (it == _in_flight.end()) {
        return false;
    }
    _in_flight.erase(it);
    _completing++;
    return true;
}

void BLEAdvertisementWatcher::abandonResolution(uint64_t ticket) {
    // The callback may already have run before the throw
    if (claimResolution(ticket)) {
        CompletionScope scope(*this);
        _resolve_failures++;
    }
}

void BLEAdvertisementWatcher::finishResolution() {
    std::lock_guard<std::mutex> lock(_inflight_mutex);

    if (_completing > 0) {
        _completing--;
    }
    if (_in_flight.empty() && _completing == 0) {
        _idle_cv.notify_all();
    }
}

void BLEAdvertisementWatcher::expireResolutions(double now) {
    std::lock_guard<std::mutex> lock(_inflight_mutex);

    size_t expired = 0;
    for (auto it = _in_flight.begin(); it != _in_flight.end(); ) {
        double age = now - it->second.started_at;
        if (age > _config.resolve_timeout) {
            char buf[96];
            snprintf(buf, sizeof(buf), "BLEAdvertisementWatcher: Lookup of %s timed out after %.1fs",
                     BLEAddress::fromUInt64(it->second.address).toString().c_str(), age);
            DEBUG(buf);

            it = _in_flight.erase(it);
            expired++;
        } else {
            ++it;
        }
    }

    if (expired > 0) {
        _resolve_timeouts += static_cast<uint32_t>(expired);
        if (_in_flight.empty() && _completing == 0) {
            _idle_cv.notify_all();
        }
    }
}

//=============================================================================
// Synchronization
//=============================================================================

bool BLEAdvertisementWatcher::waitForIdle(double timeout_seconds) {
    std::unique_lock<std::mutex> lock(_inflight_mutex);

    auto deadline = std::chrono::steady_clock::now() +
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(timeout_seconds > 0.0 ? timeout_seconds : 0.0));

    return _idle_cv.wait_until(lock, deadline, [this]() {
        return _in_flight.empty() && _completing == 0;
    });
}

size_t BLEAdvertisementWatcher::inFlightCount() const {
    std::lock_guard<std::mutex> lock(_inflight_mutex);
    return _in_flight.size();
}

//=============================================================================
// Statistics
//=============================================================================

std::map<std::string, float> BLEAdvertisementWatcher::get_stats() const {
    std::map<std::string, float> stats;
    // Entries past the heartbeat window are awaiting the next sweep, not visible
    stats["devices"] = static_cast<float>(_roster.countNotOlderThan(_sweeper.threshold(now())));
    stats["in_flight"] = static_cast<float>(inFlightCount());
    stats["advertisements"] = static_cast<float>(_advertisements.load());
    stats["resolved"] = static_cast<float>(_resolved.load());
    stats["resolve_failures"] = static_cast<float>(_resolve_failures.load());
    stats["resolve_timeouts"] = static_cast<float>(_resolve_timeouts.load());
    stats["discarded"] = static_cast<float>(_discarded.load());
    stats["timeouts"] = static_cast<float>(_timeouts.load());
    return stats;
}

//=============================================================================
// Task Support
//=============================================================================

void BLEAdvertisementWatcher::watcher_task(uint32_t period_ms) {
    DEBUG("BLEAdvertisementWatcher: Task started");

    while (_task_running.load()) {
        try {
            loop();
        } catch (const std::exception& e) {
            ERROR("BLEAdvertisementWatcher: Exception in task loop: " + std::string(e.what()));
        } catch (...) {
            ERROR("BLEAdvertisementWatcher: Unknown exception in task loop");
        }

        // Yield until the next period or a stop request
        std::unique_lock<std::mutex> lock(_task_wake_mutex);
        _task_wake.wait_for(lock, std::chrono::milliseconds(period_ms), [this]() {
            return !_task_running.load();
        });
    }

    DEBUG("BLEAdvertisementWatcher: Task stopped");
}

bool BLEAdvertisementWatcher::start_task(uint32_t period_ms) {
    std::lock_guard<std::mutex> lock(_task_mutex);

    if (_task.joinable()) {
        WARNING("BLEAdvertisementWatcher: Task already running");
        return true;
    }

    _task_running.store(true);
    try {
        _task = std::thread(&BLEAdvertisementWatcher::watcher_task, this, period_ms);
    } catch (const std::system_error& e) {
        _task_running.store(false);
        ERROR("BLEAdvertisementWatcher: Failed to create task: " + std::string(e.what()));
        return false;
    }

    DEBUG("BLEAdvertisementWatcher: Task created with period " + std::to_string(period_ms) + "ms");
    return true;
}

void BLEAdvertisementWatcher::stop_task() {
    std::lock_guard<std::mutex> lock(_task_mutex);

    if (!_task.joinable()) {
        return;
    }

    {
        std::lock_guard<std::mutex> wake(_task_wake_mutex);
        _task_running.store(false);
    }
    _task_wake.notify_all();

    if (_task.get_id() == std::this_thread::get_id()) {
        // Stopped from a subscriber running on the task itself
        _task.detach();
    } else {
        _task.join();
    }
}

double BLEAdvertisementWatcher::now() const {
    return _clock();
}

}} // namespace Bluewatch::BLE
