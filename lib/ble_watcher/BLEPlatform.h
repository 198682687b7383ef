/**
 * @file BLEPlatform.h
 * @brief Platform collaborator interfaces for the advertisement watcher
 *
 * Platform-specific code (BlueZ, NimBLE, WinRT, a replay file) implements these
 * interfaces to feed the watcher. The watcher never talks to the radio directly.
 *
 * The abstraction covers:
 * - Scan lifecycle and raw advertisement delivery
 * - Asynchronous device metadata lookup
 */
#pragma once

#include "BLETypes.h"

#include <memory>

namespace Bluewatch { namespace BLE {

/**
 * @brief Source of raw advertisement receptions
 *
 * Implementations may deliver advertisements concurrently from any thread.
 */
class IAdvertisementSource {
public:
    using Ptr = std::shared_ptr<IAdvertisementSource>;

    virtual ~IAdvertisementSource() = default;

    //=========================================================================
    // Scanning
    //=========================================================================

    /**
     * @brief Start scanning for advertisements
     *
     * @param mode Passive or active scan
     * @return true if scan started successfully
     */
    virtual bool startScan(ScanMode mode) = 0;

    /**
     * @brief Stop scanning
     */
    virtual void stopScan() = 0;

    /**
     * @brief Check if currently scanning
     */
    virtual bool isScanning() const = 0;

    //=========================================================================
    // Callback Registration
    //=========================================================================

    /**
     * @brief Register the advertisement handler
     *
     * Passing nullptr unregisters the current handler. After the call returns
     * the previous handler receives no further advertisements.
     */
    virtual void setOnAdvertisement(Callbacks::OnAdvertisement callback) = 0;

    /**
     * @brief Register the handler for a scan ending on its own
     *
     * Fired when the platform stops scanning without stopScan() having been
     * called (adapter removed, radio turned off, stack reset). Implementations
     * must not hold their own locks while invoking it. Passing nullptr
     * unregisters the current handler.
     */
    virtual void setOnScanStopped(Callbacks::OnScanStopped callback) = 0;
};

/**
 * @brief Asynchronous device metadata lookup
 */
class IDeviceResolver {
public:
    using Ptr = std::shared_ptr<IDeviceResolver>;

    virtual ~IDeviceResolver() = default;

    /**
     * @brief Look up current metadata for a device
     *
     * The callback is invoked at most once, either synchronously from within
     * this call or later from any thread. Implementations may throw; the
     * watcher treats a throw as a failed lookup.
     *
     * @param address 48-bit device address
     * @param callback Completion handler
     */
    virtual void resolveDevice(uint64_t address, Callbacks::OnResolved callback) = 0;
};

}} // namespace Bluewatch::BLE
