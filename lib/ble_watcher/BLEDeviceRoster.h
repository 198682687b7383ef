/**
 * @file BLEDeviceRoster.h
 * @brief Thread-safe roster of currently visible BLE devices
 *
 * Holds exactly the latest snapshot per device id with:
 * - Change classification on every upsert (new / updated / name changed)
 * - Age-based eviction against a caller-supplied threshold
 * - Point-in-time copies for readers
 *
 * Every operation takes the same exclusive lock. Nothing is held across calls.
 */
#pragma once

#include "BLETypes.h"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace Bluewatch { namespace BLE {

class BLEDeviceRoster {
public:
    BLEDeviceRoster() = default;

    BLEDeviceRoster(const BLEDeviceRoster&) = delete;
    BLEDeviceRoster& operator=(const BLEDeviceRoster&) = delete;

    //=========================================================================
    // Mutation
    //=========================================================================

    /**
     * @brief Insert or replace the entry for device.id
     *
     * @param device Latest snapshot
     * @return Classification of the change against the prior entry
     */
    ChangeKind upsert(const Device& device);

    /**
     * @brief Remove every entry with last_seen strictly before threshold
     *
     * @param threshold Cutoff timestamp (seconds)
     * @return Evicted devices ordered by id
     */
    std::vector<Device> evictOlderThan(double threshold);

    /**
     * @brief Evict, then copy the remaining entries, under one lock acquisition
     *
     * @param threshold Cutoff timestamp (seconds)
     * @param evicted Receives the evicted devices ordered by id
     * @return Remaining devices ordered by id
     */
    std::vector<Device> evictAndSnapshot(double threshold, std::vector<Device>& evicted);

    /**
     * @brief Remove all entries
     */
    void clear();

    //=========================================================================
    // Queries
    //=========================================================================

    /**
     * @brief Copy of all entries ordered by id
     */
    std::vector<Device> snapshot() const;

    /**
     * @brief Look up one entry
     *
     * @param id Device id
     * @param device Receives a copy when found
     * @return true if the id is present
     */
    bool find(const std::string& id, Device& device) const;

    bool isEmpty() const;
    size_t size() const;

    /**
     * @brief Number of entries a sweep at threshold would keep
     *
     * @param threshold Cutoff timestamp (seconds)
     */
    size_t countNotOlderThan(double threshold) const;

    /**
     * @brief Classify a change without touching any roster
     *
     * @param prior Current entry, or nullptr if none
     * @param next Incoming snapshot
     */
    static ChangeKind classify(const Device* prior, const Device& next);

private:
    std::vector<Device> evictLocked(double threshold);

    std::map<std::string, Device> _devices;
    mutable std::mutex _mutex;
};

}} // namespace Bluewatch::BLE
