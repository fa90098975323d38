/*
 * Copyright (c) 2025-present
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// dt_core/device_management/DeviceRegistry.hpp
#pragma once

#include "common_types/DeviceTypes.hpp"                 // for Entity, SwitchPort
#include "dt_core/classification/EntityClassifier.hpp" // for IEntityClassifier
#include "dt_core/device_management/Device.hpp"         // for DevicePtr
#include "event_system/EventBus.hpp"                    // for EventType
#include <cstdint>                                      // for uint64_t, uint32_t, uint16_t
#include <memory>                                       // for shared_ptr
#include <optional>                                     // for optional
#include <set>                                          // for set
#include <shared_mutex>                                 // for shared_mutex
#include <stdexcept>                                    // for logic_error
#include <string>                                       // for string
#include <unordered_map>                                // for unordered_map
#include <vector>                                       // for vector

class AttachmentPointTracker;
class StorageSynchronizer;
struct DeviceEventPayload;

/**
 * @brief The device index no longer matches the device set (dangling entry, or two devices
 * claiming the same key).
 */
class DeviceConsistencyError : public std::logic_error
{
  public:
    using std::logic_error::logic_error;
};

/**
 * @brief Resolves entities to devices and owns the device set.
 *
 * @details
 * The primary index maps (class-set signature, entity projected on the indexed key fields) to a
 * device key. Secondary indices map MAC, MAC+VLAN and IPv4 to the devices that own a matching
 * entity.
 *
 * Locking:
 *   - m_indexMutex guards the device map and every index; lookups take it shared,
 *     check-then-create and index mutation take it exclusively.
 *   - Device::m_mutex guards a device's entities and attachment points.
 *   - A thread holding a device lock may take m_indexMutex, never the other way round.
 *
 * Events and storage writes are issued after every lock is released.
 */
class DeviceRegistry
{
  public:
    DeviceRegistry(std::shared_ptr<dtClassifier::IEntityClassifier> classifier,
                   std::shared_ptr<AttachmentPointTracker> tracker,
                   std::shared_ptr<EventBus> eventBus = nullptr,
                   std::shared_ptr<StorageSynchronizer> storageSync = nullptr);

    /**
     * @brief Merge @p entity into its device, creating the device when none matches.
     *
     * The same DevicePtr is returned for every merge into one device.
     *
     * @throws DeviceConsistencyError if the index references a missing device.
     */
    DevicePtr learnDeviceByEntity(const Entity& entity);

    /** @brief Lookup only; null when no device matches. */
    DevicePtr findDeviceByEntity(const Entity& entity) const;

    /**
     * @brief Lookup by identity fields.
     *
     * @throws std::invalid_argument if a key field of the active classifier is not supplied.
     */
    DevicePtr findDevice(uint64_t macAddress,
                         std::optional<uint16_t> vlan,
                         std::optional<uint32_t> ipv4Address,
                         std::optional<uint64_t> switchDpid,
                         std::optional<uint32_t> switchPort) const;

    std::vector<DevicePtr> findDevicesByMac(uint64_t macAddress) const;

    /** @brief An absent @p vlan selects devices seen untagged. */
    std::vector<DevicePtr> findDevicesByMacAndVlan(uint64_t macAddress,
                                                   std::optional<uint16_t> vlan) const;

    std::vector<DevicePtr> findDevicesByIpv4(uint32_t ipv4Address) const;

    DevicePtr getDevice(uint64_t deviceKey) const;
    std::vector<DevicePtr> getAllDevices() const;
    size_t getDeviceCount() const;

    /**
     * @brief Swap the classifier.
     *
     * Existing devices keep their classes. When the key fields change the primary index is
     * rebuilt under the new fields.
     *
     * @throws DeviceConsistencyError if two existing devices would share a key under the new
     *         fields; the previous classifier stays active.
     * @throws std::invalid_argument on a null classifier or empty key fields.
     */
    void setEntityClassifier(std::shared_ptr<dtClassifier::IEntityClassifier> classifier);
    std::shared_ptr<dtClassifier::IEntityClassifier> getEntityClassifier() const;

    /**
     * @brief Rebuild the device set from storage.
     *
     * @return number of devices loaded.
     * @throws StorageException on read or decode failures.
     * @throws DeviceConsistencyError if two stored devices claim the same key.
     */
    size_t loadFromStorage();

    /**
     * @brief Remove devices whose last entity is older than @p timeoutMs at @p nowMs.
     *
     * Removed devices are deleted from storage and announced with DeviceRemoved.
     */
    std::vector<DevicePtr> removeExpiredDevices(int64_t nowMs, int64_t timeoutMs);

    /** @return number of old attachment points dropped over all devices. */
    size_t expireOldAttachmentPoints(int64_t nowMs, int64_t maxAgeMs);

    /** @brief Clear the blocked flag of an old attachment point once externally confirmed. */
    bool unblockAttachmentPoint(uint64_t deviceKey, const SwitchPort& switchPort);

    /** @brief Drop every device from memory. Storage is left untouched. */
    void clearAllDeviceStateFromMemory();

  private:
    struct DeviceIndexEntry
    {
        DevicePtr device;
        std::string classSignature;
        std::vector<Entity> entities; // identity copies used for re-indexing
    };

    static std::string makePrimaryKey(const Entity& entity,
                                      const EntityFieldSet& keyFields,
                                      const std::string& classSignature);
    static uint64_t makeMacVlanKey(uint64_t macAddress, std::optional<uint16_t> vlan);

    DevicePtr lookupNoLock(const Entity& entity, const std::string& classSignature) const;
    DevicePtr createDeviceNoLock(const Entity& entity,
                                 const dtClassifier::EntityClassSet& classes,
                                 const std::string& classSignature,
                                 AttachmentPointState attachmentPoints);
    void addIndexEntriesNoLock(DeviceIndexEntry& entry, const Entity& entity);
    void eraseDeviceNoLock(uint64_t deviceKey);
    std::vector<DevicePtr> collectNoLock(const std::set<uint64_t>& deviceKeys) const;

    void emitDeviceEvent(EventType type, const DeviceEventPayload& payload) const;

    std::shared_ptr<dtClassifier::IEntityClassifier> m_classifier; // std::atomic_load/store
    std::shared_ptr<AttachmentPointTracker> m_tracker;
    std::shared_ptr<EventBus> m_eventBus;
    std::shared_ptr<StorageSynchronizer> m_storageSync;

    mutable std::shared_mutex m_indexMutex;
    EntityFieldSet m_indexedKeyFields;
    uint64_t m_nextDeviceKey = 1;
    std::unordered_map<uint64_t, DeviceIndexEntry> m_devices;
    std::unordered_map<std::string, uint64_t> m_primaryIndex;
    std::unordered_map<uint64_t, std::set<uint64_t>> m_macIndex;
    std::unordered_map<uint64_t, std::set<uint64_t>> m_macVlanIndex;
    std::unordered_map<uint32_t, std::set<uint64_t>> m_ipv4Index;
};
