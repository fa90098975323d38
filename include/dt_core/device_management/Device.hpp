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

// dt_core/device_management/Device.hpp
#pragma once

#include "common_types/DeviceTypes.hpp"                 // for Entity, AttachmentPointState
#include "dt_core/classification/EntityClassifier.hpp" // for EntityClassSet
#include <cstdint>                                      // for uint64_t, uint32_t, uint16_t
#include <memory>                                       // for shared_ptr
#include <mutex>                                        // for mutex
#include <nlohmann/json.hpp>                            // for json
#include <string>                                       // for string
#include <vector>                                       // for vector

/**
 * @brief A host resolved from one or more entities.
 *
 * Devices are owned by the DeviceRegistry, which mutates them in place under the per-device
 * lock. All public accessors lock and return copies, so a Device can be read from any thread.
 */
class Device
{
  public:
    Device(uint64_t deviceKey, dtClassifier::EntityClassSet entityClasses);

    uint64_t getDeviceKey() const
    {
        return m_deviceKey;
    }

    /** @brief Classes assigned at creation, ordered by name. Never changes afterwards. */
    const dtClassifier::EntityClassSet& getEntityClasses() const
    {
        return m_entityClasses;
    }

    std::vector<std::string> getEntityClassNames() const;

    /** @brief Entities in arrival order, distinct by identity tuple. */
    std::vector<Entity> getEntities() const;

    /** @brief MAC of the first entity. */
    uint64_t getMacAddress() const;
    std::string getMacAddressString() const;

    /** @brief Tagged VLANs seen, sorted. Untagged traffic is not listed. */
    std::vector<uint16_t> getVlanIds() const;

    /** @brief Whether any entity was observed untagged. */
    bool hasUntaggedEntity() const;

    /** @brief Known IPv4 addresses (host byte order), sorted. */
    std::vector<uint32_t> getIPv4Addresses() const;

    /** @brief Current attachment points as (switch, port). */
    std::vector<SwitchPort> getAttachmentPoints() const;

    /** @brief Current and old attachment points with their timestamps and block state. */
    AttachmentPointState getAttachmentPointDetails() const;

    std::vector<SwitchPort> getOldAttachmentPoints() const;

    /** @brief Latest entity timestamp, in milliseconds. */
    int64_t getLastSeen() const;

    /** @brief Whether the registry dropped this device. */
    bool isRemoved() const;

    /** @brief Row stored in the "device" table. */
    nlohmann::json toJson() const;

    /**
     * @brief Rebuild a device from a stored row.
     *
     * @throws nlohmann::json::exception or std::invalid_argument on a malformed row.
     */
    static std::shared_ptr<Device> fromJson(const nlohmann::json& row);

  private:
    friend class DeviceRegistry;

    struct MergeResult
    {
        bool newEntity = false;
        bool newIpv4 = false;
        bool newVlan = false;
    };

    MergeResult mergeEntityNoLock(const Entity& entity);
    nlohmann::json toJsonNoLock() const;

    mutable std::mutex m_mutex;

    const uint64_t m_deviceKey;
    const dtClassifier::EntityClassSet m_entityClasses;

    std::vector<Entity> m_entities;
    AttachmentPointState m_attachmentPoints;
    int64_t m_lastSeenMs = 0;

    // Set under m_mutex once the registry dropped the device
    bool m_removed = false;
};

using DevicePtr = std::shared_ptr<Device>;
