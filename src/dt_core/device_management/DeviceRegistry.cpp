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

#include "dt_core/device_management/DeviceRegistry.hpp"
#include "dt_core/data_management/StorageSource.hpp"             // for StorageException
#include "dt_core/data_management/StorageSynchronizer.hpp"       // for StorageSynchronizer
#include "dt_core/device_management/AttachmentPointTracker.hpp" // for AttachmentPointTracker
#include "event_system/PayloadTypes.hpp"                         // for DeviceEventPayload
#include "utils/Logger.hpp"                                      // for Logger
#include "utils/Utils.hpp"                                       // for macToString
#include <algorithm>                                             // for max
#include <mutex>                                                 // for unique_lock
#include <utility>                                               // for move

using json = nlohmann::json;
using namespace dtClassifier;

namespace
{
// A merge that keeps finding its device concurrently aged out gives up after this many rounds
constexpr int MAX_LEARN_ATTEMPTS = 8;

constexpr uint64_t UNTAGGED_VLAN_KEY = 0xFFFF;
} // namespace

DeviceRegistry::DeviceRegistry(std::shared_ptr<IEntityClassifier> classifier,
                               std::shared_ptr<AttachmentPointTracker> tracker,
                               std::shared_ptr<EventBus> eventBus,
                               std::shared_ptr<StorageSynchronizer> storageSync)
    : m_classifier(classifier ? std::move(classifier)
                              : std::make_shared<DefaultEntityClassifier>()),
      m_tracker(std::move(tracker)),
      m_eventBus(std::move(eventBus)),
      m_storageSync(std::move(storageSync))
{
    if (!m_tracker)
    {
        throw std::invalid_argument("DeviceRegistry requires an attachment point tracker");
    }
    m_indexedKeyFields = m_classifier->getKeyFields();
    if (m_indexedKeyFields.empty())
    {
        throw std::invalid_argument("Entity classifier declares no key fields");
    }
}

DevicePtr
DeviceRegistry::learnDeviceByEntity(const Entity& entity)
{
    auto classifier = std::atomic_load(&m_classifier);
    auto classes = normalizeClassSet(classifier->classifyEntity(entity));
    auto signature = classSetSignature(classes);

    for (int attempt = 0; attempt < MAX_LEARN_ATTEMPTS; ++attempt)
    {
        DevicePtr device;
        {
            std::shared_lock lock(m_indexMutex);
            device = lookupNoLock(entity, signature);
        }

        if (!device)
        {
            // Topology queries stay outside the index lock
            AttachmentPointState initialAps;
            m_tracker->observe(initialAps, entity.switchDpid, entity.switchPort, entity.lastSeenMs);

            std::unique_lock lock(m_indexMutex);
            device = lookupNoLock(entity, signature);
            if (!device)
            {
                device = createDeviceNoLock(entity, classes, signature, std::move(initialAps));
                lock.unlock();

                auto aps = device->getAttachmentPoints();
                SPDLOG_LOGGER_INFO(Logger::instance(),
                                   "New device {} mac {} class [{}]",
                                   device->getDeviceKey(),
                                   utils::macToString(entity.macAddress),
                                   signature);

                DeviceEventPayload payload{device->getDeviceKey(), entity.macAddress};
                if (!aps.empty())
                {
                    payload.currentAttachmentPoint = aps.front();
                }
                payload.ipv4Address = entity.ipv4Address;
                payload.vlan = entity.vlan;
                emitDeviceEvent(EventType::DeviceAdded, payload);

                if (m_storageSync)
                {
                    m_storageSync->onDeviceUpdated(*device, true);
                }
                return device;
            }
        }

        Device::MergeResult merge;
        AttachmentPointUpdate apUpdate;
        {
            std::unique_lock deviceLock(device->m_mutex);
            if (device->m_removed)
            {
                SPDLOG_LOGGER_DEBUG(Logger::instance(),
                                    "Device {} removed during merge, retrying",
                                    device->getDeviceKey());
                continue;
            }

            merge = device->mergeEntityNoLock(entity);
            apUpdate = m_tracker->observe(device->m_attachmentPoints,
                                          entity.switchDpid,
                                          entity.switchPort,
                                          entity.lastSeenMs);

            if (merge.newEntity)
            {
                std::unique_lock indexLock(m_indexMutex);
                auto it = m_devices.find(device->getDeviceKey());
                if (it == m_devices.end())
                {
                    throw DeviceConsistencyError("Device " +
                                                 std::to_string(device->getDeviceKey()) +
                                                 " is live but missing from the device map");
                }
                addIndexEntriesNoLock(it->second, entity);
            }
        }

        const uint64_t key = device->getDeviceKey();
        SPDLOG_LOGGER_TRACE(Logger::instance(),
                            "Device {} seen at {}:{}: {}",
                            key,
                            utils::dpidToString(entity.switchDpid),
                            entity.switchPort,
                            to_string(apUpdate.change));
        if (apUpdate.change == AttachmentPointChange::Moved)
        {
            SPDLOG_LOGGER_INFO(Logger::instance(),
                               "Device {} moved from {}:{} to {}:{}",
                               key,
                               utils::dpidToString(apUpdate.previous->switchDpid),
                               apUpdate.previous->port,
                               utils::dpidToString(entity.switchDpid),
                               entity.switchPort);
            DeviceEventPayload payload{key, entity.macAddress};
            payload.previousAttachmentPoint = apUpdate.previous;
            payload.currentAttachmentPoint = SwitchPort(entity.switchDpid, entity.switchPort);
            emitDeviceEvent(EventType::DeviceMoved, payload);
        }
        if (merge.newIpv4)
        {
            DeviceEventPayload payload{key, entity.macAddress};
            payload.ipv4Address = entity.ipv4Address;
            emitDeviceEvent(EventType::DeviceIpv4Changed, payload);
        }
        if (merge.newVlan)
        {
            DeviceEventPayload payload{key, entity.macAddress};
            payload.vlan = entity.vlan;
            emitDeviceEvent(EventType::DeviceVlanChanged, payload);
        }

        if (m_storageSync)
        {
            m_storageSync->onDeviceUpdated(*device, merge.newEntity || apUpdate.isStructural());
        }
        return device;
    }

    throw DeviceConsistencyError("Could not settle device for mac " +
                                 utils::macToString(entity.macAddress) + " after " +
                                 std::to_string(MAX_LEARN_ATTEMPTS) + " attempts");
}

DevicePtr
DeviceRegistry::findDeviceByEntity(const Entity& entity) const
{
    auto classifier = std::atomic_load(&m_classifier);
    auto classes = normalizeClassSet(classifier->classifyEntity(entity));
    auto signature = classSetSignature(classes);

    std::shared_lock lock(m_indexMutex);
    return lookupNoLock(entity, signature);
}

DevicePtr
DeviceRegistry::findDevice(uint64_t macAddress,
                           std::optional<uint16_t> vlan,
                           std::optional<uint32_t> ipv4Address,
                           std::optional<uint64_t> switchDpid,
                           std::optional<uint32_t> switchPort) const
{
    auto keyFields = std::atomic_load(&m_classifier)->getKeyFields();
    if ((keyFields.count(EntityField::IPV4) && !ipv4Address) ||
        (keyFields.count(EntityField::SWITCH) && !switchDpid) ||
        (keyFields.count(EntityField::PORT) && !switchPort))
    {
        throw std::invalid_argument("findDevice: every key field of the classifier is required");
    }

    Entity query;
    query.macAddress = macAddress;
    query.vlan = vlan;
    query.ipv4Address = ipv4Address;
    query.switchDpid = switchDpid.value_or(0);
    query.switchPort = switchPort.value_or(0);
    return findDeviceByEntity(query);
}

std::vector<DevicePtr>
DeviceRegistry::findDevicesByMac(uint64_t macAddress) const
{
    std::shared_lock lock(m_indexMutex);
    auto it = m_macIndex.find(macAddress);
    if (it == m_macIndex.end())
    {
        return {};
    }
    return collectNoLock(it->second);
}

std::vector<DevicePtr>
DeviceRegistry::findDevicesByMacAndVlan(uint64_t macAddress, std::optional<uint16_t> vlan) const
{
    std::shared_lock lock(m_indexMutex);
    auto it = m_macVlanIndex.find(makeMacVlanKey(macAddress, vlan));
    if (it == m_macVlanIndex.end())
    {
        return {};
    }
    return collectNoLock(it->second);
}

std::vector<DevicePtr>
DeviceRegistry::findDevicesByIpv4(uint32_t ipv4Address) const
{
    std::shared_lock lock(m_indexMutex);
    auto it = m_ipv4Index.find(ipv4Address);
    if (it == m_ipv4Index.end())
    {
        return {};
    }
    return collectNoLock(it->second);
}

DevicePtr
DeviceRegistry::getDevice(uint64_t deviceKey) const
{
    std::shared_lock lock(m_indexMutex);
    auto it = m_devices.find(deviceKey);
    return it == m_devices.end() ? nullptr : it->second.device;
}

std::vector<DevicePtr>
DeviceRegistry::getAllDevices() const
{
    std::shared_lock lock(m_indexMutex);
    std::vector<DevicePtr> devices;
    devices.reserve(m_devices.size());
    for (const auto& [key, entry] : m_devices)
    {
        devices.push_back(entry.device);
    }
    std::sort(devices.begin(), devices.end(), [](const DevicePtr& a, const DevicePtr& b) {
        return a->getDeviceKey() < b->getDeviceKey();
    });
    return devices;
}

size_t
DeviceRegistry::getDeviceCount() const
{
    std::shared_lock lock(m_indexMutex);
    return m_devices.size();
}

void
DeviceRegistry::setEntityClassifier(std::shared_ptr<IEntityClassifier> classifier)
{
    if (!classifier)
    {
        throw std::invalid_argument("Entity classifier must not be null");
    }
    auto keyFields = classifier->getKeyFields();
    if (keyFields.empty())
    {
        throw std::invalid_argument("Entity classifier declares no key fields");
    }

    std::unique_lock lock(m_indexMutex);
    if (keyFields != m_indexedKeyFields)
    {
        std::unordered_map<std::string, uint64_t> rebuilt;
        for (const auto& [deviceKey, entry] : m_devices)
        {
            for (const auto& entity : entry.entities)
            {
                auto key = makePrimaryKey(entity, keyFields, entry.classSignature);
                auto [it, inserted] = rebuilt.emplace(key, deviceKey);
                if (!inserted && it->second != deviceKey)
                {
                    throw DeviceConsistencyError(
                        "Classifier change rejected: devices " + std::to_string(it->second) +
                        " and " + std::to_string(deviceKey) + " collide under the new key fields");
                }
            }
        }
        m_primaryIndex.swap(rebuilt);
        m_indexedKeyFields = keyFields;
        SPDLOG_LOGGER_INFO(Logger::instance(),
                           "Primary device index rebuilt: {} keys for {} devices",
                           m_primaryIndex.size(),
                           m_devices.size());
    }
    std::atomic_store(&m_classifier, std::move(classifier));
}

std::shared_ptr<IEntityClassifier>
DeviceRegistry::getEntityClassifier() const
{
    return std::atomic_load(&m_classifier);
}

size_t
DeviceRegistry::loadFromStorage()
{
    if (!m_storageSync)
    {
        return 0;
    }

    std::vector<DevicePtr> devices;
    for (const auto& row : m_storageSync->loadDevices())
    {
        try
        {
            devices.push_back(Device::fromJson(row));
        }
        catch (const json::exception& e)
        {
            throw StorageException(std::string("Malformed device row: ") + e.what());
        }
        catch (const std::invalid_argument& e)
        {
            throw StorageException(std::string("Malformed device row: ") + e.what());
        }
    }

    std::unique_lock lock(m_indexMutex);
    for (auto& device : devices)
    {
        const uint64_t key = device->getDeviceKey();
        if (m_devices.count(key))
        {
            throw DeviceConsistencyError("Duplicate stored device key " + std::to_string(key));
        }

        DeviceIndexEntry entry;
        entry.device = device;
        entry.classSignature = classSetSignature(device->getEntityClasses());
        auto& inserted = m_devices.emplace(key, std::move(entry)).first->second;
        for (const auto& entity : device->m_entities)
        {
            addIndexEntriesNoLock(inserted, entity);
        }
        m_nextDeviceKey = std::max(m_nextDeviceKey, key + 1);
    }

    SPDLOG_LOGGER_INFO(Logger::instance(), "Loaded {} devices from storage", devices.size());
    return devices.size();
}

std::vector<DevicePtr>
DeviceRegistry::removeExpiredDevices(int64_t nowMs, int64_t timeoutMs)
{
    std::vector<DevicePtr> removed;
    for (auto& device : getAllDevices())
    {
        std::unique_lock deviceLock(device->m_mutex);
        if (device->m_removed || nowMs - device->m_lastSeenMs <= timeoutMs)
        {
            continue;
        }
        device->m_removed = true;
        {
            std::unique_lock indexLock(m_indexMutex);
            eraseDeviceNoLock(device->getDeviceKey());
        }
        removed.push_back(device);
    }

    for (const auto& device : removed)
    {
        SPDLOG_LOGGER_INFO(Logger::instance(),
                           "Device {} ({}) aged out",
                           device->getDeviceKey(),
                           device->getMacAddressString());
        if (m_storageSync)
        {
            m_storageSync->onDeviceRemoved(device->getDeviceKey());
        }
        emitDeviceEvent(EventType::DeviceRemoved,
                        DeviceEventPayload{device->getDeviceKey(), device->getMacAddress()});
    }
    return removed;
}

size_t
DeviceRegistry::expireOldAttachmentPoints(int64_t nowMs, int64_t maxAgeMs)
{
    size_t total = 0;
    for (auto& device : getAllDevices())
    {
        size_t expired = 0;
        {
            std::lock_guard<std::mutex> deviceLock(device->m_mutex);
            if (device->m_removed)
            {
                continue;
            }
            expired = AttachmentPointTracker::expireOld(device->m_attachmentPoints, nowMs, maxAgeMs);
        }
        if (expired > 0 && m_storageSync)
        {
            m_storageSync->onDeviceUpdated(*device, true);
        }
        total += expired;
    }
    return total;
}

bool
DeviceRegistry::unblockAttachmentPoint(uint64_t deviceKey, const SwitchPort& switchPort)
{
    auto device = getDevice(deviceKey);
    if (!device)
    {
        return false;
    }

    bool unblocked = false;
    {
        std::lock_guard<std::mutex> deviceLock(device->m_mutex);
        if (!device->m_removed)
        {
            unblocked = AttachmentPointTracker::unblock(device->m_attachmentPoints, switchPort);
        }
    }
    if (unblocked && m_storageSync)
    {
        m_storageSync->onDeviceUpdated(*device, true);
    }
    return unblocked;
}

void
DeviceRegistry::clearAllDeviceStateFromMemory()
{
    auto devices = getAllDevices();
    for (auto& device : devices)
    {
        std::lock_guard<std::mutex> deviceLock(device->m_mutex);
        device->m_removed = true;
        std::unique_lock indexLock(m_indexMutex);
        eraseDeviceNoLock(device->getDeviceKey());
    }
    SPDLOG_LOGGER_INFO(Logger::instance(), "Cleared {} devices from memory", devices.size());
}

std::string
DeviceRegistry::makePrimaryKey(const Entity& entity,
                               const EntityFieldSet& keyFields,
                               const std::string& classSignature)
{
    std::string key = classSignature;
    for (auto field : keyFields)
    {
        key += '|';
        switch (field)
        {
        case EntityField::MAC:
            key += std::to_string(entity.macAddress);
            break;
        case EntityField::IPV4:
            key += entity.ipv4Address ? std::to_string(*entity.ipv4Address) : "-";
            break;
        case EntityField::VLAN:
            key += entity.vlan ? std::to_string(*entity.vlan) : "untagged";
            break;
        case EntityField::SWITCH:
            key += std::to_string(entity.switchDpid);
            break;
        case EntityField::PORT:
            key += std::to_string(entity.switchPort);
            break;
        }
    }
    return key;
}

uint64_t
DeviceRegistry::makeMacVlanKey(uint64_t macAddress, std::optional<uint16_t> vlan)
{
    return (macAddress << 16) | (vlan ? *vlan : UNTAGGED_VLAN_KEY);
}

DevicePtr
DeviceRegistry::lookupNoLock(const Entity& entity, const std::string& classSignature) const
{
    auto it = m_primaryIndex.find(makePrimaryKey(entity, m_indexedKeyFields, classSignature));
    if (it == m_primaryIndex.end())
    {
        return nullptr;
    }

    auto deviceIt = m_devices.find(it->second);
    if (deviceIt == m_devices.end())
    {
        throw DeviceConsistencyError("Primary index references missing device " +
                                     std::to_string(it->second));
    }
    return deviceIt->second.device;
}

DevicePtr
DeviceRegistry::createDeviceNoLock(const Entity& entity,
                                   const EntityClassSet& classes,
                                   const std::string& classSignature,
                                   AttachmentPointState attachmentPoints)
{
    const uint64_t key = m_nextDeviceKey++;
    auto device = std::make_shared<Device>(key, classes);

    // Not yet published, the device lock is not needed
    device->mergeEntityNoLock(entity);
    device->m_attachmentPoints = std::move(attachmentPoints);

    DeviceIndexEntry entry;
    entry.device = device;
    entry.classSignature = classSignature;
    auto& inserted = m_devices.emplace(key, std::move(entry)).first->second;
    addIndexEntriesNoLock(inserted, entity);
    return device;
}

void
DeviceRegistry::addIndexEntriesNoLock(DeviceIndexEntry& entry, const Entity& entity)
{
    const uint64_t deviceKey = entry.device->getDeviceKey();

    auto primaryKey = makePrimaryKey(entity, m_indexedKeyFields, entry.classSignature);
    auto [it, inserted] = m_primaryIndex.emplace(primaryKey, deviceKey);
    if (!inserted && it->second != deviceKey)
    {
        throw DeviceConsistencyError("Devices " + std::to_string(it->second) + " and " +
                                     std::to_string(deviceKey) + " claim the same key");
    }

    entry.entities.push_back(entity);
    m_macIndex[entity.macAddress].insert(deviceKey);
    m_macVlanIndex[makeMacVlanKey(entity.macAddress, entity.vlan)].insert(deviceKey);
    if (entity.ipv4Address)
    {
        m_ipv4Index[*entity.ipv4Address].insert(deviceKey);
    }
}

void
DeviceRegistry::eraseDeviceNoLock(uint64_t deviceKey)
{
    auto it = m_devices.find(deviceKey);
    if (it == m_devices.end())
    {
        return;
    }

    auto eraseFrom = [deviceKey](auto& index, const auto& key) {
        auto indexIt = index.find(key);
        if (indexIt == index.end())
        {
            return;
        }
        indexIt->second.erase(deviceKey);
        if (indexIt->second.empty())
        {
            index.erase(indexIt);
        }
    };

    for (const auto& entity : it->second.entities)
    {
        auto primaryIt =
            m_primaryIndex.find(makePrimaryKey(entity, m_indexedKeyFields, it->second.classSignature));
        if (primaryIt != m_primaryIndex.end() && primaryIt->second == deviceKey)
        {
            m_primaryIndex.erase(primaryIt);
        }
        eraseFrom(m_macIndex, entity.macAddress);
        eraseFrom(m_macVlanIndex, makeMacVlanKey(entity.macAddress, entity.vlan));
        if (entity.ipv4Address)
        {
            eraseFrom(m_ipv4Index, *entity.ipv4Address);
        }
    }
    m_devices.erase(it);
}

std::vector<DevicePtr>
DeviceRegistry::collectNoLock(const std::set<uint64_t>& deviceKeys) const
{
    std::vector<DevicePtr> devices;
    for (auto key : deviceKeys)
    {
        auto it = m_devices.find(key);
        if (it == m_devices.end())
        {
            throw DeviceConsistencyError("Secondary index references missing device " +
                                         std::to_string(key));
        }
        devices.push_back(it->second.device);
    }
    return devices;
}

void
DeviceRegistry::emitDeviceEvent(EventType type, const DeviceEventPayload& payload) const
{
    if (m_eventBus)
    {
        m_eventBus->emit(Event{type, payload});
    }
}
