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

#include "dt_core/device_management/Device.hpp"
#include "utils/Utils.hpp" // for macToString
#include <algorithm>       // for find_if, max
#include <set>             // for set
#include <utility>         // for move

using json = nlohmann::json;

Device::Device(uint64_t deviceKey, dtClassifier::EntityClassSet entityClasses)
    : m_deviceKey(deviceKey),
      m_entityClasses(dtClassifier::normalizeClassSet(std::move(entityClasses)))
{
}

std::vector<std::string>
Device::getEntityClassNames() const
{
    std::vector<std::string> names;
    for (const auto& cls : m_entityClasses)
    {
        names.push_back(cls->getName());
    }
    return names;
}

std::vector<Entity>
Device::getEntities() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entities;
}

uint64_t
Device::getMacAddress() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entities.empty() ? 0 : m_entities.front().macAddress;
}

std::string
Device::getMacAddressString() const
{
    return utils::macToString(getMacAddress());
}

std::vector<uint16_t>
Device::getVlanIds() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::set<uint16_t> vlans;
    for (const auto& e : m_entities)
    {
        if (e.vlan)
        {
            vlans.insert(*e.vlan);
        }
    }
    return {vlans.begin(), vlans.end()};
}

bool
Device::hasUntaggedEntity() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::any_of(m_entities.begin(), m_entities.end(), [](const Entity& e) {
        return !e.vlan.has_value();
    });
}

std::vector<uint32_t>
Device::getIPv4Addresses() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::set<uint32_t> ips;
    for (const auto& e : m_entities)
    {
        if (e.ipv4Address)
        {
            ips.insert(*e.ipv4Address);
        }
    }
    return {ips.begin(), ips.end()};
}

std::vector<SwitchPort>
Device::getAttachmentPoints() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<SwitchPort> aps;
    for (const auto& ap : m_attachmentPoints.current)
    {
        aps.push_back(ap.switchPort());
    }
    return aps;
}

AttachmentPointState
Device::getAttachmentPointDetails() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_attachmentPoints;
}

std::vector<SwitchPort>
Device::getOldAttachmentPoints() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<SwitchPort> aps;
    for (const auto& ap : m_attachmentPoints.old)
    {
        aps.push_back(ap.switchPort());
    }
    return aps;
}

int64_t
Device::getLastSeen() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastSeenMs;
}

bool
Device::isRemoved() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_removed;
}

json
Device::toJson() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return toJsonNoLock();
}

json
Device::toJsonNoLock() const
{
    json classes = json::array();
    for (const auto& cls : m_entityClasses)
    {
        classes.push_back({{"name", cls->getName()}, {"key_fields", cls->getKeyFields()}});
    }

    return json{{"device_key", m_deviceKey},
                {"mac", utils::macToString(m_entities.empty() ? 0 : m_entities.front().macAddress)},
                {"entity_classes", classes},
                {"entities", m_entities},
                {"attachment_points", m_attachmentPoints.current},
                {"old_attachment_points", m_attachmentPoints.old},
                {"last_seen", m_lastSeenMs}};
}

std::shared_ptr<Device>
Device::fromJson(const json& row)
{
    dtClassifier::EntityClassSet classes;
    for (const auto& cls : row.at("entity_classes"))
    {
        classes.push_back(std::make_shared<dtClassifier::StoredEntityClass>(
            cls.at("name").get<std::string>(),
            cls.at("key_fields").get<EntityFieldSet>()));
    }

    auto device = std::make_shared<Device>(row.at("device_key").get<uint64_t>(), classes);

    for (const auto& e : row.at("entities"))
    {
        device->mergeEntityNoLock(e.get<Entity>());
    }
    device->m_attachmentPoints.current =
        row.value("attachment_points", json::array()).get<std::vector<AttachmentPoint>>();
    device->m_attachmentPoints.old =
        row.value("old_attachment_points", json::array()).get<std::vector<AttachmentPoint>>();
    device->m_lastSeenMs = std::max(device->m_lastSeenMs, row.value("last_seen", int64_t{0}));

    return device;
}

Device::MergeResult
Device::mergeEntityNoLock(const Entity& entity)
{
    MergeResult result;

    auto it = std::find_if(m_entities.begin(), m_entities.end(), [&entity](const Entity& e) {
        return e.sameIdentity(entity);
    });

    if (it != m_entities.end())
    {
        it->lastSeenMs = std::max(it->lastSeenMs, entity.lastSeenMs);
    }
    else
    {
        if (entity.ipv4Address)
        {
            result.newIpv4 = std::none_of(m_entities.begin(),
                                          m_entities.end(),
                                          [&entity](const Entity& e) {
                                              return e.ipv4Address == entity.ipv4Address;
                                          });
        }
        if (entity.vlan && !m_entities.empty())
        {
            result.newVlan = std::none_of(m_entities.begin(),
                                          m_entities.end(),
                                          [&entity](const Entity& e) {
                                              return e.vlan == entity.vlan;
                                          });
        }
        m_entities.push_back(entity);
        result.newEntity = true;
    }

    m_lastSeenMs = std::max(m_lastSeenMs, entity.lastSeenMs);
    return result;
}
