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

#include "dt_core/device_management/PortChannelConfig.hpp"
#include "dt_core/data_management/StorageSource.hpp" // for IStorageSource
#include "utils/Logger.hpp"                          // for Logger
#include "utils/Utils.hpp"                           // for dpidToString
#include <exception>                                 // for exception
#include <mutex>                                     // for unique_lock

using json = nlohmann::json;

std::optional<std::string>
PortChannelConfig::getGroup(uint64_t dpid, uint32_t port) const
{
    std::shared_lock lock(m_mutex);
    auto it = m_groups.find(SwitchPort(dpid, port));
    if (it == m_groups.end())
    {
        return std::nullopt;
    }
    return it->second;
}

void
PortChannelConfig::setGroup(uint64_t dpid, uint32_t port, const std::string& group)
{
    std::unique_lock lock(m_mutex);
    m_groups[SwitchPort(dpid, port)] = group;
}

void
PortChannelConfig::removeGroup(uint64_t dpid, uint32_t port)
{
    std::unique_lock lock(m_mutex);
    m_groups.erase(SwitchPort(dpid, port));
}

void
PortChannelConfig::clear()
{
    std::unique_lock lock(m_mutex);
    m_groups.clear();
}

size_t
PortChannelConfig::size() const
{
    std::shared_lock lock(m_mutex);
    return m_groups.size();
}

size_t
PortChannelConfig::loadFromStorage(const IStorageSource& storage)
{
    std::map<SwitchPort, std::string> groups;

    for (const auto& row : storage.getAllRows(TABLE_NAME))
    {
        const auto& switchValue = row.at(SWITCH_COLUMN_NAME);
        uint64_t dpid = switchValue.is_string()
                            ? utils::dpidFromString(switchValue.get<std::string>())
                            : switchValue.get<uint64_t>();
        uint32_t port = row.at(PORT_COLUMN_NAME).get<uint32_t>();
        std::string channel = row.at(CHANNEL_COLUMN_NAME).get<std::string>();

        if (channel.empty())
        {
            SPDLOG_LOGGER_WARN(Logger::instance(),
                               "Ignoring port-channel row without channel for {}|{}",
                               utils::dpidToString(dpid),
                               port);
            continue;
        }
        groups[SwitchPort(dpid, port)] = std::move(channel);
    }

    size_t count = groups.size();
    {
        std::unique_lock lock(m_mutex);
        m_groups.swap(groups);
    }

    SPDLOG_LOGGER_INFO(Logger::instance(), "Port-channel configuration: {} ports", count);
    return count;
}

bool
PortChannelConfig::reloadFromStorage(const IStorageSource& storage)
{
    try
    {
        loadFromStorage(storage);
        return true;
    }
    catch (const std::exception& e)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(),
                            "Port-channel reload failed, keeping previous mapping: {}",
                            e.what());
        return false;
    }
}

json
PortChannelConfig::makeRow(uint64_t dpid, uint32_t port, const std::string& group)
{
    const std::string dpidStr = utils::dpidToString(dpid);
    return json{{ID_COLUMN_NAME, dpidStr + "|" + std::to_string(port)},
                {SWITCH_COLUMN_NAME, dpidStr},
                {PORT_COLUMN_NAME, port},
                {CHANNEL_COLUMN_NAME, group}};
}
