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

#pragma once

#include "common_types/DeviceTypes.hpp" // for SwitchPort
#include <cstdint>                      // for uint64_t, uint32_t
#include <map>                          // for map
#include <optional>                     // for optional
#include <shared_mutex>                 // for shared_mutex
#include <string>                       // for string

class IStorageSource;

/**
 * @brief (switch, port) -> port-channel group mapping.
 *
 * Ports in the same group form one logical link; the attachment point tracker never treats
 * traffic alternating between them as a move.
 *
 * Persisted in table "port_channel":
 * @code
 * {"id": "00:00:00:00:00:00:00:01|1", "switch": "00:00:00:00:00:00:00:01", "port": 1,
 *  "channel": "channel"}
 * @endcode
 */
class PortChannelConfig
{
  public:
    static constexpr const char* TABLE_NAME = "port_channel";
    static constexpr const char* ID_COLUMN_NAME = "id";
    static constexpr const char* SWITCH_COLUMN_NAME = "switch";
    static constexpr const char* PORT_COLUMN_NAME = "port";
    static constexpr const char* CHANNEL_COLUMN_NAME = "channel";

    std::optional<std::string> getGroup(uint64_t dpid, uint32_t port) const;

    void setGroup(uint64_t dpid, uint32_t port, const std::string& group);
    void removeGroup(uint64_t dpid, uint32_t port);
    void clear();
    size_t size() const;

    /**
     * @brief Replace the mapping with the rows of the port_channel table.
     *
     * The mapping is swapped in one step only after every row parsed.
     *
     * @return number of configured ports.
     * @throws StorageException if the table cannot be read, std::invalid_argument or
     *         nlohmann::json::exception on malformed rows. The previous mapping stays active.
     */
    size_t loadFromStorage(const IStorageSource& storage);

    /**
     * @brief loadFromStorage() for runtime reloads: failures are logged and the previous mapping
     * is kept.
     */
    bool reloadFromStorage(const IStorageSource& storage);

    /** @brief Row written to the port_channel table for one port. */
    static nlohmann::json makeRow(uint64_t dpid, uint32_t port, const std::string& group);

  private:
    mutable std::shared_mutex m_mutex;
    std::map<SwitchPort, std::string> m_groups;
};
