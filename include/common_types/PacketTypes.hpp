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

// common_types/PacketTypes.hpp
#pragma once

#include "utils/Utils.hpp"   // for macToUint64, dpidFromString, ipStringToUint32
#include <cstdint>           // for uint8_t, uint16_t, uint32_t, uint64_t, int64_t
#include <nlohmann/json.hpp> // for json
#include <optional>          // for optional
#include <string>            // for string
#include <vector>            // for vector

/**
 * @brief Source-side header fields of a packet, already decoded by the southbound layer.
 */
struct PacketHeaderFields
{
    uint64_t srcMac = 0;
    std::optional<uint16_t> vlan;
    std::optional<uint32_t> srcIpv4; // host byte order
};

/**
 * @brief A packet a switch forwarded to the controller.
 *
 * When headerFields is set it takes precedence over decoding packetData.
 */
struct PacketInObservation
{
    uint64_t switchDpid = 0;
    uint32_t inPort = 0;
    std::vector<uint8_t> packetData;
    int64_t timestampMs = 0;
    std::optional<PacketHeaderFields> headerFields;
};

/**
 * Replay records:
 * @code
 * {"switch": "00:00:00:00:00:00:00:01", "port": 1, "timestamp_ms": 1000,
 *  "mac": "00:44:33:22:11:00", "vlan": 5, "ip": "192.168.1.1"}
 * {"switch": 1, "port": 1, "timestamp_ms": 1000, "packet_hex": "ffffffffffff0044..."}
 * @endcode
 */
inline void
from_json(const nlohmann::json& j, PacketInObservation& obs)
{
    const auto& sw = j.at("switch");
    obs.switchDpid = sw.is_string() ? utils::dpidFromString(sw.get<std::string>())
                                    : sw.get<uint64_t>();
    obs.inPort = j.at("port").get<uint32_t>();
    obs.timestampMs = j.value("timestamp_ms", int64_t{0});
    obs.packetData.clear();
    obs.headerFields.reset();

    if (j.contains("packet_hex"))
    {
        auto hex = j.at("packet_hex").get<std::string>();
        if (hex.size() % 2 != 0)
        {
            throw std::invalid_argument("packet_hex has an odd number of digits");
        }
        for (size_t i = 0; i < hex.size(); i += 2)
        {
            obs.packetData.push_back(
                static_cast<uint8_t>(utils::hexStringToUint64(hex.substr(i, 2))));
        }
        return;
    }

    PacketHeaderFields fields;
    fields.srcMac = utils::macToUint64(j.at("mac").get<std::string>());
    if (j.contains("vlan") && !j.at("vlan").is_null())
    {
        fields.vlan = j.at("vlan").get<uint16_t>();
    }
    if (j.contains("ip") && !j.at("ip").is_null())
    {
        fields.srcIpv4 = utils::ipStringToUint32(j.at("ip").get<std::string>());
    }
    obs.headerFields = fields;
}
