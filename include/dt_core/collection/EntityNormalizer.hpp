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

// dt_core/collection/EntityNormalizer.hpp
#pragma once

#include "common_types/DeviceTypes.hpp" // for Entity
#include "common_types/PacketTypes.hpp" // for PacketInObservation, PacketHeaderFields
#include <cstddef>                      // for size_t
#include <cstdint>                      // for uint8_t
#include <optional>                     // for optional

/**
 * @brief Turns a packet-in observation into an Entity.
 *
 * Rejected (std::nullopt, logged at debug):
 *   - frames too short to carry the headers they announce,
 *   - zero, broadcast or multicast source MACs.
 *
 * A source IPv4 of 0.0.0.0 or in 224.0.0.0/4 is treated as unknown. VLAN id 0 (priority tag)
 * counts as untagged.
 */
class EntityNormalizer
{
  public:
    static constexpr uint16_t ETH_TYPE_IPV4 = 0x0800;
    static constexpr uint16_t ETH_TYPE_ARP = 0x0806;
    static constexpr uint16_t ETH_TYPE_VLAN = 0x8100;

    std::optional<Entity> normalize(const PacketInObservation& observation) const;

    /**
     * @brief Decode Ethernet, one 802.1Q tag, the ARP sender address or the IPv4 source.
     *
     * @return std::nullopt if the frame is truncated.
     */
    static std::optional<PacketHeaderFields> extractHeaders(const uint8_t* data, size_t length);
};
