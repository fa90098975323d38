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

#include "dt_core/collection/EntityNormalizer.hpp"
#include "utils/Logger.hpp" // for Logger
#include "utils/Utils.hpp"  // for isMulticastMac, isBroadcastMac, dpidToString

namespace
{
constexpr size_t ETH_HEADER_LEN = 14;
constexpr size_t VLAN_TAG_LEN = 4;
constexpr size_t ARP_PACKET_LEN = 28;
constexpr size_t ARP_SENDER_IP_OFFSET = 14;
constexpr size_t IPV4_MIN_HEADER_LEN = 20;
constexpr size_t IPV4_SRC_OFFSET = 12;

uint16_t
readU16(const uint8_t* p)
{
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

uint32_t
readU32(const uint8_t* p)
{
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

uint64_t
readMac(const uint8_t* p)
{
    uint64_t mac = 0;
    for (int i = 0; i < 6; ++i)
    {
        mac = (mac << 8) | p[i];
    }
    return mac;
}

bool
isUsableIpv4(uint32_t ip)
{
    // 0.0.0.0 and 224.0.0.0/4
    return ip != 0 && (ip >> 28) != 0xE;
}
} // namespace

std::optional<Entity>
EntityNormalizer::normalize(const PacketInObservation& observation) const
{
    std::optional<PacketHeaderFields> fields = observation.headerFields;
    if (!fields)
    {
        fields = extractHeaders(observation.packetData.data(), observation.packetData.size());
        if (!fields)
        {
            SPDLOG_LOGGER_DEBUG(Logger::instance(),
                                "Dropping truncated frame ({} bytes) from {}:{}",
                                observation.packetData.size(),
                                utils::dpidToString(observation.switchDpid),
                                observation.inPort);
            return std::nullopt;
        }
    }

    const uint64_t mac = fields->srcMac & 0xFFFFFFFFFFFFULL;
    if (mac == 0 || utils::isBroadcastMac(mac) || utils::isMulticastMac(mac))
    {
        SPDLOG_LOGGER_DEBUG(Logger::instance(),
                            "Ignoring packet with source mac {} from {}:{}",
                            utils::macToString(mac),
                            utils::dpidToString(observation.switchDpid),
                            observation.inPort);
        return std::nullopt;
    }

    Entity entity;
    entity.macAddress = mac;
    if (fields->vlan && (*fields->vlan & 0x0FFF) != 0)
    {
        entity.vlan = static_cast<uint16_t>(*fields->vlan & 0x0FFF);
    }
    if (fields->srcIpv4 && isUsableIpv4(*fields->srcIpv4))
    {
        entity.ipv4Address = fields->srcIpv4;
    }
    entity.switchDpid = observation.switchDpid;
    entity.switchPort = observation.inPort;
    entity.lastSeenMs = observation.timestampMs;
    return entity;
}

std::optional<PacketHeaderFields>
EntityNormalizer::extractHeaders(const uint8_t* data, size_t length)
{
    if (data == nullptr || length < ETH_HEADER_LEN)
    {
        return std::nullopt;
    }

    PacketHeaderFields fields;
    fields.srcMac = readMac(data + 6);

    size_t offset = 12;
    uint16_t ethType = readU16(data + offset);
    offset += 2;

    if (ethType == ETH_TYPE_VLAN)
    {
        if (length < ETH_HEADER_LEN + VLAN_TAG_LEN)
        {
            return std::nullopt;
        }
        fields.vlan = static_cast<uint16_t>(readU16(data + offset) & 0x0FFF);
        ethType = readU16(data + offset + 2);
        offset += VLAN_TAG_LEN;
    }

    if (ethType == ETH_TYPE_ARP)
    {
        if (length < offset + ARP_PACKET_LEN)
        {
            return std::nullopt;
        }
        fields.srcIpv4 = readU32(data + offset + ARP_SENDER_IP_OFFSET);
    }
    else if (ethType == ETH_TYPE_IPV4)
    {
        if (length < offset + IPV4_MIN_HEADER_LEN || (data[offset] >> 4) != 4)
        {
            return std::nullopt;
        }
        fields.srcIpv4 = readU32(data + offset + IPV4_SRC_OFFSET);
    }

    return fields;
}
