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

// utils/Utils.hpp
#pragma once

#include <arpa/inet.h>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

/**
 * @brief Common utility helpers used across DevTrack.
 *
 * Small, header-only helpers for:
 *  - IPv4, MAC and datapath-id conversions,
 *  - the wall-clock timestamp used for observations.
 *
 * IPv4 addresses are carried in host byte order throughout DevTrack; the conversions below
 * translate at the string boundary.
 */
namespace utils
{

/**
 * @brief Convert a host-byte-order IPv4 address to dotted-decimal string.
 *
 * @throws std::runtime_error if conversion fails.
 */
inline std::string
ipToString(uint32_t ip)
{
    struct in_addr addr;
    addr.s_addr = htonl(ip);
    char buf[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &addr, buf, sizeof(buf)) == nullptr)
    {
        throw std::runtime_error("inet_ntop failed");
    }
    return std::string(buf);
}

/**
 * @brief Parse dotted IPv4 string into a host-byte-order uint32_t.
 *
 * @throws std::invalid_argument if the string is not a valid IPv4 address.
 */
inline uint32_t
ipStringToUint32(const std::string& ipStr)
{
    struct in_addr addr;
    if (inet_pton(AF_INET, ipStr.c_str(), &addr) != 1)
    {
        throw std::invalid_argument("Invalid IP address: " + ipStr);
    }
    return ntohl(addr.s_addr);
}

/**
 * @brief Parse a hex string into uint64_t.
 *
 * Accepts strings like "0x1a2b" or "1A2B". Every character after the optional prefix must be a
 * hex digit.
 *
 * @throws std::invalid_argument on parse failure or overflow.
 */
inline uint64_t
hexStringToUint64(const std::string& hexStr)
{
    const char* first = hexStr.data();
    const char* last = first + hexStr.size();
    if (hexStr.size() > 2 && first[0] == '0' && (first[1] == 'x' || first[1] == 'X'))
    {
        first += 2;
    }

    uint64_t value = 0;
    auto [p, ec] = std::from_chars(first, last, value, 16);
    if (first == last || ec != std::errc() || p != last)
    {
        throw std::invalid_argument("Invalid hex string: " + hexStr);
    }
    return value;
}

/**
 * @brief Current time in milliseconds since epoch (system_clock).
 */
inline int64_t
getCurrentTimeMillisSystemClock()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/**
 * @brief Convert MAC address string ("aa:bb:cc:dd:ee:ff") to a 48-bit integer.
 *
 * @throws std::invalid_argument if parsing fails.
 */
inline uint64_t
macToUint64(const std::string& mac)
{
    if (mac.size() != 17)
    {
        throw std::invalid_argument("Invalid MAC address: " + mac);
    }

    uint64_t result = 0;
    auto parse_hex_byte = [&](const char* ptr) {
        uint8_t byte = 0;
        auto [p, ec] = std::from_chars(ptr, ptr + 2, byte, 16);
        if (ec != std::errc() || p != ptr + 2)
        {
            throw std::invalid_argument("Invalid hex digit in MAC address: " + mac);
        }
        return byte;
    };

    const char* p = mac.data();
    for (int i = 0; i < 6; ++i)
    {
        result <<= 8;
        result |= parse_hex_byte(p + i * 3);
    }
    return result;
}

/**
 * @brief Convert a 48-bit MAC stored in uint64_t to string form ("aa:bb:cc:dd:ee:ff").
 */
inline std::string
macToString(uint64_t mac)
{
    std::ostringstream oss;

    for (int i = 5; i >= 0; --i)
    {
        uint8_t byte = (mac >> (i * 8)) & 0xFF;
        oss << std::hex << std::setw(2) << std::setfill('0') << (int)byte;
        if (i > 0)
        {
            oss << ":";
        }
    }

    return oss.str();
}

/**
 * @brief Convert a datapath id to the colon-separated form "00:00:00:00:00:00:00:01".
 */
inline std::string
dpidToString(uint64_t dpid)
{
    std::ostringstream oss;

    for (int i = 7; i >= 0; --i)
    {
        uint8_t byte = (dpid >> (i * 8)) & 0xFF;
        oss << std::hex << std::setw(2) << std::setfill('0') << (int)byte;
        if (i > 0)
        {
            oss << ":";
        }
    }

    return oss.str();
}

/**
 * @brief Parse a datapath id written either colon-separated or as plain hex.
 *
 * @throws std::invalid_argument on parse failure.
 */
inline uint64_t
dpidFromString(const std::string& dpidStr)
{
    if (dpidStr.find(':') == std::string::npos)
    {
        return hexStringToUint64(dpidStr);
    }

    std::string compact;
    compact.reserve(16);
    for (char c : dpidStr)
    {
        if (c != ':')
        {
            compact.push_back(c);
        }
    }
    if (compact.empty() || compact.size() > 16)
    {
        throw std::invalid_argument("Invalid datapath id: " + dpidStr);
    }
    return hexStringToUint64(compact);
}

/// Multicast (and broadcast) MACs have the group bit of the first octet set.
inline bool
isMulticastMac(uint64_t mac)
{
    return ((mac >> 40) & 0x01) != 0;
}

inline bool
isBroadcastMac(uint64_t mac)
{
    return (mac & 0xFFFFFFFFFFFFULL) == 0xFFFFFFFFFFFFULL;
}
} // namespace utils
