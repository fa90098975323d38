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

// common_types/DeviceTypes.hpp
#pragma once

#include <cstdint>           // for uint64_t, uint32_t, uint16_t, int64_t
#include <functional>        // for hash
#include <nlohmann/json.hpp> // for json
#include <optional>          // for optional
#include <set>               // for set
#include <stdexcept>         // for invalid_argument
#include <string>            // for string
#include <tuple>             // for tie
#include <vector>            // for vector

using json = nlohmann::json;

template <typename T>
inline void
hashCombine(std::size_t& seed, const T& val)
{
    seed ^= std::hash<T>{}(val) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
}

/**
 * @brief Identity fields an entity classifier may declare as significant.
 */
enum class EntityField
{
    MAC,
    IPV4,
    VLAN,
    SWITCH,
    PORT
};

using EntityFieldSet = std::set<EntityField>;

inline std::string
to_string(EntityField f)
{
    switch (f)
    {
    case EntityField::MAC:
        return "mac";
    case EntityField::IPV4:
        return "ipv4";
    case EntityField::VLAN:
        return "vlan";
    case EntityField::SWITCH:
        return "switch";
    case EntityField::PORT:
        return "port";
    }
    return "unknown";
}

inline EntityField
entityFieldFromString(const std::string& s)
{
    if (s == "mac")
    {
        return EntityField::MAC;
    }
    if (s == "ipv4")
    {
        return EntityField::IPV4;
    }
    if (s == "vlan")
    {
        return EntityField::VLAN;
    }
    if (s == "switch")
    {
        return EntityField::SWITCH;
    }
    if (s == "port")
    {
        return EntityField::PORT;
    }
    throw std::invalid_argument("Unknown entity field " + s);
}

inline void
to_json(json& j, const EntityField& f)
{
    j = to_string(f);
}

inline void
from_json(const json& j, EntityField& f)
{
    f = entityFieldFromString(j.get<std::string>());
}

/**
 * @brief One normalized packet observation.
 *
 * macAddress uses the lower 48 bits. An absent vlan means "untagged" and is a value of its own
 * when VLAN is a key field. ipv4Address is in host byte order; absent means unknown.
 * lastSeenMs is the observation time in milliseconds since epoch.
 */
struct Entity
{
    uint64_t macAddress = 0;
    std::optional<uint16_t> vlan;
    std::optional<uint32_t> ipv4Address;
    uint64_t switchDpid = 0;
    uint32_t switchPort = 0;
    int64_t lastSeenMs = 0;

    /// Same mac, vlan, ip, switch and port. The timestamp is ignored.
    bool sameIdentity(const Entity& other) const
    {
        return std::tie(macAddress, vlan, ipv4Address, switchDpid, switchPort) ==
               std::tie(other.macAddress,
                        other.vlan,
                        other.ipv4Address,
                        other.switchDpid,
                        other.switchPort);
    }

    bool operator==(const Entity& other) const
    {
        return sameIdentity(other) && lastSeenMs == other.lastSeenMs;
    }
};

inline void
to_json(json& j, const Entity& e)
{
    j = json{{"mac", e.macAddress},
             {"vlan", e.vlan ? json(*e.vlan) : json(nullptr)},
             {"ipv4", e.ipv4Address ? json(*e.ipv4Address) : json(nullptr)},
             {"switch", e.switchDpid},
             {"port", e.switchPort},
             {"last_seen", e.lastSeenMs}};
}

inline void
from_json(const json& j, Entity& e)
{
    e.macAddress = j.at("mac").get<uint64_t>();
    e.vlan.reset();
    e.ipv4Address.reset();
    if (j.contains("vlan") && !j.at("vlan").is_null())
    {
        e.vlan = j.at("vlan").get<uint16_t>();
    }
    if (j.contains("ipv4") && !j.at("ipv4").is_null())
    {
        e.ipv4Address = j.at("ipv4").get<uint32_t>();
    }
    e.switchDpid = j.at("switch").get<uint64_t>();
    e.switchPort = j.at("port").get<uint32_t>();
    e.lastSeenMs = j.at("last_seen").get<int64_t>();
}

/**
 * @brief A (switch, port) location.
 */
struct SwitchPort
{
    uint64_t switchDpid = 0;
    uint32_t port = 0;

    SwitchPort() = default;
    SwitchPort(uint64_t dpid, uint32_t p)
        : switchDpid(dpid),
          port(p)
    {
    }

    bool operator==(const SwitchPort& other) const
    {
        return switchDpid == other.switchDpid && port == other.port;
    }

    bool operator!=(const SwitchPort& other) const
    {
        return !(*this == other);
    }

    bool operator<(const SwitchPort& other) const
    {
        return std::tie(switchDpid, port) < std::tie(other.switchDpid, other.port);
    }
};

struct SwitchPortHash
{
    std::size_t operator()(const SwitchPort& sp) const
    {
        std::size_t seed = 0;
        hashCombine(seed, sp.switchDpid);
        hashCombine(seed, sp.port);
        return seed;
    }
};

inline void
to_json(json& j, const SwitchPort& sp)
{
    j = json{{"switch", sp.switchDpid}, {"port", sp.port}};
}

/**
 * @brief Where a device was observed, plus its flap-suppression state.
 *
 * blockedSinceMs is only meaningful while blocked is set. portChannel carries the configured
 * aggregation group of the port at the time it was last observed.
 */
struct AttachmentPoint
{
    uint64_t switchDpid = 0;
    uint32_t port = 0;
    int64_t lastSeenMs = 0;
    int64_t activeSinceMs = 0;
    bool blocked = false;
    int64_t blockedSinceMs = 0;
    std::optional<std::string> portChannel;

    SwitchPort switchPort() const
    {
        return SwitchPort(switchDpid, port);
    }
};

inline void
to_json(json& j, const AttachmentPoint& ap)
{
    j = json{{"switch", ap.switchDpid},
             {"port", ap.port},
             {"last_seen", ap.lastSeenMs},
             {"active_since", ap.activeSinceMs},
             {"blocked", ap.blocked},
             {"blocked_since", ap.blockedSinceMs},
             {"port_channel", ap.portChannel ? json(*ap.portChannel) : json(nullptr)}};
}

inline void
from_json(const json& j, AttachmentPoint& ap)
{
    ap.switchDpid = j.at("switch").get<uint64_t>();
    ap.port = j.at("port").get<uint32_t>();
    ap.lastSeenMs = j.at("last_seen").get<int64_t>();
    ap.activeSinceMs = j.value("active_since", ap.lastSeenMs);
    ap.blocked = j.value("blocked", false);
    ap.blockedSinceMs = j.value("blocked_since", int64_t{0});
    ap.portChannel.reset();
    if (j.contains("port_channel") && !j.at("port_channel").is_null())
    {
        ap.portChannel = j.at("port_channel").get<std::string>();
    }
}

/**
 * @brief Current and superseded attachment points of one device.
 */
struct AttachmentPointState
{
    std::vector<AttachmentPoint> current;
    std::vector<AttachmentPoint> old;
};
