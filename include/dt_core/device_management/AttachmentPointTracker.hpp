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

#include "common_types/DeviceTypes.hpp" // for AttachmentPointState, SwitchPort
#include <atomic>                       // for atomic
#include <chrono>                       // for milliseconds
#include <cstdint>                      // for uint64_t, uint32_t, int64_t
#include <memory>                       // for shared_ptr
#include <optional>                     // for optional
#include <string>                       // for string

class ITopologyService;
class PortChannelConfig;

enum class AttachmentPointChange
{
    None,
    Internal,   // port terminates an inter-switch link
    Added,      // first current port on the switch, or re-promotion of an old one
    Refreshed,  // already current
    Moved,      // replaced the current port(s) on the switch
    Suppressed, // blocked old port inside the flap cool-down
    Stale,      // older than the current port's last sighting
    Aggregated  // same port-channel as the current port(s)
};

std::string to_string(AttachmentPointChange change);

struct AttachmentPointUpdate
{
    AttachmentPointChange change = AttachmentPointChange::None;

    /// Current port that was superseded, set for Moved.
    std::optional<SwitchPort> previous;

    /// Whether the current/old lists changed shape (not only timestamps).
    bool isStructural() const
    {
        return change == AttachmentPointChange::Added || change == AttachmentPointChange::Moved ||
               change == AttachmentPointChange::Aggregated || stateChanged;
    }

    /// Set when an old entry was added or removed without touching the current list.
    bool stateChanged = false;
};

/**
 * @brief Attachment-point state machine of a device.
 *
 * Operates on an AttachmentPointState owned by a Device; the caller holds the device lock.
 * The tracker itself only keeps configuration and is safe to share between workers.
 *
 * For an observation (dpid, port, t):
 *   1. internal link port            -> no change
 *   2. port already current          -> lastSeen = max(lastSeen, t)
 *   3. old, blocked, t - blockedSince < cool-down -> suppressed, old lastSeen refreshed
 *   4. no current port on the switch -> port becomes current (leaves the old list)
 *   5. other current port on the switch:
 *        same port-channel           -> both current
 *        t < current lastSeen        -> recorded as an unblocked old entry
 *        otherwise                   -> current entries on the switch become old and blocked
 *                                       since t, the port becomes current
 */
class AttachmentPointTracker
{
  public:
    AttachmentPointTracker(std::shared_ptr<ITopologyService> topology,
                           std::shared_ptr<PortChannelConfig> portChannels,
                           std::chrono::milliseconds flapCooldown);

    AttachmentPointUpdate observe(AttachmentPointState& state,
                                  uint64_t dpid,
                                  uint32_t port,
                                  int64_t timestampMs) const;

    /**
     * @brief Clear the blocked flag of the old entry for @p switchPort.
     * @return true if an entry was blocked.
     */
    static bool unblock(AttachmentPointState& state, const SwitchPort& switchPort);

    /**
     * @brief Drop old entries not seen within @p maxAgeMs before @p nowMs.
     * @return number of entries removed.
     */
    static size_t expireOld(AttachmentPointState& state, int64_t nowMs, int64_t maxAgeMs);

    void setFlapCooldown(std::chrono::milliseconds cooldown);
    std::chrono::milliseconds getFlapCooldown() const;

  private:
    bool isInternalPort(uint64_t dpid, uint32_t port) const;
    std::optional<std::string> lookupPortChannel(uint64_t dpid, uint32_t port) const;

    std::shared_ptr<ITopologyService> m_topology;
    std::shared_ptr<PortChannelConfig> m_portChannels;
    std::atomic<int64_t> m_flapCooldownMs;
};
