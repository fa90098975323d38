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

#include "dt_core/device_management/AttachmentPointTracker.hpp"
#include "dt_core/device_management/PortChannelConfig.hpp" // for PortChannelConfig
#include "dt_core/topology/TopologyService.hpp"            // for ITopologyService
#include "utils/Logger.hpp"                                // for Logger
#include "utils/Utils.hpp"                                 // for dpidToString
#include <algorithm>                                       // for find_if, remove_if, stable_partition
#include <exception>                                       // for exception
#include <iterator>                                        // for make_move_iterator
#include <utility>                                         // for move
#include <vector>                                          // for vector

namespace
{
template <typename Container>
auto
findPort(Container& list, const SwitchPort& sp)
{
    return std::find_if(list.begin(), list.end(), [&sp](const AttachmentPoint& ap) {
        return ap.switchPort() == sp;
    });
}

bool
removePort(std::vector<AttachmentPoint>& list, const SwitchPort& sp)
{
    auto it = findPort(list, sp);
    if (it == list.end())
    {
        return false;
    }
    list.erase(it);
    return true;
}

AttachmentPoint
makeAttachmentPoint(uint64_t dpid,
                    uint32_t port,
                    int64_t timestampMs,
                    std::optional<std::string> portChannel)
{
    AttachmentPoint ap;
    ap.switchDpid = dpid;
    ap.port = port;
    ap.lastSeenMs = timestampMs;
    ap.activeSinceMs = timestampMs;
    ap.portChannel = std::move(portChannel);
    return ap;
}
} // namespace

std::string
to_string(AttachmentPointChange change)
{
    switch (change)
    {
    case AttachmentPointChange::None:
        return "none";
    case AttachmentPointChange::Internal:
        return "internal";
    case AttachmentPointChange::Added:
        return "added";
    case AttachmentPointChange::Refreshed:
        return "refreshed";
    case AttachmentPointChange::Moved:
        return "moved";
    case AttachmentPointChange::Suppressed:
        return "suppressed";
    case AttachmentPointChange::Stale:
        return "stale";
    case AttachmentPointChange::Aggregated:
        return "aggregated";
    }
    return "unknown";
}

AttachmentPointTracker::AttachmentPointTracker(std::shared_ptr<ITopologyService> topology,
                                               std::shared_ptr<PortChannelConfig> portChannels,
                                               std::chrono::milliseconds flapCooldown)
    : m_topology(std::move(topology)),
      m_portChannels(std::move(portChannels)),
      m_flapCooldownMs(flapCooldown.count())
{
}

AttachmentPointUpdate
AttachmentPointTracker::observe(AttachmentPointState& state,
                                uint64_t dpid,
                                uint32_t port,
                                int64_t timestampMs) const
{
    AttachmentPointUpdate update;
    const SwitchPort sp(dpid, port);

    if (isInternalPort(dpid, port))
    {
        update.change = AttachmentPointChange::Internal;
        return update;
    }

    auto currentIt = findPort(state.current, sp);
    if (currentIt != state.current.end())
    {
        currentIt->lastSeenMs = std::max(currentIt->lastSeenMs, timestampMs);
        update.change = AttachmentPointChange::Refreshed;
        return update;
    }

    auto oldIt = findPort(state.old, sp);
    auto portChannel = lookupPortChannel(dpid, port);

    std::vector<AttachmentPoint*> sameSwitch;
    for (auto& ap : state.current)
    {
        if (ap.switchDpid == dpid)
        {
            sameSwitch.push_back(&ap);
        }
    }

    // Port-channel membership wins over the flap cool-down
    bool aggregated = portChannel.has_value() && !sameSwitch.empty();
    int64_t newestLastSeen = 0;
    SwitchPort newest;
    for (auto* ap : sameSwitch)
    {
        auto apChannel = lookupPortChannel(ap->switchDpid, ap->port);
        if (!apChannel || apChannel != portChannel)
        {
            aggregated = false;
        }
        if (ap == sameSwitch.front() || ap->lastSeenMs > newestLastSeen)
        {
            newestLastSeen = ap->lastSeenMs;
            newest = ap->switchPort();
        }
    }

    if (aggregated)
    {
        removePort(state.old, sp);
        state.current.push_back(makeAttachmentPoint(dpid, port, timestampMs, portChannel));
        update.change = AttachmentPointChange::Aggregated;
        return update;
    }

    if (oldIt != state.old.end() && oldIt->blocked &&
        timestampMs - oldIt->blockedSinceMs < m_flapCooldownMs.load())
    {
        oldIt->lastSeenMs = std::max(oldIt->lastSeenMs, timestampMs);
        update.change = AttachmentPointChange::Suppressed;
        SPDLOG_LOGGER_DEBUG(Logger::instance(),
                            "Suppressed flapping attachment point {}:{}",
                            utils::dpidToString(dpid),
                            port);
        return update;
    }

    if (sameSwitch.empty())
    {
        removePort(state.old, sp);
        state.current.push_back(makeAttachmentPoint(dpid, port, timestampMs, portChannel));
        update.change = AttachmentPointChange::Added;
        return update;
    }

    if (timestampMs < newestLastSeen)
    {
        if (oldIt != state.old.end())
        {
            oldIt->lastSeenMs = std::max(oldIt->lastSeenMs, timestampMs);
        }
        else
        {
            state.old.push_back(makeAttachmentPoint(dpid, port, timestampMs, portChannel));
            update.stateChanged = true;
        }
        update.change = AttachmentPointChange::Stale;
        return update;
    }

    // Move: every current entry on this switch is superseded
    std::vector<AttachmentPoint> superseded;
    auto keep = std::stable_partition(state.current.begin(),
                                      state.current.end(),
                                      [dpid](const AttachmentPoint& ap) {
                                          return ap.switchDpid != dpid;
                                      });
    superseded.assign(std::make_move_iterator(keep), std::make_move_iterator(state.current.end()));
    state.current.erase(keep, state.current.end());

    for (auto& ap : superseded)
    {
        removePort(state.old, ap.switchPort());
        ap.blocked = true;
        ap.blockedSinceMs = timestampMs;
        state.old.push_back(std::move(ap));
    }

    removePort(state.old, sp);
    state.current.push_back(makeAttachmentPoint(dpid, port, timestampMs, portChannel));

    update.change = AttachmentPointChange::Moved;
    update.previous = newest;

    SPDLOG_LOGGER_DEBUG(Logger::instance(),
                        "Attachment point moved {}:{} -> {}:{}",
                        utils::dpidToString(newest.switchDpid),
                        newest.port,
                        utils::dpidToString(dpid),
                        port);
    return update;
}

bool
AttachmentPointTracker::unblock(AttachmentPointState& state, const SwitchPort& switchPort)
{
    auto it = findPort(state.old, switchPort);
    if (it == state.old.end() || !it->blocked)
    {
        return false;
    }
    it->blocked = false;
    it->blockedSinceMs = 0;
    return true;
}

size_t
AttachmentPointTracker::expireOld(AttachmentPointState& state, int64_t nowMs, int64_t maxAgeMs)
{
    auto before = state.old.size();
    state.old.erase(std::remove_if(state.old.begin(),
                                   state.old.end(),
                                   [nowMs, maxAgeMs](const AttachmentPoint& ap) {
                                       return nowMs - ap.lastSeenMs > maxAgeMs;
                                   }),
                    state.old.end());
    return before - state.old.size();
}

void
AttachmentPointTracker::setFlapCooldown(std::chrono::milliseconds cooldown)
{
    m_flapCooldownMs.store(cooldown.count());
}

std::chrono::milliseconds
AttachmentPointTracker::getFlapCooldown() const
{
    return std::chrono::milliseconds(m_flapCooldownMs.load());
}

bool
AttachmentPointTracker::isInternalPort(uint64_t dpid, uint32_t port) const
{
    if (!m_topology)
    {
        return false;
    }
    try
    {
        return m_topology->isInternal(dpid, port);
    }
    catch (const std::exception& e)
    {
        SPDLOG_LOGGER_WARN(Logger::instance(),
                           "Topology query for {}:{} failed, treating as edge port: {}",
                           utils::dpidToString(dpid),
                           port,
                           e.what());
        return false;
    }
}

std::optional<std::string>
AttachmentPointTracker::lookupPortChannel(uint64_t dpid, uint32_t port) const
{
    if (!m_portChannels)
    {
        return std::nullopt;
    }
    return m_portChannels->getGroup(dpid, port);
}
