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

// dt_core/topology/TopologyService.hpp
#pragma once

#include "common_types/DeviceTypes.hpp"   // for SwitchPort, SwitchPortHash
#include <boost/graph/adjacency_list.hpp> // for adjacency_list
#include <cstdint>                        // for uint64_t, uint32_t
#include <nlohmann/json.hpp>              // for json
#include <optional>                       // for optional
#include <shared_mutex>                   // for shared_mutex
#include <string>                         // for string
#include <unordered_map>                  // for unordered_map
#include <unordered_set>                  // for unordered_set

/**
 * @brief Topology query consulted before an attachment point is created or updated.
 */
class ITopologyService
{
  public:
    virtual ~ITopologyService() = default;

    /**
     * @brief Whether (dpid, port) terminates a link internal to the switching fabric.
     *
     * Implementations may throw; callers treat a failed query as "not internal".
     */
    virtual bool isInternal(uint64_t dpid, uint32_t port) const = 0;
};

struct SwitchVertexProperties
{
    uint64_t dpid = 0;
};

struct SwitchLinkProperties
{
    uint32_t srcInterface = 0;
    uint32_t dstInterface = 0;
};

/**
 * @brief Directed inter-switch link graph.
 *
 * multisetS allows parallel links between the same pair of switches.
 */
using SwitchGraph = boost::adjacency_list<boost::multisetS,
                                          boost::vecS,
                                          boost::directedS,
                                          SwitchVertexProperties,
                                          SwitchLinkProperties>;

/**
 * @brief Topology built from a static description of the inter-switch links.
 *
 * Every switch-side endpoint of a switch-to-switch link is internal. Host edges (an endpoint
 * with dpid 0) are ignored, they are exactly the ports hosts attach to.
 *
 * The file format follows the static topology files of the controller:
 * @code
 * {"edges": [{"src_dpid": 1, "src_interface": 3, "dst_dpid": 2, "dst_interface": 1}]}
 * @endcode
 * dpids may be numbers or hex strings ("00:00:00:00:00:00:00:01").
 *
 * Thread-safe: queries take a shared lock, mutations an exclusive one.
 */
class StaticTopologyService : public ITopologyService
{
  public:
    StaticTopologyService() = default;

    /**
     * @brief Replace the current links with the ones in @p path.
     *
     * @return number of switch-to-switch links loaded.
     * @throws std::runtime_error if the file cannot be opened or parsed.
     */
    size_t loadFromFile(const std::string& path);

    /** @brief Replace the current links with the "edges" array of @p topology. */
    size_t loadFromJson(const nlohmann::json& topology);

    void addLink(uint64_t srcDpid, uint32_t srcInterface, uint64_t dstDpid, uint32_t dstInterface);

    bool isInternal(uint64_t dpid, uint32_t port) const override;

    size_t getSwitchCount() const;
    size_t getLinkCount() const;

  private:
    SwitchGraph::vertex_descriptor findOrAddSwitchNoLock(uint64_t dpid);
    void addLinkNoLock(uint64_t srcDpid,
                       uint32_t srcInterface,
                       uint64_t dstDpid,
                       uint32_t dstInterface);

    mutable std::shared_mutex m_graphMutex;
    SwitchGraph m_graph;
    std::unordered_map<uint64_t, SwitchGraph::vertex_descriptor> m_dpidToVertex;
    std::unordered_set<SwitchPort, SwitchPortHash> m_internalPorts;
};
