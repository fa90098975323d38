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

#include "dt_core/topology/TopologyService.hpp"
#include "utils/Logger.hpp"               // for Logger
#include "utils/Utils.hpp"                // for dpidFromString
#include <boost/graph/adjacency_list.hpp> // for add_vertex, add_edge
#include <fstream>                        // for ifstream
#include <mutex>                          // for unique_lock
#include <stdexcept>                      // for runtime_error

using json = nlohmann::json;

namespace
{
uint64_t
readDpid(const json& value)
{
    if (value.is_string())
    {
        return utils::dpidFromString(value.get<std::string>());
    }
    return value.get<uint64_t>();
}
} // namespace

size_t
StaticTopologyService::loadFromFile(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        throw std::runtime_error("Cannot open topology file: " + path);
    }

    json j;
    try
    {
        file >> j;
    }
    catch (const json::exception& e)
    {
        throw std::runtime_error("Cannot parse topology file " + path + ": " + e.what());
    }

    SPDLOG_LOGGER_INFO(Logger::instance(), "Load Static Topology File {}", path);
    return loadFromJson(j);
}

size_t
StaticTopologyService::loadFromJson(const json& topology)
{
    std::unique_lock lock(m_graphMutex);

    m_graph.clear();
    m_dpidToVertex.clear();
    m_internalPorts.clear();

    for (const auto& edgeJson : topology.value("edges", json::array()))
    {
        uint64_t srcDpid = readDpid(edgeJson.at("src_dpid"));
        uint64_t dstDpid = readDpid(edgeJson.at("dst_dpid"));
        uint32_t srcInterface = edgeJson.at("src_interface").get<uint32_t>();
        uint32_t dstInterface = edgeJson.at("dst_interface").get<uint32_t>();

        // Host links are where devices attach, skip them
        if (srcDpid == 0 || dstDpid == 0)
        {
            SPDLOG_LOGGER_DEBUG(Logger::instance(),
                                "Skipping host edge: src_dpid={} dst_dpid={}",
                                srcDpid,
                                dstDpid);
            continue;
        }

        addLinkNoLock(srcDpid, srcInterface, dstDpid, dstInterface);
    }

    SPDLOG_LOGGER_INFO(Logger::instance(),
                       "Static topology: {} switches, {} inter-switch links",
                       boost::num_vertices(m_graph),
                       boost::num_edges(m_graph));
    return boost::num_edges(m_graph);
}

void
StaticTopologyService::addLink(uint64_t srcDpid,
                               uint32_t srcInterface,
                               uint64_t dstDpid,
                               uint32_t dstInterface)
{
    std::unique_lock lock(m_graphMutex);
    addLinkNoLock(srcDpid, srcInterface, dstDpid, dstInterface);
}

void
StaticTopologyService::addLinkNoLock(uint64_t srcDpid,
                                     uint32_t srcInterface,
                                     uint64_t dstDpid,
                                     uint32_t dstInterface)
{
    auto u = findOrAddSwitchNoLock(srcDpid);
    auto v = findOrAddSwitchNoLock(dstDpid);

    SwitchLinkProperties ep;
    ep.srcInterface = srcInterface;
    ep.dstInterface = dstInterface;
    boost::add_edge(u, v, ep, m_graph);

    m_internalPorts.insert(SwitchPort(srcDpid, srcInterface));
    m_internalPorts.insert(SwitchPort(dstDpid, dstInterface));
}

SwitchGraph::vertex_descriptor
StaticTopologyService::findOrAddSwitchNoLock(uint64_t dpid)
{
    auto it = m_dpidToVertex.find(dpid);
    if (it != m_dpidToVertex.end())
    {
        return it->second;
    }

    SwitchVertexProperties vp;
    vp.dpid = dpid;
    auto v = boost::add_vertex(vp, m_graph);
    m_dpidToVertex.emplace(dpid, v);
    return v;
}

bool
StaticTopologyService::isInternal(uint64_t dpid, uint32_t port) const
{
    std::shared_lock lock(m_graphMutex);
    return m_internalPorts.count(SwitchPort(dpid, port)) > 0;
}

size_t
StaticTopologyService::getSwitchCount() const
{
    std::shared_lock lock(m_graphMutex);
    return boost::num_vertices(m_graph);
}

size_t
StaticTopologyService::getLinkCount() const
{
    std::shared_lock lock(m_graphMutex);
    return boost::num_edges(m_graph);
}
