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

#include "dt_core/collection/PacketInDispatcher.hpp"
#include "dt_core/device_management/DeviceRegistry.hpp" // for DeviceRegistry, DeviceConsistencyError
#include "utils/Logger.hpp"                             // for Logger
#include "utils/Utils.hpp"                              // for dpidToString

PacketInDispatcher::PacketInDispatcher(std::shared_ptr<DeviceRegistry> registry, size_t queueLimit)
    : m_registry(std::move(registry)),
      m_queueLimit(queueLimit)
{
}

PacketInDispatcher::~PacketInDispatcher()
{
    stop();
}

void
PacketInDispatcher::start()
{
    m_running = true;
}

void
PacketInDispatcher::stop()
{
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        m_running = false;
    }
    m_cv.notify_all();
    for (auto& [dpid, th] : m_workers)
    {
        if (th.joinable())
        {
            th.join();
        }
    }
    m_workers.clear();
}

bool
PacketInDispatcher::enqueue(PacketInObservation observation)
{
    const uint64_t dpid = observation.switchDpid;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        if (!m_running)
        {
            m_dropped.fetch_add(1);
            return false;
        }

        auto& q = m_queues[dpid];
        if (q.size() >= m_queueLimit)
        {
            auto dropped = m_dropped.fetch_add(1) + 1;
            if (dropped % 1000 == 1)
            {
                SPDLOG_LOGGER_WARN(Logger::instance(),
                                   "Packet-in queue of {} full, {} observations dropped so far",
                                   utils::dpidToString(dpid),
                                   dropped);
            }
            return false;
        }
        q.push_back(std::move(observation));

        if (!m_workers.count(dpid))
        {
            // spawn worker lazily per DPID
            m_workers[dpid] = std::thread(&PacketInDispatcher::workerLoop, this, dpid);
        }
    }
    m_cv.notify_all();
    return true;
}

DevicePtr
PacketInDispatcher::processPacketIn(const PacketInObservation& observation)
{
    auto entity = m_normalizer.normalize(observation);
    if (!entity)
    {
        m_rejected.fetch_add(1);
        return nullptr;
    }

    try
    {
        auto device = m_registry->learnDeviceByEntity(*entity);
        m_processed.fetch_add(1);
        return device;
    }
    catch (const DeviceConsistencyError& e)
    {
        m_errors.fetch_add(1);
        SPDLOG_LOGGER_ERROR(Logger::instance(),
                            "Dropping observation from {}:{}: {}",
                            utils::dpidToString(observation.switchDpid),
                            observation.inPort,
                            e.what());
        return nullptr;
    }
}

void
PacketInDispatcher::waitIdle()
{
    std::unique_lock<std::mutex> lk(m_mutex);
    m_idleCv.wait(lk, [this] { return allIdleNoLock(); });
}

void
PacketInDispatcher::workerLoop(uint64_t dpid)
{
    while (true)
    {
        PacketInObservation observation;
        {
            std::unique_lock<std::mutex> lk(m_mutex);
            m_cv.wait(lk, [&] { return !m_running || !m_queues[dpid].empty(); });
            auto& q = m_queues[dpid];
            if (!m_running && q.empty())
            {
                break;
            }
            observation = std::move(q.front());
            q.pop_front();
            ++m_busy;
        }

        try
        {
            processPacketIn(observation);
        }
        catch (const std::exception& e)
        {
            m_errors.fetch_add(1);
            SPDLOG_LOGGER_ERROR(Logger::instance(),
                                "Packet-in worker of {} failed: {}",
                                utils::dpidToString(dpid),
                                e.what());
        }

        {
            std::lock_guard<std::mutex> lk(m_mutex);
            --m_busy;
        }
        m_idleCv.notify_all();
    }
    m_idleCv.notify_all();
}

bool
PacketInDispatcher::allIdleNoLock() const
{
    if (m_busy > 0)
    {
        return false;
    }
    for (const auto& [dpid, q] : m_queues)
    {
        if (!q.empty())
        {
            return false;
        }
    }
    return true;
}
