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
#include "common_types/PacketTypes.hpp"            // for PacketInObservation
#include "dt_core/collection/EntityNormalizer.hpp" // for EntityNormalizer
#include "dt_core/device_management/Device.hpp"    // for DevicePtr
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

class DeviceRegistry;

/**
 * @brief Feeds packet-in observations through normalizer and registry.
 *
 * One bounded queue and one lazily spawned worker per switch, so observations of one switch
 * are processed in arrival order while switches run in parallel.
 */
class PacketInDispatcher
{
  public:
    static constexpr size_t DEFAULT_QUEUE_LIMIT = 4096;

    PacketInDispatcher(std::shared_ptr<DeviceRegistry> registry,
                       size_t queueLimit = DEFAULT_QUEUE_LIMIT);
    ~PacketInDispatcher();

    void start();
    void stop();

    /**
     * @brief Queue an observation on its switch's worker.
     * @return false if the dispatcher is stopped or the switch queue is full (counted as dropped).
     */
    bool enqueue(PacketInObservation observation);

    /**
     * @brief Run the pipeline on the calling thread.
     * @return the device the observation was merged into, null if it was rejected.
     */
    DevicePtr processPacketIn(const PacketInObservation& observation);

    /// Block until every queue is empty and no worker is busy.
    void waitIdle();

    uint64_t getProcessedCount() const
    {
        return m_processed.load();
    }

    uint64_t getRejectedCount() const
    {
        return m_rejected.load();
    }

    uint64_t getDroppedCount() const
    {
        return m_dropped.load();
    }

    uint64_t getErrorCount() const
    {
        return m_errors.load();
    }

  private:
    void workerLoop(uint64_t dpid);
    bool allIdleNoLock() const;

    std::shared_ptr<DeviceRegistry> m_registry;
    EntityNormalizer m_normalizer;
    size_t m_queueLimit;

    // One queue per DPID
    std::unordered_map<uint64_t, std::deque<PacketInObservation>> m_queues;
    std::unordered_map<uint64_t, std::thread> m_workers;
    size_t m_busy = 0;

    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    std::atomic<bool> m_running{false};

    std::atomic<uint64_t> m_processed{0};
    std::atomic<uint64_t> m_rejected{0};
    std::atomic<uint64_t> m_dropped{0};
    std::atomic<uint64_t> m_errors{0};
};
