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

// dt_core/data_management/StorageSynchronizer.hpp
#pragma once

#include <atomic>             // for atomic
#include <chrono>             // for milliseconds
#include <condition_variable> // for condition_variable
#include <cstdint>            // for uint64_t, int64_t
#include <deque>              // for deque
#include <memory>             // for shared_ptr
#include <mutex>              // for mutex
#include <nlohmann/json.hpp>  // for json
#include <optional>           // for optional
#include <thread>             // for thread
#include <unordered_map>      // for unordered_map
#include <unordered_set>      // for unordered_set
#include <vector>             // for vector

class Device;
class IStorageSource;

/**
 * @brief Mirrors the device set into the "device" table.
 *
 * Updates are filtered (structural change, or lastSeen advanced by at least the minimum update
 * interval since the last write), coalesced per device and written by a background thread.
 * Failed writes are logged and counted; memory stays authoritative.
 */
class StorageSynchronizer
{
  public:
    static constexpr const char* DEVICE_TABLE_NAME = "device";
    static constexpr const char* DEVICE_KEY_COLUMN_NAME = "device_key";
    static constexpr std::chrono::milliseconds DEFAULT_MIN_UPDATE_INTERVAL{5 * 60 * 1000};

    /**
     * @throws StorageException if the device table cannot be created.
     */
    StorageSynchronizer(std::shared_ptr<IStorageSource> storage,
                        std::chrono::milliseconds minUpdateInterval = DEFAULT_MIN_UPDATE_INTERVAL);

    ~StorageSynchronizer();

    /// Start the writer thread. Without it, queued writes are applied by flush().
    void start();

    /// Drain the queue and join the writer thread.
    void stop();

    /**
     * @brief Called by the registry after every merge into @p device.
     *
     * Must not be called while holding the device lock. Updates for a removed device are
     * ignored.
     */
    void onDeviceUpdated(const Device& device, bool structuralChange);

    void onDeviceRemoved(uint64_t deviceKey);

    /**
     * @brief All stored device rows.
     * @throws StorageException on read failures.
     */
    std::vector<nlohmann::json> loadDevices() const;

    /// Block until every queued write was attempted.
    void flush();

    uint64_t getWriteCount() const
    {
        return m_writeCount.load();
    }

    uint64_t getFailureCount() const
    {
        return m_failureCount.load();
    }

    size_t getPendingCount() const;

    /// Removed devices whose delete has not been written yet.
    size_t getRemovedKeyCount() const;

  private:
    void run();
    void applyPending(uint64_t deviceKey, const std::optional<nlohmann::json>& row);
    void enqueueNoLock(uint64_t deviceKey, std::optional<nlohmann::json> row);
    void forgetRemovedNoLock(uint64_t deviceKey);

    std::shared_ptr<IStorageSource> m_storage;
    std::chrono::milliseconds m_minUpdateInterval;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_drainedCv;
    std::deque<uint64_t> m_order;
    std::unordered_map<uint64_t, std::optional<nlohmann::json>> m_pending; // nullopt = delete
    std::unordered_map<uint64_t, int64_t> m_lastWrittenSeenMs;
    std::unordered_set<uint64_t> m_removedKeys; // deletes not yet written
    std::mutex m_inlineFlushMutex;
    size_t m_inFlight = 0;

    std::atomic<bool> m_running{false};
    std::thread m_thread;
    std::atomic<uint64_t> m_writeCount{0};
    std::atomic<uint64_t> m_failureCount{0};
};
