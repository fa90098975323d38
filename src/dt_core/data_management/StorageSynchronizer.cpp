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

#include "dt_core/data_management/StorageSynchronizer.hpp"
#include "dt_core/data_management/StorageSource.hpp" // for IStorageSource, StorageException
#include "dt_core/device_management/Device.hpp"      // for Device
#include "utils/Logger.hpp"                          // for Logger
#include <exception>                                 // for exception
#include <string>                                    // for string, to_string
#include <utility>                                   // for move

using json = nlohmann::json;

StorageSynchronizer::StorageSynchronizer(std::shared_ptr<IStorageSource> storage,
                                         std::chrono::milliseconds minUpdateInterval)
    : m_storage(std::move(storage)),
      m_minUpdateInterval(minUpdateInterval)
{
    if (!m_storage)
    {
        throw StorageException("StorageSynchronizer requires a storage source");
    }
    m_storage->createTable(DEVICE_TABLE_NAME, DEVICE_KEY_COLUMN_NAME);
}

StorageSynchronizer::~StorageSynchronizer()
{
    stop();
}

void
StorageSynchronizer::start()
{
    if (m_running.exchange(true))
    {
        return;
    }
    m_thread = std::thread(&StorageSynchronizer::run, this);
    SPDLOG_LOGGER_INFO(Logger::instance(), "StorageSynchronizer started.");
}

void
StorageSynchronizer::stop()
{
    m_running.store(false);
    m_cv.notify_all();
    if (m_thread.joinable())
    {
        m_thread.join();
        SPDLOG_LOGGER_INFO(Logger::instance(), "StorageSynchronizer stopped.");
    }
    flush();
}

void
StorageSynchronizer::onDeviceUpdated(const Device& device, bool structuralChange)
{
    const uint64_t key = device.getDeviceKey();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_removedKeys.count(key) || device.isRemoved())
        {
            return;
        }
        // Snapshot under m_mutex so the row queued last is the newest one
        auto row = device.toJson();
        const int64_t lastSeen = row.at("last_seen").get<int64_t>();
        auto written = m_lastWrittenSeenMs.find(key);
        bool due = structuralChange || written == m_lastWrittenSeenMs.end() ||
                   lastSeen - written->second >= m_minUpdateInterval.count();
        if (!due)
        {
            return;
        }
        m_lastWrittenSeenMs[key] = lastSeen;
        enqueueNoLock(key, std::move(row));
    }
    m_cv.notify_one();
}

void
StorageSynchronizer::onDeviceRemoved(uint64_t deviceKey)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_lastWrittenSeenMs.erase(deviceKey);
        m_removedKeys.insert(deviceKey);
        enqueueNoLock(deviceKey, std::nullopt);
    }
    m_cv.notify_one();
}

std::vector<json>
StorageSynchronizer::loadDevices() const
{
    try
    {
        return m_storage->getAllRows(DEVICE_TABLE_NAME);
    }
    catch (const StorageException&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        throw StorageException(std::string("Reading device table failed: ") + e.what());
    }
}

void
StorageSynchronizer::flush()
{
    if (m_running.load())
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_drainedCv.wait(lock, [this] { return m_order.empty() && m_inFlight == 0; });
        return;
    }

    // No writer thread: apply inline, one flusher at a time to keep rows in queue order
    std::lock_guard<std::mutex> flushLock(m_inlineFlushMutex);
    while (true)
    {
        uint64_t key;
        std::optional<json> row;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_order.empty())
            {
                break;
            }
            key = m_order.front();
            m_order.pop_front();
            row = std::move(m_pending[key]);
            m_pending.erase(key);
        }
        applyPending(key, row);
        if (!row)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            forgetRemovedNoLock(key);
        }
    }
}

size_t
StorageSynchronizer::getPendingCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_order.size();
}

size_t
StorageSynchronizer::getRemovedKeyCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_removedKeys.size();
}

void
StorageSynchronizer::run()
{
    while (true)
    {
        uint64_t key;
        std::optional<json> row;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return !m_running.load() || !m_order.empty(); });
            if (m_order.empty())
            {
                break;
            }
            key = m_order.front();
            m_order.pop_front();
            row = std::move(m_pending[key]);
            m_pending.erase(key);
            ++m_inFlight;
        }

        applyPending(key, row);

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            --m_inFlight;
            if (!row)
            {
                forgetRemovedNoLock(key);
            }
        }
        m_drainedCv.notify_all();
    }
    m_drainedCv.notify_all();
}

void
StorageSynchronizer::applyPending(uint64_t deviceKey, const std::optional<json>& row)
{
    try
    {
        if (row)
        {
            m_storage->upsertRow(DEVICE_TABLE_NAME, *row);
        }
        else
        {
            m_storage->deleteRow(DEVICE_TABLE_NAME, std::to_string(deviceKey));
        }
        m_writeCount.fetch_add(1);
    }
    catch (const std::exception& e)
    {
        m_failureCount.fetch_add(1);
        SPDLOG_LOGGER_ERROR(Logger::instance(),
                            "Storage write for device {} failed: {}",
                            deviceKey,
                            e.what());
    }
}

void
StorageSynchronizer::enqueueNoLock(uint64_t deviceKey, std::optional<json> row)
{
    auto it = m_pending.find(deviceKey);
    if (it != m_pending.end())
    {
        it->second = std::move(row);
        return;
    }
    m_pending.emplace(deviceKey, std::move(row));
    m_order.push_back(deviceKey);
}

void
StorageSynchronizer::forgetRemovedNoLock(uint64_t deviceKey)
{
    // A delete queued again while the previous one was being written keeps its tombstone
    if (m_pending.count(deviceKey) == 0)
    {
        m_removedKeys.erase(deviceKey);
    }
}
