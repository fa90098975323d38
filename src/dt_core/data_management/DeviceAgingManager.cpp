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

#include "dt_core/data_management/DeviceAgingManager.hpp"
#include "dt_core/device_management/DeviceRegistry.hpp" // for DeviceRegistry
#include "utils/Logger.hpp"                             // for Logger
#include "utils/Utils.hpp"                              // for getCurrentTimeMillisSystemClock
#include <exception>                                    // for exception
#include <utility>                                      // for move

DeviceAgingManager::DeviceAgingManager(std::shared_ptr<DeviceRegistry> registry,
                                       std::chrono::milliseconds deviceTimeout,
                                       std::chrono::milliseconds oldAttachmentPointTimeout,
                                       std::chrono::seconds interval,
                                       ClockFn clock)
    : m_registry(std::move(registry)),
      m_deviceTimeout(deviceTimeout),
      m_oldAttachmentPointTimeout(oldAttachmentPointTimeout),
      m_interval(interval),
      m_clock(clock ? std::move(clock) : ClockFn(utils::getCurrentTimeMillisSystemClock))
{
}

DeviceAgingManager::~DeviceAgingManager()
{
    stop();
}

void
DeviceAgingManager::start()
{
    if (m_running.exchange(true))
    {
        return;
    }
    m_thread = std::thread(&DeviceAgingManager::run, this);
    SPDLOG_LOGGER_INFO(Logger::instance(), "DeviceAgingManager started.");
}

void
DeviceAgingManager::stop()
{
    m_running.store(false);
    if (m_thread.joinable())
    {
        m_thread.join();
        SPDLOG_LOGGER_INFO(Logger::instance(), "DeviceAgingManager stopped.");
    }
}

size_t
DeviceAgingManager::runOnce()
{
    const int64_t now = m_clock();

    auto removed = m_registry->removeExpiredDevices(now, m_deviceTimeout.count());
    auto expiredAps =
        m_registry->expireOldAttachmentPoints(now, m_oldAttachmentPointTimeout.count());

    if (!removed.empty() || expiredAps > 0)
    {
        SPDLOG_LOGGER_INFO(Logger::instance(),
                           "Aging pass: {} devices removed, {} old attachment points dropped",
                           removed.size(),
                           expiredAps);
    }
    return removed.size();
}

void
DeviceAgingManager::run()
{
    while (m_running.load())
    {
        try
        {
            runOnce();
        }
        catch (const std::exception& e)
        {
            SPDLOG_LOGGER_ERROR(Logger::instance(), "Aging pass failed: {}", e.what());
        }

        // Sleep until next interval (or until stop() is called)
        for (int i = 0; i < m_interval.count() * 10 && m_running.load(); ++i)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }
}
