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

// dt_core/data_management/DeviceAgingManager.hpp
#pragma once

#include <atomic>           // for atomic
#include <chrono>           // for seconds, milliseconds
#include <cstdint>          // for int64_t
#include <functional>       // for function
#include <memory>           // for shared_ptr
#include <thread>           // for thread
class DeviceRegistry;

/**
 * @brief Periodically ages out idle devices and stale old attachment points.
 */
class DeviceAgingManager
{
  public:
    static constexpr std::chrono::seconds DEFAULT_INTERVAL{15};

    using ClockFn = std::function<int64_t()>;

    /**
     * @param registry                Registry to age.
     * @param deviceTimeout           Devices idle longer than this are removed.
     * @param oldAttachmentPointTimeout Old attachment points idle longer than this are dropped.
     * @param interval                Interval between passes.
     * @param clock                   Current time in ms (defaults to the system clock).
     */
    DeviceAgingManager(std::shared_ptr<DeviceRegistry> registry,
                       std::chrono::milliseconds deviceTimeout,
                       std::chrono::milliseconds oldAttachmentPointTimeout,
                       std::chrono::seconds interval = DEFAULT_INTERVAL,
                       ClockFn clock = nullptr);

    ~DeviceAgingManager();

    /// Start the aging thread.
    void start();

    /// Request shutdown and join the thread.
    void stop();

    /// One aging pass; returns the number of devices removed.
    size_t runOnce();

  private:
    /// Main loop executed in the background thread.
    void run();

    std::shared_ptr<DeviceRegistry> m_registry;
    std::chrono::milliseconds m_deviceTimeout;
    std::chrono::milliseconds m_oldAttachmentPointTimeout;
    std::chrono::seconds m_interval;
    ClockFn m_clock;
    std::atomic<bool> m_running{false};
    std::thread m_thread;
};
