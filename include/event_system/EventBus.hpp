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

#include <any>           // for any
#include <functional>    // for function
#include <mutex>         // for unique_lock
#include <shared_mutex>  // for shared_lock, shared_mutex
#include <unordered_map> // for unordered_map
#include <utility>       // for move
#include <vector>        // for vector

// Device lifecycle notifications emitted by the DeviceRegistry
enum class EventType
{
    DeviceAdded,       // 1. A new device was learned
    DeviceMoved,       // 2. A current attachment point was superseded by a port on the same switch
    DeviceIpv4Changed, // 3. A device gained an IPv4 address
    DeviceVlanChanged, // 4. A device gained a VLAN
    DeviceRemoved      // 5. A device was aged out
};

// Event structure containing type and payload
struct Event
{
    EventType type;
    std::any payload; // DeviceEventPayload for every device event
};

class EventBus
{
  public:
    using Handler = std::function<void(const Event&)>;

    // Register a handler for a specific event type
    void registerHandler(EventType type, Handler handler)
    {
        std::unique_lock lock(m_mutex);
        m_handlers[type].push_back(std::move(handler));
    }

    // Emit an event (synchronously calls all registered handlers)
    void emit(const Event& event) const
    {
        std::shared_lock lock(m_mutex);
        auto it = m_handlers.find(event.type);
        if (it != m_handlers.end())
        {
            for (const auto& handler : it->second)
            {
                handler(event);
            }
        }
    }

  private:
    mutable std::shared_mutex m_mutex;
    std::unordered_map<EventType, std::vector<Handler>> m_handlers;
};
