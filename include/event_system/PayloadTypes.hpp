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

#include "common_types/DeviceTypes.hpp"
#include <cstdint>
#include <optional>

// Payload structure for every device lifecycle event
struct DeviceEventPayload
{
    uint64_t deviceKey;
    uint64_t macAddress;
    std::optional<SwitchPort> previousAttachmentPoint; // DeviceMoved only
    std::optional<SwitchPort> currentAttachmentPoint;  // DeviceAdded, DeviceMoved
    std::optional<uint32_t> ipv4Address;               // DeviceIpv4Changed
    std::optional<uint16_t> vlan;                      // DeviceVlanChanged
};
