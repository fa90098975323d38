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

// utils/ConfigLoader.hpp
#pragma once

#include <cstdint>           // for int64_t
#include <nlohmann/json.hpp> // for json
#include <optional>          // for optional
#include <string>            // for string

/**
 * @brief Runtime settings of the tracker, every field defaulting to AppConfig.
 *
 * @code
 * {
 *   "storage_dir": "devtrack_storage",
 *   "topology_file": "topology.json",
 *   "storage_update_interval_ms": 300000,
 *   "flap_cooldown_ms": 5000,
 *   "device_timeout_ms": 3600000,
 *   "old_attachment_point_timeout_ms": 3600000,
 *   "aging_interval_s": 15,
 *   "dispatcher_queue_limit": 4096,
 *   "classifier": {"type": "default"}
 * }
 * @endcode
 */
struct TrackerConfig
{
    std::string storageDir;
    std::string topologyFile;
    int64_t storageUpdateIntervalMs;
    int64_t flapCooldownMs;
    int64_t deviceTimeoutMs;
    int64_t oldAttachmentPointTimeoutMs;
    int64_t agingIntervalS;
    size_t dispatcherQueueLimit;
    nlohmann::json classifier;

    TrackerConfig();
};

void from_json(const nlohmann::json& j, TrackerConfig& cfg);
void to_json(nlohmann::json& j, const TrackerConfig& cfg);

/**
 * @brief Parse the --config flag out of the command line.
 *
 * Other arguments are ignored so the caller can parse its own flags from the same argv.
 */
std::optional<std::string> parseConfigPathArg(int argc, char* argv[]);

/**
 * @brief Read a TrackerConfig from a JSON file.
 *
 * @throws std::runtime_error if the file cannot be opened or parsed, std::invalid_argument on
 *         out-of-range values.
 */
TrackerConfig loadTrackerConfig(const std::string& path);
