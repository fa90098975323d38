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

#include "utils/ConfigLoader.hpp"
#include "setting/AppConfig.hpp" // for AppConfig
#include "utils/Logger.hpp"      // for Logger
#include <fstream>               // for ifstream
#include <stdexcept>             // for runtime_error, invalid_argument

using json = nlohmann::json;

TrackerConfig::TrackerConfig()
    : storageDir(AppConfig::STORAGE_DIR),
      topologyFile(AppConfig::TOPOLOGY_FILE),
      storageUpdateIntervalMs(AppConfig::STORAGE_UPDATE_INTERVAL_MS),
      flapCooldownMs(AppConfig::FLAP_COOLDOWN_MS),
      deviceTimeoutMs(AppConfig::DEVICE_TIMEOUT_MS),
      oldAttachmentPointTimeoutMs(AppConfig::OLD_ATTACHMENT_POINT_TIMEOUT_MS),
      agingIntervalS(AppConfig::AGING_INTERVAL_S),
      dispatcherQueueLimit(AppConfig::DISPATCHER_QUEUE_LIMIT),
      classifier(json::object())
{
}

void
from_json(const json& j, TrackerConfig& cfg)
{
    cfg.storageDir = j.value("storage_dir", cfg.storageDir);
    cfg.topologyFile = j.value("topology_file", cfg.topologyFile);
    cfg.storageUpdateIntervalMs = j.value("storage_update_interval_ms", cfg.storageUpdateIntervalMs);
    cfg.flapCooldownMs = j.value("flap_cooldown_ms", cfg.flapCooldownMs);
    cfg.deviceTimeoutMs = j.value("device_timeout_ms", cfg.deviceTimeoutMs);
    cfg.oldAttachmentPointTimeoutMs =
        j.value("old_attachment_point_timeout_ms", cfg.oldAttachmentPointTimeoutMs);
    cfg.agingIntervalS = j.value("aging_interval_s", cfg.agingIntervalS);
    cfg.dispatcherQueueLimit = j.value("dispatcher_queue_limit", cfg.dispatcherQueueLimit);
    if (j.contains("classifier"))
    {
        cfg.classifier = j.at("classifier");
    }

    if (cfg.storageUpdateIntervalMs < 0 || cfg.flapCooldownMs < 0 || cfg.deviceTimeoutMs <= 0 ||
        cfg.oldAttachmentPointTimeoutMs <= 0 || cfg.agingIntervalS <= 0 ||
        cfg.dispatcherQueueLimit == 0)
    {
        throw std::invalid_argument("Tracker configuration has negative or zero intervals");
    }
}

void
to_json(json& j, const TrackerConfig& cfg)
{
    j = json{{"storage_dir", cfg.storageDir},
             {"topology_file", cfg.topologyFile},
             {"storage_update_interval_ms", cfg.storageUpdateIntervalMs},
             {"flap_cooldown_ms", cfg.flapCooldownMs},
             {"device_timeout_ms", cfg.deviceTimeoutMs},
             {"old_attachment_point_timeout_ms", cfg.oldAttachmentPointTimeoutMs},
             {"aging_interval_s", cfg.agingIntervalS},
             {"dispatcher_queue_limit", cfg.dispatcherQueueLimit},
             {"classifier", cfg.classifier}};
}

std::optional<std::string>
parseConfigPathArg(int argc, char* argv[])
{
    for (int i = 1; i < argc - 1; ++i)
    {
        if (std::string(argv[i]) == "--config")
        {
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

TrackerConfig
loadTrackerConfig(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        throw std::runtime_error("Cannot open config file " + path);
    }

    json j;
    try
    {
        file >> j;
    }
    catch (const json::parse_error& err)
    {
        throw std::runtime_error("Cannot parse config file " + path + ": " + err.what());
    }

    auto cfg = j.get<TrackerConfig>();
    SPDLOG_LOGGER_INFO(Logger::instance(), "Loaded configuration from {}", path);
    return cfg;
}
