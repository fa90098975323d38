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
#include "common_types/PacketTypes.hpp"
#include "dt_core/classification/EntityClassifier.hpp"
#include "dt_core/collection/PacketInDispatcher.hpp"
#include "dt_core/data_management/DeviceAgingManager.hpp"
#include "dt_core/data_management/JsonFileStorageSource.hpp"
#include "dt_core/data_management/StorageSynchronizer.hpp"
#include "dt_core/device_management/AttachmentPointTracker.hpp"
#include "dt_core/device_management/DeviceRegistry.hpp"
#include "dt_core/device_management/PortChannelConfig.hpp"
#include "dt_core/topology/TopologyService.hpp"
#include "event_system/EventBus.hpp"
#include "event_system/PayloadTypes.hpp"
#include "setting/AppConfig.hpp"
#include "utils/ConfigLoader.hpp"
#include "utils/Logger.hpp"
#include "utils/Utils.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

static std::atomic<bool> gShutdownRequested{false};

void
handleSigint(int)
{
    gShutdownRequested.store(true);
}

std::optional<std::string>
parseReplayArg(int argc, char* argv[])
{
    for (int i = 1; i < argc - 1; ++i)
    {
        if (std::string(argv[i]) == "--replay")
        {
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

std::vector<PacketInObservation>
readReplayFile(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        throw std::runtime_error("Cannot open replay file " + path);
    }
    json records;
    file >> records;

    auto observations = records.get<std::vector<PacketInObservation>>();
    const int64_t now = utils::getCurrentTimeMillisSystemClock();
    for (auto& obs : observations)
    {
        if (obs.timestampMs == 0)
        {
            obs.timestampMs = now;
        }
    }
    return observations;
}

void
registerEventLogging(EventBus& eventBus)
{
    eventBus.registerHandler(EventType::DeviceMoved, [](const Event& event) {
        const auto& p = std::any_cast<const DeviceEventPayload&>(event.payload);
        SPDLOG_LOGGER_DEBUG(Logger::instance(),
                            "[event] device {} moved to {}:{}",
                            p.deviceKey,
                            utils::dpidToString(p.currentAttachmentPoint->switchDpid),
                            p.currentAttachmentPoint->port);
    });
    eventBus.registerHandler(EventType::DeviceIpv4Changed, [](const Event& event) {
        const auto& p = std::any_cast<const DeviceEventPayload&>(event.payload);
        SPDLOG_LOGGER_DEBUG(Logger::instance(),
                            "[event] device {} has ip {}",
                            p.deviceKey,
                            utils::ipToString(*p.ipv4Address));
    });
}

int
main(int argc, char* argv[])
{
    auto logCfg = Logger::parse_cli_args(argc, argv);
    Logger::init(logCfg);
    SPDLOG_LOGGER_INFO(Logger::instance(), "Logger Loads Successfully!");

    std::signal(SIGINT, handleSigint);
    std::signal(SIGTERM, handleSigint);

    TrackerConfig cfg;
    std::shared_ptr<dtClassifier::IEntityClassifier> classifier;
    try
    {
        auto configPath = parseConfigPathArg(argc, argv);
        if (!configPath && std::filesystem::exists(AppConfig::CONFIG_FILE))
        {
            configPath = AppConfig::CONFIG_FILE;
        }
        if (configPath)
        {
            cfg = loadTrackerConfig(*configPath);
        }
        classifier = dtClassifier::makeEntityClassifier(cfg.classifier);
    }
    catch (const std::exception& e)
    {
        SPDLOG_LOGGER_CRITICAL(Logger::instance(), "Invalid configuration: {}", e.what());
        return 1;
    }

    auto eventBus = std::make_shared<EventBus>();
    registerEventLogging(*eventBus);

    auto topology = std::make_shared<StaticTopologyService>();
    auto portChannels = std::make_shared<PortChannelConfig>();
    std::shared_ptr<StorageSynchronizer> storageSync;
    std::shared_ptr<DeviceRegistry> registry;

    try
    {
        if (!cfg.topologyFile.empty())
        {
            topology->loadFromFile(cfg.topologyFile);
        }

        auto storage = std::make_shared<JsonFileStorageSource>(cfg.storageDir);
        storage->createTable(PortChannelConfig::TABLE_NAME, PortChannelConfig::ID_COLUMN_NAME);
        portChannels->loadFromStorage(*storage);

        storageSync = std::make_shared<StorageSynchronizer>(
            storage,
            std::chrono::milliseconds(cfg.storageUpdateIntervalMs));

        auto tracker = std::make_shared<AttachmentPointTracker>(
            topology,
            portChannels,
            std::chrono::milliseconds(cfg.flapCooldownMs));

        registry = std::make_shared<DeviceRegistry>(classifier, tracker, eventBus, storageSync);
        registry->loadFromStorage();
    }
    catch (const std::exception& e)
    {
        SPDLOG_LOGGER_CRITICAL(Logger::instance(), "Startup aborted: {}", e.what());
        return 1;
    }

    auto dispatcher = std::make_shared<PacketInDispatcher>(registry, cfg.dispatcherQueueLimit);
    auto agingManager = std::make_unique<DeviceAgingManager>(
        registry,
        std::chrono::milliseconds(cfg.deviceTimeoutMs),
        std::chrono::milliseconds(cfg.oldAttachmentPointTimeoutMs),
        std::chrono::seconds(cfg.agingIntervalS));

    storageSync->start();
    dispatcher->start();
    agingManager->start();

    SPDLOG_LOGGER_INFO(Logger::instance(),
                       "DevTrack running: {} devices, {} inter-switch links, {} port-channel ports",
                       registry->getDeviceCount(),
                       topology->getLinkCount(),
                       portChannels->size());

    int exitCode = 0;
    if (auto replayPath = parseReplayArg(argc, argv))
    {
        try
        {
            auto observations = readReplayFile(*replayPath);
            size_t queued = 0;
            for (auto& obs : observations)
            {
                if (dispatcher->enqueue(std::move(obs)))
                {
                    ++queued;
                }
            }
            dispatcher->waitIdle();
            SPDLOG_LOGGER_INFO(Logger::instance(),
                               "Replay done: {}/{} queued, {} processed, {} rejected, {} dropped, "
                               "{} devices",
                               queued,
                               observations.size(),
                               dispatcher->getProcessedCount(),
                               dispatcher->getRejectedCount(),
                               dispatcher->getDroppedCount(),
                               registry->getDeviceCount());
        }
        catch (const std::exception& e)
        {
            SPDLOG_LOGGER_ERROR(Logger::instance(), "Replay failed: {}", e.what());
            exitCode = 1;
        }
    }
    else
    {
        while (!gShutdownRequested.load())
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        SPDLOG_LOGGER_INFO(Logger::instance(), "Shutdown requested. Cleaning up...");
    }

    dispatcher->stop();
    agingManager->stop();
    storageSync->stop();

    SPDLOG_LOGGER_INFO(Logger::instance(),
                       "All subsystems stopped. {} storage writes, {} failures. Exiting.",
                       storageSync->getWriteCount(),
                       storageSync->getFailureCount());

    return exitCode;
}
