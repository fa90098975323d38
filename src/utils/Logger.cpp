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

#include "utils/Logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h> // for rotating_file_sink_mt
#include <spdlog/sinks/stdout_color_sinks.h> // for stdout_color_sink_mt
#include <filesystem>                        // for create_directories
#include <vector>                            // for vector

std::shared_ptr<spdlog::logger> Logger::m_logger;
std::mutex Logger::m_initMutex;

namespace
{
constexpr const char* LOGGER_NAME = "devtrack";
constexpr const char* LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] [%s:%#] %v";
constexpr size_t LOG_FILE_MAX_BYTES = 10 * 1024 * 1024;
constexpr size_t LOG_FILE_MAX_FILES = 5;
} // namespace

spdlog::level::level_enum
Logger::parse_level(const std::string& name)
{
    if (name == "trace")
    {
        return spdlog::level::trace;
    }
    if (name == "debug")
    {
        return spdlog::level::debug;
    }
    if (name == "info")
    {
        return spdlog::level::info;
    }
    if (name == "warn" || name == "warning")
    {
        return spdlog::level::warn;
    }
    if (name == "err" || name == "error")
    {
        return spdlog::level::err;
    }
    if (name == "critical")
    {
        return spdlog::level::critical;
    }
    if (name == "off")
    {
        return spdlog::level::off;
    }
    return spdlog::level::info;
}

LogConfig
Logger::parse_cli_args(int argc, char* argv[])
{
    LogConfig cfg;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--log-level" && i + 1 < argc)
        {
            cfg.level = parse_level(argv[++i]);
        }
        else if (arg == "--log-file")
        {
            cfg.enableFile = true;
            if (i + 1 < argc && argv[i + 1][0] != '-')
            {
                cfg.filePath = argv[++i];
            }
        }
    }
    return cfg;
}

void
Logger::init(const LogConfig& cfg)
{
    std::lock_guard<std::mutex> lock(m_initMutex);

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (cfg.enableFile)
    {
        auto parent = std::filesystem::path(cfg.filePath).parent_path();
        if (!parent.empty())
        {
            std::filesystem::create_directories(parent);
        }
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(cfg.filePath,
                                                                               LOG_FILE_MAX_BYTES,
                                                                               LOG_FILE_MAX_FILES));
    }

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_pattern(LOG_PATTERN);
    logger->set_level(cfg.level);
    logger->flush_on(spdlog::level::warn);

    m_logger = logger;
}

std::shared_ptr<spdlog::logger>
Logger::instance()
{
    {
        std::lock_guard<std::mutex> lock(m_initMutex);
        if (m_logger)
        {
            return m_logger;
        }
    }
    init(LogConfig{});
    std::lock_guard<std::mutex> lock(m_initMutex);
    return m_logger;
}
