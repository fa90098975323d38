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

/*
 * spdlog Log Levels:
 *   trace     - Per-packet pipeline decisions (normalizer rejects, index hits).
 *   debug     - Device merges, attachment point refreshes, storage writes.
 *   info      - Device creation, moves, startup and shutdown of subsystems.
 *   warn      - Suppressed flaps, dropped observations, classifier fallbacks.
 *   err       - Storage write failures, consistency errors.
 *   critical  - Startup aborts (storage baseline unreadable).
 *   off       - Disables logging.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <string>

/**
 * @brief Runtime logging configuration options for the global logger.
 *
 * enableFile adds a rotating file sink at filePath.
 * level selects the minimum log severity that will be emitted.
 */
struct LogConfig
{
    bool enableFile = false;
    std::string filePath = "logs/devtrack.log";
    spdlog::level::level_enum level = spdlog::level::info;
};

/**
 * @brief Centralized spdlog wrapper providing a process-wide logger instance.
 *
 * Usage:
 *  - Call Logger::init(cfg) once at program startup.
 *  - Use Logger::instance() anywhere to log via SPDLOG_LOGGER_* macros.
 *
 * Threading:
 *  - spdlog loggers are thread-safe (the _mt sinks are used).
 *  - instance() creates a console-only logger on first use when init() was never called,
 *    which is what unit tests rely on.
 */
class Logger
{
  public:
    /**
     * @brief Convert a textual log level into a spdlog level enum.
     *
     * @param name "trace", "debug", "info", "warn", "err"/"error", "critical" or "off".
     * @return Corresponding spdlog level; unknown names map to info.
     */
    static spdlog::level::level_enum parse_level(const std::string& name);

    /**
     * @brief Parse the logging flags out of the command line.
     *
     * Recognized: --log-level <name>, --log-file [path]. Other arguments are ignored so the
     * caller can parse its own flags from the same argv.
     */
    static LogConfig parse_cli_args(int argc, char* argv[]);

    /**
     * @brief Initialize (or re-initialize) the global logger instance.
     */
    static void init(const LogConfig& cfg);

    /**
     * @brief Access the global logger instance.
     */
    static std::shared_ptr<spdlog::logger> instance();

  private:
    static std::shared_ptr<spdlog::logger> m_logger;
    static std::mutex m_initMutex;
};
