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

#include "dt_core/data_management/JsonFileStorageSource.hpp"
#include "utils/Logger.hpp" // for Logger
#include <fstream>          // for ifstream, ofstream
#include <system_error>     // for error_code
#include <utility>          // for move

using json = nlohmann::json;

JsonFileStorageSource::JsonFileStorageSource(std::filesystem::path directory)
    : m_directory(std::move(directory))
{
    std::error_code ec;
    std::filesystem::create_directories(m_directory, ec);
    if (ec)
    {
        throw StorageException("Cannot create storage directory " + m_directory.string() + ": " +
                               ec.message());
    }
}

void
JsonFileStorageSource::createTable(const std::string& table, const std::string& primaryKeyColumn)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_tables.count(table))
    {
        return;
    }

    Table t;
    t.primaryKeyColumn = primaryKeyColumn;

    auto path = tablePath(table);
    if (std::filesystem::exists(path))
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            throw StorageException("Cannot open table file " + path.string());
        }
        try
        {
            json doc;
            file >> doc;
            for (const auto& [key, row] : doc.at("rows").items())
            {
                t.rows.emplace(key, row);
            }
        }
        catch (const json::exception& e)
        {
            throw StorageException("Corrupted table file " + path.string() + ": " + e.what());
        }
        SPDLOG_LOGGER_INFO(Logger::instance(),
                           "Loaded {} rows of table {} from {}",
                           t.rows.size(),
                           table,
                           path.string());
    }

    m_tables.emplace(table, std::move(t));
}

void
JsonFileStorageSource::upsertRow(const std::string& table, const json& row)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto& t = getTableNoLock(table);

    // The cache only changes once the file was replaced
    Table updated = t;
    updated.rows[storageRowKey(row, t.primaryKeyColumn)] = row;
    persistTableNoLock(table, updated);
    t = std::move(updated);
}

void
JsonFileStorageSource::deleteRow(const std::string& table, const std::string& key)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto& t = getTableNoLock(table);
    if (t.rows.count(key) == 0)
    {
        return;
    }

    Table updated = t;
    updated.rows.erase(key);
    persistTableNoLock(table, updated);
    t = std::move(updated);
}

std::filesystem::path
JsonFileStorageSource::tablePath(const std::string& table) const
{
    return m_directory / (table + ".json");
}

void
JsonFileStorageSource::persistTableNoLock(const std::string& table, const Table& t) const
{
    json doc;
    doc["primary_key"] = t.primaryKeyColumn;
    doc["rows"] = json::object();
    for (const auto& [key, row] : t.rows)
    {
        doc["rows"][key] = row;
    }

    auto path = tablePath(table);
    auto tmpPath = path;
    tmpPath += ".tmp";

    {
        std::ofstream ofs(tmpPath, std::ios::trunc);
        if (!ofs.is_open())
        {
            throw StorageException("Cannot write table file " + tmpPath.string());
        }
        ofs << doc.dump(2);
        if (!ofs.good())
        {
            throw StorageException("Short write on table file " + tmpPath.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmpPath, path, ec);
    if (ec)
    {
        throw StorageException("Cannot replace table file " + path.string() + ": " +
                               ec.message());
    }
}
