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

#include "dt_core/data_management/MemoryStorageSource.hpp"

using json = nlohmann::json;

void
MemoryStorageSource::createTable(const std::string& table, const std::string& primaryKeyColumn)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto& t = m_tables[table];
    t.primaryKeyColumn = primaryKeyColumn;
}

void
MemoryStorageSource::upsertRow(const std::string& table, const json& row)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto& t = getTableNoLock(table);
    t.rows[storageRowKey(row, t.primaryKeyColumn)] = row;
}

void
MemoryStorageSource::deleteRow(const std::string& table, const std::string& key)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    getTableNoLock(table).rows.erase(key);
}

std::optional<json>
MemoryStorageSource::getRow(const std::string& table, const std::string& key) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto& t = getTableNoLock(table);
    auto it = t.rows.find(key);
    if (it == t.rows.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::vector<json>
MemoryStorageSource::getAllRows(const std::string& table) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<json> rows;
    for (const auto& [key, row] : getTableNoLock(table).rows)
    {
        rows.push_back(row);
    }
    return rows;
}

MemoryStorageSource::Table&
MemoryStorageSource::getTableNoLock(const std::string& table)
{
    auto it = m_tables.find(table);
    if (it == m_tables.end())
    {
        throw StorageException("Unknown table: " + table);
    }
    return it->second;
}

const MemoryStorageSource::Table&
MemoryStorageSource::getTableNoLock(const std::string& table) const
{
    auto it = m_tables.find(table);
    if (it == m_tables.end())
    {
        throw StorageException("Unknown table: " + table);
    }
    return it->second;
}
