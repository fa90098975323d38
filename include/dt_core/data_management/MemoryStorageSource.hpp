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

// dt_core/data_management/MemoryStorageSource.hpp
#pragma once

#include "dt_core/data_management/StorageSource.hpp"
#include <map>   // for map
#include <mutex> // for mutex

/**
 * @brief In-process table store. Nothing survives the process.
 */
class MemoryStorageSource : public IStorageSource
{
  public:
    void createTable(const std::string& table, const std::string& primaryKeyColumn) override;
    void upsertRow(const std::string& table, const nlohmann::json& row) override;
    void deleteRow(const std::string& table, const std::string& key) override;
    std::optional<nlohmann::json> getRow(const std::string& table,
                                         const std::string& key) const override;
    std::vector<nlohmann::json> getAllRows(const std::string& table) const override;

  protected:
    struct Table
    {
        std::string primaryKeyColumn;
        std::map<std::string, nlohmann::json> rows;
    };

    Table& getTableNoLock(const std::string& table);
    const Table& getTableNoLock(const std::string& table) const;

    mutable std::mutex m_mutex;
    std::map<std::string, Table> m_tables;
};
