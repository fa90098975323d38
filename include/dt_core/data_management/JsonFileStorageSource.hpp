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

// dt_core/data_management/JsonFileStorageSource.hpp
#pragma once

#include "dt_core/data_management/MemoryStorageSource.hpp"
#include <filesystem> // for path

/**
 * @brief Table store persisted as one JSON document per table under a directory.
 *
 * Layout of <dir>/<table>.json:
 * @code
 * {"primary_key": "device_key", "rows": {"1": {...}, "2": {...}}}
 * @endcode
 *
 * Tables are cached in memory; every upsert/delete rewrites the whole table file through a
 * temporary file followed by a rename, so a crash leaves either the old or the new document.
 * A failed write leaves the cached table unchanged.
 */
class JsonFileStorageSource : public MemoryStorageSource
{
  public:
    /**
     * @throws StorageException if the directory cannot be created.
     */
    explicit JsonFileStorageSource(std::filesystem::path directory);

    /**
     * @brief Create the table, loading existing rows from disk.
     *
     * @throws StorageException if an existing table file cannot be parsed.
     */
    void createTable(const std::string& table, const std::string& primaryKeyColumn) override;
    void upsertRow(const std::string& table, const nlohmann::json& row) override;
    void deleteRow(const std::string& table, const std::string& key) override;

  private:
    std::filesystem::path tablePath(const std::string& table) const;
    void persistTableNoLock(const std::string& table, const Table& t) const;

    std::filesystem::path m_directory;
};
