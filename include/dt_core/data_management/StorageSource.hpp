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

// dt_core/data_management/StorageSource.hpp
#pragma once

#include <nlohmann/json.hpp> // for json
#include <optional>          // for optional
#include <stdexcept>         // for runtime_error
#include <string>            // for string
#include <vector>            // for vector

/**
 * @brief Raised by storage sources when a table cannot be read or written.
 */
class StorageException : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Row-oriented key/value table store.
 *
 * Rows are JSON objects. Every table has one primary-key column; its value (rendered as a
 * string when it is not one already) identifies the row.
 *
 * All operations throw StorageException on failure, including access to a table that was
 * never created.
 */
class IStorageSource
{
  public:
    virtual ~IStorageSource() = default;

    /// Create @p table if it does not exist yet. Existing rows are kept.
    virtual void createTable(const std::string& table, const std::string& primaryKeyColumn) = 0;

    /// Insert or replace the row identified by its primary-key column.
    virtual void upsertRow(const std::string& table, const nlohmann::json& row) = 0;

    /// Remove a row; removing a missing row is not an error.
    virtual void deleteRow(const std::string& table, const std::string& key) = 0;

    virtual std::optional<nlohmann::json> getRow(const std::string& table,
                                                 const std::string& key) const = 0;

    virtual std::vector<nlohmann::json> getAllRows(const std::string& table) const = 0;
};

/**
 * @brief Primary key of @p row as stored: the string itself, or the JSON dump of a number.
 *
 * @throws StorageException if the column is missing.
 */
inline std::string
storageRowKey(const nlohmann::json& row, const std::string& primaryKeyColumn)
{
    if (!row.is_object() || !row.contains(primaryKeyColumn))
    {
        throw StorageException("Row has no primary key column '" + primaryKeyColumn + "'");
    }
    const auto& value = row.at(primaryKeyColumn);
    if (value.is_string())
    {
        return value.get<std::string>();
    }
    return value.dump();
}
