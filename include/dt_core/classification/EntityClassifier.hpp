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

#pragma once

#include "common_types/DeviceTypes.hpp" // for Entity, EntityFieldSet
#include <cstdint>                      // for uint64_t
#include <memory>                       // for shared_ptr
#include <nlohmann/json.hpp>            // for json
#include <string>                       // for string
#include <vector>                       // for vector

namespace dtClassifier
{
/**
 * @file EntityClassifier.hpp
 * @brief Entity classes and the pluggable classifier that assigns them.
 *
 * @details
 * An entity class partitions the identity space: two entities can only end up in the same
 * device when they were assigned the same class set. Each class also names the key fields it
 * cares about.
 *
 * Classifiers are independent implementations of IEntityClassifier selected by configuration;
 * none of them extends another.
 */

/**
 * @brief A classifier-assigned partition label.
 *
 * Classes compare by name.
 */
class IEntityClass
{
  public:
    virtual ~IEntityClass() = default;

    virtual std::string getName() const = 0;

    virtual EntityFieldSet getKeyFields() const = 0;
};

using EntityClassPtr = std::shared_ptr<const IEntityClass>;

/** @brief Class set of one device, ordered by class name, no duplicates. */
using EntityClassSet = std::vector<EntityClassPtr>;

/**
 * @brief Maps an entity to the classes it belongs to.
 *
 * Both operations are pure functions of the classifier configuration and the entity.
 */
class IEntityClassifier
{
  public:
    virtual ~IEntityClassifier() = default;

    /**
     * @brief Classes for @p entity.
     *
     * An empty result is a configuration fault; callers pass the result through
     * normalizeClassSet() which substitutes the default class.
     */
    virtual EntityClassSet classifyEntity(const Entity& entity) const = 0;

    /** @brief Fields used for equality and merge decisions. */
    virtual EntityFieldSet getKeyFields() const = 0;
};

/** @brief Name of the single global class. */
inline constexpr const char* DEFAULT_ENTITY_CLASS_NAME = "DefaultEntityClass";

/** @brief {MAC, VLAN} */
EntityFieldSet defaultKeyFields();

/** @brief The process-wide default class instance. */
EntityClassPtr defaultEntityClass();

/**
 * @brief Class rebuilt from a persisted (name, key fields) pair, or created by configuration.
 */
class StoredEntityClass : public IEntityClass
{
  public:
    StoredEntityClass(std::string name, EntityFieldSet keyFields);

    std::string getName() const override;
    EntityFieldSet getKeyFields() const override;

  private:
    std::string m_name;
    EntityFieldSet m_keyFields;
};

/**
 * @brief Places every entity in the default class; key fields {MAC, VLAN}.
 */
class DefaultEntityClassifier : public IEntityClassifier
{
  public:
    EntityClassSet classifyEntity(const Entity& entity) const override;
    EntityFieldSet getKeyFields() const override;
};

/**
 * @brief One configured switch range and the class it maps to.
 */
struct SwitchPartition
{
    std::string className;
    uint64_t minDpid = 0;
    uint64_t maxDpid = UINT64_MAX;
};

/**
 * @brief Partitions entities by the switch they were observed on.
 *
 * An entity whose switch falls into one or more configured ranges belongs to each matching
 * partition class; otherwise it belongs to the default class.
 */
class SwitchPartitionEntityClassifier : public IEntityClassifier
{
  public:
    SwitchPartitionEntityClassifier(std::vector<SwitchPartition> partitions,
                                    EntityFieldSet keyFields);

    EntityClassSet classifyEntity(const Entity& entity) const override;
    EntityFieldSet getKeyFields() const override;

  private:
    std::vector<std::pair<SwitchPartition, EntityClassPtr>> m_partitions;
    EntityFieldSet m_keyFields;
};

/**
 * @brief Drop null members, de-duplicate by name and sort by name.
 *
 * Falls back to {defaultEntityClass()} (and logs a warning) when nothing is left.
 */
EntityClassSet normalizeClassSet(EntityClassSet classes);

/** @brief Comma-joined class names of a normalized set, used as index component. */
std::string classSetSignature(const EntityClassSet& classes);

/** @brief Build a classifier from the "classifier" section of the configuration file.
 *
 * @code
 * {"type": "switch_partition", "key_fields": ["mac", "vlan", "switch", "port"],
 *  "partitions": [{"name": "Fabric", "min_dpid": 10, "max_dpid": 99}]}
 * @endcode
 * A missing section or type "default" yields DefaultEntityClassifier.
 *
 * @throws std::invalid_argument on unknown types or fields.
 */
std::shared_ptr<IEntityClassifier> makeEntityClassifier(const nlohmann::json& section);

} // namespace dtClassifier
