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

#include "dt_core/classification/EntityClassifier.hpp"
#include "utils/Logger.hpp" // for Logger
#include "utils/Utils.hpp"  // for dpidToString
#include <algorithm>        // for sort, unique
#include <stdexcept>        // for invalid_argument
#include <utility>          // for move

namespace dtClassifier
{

EntityFieldSet
defaultKeyFields()
{
    return {EntityField::MAC, EntityField::VLAN};
}

EntityClassPtr
defaultEntityClass()
{
    static const EntityClassPtr instance =
        std::make_shared<StoredEntityClass>(DEFAULT_ENTITY_CLASS_NAME, defaultKeyFields());
    return instance;
}

StoredEntityClass::StoredEntityClass(std::string name, EntityFieldSet keyFields)
    : m_name(std::move(name)),
      m_keyFields(std::move(keyFields))
{
}

std::string
StoredEntityClass::getName() const
{
    return m_name;
}

EntityFieldSet
StoredEntityClass::getKeyFields() const
{
    return m_keyFields;
}

EntityClassSet
DefaultEntityClassifier::classifyEntity(const Entity&) const
{
    return {defaultEntityClass()};
}

EntityFieldSet
DefaultEntityClassifier::getKeyFields() const
{
    return defaultKeyFields();
}

SwitchPartitionEntityClassifier::SwitchPartitionEntityClassifier(
    std::vector<SwitchPartition> partitions,
    EntityFieldSet keyFields)
    : m_keyFields(std::move(keyFields))
{
    if (m_keyFields.empty())
    {
        throw std::invalid_argument("Switch partition classifier needs at least one key field");
    }

    for (auto& partition : partitions)
    {
        if (partition.className.empty())
        {
            throw std::invalid_argument("Switch partition without a class name");
        }
        if (partition.minDpid > partition.maxDpid)
        {
            throw std::invalid_argument("Switch partition " + partition.className +
                                        " has min_dpid > max_dpid");
        }
        auto clazz = std::make_shared<StoredEntityClass>(partition.className, m_keyFields);
        m_partitions.emplace_back(std::move(partition), std::move(clazz));
    }
}

EntityClassSet
SwitchPartitionEntityClassifier::classifyEntity(const Entity& entity) const
{
    EntityClassSet classes;
    for (const auto& [partition, clazz] : m_partitions)
    {
        if (entity.switchDpid >= partition.minDpid && entity.switchDpid <= partition.maxDpid)
        {
            classes.push_back(clazz);
        }
    }
    if (classes.empty())
    {
        classes.push_back(defaultEntityClass());
    }
    return classes;
}

EntityFieldSet
SwitchPartitionEntityClassifier::getKeyFields() const
{
    return m_keyFields;
}

EntityClassSet
normalizeClassSet(EntityClassSet classes)
{
    classes.erase(std::remove(classes.begin(), classes.end(), nullptr), classes.end());

    std::sort(classes.begin(), classes.end(), [](const auto& a, const auto& b) {
        return a->getName() < b->getName();
    });
    classes.erase(std::unique(classes.begin(),
                              classes.end(),
                              [](const auto& a, const auto& b) {
                                  return a->getName() == b->getName();
                              }),
                  classes.end());

    if (classes.empty())
    {
        SPDLOG_LOGGER_WARN(Logger::instance(),
                           "Classifier returned no entity class, using {}",
                           DEFAULT_ENTITY_CLASS_NAME);
        classes.push_back(defaultEntityClass());
    }
    return classes;
}

std::string
classSetSignature(const EntityClassSet& classes)
{
    std::string signature;
    for (const auto& clazz : classes)
    {
        if (!signature.empty())
        {
            signature += ",";
        }
        signature += clazz->getName();
    }
    return signature;
}

std::shared_ptr<IEntityClassifier>
makeEntityClassifier(const nlohmann::json& section)
{
    if (section.is_null() || section.empty())
    {
        return std::make_shared<DefaultEntityClassifier>();
    }

    const std::string type = section.value("type", "default");
    if (type == "default")
    {
        return std::make_shared<DefaultEntityClassifier>();
    }
    if (type != "switch_partition")
    {
        throw std::invalid_argument("Unknown classifier type: " + type);
    }

    EntityFieldSet keyFields = defaultKeyFields();
    if (section.contains("key_fields"))
    {
        keyFields = section.at("key_fields").get<EntityFieldSet>();
    }

    std::vector<SwitchPartition> partitions;
    for (const auto& partitionJson : section.value("partitions", nlohmann::json::array()))
    {
        SwitchPartition partition;
        partition.className = partitionJson.at("name").get<std::string>();
        partition.minDpid = partitionJson.value("min_dpid", uint64_t{0});
        partition.maxDpid = partitionJson.value("max_dpid", UINT64_MAX);
        SPDLOG_LOGGER_INFO(Logger::instance(),
                           "Entity class {} covers switches {} .. {}",
                           partition.className,
                           utils::dpidToString(partition.minDpid),
                           utils::dpidToString(partition.maxDpid));
        partitions.push_back(std::move(partition));
    }

    return std::make_shared<SwitchPartitionEntityClassifier>(std::move(partitions),
                                                             std::move(keyFields));
}

} // namespace dtClassifier
