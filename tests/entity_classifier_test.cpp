#include "gtest/gtest.h"
#include "dt_core/classification/EntityClassifier.hpp"
#include "TestHelpers.hpp"
#include <stdexcept>

using namespace dtClassifier;
using devtrack_test::makeEntity;

TEST(EntityClassifierTest, DefaultClassifierUsesSingleGlobalClass) {
    DefaultEntityClassifier classifier;
    auto classes = classifier.classifyEntity(makeEntity(0x1, std::nullopt, std::nullopt, 1, 1));

    ASSERT_EQ(classes.size(), 1u);
    EXPECT_EQ(classes[0]->getName(), DEFAULT_ENTITY_CLASS_NAME);
    EXPECT_EQ(classifier.getKeyFields(), (EntityFieldSet{EntityField::MAC, EntityField::VLAN}));
}

TEST(EntityClassifierTest, SwitchPartitionAssignsClassByDpidRange) {
    SwitchPartitionEntityClassifier classifier(
        {{"Edge", 1, 9}, {"Fabric", 10, 99}},
        {EntityField::MAC, EntityField::VLAN, EntityField::SWITCH, EntityField::PORT});

    auto edge = classifier.classifyEntity(makeEntity(0x1, std::nullopt, std::nullopt, 5, 1));
    auto fabric = classifier.classifyEntity(makeEntity(0x1, std::nullopt, std::nullopt, 10, 1));
    auto outside = classifier.classifyEntity(makeEntity(0x1, std::nullopt, std::nullopt, 100, 1));

    ASSERT_EQ(edge.size(), 1u);
    EXPECT_EQ(edge[0]->getName(), "Edge");
    ASSERT_EQ(fabric.size(), 1u);
    EXPECT_EQ(fabric[0]->getName(), "Fabric");
    ASSERT_EQ(outside.size(), 1u);
    EXPECT_EQ(outside[0]->getName(), DEFAULT_ENTITY_CLASS_NAME);
    EXPECT_EQ(fabric[0]->getKeyFields().size(), 4u);
}

TEST(EntityClassifierTest, OverlappingPartitionsYieldEveryMatchingClass) {
    SwitchPartitionEntityClassifier classifier({{"B", 1, 20}, {"A", 10, 30}},
                                               defaultKeyFields());
    auto classes = normalizeClassSet(
        classifier.classifyEntity(makeEntity(0x1, std::nullopt, std::nullopt, 15, 1)));

    ASSERT_EQ(classes.size(), 2u);
    EXPECT_EQ(classes[0]->getName(), "A");
    EXPECT_EQ(classes[1]->getName(), "B");
    EXPECT_EQ(classSetSignature(classes), "A,B");
}

TEST(EntityClassifierTest, SwitchPartitionRejectsBadConfiguration) {
    EXPECT_THROW(SwitchPartitionEntityClassifier({{"X", 1, 2}}, {}), std::invalid_argument);
    EXPECT_THROW(SwitchPartitionEntityClassifier({{"", 1, 2}}, defaultKeyFields()),
                 std::invalid_argument);
    EXPECT_THROW(SwitchPartitionEntityClassifier({{"X", 5, 2}}, defaultKeyFields()),
                 std::invalid_argument);
}

TEST(EntityClassifierTest, NormalizeFallsBackToDefaultOnEmptyOrNullSet) {
    auto empty = normalizeClassSet({});
    ASSERT_EQ(empty.size(), 1u);
    EXPECT_EQ(empty[0]->getName(), DEFAULT_ENTITY_CLASS_NAME);

    auto nulls = normalizeClassSet({nullptr, nullptr});
    ASSERT_EQ(nulls.size(), 1u);
    EXPECT_EQ(nulls[0]->getName(), DEFAULT_ENTITY_CLASS_NAME);
}

TEST(EntityClassifierTest, NormalizeDeduplicatesByName) {
    auto a1 = std::make_shared<StoredEntityClass>("A", defaultKeyFields());
    auto a2 = std::make_shared<StoredEntityClass>("A", defaultKeyFields());
    auto b = std::make_shared<StoredEntityClass>("B", defaultKeyFields());

    auto classes = normalizeClassSet({b, a1, nullptr, a2});
    ASSERT_EQ(classes.size(), 2u);
    EXPECT_EQ(classSetSignature(classes), "A,B");
}

TEST(EntityClassifierTest, FactoryBuildsFromConfiguration) {
    auto byDefault = makeEntityClassifier(nlohmann::json::object());
    EXPECT_NE(std::dynamic_pointer_cast<DefaultEntityClassifier>(byDefault), nullptr);

    auto partitioned = makeEntityClassifier(nlohmann::json::parse(R"({
        "type": "switch_partition",
        "key_fields": ["mac", "vlan", "switch", "port"],
        "partitions": [{"name": "testEC", "min_dpid": 10}]
    })"));
    auto entity = makeEntity(0x1, std::nullopt, std::nullopt, 42, 1);
    EXPECT_EQ(classSetSignature(partitioned->classifyEntity(entity)), "testEC");
    EXPECT_EQ(partitioned->getKeyFields().count(EntityField::PORT), 1u);
}

TEST(EntityClassifierTest, FactoryRejectsUnknownTypeAndField) {
    EXPECT_THROW(makeEntityClassifier(nlohmann::json{{"type", "by_oui"}}), std::invalid_argument);
    EXPECT_THROW(makeEntityClassifier(nlohmann::json::parse(
                     R"({"type": "switch_partition", "key_fields": ["hostname"]})")),
                 std::invalid_argument);
}
