#include "gtest/gtest.h"
#include "dt_core/data_management/MemoryStorageSource.hpp"
#include "dt_core/device_management/PortChannelConfig.hpp"
#include "TestHelpers.hpp"

using json = nlohmann::json;

class PortChannelConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        storage_.createTable(PortChannelConfig::TABLE_NAME, PortChannelConfig::ID_COLUMN_NAME);
    }

    devtrack_test::FlakyStorageSource storage_;
    PortChannelConfig config_;
};

TEST_F(PortChannelConfigTest, MakeRowUsesColonDpidAndPortAsId) {
    auto row = PortChannelConfig::makeRow(0x1a, 3, "po1");

    EXPECT_EQ(row.at("id"), "00:00:00:00:00:00:00:1a|3");
    EXPECT_EQ(row.at("switch"), "00:00:00:00:00:00:00:1a");
    EXPECT_EQ(row.at("port"), 3);
    EXPECT_EQ(row.at("channel"), "po1");
}

TEST_F(PortChannelConfigTest, LoadsRowsFromStorage) {
    storage_.upsertRow(PortChannelConfig::TABLE_NAME, PortChannelConfig::makeRow(1, 1, "po1"));
    storage_.upsertRow(PortChannelConfig::TABLE_NAME, PortChannelConfig::makeRow(1, 2, "po1"));
    storage_.upsertRow(PortChannelConfig::TABLE_NAME,
                       json{{"id", "numeric"}, {"switch", 2}, {"port", 7}, {"channel", "po2"}});
    storage_.upsertRow(PortChannelConfig::TABLE_NAME,
                       json{{"id", "blank"}, {"switch", 3}, {"port", 1}, {"channel", ""}});

    EXPECT_EQ(config_.loadFromStorage(storage_), 3u);
    EXPECT_EQ(config_.getGroup(1, 1), "po1");
    EXPECT_EQ(config_.getGroup(1, 2), "po1");
    EXPECT_EQ(config_.getGroup(2, 7), "po2");
    EXPECT_FALSE(config_.getGroup(3, 1).has_value());
    EXPECT_FALSE(config_.getGroup(1, 3).has_value());
}

TEST_F(PortChannelConfigTest, LoadReplacesPreviousMapping) {
    config_.setGroup(9, 9, "stale");
    storage_.upsertRow(PortChannelConfig::TABLE_NAME, PortChannelConfig::makeRow(1, 1, "po1"));

    config_.loadFromStorage(storage_);
    EXPECT_EQ(config_.size(), 1u);
    EXPECT_FALSE(config_.getGroup(9, 9).has_value());
}

TEST_F(PortChannelConfigTest, FailedReloadKeepsPreviousMapping) {
    storage_.upsertRow(PortChannelConfig::TABLE_NAME, PortChannelConfig::makeRow(1, 1, "po1"));
    ASSERT_TRUE(config_.reloadFromStorage(storage_));

    storage_.upsertRow(PortChannelConfig::TABLE_NAME,
                       json{{"id", "broken"}, {"switch", 1}, {"channel", "po9"}});
    EXPECT_FALSE(config_.reloadFromStorage(storage_));
    EXPECT_EQ(config_.getGroup(1, 1), "po1");
    EXPECT_EQ(config_.size(), 1u);

    storage_.failReads = true;
    EXPECT_THROW(config_.loadFromStorage(storage_), StorageException);
    EXPECT_EQ(config_.size(), 1u);
}

TEST_F(PortChannelConfigTest, RuntimeEdits) {
    config_.setGroup(1, 1, "a");
    config_.setGroup(1, 1, "b");
    EXPECT_EQ(config_.getGroup(1, 1), "b");

    config_.removeGroup(1, 1);
    EXPECT_FALSE(config_.getGroup(1, 1).has_value());

    config_.setGroup(1, 2, "c");
    config_.clear();
    EXPECT_EQ(config_.size(), 0u);
}
