#include "gtest/gtest.h"
#include "dt_core/data_management/JsonFileStorageSource.hpp"
#include "dt_core/data_management/MemoryStorageSource.hpp"
#include <filesystem>
#include <fstream>

using json = nlohmann::json;

TEST(MemoryStorageSourceTest, UpsertReplacesRowByPrimaryKey) {
    MemoryStorageSource storage;
    storage.createTable("device", "device_key");

    storage.upsertRow("device", json{{"device_key", 1}, {"mac", 10}});
    storage.upsertRow("device", json{{"device_key", 2}, {"mac", 20}});
    storage.upsertRow("device", json{{"device_key", 1}, {"mac", 11}});

    EXPECT_EQ(storage.getAllRows("device").size(), 2u);
    auto row = storage.getRow("device", "1");
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->at("mac"), 11);
    EXPECT_FALSE(storage.getRow("device", "3").has_value());
}

TEST(MemoryStorageSourceTest, DeleteIsIdempotent) {
    MemoryStorageSource storage;
    storage.createTable("port_channel", "id");
    storage.upsertRow("port_channel", json{{"id", "a"}});

    storage.deleteRow("port_channel", "a");
    storage.deleteRow("port_channel", "a");
    EXPECT_TRUE(storage.getAllRows("port_channel").empty());
}

TEST(MemoryStorageSourceTest, UnknownTableAndMissingKeyThrow) {
    MemoryStorageSource storage;
    EXPECT_THROW(storage.getAllRows("nope"), StorageException);
    EXPECT_THROW(storage.upsertRow("nope", json{{"id", 1}}), StorageException);

    storage.createTable("t", "id");
    EXPECT_THROW(storage.upsertRow("t", json{{"other", 1}}), StorageException);
    EXPECT_THROW(storage.upsertRow("t", json::array()), StorageException);
}

TEST(MemoryStorageSourceTest, CreateTableKeepsExistingRows) {
    MemoryStorageSource storage;
    storage.createTable("t", "id");
    storage.upsertRow("t", json{{"id", "x"}});
    storage.createTable("t", "id");
    EXPECT_EQ(storage.getAllRows("t").size(), 1u);
}

class JsonFileStorageSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("devtrack_storage_" +
                std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::filesystem::path dir_;
};

TEST_F(JsonFileStorageSourceTest, RowsSurviveReopen) {
    {
        JsonFileStorageSource storage(dir_);
        storage.createTable("device", "device_key");
        storage.upsertRow("device", json{{"device_key", 7}, {"mac", 1}});
        storage.upsertRow("device", json{{"device_key", 8}, {"mac", 2}});
        storage.deleteRow("device", "8");
    }
    EXPECT_TRUE(std::filesystem::exists(dir_ / "device.json"));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "device.json.tmp"));

    JsonFileStorageSource reopened(dir_);
    reopened.createTable("device", "device_key");
    auto rows = reopened.getAllRows("device");
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].at("device_key"), 7);
    EXPECT_TRUE(reopened.getRow("device", "7").has_value());
}

TEST_F(JsonFileStorageSourceTest, CorruptTableFileIsReported) {
    std::filesystem::create_directories(dir_);
    std::ofstream(dir_ / "device.json") << "{\"rows\": [not json";

    JsonFileStorageSource storage(dir_);
    EXPECT_THROW(storage.createTable("device", "device_key"), StorageException);
}

TEST_F(JsonFileStorageSourceTest, TableWithoutRowsSectionIsReported) {
    std::filesystem::create_directories(dir_);
    std::ofstream(dir_ / "device.json") << "{\"primary_key\": \"device_key\"}";

    JsonFileStorageSource storage(dir_);
    EXPECT_THROW(storage.createTable("device", "device_key"), StorageException);
}

TEST_F(JsonFileStorageSourceTest, UnknownTableThrows) {
    JsonFileStorageSource storage(dir_);
    EXPECT_THROW(storage.upsertRow("device", json{{"device_key", 1}}), StorageException);
    EXPECT_THROW(storage.deleteRow("device", "1"), StorageException);
}

TEST_F(JsonFileStorageSourceTest, FailedWriteLeavesTableUnchanged) {
    JsonFileStorageSource storage(dir_);
    storage.createTable("device", "device_key");
    storage.upsertRow("device", json{{"device_key", 1}, {"mac", 1}});

    // A directory in place of the temporary file makes every write fail
    std::filesystem::create_directories(dir_ / "device.json.tmp");
    EXPECT_THROW(storage.upsertRow("device", json{{"device_key", 1}, {"mac", 9}}), StorageException);
    EXPECT_THROW(storage.upsertRow("device", json{{"device_key", 2}, {"mac", 2}}), StorageException);
    EXPECT_THROW(storage.deleteRow("device", "1"), StorageException);

    ASSERT_EQ(storage.getAllRows("device").size(), 1u);
    EXPECT_EQ(storage.getRow("device", "1")->at("mac"), 1);

    std::filesystem::remove_all(dir_ / "device.json.tmp");
    JsonFileStorageSource reopened(dir_);
    reopened.createTable("device", "device_key");
    EXPECT_EQ(reopened.getRow("device", "1")->at("mac"), 1);
}
