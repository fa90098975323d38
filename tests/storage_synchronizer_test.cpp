#include "gtest/gtest.h"
#include "dt_core/data_management/StorageSynchronizer.hpp"
#include "dt_core/device_management/AttachmentPointTracker.hpp"
#include "dt_core/device_management/Device.hpp"
#include "dt_core/device_management/DeviceRegistry.hpp"
#include "dt_core/device_management/PortChannelConfig.hpp"
#include "TestHelpers.hpp"
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using devtrack_test::FlakyStorageSource;
using devtrack_test::makeEntity;
using json = nlohmann::json;

namespace
{

DevicePtr
makeDevice(uint64_t key, int64_t lastSeen)
{
    return Device::fromJson(json{
        {"device_key", key},
        {"entity_classes", json::array({json{{"name", "DefaultEntityClass"},
                                             {"key_fields", json::array({"mac", "vlan"})}}})},
        {"entities",
         json::array({json{{"mac", key}, {"vlan", nullptr}, {"ipv4", nullptr}, {"switch", 1},
                           {"port", 1}, {"last_seen", lastSeen}}})},
        {"last_seen", lastSeen}});
}

} // namespace

class StorageSynchronizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        storage_ = std::make_shared<FlakyStorageSource>();
        sync_ = std::make_unique<StorageSynchronizer>(storage_, std::chrono::milliseconds(1000));
    }

    std::optional<json> storedRow(uint64_t key) {
        return storage_->getRow(StorageSynchronizer::DEVICE_TABLE_NAME, std::to_string(key));
    }

    std::shared_ptr<DeviceRegistry> makeRegistry(std::shared_ptr<StorageSynchronizer> sync) {
        auto tracker = std::make_shared<AttachmentPointTracker>(
            std::make_shared<devtrack_test::FakeTopology>(), std::make_shared<PortChannelConfig>(),
            std::chrono::milliseconds(5000));
        return std::make_shared<DeviceRegistry>(nullptr, tracker, nullptr, std::move(sync));
    }

    std::shared_ptr<FlakyStorageSource> storage_;
    std::unique_ptr<StorageSynchronizer> sync_;
};

TEST_F(StorageSynchronizerTest, NullStorageIsRejected) {
    EXPECT_THROW(StorageSynchronizer(nullptr), StorageException);
}

TEST_F(StorageSynchronizerTest, TimestampOnlyUpdatesAreRateLimited) {
    sync_->onDeviceUpdated(*makeDevice(1, 1000), false);
    EXPECT_EQ(sync_->getPendingCount(), 1u);
    sync_->flush();
    EXPECT_EQ(sync_->getWriteCount(), 1u);

    sync_->onDeviceUpdated(*makeDevice(1, 1500), false);
    EXPECT_EQ(sync_->getPendingCount(), 0u);

    sync_->onDeviceUpdated(*makeDevice(1, 2000), false);
    EXPECT_EQ(sync_->getPendingCount(), 1u);
    sync_->flush();
    EXPECT_EQ(storedRow(1)->at("last_seen"), 2000);

    sync_->onDeviceUpdated(*makeDevice(1, 2100), true);
    sync_->flush();
    EXPECT_EQ(storedRow(1)->at("last_seen"), 2100);
    EXPECT_EQ(sync_->getWriteCount(), 3u);
}

TEST_F(StorageSynchronizerTest, PendingWritesAreCoalescedPerDevice) {
    for (int64_t t = 1000; t < 1005; ++t) {
        sync_->onDeviceUpdated(*makeDevice(1, t), true);
    }
    sync_->onDeviceUpdated(*makeDevice(2, 1000), true);
    EXPECT_EQ(sync_->getPendingCount(), 2u);

    sync_->flush();
    EXPECT_EQ(sync_->getWriteCount(), 2u);
    EXPECT_EQ(storedRow(1)->at("last_seen"), 1004);
}

TEST_F(StorageSynchronizerTest, WriteFailuresAreCountedAndLaterWritesSucceed) {
    storage_->failWrites = true;
    sync_->onDeviceUpdated(*makeDevice(1, 1000), true);
    sync_->flush();
    EXPECT_EQ(sync_->getFailureCount(), 1u);
    EXPECT_EQ(sync_->getWriteCount(), 0u);
    EXPECT_FALSE(storedRow(1).has_value());

    storage_->failWrites = false;
    sync_->onDeviceUpdated(*makeDevice(1, 1100), true);
    sync_->flush();
    EXPECT_EQ(sync_->getWriteCount(), 1u);
    EXPECT_TRUE(storedRow(1).has_value());
}

TEST_F(StorageSynchronizerTest, RemovedDevicesAreDeletedAndStayDeleted) {
    sync_->onDeviceUpdated(*makeDevice(1, 1000), true);
    sync_->flush();
    ASSERT_TRUE(storedRow(1).has_value());

    auto late = makeDevice(1, 5000);
    sync_->onDeviceRemoved(1);
    sync_->onDeviceUpdated(*late, true);
    EXPECT_EQ(sync_->getPendingCount(), 1u);
    sync_->flush();

    EXPECT_FALSE(storedRow(1).has_value());
}

TEST_F(StorageSynchronizerTest, ReadFailureIsFatalForLoad) {
    storage_->failReads = true;
    EXPECT_THROW(sync_->loadDevices(), StorageException);
}

TEST_F(StorageSynchronizerTest, WriterThreadDrainsOnFlushAndStop) {
    sync_->start();
    for (uint64_t key = 1; key <= 20; ++key) {
        sync_->onDeviceUpdated(*makeDevice(key, 1000), true);
    }
    sync_->flush();
    EXPECT_EQ(sync_->getPendingCount(), 0u);
    EXPECT_EQ(sync_->loadDevices().size(), 20u);

    sync_->onDeviceRemoved(20);
    sync_->stop();
    EXPECT_EQ(sync_->loadDevices().size(), 19u);
    EXPECT_EQ(sync_->getWriteCount(), 21u);
}

TEST_F(StorageSynchronizerTest, StoredRowsRebuildDevices) {
    auto device = makeDevice(3, 4200);
    sync_->onDeviceUpdated(*device, true);
    sync_->flush();

    auto rows = sync_->loadDevices();
    ASSERT_EQ(rows.size(), 1u);
    auto rebuilt = Device::fromJson(rows[0]);
    EXPECT_EQ(rebuilt->getDeviceKey(), 3u);
    EXPECT_EQ(rebuilt->getLastSeen(), 4200);
    EXPECT_EQ(rebuilt->getEntities(), device->getEntities());
    EXPECT_EQ(rebuilt->getEntityClassNames(), device->getEntityClassNames());
}

TEST_F(StorageSynchronizerTest, RemovedKeysAreForgottenOnceDeleted) {
    sync_->onDeviceUpdated(*makeDevice(1, 1000), true);
    sync_->onDeviceRemoved(1);
    sync_->onDeviceRemoved(2);
    EXPECT_EQ(sync_->getRemovedKeyCount(), 2u);

    sync_->flush();
    EXPECT_EQ(sync_->getRemovedKeyCount(), 0u);
    EXPECT_FALSE(storedRow(1).has_value());
}

TEST_F(StorageSynchronizerTest, UpdatesOfAgedOutDeviceAreIgnored) {
    auto sync = std::make_shared<StorageSynchronizer>(storage_, std::chrono::milliseconds(1000));
    auto registry = makeRegistry(sync);
    auto device = registry->learnDeviceByEntity(makeEntity(0xA, std::nullopt, std::nullopt, 1, 1));
    registry->removeExpiredDevices(100000, 1000);
    sync->flush();
    ASSERT_EQ(sync->getRemovedKeyCount(), 0u);

    sync->onDeviceUpdated(*device, true);
    sync->flush();
    EXPECT_FALSE(storedRow(device->getDeviceKey()).has_value());
}

TEST_F(StorageSynchronizerTest, ConcurrentUpdatesStoreNewestSnapshot) {
    for (int round = 0; round < 20; ++round) {
        auto storage = std::make_shared<FlakyStorageSource>();
        auto sync = std::make_shared<StorageSynchronizer>(storage, std::chrono::milliseconds(1000));
        auto registry = makeRegistry(sync);

        std::vector<std::thread> learners;
        for (uint32_t t = 0; t < 2; ++t) {
            learners.emplace_back([&, t] {
                for (uint32_t i = 0; i < 50; ++i) {
                    registry->learnDeviceByEntity(
                        makeEntity(0xA, std::nullopt, 0x0A000000u + t * 100 + i, 1, 1, 1000 + i));
                }
            });
        }
        for (auto& l : learners) {
            l.join();
        }
        sync->flush();

        auto device = registry->findDevice(0xA, std::nullopt, std::nullopt, std::nullopt, std::nullopt);
        ASSERT_NE(device, nullptr);
        auto row = storage->getRow(StorageSynchronizer::DEVICE_TABLE_NAME,
                                   std::to_string(device->getDeviceKey()));
        ASSERT_TRUE(row.has_value());
        EXPECT_EQ(Device::fromJson(*row)->getEntities().size(), 100u) << "round " << round;
    }
}
