#include "gtest/gtest.h"
#include "dt_core/data_management/DeviceAgingManager.hpp"
#include "dt_core/device_management/AttachmentPointTracker.hpp"
#include "dt_core/device_management/DeviceRegistry.hpp"
#include "dt_core/device_management/PortChannelConfig.hpp"
#include "event_system/EventBus.hpp"
#include "event_system/PayloadTypes.hpp"
#include "TestHelpers.hpp"
#include <atomic>
#include <chrono>
#include <thread>

using devtrack_test::makeEntity;

class DeviceAgingManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto tracker = std::make_shared<AttachmentPointTracker>(
            std::make_shared<devtrack_test::FakeTopology>(), std::make_shared<PortChannelConfig>(),
            std::chrono::milliseconds(5000));
        eventBus_ = std::make_shared<EventBus>();
        eventBus_->registerHandler(EventType::DeviceRemoved, [this](const Event& event) {
            removedKeys_.push_back(std::any_cast<DeviceEventPayload>(event.payload).deviceKey);
        });
        registry_ = std::make_shared<DeviceRegistry>(nullptr, tracker, eventBus_);
        aging_ = std::make_unique<DeviceAgingManager>(
            registry_, std::chrono::milliseconds(10000), std::chrono::milliseconds(4000),
            std::chrono::seconds(1), [this] { return now_.load(); });
    }

    std::shared_ptr<EventBus> eventBus_;
    std::shared_ptr<DeviceRegistry> registry_;
    std::unique_ptr<DeviceAgingManager> aging_;
    std::atomic<int64_t> now_{0};
    std::vector<uint64_t> removedKeys_;
};

TEST_F(DeviceAgingManagerTest, RunOnceRemovesIdleDevices) {
    auto idle = registry_->learnDeviceByEntity(makeEntity(0xA, std::nullopt, std::nullopt, 1, 1, 1000));
    auto busy = registry_->learnDeviceByEntity(makeEntity(0xB, std::nullopt, std::nullopt, 1, 2, 1000));

    now_ = 11000;
    EXPECT_EQ(aging_->runOnce(), 0u);

    registry_->learnDeviceByEntity(makeEntity(0xB, std::nullopt, std::nullopt, 1, 2, 9000));
    now_ = 11001;
    EXPECT_EQ(aging_->runOnce(), 1u);

    EXPECT_EQ(registry_->getDeviceCount(), 1u);
    EXPECT_EQ(registry_->getDevice(busy->getDeviceKey()), busy);
    EXPECT_EQ(registry_->getDevice(idle->getDeviceKey()), nullptr);
    ASSERT_EQ(removedKeys_.size(), 1u);
    EXPECT_EQ(removedKeys_[0], idle->getDeviceKey());
}

TEST_F(DeviceAgingManagerTest, RunOnceDropsStaleOldAttachmentPoints) {
    auto device = registry_->learnDeviceByEntity(makeEntity(0xA, std::nullopt, std::nullopt, 1, 1, 1000));
    registry_->learnDeviceByEntity(makeEntity(0xA, std::nullopt, std::nullopt, 1, 2, 2000));
    registry_->learnDeviceByEntity(makeEntity(0xA, std::nullopt, std::nullopt, 1, 2, 8000));
    ASSERT_EQ(device->getOldAttachmentPoints().size(), 1u);

    now_ = 5000;
    aging_->runOnce();
    EXPECT_EQ(device->getOldAttachmentPoints().size(), 1u);

    now_ = 5001;
    EXPECT_EQ(aging_->runOnce(), 0u);
    EXPECT_TRUE(device->getOldAttachmentPoints().empty());
    EXPECT_EQ(device->getAttachmentPoints(), std::vector<SwitchPort>{SwitchPort(1, 2)});
}

TEST_F(DeviceAgingManagerTest, BackgroundThreadAgesDevices) {
    registry_->learnDeviceByEntity(makeEntity(0xA, std::nullopt, std::nullopt, 1, 1, 1000));
    now_ = 100000;

    aging_->start();
    for (int i = 0; i < 50 && registry_->getDeviceCount() > 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    aging_->stop();

    EXPECT_EQ(registry_->getDeviceCount(), 0u);
}
