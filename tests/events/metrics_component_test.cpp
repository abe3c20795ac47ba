#include "runsync/events/components.hpp"
#include "runsync/events/event_bus.hpp"
#include "runsync/events/events.hpp"

#include <gtest/gtest.h>

#include <chrono>

using runsync::events::EventBus;
using runsync::events::InventoryMarkedStaleEvent;
using runsync::events::InventoryRefreshFailedEvent;
using runsync::events::InventoryRefreshedEvent;
using runsync::events::LoggerComponent;
using runsync::events::MetricsComponent;
using runsync::events::TransferCompletedEvent;
using runsync::events::TransferConflictDetectedEvent;
using runsync::events::TransferItemCompletedEvent;
using runsync::events::TransferItemFailedEvent;
using runsync::events::TransferStartedEvent;
using runsync::model::DataKind;
using runsync::model::RunCoordinate;

namespace {

RunCoordinate coordinate() {
    return RunCoordinate::create("acme", "eu", "f7", "2024w10", "b3", "1700000000").value();
}

} // namespace

TEST(MetricsComponentTest, TracksTransferCounters) {
    EventBus bus;
    MetricsComponent metrics(bus);
    const auto c = coordinate();

    bus.emit(TransferStartedEvent{"raw-download", c, DataKind::Raw, 3, 3072, false});
    bus.emit(TransferItemCompletedEvent{"raw-download", c, "rosbag_a.bag", "/data/raw/rosbag_a.bag", 1024});
    bus.emit(TransferItemCompletedEvent{"raw-download", c, "rosbag_b.bag", "/data/raw/rosbag_b.bag", 2048});
    bus.emit(TransferItemFailedEvent{"raw-download", c, "rosbag_c.bag", "RemoteStoreError: boom"});
    bus.emit(TransferConflictDetectedEvent{"raw-download", c, "rosbag_d.bag", 10, 12, false});
    bus.emit(TransferCompletedEvent{"raw-download", c, true, false, false, 2, 1, 3072, std::chrono::milliseconds{40}});
    bus.emit(TransferCompletedEvent{"raw-upload", c, false, false, false, 0, 1, 0, std::chrono::milliseconds{5}});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.transfers_started.load(), 1u);
    EXPECT_EQ(stats.items_succeeded.load(), 2u);
    EXPECT_EQ(stats.bytes_transferred.load(), 3072u);
    EXPECT_EQ(stats.items_failed.load(), 1u);
    EXPECT_EQ(stats.conflicts_detected.load(), 1u);
    EXPECT_EQ(stats.transfers_completed.load(), 1u);
    EXPECT_EQ(stats.transfers_failed.load(), 1u);
}

TEST(MetricsComponentTest, TracksInventoryCounters) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(InventoryRefreshedEvent{12, 40, 9000, std::chrono::milliseconds{120}});
    bus.emit(InventoryRefreshFailedEvent{"RemoteStoreError: bucket missing"});
    bus.emit(InventoryMarkedStaleEvent{DataKind::Raw, "raw-upload"});
    bus.emit(InventoryMarkedStaleEvent{DataKind::Ml, "expired"});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.inventory_refreshes.load(), 1u);
    EXPECT_EQ(stats.inventory_refresh_failures.load(), 1u);
    EXPECT_EQ(stats.stale_marks.load(), 2u);
}

TEST(MetricsComponentTest, StopsCountingWhenDestroyed) {
    EventBus bus;
    {
        MetricsComponent metrics(bus);
        LoggerComponent logger(bus);
        EXPECT_EQ(bus.subscriber_count<TransferStartedEvent>(), 2u);
    }
    EXPECT_EQ(bus.subscriber_count<TransferStartedEvent>(), 0u);
    EXPECT_NO_THROW(bus.emit(InventoryMarkedStaleEvent{DataKind::Raw, "raw-upload"}));
}
