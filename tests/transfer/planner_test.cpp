#include "runsync/transfer/planner.hpp"
#include "runsync/transfer/transfer_strategy.hpp"

#include "../support/sync_fixture.hpp"

#include <gtest/gtest.h>

using runsync::ErrorCode;
using runsync::model::DataKind;
using runsync::model::MlFileType;
using runsync::model::StorageSide;
using runsync::model::StorageStatus;
using runsync::remote::RemoteInventoryCache;
using runsync::testing::SyncFixture;
using runsync::testing::make_coord;
using namespace runsync::transfer;

namespace {

StorageStatus remote_raw(std::initializer_list<std::pair<const char*, std::uint64_t>> units) {
    auto status = StorageStatus::absent(StorageSide::Remote, DataKind::Raw);
    for (const auto& [name, size] : units) {
        status.add_unit(name, size);
    }
    return status;
}

StorageStatus local_raw(std::initializer_list<std::pair<const char*, std::uint64_t>> units) {
    auto status = StorageStatus::absent(StorageSide::Local, DataKind::Raw);
    for (const auto& [name, size] : units) {
        status.add_unit(name, size);
    }
    return status;
}

struct PlannerTest : ::testing::Test {
    SyncFixture fx;
    RemoteInventoryCache cache{fx.store, fx.translator, fx.cache_options()};
    StrategyContext context{fx.store, fx.translator, fx.scanner, cache};
};

} // namespace

TEST_F(PlannerTest, SkipPolicyReportsConflictsWithoutTransferringThem) {
    RawDownloadStrategy strategy(context);
    auto source = remote_raw({{"_a.bag", 10}, {"_b.bag", 20}, {"_c.bag", 30}});
    auto target = local_raw({{"rosbag_a.bag", 10}, {"rosbag_b.bag", 25}});

    auto plan = strategy.plan_transfer(make_coord(), source, target, TransferOptions{});
    ASSERT_TRUE(plan.is_ok());

    ASSERT_EQ(plan.value().items.size(), 1u);
    EXPECT_EQ(plan.value().items[0].source_unit, "_c.bag");
    EXPECT_EQ(plan.value().items[0].target_unit, "rosbag_c.bag");
    EXPECT_FALSE(plan.value().items[0].overwrite);

    ASSERT_EQ(plan.value().conflicts.size(), 1u);
    EXPECT_EQ(plan.value().conflicts[0].target_unit, "rosbag_b.bag");
    EXPECT_EQ(plan.value().conflicts[0].source_size, 20u);
    EXPECT_EQ(plan.value().conflicts[0].target_size, 25u);

    EXPECT_EQ(plan.value().already_synced, (std::vector<std::string>{"rosbag_a.bag"}));
    EXPECT_EQ(plan.value().total_bytes(), 30u);
}

TEST_F(PlannerTest, OverwritePolicyPromotesConflicts) {
    RawDownloadStrategy strategy(context);
    auto source = remote_raw({{"_a.bag", 10}, {"_b.bag", 20}});
    auto target = local_raw({{"rosbag_b.bag", 25}});

    TransferOptions options;
    options.policy = ConflictPolicy::Overwrite;
    auto plan = strategy.plan_transfer(make_coord(), source, target, options);
    ASSERT_TRUE(plan.is_ok());

    ASSERT_EQ(plan.value().items.size(), 2u);
    EXPECT_FALSE(plan.value().items[0].overwrite);
    EXPECT_EQ(plan.value().items[1].target_unit, "rosbag_b.bag");
    EXPECT_TRUE(plan.value().items[1].overwrite);
    EXPECT_EQ(plan.value().conflicts.size(), 1u);
}

TEST_F(PlannerTest, DownloadItemsCarryBothLocations) {
    RawDownloadStrategy strategy(context);
    const auto c = make_coord();
    auto plan = strategy.plan_transfer(c, remote_raw({{"_a.bag", 1}}), local_raw({}), TransferOptions{});
    ASSERT_TRUE(plan.is_ok());
    ASSERT_EQ(plan.value().items.size(), 1u);

    const auto& item = plan.value().items[0];
    EXPECT_EQ(item.from, StorageSide::Remote);
    EXPECT_EQ(item.bucket, "raw-bucket");
    EXPECT_EQ(item.remote_key, "c1/r1/f1/tw1/lb1/ts1/rosbag/_a.bag");
    EXPECT_EQ(item.local_path, fx.translator.local_raw_bag_path(c, "rosbag_a.bag"));
    EXPECT_EQ(item.source_location(), "raw-bucket/c1/r1/f1/tw1/lb1/ts1/rosbag/_a.bag");
}

TEST_F(PlannerTest, SelectionByIndexAndName) {
    RawDownloadStrategy strategy(context);
    auto source = remote_raw({{"_a.bag", 1}, {"_b.bag", 2}, {"_c.bag", 3}});

    TransferOptions by_index;
    by_index.selection.unit_indices = {0, 2, 17};
    auto indexed = strategy.plan_transfer(make_coord(), source, local_raw({}), by_index);
    ASSERT_TRUE(indexed.is_ok());
    ASSERT_EQ(indexed.value().items.size(), 2u);
    EXPECT_EQ(indexed.value().items[0].source_unit, "_a.bag");
    EXPECT_EQ(indexed.value().items[1].source_unit, "_c.bag");

    TransferOptions by_name;
    by_name.selection.unit_names = {"_b.bag", "_missing.bag"};
    auto named = strategy.plan_transfer(make_coord(), source, local_raw({}), by_name);
    ASSERT_TRUE(named.is_ok());
    ASSERT_EQ(named.value().items.size(), 1u);
    EXPECT_EQ(named.value().items[0].source_unit, "_b.bag");
}

TEST_F(PlannerTest, SourceNameOutsideConventionFailsThePlan) {
    RawUploadStrategy strategy(context);
    auto source = StorageStatus::absent(StorageSide::Local, DataKind::Raw);
    source.add_unit("rosbag_a.bag", 1);
    source.add_unit("export.bag", 2);

    auto plan = strategy.plan_transfer(make_coord(), source,
                                       StorageStatus::absent(StorageSide::Remote, DataKind::Raw), TransferOptions{});
    ASSERT_TRUE(plan.is_error());
    EXPECT_EQ(plan.error().code, ErrorCode::InvalidNameFormat);
}

TEST_F(PlannerTest, MlPlansPerFileInsideBags) {
    MlDownloadStrategy strategy(context);
    auto source = StorageStatus::absent(StorageSide::Remote, DataKind::Ml);
    source.add_ml_file("_x", MlFileType::Frames, "1.jpg", 10);
    source.add_ml_file("_x", MlFileType::Frames, "2.jpg", 10);
    source.add_ml_file("_x", MlFileType::Labels, "1.json", 5);
    auto target = StorageStatus::absent(StorageSide::Local, DataKind::Ml);
    target.add_ml_file("rosbag_x", MlFileType::Frames, "1.jpg", 10);
    target.add_ml_file("rosbag_x", MlFileType::Labels, "1.json", 6);

    auto plan = strategy.plan_transfer(make_coord(), source, target, TransferOptions{});
    ASSERT_TRUE(plan.is_ok());
    ASSERT_EQ(plan.value().items.size(), 1u);
    EXPECT_EQ(plan.value().items[0].label(), "rosbag_x/frames/2.jpg");
    EXPECT_EQ(plan.value().items[0].remote_key, "raw/c1/r1/f1/tw1/lb1/ts1/rosbag/_x/frames/2.jpg");
    ASSERT_EQ(plan.value().conflicts.size(), 1u);
    EXPECT_EQ(plan.value().conflicts[0].label(), "rosbag_x/labels/1.json");
    EXPECT_EQ(plan.value().already_synced, (std::vector<std::string>{"rosbag_x/frames/1.jpg"}));

    TransferOptions frames_only;
    frames_only.selection.file_types = {MlFileType::Frames};
    auto filtered = strategy.plan_transfer(make_coord(), source, target, frames_only);
    ASSERT_TRUE(filtered.is_ok());
    EXPECT_EQ(filtered.value().items.size(), 1u);
    EXPECT_TRUE(filtered.value().conflicts.empty());
}

TEST(ConflictPolicyTest, OnlySkipAndOverwriteExist) {
    EXPECT_EQ(parse_conflict_policy("skip").value(), ConflictPolicy::Skip);
    EXPECT_EQ(parse_conflict_policy("overwrite").value(), ConflictPolicy::Overwrite);
    EXPECT_EQ(parse_conflict_policy("merge").error().code, ErrorCode::ConfigurationError);
    EXPECT_EQ(parse_conflict_policy("rename").error().code, ErrorCode::ConfigurationError);
    EXPECT_TRUE(parse_conflict_policy("").is_error());
}
