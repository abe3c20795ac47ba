#include "runsync/discovery/bulk_discovery.hpp"

#include "../support/sync_fixture.hpp"

#include <gtest/gtest.h>

using runsync::ErrorCode;
using runsync::discovery::BulkDiscovery;
using runsync::discovery::SideFilter;
using runsync::discovery::SyncState;
using runsync::model::DataKind;
using runsync::model::MlFileType;
using runsync::remote::RemoteInventoryCache;
using runsync::testing::SyncFixture;
using runsync::testing::make_coord;

namespace {

struct BulkDiscoveryTest : ::testing::Test {
    SyncFixture fx;
    RemoteInventoryCache cache{fx.store, fx.translator, fx.cache_options()};
    BulkDiscovery discovery{fx.scanner, cache, fx.translator};
};

} // namespace

TEST_F(BulkDiscoveryTest, RemoteSideNeedsALoadedInventory) {
    auto remote = discovery.all_coordinates(DataKind::Raw, SideFilter::Remote);
    ASSERT_TRUE(remote.is_error());
    EXPECT_EQ(remote.error().code, ErrorCode::CacheUnavailable);
    EXPECT_TRUE(discovery.overview(DataKind::Raw).is_error());

    // The local side works regardless.
    EXPECT_TRUE(discovery.all_coordinates(DataKind::Raw, SideFilter::Local).is_ok());
}

TEST_F(BulkDiscoveryTest, UnionOfBothSidesIsSortedAndDeduplicated) {
    fx.local_raw(make_coord("1"), "rosbag_a.bag", 1);
    fx.local_raw(make_coord("3"), "rosbag_a.bag", 1);
    fx.remote_raw(make_coord("2"), "_a.bag", 1);
    fx.remote_raw(make_coord("3"), "_a.bag", 1);
    ASSERT_TRUE(cache.refresh().is_ok());

    auto local = discovery.all_coordinates(DataKind::Raw, SideFilter::Local);
    ASSERT_TRUE(local.is_ok());
    EXPECT_EQ(local.value(), (std::vector<runsync::model::RunCoordinate>{make_coord("1"), make_coord("3")}));

    auto remote = discovery.all_coordinates(DataKind::Raw, SideFilter::Remote);
    ASSERT_TRUE(remote.is_ok());
    EXPECT_EQ(remote.value(), (std::vector<runsync::model::RunCoordinate>{make_coord("2"), make_coord("3")}));

    auto both = discovery.all_coordinates(DataKind::Raw);
    ASSERT_TRUE(both.is_ok());
    EXPECT_EQ(both.value(),
              (std::vector<runsync::model::RunCoordinate>{make_coord("1"), make_coord("2"), make_coord("3")}));
}

TEST_F(BulkDiscoveryTest, OverviewClassifiesEveryCoordinate) {
    fx.local_raw(make_coord("1"), "rosbag_a.bag", 4);
    fx.remote_raw(make_coord("2"), "_a.bag", 4);
    fx.local_raw(make_coord("3"), "rosbag_a.bag", 4);
    fx.remote_raw(make_coord("3"), "_a.bag", 4);
    fx.local_raw(make_coord("4"), "rosbag_a.bag", 4);
    fx.remote_raw(make_coord("4"), "_a.bag", 5);
    ASSERT_TRUE(cache.refresh().is_ok());

    auto overview = discovery.overview(DataKind::Raw);
    ASSERT_TRUE(overview.is_ok());
    const auto& entries = overview.value();
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries.at(make_coord("1")).state, SyncState::LocalOnly);
    EXPECT_EQ(entries.at(make_coord("2")).state, SyncState::RemoteOnly);
    EXPECT_EQ(entries.at(make_coord("3")).state, SyncState::InSync);
    EXPECT_EQ(entries.at(make_coord("4")).state, SyncState::Diverged);
    EXPECT_FALSE(entries.at(make_coord("2")).local);
    ASSERT_TRUE(entries.at(make_coord("1")).local);
    EXPECT_EQ(entries.at(make_coord("1")).local->unit_count(), 1u);
}

TEST_F(BulkDiscoveryTest, MlComparisonLooksInsideBags) {
    const auto c = make_coord();
    fx.local_ml(c, "rosbag_x", MlFileType::Frames, "1.jpg", 3);
    fx.local_ml(c, "rosbag_x", MlFileType::Labels, "1.json", 2);
    fx.remote_ml(c, "_x", MlFileType::Frames, "1.jpg", 2);
    fx.remote_ml(c, "_x", MlFileType::Labels, "1.json", 3);
    ASSERT_TRUE(cache.refresh().is_ok());

    // Same bag total, different files.
    auto overview = discovery.overview(DataKind::Ml);
    ASSERT_TRUE(overview.is_ok());
    EXPECT_EQ(overview.value().at(c).state, SyncState::Diverged);
}

TEST_F(BulkDiscoveryTest, LocalNameOutsideConventionIsDivergence) {
    auto local = runsync::model::StorageStatus::absent(runsync::model::StorageSide::Local, DataKind::Raw);
    local.add_unit("export.bag", 1);
    auto remote = runsync::model::StorageStatus::absent(runsync::model::StorageSide::Remote, DataKind::Raw);
    remote.add_unit("_export.bag", 1);
    EXPECT_EQ(discovery.compare(local, remote), SyncState::Diverged);
}

TEST(SyncStateTest, Names) {
    EXPECT_STREQ(runsync::discovery::to_string(SyncState::LocalOnly), "local-only");
    EXPECT_STREQ(runsync::discovery::to_string(SyncState::RemoteOnly), "remote-only");
    EXPECT_STREQ(runsync::discovery::to_string(SyncState::InSync), "in-sync");
    EXPECT_STREQ(runsync::discovery::to_string(SyncState::Diverged), "diverged");
}
