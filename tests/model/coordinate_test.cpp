#include "runsync/model/coordinate.hpp"
#include "runsync/model/types.hpp"

#include <gtest/gtest.h>

#include <unordered_map>

using runsync::ErrorCode;
using runsync::model::BagContents;
using runsync::model::DataKind;
using runsync::model::MlFileType;
using runsync::model::RunCoordinate;
using runsync::model::StorageSide;
using runsync::model::StorageStatus;

TEST(RunCoordinateTest, CreateExposesParts) {
    auto coord = RunCoordinate::create("acme", "eu", "field7", "2025-08", "batch1", "2025-08-12-08-54-21");
    ASSERT_TRUE(coord.is_ok());

    EXPECT_EQ(coord.value().client(), "acme");
    EXPECT_EQ(coord.value().timestamp(), "2025-08-12-08-54-21");
    EXPECT_EQ(coord.value().to_path_string('/'), "acme/eu/field7/2025-08/batch1/2025-08-12-08-54-21");
    EXPECT_EQ(coord.value().to_string(), "(acme,eu,field7,2025-08,batch1,2025-08-12-08-54-21)");
}

TEST(RunCoordinateTest, RejectsEmptyAndPathLikeParts) {
    EXPECT_EQ(RunCoordinate::create("", "r", "f", "tw", "lb", "ts").error().code, ErrorCode::InvalidCoordinate);
    EXPECT_TRUE(RunCoordinate::create("c", "r/x", "f", "tw", "lb", "ts").is_error());
    EXPECT_TRUE(RunCoordinate::create("c", "r", "..", "tw", "lb", "ts").is_error());
    EXPECT_TRUE(RunCoordinate::from_parts({"c", "r", "f"}).is_error());
}

TEST(RunCoordinateTest, StructuralEqualityAndHashing) {
    auto a = RunCoordinate::create("c1", "r1", "f1", "tw1", "lb1", "ts1").value();
    auto b = RunCoordinate::from_parts({"c1", "r1", "f1", "tw1", "lb1", "ts1"}).value();
    auto c = RunCoordinate::create("c1", "r1", "f1", "tw1", "lb1", "ts2").value();

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_TRUE(a < c);

    std::unordered_map<RunCoordinate, int> counts;
    counts[a]++;
    counts[b]++;
    counts[c]++;
    EXPECT_EQ(counts.size(), 2u);
    EXPECT_EQ(counts[a], 2);
}

TEST(StorageStatusTest, AbsentStatusHasNothing) {
    auto status = StorageStatus::absent(StorageSide::Remote, DataKind::Ml);
    EXPECT_FALSE(status.exists());
    EXPECT_EQ(status.unit_count(), 0u);
    EXPECT_EQ(status.total_size(), 0u);
    EXPECT_EQ(status.file_count(), 0u);
    EXPECT_EQ(status.sample_count(), 0u);
    EXPECT_FALSE(status.unit_size("_bag").has_value());
}

TEST(StorageStatusTest, MlFilesRollUpIntoBagUnits) {
    auto status = StorageStatus::absent(StorageSide::Local, DataKind::Ml);
    status.add_ml_file("rosbag_a", MlFileType::Frames, "0001.jpg", 100);
    status.add_ml_file("rosbag_a", MlFileType::Frames, "0002.jpg", 50);
    status.add_ml_file("rosbag_a", MlFileType::Labels, "0001.json", 10);
    status.add_ml_file("rosbag_b", MlFileType::Labels, "0001.json", 5);

    EXPECT_TRUE(status.exists());
    EXPECT_EQ(status.unit_count(), 2u);
    EXPECT_EQ(status.unit_size("rosbag_a"), 160u);
    EXPECT_EQ(status.total_size(), 165u);
    EXPECT_EQ(status.file_count(), 4u);
    EXPECT_EQ(status.sample_count(), 2u);
    EXPECT_EQ(status.unit_names(), (std::vector<std::string>{"rosbag_a", "rosbag_b"}));
}

TEST(DataKindTest, ParsesKnownKinds) {
    EXPECT_EQ(runsync::model::parse_data_kind("raw").value(), DataKind::Raw);
    EXPECT_EQ(runsync::model::parse_data_kind("ml").value(), DataKind::Ml);
    EXPECT_EQ(runsync::model::parse_data_kind("processed").error().code, ErrorCode::ConfigurationError);
    EXPECT_EQ(runsync::model::parse_ml_file_type("labels"), MlFileType::Labels);
    EXPECT_FALSE(runsync::model::parse_ml_file_type("masks").has_value());
}
