#pragma once

#include "runsync/core/result.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace runsync::model {

enum class DataKind {
    Raw,   ///< whole rosbag files
    Ml     ///< frame/label files nested under a bag directory
};

enum class StorageSide {
    Local,
    Remote
};

enum class MlFileType {
    Frames,
    Labels
};

const char* to_string(DataKind kind) noexcept;
const char* to_string(StorageSide side) noexcept;
const char* to_string(MlFileType type) noexcept;

Result<DataKind> parse_data_kind(const std::string& text);
std::optional<MlFileType> parse_ml_file_type(const std::string& text);

inline StorageSide opposite(StorageSide side) noexcept {
    return side == StorageSide::Local ? StorageSide::Remote : StorageSide::Local;
}

using FileSizes = std::map<std::string, std::uint64_t>;

/**
 * @brief Files of one ML bag, split by type (filename -> bytes)
 */
struct BagContents {
    FileSizes frames;
    FileSizes labels;

    FileSizes& files(MlFileType type) { return type == MlFileType::Frames ? frames : labels; }
    const FileSizes& files(MlFileType type) const { return type == MlFileType::Frames ? frames : labels; }

    std::uint64_t total_bytes() const;
    std::size_t file_count() const { return frames.size() + labels.size(); }
};

/**
 * @brief What one side holds for one coordinate and kind
 *
 * Unit names are always in the native convention of `side`. For raw data a
 * unit is a bag file; for ML data a unit is a bag directory and `bag_files`
 * carries its frame/label files. Statuses are produced fresh by every
 * discovery call.
 */
struct StorageStatus {
    StorageSide side = StorageSide::Local;
    DataKind kind = DataKind::Raw;
    std::map<std::string, std::uint64_t> units;   ///< unit name -> bytes (ordered)
    std::map<std::string, BagContents> bag_files; ///< ML only

    static StorageStatus absent(StorageSide side, DataKind kind);

    void add_unit(const std::string& name, std::uint64_t size);
    void add_ml_file(const std::string& bag, MlFileType type, const std::string& filename, std::uint64_t size);

    bool exists() const noexcept { return !units.empty(); }
    std::size_t unit_count() const noexcept { return units.size(); }
    std::vector<std::string> unit_names() const;
    std::uint64_t total_size() const;
    bool has_unit(const std::string& name) const { return units.count(name) > 0; }
    std::optional<std::uint64_t> unit_size(const std::string& name) const;

    std::size_t file_count() const;
    /// Number of label files; each label marks one annotated sample.
    std::size_t sample_count() const;
};

} // namespace runsync::model
