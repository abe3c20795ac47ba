#pragma once

#include "runsync/core/result.hpp"
#include "runsync/model/coordinate.hpp"
#include "runsync/model/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace runsync::paths {

/**
 * @brief Static roots and bucket names the translator resolves against
 */
struct StorageLayout {
    std::filesystem::path raw_root;
    std::filesystem::path ml_root;
    std::filesystem::path processed_root;
    std::string raw_bucket;
    std::string ml_bucket;
};

/**
 * @brief Bag-name prefixes of one data kind on each side
 *
 * Local bags are named `rosbag_<stamp>_<n>.bag`, the remote store drops the
 * `rosbag` token and keeps the leading underscore.
 */
struct NamingRule {
    model::DataKind kind;
    std::string local_prefix;
    std::string remote_prefix;
};

/**
 * @brief Remote object key decoded into its coordinate and unit parts
 */
struct RemoteObjectRef {
    model::RunCoordinate coordinate;
    std::string bag;                              ///< remote convention
    std::optional<model::MlFileType> file_type;   ///< ML keys only
    std::string filename;                         ///< ML keys only
};

class PathTranslator {
public:
    static constexpr const char* kRemoteBagDir = "rosbag";
    static constexpr const char* kMlRawDir = "raw";
    static constexpr const char* kBagExtension = ".bag";
    /// Appended to a download's destination until it is complete.
    static constexpr const char* kPartialSuffix = ".partial";

    explicit PathTranslator(StorageLayout layout);

    const StorageLayout& layout() const noexcept { return layout_; }

    // Coordinate level
    std::filesystem::path local_kind_root(model::DataKind kind) const;
    std::filesystem::path local_coordinate_dir(const model::RunCoordinate& coord, model::DataKind kind) const;
    std::string remote_coordinate_prefix(const model::RunCoordinate& coord, model::DataKind kind) const;
    std::string coordinate_location(const model::RunCoordinate& coord,
                                    model::StorageSide side,
                                    model::DataKind kind) const;
    std::filesystem::path processed_coordinate_dir(const model::RunCoordinate& coord) const;
    const std::string& bucket_for(model::DataKind kind) const;

    // Unit level
    std::filesystem::path local_raw_bag_path(const model::RunCoordinate& coord, const std::string& local_bag) const;
    std::string remote_raw_bag_key(const model::RunCoordinate& coord, const std::string& remote_bag) const;
    std::filesystem::path local_ml_file_path(const model::RunCoordinate& coord,
                                             const std::string& local_bag,
                                             model::MlFileType type,
                                             const std::string& filename) const;
    std::string remote_ml_file_key(const model::RunCoordinate& coord,
                                   const std::string& remote_bag,
                                   model::MlFileType type,
                                   const std::string& filename) const;

    // Naming conventions
    Result<std::string> translate_unit_name(const std::string& name,
                                            model::StorageSide from_side,
                                            model::DataKind kind) const;
    bool matches_convention(const std::string& name, model::StorageSide side, model::DataKind kind) const;

    /**
     * @brief Decode a bucket key, nullopt when it is not part of the layout
     */
    std::optional<RemoteObjectRef> parse_remote_key(model::DataKind kind, const std::string& key) const;

    static const NamingRule& naming_rule(model::DataKind kind);

private:
    static std::vector<std::string> split_key(const std::string& key);

    StorageLayout layout_;
};

} // namespace runsync::paths
