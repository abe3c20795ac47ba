#pragma once

#include "runsync/core/result.hpp"
#include "runsync/model/coordinate.hpp"
#include "runsync/model/types.hpp"
#include "runsync/paths/path_translator.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace runsync::local {

using StatusMap = std::unordered_map<model::RunCoordinate, model::StorageStatus>;

/**
 * @brief Reports what the local filesystem holds beneath the configured roots
 *
 * Read-only; never touches the network. A coordinate whose directory does not
 * exist is reported as absent rather than as an error.
 */
class LocalStateScanner {
public:
    using CoordinateVisitor = std::function<void(const model::RunCoordinate&)>;

    explicit LocalStateScanner(const paths::PathTranslator& translator);

    Result<model::StorageStatus> status_for(const model::RunCoordinate& coord, model::DataKind kind) const;

    Result<StatusMap> all_statuses(model::DataKind kind) const;

    /**
     * @brief Visit every six-level coordinate directory under the kind's root
     *
     * Missing intermediate directories are treated as absence and non-directory
     * entries are skipped. Children are visited in name order so repeated walks
     * over an unchanged tree produce the same sequence.
     */
    Result<void> for_each_coordinate(model::DataKind kind, const CoordinateVisitor& visitor) const;

    /// Written by the dataset exporter next to the exported coordinates.
    static constexpr const char* kExportTrackingFile = ".export_tracking.json";

    /**
     * @brief Sorted ids of the dataset exports recorded under the ML root
     *
     * Ids are the keys of "exports" when present, otherwise the top-level keys
     * other than "metadata", "last_updated" and "version". A missing tracking
     * file means no exports.
     */
    Result<std::vector<std::string>> export_ids() const;

    /// The tracking record of one export; NotFound when it is not listed.
    Result<nlohmann::json> export_info(const std::string& export_id) const;

    std::filesystem::path export_tracking_path() const;

private:
    Result<std::optional<nlohmann::json>> read_export_tracking() const;

    Result<void> scan_raw(const std::filesystem::path& dir, model::StorageStatus& status) const;
    Result<void> scan_ml(const std::filesystem::path& dir, model::StorageStatus& status) const;

    Result<void> walk_level(const std::filesystem::path& dir,
                            std::vector<std::string>& parts,
                            const CoordinateVisitor& visitor) const;

    const paths::PathTranslator& translator_;
};

} // namespace runsync::local
