#include "runsync/local/local_state_scanner.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <system_error>
#include <vector>

namespace runsync::local {
namespace fs = std::filesystem;

using model::DataKind;
using model::RunCoordinate;
using model::StorageSide;
using model::StorageStatus;

namespace {

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_not_found(const std::error_code& ec) {
    return ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory;
}

Error filesystem_error(const std::string& what, const fs::path& path, const std::error_code& ec) {
    return Error(ErrorCode::FilesystemError, what + ": " + ec.message(), path.string());
}

struct Entry {
    std::string name;
    fs::path path;
    bool is_directory = false;
    bool is_regular_file = false;
    std::uint64_t size = 0;
};

// Lists a directory sorted by name. A directory that vanished reads as empty.
Result<std::vector<Entry>> list_directory(const fs::path& dir, bool want_sizes) {
    std::vector<Entry> entries;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        if (is_not_found(ec)) {
            return Ok(std::move(entries));
        }
        return Err<std::vector<Entry>>(filesystem_error("Failed to list directory", dir, ec));
    }

    for (const auto end = fs::directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            return Err<std::vector<Entry>>(filesystem_error("Failed to read directory entry", dir, ec));
        }

        Entry entry;
        entry.path = it->path();
        entry.name = entry.path.filename().string();

        std::error_code status_ec;
        const auto status = it->status(status_ec);
        if (status_ec) {
            if (is_not_found(status_ec)) {
                continue;
            }
            return Err<std::vector<Entry>>(filesystem_error("Failed to stat", entry.path, status_ec));
        }
        entry.is_directory = fs::is_directory(status);
        entry.is_regular_file = fs::is_regular_file(status);

        if (want_sizes && entry.is_regular_file) {
            std::error_code size_ec;
            entry.size = it->file_size(size_ec);
            if (size_ec) {
                if (is_not_found(size_ec)) {
                    continue;
                }
                return Err<std::vector<Entry>>(filesystem_error("Failed to read file size", entry.path, size_ec));
            }
        }
        entries.push_back(std::move(entry));
    }
    if (ec) {
        return Err<std::vector<Entry>>(filesystem_error("Failed to read directory entry", dir, ec));
    }

    std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) { return a.name < b.name; });
    return Ok(std::move(entries));
}

const std::array<const char*, 3> kTrackingBookkeepingKeys{{"metadata", "last_updated", "version"}};

bool is_bookkeeping_key(const std::string& key) {
    return std::find(kTrackingBookkeepingKeys.begin(), kTrackingBookkeepingKeys.end(), key) !=
           kTrackingBookkeepingKeys.end();
}

} // namespace

LocalStateScanner::LocalStateScanner(const paths::PathTranslator& translator) : translator_(translator) {
    for (auto kind : {DataKind::Raw, DataKind::Ml}) {
        std::error_code ec;
        const auto root = translator_.local_kind_root(kind);
        if (!fs::exists(root, ec)) {
            spdlog::warn("Local {} root does not exist: {}", model::to_string(kind), root.string());
        }
    }
}

Result<StorageStatus> LocalStateScanner::status_for(const RunCoordinate& coord, DataKind kind) const {
    auto status = StorageStatus::absent(StorageSide::Local, kind);
    const auto dir = translator_.local_coordinate_dir(coord, kind);

    std::error_code ec;
    const auto dir_status = fs::status(dir, ec);
    if (ec && !is_not_found(ec)) {
        return Err<StorageStatus>(filesystem_error("Failed to stat coordinate directory", dir, ec));
    }
    if (!fs::is_directory(dir_status)) {
        return Ok(std::move(status));
    }

    auto scanned = kind == DataKind::Raw ? scan_raw(dir, status) : scan_ml(dir, status);
    if (scanned.is_error()) {
        return Err<StorageStatus>(scanned.error());
    }

    spdlog::debug("Local {} status for {}: {} units, {} bytes",
                  model::to_string(kind), coord.to_string(), status.unit_count(), status.total_size());
    return Ok(std::move(status));
}

Result<StatusMap> LocalStateScanner::all_statuses(DataKind kind) const {
    std::vector<RunCoordinate> coordinates;
    auto walked = for_each_coordinate(kind, [&](const RunCoordinate& coord) {
        coordinates.push_back(coord);
    });
    if (walked.is_error()) {
        return Err<StatusMap>(walked.error());
    }

    StatusMap statuses;
    for (const auto& coord : coordinates) {
        auto status = status_for(coord, kind);
        if (status.is_error()) {
            return Err<StatusMap>(status.error());
        }
        statuses.emplace(coord, std::move(status.value()));
    }

    spdlog::info("Discovered {} local {} coordinates", statuses.size(), model::to_string(kind));
    return Ok(std::move(statuses));
}

Result<void> LocalStateScanner::for_each_coordinate(DataKind kind, const CoordinateVisitor& visitor) const {
    std::vector<std::string> parts;
    parts.reserve(RunCoordinate::kLevels);
    return walk_level(translator_.local_kind_root(kind), parts, visitor);
}

fs::path LocalStateScanner::export_tracking_path() const {
    return translator_.local_kind_root(DataKind::Ml) / kExportTrackingFile;
}

Result<std::optional<nlohmann::json>> LocalStateScanner::read_export_tracking() const {
    using Tracking = std::optional<nlohmann::json>;
    const auto path = export_tracking_path();

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec && !is_not_found(ec)) {
            return Err<Tracking>(filesystem_error("Failed to stat export tracking file", path, ec));
        }
        return Ok(Tracking{});
    }

    std::ifstream input(path);
    if (!input) {
        return Err<Tracking>(ErrorCode::FilesystemError, "Cannot open export tracking file", path.string());
    }
    auto document = nlohmann::json::parse(input, nullptr, false);
    if (document.is_discarded()) {
        return Err<Tracking>(ErrorCode::FilesystemError, "Export tracking file is not valid JSON", path.string());
    }
    return Ok(Tracking(std::move(document)));
}

Result<std::vector<std::string>> LocalStateScanner::export_ids() const {
    auto tracking = read_export_tracking();
    if (tracking.is_error()) {
        return Err<std::vector<std::string>>(tracking.error());
    }

    std::vector<std::string> ids;
    if (!tracking.value()) {
        spdlog::info("No export tracking file at {}", export_tracking_path().string());
        return Ok(std::move(ids));
    }

    const auto& document = *tracking.value();
    if (!document.is_object()) {
        return Ok(std::move(ids));
    }
    const auto exports = document.find("exports");
    if (exports != document.end() && exports->is_object()) {
        for (const auto& [id, _] : exports->items()) {
            ids.push_back(id);
        }
    } else {
        for (const auto& [key, _] : document.items()) {
            if (!is_bookkeeping_key(key)) {
                ids.push_back(key);
            }
        }
    }
    std::sort(ids.begin(), ids.end());
    return Ok(std::move(ids));
}

Result<nlohmann::json> LocalStateScanner::export_info(const std::string& export_id) const {
    auto tracking = read_export_tracking();
    if (tracking.is_error()) {
        return Err<nlohmann::json>(tracking.error());
    }
    if (!tracking.value()) {
        return Err<nlohmann::json>(ErrorCode::NotFound, "Export tracking file not found",
                                   export_tracking_path().string());
    }

    const auto& document = *tracking.value();
    if (document.is_object()) {
        const auto exports = document.find("exports");
        if (exports != document.end() && exports->is_object() && exports->contains(export_id)) {
            return Ok(nlohmann::json((*exports)[export_id]));
        }
        if (!is_bookkeeping_key(export_id) && document.contains(export_id)) {
            return Ok(nlohmann::json(document[export_id]));
        }
    }
    return Err<nlohmann::json>(ErrorCode::NotFound, "Export id not listed", "'" + export_id + "'");
}

Result<void> LocalStateScanner::scan_raw(const fs::path& dir, StorageStatus& status) const {
    auto entries = list_directory(dir, true);
    if (entries.is_error()) {
        return Err<void>(entries.error());
    }

    for (const auto& entry : entries.value()) {
        if (!entry.is_regular_file || entry.path.extension() != paths::PathTranslator::kBagExtension) {
            continue;
        }
        status.add_unit(entry.name, entry.size);
    }
    return Ok();
}

Result<void> LocalStateScanner::scan_ml(const fs::path& dir, StorageStatus& status) const {
    auto bags = list_directory(dir, false);
    if (bags.is_error()) {
        return Err<void>(bags.error());
    }

    // <bag>/<frames|labels>/<file>
    for (const auto& bag : bags.value()) {
        if (!bag.is_directory) {
            continue;
        }
        auto type_dirs = list_directory(bag.path, false);
        if (type_dirs.is_error()) {
            return Err<void>(type_dirs.error());
        }

        for (const auto& type_dir : type_dirs.value()) {
            const auto type = model::parse_ml_file_type(type_dir.name);
            if (!type_dir.is_directory || !type) {
                continue;
            }
            auto files = list_directory(type_dir.path, true);
            if (files.is_error()) {
                return Err<void>(files.error());
            }
            for (const auto& file : files.value()) {
                // Leftovers of an interrupted download are not data.
                if (file.is_regular_file && !ends_with(file.name, paths::PathTranslator::kPartialSuffix)) {
                    status.add_ml_file(bag.name, *type, file.name, file.size);
                }
            }
        }
    }
    return Ok();
}

Result<void> LocalStateScanner::walk_level(const fs::path& dir,
                                           std::vector<std::string>& parts,
                                           const CoordinateVisitor& visitor) const {
    if (parts.size() == RunCoordinate::kLevels) {
        auto coord = RunCoordinate::from_parts(parts);
        if (coord.is_error()) {
            spdlog::debug("Skipping directory that is not a coordinate: {}", dir.string());
            return Ok();
        }
        visitor(coord.value());
        return Ok();
    }

    auto entries = list_directory(dir, false);
    if (entries.is_error()) {
        return Err<void>(entries.error());
    }

    for (const auto& entry : entries.value()) {
        if (!entry.is_directory) {
            continue;
        }
        parts.push_back(entry.name);
        auto result = walk_level(entry.path, parts, visitor);
        parts.pop_back();
        if (result.is_error()) {
            return result;
        }
    }
    return Ok();
}

} // namespace runsync::local
