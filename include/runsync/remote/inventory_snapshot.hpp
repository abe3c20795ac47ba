#pragma once

#include "runsync/core/cancellation.hpp"
#include "runsync/core/result.hpp"
#include "runsync/model/coordinate.hpp"
#include "runsync/model/types.hpp"
#include "runsync/paths/path_translator.hpp"
#include "runsync/remote/object_store.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace runsync::remote {

/**
 * @brief Immutable picture of both remote buckets at one point in time
 *
 * Built off to the side by a refresh and then published as a
 * shared_ptr<const InventorySnapshot>; readers never see a half built one.
 * Unit names are in the remote convention.
 *
 * PERSISTED FORM:
 * {
 *   "metadata": { "format_version", "last_refresh", "buckets", "object_count",
 *                 "total_bytes", "stale" },
 *   "raw": { <client>: { <region>: ... { <timestamp>: { <bag>: size } } } },
 *   "ml":  { <client>: ... { <timestamp>: { <bag>: { "frames": {...}, "labels": {...} } } } }
 * }
 */
class InventorySnapshot {
public:
    static constexpr int kFormatVersion = 1;

    using Clock = std::chrono::system_clock;
    using CoordinateMap = std::map<model::RunCoordinate, model::StorageStatus>;

    struct Metadata {
        Clock::time_point last_refresh{};
        std::string raw_bucket;
        std::string ml_bucket;
        std::uint64_t object_count = 0;
        std::uint64_t total_bytes = 0;
        std::uint64_t foreign_objects = 0;   ///< keys outside the layout, not persisted
    };

    InventorySnapshot() = default;
    InventorySnapshot(Metadata metadata, CoordinateMap raw, CoordinateMap ml);

    /**
     * @brief List both buckets and fold every recognised key into a snapshot
     *
     * Any store error (including cancellation) fails the whole build; a
     * partially listed inventory is never returned.
     */
    static Result<InventorySnapshot> build(ObjectStore& store,
                                           const paths::PathTranslator& translator,
                                           const CancellationToken& token);

    const Metadata& metadata() const noexcept { return metadata_; }
    const CoordinateMap& entries(model::DataKind kind) const noexcept {
        return kind == model::DataKind::Raw ? raw_ : ml_;
    }

    /// Remote status of one coordinate; absent when the snapshot has no entry.
    model::StorageStatus status_for(const model::RunCoordinate& coord, model::DataKind kind) const;

    std::size_t coordinate_count() const noexcept { return raw_.size() + ml_.size(); }

    /**
     * @brief Distinct values one level below `parent_parts`
     *
     * An empty parent lists clients, one part lists the client's regions and
     * so on down to timestamps. Sorted, no duplicates.
     */
    std::vector<std::string> hierarchy_level(model::DataKind kind, const std::vector<std::string>& parent_parts) const;

    /// True when some coordinate starts with `parts` (1 to 6 levels).
    bool path_exists(model::DataKind kind, const std::vector<std::string>& parts) const;

    nlohmann::json to_json() const;
    static Result<InventorySnapshot> from_json(const nlohmann::json& document);

private:
    static bool has_prefix(const model::RunCoordinate& coord, const std::vector<std::string>& parts);

    Metadata metadata_;
    CoordinateMap raw_;
    CoordinateMap ml_;
};

} // namespace runsync::remote
