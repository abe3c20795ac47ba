#pragma once

#include "runsync/core/cancellation.hpp"
#include "runsync/core/result.hpp"
#include "runsync/model/coordinate.hpp"
#include "runsync/model/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace runsync::transfer {

/**
 * @brief What to do with a unit present on both sides with different sizes
 *
 * Only these two policies exist. Anything else is rejected when parsed.
 */
enum class ConflictPolicy {
    Skip,       ///< report the conflict, transfer nothing
    Overwrite   ///< replace the target copy
};

const char* to_string(ConflictPolicy policy) noexcept;
Result<ConflictPolicy> parse_conflict_policy(const std::string& text);

enum class TransferOperation {
    RawDownload,
    RawUpload,
    MlDownload,
    MlUpload
};

const char* to_string(TransferOperation operation) noexcept;
Result<TransferOperation> parse_transfer_operation(const std::string& text);
model::DataKind kind_of(TransferOperation operation) noexcept;
model::StorageSide source_side(TransferOperation operation) noexcept;
inline model::StorageSide target_side(TransferOperation operation) noexcept {
    return model::opposite(source_side(operation));
}

/**
 * @brief Which source units to consider
 *
 * Indices refer to the source's unit names in sorted order; names are in the
 * source convention. Both empty selects every unit. For ML data the unit
 * filters pick bags and `file_types` narrows the files inside them.
 */
struct Selection {
    std::vector<std::size_t> unit_indices;
    std::vector<std::string> unit_names;
    std::vector<model::MlFileType> file_types;   ///< empty = frames and labels

    bool selects_all_units() const noexcept { return unit_indices.empty() && unit_names.empty(); }
    bool selects_type(model::MlFileType type) const;
};

struct TransferOptions {
    ConflictPolicy policy = ConflictPolicy::Skip;
    bool dry_run = false;
    bool require_full_success = false;
    Selection selection;
    CancellationToken token;
};

/**
 * @brief One byte move between a local path and a remote object
 *
 * Self-contained: a strategy executes it without looking anything up.
 * For ML items the unit is one file; `source_unit`/`target_unit` still name
 * the enclosing bag in each side's convention.
 */
struct TransferItem {
    model::StorageSide from = model::StorageSide::Remote;
    std::string source_unit;
    std::string target_unit;
    std::optional<model::MlFileType> file_type;
    std::string filename;

    std::filesystem::path local_path;
    std::string bucket;
    std::string remote_key;

    std::uint64_t size = 0;
    bool overwrite = false;

    std::string source_location() const;
    std::string destination_location() const;
    /// Target-side name, with the file for ML items ("bag/frames/0001.jpg").
    std::string label() const;
};

/**
 * @brief Same logical unit on both sides with differing sizes
 */
struct Conflict {
    std::string source_unit;
    std::string target_unit;
    std::optional<model::MlFileType> file_type;
    std::string filename;
    std::uint64_t source_size = 0;
    std::uint64_t target_size = 0;

    std::string label() const;
};

struct TransferPlan {
    TransferPlan(TransferOperation op, model::RunCoordinate coord)
        : operation(op), coordinate(std::move(coord)) {}

    TransferOperation operation;
    model::RunCoordinate coordinate;
    std::vector<TransferItem> items;
    std::vector<Conflict> conflicts;
    std::vector<std::string> already_synced;   ///< target-side labels

    bool empty() const noexcept { return items.empty(); }
    std::uint64_t total_bytes() const;
};

enum class ItemStatus {
    Succeeded,
    Failed,
    Cancelled,   ///< never started because the token fired
    Simulated    ///< dry run
};

const char* to_string(ItemStatus status) noexcept;

struct ItemOutcome {
    TransferItem item;
    ItemStatus status = ItemStatus::Failed;
    std::optional<Error> error;
    std::uint64_t bytes = 0;
};

enum class TransferPhase {
    DiscoverSource,
    DiscoverTarget,
    Plan,
    Validate,
    Execute,
    Cleanup
};

const char* to_string(TransferPhase phase) noexcept;

/**
 * @brief Everything one engine invocation did, returned by value
 *
 * `success` is the operation-level verdict: false on a fatal error, when
 * every item failed, or (with require_full_success) when any item failed.
 * overall_success() is the stricter "nothing failed".
 */
struct TransferResult {
    TransferResult(TransferOperation op, model::RunCoordinate coord)
        : operation(op), coordinate(coord), plan(op, coord) {}

    TransferOperation operation;
    model::RunCoordinate coordinate;

    bool success = false;
    bool nothing_to_do = false;
    bool dry_run = false;
    bool cancelled = false;

    TransferPlan plan;
    std::vector<ItemOutcome> outcomes;

    std::size_t succeeded_count = 0;
    std::size_t failed_count = 0;
    std::size_t cancelled_count = 0;
    std::size_t simulated_count = 0;
    std::uint64_t bytes_transferred = 0;
    std::chrono::milliseconds duration{0};

    std::vector<TransferPhase> phases;
    std::vector<Error> warnings;
    std::optional<Error> fatal_error;
    std::optional<TransferPhase> failed_phase;

    bool overall_success() const noexcept { return failed_count == 0; }
    std::size_t conflict_count() const noexcept { return plan.conflicts.size(); }
};

} // namespace runsync::transfer
