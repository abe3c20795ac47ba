#include "runsync/transfer/types.hpp"

#include <algorithm>

namespace runsync::transfer {

using model::DataKind;
using model::StorageSide;

const char* to_string(ConflictPolicy policy) noexcept {
    switch (policy) {
        case ConflictPolicy::Skip: return "skip";
        case ConflictPolicy::Overwrite: return "overwrite";
        default: return "unknown";
    }
}

Result<ConflictPolicy> parse_conflict_policy(const std::string& text) {
    if (text == "skip") return Ok(ConflictPolicy::Skip);
    if (text == "overwrite") return Ok(ConflictPolicy::Overwrite);
    return Err<ConflictPolicy>(ErrorCode::ConfigurationError,
                               "Unsupported conflict policy '" + text + "' (expected 'skip' or 'overwrite')");
}

const char* to_string(TransferOperation operation) noexcept {
    switch (operation) {
        case TransferOperation::RawDownload: return "raw-download";
        case TransferOperation::RawUpload: return "raw-upload";
        case TransferOperation::MlDownload: return "ml-download";
        case TransferOperation::MlUpload: return "ml-upload";
        default: return "unknown";
    }
}

Result<TransferOperation> parse_transfer_operation(const std::string& text) {
    for (auto op : {TransferOperation::RawDownload, TransferOperation::RawUpload,
                    TransferOperation::MlDownload, TransferOperation::MlUpload}) {
        if (text == to_string(op)) {
            return Ok(op);
        }
    }
    return Err<TransferOperation>(ErrorCode::ConfigurationError, "Unknown transfer operation: " + text);
}

DataKind kind_of(TransferOperation operation) noexcept {
    return operation == TransferOperation::RawDownload || operation == TransferOperation::RawUpload
               ? DataKind::Raw
               : DataKind::Ml;
}

StorageSide source_side(TransferOperation operation) noexcept {
    return operation == TransferOperation::RawDownload || operation == TransferOperation::MlDownload
               ? StorageSide::Remote
               : StorageSide::Local;
}

bool Selection::selects_type(model::MlFileType type) const {
    return file_types.empty() || std::find(file_types.begin(), file_types.end(), type) != file_types.end();
}

std::string TransferItem::source_location() const {
    return from == StorageSide::Remote ? bucket + "/" + remote_key : local_path.generic_string();
}

std::string TransferItem::destination_location() const {
    return from == StorageSide::Remote ? local_path.generic_string() : bucket + "/" + remote_key;
}

std::string TransferItem::label() const {
    if (!file_type) {
        return target_unit;
    }
    return target_unit + "/" + model::to_string(*file_type) + "/" + filename;
}

std::string Conflict::label() const {
    if (!file_type) {
        return target_unit;
    }
    return target_unit + "/" + model::to_string(*file_type) + "/" + filename;
}

std::uint64_t TransferPlan::total_bytes() const {
    std::uint64_t total = 0;
    for (const auto& item : items) {
        total += item.size;
    }
    return total;
}

const char* to_string(ItemStatus status) noexcept {
    switch (status) {
        case ItemStatus::Succeeded: return "succeeded";
        case ItemStatus::Failed: return "failed";
        case ItemStatus::Cancelled: return "cancelled";
        case ItemStatus::Simulated: return "simulated";
        default: return "unknown";
    }
}

const char* to_string(TransferPhase phase) noexcept {
    switch (phase) {
        case TransferPhase::DiscoverSource: return "discover-source";
        case TransferPhase::DiscoverTarget: return "discover-target";
        case TransferPhase::Plan: return "plan";
        case TransferPhase::Validate: return "validate";
        case TransferPhase::Execute: return "execute";
        case TransferPhase::Cleanup: return "cleanup";
        default: return "unknown";
    }
}

} // namespace runsync::transfer
