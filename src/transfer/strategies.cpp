#include "runsync/transfer/item_transfer.hpp"
#include "runsync/transfer/planner.hpp"
#include "runsync/transfer/transfer_strategy.hpp"

namespace runsync::transfer {

using model::DataKind;
using model::RunCoordinate;
using model::StorageStatus;

namespace {

// Remote state comes from the cache; a missing or stale snapshot is rebuilt
// here, never by the status queries themselves.
Result<StorageStatus> remote_status(remote::RemoteInventoryCache& cache,
                                    const RunCoordinate& coord,
                                    DataKind kind,
                                    const CancellationToken& token) {
    auto inventory = cache.full_inventory(false, token);
    if (inventory.is_error()) {
        return Err<StorageStatus>(inventory.error());
    }
    return Ok(inventory.value()->status_for(coord, kind));
}

ItemLocator raw_locator(const paths::PathTranslator& translator, const RunCoordinate& coord, bool download) {
    return [&translator, coord, download](TransferItem& item) {
        const auto& local_name = download ? item.target_unit : item.source_unit;
        const auto& remote_name = download ? item.source_unit : item.target_unit;
        item.local_path = translator.local_raw_bag_path(coord, local_name);
        item.bucket = translator.bucket_for(DataKind::Raw);
        item.remote_key = translator.remote_raw_bag_key(coord, remote_name);
    };
}

ItemLocator ml_locator(const paths::PathTranslator& translator, const RunCoordinate& coord, bool download) {
    return [&translator, coord, download](TransferItem& item) {
        const auto& local_bag = download ? item.target_unit : item.source_unit;
        const auto& remote_bag = download ? item.source_unit : item.target_unit;
        item.local_path = translator.local_ml_file_path(coord, local_bag, *item.file_type, item.filename);
        item.bucket = translator.bucket_for(DataKind::Ml);
        item.remote_key = translator.remote_ml_file_key(coord, remote_bag, *item.file_type, item.filename);
    };
}

} // namespace

// ════════════════════════════════════════════════════════
// Raw download: remote bags -> local bags
// ════════════════════════════════════════════════════════

Result<StorageStatus> RawDownloadStrategy::discover_source(const RunCoordinate& coord, const CancellationToken& token) {
    return remote_status(context_.cache, coord, DataKind::Raw, token);
}

Result<StorageStatus> RawDownloadStrategy::discover_target(const RunCoordinate& coord, const CancellationToken&) {
    return context_.scanner.status_for(coord, DataKind::Raw);
}

Result<TransferPlan> RawDownloadStrategy::plan_transfer(const RunCoordinate& coord,
                                                        const StorageStatus& source,
                                                        const StorageStatus& target,
                                                        const TransferOptions& options) const {
    return build_plan(operation(), coord, source, target, options, context_.translator,
                      raw_locator(context_.translator, coord, true));
}

Result<std::uint64_t> RawDownloadStrategy::execute_transfer(const TransferItem& item, const CancellationToken& token) {
    return ItemTransfer::download(context_.store, item, token);
}

// ════════════════════════════════════════════════════════
// Raw upload: local bags -> remote bags
// ════════════════════════════════════════════════════════

Result<StorageStatus> RawUploadStrategy::discover_source(const RunCoordinate& coord, const CancellationToken&) {
    return context_.scanner.status_for(coord, DataKind::Raw);
}

Result<StorageStatus> RawUploadStrategy::discover_target(const RunCoordinate& coord, const CancellationToken& token) {
    return remote_status(context_.cache, coord, DataKind::Raw, token);
}

Result<TransferPlan> RawUploadStrategy::plan_transfer(const RunCoordinate& coord,
                                                      const StorageStatus& source,
                                                      const StorageStatus& target,
                                                      const TransferOptions& options) const {
    return build_plan(operation(), coord, source, target, options, context_.translator,
                      raw_locator(context_.translator, coord, false));
}

Result<std::uint64_t> RawUploadStrategy::execute_transfer(const TransferItem& item, const CancellationToken& token) {
    return ItemTransfer::upload(context_.store, item, token);
}

// ════════════════════════════════════════════════════════
// ML download: remote bag files -> local bag files
// ════════════════════════════════════════════════════════

Result<StorageStatus> MlDownloadStrategy::discover_source(const RunCoordinate& coord, const CancellationToken& token) {
    return remote_status(context_.cache, coord, DataKind::Ml, token);
}

Result<StorageStatus> MlDownloadStrategy::discover_target(const RunCoordinate& coord, const CancellationToken&) {
    return context_.scanner.status_for(coord, DataKind::Ml);
}

Result<TransferPlan> MlDownloadStrategy::plan_transfer(const RunCoordinate& coord,
                                                       const StorageStatus& source,
                                                       const StorageStatus& target,
                                                       const TransferOptions& options) const {
    return build_plan(operation(), coord, source, target, options, context_.translator,
                      ml_locator(context_.translator, coord, true));
}

Result<std::uint64_t> MlDownloadStrategy::execute_transfer(const TransferItem& item, const CancellationToken& token) {
    return ItemTransfer::download(context_.store, item, token);
}

// ════════════════════════════════════════════════════════
// ML upload: local bag files -> remote bag files
// ════════════════════════════════════════════════════════

Result<StorageStatus> MlUploadStrategy::discover_source(const RunCoordinate& coord, const CancellationToken&) {
    return context_.scanner.status_for(coord, DataKind::Ml);
}

Result<StorageStatus> MlUploadStrategy::discover_target(const RunCoordinate& coord, const CancellationToken& token) {
    return remote_status(context_.cache, coord, DataKind::Ml, token);
}

Result<TransferPlan> MlUploadStrategy::plan_transfer(const RunCoordinate& coord,
                                                     const StorageStatus& source,
                                                     const StorageStatus& target,
                                                     const TransferOptions& options) const {
    return build_plan(operation(), coord, source, target, options, context_.translator,
                      ml_locator(context_.translator, coord, false));
}

Result<std::uint64_t> MlUploadStrategy::execute_transfer(const TransferItem& item, const CancellationToken& token) {
    return ItemTransfer::upload(context_.store, item, token);
}

std::unique_ptr<TransferStrategy> make_strategy(TransferOperation operation, StrategyContext context) {
    switch (operation) {
        case TransferOperation::RawDownload: return std::make_unique<RawDownloadStrategy>(context);
        case TransferOperation::RawUpload: return std::make_unique<RawUploadStrategy>(context);
        case TransferOperation::MlDownload: return std::make_unique<MlDownloadStrategy>(context);
        case TransferOperation::MlUpload: return std::make_unique<MlUploadStrategy>(context);
    }
    return nullptr;
}

} // namespace runsync::transfer
