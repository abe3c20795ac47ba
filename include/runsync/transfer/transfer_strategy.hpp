#pragma once

#include "runsync/core/cancellation.hpp"
#include "runsync/core/result.hpp"
#include "runsync/local/local_state_scanner.hpp"
#include "runsync/model/coordinate.hpp"
#include "runsync/model/types.hpp"
#include "runsync/paths/path_translator.hpp"
#include "runsync/remote/inventory_cache.hpp"
#include "runsync/remote/object_store.hpp"
#include "runsync/transfer/types.hpp"

#include <cstdint>
#include <memory>

namespace runsync::transfer {

/**
 * @brief Direction and granularity specific steps of a transfer
 *
 * The phase order, locking, worker pool, cache invalidation and result
 * assembly live in TransferEngine::run and cannot be overridden; a strategy
 * only answers these four questions.
 *
 * execute_transfer() is called concurrently from pool threads for distinct
 * items of one plan and must not touch shared mutable state.
 */
class TransferStrategy {
public:
    virtual ~TransferStrategy() = default;

    virtual TransferOperation operation() const noexcept = 0;

    virtual Result<model::StorageStatus> discover_source(const model::RunCoordinate& coord,
                                                         const CancellationToken& token) = 0;
    virtual Result<model::StorageStatus> discover_target(const model::RunCoordinate& coord,
                                                         const CancellationToken& token) = 0;

    virtual Result<TransferPlan> plan_transfer(const model::RunCoordinate& coord,
                                               const model::StorageStatus& source,
                                               const model::StorageStatus& target,
                                               const TransferOptions& options) const = 0;

    /// Bytes moved on success.
    virtual Result<std::uint64_t> execute_transfer(const TransferItem& item, const CancellationToken& token) = 0;
};

/**
 * @brief Collaborators every strategy is built from
 */
struct StrategyContext {
    remote::ObjectStore& store;
    const paths::PathTranslator& translator;
    const local::LocalStateScanner& scanner;
    remote::RemoteInventoryCache& cache;
};

class RawDownloadStrategy : public TransferStrategy {
public:
    explicit RawDownloadStrategy(StrategyContext context) : context_(context) {}

    TransferOperation operation() const noexcept override { return TransferOperation::RawDownload; }
    Result<model::StorageStatus> discover_source(const model::RunCoordinate& coord, const CancellationToken& token) override;
    Result<model::StorageStatus> discover_target(const model::RunCoordinate& coord, const CancellationToken& token) override;
    Result<TransferPlan> plan_transfer(const model::RunCoordinate& coord,
                                       const model::StorageStatus& source,
                                       const model::StorageStatus& target,
                                       const TransferOptions& options) const override;
    Result<std::uint64_t> execute_transfer(const TransferItem& item, const CancellationToken& token) override;

private:
    StrategyContext context_;
};

class RawUploadStrategy : public TransferStrategy {
public:
    explicit RawUploadStrategy(StrategyContext context) : context_(context) {}

    TransferOperation operation() const noexcept override { return TransferOperation::RawUpload; }
    Result<model::StorageStatus> discover_source(const model::RunCoordinate& coord, const CancellationToken& token) override;
    Result<model::StorageStatus> discover_target(const model::RunCoordinate& coord, const CancellationToken& token) override;
    Result<TransferPlan> plan_transfer(const model::RunCoordinate& coord,
                                       const model::StorageStatus& source,
                                       const model::StorageStatus& target,
                                       const TransferOptions& options) const override;
    Result<std::uint64_t> execute_transfer(const TransferItem& item, const CancellationToken& token) override;

private:
    StrategyContext context_;
};

class MlDownloadStrategy : public TransferStrategy {
public:
    explicit MlDownloadStrategy(StrategyContext context) : context_(context) {}

    TransferOperation operation() const noexcept override { return TransferOperation::MlDownload; }
    Result<model::StorageStatus> discover_source(const model::RunCoordinate& coord, const CancellationToken& token) override;
    Result<model::StorageStatus> discover_target(const model::RunCoordinate& coord, const CancellationToken& token) override;
    Result<TransferPlan> plan_transfer(const model::RunCoordinate& coord,
                                       const model::StorageStatus& source,
                                       const model::StorageStatus& target,
                                       const TransferOptions& options) const override;
    Result<std::uint64_t> execute_transfer(const TransferItem& item, const CancellationToken& token) override;

private:
    StrategyContext context_;
};

class MlUploadStrategy : public TransferStrategy {
public:
    explicit MlUploadStrategy(StrategyContext context) : context_(context) {}

    TransferOperation operation() const noexcept override { return TransferOperation::MlUpload; }
    Result<model::StorageStatus> discover_source(const model::RunCoordinate& coord, const CancellationToken& token) override;
    Result<model::StorageStatus> discover_target(const model::RunCoordinate& coord, const CancellationToken& token) override;
    Result<TransferPlan> plan_transfer(const model::RunCoordinate& coord,
                                       const model::StorageStatus& source,
                                       const model::StorageStatus& target,
                                       const TransferOptions& options) const override;
    Result<std::uint64_t> execute_transfer(const TransferItem& item, const CancellationToken& token) override;

private:
    StrategyContext context_;
};

std::unique_ptr<TransferStrategy> make_strategy(TransferOperation operation, StrategyContext context);

} // namespace runsync::transfer
