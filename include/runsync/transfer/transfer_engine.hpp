#pragma once

#include "runsync/events/event_bus.hpp"
#include "runsync/model/coordinate.hpp"
#include "runsync/remote/inventory_cache.hpp"
#include "runsync/transfer/key_lock.hpp"
#include "runsync/transfer/transfer_strategy.hpp"
#include "runsync/transfer/types.hpp"

#include <boost/asio/thread_pool.hpp>

#include <chrono>
#include <cstddef>
#include <vector>

namespace runsync::transfer {

struct EngineOptions {
    std::size_t worker_count = 4;
    std::chrono::milliseconds lock_timeout{std::chrono::seconds(30)};
    std::chrono::milliseconds remote_timeout{0};   ///< per invocation, 0 = caller's token only
};

/**
 * @brief Runs one transfer for one coordinate through the fixed phase sequence
 *
 * discover source -> discover target -> plan -> validate -> execute -> cleanup
 *
 * Invocations for different coordinates may run concurrently; invocations
 * for the same (coordinate, kind) are serialized. Items of one plan are
 * executed on a shared Boost.Asio thread pool and aggregated before cleanup.
 */
class TransferEngine {
public:
    TransferEngine(remote::RemoteInventoryCache& cache, EngineOptions options, events::EventBus* bus = nullptr);
    ~TransferEngine();

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    /**
     * @brief The driver; never fails as a call, failures are in the result
     */
    TransferResult run(TransferStrategy& strategy,
                       const model::RunCoordinate& coord,
                       const TransferOptions& options);

    /**
     * @brief Independent run() per coordinate, in order
     */
    std::vector<TransferResult> run_bulk(TransferStrategy& strategy,
                                         const std::vector<model::RunCoordinate>& coordinates,
                                         const TransferOptions& options);

    const EngineOptions& options() const noexcept { return options_; }

private:
    void execute_items(TransferStrategy& strategy,
                       TransferResult& result,
                       const CancellationToken& token);
    void cleanup(TransferResult& result);
    void finish(TransferResult& result, bool require_full_success);
    void fail(TransferResult& result, TransferPhase phase, Error error);

    remote::RemoteInventoryCache& cache_;
    EngineOptions options_;
    events::EventBus* bus_;
    KeyLockTable locks_;
    boost::asio::thread_pool pool_;
};

} // namespace runsync::transfer
