#include "runsync/transfer/transfer_engine.hpp"

#include "runsync/events/events.hpp"

#include <boost/asio/post.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <condition_variable>
#include <mutex>

namespace runsync::transfer {

using model::RunCoordinate;

namespace {

std::string lock_key(const RunCoordinate& coord, model::DataKind kind) {
    return std::string(model::to_string(kind)) + ":" + coord.to_path_string('/');
}

std::string phase_context(const RunCoordinate& coord, TransferPhase phase) {
    return coord.to_string() + " during " + to_string(phase);
}

// Counts finished pool tasks so the execute phase can wait for all of them.
class CompletionLatch {
public:
    explicit CompletionLatch(std::size_t count) : remaining_(count) {}

    void count_down() {
        std::lock_guard lock(mutex_);
        if (remaining_ > 0 && --remaining_ == 0) {
            done_.notify_all();
        }
    }

    void wait() {
        std::unique_lock lock(mutex_);
        done_.wait(lock, [this] { return remaining_ == 0; });
    }

private:
    std::mutex mutex_;
    std::condition_variable done_;
    std::size_t remaining_;
};

} // namespace

TransferEngine::TransferEngine(remote::RemoteInventoryCache& cache, EngineOptions options, events::EventBus* bus)
    : cache_(cache),
      options_(std::move(options)),
      bus_(bus),
      pool_(std::max<std::size_t>(1, options_.worker_count)) {}

TransferEngine::~TransferEngine() {
    pool_.join();
}

TransferResult TransferEngine::run(TransferStrategy& strategy, const RunCoordinate& coord, const TransferOptions& options) {
    const auto started = std::chrono::steady_clock::now();
    const auto operation = strategy.operation();
    const auto kind = kind_of(operation);

    TransferResult result(operation, coord);
    result.dry_run = options.dry_run;

    const auto token = options_.remote_timeout.count() > 0 ? options.token.with_timeout(options_.remote_timeout)
                                                           : options.token;

    auto guard = locks_.acquire(lock_key(coord, kind), token, options_.lock_timeout);
    if (guard.is_error()) {
        fail(result, TransferPhase::DiscoverSource, guard.error());
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
        return result;
    }
    const auto held = std::move(guard.value());

    spdlog::debug("Starting {} for {}", to_string(operation), coord.to_string());

    // Phase 1: discover source
    result.phases.push_back(TransferPhase::DiscoverSource);
    auto source = strategy.discover_source(coord, token);
    if (source.is_error()) {
        fail(result, TransferPhase::DiscoverSource,
             source.error().wrap(ErrorCode::DiscoveryFailed, phase_context(coord, TransferPhase::DiscoverSource)));
    }

    // Phase 2: discover target
    std::optional<model::StorageStatus> target;
    if (!result.fatal_error) {
        result.phases.push_back(TransferPhase::DiscoverTarget);
        auto discovered = strategy.discover_target(coord, token);
        if (discovered.is_error()) {
            fail(result, TransferPhase::DiscoverTarget,
                 discovered.error().wrap(ErrorCode::DiscoveryFailed, phase_context(coord, TransferPhase::DiscoverTarget)));
        } else {
            target = std::move(discovered.value());
        }
    }

    // Phase 3: plan
    if (!result.fatal_error) {
        result.phases.push_back(TransferPhase::Plan);
        auto plan = strategy.plan_transfer(coord, source.value(), *target, options);
        if (plan.is_error()) {
            auto error = plan.error();
            error.context = phase_context(coord, TransferPhase::Plan) + (error.context.empty() ? "" : ": " + error.context);
            fail(result, TransferPhase::Plan, std::move(error));
        } else {
            result.plan = std::move(plan.value());
            if (bus_) {
                for (const auto& conflict : result.plan.conflicts) {
                    bus_->emit(events::TransferConflictDetectedEvent{
                        to_string(operation), coord, conflict.label(), conflict.source_size, conflict.target_size,
                        options.policy == ConflictPolicy::Overwrite});
                }
            }
        }
    }

    // Phase 4: validate
    if (!result.fatal_error) {
        result.phases.push_back(TransferPhase::Validate);
        result.nothing_to_do = result.plan.empty();
        if (result.nothing_to_do) {
            spdlog::info("{} at {}: nothing to do ({} already synchronized, {} conflicts)",
                         to_string(operation), coord.to_string(),
                         result.plan.already_synced.size(), result.plan.conflicts.size());
        }
    }

    // Phase 5: execute
    if (!result.fatal_error) {
        result.phases.push_back(TransferPhase::Execute);
        if (!result.nothing_to_do) {
            if (bus_) {
                bus_->emit(events::TransferStartedEvent{to_string(operation), coord, kind, result.plan.items.size(),
                                                        result.plan.total_bytes(), options.dry_run});
            }
            if (options.dry_run) {
                for (const auto& item : result.plan.items) {
                    result.outcomes.push_back(ItemOutcome{item, ItemStatus::Simulated, std::nullopt, 0});
                }
            } else {
                execute_items(strategy, result, token);
            }
        }
    }

    // Phase 6: cleanup
    if (!result.fatal_error) {
        result.phases.push_back(TransferPhase::Cleanup);
        finish(result, options.require_full_success);
        cleanup(result);
    }

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

    if (bus_) {
        bus_->emit(events::TransferCompletedEvent{to_string(operation), coord, result.success, result.cancelled,
                                                  result.nothing_to_do, result.succeeded_count, result.failed_count,
                                                  result.bytes_transferred, result.duration});
    }
    return result;
}

std::vector<TransferResult> TransferEngine::run_bulk(TransferStrategy& strategy,
                                                     const std::vector<RunCoordinate>& coordinates,
                                                     const TransferOptions& options) {
    std::vector<TransferResult> results;
    results.reserve(coordinates.size());
    for (const auto& coord : coordinates) {
        results.push_back(run(strategy, coord, options));
    }
    return results;
}

void TransferEngine::execute_items(TransferStrategy& strategy, TransferResult& result, const CancellationToken& token) {
    const auto& items = result.plan.items;
    const auto operation = to_string(result.operation);
    const auto& coord = result.coordinate;

    std::vector<ItemOutcome> outcomes;
    outcomes.reserve(items.size());
    for (const auto& item : items) {
        outcomes.push_back(ItemOutcome{item, ItemStatus::Cancelled, std::nullopt, 0});
    }

    CompletionLatch latch(items.size());
    for (std::size_t i = 0; i < items.size(); ++i) {
        boost::asio::post(pool_, [&, i] {
            auto& outcome = outcomes[i];
            if (token.is_cancelled()) {
                outcome.status = ItemStatus::Cancelled;
                outcome.error = Error(ErrorCode::Cancelled, "Not started: transfer cancelled", outcome.item.label());
                latch.count_down();
                return;
            }

            auto moved = strategy.execute_transfer(outcome.item, token);
            if (moved.is_ok()) {
                outcome.status = ItemStatus::Succeeded;
                outcome.bytes = moved.value();
                if (bus_) {
                    bus_->emit(events::TransferItemCompletedEvent{operation, coord, outcome.item.label(),
                                                                  outcome.item.destination_location(), outcome.bytes});
                }
            } else if (moved.error().code == ErrorCode::Cancelled) {
                outcome.status = ItemStatus::Cancelled;
                outcome.error = moved.error();
            } else {
                outcome.status = ItemStatus::Failed;
                outcome.error = moved.error().wrap(ErrorCode::TransferItemFailed, outcome.item.label());
                if (bus_) {
                    bus_->emit(events::TransferItemFailedEvent{operation, coord, outcome.item.label(),
                                                               outcome.error->describe()});
                }
            }
            latch.count_down();
        });
    }
    latch.wait();

    result.outcomes = std::move(outcomes);
}

void TransferEngine::finish(TransferResult& result, bool require_full_success) {
    for (const auto& outcome : result.outcomes) {
        switch (outcome.status) {
            case ItemStatus::Succeeded:
                result.succeeded_count++;
                result.bytes_transferred += outcome.bytes;
                break;
            case ItemStatus::Failed:
                result.failed_count++;
                break;
            case ItemStatus::Cancelled:
                result.cancelled_count++;
                break;
            case ItemStatus::Simulated:
                result.simulated_count++;
                break;
        }
    }

    result.cancelled = result.cancelled_count > 0;

    const bool all_failed = result.failed_count > 0 && result.succeeded_count == 0 && result.cancelled_count == 0;
    result.success = !all_failed && !(require_full_success && result.failed_count > 0);

    if (result.failed_count > 0) {
        spdlog::warn("{} at {}: {} of {} items failed", to_string(result.operation), result.coordinate.to_string(),
                     result.failed_count, result.outcomes.size());
    }
    if (result.cancelled) {
        spdlog::warn("{} at {}: cancelled with {} items not transferred", to_string(result.operation),
                     result.coordinate.to_string(), result.cancelled_count);
    }
}

void TransferEngine::cleanup(TransferResult& result) {
    if (result.succeeded_count == 0) {
        return;
    }

    const auto kind = kind_of(result.operation);
    const auto reason = std::string(to_string(result.operation)) + " at " + result.coordinate.to_string();
    auto marked = cache_.mark_stale(kind, reason);
    if (marked.is_error()) {
        spdlog::warn("Cache invalidation failed after {}: {}", reason, marked.error().describe());
        result.warnings.push_back(marked.error());
    }
}

void TransferEngine::fail(TransferResult& result, TransferPhase phase, Error error) {
    spdlog::error("{} aborted in {}: {}", to_string(result.operation), to_string(phase), error.describe());
    result.success = false;
    result.failed_phase = phase;
    result.fatal_error = std::move(error);
}

} // namespace runsync::transfer
