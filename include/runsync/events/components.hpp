/**
 * @file components.hpp
 * @brief Ready-made subscribers for transfer and inventory events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Engine and cache events are now logged and counted.
 */

#pragma once

#include "runsync/events/event_bus.hpp"
#include "runsync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace runsync::events {

/**
 * @brief Logs every engine and cache event with spdlog
 *
 * Per-item events go to debug so a bulk run with thousands of ML files does
 * not flood the info log; start/finish and cache events go to info/warn.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : subscriptions_(bus) {
        subscriptions_.add<TransferStartedEvent>([](const TransferStartedEvent& e) {
            spdlog::info("[TransferStarted] op={} coord={} items={} bytes={}{}",
                         e.operation, e.coordinate.to_string(), e.item_count, e.total_bytes,
                         e.dry_run ? " (dry run)" : "");
        });

        subscriptions_.add<TransferItemCompletedEvent>([](const TransferItemCompletedEvent& e) {
            spdlog::debug("[ItemCompleted] op={} unit={} dest={} bytes={}",
                          e.operation, e.unit, e.destination, e.bytes);
        });

        subscriptions_.add<TransferItemFailedEvent>([](const TransferItemFailedEvent& e) {
            spdlog::warn("[ItemFailed] op={} coord={} unit={} error={}",
                         e.operation, e.coordinate.to_string(), e.unit, e.error);
        });

        subscriptions_.add<TransferConflictDetectedEvent>([](const TransferConflictDetectedEvent& e) {
            spdlog::warn("[ConflictDetected] op={} coord={} unit={} source_bytes={} target_bytes={} {}",
                         e.operation, e.coordinate.to_string(), e.unit, e.source_bytes, e.target_bytes,
                         e.overwritten ? "overwriting" : "skipped");
        });

        subscriptions_.add<TransferCompletedEvent>([](const TransferCompletedEvent& e) {
            if (e.nothing_to_do) {
                spdlog::info("[TransferCompleted] op={} coord={} nothing to do", e.operation, e.coordinate.to_string());
                return;
            }
            spdlog::info("[TransferCompleted] op={} coord={} success={} succeeded={} failed={} bytes={} duration={}ms{}",
                         e.operation, e.coordinate.to_string(), e.success, e.succeeded, e.failed,
                         e.bytes_transferred, e.duration.count(), e.cancelled ? " (cancelled)" : "");
        });

        subscriptions_.add<InventoryRefreshedEvent>([](const InventoryRefreshedEvent& e) {
            spdlog::info("[InventoryRefreshed] coordinates={} objects={} bytes={} duration={}ms",
                         e.coordinate_count, e.object_count, e.total_bytes, e.duration.count());
        });

        subscriptions_.add<InventoryRefreshFailedEvent>([](const InventoryRefreshFailedEvent& e) {
            spdlog::error("[InventoryRefreshFailed] {}", e.error);
        });

        subscriptions_.add<InventoryMarkedStaleEvent>([](const InventoryMarkedStaleEvent& e) {
            spdlog::info("[InventoryMarkedStale] kind={} reason={}", model::to_string(e.kind), e.reason);
        });
    }

private:
    SubscriptionSet subscriptions_;
};

/**
 * @brief Counts transfers, bytes and cache activity
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * ...
 * metrics.get_stats().items_succeeded.load();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> transfers_started{0};
        std::atomic<std::uint64_t> transfers_completed{0};
        std::atomic<std::uint64_t> transfers_failed{0};
        std::atomic<std::uint64_t> items_succeeded{0};
        std::atomic<std::uint64_t> items_failed{0};
        std::atomic<std::uint64_t> bytes_transferred{0};
        std::atomic<std::uint64_t> conflicts_detected{0};
        std::atomic<std::uint64_t> inventory_refreshes{0};
        std::atomic<std::uint64_t> inventory_refresh_failures{0};
        std::atomic<std::uint64_t> stale_marks{0};
    };

    explicit MetricsComponent(EventBus& bus) : subscriptions_(bus) {
        subscriptions_.add<TransferStartedEvent>([this](const TransferStartedEvent&) {
            stats_.transfers_started++;
        });

        subscriptions_.add<TransferItemCompletedEvent>([this](const TransferItemCompletedEvent& e) {
            stats_.items_succeeded++;
            stats_.bytes_transferred += e.bytes;
        });

        subscriptions_.add<TransferItemFailedEvent>([this](const TransferItemFailedEvent&) {
            stats_.items_failed++;
        });

        subscriptions_.add<TransferConflictDetectedEvent>([this](const TransferConflictDetectedEvent&) {
            stats_.conflicts_detected++;
        });

        subscriptions_.add<TransferCompletedEvent>([this](const TransferCompletedEvent& e) {
            if (e.success) {
                stats_.transfers_completed++;
            } else {
                stats_.transfers_failed++;
            }
        });

        subscriptions_.add<InventoryRefreshedEvent>([this](const InventoryRefreshedEvent&) {
            stats_.inventory_refreshes++;
        });

        subscriptions_.add<InventoryRefreshFailedEvent>([this](const InventoryRefreshFailedEvent&) {
            stats_.inventory_refresh_failures++;
        });

        subscriptions_.add<InventoryMarkedStaleEvent>([this](const InventoryMarkedStaleEvent&) {
            stats_.stale_marks++;
        });
    }

    const Stats& get_stats() const { return stats_; }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Sync Statistics:");
        spdlog::info("  Transfers started:   {}", stats_.transfers_started.load());
        spdlog::info("  Transfers completed: {}", stats_.transfers_completed.load());
        spdlog::info("  Transfers failed:    {}", stats_.transfers_failed.load());
        spdlog::info("  Items succeeded:     {}", stats_.items_succeeded.load());
        spdlog::info("  Items failed:        {}", stats_.items_failed.load());
        spdlog::info("  Bytes transferred:   {}", stats_.bytes_transferred.load());
        spdlog::info("  Conflicts detected:  {}", stats_.conflicts_detected.load());
        spdlog::info("  Inventory refreshes: {}", stats_.inventory_refreshes.load());
        spdlog::info("  Refresh failures:    {}", stats_.inventory_refresh_failures.load());
        spdlog::info("  Stale marks:         {}", stats_.stale_marks.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    Stats stats_;
    // Declared last so handlers are removed before stats_ goes away.
    SubscriptionSet subscriptions_;
};

} // namespace runsync::events
