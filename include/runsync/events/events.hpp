/**
 * @file events.hpp
 * @brief Events emitted by the transfer engine and the inventory cache
 *
 * NAMING CONVENTION:
 * Events are past tense. Every event carries the time it was created so
 * subscribers can order them across worker threads.
 */

#pragma once

#include "runsync/model/coordinate.hpp"
#include "runsync/model/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace runsync::events {

using EventClock = std::chrono::system_clock;

// ════════════════════════════════════════════════════════
// Transfer Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted once planning has produced at least one item
 *
 * WHO EMITS: TransferEngine, just before the execute phase
 * WHO SUBSCRIBES: LoggerComponent, MetricsComponent
 */
struct TransferStartedEvent {
    std::string operation;   ///< e.g. "raw-download"
    model::RunCoordinate coordinate;
    model::DataKind kind;
    std::size_t item_count = 0;
    std::uint64_t total_bytes = 0;
    bool dry_run = false;
    EventClock::time_point timestamp = EventClock::now();
};

struct TransferItemCompletedEvent {
    std::string operation;
    model::RunCoordinate coordinate;
    std::string unit;          ///< destination-side name
    std::string destination;
    std::uint64_t bytes = 0;
    EventClock::time_point timestamp = EventClock::now();
};

struct TransferItemFailedEvent {
    std::string operation;
    model::RunCoordinate coordinate;
    std::string unit;
    std::string error;
    EventClock::time_point timestamp = EventClock::now();
};

/**
 * @brief Same unit on both sides with different sizes
 *
 * Emitted during planning whether or not the overwrite policy later
 * promotes the conflict into a transfer item.
 */
struct TransferConflictDetectedEvent {
    std::string operation;
    model::RunCoordinate coordinate;
    std::string unit;
    std::uint64_t source_bytes = 0;
    std::uint64_t target_bytes = 0;
    bool overwritten = false;
    EventClock::time_point timestamp = EventClock::now();
};

struct TransferCompletedEvent {
    std::string operation;
    model::RunCoordinate coordinate;
    bool success = false;
    bool cancelled = false;
    bool nothing_to_do = false;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::uint64_t bytes_transferred = 0;
    std::chrono::milliseconds duration{0};
    EventClock::time_point timestamp = EventClock::now();
};

// ════════════════════════════════════════════════════════
// Inventory Events
// ════════════════════════════════════════════════════════

struct InventoryRefreshedEvent {
    std::size_t coordinate_count = 0;
    std::uint64_t object_count = 0;
    std::uint64_t total_bytes = 0;
    std::chrono::milliseconds duration{0};
    EventClock::time_point timestamp = EventClock::now();
};

struct InventoryRefreshFailedEvent {
    std::string error;
    EventClock::time_point timestamp = EventClock::now();
};

/**
 * @brief A kind's cached view no longer reflects the remote store
 *
 * WHO EMITS: RemoteInventoryCache::mark_stale (after uploads, on expiry)
 */
struct InventoryMarkedStaleEvent {
    model::DataKind kind;
    std::string reason;
    EventClock::time_point timestamp = EventClock::now();
};

} // namespace runsync::events
