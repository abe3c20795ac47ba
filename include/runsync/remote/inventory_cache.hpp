#pragma once

#include "runsync/core/cancellation.hpp"
#include "runsync/core/result.hpp"
#include "runsync/events/event_bus.hpp"
#include "runsync/model/coordinate.hpp"
#include "runsync/model/types.hpp"
#include "runsync/paths/path_translator.hpp"
#include "runsync/remote/inventory_snapshot.hpp"
#include "runsync/remote/object_store.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace runsync::remote {

using StatusMap = std::unordered_map<model::RunCoordinate, model::StorageStatus>;
using SnapshotPtr = std::shared_ptr<const InventorySnapshot>;

struct CacheOptions {
    std::filesystem::path cache_file;
    std::chrono::seconds max_age{std::chrono::hours(1)};
    std::chrono::milliseconds remote_timeout{0};   ///< 0 = no deadline beyond the caller's
};

struct CacheInfo {
    bool loaded = false;
    std::optional<InventorySnapshot::Clock::time_point> last_refresh;
    std::map<model::DataKind, std::string> stale;   ///< kind -> reason
    std::uint64_t object_count = 0;
    std::uint64_t total_bytes = 0;
    std::size_t coordinate_count = 0;
    std::filesystem::path cache_file;
};

/**
 * @brief Owns the cached inventory of the remote buckets
 *
 * Queries only ever read the current snapshot; only full_inventory() and
 * refresh() contact the store. Staleness is tracked per data kind, set by
 * mark_stale() and cleared only by a successful full refresh.
 *
 * THREAD SAFETY:
 * The snapshot pointer is swapped under a shared_mutex, so readers keep a
 * consistent snapshot for as long as they hold the pointer. Refreshes are
 * serialized among themselves.
 */
class RemoteInventoryCache {
public:
    RemoteInventoryCache(ObjectStore& store,
                         const paths::PathTranslator& translator,
                         CacheOptions options,
                         events::EventBus* bus = nullptr);

    RemoteInventoryCache(const RemoteInventoryCache&) = delete;
    RemoteInventoryCache& operator=(const RemoteInventoryCache&) = delete;

    /**
     * @brief Load the persisted cache file, if any, without contacting the store
     *
     * A file older than max_age is still loaded, but both kinds are marked
     * stale with reason "expired". A missing or corrupt file leaves the cache
     * empty; neither is an error.
     */
    Result<void> initialize();

    Result<SnapshotPtr> full_inventory(bool force_refresh = false, const CancellationToken& token = {});

    /**
     * @brief Unconditional rebuild, persist, then swap
     *
     * On failure the previous snapshot stays in place and RefreshFailed is
     * returned.
     */
    Result<SnapshotPtr> refresh(const CancellationToken& token = {});

    /**
     * @brief Flag one kind as out of date without rebuilding
     *
     * The flag is persisted so a restart does not trust the old file. A
     * failure to write it returns CacheInvalidationFailed; the in-memory flag
     * is set regardless.
     */
    Result<void> mark_stale(model::DataKind kind, const std::string& reason);

    bool is_stale(model::DataKind kind) const;

    Result<model::StorageStatus> status_for(const model::RunCoordinate& coord, model::DataKind kind) const;
    Result<StatusMap> all_statuses(model::DataKind kind) const;

    Result<std::vector<std::string>> hierarchy_level(model::DataKind kind,
                                                     const std::vector<std::string>& parent_parts) const;
    Result<bool> path_exists(model::DataKind kind, const std::vector<std::string>& parts) const;

    CacheInfo cache_info() const;

    /// Current snapshot, nullptr before the first load or refresh.
    SnapshotPtr snapshot() const;

    /**
     * @brief Persist pending staleness and drop the in-memory snapshot
     */
    void shutdown();

    static constexpr const char* kExpiredReason = "expired";

private:
    Result<SnapshotPtr> require_snapshot() const;
    /// Write the snapshot and stale flags as they are now. Serialized on persist_mutex_.
    Result<void> persist_current();
    /// Caller holds persist_mutex_.
    Result<void> write_cache_file(const InventorySnapshot& snapshot,
                                  const std::map<model::DataKind, std::string>& stale) const;
    bool any_stale_locked() const;

    ObjectStore& store_;
    const paths::PathTranslator& translator_;
    CacheOptions options_;
    events::EventBus* bus_;

    mutable std::shared_mutex mutex_;
    SnapshotPtr snapshot_;
    std::map<model::DataKind, std::string> stale_;
    std::uint64_t stale_generation_ = 0;

    std::mutex refresh_mutex_;
    std::mutex persist_mutex_;
};

} // namespace runsync::remote
