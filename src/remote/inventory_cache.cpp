#include "runsync/remote/inventory_cache.hpp"

#include "runsync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

namespace runsync::remote {
namespace fs = std::filesystem;

using nlohmann::json;
using model::DataKind;

namespace {

json stale_to_json(const std::map<DataKind, std::string>& stale) {
    json out = json::object();
    for (const auto& [kind, reason] : stale) {
        out[model::to_string(kind)] = reason;
    }
    return out;
}

std::map<DataKind, std::string> stale_from_json(const json& metadata) {
    std::map<DataKind, std::string> stale;
    if (!metadata.contains("stale") || !metadata["stale"].is_object()) {
        return stale;
    }
    for (const auto& [name, reason] : metadata["stale"].items()) {
        auto kind = model::parse_data_kind(name);
        if (kind.is_ok()) {
            stale[kind.value()] = reason.is_string() ? reason.get<std::string>() : std::string("unknown");
        }
    }
    return stale;
}

} // namespace

RemoteInventoryCache::RemoteInventoryCache(ObjectStore& store,
                                           const paths::PathTranslator& translator,
                                           CacheOptions options,
                                           events::EventBus* bus)
    : store_(store), translator_(translator), options_(std::move(options)), bus_(bus) {}

Result<void> RemoteInventoryCache::initialize() {
    std::error_code ec;
    if (options_.cache_file.empty() || !fs::exists(options_.cache_file, ec)) {
        spdlog::info("No persisted inventory at {}; first query will build one", options_.cache_file.string());
        return Ok();
    }

    std::ifstream input(options_.cache_file);
    if (!input) {
        spdlog::warn("Cannot open inventory cache {}; ignoring it", options_.cache_file.string());
        return Ok();
    }

    json document = json::parse(input, nullptr, false);
    if (document.is_discarded()) {
        spdlog::warn("Inventory cache {} is not valid JSON; ignoring it", options_.cache_file.string());
        return Ok();
    }

    auto loaded = InventorySnapshot::from_json(document);
    if (loaded.is_error()) {
        spdlog::warn("Inventory cache {} is unusable ({}); ignoring it",
                     options_.cache_file.string(), loaded.error().describe());
        return Ok();
    }

    auto stale = stale_from_json(document["metadata"]);
    const auto age = InventorySnapshot::Clock::now() - loaded.value().metadata().last_refresh;
    const bool expired = age > options_.max_age;
    if (expired) {
        for (auto kind : {DataKind::Raw, DataKind::Ml}) {
            stale.emplace(kind, kExpiredReason);
        }
    }

    {
        std::unique_lock lock(mutex_);
        snapshot_ = std::make_shared<const InventorySnapshot>(std::move(loaded.value()));
        stale_ = stale;
    }

    spdlog::info("Loaded inventory cache {} ({} coordinates, age {}s{})",
                 options_.cache_file.string(), snapshot()->coordinate_count(),
                 std::chrono::duration_cast<std::chrono::seconds>(age).count(),
                 expired ? ", expired" : "");

    if (expired && bus_) {
        for (auto kind : {DataKind::Raw, DataKind::Ml}) {
            bus_->emit(events::InventoryMarkedStaleEvent{kind, kExpiredReason});
        }
    }
    return Ok();
}

Result<SnapshotPtr> RemoteInventoryCache::full_inventory(bool force_refresh, const CancellationToken& token) {
    bool needs_refresh = force_refresh;
    SnapshotPtr current;
    {
        std::shared_lock lock(mutex_);
        current = snapshot_;
        needs_refresh = needs_refresh || !current || any_stale_locked();
    }

    if (!needs_refresh) {
        return Ok(std::move(current));
    }
    return refresh(token);
}

Result<SnapshotPtr> RemoteInventoryCache::refresh(const CancellationToken& token) {
    std::lock_guard refresh_guard(refresh_mutex_);
    const auto started = std::chrono::steady_clock::now();
    std::uint64_t generation = 0;
    {
        std::shared_lock lock(mutex_);
        generation = stale_generation_;
    }

    const auto bounded = options_.remote_timeout.count() > 0 ? token.with_timeout(options_.remote_timeout) : token;
    auto built = InventorySnapshot::build(store_, translator_, bounded);
    if (built.is_error()) {
        auto error = built.error().wrap(ErrorCode::RefreshFailed, "remote inventory refresh");
        error.message = "Failed to rebuild remote inventory: " + built.error().message;
        spdlog::error("{}", error.describe());
        if (bus_) {
            bus_->emit(events::InventoryRefreshFailedEvent{error.describe()});
        }
        return Err<SnapshotPtr>(std::move(error));
    }

    auto fresh = std::make_shared<const InventorySnapshot>(std::move(built.value()));

    // Persist before publishing so the file never lags a snapshot readers have seen.
    // The persist lock is held across the swap so a concurrent mark_stale writes
    // its flag after this file, never before it.
    Result<void> persisted = Ok();
    {
        std::lock_guard persist_guard(persist_mutex_);
        std::map<DataKind, std::string> remaining;
        {
            std::shared_lock lock(mutex_);
            if (stale_generation_ != generation) {
                remaining = stale_;
            }
        }
        persisted = write_cache_file(*fresh, remaining);
        if (persisted.is_ok()) {
            std::unique_lock lock(mutex_);
            snapshot_ = fresh;
            // A kind marked stale while the listing ran may be missing that change.
            if (stale_generation_ == generation) {
                stale_.clear();
            }
        }
    }
    if (persisted.is_error()) {
        auto error = persisted.error().wrap(ErrorCode::RefreshFailed, options_.cache_file.string());
        error.message = "Failed to persist remote inventory: " + persisted.error().message;
        spdlog::error("{}", error.describe());
        if (bus_) {
            bus_->emit(events::InventoryRefreshFailedEvent{error.describe()});
        }
        return Err<SnapshotPtr>(std::move(error));
    }

    if (bus_) {
        bus_->emit(events::InventoryRefreshedEvent{
            fresh->coordinate_count(),
            fresh->metadata().object_count,
            fresh->metadata().total_bytes,
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started)});
    }
    return Ok(SnapshotPtr(fresh));
}

Result<void> RemoteInventoryCache::mark_stale(DataKind kind, const std::string& reason) {
    {
        std::unique_lock lock(mutex_);
        stale_[kind] = reason;
        stale_generation_++;
    }

    if (bus_) {
        bus_->emit(events::InventoryMarkedStaleEvent{kind, reason});
    }

    auto persisted = persist_current();
    if (persisted.is_error()) {
        auto error = persisted.error().wrap(ErrorCode::CacheInvalidationFailed, options_.cache_file.string());
        error.message = std::string("Failed to persist stale flag for ") + model::to_string(kind);
        return Err<void>(std::move(error));
    }
    return Ok();
}

bool RemoteInventoryCache::is_stale(DataKind kind) const {
    std::shared_lock lock(mutex_);
    return stale_.count(kind) > 0;
}

Result<model::StorageStatus> RemoteInventoryCache::status_for(const model::RunCoordinate& coord, DataKind kind) const {
    auto current = require_snapshot();
    if (current.is_error()) {
        return Err<model::StorageStatus>(current.error());
    }
    return Ok(current.value()->status_for(coord, kind));
}

Result<StatusMap> RemoteInventoryCache::all_statuses(DataKind kind) const {
    auto current = require_snapshot();
    if (current.is_error()) {
        return Err<StatusMap>(current.error());
    }

    StatusMap statuses;
    for (const auto& [coord, status] : current.value()->entries(kind)) {
        statuses.emplace(coord, status);
    }
    return Ok(std::move(statuses));
}

Result<std::vector<std::string>> RemoteInventoryCache::hierarchy_level(DataKind kind,
                                                                        const std::vector<std::string>& parent_parts) const {
    auto current = require_snapshot();
    if (current.is_error()) {
        return Err<std::vector<std::string>>(current.error());
    }
    return Ok(current.value()->hierarchy_level(kind, parent_parts));
}

Result<bool> RemoteInventoryCache::path_exists(DataKind kind, const std::vector<std::string>& parts) const {
    auto current = require_snapshot();
    if (current.is_error()) {
        return Err<bool>(current.error());
    }
    return Ok(current.value()->path_exists(kind, parts));
}

CacheInfo RemoteInventoryCache::cache_info() const {
    std::shared_lock lock(mutex_);
    CacheInfo info;
    info.cache_file = options_.cache_file;
    info.stale = stale_;
    if (snapshot_) {
        info.loaded = true;
        info.last_refresh = snapshot_->metadata().last_refresh;
        info.object_count = snapshot_->metadata().object_count;
        info.total_bytes = snapshot_->metadata().total_bytes;
        info.coordinate_count = snapshot_->coordinate_count();
    }
    return info;
}

SnapshotPtr RemoteInventoryCache::snapshot() const {
    std::shared_lock lock(mutex_);
    return snapshot_;
}

void RemoteInventoryCache::shutdown() {
    bool pending = false;
    {
        std::shared_lock lock(mutex_);
        pending = snapshot_ && !stale_.empty();
    }
    if (pending) {
        if (auto persisted = persist_current(); persisted.is_error()) {
            spdlog::warn("Could not persist inventory on shutdown: {}", persisted.error().describe());
        }
    }

    {
        std::unique_lock lock(mutex_);
        snapshot_.reset();
    }
    spdlog::debug("Remote inventory cache shut down");
}

Result<SnapshotPtr> RemoteInventoryCache::require_snapshot() const {
    auto current = snapshot();
    if (!current) {
        return Err<SnapshotPtr>(ErrorCode::CacheUnavailable,
                                "Remote inventory has not been loaded; call full_inventory() or refresh() first");
    }
    return Ok(std::move(current));
}

Result<void> RemoteInventoryCache::persist_current() {
    std::lock_guard persist_guard(persist_mutex_);
    SnapshotPtr current;
    std::map<DataKind, std::string> stale;
    {
        std::shared_lock lock(mutex_);
        current = snapshot_;
        stale = stale_;
    }
    if (!current) {
        return Ok();
    }
    return write_cache_file(*current, stale);
}

Result<void> RemoteInventoryCache::write_cache_file(const InventorySnapshot& snapshot,
                                                    const std::map<DataKind, std::string>& stale) const {
    if (options_.cache_file.empty()) {
        return Ok();
    }

    auto document = snapshot.to_json();
    document["metadata"]["stale"] = stale_to_json(stale);

    const auto target = options_.cache_file;
    auto temp = target;
    temp += ".tmp";

    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return Err<void>(ErrorCode::FilesystemError, "Failed to create cache directory: " + ec.message(),
                             target.parent_path().string());
        }
    }

    {
        std::ofstream output(temp, std::ios::trunc);
        if (!output) {
            return Err<void>(ErrorCode::FilesystemError, "Failed to open cache temp file", temp.string());
        }
        output << document.dump(2);
        output.flush();
        if (!output) {
            return Err<void>(ErrorCode::FilesystemError, "Failed to write cache temp file", temp.string());
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove(temp, cleanup_ec);
        return Err<void>(ErrorCode::FilesystemError, "Failed to replace cache file: " + ec.message(), target.string());
    }
    return Ok();
}

bool RemoteInventoryCache::any_stale_locked() const {
    return !stale_.empty();
}

} // namespace runsync::remote
