#include "runsync/discovery/bulk_discovery.hpp"

#include <spdlog/spdlog.h>

#include <set>

namespace runsync::discovery {

using model::DataKind;
using model::RunCoordinate;
using model::StorageSide;
using model::StorageStatus;

const char* to_string(SyncState state) noexcept {
    switch (state) {
        case SyncState::LocalOnly: return "local-only";
        case SyncState::RemoteOnly: return "remote-only";
        case SyncState::InSync: return "in-sync";
        case SyncState::Diverged: return "diverged";
        default: return "unknown";
    }
}

BulkDiscovery::BulkDiscovery(const local::LocalStateScanner& scanner,
                             const remote::RemoteInventoryCache& cache,
                             const paths::PathTranslator& translator)
    : scanner_(scanner), cache_(cache), translator_(translator) {}

Result<std::vector<RunCoordinate>> BulkDiscovery::all_coordinates(DataKind kind, SideFilter sides) const {
    std::set<RunCoordinate> coordinates;

    if (sides != SideFilter::Remote) {
        auto walked = scanner_.for_each_coordinate(kind, [&coordinates](const RunCoordinate& coord) {
            coordinates.insert(coord);
        });
        if (walked.is_error()) {
            return Err<std::vector<RunCoordinate>>(walked.error());
        }
    }

    if (sides != SideFilter::Local) {
        auto snapshot = cache_.snapshot();
        if (!snapshot) {
            return Err<std::vector<RunCoordinate>>(ErrorCode::CacheUnavailable,
                                                   "Remote inventory has not been loaded");
        }
        for (const auto& [coord, _] : snapshot->entries(kind)) {
            coordinates.insert(coord);
        }
    }

    return Ok(std::vector<RunCoordinate>(coordinates.begin(), coordinates.end()));
}

Result<std::map<RunCoordinate, CoordinateOverview>> BulkDiscovery::overview(DataKind kind) const {
    auto snapshot = cache_.snapshot();
    if (!snapshot) {
        return Err<std::map<RunCoordinate, CoordinateOverview>>(ErrorCode::CacheUnavailable,
                                                                "Remote inventory has not been loaded");
    }

    auto local = scanner_.all_statuses(kind);
    if (local.is_error()) {
        return Err<std::map<RunCoordinate, CoordinateOverview>>(local.error());
    }

    std::map<RunCoordinate, CoordinateOverview> result;
    for (auto& [coord, status] : local.value()) {
        if (status.exists()) {
            result[coord].local = std::move(status);
        }
    }
    for (const auto& [coord, status] : snapshot->entries(kind)) {
        result[coord].remote = status;
    }

    for (auto& [coord, entry] : result) {
        if (entry.local && entry.remote) {
            entry.state = compare(*entry.local, *entry.remote);
        } else if (entry.local) {
            entry.state = SyncState::LocalOnly;
        } else {
            entry.state = SyncState::RemoteOnly;
        }
    }

    spdlog::debug("Overview of {} {} coordinates", result.size(), model::to_string(kind));
    return Ok(std::move(result));
}

SyncState BulkDiscovery::compare(const StorageStatus& local, const StorageStatus& remote) const {
    if (local.unit_count() != remote.unit_count()) {
        return SyncState::Diverged;
    }

    for (const auto& [local_name, size] : local.units) {
        auto remote_name = translator_.translate_unit_name(local_name, StorageSide::Local, local.kind);
        if (remote_name.is_error()) {
            return SyncState::Diverged;
        }
        const auto remote_size = remote.unit_size(remote_name.value());
        if (!remote_size || *remote_size != size) {
            return SyncState::Diverged;
        }
        if (local.kind == DataKind::Ml) {
            const auto& local_files = local.bag_files.at(local_name);
            const auto& remote_files = remote.bag_files.at(remote_name.value());
            if (local_files.frames != remote_files.frames || local_files.labels != remote_files.labels) {
                return SyncState::Diverged;
            }
        }
    }
    return SyncState::InSync;
}

} // namespace runsync::discovery
