#pragma once

#include "runsync/core/result.hpp"
#include "runsync/local/local_state_scanner.hpp"
#include "runsync/model/coordinate.hpp"
#include "runsync/model/types.hpp"
#include "runsync/paths/path_translator.hpp"
#include "runsync/remote/inventory_cache.hpp"

#include <map>
#include <optional>
#include <vector>

namespace runsync::discovery {

/// Which stores to enumerate.
enum class SideFilter {
    Local,
    Remote,
    Both
};

enum class SyncState {
    LocalOnly,
    RemoteOnly,
    InSync,     ///< same units with the same sizes after name translation
    Diverged
};

const char* to_string(SyncState state) noexcept;

struct CoordinateOverview {
    std::optional<model::StorageStatus> local;
    std::optional<model::StorageStatus> remote;
    SyncState state = SyncState::Diverged;
};

/**
 * @brief Fleet-wide listings over the local tree and the cached inventory
 *
 * Read-only: the remote side comes from the current cache snapshot as is, so
 * nothing here triggers a refresh. Without a loaded snapshot remote
 * enumeration fails with CacheUnavailable.
 */
class BulkDiscovery {
public:
    BulkDiscovery(const local::LocalStateScanner& scanner,
                  const remote::RemoteInventoryCache& cache,
                  const paths::PathTranslator& translator);

    /// Sorted union of coordinates present on the selected sides.
    Result<std::vector<model::RunCoordinate>> all_coordinates(model::DataKind kind,
                                                              SideFilter sides = SideFilter::Both) const;

    Result<std::map<model::RunCoordinate, CoordinateOverview>> overview(model::DataKind kind) const;

    /**
     * @brief Compare two statuses of the same coordinate
     *
     * Local names are translated to the remote convention; a local name that
     * does not follow the convention counts as divergence.
     */
    SyncState compare(const model::StorageStatus& local, const model::StorageStatus& remote) const;

private:
    const local::LocalStateScanner& scanner_;
    const remote::RemoteInventoryCache& cache_;
    const paths::PathTranslator& translator_;
};

} // namespace runsync::discovery
