#include "runsync/config/config.hpp"
#include "runsync/discovery/bulk_discovery.hpp"
#include "runsync/events/components.hpp"
#include "runsync/events/event_bus.hpp"
#include "runsync/local/local_state_scanner.hpp"
#include "runsync/paths/path_translator.hpp"
#include "runsync/remote/filesystem_object_store.hpp"
#ifdef RUNSYNC_HAVE_GCS
#include "runsync/remote/gcs_object_store.hpp"
#endif
#include "runsync/remote/inventory_cache.hpp"
#include "runsync/transfer/transfer_engine.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

using runsync::model::DataKind;
using runsync::model::RunCoordinate;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " <config.json> <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  info                                      Show cache metadata\n"
              << "  refresh                                   Rebuild the remote inventory\n"
              << "  status <raw|ml> <c> <r> <f> <tw> <lb> <ts>  Local and remote status of one coordinate\n"
              << "  coordinates <raw|ml> [local|remote|both]  List known coordinates\n"
              << "  overview <raw|ml>                         Sync state of every coordinate\n"
              << "  levels <raw|ml> [part...]                 Values one level below the given parts\n"
              << "  exports [id]                              Recorded ML dataset exports\n"
              << "  transfer <operation> <c> <r> <f> <tw> <lb> <ts> [--dry-run] [--overwrite]\n"
              << "           operation: raw-download | raw-upload | ml-download | ml-upload\n";
}

runsync::Result<std::unique_ptr<runsync::remote::ObjectStore>> make_store(
    const runsync::config::SyncConfig& config) {
    using StorePtr = std::unique_ptr<runsync::remote::ObjectStore>;
    if (config.object_store == runsync::config::ObjectStoreKind::Gcs) {
#ifdef RUNSYNC_HAVE_GCS
        runsync::remote::GcsOptions options;
        options.endpoint = config.gcs_endpoint;
        return runsync::Ok(StorePtr(std::make_unique<runsync::remote::GcsObjectStore>(options)));
#else
        return runsync::Err<StorePtr>(runsync::ErrorCode::ConfigurationError,
                                      "runsync was built without Google Cloud Storage support", "object_store");
#endif
    }
    return runsync::Ok(StorePtr(std::make_unique<runsync::remote::FilesystemObjectStore>(config.object_store_root)));
}

void print_status(const char* label, const runsync::model::StorageStatus& status) {
    std::cout << label << ": " << (status.exists() ? "present" : "absent")
              << ", units=" << status.unit_count()
              << ", files=" << status.file_count()
              << ", bytes=" << status.total_size() << "\n";
    for (const auto& [name, size] : status.units) {
        std::cout << "    " << name << " (" << size << " bytes)\n";
    }
}

runsync::Result<RunCoordinate> coordinate_from_args(const std::vector<std::string>& args, std::size_t first) {
    if (args.size() < first + RunCoordinate::kLevels) {
        return runsync::Err<RunCoordinate>(runsync::ErrorCode::InvalidCoordinate, "Expected six coordinate parts");
    }
    return RunCoordinate::from_parts(std::vector<std::string>(args.begin() + first,
                                                              args.begin() + first + RunCoordinate::kLevels));
}

void print_result(const runsync::transfer::TransferResult& result) {
    using runsync::transfer::to_string;

    if (result.fatal_error) {
        std::cout << "FAILED in " << to_string(*result.failed_phase) << ": " << result.fatal_error->describe() << "\n";
        return;
    }
    if (result.nothing_to_do) {
        std::cout << "Nothing to do (" << result.plan.already_synced.size() << " already synchronized, "
                  << result.plan.conflicts.size() << " conflicts)\n";
    }
    for (const auto& conflict : result.plan.conflicts) {
        std::cout << "  conflict " << conflict.label() << ": source " << conflict.source_size
                  << " bytes, target " << conflict.target_size << " bytes\n";
    }
    for (const auto& outcome : result.outcomes) {
        std::cout << "  " << to_string(outcome.status) << " " << outcome.item.source_location()
                  << " -> " << outcome.item.destination_location();
        if (outcome.error) {
            std::cout << " (" << outcome.error->describe() << ")";
        }
        std::cout << "\n";
    }
    for (const auto& warning : result.warnings) {
        std::cout << "  warning: " << warning.describe() << "\n";
    }
    std::cout << (result.success ? "OK" : "FAILED") << ": " << result.succeeded_count << " succeeded, "
              << result.failed_count << " failed, " << result.cancelled_count << " cancelled, "
              << result.bytes_transferred << " bytes in " << result.duration.count() << "ms\n";
}

} // namespace

// ════════════════════════════════════════════════════════════
// Main
// ════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }
    const std::vector<std::string> args(argv + 1, argv + argc);

    auto loaded = runsync::config::load_config(args[0]);
    if (loaded.is_error()) {
        spdlog::error("{}", loaded.error().describe());
        return 1;
    }
    const auto& config = loaded.value();
    if (auto res = runsync::config::apply_log_level(config.log_level); res.is_error()) {
        spdlog::error("{}", res.error().describe());
        return 1;
    }

    // ════════════════════════════════════════════════════════════
    // Wire components
    // ════════════════════════════════════════════════════════════

    runsync::events::EventBus bus;
    runsync::events::LoggerComponent logger(bus);
    runsync::events::MetricsComponent metrics(bus);

    runsync::paths::PathTranslator translator(config.layout());
    runsync::local::LocalStateScanner scanner(translator);
    auto store = make_store(config);
    if (store.is_error()) {
        spdlog::error("{}", store.error().describe());
        return 1;
    }
    runsync::remote::RemoteInventoryCache cache(*store.value(), translator, config.cache_options(), &bus);
    runsync::discovery::BulkDiscovery discovery(scanner, cache, translator);

    if (auto res = cache.initialize(); res.is_error()) {
        spdlog::error("{}", res.error().describe());
        return 1;
    }

    const auto& command = args[1];
    int exit_code = 0;

    if (command == "info") {
        const auto info = cache.cache_info();
        std::cout << "cache file:   " << info.cache_file.string() << "\n"
                  << "loaded:       " << (info.loaded ? "yes" : "no") << "\n"
                  << "coordinates:  " << info.coordinate_count << "\n"
                  << "objects:      " << info.object_count << "\n"
                  << "bytes:        " << info.total_bytes << "\n";
        for (const auto& [kind, reason] : info.stale) {
            std::cout << "stale " << runsync::model::to_string(kind) << ":    " << reason << "\n";
        }
    } else if (command == "refresh") {
        auto refreshed = cache.refresh();
        if (refreshed.is_error()) {
            spdlog::error("{}", refreshed.error().describe());
            exit_code = 1;
        }
    } else if (command == "status" && args.size() >= 3) {
        auto kind = runsync::model::parse_data_kind(args[2]);
        auto coord = coordinate_from_args(args, 3);
        if (kind.is_error() || coord.is_error()) {
            spdlog::error("{}", kind.is_error() ? kind.error().describe() : coord.error().describe());
            return 1;
        }
        auto local = scanner.status_for(coord.value(), kind.value());
        auto inventory = cache.full_inventory();
        if (local.is_error() || inventory.is_error()) {
            spdlog::error("{}", local.is_error() ? local.error().describe() : inventory.error().describe());
            return 1;
        }
        std::cout << coord.value().to_string() << "\n";
        print_status("  local ", local.value());
        print_status("  remote", inventory.value()->status_for(coord.value(), kind.value()));
    } else if (command == "coordinates" && args.size() >= 3) {
        auto kind = runsync::model::parse_data_kind(args[2]);
        if (kind.is_error()) {
            spdlog::error("{}", kind.error().describe());
            return 1;
        }
        auto sides = runsync::discovery::SideFilter::Both;
        if (args.size() >= 4 && args[3] == "local") sides = runsync::discovery::SideFilter::Local;
        if (args.size() >= 4 && args[3] == "remote") sides = runsync::discovery::SideFilter::Remote;
        if (sides != runsync::discovery::SideFilter::Local) {
            if (auto res = cache.full_inventory(); res.is_error()) {
                spdlog::error("{}", res.error().describe());
                return 1;
            }
        }
        auto coordinates = discovery.all_coordinates(kind.value(), sides);
        if (coordinates.is_error()) {
            spdlog::error("{}", coordinates.error().describe());
            return 1;
        }
        for (const auto& coord : coordinates.value()) {
            std::cout << coord.to_path_string('/') << "\n";
        }
    } else if (command == "overview" && args.size() >= 3) {
        auto kind = runsync::model::parse_data_kind(args[2]);
        if (kind.is_error()) {
            spdlog::error("{}", kind.error().describe());
            return 1;
        }
        if (auto res = cache.full_inventory(); res.is_error()) {
            spdlog::error("{}", res.error().describe());
            return 1;
        }
        auto overview = discovery.overview(kind.value());
        if (overview.is_error()) {
            spdlog::error("{}", overview.error().describe());
            return 1;
        }
        for (const auto& [coord, entry] : overview.value()) {
            std::cout << runsync::discovery::to_string(entry.state) << "\t" << coord.to_path_string('/') << "\n";
        }
    } else if (command == "levels" && args.size() >= 3) {
        auto kind = runsync::model::parse_data_kind(args[2]);
        if (kind.is_error()) {
            spdlog::error("{}", kind.error().describe());
            return 1;
        }
        if (auto res = cache.full_inventory(); res.is_error()) {
            spdlog::error("{}", res.error().describe());
            return 1;
        }
        auto values = cache.hierarchy_level(kind.value(), std::vector<std::string>(args.begin() + 3, args.end()));
        if (values.is_error()) {
            spdlog::error("{}", values.error().describe());
            return 1;
        }
        for (const auto& value : values.value()) {
            std::cout << value << "\n";
        }
    } else if (command == "exports") {
        if (args.size() >= 3) {
            auto info = scanner.export_info(args[2]);
            if (info.is_error()) {
                spdlog::error("{}", info.error().describe());
                return 1;
            }
            std::cout << info.value().dump(2) << "\n";
        } else {
            auto ids = scanner.export_ids();
            if (ids.is_error()) {
                spdlog::error("{}", ids.error().describe());
                return 1;
            }
            for (const auto& id : ids.value()) {
                std::cout << id << "\n";
            }
        }
    } else if (command == "transfer" && args.size() >= 3) {
        auto operation = runsync::transfer::parse_transfer_operation(args[2]);
        auto coord = coordinate_from_args(args, 3);
        if (operation.is_error() || coord.is_error()) {
            spdlog::error("{}", operation.is_error() ? operation.error().describe() : coord.error().describe());
            return 1;
        }

        auto options = config.transfer_options();
        for (std::size_t i = 3 + RunCoordinate::kLevels; i < args.size(); ++i) {
            if (args[i] == "--dry-run") {
                options.dry_run = true;
            } else if (args[i] == "--overwrite") {
                options.policy = runsync::transfer::ConflictPolicy::Overwrite;
            } else {
                spdlog::error("Unknown option: {}", args[i]);
                return 1;
            }
        }

        runsync::transfer::TransferEngine engine(cache, config.engine_options(), &bus);
        auto strategy = runsync::transfer::make_strategy(operation.value(),
                                                         runsync::transfer::StrategyContext{*store.value(), translator, scanner, cache});
        const auto result = engine.run(*strategy, coord.value(), options);
        print_result(result);
        exit_code = result.success ? 0 : 2;
        metrics.print_stats();
    } else {
        print_usage(argv[0]);
        exit_code = 1;
    }

    cache.shutdown();
    return exit_code;
}
