#pragma once

#include "runsync/core/result.hpp"
#include "runsync/paths/path_translator.hpp"
#include "runsync/remote/inventory_cache.hpp"
#include "runsync/transfer/transfer_engine.hpp"
#include "runsync/transfer/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace runsync::config {

/**
 * @brief Every knob of a runsync deployment
 *
 * JSON keys match the field names. Missing keys keep these defaults.
 *
 * {
 *   "raw_root": "/data/raw",
 *   "ml_root": "/data/ml",
 *   "processed_root": "/data/processed",
 *   "raw_bucket": "fleet-raw",
 *   "ml_bucket": "fleet-ml",
 *   "object_store": "filesystem",
 *   "object_store_root": "/mnt/buckets",
 *   "gcs_endpoint": "",
 *   "cache_file": "/var/cache/runsync/inventory.json",
 *   "cache_max_age_seconds": 3600,
 *   "conflict_policy": "skip",
 *   "dry_run": false,
 *   "worker_count": 4,
 *   "remote_timeout_ms": 0,
 *   "require_full_success": false,
 *   "log_level": "info"
 * }
 */
/// Backend behind the two buckets.
enum class ObjectStoreKind {
    Filesystem,  ///< <object_store_root>/<bucket>/<key>
    Gcs          ///< Google Cloud Storage, credentials from the environment
};

const char* to_string(ObjectStoreKind kind);
Result<ObjectStoreKind> parse_object_store_kind(const std::string& name);

struct SyncConfig {
    std::filesystem::path raw_root;
    std::filesystem::path ml_root;
    std::filesystem::path processed_root;
    std::string raw_bucket;
    std::string ml_bucket;
    ObjectStoreKind object_store = ObjectStoreKind::Filesystem;
    std::filesystem::path object_store_root;
    std::string gcs_endpoint;

    std::filesystem::path cache_file;
    std::chrono::seconds cache_max_age{std::chrono::hours(1)};

    transfer::ConflictPolicy conflict_policy = transfer::ConflictPolicy::Skip;
    bool dry_run = false;
    std::size_t worker_count = 4;
    std::chrono::milliseconds remote_timeout{0};
    bool require_full_success = false;
    std::string log_level = "info";

    paths::StorageLayout layout() const;
    remote::CacheOptions cache_options() const;
    transfer::EngineOptions engine_options() const;
    /// Transfer defaults; selection and token are per call.
    transfer::TransferOptions transfer_options() const;
};

Result<SyncConfig> load_config(const std::filesystem::path& path);
Result<SyncConfig> parse_config(const nlohmann::json& document);

/**
 * @brief Apply `level` ("trace".."off") to the default spdlog logger
 */
Result<void> apply_log_level(const std::string& level);

} // namespace runsync::config
