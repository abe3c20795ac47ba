#include "runsync/config/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <fstream>
#include <string>

namespace runsync::config {

using nlohmann::json;

namespace {

Error config_error(const std::string& message, const std::string& key = {}) {
    return Error(ErrorCode::ConfigurationError, message, key);
}

Result<void> require_type(const json& document, const char* key, json::value_t expected, const char* expected_name) {
    if (!document.contains(key)) {
        return Ok();
    }
    const auto& value = document[key];
    const bool matches = expected == json::value_t::number_unsigned
                             ? value.is_number_unsigned()
                             : value.type() == expected;
    if (!matches) {
        return Err<void>(config_error(std::string("Expected ") + expected_name, key));
    }
    return Ok();
}

// Deadlines are computed on nanosecond clocks; keep every configured span
// far enough below their range that now() + span cannot wrap.
constexpr std::uint64_t kMaxDurationSeconds = 100ULL * 365 * 24 * 60 * 60;

template<typename Duration>
Result<Duration> read_duration(const json& document, const char* key, Duration fallback) {
    if (!document.contains(key)) {
        return Ok(fallback);
    }
    const auto value = document[key].get<std::uint64_t>();
    const auto limit = std::chrono::duration_cast<Duration>(std::chrono::seconds(kMaxDurationSeconds)).count();
    if (value > static_cast<std::uint64_t>(limit)) {
        return Err<Duration>(config_error("Value exceeds the supported maximum of " + std::to_string(limit), key));
    }
    return Ok(Duration(static_cast<typename Duration::rep>(value)));
}

} // namespace

const char* to_string(ObjectStoreKind kind) {
    return kind == ObjectStoreKind::Gcs ? "gcs" : "filesystem";
}

Result<ObjectStoreKind> parse_object_store_kind(const std::string& name) {
    if (name == "filesystem") {
        return Ok(ObjectStoreKind::Filesystem);
    }
    if (name == "gcs") {
        return Ok(ObjectStoreKind::Gcs);
    }
    return Err<ObjectStoreKind>(config_error("Unknown object store '" + name + "'", "object_store"));
}

paths::StorageLayout SyncConfig::layout() const {
    return paths::StorageLayout{raw_root, ml_root, processed_root, raw_bucket, ml_bucket};
}

remote::CacheOptions SyncConfig::cache_options() const {
    return remote::CacheOptions{cache_file, cache_max_age, remote_timeout};
}

transfer::EngineOptions SyncConfig::engine_options() const {
    transfer::EngineOptions options;
    options.worker_count = worker_count;
    options.remote_timeout = remote_timeout;
    return options;
}

transfer::TransferOptions SyncConfig::transfer_options() const {
    transfer::TransferOptions options;
    options.policy = conflict_policy;
    options.dry_run = dry_run;
    options.require_full_success = require_full_success;
    return options;
}

Result<SyncConfig> parse_config(const json& document) {
    if (!document.is_object()) {
        return Err<SyncConfig>(config_error("Configuration must be a JSON object"));
    }

    for (const char* key : {"raw_root", "ml_root", "processed_root", "raw_bucket", "ml_bucket",
                            "object_store", "object_store_root", "gcs_endpoint", "cache_file", "conflict_policy", "log_level"}) {
        if (auto res = require_type(document, key, json::value_t::string, "a string"); res.is_error()) {
            return Err<SyncConfig>(res.error());
        }
    }
    for (const char* key : {"dry_run", "require_full_success"}) {
        if (auto res = require_type(document, key, json::value_t::boolean, "a boolean"); res.is_error()) {
            return Err<SyncConfig>(res.error());
        }
    }
    for (const char* key : {"cache_max_age_seconds", "worker_count", "remote_timeout_ms"}) {
        if (auto res = require_type(document, key, json::value_t::number_unsigned, "a non-negative integer");
            res.is_error()) {
            return Err<SyncConfig>(res.error());
        }
    }

    SyncConfig config;
    config.raw_root = document.value("raw_root", std::string{});
    config.ml_root = document.value("ml_root", std::string{});
    config.processed_root = document.value("processed_root", std::string{});
    config.raw_bucket = document.value("raw_bucket", std::string{});
    config.ml_bucket = document.value("ml_bucket", std::string{});
    config.object_store_root = document.value("object_store_root", std::string{});
    config.gcs_endpoint = document.value("gcs_endpoint", std::string{});
    auto store_kind = parse_object_store_kind(document.value("object_store", std::string("filesystem")));
    if (store_kind.is_error()) {
        return Err<SyncConfig>(store_kind.error());
    }
    config.object_store = store_kind.value();
    config.cache_file = document.value("cache_file", std::string{});
    auto max_age = read_duration(document, "cache_max_age_seconds", config.cache_max_age);
    if (max_age.is_error()) {
        return Err<SyncConfig>(max_age.error());
    }
    config.cache_max_age = max_age.value();
    config.dry_run = document.value("dry_run", false);
    config.worker_count = document.value("worker_count", config.worker_count);
    auto remote_timeout = read_duration(document, "remote_timeout_ms", config.remote_timeout);
    if (remote_timeout.is_error()) {
        return Err<SyncConfig>(remote_timeout.error());
    }
    config.remote_timeout = remote_timeout.value();
    config.require_full_success = document.value("require_full_success", false);
    config.log_level = document.value("log_level", config.log_level);

    auto policy = transfer::parse_conflict_policy(document.value("conflict_policy", std::string("skip")));
    if (policy.is_error()) {
        return Err<SyncConfig>(config_error(policy.error().message, "conflict_policy"));
    }
    config.conflict_policy = policy.value();

    if (config.worker_count == 0) {
        return Err<SyncConfig>(config_error("worker_count must be at least 1", "worker_count"));
    }
    if (config.raw_root.empty() || config.ml_root.empty()) {
        return Err<SyncConfig>(config_error("raw_root and ml_root are required"));
    }
    if (config.raw_bucket.empty() || config.ml_bucket.empty()) {
        return Err<SyncConfig>(config_error("raw_bucket and ml_bucket are required"));
    }
    if (spdlog::level::from_str(config.log_level) == spdlog::level::off && config.log_level != "off") {
        return Err<SyncConfig>(config_error("Unknown log level '" + config.log_level + "'", "log_level"));
    }
    return Ok(std::move(config));
}

Result<SyncConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<SyncConfig>(config_error("Cannot open configuration file", path.string()));
    }

    auto document = json::parse(input, nullptr, false);
    if (document.is_discarded()) {
        return Err<SyncConfig>(config_error("Configuration file is not valid JSON", path.string()));
    }

    auto config = parse_config(document);
    if (config.is_error()) {
        auto error = config.error();
        error.context = path.string() + (error.context.empty() ? "" : ": " + error.context);
        return Err<SyncConfig>(std::move(error));
    }

    spdlog::debug("Loaded configuration from {}", path.string());
    return config;
}

Result<void> apply_log_level(const std::string& level) {
    const auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        return Err<void>(config_error("Unknown log level '" + level + "'", "log_level"));
    }
    spdlog::set_level(parsed);
    return Ok();
}

} // namespace runsync::config
