#pragma once

#include "runsync/local/local_state_scanner.hpp"
#include "runsync/model/coordinate.hpp"
#include "runsync/model/types.hpp"
#include "runsync/paths/path_translator.hpp"
#include "runsync/remote/filesystem_object_store.hpp"
#include "runsync/remote/inventory_cache.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <unistd.h>

namespace runsync::testing {

namespace fs = std::filesystem;

class TempDir {
public:
    TempDir() {
        static std::atomic<std::uint64_t> counter{0};
        path_ = fs::temp_directory_path() /
                ("runsync_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter.fetch_add(1)));
        fs::remove_all(path_);
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

inline void write_file(const fs::path& path, std::uint64_t size, char fill = 'x') {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << std::string(static_cast<std::size_t>(size), fill);
}

inline model::RunCoordinate make_coord(const std::string& suffix = "1") {
    return model::RunCoordinate::create("c" + suffix, "r" + suffix, "f" + suffix, "tw" + suffix, "lb" + suffix,
                                        "ts" + suffix)
        .value();
}

/**
 * @brief Local roots, buckets and a cache, all below one temp directory
 */
struct SyncFixture {
    TempDir temp;
    paths::StorageLayout layout{temp.path() / "local" / "raw",
                                temp.path() / "local" / "ml",
                                temp.path() / "local" / "processed",
                                "raw-bucket",
                                "ml-bucket"};
    paths::PathTranslator translator{layout};
    local::LocalStateScanner scanner{translator};
    remote::FilesystemObjectStore store{make_buckets(temp.path() / "buckets")};

    SyncFixture() = default;

    remote::CacheOptions cache_options() const {
        return remote::CacheOptions{temp.path() / "cache" / "inventory.json", std::chrono::hours(1),
                                    std::chrono::milliseconds(0)};
    }

    fs::path remote_raw(const model::RunCoordinate& c, const std::string& remote_bag, std::uint64_t size) {
        const auto path = store.root() / layout.raw_bucket / translator.remote_raw_bag_key(c, remote_bag);
        write_file(path, size);
        return path;
    }

    fs::path local_raw(const model::RunCoordinate& c, const std::string& local_bag, std::uint64_t size) {
        const auto path = translator.local_raw_bag_path(c, local_bag);
        write_file(path, size);
        return path;
    }

    fs::path remote_ml(const model::RunCoordinate& c,
                       const std::string& remote_bag,
                       model::MlFileType type,
                       const std::string& file,
                       std::uint64_t size) {
        const auto path = store.root() / layout.ml_bucket / translator.remote_ml_file_key(c, remote_bag, type, file);
        write_file(path, size);
        return path;
    }

    fs::path local_ml(const model::RunCoordinate& c,
                      const std::string& local_bag,
                      model::MlFileType type,
                      const std::string& file,
                      std::uint64_t size) {
        const auto path = translator.local_ml_file_path(c, local_bag, type, file);
        write_file(path, size);
        return path;
    }

private:
    static fs::path make_buckets(const fs::path& root) {
        fs::create_directories(root / "raw-bucket");
        fs::create_directories(root / "ml-bucket");
        return root;
    }
};

/**
 * @brief Store decorator that fails transfers whose key contains a marker
 */
class FailingObjectStore : public remote::ObjectStore {
public:
    explicit FailingObjectStore(remote::ObjectStore& inner) : inner_(inner) {}

    void fail_keys_containing(const std::string& marker) {
        std::lock_guard lock(mutex_);
        markers_.insert(marker);
    }

    void fail_listing(bool fail) { fail_listing_ = fail; }

    Result<std::vector<remote::ObjectInfo>> list(const std::string& bucket,
                                                 const std::string& prefix,
                                                 const CancellationToken& token) override {
        if (fail_listing_) {
            return Err<std::vector<remote::ObjectInfo>>(ErrorCode::RemoteStoreError, "Injected listing failure", bucket);
        }
        return inner_.list(bucket, prefix, token);
    }

    Result<remote::ObjectInfo> stat(const std::string& bucket, const std::string& key) override {
        return inner_.stat(bucket, key);
    }

    Result<void> download(const std::string& bucket,
                          const std::string& key,
                          const fs::path& destination,
                          const CancellationToken& token) override {
        if (should_fail(key)) {
            return Err<void>(ErrorCode::RemoteStoreError, "Injected download failure", key);
        }
        return inner_.download(bucket, key, destination, token);
    }

    Result<void> upload(const fs::path& source,
                        const std::string& bucket,
                        const std::string& key,
                        const CancellationToken& token) override {
        if (should_fail(key)) {
            return Err<void>(ErrorCode::RemoteStoreError, "Injected upload failure", key);
        }
        return inner_.upload(source, bucket, key, token);
    }

private:
    bool should_fail(const std::string& key) {
        std::lock_guard lock(mutex_);
        for (const auto& marker : markers_) {
            if (key.find(marker) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    remote::ObjectStore& inner_;
    std::mutex mutex_;
    std::set<std::string> markers_;
    std::atomic<bool> fail_listing_{false};
};

} // namespace runsync::testing
