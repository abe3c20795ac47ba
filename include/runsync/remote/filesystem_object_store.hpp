#pragma once

#include "runsync/remote/object_store.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>

namespace runsync::remote {

/**
 * @brief Object store backed by a directory tree: <root>/<bucket>/<key>
 *
 * Serves mounted buckets and tests. Uploads are written below
 * <root>/<bucket>/.staging and renamed into place, so a reader never sees a
 * partially written object.
 */
class FilesystemObjectStore : public ObjectStore {
public:
    static constexpr std::size_t kDefaultChunkSize = 64 * 1024;
    static constexpr const char* kStagingDir = ".staging";

    explicit FilesystemObjectStore(std::filesystem::path root, std::size_t chunk_size = kDefaultChunkSize);

    Result<std::vector<ObjectInfo>> list(const std::string& bucket,
                                         const std::string& prefix,
                                         const CancellationToken& token) override;

    Result<ObjectInfo> stat(const std::string& bucket, const std::string& key) override;

    Result<void> download(const std::string& bucket,
                          const std::string& key,
                          const std::filesystem::path& destination,
                          const CancellationToken& token) override;

    Result<void> upload(const std::filesystem::path& source,
                        const std::string& bucket,
                        const std::string& key,
                        const CancellationToken& token) override;

    const std::filesystem::path& root() const noexcept { return root_; }

private:
    Result<std::filesystem::path> object_path(const std::string& bucket, const std::string& key) const;
    Result<std::filesystem::path> bucket_path(const std::string& bucket) const;

    std::filesystem::path root_;
    std::size_t chunk_size_;
    std::atomic<std::uint64_t> staging_counter_{0};
};

} // namespace runsync::remote
