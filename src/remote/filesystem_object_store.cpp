#include "runsync/remote/filesystem_object_store.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>
#include <thread>
#include <vector>

namespace runsync::remote {
namespace fs = std::filesystem;

namespace {

Error store_error(const std::string& message, const std::string& context) {
    return Error(ErrorCode::RemoteStoreError, message, context);
}

bool valid_key(const std::string& key) {
    if (key.empty() || key.front() == '/') {
        return false;
    }
    for (const auto& part : fs::path(key)) {
        const auto text = part.string();
        if (text == ".." || text == ".") {
            return false;
        }
    }
    return true;
}

Result<void> copy_chunked(const fs::path& source,
                          const fs::path& destination,
                          std::size_t chunk_size,
                          const CancellationToken& token) {
    std::ifstream input(source, std::ios::binary);
    if (!input) {
        return Err<void>(ErrorCode::RemoteStoreError, "Failed to open source file", source.string());
    }

    std::ofstream output(destination, std::ios::binary | std::ios::trunc);
    if (!output) {
        return Err<void>(ErrorCode::FilesystemError, "Failed to open destination file", destination.string());
    }

    std::vector<char> buffer(chunk_size);
    while (input) {
        if (token.is_cancelled()) {
            return Err<void>(ErrorCode::Cancelled, "Transfer cancelled", source.string());
        }
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto bytes_read = input.gcount();
        if (bytes_read == 0) {
            break;
        }
        output.write(buffer.data(), bytes_read);
        if (!output) {
            return Err<void>(ErrorCode::FilesystemError, "Failed to write chunk", destination.string());
        }
    }
    if (input.bad()) {
        return Err<void>(ErrorCode::RemoteStoreError, "Failed to read source file", source.string());
    }

    output.flush();
    if (!output) {
        return Err<void>(ErrorCode::FilesystemError, "Failed to flush destination file", destination.string());
    }
    return Ok();
}

} // namespace

FilesystemObjectStore::FilesystemObjectStore(fs::path root, std::size_t chunk_size)
    : root_(std::move(root)), chunk_size_(chunk_size == 0 ? kDefaultChunkSize : chunk_size) {}

Result<std::vector<ObjectInfo>> FilesystemObjectStore::list(const std::string& bucket,
                                                            const std::string& prefix,
                                                            const CancellationToken& token) {
    auto bucket_dir = bucket_path(bucket);
    if (bucket_dir.is_error()) {
        return Err<std::vector<ObjectInfo>>(bucket_dir.error());
    }
    const auto& base = bucket_dir.value();

    std::vector<ObjectInfo> objects;
    std::error_code ec;
    fs::recursive_directory_iterator it(base, ec);
    if (ec) {
        return Err<std::vector<ObjectInfo>>(store_error("Failed to list bucket: " + ec.message(), bucket));
    }

    for (const auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            return Err<std::vector<ObjectInfo>>(store_error("Failed to list bucket: " + ec.message(), bucket));
        }
        if (token.is_cancelled()) {
            return Err<std::vector<ObjectInfo>>(ErrorCode::Cancelled, "Listing cancelled", bucket);
        }

        if (it.depth() == 0 && it->path().filename() == kStagingDir) {
            it.disable_recursion_pending();
            continue;
        }

        std::error_code file_ec;
        if (!it->is_regular_file(file_ec)) {
            continue;
        }

        const auto key = it->path().lexically_relative(base).generic_string();
        if (key.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }

        const auto size = it->file_size(file_ec);
        if (file_ec) {
            // Removed between listing and stat.
            continue;
        }
        objects.push_back(ObjectInfo{key, size});
    }
    if (ec) {
        return Err<std::vector<ObjectInfo>>(store_error("Failed to list bucket: " + ec.message(), bucket));
    }

    spdlog::debug("Listed {} objects in {} with prefix '{}'", objects.size(), bucket, prefix);
    return Ok(std::move(objects));
}

Result<ObjectInfo> FilesystemObjectStore::stat(const std::string& bucket, const std::string& key) {
    auto path = object_path(bucket, key);
    if (path.is_error()) {
        return Err<ObjectInfo>(path.error());
    }

    std::error_code ec;
    const auto size = fs::file_size(path.value(), ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            return Err<ObjectInfo>(ErrorCode::NotFound, "Object not found", bucket + "/" + key);
        }
        return Err<ObjectInfo>(store_error("Failed to stat object: " + ec.message(), bucket + "/" + key));
    }
    return Ok(ObjectInfo{key, size});
}

Result<void> FilesystemObjectStore::download(const std::string& bucket,
                                             const std::string& key,
                                             const fs::path& destination,
                                             const CancellationToken& token) {
    auto path = object_path(bucket, key);
    if (path.is_error()) {
        return Err<void>(path.error());
    }

    std::error_code ec;
    if (!fs::is_regular_file(path.value(), ec)) {
        return Err<void>(ErrorCode::NotFound, "Object not found", bucket + "/" + key);
    }
    return copy_chunked(path.value(), destination, chunk_size_, token);
}

Result<void> FilesystemObjectStore::upload(const fs::path& source,
                                           const std::string& bucket,
                                           const std::string& key,
                                           const CancellationToken& token) {
    auto path = object_path(bucket, key);
    if (path.is_error()) {
        return Err<void>(path.error());
    }

    const auto staging_dir = root_ / bucket / kStagingDir;
    const auto staging_name = std::to_string(staging_counter_.fetch_add(1)) + "-" +
                              std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    const auto staging_path = staging_dir / staging_name;

    std::error_code ec;
    fs::create_directories(staging_dir, ec);
    if (ec) {
        return Err<void>(store_error("Failed to create staging area: " + ec.message(), staging_dir.string()));
    }
    fs::create_directories(path.value().parent_path(), ec);
    if (ec) {
        return Err<void>(store_error("Failed to create object directory: " + ec.message(), bucket + "/" + key));
    }

    auto copied = copy_chunked(source, staging_path, chunk_size_, token);
    if (copied.is_error()) {
        fs::remove(staging_path, ec);
        return copied;
    }

    fs::rename(staging_path, path.value(), ec);
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove(staging_path, cleanup_ec);
        return Err<void>(store_error("Failed to commit object: " + ec.message(), bucket + "/" + key));
    }
    return Ok();
}

Result<fs::path> FilesystemObjectStore::object_path(const std::string& bucket, const std::string& key) const {
    auto bucket_dir = bucket_path(bucket);
    if (bucket_dir.is_error()) {
        return bucket_dir;
    }
    if (!valid_key(key)) {
        return Err<fs::path>(store_error("Invalid object key", bucket + "/" + key));
    }
    return Ok(bucket_dir.value() / fs::path(key));
}

Result<fs::path> FilesystemObjectStore::bucket_path(const std::string& bucket) const {
    if (bucket.empty() || bucket.find('/') != std::string::npos || bucket == "." || bucket == "..") {
        return Err<fs::path>(store_error("Invalid bucket name", bucket));
    }

    const auto dir = root_ / bucket;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return Err<fs::path>(store_error("Bucket not found", bucket));
    }
    return Ok(dir);
}

} // namespace runsync::remote
