#include "runsync/remote/gcs_object_store.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <vector>

namespace runsync::remote {
namespace fs = std::filesystem;
namespace gcs = google::cloud::storage;

using google::cloud::StatusCode;

namespace {

gcs::Client make_client(const GcsOptions& options) {
    auto client_options = google::cloud::Options{};
    if (!options.endpoint.empty()) {
        client_options.set<gcs::RestEndpointOption>(options.endpoint);
    }
    return gcs::Client(std::move(client_options));
}

std::string object_context(const std::string& bucket, const std::string& key) {
    return "gs://" + bucket + "/" + key;
}

} // namespace

GcsObjectStore::GcsObjectStore(GcsOptions options)
    : client_(make_client(options)), options_(std::move(options)) {}

GcsObjectStore::GcsObjectStore(gcs::Client client, GcsOptions options)
    : client_(std::move(client)), options_(std::move(options)) {}

Error GcsObjectStore::to_error(const google::cloud::Status& status, const std::string& context) {
    ErrorCode code = ErrorCode::RemoteStoreError;
    switch (status.code()) {
        case StatusCode::kNotFound:
            code = ErrorCode::NotFound;
            break;
        case StatusCode::kCancelled:
            code = ErrorCode::Cancelled;
            break;
        default:
            break;
    }
    Error error(code, status.message(), context);
    error.cause = google::cloud::StatusCodeToString(status.code());
    return error;
}

Result<std::vector<ObjectInfo>> GcsObjectStore::list(const std::string& bucket,
                                                     const std::string& prefix,
                                                     const CancellationToken& token) {
    if (token.is_cancelled()) {
        return Err<std::vector<ObjectInfo>>(ErrorCode::Cancelled, "Listing cancelled", object_context(bucket, prefix));
    }

    std::vector<ObjectInfo> objects;
    for (auto&& metadata : client_.ListObjects(bucket, gcs::Prefix(prefix))) {
        if (token.is_cancelled()) {
            return Err<std::vector<ObjectInfo>>(ErrorCode::Cancelled, "Listing cancelled", object_context(bucket, prefix));
        }
        if (!metadata) {
            return Err<std::vector<ObjectInfo>>(to_error(metadata.status(), object_context(bucket, prefix)));
        }
        objects.push_back(ObjectInfo{metadata->name(), metadata->size()});
    }
    if (token.is_cancelled()) {
        return Err<std::vector<ObjectInfo>>(ErrorCode::Cancelled, "Listing cancelled", object_context(bucket, prefix));
    }

    spdlog::debug("Listed {} objects under {}", objects.size(), object_context(bucket, prefix));
    return Ok(std::move(objects));
}

Result<ObjectInfo> GcsObjectStore::stat(const std::string& bucket, const std::string& key) {
    auto metadata = client_.GetObjectMetadata(bucket, key);
    if (!metadata) {
        return Err<ObjectInfo>(to_error(metadata.status(), object_context(bucket, key)));
    }
    return Ok(ObjectInfo{metadata->name(), metadata->size()});
}

Result<void> GcsObjectStore::download(const std::string& bucket,
                                      const std::string& key,
                                      const fs::path& destination,
                                      const CancellationToken& token) {
    if (token.is_cancelled()) {
        return Err<void>(ErrorCode::Cancelled, "Transfer cancelled", object_context(bucket, key));
    }

    auto reader = client_.ReadObject(bucket, key);
    if (!reader.status().ok()) {
        return Err<void>(to_error(reader.status(), object_context(bucket, key)));
    }

    std::ofstream output(destination, std::ios::binary | std::ios::trunc);
    if (!output) {
        return Err<void>(ErrorCode::FilesystemError, "Failed to open destination file", destination.string());
    }

    std::vector<char> buffer(options_.chunk_size);
    while (reader) {
        if (token.is_cancelled()) {
            reader.Close();
            return Err<void>(ErrorCode::Cancelled, "Transfer cancelled", object_context(bucket, key));
        }
        reader.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto bytes_read = reader.gcount();
        if (bytes_read == 0) {
            break;
        }
        output.write(buffer.data(), bytes_read);
        if (!output) {
            reader.Close();
            return Err<void>(ErrorCode::FilesystemError, "Failed to write chunk", destination.string());
        }
    }
    if (!reader.status().ok()) {
        return Err<void>(to_error(reader.status(), object_context(bucket, key)));
    }

    output.flush();
    if (!output) {
        return Err<void>(ErrorCode::FilesystemError, "Failed to flush destination file", destination.string());
    }
    return Ok();
}

Result<void> GcsObjectStore::upload(const fs::path& source,
                                    const std::string& bucket,
                                    const std::string& key,
                                    const CancellationToken& token) {
    std::ifstream input(source, std::ios::binary);
    if (!input) {
        return Err<void>(ErrorCode::FilesystemError, "Failed to open source file", source.string());
    }
    if (token.is_cancelled()) {
        return Err<void>(ErrorCode::Cancelled, "Transfer cancelled", source.string());
    }

    auto writer = client_.WriteObject(bucket, key, gcs::NewResumableUploadSession());
    if (!writer.last_status().ok()) {
        return Err<void>(to_error(writer.last_status(), object_context(bucket, key)));
    }

    std::vector<char> buffer(options_.chunk_size);
    while (input) {
        if (token.is_cancelled()) {
            const auto session_id = writer.resumable_session_id();
            std::move(writer).Suspend();
            if (auto status = client_.DeleteResumableUpload(session_id); !status.ok()) {
                spdlog::warn("Could not delete upload session for {}: {}", object_context(bucket, key),
                             status.message());
            }
            return Err<void>(ErrorCode::Cancelled, "Transfer cancelled", source.string());
        }
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto bytes_read = input.gcount();
        if (bytes_read == 0) {
            break;
        }
        writer.write(buffer.data(), bytes_read);
        if (!writer) {
            return Err<void>(to_error(writer.last_status(), object_context(bucket, key)));
        }
    }
    if (input.bad()) {
        return Err<void>(ErrorCode::FilesystemError, "Failed to read source file", source.string());
    }

    writer.Close();
    const auto& metadata = writer.metadata();
    if (!metadata) {
        return Err<void>(to_error(metadata.status(), object_context(bucket, key)));
    }
    spdlog::debug("Uploaded {} ({} bytes)", object_context(bucket, key), metadata->size());
    return Ok();
}

} // namespace runsync::remote
