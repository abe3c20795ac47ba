#pragma once

#include "runsync/remote/object_store.hpp"

#include <google/cloud/status.h>
#include <google/cloud/storage/client.h>

#include <cstddef>
#include <string>

namespace runsync::remote {

struct GcsOptions {
    /// Empty uses the public endpoint; set for emulators and private gateways.
    std::string endpoint;
    std::size_t chunk_size = 1024 * 1024;
};

/**
 * @brief Object store backed by Google Cloud Storage
 *
 * Credentials are resolved by the client library (Application Default
 * Credentials, GOOGLE_APPLICATION_CREDENTIALS). Uploads use a resumable
 * session; the object only becomes visible when the session is finalized, and
 * a cancelled upload deletes its session.
 */
class GcsObjectStore : public ObjectStore {
public:
    explicit GcsObjectStore(GcsOptions options = {});
    GcsObjectStore(google::cloud::storage::Client client, GcsOptions options);

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

    /// kNotFound -> NotFound, kCancelled -> Cancelled, everything else RemoteStoreError.
    static Error to_error(const google::cloud::Status& status, const std::string& context);

private:
    google::cloud::storage::Client client_;
    GcsOptions options_;
};

} // namespace runsync::remote
