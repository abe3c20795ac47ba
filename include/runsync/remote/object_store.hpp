#pragma once

#include "runsync/core/cancellation.hpp"
#include "runsync/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace runsync::remote {

struct ObjectInfo {
    std::string key;
    std::uint64_t size = 0;
};

/**
 * @brief Primitives the engine needs from a remote bucket store
 *
 * Implementations must be safe to call from several worker threads at once.
 * Credentials are the implementation's concern. Long running calls poll the
 * token and fail with ErrorCode::Cancelled once it fires.
 */
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    virtual Result<std::vector<ObjectInfo>> list(const std::string& bucket,
                                                 const std::string& prefix,
                                                 const CancellationToken& token) = 0;

    virtual Result<ObjectInfo> stat(const std::string& bucket, const std::string& key) = 0;

    virtual Result<void> download(const std::string& bucket,
                                  const std::string& key,
                                  const std::filesystem::path& destination,
                                  const CancellationToken& token) = 0;

    virtual Result<void> upload(const std::filesystem::path& source,
                                const std::string& bucket,
                                const std::string& key,
                                const CancellationToken& token) = 0;
};

} // namespace runsync::remote
