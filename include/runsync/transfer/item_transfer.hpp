#pragma once

#include "runsync/core/cancellation.hpp"
#include "runsync/core/result.hpp"
#include "runsync/paths/path_translator.hpp"
#include "runsync/remote/object_store.hpp"
#include "runsync/transfer/types.hpp"

#include <cstdint>
#include <filesystem>

namespace runsync::transfer {

/**
 * @brief Byte moves shared by the raw and ML strategies
 *
 * Downloads land in "<destination>.partial" and are renamed into place once
 * the size matches the plan; uploads are verified by reading the object's
 * size back. Without the overwrite flag an item whose destination appeared
 * after planning fails instead of replacing it.
 */
class ItemTransfer {
public:
    static constexpr const char* kPartialSuffix = paths::PathTranslator::kPartialSuffix;

    static Result<std::uint64_t> download(remote::ObjectStore& store,
                                          const TransferItem& item,
                                          const CancellationToken& token);

    static Result<std::uint64_t> upload(remote::ObjectStore& store,
                                        const TransferItem& item,
                                        const CancellationToken& token);

    static std::filesystem::path partial_path(const std::filesystem::path& destination);

private:
    static Result<void> ensure_parent_exists(const std::filesystem::path& path);
};

} // namespace runsync::transfer
