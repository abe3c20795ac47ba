#include "runsync/transfer/item_transfer.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace runsync::transfer {
namespace fs = std::filesystem;

namespace {

void discard_partial(const fs::path& partial) {
    std::error_code ec;
    fs::remove(partial, ec);
    if (ec) {
        spdlog::warn("Could not remove partial file {}: {}", partial.string(), ec.message());
    }
}

} // namespace

Result<std::uint64_t> ItemTransfer::download(remote::ObjectStore& store,
                                             const TransferItem& item,
                                             const CancellationToken& token) {
    const auto& destination = item.local_path;

    std::error_code ec;
    if (!item.overwrite && fs::exists(destination, ec)) {
        return Err<std::uint64_t>(ErrorCode::PlanningConflict,
                                  "Destination appeared after planning; refusing to overwrite",
                                  destination.string());
    }

    if (auto res = ensure_parent_exists(destination); res.is_error()) {
        return Err<std::uint64_t>(res.error());
    }

    const auto partial = partial_path(destination);
    if (auto res = store.download(item.bucket, item.remote_key, partial, token); res.is_error()) {
        discard_partial(partial);
        return Err<std::uint64_t>(res.error());
    }

    const auto written = fs::file_size(partial, ec);
    if (ec) {
        discard_partial(partial);
        return Err<std::uint64_t>(ErrorCode::FilesystemError, "Failed to read downloaded size: " + ec.message(),
                                  partial.string());
    }
    if (written != item.size) {
        discard_partial(partial);
        return Err<std::uint64_t>(ErrorCode::TransferItemFailed,
                                  "Size mismatch after download: expected " + std::to_string(item.size) +
                                      " bytes, got " + std::to_string(written),
                                  item.remote_key);
    }

    fs::rename(partial, destination, ec);
    if (ec) {
        discard_partial(partial);
        return Err<std::uint64_t>(ErrorCode::FilesystemError, "Failed to move download into place: " + ec.message(),
                                  destination.string());
    }
    return Ok(static_cast<std::uint64_t>(written));
}

Result<std::uint64_t> ItemTransfer::upload(remote::ObjectStore& store,
                                           const TransferItem& item,
                                           const CancellationToken& token) {
    if (!item.overwrite) {
        auto existing = store.stat(item.bucket, item.remote_key);
        if (existing.is_ok()) {
            return Err<std::uint64_t>(ErrorCode::PlanningConflict,
                                      "Object appeared after planning; refusing to overwrite",
                                      item.bucket + "/" + item.remote_key);
        }
        if (existing.error().code != ErrorCode::NotFound) {
            return Err<std::uint64_t>(existing.error());
        }
    }

    if (auto res = store.upload(item.local_path, item.bucket, item.remote_key, token); res.is_error()) {
        return Err<std::uint64_t>(res.error());
    }

    auto uploaded = store.stat(item.bucket, item.remote_key);
    if (uploaded.is_error()) {
        return Err<std::uint64_t>(uploaded.error());
    }
    if (uploaded.value().size != item.size) {
        return Err<std::uint64_t>(ErrorCode::TransferItemFailed,
                                  "Size mismatch after upload: expected " + std::to_string(item.size) +
                                      " bytes, store reports " + std::to_string(uploaded.value().size),
                                  item.bucket + "/" + item.remote_key);
    }
    return Ok(uploaded.value().size);
}

fs::path ItemTransfer::partial_path(const fs::path& destination) {
    auto partial = destination;
    partial += kPartialSuffix;
    return partial;
}

Result<void> ItemTransfer::ensure_parent_exists(const fs::path& path) {
    const auto parent = path.parent_path();
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec && !fs::is_directory(parent)) {
        return Err<void>(ErrorCode::FilesystemError, "Failed to create directory: " + ec.message(), parent.string());
    }
    return Ok();
}

} // namespace runsync::transfer
