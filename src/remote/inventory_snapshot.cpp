#include "runsync/remote/inventory_snapshot.hpp"

#include <spdlog/spdlog.h>

#include <set>

namespace runsync::remote {

using nlohmann::json;
using model::DataKind;
using model::MlFileType;
using model::RunCoordinate;
using model::StorageSide;
using model::StorageStatus;

namespace {

json& leaf_for(json& tree, const RunCoordinate& coord) {
    json* node = &tree;
    for (const auto& part : coord.parts()) {
        node = &(*node)[part];
    }
    return *node;
}

json raw_units_to_json(const StorageStatus& status) {
    json units = json::object();
    for (const auto& [name, size] : status.units) {
        units[name] = size;
    }
    return units;
}

json ml_units_to_json(const StorageStatus& status) {
    json units = json::object();
    for (const auto& [bag, contents] : status.bag_files) {
        json entry = json::object();
        for (auto type : {MlFileType::Frames, MlFileType::Labels}) {
            json files = json::object();
            for (const auto& [name, size] : contents.files(type)) {
                files[name] = size;
            }
            entry[model::to_string(type)] = std::move(files);
        }
        units[bag] = std::move(entry);
    }
    return units;
}

Result<void> read_leaf(DataKind kind, const json& leaf, StorageStatus& status) {
    if (!leaf.is_object()) {
        return Err<void>(ErrorCode::CacheUnavailable, "Inventory leaf is not an object");
    }

    for (const auto& [unit, value] : leaf.items()) {
        if (kind == DataKind::Raw) {
            if (!value.is_number_unsigned()) {
                return Err<void>(ErrorCode::CacheUnavailable, "Raw unit size is not a number", unit);
            }
            status.add_unit(unit, value.get<std::uint64_t>());
            continue;
        }

        if (!value.is_object()) {
            return Err<void>(ErrorCode::CacheUnavailable, "ML bag entry is not an object", unit);
        }
        for (const auto& [type_name, files] : value.items()) {
            const auto type = model::parse_ml_file_type(type_name);
            if (!type || !files.is_object()) {
                return Err<void>(ErrorCode::CacheUnavailable, "Unknown ML file group", unit + "/" + type_name);
            }
            for (const auto& [filename, size] : files.items()) {
                if (!size.is_number_unsigned()) {
                    return Err<void>(ErrorCode::CacheUnavailable, "ML file size is not a number", filename);
                }
                status.add_ml_file(unit, *type, filename, size.get<std::uint64_t>());
            }
        }
    }
    return Ok();
}

Result<void> read_tree(DataKind kind,
                       const json& node,
                       std::vector<std::string>& parts,
                       InventorySnapshot::CoordinateMap& out) {
    if (!node.is_object()) {
        return Err<void>(ErrorCode::CacheUnavailable, "Inventory level is not an object");
    }

    if (parts.size() == RunCoordinate::kLevels) {
        auto coord = RunCoordinate::from_parts(parts);
        if (coord.is_error()) {
            return Err<void>(coord.error().wrap(ErrorCode::CacheUnavailable, "persisted inventory"));
        }
        auto status = StorageStatus::absent(StorageSide::Remote, kind);
        auto read = read_leaf(kind, node, status);
        if (read.is_error()) {
            return read;
        }
        if (status.exists()) {
            out.emplace(coord.value(), std::move(status));
        }
        return Ok();
    }

    for (const auto& [name, child] : node.items()) {
        parts.push_back(name);
        auto read = read_tree(kind, child, parts, out);
        parts.pop_back();
        if (read.is_error()) {
            return read;
        }
    }
    return Ok();
}

StorageStatus& status_slot(InventorySnapshot::CoordinateMap& map, const RunCoordinate& coord, DataKind kind) {
    auto it = map.find(coord);
    if (it == map.end()) {
        it = map.emplace(coord, StorageStatus::absent(StorageSide::Remote, kind)).first;
    }
    return it->second;
}

} // namespace

InventorySnapshot::InventorySnapshot(Metadata metadata, CoordinateMap raw, CoordinateMap ml)
    : metadata_(std::move(metadata)), raw_(std::move(raw)), ml_(std::move(ml)) {}

Result<InventorySnapshot> InventorySnapshot::build(ObjectStore& store,
                                                   const paths::PathTranslator& translator,
                                                   const CancellationToken& token) {
    Metadata metadata;
    metadata.raw_bucket = translator.bucket_for(DataKind::Raw);
    metadata.ml_bucket = translator.bucket_for(DataKind::Ml);

    CoordinateMap raw;
    CoordinateMap ml;

    for (auto kind : {DataKind::Raw, DataKind::Ml}) {
        const auto& bucket = translator.bucket_for(kind);
        const std::string prefix = kind == DataKind::Ml ? std::string(paths::PathTranslator::kMlRawDir) + "/" : "";

        auto listed = store.list(bucket, prefix, token);
        if (listed.is_error()) {
            return Err<InventorySnapshot>(listed.error());
        }

        auto& target = kind == DataKind::Raw ? raw : ml;
        for (const auto& object : listed.value()) {
            auto ref = translator.parse_remote_key(kind, object.key);
            if (!ref) {
                metadata.foreign_objects++;
                spdlog::debug("Ignoring object outside the {} layout: {}/{}", model::to_string(kind), bucket, object.key);
                continue;
            }

            auto& status = status_slot(target, ref->coordinate, kind);
            if (kind == DataKind::Raw) {
                status.add_unit(ref->bag, object.size);
            } else {
                status.add_ml_file(ref->bag, *ref->file_type, ref->filename, object.size);
            }
            metadata.object_count++;
            metadata.total_bytes += object.size;
        }
    }

    metadata.last_refresh = Clock::now();
    spdlog::info("Built remote inventory: {} raw coordinates, {} ml coordinates, {} objects, {} bytes",
                 raw.size(), ml.size(), metadata.object_count, metadata.total_bytes);
    return Ok(InventorySnapshot(std::move(metadata), std::move(raw), std::move(ml)));
}

StorageStatus InventorySnapshot::status_for(const RunCoordinate& coord, DataKind kind) const {
    const auto& map = entries(kind);
    auto it = map.find(coord);
    if (it == map.end()) {
        return StorageStatus::absent(StorageSide::Remote, kind);
    }
    return it->second;
}

std::vector<std::string> InventorySnapshot::hierarchy_level(DataKind kind,
                                                            const std::vector<std::string>& parent_parts) const {
    if (parent_parts.size() >= RunCoordinate::kLevels) {
        return {};
    }

    std::set<std::string> values;
    for (const auto& [coord, _] : entries(kind)) {
        if (has_prefix(coord, parent_parts)) {
            values.insert(coord.parts()[parent_parts.size()]);
        }
    }
    return {values.begin(), values.end()};
}

bool InventorySnapshot::path_exists(DataKind kind, const std::vector<std::string>& parts) const {
    if (parts.empty() || parts.size() > RunCoordinate::kLevels) {
        return false;
    }
    for (const auto& [coord, _] : entries(kind)) {
        if (has_prefix(coord, parts)) {
            return true;
        }
    }
    return false;
}

json InventorySnapshot::to_json() const {
    json document;
    document["metadata"] = {
        {"format_version", kFormatVersion},
        {"last_refresh", std::chrono::duration_cast<std::chrono::seconds>(
                             metadata_.last_refresh.time_since_epoch()).count()},
        {"buckets", {{"raw", metadata_.raw_bucket}, {"ml", metadata_.ml_bucket}}},
        {"object_count", metadata_.object_count},
        {"total_bytes", metadata_.total_bytes},
        {"stale", json::object()},
    };

    if (!raw_.empty()) {
        json tree = json::object();
        for (const auto& [coord, status] : raw_) {
            leaf_for(tree, coord) = raw_units_to_json(status);
        }
        document["raw"] = std::move(tree);
    }
    if (!ml_.empty()) {
        json tree = json::object();
        for (const auto& [coord, status] : ml_) {
            leaf_for(tree, coord) = ml_units_to_json(status);
        }
        document["ml"] = std::move(tree);
    }
    return document;
}

Result<InventorySnapshot> InventorySnapshot::from_json(const json& document) {
    if (!document.is_object() || !document.contains("metadata") || !document["metadata"].is_object()) {
        return Err<InventorySnapshot>(ErrorCode::CacheUnavailable, "Inventory document has no metadata");
    }

    const auto& meta = document["metadata"];
    if (meta.value("format_version", 0) != kFormatVersion) {
        return Err<InventorySnapshot>(ErrorCode::CacheUnavailable, "Unsupported inventory format version");
    }

    Metadata metadata;
    try {
        metadata.last_refresh = Clock::time_point(std::chrono::seconds(meta.at("last_refresh").get<std::int64_t>()));
        metadata.object_count = meta.value("object_count", std::uint64_t{0});
        metadata.total_bytes = meta.value("total_bytes", std::uint64_t{0});
        if (meta.contains("buckets")) {
            metadata.raw_bucket = meta["buckets"].value("raw", std::string{});
            metadata.ml_bucket = meta["buckets"].value("ml", std::string{});
        }
    } catch (const json::exception& e) {
        return Err<InventorySnapshot>(ErrorCode::CacheUnavailable, "Malformed inventory metadata", e.what());
    }

    CoordinateMap raw;
    CoordinateMap ml;
    for (auto kind : {DataKind::Raw, DataKind::Ml}) {
        const char* branch = model::to_string(kind);
        if (!document.contains(branch)) {
            continue;
        }
        std::vector<std::string> parts;
        auto read = read_tree(kind, document[branch], parts, kind == DataKind::Raw ? raw : ml);
        if (read.is_error()) {
            return Err<InventorySnapshot>(read.error());
        }
    }

    return Ok(InventorySnapshot(std::move(metadata), std::move(raw), std::move(ml)));
}

bool InventorySnapshot::has_prefix(const RunCoordinate& coord, const std::vector<std::string>& parts) {
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (coord.parts()[i] != parts[i]) {
            return false;
        }
    }
    return true;
}

} // namespace runsync::remote
