#include "runsync/paths/path_translator.hpp"

#include <array>

namespace runsync::paths {
namespace fs = std::filesystem;

using model::DataKind;
using model::MlFileType;
using model::RunCoordinate;
using model::StorageSide;

namespace {

const std::array<NamingRule, 2> kNamingRules{{
    {DataKind::Raw, "rosbag_", "_"},
    {DataKind::Ml, "rosbag_", "_"},
}};

fs::path append_coordinate(fs::path base, const RunCoordinate& coord) {
    for (const auto& part : coord.parts()) {
        base /= part;
    }
    return base;
}

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

PathTranslator::PathTranslator(StorageLayout layout) : layout_(std::move(layout)) {}

fs::path PathTranslator::local_kind_root(DataKind kind) const {
    return kind == DataKind::Raw ? layout_.raw_root : layout_.ml_root / kMlRawDir;
}

fs::path PathTranslator::local_coordinate_dir(const RunCoordinate& coord, DataKind kind) const {
    return append_coordinate(local_kind_root(kind), coord);
}

std::string PathTranslator::remote_coordinate_prefix(const RunCoordinate& coord, DataKind kind) const {
    std::string prefix;
    if (kind == DataKind::Ml) {
        prefix = std::string(kMlRawDir) + "/";
    }
    prefix += coord.to_path_string('/');
    prefix += "/";
    prefix += kRemoteBagDir;
    prefix += "/";
    return prefix;
}

std::string PathTranslator::coordinate_location(const RunCoordinate& coord, StorageSide side, DataKind kind) const {
    if (side == StorageSide::Local) {
        return local_coordinate_dir(coord, kind).generic_string();
    }
    return bucket_for(kind) + "/" + remote_coordinate_prefix(coord, kind);
}

fs::path PathTranslator::processed_coordinate_dir(const RunCoordinate& coord) const {
    return append_coordinate(layout_.processed_root, coord);
}

const std::string& PathTranslator::bucket_for(DataKind kind) const {
    return kind == DataKind::Raw ? layout_.raw_bucket : layout_.ml_bucket;
}

fs::path PathTranslator::local_raw_bag_path(const RunCoordinate& coord, const std::string& local_bag) const {
    return local_coordinate_dir(coord, DataKind::Raw) / local_bag;
}

std::string PathTranslator::remote_raw_bag_key(const RunCoordinate& coord, const std::string& remote_bag) const {
    return remote_coordinate_prefix(coord, DataKind::Raw) + remote_bag;
}

fs::path PathTranslator::local_ml_file_path(const RunCoordinate& coord,
                                            const std::string& local_bag,
                                            MlFileType type,
                                            const std::string& filename) const {
    return local_coordinate_dir(coord, DataKind::Ml) / local_bag / model::to_string(type) / filename;
}

std::string PathTranslator::remote_ml_file_key(const RunCoordinate& coord,
                                               const std::string& remote_bag,
                                               MlFileType type,
                                               const std::string& filename) const {
    return remote_coordinate_prefix(coord, DataKind::Ml) + remote_bag + "/" + model::to_string(type) + "/" + filename;
}

Result<std::string> PathTranslator::translate_unit_name(const std::string& name,
                                                        StorageSide from_side,
                                                        DataKind kind) const {
    if (!matches_convention(name, from_side, kind)) {
        return Err<std::string>(ErrorCode::InvalidNameFormat,
                                std::string("Name does not follow the ") + model::to_string(from_side) + " " +
                                    model::to_string(kind) + " convention",
                                "'" + name + "'");
    }

    const auto& rule = naming_rule(kind);
    const auto& from_prefix = from_side == StorageSide::Local ? rule.local_prefix : rule.remote_prefix;
    const auto& to_prefix = from_side == StorageSide::Local ? rule.remote_prefix : rule.local_prefix;
    return Ok(to_prefix + name.substr(from_prefix.size()));
}

bool PathTranslator::matches_convention(const std::string& name, StorageSide side, DataKind kind) const {
    const auto& rule = naming_rule(kind);
    const auto& prefix = side == StorageSide::Local ? rule.local_prefix : rule.remote_prefix;

    if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    return name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

std::optional<RemoteObjectRef> PathTranslator::parse_remote_key(DataKind kind, const std::string& key) const {
    const auto parts = split_key(key);

    if (kind == DataKind::Raw) {
        // <c>/<r>/<f>/<tw>/<lb>/<ts>/rosbag/<bag>.bag
        if (parts.size() != 8 || parts[6] != kRemoteBagDir || !ends_with(parts[7], kBagExtension)) {
            return std::nullopt;
        }
        auto coord = RunCoordinate::from_parts(std::vector<std::string>(parts.begin(), parts.begin() + 6));
        if (coord.is_error()) {
            return std::nullopt;
        }
        return RemoteObjectRef{coord.value(), parts[7], std::nullopt, {}};
    }

    // raw/<c>/<r>/<f>/<tw>/<lb>/<ts>/rosbag/<bag>/<frames|labels>/<file>
    if (parts.size() != 11 || parts[0] != kMlRawDir || parts[7] != kRemoteBagDir) {
        return std::nullopt;
    }
    const auto type = model::parse_ml_file_type(parts[9]);
    if (!type || parts[10].empty()) {
        return std::nullopt;
    }
    auto coord = RunCoordinate::from_parts(std::vector<std::string>(parts.begin() + 1, parts.begin() + 7));
    if (coord.is_error()) {
        return std::nullopt;
    }
    return RemoteObjectRef{coord.value(), parts[8], type, parts[10]};
}

const NamingRule& PathTranslator::naming_rule(DataKind kind) {
    for (const auto& rule : kNamingRules) {
        if (rule.kind == kind) {
            return rule;
        }
    }
    return kNamingRules.front();
}

std::vector<std::string> PathTranslator::split_key(const std::string& key) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (start <= key.size()) {
        const auto slash = key.find('/', start);
        const auto end = slash == std::string::npos ? key.size() : slash;
        parts.push_back(key.substr(start, end - start));
        if (slash == std::string::npos) {
            break;
        }
        start = slash + 1;
    }
    return parts;
}

} // namespace runsync::paths
