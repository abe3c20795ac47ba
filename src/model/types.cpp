#include "runsync/model/types.hpp"

namespace runsync::model {

const char* to_string(DataKind kind) noexcept {
    switch (kind) {
        case DataKind::Raw: return "raw";
        case DataKind::Ml: return "ml";
        default: return "unknown";
    }
}

const char* to_string(StorageSide side) noexcept {
    switch (side) {
        case StorageSide::Local: return "local";
        case StorageSide::Remote: return "remote";
        default: return "unknown";
    }
}

const char* to_string(MlFileType type) noexcept {
    switch (type) {
        case MlFileType::Frames: return "frames";
        case MlFileType::Labels: return "labels";
        default: return "unknown";
    }
}

Result<DataKind> parse_data_kind(const std::string& text) {
    if (text == "raw") return Ok(DataKind::Raw);
    if (text == "ml") return Ok(DataKind::Ml);
    return Err<DataKind>(ErrorCode::ConfigurationError, "Unknown data kind: " + text);
}

std::optional<MlFileType> parse_ml_file_type(const std::string& text) {
    if (text == "frames") return MlFileType::Frames;
    if (text == "labels") return MlFileType::Labels;
    return std::nullopt;
}

std::uint64_t BagContents::total_bytes() const {
    std::uint64_t total = 0;
    for (const auto& [_, size] : frames) total += size;
    for (const auto& [_, size] : labels) total += size;
    return total;
}

StorageStatus StorageStatus::absent(StorageSide side, DataKind kind) {
    StorageStatus status;
    status.side = side;
    status.kind = kind;
    return status;
}

void StorageStatus::add_unit(const std::string& name, std::uint64_t size) {
    units[name] = size;
}

void StorageStatus::add_ml_file(const std::string& bag,
                                MlFileType type,
                                const std::string& filename,
                                std::uint64_t size) {
    auto& contents = bag_files[bag];
    contents.files(type)[filename] = size;
    units[bag] = contents.total_bytes();
}

std::vector<std::string> StorageStatus::unit_names() const {
    std::vector<std::string> names;
    names.reserve(units.size());
    for (const auto& [name, _] : units) {
        names.push_back(name);
    }
    return names;
}

std::uint64_t StorageStatus::total_size() const {
    std::uint64_t total = 0;
    for (const auto& [_, size] : units) {
        total += size;
    }
    return total;
}

std::optional<std::uint64_t> StorageStatus::unit_size(const std::string& name) const {
    auto it = units.find(name);
    if (it == units.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t StorageStatus::file_count() const {
    if (kind == DataKind::Raw) {
        return units.size();
    }
    std::size_t count = 0;
    for (const auto& [_, contents] : bag_files) {
        count += contents.file_count();
    }
    return count;
}

std::size_t StorageStatus::sample_count() const {
    std::size_t count = 0;
    for (const auto& [_, contents] : bag_files) {
        count += contents.labels.size();
    }
    return count;
}

} // namespace runsync::model
