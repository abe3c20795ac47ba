#include "runsync/model/coordinate.hpp"

namespace runsync::model {

Result<RunCoordinate> RunCoordinate::create(std::string client,
                                            std::string region,
                                            std::string field,
                                            std::string time_window,
                                            std::string label_batch,
                                            std::string timestamp) {
    Parts parts{std::move(client), std::move(region), std::move(field),
                std::move(time_window), std::move(label_batch), std::move(timestamp)};

    for (std::size_t level = 0; level < kLevels; ++level) {
        if (!valid_component(parts[level])) {
            return Err<RunCoordinate>(ErrorCode::InvalidCoordinate,
                                      std::string("Invalid coordinate component for ") + level_name(level),
                                      "'" + parts[level] + "'");
        }
    }
    return Ok(RunCoordinate(std::move(parts)));
}

Result<RunCoordinate> RunCoordinate::from_parts(const std::vector<std::string>& parts) {
    if (parts.size() != kLevels) {
        return Err<RunCoordinate>(ErrorCode::InvalidCoordinate,
                                  "Coordinate needs " + std::to_string(kLevels) + " components, got " +
                                      std::to_string(parts.size()));
    }
    return create(parts[0], parts[1], parts[2], parts[3], parts[4], parts[5]);
}

std::string RunCoordinate::to_path_string(char separator) const {
    std::string out;
    for (std::size_t level = 0; level < kLevels; ++level) {
        if (level > 0) {
            out.push_back(separator);
        }
        out += parts_[level];
    }
    return out;
}

std::string RunCoordinate::to_string() const {
    return "(" + to_path_string(',') + ")";
}

const char* RunCoordinate::level_name(std::size_t level) noexcept {
    static constexpr const char* kNames[kLevels] = {
        "client", "region", "field", "time_window", "label_batch", "timestamp"};
    return level < kLevels ? kNames[level] : "unknown";
}

bool RunCoordinate::valid_component(const std::string& value) {
    if (value.empty() || value == "." || value == "..") {
        return false;
    }
    return value.find('/') == std::string::npos && value.find('\\') == std::string::npos;
}

} // namespace runsync::model
