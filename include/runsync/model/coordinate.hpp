#pragma once

#include "runsync/core/result.hpp"

#include <array>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace runsync::model {

/**
 * @brief Six-level address of one logical data unit
 *
 * client / region / field / time window / label batch / timestamp. The same
 * coordinate names a directory on the local side and a key prefix on the
 * remote side. Values are immutable once created.
 */
class RunCoordinate {
public:
    static constexpr std::size_t kLevels = 6;
    using Parts = std::array<std::string, kLevels>;

    static Result<RunCoordinate> create(std::string client,
                                        std::string region,
                                        std::string field,
                                        std::string time_window,
                                        std::string label_batch,
                                        std::string timestamp);

    static Result<RunCoordinate> from_parts(const std::vector<std::string>& parts);

    [[nodiscard]] const std::string& client() const noexcept { return parts_[0]; }
    [[nodiscard]] const std::string& region() const noexcept { return parts_[1]; }
    [[nodiscard]] const std::string& field() const noexcept { return parts_[2]; }
    [[nodiscard]] const std::string& time_window() const noexcept { return parts_[3]; }
    [[nodiscard]] const std::string& label_batch() const noexcept { return parts_[4]; }
    [[nodiscard]] const std::string& timestamp() const noexcept { return parts_[5]; }

    [[nodiscard]] const Parts& parts() const noexcept { return parts_; }

    [[nodiscard]] std::string to_path_string(char separator = '/') const;
    [[nodiscard]] std::string to_string() const;

    bool operator==(const RunCoordinate& other) const { return parts_ == other.parts_; }
    bool operator!=(const RunCoordinate& other) const { return parts_ != other.parts_; }
    // Only used to give listings a stable order.
    bool operator<(const RunCoordinate& other) const { return parts_ < other.parts_; }

    static const char* level_name(std::size_t level) noexcept;

private:
    explicit RunCoordinate(Parts parts) : parts_(std::move(parts)) {}

    static bool valid_component(const std::string& value);

    Parts parts_;
};

} // namespace runsync::model

namespace std {

template<>
struct hash<runsync::model::RunCoordinate> {
    std::size_t operator()(const runsync::model::RunCoordinate& coord) const noexcept {
        std::size_t seed = 0;
        for (const auto& part : coord.parts()) {
            seed ^= std::hash<std::string>{}(part) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        }
        return seed;
    }
};

} // namespace std
