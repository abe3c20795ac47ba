#pragma once

#include <string>

namespace runsync {

enum class ErrorCode {
    InvalidNameFormat,
    InvalidCoordinate,
    FilesystemError,
    RemoteStoreError,
    NotFound,
    RefreshFailed,
    CacheUnavailable,
    DiscoveryFailed,
    PlanningConflict,
    TransferItemFailed,
    CacheInvalidationFailed,
    ConfigurationError,
    Cancelled
};

/**
 * @brief Error value carried by Result
 *
 * `context` holds where the failure happened (coordinate, phase, key) and
 * `cause` the message of the underlying error when one was wrapped.
 */
struct Error {
    ErrorCode code = ErrorCode::FilesystemError;
    std::string message;
    std::string context;
    std::string cause;

    Error() = default;
    Error(ErrorCode c, std::string msg, std::string ctx = {})
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}

    /**
     * @brief Re-label an error while keeping the original as the cause
     *
     * Used when a lower layer failure becomes fatal for an operation, e.g. a
     * FilesystemError during discovery surfacing as DiscoveryFailed.
     */
    [[nodiscard]] Error wrap(ErrorCode outer, std::string outer_context) const {
        Error wrapped(outer, message, std::move(outer_context));
        wrapped.cause = cause.empty() ? std::string(to_string(code)) : cause;
        return wrapped;
    }

    [[nodiscard]] std::string describe() const {
        std::string text = std::string(to_string(code)) + ": " + message;
        if (!context.empty()) {
            text += " [" + context + "]";
        }
        if (!cause.empty()) {
            text += " (cause: " + cause + ")";
        }
        return text;
    }

    static const char* to_string(ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::InvalidNameFormat: return "InvalidNameFormat";
            case ErrorCode::InvalidCoordinate: return "InvalidCoordinate";
            case ErrorCode::FilesystemError: return "FilesystemError";
            case ErrorCode::RemoteStoreError: return "RemoteStoreError";
            case ErrorCode::NotFound: return "NotFound";
            case ErrorCode::RefreshFailed: return "RefreshFailed";
            case ErrorCode::CacheUnavailable: return "CacheUnavailable";
            case ErrorCode::DiscoveryFailed: return "DiscoveryFailed";
            case ErrorCode::PlanningConflict: return "PlanningConflict";
            case ErrorCode::TransferItemFailed: return "TransferItemFailed";
            case ErrorCode::CacheInvalidationFailed: return "CacheInvalidationFailed";
            case ErrorCode::ConfigurationError: return "ConfigurationError";
            case ErrorCode::Cancelled: return "Cancelled";
            default: return "Unknown";
        }
    }
};

} // namespace runsync
