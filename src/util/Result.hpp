/**
 * @file Result.hpp
 * @brief Error type shared by every fallible engine operation
 *
 * Operations return std::expected<T, util::Error>. Per-file failures are kept
 * as values inside result maps, only operation-level failures end a job.
 */

#pragma once

#include <cerrno>
#include <cstring>
#include <expected>
#include <string>
#include <string_view>

namespace util {

/**
 * @enum ErrorKind
 * @brief Classification of an error for callers that render or aggregate them
 */
enum class ErrorKind {
    Generic,
    InvalidInput,
    DetectionFailure,        ///< Soft, normally resolved to a fallback
    HashCalculation,         ///< Per-file read or digest failure
    Copy,                    ///< Per-file copy failure
    Cancelled,               ///< Cooperative cancellation honoured
    ResourceExhausted,       ///< Buffer pool timeout, pool saturation
    DestinationUnavailable,  ///< Destination root vanished mid-job
    AbnormalTermination      ///< Worker did not stop within the grace period
};

/**
 * @struct Error
 * @brief Represents an error with a message, an errno-style code and a kind
 */
struct Error {
    std::string message;
    int code = 0;
    ErrorKind kind = ErrorKind::Generic;

    Error() = default;
    explicit Error(std::string msg, int err_code = 0, ErrorKind err_kind = ErrorKind::Generic)
        : message(std::move(msg)), code(err_code), kind(err_kind) {}

    [[nodiscard]] auto what() const -> const std::string& {
        return message;
    }

    [[nodiscard]] auto is_cancelled() const -> bool {
        return kind == ErrorKind::Cancelled;
    }
};

/**
 * @brief Build an Error from the current errno
 * @param context Prefix describing the failed call
 * @param kind Error classification
 */
[[nodiscard]] inline auto errno_error(std::string_view context, ErrorKind kind) -> Error {
    const int saved = errno;
    return Error{std::string(context) + ": " + std::strerror(saved), saved, kind};
}

[[nodiscard]] inline auto cancelled_error(std::string_view what) -> Error {
    return Error{std::string(what) + " cancelled", ECANCELED, ErrorKind::Cancelled};
}

[[nodiscard]] inline auto error_kind_name(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::Generic:
            return "error";
        case ErrorKind::InvalidInput:
            return "invalid_input";
        case ErrorKind::DetectionFailure:
            return "detection_failure";
        case ErrorKind::HashCalculation:
            return "hash_calculation";
        case ErrorKind::Copy:
            return "copy";
        case ErrorKind::Cancelled:
            return "cancelled";
        case ErrorKind::ResourceExhausted:
            return "resource_exhausted";
        case ErrorKind::DestinationUnavailable:
            return "destination_unavailable";
        case ErrorKind::AbnormalTermination:
            return "abnormal_termination";
    }
    return "error";
}

}  // namespace util
