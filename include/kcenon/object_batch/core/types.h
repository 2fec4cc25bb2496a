/**
 * @file types.h
 * @brief Core type definitions for object_batch
 */

#ifndef KCENON_OBJECT_BATCH_CORE_TYPES_H
#define KCENON_OBJECT_BATCH_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::object_batch {

/**
 * @brief Error codes for batch transfer operations
 *
 * Error code ranges:
 * - -100 to -119: Planning errors (fatal, raised before any transfer)
 * - -120 to -139: Authentication errors (fatal for the whole batch)
 * - -140 to -159: Transport errors (retryable per item)
 * - -160 to -169: Verification errors (retried like transport errors)
 * - -170 to -189: State store errors
 * - -190 to -199: Configuration errors
 * - -200 to -219: Internal errors
 */
enum class error_code {
    success = 0,

    // Planning errors (-100 to -119)
    source_not_found = -100,
    source_is_directory = -101,
    invalid_pattern = -102,
    invalid_destination = -103,
    no_sources = -104,
    directory_walk_failed = -105,
    invalid_source = -106,
    invalid_ticket_id = -107,

    // Authentication errors (-120 to -139)
    authentication_failed = -120,
    transport_unavailable = -121,

    // Transport errors (-140 to -159)
    transport_failed = -140,
    transport_timeout = -141,
    network_error = -142,
    transfer_cancelled = -143,
    remote_list_failed = -144,
    remote_stat_failed = -145,

    // Verification errors (-160 to -169)
    size_mismatch = -160,
    remote_object_not_found = -161,

    // State errors (-170 to -189)
    state_corrupted = -170,
    state_write_failed = -171,
    state_read_failed = -172,

    // Configuration errors (-190 to -199)
    invalid_configuration = -190,

    // Internal errors (-200 to -219)
    internal_error = -200,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::source_not_found:
            return "source not found";
        case error_code::source_is_directory:
            return "source is a directory";
        case error_code::invalid_pattern:
            return "invalid glob pattern";
        case error_code::invalid_destination:
            return "invalid destination";
        case error_code::no_sources:
            return "nothing to transfer";
        case error_code::directory_walk_failed:
            return "directory walk failed";
        case error_code::invalid_source:
            return "invalid source";
        case error_code::invalid_ticket_id:
            return "invalid ticket id";
        case error_code::authentication_failed:
            return "authentication failed";
        case error_code::transport_unavailable:
            return "transport command unavailable";
        case error_code::transport_failed:
            return "transport command failed";
        case error_code::transport_timeout:
            return "transport timeout";
        case error_code::network_error:
            return "network error";
        case error_code::transfer_cancelled:
            return "transfer cancelled";
        case error_code::remote_list_failed:
            return "remote listing failed";
        case error_code::remote_stat_failed:
            return "remote metadata query failed";
        case error_code::size_mismatch:
            return "size mismatch";
        case error_code::remote_object_not_found:
            return "remote object not found";
        case error_code::state_corrupted:
            return "state file corrupted";
        case error_code::state_write_failed:
            return "state write failed";
        case error_code::state_read_failed:
            return "state read failed";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Check if error code is in planning error range
 */
[[nodiscard]] constexpr auto is_planning_error(error_code code) noexcept -> bool {
    auto v = static_cast<int>(code);
    return v <= -100 && v >= -119;
}

/**
 * @brief Check if error code is in authentication error range
 */
[[nodiscard]] constexpr auto is_authentication_error(error_code code) noexcept -> bool {
    auto v = static_cast<int>(code);
    return v <= -120 && v >= -139;
}

/**
 * @brief Check if error code is in transport error range
 */
[[nodiscard]] constexpr auto is_transport_error(error_code code) noexcept -> bool {
    auto v = static_cast<int>(code);
    return v <= -140 && v >= -159;
}

/**
 * @brief Check if error code is in verification error range
 */
[[nodiscard]] constexpr auto is_verification_error(error_code code) noexcept -> bool {
    auto v = static_cast<int>(code);
    return v <= -160 && v >= -169;
}

/**
 * @brief Check if error code is in state error range
 */
[[nodiscard]] constexpr auto is_state_error(error_code code) noexcept -> bool {
    auto v = static_cast<int>(code);
    return v <= -170 && v >= -189;
}

/**
 * @brief Check if a per-item failure with this code may be retried
 *
 * Cancellation is excluded: a cancelled item stays resumable but is not
 * retried within the same run.
 */
[[nodiscard]] constexpr auto is_retryable(error_code code) noexcept -> bool {
    if (code == error_code::transfer_cancelled) {
        return false;
    }
    return is_transport_error(code) || is_verification_error(code);
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::object_batch

#endif  // KCENON_OBJECT_BATCH_CORE_TYPES_H
