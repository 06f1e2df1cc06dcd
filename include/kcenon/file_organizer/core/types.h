/**
 * @file types.h
 * @brief Core type definitions for file_organizer_system
 */

#ifndef KCENON_FILE_ORGANIZER_CORE_TYPES_H
#define KCENON_FILE_ORGANIZER_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::file_organizer {

/**
 * @brief Error codes for file organizer operations
 */
enum class error_code {
    success = 0,

    // File errors (-100 to -119)
    file_not_found = -100,
    file_access_denied = -101,
    file_read_error = -102,
    file_write_error = -103,
    invalid_file_path = -104,
    directory_create_failed = -105,

    // Resolution errors (-120 to -139)
    resolution_failed = -120,

    // Transfer errors (-140 to -159)
    transfer_failed = -140,
    move_failed = -141,
    copy_failed = -142,

    // Cleanup errors (-160 to -179)
    cleanup_failed = -160,
    directory_remove_failed = -161,

    // Configuration errors (-180 to -199)
    invalid_configuration = -180,
    invalid_destination = -181,

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
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_access_denied:
            return "file access denied";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::invalid_file_path:
            return "invalid file path";
        case error_code::directory_create_failed:
            return "directory creation failed";
        case error_code::resolution_failed:
            return "duplicate resolution failed";
        case error_code::transfer_failed:
            return "transfer failed";
        case error_code::move_failed:
            return "move failed";
        case error_code::copy_failed:
            return "copy failed";
        case error_code::cleanup_failed:
            return "cleanup failed";
        case error_code::directory_remove_failed:
            return "directory removal failed";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::invalid_destination:
            return "invalid destination";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Check if error code belongs to the cleanup range
 */
[[nodiscard]] constexpr auto is_cleanup_error(error_code code) noexcept -> bool {
    auto value = static_cast<int>(code);
    return value <= -160 && value >= -179;
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
 * Holds either a value of type T or an error, similar to std::expected.
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

}  // namespace kcenon::file_organizer

#endif  // KCENON_FILE_ORGANIZER_CORE_TYPES_H
