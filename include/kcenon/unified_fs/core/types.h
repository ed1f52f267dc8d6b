/**
 * @file types.h
 * @brief Core type definitions for unified_fs_system
 */

#ifndef KCENON_UNIFIED_FS_CORE_TYPES_H
#define KCENON_UNIFIED_FS_CORE_TYPES_H

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::unified_fs {

/**
 * @brief Error codes for filesystem and transfer operations
 */
enum class error_code {
    success = 0,

    // Filesystem errors (-100 to -119)
    not_found = -100,
    permission_denied = -101,
    name_collision = -102,
    directory_not_empty = -103,
    not_a_directory = -104,
    invalid_argument = -105,

    // Session errors (-160 to -179)
    connectivity_error = -160,
    authentication_error = -161,

    // Operation outcomes (-180 to -199)
    cancelled = -180,
    skipped_directory = -181,

    // Internal errors (-200 to -219)
    unknown_failure = -200,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::not_found:
            return "not found";
        case error_code::permission_denied:
            return "permission denied";
        case error_code::name_collision:
            return "name collision";
        case error_code::directory_not_empty:
            return "directory not empty";
        case error_code::not_a_directory:
            return "not a directory";
        case error_code::invalid_argument:
            return "invalid argument";
        case error_code::connectivity_error:
            return "connectivity error";
        case error_code::authentication_error:
            return "authentication error";
        case error_code::cancelled:
            return "cancelled";
        case error_code::skipped_directory:
            return "skipped directory";
        case error_code::unknown_failure:
            return "unknown failure";
        default:
            return "unknown error";
    }
}

/**
 * @brief Whether an operation failing with @p code may succeed when retried
 *
 * Only transport loss qualifies. Authentication failures and filesystem
 * errors such as not_found are final.
 */
[[nodiscard]] constexpr auto is_retryable(error_code code) -> bool {
    return code == error_code::connectivity_error;
}

/**
 * @brief Error type with code, message and optional underlying cause
 */
struct error {
    error_code code;
    std::string message;
    std::string cause;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}
    error(error_code c, std::string msg, std::string why)
        : code(c), message(std::move(msg)), cause(std::move(why)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }

    /**
     * @brief Human readable form: "<code>: <message> (<cause>)"
     */
    [[nodiscard]] auto describe() const -> std::string {
        std::string text = to_string(code);
        if (!message.empty()) {
            text += ": " + message;
        }
        if (!cause.empty()) {
            text += " (" + cause + ")";
        }
        return text;
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

/**
 * @brief Identifier assigned to a submitted operation request
 */
struct request_id {
    uint64_t value;

    request_id() : value(0) {}
    explicit request_id(uint64_t v) : value(v) {}

    [[nodiscard]] auto operator==(const request_id& other) const -> bool = default;
    [[nodiscard]] auto operator<(const request_id& other) const -> bool {
        return value < other.value;
    }

    [[nodiscard]] auto to_string() const -> std::string {
        return "req-" + std::to_string(value);
    }
};

}  // namespace kcenon::unified_fs

template <>
struct std::hash<kcenon::unified_fs::request_id> {
    auto operator()(const kcenon::unified_fs::request_id& id) const noexcept -> std::size_t {
        return std::hash<uint64_t>{}(id.value);
    }
};

#endif  // KCENON_UNIFIED_FS_CORE_TYPES_H
