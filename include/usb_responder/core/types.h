/**
 * @file types.h
 * @brief Core type definitions for usb_responder
 */

#ifndef USB_RESPONDER_CORE_TYPES_H
#define USB_RESPONDER_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace usb_responder {

/**
 * @brief Error codes for responder operations
 */
enum class error_code {
    success = 0,

    // Frame errors (-100 to -119)
    malformed_frame = -100,
    unknown_command = -101,
    unexpected_frame_type = -102,
    invalid_payload = -103,
    end_of_stream = -104,

    // Catalog errors (-120 to -139)
    index_out_of_range = -120,
    range_invalid = -121,
    io_error = -122,

    // Input errors (-140 to -149)
    file_not_found = -140,
    not_a_regular_file = -141,
    empty_file = -142,

    // Configuration errors (-150 to -159)
    invalid_configuration = -150,
    invalid_segment_size = -151,

    // Transport errors (-160 to -179)
    connect_failed = -160,
    device_not_found = -161,
    connection_lost = -162,
    connection_timeout = -163,
    not_connected = -164,

    // Session errors (-180 to -199)
    session_failed = -180,
    cancelled = -181,

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
        case error_code::malformed_frame:
            return "malformed frame";
        case error_code::unknown_command:
            return "unknown command";
        case error_code::unexpected_frame_type:
            return "unexpected frame type";
        case error_code::invalid_payload:
            return "invalid payload";
        case error_code::end_of_stream:
            return "end of stream";
        case error_code::index_out_of_range:
            return "file index out of range";
        case error_code::range_invalid:
            return "byte range invalid";
        case error_code::io_error:
            return "file I/O error";
        case error_code::file_not_found:
            return "file not found";
        case error_code::not_a_regular_file:
            return "not a regular file";
        case error_code::empty_file:
            return "file is empty";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::invalid_segment_size:
            return "invalid segment size";
        case error_code::connect_failed:
            return "connect failed";
        case error_code::device_not_found:
            return "device not found";
        case error_code::connection_lost:
            return "connection lost";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::not_connected:
            return "not connected";
        case error_code::session_failed:
            return "session failed";
        case error_code::cancelled:
            return "cancelled";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Check if the error is raised by the transport
 *
 * Transport errors escalate to the session controller; every other error is
 * recovered where it happens.
 */
[[nodiscard]] constexpr auto is_transport_error(error_code code) -> bool {
    return static_cast<int>(code) <= -160 && static_cast<int>(code) >= -179;
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

}  // namespace usb_responder

#endif  // USB_RESPONDER_CORE_TYPES_H
