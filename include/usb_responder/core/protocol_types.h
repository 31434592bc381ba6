/**
 * @file protocol_types.h
 * @brief Protocol frame types, command ids and payloads
 *
 * This file defines the wire protocol spoken with the peer device.
 * All multi-byte fields use little-endian byte order.
 */

#ifndef USB_RESPONDER_CORE_PROTOCOL_TYPES_H
#define USB_RESPONDER_CORE_PROTOCOL_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "types.h"

namespace usb_responder {

/**
 * @brief Frame type (direction / meaning of a frame)
 */
enum class frame_type : uint8_t {
    request,    ///< Peer to host
    response,   ///< Host to peer, success
    error,      ///< Host to peer, request failed
};

inline constexpr std::size_t frame_type_count = 3;

/**
 * @brief Command identifiers
 *
 * Logical ids; the byte values on the wire come from the wire_profile.
 */
enum class command_id : uint8_t {
    exit,
    list,
    file_range,
    file_count,
    file_name,
    file_size,
};

inline constexpr std::size_t command_count = 6;

inline constexpr std::array<command_id, command_count> all_commands = {
    command_id::exit,       command_id::list,      command_id::file_range,
    command_id::file_count, command_id::file_name, command_id::file_size,
};

[[nodiscard]] constexpr auto to_string(frame_type type) noexcept -> std::string_view {
    switch (type) {
        case frame_type::request: return "REQUEST";
        case frame_type::response: return "RESPONSE";
        case frame_type::error: return "ERROR";
        default: return "UNKNOWN";
    }
}

[[nodiscard]] constexpr auto to_string(command_id command) noexcept -> std::string_view {
    switch (command) {
        case command_id::exit: return "EXIT";
        case command_id::list: return "LIST";
        case command_id::file_range: return "FILE_RANGE";
        case command_id::file_count: return "FILE_COUNT";
        case command_id::file_name: return "FILE_NAME";
        case command_id::file_size: return "FILE_SIZE";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Status carried by ERROR frames (u32 payload)
 */
enum class response_status : uint32_t {
    ok = 0,
    file_not_found = 1,
    range_invalid = 2,
    io_error = 3,
    bad_request = 4,
};

[[nodiscard]] constexpr auto to_string(response_status status) noexcept -> std::string_view {
    switch (status) {
        case response_status::ok: return "OK";
        case response_status::file_not_found: return "FILE_NOT_FOUND";
        case response_status::range_invalid: return "RANGE_INVALID";
        case response_status::io_error: return "IO_ERROR";
        case response_status::bad_request: return "BAD_REQUEST";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Map a per-request error to the status reported to the peer
 */
[[nodiscard]] constexpr auto to_response_status(error_code code) noexcept -> response_status {
    switch (code) {
        case error_code::success: return response_status::ok;
        case error_code::index_out_of_range: return response_status::file_not_found;
        case error_code::range_invalid: return response_status::range_invalid;
        case error_code::io_error: return response_status::io_error;
        default: return response_status::bad_request;
    }
}

/**
 * @brief Revisioned set of wire constants
 *
 * The magic and the byte codes of frame types and commands are not
 * negotiated; both sides must be built against the same profile.
 */
struct wire_profile {
    std::string revision;
    std::array<std::byte, 4> magic{};
    std::array<uint8_t, frame_type_count> type_codes{};
    std::array<uint8_t, command_count> command_codes{};

    /**
     * @brief Profile of the DBI0 peer application
     *
     * Type code 2 is the peer's ACK and command code 1 its deprecated list
     * command; neither is used here.
     */
    [[nodiscard]] static auto standard() -> wire_profile;

    [[nodiscard]] auto code_of(frame_type type) const -> uint8_t {
        return type_codes[static_cast<std::size_t>(type)];
    }

    [[nodiscard]] auto code_of(command_id command) const -> uint8_t {
        return command_codes[static_cast<std::size_t>(command)];
    }

    [[nodiscard]] auto type_from_code(uint8_t code) const -> std::optional<frame_type>;
    [[nodiscard]] auto command_from_code(uint8_t code) const -> std::optional<command_id>;

    /**
     * @brief Check that codes are distinct within each group
     */
    [[nodiscard]] auto validate() const -> result<void>;
};

/**
 * @brief Protocol frame header (10 bytes)
 *
 * Frame layout:
 * - magic (4 bytes)
 * - type (1 byte)
 * - command_id (1 byte)
 * - payload_length (4 bytes, little-endian)
 * - payload (payload_length bytes)
 */
struct frame_header {
    frame_type type = frame_type::request;
    command_id command = command_id::exit;
    uint32_t payload_length = 0;

    static constexpr std::size_t size = 10;
};

/**
 * @brief Decoded frame
 */
struct frame {
    frame_header header;
    std::vector<std::byte> payload;
};

/**
 * @brief FILE_RANGE request payload (16 bytes)
 */
struct transfer_request {
    uint32_t file_index = 0;   // 4 bytes
    uint64_t offset = 0;       // 8 bytes
    uint32_t length = 0;       // 4 bytes

    static constexpr std::size_t serialized_size = 16;
};

/**
 * @brief Payload size of FILE_NAME / FILE_SIZE requests (u32 index)
 */
inline constexpr std::size_t index_payload_size = 4;

}  // namespace usb_responder

#endif  // USB_RESPONDER_CORE_PROTOCOL_TYPES_H
