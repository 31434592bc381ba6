/**
 * @file frame_codec.h
 * @brief Encoding and decoding of protocol frames
 */

#ifndef USB_RESPONDER_CORE_FRAME_CODEC_H
#define USB_RESPONDER_CORE_FRAME_CODEC_H

#include <usb_responder/core/protocol_types.h>
#include <usb_responder/core/types.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace usb_responder {

/**
 * @brief Source of bytes consumed by frame_codec::decode
 *
 * read_exact() either returns exactly @p count bytes or fails. A source that
 * runs dry reports error_code::end_of_stream; transport-backed sources
 * report transport errors instead.
 */
class byte_source {
public:
    virtual ~byte_source() = default;

    [[nodiscard]] virtual auto read_exact(std::size_t count)
        -> result<std::vector<std::byte>> = 0;
};

/**
 * @brief byte_source over an in-memory buffer
 */
class memory_byte_source : public byte_source {
public:
    explicit memory_byte_source(std::span<const std::byte> data) : data_(data) {}

    [[nodiscard]] auto read_exact(std::size_t count)
        -> result<std::vector<std::byte>> override;

    [[nodiscard]] auto remaining() const -> std::size_t { return data_.size() - position_; }

private:
    std::span<const std::byte> data_;
    std::size_t position_ = 0;
};

/**
 * @brief Encodes and decodes frames for one wire profile
 *
 * @code
 * frame_codec codec;
 * auto bytes = codec.encode(frame_type::response, command_id::file_count,
 *                           frame_codec::encode_u32(3));
 *
 * memory_byte_source source(bytes);
 * auto decoded = codec.decode(source);
 * @endcode
 */
class frame_codec {
public:
    /// Default bound on incoming payloads (64KB)
    static constexpr uint32_t default_max_payload = 64 * 1024;

    frame_codec();
    explicit frame_codec(wire_profile profile, uint32_t max_payload = default_max_payload);

    /**
     * @brief Encode a header
     */
    [[nodiscard]] auto encode_header(frame_type type, command_id command,
                                     uint32_t payload_length) const
        -> std::array<std::byte, frame_header::size>;

    /**
     * @brief Encode header and payload into one contiguous buffer
     */
    [[nodiscard]] auto encode(frame_type type, command_id command,
                              std::span<const std::byte> payload = {}) const
        -> std::vector<std::byte>;

    /**
     * @brief Encode into a caller-owned buffer, reusing its capacity
     */
    void encode_into(std::vector<std::byte>& out, frame_type type, command_id command,
                     std::span<const std::byte> payload) const;

    /**
     * @brief Decode one frame from @p source
     *
     * Reads the header, then exactly payload_length bytes.
     * - bad magic or oversized payload: malformed_frame, payload not read
     * - source exhausted early: malformed_frame
     * - unknown type or command code: unknown_command, payload consumed
     * - transport failures of the source are passed through
     */
    [[nodiscard]] auto decode(byte_source& source) const -> result<frame>;

    [[nodiscard]] auto profile() const -> const wire_profile& { return profile_; }
    [[nodiscard]] auto max_payload() const -> uint32_t { return max_payload_; }

    // Payload helpers

    [[nodiscard]] static auto encode_u32(uint32_t value) -> std::vector<std::byte>;
    [[nodiscard]] static auto encode_u64(uint64_t value) -> std::vector<std::byte>;
    [[nodiscard]] static auto encode_status(response_status status) -> std::vector<std::byte>;
    [[nodiscard]] static auto encode_text(std::string_view text) -> std::vector<std::byte>;
    [[nodiscard]] static auto encode_transfer_request(const transfer_request& request)
        -> std::vector<std::byte>;

    [[nodiscard]] static auto decode_u32(std::span<const std::byte> payload) -> result<uint32_t>;
    [[nodiscard]] static auto decode_u64(std::span<const std::byte> payload) -> result<uint64_t>;
    [[nodiscard]] static auto decode_transfer_request(std::span<const std::byte> payload)
        -> result<transfer_request>;

private:
    wire_profile profile_;
    uint32_t max_payload_;
};

}  // namespace usb_responder

#endif  // USB_RESPONDER_CORE_FRAME_CODEC_H
