/**
 * @file frame_codec.cpp
 * @brief Implementation of frame encoding and decoding
 */

#include <usb_responder/core/frame_codec.h>

#include <usb_responder/core/byte_order.h>

#include <algorithm>
#include <cstring>

namespace usb_responder {

// memory_byte_source implementation

auto memory_byte_source::read_exact(std::size_t count) -> result<std::vector<std::byte>> {
    if (count > remaining()) {
        position_ = data_.size();
        return unexpected(error{error_code::end_of_stream,
                                "need " + std::to_string(count) + " bytes"});
    }

    auto first = data_.begin() + static_cast<std::ptrdiff_t>(position_);
    std::vector<std::byte> out(first, first + static_cast<std::ptrdiff_t>(count));
    position_ += count;
    return out;
}

// frame_codec implementation

frame_codec::frame_codec() : frame_codec(wire_profile::standard()) {}

frame_codec::frame_codec(wire_profile profile, uint32_t max_payload)
    : profile_(std::move(profile)), max_payload_(max_payload) {}

auto frame_codec::encode_header(frame_type type, command_id command,
                                uint32_t payload_length) const
    -> std::array<std::byte, frame_header::size> {
    std::array<std::byte, frame_header::size> header{};
    std::copy(profile_.magic.begin(), profile_.magic.end(), header.begin());
    header[4] = static_cast<std::byte>(profile_.code_of(type));
    header[5] = static_cast<std::byte>(profile_.code_of(command));
    store_le<uint32_t>(std::span<std::byte>(header).subspan(6), payload_length);
    return header;
}

auto frame_codec::encode(frame_type type, command_id command,
                         std::span<const std::byte> payload) const
    -> std::vector<std::byte> {
    std::vector<std::byte> out;
    encode_into(out, type, command, payload);
    return out;
}

void frame_codec::encode_into(std::vector<std::byte>& out, frame_type type,
                              command_id command,
                              std::span<const std::byte> payload) const {
    auto header = encode_header(type, command, static_cast<uint32_t>(payload.size()));
    out.resize(frame_header::size + payload.size());
    std::copy(header.begin(), header.end(), out.begin());
    if (!payload.empty()) {
        std::memcpy(out.data() + frame_header::size, payload.data(), payload.size());
    }
}

auto frame_codec::decode(byte_source& source) const -> result<frame> {
    auto header_bytes = source.read_exact(frame_header::size);
    if (!header_bytes) {
        if (header_bytes.error().code == error_code::end_of_stream) {
            return unexpected(error{error_code::malformed_frame, "truncated frame header"});
        }
        return unexpected(header_bytes.error());
    }

    std::span<const std::byte> raw(header_bytes.value());
    if (!std::equal(profile_.magic.begin(), profile_.magic.end(), raw.begin())) {
        return unexpected(error{error_code::malformed_frame, "bad magic"});
    }

    const auto type_code = std::to_integer<uint8_t>(raw[4]);
    const auto command_code = std::to_integer<uint8_t>(raw[5]);
    const auto payload_length = load_le<uint32_t>(raw.subspan(6));

    if (payload_length > max_payload_) {
        return unexpected(error{error_code::malformed_frame,
                                "payload length " + std::to_string(payload_length) +
                                " exceeds maximum " + std::to_string(max_payload_)});
    }

    frame decoded;
    decoded.header.payload_length = payload_length;

    if (payload_length > 0) {
        auto payload = source.read_exact(payload_length);
        if (!payload) {
            if (payload.error().code == error_code::end_of_stream) {
                return unexpected(error{error_code::malformed_frame, "truncated payload"});
            }
            return unexpected(payload.error());
        }
        decoded.payload = std::move(payload.value());
    }

    auto type = profile_.type_from_code(type_code);
    if (!type) {
        return unexpected(error{error_code::unknown_command,
                                "unknown frame type code " + std::to_string(type_code)});
    }
    auto command = profile_.command_from_code(command_code);
    if (!command) {
        return unexpected(error{error_code::unknown_command,
                                "unknown command code " + std::to_string(command_code)});
    }

    decoded.header.type = *type;
    decoded.header.command = *command;
    return decoded;
}

// Payload helpers

auto frame_codec::encode_u32(uint32_t value) -> std::vector<std::byte> {
    std::vector<std::byte> out(sizeof(uint32_t));
    store_le<uint32_t>(out, value);
    return out;
}

auto frame_codec::encode_u64(uint64_t value) -> std::vector<std::byte> {
    std::vector<std::byte> out(sizeof(uint64_t));
    store_le<uint64_t>(out, value);
    return out;
}

auto frame_codec::encode_status(response_status status) -> std::vector<std::byte> {
    return encode_u32(static_cast<uint32_t>(status));
}

auto frame_codec::encode_text(std::string_view text) -> std::vector<std::byte> {
    std::vector<std::byte> out(text.size());
    if (!text.empty()) {
        std::memcpy(out.data(), text.data(), text.size());
    }
    return out;
}

auto frame_codec::encode_transfer_request(const transfer_request& request)
    -> std::vector<std::byte> {
    std::vector<std::byte> out(transfer_request::serialized_size);
    std::span<std::byte> view(out);
    store_le<uint32_t>(view, request.file_index);
    store_le<uint64_t>(view.subspan(4), request.offset);
    store_le<uint32_t>(view.subspan(12), request.length);
    return out;
}

auto frame_codec::decode_u32(std::span<const std::byte> payload) -> result<uint32_t> {
    if (payload.size() != sizeof(uint32_t)) {
        return unexpected(error{error_code::invalid_payload,
                                "expected 4-byte payload, got " +
                                std::to_string(payload.size())});
    }
    return load_le<uint32_t>(payload);
}

auto frame_codec::decode_u64(std::span<const std::byte> payload) -> result<uint64_t> {
    if (payload.size() != sizeof(uint64_t)) {
        return unexpected(error{error_code::invalid_payload,
                                "expected 8-byte payload, got " +
                                std::to_string(payload.size())});
    }
    return load_le<uint64_t>(payload);
}

auto frame_codec::decode_transfer_request(std::span<const std::byte> payload)
    -> result<transfer_request> {
    if (payload.size() != transfer_request::serialized_size) {
        return unexpected(error{error_code::invalid_payload,
                                "expected 16-byte range payload, got " +
                                std::to_string(payload.size())});
    }

    transfer_request request;
    request.file_index = load_le<uint32_t>(payload);
    request.offset = load_le<uint64_t>(payload.subspan(4));
    request.length = load_le<uint32_t>(payload.subspan(12));
    return request;
}

}  // namespace usb_responder
