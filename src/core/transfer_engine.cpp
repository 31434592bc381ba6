/**
 * @file transfer_engine.cpp
 * @brief Implementation of segmented range streaming
 */

#include <usb_responder/core/transfer_engine.h>
#include <usb_responder/core/logging.h>

#include <algorithm>
#include <cstring>

namespace usb_responder {

transfer_engine::transfer_engine(const frame_codec& codec, segment_config config)
    : codec_(codec), config_(config) {}

auto transfer_engine::stream(const transfer_request& request, range_reader& reader,
                             transport_interface& transport,
                             const cancellation_token& token,
                             const progress_callback& on_progress) -> result<transfer_outcome> {
    transfer_outcome outcome;
    uint64_t remaining = request.length;
    uint64_t offset = request.offset;

    do {
        if (outcome.frames_sent > 0 && token.is_cancelled()) {
            outcome.cancelled = true;
            UR_LOG_DEBUG(log_category::transfer,
                "Range stream cancelled after " + std::to_string(outcome.bytes_sent) + " bytes");
            return outcome;
        }

        const auto segment = static_cast<std::size_t>(
            std::min<uint64_t>(remaining, config_.segment_size));

        buffer_.resize(frame_header::size + segment);
        auto payload = std::span<std::byte>(buffer_).subspan(frame_header::size);

        if (segment > 0) {
            auto read = reader.read(payload);
            if (!read.has_value()) {
                return unexpected(read.error());
            }
        }

        auto header = codec_.encode_header(frame_type::response, command_id::file_range,
                                           static_cast<uint32_t>(segment));
        std::memcpy(buffer_.data(), header.data(), header.size());

        auto sent = transport.send(buffer_);
        if (!sent.has_value()) {
            return unexpected(sent.error());
        }

        outcome.frames_sent++;
        outcome.bytes_sent += segment;

        if (on_progress) {
            on_progress(progress_event{request.file_index, offset, segment});
        }

        offset += segment;
        remaining -= segment;
    } while (remaining > 0);

    return outcome;
}

}  // namespace usb_responder
