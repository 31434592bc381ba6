/**
 * @file transfer_engine.h
 * @brief Segmented streaming of a file range to the peer
 */

#ifndef USB_RESPONDER_CORE_TRANSFER_ENGINE_H
#define USB_RESPONDER_CORE_TRANSFER_ENGINE_H

#include <usb_responder/core/cancellation_token.h>
#include <usb_responder/core/file_catalog.h>
#include <usb_responder/core/frame_codec.h>
#include <usb_responder/core/progress_aggregator.h>
#include <usb_responder/core/segment_config.h>
#include <usb_responder/transport/transport_interface.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace usb_responder {

/**
 * @brief Result of one streamed range
 */
struct transfer_outcome {
    uint64_t bytes_sent = 0;     ///< Payload bytes acknowledged by the transport
    uint64_t frames_sent = 0;
    bool cancelled = false;      ///< Stopped between segments on cancellation
};

using progress_callback = std::function<void(const progress_event&)>;

/**
 * @brief Streams a byte range as a sequence of RESPONSE frames
 *
 * Each segment is read completely, then header and payload go out in a
 * single send from one reused buffer. A progress event follows every
 * successful send and is the only source of progress. Cancellation is
 * checked between segments, never inside one.
 *
 * Errors:
 * - io_error from the reader, after zero or more segments were sent
 * - transport errors from send(), unchanged
 */
class transfer_engine {
public:
    transfer_engine(const frame_codec& codec, segment_config config = {});

    [[nodiscard]] auto stream(const transfer_request& request, range_reader& reader,
                              transport_interface& transport,
                              const cancellation_token& token,
                              const progress_callback& on_progress) -> result<transfer_outcome>;

    [[nodiscard]] auto config() const -> const segment_config& { return config_; }

private:
    const frame_codec& codec_;
    segment_config config_;
    std::vector<std::byte> buffer_;
};

}  // namespace usb_responder

#endif  // USB_RESPONDER_CORE_TRANSFER_ENGINE_H
