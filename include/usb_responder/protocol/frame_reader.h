/**
 * @file frame_reader.h
 * @brief Buffered byte source over a transport connection
 */

#ifndef USB_RESPONDER_PROTOCOL_FRAME_READER_H
#define USB_RESPONDER_PROTOCOL_FRAME_READER_H

#include <usb_responder/core/frame_codec.h>
#include <usb_responder/transport/transport_interface.h>

#include <chrono>
#include <cstddef>
#include <span>
#include <vector>

namespace usb_responder {

/**
 * @brief Serves the codec's exact-length reads from transport receive batches
 *
 * The buffer belongs to one connection generation: reset() must be called
 * whenever the transport is re-opened so no stale bytes leak across
 * connections.
 *
 * Bytes of the frame being decoded stay buffered from begin_frame() until the
 * next begin_frame(), so a rejected frame can be rescanned by resynchronise().
 */
class frame_reader : public byte_source {
public:
    /// Default size requested from the transport per receive
    static constexpr std::size_t default_receive_window = 64 * 1024;

    explicit frame_reader(transport_interface& transport,
                          std::size_t receive_window = default_receive_window);

    /**
     * @brief Return exactly @p count bytes, receiving more as needed
     *
     * Uses the I/O timeout set by set_io_timeout(); transport errors are
     * returned unchanged.
     */
    [[nodiscard]] auto read_exact(std::size_t count)
        -> result<std::vector<std::byte>> override;

    /**
     * @brief Wait until at least one byte is buffered
     * @return true when data is available, false when @p timeout elapsed
     */
    [[nodiscard]] auto wait_for_data(std::chrono::milliseconds timeout) -> result<bool>;

    /**
     * @brief Mark the current position as the first byte of the next frame
     */
    void begin_frame();

    /**
     * @brief Move to the next candidate frame start after a rejected frame
     *
     * Rewinds to the rejected frame's first byte. A frame that starts with
     * @p magic is skipped as a whole header, anything else by one byte. The
     * buffered bytes are then scanned for @p magic; when none is found only
     * a trailing partial magic is kept. Buffered bytes after the match are
     * never dropped.
     *
     * @return Number of bytes skipped
     */
    auto resynchronise(std::span<const std::byte> magic, std::size_t header_size)
        -> std::size_t;

    /**
     * @brief Forget all state of the previous connection
     */
    void reset();

    void set_io_timeout(std::chrono::milliseconds timeout) { io_timeout_ = timeout; }

    [[nodiscard]] auto buffered() const -> std::size_t { return buffer_.size() - position_; }

private:
    auto fill(std::chrono::milliseconds timeout) -> result<void>;
    void compact();

    transport_interface& transport_;
    std::size_t receive_window_;
    std::chrono::milliseconds io_timeout_{0};
    std::vector<std::byte> buffer_;
    std::size_t position_ = 0;
    std::size_t frame_start_ = 0;
};

}  // namespace usb_responder

#endif  // USB_RESPONDER_PROTOCOL_FRAME_READER_H
