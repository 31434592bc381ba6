/**
 * @file segment_config.h
 * @brief Configuration for segmented range streaming
 */

#ifndef USB_RESPONDER_CORE_SEGMENT_CONFIG_H
#define USB_RESPONDER_CORE_SEGMENT_CONFIG_H

#include <usb_responder/core/types.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace usb_responder {

/**
 * @brief Configuration for segment operations
 *
 * A segment is the payload of one RESPONSE frame of a FILE_RANGE stream.
 */
struct segment_config {
    /// Default segment size (1MB)
    static constexpr std::size_t default_segment_size = 1024 * 1024;

    /// Minimum allowed segment size (4KB)
    static constexpr std::size_t min_segment_size = 4 * 1024;

    /// Maximum allowed segment size (8MB)
    static constexpr std::size_t max_segment_size = 8 * 1024 * 1024;

    /// Segment size to use for streaming
    std::size_t segment_size = default_segment_size;

    segment_config() = default;

    explicit segment_config(std::size_t size) : segment_size(size) {}

    /**
     * @brief Validate configuration
     * @return Success if valid, error otherwise
     */
    [[nodiscard]] auto validate() const -> result<void> {
        if (segment_size < min_segment_size) {
            return unexpected(error{
                error_code::invalid_segment_size,
                "segment size too small (minimum: " + std::to_string(min_segment_size) + ")"});
        }
        if (segment_size > max_segment_size) {
            return unexpected(error{
                error_code::invalid_segment_size,
                "segment size too large (maximum: " + std::to_string(max_segment_size) + ")"});
        }
        return {};
    }

    /**
     * @brief Number of RESPONSE frames needed for a range
     *
     * A zero-length range still takes one (empty) frame.
     */
    [[nodiscard]] auto calculate_segment_count(uint64_t length) const -> uint64_t {
        if (length == 0) return 1;
        return (length + segment_size - 1) / segment_size;
    }
};

}  // namespace usb_responder

#endif  // USB_RESPONDER_CORE_SEGMENT_CONFIG_H
