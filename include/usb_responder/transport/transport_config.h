/**
 * @file transport_config.h
 * @brief Transport configuration types
 *
 * This file defines configuration structures for transport implementations.
 */

#ifndef USB_RESPONDER_TRANSPORT_TRANSPORT_CONFIG_H
#define USB_RESPONDER_TRANSPORT_TRANSPORT_CONFIG_H

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace usb_responder {

/**
 * @brief Transport type enumeration
 */
enum class transport_type {
    usb,     ///< libusb bulk transport
    custom   ///< Any other implementation (loopback, test doubles)
};

/**
 * @brief Convert transport_type to string
 */
[[nodiscard]] constexpr auto to_string(transport_type type) -> const char* {
    switch (type) {
        case transport_type::usb: return "usb";
        case transport_type::custom: return "custom";
        default: return "unknown";
    }
}

/**
 * @brief Base transport configuration
 */
struct transport_config {
    transport_type type = transport_type::custom;

    /// Read timeout used when receive() is given none (0 = no timeout)
    std::chrono::milliseconds read_timeout{0};

    /// Write timeout (0 = no timeout)
    std::chrono::milliseconds write_timeout{0};

    /// Size of a single bulk read request
    std::size_t receive_buffer_size = 64 * 1024;

    virtual ~transport_config() = default;
};

/**
 * @brief USB-specific transport configuration
 */
struct usb_transport_config : transport_config {
    usb_transport_config() {
        type = transport_type::usb;
    }

    /// Vendor id of the peer device
    uint16_t vendor_id = 0x057E;

    /// Product id of the peer device
    uint16_t product_id = 0x3000;

    /// Interface carrying the bulk endpoints
    int interface_number = 0;

    /// Configuration value selected after reset (-1 = leave as is)
    int configuration_value = 1;

    /// Reset the device before claiming the interface
    bool reset_on_connect = true;

    /// Detach a kernel driver bound to the interface, if any
    bool detach_kernel_driver = true;
};

/**
 * @brief Size of one bulk IN request
 *
 * Bulk IN requests must be whole packets or the device may overflow them.
 * The request is the smaller of @p max_bytes and @p buffer_size, rounded down
 * to whole packets, and never less than one packet.
 */
[[nodiscard]] constexpr auto bulk_read_size(std::size_t max_bytes, std::size_t buffer_size,
                                            std::size_t packet_size) -> std::size_t {
    const std::size_t packet = packet_size == 0 ? 1 : packet_size;
    const std::size_t wanted = max_bytes < buffer_size ? max_bytes : buffer_size;
    const std::size_t packets = wanted / packet;
    return (packets == 0 ? 1 : packets) * packet;
}

/**
 * @brief Transport configuration builder
 *
 * @code
 * auto config = transport_config_builder::usb()
 *     .with_device(0x057E, 0x3000)
 *     .with_read_timeout(std::chrono::milliseconds{5000})
 *     .build_usb();
 * @endcode
 */
class transport_config_builder {
public:
    /**
     * @brief Start building USB configuration
     */
    static auto usb() -> transport_config_builder {
        return transport_config_builder{};
    }

    // Common options
    auto with_read_timeout(std::chrono::milliseconds timeout) -> transport_config_builder& {
        usb_config_.read_timeout = timeout;
        return *this;
    }

    auto with_write_timeout(std::chrono::milliseconds timeout) -> transport_config_builder& {
        usb_config_.write_timeout = timeout;
        return *this;
    }

    auto with_receive_buffer_size(std::size_t size) -> transport_config_builder& {
        usb_config_.receive_buffer_size = size;
        return *this;
    }

    // USB-specific options
    auto with_device(uint16_t vendor_id, uint16_t product_id) -> transport_config_builder& {
        usb_config_.vendor_id = vendor_id;
        usb_config_.product_id = product_id;
        return *this;
    }

    auto with_interface(int interface_number) -> transport_config_builder& {
        usb_config_.interface_number = interface_number;
        return *this;
    }

    auto with_configuration(int configuration_value) -> transport_config_builder& {
        usb_config_.configuration_value = configuration_value;
        return *this;
    }

    auto with_reset_on_connect(bool enable) -> transport_config_builder& {
        usb_config_.reset_on_connect = enable;
        return *this;
    }

    auto with_kernel_driver_detach(bool enable) -> transport_config_builder& {
        usb_config_.detach_kernel_driver = enable;
        return *this;
    }

    /**
     * @brief Build USB configuration
     * @return USB transport configuration
     */
    [[nodiscard]] auto build_usb() const -> usb_transport_config {
        return usb_config_;
    }

private:
    transport_config_builder() = default;

    usb_transport_config usb_config_;
};

}  // namespace usb_responder

#endif  // USB_RESPONDER_TRANSPORT_TRANSPORT_CONFIG_H
