/**
 * @file usb_transport.h
 * @brief USB bulk transport implementation
 *
 * This file implements the transport_interface over libusb-1.0 bulk
 * endpoints of the peer device.
 */

#ifndef USB_RESPONDER_TRANSPORT_USB_TRANSPORT_H
#define USB_RESPONDER_TRANSPORT_USB_TRANSPORT_H

#include <memory>

#include "transport_interface.h"
#include "transport_config.h"

namespace usb_responder {

/**
 * @brief USB bulk transport implementation
 *
 * Looks the device up by vendor/product id, optionally resets it, selects
 * the configuration, claims the interface and uses its first bulk IN and
 * bulk OUT endpoints.
 *
 * @code
 * auto config = transport_config_builder::usb()
 *     .with_device(0x057E, 0x3000)
 *     .build_usb();
 *
 * auto transport = usb_transport::create(config);
 * if (transport) {
 *     auto result = transport->connect();
 *     if (!result.has_value() &&
 *         result.error().code == error_code::device_not_found) {
 *         // Peer not plugged in yet
 *     }
 * }
 * @endcode
 */
class usb_transport : public transport_interface {
public:
    /**
     * @brief Create a USB transport instance
     * @param config USB configuration
     * @return Transport instance or nullptr when libusb cannot be initialized
     */
    [[nodiscard]] static auto create(const usb_transport_config& config = {})
        -> std::unique_ptr<usb_transport>;

    ~usb_transport() override;

    // Non-copyable
    usb_transport(const usb_transport&) = delete;
    auto operator=(const usb_transport&) -> usb_transport& = delete;

    // Movable
    usb_transport(usb_transport&&) noexcept;
    auto operator=(usb_transport&&) noexcept -> usb_transport&;

    // ========================================================================
    // transport_interface implementation
    // ========================================================================

    [[nodiscard]] auto type() const -> std::string_view override;

    // Connection Management
    [[nodiscard]] auto connect() -> result<void> override;
    void close() override;
    [[nodiscard]] auto is_connected() const -> bool override;
    [[nodiscard]] auto state() const -> transport_state override;

    // Data Transfer
    [[nodiscard]] auto send(std::span<const std::byte> data) -> result<void> override;
    [[nodiscard]] auto receive(std::size_t max_bytes, std::chrono::milliseconds timeout)
        -> result<std::vector<std::byte>> override;

    // Statistics and Information
    [[nodiscard]] auto get_statistics() const -> transport_statistics override;
    [[nodiscard]] auto config() const -> const transport_config& override;

private:
    struct impl;

    explicit usb_transport(std::unique_ptr<impl> pimpl);

    std::unique_ptr<impl> impl_;
};

}  // namespace usb_responder

#endif  // USB_RESPONDER_TRANSPORT_USB_TRANSPORT_H
