/**
 * @file transport_interface.h
 * @brief Transport abstraction layer interface
 *
 * This file defines the byte channel between the host and the peer device.
 * The session controller and dispatcher only ever see this interface.
 */

#ifndef USB_RESPONDER_TRANSPORT_TRANSPORT_INTERFACE_H
#define USB_RESPONDER_TRANSPORT_TRANSPORT_INTERFACE_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "usb_responder/core/types.h"
#include "transport_config.h"

namespace usb_responder {

/**
 * @brief Transport state enumeration
 */
enum class transport_state {
    disconnected,   ///< Not connected
    connecting,     ///< Connection in progress
    connected,      ///< Connected and ready
    error           ///< Connection lost or failed
};

/**
 * @brief Convert transport_state to string
 */
[[nodiscard]] constexpr auto to_string(transport_state state) -> const char* {
    switch (state) {
        case transport_state::disconnected: return "disconnected";
        case transport_state::connecting: return "connecting";
        case transport_state::connected: return "connected";
        case transport_state::error: return "error";
        default: return "unknown";
    }
}

/**
 * @brief Transport statistics
 */
struct transport_statistics {
    uint64_t bytes_sent = 0;           ///< Total bytes sent
    uint64_t bytes_received = 0;       ///< Total bytes received
    uint64_t packets_sent = 0;         ///< Total send calls completed
    uint64_t packets_received = 0;     ///< Total receive calls that returned data
    uint64_t errors = 0;               ///< Total errors
    uint64_t connects = 0;             ///< Successful connect() calls
    std::chrono::steady_clock::time_point connected_at;  ///< Last connection time
};

/**
 * @brief Transport interface base class
 *
 * Blocking byte channel with connection-loss reporting. Errors:
 * - connect(): device_not_found, connect_failed
 * - send() / receive(): connection_lost, connection_timeout, not_connected
 *
 * A receive() that times out reports connection_timeout; callers that only
 * poll for data pass a short timeout and treat that code as "no data yet".
 *
 * @code
 * auto transport = usb_transport::create(usb_transport_config{});
 * if (transport && transport->connect().has_value()) {
 *     auto data = transport->receive(512, std::chrono::milliseconds{100});
 * }
 * @endcode
 */
class transport_interface {
public:
    virtual ~transport_interface() = default;

    // Non-copyable
    transport_interface(const transport_interface&) = delete;
    auto operator=(const transport_interface&) -> transport_interface& = delete;

    // Movable
    transport_interface(transport_interface&&) noexcept = default;
    auto operator=(transport_interface&&) noexcept -> transport_interface& = default;

    /**
     * @brief Get the transport type identifier
     * @return Transport type string (e.g., "usb")
     */
    [[nodiscard]] virtual auto type() const -> std::string_view = 0;

    // ========================================================================
    // Connection Management
    // ========================================================================

    /**
     * @brief Open the channel to the peer
     *
     * Calling connect() on a connected transport closes and re-opens it.
     */
    [[nodiscard]] virtual auto connect() -> result<void> = 0;

    /**
     * @brief Close the channel; safe to call when not connected
     */
    virtual void close() = 0;

    [[nodiscard]] virtual auto is_connected() const -> bool = 0;

    [[nodiscard]] virtual auto state() const -> transport_state = 0;

    // ========================================================================
    // Data Transfer
    // ========================================================================

    /**
     * @brief Send all of @p data
     */
    [[nodiscard]] virtual auto send(std::span<const std::byte> data) -> result<void> = 0;

    /**
     * @brief Receive up to @p max_bytes
     * @param timeout Wait bound (0 = no timeout)
     * @return Non-empty data of at most @p max_bytes, or an error
     */
    [[nodiscard]] virtual auto receive(std::size_t max_bytes,
                                       std::chrono::milliseconds timeout)
        -> result<std::vector<std::byte>> = 0;

    // ========================================================================
    // Statistics and Information
    // ========================================================================

    [[nodiscard]] virtual auto get_statistics() const -> transport_statistics = 0;

    [[nodiscard]] virtual auto config() const -> const transport_config& = 0;

protected:
    transport_interface() = default;
};

}  // namespace usb_responder

#endif  // USB_RESPONDER_TRANSPORT_TRANSPORT_INTERFACE_H
