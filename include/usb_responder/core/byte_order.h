/**
 * @file byte_order.h
 * @brief Little-endian load/store helpers for wire encoding
 */

#ifndef USB_RESPONDER_CORE_BYTE_ORDER_H
#define USB_RESPONDER_CORE_BYTE_ORDER_H

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>

namespace usb_responder {

/**
 * @brief Store an unsigned integer little-endian at the start of @p out
 *
 * @p out must hold at least sizeof(T) bytes.
 */
template <std::unsigned_integral T>
constexpr void store_le(std::span<std::byte> out, T value) noexcept {
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        out[i] = static_cast<std::byte>((value >> (8 * i)) & 0xFF);
    }
}

/**
 * @brief Load a little-endian unsigned integer from the start of @p in
 *
 * @p in must hold at least sizeof(T) bytes.
 */
template <std::unsigned_integral T>
[[nodiscard]] constexpr auto load_le(std::span<const std::byte> in) noexcept -> T {
    T value = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        value |= static_cast<T>(std::to_integer<T>(in[i]) << (8 * i));
    }
    return value;
}

}  // namespace usb_responder

#endif  // USB_RESPONDER_CORE_BYTE_ORDER_H
