/**
 * @file usb_transport.cpp
 * @brief USB bulk transport implementation
 */

#include "usb_responder/transport/usb_transport.h"
#include "usb_responder/core/logging.h"

#include <libusb.h>

#include <algorithm>
#include <atomic>
#include <limits>
#include <optional>
#include <string>

namespace usb_responder {

namespace {

auto libusb_message(int rc) -> std::string {
    return std::string(libusb_error_name(rc)) + " (" + std::to_string(rc) + ")";
}

/**
 * @brief Map a libusb transfer status to the transport taxonomy
 */
auto map_transfer_error(int rc, const char* operation) -> error {
    const auto what = std::string(operation) + " failed: " + libusb_message(rc);
    switch (rc) {
        case LIBUSB_ERROR_TIMEOUT:
            return error{error_code::connection_timeout, what};
        default:
            // NO_DEVICE, PIPE, IO, OVERFLOW and the rest end the connection
            return error{error_code::connection_lost, what};
    }
}

auto to_libusb_timeout(std::chrono::milliseconds timeout) -> unsigned int {
    if (timeout.count() <= 0) {
        return 0;  // libusb: no timeout
    }
    return static_cast<unsigned int>(std::min<int64_t>(
        timeout.count(), std::numeric_limits<unsigned int>::max()));
}

}  // namespace

struct usb_transport::impl {
    usb_transport_config config;
    std::atomic<transport_state> current_state{transport_state::disconnected};

    libusb_context* context = nullptr;
    libusb_device_handle* handle = nullptr;
    bool interface_claimed = false;
    uint8_t endpoint_in = 0;
    uint8_t endpoint_out = 0;
    uint16_t max_packet_in = 512;

    transport_statistics stats;

    /// Bytes of a packet-sized read beyond what the caller asked for
    std::vector<std::byte> pending;

    explicit impl(usb_transport_config cfg) : config(std::move(cfg)) {}

    ~impl() {
        release();
        if (context != nullptr) {
            libusb_exit(context);
        }
    }

    impl(const impl&) = delete;
    auto operator=(const impl&) -> impl& = delete;

    void set_state(transport_state new_state) {
        auto old_state = current_state.exchange(new_state);
        if (old_state != new_state) {
            UR_LOG_DEBUG(log_category::transport,
                "USB transport state changed: " +
                std::string(to_string(old_state)) + " -> " +
                std::string(to_string(new_state)));
        }
    }

    auto take_pending(std::size_t max_bytes) -> std::vector<std::byte> {
        const auto count = static_cast<std::ptrdiff_t>(std::min(max_bytes, pending.size()));
        std::vector<std::byte> out(pending.begin(), pending.begin() + count);
        pending.erase(pending.begin(), pending.begin() + count);
        return out;
    }

    void release() {
        pending.clear();
        if (handle == nullptr) {
            return;
        }
        if (interface_claimed) {
            int rc = libusb_release_interface(handle, config.interface_number);
            if (rc != LIBUSB_SUCCESS && rc != LIBUSB_ERROR_NO_DEVICE) {
                UR_LOG_DEBUG(log_category::transport,
                    "Release interface failed: " + libusb_message(rc));
            }
            interface_claimed = false;
        }
        libusb_close(handle);
        handle = nullptr;
    }

    /**
     * @brief Locate the first bulk IN and bulk OUT endpoints of the interface
     */
    auto find_endpoints() -> result<void> {
        libusb_config_descriptor* descriptor = nullptr;
        int rc = libusb_get_active_config_descriptor(libusb_get_device(handle), &descriptor);
        if (rc != LIBUSB_SUCCESS) {
            return unexpected(error{error_code::connect_failed,
                "Cannot read configuration descriptor: " + libusb_message(rc)});
        }

        std::optional<uint8_t> in;
        std::optional<uint8_t> out;
        for (int i = 0; i < descriptor->bNumInterfaces; ++i) {
            const auto& iface = descriptor->interface[i];
            for (int alt = 0; alt < iface.num_altsetting; ++alt) {
                const auto& setting = iface.altsetting[alt];
                if (setting.bInterfaceNumber != config.interface_number) {
                    continue;
                }
                for (int e = 0; e < setting.bNumEndpoints; ++e) {
                    const auto& ep = setting.endpoint[e];
                    if ((ep.bmAttributes & LIBUSB_TRANSFER_TYPE_MASK) !=
                        LIBUSB_TRANSFER_TYPE_BULK) {
                        continue;
                    }
                    if ((ep.bEndpointAddress & LIBUSB_ENDPOINT_DIR_MASK) == LIBUSB_ENDPOINT_IN) {
                        if (!in) {
                            in = ep.bEndpointAddress;
                            max_packet_in = ep.wMaxPacketSize;
                        }
                    } else if (!out) {
                        out = ep.bEndpointAddress;
                    }
                }
            }
        }
        libusb_free_config_descriptor(descriptor);

        if (!in || !out) {
            return unexpected(error{error_code::connect_failed,
                "Interface " + std::to_string(config.interface_number) +
                " has no bulk IN/OUT endpoint pair"});
        }

        endpoint_in = *in;
        endpoint_out = *out;
        return {};
    }

    auto open() -> result<void> {
        handle = libusb_open_device_with_vid_pid(context, config.vendor_id, config.product_id);
        if (handle == nullptr) {
            return unexpected(error{error_code::device_not_found,
                "No device " + to_hex(config.vendor_id) + ":" + to_hex(config.product_id)});
        }

        if (config.reset_on_connect) {
            int rc = libusb_reset_device(handle);
            if (rc == LIBUSB_ERROR_NOT_FOUND) {
                // Device re-enumerated; the handle is stale
                release();
                return unexpected(error{error_code::device_not_found,
                    "Device re-enumerated during reset"});
            }
            if (rc != LIBUSB_SUCCESS) {
                return unexpected(error{error_code::connect_failed,
                    "Device reset failed: " + libusb_message(rc)});
            }
        }

        if (config.detach_kernel_driver) {
            // Not supported on every platform; failure is not fatal
            int rc = libusb_set_auto_detach_kernel_driver(handle, 1);
            if (rc != LIBUSB_SUCCESS && rc != LIBUSB_ERROR_NOT_SUPPORTED) {
                UR_LOG_DEBUG(log_category::transport,
                    "Auto detach not available: " + libusb_message(rc));
            }
        }

        if (config.configuration_value >= 0) {
            int rc = libusb_set_configuration(handle, config.configuration_value);
            if (rc != LIBUSB_SUCCESS && rc != LIBUSB_ERROR_BUSY) {
                return unexpected(error{error_code::connect_failed,
                    "Set configuration " + std::to_string(config.configuration_value) +
                    " failed: " + libusb_message(rc)});
            }
        }

        int rc = libusb_claim_interface(handle, config.interface_number);
        if (rc != LIBUSB_SUCCESS) {
            return unexpected(error{error_code::connect_failed,
                "Claim interface " + std::to_string(config.interface_number) +
                " failed: " + libusb_message(rc)});
        }
        interface_claimed = true;

        return find_endpoints();
    }

    static auto to_hex(uint16_t value) -> std::string {
        static constexpr char digits[] = "0123456789abcdef";
        std::string out = "0x0000";
        for (int i = 0; i < 4; ++i) {
            out[5 - i] = digits[(value >> (4 * i)) & 0xF];
        }
        return out;
    }
};

usb_transport::usb_transport(std::unique_ptr<impl> pimpl)
    : impl_(std::move(pimpl)) {
    get_logger().initialize();
    UR_LOG_DEBUG(log_category::transport, "USB transport created");
}

usb_transport::~usb_transport() {
    if (impl_) {
        close();
    }
}

usb_transport::usb_transport(usb_transport&&) noexcept = default;
auto usb_transport::operator=(usb_transport&&) noexcept -> usb_transport& = default;

auto usb_transport::create(const usb_transport_config& config)
    -> std::unique_ptr<usb_transport> {
    auto pimpl = std::make_unique<impl>(config);
    int rc = libusb_init(&pimpl->context);
    if (rc != LIBUSB_SUCCESS) {
        pimpl->context = nullptr;
        UR_LOG_ERROR(log_category::transport, "libusb_init failed: " + libusb_message(rc));
        return nullptr;
    }
    return std::unique_ptr<usb_transport>(new usb_transport(std::move(pimpl)));
}

auto usb_transport::type() const -> std::string_view {
    return "usb";
}

auto usb_transport::connect() -> result<void> {
    if (impl_->handle != nullptr) {
        close();
    }

    impl_->set_state(transport_state::connecting);

    auto opened = impl_->open();
    if (!opened.has_value()) {
        impl_->release();
        impl_->stats.errors++;
        impl_->set_state(opened.error().code == error_code::device_not_found
                             ? transport_state::disconnected
                             : transport_state::error);
        return opened;
    }

    impl_->stats.connects++;
    impl_->stats.connected_at = std::chrono::steady_clock::now();
    impl_->set_state(transport_state::connected);

    UR_LOG_INFO(log_category::transport,
        "Connected to " + impl::to_hex(impl_->config.vendor_id) + ":" +
        impl::to_hex(impl_->config.product_id) + " (in " +
        impl::to_hex(impl_->endpoint_in) + ", out " +
        impl::to_hex(impl_->endpoint_out) + ")");
    return {};
}

void usb_transport::close() {
    if (impl_->handle == nullptr) {
        impl_->set_state(transport_state::disconnected);
        return;
    }
    impl_->release();
    impl_->set_state(transport_state::disconnected);
    UR_LOG_DEBUG(log_category::transport, "USB transport closed");
}

auto usb_transport::is_connected() const -> bool {
    return impl_->current_state == transport_state::connected;
}

auto usb_transport::state() const -> transport_state {
    return impl_->current_state;
}

auto usb_transport::send(std::span<const std::byte> data) -> result<void> {
    if (!is_connected()) {
        return unexpected(error{error_code::not_connected, "USB transport is not connected"});
    }

    const auto timeout = to_libusb_timeout(impl_->config.write_timeout);
    std::size_t offset = 0;

    // A zero-length frame still needs one (empty) bulk transfer
    do {
        const auto slice = std::min<std::size_t>(
            data.size() - offset, static_cast<std::size_t>(std::numeric_limits<int>::max()));
        int transferred = 0;
        auto* ptr = const_cast<unsigned char*>(
            reinterpret_cast<const unsigned char*>(data.data() + offset));
        int rc = libusb_bulk_transfer(impl_->handle, impl_->endpoint_out, ptr,
                                      static_cast<int>(slice), &transferred, timeout);
        if (transferred > 0) {
            offset += static_cast<std::size_t>(transferred);
            impl_->stats.bytes_sent += static_cast<uint64_t>(transferred);
        }
        if (rc != LIBUSB_SUCCESS) {
            impl_->stats.errors++;
            auto err = map_transfer_error(rc, "Bulk write");
            if (err.code == error_code::connection_lost) {
                impl_->set_state(transport_state::error);
            }
            return unexpected(std::move(err));
        }
    } while (offset < data.size());

    impl_->stats.packets_sent++;
    return {};
}

auto usb_transport::receive(std::size_t max_bytes, std::chrono::milliseconds timeout)
    -> result<std::vector<std::byte>> {
    if (!is_connected()) {
        return unexpected(error{error_code::not_connected, "USB transport is not connected"});
    }

    const std::size_t limit = std::max<std::size_t>(max_bytes, 1);
    if (!impl_->pending.empty()) {
        return impl_->take_pending(limit);
    }

    std::size_t request = bulk_read_size(limit, impl_->config.receive_buffer_size,
                                         impl_->max_packet_in);
    request = std::min<std::size_t>(request, static_cast<std::size_t>(std::numeric_limits<int>::max()));

    std::vector<std::byte> buffer(request);
    const auto effective_timeout = timeout.count() > 0 ? timeout : impl_->config.read_timeout;

    for (;;) {
        int transferred = 0;
        int rc = libusb_bulk_transfer(impl_->handle, impl_->endpoint_in,
                                      reinterpret_cast<unsigned char*>(buffer.data()),
                                      static_cast<int>(buffer.size()), &transferred,
                                      to_libusb_timeout(effective_timeout));
        if (rc != LIBUSB_SUCCESS && !(rc == LIBUSB_ERROR_TIMEOUT && transferred > 0)) {
            if (rc != LIBUSB_ERROR_TIMEOUT) {
                impl_->stats.errors++;
            }
            auto err = map_transfer_error(rc, "Bulk read");
            if (err.code == error_code::connection_lost) {
                impl_->set_state(transport_state::error);
            }
            return unexpected(std::move(err));
        }

        if (transferred == 0) {
            continue;  // zero-length packet
        }

        buffer.resize(static_cast<std::size_t>(transferred));
        impl_->stats.bytes_received += static_cast<uint64_t>(transferred);
        impl_->stats.packets_received++;

        // A one-packet read may exceed a request smaller than a packet
        if (buffer.size() > limit) {
            impl_->pending.assign(buffer.begin() + static_cast<std::ptrdiff_t>(limit),
                                  buffer.end());
            buffer.resize(limit);
        }
        return buffer;
    }
}

auto usb_transport::get_statistics() const -> transport_statistics {
    return impl_->stats;
}

auto usb_transport::config() const -> const transport_config& {
    return impl_->config;
}

}  // namespace usb_responder
