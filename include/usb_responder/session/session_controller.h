/**
 * @file session_controller.h
 * @brief Serving session: connect, serve loop, retry and shutdown
 *
 * This file defines the session_controller, which owns the transport, the
 * connection generation and the only retry/abort decision of a session.
 */

#ifndef USB_RESPONDER_SESSION_SESSION_CONTROLLER_H
#define USB_RESPONDER_SESSION_SESSION_CONTROLLER_H

#include <usb_responder/core/cancellation_token.h>
#include <usb_responder/core/file_catalog.h>
#include <usb_responder/core/progress_aggregator.h>
#include <usb_responder/session/session_types.h>
#include <usb_responder/transport/transport_interface.h>

#include <chrono>
#include <memory>
#include <vector>

namespace usb_responder {

/**
 * @brief Runs one serving session against a peer
 *
 * @code
 * auto controller = session_controller::builder()
 *     .with_catalog(std::move(catalog))
 *     .with_transport(usb_transport::create())
 *     .with_retry_policy(retry_policy{})
 *     .with_progress_sink(&sink)
 *     .with_cancellation_token(token)
 *     .build();
 *
 * if (controller) {
 *     auto report = controller.value().run();
 * }
 * @endcode
 */
class session_controller {
public:
    /**
     * @brief Builder for session_controller
     */
    class builder {
    public:
        builder();

        auto with_catalog(file_catalog catalog) -> builder&;
        auto with_transport(std::unique_ptr<transport_interface> transport) -> builder&;

        /**
         * @brief Replace the whole configuration
         */
        auto with_config(session_config config) -> builder&;

        auto with_retry_policy(retry_policy policy) -> builder&;
        auto with_io_timeout(std::chrono::milliseconds timeout) -> builder&;
        auto with_cancel_poll_interval(std::chrono::milliseconds interval) -> builder&;

        /**
         * @brief Wait for an absent device instead of counting it as a failure
         */
        auto with_device_wait(bool enable,
                              std::chrono::milliseconds poll_interval = std::chrono::seconds{1})
            -> builder&;

        auto with_segment_size(std::size_t size) -> builder&;
        auto with_max_payload(uint32_t max_payload) -> builder&;
        auto with_wire_profile(wire_profile profile) -> builder&;

        auto with_progress_sink(progress_sink* sink) -> builder&;

        /**
         * @brief Add an event observer; may be called more than once
         */
        auto with_observer(session_observer observer) -> builder&;

        auto with_cancellation_token(cancellation_token token) -> builder&;

        /**
         * @brief Validate the configuration and build the controller
         *
         * Fails with invalid_configuration when no transport was given, or
         * with the error of the first invalid setting.
         */
        [[nodiscard]] auto build() -> result<session_controller>;

    private:
        file_catalog catalog_;
        std::unique_ptr<transport_interface> transport_;
        session_config config_;
        progress_sink* sink_ = nullptr;
        std::vector<session_observer> observers_;
        cancellation_token token_;
    };

    ~session_controller();

    // Non-copyable, movable
    session_controller(const session_controller&) = delete;
    auto operator=(const session_controller&) -> session_controller& = delete;
    session_controller(session_controller&&) noexcept;
    auto operator=(session_controller&&) noexcept -> session_controller&;

    /**
     * @brief Serve until EXIT, cancellation or exhausted retries
     *
     * Closes the transport before returning. Call once.
     */
    [[nodiscard]] auto run() -> session_report;

    /**
     * @brief Request cancellation; safe from another thread
     */
    void cancel();

    [[nodiscard]] auto state() const -> const session_state&;
    [[nodiscard]] auto catalog() const -> const file_catalog&;
    [[nodiscard]] auto config() const -> const session_config&;

private:
    struct impl;

    explicit session_controller(std::unique_ptr<impl> pimpl);

    std::unique_ptr<impl> impl_;
};

}  // namespace usb_responder

#endif  // USB_RESPONDER_SESSION_SESSION_CONTROLLER_H
