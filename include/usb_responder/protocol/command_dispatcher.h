/**
 * @file command_dispatcher.h
 * @brief Protocol state machine serving peer requests
 *
 * This file defines the command_dispatcher, which reads request frames from
 * the transport, dispatches them through a per-command handler table and
 * writes the response frames.
 */

#ifndef USB_RESPONDER_PROTOCOL_COMMAND_DISPATCHER_H
#define USB_RESPONDER_PROTOCOL_COMMAND_DISPATCHER_H

#include <usb_responder/core/cancellation_token.h>
#include <usb_responder/core/file_catalog.h>
#include <usb_responder/core/frame_codec.h>
#include <usb_responder/core/progress_aggregator.h>
#include <usb_responder/core/transfer_engine.h>
#include <usb_responder/protocol/frame_reader.h>
#include <usb_responder/transport/transport_interface.h>

#include <array>
#include <chrono>
#include <cstddef>
#include <string_view>

namespace usb_responder {

/**
 * @brief Dispatcher states
 */
enum class dispatcher_state {
    awaiting_frame,     ///< Waiting for the next frame
    decoding_payload,   ///< Reading header and payload
    dispatching,        ///< Validating and routing to a handler
    responding,         ///< Writing response frame(s)
    error,              ///< Bad input was discarded; resumes at awaiting_frame
    terminated          ///< EXIT, cancellation or transport failure
};

[[nodiscard]] constexpr auto to_string(dispatcher_state state) -> const char* {
    switch (state) {
        case dispatcher_state::awaiting_frame: return "awaiting_frame";
        case dispatcher_state::decoding_payload: return "decoding_payload";
        case dispatcher_state::dispatching: return "dispatching";
        case dispatcher_state::responding: return "responding";
        case dispatcher_state::error: return "error";
        case dispatcher_state::terminated: return "terminated";
        default: return "unknown";
    }
}

/**
 * @brief How a serve loop ended without a transport failure
 */
enum class serve_outcome {
    exit_requested,
    cancelled
};

/**
 * @brief Receiver of dispatcher events
 *
 * All callbacks run on the serving thread.
 */
class dispatcher_observer {
public:
    virtual ~dispatcher_observer() = default;

    virtual void on_state_changed(dispatcher_state from, dispatcher_state to) = 0;

    /**
     * @brief A frame was dropped without a response
     * @param reason malformed_frame, unknown_command or unexpected_frame_type
     * @param bytes_dropped Buffered bytes discarded to resynchronise
     */
    virtual void on_frame_discarded(const error& reason, std::size_t bytes_dropped) = 0;

    /**
     * @brief A request was answered with an ERROR frame
     */
    virtual void on_request_failed(command_id command, const error& reason) = 0;

    /**
     * @brief A request was processed to completion
     */
    virtual void on_command_completed(command_id command) = 0;

    virtual void on_progress(const progress_event& event) = 0;
};

/**
 * @brief Dispatcher options
 */
struct dispatcher_options {
    /// Slice of the idle wait between cancellation checks
    std::chrono::milliseconds cancel_poll_interval{100};
};

/**
 * @brief Protocol state machine
 *
 * One command is in flight at a time. Per-request failures are answered
 * with ERROR frames and the loop continues; transport failures end serve()
 * and are returned to the caller.
 *
 * @code
 * command_dispatcher dispatcher(catalog, transport, reader, codec, engine);
 * auto outcome = dispatcher.serve(token);
 * if (!outcome.has_value() && is_transport_error(outcome.error().code)) {
 *     // reconnect
 * }
 * @endcode
 */
class command_dispatcher {
public:
    command_dispatcher(const file_catalog& catalog, transport_interface& transport,
                       frame_reader& reader, const frame_codec& codec, transfer_engine& engine,
                       dispatcher_options options = {});

    void set_observer(dispatcher_observer* observer) { observer_ = observer; }

    /**
     * @brief Serve requests until EXIT, cancellation or a transport failure
     */
    [[nodiscard]] auto serve(const cancellation_token& token) -> result<serve_outcome>;

    [[nodiscard]] auto state() const -> dispatcher_state { return state_; }

private:
    /// What the loop does after a handler returns
    enum class handler_status {
        proceed,
        exit,
        cancelled
    };

    using handler_fn = auto (command_dispatcher::*)(const frame&, const cancellation_token&)
        -> result<handler_status>;

    auto handle_exit(const frame& request, const cancellation_token& token)
        -> result<handler_status>;
    auto handle_list(const frame& request, const cancellation_token& token)
        -> result<handler_status>;
    auto handle_file_range(const frame& request, const cancellation_token& token)
        -> result<handler_status>;
    auto handle_file_count(const frame& request, const cancellation_token& token)
        -> result<handler_status>;
    auto handle_file_name(const frame& request, const cancellation_token& token)
        -> result<handler_status>;
    auto handle_file_size(const frame& request, const cancellation_token& token)
        -> result<handler_status>;

    auto respond(command_id command, std::span<const std::byte> payload) -> result<void>;

    /**
     * @brief Answer with an ERROR frame for a per-request failure
     *
     * Returns only transport errors; the request failure itself is reported
     * to the observer.
     */
    auto respond_error(command_id command, const error& reason) -> result<void>;

    void discard(const error& reason, std::size_t bytes_dropped);
    void transition(dispatcher_state next);

    const file_catalog& catalog_;
    transport_interface& transport_;
    frame_reader& reader_;
    const frame_codec& codec_;
    transfer_engine& engine_;
    dispatcher_options options_;
    dispatcher_observer* observer_ = nullptr;
    dispatcher_state state_ = dispatcher_state::awaiting_frame;

    std::array<handler_fn, command_count> handlers_{};
};

}  // namespace usb_responder

#endif  // USB_RESPONDER_PROTOCOL_COMMAND_DISPATCHER_H
