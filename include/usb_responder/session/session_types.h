/**
 * @file session_types.h
 * @brief Session configuration, state, events and report types
 */

#ifndef USB_RESPONDER_SESSION_SESSION_TYPES_H
#define USB_RESPONDER_SESSION_SESSION_TYPES_H

#include <usb_responder/core/frame_codec.h>
#include <usb_responder/core/progress_aggregator.h>
#include <usb_responder/core/protocol_types.h>
#include <usb_responder/core/segment_config.h>
#include <usb_responder/core/types.h>
#include <usb_responder/protocol/command_dispatcher.h>
#include <usb_responder/session/retry_policy.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>

namespace usb_responder {

/**
 * @brief Session configuration
 */
struct session_config {
    retry_policy retry;

    /// Bound on a single transport read/write inside a frame (0 = none)
    std::chrono::milliseconds io_timeout{0};

    /// Idle-wait slice between cancellation checks
    std::chrono::milliseconds cancel_poll_interval{100};

    /// Keep polling while the device is absent instead of failing
    bool wait_for_device = true;

    /// Poll interval while waiting for the device
    std::chrono::milliseconds device_poll_interval{1000};

    segment_config segments;

    uint32_t max_payload = frame_codec::default_max_payload;

    wire_profile profile = wire_profile::standard();

    [[nodiscard]] auto validate() const -> result<void>;
};

/**
 * @brief Mutable counters of one session
 */
struct session_state {
    uint32_t retry_count = 0;          ///< Consecutive reconnect attempts
    uint32_t generation = 0;           ///< Incremented on each reconnect attempt
    uint64_t bytes_sent = 0;           ///< FILE_RANGE payload bytes sent
    uint64_t commands_processed = 0;
    uint64_t request_errors = 0;       ///< Requests answered with ERROR frames
    uint64_t frames_discarded = 0;
    bool cancelled = false;
};

/**
 * @brief Final classification of a session
 */
enum class session_outcome {
    completed,   ///< Peer sent EXIT
    failed,      ///< Retries exhausted or unrecoverable error
    cancelled    ///< Cancellation requested
};

[[nodiscard]] constexpr auto to_string(session_outcome outcome) -> const char* {
    switch (outcome) {
        case session_outcome::completed: return "completed";
        case session_outcome::failed: return "failed";
        case session_outcome::cancelled: return "cancelled";
        default: return "unknown";
    }
}

/**
 * @brief Returned by session_controller::run()
 */
struct session_report {
    session_outcome outcome = session_outcome::failed;
    session_state state;
    progress_snapshot progress;        ///< Overall figures at session end
    std::optional<error> failure;      ///< Set when outcome is failed
};

/**
 * @brief Kinds of structured session events
 */
enum class session_event_kind {
    state_changed,        ///< Dispatcher state transition
    waiting_for_device,   ///< Device absent, polling
    connected,            ///< First connection established
    connection_lost,      ///< Transport failure or failed connect
    reconnecting,         ///< Retry scheduled
    reconnected,          ///< Connection re-established
    retries_exhausted,
    frame_discarded,
    request_failed,
    command_completed,
    exit_requested,
    cancelled,
    session_finished
};

[[nodiscard]] constexpr auto to_string(session_event_kind kind) -> const char* {
    switch (kind) {
        case session_event_kind::state_changed: return "state_changed";
        case session_event_kind::waiting_for_device: return "waiting_for_device";
        case session_event_kind::connected: return "connected";
        case session_event_kind::connection_lost: return "connection_lost";
        case session_event_kind::reconnecting: return "reconnecting";
        case session_event_kind::reconnected: return "reconnected";
        case session_event_kind::retries_exhausted: return "retries_exhausted";
        case session_event_kind::frame_discarded: return "frame_discarded";
        case session_event_kind::request_failed: return "request_failed";
        case session_event_kind::command_completed: return "command_completed";
        case session_event_kind::exit_requested: return "exit_requested";
        case session_event_kind::cancelled: return "cancelled";
        case session_event_kind::session_finished: return "session_finished";
        default: return "unknown";
    }
}

/**
 * @brief Structured session event
 *
 * Fields not relevant to a kind keep their defaults.
 */
struct session_event {
    session_event_kind kind = session_event_kind::state_changed;
    uint32_t generation = 0;
    uint32_t retry_count = 0;
    dispatcher_state from = dispatcher_state::awaiting_frame;
    dispatcher_state to = dispatcher_state::awaiting_frame;
    std::optional<command_id> command;
    std::optional<error> reason;
    std::size_t bytes_dropped = 0;
    std::chrono::milliseconds delay{0};
    std::optional<session_outcome> outcome;
};

using session_observer = std::function<void(const session_event&)>;

/**
 * @brief Observer writing session events to the responder logger
 */
[[nodiscard]] auto make_logging_observer() -> session_observer;

}  // namespace usb_responder

#endif  // USB_RESPONDER_SESSION_SESSION_TYPES_H
