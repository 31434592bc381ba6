/**
 * @file session_events.cpp
 * @brief Logging observer for session events
 */

#include <usb_responder/session/session_types.h>
#include <usb_responder/core/logging.h>

#include <string>

namespace usb_responder {

namespace {

auto base_context(const session_event& event) -> transfer_log_context {
    transfer_log_context ctx;
    ctx.generation = event.generation;
    ctx.retry_count = event.retry_count;
    if (event.command) {
        ctx.command = std::string(to_string(*event.command));
    }
    if (event.reason) {
        ctx.error_message = event.reason->message;
    }
    return ctx;
}

void log_event(const session_event& event) {
    auto ctx = base_context(event);

    switch (event.kind) {
        case session_event_kind::state_changed:
            UR_LOG_TRACE(log_category::dispatcher,
                std::string("State ") + to_string(event.from) + " -> " + to_string(event.to));
            break;

        case session_event_kind::waiting_for_device:
            UR_LOG_INFO(log_category::session, "Waiting for device...");
            break;

        case session_event_kind::connected:
            UR_LOG_INFO_CTX(log_category::session, "Device connected", ctx);
            break;

        case session_event_kind::reconnected:
            UR_LOG_INFO_CTX(log_category::session, "Device reconnected", ctx);
            break;

        case session_event_kind::connection_lost:
            UR_LOG_WARN_CTX(log_category::session, "Connection lost", ctx);
            break;

        case session_event_kind::reconnecting:
            UR_LOG_WARN_CTX(log_category::session,
                "Reconnecting in " + std::to_string(event.delay.count()) + " ms", ctx);
            break;

        case session_event_kind::retries_exhausted:
            UR_LOG_ERROR_CTX(log_category::session, "Retries exhausted", ctx);
            break;

        case session_event_kind::frame_discarded:
            UR_LOG_WARN_CTX(log_category::dispatcher,
                "Frame discarded (" + std::to_string(event.bytes_dropped) +
                " buffered bytes dropped)", ctx);
            break;

        case session_event_kind::request_failed:
            UR_LOG_WARN_CTX(log_category::dispatcher, "Request failed", ctx);
            break;

        case session_event_kind::command_completed:
            UR_LOG_DEBUG_CTX(log_category::dispatcher, "Command completed", ctx);
            break;

        case session_event_kind::exit_requested:
            UR_LOG_INFO(log_category::session, "Peer requested exit");
            break;

        case session_event_kind::cancelled:
            UR_LOG_INFO(log_category::session, "Session cancelled");
            break;

        case session_event_kind::session_finished:
            UR_LOG_INFO(log_category::session,
                std::string("Session finished: ") +
                to_string(event.outcome.value_or(session_outcome::failed)));
            break;
    }
}

}  // namespace

auto make_logging_observer() -> session_observer {
    return [](const session_event& event) { log_event(event); };
}

}  // namespace usb_responder
