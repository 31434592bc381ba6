/**
 * @file command_dispatcher.cpp
 * @brief Implementation of the protocol state machine
 */

#include <usb_responder/protocol/command_dispatcher.h>
#include <usb_responder/core/logging.h>

#include <string>

namespace usb_responder {

command_dispatcher::command_dispatcher(const file_catalog& catalog,
                                       transport_interface& transport, frame_reader& reader,
                                       const frame_codec& codec, transfer_engine& engine,
                                       dispatcher_options options)
    : catalog_(catalog),
      transport_(transport),
      reader_(reader),
      codec_(codec),
      engine_(engine),
      options_(options) {
    handlers_[static_cast<std::size_t>(command_id::exit)] = &command_dispatcher::handle_exit;
    handlers_[static_cast<std::size_t>(command_id::list)] = &command_dispatcher::handle_list;
    handlers_[static_cast<std::size_t>(command_id::file_range)] =
        &command_dispatcher::handle_file_range;
    handlers_[static_cast<std::size_t>(command_id::file_count)] =
        &command_dispatcher::handle_file_count;
    handlers_[static_cast<std::size_t>(command_id::file_name)] =
        &command_dispatcher::handle_file_name;
    handlers_[static_cast<std::size_t>(command_id::file_size)] =
        &command_dispatcher::handle_file_size;
}

auto command_dispatcher::serve(const cancellation_token& token) -> result<serve_outcome> {
    for (;;) {
        if (token.is_cancelled()) {
            transition(dispatcher_state::terminated);
            return serve_outcome::cancelled;
        }

        transition(dispatcher_state::awaiting_frame);

        auto ready = reader_.wait_for_data(options_.cancel_poll_interval);
        if (!ready.has_value()) {
            transition(dispatcher_state::terminated);
            return unexpected(ready.error());
        }
        if (!ready.value()) {
            continue;
        }

        transition(dispatcher_state::decoding_payload);

        reader_.begin_frame();
        auto decoded = codec_.decode(reader_);
        if (!decoded.has_value()) {
            const auto& err = decoded.error();
            if (is_transport_error(err.code)) {
                transition(dispatcher_state::terminated);
                return unexpected(err);
            }
            // Unknown codes were consumed whole; anything else is rescanned
            // for the next magic
            std::size_t dropped = 0;
            if (err.code != error_code::unknown_command) {
                dropped = reader_.resynchronise(codec_.profile().magic, frame_header::size);
            }
            discard(err, dropped);
            continue;
        }

        const auto& request = decoded.value();
        if (request.header.type != frame_type::request) {
            discard(error{error_code::unexpected_frame_type,
                          std::string("Ignoring ") + std::string(to_string(request.header.type)) +
                          " frame for " + std::string(to_string(request.header.command))},
                    0);
            continue;
        }

        transition(dispatcher_state::dispatching);
        UR_LOG_TRACE(log_category::dispatcher,
            "Dispatching " + std::string(to_string(request.header.command)) + " (" +
            std::to_string(request.header.payload_length) + " byte payload)");

        auto handler = handlers_[static_cast<std::size_t>(request.header.command)];
        auto handled = (this->*handler)(request, token);
        if (!handled.has_value()) {
            transition(dispatcher_state::terminated);
            return unexpected(handled.error());
        }

        if (observer_ != nullptr) {
            observer_->on_command_completed(request.header.command);
        }

        switch (handled.value()) {
            case handler_status::exit:
                transition(dispatcher_state::terminated);
                return serve_outcome::exit_requested;
            case handler_status::cancelled:
                transition(dispatcher_state::terminated);
                return serve_outcome::cancelled;
            case handler_status::proceed:
                break;
        }
    }
}

auto command_dispatcher::handle_exit(const frame& /*request*/, const cancellation_token& /*token*/)
    -> result<handler_status> {
    auto acked = respond(command_id::exit, {});
    if (!acked.has_value()) {
        // The peer may already be gone; the session still ends normally
        UR_LOG_DEBUG(log_category::dispatcher,
            "EXIT acknowledgment not delivered: " + acked.error().message);
    }
    return handler_status::exit;
}

auto command_dispatcher::handle_list(const frame& /*request*/, const cancellation_token& /*token*/)
    -> result<handler_status> {
    std::string listing;
    for (const auto& entry : catalog_.entries()) {
        listing += entry.name;
        listing += '\n';
    }

    auto sent = respond(command_id::list, frame_codec::encode_text(listing));
    if (!sent.has_value()) {
        return unexpected(sent.error());
    }
    return handler_status::proceed;
}

auto command_dispatcher::handle_file_count(const frame& /*request*/,
                                           const cancellation_token& /*token*/)
    -> result<handler_status> {
    auto sent = respond(command_id::file_count,
                        frame_codec::encode_u32(static_cast<uint32_t>(catalog_.count())));
    if (!sent.has_value()) {
        return unexpected(sent.error());
    }
    return handler_status::proceed;
}

auto command_dispatcher::handle_file_name(const frame& request,
                                          const cancellation_token& /*token*/)
    -> result<handler_status> {
    auto index = frame_codec::decode_u32(request.payload);
    if (!index.has_value()) {
        auto sent = respond_error(command_id::file_name, index.error());
        if (!sent.has_value()) {
            return unexpected(sent.error());
        }
        return handler_status::proceed;
    }

    auto name = catalog_.name_of(index.value());
    auto sent = name.has_value()
                    ? respond(command_id::file_name, frame_codec::encode_text(name.value()))
                    : respond_error(command_id::file_name, name.error());
    if (!sent.has_value()) {
        return unexpected(sent.error());
    }
    return handler_status::proceed;
}

auto command_dispatcher::handle_file_size(const frame& request,
                                          const cancellation_token& /*token*/)
    -> result<handler_status> {
    auto index = frame_codec::decode_u32(request.payload);
    if (!index.has_value()) {
        auto sent = respond_error(command_id::file_size, index.error());
        if (!sent.has_value()) {
            return unexpected(sent.error());
        }
        return handler_status::proceed;
    }

    auto size = catalog_.size_of(index.value());
    auto sent = size.has_value()
                    ? respond(command_id::file_size, frame_codec::encode_u64(size.value()))
                    : respond_error(command_id::file_size, size.error());
    if (!sent.has_value()) {
        return unexpected(sent.error());
    }
    return handler_status::proceed;
}

auto command_dispatcher::handle_file_range(const frame& request, const cancellation_token& token)
    -> result<handler_status> {
    auto decoded = frame_codec::decode_transfer_request(request.payload);
    if (!decoded.has_value()) {
        auto sent = respond_error(command_id::file_range, decoded.error());
        if (!sent.has_value()) {
            return unexpected(sent.error());
        }
        return handler_status::proceed;
    }

    const auto& range = decoded.value();
    auto reader = catalog_.open_range_reader(range.file_index, range.offset, range.length);
    if (!reader.has_value()) {
        auto sent = respond_error(command_id::file_range, reader.error());
        if (!sent.has_value()) {
            return unexpected(sent.error());
        }
        return handler_status::proceed;
    }

    transition(dispatcher_state::responding);

    auto streamed = engine_.stream(range, reader.value(), transport_, token,
        [this](const progress_event& event) {
            if (observer_ != nullptr) {
                observer_->on_progress(event);
            }
        });

    if (!streamed.has_value()) {
        if (is_transport_error(streamed.error().code)) {
            return unexpected(streamed.error());
        }
        // Read failure mid-stream; terminate the range with an error frame
        auto sent = respond_error(command_id::file_range, streamed.error());
        if (!sent.has_value()) {
            return unexpected(sent.error());
        }
        return handler_status::proceed;
    }

    if (streamed.value().cancelled) {
        return handler_status::cancelled;
    }

    if (get_logger().is_enabled(log_level::debug)) {
        transfer_log_context ctx;
        ctx.filename = catalog_.name_of(range.file_index).value();
        ctx.file_index = range.file_index;
        ctx.offset = range.offset;
        ctx.length = range.length;
        ctx.bytes_transferred = streamed.value().bytes_sent;
        UR_LOG_DEBUG_CTX(log_category::dispatcher, "Range served", ctx);
    }
    return handler_status::proceed;
}

auto command_dispatcher::respond(command_id command, std::span<const std::byte> payload)
    -> result<void> {
    transition(dispatcher_state::responding);
    return transport_.send(codec_.encode(frame_type::response, command, payload));
}

auto command_dispatcher::respond_error(command_id command, const error& reason) -> result<void> {
    transition(dispatcher_state::responding);

    if (observer_ != nullptr) {
        observer_->on_request_failed(command, reason);
    }

    const auto status = to_response_status(reason.code);
    return transport_.send(
        codec_.encode(frame_type::error, command, frame_codec::encode_status(status)));
}

void command_dispatcher::discard(const error& reason, std::size_t bytes_dropped) {
    transition(dispatcher_state::error);
    if (observer_ != nullptr) {
        observer_->on_frame_discarded(reason, bytes_dropped);
    }
}

void command_dispatcher::transition(dispatcher_state next) {
    if (state_ == next) {
        return;
    }
    const auto previous = state_;
    state_ = next;
    if (observer_ != nullptr) {
        observer_->on_state_changed(previous, next);
    }
}

}  // namespace usb_responder
