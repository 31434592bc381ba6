/**
 * @file session_controller.cpp
 * @brief Implementation of the serving session
 */

#include <usb_responder/session/session_controller.h>
#include <usb_responder/core/frame_codec.h>
#include <usb_responder/core/logging.h>
#include <usb_responder/core/transfer_engine.h>
#include <usb_responder/protocol/command_dispatcher.h>
#include <usb_responder/protocol/frame_reader.h>

#include <algorithm>
#include <string>
#include <thread>

namespace usb_responder {

// session_config implementation

auto session_config::validate() const -> result<void> {
    if (auto r = retry.validate(); !r.has_value()) {
        return r;
    }
    if (auto r = segments.validate(); !r.has_value()) {
        return r;
    }
    if (auto r = profile.validate(); !r.has_value()) {
        return r;
    }
    if (max_payload < transfer_request::serialized_size) {
        return unexpected(error{error_code::invalid_configuration,
            "max payload must hold a FILE_RANGE request (minimum: " +
            std::to_string(transfer_request::serialized_size) + ")"});
    }
    if (cancel_poll_interval.count() <= 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "cancel poll interval must be positive"});
    }
    if (wait_for_device && device_poll_interval.count() <= 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "device poll interval must be positive"});
    }
    if (io_timeout.count() < 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "I/O timeout must not be negative"});
    }
    return {};
}

// session_controller::impl

struct session_controller::impl : dispatcher_observer {
    session_config config;
    file_catalog catalog;
    std::unique_ptr<transport_interface> transport;
    cancellation_token token;
    std::vector<session_observer> observers;

    frame_codec codec;
    frame_reader reader;
    transfer_engine engine;
    command_dispatcher dispatcher;
    progress_aggregator progress;

    session_state state;

    impl(session_config cfg, file_catalog files, std::unique_ptr<transport_interface> channel,
         cancellation_token cancel, std::vector<session_observer> event_observers,
         progress_sink* sink)
        : config(std::move(cfg)),
          catalog(std::move(files)),
          transport(std::move(channel)),
          token(std::move(cancel)),
          observers(std::move(event_observers)),
          codec(config.profile, config.max_payload),
          reader(*transport, transport->config().receive_buffer_size),
          engine(codec, config.segments),
          dispatcher(catalog, *transport, reader, codec, engine,
                     dispatcher_options{config.cancel_poll_interval}),
          progress(file_sizes(catalog)) {
        reader.set_io_timeout(config.io_timeout);
        progress.set_sink(sink);
        dispatcher.set_observer(this);
    }

    static auto file_sizes(const file_catalog& files) -> std::vector<uint64_t> {
        std::vector<uint64_t> sizes;
        sizes.reserve(files.count());
        for (const auto& entry : files.entries()) {
            sizes.push_back(entry.size);
        }
        return sizes;
    }

    void emit(session_event event) {
        event.generation = state.generation;
        event.retry_count = state.retry_count;
        for (const auto& observer : observers) {
            if (observer) {
                observer(event);
            }
        }
    }

    void emit(session_event_kind kind) {
        session_event event;
        event.kind = kind;
        emit(std::move(event));
    }

    /**
     * @brief Sleep in cancel_poll_interval slices
     * @return false when cancellation was requested
     */
    auto sleep_cancellable(std::chrono::milliseconds total) -> bool {
        auto deadline = std::chrono::steady_clock::now() + total;
        for (;;) {
            if (token.is_cancelled()) {
                return false;
            }
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                return true;
            }
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            std::this_thread::sleep_for(std::min(left, config.cancel_poll_interval));
        }
    }

    /**
     * @brief Open the transport, polling while the device is absent
     *
     * Polling for an absent device does not consume retries.
     */
    auto connect_transport() -> result<void> {
        bool announced = false;
        for (;;) {
            if (token.is_cancelled()) {
                return unexpected(error{error_code::cancelled, "cancelled while connecting"});
            }

            auto connected = transport->connect();
            if (connected.has_value()) {
                return connected;
            }

            if (connected.error().code != error_code::device_not_found ||
                !config.wait_for_device) {
                return connected;
            }

            if (!announced) {
                emit(session_event_kind::waiting_for_device);
                announced = true;
            }
            if (!sleep_cancellable(config.device_poll_interval)) {
                return unexpected(error{error_code::cancelled, "cancelled while waiting"});
            }
        }
    }

    auto finish(session_outcome outcome, std::optional<error> failure = std::nullopt)
        -> session_report {
        transport->close();

        state.cancelled = outcome == session_outcome::cancelled;
        if (state.cancelled) {
            emit(session_event_kind::cancelled);
        }

        session_event finished;
        finished.kind = session_event_kind::session_finished;
        finished.outcome = outcome;
        finished.reason = failure;
        emit(std::move(finished));

        session_report report;
        report.outcome = outcome;
        report.state = state;
        report.progress = progress.snapshot(0);
        report.failure = std::move(failure);
        return report;
    }

    auto run() -> session_report {
        progress.start();
        bool ever_connected = false;

        for (;;) {
            if (token.is_cancelled()) {
                return finish(session_outcome::cancelled);
            }

            error failure;
            auto connected = connect_transport();
            if (!connected.has_value()) {
                if (connected.error().code == error_code::cancelled) {
                    return finish(session_outcome::cancelled);
                }
                failure = connected.error();
            } else {
                reader.reset();
                emit(ever_connected ? session_event_kind::reconnected
                                    : session_event_kind::connected);
                ever_connected = true;

                auto served = dispatcher.serve(token);
                if (served.has_value()) {
                    if (served.value() == serve_outcome::exit_requested) {
                        emit(session_event_kind::exit_requested);
                        return finish(session_outcome::completed);
                    }
                    return finish(session_outcome::cancelled);
                }

                failure = served.error();
                if (!is_transport_error(failure.code)) {
                    return finish(session_outcome::failed, failure);
                }
            }

            session_event lost;
            lost.kind = session_event_kind::connection_lost;
            lost.reason = failure;
            emit(std::move(lost));
            transport->close();

            if (state.retry_count >= config.retry.max_retries) {
                session_event exhausted;
                exhausted.kind = session_event_kind::retries_exhausted;
                exhausted.reason = failure;
                emit(std::move(exhausted));
                return finish(session_outcome::failed,
                              error{error_code::session_failed,
                                    "giving up after " + std::to_string(state.retry_count) +
                                    " retries: " + failure.message});
            }

            if (token.is_cancelled()) {
                return finish(session_outcome::cancelled);
            }

            state.retry_count++;
            state.generation++;
            reader.reset();

            session_event retry;
            retry.kind = session_event_kind::reconnecting;
            retry.reason = failure;
            retry.delay = config.retry.delay_for(state.retry_count);
            emit(retry);

            if (!sleep_cancellable(retry.delay)) {
                return finish(session_outcome::cancelled);
            }
        }
    }

    // dispatcher_observer

    void on_state_changed(dispatcher_state from, dispatcher_state to) override {
        session_event event;
        event.kind = session_event_kind::state_changed;
        event.from = from;
        event.to = to;
        emit(std::move(event));
    }

    void on_frame_discarded(const error& reason, std::size_t bytes_dropped) override {
        state.frames_discarded++;
        session_event event;
        event.kind = session_event_kind::frame_discarded;
        event.reason = reason;
        event.bytes_dropped = bytes_dropped;
        emit(std::move(event));
    }

    void on_request_failed(command_id command, const error& reason) override {
        state.request_errors++;
        session_event event;
        event.kind = session_event_kind::request_failed;
        event.command = command;
        event.reason = reason;
        emit(std::move(event));
    }

    void on_command_completed(command_id command) override {
        state.commands_processed++;
        // Only consecutive failures count against the retry budget
        state.retry_count = 0;
        session_event event;
        event.kind = session_event_kind::command_completed;
        event.command = command;
        emit(std::move(event));
    }

    void on_progress(const progress_event& event) override {
        state.bytes_sent += event.bytes;
        progress.record(event);
    }
};

// session_controller::builder

session_controller::builder::builder() = default;

auto session_controller::builder::with_catalog(file_catalog catalog) -> builder& {
    catalog_ = std::move(catalog);
    return *this;
}

auto session_controller::builder::with_transport(std::unique_ptr<transport_interface> transport)
    -> builder& {
    transport_ = std::move(transport);
    return *this;
}

auto session_controller::builder::with_config(session_config config) -> builder& {
    config_ = std::move(config);
    return *this;
}

auto session_controller::builder::with_retry_policy(retry_policy policy) -> builder& {
    config_.retry = policy;
    return *this;
}

auto session_controller::builder::with_io_timeout(std::chrono::milliseconds timeout)
    -> builder& {
    config_.io_timeout = timeout;
    return *this;
}

auto session_controller::builder::with_cancel_poll_interval(std::chrono::milliseconds interval)
    -> builder& {
    config_.cancel_poll_interval = interval;
    return *this;
}

auto session_controller::builder::with_device_wait(bool enable,
                                                   std::chrono::milliseconds poll_interval)
    -> builder& {
    config_.wait_for_device = enable;
    config_.device_poll_interval = poll_interval;
    return *this;
}

auto session_controller::builder::with_segment_size(std::size_t size) -> builder& {
    config_.segments = segment_config(size);
    return *this;
}

auto session_controller::builder::with_max_payload(uint32_t max_payload) -> builder& {
    config_.max_payload = max_payload;
    return *this;
}

auto session_controller::builder::with_wire_profile(wire_profile profile) -> builder& {
    config_.profile = std::move(profile);
    return *this;
}

auto session_controller::builder::with_progress_sink(progress_sink* sink) -> builder& {
    sink_ = sink;
    return *this;
}

auto session_controller::builder::with_observer(session_observer observer) -> builder& {
    observers_.push_back(std::move(observer));
    return *this;
}

auto session_controller::builder::with_cancellation_token(cancellation_token token)
    -> builder& {
    token_ = std::move(token);
    return *this;
}

auto session_controller::builder::build() -> result<session_controller> {
    if (!transport_) {
        return unexpected(error{error_code::invalid_configuration, "transport is required"});
    }

    if (auto valid = config_.validate(); !valid.has_value()) {
        return unexpected(valid.error());
    }

    UR_LOG_DEBUG(log_category::session,
        "Session configured: " + std::to_string(catalog_.count()) + " files, profile " +
        config_.profile.revision + ", segment " +
        std::to_string(config_.segments.segment_size) + " bytes, " +
        std::to_string(config_.retry.max_retries) + " retries");

    return session_controller(std::make_unique<impl>(std::move(config_), std::move(catalog_),
                                                     std::move(transport_), token_,
                                                     std::move(observers_), sink_));
}

// session_controller

session_controller::session_controller(std::unique_ptr<impl> pimpl)
    : impl_(std::move(pimpl)) {}

session_controller::~session_controller() = default;

session_controller::session_controller(session_controller&&) noexcept = default;
auto session_controller::operator=(session_controller&&) noexcept
    -> session_controller& = default;

auto session_controller::run() -> session_report {
    return impl_->run();
}

void session_controller::cancel() {
    impl_->token.cancel();
}

auto session_controller::state() const -> const session_state& {
    return impl_->state;
}

auto session_controller::catalog() const -> const file_catalog& {
    return impl_->catalog;
}

auto session_controller::config() const -> const session_config& {
    return impl_->config;
}

}  // namespace usb_responder
