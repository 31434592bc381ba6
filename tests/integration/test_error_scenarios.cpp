/**
 * @file test_error_scenarios.cpp
 * @brief Integration tests for error handling, reconnection and cancellation
 */

#include "test_fixtures.h"

namespace usb_responder::test {

class ErrorScenariosTest : public SessionFixture {
protected:
    static auto status_of(const frame& f) -> response_status {
        return static_cast<response_status>(payload_u32(f));
    }
};

// ============================================================================
// Per-request errors
// ============================================================================

TEST_F(ErrorScenariosTest, RequestErrorsDoNotEndSession) {
    auto path = create_test_file("a.nsp", 1000);

    connection_script script;
    script.then_receive(batch({
        request_frame(command_id::file_name, frame_codec::encode_u32(5)),
        range_request(0, 999, 2),
        request_frame(command_id::file_size, frame_codec::encode_text("xy")),
        request_frame(command_id::file_count),
        request_frame(command_id::exit),
    }));

    auto report = run_session(resolve({path}), {script});
    EXPECT_EQ(report.outcome, session_outcome::completed);
    EXPECT_EQ(report.state.request_errors, 3u);
    EXPECT_EQ(report.state.commands_processed, 5u);

    auto frames = transport_->sent_frames(0);
    ASSERT_EQ(frames.size(), 5u);
    EXPECT_EQ(frames[0].header.type, frame_type::error);
    EXPECT_EQ(status_of(frames[0]), response_status::file_not_found);
    EXPECT_EQ(frames[1].header.type, frame_type::error);
    EXPECT_EQ(status_of(frames[1]), response_status::range_invalid);
    EXPECT_EQ(frames[2].header.type, frame_type::error);
    EXPECT_EQ(status_of(frames[2]), response_status::bad_request);
    EXPECT_EQ(frames[3].header.type, frame_type::response);
    EXPECT_EQ(payload_u32(frames[3]), 1u);
}

TEST_F(ErrorScenariosTest, FileDeletedAfterStartup) {
    auto path = create_test_file("gone.nsp", 1000);
    auto catalog = resolve({path});
    std::filesystem::remove(path);

    connection_script script;
    script.then_receive(batch({range_request(0, 0, 100), request_frame(command_id::exit)}));

    auto report = run_session(std::move(catalog), {script});
    EXPECT_EQ(report.outcome, session_outcome::completed);

    auto frames = transport_->sent_frames(0);
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0].header.type, frame_type::error);
    EXPECT_EQ(status_of(frames[0]), response_status::io_error);
}

// ============================================================================
// Malformed input
// ============================================================================

TEST_F(ErrorScenariosTest, RecoversAfterBadMagic) {
    auto garbage = request_frame(command_id::file_count);
    garbage[1] = std::byte{'X'};

    connection_script script;
    script.then_receive(garbage)
          .then_receive(batch({request_frame(command_id::file_count),
                               request_frame(command_id::exit)}));

    auto report = run_session(file_catalog{}, {script});
    EXPECT_EQ(report.outcome, session_outcome::completed);
    EXPECT_EQ(report.state.frames_discarded, 1u);
    EXPECT_EQ(count(session_event_kind::frame_discarded), 1u);
    EXPECT_EQ(transport_->sent_frames(0).size(), 2u);
}

TEST_F(ErrorScenariosTest, RecoversAfterBadMagicInSameReceive) {
    auto garbage = request_frame(command_id::file_count);
    garbage[1] = std::byte{'X'};

    connection_script script;
    script.then_receive(batch({garbage, request_frame(command_id::file_count),
                               request_frame(command_id::exit)}));

    auto report = run_session(file_catalog{}, {script});
    EXPECT_EQ(report.outcome, session_outcome::completed);
    EXPECT_EQ(report.state.frames_discarded, 1u);
    EXPECT_EQ(count(session_event_kind::connection_lost), 0u);

    auto frames = transport_->sent_frames(0);
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0].header.command, command_id::file_count);
    EXPECT_EQ(payload_u32(frames[0]), 0u);
}

TEST_F(ErrorScenariosTest, OversizedFrameIsDiscarded) {
    std::vector<std::byte> header(frame_header::size);
    auto encoded = frame_codec{}.encode_header(frame_type::request, command_id::list,
                                               frame_codec::default_max_payload + 1);
    std::copy(encoded.begin(), encoded.end(), header.begin());

    connection_script script;
    script.then_receive(header).then_receive(request_frame(command_id::exit));

    auto report = run_session(file_catalog{}, {script});
    EXPECT_EQ(report.outcome, session_outcome::completed);
    EXPECT_EQ(report.state.frames_discarded, 1u);
}

// ============================================================================
// Connection loss
// ============================================================================

TEST_F(ErrorScenariosTest, DropMidRangeThenReRequest) {
    const std::size_t size = 3 * segment_size;
    auto path = create_test_file("a.nsp", size);

    connection_script first;
    first.then_receive(range_request(0, 0, static_cast<uint32_t>(size)));
    first.drop_after_sends = 2;

    connection_script second;
    second.then_receive(batch({range_request(0, 0, static_cast<uint32_t>(size)),
                               request_frame(command_id::exit)}));

    auto report = run_session(resolve({path}), {first, second});
    EXPECT_EQ(report.outcome, session_outcome::completed);

    EXPECT_EQ(transport_->sent_frames(0).size(), 2u);
    EXPECT_EQ(transport_->sent_frames(1).size(), 4u);

    // Re-sent bytes are not counted twice
    EXPECT_EQ(report.progress.bytes_done, size);
    EXPECT_EQ(report.state.bytes_sent, 2 * segment_size + size);
    EXPECT_EQ(sink_.completed, (std::vector<uint32_t>{0}));

    EXPECT_EQ(count(session_event_kind::connection_lost), 1u);
    EXPECT_EQ(count(session_event_kind::reconnected), 1u);
}

TEST_F(ErrorScenariosTest, StaleBytesDoNotLeakAcrossConnections) {
    auto request = request_frame(command_id::file_count);

    connection_script first;
    first.then_receive({request.begin(), request.begin() + 4})
         .then_fail(error_code::connection_lost);

    connection_script second;
    second.then_receive(batch({request_frame(command_id::file_count),
                               request_frame(command_id::exit)}));

    auto report = run_session(file_catalog{}, {first, second});
    EXPECT_EQ(report.outcome, session_outcome::completed);
    EXPECT_EQ(report.state.frames_discarded, 0u);
    EXPECT_TRUE(transport_->sent_frames(0).empty());
    EXPECT_EQ(transport_->sent_frames(1).size(), 2u);
}

TEST_F(ErrorScenariosTest, RetriesExhausted) {
    connection_script unreachable;
    unreachable.connect_failure = error_code::connect_failed;

    auto controller = make_builder(file_catalog{}, {}).build();
    ASSERT_TRUE(controller.has_value());
    transport_->set_fallback_script(unreachable);

    auto report = controller.value().run();

    EXPECT_EQ(report.outcome, session_outcome::failed);
    ASSERT_TRUE(report.failure.has_value());
    EXPECT_EQ(report.failure->code, error_code::session_failed);
    EXPECT_EQ(transport_->connect_attempts(), 4u);
    EXPECT_EQ(count(session_event_kind::reconnecting), 3u);
    EXPECT_EQ(count(session_event_kind::retries_exhausted), 1u);
}

TEST_F(ErrorScenariosTest, DeviceAppearsLater) {
    connection_script absent;
    absent.connect_failure = error_code::device_not_found;

    connection_script present;
    present.then_receive(request_frame(command_id::exit));

    auto report = run_session(file_catalog{}, {absent, absent, absent, present});
    EXPECT_EQ(report.outcome, session_outcome::completed);
    EXPECT_EQ(transport_->connect_attempts(), 4u);
    EXPECT_EQ(count(session_event_kind::waiting_for_device), 1u);
    EXPECT_EQ(count(session_event_kind::reconnecting), 0u);
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_F(ErrorScenariosTest, CancelBetweenSegments) {
    const std::size_t size = 4 * segment_size;
    auto path = create_test_file("a.nsp", size);

    connection_script script;
    script.then_receive(range_request(0, 0, static_cast<uint32_t>(size)));

    auto controller = make_builder(resolve({path}), {script}).build();
    ASSERT_TRUE(controller.has_value());

    auto token = token_;
    transport_->on_send([token](std::size_t count) {
        if (count == 2) {
            token.cancel();
        }
    });

    auto report = controller.value().run();

    EXPECT_EQ(report.outcome, session_outcome::cancelled);
    EXPECT_TRUE(report.state.cancelled);
    EXPECT_EQ(transport_->sent_frames(0).size(), 2u);
    EXPECT_EQ(report.progress.bytes_done, 2 * segment_size);
    EXPECT_FALSE(transport_->is_connected());
    EXPECT_EQ(count(session_event_kind::cancelled), 1u);
}

}  // namespace usb_responder::test
