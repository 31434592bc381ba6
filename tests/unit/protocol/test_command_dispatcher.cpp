/**
 * @file test_command_dispatcher.cpp
 * @brief Unit tests for command_dispatcher
 */

#include <gtest/gtest.h>

#include <usb_responder/core/byte_order.h>
#include <usb_responder/protocol/command_dispatcher.h>

#include "fakes/fake_transport.h"

#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace usb_responder::test {

using namespace std::chrono_literals;

namespace {

class recording_observer : public dispatcher_observer {
public:
    void on_state_changed(dispatcher_state /*from*/, dispatcher_state to) override {
        states.push_back(to);
    }

    void on_frame_discarded(const error& reason, std::size_t bytes_dropped) override {
        discarded.push_back(reason.code);
        dropped_bytes += bytes_dropped;
    }

    void on_request_failed(command_id command, const error& reason) override {
        failed.emplace_back(command, reason.code);
    }

    void on_command_completed(command_id command) override {
        completed.push_back(command);
        if (cancel_on_complete) {
            cancel_on_complete->cancel();
        }
    }

    void on_progress(const progress_event& event) override { progress.push_back(event); }

    std::vector<dispatcher_state> states;
    std::vector<error_code> discarded;
    std::size_t dropped_bytes = 0;
    std::vector<std::pair<command_id, error_code>> failed;
    std::vector<command_id> completed;
    std::vector<progress_event> progress;
    const cancellation_token* cancel_on_complete = nullptr;
};

auto payload_text(const frame& f) -> std::string {
    return std::string(reinterpret_cast<const char*>(f.payload.data()), f.payload.size());
}

auto payload_status(const frame& f) -> uint32_t {
    return load_le<uint32_t>(f.payload);
}

}  // namespace

class CommandDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("usb_responder_dispatcher_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
        catalog_ = file_catalog({create_test_file("a.nsp", 1000),
                                 create_test_file("b.xci", 5000)});
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_test_file(const std::string& name, std::size_t size) -> file_input {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);
        for (std::size_t i = 0; i < size; ++i) {
            char byte = static_cast<char>(i % 251);
            file.write(&byte, 1);
        }
        return {path, size};
    }

    auto serve(connection_script script) -> result<serve_outcome> {
        transport_ = std::make_unique<fake_transport>(std::vector<connection_script>{script});
        if (auto connected = transport_->connect(); !connected.has_value()) {
            return unexpected(connected.error());
        }
        reader_ = std::make_unique<frame_reader>(*transport_);
        engine_ = std::make_unique<transfer_engine>(codec_, segment_config(4096));
        dispatcher_ = std::make_unique<command_dispatcher>(
            catalog_, *transport_, *reader_, codec_, *engine_,
            dispatcher_options{std::chrono::milliseconds{5}});
        dispatcher_->set_observer(&observer_);
        return dispatcher_->serve(token_);
    }

    auto sent() const -> std::vector<frame> { return transport_->sent_frames(0); }

    std::filesystem::path test_dir_;
    file_catalog catalog_;
    frame_codec codec_;
    cancellation_token token_;
    recording_observer observer_;

    std::unique_ptr<fake_transport> transport_;
    std::unique_ptr<frame_reader> reader_;
    std::unique_ptr<transfer_engine> engine_;
    std::unique_ptr<command_dispatcher> dispatcher_;
};

// =============================================================================
// Catalog queries
// =============================================================================

TEST_F(CommandDispatcherTest, CountListAndExit) {
    connection_script script;
    script.then_receive(batch({request_frame(command_id::file_count),
                               request_frame(command_id::list),
                               request_frame(command_id::exit)}));

    auto outcome = serve(script);
    ASSERT_TRUE(outcome.has_value()) << outcome.error().message;
    EXPECT_EQ(outcome.value(), serve_outcome::exit_requested);
    EXPECT_EQ(dispatcher_->state(), dispatcher_state::terminated);

    auto frames = sent();
    ASSERT_EQ(frames.size(), 3u);

    EXPECT_EQ(frames[0].header.type, frame_type::response);
    EXPECT_EQ(frames[0].header.command, command_id::file_count);
    EXPECT_EQ(payload_status(frames[0]), 2u);

    EXPECT_EQ(frames[1].header.command, command_id::list);
    EXPECT_EQ(payload_text(frames[1]), "a.nsp\nb.xci\n");

    EXPECT_EQ(frames[2].header.command, command_id::exit);
    EXPECT_TRUE(frames[2].payload.empty());

    EXPECT_EQ(observer_.completed.size(), 3u);
}

TEST_F(CommandDispatcherTest, NameAndSize) {
    connection_script script;
    script.then_receive(batch({request_frame(command_id::file_name, frame_codec::encode_u32(1)),
                               request_frame(command_id::file_size, frame_codec::encode_u32(1)),
                               request_frame(command_id::exit)}));

    ASSERT_TRUE(serve(script).has_value());

    auto frames = sent();
    ASSERT_EQ(frames.size(), 3u);
    EXPECT_EQ(payload_text(frames[0]), "b.xci");
    ASSERT_EQ(frames[1].payload.size(), 8u);
    EXPECT_EQ(load_le<uint64_t>(frames[1].payload), 5000u);
}

TEST_F(CommandDispatcherTest, UnknownIndexIsFileNotFound) {
    connection_script script;
    script.then_receive(batch({request_frame(command_id::file_size, frame_codec::encode_u32(9)),
                               request_frame(command_id::exit)}));

    ASSERT_TRUE(serve(script).has_value());

    auto frames = sent();
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0].header.type, frame_type::error);
    EXPECT_EQ(frames[0].header.command, command_id::file_size);
    EXPECT_EQ(payload_status(frames[0]),
              static_cast<uint32_t>(response_status::file_not_found));

    ASSERT_EQ(observer_.failed.size(), 1u);
    EXPECT_EQ(observer_.failed[0].first, command_id::file_size);
    EXPECT_EQ(observer_.failed[0].second, error_code::index_out_of_range);
}

TEST_F(CommandDispatcherTest, WrongPayloadSizeIsBadRequest) {
    connection_script script;
    script.then_receive(batch({request_frame(command_id::file_name, frame_codec::encode_u64(1)),
                               request_frame(command_id::file_range,
                                             frame_codec::encode_u32(0)),
                               request_frame(command_id::exit)}));

    ASSERT_TRUE(serve(script).has_value());

    auto frames = sent();
    ASSERT_EQ(frames.size(), 3u);
    EXPECT_EQ(frames[0].header.type, frame_type::error);
    EXPECT_EQ(payload_status(frames[0]), static_cast<uint32_t>(response_status::bad_request));
    EXPECT_EQ(frames[1].header.type, frame_type::error);
    EXPECT_EQ(frames[1].header.command, command_id::file_range);
    EXPECT_EQ(payload_status(frames[1]), static_cast<uint32_t>(response_status::bad_request));
}

// =============================================================================
// FILE_RANGE
// =============================================================================

TEST_F(CommandDispatcherTest, RangeIsStreamed) {
    connection_script script;
    script.then_receive(batch({range_request(1, 100, 4500), request_frame(command_id::exit)}));

    ASSERT_TRUE(serve(script).has_value());

    auto frames = sent();
    ASSERT_EQ(frames.size(), 3u);
    EXPECT_EQ(frames[0].header.command, command_id::file_range);
    EXPECT_EQ(frames[0].payload.size(), 4096u);
    EXPECT_EQ(frames[1].payload.size(), 404u);
    EXPECT_EQ(frames[0].payload[0], static_cast<std::byte>(100));

    ASSERT_EQ(observer_.progress.size(), 2u);
    EXPECT_EQ(observer_.progress[1].offset, 4196u);
    EXPECT_EQ(observer_.progress[1].bytes, 404u);
}

TEST_F(CommandDispatcherTest, RangePastEndIsRangeInvalid) {
    connection_script script;
    script.then_receive(batch({range_request(0, 900, 200), request_frame(command_id::exit)}));

    ASSERT_TRUE(serve(script).has_value());

    auto frames = sent();
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0].header.type, frame_type::error);
    EXPECT_EQ(payload_status(frames[0]), static_cast<uint32_t>(response_status::range_invalid));
    EXPECT_TRUE(observer_.progress.empty());
}

TEST_F(CommandDispatcherTest, MissingFileIsIoError) {
    std::filesystem::remove(test_dir_ / "a.nsp");

    connection_script script;
    script.then_receive(batch({range_request(0, 0, 10), request_frame(command_id::exit)}));

    ASSERT_TRUE(serve(script).has_value());

    auto frames = sent();
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0].header.type, frame_type::error);
    EXPECT_EQ(payload_status(frames[0]), static_cast<uint32_t>(response_status::io_error));
}

TEST_F(CommandDispatcherTest, TransportDropDuringRange) {
    connection_script script;
    script.then_receive(range_request(1, 0, 5000));
    script.drop_after_sends = 1;

    auto outcome = serve(script);
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::connection_lost);
    EXPECT_EQ(dispatcher_->state(), dispatcher_state::terminated);
    EXPECT_TRUE(observer_.completed.empty());
    EXPECT_EQ(observer_.progress.size(), 1u);
}

// =============================================================================
// Bad input
// =============================================================================

TEST_F(CommandDispatcherTest, BadMagicIsDiscardedAndServingContinues) {
    auto garbage = request_frame(command_id::file_count);
    garbage[0] = std::byte{'X'};

    connection_script script;
    script.then_receive(garbage)
          .then_receive(batch({request_frame(command_id::file_count),
                               request_frame(command_id::exit)}));

    ASSERT_TRUE(serve(script).has_value());

    ASSERT_EQ(observer_.discarded.size(), 1u);
    EXPECT_EQ(observer_.discarded[0], error_code::malformed_frame);

    auto frames = sent();
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0].header.command, command_id::file_count);
}

TEST_F(CommandDispatcherTest, BadMagicInSameReceiveKeepsFollowingFrames) {
    auto garbage = request_frame(command_id::file_count);
    garbage[0] = std::byte{'X'};

    connection_script script;
    script.then_receive(batch({garbage, request_frame(command_id::file_count),
                               request_frame(command_id::exit)}));

    auto outcome = serve(script);
    ASSERT_TRUE(outcome.has_value()) << outcome.error().message;
    EXPECT_EQ(outcome.value(), serve_outcome::exit_requested);

    ASSERT_EQ(observer_.discarded.size(), 1u);
    EXPECT_EQ(observer_.discarded[0], error_code::malformed_frame);
    EXPECT_EQ(observer_.dropped_bytes, frame_header::size);

    auto frames = sent();
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0].header.command, command_id::file_count);
    EXPECT_EQ(frames[1].header.command, command_id::exit);
}

TEST_F(CommandDispatcherTest, OversizedHeaderInSameReceiveIsSkipped) {
    auto header = codec_.encode_header(frame_type::request, command_id::list,
                                       frame_codec::default_max_payload + 1);
    std::vector<std::byte> oversized(header.begin(), header.end());

    connection_script script;
    script.then_receive(batch({oversized, request_frame(command_id::file_count),
                               request_frame(command_id::exit)}));

    auto outcome = serve(script);
    ASSERT_TRUE(outcome.has_value()) << outcome.error().message;
    EXPECT_EQ(outcome.value(), serve_outcome::exit_requested);

    ASSERT_EQ(observer_.discarded.size(), 1u);
    EXPECT_EQ(observer_.dropped_bytes, frame_header::size);
    EXPECT_EQ(sent().size(), 2u);
}

TEST_F(CommandDispatcherTest, BadFramePayloadSentSeparatelyDoesNotSwallowNextFrame) {
    // Header and payload arrive as separate transfers
    auto bad = request_frame(command_id::file_name, frame_codec::encode_u32(1));
    bad[0] = std::byte{'X'};
    std::vector<std::byte> bad_header(bad.begin(), bad.begin() + frame_header::size);
    std::vector<std::byte> bad_payload(bad.begin() + frame_header::size, bad.end());

    connection_script script;
    script.then_receive(bad_header)
          .then_receive(bad_payload)
          .then_receive(batch({request_frame(command_id::file_count),
                               request_frame(command_id::exit)}));

    auto outcome = serve(script);
    ASSERT_TRUE(outcome.has_value()) << outcome.error().message;
    EXPECT_EQ(outcome.value(), serve_outcome::exit_requested);

    EXPECT_EQ(observer_.dropped_bytes, bad.size());

    auto frames = sent();
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0].header.command, command_id::file_count);
    EXPECT_EQ(payload_status(frames[0]), 2u);
}

TEST_F(CommandDispatcherTest, UnknownCommandKeepsFollowingFrames) {
    auto unknown = request_frame(command_id::file_count);
    unknown[5] = std::byte{1};

    connection_script script;
    script.then_receive(batch({unknown, request_frame(command_id::file_count),
                               request_frame(command_id::exit)}));

    ASSERT_TRUE(serve(script).has_value());

    ASSERT_EQ(observer_.discarded.size(), 1u);
    EXPECT_EQ(observer_.discarded[0], error_code::unknown_command);
    EXPECT_EQ(observer_.dropped_bytes, 0u);
    EXPECT_EQ(sent().size(), 2u);
}

TEST_F(CommandDispatcherTest, ResponseFramesFromPeerAreIgnored) {
    connection_script script;
    script.then_receive(batch({codec_.encode(frame_type::response, command_id::list),
                               request_frame(command_id::exit)}));

    ASSERT_TRUE(serve(script).has_value());

    ASSERT_EQ(observer_.discarded.size(), 1u);
    EXPECT_EQ(observer_.discarded[0], error_code::unexpected_frame_type);
    EXPECT_EQ(sent().size(), 1u);
}

// =============================================================================
// Termination
// =============================================================================

TEST_F(CommandDispatcherTest, ConnectionLossEndsServe) {
    connection_script script;
    script.then_receive(request_frame(command_id::file_count));

    auto outcome = serve(script);
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::connection_lost);
    EXPECT_EQ(sent().size(), 1u);
}

TEST_F(CommandDispatcherTest, CancelledWhileIdle) {
    connection_script script;
    script.then_receive(request_frame(command_id::file_count));
    script.when_drained = drained_behavior::idle;
    observer_.cancel_on_complete = &token_;

    auto outcome = serve(script);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value(), serve_outcome::cancelled);
    EXPECT_EQ(observer_.states.back(), dispatcher_state::terminated);
}

TEST_F(CommandDispatcherTest, ExitAckFailureStillExits) {
    connection_script script;
    script.then_receive(request_frame(command_id::exit));
    script.drop_after_sends = 0;

    auto outcome = serve(script);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value(), serve_outcome::exit_requested);
}

}  // namespace usb_responder::test
