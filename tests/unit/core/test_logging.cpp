/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging and path masking
 */

#include <gtest/gtest.h>

#include <usb_responder/core/logging.h>

#include <sstream>
#include <string>
#include <vector>

namespace usb_responder::test {

// =============================================================================
// Masking Config Tests
// =============================================================================

class MaskingConfigTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(MaskingConfigTest, DefaultConfig) {
    masking_config config;

    EXPECT_FALSE(config.mask_paths);
    EXPECT_FALSE(config.mask_filenames);
    EXPECT_EQ(config.mask_char, "*");
    EXPECT_EQ(config.visible_chars, 4u);
}

TEST_F(MaskingConfigTest, AllMaskedConfig) {
    auto config = masking_config::all_masked();

    EXPECT_TRUE(config.mask_paths);
    EXPECT_TRUE(config.mask_filenames);
}

// =============================================================================
// Sensitive Info Masker Tests
// =============================================================================

class SensitiveInfoMaskerTest : public ::testing::Test {};

TEST_F(SensitiveInfoMaskerTest, NoMaskingByDefault) {
    sensitive_info_masker masker;
    std::string input = "serving /home/user/games/title.nsp";

    EXPECT_EQ(masker.mask(input), input);
}

TEST_F(SensitiveInfoMaskerTest, MaskDirectoryKeepsFilename) {
    masking_config config;
    config.mask_paths = true;
    sensitive_info_masker masker(config);

    EXPECT_EQ(masker.mask_path("/home/user/title.nsp"), "**********/title.nsp");
}

TEST_F(SensitiveInfoMaskerTest, MaskFilenameKeepsExtension) {
    sensitive_info_masker masker(masking_config::all_masked());

    EXPECT_EQ(masker.mask_filename("firmware_update.nsp"), "firm***********.nsp");
    EXPECT_EQ(masker.mask_filename("game.nsp"), "game.nsp");
    EXPECT_EQ(masker.mask_filename("abc"), "abc");
}

TEST_F(SensitiveInfoMaskerTest, MaskPathsInsideMessage) {
    masking_config config;
    config.mask_paths = true;
    sensitive_info_masker masker(config);

    auto masked = masker.mask("cannot open /data/roms/title.xci now");

    EXPECT_EQ(masked.find("/data/roms"), std::string::npos);
    EXPECT_NE(masked.find("title.xci"), std::string::npos);
    EXPECT_EQ(masked.rfind("cannot open ", 0), 0u);
}

// =============================================================================
// Structured Context Tests
// =============================================================================

class TransferLogContextTest : public ::testing::Test {};

TEST_F(TransferLogContextTest, EmptyContextIsEmptyObject) {
    transfer_log_context ctx;
    EXPECT_EQ(ctx.to_json(), "{}");
}

TEST_F(TransferLogContextTest, RangeFields) {
    transfer_log_context ctx;
    ctx.filename = "a.nsp";
    ctx.file_index = 0;
    ctx.offset = 500;
    ctx.length = 300;
    ctx.command = "FILE_RANGE";

    EXPECT_EQ(ctx.to_json(),
              R"({"filename":"a.nsp","file_index":0,"offset":500,"length":300,)"
              R"("command":"FILE_RANGE"})");
}

TEST_F(TransferLogContextTest, EscapesStrings) {
    transfer_log_context ctx;
    ctx.error_message = "bad \"name\"\n";

    EXPECT_EQ(ctx.to_json(), R"({"error_message":"bad \"name\"\n"})");
}

TEST_F(TransferLogContextTest, BuilderProducesJson) {
    transfer_log_context ctx;
    ctx.generation = 2;

    auto json = log_entry_builder()
                    .with_level(log_level::warn)
                    .with_category(log_category::session)
                    .with_message("connection lost")
                    .with_context(ctx)
                    .build_json();

    EXPECT_NE(json.find(R"("level":"WARN")"), std::string::npos);
    EXPECT_NE(json.find(R"("category":"usb_responder.session")"), std::string::npos);
    EXPECT_NE(json.find(R"("message":"connection lost")"), std::string::npos);
    EXPECT_NE(json.find(R"("generation":2)"), std::string::npos);
}

// =============================================================================
// Logger Tests
// =============================================================================

class ResponderLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().set_level(log_level::trace);
        get_logger().set_output_stream(&output_);
        get_logger().enable_json_output(false);
    }

    void TearDown() override {
        get_logger().set_callback(nullptr);
        get_logger().set_output_stream(nullptr);
        get_logger().enable_json_output(false);
        get_logger().set_masking_config(masking_config::none());
        get_logger().set_level(log_level::info);
    }

    std::ostringstream output_;
};

TEST_F(ResponderLoggerTest, LevelFiltering) {
    get_logger().set_level(log_level::warn);

    EXPECT_FALSE(get_logger().is_enabled(log_level::debug));
    EXPECT_FALSE(get_logger().is_enabled(log_level::info));
    EXPECT_TRUE(get_logger().is_enabled(log_level::warn));
    EXPECT_TRUE(get_logger().is_enabled(log_level::error));

    UR_LOG_INFO(log_category::session, "hidden");
    UR_LOG_ERROR(log_category::session, "shown");

    auto text = output_.str();
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("shown"), std::string::npos);
}

TEST_F(ResponderLoggerTest, TextFormatContainsLevelAndCategory) {
    UR_LOG_INFO(log_category::dispatcher, "frame discarded");

    auto text = output_.str();
    EXPECT_NE(text.find("[INFO]"), std::string::npos);
    EXPECT_NE(text.find("[usb_responder.dispatcher]"), std::string::npos);
    EXPECT_NE(text.find("frame discarded"), std::string::npos);
}

TEST_F(ResponderLoggerTest, JsonOutput) {
    get_logger().enable_json_output(true);

    transfer_log_context ctx;
    ctx.file_index = 3;
    UR_LOG_DEBUG_CTX(log_category::transfer, "streaming", ctx);

    auto text = output_.str();
    EXPECT_EQ(text.front(), '{');
    EXPECT_NE(text.find(R"("file_index":3)"), std::string::npos);
    EXPECT_NE(text.find(R"("source":{)"), std::string::npos);
}

TEST_F(ResponderLoggerTest, MaskingHidesServedPaths) {
    get_logger().set_masking_config(masking_config::all_masked());
    EXPECT_TRUE(get_logger().get_masking_config().mask_paths);

    UR_LOG_INFO(log_category::input, "Added /home/user/games/firmware_update.nsp");

    auto text = output_.str();
    EXPECT_EQ(text.find("/home/user"), std::string::npos);
    EXPECT_EQ(text.find("firmware_update"), std::string::npos);
    EXPECT_NE(text.find("firm***********.nsp"), std::string::npos);
}

TEST_F(ResponderLoggerTest, MaskingOffKeepsPaths) {
    UR_LOG_INFO(log_category::input, "Added /home/user/games/a.nsp");

    EXPECT_NE(output_.str().find("/home/user/games/a.nsp"), std::string::npos);
}

TEST_F(ResponderLoggerTest, CallbackReceivesRecords) {
    std::vector<std::string> messages;
    get_logger().set_callback(
        [&](log_level level, std::string_view category, std::string_view message,
            const transfer_log_context* ctx) {
            EXPECT_EQ(level, log_level::warn);
            EXPECT_EQ(category, log_category::transport);
            EXPECT_EQ(ctx, nullptr);
            messages.emplace_back(message);
        });

    UR_LOG_WARN(log_category::transport, "bulk transfer stalled");

    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0], "bulk transfer stalled");
}

}  // namespace usb_responder::test
