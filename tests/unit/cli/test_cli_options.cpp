/**
 * @file test_cli_options.cpp
 * @brief Unit tests for command-line parsing
 */

#include <gtest/gtest.h>

#include <usb_responder/cli/cli_options.h>

#include <sstream>
#include <string>
#include <vector>

namespace usb_responder::test {

using namespace std::chrono_literals;

class CliOptionsTest : public ::testing::Test {};

TEST_F(CliOptionsTest, Defaults) {
    auto options = parse_cli_options({"game.nsp"});
    ASSERT_TRUE(options.has_value()) << options.error().message;

    const auto& o = options.value();
    EXPECT_EQ(o.paths, (std::vector<std::string>{"game.nsp"}));
    EXPECT_FALSE(o.debug);
    EXPECT_TRUE(o.filter.empty());
    EXPECT_EQ(o.retry_count, 3u);
    EXPECT_EQ(o.timeout, 0ms);
    EXPECT_EQ(o.segment_size, 1024u * 1024u);
    EXPECT_FALSE(o.log_json);
    EXPECT_FALSE(o.mask_paths);
    EXPECT_TRUE(o.wait_for_device);
    EXPECT_FALSE(o.help);
}

TEST_F(CliOptionsTest, AllOptions) {
    auto options = parse_cli_options({"--debug", "--filter", "nsp,xci", "--retry-count", "5",
                                      "--timeout", "2500", "--segment-size", "65536",
                                      "--log-json", "--mask-paths", "--no-wait", "roms",
                                      "extra.nsp"});
    ASSERT_TRUE(options.has_value()) << options.error().message;

    const auto& o = options.value();
    EXPECT_EQ(o.paths, (std::vector<std::string>{"roms", "extra.nsp"}));
    EXPECT_TRUE(o.debug);
    EXPECT_EQ(o.filter, "nsp,xci");
    EXPECT_EQ(o.retry_count, 5u);
    EXPECT_EQ(o.timeout, 2500ms);
    EXPECT_EQ(o.segment_size, 65536u);
    EXPECT_TRUE(o.log_json);
    EXPECT_TRUE(o.mask_paths);
    EXPECT_FALSE(o.wait_for_device);
}

TEST_F(CliOptionsTest, HelpWithoutPaths) {
    auto options = parse_cli_options({"-h"});
    ASSERT_TRUE(options.has_value());
    EXPECT_TRUE(options.value().help);
}

TEST_F(CliOptionsTest, PathsAreRequired) {
    auto options = parse_cli_options({"--debug"});
    ASSERT_FALSE(options.has_value());
    EXPECT_EQ(options.error().code, error_code::invalid_configuration);
}

TEST_F(CliOptionsTest, UnknownOption) {
    auto options = parse_cli_options({"--verbose", "a.nsp"});
    ASSERT_FALSE(options.has_value());
    EXPECT_EQ(options.error().code, error_code::invalid_configuration);
    EXPECT_NE(options.error().message.find("--verbose"), std::string::npos);
}

TEST_F(CliOptionsTest, MissingValue) {
    auto options = parse_cli_options({"a.nsp", "--retry-count"});
    ASSERT_FALSE(options.has_value());
    EXPECT_EQ(options.error().code, error_code::invalid_configuration);
}

TEST_F(CliOptionsTest, MalformedNumbers) {
    EXPECT_FALSE(parse_cli_options({"--retry-count", "three", "a.nsp"}).has_value());
    EXPECT_FALSE(parse_cli_options({"--retry-count", "-1", "a.nsp"}).has_value());
    EXPECT_FALSE(parse_cli_options({"--timeout", "10ms", "a.nsp"}).has_value());
}

TEST_F(CliOptionsTest, SegmentSizeOutOfRange) {
    auto options = parse_cli_options({"--segment-size", "100", "a.nsp"});
    ASSERT_FALSE(options.has_value());
    EXPECT_EQ(options.error().code, error_code::invalid_segment_size);
}

TEST_F(CliOptionsTest, DashAloneIsAPath) {
    auto options = parse_cli_options({"-"});
    ASSERT_TRUE(options.has_value());
    EXPECT_EQ(options.value().paths, (std::vector<std::string>{"-"}));
}

TEST_F(CliOptionsTest, UsageMentionsOptions) {
    std::ostringstream out;
    print_usage(out, "usb-responder");

    auto text = out.str();
    EXPECT_NE(text.find("Usage: usb-responder"), std::string::npos);
    EXPECT_NE(text.find("--retry-count"), std::string::npos);
    EXPECT_NE(text.find("--filter"), std::string::npos);
}

}  // namespace usb_responder::test
