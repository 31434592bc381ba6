/**
 * @file test_version.cpp
 * @brief Unit tests for version information and the umbrella header
 */

#include <gtest/gtest.h>
#include <usb_responder/usb_responder.h>

namespace usb_responder::test {

class VersionTest : public ::testing::Test {};

TEST_F(VersionTest, VersionStringIsCorrect) {
    EXPECT_EQ(version::to_string(), "1.0.0");
}

TEST_F(VersionTest, VersionStringMatchesComponents) {
    auto expected = std::to_string(version::major) + "." + std::to_string(version::minor) +
                    "." + std::to_string(version::patch);
    EXPECT_EQ(version::to_string(), expected);
}

TEST_F(VersionTest, UmbrellaHeaderExposesDefaultProfile) {
    // The default wire profile must be usable straight from the umbrella header
    auto profile = wire_profile::standard();
    EXPECT_TRUE(profile.validate().has_value());

    frame_codec codec;
    EXPECT_EQ(codec.max_payload(), frame_codec::default_max_payload);
}

}  // namespace usb_responder::test
