#include <gtest/gtest.h>

#include "pixshift/pixshift.hpp"

#include <string>

using namespace ps;

TEST(InterpolationTest, LegacyCodes) {
    EXPECT_EQ(interpolation_from_int(0), InterpolationMode::Nearest);
    EXPECT_EQ(interpolation_from_int(1), InterpolationMode::Lanczos);
    EXPECT_EQ(interpolation_from_int(2), InterpolationMode::Bilinear);
    EXPECT_EQ(interpolation_from_int(3), InterpolationMode::Bicubic);
    EXPECT_EQ(interpolation_from_int(4), InterpolationMode::Box);
    EXPECT_EQ(interpolation_from_int(5), InterpolationMode::Hamming);
    EXPECT_THROW(interpolation_from_int(6), ValidationError);
    EXPECT_THROW(interpolation_from_int(-1), ValidationError);
}

TEST(InterpolationTest, LegacyCodeWarns) {
    const log::Level saved = log::level();
    log::set_level(log::Level::Warn);

    testing::internal::CaptureStderr();
    interpolation_from_int(2);
    const std::string err = testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("[WARN]"), std::string::npos);
    EXPECT_NE(err.find("InterpolationMode"), std::string::npos);

    log::set_level(log::Level::Error);
    testing::internal::CaptureStderr();
    interpolation_from_int(2);
    EXPECT_TRUE(testing::internal::GetCapturedStderr().empty());

    log::set_level(saved);
}

TEST(InterpolationTest, StringNames) {
    for (InterpolationMode m : {InterpolationMode::Nearest, InterpolationMode::Bilinear,
                                InterpolationMode::Bicubic, InterpolationMode::Box,
                                InterpolationMode::Hamming, InterpolationMode::Lanczos}) {
        EXPECT_EQ(interpolation_from_string(to_string(m)), m);
    }
    EXPECT_STREQ(to_string(InterpolationMode::Bilinear), "bilinear");
    EXPECT_THROW(interpolation_from_string("area"), ValidationError);
}

TEST(InterpolationTest, SupportedSubsets) {
    for (InterpolationMode m : {InterpolationMode::Nearest, InterpolationMode::Bilinear,
                                InterpolationMode::Bicubic, InterpolationMode::Box,
                                InterpolationMode::Hamming, InterpolationMode::Lanczos}) {
        EXPECT_TRUE(resize_supports(Representation::Object, m)) << to_string(m);
        EXPECT_FALSE(resize_supports(Representation::None, m)) << to_string(m);
    }

    EXPECT_TRUE(resize_supports(Representation::Array, InterpolationMode::Nearest));
    EXPECT_TRUE(resize_supports(Representation::Array, InterpolationMode::Bilinear));
    EXPECT_TRUE(resize_supports(Representation::Array, InterpolationMode::Bicubic));
    EXPECT_FALSE(resize_supports(Representation::Array, InterpolationMode::Box));
    EXPECT_FALSE(resize_supports(Representation::Array, InterpolationMode::Hamming));
    EXPECT_FALSE(resize_supports(Representation::Array, InterpolationMode::Lanczos));

    EXPECT_TRUE(affine_supports(InterpolationMode::Bicubic));
    EXPECT_FALSE(affine_supports(InterpolationMode::Lanczos));
}

TEST(LoggerTest, LevelFromString) {
    EXPECT_EQ(log::level_from_string("error"), log::Level::Error);
    EXPECT_EQ(log::level_from_string("warn"), log::Level::Warn);
    EXPECT_EQ(log::level_from_string("info"), log::Level::Info);
    EXPECT_THROW(log::level_from_string("verbose"), std::invalid_argument);
}

TEST(LoggerTest, InfoIsGated) {
    const log::Level saved = log::level();

    log::set_level(log::Level::Warn);
    testing::internal::CaptureStderr();
    log::info("hidden");
    EXPECT_TRUE(testing::internal::GetCapturedStderr().empty());

    log::set_level(log::Level::Info);
    testing::internal::CaptureStderr();
    log::info("shown");
    EXPECT_NE(testing::internal::GetCapturedStderr().find("[INFO] shown"), std::string::npos);

    log::set_level(saved);
}

TEST(LoggerTest, OneLinePerMessage) {
    const log::Level saved = log::level();

    log::set_level(log::Level::Warn);
    testing::internal::CaptureStderr();
    log::warn("first");
    log::error("second");
    EXPECT_EQ(testing::internal::GetCapturedStderr(), "[WARN] first\n[ERROR] second\n");

    log::set_level(log::Level::Error);
    testing::internal::CaptureStderr();
    log::warn("hidden");
    EXPECT_TRUE(testing::internal::GetCapturedStderr().empty());

    log::set_level(saved);
}
