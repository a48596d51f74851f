#include <gtest/gtest.h>

#include "pixshift/pixshift.hpp"
#include "test_util.hpp"

#include <string>
#include <utility>

using namespace ps;

TEST(DispatchTest, CapabilityTable) {
    const Primitive both[] = {
        Primitive::Crop, Primitive::Pad, Primitive::Resize, Primitive::HFlip, Primitive::VFlip,
        Primitive::AdjustBrightness, Primitive::AdjustContrast, Primitive::AdjustSaturation,
        Primitive::AdjustHue, Primitive::RgbToGrayscale,
    };
    for (Primitive p : both) {
        EXPECT_TRUE(supports(p, Representation::Object)) << to_string(p);
        EXPECT_TRUE(supports(p, Representation::Array)) << to_string(p);
        EXPECT_FALSE(supports(p, Representation::None)) << to_string(p);
    }

    EXPECT_TRUE(supports(Primitive::Rotate, Representation::Object));
    EXPECT_FALSE(supports(Primitive::Rotate, Representation::Array));

    EXPECT_FALSE(supports(Primitive::GaussianBlur, Representation::Object));
    EXPECT_TRUE(supports(Primitive::GaussianBlur, Representation::Array));

    EXPECT_FALSE(supports(Primitive::Normalize, Representation::Object));
    EXPECT_TRUE(supports(Primitive::Normalize, Representation::Array));
}

TEST(DispatchTest, PrimitiveNames) {
    EXPECT_STREQ(to_string(Primitive::Crop), "crop");
    EXPECT_STREQ(to_string(Primitive::GaussianBlur), "gaussian_blur");
    EXPECT_STREQ(to_string(Primitive::RgbToGrayscale), "rgb_to_grayscale");
}

TEST(DispatchTest, EmptyImageIsTypeMismatch) {
    const Image none;
    EXPECT_THROW(hflip(none), TypeMismatch);
    EXPECT_THROW(vflip(none), TypeMismatch);
    EXPECT_THROW(crop(none, 0, 0, 1, 1), TypeMismatch);
    EXPECT_THROW(pad(none, 1), TypeMismatch);
    EXPECT_THROW(resize(none, 4), TypeMismatch);
    EXPECT_THROW(rotate(none, 10.0), TypeMismatch);
    EXPECT_THROW(adjust_brightness(none, 1.0), TypeMismatch);
    EXPECT_THROW(rgb_to_grayscale(none), TypeMismatch);
    EXPECT_THROW(gaussian_blur(none, 3), TypeMismatch);
    EXPECT_THROW(five_crop(none, 1), TypeMismatch);
}

TEST(DispatchTest, EmptyBufferIsTypeMismatch) {
    // 包著空 buffer 的影像跟空的 Image 一樣處理
    const Image empty_array{ArrayImage()};
    const Image empty_object{ObjectImage()};

    ArrayImage a = ps_test::make_array(3, 4, 4);
    const ArrayImage taken = std::move(a);
    const Image moved_from(std::move(a));
    EXPECT_EQ(taken.h(), 4);

    for (const Image* img : {&empty_array, &empty_object, &moved_from}) {
        EXPECT_THROW(hflip(*img), TypeMismatch);
        EXPECT_THROW(vflip(*img), TypeMismatch);
        EXPECT_THROW(adjust_brightness(*img, 0.5), TypeMismatch);
        EXPECT_THROW(adjust_hue(*img, 0.1), TypeMismatch);
        EXPECT_THROW(pad(*img, {1}, {0.0}, PaddingMode::Edge), TypeMismatch);
        EXPECT_THROW(crop(*img, 0, 0, 1, 1), TypeMismatch);
        EXPECT_THROW(resize(*img, 4), TypeMismatch);
        EXPECT_THROW(gaussian_blur(*img, 3), TypeMismatch);
    }
    EXPECT_THROW(rotate(empty_object, 10.0), TypeMismatch);
    EXPECT_THROW(normalize(empty_array, {0.5}, {0.5}), TypeMismatch);
}

TEST(DispatchTest, ArrayRotateFailsFast) {
    const Image arr(ps_test::make_array(3, 8, 8));
    try {
        rotate(arr, 30.0);
        FAIL() << "expected UnsupportedRepresentation";
    } catch (const UnsupportedRepresentation& e) {
        EXPECT_EQ(e.primitive(), "rotate");
        EXPECT_EQ(e.representation(), "array");
    }
}

TEST(DispatchTest, ValidationBeforeDispatch) {
    // 參數錯誤先於表示法檢查
    const Image arr(ps_test::make_array(3, 8, 8));
    EXPECT_THROW(rotate(arr, 30.0, InterpolationMode::Lanczos), ValidationError);
}

TEST(DispatchTest, NormalizeOnObjectUnsupported) {
    const Image obj(ps_test::make_object(4, 4));
    EXPECT_THROW(normalize(obj, {0.5}, {0.5}), UnsupportedRepresentation);
}

TEST(DispatchTest, ResultKeepsRepresentation) {
    const Image obj(ps_test::make_object(6, 6));
    const Image arr(ps_test::make_array(3, 6, 6));
    EXPECT_TRUE(hflip(obj).is_object());
    EXPECT_TRUE(hflip(arr).is_array());
    EXPECT_TRUE(adjust_contrast(obj, 0.5).is_object());
    EXPECT_TRUE(adjust_contrast(arr, 0.5).is_array());
    EXPECT_TRUE(gaussian_blur(obj, 3).is_object());
    EXPECT_TRUE(gaussian_blur(arr, 3).is_array());
}
