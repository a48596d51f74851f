#include <gtest/gtest.h>

#include "pixshift/pixshift.hpp"
#include "pixshift/io.hpp"
#include "test_util.hpp"

#include <cstdio>
#include <stdexcept>
#include <string>

using namespace ps;

namespace {

std::string temp_path(const std::string& name) {
    return testing::TempDir() + "pixshift_" + name;
}

} // namespace

TEST(IoTest, PngRoundTripKeepsMode) {
    for (Mode mode : {Mode::L, Mode::LA, Mode::RGB, Mode::RGBA}) {
        const ObjectImage img = ps_test::make_object(9, 13, mode);
        const std::string path = temp_path(std::string("roundtrip_") + to_string(mode) + ".png");

        save_image(path, img);
        const ObjectImage back = load_image(path);
        std::remove(path.c_str());

        EXPECT_EQ(back.mode(), mode);
        EXPECT_TRUE(ps_test::same_pixels(back, img)) << to_string(mode);
    }
}

TEST(IoTest, JpgRejectsAlpha) {
    const ObjectImage img = ps_test::make_object(4, 4, Mode::RGBA);
    EXPECT_THROW(save_image(temp_path("alpha.jpg"), img), ValidationError);
}

TEST(IoTest, JpgWritesRgb) {
    const ObjectImage img = ps_test::make_constant_object(8, 8, Mode::RGB, 120);
    const std::string path = temp_path("flat.jpg");
    save_image(path, img);
    const ObjectImage back = load_image(path);
    std::remove(path.c_str());

    ASSERT_EQ(back.h(), 8);
    ASSERT_EQ(back.w(), 8);
    EXPECT_NEAR(back.get_pixel(3, 3)[0], 120, 2);
}

TEST(IoTest, UnsupportedExtension) {
    const ObjectImage img = ps_test::make_object(2, 2);
    EXPECT_THROW(save_image(temp_path("image.bmp"), img), ValidationError);
}

TEST(IoTest, MissingFile) {
    EXPECT_THROW(load_image(temp_path("does_not_exist.png")), std::runtime_error);
}

TEST(IoTest, LoadedImageFeedsTransforms) {
    const ObjectImage img = ps_test::make_object(10, 10, Mode::RGB);
    const std::string path = temp_path("pipeline.png");
    save_image(path, img);

    const Image loaded(load_image(path));
    std::remove(path.c_str());

    const Image out = gaussian_blur(center_crop(hflip(loaded), 6), 3);
    EXPECT_EQ(out.size().width, 6);
    EXPECT_EQ(out.size().height, 6);
    EXPECT_EQ(out.channels(), 3);
}
