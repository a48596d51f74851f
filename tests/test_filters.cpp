#include <gtest/gtest.h>

#include "pixshift/pixshift.hpp"
#include "test_util.hpp"

#include <cmath>
#include <numeric>

using namespace ps;

TEST(GaussianKernelTest, NormalizedAndSymmetric) {
    const std::vector<float> k = gaussian_kernel1d(5, 1.2f);
    ASSERT_EQ(k.size(), 5u);
    EXPECT_NEAR(std::accumulate(k.begin(), k.end(), 0.0f), 1.0f, 1e-6f);
    EXPECT_FLOAT_EQ(k[0], k[4]);
    EXPECT_FLOAT_EQ(k[1], k[3]);
    EXPECT_GT(k[2], k[1]);
    EXPECT_GT(k[1], k[0]);
}

TEST(GaussianKernelTest, SizeOneIsDelta) {
    const std::vector<float> k = gaussian_kernel1d(1, 0.5f);
    ASSERT_EQ(k.size(), 1u);
    EXPECT_FLOAT_EQ(k[0], 1.0f);
}

TEST(GaussianKernelTest, DefaultSigma) {
    EXPECT_NEAR(default_gaussian_sigma(3), 0.8f, 1e-6f);
    EXPECT_NEAR(default_gaussian_sigma(7), 1.4f, 1e-6f);
}

TEST(GaussianKernelTest, InvalidArguments) {
    EXPECT_THROW(gaussian_kernel1d(4, 1.0f), ValidationError);
    EXPECT_THROW(gaussian_kernel1d(0, 1.0f), ValidationError);
    EXPECT_THROW(gaussian_kernel1d(3, 0.0f), ValidationError);
}

TEST(GaussianBlurTest, ConstantImageIsInvariant) {
    const Image obj(ps_test::make_constant_object(8, 9, Mode::RGB, 90));
    const Image out = gaussian_blur(obj, {3, 3});
    EXPECT_TRUE(ps_test::same_pixels(out.object(), obj.object()));
    EXPECT_EQ(out.object().mode(), Mode::RGB);

    ArrayImage arr(std::vector<std::int64_t>{2, 3, 6, 5});
    for (std::size_t i = 0; i < arr.numel(); ++i) arr.data()[i] = 0.3f;
    const Image blurred = gaussian_blur(Image(std::move(arr)), 3);
    const ArrayImage& b = blurred.array();
    ASSERT_EQ(b.ndim(), 4);
    for (std::size_t i = 0; i < b.numel(); ++i)
        ASSERT_NEAR(b.data()[i], 0.3f, 1e-6f);
}

TEST(GaussianBlurTest, SmoothsImpulse) {
    ArrayImage arr(1, 5, 5);
    arr.at(0, 2, 2) = 1.0f;
    const Image out = gaussian_blur(Image(std::move(arr)), 3, 1.0);
    const ArrayImage& o = out.array();

    const std::vector<float> k = gaussian_kernel1d(3, 1.0f);
    EXPECT_NEAR(o.at(0, 2, 2), k[1] * k[1], 1e-6f);
    EXPECT_NEAR(o.at(0, 1, 2), k[0] * k[1], 1e-6f);
    EXPECT_NEAR(o.at(0, 1, 1), k[0] * k[0], 1e-6f);
    EXPECT_FLOAT_EQ(o.at(0, 0, 0), 0.0f);
}

TEST(GaussianBlurTest, ReflectBorder) {
    // 單列 [1, 0, 0]，reflect 左邊補的是 index 1（值 0）
    ArrayImage arr(1, 1, 3);
    arr.at(0, 0, 0) = 1.0f;
    const Image out = gaussian_blur(Image(std::move(arr)), {3, 1}, {1.0, 1.0});
    const std::vector<float> k = gaussian_kernel1d(3, 1.0f);
    EXPECT_NEAR(out.array().at(0, 0, 0), k[1], 1e-6f);
    EXPECT_NEAR(out.array().at(0, 0, 1), k[0], 1e-6f);
    EXPECT_NEAR(out.array().at(0, 0, 2), 0.0f, 1e-6f);
}

TEST(GaussianBlurTest, AnisotropicKernel) {
    // kernel_size = (x, y)：只有水平方向模糊
    ArrayImage arr(1, 3, 3);
    arr.at(0, 1, 1) = 1.0f;
    const Image out = gaussian_blur(Image(std::move(arr)), {3, 1});
    EXPECT_FLOAT_EQ(out.array().at(0, 0, 1), 0.0f);
    EXPECT_GT(out.array().at(0, 1, 0), 0.0f);
}

TEST(GaussianBlurTest, InvalidArguments) {
    const Image img(ps_test::make_object(5, 5));
    EXPECT_THROW(gaussian_blur(img, 4), ValidationError);
    EXPECT_THROW(gaussian_blur(img, -3), ValidationError);
    EXPECT_THROW(gaussian_blur(img, {3, 3, 3}), ValidationError);
    EXPECT_THROW(gaussian_blur(img, 3, 0.0), ValidationError);
    EXPECT_THROW(gaussian_blur(img, 3, -1.0), ValidationError);
    EXPECT_THROW(gaussian_blur(img, {3, 3}, {1.0, 1.0, 1.0}), ValidationError);
}
