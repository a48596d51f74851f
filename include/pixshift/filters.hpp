#pragma once

#include <vector>
#include "pixshift/image.hpp"

namespace ps {

// ------------------------------------------------------------
// Kernel utilities
// ------------------------------------------------------------

// ksize 個取樣點的 Gaussian PDF，sum = 1
// ksize: 正奇數；sigma: > 0
std::vector<float> gaussian_kernel1d(int ksize, float sigma);

// 沒給 sigma 時的預設值：0.15 * ksize + 0.35
float default_gaussian_sigma(int ksize);

// ------------------------------------------------------------
// Gaussian blur
// ------------------------------------------------------------

// kernel_size = (kx, ky) 或單一值；sigma = (sx, sy)、單一值或空（自動推算）
// 物件式影像會轉成 array、模糊後再轉回來
Image gaussian_blur(const Image& img,
                    const std::vector<int>& kernel_size,
                    const std::vector<double>& sigma = {});

Image gaussian_blur(const Image& img, int kernel_size);
Image gaussian_blur(const Image& img, int kernel_size, double sigma);

} // namespace ps
