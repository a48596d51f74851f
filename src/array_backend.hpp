#pragma once

#include <vector>

#include "pixshift/geometry.hpp"
#include "pixshift/image.hpp"
#include "pixshift/interpolation.hpp"

// array 影像（float32, [..., C, H, W]）的後端
// 所有運算逐一處理 batch * C 個 HxW 平面
namespace ps {
namespace array_backend {

ArrayImage crop(const ArrayImage& src, int top, int left, int height, int width);

// fill 只有 1 個值
ArrayImage pad(const ArrayImage& src, const Padding& padding,
               const std::vector<double>& fill, PaddingMode mode);

// nearest / bilinear / bicubic
ArrayImage resize(const ArrayImage& src, int new_h, int new_w,
                  InterpolationMode interpolation);

ArrayImage hflip(const ArrayImage& src);
ArrayImage vflip(const ArrayImage& src);

ArrayImage adjust_brightness(const ArrayImage& src, double factor);
ArrayImage adjust_contrast(const ArrayImage& src, double factor);
ArrayImage adjust_saturation(const ArrayImage& src, double factor);
ArrayImage adjust_hue(const ArrayImage& src, double hue_factor);
ArrayImage rgb_to_grayscale(const ArrayImage& src, int num_output_channels);

// 可分離卷積：先水平（kx）再垂直（ky），邊界用 reflect
ArrayImage gaussian_blur(const ArrayImage& src,
                         const std::vector<float>& kx,
                         const std::vector<float>& ky);

ArrayImage normalize(const ArrayImage& src,
                     const std::vector<double>& mean,
                     const std::vector<double>& stddev);

void normalize_inplace(ArrayImage& img,
                       const std::vector<double>& mean,
                       const std::vector<double>& stddev);

} // namespace array_backend
} // namespace ps
