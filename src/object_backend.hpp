#pragma once

#include <vector>

#include "pixshift/affine.hpp"
#include "pixshift/geometry.hpp"
#include "pixshift/image.hpp"
#include "pixshift/interpolation.hpp"

// 物件式影像（HxWxC uint8 + Mode）的後端
// 參數都已經在分派前檢查過
namespace ps {
namespace object_backend {

// 原圖範圍內的裁切
ObjectImage crop(const ObjectImage& src, int top, int left, int height, int width);

// fill：1 個值或每個通道一個值
ObjectImage pad(const ObjectImage& src, const Padding& padding,
                const std::vector<double>& fill, PaddingMode mode);

ObjectImage resize(const ObjectImage& src, int new_h, int new_w,
                   InterpolationMode interpolation);

ObjectImage hflip(const ObjectImage& src);
ObjectImage vflip(const ObjectImage& src);

// matrix 把輸出座標映射回輸入座標；超出範圍的像素填 fill
ObjectImage affine(const ObjectImage& src, const AffineMatrix& matrix,
                   int out_h, int out_w, InterpolationMode interpolation,
                   const std::vector<double>& fill);

ObjectImage adjust_brightness(const ObjectImage& src, double factor);
ObjectImage adjust_contrast(const ObjectImage& src, double factor);
ObjectImage adjust_saturation(const ObjectImage& src, double factor);
ObjectImage adjust_hue(const ObjectImage& src, double hue_factor);
ObjectImage rgb_to_grayscale(const ObjectImage& src, int num_output_channels);

} // namespace object_backend
} // namespace ps
