#pragma once

#include <vector>
#include "pixshift/image.hpp"

namespace ps {

// factor 0 -> 全黑，1 -> 原圖，2 -> 亮度加倍
Image adjust_brightness(const Image& img, double brightness_factor);

// factor 0 -> 平均灰階的單色圖，1 -> 原圖
Image adjust_contrast(const Image& img, double contrast_factor);

// factor 0 -> 灰階，1 -> 原圖，2 -> 飽和度加倍
Image adjust_saturation(const Image& img, double saturation_factor);

// hue_factor in [-0.5, 0.5]：色相循環位移 hue_factor * 360 度
// 只定義在 3 通道影像；單通道原樣回傳
Image adjust_hue(const Image& img, double hue_factor);

// 轉灰階（0.299 R + 0.587 G + 0.114 B），num_output_channels = 1 或 3
Image rgb_to_grayscale(const Image& img, int num_output_channels = 1);

// (x - mean[c]) / stddev[c]，只支援 array；mean/stddev 長度為 1 或 C
Image normalize(const Image& img,
                const std::vector<double>& mean,
                const std::vector<double>& stddev);

// 唯一會修改輸入的操作（明確選用）
void normalize_inplace(Image& img,
                       const std::vector<double>& mean,
                       const std::vector<double>& stddev);

} // namespace ps
