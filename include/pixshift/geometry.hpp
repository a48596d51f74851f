#pragma once

#include <string>
#include <vector>
#include "pixshift/image.hpp"
#include "pixshift/interpolation.hpp"

namespace ps {

enum class PaddingMode {
    Constant,
    Edge,
    Reflect,     // 鏡射，不重複邊界像素：[1,2,3,4] -> [3,2,1,2,3,4,3,2]
    Symmetric,   // 鏡射，重複邊界像素：  [1,2,3,4] -> [2,1,1,2,3,4,4,3]
};

const char* to_string(PaddingMode mode);
PaddingMode padding_mode_from_string(const std::string& name);

struct Padding {
    int left   = 0;
    int top    = 0;
    int right  = 0;
    int bottom = 0;
};

// 1 個值：四邊相同；2 個值：左右 / 上下；4 個值：左、上、右、下
Padding padding_from(const std::vector<int>& padding);

// crop：從 (top, left) 取 height x width；超出原圖的部分先補 0 再裁切
Image crop(const Image& img, int top, int left, int height, int width);

// pad：fill 只在 Constant 模式使用
// 物件式影像可給 1 個值或每個通道一個值；array 只接受 1 個值
Image pad(const Image& img,
          const std::vector<int>& padding,
          const std::vector<double>& fill = {0.0},
          PaddingMode mode = PaddingMode::Constant);

Image pad(const Image& img,
          int padding,
          double fill = 0.0,
          PaddingMode mode = PaddingMode::Constant);

// center_crop：output_size = (height, width) 或單一值；比原圖大時先對稱補 0
Image center_crop(const Image& img, int size);
Image center_crop(const Image& img, const std::vector<int>& output_size);

// resize：單一值 = 短邊縮放到 size（保持長寬比），(h, w) = 精確尺寸
Image resize(const Image& img, int size,
             InterpolationMode interpolation = InterpolationMode::Bilinear);
Image resize(const Image& img, const std::vector<int>& size,
             InterpolationMode interpolation = InterpolationMode::Bilinear);

// 舊版整數 interpolation 代碼（會印 deprecation 警告）
Image resize(const Image& img, int size, int interpolation);
Image resize(const Image& img, const std::vector<int>& size, int interpolation);

// resized_crop = resize(crop(...))
Image resized_crop(const Image& img,
                   int top, int left, int height, int width,
                   const std::vector<int>& size,
                   InterpolationMode interpolation = InterpolationMode::Bilinear);

Image hflip(const Image& img);
Image vflip(const Image& img);

// 回傳 (tl, tr, bl, br, center)；size 比原圖大時丟 ValidationError（不自動補邊）
std::vector<Image> five_crop(const Image& img, int size);
std::vector<Image> five_crop(const Image& img, const std::vector<int>& size);

// five_crop(img) + five_crop(flip(img))，預設水平翻轉
std::vector<Image> ten_crop(const Image& img, int size, bool vertical_flip = false);
std::vector<Image> ten_crop(const Image& img, const std::vector<int>& size,
                            bool vertical_flip = false);

// rotate：逆時針旋轉 angle 度
// center 為空 = 影像中心，否則為 (x, y) 像素座標，原點在左上角
// expand = true 時輸出尺寸放大到能容納整張旋轉後的影像
// 目前只有物件式影像有實作，array 會丟 UnsupportedRepresentation
Image rotate(const Image& img,
             double angle,
             InterpolationMode interpolation = InterpolationMode::Nearest,
             bool expand = false,
             const std::vector<double>& center = {},
             const std::vector<double>& fill = {0.0});

Image rotate(const Image& img, double angle, int interpolation,
             bool expand = false,
             const std::vector<double>& center = {},
             const std::vector<double>& fill = {0.0});

} // namespace ps
