#pragma once

#include "pixshift/image.hpp"

namespace ps {

// HxWxC uint8 -> [C, H, W] float，除以 255
ArrayImage to_array(const ObjectImage& img);

// 同上但不縮放（0..255）
ArrayImage to_array_raw(const ObjectImage& img);

// [C, H, W] float（0..1）-> HxWxC uint8，乘 255 後四捨五入
// 色彩模式由通道數推得，或檢查是否與指定的 mode 相符
ObjectImage to_object(const ArrayImage& img);
ObjectImage to_object(const ArrayImage& img, Mode mode);

// 回傳 (width, height)
Size get_image_size(const Image& img);
int  get_image_num_channels(const Image& img);

} // namespace ps
