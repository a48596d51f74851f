#pragma once

#include "pixshift/image.hpp"

namespace ps {

// 所有會依表示法分派的 primitive
enum class Primitive {
    Crop,
    Pad,
    Resize,
    HFlip,
    VFlip,
    Rotate,
    AdjustBrightness,
    AdjustContrast,
    AdjustSaturation,
    AdjustHue,
    RgbToGrayscale,
    GaussianBlur,
    Normalize,
};

const char* to_string(Primitive primitive);

// 查詢能力表：該表示法是否有後端實作
// gaussian_blur 對物件式影像是先轉成 array 再處理，這裡回報的是後端本身
bool supports(Primitive primitive, Representation rep);

} // namespace ps
