#pragma once

#include <string>
#include "pixshift/image.hpp"

namespace ps {

enum class InterpolationMode {
    Nearest,
    Bilinear,
    Bicubic,
    // 只有物件式影像支援
    Box,
    Hamming,
    Lanczos,
};

const char* to_string(InterpolationMode mode);

// "nearest" / "bilinear" / "bicubic" / "box" / "hamming" / "lanczos"
InterpolationMode interpolation_from_string(const std::string& name);

// 舊版整數代碼：0 nearest, 1 lanczos, 2 bilinear, 3 bicubic, 4 box, 5 hamming
// 會印出 deprecation 警告，未知代碼丟 ValidationError
InterpolationMode interpolation_from_int(int code);

// resize 各表示法支援的子集
bool resize_supports(Representation rep, InterpolationMode mode);

// rotate（仿射取樣）支援 nearest / bilinear / bicubic
bool affine_supports(InterpolationMode mode);

} // namespace ps
