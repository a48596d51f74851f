#pragma once

#include <array>

namespace ps {

// 2x3 row-major：[a, b, c, d, e, f]
// 把輸出座標 (x, y) 映射回輸入座標 (a*x + b*y + c, d*x + e*y + f)
using AffineMatrix = std::array<double, 6>;

// 計算 M = T * C * RSS * C^-1 的反矩陣
//   T   : 平移 (tx, ty)
//   C   : 以 center 為中心
//   RSS : 旋轉(angle, 度, 逆時針) * 縮放(scale) * 錯切(shear_x, shear_y, 度)
// M^-1 = C * RSS^-1 * C^-1 * T^-1
AffineMatrix inverse_affine_matrix(const std::array<double, 2>& center,
                                   double angle,
                                   const std::array<double, 2>& translate,
                                   double scale,
                                   const std::array<double, 2>& shear);

// 套用 2x3 矩陣到一個點
inline std::array<double, 2> apply_affine(const AffineMatrix& m, double x, double y) {
    return {m[0] * x + m[1] * y + m[2],
            m[3] * x + m[4] * y + m[5]};
}

} // namespace ps
