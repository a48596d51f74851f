#include "array_backend.hpp"
#include "detail.hpp"

#include <cstdint>
#include <vector>

namespace ps {
namespace array_backend {

// ============================================================
// Separable convolution（float in / float out），邊界用 reflect
// ============================================================

ArrayImage gaussian_blur(const ArrayImage& src,
                         const std::vector<float>& kx,
                         const std::vector<float>& ky) {
    const int H = src.h();
    const int W = src.w();
    const int RX = static_cast<int>(kx.size()) / 2;
    const int RY = static_cast<int>(ky.size()) / 2;

    ArrayImage dst(src.shape());
    const std::int64_t P = static_cast<std::int64_t>(src.planes());

    // 反射索引只跟位置有關，先算好
    std::vector<int> col_index(static_cast<std::size_t>(W + 2 * RX));
    for (int i = 0; i < W + 2 * RX; ++i)
        col_index[static_cast<std::size_t>(i)] = detail::border_index(i - RX, W, PaddingMode::Reflect);

    std::vector<int> row_index(static_cast<std::size_t>(H + 2 * RY));
    for (int i = 0; i < H + 2 * RY; ++i)
        row_index[static_cast<std::size_t>(i)] = detail::border_index(i - RY, H, PaddingMode::Reflect);

#ifdef PS_HAS_OPENMP
#pragma omp parallel for
#endif
    for (std::int64_t p = 0; p < P; ++p) {
        const std::size_t plane = static_cast<std::size_t>(p);
        std::vector<float> tmp(static_cast<std::size_t>(H) * W, 0.f);

        // ---- 水平 pass: src → tmp ----
        for (int y = 0; y < H; ++y) {
            for (int x = 0; x < W; ++x) {
                float sum = 0.f;
                for (int t = -RX; t <= RX; ++t) {
                    const int sx = col_index[static_cast<std::size_t>(x + t + RX)];
                    sum += kx[static_cast<std::size_t>(t + RX)] * src.at(plane, y, sx);
                }
                tmp[static_cast<std::size_t>(y) * W + x] = sum;
            }
        }

        // ---- 垂直 pass: tmp → dst ----
        for (int y = 0; y < H; ++y) {
            for (int x = 0; x < W; ++x) {
                float sum = 0.f;
                for (int t = -RY; t <= RY; ++t) {
                    const int sy = row_index[static_cast<std::size_t>(y + t + RY)];
                    sum += ky[static_cast<std::size_t>(t + RY)] * tmp[static_cast<std::size_t>(sy) * W + x];
                }
                dst.at(plane, y, x) = sum;
            }
        }
    }

    return dst;
}

// ============================================================
// Normalize
// ============================================================

void normalize_inplace(ArrayImage& img,
                       const std::vector<double>& mean,
                       const std::vector<double>& stddev) {
    const int C = img.c();
    const std::size_t HW = static_cast<std::size_t>(img.h()) * img.w();
    const std::int64_t P = static_cast<std::int64_t>(img.planes());
    float* data = img.data();

#ifdef PS_HAS_OPENMP
#pragma omp parallel for
#endif
    for (std::int64_t p = 0; p < P; ++p) {
        const std::size_t c = static_cast<std::size_t>(p % C);
        const float m = static_cast<float>(mean.size() == 1 ? mean[0] : mean[c]);
        const float s = static_cast<float>(stddev.size() == 1 ? stddev[0] : stddev[c]);
        float* plane = data + static_cast<std::size_t>(p) * HW;
        for (std::size_t i = 0; i < HW; ++i) plane[i] = (plane[i] - m) / s;
    }
}

ArrayImage normalize(const ArrayImage& src,
                     const std::vector<double>& mean,
                     const std::vector<double>& stddev) {
    ArrayImage dst = src.clone();
    normalize_inplace(dst, mean, stddev);
    return dst;
}

} // namespace array_backend
} // namespace ps
