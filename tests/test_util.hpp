#pragma once

#include "pixshift/pixshift.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>

namespace ps_test {

// 漸層測試圖：每個像素每個通道都不同
inline ps::ObjectImage make_object(int h, int w, ps::Mode mode = ps::Mode::RGB) {
    ps::ObjectImage img(h, w, mode);
    const int C = img.c();
    uint8_t* p = img.data();
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            for (int c = 0; c < C; ++c) {
                p[(static_cast<std::size_t>(y) * w + x) * C + c] =
                    static_cast<uint8_t>((x * 7 + y * 13 + c * 50) % 256);
            }
        }
    }
    return img;
}

inline ps::ObjectImage make_constant_object(int h, int w, ps::Mode mode, uint8_t value) {
    ps::ObjectImage img(h, w, mode);
    std::fill(img.data(), img.data() + static_cast<std::size_t>(h) * w * img.c(), value);
    return img;
}

// [C, H, W]，值在 [0, 1]
inline ps::ArrayImage make_array(int c, int h, int w) {
    ps::ArrayImage img(c, h, w);
    for (int k = 0; k < c; ++k) {
        for (int y = 0; y < h; ++y) {
            for (int x = 0; x < w; ++x) {
                img.at(static_cast<std::size_t>(k), y, x) =
                    static_cast<float>((x * 7 + y * 13 + k * 50) % 256) / 255.0f;
            }
        }
    }
    return img;
}

inline bool same_pixels(const ps::ObjectImage& a, const ps::ObjectImage& b) {
    if (a.h() != b.h() || a.w() != b.w() || a.c() != b.c()) return false;
    const std::size_t n = static_cast<std::size_t>(a.h()) * a.w() * a.c();
    return std::equal(a.data(), a.data() + n, b.data());
}

inline bool same_values(const ps::ArrayImage& a, const ps::ArrayImage& b, float tol = 1e-6f) {
    if (a.shape() != b.shape()) return false;
    for (std::size_t i = 0; i < a.numel(); ++i) {
        if (std::fabs(a.data()[i] - b.data()[i]) > tol) return false;
    }
    return true;
}

// 物件式結果 vs array 結果：array 先乘 255，回傳最大的絕對差
inline float max_diff_255(const ps::ObjectImage& obj, const ps::ArrayImage& arr) {
    const int H = obj.h();
    const int W = obj.w();
    const int C = obj.c();
    float worst = 0.0f;
    for (int c = 0; c < C; ++c) {
        for (int y = 0; y < H; ++y) {
            for (int x = 0; x < W; ++x) {
                const float a = static_cast<float>(obj.data()[(static_cast<std::size_t>(y) * W + x) * C + c]);
                const float b = arr.at(static_cast<std::size_t>(c), y, x) * 255.0f;
                worst = std::max(worst, std::fabs(a - b));
            }
        }
    }
    return worst;
}

} // namespace ps_test
