#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>

#include "pixshift/geometry.hpp"

namespace ps {
namespace detail {

inline std::size_t idx(int y, int x, int c, int W, int C) {
    return (static_cast<std::size_t>(y) * W + x) * C + c;
}

// NaN 沒有大小關係，clamp 不會處理，直接當 0
inline std::uint8_t to_u8(float v) {
    if (std::isnan(v)) return 0;
    v = std::round(v);
    v = std::clamp(v, 0.0f, 255.0f);
    return static_cast<std::uint8_t>(v);
}

inline std::uint8_t to_u8(double v) {
    return to_u8(static_cast<float>(v));
}

// 將越界的 index 依照 PaddingMode 映射回合法範圍 [0, N-1]
// 週期性映射，所以補邊寬度大於影像時會持續鏡射
// Constant 不應走到這裡，呼叫端要先處理
inline int border_index(int i, int N, PaddingMode mode) {
    if (N <= 1) return 0;
    if (i >= 0 && i < N) return i;

    switch (mode) {
    case PaddingMode::Reflect: {
        const int period = 2 * N - 2;
        int m = i % period;
        if (m < 0) m += period;
        return (m < N) ? m : period - m;
    }
    case PaddingMode::Symmetric: {
        const int period = 2 * N;
        int m = i % period;
        if (m < 0) m += period;
        return (m < N) ? m : period - 1 - m;
    }
    case PaddingMode::Edge:
    case PaddingMode::Constant:
    default:
        return std::clamp(i, 0, N - 1);
    }
}

// ITU-R 601-2 luma
constexpr float kLumaR = 0.299f;
constexpr float kLumaG = 0.587f;
constexpr float kLumaB = 0.114f;

inline float luma(float r, float g, float b) {
    return kLumaR * r + kLumaG * g + kLumaB * b;
}

// r, g, b in [0, 1] -> h, s, v in [0, 1]
inline void rgb_to_hsv(float r, float g, float b, float& h, float& s, float& v) {
    const float maxc = std::max({r, g, b});
    const float minc = std::min({r, g, b});
    const float cr = maxc - minc;

    v = maxc;
    s = (maxc > 0.0f) ? cr / maxc : 0.0f;

    if (cr <= 0.0f) {
        h = 0.0f;
        return;
    }

    const float rc = (maxc - r) / cr;
    const float gc = (maxc - g) / cr;
    const float bc = (maxc - b) / cr;

    float hh;
    if (maxc == r)      hh = bc - gc;
    else if (maxc == g) hh = 2.0f + rc - bc;
    else                hh = 4.0f + gc - rc;

    hh = std::fmod(hh / 6.0f + 1.0f, 1.0f);
    h = hh;
}

inline void hsv_to_rgb(float h, float s, float v, float& r, float& g, float& b) {
    const float h6 = h * 6.0f;
    int   i = static_cast<int>(std::floor(h6));
    const float f = h6 - static_cast<float>(i);
    i = ((i % 6) + 6) % 6;

    const float p = std::clamp(v * (1.0f - s), 0.0f, 1.0f);
    const float q = std::clamp(v * (1.0f - s * f), 0.0f, 1.0f);
    const float t = std::clamp(v * (1.0f - s * (1.0f - f)), 0.0f, 1.0f);

    switch (i) {
    case 0:  r = v; g = t; b = p; break;
    case 1:  r = q; g = v; b = p; break;
    case 2:  r = p; g = v; b = t; break;
    case 3:  r = p; g = q; b = v; break;
    case 4:  r = t; g = p; b = v; break;
    default: r = v; g = p; b = q; break;
    }
}

// 色相循環位移，結果落在 [0, 1)
inline float shift_hue(float h, float hue_factor) {
    float out = std::fmod(h + hue_factor, 1.0f);
    if (out < 0.0f) out += 1.0f;
    return out;
}

// 最近鄰取樣：兩種表示法都用 floor((dst + 0.5) * in / out)
inline int nearest_index(int dst, int in_size, int out_size) {
    const double scale = static_cast<double>(in_size) / static_cast<double>(out_size);
    int s = static_cast<int>(std::floor((dst + 0.5) * scale));
    return std::clamp(s, 0, in_size - 1);
}

} // namespace detail
} // namespace ps
