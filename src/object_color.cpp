#include "object_backend.hpp"
#include "detail.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <vector>

namespace ps {
namespace object_backend {

using detail::to_u8;

// LA / RGBA 的最後一個通道是 alpha，色彩調整時原樣保留
static int color_channels(int C) {
    return (C == 2 || C == 4) ? C - 1 : C;
}

// 每個像素的 luma（已四捨五入成 uint8，跟轉成 L 模式一致）
static std::vector<uint8_t> luma_plane(const ObjectImage& src) {
    const int C = src.c();
    const std::size_t n = static_cast<std::size_t>(src.h()) * src.w();
    const uint8_t* in = src.data();

    std::vector<uint8_t> gray(n);
#ifdef PS_HAS_OPENMP
#pragma omp parallel for
#endif
    for (std::int64_t ii = 0; ii < static_cast<std::int64_t>(n); ++ii) {
        const std::size_t i = static_cast<std::size_t>(ii);
        const uint8_t* p = in + i * C;
        gray[i] = (C >= 3) ? to_u8(detail::luma(p[0], p[1], p[2])) : p[0];
    }
    return gray;
}

// out = degenerate + factor * (img - degenerate)
// degenerate 為每個像素一個值（broadcast 到所有色彩通道）
static ObjectImage blend(const ObjectImage& src,
                         const std::vector<float>& degenerate,
                         double factor) {
    const int C  = src.c();
    const int CC = color_channels(C);
    const std::size_t n = static_cast<std::size_t>(src.h()) * src.w();
    const uint8_t* in = src.data();

    ObjectImage dst(src.h(), src.w(), src.mode());
    uint8_t* out = dst.data();

    const float f = static_cast<float>(factor);
#ifdef PS_HAS_OPENMP
#pragma omp parallel for
#endif
    for (std::int64_t ii = 0; ii < static_cast<std::int64_t>(n); ++ii) {
        const std::size_t i = static_cast<std::size_t>(ii);
        const float d = degenerate.size() == 1 ? degenerate[0] : degenerate[i];
        for (int c = 0; c < C; ++c) {
            const std::size_t k = i * C + c;
            if (c >= CC) {
                out[k] = in[k];
                continue;
            }
            out[k] = to_u8(d + f * (static_cast<float>(in[k]) - d));
        }
    }
    return dst;
}

ObjectImage adjust_brightness(const ObjectImage& src, double factor) {
    return blend(src, {0.0f}, factor);
}

ObjectImage adjust_contrast(const ObjectImage& src, double factor) {
    const std::vector<uint8_t> gray = luma_plane(src);

    double sum = 0.0;
    for (uint8_t v : gray) sum += v;
    const double mean = sum / static_cast<double>(gray.size());

    // 平均亮度取整數，跟 L 模式的灰階圖一致
    const float m = static_cast<float>(std::floor(mean + 0.5));
    return blend(src, {m}, factor);
}

ObjectImage adjust_saturation(const ObjectImage& src, double factor) {
    if (src.c() < 3) return src.clone();

    const std::vector<uint8_t> gray = luma_plane(src);
    std::vector<float> degenerate(gray.begin(), gray.end());
    return blend(src, degenerate, factor);
}

ObjectImage adjust_hue(const ObjectImage& src, double hue_factor) {
    if (src.c() == 1) return src.clone();

    const std::size_t n = static_cast<std::size_t>(src.h()) * src.w();
    const uint8_t* in = src.data();

    ObjectImage dst(src.h(), src.w(), src.mode());
    uint8_t* out = dst.data();

    const float hf = static_cast<float>(hue_factor);
    const float inv = 1.0f / 255.0f;
#ifdef PS_HAS_OPENMP
#pragma omp parallel for
#endif
    for (std::int64_t ii = 0; ii < static_cast<std::int64_t>(n); ++ii) {
        const std::size_t i = static_cast<std::size_t>(ii);
        const uint8_t* p = in + i * 3;
        float h, s, v;
        detail::rgb_to_hsv(p[0] * inv, p[1] * inv, p[2] * inv, h, s, v);
        h = detail::shift_hue(h, hf);

        float r, g, b;
        detail::hsv_to_rgb(h, s, v, r, g, b);
        out[i * 3 + 0] = to_u8(r * 255.0f);
        out[i * 3 + 1] = to_u8(g * 255.0f);
        out[i * 3 + 2] = to_u8(b * 255.0f);
    }
    return dst;
}

ObjectImage rgb_to_grayscale(const ObjectImage& src, int num_output_channels) {
    const std::vector<uint8_t> gray = luma_plane(src);

    if (num_output_channels == 1) {
        ObjectImage dst(src.h(), src.w(), Mode::L);
        std::copy(gray.begin(), gray.end(), dst.data());
        return dst;
    }

    ObjectImage dst(src.h(), src.w(), Mode::RGB);
    uint8_t* out = dst.data();
    for (std::size_t i = 0; i < gray.size(); ++i) {
        out[i * 3 + 0] = gray[i];
        out[i * 3 + 1] = gray[i];
        out[i * 3 + 2] = gray[i];
    }
    return dst;
}

} // namespace object_backend
} // namespace ps
