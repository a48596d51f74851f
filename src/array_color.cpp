#include "array_backend.hpp"
#include "detail.hpp"

#include <algorithm>
#include <cstdint>
#include <vector>

namespace ps {
namespace array_backend {

namespace {

// 數值範圍 [0, 1]
constexpr float kBound = 1.0f;

int color_channels(int C) {
    return (C == 2 || C == 4) ? C - 1 : C;
}

// 第 b 張影像的 luma 平面（H*W）
void luma_plane(const ArrayImage& src, std::size_t b, std::vector<float>& gray) {
    const int C = src.c();
    const int H = src.h();
    const int W = src.w();
    const std::size_t base = b * static_cast<std::size_t>(C);

    gray.resize(static_cast<std::size_t>(H) * W);
    for (int y = 0; y < H; ++y) {
        for (int x = 0; x < W; ++x) {
            const float v = (C >= 3)
                ? detail::luma(src.at(base + 0, y, x), src.at(base + 1, y, x), src.at(base + 2, y, x))
                : src.at(base, y, x);
            gray[static_cast<std::size_t>(y) * W + x] = v;
        }
    }
}

enum class Degenerate {
    Black,
    Mean,
    Gray,
};

// out = clamp(degenerate + factor * (img - degenerate), 0, 1)，alpha 原樣保留
ArrayImage blend(const ArrayImage& src, Degenerate kind, double factor) {
    const int C  = src.c();
    const int CC = color_channels(C);
    const int H  = src.h();
    const int W  = src.w();
    const float f = static_cast<float>(factor);

    ArrayImage dst(src.shape());
    const std::int64_t B = static_cast<std::int64_t>(src.batch());

#ifdef PS_HAS_OPENMP
#pragma omp parallel for
#endif
    for (std::int64_t bi = 0; bi < B; ++bi) {
        const std::size_t b = static_cast<std::size_t>(bi);
        std::vector<float> gray;
        float mean = 0.0f;

        if (kind != Degenerate::Black) {
            luma_plane(src, b, gray);
            if (kind == Degenerate::Mean) {
                double sum = 0.0;
                for (float v : gray) sum += v;
                mean = static_cast<float>(sum / static_cast<double>(gray.size()));
            }
        }

        for (int c = 0; c < C; ++c) {
            const std::size_t plane = b * C + c;
            for (int y = 0; y < H; ++y) {
                for (int x = 0; x < W; ++x) {
                    const float v = src.at(plane, y, x);
                    if (c >= CC) {
                        dst.at(plane, y, x) = v;
                        continue;
                    }
                    float d = 0.0f;
                    if (kind == Degenerate::Mean) d = mean;
                    else if (kind == Degenerate::Gray) d = gray[static_cast<std::size_t>(y) * W + x];
                    dst.at(plane, y, x) = std::clamp(d + f * (v - d), 0.0f, kBound);
                }
            }
        }
    }
    return dst;
}

} // namespace

ArrayImage adjust_brightness(const ArrayImage& src, double factor) {
    return blend(src, Degenerate::Black, factor);
}

ArrayImage adjust_contrast(const ArrayImage& src, double factor) {
    return blend(src, Degenerate::Mean, factor);
}

ArrayImage adjust_saturation(const ArrayImage& src, double factor) {
    if (src.c() < 3) return src.clone();
    return blend(src, Degenerate::Gray, factor);
}

ArrayImage adjust_hue(const ArrayImage& src, double hue_factor) {
    if (src.c() == 1) return src.clone();

    const int H = src.h();
    const int W = src.w();
    const float hf = static_cast<float>(hue_factor);

    ArrayImage dst(src.shape());
    const std::int64_t B = static_cast<std::int64_t>(src.batch());

#ifdef PS_HAS_OPENMP
#pragma omp parallel for
#endif
    for (std::int64_t bi = 0; bi < B; ++bi) {
        const std::size_t base = static_cast<std::size_t>(bi) * 3;
        for (int y = 0; y < H; ++y) {
            for (int x = 0; x < W; ++x) {
                float h, s, v;
                detail::rgb_to_hsv(std::clamp(src.at(base + 0, y, x), 0.0f, kBound),
                                   std::clamp(src.at(base + 1, y, x), 0.0f, kBound),
                                   std::clamp(src.at(base + 2, y, x), 0.0f, kBound),
                                   h, s, v);
                h = detail::shift_hue(h, hf);

                float r, g, b;
                detail::hsv_to_rgb(h, s, v, r, g, b);
                dst.at(base + 0, y, x) = r;
                dst.at(base + 1, y, x) = g;
                dst.at(base + 2, y, x) = b;
            }
        }
    }
    return dst;
}

ArrayImage rgb_to_grayscale(const ArrayImage& src, int num_output_channels) {
    const int H = src.h();
    const int W = src.w();

    ArrayImage dst(src.reshaped(num_output_channels, H, W));
    const std::int64_t B = static_cast<std::int64_t>(src.batch());

#ifdef PS_HAS_OPENMP
#pragma omp parallel for
#endif
    for (std::int64_t bi = 0; bi < B; ++bi) {
        const std::size_t b = static_cast<std::size_t>(bi);
        std::vector<float> gray;
        luma_plane(src, b, gray);
        for (int c = 0; c < num_output_channels; ++c) {
            std::copy(gray.begin(), gray.end(),
                      &dst.at(b * num_output_channels + c, 0, 0));
        }
    }
    return dst;
}

} // namespace array_backend
} // namespace ps
