#include "array_backend.hpp"
#include "detail.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <vector>

namespace ps {
namespace array_backend {

// ======================
//  Crop
// ======================
ArrayImage crop(const ArrayImage& src, int top, int left, int height, int width) {
    ArrayImage dst(src.reshaped(src.c(), height, width));
    const std::int64_t P = static_cast<std::int64_t>(src.planes());

#ifdef PS_HAS_OPENMP
#pragma omp parallel for
#endif
    for (std::int64_t p = 0; p < P; ++p) {
        const std::size_t plane = static_cast<std::size_t>(p);
        for (int y = 0; y < height; ++y) {
            const float* row = &src.at(plane, top + y, left);
            std::copy(row, row + width, &dst.at(plane, y, 0));
        }
    }
    return dst;
}

// ======================
//  Pad
// ======================
ArrayImage pad(const ArrayImage& src, const Padding& padding,
               const std::vector<double>& fill, PaddingMode mode) {
    const int H = src.h();
    const int W = src.w();
    const int out_h = H + padding.top + padding.bottom;
    const int out_w = W + padding.left + padding.right;
    const float value = static_cast<float>(fill.empty() ? 0.0 : fill[0]);

    ArrayImage dst(src.reshaped(src.c(), out_h, out_w));
    const std::int64_t P = static_cast<std::int64_t>(src.planes());

#ifdef PS_HAS_OPENMP
#pragma omp parallel for
#endif
    for (std::int64_t p = 0; p < P; ++p) {
        const std::size_t plane = static_cast<std::size_t>(p);
        for (int y = 0; y < out_h; ++y) {
            const int sy = y - padding.top;
            for (int x = 0; x < out_w; ++x) {
                const int sx = x - padding.left;
                const bool inside = (sy >= 0 && sy < H && sx >= 0 && sx < W);
                if (!inside && mode == PaddingMode::Constant) {
                    dst.at(plane, y, x) = value;
                    continue;
                }
                dst.at(plane, y, x) = src.at(plane,
                                             detail::border_index(sy, H, mode),
                                             detail::border_index(sx, W, mode));
            }
        }
    }
    return dst;
}

// ======================
//  Resize
// ======================

namespace {

// 一個輸出座標對應的來源索引與權重
struct Tap {
    int   index[4];
    float weight[4];
    int   n;
};

// cubic convolution, a = -0.75
float cubic1(float x, float a) { return ((a + 2.0f) * x - (a + 3.0f)) * x * x + 1.0f; }
float cubic2(float x, float a) { return ((a * x - 5.0f * a) * x + 8.0f * a) * x - 4.0f * a; }

std::vector<Tap> compute_taps(int in_size, int out_size, InterpolationMode mode) {
    std::vector<Tap> taps(static_cast<std::size_t>(out_size));
    const float scale = static_cast<float>(in_size) / static_cast<float>(out_size);

    for (int d = 0; d < out_size; ++d) {
        Tap& t = taps[static_cast<std::size_t>(d)];

        if (mode == InterpolationMode::Nearest) {
            t.n = 1;
            t.index[0] = detail::nearest_index(d, in_size, out_size);
            t.weight[0] = 1.0f;
            continue;
        }

        // half-pixel center（align_corners = false）
        float src = (d + 0.5f) * scale - 0.5f;

        if (mode == InterpolationMode::Bilinear) {
            if (src < 0.0f) src = 0.0f;
            const int i0 = static_cast<int>(std::floor(src));
            const int i1 = std::min(i0 + 1, in_size - 1);
            const float l1 = src - static_cast<float>(i0);
            t.n = 2;
            t.index[0] = std::min(i0, in_size - 1);
            t.index[1] = i1;
            t.weight[0] = 1.0f - l1;
            t.weight[1] = l1;
            continue;
        }

        // bicubic
        constexpr float a = -0.75f;
        const int i0 = static_cast<int>(std::floor(src));
        const float f = src - static_cast<float>(i0);
        t.n = 4;
        t.weight[0] = cubic2(f + 1.0f, a);
        t.weight[1] = cubic1(f, a);
        t.weight[2] = cubic1(1.0f - f, a);
        t.weight[3] = cubic2(2.0f - f, a);
        for (int k = 0; k < 4; ++k)
            t.index[k] = std::clamp(i0 - 1 + k, 0, in_size - 1);
    }
    return taps;
}

} // namespace

ArrayImage resize(const ArrayImage& src, int new_h, int new_w,
                  InterpolationMode interpolation) {
    const int H = src.h();
    const int W = src.w();

    const std::vector<Tap> tx = compute_taps(W, new_w, interpolation);
    const std::vector<Tap> ty = compute_taps(H, new_h, interpolation);

    ArrayImage dst(src.reshaped(src.c(), new_h, new_w));
    const std::int64_t P = static_cast<std::int64_t>(src.planes());

#ifdef PS_HAS_OPENMP
#pragma omp parallel for
#endif
    for (std::int64_t p = 0; p < P; ++p) {
        const std::size_t plane = static_cast<std::size_t>(p);
        for (int y = 0; y < new_h; ++y) {
            const Tap& vy = ty[static_cast<std::size_t>(y)];
            for (int x = 0; x < new_w; ++x) {
                const Tap& vx = tx[static_cast<std::size_t>(x)];
                float sum = 0.0f;
                for (int j = 0; j < vy.n; ++j) {
                    float row = 0.0f;
                    for (int i = 0; i < vx.n; ++i)
                        row += vx.weight[i] * src.at(plane, vy.index[j], vx.index[i]);
                    sum += vy.weight[j] * row;
                }
                dst.at(plane, y, x) = sum;
            }
        }
    }
    return dst;
}

// ======================
//  Flip
// ======================
ArrayImage hflip(const ArrayImage& src) {
    const int H = src.h();
    const int W = src.w();
    ArrayImage dst(src.shape());
    const std::int64_t P = static_cast<std::int64_t>(src.planes());

#ifdef PS_HAS_OPENMP
#pragma omp parallel for
#endif
    for (std::int64_t p = 0; p < P; ++p) {
        const std::size_t plane = static_cast<std::size_t>(p);
        for (int y = 0; y < H; ++y) {
            for (int x = 0; x < W; ++x) {
                dst.at(plane, y, x) = src.at(plane, y, W - 1 - x);
            }
        }
    }
    return dst;
}

ArrayImage vflip(const ArrayImage& src) {
    const int H = src.h();
    const int W = src.w();
    ArrayImage dst(src.shape());
    const std::int64_t P = static_cast<std::int64_t>(src.planes());

#ifdef PS_HAS_OPENMP
#pragma omp parallel for
#endif
    for (std::int64_t p = 0; p < P; ++p) {
        const std::size_t plane = static_cast<std::size_t>(p);
        for (int y = 0; y < H; ++y) {
            const float* row = &src.at(plane, H - 1 - y, 0);
            std::copy(row, row + W, &dst.at(plane, y, 0));
        }
    }
    return dst;
}

} // namespace array_backend
} // namespace ps
