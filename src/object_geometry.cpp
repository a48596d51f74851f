#include "object_backend.hpp"
#include "detail.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace ps {
namespace object_backend {

using detail::idx;
using detail::to_u8;

// fill 只有 1 個值時套用到全部通道
static Pixel fill_pixel(const std::vector<double>& fill, int C) {
    Pixel px{0, 0, 0, 0};
    for (int c = 0; c < C; ++c) {
        const double v = (fill.size() == 1) ? fill[0] : fill[static_cast<std::size_t>(c)];
        px[static_cast<std::size_t>(c)] = to_u8(v);
    }
    return px;
}

// ======================
//  Crop
// ======================
ObjectImage crop(const ObjectImage& src, int top, int left, int height, int width) {
    const int W = src.w();
    const int C = src.c();
    const uint8_t* in = src.data();

    ObjectImage dst(height, width, src.mode());
    uint8_t* out = dst.data();

    const std::size_t row_bytes = static_cast<std::size_t>(width) * C;
    for (int y = 0; y < height; ++y) {
        const uint8_t* row = in + idx(top + y, left, 0, W, C);
        std::copy(row, row + row_bytes, out + idx(y, 0, 0, width, C));
    }

    return dst;
}

// ======================
//  Pad
// ======================
ObjectImage pad(const ObjectImage& src, const Padding& padding,
                const std::vector<double>& fill, PaddingMode mode) {
    const int H = src.h();
    const int W = src.w();
    const int C = src.c();
    const uint8_t* in = src.data();

    const int out_h = H + padding.top + padding.bottom;
    const int out_w = W + padding.left + padding.right;

    ObjectImage dst(out_h, out_w, src.mode());
    uint8_t* out = dst.data();

    const Pixel value = fill_pixel(fill, C);

#ifdef PS_HAS_OPENMP
#pragma omp parallel for
#endif
    for (int y = 0; y < out_h; ++y) {
        const int sy = y - padding.top;
        for (int x = 0; x < out_w; ++x) {
            const int sx = x - padding.left;
            const bool inside = (sy >= 0 && sy < H && sx >= 0 && sx < W);

            if (!inside && mode == PaddingMode::Constant) {
                for (int c = 0; c < C; ++c)
                    out[idx(y, x, c, out_w, C)] = value[static_cast<std::size_t>(c)];
                continue;
            }

            const int yy = detail::border_index(sy, H, mode);
            const int xx = detail::border_index(sx, W, mode);
            for (int c = 0; c < C; ++c)
                out[idx(y, x, c, out_w, C)] = in[idx(yy, xx, c, W, C)];
        }
    }

    return dst;
}

// ======================
//  Resize
// ======================

namespace {

struct Filter {
    double support;
    double (*fn)(double);
};

double box_filter(double x) {
    return (x > -0.5 && x <= 0.5) ? 1.0 : 0.0;
}

double triangle_filter(double x) {
    if (x < 0.0) x = -x;
    return (x < 1.0) ? 1.0 - x : 0.0;
}

double hamming_filter(double x) {
    if (x < 0.0) x = -x;
    if (x == 0.0) return 1.0;
    if (x >= 1.0) return 0.0;
    const double pi = std::acos(-1.0);
    x *= pi;
    return std::sin(x) / x * (0.54 + 0.46 * std::cos(x));
}

double bicubic_filter(double x) {
    constexpr double a = -0.5;
    if (x < 0.0) x = -x;
    if (x < 1.0) return ((a + 2.0) * x - (a + 3.0)) * x * x + 1.0;
    if (x < 2.0) return (((x - 5.0) * x + 8.0) * x - 4.0) * a;
    return 0.0;
}

double sinc(double x) {
    if (x == 0.0) return 1.0;
    const double pi = std::acos(-1.0);
    x *= pi;
    return std::sin(x) / x;
}

double lanczos_filter(double x) {
    if (-3.0 <= x && x < 3.0) return sinc(x) * sinc(x / 3.0);
    return 0.0;
}

Filter filter_for(InterpolationMode mode) {
    switch (mode) {
    case InterpolationMode::Box:      return {0.5, &box_filter};
    case InterpolationMode::Hamming:  return {1.0, &hamming_filter};
    case InterpolationMode::Bicubic:  return {2.0, &bicubic_filter};
    case InterpolationMode::Lanczos:  return {3.0, &lanczos_filter};
    case InterpolationMode::Bilinear:
    case InterpolationMode::Nearest:
    default:
        return {1.0, &triangle_filter};
    }
}

// 每個輸出位置的權重：縮小時 support 跟著放大（antialias）
struct AxisCoeffs {
    std::vector<int> start;
    std::vector<int> count;
    int ksize = 0;
    std::vector<double> weights;   // out_size * ksize
};

AxisCoeffs precompute_coeffs(int in_size, int out_size, const Filter& filter) {
    const double scale = static_cast<double>(in_size) / static_cast<double>(out_size);
    const double filterscale = std::max(scale, 1.0);
    const double support = filter.support * filterscale;
    const double ss = 1.0 / filterscale;

    AxisCoeffs co;
    co.ksize = static_cast<int>(std::ceil(support)) * 2 + 1;
    co.start.resize(static_cast<std::size_t>(out_size));
    co.count.resize(static_cast<std::size_t>(out_size));
    co.weights.assign(static_cast<std::size_t>(out_size) * co.ksize, 0.0);

    for (int xx = 0; xx < out_size; ++xx) {
        const double center = (xx + 0.5) * scale;
        int xmin = static_cast<int>(center - support + 0.5);
        if (xmin < 0) xmin = 0;
        int xmax = static_cast<int>(center + support + 0.5);
        if (xmax > in_size) xmax = in_size;
        xmax -= xmin;
        xmax = std::min(xmax, co.ksize);

        double* k = &co.weights[static_cast<std::size_t>(xx) * co.ksize];
        double total = 0.0;
        for (int x = 0; x < xmax; ++x) {
            const double w = filter.fn((x + xmin - center + 0.5) * ss);
            k[x] = w;
            total += w;
        }
        if (total != 0.0) {
            for (int x = 0; x < xmax; ++x) k[x] /= total;
        }
        co.start[static_cast<std::size_t>(xx)] = xmin;
        co.count[static_cast<std::size_t>(xx)] = xmax;
    }
    return co;
}

ObjectImage resize_nearest(const ObjectImage& src, int new_h, int new_w) {
    const int H = src.h();
    const int W = src.w();
    const int C = src.c();
    const uint8_t* in = src.data();

    ObjectImage dst(new_h, new_w, src.mode());
    uint8_t* out = dst.data();

    std::vector<int> xs(static_cast<std::size_t>(new_w));
    for (int x = 0; x < new_w; ++x) xs[static_cast<std::size_t>(x)] = detail::nearest_index(x, W, new_w);

    for (int y = 0; y < new_h; ++y) {
        const int sy = detail::nearest_index(y, H, new_h);
        for (int x = 0; x < new_w; ++x) {
            const int sx = xs[static_cast<std::size_t>(x)];
            for (int c = 0; c < C; ++c)
                out[idx(y, x, c, new_w, C)] = in[idx(sy, sx, c, W, C)];
        }
    }
    return dst;
}

// 可分離重取樣：水平 pass 到 float 暫存，再垂直 pass 回 uint8
ObjectImage resize_filtered(const ObjectImage& src, int new_h, int new_w,
                            InterpolationMode mode) {
    const int H = src.h();
    const int W = src.w();
    const int C = src.c();
    const uint8_t* in = src.data();

    const Filter filter = filter_for(mode);
    const AxisCoeffs cx = precompute_coeffs(W, new_w, filter);
    const AxisCoeffs cy = precompute_coeffs(H, new_h, filter);

    // ---- 水平 pass: src → tmp (H x new_w) ----
    std::vector<double> tmp(static_cast<std::size_t>(H) * new_w * C, 0.0);
    for (int y = 0; y < H; ++y) {
        for (int x = 0; x < new_w; ++x) {
            const int xmin = cx.start[static_cast<std::size_t>(x)];
            const int n    = cx.count[static_cast<std::size_t>(x)];
            const double* k = &cx.weights[static_cast<std::size_t>(x) * cx.ksize];
            for (int c = 0; c < C; ++c) {
                double sum = 0.0;
                for (int t = 0; t < n; ++t)
                    sum += k[t] * static_cast<double>(in[idx(y, xmin + t, c, W, C)]);
                tmp[idx(y, x, c, new_w, C)] = sum;
            }
        }
    }

    // ---- 垂直 pass: tmp → dst ----
    ObjectImage dst(new_h, new_w, src.mode());
    uint8_t* out = dst.data();
    for (int y = 0; y < new_h; ++y) {
        const int ymin = cy.start[static_cast<std::size_t>(y)];
        const int n    = cy.count[static_cast<std::size_t>(y)];
        const double* k = &cy.weights[static_cast<std::size_t>(y) * cy.ksize];
        for (int x = 0; x < new_w; ++x) {
            for (int c = 0; c < C; ++c) {
                double sum = 0.0;
                for (int t = 0; t < n; ++t)
                    sum += k[t] * tmp[idx(ymin + t, x, c, new_w, C)];
                out[idx(y, x, c, new_w, C)] = to_u8(sum);
            }
        }
    }
    return dst;
}

} // namespace

ObjectImage resize(const ObjectImage& src, int new_h, int new_w,
                   InterpolationMode interpolation) {
    if (interpolation == InterpolationMode::Nearest)
        return resize_nearest(src, new_h, new_w);
    return resize_filtered(src, new_h, new_w, interpolation);
}

// ======================
//  Flip
// ======================
ObjectImage hflip(const ObjectImage& src) {
    const int H = src.h();
    const int W = src.w();
    const int C = src.c();
    const uint8_t* in = src.data();

    ObjectImage dst(H, W, src.mode());
    uint8_t* out = dst.data();

    for (int y = 0; y < H; ++y) {
        for (int x = 0; x < W; ++x) {
            int sx = W - 1 - x;
            for (int c = 0; c < C; ++c) {
                out[idx(y, x, c, W, C)] = in[idx(y, sx, c, W, C)];
            }
        }
    }

    return dst;
}

ObjectImage vflip(const ObjectImage& src) {
    const int H = src.h();
    const int W = src.w();
    const int C = src.c();
    const uint8_t* in = src.data();

    ObjectImage dst(H, W, src.mode());
    uint8_t* out = dst.data();

    const std::size_t row_bytes = static_cast<std::size_t>(W) * C;
    for (int y = 0; y < H; ++y) {
        int sy = H - 1 - y;
        std::copy(in + idx(sy, 0, 0, W, C), in + idx(sy, 0, 0, W, C) + row_bytes,
                  out + idx(y, 0, 0, W, C));
    }

    return dst;
}

// ======================
//  Affine（rotate 用）
// ======================

ObjectImage affine(const ObjectImage& src, const AffineMatrix& m,
                   int out_h, int out_w, InterpolationMode interpolation,
                   const std::vector<double>& fill) {
    const int H = src.h();
    const int W = src.w();
    const int C = src.c();
    const uint8_t* in = src.data();

    ObjectImage dst(out_h, out_w, src.mode());
    uint8_t* out = dst.data();

    const Pixel value = fill_pixel(fill, C);

    auto at = [&](int yy, int xx, int c) -> double {
        yy = std::clamp(yy, 0, H - 1);
        xx = std::clamp(xx, 0, W - 1);
        return static_cast<double>(in[idx(yy, xx, c, W, C)]);
    };

    for (int y = 0; y < out_h; ++y) {
        for (int x = 0; x < out_w; ++x) {
            // 以像素中心取樣
            const auto p = apply_affine(m, x + 0.5, y + 0.5);
            const double xin = p[0];
            const double yin = p[1];

            // 在邊界外 → 填 fill
            if (xin < 0.0 || xin >= W || yin < 0.0 || yin >= H) {
                for (int c = 0; c < C; ++c)
                    out[idx(y, x, c, out_w, C)] = value[static_cast<std::size_t>(c)];
                continue;
            }

            if (interpolation == InterpolationMode::Nearest) {
                const int sx = static_cast<int>(std::floor(xin));
                const int sy = static_cast<int>(std::floor(yin));
                for (int c = 0; c < C; ++c)
                    out[idx(y, x, c, out_w, C)] = in[idx(sy, sx, c, W, C)];
                continue;
            }

            const double fxs = xin - 0.5;
            const double fys = yin - 0.5;
            const int x0 = static_cast<int>(std::floor(fxs));
            const int y0 = static_cast<int>(std::floor(fys));
            const double fx = fxs - x0;
            const double fy = fys - y0;

            for (int c = 0; c < C; ++c) {
                double v = 0.0;
                if (interpolation == InterpolationMode::Bilinear) {
                    const double v0 = at(y0, x0, c) + (at(y0, x0 + 1, c) - at(y0, x0, c)) * fx;
                    const double v1 = at(y0 + 1, x0, c) + (at(y0 + 1, x0 + 1, c) - at(y0 + 1, x0, c)) * fx;
                    v = v0 + (v1 - v0) * fy;
                } else {
                    // bicubic：4x4 鄰域
                    for (int j = -1; j <= 2; ++j) {
                        const double wy = bicubic_filter(fy - j);
                        double row = 0.0;
                        for (int i = -1; i <= 2; ++i)
                            row += bicubic_filter(fx - i) * at(y0 + j, x0 + i, c);
                        v += wy * row;
                    }
                }
                out[idx(y, x, c, out_w, C)] = to_u8(v);
            }
        }
    }

    return dst;
}

} // namespace object_backend
} // namespace ps
