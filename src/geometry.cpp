#include "pixshift/geometry.hpp"
#include "pixshift/affine.hpp"
#include "pixshift/errors.hpp"
#include "pixshift/logger.hpp"

#include "dispatch_table.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace ps {

using detail::dispatch;
using detail::require_image;

namespace {

std::string hw_string(int h, int w) {
    return "(" + std::to_string(h) + ", " + std::to_string(w) + ")";
}

// (h, w) 或單一值
void parse_hw(const std::vector<int>& size, const char* op, int& h, int& w) {
    if (size.size() == 1) {
        h = w = size[0];
    } else if (size.size() == 2) {
        h = size[0];
        w = size[1];
    } else {
        throw ValidationError(std::string(op) + ": please provide only two dimensions (h, w) for size, got "
                              + std::to_string(size.size()) + " values");
    }
    if (h <= 0 || w <= 0)
        throw ValidationError(std::string(op) + ": size must be positive, got " + hw_string(h, w));
}

// 物件式影像：1 個值或每個通道一個值；array：只接受 1 個值
void check_fill(const Image& img, const std::vector<double>& fill, const char* op) {
    if (fill.empty())
        throw ValidationError(std::string(op) + ": fill must not be empty");

    if (img.is_array()) {
        if (fill.size() != 1)
            throw ValidationError(std::string(op) + ": only a scalar fill is supported for array images");
        return;
    }

    const int C = img.channels();
    if (fill.size() != 1 && fill.size() != static_cast<std::size_t>(C)) {
        throw ValidationError(std::string(op) + ": fill must have 1 or " + std::to_string(C)
                              + " values, got " + std::to_string(fill.size()));
    }
}

// Python 風格的 round：0.5 的情況取偶數
int round_half_even(double v) {
    const double fl = std::floor(v);
    const double diff = v - fl;
    if (diff > 0.5) return static_cast<int>(fl) + 1;
    if (diff < 0.5) return static_cast<int>(fl);
    const int i = static_cast<int>(fl);
    return (i % 2 == 0) ? i : i + 1;
}

} // namespace

// ======================
//  Padding
// ======================

const char* to_string(PaddingMode mode) {
    switch (mode) {
    case PaddingMode::Constant:  return "constant";
    case PaddingMode::Edge:      return "edge";
    case PaddingMode::Reflect:   return "reflect";
    case PaddingMode::Symmetric: return "symmetric";
    }
    return "?";
}

PaddingMode padding_mode_from_string(const std::string& name) {
    if (name == "constant")  return PaddingMode::Constant;
    if (name == "edge")      return PaddingMode::Edge;
    if (name == "reflect")   return PaddingMode::Reflect;
    if (name == "symmetric") return PaddingMode::Symmetric;
    throw ValidationError("padding_mode must be one of: constant, edge, reflect, symmetric (got \""
                          + name + "\")");
}

Padding padding_from(const std::vector<int>& padding) {
    Padding p;
    switch (padding.size()) {
    case 1:
        p = {padding[0], padding[0], padding[0], padding[0]};
        break;
    case 2:
        p = {padding[0], padding[1], padding[0], padding[1]};
        break;
    case 4:
        p = {padding[0], padding[1], padding[2], padding[3]};
        break;
    default:
        throw ValidationError("pad: padding must have 1, 2 or 4 values, got "
                              + std::to_string(padding.size()));
    }
    if (p.left < 0 || p.top < 0 || p.right < 0 || p.bottom < 0)
        throw ValidationError("pad: padding must be non-negative");
    return p;
}

Image pad(const Image& img,
          const std::vector<int>& padding,
          const std::vector<double>& fill,
          PaddingMode mode) {
    require_image(img, Primitive::Pad);
    const Padding p = padding_from(padding);
    check_fill(img, fill, "pad");
    return dispatch(detail::kPadKernel, img, p, fill, mode);
}

Image pad(const Image& img, int padding, double fill, PaddingMode mode) {
    return pad(img, std::vector<int>{padding}, std::vector<double>{fill}, mode);
}

// ======================
//  Crop
// ======================

Image crop(const Image& img, int top, int left, int height, int width) {
    require_image(img, Primitive::Crop);
    if (height <= 0 || width <= 0)
        throw ValidationError("crop: invalid size " + hw_string(height, width));

    const Size s = img.size();
    const int right  = left + width;
    const int bottom = top + height;

    if (left < 0 || top < 0 || right > s.width || bottom > s.height) {
        // 超出原圖：先補 0 再裁切
        const Padding p{std::max(-left, 0),
                        std::max(-top, 0),
                        std::max(right - s.width, 0),
                        std::max(bottom - s.height, 0)};
        const Image padded = dispatch(detail::kPadKernel, img, p,
                                      std::vector<double>{0.0}, PaddingMode::Constant);
        return dispatch(detail::kCropKernel, padded, top + p.top, left + p.left, height, width);
    }

    return dispatch(detail::kCropKernel, img, top, left, height, width);
}

Image center_crop(const Image& img, int size) {
    return center_crop(img, std::vector<int>{size});
}

Image center_crop(const Image& img, const std::vector<int>& output_size) {
    require_image(img, Primitive::Crop);
    int crop_h = 0, crop_w = 0;
    parse_hw(output_size, "center_crop", crop_h, crop_w);

    Size s = img.size();
    Image padded;
    const Image* src = &img;

    if (crop_w > s.width || crop_h > s.height) {
        // 不足的部分對稱補 0，奇數多出來的那一格放在後面
        const std::vector<int> padding_ltrb = {
            crop_w > s.width ? (crop_w - s.width) / 2 : 0,
            crop_h > s.height ? (crop_h - s.height) / 2 : 0,
            crop_w > s.width ? (crop_w - s.width + 1) / 2 : 0,
            crop_h > s.height ? (crop_h - s.height + 1) / 2 : 0,
        };
        padded = pad(img, padding_ltrb, {0.0}, PaddingMode::Constant);
        s = padded.size();
        if (crop_w == s.width && crop_h == s.height) return padded;
        src = &padded;
    }

    const int crop_top  = round_half_even((s.height - crop_h) / 2.0);
    const int crop_left = round_half_even((s.width - crop_w) / 2.0);
    return crop(*src, crop_top, crop_left, crop_h, crop_w);
}

// ======================
//  Resize
// ======================

static void check_interpolation(const Image& img, InterpolationMode interpolation) {
    if (!resize_supports(img.representation(), interpolation)) {
        throw ValidationError(std::string("resize: interpolation ") + to_string(interpolation)
                              + " is not supported for " + to_string(img.representation())
                              + " images");
    }
}

Image resize(const Image& img, int size, InterpolationMode interpolation) {
    require_image(img, Primitive::Resize);
    if (size <= 0)
        throw ValidationError("resize: size must be positive, got " + std::to_string(size));
    check_interpolation(img, interpolation);

    const Size s = img.size();
    const int w = s.width;
    const int h = s.height;

    // 短邊已經等於 size
    if ((w <= h && w == size) || (h <= w && h == size)) return img.clone();

    int ow = size, oh = size;
    if (w < h) {
        oh = static_cast<int>(static_cast<double>(size) * h / w);
    } else {
        ow = static_cast<int>(static_cast<double>(size) * w / h);
    }
    oh = std::max(oh, 1);
    ow = std::max(ow, 1);

    return dispatch(detail::kResizeKernel, img, oh, ow, interpolation);
}

Image resize(const Image& img, const std::vector<int>& size, InterpolationMode interpolation) {
    if (size.size() == 1) return resize(img, size[0], interpolation);

    require_image(img, Primitive::Resize);
    int oh = 0, ow = 0;
    parse_hw(size, "resize", oh, ow);
    check_interpolation(img, interpolation);
    return dispatch(detail::kResizeKernel, img, oh, ow, interpolation);
}

Image resize(const Image& img, int size, int interpolation) {
    return resize(img, size, interpolation_from_int(interpolation));
}

Image resize(const Image& img, const std::vector<int>& size, int interpolation) {
    return resize(img, size, interpolation_from_int(interpolation));
}

Image resized_crop(const Image& img,
                   int top, int left, int height, int width,
                   const std::vector<int>& size,
                   InterpolationMode interpolation) {
    Image cropped = crop(img, top, left, height, width);
    return resize(cropped, size, interpolation);
}

// ======================
//  Flip
// ======================

Image hflip(const Image& img) {
    return dispatch(detail::kHFlipKernel, img);
}

Image vflip(const Image& img) {
    return dispatch(detail::kVFlipKernel, img);
}

// ======================
//  Five / ten crop
// ======================

std::vector<Image> five_crop(const Image& img, int size) {
    return five_crop(img, std::vector<int>{size});
}

std::vector<Image> five_crop(const Image& img, const std::vector<int>& size) {
    require_image(img, Primitive::Crop);
    int crop_h = 0, crop_w = 0;
    parse_hw(size, "five_crop", crop_h, crop_w);

    const Size s = img.size();
    if (crop_w > s.width || crop_h > s.height) {
        throw ValidationError("five_crop: requested crop size " + hw_string(crop_h, crop_w)
                              + " is bigger than input size " + hw_string(s.height, s.width));
    }

    std::vector<Image> out;
    out.reserve(5);
    out.push_back(crop(img, 0, 0, crop_h, crop_w));
    out.push_back(crop(img, 0, s.width - crop_w, crop_h, crop_w));
    out.push_back(crop(img, s.height - crop_h, 0, crop_h, crop_w));
    out.push_back(crop(img, s.height - crop_h, s.width - crop_w, crop_h, crop_w));
    out.push_back(center_crop(img, std::vector<int>{crop_h, crop_w}));
    return out;
}

std::vector<Image> ten_crop(const Image& img, int size, bool vertical_flip) {
    return ten_crop(img, std::vector<int>{size}, vertical_flip);
}

std::vector<Image> ten_crop(const Image& img, const std::vector<int>& size, bool vertical_flip) {
    std::vector<Image> out = five_crop(img, size);

    const Image flipped = vertical_flip ? vflip(img) : hflip(img);
    std::vector<Image> second = five_crop(flipped, size);

    out.reserve(10);
    for (Image& im : second) out.push_back(std::move(im));
    return out;
}

// ======================
//  Rotate
// ======================

Image rotate(const Image& img,
             double angle,
             InterpolationMode interpolation,
             bool expand,
             const std::vector<double>& center,
             const std::vector<double>& fill) {
    require_image(img, Primitive::Rotate);
    if (!affine_supports(interpolation)) {
        throw ValidationError(std::string("rotate: interpolation ") + to_string(interpolation)
                              + " is not supported");
    }
    if (!center.empty() && center.size() != 2)
        throw ValidationError("rotate: center should be a sequence of (x, y)");
    check_fill(img, fill, "rotate");

    const Size s = img.size();
    const std::array<double, 2> c = center.empty()
        ? std::array<double, 2>{s.width * 0.5, s.height * 0.5}
        : std::array<double, 2>{center[0], center[1]};

    // rotate 的角度方向跟 affine 相反
    AffineMatrix m = inverse_affine_matrix(c, -angle, {0.0, 0.0}, 1.0, {0.0, 0.0});

    int out_w = s.width;
    int out_h = s.height;

    if (expand) {
        // 四個角落的外接框，消掉浮點誤差避免多出一格
        constexpr double eps = 1e-9;
        double min_x = 0.0, max_x = 0.0, min_y = 0.0, max_y = 0.0;
        const double corners[4][2] = {{0.0, 0.0},
                                      {static_cast<double>(s.width), 0.0},
                                      {static_cast<double>(s.width), static_cast<double>(s.height)},
                                      {0.0, static_cast<double>(s.height)}};
        for (int i = 0; i < 4; ++i) {
            const auto p = apply_affine(m, corners[i][0], corners[i][1]);
            if (i == 0) {
                min_x = max_x = p[0];
                min_y = max_y = p[1];
            } else {
                min_x = std::min(min_x, p[0]);
                max_x = std::max(max_x, p[0]);
                min_y = std::min(min_y, p[1]);
                max_y = std::max(max_y, p[1]);
            }
        }
        out_w = static_cast<int>(std::ceil(max_x - eps) - std::floor(min_x + eps));
        out_h = static_cast<int>(std::ceil(max_y - eps) - std::floor(min_y + eps));

        const auto shift = apply_affine(m, -(out_w - s.width) / 2.0, -(out_h - s.height) / 2.0);
        m[2] = shift[0];
        m[5] = shift[1];
    }

    log::info("rotate: angle=" + std::to_string(angle) + " output=" + hw_string(out_h, out_w));
    return dispatch(detail::kRotateKernel, img, m, out_h, out_w, interpolation, fill);
}

Image rotate(const Image& img, double angle, int interpolation,
             bool expand,
             const std::vector<double>& center,
             const std::vector<double>& fill) {
    return rotate(img, angle, interpolation_from_int(interpolation), expand, center, fill);
}

} // namespace ps
