#pragma once

#include <utility>
#include <vector>

#include "pixshift/affine.hpp"
#include "pixshift/dispatch.hpp"
#include "pixshift/errors.hpp"
#include "pixshift/geometry.hpp"
#include "pixshift/image.hpp"
#include "pixshift/interpolation.hpp"

namespace ps {
namespace detail {

// 一個 primitive 在兩種表示法上的實作；nullptr = 沒有後端
template <typename... Args>
struct Kernel {
    Primitive primitive;
    ObjectImage (*object_fn)(const ObjectImage&, Args...);
    ArrayImage (*array_fn)(const ArrayImage&, Args...);
};

// 空的 Image（含包著空 buffer 或被 move 走的影像）一律丟 TypeMismatch
inline void require_image(const Image& img, Primitive primitive) {
    const bool empty = img.representation() == Representation::None
                       || (img.is_object() && img.object().empty())
                       || (img.is_array() && img.array().empty());
    if (empty) {
        throw TypeMismatch(std::string(to_string(primitive))
                           + ": img should be an object or array image");
    }
}

template <typename... Args, typename... Ts>
Image dispatch(const Kernel<Args...>& kernel, const Image& img, Ts&&... args) {
    require_image(img, kernel.primitive);
    switch (img.representation()) {
    case Representation::Object:
        if (!kernel.object_fn) {
            throw UnsupportedRepresentation(to_string(kernel.primitive),
                                            to_string(Representation::Object));
        }
        return Image(kernel.object_fn(img.object(), std::forward<Ts>(args)...));
    case Representation::Array:
        if (!kernel.array_fn) {
            throw UnsupportedRepresentation(to_string(kernel.primitive),
                                            to_string(Representation::Array));
        }
        return Image(kernel.array_fn(img.array(), std::forward<Ts>(args)...));
    case Representation::None:
    default:
        return Image();
    }
}

// 能力表：程序啟動時就固定，之後唯讀
extern const Kernel<int, int, int, int> kCropKernel;
extern const Kernel<const Padding&, const std::vector<double>&, PaddingMode> kPadKernel;
extern const Kernel<int, int, InterpolationMode> kResizeKernel;
extern const Kernel<> kHFlipKernel;
extern const Kernel<> kVFlipKernel;
extern const Kernel<const AffineMatrix&, int, int, InterpolationMode,
                    const std::vector<double>&> kRotateKernel;
extern const Kernel<double> kBrightnessKernel;
extern const Kernel<double> kContrastKernel;
extern const Kernel<double> kSaturationKernel;
extern const Kernel<double> kHueKernel;
extern const Kernel<int> kGrayscaleKernel;
extern const Kernel<const std::vector<float>&, const std::vector<float>&> kGaussianBlurKernel;
extern const Kernel<const std::vector<double>&, const std::vector<double>&> kNormalizeKernel;

} // namespace detail
} // namespace ps
