#include "dispatch_table.hpp"

#include "array_backend.hpp"
#include "object_backend.hpp"

namespace ps {
namespace detail {

const Kernel<int, int, int, int> kCropKernel{
    Primitive::Crop, &object_backend::crop, &array_backend::crop};

const Kernel<const Padding&, const std::vector<double>&, PaddingMode> kPadKernel{
    Primitive::Pad, &object_backend::pad, &array_backend::pad};

const Kernel<int, int, InterpolationMode> kResizeKernel{
    Primitive::Resize, &object_backend::resize, &array_backend::resize};

const Kernel<> kHFlipKernel{
    Primitive::HFlip, &object_backend::hflip, &array_backend::hflip};

const Kernel<> kVFlipKernel{
    Primitive::VFlip, &object_backend::vflip, &array_backend::vflip};

// array 版 rotate 尚未實作：明確 fail-fast，不做近似
const Kernel<const AffineMatrix&, int, int, InterpolationMode,
             const std::vector<double>&> kRotateKernel{
    Primitive::Rotate, &object_backend::affine, nullptr};

const Kernel<double> kBrightnessKernel{
    Primitive::AdjustBrightness, &object_backend::adjust_brightness,
    &array_backend::adjust_brightness};

const Kernel<double> kContrastKernel{
    Primitive::AdjustContrast, &object_backend::adjust_contrast,
    &array_backend::adjust_contrast};

const Kernel<double> kSaturationKernel{
    Primitive::AdjustSaturation, &object_backend::adjust_saturation,
    &array_backend::adjust_saturation};

const Kernel<double> kHueKernel{
    Primitive::AdjustHue, &object_backend::adjust_hue, &array_backend::adjust_hue};

const Kernel<int> kGrayscaleKernel{
    Primitive::RgbToGrayscale, &object_backend::rgb_to_grayscale,
    &array_backend::rgb_to_grayscale};

// 物件式影像由 gaussian_blur() 先轉成 array
const Kernel<const std::vector<float>&, const std::vector<float>&> kGaussianBlurKernel{
    Primitive::GaussianBlur, nullptr, &array_backend::gaussian_blur};

const Kernel<const std::vector<double>&, const std::vector<double>&> kNormalizeKernel{
    Primitive::Normalize, nullptr, &array_backend::normalize};

namespace {

struct Capability {
    Primitive primitive;
    bool object;
    bool array;
};

template <typename... Args>
Capability capability_of(const Kernel<Args...>& k) {
    return {k.primitive, k.object_fn != nullptr, k.array_fn != nullptr};
}

const std::vector<Capability>& capability_table() {
    static const std::vector<Capability> table = {
        capability_of(kCropKernel),
        capability_of(kPadKernel),
        capability_of(kResizeKernel),
        capability_of(kHFlipKernel),
        capability_of(kVFlipKernel),
        capability_of(kRotateKernel),
        capability_of(kBrightnessKernel),
        capability_of(kContrastKernel),
        capability_of(kSaturationKernel),
        capability_of(kHueKernel),
        capability_of(kGrayscaleKernel),
        capability_of(kGaussianBlurKernel),
        capability_of(kNormalizeKernel),
    };
    return table;
}

} // namespace
} // namespace detail

const char* to_string(Primitive primitive) {
    switch (primitive) {
    case Primitive::Crop:             return "crop";
    case Primitive::Pad:              return "pad";
    case Primitive::Resize:           return "resize";
    case Primitive::HFlip:            return "hflip";
    case Primitive::VFlip:            return "vflip";
    case Primitive::Rotate:           return "rotate";
    case Primitive::AdjustBrightness: return "adjust_brightness";
    case Primitive::AdjustContrast:   return "adjust_contrast";
    case Primitive::AdjustSaturation: return "adjust_saturation";
    case Primitive::AdjustHue:        return "adjust_hue";
    case Primitive::RgbToGrayscale:   return "rgb_to_grayscale";
    case Primitive::GaussianBlur:     return "gaussian_blur";
    case Primitive::Normalize:        return "normalize";
    }
    return "?";
}

bool supports(Primitive primitive, Representation rep) {
    for (const auto& cap : detail::capability_table()) {
        if (cap.primitive != primitive) continue;
        if (rep == Representation::Object) return cap.object;
        if (rep == Representation::Array)  return cap.array;
        return false;
    }
    return false;
}

} // namespace ps
