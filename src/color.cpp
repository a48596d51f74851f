#include "pixshift/color.hpp"
#include "pixshift/errors.hpp"

#include "array_backend.hpp"
#include "dispatch_table.hpp"

#include <cmath>
#include <string>

namespace ps {

using detail::dispatch;
using detail::require_image;

static void check_factor(double factor, const char* op) {
    if (!(factor >= 0.0) || !std::isfinite(factor)) {
        throw ValidationError(std::string(op) + ": factor must be non-negative, got "
                              + std::to_string(factor));
    }
}

Image adjust_brightness(const Image& img, double brightness_factor) {
    require_image(img, Primitive::AdjustBrightness);
    check_factor(brightness_factor, "adjust_brightness");
    return dispatch(detail::kBrightnessKernel, img, brightness_factor);
}

Image adjust_contrast(const Image& img, double contrast_factor) {
    require_image(img, Primitive::AdjustContrast);
    check_factor(contrast_factor, "adjust_contrast");
    return dispatch(detail::kContrastKernel, img, contrast_factor);
}

Image adjust_saturation(const Image& img, double saturation_factor) {
    require_image(img, Primitive::AdjustSaturation);
    check_factor(saturation_factor, "adjust_saturation");
    return dispatch(detail::kSaturationKernel, img, saturation_factor);
}

Image adjust_hue(const Image& img, double hue_factor) {
    require_image(img, Primitive::AdjustHue);
    if (!(hue_factor >= -0.5 && hue_factor <= 0.5)) {
        throw ValidationError("adjust_hue: hue_factor (" + std::to_string(hue_factor)
                              + ") is not in [-0.5, 0.5]");
    }
    const int C = img.channels();
    if (C != 1 && C != 3) {
        throw ValidationError("adjust_hue: expects a 1 or 3 channel image, got "
                              + std::to_string(C) + " channels");
    }
    return dispatch(detail::kHueKernel, img, hue_factor);
}

Image rgb_to_grayscale(const Image& img, int num_output_channels) {
    require_image(img, Primitive::RgbToGrayscale);
    if (num_output_channels != 1 && num_output_channels != 3) {
        throw ValidationError("rgb_to_grayscale: num_output_channels should be either 1 or 3, got "
                              + std::to_string(num_output_channels));
    }
    return dispatch(detail::kGrayscaleKernel, img, num_output_channels);
}

// ======================
//  Normalize
// ======================

static void check_normalize(const Image& img,
                            const std::vector<double>& mean,
                            const std::vector<double>& stddev) {
    require_image(img, Primitive::Normalize);
    if (!img.is_array()) {
        throw UnsupportedRepresentation(to_string(Primitive::Normalize),
                                        to_string(img.representation()));
    }

    const std::size_t C = static_cast<std::size_t>(img.channels());
    if (mean.empty() || (mean.size() != 1 && mean.size() != C))
        throw ValidationError("normalize: mean must have 1 or " + std::to_string(C) + " values");
    if (stddev.empty() || (stddev.size() != 1 && stddev.size() != C))
        throw ValidationError("normalize: std must have 1 or " + std::to_string(C) + " values");

    for (double s : stddev) {
        if (static_cast<float>(s) == 0.0f)
            throw ValidationError("normalize: std evaluated to zero, leading to division by zero");
    }
}

Image normalize(const Image& img,
                const std::vector<double>& mean,
                const std::vector<double>& stddev) {
    check_normalize(img, mean, stddev);
    return dispatch(detail::kNormalizeKernel, img, mean, stddev);
}

void normalize_inplace(Image& img,
                       const std::vector<double>& mean,
                       const std::vector<double>& stddev) {
    check_normalize(img, mean, stddev);
    array_backend::normalize_inplace(img.array(), mean, stddev);
}

} // namespace ps
