#include "pixshift/filters.hpp"
#include "pixshift/convert.hpp"
#include "pixshift/errors.hpp"

#include "dispatch_table.hpp"

#include <cmath>
#include <string>

namespace ps {

using detail::dispatch;
using detail::require_image;

// ============================================================
// Kernel 工具
// ============================================================

float default_gaussian_sigma(int ksize) {
    return 0.15f * static_cast<float>(ksize) + 0.35f;
}

std::vector<float> gaussian_kernel1d(int ksize, float sigma) {
    if (ksize <= 0 || ksize % 2 == 0) {
        throw ValidationError("gaussian_kernel1d: ksize must be odd and positive, got "
                              + std::to_string(ksize));
    }
    if (!(sigma > 0.f)) {
        throw ValidationError("gaussian_kernel1d: sigma must be > 0");
    }

    const float half = (ksize - 1) * 0.5f;

    std::vector<float> kernel(static_cast<std::size_t>(ksize));
    float sum = 0.f;
    for (int i = 0; i < ksize; ++i) {
        const float x = (static_cast<float>(i) - half) / sigma;
        const float v = std::exp(-0.5f * x * x);
        kernel[static_cast<std::size_t>(i)] = v;
        sum += v;
    }

    // 正規化使 sum = 1
    for (float& v : kernel) v /= sum;
    return kernel;
}

// ============================================================
// Gaussian blur
// ============================================================

Image gaussian_blur(const Image& img,
                    const std::vector<int>& kernel_size,
                    const std::vector<double>& sigma) {
    require_image(img, Primitive::GaussianBlur);

    int kx = 0, ky = 0;
    if (kernel_size.size() == 1) {
        kx = ky = kernel_size[0];
    } else if (kernel_size.size() == 2) {
        kx = kernel_size[0];
        ky = kernel_size[1];
    } else {
        throw ValidationError("gaussian_blur: if kernel_size is a sequence its length should be 2, got "
                              + std::to_string(kernel_size.size()));
    }
    for (int k : {kx, ky}) {
        if (k <= 0 || k % 2 == 0) {
            throw ValidationError("gaussian_blur: kernel_size should have odd and positive integers, got "
                                  + std::to_string(k));
        }
    }

    double sx = 0.0, sy = 0.0;
    if (sigma.empty()) {
        sx = default_gaussian_sigma(kx);
        sy = default_gaussian_sigma(ky);
    } else if (sigma.size() == 1) {
        sx = sy = sigma[0];
    } else if (sigma.size() == 2) {
        sx = sigma[0];
        sy = sigma[1];
    } else {
        throw ValidationError("gaussian_blur: if sigma is a sequence, its length should be 2, got "
                              + std::to_string(sigma.size()));
    }
    if (!(sx > 0.0) || !(sy > 0.0)) {
        throw ValidationError("gaussian_blur: sigma should have positive values");
    }

    const std::vector<float> kernel_x = gaussian_kernel1d(kx, static_cast<float>(sx));
    const std::vector<float> kernel_y = gaussian_kernel1d(ky, static_cast<float>(sy));

    if (img.is_object()) {
        // 物件式影像：轉成 array → 模糊 → 轉回原本的模式
        const ObjectImage& obj = img.object();
        const Image as_array(to_array(obj));
        const Image blurred = dispatch(detail::kGaussianBlurKernel, as_array, kernel_x, kernel_y);
        return Image(to_object(blurred.array(), obj.mode()));
    }

    return dispatch(detail::kGaussianBlurKernel, img, kernel_x, kernel_y);
}

Image gaussian_blur(const Image& img, int kernel_size) {
    return gaussian_blur(img, std::vector<int>{kernel_size}, std::vector<double>{});
}

Image gaussian_blur(const Image& img, int kernel_size, double sigma) {
    return gaussian_blur(img, std::vector<int>{kernel_size}, std::vector<double>{sigma});
}

} // namespace ps
