#include "pixshift/convert.hpp"
#include "pixshift/errors.hpp"

#include "detail.hpp"

#include <string>

namespace ps {

// HWC -> CHW，乘上 scale
static ArrayImage object_to_array(const ObjectImage& img, float scale) {
    if (img.empty()) throw ValidationError("to_array: empty image");

    const int H = img.h();
    const int W = img.w();
    const int C = img.c();
    const uint8_t* in = img.data();

    ArrayImage dst(C, H, W);
    for (int c = 0; c < C; ++c) {
        for (int y = 0; y < H; ++y) {
            for (int x = 0; x < W; ++x) {
                dst.at(static_cast<std::size_t>(c), y, x) =
                    static_cast<float>(in[detail::idx(y, x, c, W, C)]) * scale;
            }
        }
    }
    return dst;
}

ArrayImage to_array(const ObjectImage& img) {
    return object_to_array(img, 1.0f / 255.0f);
}

ArrayImage to_array_raw(const ObjectImage& img) {
    return object_to_array(img, 1.0f);
}

ObjectImage to_object(const ArrayImage& img, Mode mode) {
    if (img.empty()) throw ValidationError("to_object: empty image");
    if (img.ndim() != 3) {
        throw ValidationError("to_object: expected a [C, H, W] array, got "
                              + std::to_string(img.ndim()) + " dimensions");
    }
    if (mode_channels(mode) != img.c()) {
        throw ValidationError(std::string("to_object: incorrect mode ") + to_string(mode)
                              + " supplied for " + std::to_string(img.c()) + " channels");
    }

    const int H = img.h();
    const int W = img.w();
    const int C = img.c();

    ObjectImage dst(H, W, mode);
    uint8_t* out = dst.data();
    for (int c = 0; c < C; ++c) {
        for (int y = 0; y < H; ++y) {
            for (int x = 0; x < W; ++x) {
                out[detail::idx(y, x, c, W, C)] =
                    detail::to_u8(img.at(static_cast<std::size_t>(c), y, x) * 255.0f);
            }
        }
    }
    return dst;
}

ObjectImage to_object(const ArrayImage& img) {
    if (img.empty()) throw ValidationError("to_object: empty image");
    return to_object(img, mode_from_channels(img.c()));
}

Size get_image_size(const Image& img) {
    return img.size();
}

int get_image_num_channels(const Image& img) {
    return img.channels();
}

} // namespace ps
