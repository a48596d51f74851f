#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include "pixshift/pixshift.hpp"
#include "pixshift/io.hpp"

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace py = pybind11;

namespace pspy {

using ps::ArrayImage;
using ps::Image;
using ps::InterpolationMode;
using ps::ObjectImage;

// ------------------------------------------------------------
// uint8 HxW / HxWxC → ObjectImage（零拷貝）
// ------------------------------------------------------------
static ObjectImage numpy_to_object_zero_copy(const py::array& array) {
    if (!py::isinstance<py::array_t<uint8_t>>(array))
        throw py::type_error("expected a uint8 array");
    py::buffer_info info = array.request();
    if (info.ndim != 2 && info.ndim != 3)
        throw py::value_error("expected HxW or HxWxC uint8 array");

    const int h = static_cast<int>(info.shape[0]);
    const int w = static_cast<int>(info.shape[1]);
    const int c = (info.ndim == 3) ? static_cast<int>(info.shape[2]) : 1;

    // C-contiguous 檢查
    const bool contiguous = (info.ndim == 2)
        ? (info.strides[0] == static_cast<py::ssize_t>(w) && info.strides[1] == 1)
        : (info.strides[0] == static_cast<py::ssize_t>(w * c) &&
           info.strides[1] == static_cast<py::ssize_t>(c) &&
           info.strides[2] == 1);
    if (!contiguous) throw py::value_error("expected C-contiguous uint8 array");

    auto* ptr = static_cast<uint8_t*>(info.ptr);

    // 持有原始 numpy 陣列，確保其生命週期 >= ObjectImage
    py::object owner = array;
    std::shared_ptr<uint8_t[]> sp(ptr, [owner](uint8_t*) mutable {
        // 不 delete ptr，numpy 擁有這塊記憶體
    });

    return ObjectImage(h, w, ps::mode_from_channels(c), std::move(sp));
}

// ------------------------------------------------------------
// float32 (..., C, H, W) → ArrayImage（零拷貝）
// ------------------------------------------------------------
static ArrayImage numpy_to_array_zero_copy(const py::array& array) {
    if (!py::isinstance<py::array_t<float>>(array))
        throw py::type_error("expected a float32 array");
    py::buffer_info info = array.request();
    if (info.ndim < 3)
        throw py::value_error("expected a float32 array of shape (..., C, H, W)");

    std::vector<std::int64_t> shape(info.shape.begin(), info.shape.end());

    py::ssize_t expected = static_cast<py::ssize_t>(sizeof(float));
    for (py::ssize_t i = info.ndim - 1; i >= 0; --i) {
        if (info.strides[static_cast<std::size_t>(i)] != expected)
            throw py::value_error("expected C-contiguous float32 array");
        expected *= info.shape[static_cast<std::size_t>(i)];
    }

    auto* ptr = static_cast<float*>(info.ptr);
    py::object owner = array;
    std::shared_ptr<float[]> sp(ptr, [owner](float*) mutable {});

    return ArrayImage(std::move(shape), std::move(sp));
}

// dtype 決定表示法：uint8 → 物件式，float32 → array
static Image numpy_to_image(const py::array& array) {
    if (py::isinstance<py::array_t<uint8_t>>(array))
        return Image(numpy_to_object_zero_copy(array));
    if (py::isinstance<py::array_t<float>>(array))
        return Image(numpy_to_array_zero_copy(array));
    throw py::type_error("img should be a uint8 (HxW[xC]) or float32 (..., C, H, W) numpy array");
}

// ------------------------------------------------------------
// Image → numpy（零拷貝，capsule 持有 shared_ptr 副本）
// ------------------------------------------------------------
static py::array object_to_numpy(const ObjectImage& img) {
    const int h = img.h();
    const int w = img.w();
    const int c = img.c();

    std::vector<py::ssize_t> shape;
    std::vector<py::ssize_t> strides;
    if (c == 1) {
        shape   = {h, w};
        strides = {static_cast<py::ssize_t>(w), 1};
    } else {
        shape   = {h, w, c};
        strides = {static_cast<py::ssize_t>(w * c), static_cast<py::ssize_t>(c), 1};
    }

    auto* sp_copy = new std::shared_ptr<uint8_t[]>(img.shared());
    py::capsule base(sp_copy, [](void* p) {
        delete reinterpret_cast<std::shared_ptr<uint8_t[]>*>(p);
    });
    return py::array(py::dtype::of<uint8_t>(), shape, strides, img.data(), base);
}

static py::array array_to_numpy(const ArrayImage& img) {
    std::vector<py::ssize_t> shape(img.shape().begin(), img.shape().end());

    auto* sp_copy = new std::shared_ptr<float[]>(img.shared());
    py::capsule base(sp_copy, [](void* p) {
        delete reinterpret_cast<std::shared_ptr<float[]>*>(p);
    });
    return py::array(py::dtype::of<float>(), shape, img.data(), base);
}

static py::array image_to_numpy(const Image& img) {
    if (img.is_object()) return object_to_numpy(img.object());
    return array_to_numpy(img.array());
}

static py::list images_to_list(const std::vector<Image>& images) {
    py::list out;
    for (const Image& im : images) out.append(image_to_numpy(im));
    return out;
}

// ------------------------------------------------------------
// 參數轉換：int 或 sequence
// ------------------------------------------------------------
static std::vector<int> as_int_list(const py::object& obj) {
    if (py::isinstance<py::int_>(obj)) return {obj.cast<int>()};
    return obj.cast<std::vector<int>>();
}

static std::vector<double> as_float_list(const py::object& obj) {
    if (obj.is_none()) return {};
    if (py::isinstance<py::int_>(obj) || py::isinstance<py::float_>(obj))
        return {obj.cast<double>()};
    return obj.cast<std::vector<double>>();
}

// InterpolationMode 字串或舊版整數代碼
static InterpolationMode as_interpolation(const py::object& obj) {
    if (py::isinstance<py::int_>(obj)) return ps::interpolation_from_int(obj.cast<int>());
    return ps::interpolation_from_string(obj.cast<std::string>());
}

} // namespace pspy

// ------------------------------------------------------------
// pybind11 module
// ------------------------------------------------------------
PYBIND11_MODULE(_core, m) {
    using namespace pspy;

    m.doc() = "PixShift core (geometry / photometric transforms over object and array images)";

    py::register_exception<ps::ValidationError>(m, "ValidationError", PyExc_ValueError);
    py::register_exception<ps::TypeMismatch>(m, "TypeMismatch", PyExc_TypeError);
    py::register_exception<ps::UnsupportedRepresentation>(m, "UnsupportedRepresentation",
                                                          PyExc_NotImplementedError);

    m.def("set_log_level",
          [](const std::string& level) { ps::log::set_level(ps::log::level_from_string(level)); },
          py::arg("level"),
          "Set log level: error, warn or info.");

    // Image IO
    m.def("load_image",
          [](const std::string& path) { return object_to_numpy(ps::load_image(path)); },
          py::arg("path"),
          "Load image as uint8 numpy.ndarray (HxW or HxWxC) with zero-copy.");

    m.def("save_image",
          [](const std::string& path, const py::array& img) {
              ps::save_image(path, numpy_to_object_zero_copy(img));
          },
          py::arg("path"), py::arg("img"),
          "Save uint8 numpy.ndarray to file (.png/.jpg).");

    // 表示法轉換
    m.def("to_tensor",
          [](const py::array& img) {
              return array_to_numpy(ps::to_array(numpy_to_object_zero_copy(img)));
          },
          py::arg("img"),
          "uint8 HxWxC -> float32 CxHxW scaled to [0, 1].");

    m.def("to_pil_image",
          [](const py::array& img) {
              return object_to_numpy(ps::to_object(numpy_to_array_zero_copy(img)));
          },
          py::arg("img"),
          "float32 CxHxW in [0, 1] -> uint8 HxWxC.");

    // -------------------- Geometry --------------------
    m.def("crop",
          [](const py::array& img, int top, int left, int height, int width) {
              return image_to_numpy(ps::crop(numpy_to_image(img), top, left, height, width));
          },
          py::arg("img"), py::arg("top"), py::arg("left"), py::arg("height"), py::arg("width"),
          "Crop (height, width) at (top, left); out-of-bounds area is zero padded.");

    m.def("pad",
          [](const py::array& img, const py::object& padding, const py::object& fill,
             const std::string& padding_mode) {
              return image_to_numpy(ps::pad(numpy_to_image(img), as_int_list(padding),
                                            as_float_list(fill),
                                            ps::padding_mode_from_string(padding_mode)));
          },
          py::arg("img"), py::arg("padding"), py::arg("fill") = 0,
          py::arg("padding_mode") = "constant",
          "Pad on all sides: constant, edge, reflect or symmetric.");

    m.def("center_crop",
          [](const py::array& img, const py::object& output_size) {
              return image_to_numpy(ps::center_crop(numpy_to_image(img), as_int_list(output_size)));
          },
          py::arg("img"), py::arg("output_size"),
          "Center crop; pads with zeros when the crop is larger than the image.");

    m.def("resize",
          [](const py::array& img, const py::object& size, const py::object& interpolation) {
              return image_to_numpy(ps::resize(numpy_to_image(img), as_int_list(size),
                                               as_interpolation(interpolation)));
          },
          py::arg("img"), py::arg("size"), py::arg("interpolation") = "bilinear",
          "Resize; an int size matches the shorter edge.");

    m.def("resized_crop",
          [](const py::array& img, int top, int left, int height, int width,
             const py::object& size, const py::object& interpolation) {
              return image_to_numpy(ps::resized_crop(numpy_to_image(img), top, left, height, width,
                                                     as_int_list(size),
                                                     as_interpolation(interpolation)));
          },
          py::arg("img"), py::arg("top"), py::arg("left"), py::arg("height"), py::arg("width"),
          py::arg("size"), py::arg("interpolation") = "bilinear",
          "Crop then resize.");

    m.def("hflip",
          [](const py::array& img) { return image_to_numpy(ps::hflip(numpy_to_image(img))); },
          py::arg("img"),
          "Flip image horizontally.");

    m.def("vflip",
          [](const py::array& img) { return image_to_numpy(ps::vflip(numpy_to_image(img))); },
          py::arg("img"),
          "Flip image vertically.");

    m.def("five_crop",
          [](const py::array& img, const py::object& size) {
              return images_to_list(ps::five_crop(numpy_to_image(img), as_int_list(size)));
          },
          py::arg("img"), py::arg("size"),
          "Four corner crops and the center crop.");

    m.def("ten_crop",
          [](const py::array& img, const py::object& size, bool vertical_flip) {
              return images_to_list(ps::ten_crop(numpy_to_image(img), as_int_list(size),
                                                 vertical_flip));
          },
          py::arg("img"), py::arg("size"), py::arg("vertical_flip") = false,
          "five_crop of the image and of its flipped version.");

    m.def("rotate",
          [](const py::array& img, double angle, const py::object& interpolation, bool expand,
             const py::object& center, const py::object& fill) {
              return image_to_numpy(ps::rotate(numpy_to_image(img), angle,
                                               as_interpolation(interpolation), expand,
                                               as_float_list(center), as_float_list(fill)));
          },
          py::arg("img"), py::arg("angle"), py::arg("interpolation") = "nearest",
          py::arg("expand") = false, py::arg("center") = py::none(), py::arg("fill") = 0,
          "Rotate counter-clockwise by angle degrees.");

    m.def("inverse_affine_matrix",
          [](std::array<double, 2> center, double angle, std::array<double, 2> translate,
             double scale, std::array<double, 2> shear) {
              return ps::inverse_affine_matrix(center, angle, translate, scale, shear);
          },
          py::arg("center"), py::arg("angle"), py::arg("translate"), py::arg("scale"),
          py::arg("shear"),
          "Inverse 2x3 affine matrix [a, b, c, d, e, f].");

    // -------------------- Color & tone --------------------
    m.def("adjust_brightness",
          [](const py::array& img, double factor) {
              return image_to_numpy(ps::adjust_brightness(numpy_to_image(img), factor));
          },
          py::arg("img"), py::arg("brightness_factor"));

    m.def("adjust_contrast",
          [](const py::array& img, double factor) {
              return image_to_numpy(ps::adjust_contrast(numpy_to_image(img), factor));
          },
          py::arg("img"), py::arg("contrast_factor"));

    m.def("adjust_saturation",
          [](const py::array& img, double factor) {
              return image_to_numpy(ps::adjust_saturation(numpy_to_image(img), factor));
          },
          py::arg("img"), py::arg("saturation_factor"));

    m.def("adjust_hue",
          [](const py::array& img, double factor) {
              return image_to_numpy(ps::adjust_hue(numpy_to_image(img), factor));
          },
          py::arg("img"), py::arg("hue_factor"));

    m.def("rgb_to_grayscale",
          [](const py::array& img, int num_output_channels) {
              return image_to_numpy(ps::rgb_to_grayscale(numpy_to_image(img), num_output_channels));
          },
          py::arg("img"), py::arg("num_output_channels") = 1);

    m.def("normalize",
          [](const py::array& img, const py::object& mean, const py::object& stddev, bool inplace) {
              // 唯讀的 array（broadcast_to、frombuffer 等）不能原地改寫
              if (inplace && !img.writeable())
                  throw py::value_error("normalize: inplace=True requires a writeable array");
              Image in = numpy_to_image(img);
              if (inplace) {
                  // 零拷貝，所以直接改到原本的 numpy buffer
                  ps::normalize_inplace(in, as_float_list(mean), as_float_list(stddev));
                  return image_to_numpy(in);
              }
              return image_to_numpy(ps::normalize(in, as_float_list(mean), as_float_list(stddev)));
          },
          py::arg("tensor"), py::arg("mean"), py::arg("std"), py::arg("inplace") = false);

    // -------------------- Filters --------------------
    m.def("gaussian_blur",
          [](const py::array& img, const py::object& kernel_size, const py::object& sigma) {
              return image_to_numpy(ps::gaussian_blur(numpy_to_image(img), as_int_list(kernel_size),
                                                      as_float_list(sigma)));
          },
          py::arg("img"), py::arg("kernel_size"), py::arg("sigma") = py::none(),
          "Separable Gaussian blur; sigma defaults to 0.15 * ksize + 0.35.");
}
