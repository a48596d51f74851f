#include "pixshift/image.hpp"
#include "pixshift/errors.hpp"

#include <algorithm>
#include <string>

namespace ps {

int mode_channels(Mode mode) {
    switch (mode) {
    case Mode::L:    return 1;
    case Mode::LA:   return 2;
    case Mode::RGB:  return 3;
    case Mode::RGBA: return 4;
    }
    return 1;
}

Mode mode_from_channels(int channels) {
    switch (channels) {
    case 1: return Mode::L;
    case 2: return Mode::LA;
    case 3: return Mode::RGB;
    case 4: return Mode::RGBA;
    default:
        throw ValidationError("mode_from_channels: channels must be in [1, 4], got "
                              + std::to_string(channels));
    }
}

const char* to_string(Mode mode) {
    switch (mode) {
    case Mode::L:    return "L";
    case Mode::LA:   return "LA";
    case Mode::RGB:  return "RGB";
    case Mode::RGBA: return "RGBA";
    }
    return "?";
}

const char* to_string(Representation rep) {
    switch (rep) {
    case Representation::Object: return "object";
    case Representation::Array:  return "array";
    case Representation::None:
    default:
        return "empty";
    }
}

// ======================
//  ObjectImage
// ======================

ObjectImage::ObjectImage(int h, int w, Mode mode)
    : h_(h), w_(w), mode_(mode)
{
    if (h <= 0 || w <= 0)
        throw ValidationError("ObjectImage: invalid shape");
    const std::size_t n = static_cast<std::size_t>(h_) * w_ * c();
    data_ = std::shared_ptr<uint8_t[]>(new uint8_t[n](), std::default_delete<uint8_t[]>());
}

ObjectImage::ObjectImage(int h, int w, Mode mode, std::shared_ptr<uint8_t[]> external)
    : h_(h), w_(w), mode_(mode), data_(std::move(external))
{
    if (!data_) throw ValidationError("ObjectImage: null external buffer");
    if (h <= 0 || w <= 0)
        throw ValidationError("ObjectImage: invalid shape");
}

Pixel ObjectImage::get_pixel(int x, int y) const {
    if (x < 0 || x >= w_ || y < 0 || y >= h_)
        throw ValidationError("get_pixel: coordinate out of range");
    const int C = c();
    const uint8_t* p = data_.get() + (static_cast<std::size_t>(y) * w_ + x) * C;
    Pixel px{0, 0, 0, 0};
    std::copy(p, p + C, px.begin());
    return px;
}

void ObjectImage::put_pixel(int x, int y, const Pixel& px) {
    if (x < 0 || x >= w_ || y < 0 || y >= h_)
        throw ValidationError("put_pixel: coordinate out of range");
    const int C = c();
    uint8_t* p = data_.get() + (static_cast<std::size_t>(y) * w_ + x) * C;
    std::copy(px.begin(), px.begin() + C, p);
}

ObjectImage ObjectImage::clone() const {
    if (empty()) return ObjectImage();
    ObjectImage dst(h_, w_, mode_);
    const std::size_t n = static_cast<std::size_t>(h_) * w_ * c();
    std::copy(data_.get(), data_.get() + n, dst.data());
    return dst;
}

// ======================
//  ArrayImage
// ======================

static void check_array_shape(const std::vector<std::int64_t>& shape) {
    if (shape.size() < 3)
        throw ValidationError("ArrayImage: expected shape [..., C, H, W]");
    for (std::int64_t d : shape) {
        if (d <= 0) throw ValidationError("ArrayImage: invalid shape");
    }
    const std::int64_t c = shape[shape.size() - 3];
    if (c < 1 || c > 4)
        throw ValidationError("ArrayImage: channels must be in [1, 4], got "
                              + std::to_string(c));
}

static std::size_t shape_numel(const std::vector<std::int64_t>& shape) {
    std::size_t n = 1;
    for (std::int64_t d : shape) n *= static_cast<std::size_t>(d);
    return n;
}

ArrayImage::ArrayImage(std::vector<std::int64_t> shape)
    : shape_(std::move(shape))
{
    check_array_shape(shape_);
    const std::size_t n = shape_numel(shape_);
    data_ = std::shared_ptr<float[]>(new float[n](), std::default_delete<float[]>());
}

ArrayImage::ArrayImage(std::vector<std::int64_t> shape, std::shared_ptr<float[]> external)
    : shape_(std::move(shape)), data_(std::move(external))
{
    if (!data_) throw ValidationError("ArrayImage: null external buffer");
    check_array_shape(shape_);
}

ArrayImage::ArrayImage(int c, int h, int w)
    : ArrayImage(std::vector<std::int64_t>{c, h, w}) {}

std::size_t ArrayImage::batch() const {
    std::size_t n = 1;
    for (std::size_t i = 0; i + 3 < shape_.size(); ++i)
        n *= static_cast<std::size_t>(shape_[i]);
    return n;
}

std::size_t ArrayImage::numel() const {
    return shape_.empty() ? 0 : shape_numel(shape_);
}

float& ArrayImage::at(std::size_t plane, int y, int x) {
    return data_[(plane * h() + y) * static_cast<std::size_t>(w()) + x];
}

const float& ArrayImage::at(std::size_t plane, int y, int x) const {
    return data_[(plane * h() + y) * static_cast<std::size_t>(w()) + x];
}

std::vector<std::int64_t> ArrayImage::reshaped(int c, int h, int w) const {
    std::vector<std::int64_t> out(shape_.begin(), shape_.end() - 3);
    out.push_back(c);
    out.push_back(h);
    out.push_back(w);
    return out;
}

ArrayImage ArrayImage::clone() const {
    if (empty()) return ArrayImage();
    ArrayImage dst(shape_);
    std::copy(data_.get(), data_.get() + numel(), dst.data());
    return dst;
}

// ======================
//  Image
// ======================

Representation Image::representation() const {
    if (is_object()) return Representation::Object;
    if (is_array())  return Representation::Array;
    return Representation::None;
}

ObjectImage& Image::object() {
    if (!is_object()) throw TypeMismatch("Image: not an object image");
    return std::get<ObjectImage>(v_);
}

const ObjectImage& Image::object() const {
    if (!is_object()) throw TypeMismatch("Image: not an object image");
    return std::get<ObjectImage>(v_);
}

ArrayImage& Image::array() {
    if (!is_array()) throw TypeMismatch("Image: not an array image");
    return std::get<ArrayImage>(v_);
}

const ArrayImage& Image::array() const {
    if (!is_array()) throw TypeMismatch("Image: not an array image");
    return std::get<ArrayImage>(v_);
}

Size Image::size() const {
    if (is_object()) return object().size();
    if (is_array())  return array().size();
    throw TypeMismatch("Image: expected an object or array image");
}

int Image::channels() const {
    if (is_object()) return object().c();
    if (is_array())  return array().c();
    throw TypeMismatch("Image: expected an object or array image");
}

Image Image::clone() const {
    if (is_object()) return Image(object().clone());
    if (is_array())  return Image(array().clone());
    return Image();
}

} // namespace ps
