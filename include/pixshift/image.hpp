#pragma once
#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace ps {

using std::uint8_t;

// 物件式影像的色彩模式，決定通道數
enum class Mode {
    L,      // 1 channel
    LA,     // 2 channels
    RGB,    // 3 channels
    RGBA,   // 4 channels
};

int mode_channels(Mode mode);
Mode mode_from_channels(int channels);
const char* to_string(Mode mode);

enum class Representation {
    None,
    Object,
    Array,
};

const char* to_string(Representation rep);

struct Size {
    int width  = 0;
    int height = 0;
};

// 一個像素最多 4 個通道，多出來的欄位不使用
using Pixel = std::array<uint8_t, 4>;

// ------------------------------------------------------------
// ObjectImage：2-D、row-major、HxWxC uint8，帶色彩模式
// ------------------------------------------------------------
class ObjectImage {
public:
    ObjectImage() = default;

    // 自行配置，像素初始化為 0
    ObjectImage(int h, int w, Mode mode);

    // 共享外部緩衝區（零拷貝）
    ObjectImage(int h, int w, Mode mode, std::shared_ptr<uint8_t[]> external);

    // 不允許複製（避免意外深拷），需要副本請用 clone()
    ObjectImage(const ObjectImage&)            = delete;
    ObjectImage& operator=(const ObjectImage&) = delete;

    ObjectImage(ObjectImage&&)            = default;
    ObjectImage& operator=(ObjectImage&&) = default;

    int  h() const { return h_; }
    int  w() const { return w_; }
    int  c() const { return mode_channels(mode_); }
    Mode mode() const { return mode_; }
    bool empty() const { return !data_; }
    Size size() const { return {w_, h_}; }

    Pixel get_pixel(int x, int y) const;
    void  put_pixel(int x, int y, const Pixel& px);

    uint8_t*       data()       { return data_.get(); }
    const uint8_t* data() const { return data_.get(); }

    const std::shared_ptr<uint8_t[]>& shared() const { return data_; }

    ObjectImage clone() const;

private:
    int  h_ = 0, w_ = 0;
    Mode mode_ = Mode::L;
    std::shared_ptr<uint8_t[]> data_;
};

// ------------------------------------------------------------
// ArrayImage：float32，shape = [..., C, H, W]
// ------------------------------------------------------------
class ArrayImage {
public:
    ArrayImage() = default;

    explicit ArrayImage(std::vector<std::int64_t> shape);
    ArrayImage(std::vector<std::int64_t> shape, std::shared_ptr<float[]> external);

    // 便利建構：[C, H, W]
    ArrayImage(int c, int h, int w);

    ArrayImage(const ArrayImage&)            = delete;
    ArrayImage& operator=(const ArrayImage&) = delete;

    ArrayImage(ArrayImage&&)            = default;
    ArrayImage& operator=(ArrayImage&&) = default;

    const std::vector<std::int64_t>& shape() const { return shape_; }
    int ndim() const { return static_cast<int>(shape_.size()); }

    // 空影像（shape 不足 3 維）回傳 0
    int h() const { return shape_.size() < 3 ? 0 : static_cast<int>(shape_[shape_.size() - 2]); }
    int w() const { return shape_.size() < 3 ? 0 : static_cast<int>(shape_[shape_.size() - 1]); }
    int c() const { return shape_.size() < 3 ? 0 : static_cast<int>(shape_[shape_.size() - 3]); }

    // 前導 batch 維度的乘積
    std::size_t batch() const;
    // batch * C：逐一處理的 HxW 平面數
    std::size_t planes() const { return batch() * static_cast<std::size_t>(c()); }
    std::size_t numel() const;
    bool empty() const { return !data_; }
    Size size() const { return {w(), h()}; }

    float&       at(std::size_t plane, int y, int x);
    const float& at(std::size_t plane, int y, int x) const;

    float*       data()       { return data_.get(); }
    const float* data() const { return data_.get(); }

    const std::shared_ptr<float[]>& shared() const { return data_; }

    // 同樣的前導維度，換掉 C/H/W
    std::vector<std::int64_t> reshaped(int c, int h, int w) const;

    ArrayImage clone() const;

private:
    std::vector<std::int64_t> shape_;
    std::shared_ptr<float[]> data_;
};

// ------------------------------------------------------------
// Image：封閉的多型值，只能是 ObjectImage 或 ArrayImage
// ------------------------------------------------------------
class Image {
public:
    Image() = default;
    Image(ObjectImage img) : v_(std::move(img)) {}
    Image(ArrayImage img) : v_(std::move(img)) {}

    Image(Image&&)            = default;
    Image& operator=(Image&&) = default;

    Representation representation() const;
    bool is_object() const { return std::holds_alternative<ObjectImage>(v_); }
    bool is_array() const { return std::holds_alternative<ArrayImage>(v_); }

    // 型別不符時丟 TypeMismatch
    ObjectImage&       object();
    const ObjectImage& object() const;
    ArrayImage&        array();
    const ArrayImage&  array() const;

    Size size() const;
    int  channels() const;

    Image clone() const;

private:
    std::variant<std::monostate, ObjectImage, ArrayImage> v_;
};

} // namespace ps
