#pragma once

#include <stdexcept>
#include <string>

namespace ps {

// 參數錯誤：一律在任何像素運算之前丟出
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& what)
        : std::invalid_argument(what) {}
};

// 既不是 ObjectImage 也不是 ArrayImage（例如空的 Image）
class TypeMismatch : public std::invalid_argument {
public:
    explicit TypeMismatch(const std::string& what)
        : std::invalid_argument(what) {}
};

// 該表示法沒有對應的後端實作
class UnsupportedRepresentation : public std::runtime_error {
public:
    UnsupportedRepresentation(const std::string& primitive,
                              const std::string& representation)
        : std::runtime_error(primitive + ": not supported for " + representation + " images"),
          primitive_(primitive),
          representation_(representation) {}

    const std::string& primitive() const { return primitive_; }
    const std::string& representation() const { return representation_; }

private:
    std::string primitive_;
    std::string representation_;
};

} // namespace ps
