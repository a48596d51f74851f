#include "pixshift/io.hpp"
#include "pixshift/errors.hpp"
#include "pixshift/logger.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>
#include <string>

#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image.h"
#include "stb_image_write.h"

namespace ps {

namespace {

constexpr int kJpegQuality = 95;

enum class FileFormat {
    Png,
    Jpeg,
};

// 副檔名不分大小寫
FileFormat format_from_path(const std::string& path) {
    const std::size_t dot = path.find_last_of('.');
    std::string ext = (dot == std::string::npos) ? std::string() : path.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    if (ext == "png") return FileFormat::Png;
    if (ext == "jpg" || ext == "jpeg") return FileFormat::Jpeg;
    throw ValidationError("save_image: unsupported extension (use .png/.jpg): " + path);
}

} // namespace

ObjectImage load_image(const std::string& path) {
    // stbi_info 先拿到檔案本身的通道數，載入時維持不變
    int w = 0, h = 0, channels = 0;
    if (!stbi_info(path.c_str(), &w, &h, &channels))
        throw std::runtime_error("load_image: cannot read " + path + " (" + stbi_failure_reason() + ")");

    const Mode mode = mode_from_channels(channels);

    int loaded_channels = 0;
    stbi_uc* pixels = stbi_load(path.c_str(), &w, &h, &loaded_channels, channels);
    if (!pixels)
        throw std::runtime_error("load_image: cannot decode " + path + " (" + stbi_failure_reason() + ")");

    // 零拷貝：buffer 由 stb 配置，最後一個持有者釋放
    std::shared_ptr<uint8_t[]> buffer(pixels, [](uint8_t* p) { stbi_image_free(p); });

    log::info("load_image: " + path + " " + std::to_string(w) + "x" + std::to_string(h)
              + " mode=" + to_string(mode));
    return ObjectImage(h, w, mode, std::move(buffer));
}

void save_image(const std::string& path, const ObjectImage& img) {
    if (img.empty()) throw ValidationError("save_image: empty image");

    const FileFormat format = format_from_path(path);
    const int C = img.c();

    int ok = 0;
    switch (format) {
    case FileFormat::Png:
        ok = stbi_write_png(path.c_str(), img.w(), img.h(), C, img.data(), img.w() * C);
        break;
    case FileFormat::Jpeg:
        if (C != 1 && C != 3) {
            throw ValidationError(std::string("save_image: jpg cannot store mode ")
                                  + to_string(img.mode()));
        }
        ok = stbi_write_jpg(path.c_str(), img.w(), img.h(), C, img.data(), kJpegQuality);
        break;
    }
    if (!ok) throw std::runtime_error("save_image: failed to write " + path);

    log::info("save_image: " + path);
}

} // namespace ps
