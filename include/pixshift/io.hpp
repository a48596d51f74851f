#pragma once

#include <string>
#include "pixshift/image.hpp"

namespace ps {

// 讀檔成物件式影像：保留原始通道數（L / LA / RGB / RGBA）
ObjectImage load_image(const std::string& path);

// 存檔：支援 .png / .jpg（jpg 不支援 alpha，LA / RGBA 會丟 ValidationError）
void save_image(const std::string& path, const ObjectImage& img);

} // namespace ps
