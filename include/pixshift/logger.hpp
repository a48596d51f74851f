#pragma once

#include <string>

namespace ps {
namespace log {

enum class Level {
    Error = 0,
    Warn = 1,
    Info = 2,
};

// 預設 Level::Warn；第一次使用時會讀取環境變數 PIXSHIFT_LOG_LEVEL
void set_level(Level level);
Level level();

// "error" / "warn" / "info"，其他字串丟 std::invalid_argument
Level level_from_string(const std::string& name);

void info(const std::string& message);
void warn(const std::string& message);
void error(const std::string& message);

} // namespace log
} // namespace ps
