#include "pixshift/logger.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace ps {
namespace log {
namespace {

std::atomic<int> g_level{static_cast<int>(Level::Warn)};
std::once_flag g_env_once;

bool level_at_least(Level lv) {
    return g_level.load(std::memory_order_relaxed) >= static_cast<int>(lv);
}

// 不經過 load_env_level，call_once 裡面也能呼叫
void write_warn(const std::string& message) {
    if (!level_at_least(Level::Warn)) return;
    std::clog << "[WARN] " << message << "\n";
}

void load_env_level() {
    std::call_once(g_env_once, [] {
        const char* env = std::getenv("PIXSHIFT_LOG_LEVEL");
        if (!env || !*env) return;
        try {
            g_level.store(static_cast<int>(level_from_string(env)),
                          std::memory_order_relaxed);
        } catch (const std::invalid_argument&) {
            write_warn(std::string("ignoring PIXSHIFT_LOG_LEVEL=") + env);
        }
    });
}

bool enabled(Level lv) {
    load_env_level();
    return level_at_least(lv);
}

} // namespace

void set_level(Level level) {
    load_env_level();
    g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

Level level() {
    load_env_level();
    return static_cast<Level>(g_level.load(std::memory_order_relaxed));
}

Level level_from_string(const std::string& name) {
    if (name == "error") return Level::Error;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "info") return Level::Info;
    throw std::invalid_argument("log level must be one of: error, warn, info");
}

void info(const std::string& message) {
    if (!enabled(Level::Info)) return;
    std::clog << "[INFO] " << message << "\n";
}

void warn(const std::string& message) {
    load_env_level();
    write_warn(message);
}

void error(const std::string& message) {
    std::clog << "[ERROR] " << message << "\n";
}

} // namespace log
} // namespace ps
