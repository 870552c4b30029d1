/**
 * @file logger.cpp
 * @brief Реализация консольного логгера
 */

#include "logger.hpp"

#include <atomic>
#include <format>
#include <iostream>
#include <mutex>

namespace ore::log {

namespace {

std::atomic<Level> g_level{Level::Info};
std::atomic<bool> g_color{false};
std::mutex g_output_mutex;

constexpr const char* RESET = "\033[0m";

constexpr const char* color_of(Level level) noexcept {
    switch (level) {
        case Level::Error: return "\033[31m";
        case Level::Warn:  return "\033[33m";
        case Level::Info:  return "\033[32m";
        case Level::Debug: return "\033[2m";
        default: return "";
    }
}

} // anonymous namespace

Result<Level> parse_level(std::string_view text) {
    if (text == "error") return Level::Error;
    if (text == "warn")  return Level::Warn;
    if (text == "info")  return Level::Info;
    if (text == "debug") return Level::Debug;

    return Err<Level>(
        ErrorCode::ConfigInvalidValue,
        std::format("Неизвестный уровень логирования: {}", text)
    );
}

void configure(Level level, bool color) noexcept {
    g_level.store(level);
    g_color.store(color);
}

Level current_level() noexcept {
    return g_level.load();
}

bool enabled(Level level) noexcept {
    return static_cast<int>(level) <= static_cast<int>(g_level.load());
}

void write(Level level, std::string_view message) {
    if (!enabled(level)) {
        return;
    }

    std::ostream& out = (level == Level::Error || level == Level::Warn) ? std::cerr : std::cout;

    std::lock_guard<std::mutex> lock(g_output_mutex);
    if (g_color.load()) {
        out << color_of(level) << "[" << to_string(level) << "]" << RESET << " " << message << "\n";
    } else {
        out << "[" << to_string(level) << "] " << message << "\n";
    }
    out.flush();
}

} // namespace ore::log
