/**
 * @file logger.hpp
 * @brief Консольный логгер с уровнями
 *
 * Строки выводятся с префиксом уровня:
 *
 *     [INFO] Раунд 1712000000/42, сложность 24 bits
 *     [WARN] Транзакция отклонена: ...
 *
 * ERROR и WARN идут в std::cerr, INFO и DEBUG в std::cout.
 * Вывод одной строки атомарен относительно других потоков.
 */

#pragma once

#include "../core/types.hpp"

#include <string_view>

namespace ore::log {

/**
 * @brief Уровень логирования (по возрастанию подробности)
 */
enum class Level {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3
};

[[nodiscard]] constexpr std::string_view to_string(Level level) noexcept {
    switch (level) {
        case Level::Error: return "ERROR";
        case Level::Warn:  return "WARN";
        case Level::Info:  return "INFO";
        case Level::Debug: return "DEBUG";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Разобрать уровень из строки конфигурации ("info", "debug", ...)
 */
[[nodiscard]] Result<Level> parse_level(std::string_view text);

/**
 * @brief Установить глобальный уровень и режим цвета
 */
void configure(Level level, bool color) noexcept;

[[nodiscard]] Level current_level() noexcept;

[[nodiscard]] bool enabled(Level level) noexcept;

/**
 * @brief Вывести строку с префиксом уровня
 */
void write(Level level, std::string_view message);

inline void error(std::string_view message) { write(Level::Error, message); }
inline void warn(std::string_view message)  { write(Level::Warn, message); }
inline void info(std::string_view message)  { write(Level::Info, message); }
inline void debug(std::string_view message) { write(Level::Debug, message); }

} // namespace ore::log
