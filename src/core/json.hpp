/**
 * @file json.hpp
 * @brief Минималистичный разбор JSON ответов RPC
 *
 * Не строит дерево документа: функции ищут ключ на верхнем уровне
 * переданного объекта и возвращают сырой текст значения. Для вложенных
 * полей вызовы комбинируются:
 *
 * @code
 * auto result = json::get_raw(response, "result");
 * auto value  = json::get_raw(*result, "value");
 * auto lamports = json::get_uint(*value, "lamports");
 * @endcode
 *
 * Этого достаточно для ответов Solana JSON-RPC, которые имеют
 * фиксированную и неглубокую структуру.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ore::json {

/**
 * @brief Сырой текст значения ключа на верхнем уровне объекта
 *
 * Строки возвращаются вместе с кавычками, объекты и массивы вместе со
 * скобками, числа/bool/null как есть.
 *
 * @return std::nullopt если ключ отсутствует или JSON повреждён
 */
[[nodiscard]] std::optional<std::string> get_raw(std::string_view object, std::string_view key);

/**
 * @brief Строковое значение ключа (без кавычек, escape-последовательности раскрыты)
 */
[[nodiscard]] std::optional<std::string> get_string(std::string_view object, std::string_view key);

/**
 * @brief Целое значение ключа
 */
[[nodiscard]] std::optional<int64_t> get_int(std::string_view object, std::string_view key);

/**
 * @brief Беззнаковое целое значение ключа
 */
[[nodiscard]] std::optional<uint64_t> get_uint(std::string_view object, std::string_view key);

/**
 * @brief Логическое значение ключа
 */
[[nodiscard]] std::optional<bool> get_bool(std::string_view object, std::string_view key);

/**
 * @brief Является ли сырое значение литералом null
 */
[[nodiscard]] bool is_null(std::string_view raw) noexcept;

/**
 * @brief Раскрыть строковый литерал JSON ("..." → текст)
 */
[[nodiscard]] std::optional<std::string> unquote(std::string_view raw);

/**
 * @brief Разбить массив на сырые элементы верхнего уровня
 *
 * @return std::nullopt если raw не является массивом
 */
[[nodiscard]] std::optional<std::vector<std::string>> split_array(std::string_view raw);

/**
 * @brief Экранировать строку для вставки в JSON
 */
[[nodiscard]] std::string escape(std::string_view text);

} // namespace ore::json
