/**
 * @file difficulty.hpp
 * @brief Работа с difficulty target
 *
 * Target - 256-битное число в big-endian порядке (байт [0] старший).
 * Хеш удовлетворяет target, если как беззнаковое big-endian число
 * он не превышает target:
 *
 *     valid = hash <= target
 *
 * Чем меньше target, тем больше ведущих нулевых бит нужно хешу.
 */

#pragma once

#include "../core/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace ore::mining {

// =============================================================================
// Проверки
// =============================================================================

/**
 * @brief Проверить, что хеш удовлетворяет target
 *
 * @return true если hash <= target (big-endian сравнение)
 */
[[nodiscard]] bool meets_target(const Hash256& hash, const Hash256& target) noexcept;

/**
 * @brief Количество ведущих нулевых бит
 */
[[nodiscard]] uint32_t leading_zero_bits(const Hash256& value) noexcept;

// =============================================================================
// Построение target
// =============================================================================

/**
 * @brief Target, требующий не менее zero_bits ведущих нулей
 *
 * zero_bits = 0 даёт максимальный target (любой хеш валиден),
 * zero_bits >= 256 даёт нулевой target.
 */
[[nodiscard]] Hash256 target_from_leading_zeros(uint32_t zero_bits) noexcept;

// =============================================================================
// Форматирование
// =============================================================================

/**
 * @brief Преобразовать target в hex строку (64 символа)
 */
[[nodiscard]] std::string target_to_hex(const Hash256& target);

/**
 * @brief Преобразовать hex строку в target
 *
 * @return Result<Hash256> Target или ошибка парсинга
 */
[[nodiscard]] Result<Hash256> hex_to_target(std::string_view hex);

/**
 * @brief Краткое описание сложности для логов ("24 bits")
 */
[[nodiscard]] std::string format_difficulty(const Hash256& target);

/**
 * @brief Форматировать хешрейт ("1.23 MH/s")
 */
[[nodiscard]] std::string format_hashrate(double hashes_per_second);

} // namespace ore::mining
