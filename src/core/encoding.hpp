/**
 * @file encoding.hpp
 * @brief Текстовые кодировки: base58, base64, hex
 *
 * - base58 (алфавит Bitcoin): адреса аккаунтов, подписи, blockhash
 * - base64: данные аккаунтов в ответах RPC, сериализованные транзакции
 * - hex: отладочный вывод хешей
 */

#pragma once

#include "types.hpp"

#include <string>
#include <string_view>

namespace ore {

// =============================================================================
// Base58
// =============================================================================

/**
 * @brief Закодировать байты в base58
 *
 * Ведущие нулевые байты кодируются символом '1'.
 */
[[nodiscard]] std::string base58_encode(ByteSpan data);

/**
 * @brief Декодировать base58 строку
 *
 * @return Result<Bytes> Байты или ошибка (недопустимый символ)
 */
[[nodiscard]] Result<Bytes> base58_decode(std::string_view text);

/**
 * @brief Декодировать 32-байтный адрес
 *
 * @return Result<Pubkey> Адрес или ошибка (символ или длина)
 */
[[nodiscard]] Result<Pubkey> pubkey_from_base58(std::string_view text);

/**
 * @brief Закодировать адрес в base58
 */
[[nodiscard]] std::string pubkey_to_base58(const Pubkey& key);

// =============================================================================
// Base64
// =============================================================================

[[nodiscard]] std::string base64_encode(ByteSpan data);

/**
 * @brief Декодировать base64 (стандартный алфавит, с padding)
 */
[[nodiscard]] Result<Bytes> base64_decode(std::string_view text);

// =============================================================================
// Hex
// =============================================================================

[[nodiscard]] std::string to_hex(ByteSpan data);

[[nodiscard]] Result<Bytes> from_hex(std::string_view hex);

} // namespace ore
