/**
 * @file sha256.hpp
 * @brief SHA256 с поддержкой midstate
 *
 * Хеш решения ORE считается как
 *
 *     sha256(challenge[32] || signer[32] || nonce_le[8])
 *
 * Первые 64 байта (challenge + signer) ровно заполняют один блок SHA256
 * и не меняются в течение раунда. Их midstate вычисляется один раз,
 * после чего каждый nonce стоит одного transform вместо двух.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"

#include <array>
#include <cstdint>
#include <span>

namespace ore::crypto {

/**
 * @brief SHA256 состояние (8 x 32-bit слов)
 */
using Sha256State = std::array<uint32_t, 8>;

/**
 * @brief Вычислить SHA256 хеш данных произвольной длины
 *
 * Реализация согласно FIPS 180-4.
 */
[[nodiscard]] Hash256 sha256(ByteSpan data) noexcept;

/**
 * @brief Функция сжатия SHA256 для одного 64-байтного блока
 *
 * @warning block должен содержать ровно 64 байта
 */
void sha256_transform(Sha256State& state, const uint8_t* block) noexcept;

/**
 * @brief Вычислить midstate для первых 64 байт данных
 *
 * @param block Указатель на 64 байта
 */
[[nodiscard]] Sha256State compute_midstate(const uint8_t* block) noexcept;

/**
 * @brief Завершить хеш по midstate и короткому хвосту
 *
 * Хвост дополняется padding и длиной (64 + tail.size()) * 8 бит.
 *
 * @param midstate Состояние после первого блока
 * @param tail Оставшиеся байты сообщения (не более 55)
 * @return Hash256 SHA256 всего сообщения
 */
[[nodiscard]] Hash256 finish_with_midstate(
    const Sha256State& midstate,
    ByteSpan tail
) noexcept;

} // namespace ore::crypto
