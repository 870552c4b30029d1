/**
 * @file accounts.hpp
 * @brief Декодирование аккаунтов программы майнинга
 *
 * Все числа little-endian, первые 8 байт - дискриминатор (тип аккаунта
 * в первом байте, остальные нули).
 *
 * Treasury (104 байта):
 * @code
 * [0..8)    discriminator (102)
 * [8..16)   bump u64
 * [16..48)  admin [32]
 * [48..80)  difficulty [32]    big-endian target
 * [80..88)  last_reset_at i64
 * [88..96)  reward_rate u64
 * [96..104) total_claimed_rewards u64
 * @endcode
 *
 * Proof (96 байт):
 * @code
 * [0..8)    discriminator (101)
 * [8..40)   authority [32]
 * [40..48)  claimable_rewards u64
 * [48..80)  hash [32]          challenge следующего решения
 * [80..88)  total_hashes u64
 * [88..96)  total_rewards u64
 * @endcode
 */

#pragma once

#include "../core/types.hpp"

#include <cstdint>

namespace ore::chain {

struct Treasury {
    uint64_t bump = 0;
    Pubkey admin{};
    Hash256 difficulty{};
    int64_t last_reset_at = 0;
    uint64_t reward_rate = 0;
    uint64_t total_claimed_rewards = 0;
};

struct Proof {
    Pubkey authority{};
    uint64_t claimable_rewards = 0;
    Hash256 hash{};
    uint64_t total_hashes = 0;
    uint64_t total_rewards = 0;
};

/**
 * @brief Разобрать Treasury
 *
 * @return AccountInvalidData если данные короче макета или
 *         дискриминатор не совпадает
 */
[[nodiscard]] Result<Treasury> decode_treasury(ByteSpan data);

/**
 * @brief Разобрать Proof
 */
[[nodiscard]] Result<Proof> decode_proof(ByteSpan data);

/**
 * @brief Сериализовать Treasury (для тестов и симуляции ответов)
 */
[[nodiscard]] Bytes encode_treasury(const Treasury& treasury);

/**
 * @brief Сериализовать Proof
 */
[[nodiscard]] Bytes encode_proof(const Proof& proof);

} // namespace ore::chain
