/**
 * @file proof.hpp
 * @brief Модель данных раунда майнинга
 *
 * - Round: идентификатор раунда (epoch + sequence)
 * - ProofStateSnapshot: неизменяемый снимок параметров раунда
 * - Solution: найденный nonce и его хеш
 *
 * Хеш решения:
 *
 *     hash = sha256(challenge[32] || signer[32] || nonce_le[8])
 *
 * Решение валидно, если hash как 256-битное big-endian число не
 * превышает difficulty target.
 */

#pragma once

#include "../core/types.hpp"

#include <chrono>
#include <compare>
#include <cstdint>

namespace ore::mining {

// =============================================================================
// Round
// =============================================================================

/**
 * @brief Идентификатор раунда
 *
 * epoch - момент последнего сброса treasury (меняет difficulty и награду),
 * sequence - счётчик принятых решений в аккаунте Proof (меняет challenge).
 * Решение действительно только для раунда, против которого оно посчитано.
 */
struct Round {
    int64_t epoch = 0;
    uint64_t sequence = 0;

    [[nodiscard]] auto operator<=>(const Round&) const = default;
};

/**
 * @brief Продвинулся ли раунд latest относительно solution_round
 *
 * Любое изменение epoch или sequence делает старое решение бесполезным:
 * challenge уже другой.
 */
[[nodiscard]] constexpr bool round_advanced(const Round& solution_round, const Round& latest) noexcept {
    return latest.epoch != solution_round.epoch || latest.sequence != solution_round.sequence;
}

// =============================================================================
// Snapshot
// =============================================================================

/**
 * @brief Снимок on-chain параметров майнинга
 *
 * Захватывается перед поиском и не меняется до конца раунда.
 * Обновляется только ProofState.
 */
struct ProofStateSnapshot {
    /// @brief Difficulty target (big-endian)
    Hash256 target{};

    /// @brief Раунд
    Round round{};

    /// @brief Challenge раунда (текущий hash аккаунта Proof)
    Hash256 challenge{};

    /// @brief Накопленная и ещё не выведенная награда
    uint64_t claimable_rewards = 0;

    /// @brief Награда за одно решение
    uint64_t reward_rate = 0;

    /// @brief Момент получения снимка
    std::chrono::steady_clock::time_point refreshed_at{};

    /**
     * @brief Возраст снимка
     */
    [[nodiscard]] std::chrono::steady_clock::duration age() const noexcept {
        return std::chrono::steady_clock::now() - refreshed_at;
    }
};

// =============================================================================
// Solution
// =============================================================================

/**
 * @brief Найденное решение
 */
struct Solution {
    /// @brief Раунд, для которого посчитано решение
    Round round{};

    /// @brief Nonce
    uint64_t nonce = 0;

    /// @brief sha256(challenge || signer || nonce)
    Hash256 hash{};
};

} // namespace ore::mining
