/**
 * @file proof_state.hpp
 * @brief Кешированный снимок on-chain параметров майнинга
 *
 * ProofState - единственный писатель ProofStateSnapshot. Снимок
 * обновляется перед каждым поиском (никогда во время поиска) чтением
 * аккаунтов Treasury и Proof.
 *
 * При ошибке обновления предыдущий снимок сохраняется и может
 * использоваться дальше, пока его возраст не превысил max_staleness.
 */

#pragma once

#include "../chain/chain_client.hpp"
#include "../core/types.hpp"
#include "proof.hpp"

#include <chrono>
#include <functional>
#include <optional>

namespace ore::mining {

/**
 * @brief Источник текущего времени (подменяется в тестах)
 */
using SteadyNow = std::function<std::chrono::steady_clock::time_point()>;

/**
 * @brief Параметры ProofState
 */
struct ProofStateOptions {
    Pubkey treasury{};
    Pubkey proof{};
    std::chrono::steady_clock::duration max_staleness = std::chrono::seconds(120);
    SteadyNow now;
};

/**
 * @brief Собрать снимок из двух аккаунтов
 */
[[nodiscard]] Result<ProofStateSnapshot> make_snapshot(
    const chain::AccountData& treasury,
    const chain::AccountData& proof,
    std::chrono::steady_clock::time_point refreshed_at
);

class ProofState {
public:
    /**
     * @param client Клиент блокчейна (должен пережить ProofState)
     */
    ProofState(chain::ChainClient& client, ProofStateOptions options);

    /**
     * @brief Перечитать аккаунты и заменить снимок
     *
     * @return Новый снимок; при ошибке прежний снимок не меняется
     */
    [[nodiscard]] Result<ProofStateSnapshot> refresh();

    /**
     * @brief Последний успешно полученный снимок
     */
    [[nodiscard]] const std::optional<ProofStateSnapshot>& current() const noexcept { return snapshot_; }

    /**
     * @brief Снимок, пригодный для майнинга
     *
     * @return MiningStateTooOld если снимка нет или он старше max_staleness
     */
    [[nodiscard]] Result<ProofStateSnapshot> usable() const;

    /**
     * @brief Прочитать текущий раунд из сети, не трогая снимок
     *
     * Используется для проверки устаревания перед повторной отправкой.
     */
    [[nodiscard]] Result<Round> latest_round();

private:
    [[nodiscard]] std::chrono::steady_clock::time_point now() const;

    chain::ChainClient& client_;
    ProofStateOptions options_;
    std::optional<ProofStateSnapshot> snapshot_;
};

} // namespace ore::mining
