/**
 * @file submission_pipeline.hpp
 * @brief Отправка транзакции до терминального исхода
 *
 * Машина состояний:
 *
 *     Built → Submitted → Confirming → {Confirmed | Rejected | TimedOut}
 *       │         │
 *       │         └─ (раунд ушёл вперёд перед повтором) → StaleRound
 *       └─ (повторы исчерпаны) → SubmitFailed
 *
 * - Транзиентные ошибки отправки повторяются с экспоненциальным backoff
 *   (initial * 2^n, не больше max), не более max_retries повторов.
 * - Постоянные ошибки сразу дают Rejected.
 * - Перед каждым повтором раунд перечитывается через RoundCheck.
 * - Отправленная транзакция всегда доводится до терминального
 *   состояния: опрос идёт до подтверждения, отклонения или
 *   confirm_timeout.
 */

#pragma once

#include "../chain/chain_client.hpp"
#include "../core/types.hpp"
#include "../mining/proof.hpp"
#include "../mining/proof_state.hpp"
#include "../tx/transaction_builder.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace ore::submit {

// =============================================================================
// Состояния и исходы
// =============================================================================

enum class SubmissionState {
    Built,
    Submitted,
    Confirming,
    Confirmed,
    Rejected,
    TimedOut,
    StaleRound,
    SubmitFailed
};

[[nodiscard]] constexpr std::string_view to_string(SubmissionState state) noexcept {
    switch (state) {
        case SubmissionState::Built:        return "Built";
        case SubmissionState::Submitted:    return "Submitted";
        case SubmissionState::Confirming:   return "Confirming";
        case SubmissionState::Confirmed:    return "Confirmed";
        case SubmissionState::Rejected:     return "Rejected";
        case SubmissionState::TimedOut:     return "TimedOut";
        case SubmissionState::StaleRound:   return "StaleRound";
        case SubmissionState::SubmitFailed: return "SubmitFailed";
        default: return "Unknown";
    }
}

/**
 * @brief Терминальный исход отправки
 */
enum class OutcomeKind {
    Confirmed,
    Rejected,
    TimedOut,
    StaleRound,
    SubmitFailed
};

[[nodiscard]] constexpr std::string_view to_string(OutcomeKind kind) noexcept {
    switch (kind) {
        case OutcomeKind::Confirmed:    return "Confirmed";
        case OutcomeKind::Rejected:     return "Rejected";
        case OutcomeKind::TimedOut:     return "TimedOut";
        case OutcomeKind::StaleRound:   return "StaleRound";
        case OutcomeKind::SubmitFailed: return "SubmitFailed";
        default: return "Unknown";
    }
}

struct SubmissionOutcome {
    OutcomeKind kind = OutcomeKind::SubmitFailed;

    /// @brief Причина (Rejected / SubmitFailed)
    std::string reason;

    /// @brief Количество вызовов submit
    uint32_t attempts = 0;

    /// @brief Подпись транзакции (base58)
    std::string signature;

    /// @brief Прирост claimable награды (заполняет оркестратор для Confirmed)
    uint64_t reward_delta = 0;

    [[nodiscard]] bool confirmed() const noexcept { return kind == OutcomeKind::Confirmed; }
};

// =============================================================================
// Параметры
// =============================================================================

/**
 * @brief Экспоненциальный backoff
 */
struct BackoffPolicy {
    std::chrono::milliseconds initial{2000};
    std::chrono::milliseconds max{16000};

    /**
     * @brief Пауза перед повтором номер retry (с нуля): initial * 2^retry, не больше max
     */
    [[nodiscard]] std::chrono::milliseconds delay(uint32_t retry) const noexcept;
};

struct PipelineOptions {
    /// @brief Плательщик (для проверки баланса)
    Pubkey payer{};

    uint32_t max_retries = 4;
    BackoffPolicy backoff;
    std::chrono::milliseconds poll_interval{5000};
    std::chrono::milliseconds confirm_timeout{60000};
    bool check_balance = true;
};

/**
 * @brief Собрать PipelineOptions из конфигурации
 */
[[nodiscard]] PipelineOptions make_pipeline_options(const SubmissionConfig& config, const Pubkey& payer);

/**
 * @brief Пауза (подменяется в тестах)
 */
using Sleeper = std::function<void(std::chrono::milliseconds)>;

/**
 * @brief Запрос текущего раунда
 */
using RoundCheck = std::function<Result<mining::Round>()>;

// =============================================================================
// SubmissionPipeline
// =============================================================================

class SubmissionPipeline {
public:
    /**
     * @param client Клиент блокчейна (должен пережить pipeline)
     * @param options Параметры повторов и опроса
     * @param sleeper Пауза; по умолчанию std::this_thread::sleep_for
     * @param now Часы; по умолчанию steady_clock::now
     */
    SubmissionPipeline(
        chain::ChainClient& client,
        PipelineOptions options,
        Sleeper sleeper = {},
        mining::SteadyNow now = {}
    );

    /**
     * @brief Довести транзакцию до терминального исхода
     *
     * @param tx Подписанная транзакция
     * @param round_check Запрос текущего раунда; пустая функция отключает проверку
     *              устаревания (например, для claim)
     */
    [[nodiscard]] SubmissionOutcome run(const tx::SignedTransaction& tx, const RoundCheck& round_check = {});

    [[nodiscard]] const PipelineOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] SubmissionOutcome confirm(
        const chain::SubmissionHandle& handle,
        SubmissionOutcome outcome
    );

    void sleep(std::chrono::milliseconds duration) const;
    [[nodiscard]] std::chrono::steady_clock::time_point now() const;

    chain::ChainClient& client_;
    PipelineOptions options_;
    Sleeper sleeper_;
    mining::SteadyNow now_;
};

} // namespace ore::submit
