/**
 * @file orchestrator.hpp
 * @brief Главный цикл майнинга
 *
 * Машина состояний:
 *
 *     Idle → Refreshing → Searching → Building → Submitting → Refreshing ...
 *                                                    (любое) → Stopped
 *
 * Один цикл (run_once):
 * 1. Refreshing: обновить ProofState; если снимок старше max_staleness,
 *    подождать refresh_retry_delay и начать заново
 * 2. Searching: параллельный поиск nonce; одновременно в отдельном
 *    async-контексте запрашиваются priority fee и blockhash
 * 3. Building: собрать и подписать транзакцию Mine
 * 4. Submitting: SubmissionPipeline до терминального исхода
 *
 * Новый поиск начинается только после терминального исхода отправки:
 * в каждом раунде не более одной транзакции в полёте.
 */

#pragma once

#include "../chain/chain_client.hpp"
#include "../core/config.hpp"
#include "../crypto/keypair.hpp"
#include "../log/status_reporter.hpp"
#include "../submit/submission_pipeline.hpp"
#include "../tx/transaction_builder.hpp"
#include "cancellation.hpp"
#include "hash_search.hpp"
#include "proof_state.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace ore::mining {

// =============================================================================
// Состояния
// =============================================================================

enum class OrchestratorState {
    Idle,
    Refreshing,
    Searching,
    Building,
    Submitting,
    Stopped
};

[[nodiscard]] constexpr std::string_view to_string(OrchestratorState state) noexcept {
    switch (state) {
        case OrchestratorState::Idle:       return "Idle";
        case OrchestratorState::Refreshing: return "Refreshing";
        case OrchestratorState::Searching:  return "Searching";
        case OrchestratorState::Building:   return "Building";
        case OrchestratorState::Submitting: return "Submitting";
        case OrchestratorState::Stopped:    return "Stopped";
        default: return "Unknown";
    }
}

/**
 * @brief Итог одного цикла
 */
enum class CycleResult {
    Confirmed,
    Rejected,
    TimedOut,
    StaleRound,
    SubmitFailed,
    NotFound,         ///< Поиск не нашёл nonce (дедлайн или диапазон исчерпан)
    RefreshFailed,    ///< Нет пригодного снимка состояния
    BuildFailed,      ///< Не удалось собрать транзакцию
    Stopped
};

[[nodiscard]] constexpr std::string_view to_string(CycleResult result) noexcept {
    switch (result) {
        case CycleResult::Confirmed:     return "Confirmed";
        case CycleResult::Rejected:      return "Rejected";
        case CycleResult::TimedOut:      return "TimedOut";
        case CycleResult::StaleRound:    return "StaleRound";
        case CycleResult::SubmitFailed:  return "SubmitFailed";
        case CycleResult::NotFound:      return "NotFound";
        case CycleResult::RefreshFailed: return "RefreshFailed";
        case CycleResult::BuildFailed:   return "BuildFailed";
        case CycleResult::Stopped:       return "Stopped";
        default: return "Unknown";
    }
}

struct CycleReport {
    CycleResult result = CycleResult::Stopped;

    /// @brief Исход отправки (если дошли до Submitting)
    std::optional<submit::SubmissionOutcome> outcome;

    /// @brief Найденное решение (если поиск был успешен)
    std::optional<Solution> solution;
};

// =============================================================================
// Параметры
// =============================================================================

struct OrchestratorOptions {
    uint32_t threads = 1;
    std::chrono::steady_clock::duration search_deadline = std::chrono::seconds(60);
    std::chrono::milliseconds refresh_retry_delay{2000};

    /// @brief Нижняя граница priority fee
    uint64_t priority_fee = 0;
    uint32_t compute_unit_limit = constants::DEFAULT_COMPUTE_UNIT_LIMIT;
    bool dynamic_fee = true;
    bool dynamic_compute_units = false;

    /// @brief Диапазон nonce для поиска
    NonceRange nonce_range;
};

[[nodiscard]] OrchestratorOptions make_orchestrator_options(const Config& config);

// =============================================================================
// MiningOrchestrator
// =============================================================================

class MiningOrchestrator {
public:
    /**
     * Все ссылки должны пережить оркестратор.
     */
    MiningOrchestrator(
        chain::ChainClient& client,
        const crypto::Signer& signer,
        ProofState& proof_state,
        const tx::TransactionBuilder& builder,
        submit::SubmissionPipeline& pipeline,
        log::StatusReporter& reporter,
        OrchestratorOptions options,
        submit::Sleeper sleeper = {}
    );

    /**
     * @brief Выполнить ровно один цикл
     */
    [[nodiscard]] CycleReport run_once();

    /**
     * @brief Крутить циклы до request_stop()
     *
     * Исключение из цикла (например, std::system_error при запуске
     * потока) логируется, после паузы refresh_retry_delay цикл
     * продолжается.
     */
    void run();

    /**
     * @brief Вывести награду (claim) через тот же pipeline
     *
     * @param amount Сумма; std::nullopt = весь claimable баланс
     * @return Исход отправки или ошибка подготовки
     */
    [[nodiscard]] Result<submit::SubmissionOutcome> claim(std::optional<uint64_t> amount);

    /**
     * @brief Запросить остановку
     *
     * Воркеры поиска останавливаются на следующей итерации, уже
     * отправленная транзакция доводится до терминального исхода.
     */
    void request_stop() noexcept;

    [[nodiscard]] bool stop_requested() const noexcept;

    [[nodiscard]] OrchestratorState state() const noexcept;

private:
    struct NetworkInputs {
        Result<chain::FeeEstimate> fee;
        Result<chain::BlockhashInfo> blockhash;
    };

    [[nodiscard]] NetworkInputs fetch_network_inputs(const std::vector<Pubkey>& writable);
    [[nodiscard]] chain::FeeEstimate choose_fee(const Result<chain::FeeEstimate>& hint) const;
    [[nodiscard]] Result<uint64_t> simulate_units(const Bytes& wire);
    [[nodiscard]] CycleReport finish(CycleReport report, const ProofStateSnapshot& snapshot);

    void set_state(OrchestratorState state) noexcept;
    void sleep(std::chrono::milliseconds duration) const;

    chain::ChainClient& client_;
    const crypto::Signer& signer_;
    ProofState& proof_state_;
    const tx::TransactionBuilder& builder_;
    submit::SubmissionPipeline& pipeline_;
    log::StatusReporter& reporter_;
    OrchestratorOptions options_;
    submit::Sleeper sleeper_;

    HashSearchEngine engine_;
    CancellationToken stop_;
    std::atomic<OrchestratorState> state_{OrchestratorState::Idle};
};

} // namespace ore::mining
