/**
 * @file submission_pipeline.cpp
 * @brief Реализация SubmissionPipeline
 */

#include "submission_pipeline.hpp"
#include "../log/logger.hpp"

#include <algorithm>
#include <format>
#include <thread>

namespace ore::submit {

// =============================================================================
// BackoffPolicy
// =============================================================================

std::chrono::milliseconds BackoffPolicy::delay(uint32_t retry) const noexcept {
    auto value = initial;
    for (uint32_t i = 0; i < retry && value < max; ++i) {
        value *= 2;
    }
    return std::min(value, max);
}

PipelineOptions make_pipeline_options(const SubmissionConfig& config, const Pubkey& payer) {
    PipelineOptions options;
    options.payer = payer;
    options.max_retries = config.max_retries;
    options.backoff.initial = std::chrono::milliseconds(config.backoff_initial_ms);
    options.backoff.max = std::chrono::milliseconds(config.backoff_max_ms);
    options.poll_interval = std::chrono::milliseconds(config.poll_interval_ms);
    options.confirm_timeout = std::chrono::seconds(config.confirm_timeout_seconds);
    options.check_balance = config.check_balance;
    return options;
}

// =============================================================================
// SubmissionPipeline
// =============================================================================

SubmissionPipeline::SubmissionPipeline(
    chain::ChainClient& client,
    PipelineOptions options,
    Sleeper sleeper,
    mining::SteadyNow now
)
    : client_(client)
    , options_(std::move(options))
    , sleeper_(std::move(sleeper))
    , now_(std::move(now)) {}

void SubmissionPipeline::sleep(std::chrono::milliseconds duration) const {
    if (sleeper_) {
        sleeper_(duration);
    } else {
        std::this_thread::sleep_for(duration);
    }
}

std::chrono::steady_clock::time_point SubmissionPipeline::now() const {
    return now_ ? now_() : std::chrono::steady_clock::now();
}

SubmissionOutcome SubmissionPipeline::run(const tx::SignedTransaction& tx, const RoundCheck& round_check) {
    SubmissionOutcome outcome;
    outcome.signature = tx.signature_base58();

    // === Built: проверка баланса ===
    if (options_.check_balance) {
        auto balance = client_.get_balance(options_.payer);
        if (balance && *balance == 0) {
            outcome.kind = OutcomeKind::Rejected;
            outcome.reason = "insufficient balance";
            return outcome;
        }
        if (!balance) {
            log::debug(std::format("Баланс не получен, отправляем без проверки: {}", balance.error().message));
        }
    }

    // === Built → Submitted ===
    for (;;) {
        ++outcome.attempts;
        auto handle = client_.submit(tx.wire, tx.min_context_slot);

        if (handle) {
            log::debug(std::format("{} → {} (попытка {})",
                                   to_string(SubmissionState::Built),
                                   to_string(SubmissionState::Submitted),
                                   outcome.attempts));
            return confirm(*handle, std::move(outcome));
        }

        const auto& error = handle.error();
        if (!is_retryable(error)) {
            outcome.kind = OutcomeKind::Rejected;
            outcome.reason = error.message;
            return outcome;
        }

        if (outcome.attempts > options_.max_retries) {
            outcome.kind = OutcomeKind::SubmitFailed;
            outcome.reason = std::format("{}: {}", to_string(ErrorCode::SubmitRetriesExhausted), error.message);
            return outcome;
        }

        auto delay = options_.backoff.delay(outcome.attempts - 1);
        log::debug(std::format("Ошибка отправки ({}), повтор через {} мс", error.message, delay.count()));
        sleep(delay);

        // Проверка устаревания перед повтором
        if (round_check && tx.round) {
            auto latest = round_check();
            if (latest && mining::round_advanced(*tx.round, *latest)) {
                outcome.kind = OutcomeKind::StaleRound;
                return outcome;
            }
            if (!latest) {
                log::debug(std::format("Запрос раунда не удался: {}", latest.error().message));
            }
        }
    }
}

SubmissionOutcome SubmissionPipeline::confirm(
    const chain::SubmissionHandle& handle,
    SubmissionOutcome outcome
) {
    // === Submitted → Confirming ===
    const auto deadline = now() + options_.confirm_timeout;

    for (;;) {
        auto status = client_.poll_status(handle);

        if (status) {
            switch (status->state) {
                case chain::TxState::Confirmed:
                    outcome.kind = OutcomeKind::Confirmed;
                    return outcome;
                case chain::TxState::Rejected:
                    outcome.kind = OutcomeKind::Rejected;
                    outcome.reason = status->reason;
                    return outcome;
                case chain::TxState::Pending:
                    break;
            }
        } else {
            // Ошибки опроса повторяются в пределах дедлайна
            log::debug(std::format("Ошибка опроса статуса {}: {}", handle.signature, status.error().message));
        }

        if (now() >= deadline) {
            outcome.kind = OutcomeKind::TimedOut;
            return outcome;
        }
        sleep(options_.poll_interval);
    }
}

} // namespace ore::submit
