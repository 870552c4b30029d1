/**
 * @file orchestrator.cpp
 * @brief Реализация главного цикла майнинга
 */

#include "orchestrator.hpp"
#include "difficulty.hpp"
#include "../core/encoding.hpp"
#include "../log/logger.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <future>
#include <thread>

namespace ore::mining {

namespace {

/// @brief После такого поиска blockhash запрашивается заново
constexpr auto BLOCKHASH_MAX_AGE = std::chrono::seconds(30);

} // anonymous namespace

OrchestratorOptions make_orchestrator_options(const Config& config) {
    OrchestratorOptions options;
    options.threads = config.mining.effective_threads();
    options.search_deadline = std::chrono::seconds(config.mining.search_deadline_seconds);
    options.refresh_retry_delay = std::chrono::milliseconds(config.mining.refresh_retry_delay_ms);
    options.priority_fee = config.fees.priority_fee;
    options.compute_unit_limit = config.fees.compute_unit_limit;
    options.dynamic_fee = config.fees.dynamic_fee;
    options.dynamic_compute_units = config.fees.dynamic_compute_units;
    return options;
}

// =============================================================================
// MiningOrchestrator
// =============================================================================

MiningOrchestrator::MiningOrchestrator(
    chain::ChainClient& client,
    const crypto::Signer& signer,
    ProofState& proof_state,
    const tx::TransactionBuilder& builder,
    submit::SubmissionPipeline& pipeline,
    log::StatusReporter& reporter,
    OrchestratorOptions options,
    submit::Sleeper sleeper
)
    : client_(client)
    , signer_(signer)
    , proof_state_(proof_state)
    , builder_(builder)
    , pipeline_(pipeline)
    , reporter_(reporter)
    , options_(std::move(options))
    , sleeper_(std::move(sleeper))
    , engine_(signer.pubkey()) {}

void MiningOrchestrator::request_stop() noexcept {
    stop_.cancel();
}

bool MiningOrchestrator::stop_requested() const noexcept {
    return stop_.is_cancelled();
}

OrchestratorState MiningOrchestrator::state() const noexcept {
    return state_.load();
}

void MiningOrchestrator::set_state(OrchestratorState state) noexcept {
    state_.store(state);
}

void MiningOrchestrator::sleep(std::chrono::milliseconds duration) const {
    if (sleeper_) {
        sleeper_(duration);
    } else {
        std::this_thread::sleep_for(duration);
    }
}

MiningOrchestrator::NetworkInputs MiningOrchestrator::fetch_network_inputs(const std::vector<Pubkey>& writable) {
    NetworkInputs inputs{
        Err<chain::FeeEstimate>(ErrorCode::RpcInvalidParams, "dynamic_fee выключен"),
        client_.latest_blockhash()
    };
    if (options_.dynamic_fee) {
        inputs.fee = client_.fetch_fee_hint(writable);
    }
    return inputs;
}

chain::FeeEstimate MiningOrchestrator::choose_fee(const Result<chain::FeeEstimate>& hint) const {
    chain::FeeEstimate fee{options_.priority_fee, options_.compute_unit_limit};
    if (hint) {
        fee.micro_lamports_per_cu = std::max(hint->micro_lamports_per_cu, options_.priority_fee);
    } else if (options_.dynamic_fee) {
        log::debug(std::format("Priority fee не получена, используем {}: {}",
                               options_.priority_fee, hint.error().message));
    }
    fee.micro_lamports_per_cu = builder_.clamp_fee(fee.micro_lamports_per_cu);
    return fee;
}

Result<uint64_t> MiningOrchestrator::simulate_units(const Bytes& wire) {
    auto units = client_.simulate(wire);
    for (uint32_t retry = 0; !units && retry < constants::SIMULATION_RETRIES; ++retry) {
        if (stop_requested()) {
            break;
        }
        log::debug(std::format("Ошибка симуляции ({}/{}): {}",
                               retry + 1, constants::SIMULATION_RETRIES, units.error().message));
        units = client_.simulate(wire);
    }
    return units;
}

CycleReport MiningOrchestrator::run_once() {
    CycleReport report;

    if (stop_requested()) {
        set_state(OrchestratorState::Stopped);
        return report;
    }

    // === Refreshing ===
    set_state(OrchestratorState::Refreshing);

    if (auto fresh = proof_state_.refresh(); !fresh) {
        log::warn(std::format("Не удалось обновить состояние: {}", fresh.error().message));
        reporter_.log_error(fresh.error().message);
    }

    auto snapshot = proof_state_.usable();
    if (!snapshot) {
        log::warn(std::format("{}, повтор через {} мс",
                              snapshot.error().message, options_.refresh_retry_delay.count()));
        sleep(options_.refresh_retry_delay);
        report.result = CycleResult::RefreshFailed;
        return report;
    }

    reporter_.update_claimable(snapshot->claimable_rewards);
    reporter_.log_round_start(snapshot->round, format_difficulty(snapshot->target));
    log::info(std::format("Раунд {}/{}, сложность {}",
                          snapshot->round.epoch, snapshot->round.sequence,
                          format_difficulty(snapshot->target)));

    // === Searching ===
    // Сеть параллельно с поиском: fee и blockhash
    auto writable = builder_.mine_writable_accounts(signer_.pubkey());
    auto prefetch = std::async(std::launch::async, [this, &writable]() {
        return fetch_network_inputs(writable);
    });

    set_state(OrchestratorState::Searching);
    auto deadline = std::chrono::steady_clock::now() + options_.search_deadline;
    auto search = engine_.search(*snapshot, options_.threads, deadline, &stop_, options_.nonce_range);

    auto inputs = prefetch.get();
    reporter_.log_search(search.hashes, search.elapsed);

    if (!search.found()) {
        if (search.status == SearchStatus::Cancelled) {
            set_state(OrchestratorState::Stopped);
            report.result = CycleResult::Stopped;
            return report;
        }
        log::debug(std::format("Решение не найдено ({}), {} хешей, {}",
                               to_string(search.status), search.hashes,
                               format_hashrate(search.hashrate())));
        report.result = CycleResult::NotFound;
        return report;
    }

    const Solution solution = *search.solution;
    report.solution = solution;
    auto hash_hex = to_hex(ByteSpan(solution.hash.data(), solution.hash.size()));
    reporter_.log_solution(solution.nonce, hash_hex);
    log::info(std::format("Найден nonce {} ({}, {})",
                          solution.nonce, hash_hex, format_hashrate(search.hashrate())));

    // === Building ===
    set_state(OrchestratorState::Building);

    auto blockhash = std::move(inputs.blockhash);
    if (!blockhash || search.elapsed > BLOCKHASH_MAX_AGE) {
        blockhash = client_.latest_blockhash();
    }
    if (!blockhash) {
        log::warn(std::format("Не удалось получить blockhash: {}", blockhash.error().message));
        reporter_.log_error(blockhash.error().message);
        report.result = CycleResult::BuildFailed;
        return report;
    }

    auto fee = choose_fee(inputs.fee);
    auto tx = builder_.build(solution, fee, signer_, *blockhash);

    if (tx && options_.dynamic_compute_units) {
        auto units = simulate_units(tx->wire);
        if (units) {
            fee.compute_unit_limit = static_cast<uint32_t>(*units) + constants::COMPUTE_UNIT_MARGIN;
            log::debug(std::format("Dynamic CUs: {}", fee.compute_unit_limit));
            tx = builder_.build(solution, fee, signer_, *blockhash);
        } else if (!is_retryable(units.error())) {
            log::warn(std::format("Симуляция отклонена: {}", units.error().message));
            reporter_.log_rejected(units.error().message);
            report.result = CycleResult::Rejected;
            return report;
        } else {
            log::debug(std::format("Симуляция не удалась, лимит CU {}: {}",
                                   fee.compute_unit_limit, units.error().message));
        }
    }

    if (!tx) {
        log::error(std::format("Не удалось собрать транзакцию: {}", tx.error().message));
        reporter_.log_error(tx.error().message);
        report.result = CycleResult::BuildFailed;
        return report;
    }

    // === Submitting ===
    set_state(OrchestratorState::Submitting);
    auto outcome = pipeline_.run(*tx, [this]() { return proof_state_.latest_round(); });
    report.outcome = std::move(outcome);

    return finish(std::move(report), *snapshot);
}

CycleReport MiningOrchestrator::finish(CycleReport report, const ProofStateSnapshot& snapshot) {
    auto& outcome = *report.outcome;

    switch (outcome.kind) {
        case submit::OutcomeKind::Confirmed: {
            report.result = CycleResult::Confirmed;

            // Награда: прирост claimable после подтверждения
            outcome.reward_delta = snapshot.reward_rate;
            set_state(OrchestratorState::Refreshing);
            if (auto fresh = proof_state_.refresh(); fresh) {
                if (fresh->claimable_rewards >= snapshot.claimable_rewards) {
                    outcome.reward_delta = fresh->claimable_rewards - snapshot.claimable_rewards;
                }
                reporter_.update_claimable(fresh->claimable_rewards);
            }

            reporter_.log_confirmed(outcome.signature, outcome.reward_delta);
            log::info(std::format("Подтверждено {} (+{}), попыток {}",
                                  outcome.signature, log::format_amount(outcome.reward_delta),
                                  outcome.attempts));
            break;
        }
        case submit::OutcomeKind::Rejected:
            report.result = CycleResult::Rejected;
            reporter_.log_rejected(outcome.reason);
            log::warn(std::format("Транзакция отклонена: {}", outcome.reason));
            break;
        case submit::OutcomeKind::TimedOut:
            report.result = CycleResult::TimedOut;
            reporter_.log_timed_out(outcome.signature);
            log::debug(std::format("Нет подтверждения для {}", outcome.signature));
            break;
        case submit::OutcomeKind::StaleRound:
            report.result = CycleResult::StaleRound;
            reporter_.log_stale();
            log::debug("Раунд ушёл вперёд, решение отброшено");
            break;
        case submit::OutcomeKind::SubmitFailed:
            report.result = CycleResult::SubmitFailed;
            reporter_.log_event(log::EventType::SUBMIT_FAIL, outcome.reason);
            log::warn(std::format("Отправка не удалась после {} попыток: {}",
                                  outcome.attempts, outcome.reason));
            break;
    }

    if (state() != OrchestratorState::Stopped) {
        set_state(OrchestratorState::Refreshing);
    }
    return report;
}

void MiningOrchestrator::run() {
    log::info(std::format("Майнинг запущен: {} воркеров, signer {}",
                          options_.threads, pubkey_to_base58(signer_.pubkey())));

    while (!stop_requested()) {
        try {
            auto report = run_once();
            log::debug(std::format("Цикл завершён: {}", to_string(report.result)));
        } catch (const std::exception& e) {
            log::error(std::format("Ошибка цикла майнинга: {}", e.what()));
            reporter_.log_error(e.what());
            sleep(options_.refresh_retry_delay);
        }
    }

    set_state(OrchestratorState::Stopped);
    log::info("Майнинг остановлен");
}

Result<submit::SubmissionOutcome> MiningOrchestrator::claim(std::optional<uint64_t> amount) {
    auto snapshot = proof_state_.refresh();
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }

    uint64_t claim_amount = amount.value_or(snapshot->claimable_rewards);
    if (claim_amount == 0) {
        return Err<submit::SubmissionOutcome>(ErrorCode::InsufficientFunds, "Нет награды для вывода");
    }
    if (claim_amount > snapshot->claimable_rewards) {
        return Err<submit::SubmissionOutcome>(
            ErrorCode::InsufficientFunds,
            std::format("Запрошено {}, доступно {}",
                        log::format_amount(claim_amount),
                        log::format_amount(snapshot->claimable_rewards))
        );
    }

    std::vector<Pubkey> writable{signer_.pubkey(), builder_.options().proof,
                                 builder_.options().beneficiary, builder_.options().treasury_tokens};
    auto inputs = fetch_network_inputs(writable);
    if (!inputs.blockhash) {
        return std::unexpected(inputs.blockhash.error());
    }

    auto tx = builder_.build_claim(claim_amount, choose_fee(inputs.fee), signer_, *inputs.blockhash);
    if (!tx) {
        return std::unexpected(tx.error());
    }

    log::info(std::format("Вывод {}", log::format_amount(claim_amount)));
    auto outcome = pipeline_.run(*tx);
    if (outcome.confirmed()) {
        outcome.reward_delta = claim_amount;
        if (auto fresh = proof_state_.refresh(); fresh) {
            reporter_.update_claimable(fresh->claimable_rewards);
        }
    }
    return outcome;
}

} // namespace ore::mining
