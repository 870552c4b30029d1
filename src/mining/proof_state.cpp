/**
 * @file proof_state.cpp
 * @brief Реализация ProofState
 */

#include "proof_state.hpp"
#include "../chain/accounts.hpp"

#include <format>

namespace ore::mining {

Result<ProofStateSnapshot> make_snapshot(
    const chain::AccountData& treasury_account,
    const chain::AccountData& proof_account,
    std::chrono::steady_clock::time_point refreshed_at
) {
    auto treasury = chain::decode_treasury(treasury_account.data);
    if (!treasury) {
        return std::unexpected(treasury.error());
    }
    auto proof = chain::decode_proof(proof_account.data);
    if (!proof) {
        return std::unexpected(proof.error());
    }

    ProofStateSnapshot snapshot;
    snapshot.target = treasury->difficulty;
    snapshot.round = Round{treasury->last_reset_at, proof->total_hashes};
    snapshot.challenge = proof->hash;
    snapshot.claimable_rewards = proof->claimable_rewards;
    snapshot.reward_rate = treasury->reward_rate;
    snapshot.refreshed_at = refreshed_at;
    return snapshot;
}

ProofState::ProofState(chain::ChainClient& client, ProofStateOptions options)
    : client_(client)
    , options_(std::move(options)) {}

std::chrono::steady_clock::time_point ProofState::now() const {
    return options_.now ? options_.now() : std::chrono::steady_clock::now();
}

Result<ProofStateSnapshot> ProofState::refresh() {
    auto treasury = client_.fetch_account(options_.treasury);
    if (!treasury) {
        return std::unexpected(treasury.error());
    }
    auto proof = client_.fetch_account(options_.proof);
    if (!proof) {
        return std::unexpected(proof.error());
    }

    auto snapshot = make_snapshot(*treasury, *proof, now());
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }

    snapshot_ = *snapshot;
    return snapshot;
}

Result<ProofStateSnapshot> ProofState::usable() const {
    if (!snapshot_) {
        return Err<ProofStateSnapshot>(ErrorCode::MiningStateTooOld, "Снимок состояния ещё не получен");
    }

    auto age = now() - snapshot_->refreshed_at;
    if (age > options_.max_staleness) {
        return Err<ProofStateSnapshot>(
            ErrorCode::MiningStateTooOld,
            std::format("Снимок состояния старше {} с",
                        std::chrono::duration_cast<std::chrono::seconds>(options_.max_staleness).count())
        );
    }
    return *snapshot_;
}

Result<Round> ProofState::latest_round() {
    auto treasury = client_.fetch_account(options_.treasury);
    if (!treasury) {
        return std::unexpected(treasury.error());
    }
    auto proof = client_.fetch_account(options_.proof);
    if (!proof) {
        return std::unexpected(proof.error());
    }

    auto snapshot = make_snapshot(*treasury, *proof, now());
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }
    return snapshot->round;
}

} // namespace ore::mining
