/**
 * @file test_proof_state.cpp
 * @brief Тесты ProofState: обновление снимка и политика устаревания
 */

#include <gtest/gtest.h>

#include "mining/difficulty.hpp"
#include "mining/proof_state.hpp"
#include "support/fake_chain_client.hpp"

namespace ore::tests {

class ProofStateTest : public ::testing::Test {
protected:
    void SetUp() override {
        challenge_.fill(0x3C);
        client_.set_account(treasury_, treasury_account(mining::target_from_leading_zeros(8), 1700, 250));
        client_.set_account(proof_, proof_account(challenge_, 41, 9000));
    }

    mining::ProofStateOptions options() {
        mining::ProofStateOptions opts;
        opts.treasury = treasury_;
        opts.proof = proof_;
        opts.max_staleness = std::chrono::seconds(120);
        opts.now = clock_.now_fn();
        return opts;
    }

    const Pubkey treasury_ = make_key(0x71);
    const Pubkey proof_ = make_key(0x72);
    Hash256 challenge_{};
    FakeChainClient client_;
    FakeClock clock_;
};

/**
 * @brief Тест: снимок собирается из Treasury и Proof
 */
TEST_F(ProofStateTest, RefreshBuildsSnapshot) {
    mining::ProofState state(client_, options());

    auto snapshot = state.refresh();
    ASSERT_TRUE(snapshot.has_value()) << snapshot.error().message;

    EXPECT_EQ(snapshot->target, mining::target_from_leading_zeros(8));
    EXPECT_EQ(snapshot->round, (mining::Round{1700, 41}));
    EXPECT_EQ(snapshot->challenge, challenge_);
    EXPECT_EQ(snapshot->claimable_rewards, 9000u);
    EXPECT_EQ(snapshot->reward_rate, 250u);
    EXPECT_EQ(snapshot->refreshed_at, clock_.now());

    ASSERT_TRUE(state.current().has_value());
    EXPECT_EQ(state.current()->round, snapshot->round);
}

/**
 * @brief Тест: до первого обновления снимка нет
 */
TEST_F(ProofStateTest, NoSnapshotIsNotUsable) {
    mining::ProofState state(client_, options());

    auto usable = state.usable();
    ASSERT_FALSE(usable.has_value());
    EXPECT_EQ(usable.error().code, ErrorCode::MiningStateTooOld);
}

/**
 * @brief Тест: ошибка обновления сохраняет прежний снимок
 */
TEST_F(ProofStateTest, FailedRefreshKeepsSnapshot) {
    mining::ProofState state(client_, options());
    ASSERT_TRUE(state.refresh().has_value());

    client_.push_account(treasury_, Err<chain::AccountData>(ErrorCode::RpcTimeout, "timeout"));
    clock_.advance(std::chrono::seconds(30));

    auto failed = state.refresh();
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, ErrorCode::RpcTimeout);

    // Снимку 30 с, он всё ещё пригоден
    auto usable = state.usable();
    ASSERT_TRUE(usable.has_value());
    EXPECT_EQ(usable->round, (mining::Round{1700, 41}));
}

/**
 * @brief Тест: снимок старше max_staleness непригоден
 */
TEST_F(ProofStateTest, StaleSnapshotRejected) {
    mining::ProofState state(client_, options());
    ASSERT_TRUE(state.refresh().has_value());

    clock_.advance(std::chrono::seconds(120));
    EXPECT_TRUE(state.usable().has_value());

    clock_.advance(std::chrono::seconds(1));
    auto usable = state.usable();
    ASSERT_FALSE(usable.has_value());
    EXPECT_EQ(usable.error().code, ErrorCode::MiningStateTooOld);

    // Успешное обновление снова делает состояние пригодным
    ASSERT_TRUE(state.refresh().has_value());
    EXPECT_TRUE(state.usable().has_value());
}

/**
 * @brief Тест: битые данные аккаунта
 */
TEST_F(ProofStateTest, InvalidAccountData) {
    client_.set_account(proof_, chain::AccountData{Pubkey{}, 1, Bytes(10, 0)});
    mining::ProofState state(client_, options());

    auto snapshot = state.refresh();
    ASSERT_FALSE(snapshot.has_value());
    EXPECT_EQ(snapshot.error().code, ErrorCode::AccountInvalidData);
    EXPECT_FALSE(state.current().has_value());
}

/**
 * @brief Тест: запрос раунда не меняет снимок
 */
TEST_F(ProofStateTest, LatestRoundDoesNotMutate) {
    mining::ProofState state(client_, options());
    ASSERT_TRUE(state.refresh().has_value());

    client_.set_account(proof_, proof_account(challenge_, 42, 9500));

    auto latest = state.latest_round();
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(*latest, (mining::Round{1700, 42}));
    EXPECT_TRUE(mining::round_advanced(state.current()->round, *latest));

    EXPECT_EQ(state.current()->round, (mining::Round{1700, 41}));
    EXPECT_EQ(state.current()->claimable_rewards, 9000u);
}

} // namespace ore::tests
