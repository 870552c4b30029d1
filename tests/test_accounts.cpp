/**
 * @file test_accounts.cpp
 * @brief Тесты декодирования аккаунтов Treasury и Proof
 */

#include <gtest/gtest.h>

#include "chain/accounts.hpp"
#include "core/constants.hpp"

namespace ore::tests {

class AccountsTest : public ::testing::Test {
protected:
    /// @brief Treasury, собранный вручную по смещениям
    static Bytes raw_treasury() {
        Bytes data(constants::TREASURY_ACCOUNT_SIZE, 0);
        data[0] = constants::TREASURY_DISCRIMINATOR;
        data[8] = 0xFE;                      // bump
        data[16] = 0xAA;                     // admin[0]
        data[48] = 0x00;                     // difficulty[0]
        data[49] = 0x00;
        data[50] = 0x0F;                     // 20 ведущих нулевых бит
        for (std::size_t i = 51; i < 80; ++i) data[i] = 0xFF;
        data[80] = 0x10;                     // last_reset_at = 0x0110 = 272
        data[81] = 0x01;
        data[88] = 0x40;                     // reward_rate = 0x42 << 8 | 0x40
        data[89] = 0x42;
        data[96] = 0x07;                     // total_claimed_rewards
        return data;
    }

    static Bytes raw_proof() {
        Bytes data(constants::PROOF_ACCOUNT_SIZE, 0);
        data[0] = constants::PROOF_DISCRIMINATOR;
        data[8] = 0x11;                      // authority[0]
        data[39] = 0x22;                     // authority[31]
        data[40] = 0x00;                     // claimable_rewards = 1_000_000_000
        data[41] = 0xCA;
        data[42] = 0x9A;
        data[43] = 0x3B;
        data[48] = 0xC0;                     // hash[0]
        data[79] = 0xDE;                     // hash[31]
        data[80] = 0x05;                     // total_hashes
        data[88] = 0x09;                     // total_rewards
        return data;
    }
};

/**
 * @brief Тест: поля Treasury читаются по своим смещениям
 */
TEST_F(AccountsTest, DecodeTreasury) {
    auto treasury = chain::decode_treasury(raw_treasury());
    ASSERT_TRUE(treasury.has_value()) << treasury.error().message;

    EXPECT_EQ(treasury->bump, 0xFEu);
    EXPECT_EQ(treasury->admin[0], 0xAA);
    EXPECT_EQ(treasury->difficulty[2], 0x0F);
    EXPECT_EQ(treasury->difficulty[31], 0xFF);
    EXPECT_EQ(treasury->last_reset_at, 272);
    EXPECT_EQ(treasury->reward_rate, 0x4240u);
    EXPECT_EQ(treasury->total_claimed_rewards, 7u);
}

/**
 * @brief Тест: поля Proof читаются по своим смещениям
 */
TEST_F(AccountsTest, DecodeProof) {
    auto proof = chain::decode_proof(raw_proof());
    ASSERT_TRUE(proof.has_value()) << proof.error().message;

    EXPECT_EQ(proof->authority[0], 0x11);
    EXPECT_EQ(proof->authority[31], 0x22);
    EXPECT_EQ(proof->claimable_rewards, 1'000'000'000u);
    EXPECT_EQ(proof->hash[0], 0xC0);
    EXPECT_EQ(proof->hash[31], 0xDE);
    EXPECT_EQ(proof->total_hashes, 5u);
    EXPECT_EQ(proof->total_rewards, 9u);
}

/**
 * @brief Тест: encode даёт те же байты, что ручная сборка
 */
TEST_F(AccountsTest, EncodeMatchesLayout) {
    auto treasury = chain::decode_treasury(raw_treasury());
    ASSERT_TRUE(treasury.has_value());
    EXPECT_EQ(chain::encode_treasury(*treasury), raw_treasury());

    auto proof = chain::decode_proof(raw_proof());
    ASSERT_TRUE(proof.has_value());
    EXPECT_EQ(chain::encode_proof(*proof), raw_proof());
}

/**
 * @brief Тест: отрицательный last_reset_at
 */
TEST_F(AccountsTest, NegativeTimestamp) {
    chain::Treasury treasury;
    treasury.last_reset_at = -5;

    auto decoded = chain::decode_treasury(chain::encode_treasury(treasury));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->last_reset_at, -5);
}

/**
 * @brief Тест: короткие данные
 */
TEST_F(AccountsTest, TruncatedData) {
    Bytes data = raw_proof();
    data.resize(95);

    auto proof = chain::decode_proof(data);
    ASSERT_FALSE(proof.has_value());
    EXPECT_EQ(proof.error().code, ErrorCode::AccountInvalidData);
}

/**
 * @brief Тест: чужой дискриминатор
 */
TEST_F(AccountsTest, WrongDiscriminator) {
    // Proof вместо Treasury: тип не совпадает (размер достаточен после дополнения)
    Bytes data = raw_proof();
    data.resize(constants::TREASURY_ACCOUNT_SIZE, 0);
    auto treasury = chain::decode_treasury(data);
    ASSERT_FALSE(treasury.has_value());
    EXPECT_EQ(treasury.error().code, ErrorCode::AccountInvalidData);

    // Ненулевой хвост дискриминатора
    Bytes proof_data = raw_proof();
    proof_data[3] = 1;
    EXPECT_FALSE(chain::decode_proof(proof_data).has_value());
}

} // namespace ore::tests
