/**
 * @file test_instruction.cpp
 * @brief Тесты кодирования инструкций Mine, Claim и ComputeBudget
 */

#include <gtest/gtest.h>

#include "core/constants.hpp"
#include "core/encoding.hpp"
#include "tx/instruction.hpp"
#include "support/fake_chain_client.hpp"

namespace ore::tests {

class InstructionTest : public ::testing::Test {
protected:
    const Pubkey program_ = make_key(0x01);
};

/**
 * @brief Тест: байтовый формат Mine
 *
 * [0x02] hash[32] nonce_le[8]
 */
TEST_F(InstructionTest, MineDataLayout) {
    tx::MineArgs args;
    args.hash.fill(0xAB);
    args.nonce = 0x0102030405060708ull;

    auto data = tx::encode_mine(args);

    ASSERT_EQ(data.size(), 41u);
    EXPECT_EQ(data[0], 0x02);
    EXPECT_EQ(data[1], 0xAB);
    EXPECT_EQ(data[32], 0xAB);
    EXPECT_EQ(to_hex(ByteSpan(data.data() + 33, 8)), "0807060504030201");

    auto decoded = tx::decode_mine(data);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, args);
}

/**
 * @brief Тест: неверный тег или длина Mine
 */
TEST_F(InstructionTest, MineDecodeErrors) {
    auto data = tx::encode_mine(tx::MineArgs{});

    auto wrong_tag = data;
    wrong_tag[0] = constants::INSTRUCTION_CLAIM;
    auto r1 = tx::decode_mine(wrong_tag);
    ASSERT_FALSE(r1.has_value());
    EXPECT_EQ(r1.error().code, ErrorCode::DecodingError);

    auto short_data = data;
    short_data.pop_back();
    EXPECT_FALSE(tx::decode_mine(short_data).has_value());
}

/**
 * @brief Тест: байтовый формат Claim
 */
TEST_F(InstructionTest, ClaimDataLayout) {
    auto data = tx::encode_claim(1'000'000'000);

    ASSERT_EQ(data.size(), 9u);
    EXPECT_EQ(to_hex(data), "0300ca9a3b00000000");
    EXPECT_EQ(tx::decode_claim(data), 1'000'000'000u);
}

/**
 * @brief Тест: инструкции ComputeBudget
 */
TEST_F(InstructionTest, ComputeBudget) {
    auto limit = tx::set_compute_unit_limit(200'000);
    EXPECT_EQ(limit.program_id, constants::COMPUTE_BUDGET_PROGRAM);
    EXPECT_TRUE(limit.accounts.empty());
    EXPECT_EQ(to_hex(limit.data), "02400d0300");
    EXPECT_EQ(tx::decode_compute_unit_limit(limit.data), 200'000u);

    auto price = tx::set_compute_unit_price(5'000);
    EXPECT_EQ(price.program_id, constants::COMPUTE_BUDGET_PROGRAM);
    EXPECT_EQ(to_hex(price.data), "038813000000000000");
    EXPECT_EQ(tx::decode_compute_unit_price(price.data), 5'000u);

    EXPECT_FALSE(tx::decode_compute_unit_price(limit.data).has_value());
}

/**
 * @brief Тест: аккаунты Mine в порядке программы
 */
TEST_F(InstructionTest, MineAccounts) {
    tx::MineAccounts accounts{make_key(0x10), make_key(0x20), make_key(0x30), make_key(0x40)};
    auto ix = tx::mine(program_, accounts, tx::MineArgs{});

    EXPECT_EQ(ix.program_id, program_);
    ASSERT_EQ(ix.accounts.size(), 5u);
    EXPECT_EQ(ix.accounts[0], (tx::AccountMeta{make_key(0x10), true, true}));
    EXPECT_EQ(ix.accounts[1], (tx::AccountMeta{make_key(0x20), false, true}));
    EXPECT_EQ(ix.accounts[2], (tx::AccountMeta{make_key(0x30), false, true}));
    EXPECT_EQ(ix.accounts[3], (tx::AccountMeta{make_key(0x40), false, false}));
    EXPECT_EQ(ix.accounts[4], (tx::AccountMeta{constants::SYSVAR_SLOT_HASHES, false, false}));
}

/**
 * @brief Тест: аккаунты Claim
 */
TEST_F(InstructionTest, ClaimAccounts) {
    tx::ClaimAccounts accounts{make_key(0x10), make_key(0x50), make_key(0x30), make_key(0x40), make_key(0x60)};
    auto ix = tx::claim(program_, accounts, 7);

    ASSERT_EQ(ix.accounts.size(), 6u);
    EXPECT_TRUE(ix.accounts[0].is_signer);
    EXPECT_EQ(ix.accounts[1].pubkey, make_key(0x50));
    EXPECT_TRUE(ix.accounts[1].is_writable);
    EXPECT_EQ(ix.accounts[4].pubkey, make_key(0x60));
    EXPECT_TRUE(ix.accounts[4].is_writable);
    EXPECT_EQ(ix.accounts[5].pubkey, constants::TOKEN_PROGRAM);
    EXPECT_FALSE(ix.accounts[5].is_writable);
    EXPECT_EQ(tx::decode_claim(ix.data), 7u);
}

} // namespace ore::tests
