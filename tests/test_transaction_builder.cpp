/**
 * @file test_transaction_builder.cpp
 * @brief Тесты сборки и подписи транзакций Mine / Claim
 */

#include <gtest/gtest.h>

#include "core/encoding.hpp"
#include "crypto/keypair.hpp"
#include "tx/instruction.hpp"
#include "tx/transaction.hpp"
#include "tx/transaction_builder.hpp"
#include "support/fake_chain_client.hpp"

#include <optional>

namespace ore::tests {

namespace {

/// @brief Signer, который всегда отказывает
class FailingSigner final : public crypto::Signer {
public:
    const Pubkey& pubkey() const noexcept override { return key_; }
    Result<SignatureBytes> sign(ByteSpan) const override {
        return Err<SignatureBytes>(ErrorCode::CryptoSignFailed, "HSM недоступен");
    }

private:
    Pubkey key_ = make_key(0xEE);
};

} // anonymous namespace

class TransactionBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto seed = *from_hex("9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60");
        auto keypair = crypto::Keypair::from_seed(seed);
        ASSERT_TRUE(keypair.has_value());
        keypair_.emplace(std::move(*keypair));

        options_.program_id = make_key(0x01);
        options_.treasury = make_key(0x02);
        options_.proof = make_key(0x03);
        options_.buses = {make_key(0x10), make_key(0x11), make_key(0x12)};
        options_.beneficiary = make_key(0x20);
        options_.treasury_tokens = make_key(0x21);
        options_.max_priority_fee = 100'000;

        solution_.round = mining::Round{500, 9};
        solution_.nonce = 7;
        solution_.hash.fill(0x0F);

        blockhash_ = chain::BlockhashInfo{make_key(0xBB), 1234, 5678};
    }

    /// @brief Разобрать wire и найти инструкцию программы майнинга
    static tx::ParsedTransaction parse(const Bytes& wire) {
        auto parsed = tx::parse_transaction(wire);
        EXPECT_TRUE(parsed.has_value());
        return parsed.value_or(tx::ParsedTransaction{});
    }

    std::optional<crypto::Keypair> keypair_;
    tx::BuilderOptions options_;
    mining::Solution solution_;
    chain::BlockhashInfo blockhash_;
};

/**
 * @brief Тест: одинаковые входы дают одинаковые байты
 */
TEST_F(TransactionBuilderTest, Deterministic) {
    tx::TransactionBuilder builder(options_);
    chain::FeeEstimate fee{5'000, 300'000};

    auto first = builder.build(solution_, fee, *keypair_, blockhash_);
    auto second = builder.build(solution_, fee, *keypair_, blockhash_);
    ASSERT_TRUE(first.has_value()) << first.error().message;
    ASSERT_TRUE(second.has_value());

    EXPECT_EQ(first->wire, second->wire);
    EXPECT_EQ(first->signature, second->signature);
}

/**
 * @brief Тест: содержимое транзакции Mine
 */
TEST_F(TransactionBuilderTest, MineContents) {
    tx::TransactionBuilder builder(options_);
    auto signed_tx = builder.build(solution_, chain::FeeEstimate{5'000, 300'000}, *keypair_, blockhash_);
    ASSERT_TRUE(signed_tx.has_value());

    EXPECT_EQ(signed_tx->round, solution_.round);
    EXPECT_EQ(signed_tx->last_valid_height, 1234u);
    EXPECT_EQ(signed_tx->min_context_slot, 5678u);
    EXPECT_LE(signed_tx->wire.size(), constants::MAX_TRANSACTION_SIZE);

    auto parsed = parse(signed_tx->wire);
    const auto& message = parsed.message;
    ASSERT_EQ(message.instructions.size(), 3u);
    EXPECT_EQ(message.account_keys[0], keypair_->pubkey());
    EXPECT_EQ(message.recent_blockhash, blockhash_.blockhash);

    EXPECT_EQ(tx::decode_compute_unit_limit(message.instructions[0].data), 300'000u);
    EXPECT_EQ(tx::decode_compute_unit_price(message.instructions[1].data), 5'000u);

    const auto& mine = message.instructions[2];
    EXPECT_EQ(message.account_keys[mine.program_id_index], options_.program_id);
    auto args = tx::decode_mine(mine.data);
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(args->nonce, 7u);
    EXPECT_EQ(args->hash, solution_.hash);

    // bus = buses[nonce % 3] = buses[1]
    ASSERT_EQ(mine.account_indices.size(), 5u);
    EXPECT_EQ(message.account_keys[mine.account_indices[1]], options_.buses[1]);
}

/**
 * @brief Тест: подпись покрывает байты сообщения
 */
TEST_F(TransactionBuilderTest, SignatureVerifies) {
    tx::TransactionBuilder builder(options_);
    auto signed_tx = builder.build(solution_, chain::FeeEstimate{}, *keypair_, blockhash_);
    ASSERT_TRUE(signed_tx.has_value());

    auto parsed = parse(signed_tx->wire);
    ASSERT_EQ(parsed.signatures.size(), 1u);
    EXPECT_EQ(parsed.signatures[0], signed_tx->signature);
    EXPECT_TRUE(crypto::verify_signature(keypair_->pubkey(), parsed.message_bytes, signed_tx->signature));
    EXPECT_EQ(signed_tx->signature_base58(),
              base58_encode(ByteSpan(signed_tx->signature.data(), signed_tx->signature.size())));
}

/**
 * @brief Тест: priority fee ограничивается сверху, нулевой лимит CU заменяется
 */
TEST_F(TransactionBuilderTest, FeeClampAndDefaultLimit) {
    tx::TransactionBuilder builder(options_);
    auto signed_tx = builder.build(solution_, chain::FeeEstimate{9'000'000, 0}, *keypair_, blockhash_);
    ASSERT_TRUE(signed_tx.has_value());

    EXPECT_EQ(signed_tx->fee.micro_lamports_per_cu, 100'000u);
    EXPECT_EQ(signed_tx->fee.compute_unit_limit, constants::DEFAULT_COMPUTE_UNIT_LIMIT);

    auto parsed = parse(signed_tx->wire);
    EXPECT_EQ(tx::decode_compute_unit_price(parsed.message.instructions[1].data), 100'000u);
    EXPECT_EQ(builder.clamp_fee(50), 50u);
}

/**
 * @brief Тест: выбор bus по nonce
 */
TEST_F(TransactionBuilderTest, BusSelection) {
    tx::TransactionBuilder builder(options_);

    EXPECT_EQ(builder.bus_for(0), options_.buses[0]);
    EXPECT_EQ(builder.bus_for(4), options_.buses[1]);
    EXPECT_EQ(builder.bus_for(0xFFFFFFFFFFFFFFFFull), options_.buses[0xFFFFFFFFFFFFFFFFull % 3]);

    auto writable = builder.mine_writable_accounts(keypair_->pubkey());
    ASSERT_EQ(writable.size(), 5u);
    EXPECT_EQ(writable[0], keypair_->pubkey());
    EXPECT_EQ(writable[1], options_.proof);
}

/**
 * @brief Тест: без bus транзакцию не собрать
 */
TEST_F(TransactionBuilderTest, NoBuses) {
    options_.buses.clear();
    tx::TransactionBuilder builder(options_);

    auto signed_tx = builder.build(solution_, chain::FeeEstimate{}, *keypair_, blockhash_);
    ASSERT_FALSE(signed_tx.has_value());
    EXPECT_EQ(signed_tx.error().code, ErrorCode::EncodingError);
}

/**
 * @brief Тест: ошибка подписи пробрасывается
 */
TEST_F(TransactionBuilderTest, SignerFailure) {
    tx::TransactionBuilder builder(options_);
    FailingSigner signer;

    auto signed_tx = builder.build(solution_, chain::FeeEstimate{}, signer, blockhash_);
    ASSERT_FALSE(signed_tx.has_value());
    EXPECT_EQ(signed_tx.error().code, ErrorCode::CryptoSignFailed);
}

/**
 * @brief Тест: транзакция Claim
 */
TEST_F(TransactionBuilderTest, Claim) {
    tx::TransactionBuilder builder(options_);

    auto signed_tx = builder.build_claim(42, chain::FeeEstimate{1, 50'000}, *keypair_, blockhash_);
    ASSERT_TRUE(signed_tx.has_value()) << signed_tx.error().message;
    EXPECT_FALSE(signed_tx->round.has_value());

    auto parsed = parse(signed_tx->wire);
    ASSERT_EQ(parsed.message.instructions.size(), 3u);
    const auto& claim = parsed.message.instructions[2];
    EXPECT_EQ(tx::decode_claim(claim.data), 42u);
    EXPECT_EQ(parsed.message.account_keys[claim.account_indices[1]], options_.beneficiary);
    EXPECT_EQ(parsed.message.account_keys[claim.account_indices[4]], options_.treasury_tokens);
}

/**
 * @brief Тест: Claim без получателя или с нулевой суммой
 */
TEST_F(TransactionBuilderTest, ClaimErrors) {
    {
        tx::TransactionBuilder builder(options_);
        EXPECT_FALSE(builder.build_claim(0, chain::FeeEstimate{}, *keypair_, blockhash_).has_value());
    }
    {
        options_.beneficiary = Pubkey{};
        tx::TransactionBuilder builder(options_);
        auto signed_tx = builder.build_claim(10, chain::FeeEstimate{}, *keypair_, blockhash_);
        ASSERT_FALSE(signed_tx.has_value());
        EXPECT_EQ(signed_tx.error().code, ErrorCode::EncodingError);
    }
}

/**
 * @brief Тест: адреса из конфигурации
 */
TEST_F(TransactionBuilderTest, OptionsFromConfig) {
    Config config;
    config.program.program_id = pubkey_to_base58(make_key(0x01));
    config.program.treasury = pubkey_to_base58(make_key(0x02));
    config.program.proof = pubkey_to_base58(make_key(0x03));
    config.program.buses = {pubkey_to_base58(make_key(0x10)), pubkey_to_base58(make_key(0x11))};
    config.fees.max_priority_fee = 777;

    auto options = tx::make_builder_options(config);
    ASSERT_TRUE(options.has_value()) << options.error().message;
    EXPECT_EQ(options->program_id, make_key(0x01));
    EXPECT_EQ(options->buses.size(), 2u);
    EXPECT_EQ(options->max_priority_fee, 777u);
    EXPECT_EQ(options->beneficiary, Pubkey{});

    config.program.proof = "bad";
    EXPECT_FALSE(tx::make_builder_options(config).has_value());
}

} // namespace ore::tests
