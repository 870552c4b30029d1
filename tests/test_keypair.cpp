/**
 * @file test_keypair.cpp
 * @brief Тесты Ed25519 ключей и подписи
 */

#include <gtest/gtest.h>

#include "core/encoding.hpp"
#include "crypto/keypair.hpp"

#include <array>
#include <filesystem>
#include <fstream>
#include <string>

namespace ore::tests {

class KeypairTest : public ::testing::Test {
protected:
    void SetUp() override {
        seed_ = *from_hex("9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60");
        public_ = *from_hex("d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a");
    }

    /// @brief Solana keypair JSON: 32 байта seed + 32 байта публичного ключа
    std::string keypair_json(const Bytes& pub) const {
        std::string text = "[";
        for (std::size_t i = 0; i < 64; ++i) {
            if (i > 0) text += ",";
            text += std::to_string(i < 32 ? seed_[i] : pub[i - 32]);
        }
        return text + "]";
    }

    Bytes seed_;
    Bytes public_;
};

/**
 * @brief Тест: RFC 8032, TEST 1 (пустое сообщение)
 */
TEST_F(KeypairTest, Rfc8032Vector) {
    auto keypair = crypto::Keypair::from_seed(seed_);
    ASSERT_TRUE(keypair.has_value()) << keypair.error().message;

    EXPECT_EQ(to_hex(ByteSpan(keypair->pubkey().data(), 32)), to_hex(public_));

    const std::array<uint8_t, 1> empty{};
    auto signature = keypair->sign(ByteSpan(empty.data(), 0));
    ASSERT_TRUE(signature.has_value());
    EXPECT_EQ(to_hex(ByteSpan(signature->data(), signature->size())),
              "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e06522490155"
              "5fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b");
}

/**
 * @brief Тест: подпись проверяется и ломается при изменении сообщения
 */
TEST_F(KeypairTest, SignVerify) {
    auto keypair = crypto::Keypair::from_seed(seed_);
    ASSERT_TRUE(keypair.has_value());

    Bytes message = {'o', 'r', 'e'};
    auto signature = keypair->sign(message);
    ASSERT_TRUE(signature.has_value());

    EXPECT_TRUE(crypto::verify_signature(keypair->pubkey(), message, *signature));

    message[0] = 'O';
    EXPECT_FALSE(crypto::verify_signature(keypair->pubkey(), message, *signature));
}

/**
 * @brief Тест: seed неверной длины
 */
TEST_F(KeypairTest, SeedWrongLength) {
    Bytes short_seed(31, 0x01);
    auto keypair = crypto::Keypair::from_seed(short_seed);
    ASSERT_FALSE(keypair.has_value());
    EXPECT_EQ(keypair.error().code, ErrorCode::CryptoInvalidLength);
}

/**
 * @brief Тест: формат keypair файла Solana
 */
TEST_F(KeypairTest, FromJson) {
    auto keypair = crypto::Keypair::from_json(keypair_json(public_));
    ASSERT_TRUE(keypair.has_value()) << keypair.error().message;
    EXPECT_EQ(pubkey_to_base58(keypair->pubkey()),
              base58_encode(public_));
}

/**
 * @brief Тест: публичная половина не соответствует seed
 */
TEST_F(KeypairTest, FromJsonMismatchedPubkey) {
    Bytes wrong = public_;
    wrong[0] ^= 0xFF;
    auto keypair = crypto::Keypair::from_json(keypair_json(wrong));
    ASSERT_FALSE(keypair.has_value());
    EXPECT_EQ(keypair.error().code, ErrorCode::KeypairInvalid);
}

/**
 * @brief Тест: мусор вместо массива байт
 */
TEST_F(KeypairTest, FromJsonMalformed) {
    EXPECT_FALSE(crypto::Keypair::from_json("[1,2,3]").has_value());
    EXPECT_FALSE(crypto::Keypair::from_json("{\"secret\":1}").has_value());

    std::string text = keypair_json(public_);
    text.replace(1, text.find(',') - 1, "300");
    EXPECT_FALSE(crypto::Keypair::from_json(text).has_value());
}

/**
 * @brief Тест: загрузка из файла
 */
TEST_F(KeypairTest, FromFile) {
    auto path = std::filesystem::temp_directory_path() / "ore_test_keypair.json";
    {
        std::ofstream file(path);
        file << keypair_json(public_);
    }

    auto keypair = crypto::Keypair::from_file(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(keypair.has_value()) << keypair.error().message;
    EXPECT_EQ(to_hex(ByteSpan(keypair->pubkey().data(), 32)), to_hex(public_));
}

/**
 * @brief Тест: отсутствующий файл
 */
TEST_F(KeypairTest, MissingFile) {
    auto keypair = crypto::Keypair::from_file("/nonexistent/ore/id.json");
    ASSERT_FALSE(keypair.has_value());
    EXPECT_EQ(keypair.error().code, ErrorCode::KeypairNotFound);
}

} // namespace ore::tests
