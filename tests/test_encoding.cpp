/**
 * @file test_encoding.cpp
 * @brief Тесты base58, base64 и hex
 */

#include <gtest/gtest.h>
#include <string>

#include "core/constants.hpp"
#include "core/encoding.hpp"
#include "core/types.hpp"

namespace ore::tests {

namespace {

ByteSpan as_bytes(std::string_view text) {
    return ByteSpan(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

} // anonymous namespace

// =============================================================================
// Base58
// =============================================================================

class Base58Test : public ::testing::Test {
};

/**
 * @brief Тест: известный вектор "Hello World!"
 */
TEST_F(Base58Test, EncodeKnownVector) {
    EXPECT_EQ(base58_encode(as_bytes("Hello World!")), "2NEpo7TZRRrLZSi2U");
}

/**
 * @brief Тест: ведущие нули кодируются символом '1'
 */
TEST_F(Base58Test, LeadingZeros) {
    const Bytes data = {0x00, 0x00, 0x01};
    EXPECT_EQ(base58_encode(data), "112");

    auto decoded = base58_decode("112");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, data);
}

/**
 * @brief Тест: нулевой ключ = System Program
 */
TEST_F(Base58Test, ZeroPubkey) {
    Pubkey zero{};
    EXPECT_EQ(pubkey_to_base58(zero), "11111111111111111111111111111111");
}

/**
 * @brief Тест: строковые и байтовые константы программ совпадают
 */
TEST_F(Base58Test, ProgramConstantsAgree) {
    auto compute_budget = pubkey_from_base58(constants::COMPUTE_BUDGET_PROGRAM_ID);
    ASSERT_TRUE(compute_budget.has_value());
    EXPECT_EQ(*compute_budget, constants::COMPUTE_BUDGET_PROGRAM);

    auto slot_hashes = pubkey_from_base58(constants::SYSVAR_SLOT_HASHES_ID);
    ASSERT_TRUE(slot_hashes.has_value());
    EXPECT_EQ(*slot_hashes, constants::SYSVAR_SLOT_HASHES);

    auto token = pubkey_from_base58(constants::TOKEN_PROGRAM_ID);
    ASSERT_TRUE(token.has_value());
    EXPECT_EQ(*token, constants::TOKEN_PROGRAM);
}

/**
 * @brief Тест: адрес переживает decode/encode без изменений
 */
TEST_F(Base58Test, PubkeyRoundTrip) {
    const std::string address = "TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA";
    auto key = pubkey_from_base58(address);
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(pubkey_to_base58(*key), address);
}

/**
 * @brief Тест: символы вне алфавита отвергаются
 */
TEST_F(Base58Test, RejectsInvalidCharacters) {
    for (std::string_view text : {"0abc", "Oabc", "Iabc", "labc", "ab+c"}) {
        auto decoded = base58_decode(text);
        ASSERT_FALSE(decoded.has_value()) << text;
        EXPECT_EQ(decoded.error().code, ErrorCode::DecodingError);
    }
}

/**
 * @brief Тест: адрес неверной длины
 */
TEST_F(Base58Test, PubkeyWrongLength) {
    auto key = pubkey_from_base58("2NEpo7TZRRrLZSi2U");
    ASSERT_FALSE(key.has_value());
    EXPECT_EQ(key.error().code, ErrorCode::CryptoInvalidLength);
}

// =============================================================================
// Base64
// =============================================================================

class Base64Test : public ::testing::Test {
};

/**
 * @brief Тест: векторы RFC 4648
 */
TEST_F(Base64Test, Rfc4648Vectors) {
    EXPECT_EQ(base64_encode(as_bytes("")), "");
    EXPECT_EQ(base64_encode(as_bytes("f")), "Zg==");
    EXPECT_EQ(base64_encode(as_bytes("fo")), "Zm8=");
    EXPECT_EQ(base64_encode(as_bytes("foo")), "Zm9v");
    EXPECT_EQ(base64_encode(as_bytes("foob")), "Zm9vYg==");
    EXPECT_EQ(base64_encode(as_bytes("fooba")), "Zm9vYmE=");
    EXPECT_EQ(base64_encode(as_bytes("foobar")), "Zm9vYmFy");
}

/**
 * @brief Тест: декодирование с padding
 */
TEST_F(Base64Test, DecodeWithPadding) {
    auto decoded = base64_decode("Zm9vYg==");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(std::string(decoded->begin(), decoded->end()), "foob");
}

/**
 * @brief Тест: некорректный base64
 */
TEST_F(Base64Test, RejectsMalformedInput) {
    EXPECT_FALSE(base64_decode("Zm9").has_value());
    EXPECT_FALSE(base64_decode("Zm=v").has_value());
    EXPECT_FALSE(base64_decode("Zm9v!A==").has_value());
}

// =============================================================================
// Hex
// =============================================================================

/**
 * @brief Тест: hex в нижнем регистре и обратно
 */
TEST(HexTest, EncodeDecode) {
    const Bytes data = {0x00, 0xab, 0xFF, 0x10};
    EXPECT_EQ(to_hex(data), "00abff10");

    auto decoded = from_hex("00ABff10");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, data);
}

/**
 * @brief Тест: нечётная длина и чужие символы
 */
TEST(HexTest, RejectsMalformedInput) {
    EXPECT_FALSE(from_hex("abc").has_value());
    EXPECT_FALSE(from_hex("zz").has_value());
}

} // namespace ore::tests
