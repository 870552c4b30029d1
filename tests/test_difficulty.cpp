/**
 * @file test_difficulty.cpp
 * @brief Тесты работы с difficulty target
 *
 * Проверяет big-endian сравнение хеша с target, построение target
 * по количеству ведущих нулей и форматирование.
 */

#include <gtest/gtest.h>
#include <array>

#include "mining/difficulty.hpp"
#include "mining/proof.hpp"
#include "core/types.hpp"

namespace ore::tests {

/**
 * @brief Класс тестов для difficulty
 */
class DifficultyTest : public ::testing::Test {
};

/**
 * @brief Тест: хеш равный target валиден
 */
TEST_F(DifficultyTest, EqualIsValid) {
    Hash256 target{};
    target[3] = 0x42;
    target[31] = 0x01;

    EXPECT_TRUE(mining::meets_target(target, target));
}

/**
 * @brief Тест: сравнение идёт от старшего байта
 *
 * Хеш с меньшим старшим байтом валиден даже если младшие байты больше.
 */
TEST_F(DifficultyTest, BigEndianComparison) {
    Hash256 target{};
    target[0] = 0x00;
    target[1] = 0x10;

    Hash256 below{};
    below[1] = 0x0F;
    below.back() = 0xFF;
    EXPECT_TRUE(mining::meets_target(below, target));

    Hash256 above{};
    above[1] = 0x10;
    above.back() = 0x01;
    EXPECT_FALSE(mining::meets_target(above, target));

    // Младший байт хеша мал, но старший больше: невалиден
    Hash256 little_endian_trap{};
    little_endian_trap[0] = 0x01;
    EXPECT_FALSE(mining::meets_target(little_endian_trap, target));
}

/**
 * @brief Тест: максимальный и нулевой target
 */
TEST_F(DifficultyTest, ExtremeTargets) {
    Hash256 any{};
    any.fill(0xFF);

    EXPECT_TRUE(mining::meets_target(any, mining::target_from_leading_zeros(0)));
    EXPECT_FALSE(mining::meets_target(any, mining::target_from_leading_zeros(256)));

    Hash256 zero{};
    EXPECT_TRUE(mining::meets_target(zero, mining::target_from_leading_zeros(256)));
}

/**
 * @brief Тест: target по ведущим нулям
 */
TEST_F(DifficultyTest, TargetFromLeadingZeros) {
    auto target = mining::target_from_leading_zeros(12);

    EXPECT_EQ(target[0], 0x00);
    EXPECT_EQ(target[1], 0x0F);
    EXPECT_EQ(target[2], 0xFF);
    EXPECT_EQ(mining::leading_zero_bits(target), 12u);
}

/**
 * @brief Тест: подсчёт ведущих нулевых бит
 */
TEST_F(DifficultyTest, LeadingZeroBits) {
    Hash256 value{};
    EXPECT_EQ(mining::leading_zero_bits(value), 256u);

    value[0] = 0x80;
    EXPECT_EQ(mining::leading_zero_bits(value), 0u);

    value[0] = 0x00;
    value[2] = 0x01;
    EXPECT_EQ(mining::leading_zero_bits(value), 23u);
}

/**
 * @brief Тест: target <-> hex
 */
TEST_F(DifficultyTest, HexConversion) {
    auto target = mining::target_from_leading_zeros(16);
    auto hex = mining::target_to_hex(target);

    EXPECT_EQ(hex.size(), 64u);
    EXPECT_EQ(hex.substr(0, 6), "0000ff");

    auto parsed = mining::hex_to_target(hex);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, target);

    EXPECT_FALSE(mining::hex_to_target("00ff").has_value());
}

/**
 * @brief Тест: форматирование для логов
 */
TEST_F(DifficultyTest, Formatting) {
    EXPECT_EQ(mining::format_difficulty(mining::target_from_leading_zeros(20)), "20 bits");
    EXPECT_EQ(mining::format_hashrate(1'500'000.0), "1.50 MH/s");
    EXPECT_EQ(mining::format_hashrate(2'000.0), "2.00 KH/s");
    EXPECT_EQ(mining::format_hashrate(12.0), "12.00 H/s");
}

/**
 * @brief Тест: смена epoch или sequence продвигает раунд
 */
TEST_F(DifficultyTest, RoundAdvanced) {
    mining::Round round{100, 7};

    EXPECT_FALSE(mining::round_advanced(round, mining::Round{100, 7}));
    EXPECT_TRUE(mining::round_advanced(round, mining::Round{100, 8}));
    EXPECT_TRUE(mining::round_advanced(round, mining::Round{160, 7}));
}

} // namespace ore::tests
