/**
 * @file test_config.cpp
 * @brief Тесты загрузки и валидации конфигурации
 */

#include <gtest/gtest.h>

#include "core/config.hpp"
#include "core/encoding.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>

namespace ore::tests {

class ConfigTest : public ::testing::Test {
protected:
    static std::string address(uint8_t fill) {
        Pubkey key{};
        key.fill(fill);
        return pubkey_to_base58(key);
    }

    /// @brief Минимальный корректный TOML
    std::string minimal_toml() const {
        return std::format(R"(
[wallet]
keypair_path = "/tmp/id.json"

[program]
program_id = "{}"
treasury = "{}"
proof = "{}"
buses = ["{}", "{}"]
)", address(1), address(2), address(3), address(4), address(5));
    }
};

/**
 * @brief Тест: значения по умолчанию
 */
TEST_F(ConfigTest, Defaults) {
    Config config;

    EXPECT_EQ(config.rpc.url, "https://api.mainnet-beta.solana.com");
    EXPECT_EQ(config.rpc.timeout_seconds, 30u);
    EXPECT_EQ(config.rpc.commitment, "confirmed");
    EXPECT_EQ(config.mining.search_deadline_seconds, 60u);
    EXPECT_EQ(config.mining.max_staleness_seconds, 120u);
    EXPECT_EQ(config.fees.compute_unit_limit, 200'000u);
    EXPECT_TRUE(config.fees.dynamic_fee);
    EXPECT_FALSE(config.fees.dynamic_compute_units);
    EXPECT_EQ(config.submission.max_retries, 4u);
    EXPECT_EQ(config.submission.backoff_initial_ms, 2000u);
    EXPECT_EQ(config.submission.backoff_max_ms, 16000u);
    EXPECT_EQ(config.submission.poll_interval_ms, 5000u);
    EXPECT_EQ(config.logging.level, "info");
}

/**
 * @brief Тест: минимальный файл разбирается и проходит валидацию
 */
TEST_F(ConfigTest, ParseMinimal) {
    auto config = Config::parse(minimal_toml());
    ASSERT_TRUE(config.has_value()) << config.error().message;

    EXPECT_EQ(config->program.program_id, address(1));
    ASSERT_EQ(config->program.buses.size(), 2u);
    EXPECT_EQ(config->program.buses[1], address(5));
    EXPECT_EQ(config->wallet.keypair_path, "/tmp/id.json");

    auto valid = config->validate();
    EXPECT_TRUE(valid.has_value()) << valid.error().message;
}

/**
 * @brief Тест: все секции переопределяют значения по умолчанию
 */
TEST_F(ConfigTest, ParseAllSections) {
    std::string text = minimal_toml() + R"(
[rpc]
url = "http://127.0.0.1:8899"
timeout_seconds = 5
commitment = "finalized"

[mining]
threads = 3
search_deadline_seconds = 45
max_staleness_seconds = 90
refresh_retry_delay_ms = 100

[fees]
priority_fee = 1000
max_priority_fee = 50000
compute_unit_limit = 500000
dynamic_fee = false
dynamic_compute_units = true

[submission]
max_retries = 7
backoff_initial_ms = 100
backoff_max_ms = 800
confirm_timeout_seconds = 20
poll_interval_ms = 250
check_balance = false

[logging]
level = "debug"
color = false
event_history = 16
)";

    auto config = Config::parse(text);
    ASSERT_TRUE(config.has_value()) << config.error().message;

    EXPECT_EQ(config->rpc.url, "http://127.0.0.1:8899");
    EXPECT_EQ(config->rpc.timeout_seconds, 5u);
    EXPECT_EQ(config->rpc.commitment, "finalized");
    EXPECT_EQ(config->mining.threads, 3u);
    EXPECT_EQ(config->mining.effective_threads(), 3u);
    EXPECT_EQ(config->mining.search_deadline_seconds, 45u);
    EXPECT_EQ(config->mining.max_staleness_seconds, 90u);
    EXPECT_EQ(config->mining.refresh_retry_delay_ms, 100u);
    EXPECT_EQ(config->fees.priority_fee, 1000u);
    EXPECT_EQ(config->fees.max_priority_fee, 50000u);
    EXPECT_EQ(config->fees.compute_unit_limit, 500000u);
    EXPECT_FALSE(config->fees.dynamic_fee);
    EXPECT_TRUE(config->fees.dynamic_compute_units);
    EXPECT_EQ(config->submission.max_retries, 7u);
    EXPECT_EQ(config->submission.backoff_initial_ms, 100u);
    EXPECT_EQ(config->submission.backoff_max_ms, 800u);
    EXPECT_EQ(config->submission.confirm_timeout_seconds, 20u);
    EXPECT_EQ(config->submission.poll_interval_ms, 250u);
    EXPECT_FALSE(config->submission.check_balance);
    EXPECT_EQ(config->logging.level, "debug");
    EXPECT_FALSE(config->logging.color);
    EXPECT_EQ(config->logging.event_history, 16u);

    EXPECT_TRUE(config->validate().has_value());
}

/**
 * @brief Тест: синтаксическая ошибка TOML
 */
TEST_F(ConfigTest, ParseError) {
    auto config = Config::parse("[rpc\nurl = ");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::ConfigParseError);
}

/**
 * @brief Тест: отсутствующие адреса программы
 */
TEST_F(ConfigTest, ValidateMissingAddresses) {
    Config config;
    auto result = config.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigInvalidValue);
}

/**
 * @brief Тест: некорректные значения отвергаются
 */
TEST_F(ConfigTest, ValidateRejectsBadValues) {
    auto base = Config::parse(minimal_toml());
    ASSERT_TRUE(base.has_value());

    {
        Config config = *base;
        config.rpc.url = "ftp://example.com";
        EXPECT_FALSE(config.validate().has_value());
    }
    {
        Config config = *base;
        config.rpc.commitment = "recent";
        EXPECT_FALSE(config.validate().has_value());
    }
    {
        Config config = *base;
        config.program.buses.clear();
        EXPECT_FALSE(config.validate().has_value());
    }
    {
        Config config = *base;
        config.program.buses.push_back("not-base58-0OIl");
        EXPECT_FALSE(config.validate().has_value());
    }
    {
        Config config = *base;
        config.program.treasury = "2NEpo7TZRRrLZSi2U";
        EXPECT_FALSE(config.validate().has_value());
    }
    {
        Config config = *base;
        config.fees.priority_fee = 10;
        config.fees.max_priority_fee = 5;
        EXPECT_FALSE(config.validate().has_value());
    }
    {
        Config config = *base;
        config.submission.backoff_initial_ms = 1000;
        config.submission.backoff_max_ms = 500;
        EXPECT_FALSE(config.validate().has_value());
    }
    {
        Config config = *base;
        config.mining.search_deadline_seconds = 0;
        EXPECT_FALSE(config.validate().has_value());
    }
    {
        Config config = *base;
        config.logging.level = "trace";
        EXPECT_FALSE(config.validate().has_value());
    }
}

/**
 * @brief Тест: beneficiary проверяется только если указан
 */
TEST_F(ConfigTest, OptionalClaimAddresses) {
    auto config = Config::parse(minimal_toml());
    ASSERT_TRUE(config.has_value());
    EXPECT_TRUE(config->wallet.beneficiary.empty());
    EXPECT_TRUE(config->validate().has_value());

    config->wallet.beneficiary = "bad!";
    EXPECT_FALSE(config->validate().has_value());

    config->wallet.beneficiary = address(9);
    config->program.treasury_tokens = address(10);
    EXPECT_TRUE(config->validate().has_value());
}

/**
 * @brief Тест: загрузка из файла и отсутствующий файл
 */
TEST_F(ConfigTest, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "ore_test_config.toml";
    {
        std::ofstream file(path);
        file << minimal_toml();
    }

    auto config = Config::load(path);
    std::filesystem::remove(path);
    ASSERT_TRUE(config.has_value()) << config.error().message;
    EXPECT_EQ(config->program.proof, address(3));

    auto missing = Config::load_with_search(std::filesystem::path("/nonexistent/ore.toml"));
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::ConfigNotFound);
}

/**
 * @brief Тест: раскрытие "~" в пути
 */
TEST_F(ConfigTest, ExpandHome) {
    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        GTEST_SKIP() << "HOME не задан";
    }

    EXPECT_EQ(expand_home("~/.config/solana/id.json"),
              std::filesystem::path(home) / ".config/solana/id.json");
    EXPECT_EQ(expand_home("/abs/id.json"), std::filesystem::path("/abs/id.json"));
}

} // namespace ore::tests
