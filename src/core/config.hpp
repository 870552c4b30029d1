/**
 * @file config.hpp
 * @brief Конфигурация ORE Miner
 *
 * Загрузка и парсинг конфигурации из TOML файла.
 *
 * Пример конфигурации (ore.toml):
 * @code
 * [rpc]
 * url = "https://api.mainnet-beta.solana.com"
 * timeout_seconds = 30
 * commitment = "confirmed"
 *
 * [wallet]
 * keypair_path = "~/.config/solana/id.json"
 * beneficiary = "..."          # токен-аккаунт для claim
 *
 * [program]
 * program_id = "..."
 * treasury = "..."
 * treasury_tokens = "..."
 * proof = "..."
 * buses = ["...", "..."]
 *
 * [mining]
 * threads = 0                  # 0 = все ядра
 * search_deadline_seconds = 60
 * max_staleness_seconds = 120
 * refresh_retry_delay_ms = 2000
 *
 * [fees]
 * priority_fee = 0
 * max_priority_fee = 500000
 * compute_unit_limit = 200000
 * dynamic_fee = true
 * dynamic_compute_units = false
 *
 * [submission]
 * max_retries = 4
 * backoff_initial_ms = 2000
 * backoff_max_ms = 16000
 * confirm_timeout_seconds = 60
 * poll_interval_ms = 5000
 * check_balance = true
 *
 * [logging]
 * level = "info"
 * color = true
 * event_history = 200
 * @endcode
 */

#pragma once

#include "types.hpp"
#include "constants.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ore {

// =============================================================================
// Структуры конфигурации
// =============================================================================

/**
 * @brief Настройки JSON-RPC узла
 */
struct RpcConfig {
    /// @brief URL узла (http или https)
    std::string url = constants::DEFAULT_RPC_URL;

    /// @brief Таймаут одного запроса (секунды)
    uint32_t timeout_seconds = constants::DEFAULT_RPC_TIMEOUT_SEC;

    /// @brief Уровень commitment: "processed", "confirmed", "finalized"
    std::string commitment = "confirmed";
};

/**
 * @brief Настройки кошелька
 */
struct WalletConfig {
    /// @brief Путь к файлу ключа (формат Solana CLI)
    std::string keypair_path = "~/.config/solana/id.json";

    /// @brief Токен-аккаунт получателя для claim (опционально)
    std::string beneficiary;
};

/**
 * @brief Адреса on-chain программы майнинга
 */
struct ProgramConfig {
    std::string program_id;
    std::string treasury;

    /// @brief Токен-аккаунт treasury (источник выплат claim)
    std::string treasury_tokens;

    /// @brief Proof аккаунт майнера
    std::string proof;

    /// @brief Bus аккаунты (порядок важен: bus выбирается по nonce)
    std::vector<std::string> buses;
};

/**
 * @brief Настройки майнинга
 */
struct MiningConfig {
    /// @brief Количество воркеров (0 = hardware_concurrency)
    uint32_t threads = 0;

    /// @brief Дедлайн одного поиска (секунды)
    uint32_t search_deadline_seconds = constants::DEFAULT_SEARCH_DEADLINE_SEC;

    /// @brief Максимальный возраст снимка состояния (секунды)
    uint32_t max_staleness_seconds = constants::DEFAULT_MAX_STALENESS_SEC;

    /// @brief Пауза после неудачного обновления состояния (мс)
    uint32_t refresh_retry_delay_ms = constants::DEFAULT_REFRESH_RETRY_DELAY_MS;

    /**
     * @brief Фактическое количество воркеров
     */
    [[nodiscard]] uint32_t effective_threads() const noexcept;
};

/**
 * @brief Настройки комиссий
 */
struct FeesConfig {
    /// @brief Минимальная priority fee (micro-lamports за CU)
    uint64_t priority_fee = 0;

    /// @brief Верхняя граница priority fee
    uint64_t max_priority_fee = constants::DEFAULT_MAX_PRIORITY_FEE;

    /// @brief Лимит compute units
    uint32_t compute_unit_limit = constants::DEFAULT_COMPUTE_UNIT_LIMIT;

    /// @brief Брать fee из getRecentPrioritizationFees
    bool dynamic_fee = true;

    /// @brief Определять лимит CU через simulateTransaction
    bool dynamic_compute_units = false;
};

/**
 * @brief Настройки отправки транзакций
 */
struct SubmissionConfig {
    uint32_t max_retries = constants::DEFAULT_SUBMIT_RETRIES;
    uint32_t backoff_initial_ms = constants::DEFAULT_BACKOFF_INITIAL_MS;
    uint32_t backoff_max_ms = constants::DEFAULT_BACKOFF_MAX_MS;
    uint32_t confirm_timeout_seconds = constants::DEFAULT_CONFIRM_TIMEOUT_SEC;
    uint32_t poll_interval_ms = constants::DEFAULT_POLL_INTERVAL_MS;

    /// @brief Проверять баланс SOL перед отправкой
    bool check_balance = true;
};

/**
 * @brief Настройки логирования и терминального вывода
 */
struct LoggingConfig {
    /// @brief Уровень логирования: "error", "warn", "info", "debug"
    std::string level = "info";

    /// @brief Включить ANSI цвета в терминале
    bool color = true;

    /// @brief Размер истории событий
    uint32_t event_history = 200;
};

/**
 * @brief Полная конфигурация приложения
 */
struct Config {
    RpcConfig rpc;
    WalletConfig wallet;
    ProgramConfig program;
    MiningConfig mining;
    FeesConfig fees;
    SubmissionConfig submission;
    LoggingConfig logging;

    /**
     * @brief Загрузить конфигурацию из TOML файла
     *
     * @param path Путь к файлу конфигурации
     * @return Result<Config> Конфигурация или ошибка
     */
    [[nodiscard]] static Result<Config> load(const std::filesystem::path& path);

    /**
     * @brief Разобрать конфигурацию из TOML текста
     */
    [[nodiscard]] static Result<Config> parse(std::string_view text);

    /**
     * @brief Загрузить конфигурацию с поиском файла
     *
     * Ищет файл в следующем порядке:
     * 1. Указанный путь
     * 2. ./ore.toml
     * 3. /etc/ore/ore.toml
     * 4. ~/.config/ore/ore.toml
     *
     * @param path Опциональный путь к файлу
     * @return Result<Config> Конфигурация или ошибка
     */
    [[nodiscard]] static Result<Config> load_with_search(
        const std::optional<std::filesystem::path>& path = std::nullopt
    );

    /**
     * @brief Валидация конфигурации
     *
     * Проверяет непустые обязательные поля, формат base58 адресов и
     * согласованность числовых значений.
     *
     * @return Result<void> Успех или ошибка валидации
     */
    [[nodiscard]] Result<void> validate() const;

    /**
     * @brief Путь к ключу с раскрытым "~"
     */
    [[nodiscard]] std::filesystem::path keypair_file() const;
};

/**
 * @brief Раскрыть ведущий "~" в пути по $HOME
 */
[[nodiscard]] std::filesystem::path expand_home(std::string_view path);

} // namespace ore
