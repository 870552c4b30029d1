/**
 * @file types.hpp
 * @brief Базовые типы для ORE Miner
 *
 * Определяет основные типы данных, используемые во всём проекте:
 * - Hash256: 32-байтный хеш (SHA256, challenge, difficulty)
 * - Pubkey: 32-байтный публичный ключ / адрес аккаунта
 * - Bytes: динамический массив байт
 * - Result<T>: обёртка std::expected для обработки ошибок
 */

#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ore {

// =============================================================================
// Базовые типы данных
// =============================================================================

/**
 * @brief 256-битный хеш (32 байта)
 *
 * Используется для SHA256 хешей, challenge раунда, difficulty target
 * и recent blockhash транзакции.
 *
 * В отличие от Bitcoin, все хеши хранятся в big-endian порядке:
 * байт [0] самый старший.
 */
using Hash256 = std::array<uint8_t, 32>;

/**
 * @brief Публичный ключ Ed25519 / адрес аккаунта (32 байта)
 */
using Pubkey = std::array<uint8_t, 32>;

/**
 * @brief Подпись Ed25519 (64 байта)
 */
using SignatureBytes = std::array<uint8_t, 64>;

/**
 * @brief Динамический массив байт
 */
using Bytes = std::vector<uint8_t>;

/**
 * @brief Представление (view) на массив байт без владения
 */
using ByteSpan = std::span<const uint8_t>;

/**
 * @brief Изменяемое представление на массив байт
 */
using MutableByteSpan = std::span<uint8_t>;

// =============================================================================
// Коды ошибок
// =============================================================================

/**
 * @brief Перечисление кодов ошибок
 *
 * Используется вместо исключений для обработки ошибок в цикле майнинга.
 * Группы кодов соответствуют категориям обработки:
 * транзиентные сетевые ошибки повторяются, постоянные отклонения нет.
 */
enum class ErrorCode {
    Success = 0,

    // Ошибки конфигурации (100-199)
    ConfigNotFound = 100,
    ConfigParseError = 101,
    ConfigInvalidValue = 102,

    // Ошибки кошелька (200-299)
    KeypairNotFound = 200,
    KeypairInvalid = 201,

    // Ошибки RPC (300-399)
    RpcConnectionFailed = 300,
    RpcTimeout = 301,
    RpcParseError = 302,
    RpcInvalidParams = 303,
    RpcInternalError = 304,
    RpcRateLimited = 305,

    // Ошибки состояния chain (400-499)
    AccountNotFound = 400,
    AccountInvalidData = 401,
    ChainRejected = 402,
    InsufficientFunds = 403,

    // Ошибки майнинга (500-599)
    MiningStaleRound = 500,
    MiningDeadlineExceeded = 501,
    MiningStateTooOld = 502,
    MiningCancelled = 503,

    // Ошибки транзакций (600-699)
    EncodingError = 600,
    DecodingError = 601,
    SubmitTimedOut = 602,
    SubmitRetriesExhausted = 603,

    // Криптографические ошибки (700-799)
    CryptoSignFailed = 700,
    CryptoInvalidLength = 701,

    // Системные ошибки (800-899)
    SystemIOError = 801,
};

/**
 * @brief Преобразование кода ошибки в строку
 */
[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ConfigNotFound: return "Файл конфигурации не найден";
        case ErrorCode::ConfigParseError: return "Ошибка парсинга конфигурации";
        case ErrorCode::ConfigInvalidValue: return "Некорректное значение в конфигурации";
        case ErrorCode::KeypairNotFound: return "Файл ключа не найден";
        case ErrorCode::KeypairInvalid: return "Некорректный файл ключа";
        case ErrorCode::RpcConnectionFailed: return "Ошибка подключения к RPC";
        case ErrorCode::RpcTimeout: return "Таймаут RPC";
        case ErrorCode::RpcParseError: return "Ошибка парсинга ответа RPC";
        case ErrorCode::RpcInvalidParams: return "Некорректные параметры RPC";
        case ErrorCode::RpcInternalError: return "Внутренняя ошибка RPC";
        case ErrorCode::RpcRateLimited: return "Превышен лимит запросов RPC";
        case ErrorCode::AccountNotFound: return "Аккаунт не найден";
        case ErrorCode::AccountInvalidData: return "Некорректные данные аккаунта";
        case ErrorCode::ChainRejected: return "Транзакция отклонена";
        case ErrorCode::InsufficientFunds: return "Недостаточно средств";
        case ErrorCode::MiningStaleRound: return "Раунд устарел";
        case ErrorCode::MiningDeadlineExceeded: return "Истёк дедлайн поиска";
        case ErrorCode::MiningStateTooOld: return "Снимок состояния слишком старый";
        case ErrorCode::MiningCancelled: return "Майнинг остановлен";
        case ErrorCode::EncodingError: return "Ошибка кодирования";
        case ErrorCode::DecodingError: return "Ошибка декодирования";
        case ErrorCode::SubmitTimedOut: return "Таймаут подтверждения";
        case ErrorCode::SubmitRetriesExhausted: return "Исчерпаны попытки отправки";
        case ErrorCode::CryptoSignFailed: return "Ошибка подписи";
        case ErrorCode::CryptoInvalidLength: return "Некорректная длина данных";
        case ErrorCode::SystemIOError: return "Ошибка ввода/вывода";
        default: return "Неизвестная ошибка";
    }
}

// =============================================================================
// Result тип (std::expected wrapper)
// =============================================================================

/**
 * @brief Ошибка с кодом и опциональным сообщением
 */
struct Error {
    ErrorCode code;
    std::string message;

    constexpr explicit Error(ErrorCode c) noexcept
        : code(c), message(std::string(to_string(c))) {}

    Error(ErrorCode c, std::string msg) noexcept
        : code(c), message(std::move(msg)) {}

    [[nodiscard]] bool operator==(const Error& other) const noexcept {
        return code == other.code;
    }
};

/**
 * @brief Результат операции: значение или ошибка
 *
 * @code
 * auto account = client.fetch_account(address);
 * if (!account) {
 *     return std::unexpected(account.error());
 * }
 * @endcode
 */
template<typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Создать результат с ошибкой
 */
template<typename T>
[[nodiscard]] constexpr Result<T> Err(ErrorCode code) {
    return std::unexpected(Error{code});
}

/**
 * @brief Создать результат с ошибкой и сообщением
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Классификация ошибок
// =============================================================================

/**
 * @brief Можно ли повторить операцию после этой ошибки
 *
 * Транзиентные сетевые ошибки (обрыв соединения, таймаут, лимит запросов,
 * 5xx, обрезанный или нечитаемый ответ узла) повторяются с backoff. Постоянные отклонения (невалидная инструкция,
 * нехватка средств, ошибка выполнения в chain) не повторяются: запись в
 * chain не идемпотентна.
 */
[[nodiscard]] constexpr bool is_retryable(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::RpcConnectionFailed:
        case ErrorCode::RpcTimeout:
        case ErrorCode::RpcParseError:
        case ErrorCode::RpcInternalError:
        case ErrorCode::RpcRateLimited:
        case ErrorCode::AccountNotFound:
            return true;
        default:
            return false;
    }
}

[[nodiscard]] inline bool is_retryable(const Error& error) noexcept {
    return is_retryable(error.code);
}

} // namespace ore
