/**
 * @file chain_client.hpp
 * @brief Интерфейс доступа к блокчейну
 *
 * ChainClient - граница между движком майнинга и сетью. Все вызовы
 * блокирующие, с таймаутом реализации, каждая ошибка возвращается как
 * Result. Повторяемость ошибки определяет is_retryable().
 *
 * Реализации:
 * - RpcChainClient: JSON-RPC 2.0 поверх HTTP(S)
 * - FakeChainClient (tests/support): сценарные ответы для тестов
 */

#pragma once

#include "../core/constants.hpp"
#include "../core/types.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace ore::chain {

// =============================================================================
// Типы данных
// =============================================================================

/**
 * @brief Содержимое аккаунта
 */
struct AccountData {
    Pubkey owner{};
    uint64_t lamports = 0;
    Bytes data;
};

/**
 * @brief Рекомендация по комиссии
 */
struct FeeEstimate {
    /// @brief Priority fee (micro-lamports за compute unit)
    uint64_t micro_lamports_per_cu = 0;

    /// @brief Лимит compute units
    uint32_t compute_unit_limit = constants::DEFAULT_COMPUTE_UNIT_LIMIT;

    [[nodiscard]] bool operator==(const FeeEstimate&) const = default;
};

/**
 * @brief Последний blockhash
 */
struct BlockhashInfo {
    Hash256 blockhash{};

    /// @brief Высота блока, после которой blockhash недействителен
    uint64_t last_valid_height = 0;

    /// @brief Слот, на котором узел выдал ответ (minContextSlot для отправки)
    uint64_t context_slot = 0;
};

/**
 * @brief Идентификатор отправленной транзакции
 */
struct SubmissionHandle {
    /// @brief Подпись в base58
    std::string signature;

    [[nodiscard]] bool operator==(const SubmissionHandle&) const = default;
};

/**
 * @brief Состояние транзакции в сети
 */
enum class TxState {
    Pending,     ///< Ещё не подтверждена (или неизвестна узлу)
    Confirmed,   ///< Подтверждена на требуемом уровне commitment
    Rejected     ///< Выполнена с ошибкой
};

[[nodiscard]] constexpr std::string_view to_string(TxState state) noexcept {
    switch (state) {
        case TxState::Pending:   return "pending";
        case TxState::Confirmed: return "confirmed";
        case TxState::Rejected:  return "rejected";
        default: return "unknown";
    }
}

/**
 * @brief Результат опроса статуса
 */
struct TxStatus {
    TxState state = TxState::Pending;

    /// @brief Причина отклонения (для Rejected)
    std::string reason;

    [[nodiscard]] static TxStatus pending() { return {TxState::Pending, {}}; }
    [[nodiscard]] static TxStatus confirmed() { return {TxState::Confirmed, {}}; }
    [[nodiscard]] static TxStatus rejected(std::string reason) {
        return {TxState::Rejected, std::move(reason)};
    }
};

// =============================================================================
// Интерфейс
// =============================================================================

/**
 * @brief Абстрактный клиент блокчейна
 */
class ChainClient {
public:
    virtual ~ChainClient() = default;

    /**
     * @brief Прочитать аккаунт
     *
     * @return AccountNotFound если аккаунт не существует
     */
    [[nodiscard]] virtual Result<AccountData> fetch_account(const Pubkey& address) = 0;

    /**
     * @brief Рекомендуемая priority fee для транзакции с данными writable аккаунтами
     */
    [[nodiscard]] virtual Result<FeeEstimate> fetch_fee_hint(std::span<const Pubkey> writable) = 0;

    /**
     * @brief Последний blockhash
     */
    [[nodiscard]] virtual Result<BlockhashInfo> latest_blockhash() = 0;

    /**
     * @brief Баланс аккаунта в lamports
     */
    [[nodiscard]] virtual Result<uint64_t> get_balance(const Pubkey& address) = 0;

    /**
     * @brief Симулировать транзакцию
     *
     * @param wire_tx Сериализованная транзакция
     * @return Потреблённые compute units, ChainRejected при ошибке выполнения
     */
    [[nodiscard]] virtual Result<uint64_t> simulate(ByteSpan wire_tx) = 0;

    /**
     * @brief Отправить подписанную транзакцию
     *
     * @param wire_tx Сериализованная транзакция
     * @param min_context_slot Минимальный слот узла (0 = без ограничения)
     */
    [[nodiscard]] virtual Result<SubmissionHandle> submit(ByteSpan wire_tx, uint64_t min_context_slot) = 0;

    /**
     * @brief Опросить статус отправленной транзакции
     */
    [[nodiscard]] virtual Result<TxStatus> poll_status(const SubmissionHandle& handle) = 0;
};

} // namespace ore::chain
