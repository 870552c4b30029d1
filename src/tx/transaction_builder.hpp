/**
 * @file transaction_builder.hpp
 * @brief Сборка и подпись транзакций майнинга
 *
 * Транзакция Mine состоит из трёх инструкций:
 * 1. ComputeBudget::SetComputeUnitLimit(fee.compute_unit_limit)
 * 2. ComputeBudget::SetComputeUnitPrice(min(fee, max_priority_fee))
 * 3. Mine(hash, nonce)
 *
 * Bus выбирается детерминированно: buses[nonce % buses.size()].
 * Сборка чистая: одинаковые входные данные дают одинаковые байты
 * (подпись Ed25519 детерминирована).
 */

#pragma once

#include "../chain/chain_client.hpp"
#include "../core/config.hpp"
#include "../core/types.hpp"
#include "../crypto/keypair.hpp"
#include "../mining/proof.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ore::tx {

/**
 * @brief Подписанная транзакция
 *
 * Неизменяема после подписи. Владеет ей SubmissionPipeline до
 * терминального исхода.
 */
struct SignedTransaction {
    /// @brief Wire-формат (то, что уходит в sendTransaction)
    Bytes wire;

    /// @brief Подпись плательщика (она же идентификатор транзакции)
    SignatureBytes signature{};

    /// @brief Раунд решения (отсутствует у транзакций вне майнинга)
    std::optional<mining::Round> round;

    /// @brief Фактически применённая комиссия
    chain::FeeEstimate fee;

    /// @brief Высота, до которой действителен blockhash
    uint64_t last_valid_height = 0;

    /// @brief minContextSlot для отправки
    uint64_t min_context_slot = 0;

    /**
     * @brief Подпись в base58
     */
    [[nodiscard]] std::string signature_base58() const;
};

/**
 * @brief Адреса и ограничения сборщика
 */
struct BuilderOptions {
    Pubkey program_id{};
    Pubkey treasury{};
    Pubkey proof{};
    std::vector<Pubkey> buses;

    /// @brief Для Claim (могут быть нулевыми, если claim не используется)
    Pubkey beneficiary{};
    Pubkey treasury_tokens{};

    uint64_t max_priority_fee = 0;
};

/**
 * @brief Собрать BuilderOptions из конфигурации
 *
 * @return ConfigInvalidValue если адрес не декодируется
 */
[[nodiscard]] Result<BuilderOptions> make_builder_options(const Config& config);

class TransactionBuilder {
public:
    explicit TransactionBuilder(BuilderOptions options);

    /**
     * @brief Собрать и подписать транзакцию Mine
     *
     * @return EncodingError при пустом списке bus или превышении
     *         размера, CryptoSignFailed при ошибке подписи
     */
    [[nodiscard]] Result<SignedTransaction> build(
        const mining::Solution& solution,
        const chain::FeeEstimate& fee,
        const crypto::Signer& signer,
        const chain::BlockhashInfo& blockhash
    ) const;

    /**
     * @brief Собрать и подписать транзакцию Claim
     */
    [[nodiscard]] Result<SignedTransaction> build_claim(
        uint64_t amount,
        const chain::FeeEstimate& fee,
        const crypto::Signer& signer,
        const chain::BlockhashInfo& blockhash
    ) const;

    /**
     * @brief Bus для данного nonce
     *
     * @warning Список buses не должен быть пустым
     */
    [[nodiscard]] const Pubkey& bus_for(uint64_t nonce) const noexcept;

    /**
     * @brief Writable аккаунты Mine (для запроса priority fee)
     */
    [[nodiscard]] std::vector<Pubkey> mine_writable_accounts(const Pubkey& signer) const;

    /**
     * @brief Ограничить priority fee сверху
     */
    [[nodiscard]] uint64_t clamp_fee(uint64_t micro_lamports) const noexcept;

    [[nodiscard]] const BuilderOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] Result<SignedTransaction> sign_and_pack(
        std::vector<Instruction> instructions,
        const chain::FeeEstimate& fee,
        const crypto::Signer& signer,
        const chain::BlockhashInfo& blockhash
    ) const;

    BuilderOptions options_;
};

} // namespace ore::tx
