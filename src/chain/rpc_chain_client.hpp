/**
 * @file rpc_chain_client.hpp
 * @brief ChainClient поверх Solana JSON-RPC
 *
 * Используемые методы:
 * - getAccountInfo (encoding base64)
 * - getRecentPrioritizationFees
 * - getLatestBlockhash
 * - getBalance
 * - simulateTransaction (sigVerify=false, replaceRecentBlockhash=true)
 * - sendTransaction (skipPreflight=true, maxRetries=0, minContextSlot)
 * - getSignatureStatuses
 *
 * Повторы отправки выполняет SubmissionPipeline, поэтому узлу
 * запрещено самостоятельно переотправлять транзакцию (maxRetries=0).
 */

#pragma once

#include "chain_client.hpp"
#include "rpc_transport.hpp"
#include "../core/config.hpp"

#include <string>
#include <string_view>

namespace ore::chain {

/**
 * @brief Уровень commitment Solana
 */
enum class Commitment {
    Processed = 0,
    Confirmed = 1,
    Finalized = 2
};

[[nodiscard]] constexpr std::string_view to_string(Commitment commitment) noexcept {
    switch (commitment) {
        case Commitment::Processed: return "processed";
        case Commitment::Confirmed: return "confirmed";
        case Commitment::Finalized: return "finalized";
        default: return "confirmed";
    }
}

/**
 * @brief Разобрать commitment ("processed", "confirmed", "finalized")
 */
[[nodiscard]] Result<Commitment> parse_commitment(std::string_view text);

class RpcChainClient final : public ChainClient {
public:
    /**
     * @param rpc Параметры узла
     * @param compute_unit_limit Лимит CU, возвращаемый в FeeEstimate
     */
    RpcChainClient(const RpcConfig& rpc, uint32_t compute_unit_limit);

    [[nodiscard]] Result<AccountData> fetch_account(const Pubkey& address) override;
    [[nodiscard]] Result<FeeEstimate> fetch_fee_hint(std::span<const Pubkey> writable) override;
    [[nodiscard]] Result<BlockhashInfo> latest_blockhash() override;
    [[nodiscard]] Result<uint64_t> get_balance(const Pubkey& address) override;
    [[nodiscard]] Result<uint64_t> simulate(ByteSpan wire_tx) override;
    [[nodiscard]] Result<SubmissionHandle> submit(ByteSpan wire_tx, uint64_t min_context_slot) override;
    [[nodiscard]] Result<TxStatus> poll_status(const SubmissionHandle& handle) override;

private:
    RpcTransport transport_;
    Commitment commitment_ = Commitment::Confirmed;
    uint32_t compute_unit_limit_;
};

// =============================================================================
// Разбор ответов (поле "result")
// =============================================================================

namespace rpc {

[[nodiscard]] Result<AccountData> parse_account_info(std::string_view result);

/**
 * @brief 75-й перцентиль недавних priority fee
 */
[[nodiscard]] Result<uint64_t> parse_prioritization_fees(std::string_view result);

[[nodiscard]] Result<BlockhashInfo> parse_latest_blockhash(std::string_view result);

[[nodiscard]] Result<uint64_t> parse_balance(std::string_view result);

/**
 * @brief Потреблённые CU или ChainRejected, если симуляция вернула err
 */
[[nodiscard]] Result<uint64_t> parse_simulation(std::string_view result);

[[nodiscard]] Result<SubmissionHandle> parse_signature(std::string_view result);

/**
 * @brief Статус первой подписи из getSignatureStatuses
 *
 * @param required Уровень commitment, начиная с которого транзакция
 *                 считается подтверждённой
 */
[[nodiscard]] Result<TxStatus> parse_signature_status(std::string_view result, Commitment required);

} // namespace rpc

} // namespace ore::chain
