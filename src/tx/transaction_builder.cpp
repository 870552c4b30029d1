/**
 * @file transaction_builder.cpp
 * @brief Реализация сборщика транзакций
 */

#include "transaction_builder.hpp"
#include "instruction.hpp"
#include "transaction.hpp"
#include "../core/constants.hpp"
#include "../core/encoding.hpp"

#include <algorithm>
#include <format>

namespace ore::tx {

namespace {

Result<Pubkey> decode_address(std::string_view field, const std::string& value) {
    auto key = pubkey_from_base58(value);
    if (!key) {
        return Err<Pubkey>(
            ErrorCode::ConfigInvalidValue,
            std::format("Некорректный адрес {}: {}", field, key.error().message)
        );
    }
    return *key;
}

} // anonymous namespace

std::string SignedTransaction::signature_base58() const {
    return base58_encode(ByteSpan(signature.data(), signature.size()));
}

Result<BuilderOptions> make_builder_options(const Config& config) {
    BuilderOptions options;
    options.max_priority_fee = config.fees.max_priority_fee;

    auto program_id = decode_address("program.program_id", config.program.program_id);
    if (!program_id) {
        return std::unexpected(program_id.error());
    }
    options.program_id = *program_id;

    auto treasury = decode_address("program.treasury", config.program.treasury);
    if (!treasury) {
        return std::unexpected(treasury.error());
    }
    options.treasury = *treasury;

    auto proof = decode_address("program.proof", config.program.proof);
    if (!proof) {
        return std::unexpected(proof.error());
    }
    options.proof = *proof;

    for (const auto& bus : config.program.buses) {
        auto key = decode_address("program.buses", bus);
        if (!key) {
            return std::unexpected(key.error());
        }
        options.buses.push_back(*key);
    }

    if (!config.program.treasury_tokens.empty()) {
        auto key = decode_address("program.treasury_tokens", config.program.treasury_tokens);
        if (!key) {
            return std::unexpected(key.error());
        }
        options.treasury_tokens = *key;
    }
    if (!config.wallet.beneficiary.empty()) {
        auto key = decode_address("wallet.beneficiary", config.wallet.beneficiary);
        if (!key) {
            return std::unexpected(key.error());
        }
        options.beneficiary = *key;
    }

    return options;
}

// =============================================================================
// TransactionBuilder
// =============================================================================

TransactionBuilder::TransactionBuilder(BuilderOptions options)
    : options_(std::move(options)) {}

const Pubkey& TransactionBuilder::bus_for(uint64_t nonce) const noexcept {
    return options_.buses[static_cast<std::size_t>(nonce % options_.buses.size())];
}

std::vector<Pubkey> TransactionBuilder::mine_writable_accounts(const Pubkey& signer) const {
    std::vector<Pubkey> accounts;
    accounts.push_back(signer);
    accounts.push_back(options_.proof);
    accounts.insert(accounts.end(), options_.buses.begin(), options_.buses.end());
    return accounts;
}

uint64_t TransactionBuilder::clamp_fee(uint64_t micro_lamports) const noexcept {
    return std::min(micro_lamports, options_.max_priority_fee);
}

Result<SignedTransaction> TransactionBuilder::build(
    const mining::Solution& solution,
    const chain::FeeEstimate& fee,
    const crypto::Signer& signer,
    const chain::BlockhashInfo& blockhash
) const {
    if (options_.buses.empty()) {
        return Err<SignedTransaction>(ErrorCode::EncodingError, "Не задан ни один bus");
    }

    MineAccounts accounts;
    accounts.signer = signer.pubkey();
    accounts.bus = bus_for(solution.nonce);
    accounts.proof = options_.proof;
    accounts.treasury = options_.treasury;

    std::vector<Instruction> instructions;
    instructions.push_back(mine(options_.program_id, accounts, MineArgs{solution.hash, solution.nonce}));

    auto tx = sign_and_pack(std::move(instructions), fee, signer, blockhash);
    if (!tx) {
        return std::unexpected(tx.error());
    }
    tx->round = solution.round;
    return tx;
}

Result<SignedTransaction> TransactionBuilder::build_claim(
    uint64_t amount,
    const chain::FeeEstimate& fee,
    const crypto::Signer& signer,
    const chain::BlockhashInfo& blockhash
) const {
    if (options_.beneficiary == Pubkey{} || options_.treasury_tokens == Pubkey{}) {
        return Err<SignedTransaction>(
            ErrorCode::EncodingError,
            "Для claim нужны wallet.beneficiary и program.treasury_tokens"
        );
    }
    if (amount == 0) {
        return Err<SignedTransaction>(ErrorCode::EncodingError, "Нечего выводить: сумма равна нулю");
    }

    ClaimAccounts accounts;
    accounts.signer = signer.pubkey();
    accounts.beneficiary = options_.beneficiary;
    accounts.proof = options_.proof;
    accounts.treasury = options_.treasury;
    accounts.treasury_tokens = options_.treasury_tokens;

    std::vector<Instruction> instructions;
    instructions.push_back(claim(options_.program_id, accounts, amount));

    return sign_and_pack(std::move(instructions), fee, signer, blockhash);
}

Result<SignedTransaction> TransactionBuilder::sign_and_pack(
    std::vector<Instruction> instructions,
    const chain::FeeEstimate& fee,
    const crypto::Signer& signer,
    const chain::BlockhashInfo& blockhash
) const {
    chain::FeeEstimate applied{clamp_fee(fee.micro_lamports_per_cu), fee.compute_unit_limit};
    if (applied.compute_unit_limit == 0) {
        applied.compute_unit_limit = constants::DEFAULT_COMPUTE_UNIT_LIMIT;
    }

    // ComputeBudget идёт первым
    instructions.insert(instructions.begin(), {
        set_compute_unit_limit(applied.compute_unit_limit),
        set_compute_unit_price(applied.micro_lamports_per_cu),
    });

    auto message = compile_message(instructions, signer.pubkey(), blockhash.blockhash);
    if (!message) {
        return std::unexpected(message.error());
    }
    auto message_bytes = message->serialize();

    auto signature = signer.sign(message_bytes);
    if (!signature) {
        return std::unexpected(signature.error());
    }

    SignedTransaction tx;
    tx.signature = *signature;
    tx.wire = serialize_transaction(std::span<const SignatureBytes>(&tx.signature, 1), message_bytes);
    tx.fee = applied;
    tx.last_valid_height = blockhash.last_valid_height;
    tx.min_context_slot = blockhash.context_slot;

    if (tx.wire.size() > constants::MAX_TRANSACTION_SIZE) {
        return Err<SignedTransaction>(
            ErrorCode::EncodingError,
            std::format("Транзакция {} байт превышает лимит {}", tx.wire.size(), constants::MAX_TRANSACTION_SIZE)
        );
    }

    return tx;
}

} // namespace ore::tx
