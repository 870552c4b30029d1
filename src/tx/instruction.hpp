/**
 * @file instruction.hpp
 * @brief Инструкции программы майнинга и ComputeBudget
 *
 * Формат данных инструкций (little-endian):
 *
 * | Инструкция            | Данные                          |
 * |-----------------------|---------------------------------|
 * | Mine                  | [0x02] hash[32] nonce u64       |
 * | Claim                 | [0x03] amount u64               |
 * | SetComputeUnitLimit   | [0x02] units u32                |
 * | SetComputeUnitPrice   | [0x03] micro_lamports u64       |
 *
 * Аккаунты Mine: signer(w,s) bus(w) proof(w) treasury slot_hashes.
 * Аккаунты Claim: signer(w,s) beneficiary(w) proof(w) treasury
 * treasury_tokens(w) token_program.
 */

#pragma once

#include "../core/types.hpp"

#include <cstdint>
#include <vector>

namespace ore::tx {

// =============================================================================
// Модель
// =============================================================================

/**
 * @brief Аккаунт, используемый инструкцией
 */
struct AccountMeta {
    Pubkey pubkey{};
    bool is_signer = false;
    bool is_writable = false;

    [[nodiscard]] bool operator==(const AccountMeta&) const = default;
};

/**
 * @brief Инструкция транзакции
 */
struct Instruction {
    Pubkey program_id{};
    std::vector<AccountMeta> accounts;
    Bytes data;
};

/**
 * @brief Аргументы Mine
 */
struct MineArgs {
    Hash256 hash{};
    uint64_t nonce = 0;

    [[nodiscard]] bool operator==(const MineArgs&) const = default;
};

struct MineAccounts {
    Pubkey signer{};
    Pubkey bus{};
    Pubkey proof{};
    Pubkey treasury{};
};

struct ClaimAccounts {
    Pubkey signer{};
    Pubkey beneficiary{};
    Pubkey proof{};
    Pubkey treasury{};
    Pubkey treasury_tokens{};
};

// =============================================================================
// Кодирование данных
// =============================================================================

[[nodiscard]] Bytes encode_mine(const MineArgs& args);

/**
 * @return DecodingError при неверной длине или теге
 */
[[nodiscard]] Result<MineArgs> decode_mine(ByteSpan data);

[[nodiscard]] Bytes encode_claim(uint64_t amount);

[[nodiscard]] Result<uint64_t> decode_claim(ByteSpan data);

[[nodiscard]] Result<uint32_t> decode_compute_unit_limit(ByteSpan data);

[[nodiscard]] Result<uint64_t> decode_compute_unit_price(ByteSpan data);

// =============================================================================
// Построение инструкций
// =============================================================================

[[nodiscard]] Instruction set_compute_unit_limit(uint32_t units);

[[nodiscard]] Instruction set_compute_unit_price(uint64_t micro_lamports);

[[nodiscard]] Instruction mine(const Pubkey& program_id, const MineAccounts& accounts, const MineArgs& args);

[[nodiscard]] Instruction claim(const Pubkey& program_id, const ClaimAccounts& accounts, uint64_t amount);

} // namespace ore::tx
