/**
 * @file transaction.hpp
 * @brief Legacy сообщение и транзакция Solana
 *
 * Формат сообщения:
 * @code
 * header:        num_required_signatures u8
 *                num_readonly_signed u8
 *                num_readonly_unsigned u8
 * account_keys:  compact-u16 N, N x [32]
 * blockhash:     [32]
 * instructions:  compact-u16 M, M x {
 *                    program_id_index u8
 *                    compact-u16 K, K x account_index u8
 *                    compact-u16 L, L x data u8
 *                }
 * @endcode
 *
 * Транзакция: compact-u16 S, S x signature[64], message.
 *
 * Порядок ключей: writable signers (плательщик первым), readonly
 * signers, writable non-signers, readonly non-signers. Внутри группы
 * сохраняется порядок первого появления.
 */

#pragma once

#include "../core/types.hpp"
#include "instruction.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace ore::tx {

struct MessageHeader {
    uint8_t num_required_signatures = 0;
    uint8_t num_readonly_signed = 0;
    uint8_t num_readonly_unsigned = 0;

    [[nodiscard]] bool operator==(const MessageHeader&) const = default;
};

/**
 * @brief Инструкция с индексами вместо ключей
 */
struct CompiledInstruction {
    uint8_t program_id_index = 0;
    std::vector<uint8_t> account_indices;
    Bytes data;
};

struct Message {
    MessageHeader header;
    std::vector<Pubkey> account_keys;
    Hash256 recent_blockhash{};
    std::vector<CompiledInstruction> instructions;

    /**
     * @brief Сериализовать сообщение (байты, которые подписываются)
     */
    [[nodiscard]] Bytes serialize() const;

    [[nodiscard]] bool is_writable(std::size_t index) const noexcept;
    [[nodiscard]] bool is_signer(std::size_t index) const noexcept;
};

/**
 * @brief Разобранная транзакция
 */
struct ParsedTransaction {
    std::vector<SignatureBytes> signatures;
    Message message;
    Bytes message_bytes;
};

// =============================================================================
// compact-u16
// =============================================================================

void write_compact_u16(Bytes& out, uint16_t value);

/**
 * @brief Прочитать compact-u16, сдвинув offset
 */
[[nodiscard]] Result<uint16_t> read_compact_u16(ByteSpan data, std::size_t& offset);

// =============================================================================
// Компиляция и сериализация
// =============================================================================

/**
 * @brief Собрать сообщение из инструкций
 *
 * @return EncodingError если аккаунтов больше 256
 */
[[nodiscard]] Result<Message> compile_message(
    std::span<const Instruction> instructions,
    const Pubkey& payer,
    const Hash256& recent_blockhash
);

/**
 * @brief Собрать wire-формат транзакции
 */
[[nodiscard]] Bytes serialize_transaction(
    std::span<const SignatureBytes> signatures,
    ByteSpan message
);

/**
 * @brief Разобрать wire-формат транзакции
 */
[[nodiscard]] Result<ParsedTransaction> parse_transaction(ByteSpan wire);

} // namespace ore::tx
