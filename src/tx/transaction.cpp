/**
 * @file transaction.cpp
 * @brief Реализация legacy сообщения и транзакции
 */

#include "transaction.hpp"

#include <algorithm>
#include <format>

namespace ore::tx {

namespace {

struct KeyEntry {
    Pubkey key{};
    bool signer = false;
    bool writable = false;

    [[nodiscard]] int rank() const noexcept {
        if (signer) {
            return writable ? 0 : 1;
        }
        return writable ? 2 : 3;
    }
};

Result<void> need(ByteSpan data, std::size_t offset, std::size_t count) {
    if (offset > data.size() || data.size() - offset < count) {
        return Err<void>(
            ErrorCode::DecodingError,
            std::format("Транзакция обрезана: нужно {} байт с позиции {}", count, offset)
        );
    }
    return {};
}

} // anonymous namespace

// =============================================================================
// compact-u16
// =============================================================================

void write_compact_u16(Bytes& out, uint16_t value) {
    uint32_t rest = value;
    while (true) {
        uint8_t byte = rest & 0x7F;
        rest >>= 7;
        if (rest == 0) {
            out.push_back(byte);
            return;
        }
        out.push_back(byte | 0x80);
    }
}

Result<uint16_t> read_compact_u16(ByteSpan data, std::size_t& offset) {
    uint32_t value = 0;
    for (int i = 0; i < 3; ++i) {
        if (offset >= data.size()) {
            return Err<uint16_t>(ErrorCode::DecodingError, "compact-u16 обрезан");
        }
        uint8_t byte = data[offset++];
        value |= static_cast<uint32_t>(byte & 0x7F) << (7 * i);
        if ((byte & 0x80) == 0) {
            if (value > 0xFFFF) {
                return Err<uint16_t>(ErrorCode::DecodingError, "compact-u16 переполнен");
            }
            return static_cast<uint16_t>(value);
        }
    }
    return Err<uint16_t>(ErrorCode::DecodingError, "compact-u16 длиннее 3 байт");
}

// =============================================================================
// Message
// =============================================================================

Bytes Message::serialize() const {
    Bytes out;
    out.reserve(3 + 1 + account_keys.size() * 32 + 32 + 64);

    out.push_back(header.num_required_signatures);
    out.push_back(header.num_readonly_signed);
    out.push_back(header.num_readonly_unsigned);

    write_compact_u16(out, static_cast<uint16_t>(account_keys.size()));
    for (const auto& key : account_keys) {
        out.insert(out.end(), key.begin(), key.end());
    }

    out.insert(out.end(), recent_blockhash.begin(), recent_blockhash.end());

    write_compact_u16(out, static_cast<uint16_t>(instructions.size()));
    for (const auto& ix : instructions) {
        out.push_back(ix.program_id_index);
        write_compact_u16(out, static_cast<uint16_t>(ix.account_indices.size()));
        out.insert(out.end(), ix.account_indices.begin(), ix.account_indices.end());
        write_compact_u16(out, static_cast<uint16_t>(ix.data.size()));
        out.insert(out.end(), ix.data.begin(), ix.data.end());
    }

    return out;
}

bool Message::is_signer(std::size_t index) const noexcept {
    return index < header.num_required_signatures;
}

bool Message::is_writable(std::size_t index) const noexcept {
    if (index >= account_keys.size()) {
        return false;
    }
    if (is_signer(index)) {
        return index < static_cast<std::size_t>(header.num_required_signatures - header.num_readonly_signed);
    }
    return index < account_keys.size() - header.num_readonly_unsigned;
}

// =============================================================================
// Компиляция
// =============================================================================

Result<Message> compile_message(
    std::span<const Instruction> instructions,
    const Pubkey& payer,
    const Hash256& recent_blockhash
) {
    std::vector<KeyEntry> entries;
    entries.push_back({payer, true, true});

    auto upsert = [&entries](const Pubkey& key, bool signer, bool writable) {
        auto it = std::find_if(entries.begin(), entries.end(),
                               [&key](const KeyEntry& e) { return e.key == key; });
        if (it == entries.end()) {
            entries.push_back({key, signer, writable});
        } else {
            it->signer = it->signer || signer;
            it->writable = it->writable || writable;
        }
    };

    for (const auto& ix : instructions) {
        for (const auto& meta : ix.accounts) {
            upsert(meta.pubkey, meta.is_signer, meta.is_writable);
        }
        upsert(ix.program_id, false, false);
    }

    if (entries.size() > 256) {
        return Err<Message>(
            ErrorCode::EncodingError,
            std::format("Слишком много аккаунтов в транзакции: {}", entries.size())
        );
    }

    std::stable_sort(entries.begin(), entries.end(),
                     [](const KeyEntry& a, const KeyEntry& b) { return a.rank() < b.rank(); });

    Message message;
    message.recent_blockhash = recent_blockhash;
    for (const auto& entry : entries) {
        message.account_keys.push_back(entry.key);
        switch (entry.rank()) {
            case 0:
                ++message.header.num_required_signatures;
                break;
            case 1:
                ++message.header.num_required_signatures;
                ++message.header.num_readonly_signed;
                break;
            case 3:
                ++message.header.num_readonly_unsigned;
                break;
            default:
                break;
        }
    }

    auto index_of = [&message](const Pubkey& key) {
        auto it = std::find(message.account_keys.begin(), message.account_keys.end(), key);
        return static_cast<uint8_t>(std::distance(message.account_keys.begin(), it));
    };

    for (const auto& ix : instructions) {
        CompiledInstruction compiled;
        compiled.program_id_index = index_of(ix.program_id);
        for (const auto& meta : ix.accounts) {
            compiled.account_indices.push_back(index_of(meta.pubkey));
        }
        compiled.data = ix.data;
        message.instructions.push_back(std::move(compiled));
    }

    return message;
}

// =============================================================================
// Транзакция
// =============================================================================

Bytes serialize_transaction(std::span<const SignatureBytes> signatures, ByteSpan message) {
    Bytes out;
    out.reserve(1 + signatures.size() * 64 + message.size());

    write_compact_u16(out, static_cast<uint16_t>(signatures.size()));
    for (const auto& sig : signatures) {
        out.insert(out.end(), sig.begin(), sig.end());
    }
    out.insert(out.end(), message.begin(), message.end());
    return out;
}

Result<ParsedTransaction> parse_transaction(ByteSpan wire) {
    ParsedTransaction parsed;
    std::size_t offset = 0;

    auto sig_count = read_compact_u16(wire, offset);
    if (!sig_count) {
        return std::unexpected(sig_count.error());
    }
    for (uint16_t i = 0; i < *sig_count; ++i) {
        if (auto r = need(wire, offset, 64); !r) {
            return std::unexpected(r.error());
        }
        SignatureBytes sig{};
        std::copy_n(wire.data() + offset, 64, sig.begin());
        parsed.signatures.push_back(sig);
        offset += 64;
    }

    const std::size_t message_start = offset;
    auto& message = parsed.message;

    if (auto r = need(wire, offset, 3); !r) {
        return std::unexpected(r.error());
    }
    message.header.num_required_signatures = wire[offset++];
    message.header.num_readonly_signed = wire[offset++];
    message.header.num_readonly_unsigned = wire[offset++];

    auto key_count = read_compact_u16(wire, offset);
    if (!key_count) {
        return std::unexpected(key_count.error());
    }
    for (uint16_t i = 0; i < *key_count; ++i) {
        if (auto r = need(wire, offset, 32); !r) {
            return std::unexpected(r.error());
        }
        Pubkey key{};
        std::copy_n(wire.data() + offset, 32, key.begin());
        message.account_keys.push_back(key);
        offset += 32;
    }

    if (auto r = need(wire, offset, 32); !r) {
        return std::unexpected(r.error());
    }
    std::copy_n(wire.data() + offset, 32, message.recent_blockhash.begin());
    offset += 32;

    auto ix_count = read_compact_u16(wire, offset);
    if (!ix_count) {
        return std::unexpected(ix_count.error());
    }
    for (uint16_t i = 0; i < *ix_count; ++i) {
        CompiledInstruction ix;

        if (auto r = need(wire, offset, 1); !r) {
            return std::unexpected(r.error());
        }
        ix.program_id_index = wire[offset++];

        auto account_count = read_compact_u16(wire, offset);
        if (!account_count) {
            return std::unexpected(account_count.error());
        }
        if (auto r = need(wire, offset, *account_count); !r) {
            return std::unexpected(r.error());
        }
        ix.account_indices.assign(wire.begin() + offset, wire.begin() + offset + *account_count);
        offset += *account_count;

        auto data_len = read_compact_u16(wire, offset);
        if (!data_len) {
            return std::unexpected(data_len.error());
        }
        if (auto r = need(wire, offset, *data_len); !r) {
            return std::unexpected(r.error());
        }
        ix.data.assign(wire.begin() + offset, wire.begin() + offset + *data_len);
        offset += *data_len;

        message.instructions.push_back(std::move(ix));
    }

    if (offset != wire.size()) {
        return Err<ParsedTransaction>(
            ErrorCode::DecodingError,
            std::format("Лишние {} байт после транзакции", wire.size() - offset)
        );
    }

    parsed.message_bytes.assign(wire.begin() + message_start, wire.end());
    return parsed;
}

} // namespace ore::tx
