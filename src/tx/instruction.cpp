/**
 * @file instruction.cpp
 * @brief Кодирование инструкций
 */

#include "instruction.hpp"
#include "../core/byte_order.hpp"
#include "../core/constants.hpp"

#include <algorithm>
#include <format>

namespace ore::tx {

namespace {

Result<void> check_data(ByteSpan data, uint8_t tag, std::size_t size, std::string_view name) {
    if (data.size() != size) {
        return Err<void>(
            ErrorCode::DecodingError,
            std::format("{}: ожидалось {} байт, получено {}", name, size, data.size())
        );
    }
    if (data[0] != tag) {
        return Err<void>(
            ErrorCode::DecodingError,
            std::format("{}: неверный тег {}", name, data[0])
        );
    }
    return {};
}

} // anonymous namespace

// =============================================================================
// Кодирование данных
// =============================================================================

Bytes encode_mine(const MineArgs& args) {
    Bytes data(constants::MINE_INSTRUCTION_SIZE);
    data[0] = constants::INSTRUCTION_MINE;
    std::copy(args.hash.begin(), args.hash.end(), data.begin() + 1);
    write_le64(data.data() + 33, args.nonce);
    return data;
}

Result<MineArgs> decode_mine(ByteSpan data) {
    if (auto r = check_data(data, constants::INSTRUCTION_MINE, constants::MINE_INSTRUCTION_SIZE, "Mine"); !r) {
        return std::unexpected(r.error());
    }

    MineArgs args;
    std::copy_n(data.data() + 1, 32, args.hash.begin());
    args.nonce = read_le64(data.data() + 33);
    return args;
}

Bytes encode_claim(uint64_t amount) {
    Bytes data(constants::CLAIM_INSTRUCTION_SIZE);
    data[0] = constants::INSTRUCTION_CLAIM;
    write_le64(data.data() + 1, amount);
    return data;
}

Result<uint64_t> decode_claim(ByteSpan data) {
    if (auto r = check_data(data, constants::INSTRUCTION_CLAIM, constants::CLAIM_INSTRUCTION_SIZE, "Claim"); !r) {
        return std::unexpected(r.error());
    }
    return read_le64(data.data() + 1);
}

Result<uint32_t> decode_compute_unit_limit(ByteSpan data) {
    if (auto r = check_data(data, constants::COMPUTE_BUDGET_SET_LIMIT, 5, "SetComputeUnitLimit"); !r) {
        return std::unexpected(r.error());
    }
    return read_le32(data.data() + 1);
}

Result<uint64_t> decode_compute_unit_price(ByteSpan data) {
    if (auto r = check_data(data, constants::COMPUTE_BUDGET_SET_PRICE, 9, "SetComputeUnitPrice"); !r) {
        return std::unexpected(r.error());
    }
    return read_le64(data.data() + 1);
}

// =============================================================================
// Построение инструкций
// =============================================================================

Instruction set_compute_unit_limit(uint32_t units) {
    Instruction ix;
    ix.program_id = constants::COMPUTE_BUDGET_PROGRAM;
    ix.data.resize(5);
    ix.data[0] = constants::COMPUTE_BUDGET_SET_LIMIT;
    write_le32(ix.data.data() + 1, units);
    return ix;
}

Instruction set_compute_unit_price(uint64_t micro_lamports) {
    Instruction ix;
    ix.program_id = constants::COMPUTE_BUDGET_PROGRAM;
    ix.data.resize(9);
    ix.data[0] = constants::COMPUTE_BUDGET_SET_PRICE;
    write_le64(ix.data.data() + 1, micro_lamports);
    return ix;
}

Instruction mine(const Pubkey& program_id, const MineAccounts& accounts, const MineArgs& args) {
    Instruction ix;
    ix.program_id = program_id;
    ix.accounts = {
        {accounts.signer, true, true},
        {accounts.bus, false, true},
        {accounts.proof, false, true},
        {accounts.treasury, false, false},
        {constants::SYSVAR_SLOT_HASHES, false, false},
    };
    ix.data = encode_mine(args);
    return ix;
}

Instruction claim(const Pubkey& program_id, const ClaimAccounts& accounts, uint64_t amount) {
    Instruction ix;
    ix.program_id = program_id;
    ix.accounts = {
        {accounts.signer, true, true},
        {accounts.beneficiary, false, true},
        {accounts.proof, false, true},
        {accounts.treasury, false, false},
        {accounts.treasury_tokens, false, true},
        {constants::TOKEN_PROGRAM, false, false},
    };
    ix.data = encode_claim(amount);
    return ix;
}

} // namespace ore::tx
