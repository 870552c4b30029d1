/**
 * @file accounts.cpp
 * @brief Декодирование аккаунтов программы майнинга
 */

#include "accounts.hpp"
#include "../core/byte_order.hpp"
#include "../core/constants.hpp"

#include <algorithm>
#include <format>

namespace ore::chain {

namespace {

Result<void> check_header(ByteSpan data, uint8_t discriminator, std::size_t size, std::string_view name) {
    if (data.size() < size) {
        return Err<void>(
            ErrorCode::AccountInvalidData,
            std::format("{}: ожидалось {} байт, получено {}", name, size, data.size())
        );
    }
    bool tag_ok = data[0] == discriminator &&
        std::all_of(data.begin() + 1, data.begin() + constants::ACCOUNT_DISCRIMINATOR_SIZE,
                    [](uint8_t b) { return b == 0; });
    if (!tag_ok) {
        return Err<void>(
            ErrorCode::AccountInvalidData,
            std::format("{}: неверный дискриминатор {}", name, data[0])
        );
    }
    return {};
}

void write_header(Bytes& out, uint8_t discriminator) {
    out[0] = discriminator;
}

} // anonymous namespace

Result<Treasury> decode_treasury(ByteSpan data) {
    if (auto r = check_header(data, constants::TREASURY_DISCRIMINATOR,
                              constants::TREASURY_ACCOUNT_SIZE, "Treasury"); !r) {
        return std::unexpected(r.error());
    }

    const uint8_t* p = data.data();
    Treasury treasury;
    treasury.bump = read_le64(p + 8);
    std::copy_n(p + 16, 32, treasury.admin.begin());
    std::copy_n(p + 48, 32, treasury.difficulty.begin());
    treasury.last_reset_at = read_le_i64(p + 80);
    treasury.reward_rate = read_le64(p + 88);
    treasury.total_claimed_rewards = read_le64(p + 96);
    return treasury;
}

Result<Proof> decode_proof(ByteSpan data) {
    if (auto r = check_header(data, constants::PROOF_DISCRIMINATOR,
                              constants::PROOF_ACCOUNT_SIZE, "Proof"); !r) {
        return std::unexpected(r.error());
    }

    const uint8_t* p = data.data();
    Proof proof;
    std::copy_n(p + 8, 32, proof.authority.begin());
    proof.claimable_rewards = read_le64(p + 40);
    std::copy_n(p + 48, 32, proof.hash.begin());
    proof.total_hashes = read_le64(p + 80);
    proof.total_rewards = read_le64(p + 88);
    return proof;
}

Bytes encode_treasury(const Treasury& treasury) {
    Bytes out(constants::TREASURY_ACCOUNT_SIZE, 0);
    write_header(out, constants::TREASURY_DISCRIMINATOR);

    uint8_t* p = out.data();
    write_le64(p + 8, treasury.bump);
    std::copy(treasury.admin.begin(), treasury.admin.end(), p + 16);
    std::copy(treasury.difficulty.begin(), treasury.difficulty.end(), p + 48);
    write_le64(p + 80, static_cast<uint64_t>(treasury.last_reset_at));
    write_le64(p + 88, treasury.reward_rate);
    write_le64(p + 96, treasury.total_claimed_rewards);
    return out;
}

Bytes encode_proof(const Proof& proof) {
    Bytes out(constants::PROOF_ACCOUNT_SIZE, 0);
    write_header(out, constants::PROOF_DISCRIMINATOR);

    uint8_t* p = out.data();
    std::copy(proof.authority.begin(), proof.authority.end(), p + 8);
    write_le64(p + 40, proof.claimable_rewards);
    std::copy(proof.hash.begin(), proof.hash.end(), p + 48);
    write_le64(p + 80, proof.total_hashes);
    write_le64(p + 88, proof.total_rewards);
    return out;
}

} // namespace ore::chain
