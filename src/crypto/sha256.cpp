/**
 * @file sha256.cpp
 * @brief Программная реализация SHA256 (FIPS 180-4)
 */

#include "sha256.hpp"
#include "../core/byte_order.hpp"

#include <bit>
#include <cstring>

namespace ore::crypto {

namespace {

// Функции SHA256 (FIPS 180-4, секция 4.1.2)
constexpr uint32_t ch(uint32_t x, uint32_t y, uint32_t z) noexcept { return (x & y) ^ (~x & z); }
constexpr uint32_t maj(uint32_t x, uint32_t y, uint32_t z) noexcept { return (x & y) ^ (x & z) ^ (y & z); }
constexpr uint32_t big_sigma0(uint32_t x) noexcept { return std::rotr(x, 2) ^ std::rotr(x, 13) ^ std::rotr(x, 22); }
constexpr uint32_t big_sigma1(uint32_t x) noexcept { return std::rotr(x, 6) ^ std::rotr(x, 11) ^ std::rotr(x, 25); }
constexpr uint32_t small_sigma0(uint32_t x) noexcept { return std::rotr(x, 7) ^ std::rotr(x, 18) ^ (x >> 3); }
constexpr uint32_t small_sigma1(uint32_t x) noexcept { return std::rotr(x, 17) ^ std::rotr(x, 19) ^ (x >> 10); }

Hash256 state_to_hash(const Sha256State& state) noexcept {
    Hash256 result;
    for (std::size_t i = 0; i < 8; ++i) {
        write_be32(result.data() + i * 4, state[i]);
    }
    return result;
}

/**
 * @brief Дописать padding и длину, выполнить оставшиеся transform
 *
 * @param state Состояние после всех полных блоков
 * @param tail Остаток сообщения (< 64 байт)
 * @param total_len Полная длина сообщения в байтах
 */
void finalize(Sha256State& state, ByteSpan tail, uint64_t total_len) noexcept {
    std::array<uint8_t, 128> buffer{};
    if (!tail.empty()) {
        std::memcpy(buffer.data(), tail.data(), tail.size());
    }
    buffer[tail.size()] = 0x80;

    // Один блок, если после 0x80 остаётся место под 8 байт длины
    std::size_t blocks = tail.size() < 56 ? 1 : 2;
    write_be64(buffer.data() + blocks * 64 - 8, total_len * 8);

    for (std::size_t i = 0; i < blocks; ++i) {
        sha256_transform(state, buffer.data() + i * 64);
    }
}

} // anonymous namespace

// =============================================================================
// Transform
// =============================================================================

void sha256_transform(Sha256State& state, const uint8_t* block) noexcept {
    std::array<uint32_t, 64> w;
    for (std::size_t i = 0; i < 16; ++i) {
        w[i] = read_be32(block + i * 4);
    }
    for (std::size_t i = 16; i < 64; ++i) {
        w[i] = small_sigma1(w[i - 2]) + w[i - 7] + small_sigma0(w[i - 15]) + w[i - 16];
    }

    // Рабочие переменные a..h
    Sha256State v = state;

    for (std::size_t i = 0; i < 64; ++i) {
        uint32_t t1 = v[7] + big_sigma1(v[4]) + ch(v[4], v[5], v[6]) + constants::SHA256_K[i] + w[i];
        uint32_t t2 = big_sigma0(v[0]) + maj(v[0], v[1], v[2]);
        v[7] = v[6];
        v[6] = v[5];
        v[5] = v[4];
        v[4] = v[3] + t1;
        v[3] = v[2];
        v[2] = v[1];
        v[1] = v[0];
        v[0] = t1 + t2;
    }

    for (std::size_t i = 0; i < 8; ++i) {
        state[i] += v[i];
    }
}

// =============================================================================
// Полный SHA256
// =============================================================================

Hash256 sha256(ByteSpan data) noexcept {
    Sha256State state = constants::SHA256_INIT;

    std::size_t full = data.size() / 64;
    for (std::size_t i = 0; i < full; ++i) {
        sha256_transform(state, data.data() + i * 64);
    }

    finalize(state, data.subspan(full * 64), data.size());
    return state_to_hash(state);
}

// =============================================================================
// Midstate
// =============================================================================

Sha256State compute_midstate(const uint8_t* block) noexcept {
    Sha256State state = constants::SHA256_INIT;
    sha256_transform(state, block);
    return state;
}

Hash256 finish_with_midstate(const Sha256State& midstate, ByteSpan tail) noexcept {
    Sha256State state = midstate;
    finalize(state, tail, 64 + tail.size());
    return state_to_hash(state);
}

} // namespace ore::crypto
