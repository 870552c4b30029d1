/**
 * @file difficulty.cpp
 * @brief Реализация работы с difficulty target
 */

#include "difficulty.hpp"
#include "../core/encoding.hpp"

#include <algorithm>
#include <bit>
#include <format>

namespace ore::mining {

bool meets_target(const Hash256& hash, const Hash256& target) noexcept {
    // Старшие байты первыми
    for (std::size_t i = 0; i < hash.size(); ++i) {
        if (hash[i] < target[i]) {
            return true;
        }
        if (hash[i] > target[i]) {
            return false;
        }
    }
    return true; // hash == target
}

uint32_t leading_zero_bits(const Hash256& value) noexcept {
    uint32_t bits = 0;
    for (auto byte : value) {
        if (byte == 0) {
            bits += 8;
            continue;
        }
        bits += static_cast<uint32_t>(std::countl_zero(byte));
        break;
    }
    return bits;
}

Hash256 target_from_leading_zeros(uint32_t zero_bits) noexcept {
    Hash256 target{};
    if (zero_bits >= 256) {
        return target;
    }

    target.fill(0xFF);
    std::size_t full_bytes = zero_bits / 8;
    std::fill_n(target.begin(), full_bytes, uint8_t{0});
    target[full_bytes] = static_cast<uint8_t>(0xFF >> (zero_bits % 8));
    return target;
}

std::string target_to_hex(const Hash256& target) {
    return to_hex(ByteSpan(target.data(), target.size()));
}

Result<Hash256> hex_to_target(std::string_view hex) {
    if (hex.size() != 64) {
        return Err<Hash256>(
            ErrorCode::DecodingError,
            std::format("Target должен быть 64 hex символа, получено {}", hex.size())
        );
    }

    auto bytes = from_hex(hex);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }

    Hash256 target{};
    std::copy(bytes->begin(), bytes->end(), target.begin());
    return target;
}

std::string format_difficulty(const Hash256& target) {
    return std::format("{} bits", leading_zero_bits(target));
}

std::string format_hashrate(double hashes_per_second) {
    if (hashes_per_second >= 1e9) {
        return std::format("{:.2f} GH/s", hashes_per_second / 1e9);
    }
    if (hashes_per_second >= 1e6) {
        return std::format("{:.2f} MH/s", hashes_per_second / 1e6);
    }
    if (hashes_per_second >= 1e3) {
        return std::format("{:.2f} KH/s", hashes_per_second / 1e3);
    }
    return std::format("{:.2f} H/s", hashes_per_second);
}

} // namespace ore::mining
