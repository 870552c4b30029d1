/**
 * @file byte_order.hpp
 * @brief Функции для работы с порядком байт (endianness)
 *
 * Solana и программа ORE кодируют числа в little-endian (borsh/bincode),
 * а SHA256 работает со словами в big-endian. Этот модуль даёт
 * чтение/запись фиксированных целых в байтовые буферы.
 */

#pragma once

#include <bit>
#include <concepts>
#include <cstdint>
#include <cstring>

namespace ore {

/**
 * @brief Concept для беззнаковых целых фиксированного размера
 */
template<typename T>
concept UnsignedInteger = std::unsigned_integral<T> &&
                          (sizeof(T) == 1 || sizeof(T) == 2 ||
                           sizeof(T) == 4 || sizeof(T) == 8);

// =============================================================================
// Преобразование порядка байт
// =============================================================================

template<UnsignedInteger T>
[[nodiscard]] constexpr T to_little_endian(T value) noexcept {
    if constexpr (std::endian::native == std::endian::little) {
        return value;
    } else {
        return std::byteswap(value);
    }
}

template<UnsignedInteger T>
[[nodiscard]] constexpr T to_big_endian(T value) noexcept {
    if constexpr (std::endian::native == std::endian::big) {
        return value;
    } else {
        return std::byteswap(value);
    }
}

// =============================================================================
// Little-endian
// =============================================================================

/**
 * @brief Записать целое в little-endian формате
 *
 * @param dest Указатель на буфер (минимум sizeof(T) байт)
 */
template<UnsignedInteger T>
inline void write_le(uint8_t* dest, T value) noexcept {
    value = to_little_endian(value);
    std::memcpy(dest, &value, sizeof(value));
}

/**
 * @brief Прочитать целое из little-endian буфера
 */
template<UnsignedInteger T>
[[nodiscard]] inline T read_le(const uint8_t* src) noexcept {
    T value;
    std::memcpy(&value, src, sizeof(value));
    return to_little_endian(value);
}

inline void write_le16(uint8_t* dest, uint16_t value) noexcept { write_le(dest, value); }
inline void write_le32(uint8_t* dest, uint32_t value) noexcept { write_le(dest, value); }
inline void write_le64(uint8_t* dest, uint64_t value) noexcept { write_le(dest, value); }

[[nodiscard]] inline uint32_t read_le32(const uint8_t* src) noexcept { return read_le<uint32_t>(src); }
[[nodiscard]] inline uint64_t read_le64(const uint8_t* src) noexcept { return read_le<uint64_t>(src); }

/**
 * @brief Прочитать знаковое int64 (i64 в borsh)
 */
[[nodiscard]] inline int64_t read_le_i64(const uint8_t* src) noexcept {
    return std::bit_cast<int64_t>(read_le<uint64_t>(src));
}

// =============================================================================
// Big-endian (слова SHA256)
// =============================================================================

inline void write_be32(uint8_t* dest, uint32_t value) noexcept {
    value = to_big_endian(value);
    std::memcpy(dest, &value, sizeof(value));
}

[[nodiscard]] inline uint32_t read_be32(const uint8_t* src) noexcept {
    uint32_t value;
    std::memcpy(&value, src, sizeof(value));
    return to_big_endian(value);
}

inline void write_be64(uint8_t* dest, uint64_t value) noexcept {
    value = to_big_endian(value);
    std::memcpy(dest, &value, sizeof(value));
}

} // namespace ore
