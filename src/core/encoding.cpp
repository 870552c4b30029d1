/**
 * @file encoding.cpp
 * @brief Реализация base58 / base64 / hex
 */

#include "encoding.hpp"

#include <algorithm>
#include <array>
#include <format>

namespace ore {

// =============================================================================
// Алфавиты
// =============================================================================

/// @brief Алфавит base58 (без 0, O, I, l)
static constexpr std::string_view BASE58_ALPHABET =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

/// @brief Алфавит base64
static constexpr std::string_view BASE64_ALPHABET =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

namespace {

/**
 * @brief Таблица обратного поиска для алфавита (-1 = недопустимый символ)
 */
constexpr std::array<int8_t, 256> make_reverse_table(std::string_view alphabet) {
    std::array<int8_t, 256> table{};
    table.fill(-1);
    for (std::size_t i = 0; i < alphabet.size(); ++i) {
        table[static_cast<uint8_t>(alphabet[i])] = static_cast<int8_t>(i);
    }
    return table;
}

constexpr auto BASE58_REVERSE = make_reverse_table(BASE58_ALPHABET);
constexpr auto BASE64_REVERSE = make_reverse_table(BASE64_ALPHABET);

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

// =============================================================================
// Base58
// =============================================================================

std::string base58_encode(ByteSpan data) {
    // Ведущие нули
    std::size_t zeros = 0;
    while (zeros < data.size() && data[zeros] == 0) {
        ++zeros;
    }

    // Цифры в базе 58 (little-endian), log(256)/log(58) ~ 1.37
    std::vector<uint8_t> digits;
    digits.reserve(data.size() * 138 / 100 + 1);

    for (std::size_t i = zeros; i < data.size(); ++i) {
        uint32_t carry = data[i];
        for (auto& digit : digits) {
            carry += static_cast<uint32_t>(digit) << 8;
            digit = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        while (carry > 0) {
            digits.push_back(static_cast<uint8_t>(carry % 58));
            carry /= 58;
        }
    }

    std::string result(zeros, '1');
    result.reserve(zeros + digits.size());
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        result.push_back(BASE58_ALPHABET[*it]);
    }
    return result;
}

Result<Bytes> base58_decode(std::string_view text) {
    std::size_t ones = 0;
    while (ones < text.size() && text[ones] == '1') {
        ++ones;
    }

    // Байты результата (little-endian)
    Bytes bytes;
    bytes.reserve(text.size() * 733 / 1000 + 1);

    for (std::size_t i = ones; i < text.size(); ++i) {
        int value = BASE58_REVERSE[static_cast<uint8_t>(text[i])];
        if (value < 0) {
            return Err<Bytes>(
                ErrorCode::DecodingError,
                std::format("Недопустимый символ base58 '{}' в позиции {}", text[i], i)
            );
        }

        uint32_t carry = static_cast<uint32_t>(value);
        for (auto& byte : bytes) {
            carry += static_cast<uint32_t>(byte) * 58;
            byte = static_cast<uint8_t>(carry & 0xFF);
            carry >>= 8;
        }
        while (carry > 0) {
            bytes.push_back(static_cast<uint8_t>(carry & 0xFF));
            carry >>= 8;
        }
    }

    Bytes result(ones, 0);
    result.insert(result.end(), bytes.rbegin(), bytes.rend());
    return result;
}

Result<Pubkey> pubkey_from_base58(std::string_view text) {
    auto decoded = base58_decode(text);
    if (!decoded) {
        return std::unexpected(decoded.error());
    }
    if (decoded->size() != 32) {
        return Err<Pubkey>(
            ErrorCode::CryptoInvalidLength,
            std::format("Адрес '{}' декодируется в {} байт вместо 32", text, decoded->size())
        );
    }

    Pubkey key{};
    std::copy(decoded->begin(), decoded->end(), key.begin());
    return key;
}

std::string pubkey_to_base58(const Pubkey& key) {
    return base58_encode(ByteSpan(key.data(), key.size()));
}

// =============================================================================
// Base64
// =============================================================================

std::string base64_encode(ByteSpan data) {
    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    std::size_t i = 0;
    while (i + 3 <= data.size()) {
        uint32_t triple = (static_cast<uint32_t>(data[i]) << 16) |
                          (static_cast<uint32_t>(data[i + 1]) << 8) |
                          static_cast<uint32_t>(data[i + 2]);
        result.push_back(BASE64_ALPHABET[(triple >> 18) & 0x3F]);
        result.push_back(BASE64_ALPHABET[(triple >> 12) & 0x3F]);
        result.push_back(BASE64_ALPHABET[(triple >> 6) & 0x3F]);
        result.push_back(BASE64_ALPHABET[triple & 0x3F]);
        i += 3;
    }

    // Padding
    auto rest = data.size() - i;
    if (rest == 1) {
        uint32_t triple = static_cast<uint32_t>(data[i]) << 16;
        result.push_back(BASE64_ALPHABET[(triple >> 18) & 0x3F]);
        result.push_back(BASE64_ALPHABET[(triple >> 12) & 0x3F]);
        result.append("==");
    } else if (rest == 2) {
        uint32_t triple = (static_cast<uint32_t>(data[i]) << 16) |
                          (static_cast<uint32_t>(data[i + 1]) << 8);
        result.push_back(BASE64_ALPHABET[(triple >> 18) & 0x3F]);
        result.push_back(BASE64_ALPHABET[(triple >> 12) & 0x3F]);
        result.push_back(BASE64_ALPHABET[(triple >> 6) & 0x3F]);
        result.push_back('=');
    }

    return result;
}

Result<Bytes> base64_decode(std::string_view text) {
    if (text.size() % 4 != 0) {
        return Err<Bytes>(ErrorCode::DecodingError, "Длина base64 не кратна 4");
    }

    Bytes result;
    result.reserve(text.size() / 4 * 3);

    for (std::size_t i = 0; i < text.size(); i += 4) {
        uint32_t triple = 0;
        int padding = 0;

        for (std::size_t j = 0; j < 4; ++j) {
            char c = text[i + j];
            if (c == '=') {
                // '=' допустим только в последних двух позициях последней группы
                if (i + 4 != text.size() || j < 2) {
                    return Err<Bytes>(ErrorCode::DecodingError, "Неожиданный padding base64");
                }
                ++padding;
                triple <<= 6;
                continue;
            }
            if (padding > 0) {
                return Err<Bytes>(ErrorCode::DecodingError, "Данные после padding base64");
            }
            int value = BASE64_REVERSE[static_cast<uint8_t>(c)];
            if (value < 0) {
                return Err<Bytes>(
                    ErrorCode::DecodingError,
                    std::format("Недопустимый символ base64 в позиции {}", i + j)
                );
            }
            triple = (triple << 6) | static_cast<uint32_t>(value);
        }

        result.push_back(static_cast<uint8_t>((triple >> 16) & 0xFF));
        if (padding < 2) result.push_back(static_cast<uint8_t>((triple >> 8) & 0xFF));
        if (padding < 1) result.push_back(static_cast<uint8_t>(triple & 0xFF));
    }

    return result;
}

// =============================================================================
// Hex
// =============================================================================

std::string to_hex(ByteSpan data) {
    static constexpr std::string_view digits = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (auto byte : data) {
        result.push_back(digits[byte >> 4]);
        result.push_back(digits[byte & 0x0F]);
    }
    return result;
}

Result<Bytes> from_hex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return Err<Bytes>(ErrorCode::DecodingError, "Нечётная длина hex строки");
    }

    Bytes result;
    result.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return Err<Bytes>(ErrorCode::DecodingError, "Недопустимый символ hex");
        }
        result.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return result;
}

} // namespace ore
