/**
 * @file constants.hpp
 * @brief Константы протокола ORE и Solana
 *
 * Содержит размеры аккаунтов, дискриминаторы инструкций, адреса
 * системных программ и значения по умолчанию для конфигурации.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace ore::constants {

// =============================================================================
// Размеры
// =============================================================================

/// @brief Размер SHA256 хеша в байтах
inline constexpr std::size_t SHA256_SIZE = 32;

/// @brief Размер блока SHA256 (один transform) в байтах
inline constexpr std::size_t SHA256_BLOCK_SIZE = 64;

/// @brief Размер публичного ключа Ed25519
inline constexpr std::size_t PUBKEY_SIZE = 32;

/// @brief Размер подписи Ed25519
inline constexpr std::size_t SIGNATURE_SIZE = 64;

/// @brief Размер seed (приватной части) Ed25519
inline constexpr std::size_t SECRET_SEED_SIZE = 32;

/// @brief Размер входа хеша: challenge[32] + signer[32] + nonce[8]
inline constexpr std::size_t HASH_INPUT_SIZE = 72;

/// @brief Максимальный размер сериализованной транзакции (MTU пакета)
inline constexpr std::size_t MAX_TRANSACTION_SIZE = 1232;

// =============================================================================
// Аккаунты программы
// =============================================================================

/// @brief Длина дискриминатора аккаунта
inline constexpr std::size_t ACCOUNT_DISCRIMINATOR_SIZE = 8;

/// @brief Дискриминатор аккаунта Proof
inline constexpr uint8_t PROOF_DISCRIMINATOR = 101;

/// @brief Дискриминатор аккаунта Treasury
inline constexpr uint8_t TREASURY_DISCRIMINATOR = 102;

/// @brief Размер аккаунта Proof: disc[8] authority[32] claimable[8] hash[32] hashes[8] rewards[8]
inline constexpr std::size_t PROOF_ACCOUNT_SIZE = 8 + 32 + 8 + 32 + 8 + 8;
static_assert(PROOF_ACCOUNT_SIZE == 96, "Размер Proof должен быть 96 байт");

/// @brief Размер аккаунта Treasury: disc[8] bump[8] admin[32] difficulty[32] reset[8] rate[8] claimed[8]
inline constexpr std::size_t TREASURY_ACCOUNT_SIZE = 8 + 8 + 32 + 32 + 8 + 8 + 8;
static_assert(TREASURY_ACCOUNT_SIZE == 104, "Размер Treasury должен быть 104 байта");

// =============================================================================
// Инструкции программы
// =============================================================================

/// @brief Тег инструкции Mine
inline constexpr uint8_t INSTRUCTION_MINE = 2;

/// @brief Тег инструкции Claim
inline constexpr uint8_t INSTRUCTION_CLAIM = 3;

/// @brief Размер данных Mine: tag[1] + hash[32] + nonce[8]
inline constexpr std::size_t MINE_INSTRUCTION_SIZE = 1 + 32 + 8;
static_assert(MINE_INSTRUCTION_SIZE == 41, "Размер Mine должен быть 41 байт");

/// @brief Размер данных Claim: tag[1] + amount[8]
inline constexpr std::size_t CLAIM_INSTRUCTION_SIZE = 1 + 8;

/// @brief Тег ComputeBudget::SetComputeUnitLimit
inline constexpr uint8_t COMPUTE_BUDGET_SET_LIMIT = 2;

/// @brief Тег ComputeBudget::SetComputeUnitPrice
inline constexpr uint8_t COMPUTE_BUDGET_SET_PRICE = 3;

/// @brief Запас compute units сверх результата симуляции
inline constexpr uint32_t COMPUTE_UNIT_MARGIN = 1000;

/// @brief Повторов симуляции сверх первой попытки
inline constexpr uint32_t SIMULATION_RETRIES = 4;

/// @brief Знаков после запятой у токена ORE
inline constexpr uint32_t TOKEN_DECIMALS = 9;

// =============================================================================
// Системные адреса (base58)
// =============================================================================

inline constexpr const char* COMPUTE_BUDGET_PROGRAM_ID = "ComputeBudget111111111111111111111111111111";
inline constexpr const char* SYSVAR_SLOT_HASHES_ID = "SysvarS1otHashes111111111111111111111111111";
inline constexpr const char* TOKEN_PROGRAM_ID = "TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA";

/// @brief ComputeBudget111111111111111111111111111111
inline constexpr std::array<uint8_t, 32> COMPUTE_BUDGET_PROGRAM = {
    0x03, 0x06, 0x46, 0x6f, 0xe5, 0x21, 0x17, 0x32, 0xff, 0xec, 0xad, 0xba, 0x72, 0xc3, 0x9b, 0xe7,
    0xbc, 0x8c, 0xe5, 0xbb, 0xc5, 0xf7, 0x12, 0x6b, 0x2c, 0x43, 0x9b, 0x3a, 0x40, 0x00, 0x00, 0x00
};

/// @brief SysvarS1otHashes111111111111111111111111111
inline constexpr std::array<uint8_t, 32> SYSVAR_SLOT_HASHES = {
    0x06, 0xa7, 0xd5, 0x17, 0x19, 0x2f, 0x0a, 0xaf, 0xc6, 0xf2, 0x65, 0xe3, 0xfb, 0x77, 0xcc, 0x7a,
    0xda, 0x82, 0xc5, 0x29, 0xd0, 0xbe, 0x3b, 0x13, 0x6e, 0x2d, 0x00, 0x55, 0x20, 0x00, 0x00, 0x00
};

/// @brief TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA
inline constexpr std::array<uint8_t, 32> TOKEN_PROGRAM = {
    0x06, 0xdd, 0xf6, 0xe1, 0xd7, 0x65, 0xa1, 0x93, 0xd9, 0xcb, 0xe1, 0x46, 0xce, 0xeb, 0x79, 0xac,
    0x1c, 0xb4, 0x85, 0xed, 0x5f, 0x5b, 0x37, 0x91, 0x3a, 0x8c, 0xf5, 0x85, 0x7e, 0xff, 0x00, 0xa9
};

// =============================================================================
// Значения по умолчанию
// =============================================================================

/// @brief RPC endpoint по умолчанию
inline constexpr const char* DEFAULT_RPC_URL = "https://api.mainnet-beta.solana.com";

/// @brief Таймаут RPC запроса в секундах
inline constexpr uint32_t DEFAULT_RPC_TIMEOUT_SEC = 30;

/// @brief Дедлайн одного поиска в секундах
inline constexpr uint32_t DEFAULT_SEARCH_DEADLINE_SEC = 60;

/// @brief Максимальный возраст снимка состояния в секундах
inline constexpr uint32_t DEFAULT_MAX_STALENESS_SEC = 120;

/// @brief Лимит compute units по умолчанию
inline constexpr uint32_t DEFAULT_COMPUTE_UNIT_LIMIT = 200'000;

/// @brief Максимальная priority fee (micro-lamports за CU)
inline constexpr uint64_t DEFAULT_MAX_PRIORITY_FEE = 500'000;

/// @brief Количество повторов отправки
inline constexpr uint32_t DEFAULT_SUBMIT_RETRIES = 4;

/// @brief Начальная задержка backoff (мс)
inline constexpr uint32_t DEFAULT_BACKOFF_INITIAL_MS = 2000;

/// @brief Максимальная задержка backoff (мс)
inline constexpr uint32_t DEFAULT_BACKOFF_MAX_MS = 16000;

/// @brief Таймаут подтверждения в секундах
inline constexpr uint32_t DEFAULT_CONFIRM_TIMEOUT_SEC = 60;

/// @brief Интервал опроса статуса (мс)
inline constexpr uint32_t DEFAULT_POLL_INTERVAL_MS = 5000;

/// @brief Пауза перед повторным refresh при ошибке (мс)
inline constexpr uint32_t DEFAULT_REFRESH_RETRY_DELAY_MS = 2000;

// =============================================================================
// Начальные значения SHA256 (H0-H7)
// =============================================================================

/// @brief Начальные значения хеша SHA256 (FIPS 180-4)
inline constexpr std::array<uint32_t, 8> SHA256_INIT = {
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
    0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19
};

/// @brief Константы раунда SHA256
inline constexpr std::array<uint32_t, 64> SHA256_K = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5,
    0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3,
    0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc,
    0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7,
    0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13,
    0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3,
    0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5,
    0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208,
    0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
};

} // namespace ore::constants
