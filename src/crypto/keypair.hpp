/**
 * @file keypair.hpp
 * @brief Подписант транзакций (Ed25519)
 *
 * Signer - абстракция подписи, передаваемая в TransactionBuilder.
 * Keypair - реализация на OpenSSL EVP (Ed25519), загружаемая из
 * файла в формате Solana CLI: JSON массив из 64 чисел
 * (seed[32] || pubkey[32]).
 */

#pragma once

#include "../core/types.hpp"

#include <filesystem>
#include <memory>

namespace ore::crypto {

/**
 * @brief Интерфейс подписанта
 */
class Signer {
public:
    virtual ~Signer() = default;

    /**
     * @brief Публичный ключ (адрес плательщика)
     */
    [[nodiscard]] virtual const Pubkey& pubkey() const noexcept = 0;

    /**
     * @brief Подписать сообщение
     *
     * Ed25519 детерминирован: одно и то же сообщение всегда даёт
     * одну и ту же подпись.
     */
    [[nodiscard]] virtual Result<SignatureBytes> sign(ByteSpan message) const = 0;
};

/**
 * @brief Ключевая пара Ed25519
 */
class Keypair final : public Signer {
public:
    /**
     * @brief Создать из 32-байтного seed
     */
    [[nodiscard]] static Result<Keypair> from_seed(ByteSpan seed);

    /**
     * @brief Загрузить из JSON файла Solana CLI
     *
     * Проверяет, что сохранённый публичный ключ совпадает с выведенным из seed.
     */
    [[nodiscard]] static Result<Keypair> from_file(const std::filesystem::path& path);

    /**
     * @brief Разобрать содержимое JSON файла ключа
     */
    [[nodiscard]] static Result<Keypair> from_json(std::string_view text);

    ~Keypair() override;

    Keypair(const Keypair&) = delete;
    Keypair& operator=(const Keypair&) = delete;

    Keypair(Keypair&&) noexcept;
    Keypair& operator=(Keypair&&) noexcept;

    [[nodiscard]] const Pubkey& pubkey() const noexcept override;

    [[nodiscard]] Result<SignatureBytes> sign(ByteSpan message) const override;

private:
    Keypair();

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Проверить подпись Ed25519
 */
[[nodiscard]] bool verify_signature(
    const Pubkey& key,
    ByteSpan message,
    const SignatureBytes& signature
) noexcept;

} // namespace ore::crypto
