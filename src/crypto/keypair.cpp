/**
 * @file keypair.cpp
 * @brief Реализация Ed25519 подписанта на OpenSSL EVP
 */

#include "keypair.hpp"
#include "../core/constants.hpp"
#include "../core/json.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <charconv>
#include <format>
#include <fstream>
#include <sstream>

namespace ore::crypto {

namespace {

struct PkeyDeleter {
    void operator()(EVP_PKEY* key) const noexcept { EVP_PKEY_free(key); }
};

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

} // anonymous namespace

// =============================================================================
// Реализация (PIMPL)
// =============================================================================

struct Keypair::Impl {
    PkeyPtr key;
    Pubkey public_key{};
};

Keypair::Keypair() : impl_(std::make_unique<Impl>()) {}

Keypair::~Keypair() = default;

Keypair::Keypair(Keypair&&) noexcept = default;
Keypair& Keypair::operator=(Keypair&&) noexcept = default;

Result<Keypair> Keypair::from_seed(ByteSpan seed) {
    if (seed.size() != constants::SECRET_SEED_SIZE) {
        return Err<Keypair>(
            ErrorCode::CryptoInvalidLength,
            std::format("Seed должен быть 32 байта, получено {}", seed.size())
        );
    }

    PkeyPtr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(), seed.size()));
    if (!key) {
        return Err<Keypair>(ErrorCode::KeypairInvalid, "OpenSSL не принял seed Ed25519");
    }

    Keypair keypair;
    std::size_t len = keypair.impl_->public_key.size();
    if (EVP_PKEY_get_raw_public_key(key.get(), keypair.impl_->public_key.data(), &len) != 1 ||
        len != constants::PUBKEY_SIZE) {
        return Err<Keypair>(ErrorCode::KeypairInvalid, "Не удалось вывести публичный ключ");
    }
    keypair.impl_->key = std::move(key);
    return keypair;
}

Result<Keypair> Keypair::from_json(std::string_view text) {
    auto items = json::split_array(text);
    if (!items || items->size() != 64) {
        return Err<Keypair>(ErrorCode::KeypairInvalid, "Ожидается JSON массив из 64 байт");
    }

    std::array<uint8_t, 64> bytes{};
    for (std::size_t i = 0; i < 64; ++i) {
        const auto& item = (*items)[i];
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(item.data(), item.data() + item.size(), value);
        if (ec != std::errc{} || ptr != item.data() + item.size() || value > 255) {
            return Err<Keypair>(
                ErrorCode::KeypairInvalid,
                std::format("Некорректный байт ключа в позиции {}", i)
            );
        }
        bytes[i] = static_cast<uint8_t>(value);
    }

    auto keypair = from_seed(ByteSpan(bytes.data(), 32));
    if (!keypair) {
        return keypair;
    }

    // Вторая половина файла - публичный ключ, он должен совпадать
    if (!std::equal(keypair->pubkey().begin(), keypair->pubkey().end(), bytes.begin() + 32)) {
        return Err<Keypair>(ErrorCode::KeypairInvalid, "Публичный ключ не соответствует seed");
    }
    return keypair;
}

Result<Keypair> Keypair::from_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Err<Keypair>(
            ErrorCode::KeypairNotFound,
            std::format("Не удалось открыть файл ключа: {}", path.string())
        );
    }

    std::ostringstream content;
    content << file.rdbuf();
    return from_json(content.str());
}

const Pubkey& Keypair::pubkey() const noexcept {
    return impl_->public_key;
}

Result<SignatureBytes> Keypair::sign(ByteSpan message) const {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return Err<SignatureBytes>(ErrorCode::CryptoSignFailed, "EVP_MD_CTX_new");
    }

    // Ed25519 использует one-shot API без отдельного digest
    if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, impl_->key.get()) != 1) {
        return Err<SignatureBytes>(ErrorCode::CryptoSignFailed, "EVP_DigestSignInit");
    }

    SignatureBytes signature{};
    std::size_t len = signature.size();
    if (EVP_DigestSign(ctx.get(), signature.data(), &len, message.data(), message.size()) != 1 ||
        len != constants::SIGNATURE_SIZE) {
        return Err<SignatureBytes>(ErrorCode::CryptoSignFailed, "EVP_DigestSign");
    }
    return signature;
}

bool verify_signature(const Pubkey& key, ByteSpan message, const SignatureBytes& signature) noexcept {
    PkeyPtr pkey(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, key.data(), key.size()));
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!pkey || !ctx) {
        return false;
    }
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
        return false;
    }
    return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                            message.data(), message.size()) == 1;
}

} // namespace ore::crypto
