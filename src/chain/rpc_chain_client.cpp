/**
 * @file rpc_chain_client.cpp
 * @brief Реализация ChainClient поверх Solana JSON-RPC
 */

#include "rpc_chain_client.hpp"
#include "../core/encoding.hpp"
#include "../core/json.hpp"

#include <algorithm>
#include <charconv>
#include <format>
#include <vector>

namespace ore::chain {

namespace {

Result<std::string> get_value(std::string_view result) {
    auto value = json::get_raw(result, "value");
    if (!value) {
        return Err<std::string>(ErrorCode::RpcParseError, "В ответе нет поля value");
    }
    return *value;
}

std::string quoted(std::string_view text) {
    return std::format("\"{}\"", json::escape(text));
}

} // anonymous namespace

Result<Commitment> parse_commitment(std::string_view text) {
    if (text == "processed") return Commitment::Processed;
    if (text == "confirmed") return Commitment::Confirmed;
    if (text == "finalized") return Commitment::Finalized;

    return Err<Commitment>(
        ErrorCode::ConfigInvalidValue,
        std::format("Неизвестный commitment: {}", text)
    );
}

// =============================================================================
// Разбор ответов
// =============================================================================

namespace rpc {

Result<AccountData> parse_account_info(std::string_view result) {
    auto value = get_value(result);
    if (!value) {
        return std::unexpected(value.error());
    }
    if (json::is_null(*value)) {
        return Err<AccountData>(ErrorCode::AccountNotFound);
    }

    AccountData account;

    auto lamports = json::get_uint(*value, "lamports");
    if (!lamports) {
        return Err<AccountData>(ErrorCode::RpcParseError, "Нет поля lamports");
    }
    account.lamports = *lamports;

    auto owner = json::get_string(*value, "owner");
    if (!owner) {
        return Err<AccountData>(ErrorCode::RpcParseError, "Нет поля owner");
    }
    auto owner_key = pubkey_from_base58(*owner);
    if (!owner_key) {
        return std::unexpected(owner_key.error());
    }
    account.owner = *owner_key;

    // data: ["<base64>", "base64"]
    auto data_raw = json::get_raw(*value, "data");
    auto parts = data_raw ? json::split_array(*data_raw) : std::nullopt;
    if (!parts || parts->empty()) {
        return Err<AccountData>(ErrorCode::RpcParseError, "Некорректное поле data");
    }
    auto encoded = json::unquote(parts->front());
    if (!encoded) {
        return Err<AccountData>(ErrorCode::RpcParseError, "Некорректное поле data");
    }
    auto data = base64_decode(*encoded);
    if (!data) {
        return std::unexpected(data.error());
    }
    account.data = std::move(*data);

    return account;
}

Result<uint64_t> parse_prioritization_fees(std::string_view result) {
    auto entries = json::split_array(result);
    if (!entries) {
        return Err<uint64_t>(ErrorCode::RpcParseError, "Ожидался массив priority fee");
    }

    std::vector<uint64_t> fees;
    fees.reserve(entries->size());
    for (const auto& entry : *entries) {
        if (auto fee = json::get_uint(entry, "prioritizationFee")) {
            fees.push_back(*fee);
        }
    }
    if (fees.empty()) {
        return uint64_t{0};
    }

    std::sort(fees.begin(), fees.end());
    return fees[(fees.size() - 1) * 3 / 4];
}

Result<BlockhashInfo> parse_latest_blockhash(std::string_view result) {
    auto value = get_value(result);
    if (!value) {
        return std::unexpected(value.error());
    }

    BlockhashInfo info;

    auto blockhash = json::get_string(*value, "blockhash");
    if (!blockhash) {
        return Err<BlockhashInfo>(ErrorCode::RpcParseError, "Нет поля blockhash");
    }
    auto decoded = pubkey_from_base58(*blockhash);
    if (!decoded) {
        return std::unexpected(decoded.error());
    }
    info.blockhash = *decoded;

    auto height = json::get_uint(*value, "lastValidBlockHeight");
    if (!height) {
        return Err<BlockhashInfo>(ErrorCode::RpcParseError, "Нет поля lastValidBlockHeight");
    }
    info.last_valid_height = *height;

    if (auto context = json::get_raw(result, "context")) {
        info.context_slot = json::get_uint(*context, "slot").value_or(0);
    }

    return info;
}

Result<uint64_t> parse_balance(std::string_view result) {
    auto value = get_value(result);
    if (!value) {
        return std::unexpected(value.error());
    }

    uint64_t lamports = 0;
    auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), lamports);
    if (ec != std::errc{} || ptr != value->data() + value->size()) {
        return Err<uint64_t>(ErrorCode::RpcParseError, std::format("Некорректный баланс: {}", *value));
    }
    return lamports;
}

Result<uint64_t> parse_simulation(std::string_view result) {
    auto value = get_value(result);
    if (!value) {
        return std::unexpected(value.error());
    }

    if (auto err = json::get_raw(*value, "err"); err && !json::is_null(*err)) {
        return Err<uint64_t>(ErrorCode::ChainRejected, std::format("Ошибка симуляции: {}", *err));
    }

    auto units = json::get_uint(*value, "unitsConsumed");
    if (!units) {
        return Err<uint64_t>(ErrorCode::RpcParseError, "Нет поля unitsConsumed");
    }
    return *units;
}

Result<SubmissionHandle> parse_signature(std::string_view result) {
    auto signature = json::unquote(result);
    if (!signature || signature->empty()) {
        return Err<SubmissionHandle>(ErrorCode::RpcParseError, "Ожидалась подпись транзакции");
    }
    return SubmissionHandle{std::move(*signature)};
}

Result<TxStatus> parse_signature_status(std::string_view result, Commitment required) {
    auto value = get_value(result);
    if (!value) {
        return std::unexpected(value.error());
    }

    auto statuses = json::split_array(*value);
    if (!statuses) {
        return Err<TxStatus>(ErrorCode::RpcParseError, "Ожидался массив статусов");
    }
    if (statuses->empty() || json::is_null(statuses->front())) {
        return TxStatus::pending();
    }

    const auto& status = statuses->front();

    if (auto err = json::get_raw(status, "err"); err && !json::is_null(*err)) {
        return TxStatus::rejected(*err);
    }

    auto level = json::get_string(status, "confirmationStatus");
    if (!level) {
        return TxStatus::pending();
    }
    auto reached = parse_commitment(*level);
    if (!reached) {
        return Err<TxStatus>(ErrorCode::RpcParseError, std::format("Неизвестный confirmationStatus: {}", *level));
    }
    if (static_cast<int>(*reached) >= static_cast<int>(required)) {
        return TxStatus::confirmed();
    }
    return TxStatus::pending();
}

} // namespace rpc

// =============================================================================
// RpcChainClient
// =============================================================================

RpcChainClient::RpcChainClient(const RpcConfig& rpc, uint32_t compute_unit_limit)
    : transport_(RpcTransportOptions{rpc.url, rpc.timeout_seconds})
    , commitment_(parse_commitment(rpc.commitment).value_or(Commitment::Confirmed))
    , compute_unit_limit_(compute_unit_limit) {}

Result<AccountData> RpcChainClient::fetch_account(const Pubkey& address) {
    auto params = std::format(
        R"([{},{{"encoding":"base64","commitment":"{}"}}])",
        quoted(pubkey_to_base58(address)), to_string(commitment_)
    );
    auto result = transport_.call("getAccountInfo", params);
    if (!result) {
        return std::unexpected(result.error());
    }
    return rpc::parse_account_info(*result);
}

Result<FeeEstimate> RpcChainClient::fetch_fee_hint(std::span<const Pubkey> writable) {
    std::string addresses = "[";
    for (std::size_t i = 0; i < writable.size(); ++i) {
        if (i > 0) {
            addresses += ",";
        }
        addresses += quoted(pubkey_to_base58(writable[i]));
    }
    addresses += "]";

    auto result = transport_.call("getRecentPrioritizationFees", std::format("[{}]", addresses));
    if (!result) {
        return std::unexpected(result.error());
    }
    auto fee = rpc::parse_prioritization_fees(*result);
    if (!fee) {
        return std::unexpected(fee.error());
    }
    return FeeEstimate{*fee, compute_unit_limit_};
}

Result<BlockhashInfo> RpcChainClient::latest_blockhash() {
    auto params = std::format(R"([{{"commitment":"{}"}}])", to_string(commitment_));
    auto result = transport_.call("getLatestBlockhash", params);
    if (!result) {
        return std::unexpected(result.error());
    }
    return rpc::parse_latest_blockhash(*result);
}

Result<uint64_t> RpcChainClient::get_balance(const Pubkey& address) {
    auto params = std::format(
        R"([{},{{"commitment":"{}"}}])",
        quoted(pubkey_to_base58(address)), to_string(commitment_)
    );
    auto result = transport_.call("getBalance", params);
    if (!result) {
        return std::unexpected(result.error());
    }
    return rpc::parse_balance(*result);
}

Result<uint64_t> RpcChainClient::simulate(ByteSpan wire_tx) {
    auto params = std::format(
        R"([{},{{"encoding":"base64","sigVerify":false,"replaceRecentBlockhash":true,"commitment":"{}"}}])",
        quoted(base64_encode(wire_tx)), to_string(commitment_)
    );
    auto result = transport_.call("simulateTransaction", params);
    if (!result) {
        return std::unexpected(result.error());
    }
    return rpc::parse_simulation(*result);
}

Result<SubmissionHandle> RpcChainClient::submit(ByteSpan wire_tx, uint64_t min_context_slot) {
    std::string options = R"("encoding":"base64","skipPreflight":true,"preflightCommitment":"finalized","maxRetries":0)";
    if (min_context_slot > 0) {
        options += std::format(R"(,"minContextSlot":{})", min_context_slot);
    }

    auto params = std::format("[{},{{{}}}]", quoted(base64_encode(wire_tx)), options);
    auto result = transport_.call("sendTransaction", params);
    if (!result) {
        return std::unexpected(result.error());
    }
    return rpc::parse_signature(*result);
}

Result<TxStatus> RpcChainClient::poll_status(const SubmissionHandle& handle) {
    auto params = std::format(R"([[{}],{{"searchTransactionHistory":false}}])", quoted(handle.signature));
    auto result = transport_.call("getSignatureStatuses", params);
    if (!result) {
        return std::unexpected(result.error());
    }
    return rpc::parse_signature_status(*result, commitment_);
}

} // namespace ore::chain
