/**
 * @file rpc_transport.cpp
 * @brief Реализация HTTP транспорта JSON-RPC 2.0
 */

#include "rpc_transport.hpp"
#include "../core/json.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <format>
#include <mutex>

namespace ore::chain {

namespace {

std::atomic<bool> curl_initialized{false};

void ensure_curl_init() {
    bool expected = false;
    if (curl_initialized.compare_exchange_strong(expected, true)) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }
}

/**
 * @brief Callback для записи ответа
 */
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* output) {
    size_t total_size = size * nmemb;
    output->append(static_cast<char*>(contents), total_size);
    return total_size;
}

bool contains_ci(std::string_view text, std::string_view needle) {
    auto it = std::search(
        text.begin(), text.end(), needle.begin(), needle.end(),
        [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) ==
                   std::tolower(static_cast<unsigned char>(b));
        });
    return it != text.end();
}

} // anonymous namespace

// =============================================================================
// Классификация
// =============================================================================

Error classify_rpc_error(int64_t code, std::string_view message) {
    std::string text = std::format("RPC ошибка {}: {}", code, message);

    if (contains_ci(message, "insufficient funds") ||
        contains_ci(message, "insufficient lamports")) {
        return Error{ErrorCode::InsufficientFunds, std::move(text)};
    }

    switch (code) {
        case -32700:   // узел не разобрал наш запрос
        case -32600:
        case -32601:
        case -32602:
            return Error{ErrorCode::RpcInvalidParams, std::move(text)};
        case -32002:   // ошибка preflight / выполнения транзакции
        case -32003:   // неверная подпись
            return Error{ErrorCode::ChainRejected, std::move(text)};
        case 429:
        case -32429:
            return Error{ErrorCode::RpcRateLimited, std::move(text)};
        default:
            // Узел нездоров, слот пропущен, minContextSlot не достигнут и т.п.
            return Error{ErrorCode::RpcInternalError, std::move(text)};
    }
}

Result<std::string> extract_result(std::string_view body) {
    if (auto error = json::get_raw(body, "error"); error && !json::is_null(*error)) {
        auto code = json::get_int(*error, "code").value_or(0);
        auto message = json::get_string(*error, "message").value_or("");
        return std::unexpected(classify_rpc_error(code, message));
    }

    auto result = json::get_raw(body, "result");
    if (!result) {
        return Err<std::string>(ErrorCode::RpcParseError, "В ответе RPC нет поля result");
    }
    return *result;
}

std::string make_request(uint64_t id, std::string_view method, std::string_view params) {
    return std::format(
        R"({{"jsonrpc":"2.0","id":{},"method":"{}","params":{}}})",
        id, method, params
    );
}

// =============================================================================
// Реализация (PIMPL)
// =============================================================================

struct RpcTransport::Impl {
    RpcTransportOptions options;
    CURL* curl = nullptr;
    std::mutex mutex;
    uint64_t next_id = 1;

    explicit Impl(RpcTransportOptions opts)
        : options(std::move(opts)) {
        ensure_curl_init();

        curl = curl_easy_init();
        if (curl) {
            // Установка базовых опций
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_URL, options.url.c_str());
            curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(options.timeout_seconds));
            curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 5L);
            curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        }
    }

    ~Impl() {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }

    Result<std::string> post(const std::string& request) {
        if (!curl) {
            return Err<std::string>(ErrorCode::RpcConnectionFailed, "CURL не инициализирован");
        }

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");

        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.size()));

        // Буфер для ответа
        std::string response;
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

        CURLcode res = curl_easy_perform(curl);
        curl_slist_free_all(headers);

        if (res == CURLE_OPERATION_TIMEDOUT) {
            return Err<std::string>(
                ErrorCode::RpcTimeout,
                std::format("Таймаут запроса к {}", options.url)
            );
        }
        if (res != CURLE_OK) {
            return Err<std::string>(
                ErrorCode::RpcConnectionFailed,
                std::format("CURL ошибка: {}", curl_easy_strerror(res))
            );
        }

        // Проверяем HTTP код
        long http_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

        if (http_code == 200) {
            return response;
        }
        if (http_code == 408) {
            return Err<std::string>(ErrorCode::RpcTimeout, "HTTP 408");
        }
        if (http_code == 429) {
            return Err<std::string>(ErrorCode::RpcRateLimited, "HTTP 429: превышен лимит запросов");
        }
        if (http_code >= 500) {
            return Err<std::string>(
                ErrorCode::RpcInternalError,
                std::format("HTTP ошибка: {}", http_code)
            );
        }
        return Err<std::string>(
            ErrorCode::RpcInvalidParams,
            std::format("HTTP ошибка: {}", http_code)
        );
    }
};

// =============================================================================
// Публичный API
// =============================================================================

RpcTransport::RpcTransport(RpcTransportOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {}

RpcTransport::~RpcTransport() = default;

Result<std::string> RpcTransport::call(std::string_view method, std::string_view params) {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    auto request = make_request(impl_->next_id++, method, params);
    auto body = impl_->post(request);
    if (!body) {
        return std::unexpected(body.error());
    }
    return extract_result(*body);
}

const std::string& RpcTransport::url() const noexcept {
    return impl_->options.url;
}

} // namespace ore::chain
