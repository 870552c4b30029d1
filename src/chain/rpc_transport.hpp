/**
 * @file rpc_transport.hpp
 * @brief HTTP транспорт JSON-RPC 2.0
 *
 * Использует libcurl для HTTP POST запросов. Один easy handle на
 * транспорт, вызовы сериализуются мьютексом.
 *
 * Классификация ошибок:
 * - таймаут curl, HTTP 408             → RpcTimeout
 * - прочие ошибки curl                 → RpcConnectionFailed
 * - HTTP 429                           → RpcRateLimited
 * - HTTP 5xx                           → RpcInternalError
 * - прочие HTTP 4xx                    → RpcInvalidParams
 * - объект "error" в ответе            → classify_rpc_error()
 */

#pragma once

#include "../core/types.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace ore::chain {

/**
 * @brief Параметры транспорта
 */
struct RpcTransportOptions {
    std::string url;
    uint32_t timeout_seconds = 30;
};

/**
 * @brief JSON-RPC 2.0 клиент поверх HTTP
 */
class RpcTransport {
public:
    explicit RpcTransport(RpcTransportOptions options);
    ~RpcTransport();

    RpcTransport(const RpcTransport&) = delete;
    RpcTransport& operator=(const RpcTransport&) = delete;

    /**
     * @brief Выполнить вызов
     *
     * @param method Имя метода ("getAccountInfo", ...)
     * @param params JSON массив параметров
     * @return Сырой текст поля "result"
     */
    [[nodiscard]] Result<std::string> call(std::string_view method, std::string_view params = "[]");

    [[nodiscard]] const std::string& url() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Классифицировать объект ошибки JSON-RPC
 *
 * Постоянные ошибки: некорректный запрос (-32600, -32602, а также -32700,
 * когда узел не смог разобрать отправленный JSON), нехватка средств,
 * ошибка выполнения транзакции (-32002, -32003). Остальные считаются
 * транзиентными.
 */
[[nodiscard]] Error classify_rpc_error(int64_t code, std::string_view message);

/**
 * @brief Извлечь "result" из тела ответа
 *
 * @return Сырой текст result или классифицированная ошибка
 */
[[nodiscard]] Result<std::string> extract_result(std::string_view body);

/**
 * @brief Сформировать тело запроса JSON-RPC 2.0
 */
[[nodiscard]] std::string make_request(uint64_t id, std::string_view method, std::string_view params);

} // namespace ore::chain
