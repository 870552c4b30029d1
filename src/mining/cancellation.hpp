/**
 * @file cancellation.hpp
 * @brief Широковещательный токен отмены
 *
 * Один токен разделяется всеми воркерами поиска: первый воркер,
 * нашедший решение, вызывает cancel(), остальные видят флаг на границе
 * следующей итерации. Токен может быть связан с родительским (внешняя
 * остановка процесса), тогда отмена родителя видна и здесь.
 */

#pragma once

#include <atomic>

namespace ore::mining {

class CancellationToken {
public:
    CancellationToken() = default;

    /**
     * @brief Создать дочерний токен
     *
     * @param parent Родительский токен (может быть nullptr), должен
     *               пережить дочерний
     */
    explicit CancellationToken(const CancellationToken* parent) noexcept
        : parent_(parent) {}

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /**
     * @brief Запросить отмену (идемпотентно)
     */
    void cancel() noexcept {
        cancelled_.store(true, std::memory_order_release);
    }

    /**
     * @brief Запрошена ли отмена этим токеном или любым предком
     */
    [[nodiscard]] bool is_cancelled() const noexcept {
        if (cancelled_.load(std::memory_order_acquire)) {
            return true;
        }
        return parent_ != nullptr && parent_->is_cancelled();
    }

private:
    std::atomic<bool> cancelled_{false};
    const CancellationToken* parent_ = nullptr;
};

} // namespace ore::mining
