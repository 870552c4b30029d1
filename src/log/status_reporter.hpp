/**
 * @file status_reporter.hpp
 * @brief Репортёр статуса майнера
 *
 * Собирает счётчики майнинга и кольцевой буфер событий и выводит их
 * блоком статуса с ANSI форматированием:
 * - Uptime
 * - Раунды, хеши, последний хешрейт
 * - Решения и исходы отправки (confirmed / rejected / stale / timeout)
 * - Полученная награда и текущий claimable баланс
 * - Последние события
 */

#pragma once

#include "../core/config.hpp"
#include "../core/types.hpp"
#include "../mining/proof.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace ore::log {

// =============================================================================
// Типы событий
// =============================================================================

/**
 * @brief Тип события майнинга
 */
enum class EventType {
    ROUND_START,        ///< Начат поиск для нового раунда
    SOLUTION_FOUND,     ///< Найден nonce
    SUBMIT_OK,          ///< Транзакция подтверждена
    SUBMIT_FAIL,        ///< Транзакция отклонена или не отправлена
    STALE_ROUND,        ///< Решение устарело до подтверждения
    TIMED_OUT,          ///< Подтверждение не дождались
    ERROR               ///< Ошибка
};

/**
 * @brief Преобразование типа события в строку
 */
[[nodiscard]] constexpr std::string_view to_string(EventType type) noexcept {
    switch (type) {
        case EventType::ROUND_START:    return "ROUND";
        case EventType::SOLUTION_FOUND: return "FOUND";
        case EventType::SUBMIT_OK:      return "SUBMIT_OK";
        case EventType::SUBMIT_FAIL:    return "SUBMIT_FAIL";
        case EventType::STALE_ROUND:    return "STALE";
        case EventType::TIMED_OUT:      return "TIMEOUT";
        case EventType::ERROR:          return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Запись события
 */
struct EventRecord {
    EventType type;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
};

/**
 * @brief Накопленные счётчики
 */
struct MiningStats {
    uint64_t rounds = 0;
    uint64_t hashes = 0;
    uint64_t solutions = 0;
    uint64_t confirmed = 0;
    uint64_t rejected = 0;
    uint64_t stale = 0;
    uint64_t timed_out = 0;
    uint64_t errors = 0;

    /// @brief Сумма наград по подтверждённым транзакциям
    uint64_t rewards = 0;

    /// @brief Claimable баланс из последнего снимка
    uint64_t claimable = 0;

    /// @brief Хешрейт последнего поиска (H/s)
    double last_hashrate = 0.0;
};

// =============================================================================
// Status Reporter
// =============================================================================

class StatusReporter {
public:
    /**
     * @brief Создать репортёр с конфигурацией
     */
    explicit StatusReporter(const LoggingConfig& config);

    ~StatusReporter();

    // Запрещаем копирование
    StatusReporter(const StatusReporter&) = delete;
    StatusReporter& operator=(const StatusReporter&) = delete;

    // ==========================================================================
    // События
    // ==========================================================================

    /**
     * @brief Записать событие
     */
    void log_event(EventType type, const std::string& message);

    void log_round_start(const mining::Round& round, std::string_view difficulty);

    /**
     * @brief Учесть завершённый поиск (найден nonce или нет)
     */
    void log_search(uint64_t hashes, std::chrono::steady_clock::duration elapsed);

    void log_solution(uint64_t nonce, std::string_view hash_hex);

    void log_confirmed(std::string_view signature, uint64_t reward_delta);

    void log_rejected(std::string_view reason);

    void log_stale();

    void log_timed_out(std::string_view signature);

    /**
     * @brief Записать ошибку
     */
    void log_error(const std::string& message);

    /**
     * @brief Обновить claimable баланс
     */
    void update_claimable(uint64_t claimable);

    // ==========================================================================
    // Данные
    // ==========================================================================

    [[nodiscard]] MiningStats stats() const;

    /**
     * @brief Последние события (не более limit, от старых к новым)
     */
    [[nodiscard]] std::vector<EventRecord> recent_events(std::size_t limit) const;

    // ==========================================================================
    // Рендеринг
    // ==========================================================================

    /**
     * @brief Получить текущий вывод статуса (без ANSI кодов)
     *
     * Используется для тестирования.
     */
    [[nodiscard]] std::string render_plain() const;

    /**
     * @brief Получить текущий вывод статуса (с ANSI кодами)
     */
    [[nodiscard]] std::string render() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Форматировать сумму в токенах ORE ("1.500000000 ORE")
 */
[[nodiscard]] std::string format_amount(uint64_t amount);

} // namespace ore::log
