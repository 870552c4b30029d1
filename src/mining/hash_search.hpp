/**
 * @file hash_search.hpp
 * @brief Параллельный поиск nonce
 *
 * Пространство nonce [first, last] распределяется между воркерами
 * чередованием: воркер i перебирает first + i, first + i + N, ...
 * Диапазоны не пересекаются, общего изменяемого состояния нет, кроме
 * токена отмены и слота результата с единственным писателем.
 *
 * Результат поиска:
 * - Found: решение найдено (ровно одно на вызов)
 * - Exhausted: диапазон nonce исчерпан
 * - DeadlineExceeded: истёк дедлайн
 * - Cancelled: внешняя остановка
 *
 * Все статусы кроме Found означают NotFound для оркестратора.
 */

#pragma once

#include "../core/types.hpp"
#include "../crypto/sha256.hpp"
#include "cancellation.hpp"
#include "proof.hpp"

#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>

namespace ore::mining {

// =============================================================================
// Типы
// =============================================================================

/**
 * @brief Статус завершения поиска
 */
enum class SearchStatus {
    Found,
    Exhausted,
    DeadlineExceeded,
    Cancelled
};

[[nodiscard]] constexpr std::string_view to_string(SearchStatus status) noexcept {
    switch (status) {
        case SearchStatus::Found:            return "found";
        case SearchStatus::Exhausted:        return "exhausted";
        case SearchStatus::DeadlineExceeded: return "deadline";
        case SearchStatus::Cancelled:        return "cancelled";
        default: return "unknown";
    }
}

/**
 * @brief Границы перебора (включительно)
 */
struct NonceRange {
    uint64_t first = 0;
    uint64_t last = std::numeric_limits<uint64_t>::max();
};

/**
 * @brief Результат одного вызова search()
 */
struct SearchResult {
    SearchStatus status = SearchStatus::Exhausted;

    /// @brief Решение (только при status == Found)
    std::optional<Solution> solution;

    /// @brief Всего посчитано хешей всеми воркерами
    uint64_t hashes = 0;

    /// @brief Время поиска
    std::chrono::steady_clock::duration elapsed{};

    [[nodiscard]] bool found() const noexcept { return solution.has_value(); }

    /**
     * @brief Средний хешрейт за вызов (H/s)
     */
    [[nodiscard]] double hashrate() const noexcept;
};

// =============================================================================
// Хеширование решения
// =============================================================================

/**
 * @brief Хешер решения с предвычисленным midstate
 *
 * challenge || signer занимают ровно один блок SHA256, поэтому на
 * каждый nonce нужен один transform хвоста из 8 байт.
 */
class SolutionHasher {
public:
    SolutionHasher(const Hash256& challenge, const Pubkey& signer) noexcept;

    [[nodiscard]] Hash256 hash(uint64_t nonce) const noexcept;

private:
    crypto::Sha256State midstate_{};
};

/**
 * @brief sha256(challenge || signer || nonce_le) без midstate
 *
 * Эталонная реализация для проверки решений.
 */
[[nodiscard]] Hash256 solution_hash(
    const Hash256& challenge,
    const Pubkey& signer,
    uint64_t nonce
) noexcept;

/**
 * @brief Проверить, что решение валидно для снимка
 *
 * Пересчитывает хеш и сравнивает с target и с сохранённым hash.
 */
[[nodiscard]] bool verify_solution(
    const Solution& solution,
    const ProofStateSnapshot& snapshot,
    const Pubkey& signer
) noexcept;

// =============================================================================
// HashSearchEngine
// =============================================================================

/**
 * @brief Движок параллельного поиска
 *
 * Не хранит состояния между вызовами: каждый search() запускает
 * свежий набор воркеров и дожидается их завершения.
 */
class HashSearchEngine {
public:
    /**
     * @param signer Публичный ключ майнера (часть хешируемых данных)
     */
    explicit HashSearchEngine(const Pubkey& signer) noexcept;

    /**
     * @brief Найти nonce, удовлетворяющий target снимка
     *
     * @param snapshot Снимок раунда (не меняется во время поиска)
     * @param worker_count Количество воркеров (0 трактуется как 1)
     * @param deadline Момент, после которого поиск прекращается
     * @param stop Внешний токен остановки (может быть nullptr)
     * @param range Диапазон nonce
     * @return SearchResult Решение или причина его отсутствия
     *
     * @note С одним воркером возвращается наименьший подходящий nonce
     *       в диапазоне.
     */
    [[nodiscard]] SearchResult search(
        const ProofStateSnapshot& snapshot,
        uint32_t worker_count,
        std::chrono::steady_clock::time_point deadline,
        const CancellationToken* stop = nullptr,
        NonceRange range = {}
    ) const;

    [[nodiscard]] const Pubkey& signer() const noexcept { return signer_; }

private:
    Pubkey signer_{};
};

} // namespace ore::mining
