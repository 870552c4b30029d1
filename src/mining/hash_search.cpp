/**
 * @file hash_search.cpp
 * @brief Реализация параллельного поиска nonce
 */

#include "hash_search.hpp"
#include "difficulty.hpp"
#include "../core/byte_order.hpp"
#include "../core/constants.hpp"

#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

namespace ore::mining {

namespace {

/// @brief Как часто воркер сверяется с часами (итераций)
constexpr uint64_t DEADLINE_CHECK_INTERVAL = 4096;

} // anonymous namespace

// =============================================================================
// SearchResult
// =============================================================================

double SearchResult::hashrate() const noexcept {
    auto seconds = std::chrono::duration<double>(elapsed).count();
    if (seconds <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(hashes) / seconds;
}

// =============================================================================
// Хеширование
// =============================================================================

SolutionHasher::SolutionHasher(const Hash256& challenge, const Pubkey& signer) noexcept {
    std::array<uint8_t, constants::SHA256_BLOCK_SIZE> prefix{};
    std::copy(challenge.begin(), challenge.end(), prefix.begin());
    std::copy(signer.begin(), signer.end(), prefix.begin() + 32);
    midstate_ = crypto::compute_midstate(prefix.data());
}

Hash256 SolutionHasher::hash(uint64_t nonce) const noexcept {
    std::array<uint8_t, 8> tail{};
    write_le64(tail.data(), nonce);
    return crypto::finish_with_midstate(midstate_, ByteSpan(tail.data(), tail.size()));
}

Hash256 solution_hash(const Hash256& challenge, const Pubkey& signer, uint64_t nonce) noexcept {
    std::array<uint8_t, constants::HASH_INPUT_SIZE> input{};
    std::copy(challenge.begin(), challenge.end(), input.begin());
    std::copy(signer.begin(), signer.end(), input.begin() + 32);
    write_le64(input.data() + 64, nonce);
    return crypto::sha256(ByteSpan(input.data(), input.size()));
}

bool verify_solution(
    const Solution& solution,
    const ProofStateSnapshot& snapshot,
    const Pubkey& signer
) noexcept {
    if (solution.round != snapshot.round) {
        return false;
    }
    auto hash = solution_hash(snapshot.challenge, signer, solution.nonce);
    return hash == solution.hash && meets_target(hash, snapshot.target);
}

// =============================================================================
// HashSearchEngine
// =============================================================================

HashSearchEngine::HashSearchEngine(const Pubkey& signer) noexcept
    : signer_(signer) {}

SearchResult HashSearchEngine::search(
    const ProofStateSnapshot& snapshot,
    uint32_t worker_count,
    std::chrono::steady_clock::time_point deadline,
    const CancellationToken* stop,
    NonceRange range
) const {
    SearchResult result;
    auto start = std::chrono::steady_clock::now();

    if (range.first > range.last) {
        result.status = SearchStatus::Exhausted;
        return result;
    }

    const uint64_t workers = std::max<uint32_t>(worker_count, 1);
    const uint64_t span = range.last - range.first;
    const SolutionHasher hasher(snapshot.challenge, signer_);

    // Отмена всех воркеров: находка, дедлайн или внешний stop
    CancellationToken found_stop(stop);

    // Слот результата: пишет только воркер, выигравший claimed
    std::atomic<bool> claimed{false};
    Solution winner{};

    std::atomic<bool> deadline_hit{false};
    std::atomic<uint64_t> total_hashes{0};

    auto worker = [&](uint64_t index) {
        uint64_t local_hashes = 0;

        for (uint64_t offset = index; offset <= span; ) {
            if (found_stop.is_cancelled()) {
                break;
            }
            if (local_hashes % DEADLINE_CHECK_INTERVAL == 0 &&
                std::chrono::steady_clock::now() >= deadline) {
                deadline_hit.store(true, std::memory_order_relaxed);
                found_stop.cancel();
                break;
            }

            uint64_t nonce = range.first + offset;
            auto hash = hasher.hash(nonce);
            ++local_hashes;

            if (meets_target(hash, snapshot.target)) {
                bool expected = false;
                if (claimed.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
                    winner = Solution{snapshot.round, nonce, hash};
                    found_stop.cancel();
                }
                break;
            }

            // Переполнение offset при полном диапазоне u64
            if (span - offset < workers) {
                break;
            }
            offset += workers;
        }

        total_hashes.fetch_add(local_hashes, std::memory_order_relaxed);
    };

    std::vector<std::thread> threads;
    threads.reserve(static_cast<std::size_t>(workers));
    for (uint64_t i = 0; i < workers; ++i) {
        threads.emplace_back(worker, i);
    }
    for (auto& t : threads) {
        t.join();
    }

    result.hashes = total_hashes.load();
    result.elapsed = std::chrono::steady_clock::now() - start;

    if (claimed.load(std::memory_order_acquire)) {
        result.status = SearchStatus::Found;
        result.solution = winner;
    } else if (stop != nullptr && stop->is_cancelled()) {
        result.status = SearchStatus::Cancelled;
    } else if (deadline_hit.load()) {
        result.status = SearchStatus::DeadlineExceeded;
    } else {
        result.status = SearchStatus::Exhausted;
    }

    return result;
}

} // namespace ore::mining
