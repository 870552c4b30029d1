/**
 * @file status_reporter.cpp
 * @brief Реализация репортёра статуса
 */

#include "status_reporter.hpp"
#include "../mining/difficulty.hpp"

#include <algorithm>
#include <deque>
#include <format>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace ore::log {

// =============================================================================
// ANSI коды цветов
// =============================================================================

namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* DIM = "\033[2m";

    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* CYAN = "\033[36m";
}

// =============================================================================
// Реализация
// =============================================================================

struct StatusReporter::Impl {
    LoggingConfig config;
    std::chrono::steady_clock::time_point start_time;

    MiningStats stats;
    std::deque<EventRecord> events;
    mutable std::mutex mutex;

    explicit Impl(const LoggingConfig& cfg)
        : config(cfg)
        , start_time(std::chrono::steady_clock::now()) {}

    void push(EventType type, std::string message) {
        events.push_back(EventRecord{type, std::chrono::system_clock::now(), std::move(message)});

        // Ограничиваем размер истории
        while (events.size() > std::max<std::size_t>(config.event_history, 1)) {
            events.pop_front();
        }
    }

    std::string render_impl(bool use_color) const {
        std::ostringstream out;

        const char* bold = use_color ? ansi::BOLD : "";
        const char* reset = use_color ? ansi::RESET : "";
        const char* green = use_color ? ansi::GREEN : "";
        const char* yellow = use_color ? ansi::YELLOW : "";
        const char* red = use_color ? ansi::RED : "";
        const char* cyan = use_color ? ansi::CYAN : "";
        const char* dim = use_color ? ansi::DIM : "";

        std::lock_guard<std::mutex> lock(mutex);

        // === Заголовок ===
        out << bold << "═══════════════════════════════════════════════════════════════════\n"
            << "                         ORE MINER\n"
            << "═══════════════════════════════════════════════════════════════════" << reset << "\n\n";

        // === Uptime ===
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - start_time);
        auto hours = uptime.count() / 3600;
        auto minutes = (uptime.count() % 3600) / 60;
        auto seconds = uptime.count() % 60;

        out << bold << "Uptime: " << reset
            << std::setfill('0') << std::setw(2) << hours << ":"
            << std::setw(2) << minutes << ":"
            << std::setw(2) << seconds << std::setfill(' ') << "\n\n";

        // === Поиск ===
        out << bold << "Mining:" << reset << "\n";
        out << "  Rounds: " << stats.rounds << "\n";
        out << "  Hashes: " << stats.hashes << "\n";
        out << "  Hashrate: " << mining::format_hashrate(stats.last_hashrate) << "\n";
        out << "  Solutions: " << stats.solutions << "\n\n";

        // === Отправка ===
        out << bold << "Submissions:" << reset << "\n";
        out << "  Confirmed: " << green << stats.confirmed << reset << "\n";
        out << "  Rejected: " << (stats.rejected > 0 ? red : "") << stats.rejected << reset << "\n";
        out << "  Stale: " << stats.stale << "\n";
        out << "  Timed out: " << (stats.timed_out > 0 ? yellow : "") << stats.timed_out << reset << "\n\n";

        // === Награда ===
        out << bold << "Rewards:" << reset << "\n";
        out << "  Earned: " << cyan << format_amount(stats.rewards) << reset << "\n";
        out << "  Claimable: " << format_amount(stats.claimable) << "\n\n";

        // === Recent Events ===
        out << bold << "Recent Events:" << reset << "\n";
        if (events.empty()) {
            out << "  " << dim << "(no events)" << reset << "\n";
        } else {
            // Показываем последние 10 событий
            std::size_t start = events.size() > 10 ? events.size() - 10 : 0;
            for (std::size_t i = start; i < events.size(); ++i) {
                const auto& event = events[i];

                auto time = std::chrono::system_clock::to_time_t(event.timestamp);
                auto tm = *std::localtime(&time);
                out << "  " << std::put_time(&tm, "%H:%M:%S") << " ";

                const char* color = "";
                switch (event.type) {
                    case EventType::ROUND_START:
                        color = cyan;
                        break;
                    case EventType::SOLUTION_FOUND:
                    case EventType::SUBMIT_OK:
                        color = green;
                        break;
                    case EventType::STALE_ROUND:
                    case EventType::TIMED_OUT:
                        color = yellow;
                        break;
                    case EventType::SUBMIT_FAIL:
                    case EventType::ERROR:
                        color = red;
                        break;
                }
                out << color << "[" << to_string(event.type) << "]" << reset
                    << " " << event.message << "\n";
            }
        }

        out << "\n" << bold << "───────────────────────────────────────────────────────────────────" << reset << "\n";

        return out.str();
    }
};

// =============================================================================
// Публичный API
// =============================================================================

StatusReporter::StatusReporter(const LoggingConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

StatusReporter::~StatusReporter() = default;

void StatusReporter::log_event(EventType type, const std::string& message) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (type == EventType::ERROR) {
        ++impl_->stats.errors;
    }
    impl_->push(type, message);
}

void StatusReporter::log_round_start(const mining::Round& round, std::string_view difficulty) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    ++impl_->stats.rounds;
    impl_->push(EventType::ROUND_START,
                std::format("Round {}/{} difficulty {}", round.epoch, round.sequence, difficulty));
}

void StatusReporter::log_search(uint64_t hashes, std::chrono::steady_clock::duration elapsed) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->stats.hashes += hashes;

    auto seconds = std::chrono::duration<double>(elapsed).count();
    impl_->stats.last_hashrate = seconds > 0.0 ? static_cast<double>(hashes) / seconds : 0.0;
}

void StatusReporter::log_solution(uint64_t nonce, std::string_view hash_hex) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    ++impl_->stats.solutions;
    impl_->push(EventType::SOLUTION_FOUND, std::format("nonce {} hash {}", nonce, hash_hex));
}

void StatusReporter::log_confirmed(std::string_view signature, uint64_t reward_delta) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    ++impl_->stats.confirmed;
    impl_->stats.rewards += reward_delta;
    impl_->push(EventType::SUBMIT_OK,
                std::format("{} +{}", signature, format_amount(reward_delta)));
}

void StatusReporter::log_rejected(std::string_view reason) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    ++impl_->stats.rejected;
    impl_->push(EventType::SUBMIT_FAIL, std::string(reason));
}

void StatusReporter::log_stale() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    ++impl_->stats.stale;
    impl_->push(EventType::STALE_ROUND, "Round advanced before confirmation");
}

void StatusReporter::log_timed_out(std::string_view signature) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    ++impl_->stats.timed_out;
    impl_->push(EventType::TIMED_OUT, std::format("No confirmation for {}", signature));
}

void StatusReporter::log_error(const std::string& message) {
    log_event(EventType::ERROR, message);
}

void StatusReporter::update_claimable(uint64_t claimable) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->stats.claimable = claimable;
}

MiningStats StatusReporter::stats() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->stats;
}

std::vector<EventRecord> StatusReporter::recent_events(std::size_t limit) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    std::size_t start = impl_->events.size() > limit ? impl_->events.size() - limit : 0;
    return {impl_->events.begin() + static_cast<std::ptrdiff_t>(start), impl_->events.end()};
}

std::string StatusReporter::render_plain() const {
    return impl_->render_impl(false);
}

std::string StatusReporter::render() const {
    return impl_->render_impl(impl_->config.color);
}

std::string format_amount(uint64_t amount) {
    uint64_t scale = 1;
    for (uint32_t i = 0; i < constants::TOKEN_DECIMALS; ++i) {
        scale *= 10;
    }
    return std::format("{}.{:0{}} ORE", amount / scale, amount % scale, constants::TOKEN_DECIMALS);
}

} // namespace ore::log
