/**
 * @file config.cpp
 * @brief Реализация загрузки конфигурации
 *
 * Использует библиотеку toml++ для парсинга TOML файлов.
 */

#include "config.hpp"
#include "encoding.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <thread>

namespace ore {

namespace {

/**
 * @brief Заполнить Config из разобранной TOML таблицы
 */
Config from_table(const toml::table& table) {
    Config config;

    // === Секция [rpc] ===
    if (auto rpc = table["rpc"].as_table()) {
        if (auto val = (*rpc)["url"].value<std::string>()) {
            config.rpc.url = *val;
        }
        if (auto val = (*rpc)["timeout_seconds"].value<int64_t>()) {
            config.rpc.timeout_seconds = static_cast<uint32_t>(*val);
        }
        if (auto val = (*rpc)["commitment"].value<std::string>()) {
            config.rpc.commitment = *val;
        }
    }

    // === Секция [wallet] ===
    if (auto wallet = table["wallet"].as_table()) {
        if (auto val = (*wallet)["keypair_path"].value<std::string>()) {
            config.wallet.keypair_path = *val;
        }
        if (auto val = (*wallet)["beneficiary"].value<std::string>()) {
            config.wallet.beneficiary = *val;
        }
    }

    // === Секция [program] ===
    if (auto program = table["program"].as_table()) {
        if (auto val = (*program)["program_id"].value<std::string>()) {
            config.program.program_id = *val;
        }
        if (auto val = (*program)["treasury"].value<std::string>()) {
            config.program.treasury = *val;
        }
        if (auto val = (*program)["treasury_tokens"].value<std::string>()) {
            config.program.treasury_tokens = *val;
        }
        if (auto val = (*program)["proof"].value<std::string>()) {
            config.program.proof = *val;
        }
        if (auto buses = (*program)["buses"].as_array()) {
            config.program.buses.clear();
            for (const auto& node : *buses) {
                if (auto val = node.value<std::string>()) {
                    config.program.buses.push_back(*val);
                }
            }
        }
    }

    // === Секция [mining] ===
    if (auto mining = table["mining"].as_table()) {
        if (auto val = (*mining)["threads"].value<int64_t>()) {
            config.mining.threads = static_cast<uint32_t>(*val);
        }
        if (auto val = (*mining)["search_deadline_seconds"].value<int64_t>()) {
            config.mining.search_deadline_seconds = static_cast<uint32_t>(*val);
        }
        if (auto val = (*mining)["max_staleness_seconds"].value<int64_t>()) {
            config.mining.max_staleness_seconds = static_cast<uint32_t>(*val);
        }
        if (auto val = (*mining)["refresh_retry_delay_ms"].value<int64_t>()) {
            config.mining.refresh_retry_delay_ms = static_cast<uint32_t>(*val);
        }
    }

    // === Секция [fees] ===
    if (auto fees = table["fees"].as_table()) {
        if (auto val = (*fees)["priority_fee"].value<int64_t>()) {
            config.fees.priority_fee = static_cast<uint64_t>(*val);
        }
        if (auto val = (*fees)["max_priority_fee"].value<int64_t>()) {
            config.fees.max_priority_fee = static_cast<uint64_t>(*val);
        }
        if (auto val = (*fees)["compute_unit_limit"].value<int64_t>()) {
            config.fees.compute_unit_limit = static_cast<uint32_t>(*val);
        }
        if (auto val = (*fees)["dynamic_fee"].value<bool>()) {
            config.fees.dynamic_fee = *val;
        }
        if (auto val = (*fees)["dynamic_compute_units"].value<bool>()) {
            config.fees.dynamic_compute_units = *val;
        }
    }

    // === Секция [submission] ===
    if (auto submission = table["submission"].as_table()) {
        if (auto val = (*submission)["max_retries"].value<int64_t>()) {
            config.submission.max_retries = static_cast<uint32_t>(*val);
        }
        if (auto val = (*submission)["backoff_initial_ms"].value<int64_t>()) {
            config.submission.backoff_initial_ms = static_cast<uint32_t>(*val);
        }
        if (auto val = (*submission)["backoff_max_ms"].value<int64_t>()) {
            config.submission.backoff_max_ms = static_cast<uint32_t>(*val);
        }
        if (auto val = (*submission)["confirm_timeout_seconds"].value<int64_t>()) {
            config.submission.confirm_timeout_seconds = static_cast<uint32_t>(*val);
        }
        if (auto val = (*submission)["poll_interval_ms"].value<int64_t>()) {
            config.submission.poll_interval_ms = static_cast<uint32_t>(*val);
        }
        if (auto val = (*submission)["check_balance"].value<bool>()) {
            config.submission.check_balance = *val;
        }
    }

    // === Секция [logging] ===
    if (auto logging = table["logging"].as_table()) {
        if (auto val = (*logging)["level"].value<std::string>()) {
            config.logging.level = *val;
        }
        if (auto val = (*logging)["color"].value<bool>()) {
            config.logging.color = *val;
        }
        if (auto val = (*logging)["event_history"].value<int64_t>()) {
            config.logging.event_history = static_cast<uint32_t>(*val);
        }
    }

    return config;
}

/**
 * @brief Проверить base58 адрес
 */
Result<void> check_address(std::string_view field, const std::string& value) {
    if (value.empty()) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("Адрес не указан ({})", field)
        );
    }
    if (auto key = pubkey_from_base58(value); !key) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("Некорректный адрес {}: {}", field, key.error().message)
        );
    }
    return {};
}

} // anonymous namespace

// =============================================================================
// MiningConfig
// =============================================================================

uint32_t MiningConfig::effective_threads() const noexcept {
    if (threads > 0) {
        return threads;
    }
    auto hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 1;
}

// =============================================================================
// Config - Загрузка из файла
// =============================================================================

Result<Config> Config::load(const std::filesystem::path& path) {
    // Проверяем существование файла
    if (!std::filesystem::exists(path)) {
        return Err<Config>(
            ErrorCode::ConfigNotFound,
            std::format("Файл конфигурации не найден: {}", path.string())
        );
    }

    try {
        auto table = toml::parse_file(path.string());
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML: {}", e.what())
        );
    }
}

Result<Config> Config::parse(std::string_view text) {
    try {
        auto table = toml::parse(text);
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML: {}", e.what())
        );
    }
}

Result<Config> Config::load_with_search(
    const std::optional<std::filesystem::path>& path
) {
    // Явно указанный путь должен существовать
    if (path.has_value()) {
        return load(path.value());
    }

    std::vector<std::filesystem::path> search_paths;
    search_paths.push_back("ore.toml");
    search_paths.push_back("/etc/ore/ore.toml");

    // Домашняя директория пользователя
    if (const char* home = std::getenv("HOME")) {
        search_paths.push_back(
            std::filesystem::path(home) / ".config" / "ore" / "ore.toml"
        );
    }

    // Ищем первый существующий файл
    for (const auto& search_path : search_paths) {
        if (std::filesystem::exists(search_path)) {
            return load(search_path);
        }
    }

    return Err<Config>(
        ErrorCode::ConfigNotFound,
        "Файл конфигурации не найден в стандартных путях"
    );
}

// =============================================================================
// Config - Валидация
// =============================================================================

Result<void> Config::validate() const {
    // RPC
    if (rpc.url.empty()) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "URL RPC не указан (rpc.url)");
    }
    if (!rpc.url.starts_with("http://") && !rpc.url.starts_with("https://")) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("URL RPC должен начинаться с http:// или https://: {}", rpc.url)
        );
    }
    if (rpc.timeout_seconds == 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "rpc.timeout_seconds должен быть больше 0");
    }
    if (rpc.commitment != "processed" &&
        rpc.commitment != "confirmed" &&
        rpc.commitment != "finalized") {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("Неизвестный commitment: {}", rpc.commitment)
        );
    }

    // Кошелёк
    if (wallet.keypair_path.empty()) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "Путь к ключу не указан (wallet.keypair_path)");
    }
    if (!wallet.beneficiary.empty()) {
        if (auto r = check_address("wallet.beneficiary", wallet.beneficiary); !r) {
            return r;
        }
    }

    // Программа
    if (auto r = check_address("program.program_id", program.program_id); !r) {
        return r;
    }
    if (auto r = check_address("program.treasury", program.treasury); !r) {
        return r;
    }
    if (auto r = check_address("program.proof", program.proof); !r) {
        return r;
    }
    if (!program.treasury_tokens.empty()) {
        if (auto r = check_address("program.treasury_tokens", program.treasury_tokens); !r) {
            return r;
        }
    }
    if (program.buses.empty()) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "Не указан ни один bus (program.buses)");
    }
    for (const auto& bus : program.buses) {
        if (auto r = check_address("program.buses", bus); !r) {
            return r;
        }
    }

    // Майнинг
    if (mining.search_deadline_seconds == 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "mining.search_deadline_seconds должен быть больше 0");
    }
    if (mining.max_staleness_seconds == 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "mining.max_staleness_seconds должен быть больше 0");
    }

    // Комиссии
    if (fees.max_priority_fee < fees.priority_fee) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("fees.max_priority_fee ({}) меньше fees.priority_fee ({})",
                        fees.max_priority_fee, fees.priority_fee)
        );
    }
    if (fees.compute_unit_limit == 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "fees.compute_unit_limit должен быть больше 0");
    }

    // Отправка
    if (submission.poll_interval_ms == 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "submission.poll_interval_ms должен быть больше 0");
    }
    if (submission.confirm_timeout_seconds == 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "submission.confirm_timeout_seconds должен быть больше 0");
    }
    if (submission.backoff_max_ms < submission.backoff_initial_ms) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "submission.backoff_max_ms меньше backoff_initial_ms");
    }

    // Логирование
    if (logging.level != "error" && logging.level != "warn" &&
        logging.level != "info" && logging.level != "debug") {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("Неизвестный уровень логирования: {}", logging.level)
        );
    }

    return {};
}

std::filesystem::path Config::keypair_file() const {
    return expand_home(wallet.keypair_path);
}

std::filesystem::path expand_home(std::string_view path) {
    if (path == "~" || path.starts_with("~/")) {
        if (const char* home = std::getenv("HOME")) {
            std::filesystem::path result(home);
            if (path.size() > 2) {
                result /= std::string(path.substr(2));
            }
            return result;
        }
    }
    return std::filesystem::path(std::string(path));
}

} // namespace ore
