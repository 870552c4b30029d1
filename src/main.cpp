/**
 * @file main.cpp
 * @brief Точка входа ORE Miner
 *
 * ORE Miner - CPU майнер токена ORE для Solana.
 *
 * Основные компоненты:
 * 1. RpcChainClient - JSON-RPC связь с узлом Solana
 * 2. ProofState - снимок on-chain параметров майнинга
 * 3. HashSearchEngine - параллельный поиск nonce
 * 4. TransactionBuilder - сборка и подпись транзакций
 * 5. SubmissionPipeline - отправка, повторы, подтверждение
 * 6. MiningOrchestrator - главный цикл
 *
 * Использование:
 *   ore-miner [options] mine
 *   ore-miner [options] claim [amount]
 *
 * Опции:
 *   -c, --config PATH    Путь к файлу конфигурации
 *   -h, --help           Показать справку
 *   -v, --version        Показать версию
 */

#include "chain/rpc_chain_client.hpp"
#include "core/config.hpp"
#include "core/encoding.hpp"
#include "core/types.hpp"
#include "crypto/keypair.hpp"
#include "log/logger.hpp"
#include "log/status_reporter.hpp"
#include "mining/orchestrator.hpp"
#include "mining/proof_state.hpp"
#include "submit/submission_pipeline.hpp"
#include "tx/transaction_builder.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <format>
#include <iostream>
#include <optional>
#include <thread>

namespace {

/// @brief Версия программы
constexpr std::string_view VERSION = "1.0.0";

/// @brief Флаг для graceful shutdown
std::atomic<bool> g_running{true};

/**
 * @brief Обработчик сигналов
 */
void signal_handler(int signum) {
    if (signum == SIGINT || signum == SIGTERM) {
        g_running.store(false, std::memory_order_relaxed);
    }
}

/**
 * @brief Вывести справку
 */
void print_help() {
    std::cout << R"(
ORE Miner v)" << VERSION << R"(
CPU майнер токена ORE

ИСПОЛЬЗОВАНИЕ:
    ore-miner [ОПЦИИ] mine
    ore-miner [ОПЦИИ] claim [AMOUNT]

КОМАНДЫ:
    mine                 Майнить до SIGINT / SIGTERM
    claim [AMOUNT]       Вывести награду (AMOUNT в минимальных единицах,
                         по умолчанию весь claimable баланс)

ОПЦИИ:
    -c, --config PATH    Путь к файлу конфигурации (ore.toml)
    -h, --help           Показать эту справку
    -v, --version        Показать версию программы
    --test-config        Проверить конфигурацию и выйти

ПРИМЕРЫ:
    ore-miner -c /etc/ore/ore.toml mine
    ore-miner claim 1000000000

)";
}

/**
 * @brief Вывести версию
 */
void print_version() {
    std::cout << "ORE Miner v" << VERSION << std::endl;
}

/**
 * @brief Вывести баннер при запуске
 */
void print_banner() {
    std::cout << R"(
╔═══════════════════════════════════════════════════════════════════╗
║                                                                   ║
║                    ██████╗ ██████╗ ███████╗                       ║
║                   ██╔═══██╗██╔══██╗██╔════╝                       ║
║                   ██║   ██║██████╔╝█████╗                         ║
║                   ██║   ██║██╔══██╗██╔══╝                         ║
║                   ╚██████╔╝██║  ██║███████╗                       ║
║                    ╚═════╝ ╚═╝  ╚═╝╚══════╝                       ║
║                                                                   ║
║                        CPU MINER v)" << VERSION << R"(                           ║
║                                                                   ║
╚═══════════════════════════════════════════════════════════════════╝
)";
}

enum class Command {
    None,
    Mine,
    Claim
};

/**
 * @brief Парсинг аргументов командной строки
 */
struct Args {
    std::optional<std::string> config_path;
    Command command = Command::None;
    std::optional<uint64_t> claim_amount;
    bool show_help = false;
    bool show_version = false;
    bool test_config = false;
    std::optional<std::string> error;
};

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if (arg == "--test-config") {
            args.test_config = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "mine" && args.command == Command::None) {
            args.command = Command::Mine;
        } else if (arg == "claim" && args.command == Command::None) {
            args.command = Command::Claim;
        } else if (args.command == Command::Claim && !args.claim_amount) {
            uint64_t amount = 0;
            auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), amount);
            if (ec != std::errc{} || ptr != arg.data() + arg.size()) {
                args.error = std::format("Некорректная сумма: {}", arg);
            } else {
                args.claim_amount = amount;
            }
        } else {
            args.error = std::format("Неизвестный аргумент: {}", arg);
        }
    }

    return args;
}

} // anonymous namespace

/**
 * @brief Главная функция
 */
int main(int argc, char* argv[]) {
    using namespace ore;

    // Парсим аргументы
    auto args = parse_args(argc, argv);

    if (args.show_help) {
        print_help();
        return 0;
    }

    if (args.show_version) {
        print_version();
        return 0;
    }

    if (args.error) {
        std::cerr << "[ERROR] " << *args.error << std::endl;
        print_help();
        return 1;
    }

    // Загружаем конфигурацию
    auto config_result = Config::load_with_search(
        args.config_path ? std::optional<std::filesystem::path>(*args.config_path) : std::nullopt
    );

    if (!config_result) {
        std::cerr << "[ERROR] " << config_result.error().message << std::endl;
        return 1;
    }

    Config config = *config_result;

    // Валидируем конфигурацию
    auto validation = config.validate();
    if (!validation) {
        std::cerr << "[ERROR] Ошибка валидации конфигурации: "
                  << validation.error().message << std::endl;
        return 1;
    }

    auto level = log::parse_level(config.logging.level);
    log::configure(level.value_or(log::Level::Info), config.logging.color);

    if (args.test_config) {
        log::info("Конфигурация корректна");
        return 0;
    }

    if (args.command == Command::None) {
        print_help();
        return 1;
    }

    if (args.command == Command::Mine) {
        print_banner();
    }

    // Загружаем ключ
    auto keypair = crypto::Keypair::from_file(config.keypair_file());
    if (!keypair) {
        log::error(std::format("Не удалось загрузить ключ: {}", keypair.error().message));
        return 1;
    }
    log::info(std::format("Signer: {}", pubkey_to_base58(keypair->pubkey())));

    auto builder_options = tx::make_builder_options(config);
    if (!builder_options) {
        log::error(builder_options.error().message);
        return 1;
    }

    // Компоненты
    chain::RpcChainClient client(config.rpc, config.fees.compute_unit_limit);
    log::info(std::format("RPC: {}", config.rpc.url));

    mining::ProofStateOptions state_options;
    state_options.treasury = builder_options->treasury;
    state_options.proof = builder_options->proof;
    state_options.max_staleness = std::chrono::seconds(config.mining.max_staleness_seconds);
    mining::ProofState proof_state(client, state_options);

    tx::TransactionBuilder builder(*builder_options);
    submit::SubmissionPipeline pipeline(
        client, submit::make_pipeline_options(config.submission, keypair->pubkey()));
    log::StatusReporter reporter(config.logging);

    mining::MiningOrchestrator orchestrator(
        client, *keypair, proof_state, builder, pipeline, reporter,
        mining::make_orchestrator_options(config));

    // === claim ===
    if (args.command == Command::Claim) {
        auto outcome = orchestrator.claim(args.claim_amount);
        if (!outcome) {
            log::error(std::format("Claim не выполнен: {}", outcome.error().message));
            return 1;
        }
        if (!outcome->confirmed()) {
            log::error(std::format("Claim {}: {} ({})",
                                   to_string(outcome->kind), outcome->reason, outcome->signature));
            return 1;
        }
        log::info(std::format("Claim подтверждён: {} ({})",
                              log::format_amount(outcome->reward_delta), outcome->signature));
        return 0;
    }

    // === mine ===
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::atomic<bool> finished{false};
    std::thread mining_thread([&orchestrator, &finished]() {
        orchestrator.run();
        finished.store(true);
    });

    // Блок статуса раз в STATUS_INTERVAL
    constexpr auto STATUS_INTERVAL = std::chrono::seconds(30);
    auto next_status = std::chrono::steady_clock::now() + STATUS_INTERVAL;

    while (g_running.load(std::memory_order_relaxed) && !finished.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        if (std::chrono::steady_clock::now() >= next_status) {
            std::cout << reporter.render() << std::flush;
            next_status += STATUS_INTERVAL;
        }
    }

    log::info("Получен сигнал завершения, останавливаем...");
    orchestrator.request_stop();
    mining_thread.join();

    std::cout << reporter.render() << std::flush;
    return 0;
}
