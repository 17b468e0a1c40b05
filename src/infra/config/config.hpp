#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <chrono>
#include <expected>
#include <filesystem>
#include "../error_handler/error.hpp"

namespace blockcopy::args_parser {
    struct CLIArgs;
}

namespace blockcopy::infra {

inline constexpr std::uint32_t kDefaultMinChunkSize = 1024 * 1024;      // 1 MiB
inline constexpr std::uint32_t kDefaultMaxChunkSize = 2 * 1024 * 1024;  // 2 MiB
inline constexpr std::uint32_t kDefaultMaxConcurrentTransfers = 4;
inline constexpr std::uint32_t kDefaultMaxRetries = 5;
inline constexpr std::uint32_t kDefaultBackoffUnitMs = 1000;
inline constexpr const char* kDefaultLogFile = "transfer_log.txt";

// Параметры, уже прошедшие валидацию; с ними работает ядро
struct TransferOptions {
    std::uint32_t min_chunk_size = kDefaultMinChunkSize;
    std::uint32_t max_chunk_size = kDefaultMaxChunkSize;
    std::uint32_t max_concurrent_transfers = kDefaultMaxConcurrentTransfers;
    std::uint32_t max_retries = kDefaultMaxRetries;
    // Задержка после n-й неудачной попытки: 2^n * backoff_unit
    std::chrono::milliseconds backoff_unit{kDefaultBackoffUnitMs};
    std::optional<std::uint64_t> seed;
    double corruption_probability = 0.0;
};

struct Config {
    // Разбиение на блоки
    std::optional<std::uint32_t> min_chunk_size;   // байты
    std::optional<std::uint32_t> max_chunk_size;   // байты

    // Параллелизм и повторы
    std::optional<std::uint32_t> max_concurrent_transfers;
    std::optional<std::uint32_t> max_retries;
    std::optional<std::uint32_t> backoff_unit_ms;
    std::optional<std::uint64_t> seed;
    std::optional<double> corruption_probability;

    // Вывод
    std::optional<std::string> log_file;
    bool progress = true;
    bool quiet = false;
    bool verbose = false;

    // Слияние с другим Config (например, из CLI)
    void merge_with(const Config& other);
};

/// Загружает конфигурацию из файла YAML.
/// Ищет файл в порядке:
///   1. ./.blockcopy.yaml
///   2. $XDG_CONFIG_HOME/blockcopy/config.yaml
///   3. ~/.config/blockcopy/config.yaml
/// Возвращает пустой Config, если файл не найден.
[[nodiscard]] auto load_config_from_file() -> Result<Config>;

/// Загружает указанный файл YAML; отсутствие файла здесь ошибка.
[[nodiscard]] auto load_config_from_file(const std::filesystem::path& path) -> Result<Config>;

/// Создаёт Config из CLI аргументов (структура из args_parser)
[[nodiscard]] auto config_from_cli(const args_parser::CLIArgs& args) -> Config;

/// Применяет значения по умолчанию и проверяет ограничения.
[[nodiscard]] auto resolve_options(const Config& config) -> Result<TransferOptions>;

} // namespace blockcopy::infra
