#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cstdlib>
#include <limits>

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"

namespace blockcopy::infra {

namespace {

auto parse_config_node(const YAML::Node& node) -> Config {
    Config cfg{};

    if (node["min_chunk_size"]) cfg.min_chunk_size = node["min_chunk_size"].as<std::uint32_t>();
    if (node["max_chunk_size"]) cfg.max_chunk_size = node["max_chunk_size"].as<std::uint32_t>();
    if (node["max_concurrent_transfers"]) {
        cfg.max_concurrent_transfers = node["max_concurrent_transfers"].as<std::uint32_t>();
    }
    if (node["max_retries"]) cfg.max_retries = node["max_retries"].as<std::uint32_t>();
    if (node["backoff_unit_ms"]) cfg.backoff_unit_ms = node["backoff_unit_ms"].as<std::uint32_t>();
    if (node["seed"]) cfg.seed = node["seed"].as<std::uint64_t>();
    if (node["corruption_probability"]) {
        cfg.corruption_probability = node["corruption_probability"].as<double>();
    }

    if (node["log_file"]) cfg.log_file = node["log_file"].as<std::string>();
    if (node["progress"]) cfg.progress = node["progress"].as<bool>();
    if (node["quiet"]) cfg.quiet = node["quiet"].as<bool>();
    if (node["verbose"]) cfg.verbose = node["verbose"].as<bool>();

    return cfg;
}

auto get_config_paths() -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> paths;

    // 1. Локальный файл
    paths.emplace_back(".blockcopy.yaml");

    // 2. Глобальный файл
    const char* config_home = std::getenv("XDG_CONFIG_HOME");
    if (config_home && std::filesystem::exists(config_home)) {
        paths.push_back(std::filesystem::path(config_home) / "blockcopy" / "config.yaml");
    } else {
        const char* home = std::getenv("HOME");
        if (home) {
            paths.push_back(std::filesystem::path(home) / ".config" / "blockcopy" / "config.yaml");
        }
    }

    return paths;
}

} // namespace

void Config::merge_with(const Config& other) {
    if (other.min_chunk_size) min_chunk_size = other.min_chunk_size;
    if (other.max_chunk_size) max_chunk_size = other.max_chunk_size;
    if (other.max_concurrent_transfers) max_concurrent_transfers = other.max_concurrent_transfers;
    if (other.max_retries) max_retries = other.max_retries;
    if (other.backoff_unit_ms) backoff_unit_ms = other.backoff_unit_ms;
    if (other.seed) seed = other.seed;
    if (other.corruption_probability) corruption_probability = other.corruption_probability;
    if (other.log_file) log_file = other.log_file;

    if (!other.progress) progress = false; // CLI может отключить
    if (other.quiet) quiet = true;
    if (other.verbose) verbose = true;
}

auto load_config_from_file(const std::filesystem::path& path) -> Result<Config> {
    if (!std::filesystem::exists(path)) {
        return std::unexpected(make_error(ErrorCode::FileNotFound,
                                          fmt::format("Config file not found: {}", path.string())));
    }

    try {
        auto cfg = parse_config_node(YAML::LoadFile(path.string()));
        spdlog::debug("Loaded config from {}", path.string());
        return cfg;
    } catch (const YAML::Exception& e) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
                                          fmt::format("Failed to parse {}: {}", path.string(), e.what())));
    }
}

auto load_config_from_file() -> Result<Config> {
    for (const auto& path : get_config_paths()) {
        if (!std::filesystem::exists(path)) continue;
        return load_config_from_file(path);
    }

    // Файл не найден — возвращаем пустой конфиг (не ошибка!)
    return Config{};
}

auto config_from_cli(const args_parser::CLIArgs& args) -> Config {
    Config cfg{};
    cfg.min_chunk_size = args.min_chunk_size;
    cfg.max_chunk_size = args.max_chunk_size;
    cfg.max_concurrent_transfers = args.concurrency;
    cfg.max_retries = args.retries;
    cfg.backoff_unit_ms = args.backoff_ms;
    cfg.seed = args.seed;
    cfg.corruption_probability = args.corrupt_probability;
    cfg.log_file = args.log_file;
    cfg.progress = !args.no_progress;
    cfg.quiet = args.quiet;
    cfg.verbose = args.verbose;
    return cfg;
}

auto resolve_options(const Config& config) -> Result<TransferOptions> {
    TransferOptions opts{};
    opts.min_chunk_size = config.min_chunk_size.value_or(kDefaultMinChunkSize);
    opts.max_chunk_size = config.max_chunk_size.value_or(kDefaultMaxChunkSize);
    opts.max_concurrent_transfers = config.max_concurrent_transfers.value_or(kDefaultMaxConcurrentTransfers);
    opts.max_retries = config.max_retries.value_or(kDefaultMaxRetries);
    opts.backoff_unit = std::chrono::milliseconds(config.backoff_unit_ms.value_or(kDefaultBackoffUnitMs));
    opts.seed = config.seed;
    opts.corruption_probability = config.corruption_probability.value_or(0.0);

    if (opts.min_chunk_size == 0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig, "min_chunk_size must be positive"));
    }
    if (opts.min_chunk_size > opts.max_chunk_size) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            fmt::format("min_chunk_size ({}) exceeds max_chunk_size ({})",
                        opts.min_chunk_size, opts.max_chunk_size)));
    }
    if (opts.max_concurrent_transfers == 0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
                                          "max_concurrent_transfers must be at least 1"));
    }
    if (opts.max_retries == 0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig, "max_retries must be at least 1"));
    }
    if (!(opts.corruption_probability >= 0.0 && opts.corruption_probability <= 1.0)) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            fmt::format("corruption_probability must be within [0, 1], got {}",
                        opts.corruption_probability)));
    }

    return opts;
}

} // namespace blockcopy::infra
