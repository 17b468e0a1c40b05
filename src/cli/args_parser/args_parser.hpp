#pragma once

#include <string>
#include <cstdint>
#include <optional>

namespace blockcopy::args_parser {

struct CLIArgs
{
    std::string source;                                 // первый позиционный аргумент
    std::string destination;                            // второй позиционный аргумент
    std::optional<std::uint32_t> min_chunk_size;        // --min-chunk=BYTES
    std::optional<std::uint32_t> max_chunk_size;        // --max-chunk=BYTES
    std::optional<std::uint32_t> concurrency;           // -j, --concurrency=N
    std::optional<std::uint32_t> retries;               // --retries=N
    std::optional<std::uint32_t> backoff_ms;            // --backoff-ms=MS
    std::optional<std::uint64_t> seed;                  // --seed=N
    std::optional<double> corrupt_probability;          // --corrupt-probability=P
    std::optional<std::string> config_file;             // --config=PATH
    std::optional<std::string> log_file;                // --log-file=PATH
    bool no_progress{false};                            // --no-progress
    bool quiet{false};                                  // -q, --quiet
    bool verbose{false};                                // -v, --verbose
    bool version{false};                                // --version
};

/// Разбирает аргументы командной строки в CLIArgs.
/// std::nullopt после --help или при ошибке разбора (CLI11 уже
/// напечатал сообщение).
std::optional<CLIArgs> parse_args(int argc, char const* const* argv);

} // namespace blockcopy::args_parser
