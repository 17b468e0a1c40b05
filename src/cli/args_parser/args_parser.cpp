#include "args_parser.hpp"

#include <CLI/CLI.hpp>
#include <fmt/core.h>

namespace blockcopy::args_parser {

std::optional<CLIArgs> parse_args(int argc, char const* const* argv)
{
    CLIArgs args;
    CLI::App app{"blockcopy - verified block-wise file copy with retry and rollback"};

    app.add_option("source", args.source, "File to copy");
    app.add_option("destination", args.destination, "Target file path");

    app.add_option("--min-chunk", args.min_chunk_size, "Minimum block size in bytes (default 1 MiB)")
        ->check(CLI::PositiveNumber);
    app.add_option("--max-chunk", args.max_chunk_size, "Maximum block size in bytes (default 2 MiB)")
        ->check(CLI::PositiveNumber);
    app.add_option("-j,--concurrency", args.concurrency, "Blocks transferred in parallel (default 4)")
        ->check(CLI::PositiveNumber);
    app.add_option("--retries", args.retries, "Attempts per block before the job aborts (default 5)")
        ->check(CLI::PositiveNumber);
    app.add_option("--backoff-ms", args.backoff_ms, "Backoff unit in milliseconds (default 1000)");
    app.add_option("--seed", args.seed, "Seed for block sizes and fault injection");
    app.add_option("--corrupt-probability", args.corrupt_probability,
                   "Simulate write-channel corruption with this probability")
        ->check(CLI::Range(0.0, 1.0));
    app.add_option("--config", args.config_file, "YAML config file")->check(CLI::ExistingFile);
    app.add_option("--log-file", args.log_file, "Append log records to this file");

    app.add_flag("--no-progress", args.no_progress, "Disable the progress bar");
    app.add_flag("-q,--quiet", args.quiet, "Only print errors");
    app.add_flag("-v,--verbose", args.verbose, "Debug logging");
    app.add_flag("--version", args.version, "Print build information and exit");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        app.exit(e);
        return std::nullopt;
    }

    if (!args.version && (args.source.empty() || args.destination.empty())) {
        fmt::print(stderr, "{}\n", app.help());
        return std::nullopt;
    }

    return args;
}

} // namespace blockcopy::args_parser
