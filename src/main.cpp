#include <chrono>
#include <filesystem>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "infra/logging/logging.hpp"
#include "infra/monitoring/log_event_sink.hpp"
#include "infra/monitoring/monitoring.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "core/transfer_engine/transfer_engine.hpp"
#include <git_info.hpp>

using GIT = blockcopy::build_info::GitInfo;

constexpr auto git = blockcopy::build_info::get_git_info();

namespace {

constexpr int kExitAborted = 2;
constexpr int kExitIntegrityMismatch = 3;

void print_build_info(const GIT& info) {
    fmt::print("blockcopy {}\n", blockcopy::build_info::version);
    fmt::print("Git branch: {}\n", info.branch);
    fmt::print("Git commit: {}\n", info.commit);
    fmt::print("Git commit short: {}\n", info.commit_short);
    fmt::print("Git dirty: {}\n", info.dirty ? "yes" : "no");
    fmt::print("Build timestamp (UTC): {}\n", info.timestamp);
}

void print_summary(const blockcopy::core::TransferResult& result,
                   std::chrono::milliseconds elapsed) {
    spdlog::info("Result: {}", blockcopy::core::to_string(result.status));
    if (!result.reason.empty()) {
        spdlog::info("Reason: {}", result.reason);
    }
    spdlog::info("Blocks: {} ({} retries)", result.blocks, result.retries);
    spdlog::info("Bytes: {} ({:.2f} MB)", result.total_bytes, result.total_bytes / 1024.0 / 1024.0);
    if (!result.destination_digest.empty()) {
        spdlog::info("SHA-256: {}", result.destination_digest);
    }
    spdlog::info("Time elapsed: {:.2f} seconds", elapsed.count() / 1000.0);

    if (result.status != blockcopy::core::TransferStatus::Aborted
        && result.total_bytes > 0 && elapsed.count() > 0) {
        double speed_mbps = (result.total_bytes / 1024.0 / 1024.0) / (elapsed.count() / 1000.0);
        spdlog::info("Average speed: {:.2f} MB/s", speed_mbps);
    }
}

} // namespace

int main(int argc, char** argv)
{
    try {
        auto args_opt = blockcopy::args_parser::parse_args(argc, argv);
        if (!args_opt) {
            return 1; // --help или ошибка
        }
        const auto& args = *args_opt;

        if (args.version) {
            print_build_info(git);
            return 0;
        }

        // 1. Загрузить из файла
        auto config_res = args.config_file
            ? blockcopy::infra::load_config_from_file(*args.config_file)
            : blockcopy::infra::load_config_from_file();
        if (!config_res) {
            fmt::print(stderr, "Config error: {}\n", config_res.error().message);
            return config_res.error().to_exit_code();
        }
        auto config = config_res.value();

        // 2. Переопределить из CLI
        config.merge_with(blockcopy::infra::config_from_cli(args));

        if (auto logging = blockcopy::infra::init_logging(config); !logging) {
            fmt::print(stderr, "Logging error: {}\n", logging.error().message);
            return logging.error().to_exit_code();
        }

        auto options = blockcopy::infra::resolve_options(config);
        if (!options) {
            spdlog::error("Config error: {}", options.error().message);
            return options.error().to_exit_code();
        }

        blockcopy::infra::install_signal_handler();

        const std::filesystem::path source_path(args.source);
        const std::filesystem::path destination_path(args.destination);

        spdlog::debug("Creating Progress Monitor...");
        blockcopy::infra::ProgressMonitor monitor(config.progress, config.quiet);
        blockcopy::infra::LogEventSink sink;

        blockcopy::core::TransferEngine engine(*options, sink, &monitor);

        auto start_time = std::chrono::steady_clock::now();
        auto result = engine.transfer_file(source_path, destination_path);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        if (!result) {
            auto err = blockcopy::infra::log_and_return(std::move(result.error()));
            spdlog::error("Transfer failed: {}", err.message);
            return err.to_exit_code();
        }

        print_summary(*result, elapsed);

        switch (result->status) {
            case blockcopy::core::TransferStatus::Succeeded:
                return 0;
            case blockcopy::core::TransferStatus::IntegrityMismatch:
                return kExitIntegrityMismatch;
            case blockcopy::core::TransferStatus::Aborted:
                return result->interrupted ? 130 : kExitAborted;
        }
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
