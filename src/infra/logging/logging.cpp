#include "logging.hpp"
#include <memory>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace blockcopy::infra {

auto init_logging(const Config& config) -> VoidResult {
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");
    if (config.quiet) {
        console->set_level(spdlog::level::err);
    }
    sinks.push_back(console);

    const auto log_file = config.log_file.value_or(kDefaultLogFile);
    if (!log_file.empty()) {
        try {
            auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
            file->set_pattern("%Y-%m-%d %H:%M:%S.%e [%l] [%t] %v");
            sinks.push_back(file);
        } catch (const spdlog::spdlog_ex& e) {
            return std::unexpected(make_error(ErrorCode::PermissionDenied,
                                   fmt::format("Cannot open log file {}: {}", log_file, e.what())));
        }
    }

    auto logger = std::make_shared<spdlog::logger>("blockcopy", sinks.begin(), sinks.end());
    logger->set_level(config.verbose ? spdlog::level::debug : spdlog::level::info);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
    return {};
}

} // namespace blockcopy::infra
