#include "log_event_sink.hpp"
#include <cmath>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace blockcopy::infra {

auto megabytes_from_bytes(std::uint64_t bytes) -> double {
    constexpr double megabyte = 1024.0 * 1024.0;
    return std::round(static_cast<double>(bytes) / megabyte * 100.0) / 100.0;
}

auto LogEventSink::format_block(const TransferEvent& event) -> std::string {
    return fmt::format("Chunk:{}  Position: {}   Size: {} MB, Hash: {}",
                       event.sequence_number, event.offset,
                       megabytes_from_bytes(event.size_bytes), event.fingerprint);
}

void LogEventSink::emit(const TransferEvent& event) {
    if (event.sequence_number == 0) {
        spdlog::log(event.ok ? spdlog::level::info : spdlog::level::warn,
                    "[{}] {}", to_string(event.phase), event.message);
        return;
    }

    // Детали блока печатаются один раз, на первой попытке
    if (event.retry_count == 0) {
        spdlog::info("{}", format_block(event));
    }
    if (event.ok) {
        spdlog::debug("Chunk:{} {}", event.sequence_number, event.message);
    } else {
        spdlog::warn("Chunk:{} {}", event.sequence_number, event.message);
    }
}

} // namespace blockcopy::infra
