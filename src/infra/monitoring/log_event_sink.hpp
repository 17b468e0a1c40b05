#pragma once

#include "events.hpp"

namespace blockcopy::infra {

// Пишет события через spdlog (консоль и, если настроен, файл журнала)
class LogEventSink final : public EventSink {
public:
    void emit(const TransferEvent& event) override;

    // Строка блока: "Chunk:3  Position: 3145728   Size: 1.5 MB, Hash: ..."
    [[nodiscard]] static auto format_block(const TransferEvent& event) -> std::string;
};

// Байты в мегабайтах с округлением до двух знаков
[[nodiscard]] auto megabytes_from_bytes(std::uint64_t bytes) -> double;

} // namespace blockcopy::infra
