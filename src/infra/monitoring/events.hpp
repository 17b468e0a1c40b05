#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace blockcopy::infra {

enum class Phase {
    Init,
    Backup,
    Transferring,
    Verifying,
    Recovering,
    Done,
};

[[nodiscard]] constexpr auto to_string(Phase phase) -> std::string_view {
    switch (phase) {
        case Phase::Init:         return "init";
        case Phase::Backup:       return "backup";
        case Phase::Transferring: return "transferring";
        case Phase::Verifying:    return "verifying";
        case Phase::Recovering:   return "recovering";
        case Phase::Done:         return "done";
    }
    return "unknown";
}

// Одно событие: переход фазы (sequence_number == 0) или попытка записи блока
struct TransferEvent {
    Phase phase = Phase::Init;
    std::uint32_t sequence_number = 0;
    std::uint64_t offset = 0;
    std::uint64_t size_bytes = 0;
    std::string fingerprint;
    std::uint32_t retry_count = 0;
    std::string message;
    bool ok = true; // false: несовпадение хеша или ошибка фазы
};

// Приёмник событий. emit() вызывается из нескольких рабочих потоков.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void emit(const TransferEvent& event) = 0;
};

} // namespace blockcopy::infra
