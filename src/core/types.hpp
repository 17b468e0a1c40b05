#pragma once

#include <cstdint>
#include <filesystem>

namespace blockcopy::core {

// Одна операция копирования; не меняется после создания
struct TransferJob {
    std::filesystem::path source_path;
    std::filesystem::path destination_path;
    std::uint64_t total_bytes = 0;
    bool destination_preexisted = false;
};

// Диапазон [offset, offset + length) файла; нумерация с 1
struct BlockDescriptor {
    std::uint32_t sequence_number = 0;
    std::uint64_t offset = 0;
    std::uint32_t length = 0;

    [[nodiscard]] auto end() const noexcept -> std::uint64_t { return offset + length; }
};

struct BlockOutcome {
    std::uint32_t sequence_number = 0;
    bool success = false;
    std::uint32_t attempts = 0;
};

// Что нужно сделать с назначением после сбоя
enum class RecoveryAction {
    None,
    Restore,  // назначение существовало: вернуть из резервной копии
    Delete,   // назначение создано заданием: удалить
};

[[nodiscard]] inline auto required_recovery(const TransferJob& job) noexcept -> RecoveryAction {
    return job.destination_preexisted ? RecoveryAction::Restore : RecoveryAction::Delete;
}

} // namespace blockcopy::core
