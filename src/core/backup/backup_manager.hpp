#pragma once

#include <filesystem>
#include "../types.hpp"
#include "../../infra/error_handler/error.hpp"

namespace blockcopy::core {

// Одна запись на задание. original_existed == false: копии нет,
// restore/discard ничего не делают.
struct BackupRecord {
    std::filesystem::path original_path;
    std::filesystem::path backup_path;
    bool original_existed = false;
};

class BackupManager {
public:
    // Путь резервной копии: "<destination>.backup"
    [[nodiscard]] static auto backup_path_for(const std::filesystem::path& destination)
        -> std::filesystem::path;

    // Копирует существующее назначение в backup_path_for(path)
    [[nodiscard]] static auto create_backup(const std::filesystem::path& path)
        -> infra::Result<BackupRecord>;

    // Резервная копия, если назначение существовало; иначе пустая запись
    [[nodiscard]] static auto prepare(const TransferJob& job) -> infra::Result<BackupRecord>;

    // Копия поверх назначения
    [[nodiscard]] static auto restore(const BackupRecord& record) -> infra::VoidResult;

    // Удаляет файл копии; идемпотентно
    [[nodiscard]] static auto discard(const BackupRecord& record) -> infra::VoidResult;
};

// Гарантирует удаление копии на любом пути выхода из задания
class BackupGuard {
public:
    explicit BackupGuard(BackupRecord record);
    ~BackupGuard();

    BackupGuard(const BackupGuard&) = delete;
    BackupGuard& operator=(const BackupGuard&) = delete;

    [[nodiscard]] auto record() const noexcept -> const BackupRecord& { return record_; }

    // Явное удаление с результатом; деструктор после этого ничего не делает
    [[nodiscard]] auto release() -> infra::VoidResult;

private:
    BackupRecord record_;
    bool released_ = false;
};

} // namespace blockcopy::core
