#include "backup_manager.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../../adapters/fs.hpp"

namespace blockcopy::core {

auto BackupManager::backup_path_for(const std::filesystem::path& destination)
    -> std::filesystem::path
{
    auto backup = destination;
    backup += ".backup";
    return backup;
}

auto BackupManager::create_backup(const std::filesystem::path& path)
    -> infra::Result<BackupRecord>
{
    BackupRecord record{
        .original_path = path,
        .backup_path = backup_path_for(path),
        .original_existed = true
    };

    auto copied = adapters::fs::copy_overwrite(record.original_path, record.backup_path,
                                               infra::ErrorCode::BackupFailed);
    if (!copied) {
        // Частично записанная копия не должна остаться; чужой каталог не трогаем
        if (adapters::fs::is_regular(record.backup_path)) {
            if (auto removed = adapters::fs::remove_file(record.backup_path); !removed) {
                (void)infra::log_and_return(std::move(removed.error()));
            }
        }
        return std::unexpected(std::move(copied.error()));
    }

    spdlog::info("Backup created: {}", record.backup_path.string());
    return record;
}

auto BackupManager::prepare(const TransferJob& job) -> infra::Result<BackupRecord> {
    if (!job.destination_preexisted) {
        return BackupRecord{.original_path = job.destination_path};
    }
    return create_backup(job.destination_path);
}

auto BackupManager::restore(const BackupRecord& record) -> infra::VoidResult {
    if (!record.original_existed) {
        return {};
    }

    spdlog::info("Restoring the destination file from backup...");
    if (!adapters::fs::exists(record.backup_path)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::RestoreFailed,
                               fmt::format("Backup is missing: {}", record.backup_path.string())));
    }
    return adapters::fs::copy_overwrite(record.backup_path, record.original_path,
                                        infra::ErrorCode::RestoreFailed);
}

auto BackupManager::discard(const BackupRecord& record) -> infra::VoidResult {
    if (!record.original_existed || !adapters::fs::exists(record.backup_path)) {
        return {};
    }

    auto removed = adapters::fs::remove_file(record.backup_path);
    if (removed) {
        spdlog::info("Backup file deleted: {}", record.backup_path.string());
    }
    return removed;
}

BackupGuard::BackupGuard(BackupRecord record)
    : record_(std::move(record)) {}

BackupGuard::~BackupGuard() {
    if (released_) {
        return;
    }
    if (auto res = BackupManager::discard(record_); !res) {
        (void)infra::log_and_return(std::move(res.error()));
    }
}

auto BackupGuard::release() -> infra::VoidResult {
    auto res = BackupManager::discard(record_);
    released_ = res.has_value(); // при ошибке деструктор попробует ещё раз
    return res;
}

} // namespace blockcopy::core
