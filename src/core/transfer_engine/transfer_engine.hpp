#pragma once

#include <filesystem>
#include <memory>
#include <random>
#include <string>
#include <string_view>
#include <vector>
#include "../types.hpp"
#include "../backup/backup_manager.hpp"
#include "../block_transfer/fault_model.hpp"
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/monitoring/events.hpp"
#include "../../infra/monitoring/monitoring.hpp"

namespace blockcopy::core {

enum class TransferStatus {
    Succeeded,          // все блоки записаны, SHA-256 совпал
    IntegrityMismatch,  // все блоки записаны, но SHA-256 файлов различается
    Aborted,            // блок не прошёл проверку или прерывание; назначение восстановлено
};

[[nodiscard]] auto to_string(TransferStatus status) -> std::string_view;

struct TransferResult {
    TransferStatus status = TransferStatus::Aborted;
    std::string reason;                      // только для Aborted
    bool interrupted = false;                // Aborted по SIGINT/SIGTERM
    RecoveryAction recovery = RecoveryAction::None;
    std::uint64_t total_bytes = 0;
    std::uint32_t blocks = 0;
    std::uint32_t retries = 0;
    std::vector<BlockOutcome> outcomes;
    std::string source_digest;               // hex SHA-256, пусто если не считали
    std::string destination_digest;
};

// Фазы: Init -> Backup -> Transferring -> {Verifying | Recovering} -> Done.
// I/O ошибки возвращаются как infra::Error; резервная копия удаляется всегда.
class TransferEngine {
public:
    // fault_model == nullptr: выбирается по options.corruption_probability
    TransferEngine(const infra::TransferOptions& options,
                   infra::EventSink& sink,
                   infra::ProgressMonitor* monitor = nullptr,
                   std::shared_ptr<FaultModel> fault_model = nullptr);

    [[nodiscard]] auto transfer_file(const std::filesystem::path& source,
                                     const std::filesystem::path& destination)
        -> infra::Result<TransferResult>;

private:
    void phase_(infra::Phase phase, std::string message, bool ok = true);

    [[nodiscard]] auto recover_(const TransferJob& job, const BackupRecord& record)
        -> infra::VoidResult;

    [[nodiscard]] auto verify_(const TransferJob& job, TransferResult& result)
        -> infra::VoidResult;

    infra::TransferOptions options_;
    infra::EventSink& sink_;
    infra::ProgressMonitor* monitor_;
    std::mt19937_64 rng_;
    std::shared_ptr<FaultModel> fault_model_;
};

} // namespace blockcopy::core
