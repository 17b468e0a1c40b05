#include "transfer_engine.hpp"
#include <algorithm>
#include <exception>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../chunk_planner/chunk_planner.hpp"
#include "../block_transfer/block_worker.hpp"
#include "../scheduler/scheduler.hpp"
#include "../../adapters/fs.hpp"
#include "../../infra/hash/digest.hpp"
#include "../../infra/retry.hpp"

namespace blockcopy::core {

namespace {

auto initial_seed(const infra::TransferOptions& options) -> std::uint64_t {
    if (options.seed) {
        return *options.seed;
    }
    std::random_device rd;
    return (static_cast<std::uint64_t>(rd()) << 32) | rd();
}

} // namespace

auto to_string(TransferStatus status) -> std::string_view {
    switch (status) {
        case TransferStatus::Succeeded:         return "succeeded";
        case TransferStatus::IntegrityMismatch: return "integrity mismatch";
        case TransferStatus::Aborted:           return "aborted";
    }
    return "unknown";
}

TransferEngine::TransferEngine(const infra::TransferOptions& options,
                               infra::EventSink& sink,
                               infra::ProgressMonitor* monitor,
                               std::shared_ptr<FaultModel> fault_model)
    : options_(options)
    , sink_(sink)
    , monitor_(monitor)
    , rng_(initial_seed(options))
    , fault_model_(std::move(fault_model))
{
    if (!fault_model_) {
        // Второй поток случайных чисел выводится из того же генератора
        fault_model_ = make_fault_model(options_, rng_());
    }
}

void TransferEngine::phase_(infra::Phase phase, std::string message, bool ok) {
    sink_.emit(infra::TransferEvent{
        .phase = phase,
        .message = std::move(message),
        .ok = ok
    });
}

auto TransferEngine::recover_(const TransferJob& job, const BackupRecord& record)
    -> infra::VoidResult
{
    switch (required_recovery(job)) {
        case RecoveryAction::Restore: {
            auto restored = BackupManager::restore(record);
            if (restored) {
                phase_(infra::Phase::Recovering, "Destination restored from backup");
            }
            return restored;
        }
        case RecoveryAction::Delete: {
            phase_(infra::Phase::Recovering, "Deleting partially transferred file...");
            return adapters::fs::remove_file(job.destination_path);
        }
        case RecoveryAction::None:
            break;
    }
    return {};
}

auto TransferEngine::verify_(const TransferJob& job, TransferResult& result)
    -> infra::VoidResult
{
    auto source_digest = infra::DigestService::digest_file(job.source_path);
    if (!source_digest) {
        return std::unexpected(std::move(source_digest.error()));
    }
    auto destination_digest = infra::DigestService::digest_file(job.destination_path);
    if (!destination_digest) {
        return std::unexpected(std::move(destination_digest.error()));
    }

    result.source_digest = infra::DigestService::to_hex(*source_digest);
    result.destination_digest = infra::DigestService::to_hex(*destination_digest);

    if (*source_digest == *destination_digest) {
        result.status = TransferStatus::Succeeded;
        phase_(infra::Phase::Verifying, "File integrity verified: Hashes match.");
    } else {
        result.status = TransferStatus::IntegrityMismatch;
        phase_(infra::Phase::Verifying,
               fmt::format("File integrity check failed! Hashes do not match. (src: {}, dst: {})",
                           result.source_digest, result.destination_digest),
               false);
    }
    return {};
}

auto TransferEngine::transfer_file(const std::filesystem::path& source_path,
                                   const std::filesystem::path& destination_path)
    -> infra::Result<TransferResult>
{
    // ---- Init ----
    phase_(infra::Phase::Init, fmt::format("{} -> {}", source_path.string(), destination_path.string()));

    auto source = adapters::fs::SourceFile::open(source_path);
    if (!source) {
        return std::unexpected(std::move(source.error()));
    }

    std::error_code ec;
    if (std::filesystem::is_directory(destination_path, ec)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
                               fmt::format("Destination is a directory: {}", destination_path.string())));
    }
    if (adapters::fs::same_file(source_path, destination_path)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
                               fmt::format("Source and destination are the same file: {}", source_path.string())));
    }

    const TransferJob job{
        .source_path = source_path,
        .destination_path = destination_path,
        .total_bytes = source->size(),
        .destination_preexisted = adapters::fs::exists(destination_path)
    };

    // ---- Backup ---- (до открытия назначения: открытие его обрезает)
    phase_(infra::Phase::Backup, job.destination_preexisted
        ? "Destination exists, creating backup"
        : "Destination is new, no backup needed");

    auto record = BackupManager::prepare(job);
    if (!record) {
        return std::unexpected(std::move(record.error()));
    }
    BackupGuard backup{std::move(*record)};

    auto destination = adapters::fs::SharedDestination::create(job.destination_path);
    if (!destination) {
        // Назначение не открылось и не изменено; копия удалится в guard
        return std::unexpected(std::move(destination.error()));
    }

    // ---- Transferring ----
    phase_(infra::Phase::Transferring,
           fmt::format("{} bytes in blocks of {}..{} bytes, {} in parallel, {} attempts per block",
                       job.total_bytes, options_.min_chunk_size, options_.max_chunk_size,
                       options_.max_concurrent_transfers, options_.max_retries));
    if (monitor_) {
        monitor_->set_total(job.total_bytes);
    }

    ChunkPlanner planner{job.total_bytes, options_.min_chunk_size, options_.max_chunk_size, rng_};
    BlockTransferWorker worker{*fault_model_, sink_, infra::RetryPolicy{
        .max_attempts = options_.max_retries,
        .delay_unit = options_.backoff_unit,
    }};
    TransferScheduler scheduler{worker, monitor_};

    infra::Result<JobOutcome> run = [&]() -> infra::Result<JobOutcome> {
        try {
            return scheduler.run(job, planner, *source, **destination, options_.max_concurrent_transfers);
        } catch (const std::exception& e) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
                                   fmt::format("Transfer failed: {}", e.what())));
        }
    }();

    auto closed = (*destination)->close();
    if (monitor_) {
        monitor_->finish();
    }

    TransferResult result{};
    result.total_bytes = job.total_bytes;

    if (run) {
        result.outcomes = std::move(run->outcomes);
        std::ranges::sort(result.outcomes, {}, &BlockOutcome::sequence_number);
        result.blocks = run->blocks_planned;
        for (const auto& o : result.outcomes) {
            result.retries += o.attempts > 0 ? o.attempts - 1 : 0;
        }
    }

    // Ошибка закрытия после успешной передачи тоже требует восстановления
    if (run && run->success && !closed) {
        run = std::unexpected(std::move(closed.error()));
    } else if (!closed) {
        (void)infra::log_and_return(std::move(closed.error()));
    }

    if (!run || !run->success) {
        // ---- Recovering ----
        phase_(infra::Phase::Recovering,
               run ? fmt::format("Transfer aborted: {}", run->reason)
                   : fmt::format("Transfer failed: {}", run.error().message),
               false);

        if (auto recovered = recover_(job, backup.record()); !recovered) {
            phase_(infra::Phase::Done, "Recovery failed", false);
            return std::unexpected(std::move(recovered.error()));
        }

        phase_(infra::Phase::Done, "Destination returned to its previous state");
        if (auto released = backup.release(); !released) {
            return std::unexpected(std::move(released.error()));
        }
        if (!run) {
            return std::unexpected(std::move(run.error()));
        }

        result.status = TransferStatus::Aborted;
        result.reason = run->reason;
        result.interrupted = run->interrupted;
        result.recovery = run->recovery;
        return result;
    }

    // ---- Verifying ----
    phase_(infra::Phase::Verifying, "Comparing SHA-256 of source and destination");
    if (auto verified = verify_(job, result); !verified) {
        phase_(infra::Phase::Done, "Verification could not complete", false);
        return std::unexpected(std::move(verified.error()));
    }

    // ---- Done ----
    if (auto released = backup.release(); !released) {
        return std::unexpected(std::move(released.error()));
    }
    phase_(infra::Phase::Done, result.status == TransferStatus::Succeeded
        ? "File transfer completed."
        : "File transfer completed with an integrity mismatch.",
        result.status == TransferStatus::Succeeded);
    return result;
}

} // namespace blockcopy::core
