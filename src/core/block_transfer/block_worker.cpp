#include "block_worker.hpp"
#include <fmt/core.h>
#include "../../infra/hash/digest.hpp"

namespace blockcopy::core {

BlockTransferWorker::BlockTransferWorker(FaultModel& fault_model,
                                         infra::EventSink& sink,
                                         infra::RetryPolicy policy)
    : fault_model_(fault_model)
    , sink_(sink)
    , policy_(policy)
{}

auto BlockTransferWorker::transfer_block(adapters::fs::SharedDestination& destination,
                                         std::span<const char> data,
                                         const BlockDescriptor& block) const
    -> infra::Result<BlockOutcome>
{
    // Эталон: хеш исходных байт, до любой попытки записи
    const auto source_hash = infra::DigestService::digest_block(data);
    std::uint32_t attempts = 0;

    auto result = infra::with_retry([&](std::uint32_t attempt) -> infra::VoidResult {
        attempts = attempt;

        auto written = fault_model_.transform(data, block, attempt);

        if (auto res = destination.write_at(block.offset, written); !res) {
            return std::unexpected(std::move(res.error()));
        }

        // Хеш того, что фактически ушло в файл
        const auto written_hash = infra::DigestService::digest_block(written);
        const bool matched = written_hash == source_hash;

        infra::TransferEvent event{
            .phase = infra::Phase::Transferring,
            .sequence_number = block.sequence_number,
            .offset = block.offset,
            .size_bytes = block.length,
            .fingerprint = infra::DigestService::to_hex(written_hash),
            .retry_count = attempt - 1,
            .message = matched
                ? std::string("Block verification successful.")
                : attempt < policy_.max_attempts
                    ? fmt::format("Hash mismatch. Retry {}/{}.", attempt, policy_.max_attempts)
                    : fmt::format("Hash mismatch. Giving up after {} attempts.", attempt),
            .ok = matched
        };
        sink_.emit(event);

        if (!matched) {
            return std::unexpected(infra::make_error(infra::ErrorCode::ChecksumMismatch,
                fmt::format("Chunk {}: expected {}, wrote {}", block.sequence_number,
                            infra::DigestService::to_hex(source_hash), event.fingerprint)));
        }
        return {};
    }, policy_);

    if (result) {
        return BlockOutcome{.sequence_number = block.sequence_number, .success = true, .attempts = attempts};
    }
    if (result.error().is_transient()) {
        return BlockOutcome{.sequence_number = block.sequence_number, .success = false, .attempts = attempts};
    }
    return std::unexpected(std::move(result.error()));
}

} // namespace blockcopy::core
