#include "scheduler.hpp"
#include <exception>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../../infra/interrupt.hpp"
#include "../../infra/thread_pool/completion_queue.hpp"
#include "../../infra/thread_pool/thread_pool.hpp"

namespace blockcopy::core {

namespace {

struct Completion {
    BlockDescriptor block;
    infra::Result<BlockOutcome> result;
};

} // namespace

TransferScheduler::TransferScheduler(const BlockTransferWorker& worker,
                                     infra::ProgressMonitor* monitor)
    : worker_(worker), monitor_(monitor) {}

auto TransferScheduler::run(const TransferJob& job,
                            ChunkPlanner& planner,
                            adapters::fs::SourceFile& source,
                            adapters::fs::SharedDestination& destination,
                            std::uint32_t max_concurrent_transfers) const
    -> infra::Result<JobOutcome>
{
    const std::uint32_t window = max_concurrent_transfers == 0 ? 1 : max_concurrent_transfers;

    JobOutcome outcome{};
    std::optional<infra::Error> fatal;
    bool admitting = true;
    std::size_t in_flight = 0;

    infra::CompletionQueue<Completion> completions;
    infra::ThreadPool pool{window};

    while (true) {
        // Заполняем окно
        while (admitting && in_flight < window && !planner.exhausted()) {
            if (infra::is_interrupted()) {
                spdlog::warn("Interrupt received, no new blocks will be started");
                outcome.interrupted = true;
                admitting = false;
                break;
            }

            auto block = *planner.next();
            auto bytes = source.read_next(block.length);
            if (!bytes) {
                fatal = std::move(bytes.error());
                admitting = false;
                break;
            }

            pool.enqueue([this, &completions, &destination, block, data = std::move(*bytes)]() {
                Completion done{block, infra::Result<BlockOutcome>{}};
                try {
                    done.result = worker_.transfer_block(destination, data, block);
                } catch (const std::exception& e) {
                    done.result = std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
                        fmt::format("Chunk {} worker failed: {}", block.sequence_number, e.what())));
                }
                completions.push(std::move(done));
            });
            ++in_flight;
        }

        if (in_flight == 0) {
            break;
        }

        // Ждём хотя бы одно завершение
        auto done = completions.pop();
        --in_flight;

        if (!done.result) {
            if (!fatal) {
                fatal = std::move(done.result.error());
            }
            admitting = false;
            continue;
        }

        const auto& block_outcome = *done.result;
        outcome.outcomes.push_back(block_outcome);

        if (!block_outcome.success) {
            if (!outcome.failed_block) {
                outcome.failed_block = block_outcome;
                spdlog::error("A block transfer failed. Aborting transfer.");
            }
            admitting = false;
            continue;
        }

        if (monitor_) {
            monitor_->block_done(done.block.length, block_outcome.attempts);
        }
    }

    outcome.blocks_planned = planner.planned_blocks();
    outcome.bytes_planned = planner.planned_bytes();

    if (fatal) {
        return std::unexpected(std::move(*fatal));
    }

    outcome.success = !outcome.failed_block && !outcome.interrupted && planner.exhausted();
    if (!outcome.success) {
        outcome.recovery = required_recovery(job);
        if (outcome.failed_block) {
            outcome.reason = fmt::format("block {} failed verification after {} attempts",
                                         outcome.failed_block->sequence_number,
                                         outcome.failed_block->attempts);
        } else {
            outcome.reason = "interrupted";
        }
    }
    return outcome;
}

} // namespace blockcopy::core
