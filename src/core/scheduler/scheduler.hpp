#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "../types.hpp"
#include "../chunk_planner/chunk_planner.hpp"
#include "../block_transfer/block_worker.hpp"
#include "../../adapters/fs.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/monitoring/monitoring.hpp"

namespace blockcopy::core {

struct JobOutcome {
    bool success = false;
    bool interrupted = false;
    std::vector<BlockOutcome> outcomes;          // в порядке завершения
    std::optional<BlockOutcome> failed_block;    // первый неудачный блок
    RecoveryAction recovery = RecoveryAction::None;
    std::string reason;
    std::uint32_t blocks_planned = 0;
    std::uint64_t bytes_planned = 0;
};

// Держит не больше max_concurrent_transfers блоков в работе.
// Блоки допускаются по возрастанию offset, завершаться могут в любом порядке.
// После первой неудачи новые блоки не допускаются, а уже запущенные дорабатывают.
class TransferScheduler {
public:
    explicit TransferScheduler(const BlockTransferWorker& worker,
                               infra::ProgressMonitor* monitor = nullptr);

    [[nodiscard]] auto run(const TransferJob& job,
                           ChunkPlanner& planner,
                           adapters::fs::SourceFile& source,
                           adapters::fs::SharedDestination& destination,
                           std::uint32_t max_concurrent_transfers) const
        -> infra::Result<JobOutcome>;

private:
    const BlockTransferWorker& worker_;
    infra::ProgressMonitor* monitor_;
};

} // namespace blockcopy::core
