#pragma once

#include <span>
#include "fault_model.hpp"
#include "../types.hpp"
#include "../../adapters/fs.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/monitoring/events.hpp"
#include "../../infra/retry.hpp"

namespace blockcopy::core {

// Записывает один блок, проверяет хеш и повторяет при несовпадении.
// Несовпадение хеша наружу не выходит: только BlockOutcome::success == false.
// Ошибка записи в файл возвращается как infra::Error.
class BlockTransferWorker {
public:
    BlockTransferWorker(FaultModel& fault_model,
                        infra::EventSink& sink,
                        infra::RetryPolicy policy);

    [[nodiscard]] auto transfer_block(adapters::fs::SharedDestination& destination,
                                      std::span<const char> data,
                                      const BlockDescriptor& block) const
        -> infra::Result<BlockOutcome>;

private:
    FaultModel& fault_model_;
    infra::EventSink& sink_;
    infra::RetryPolicy policy_;
};

} // namespace blockcopy::core
