#include <gtest/gtest.h>

#include <random>

#include "adapters/fs.hpp"
#include "core/block_transfer/block_worker.hpp"
#include "core/chunk_planner/chunk_planner.hpp"
#include "core/scheduler/scheduler.hpp"
#include "infra/interrupt.hpp"
#include "test_helpers.hpp"

using blockcopy::adapters::fs::SharedDestination;
using blockcopy::adapters::fs::SourceFile;
using blockcopy::core::BlockDescriptor;
using blockcopy::core::BlockTransferWorker;
using blockcopy::core::ChunkPlanner;
using blockcopy::core::RecoveryAction;
using blockcopy::core::TransferJob;
using blockcopy::core::TransferScheduler;
using blockcopy::infra::RetryPolicy;
using blockcopy::test::RecordingSink;
using blockcopy::test::ScriptedFaultModel;
using blockcopy::test::TempDir;

namespace {

constexpr std::uint32_t kBlock = 1024;

class SchedulerTest : public ::testing::Test {
protected:
    void make_source(std::size_t size) {
        data_ = blockcopy::test::sequential_bytes(size);
        blockcopy::test::write_file(dir_ / "src.bin", data_);
    }

    auto job(bool preexisted = false) const -> TransferJob {
        return TransferJob{.source_path = dir_ / "src.bin", .destination_path = dir_ / "dst.bin",
                           .total_bytes = data_.size(), .destination_preexisted = preexisted};
    }

    auto run(ScriptedFaultModel& faults, std::uint32_t window, bool preexisted = false,
             std::uint64_t planned_total = 0, std::uint32_t retries = 5)
        -> blockcopy::infra::Result<blockcopy::core::JobOutcome>
    {
        auto source = SourceFile::open(dir_ / "src.bin");
        EXPECT_TRUE(source.has_value());
        auto destination = SharedDestination::create(dir_ / "dst.bin");
        EXPECT_TRUE(destination.has_value());

        std::mt19937_64 rng(17);
        ChunkPlanner planner(planned_total ? planned_total : data_.size(), kBlock, kBlock, rng);
        BlockTransferWorker worker(faults, sink_, RetryPolicy{.max_attempts = retries,
                                                              .delay_unit = std::chrono::milliseconds(1)});
        TransferScheduler scheduler(worker);

        auto outcome = scheduler.run(job(preexisted), planner, *source, **destination, window);
        EXPECT_TRUE((*destination)->close().has_value());
        return outcome;
    }

    TempDir dir_;
    std::vector<char> data_;
    RecordingSink sink_;
};

} // namespace

TEST_F(SchedulerTest, AllBlocksSucceed)
{
    make_source(10 * kBlock + 100);
    ScriptedFaultModel faults(blockcopy::test::never_corrupt());

    auto outcome = run(faults, 4);
    ASSERT_TRUE(outcome.has_value()) << outcome.error().message;
    EXPECT_TRUE(outcome->success);
    EXPECT_EQ(outcome->recovery, RecoveryAction::None);
    EXPECT_EQ(outcome->blocks_planned, 11u);
    EXPECT_EQ(outcome->bytes_planned, data_.size());
    ASSERT_EQ(outcome->outcomes.size(), 11u);
    for (const auto& o : outcome->outcomes) {
        EXPECT_TRUE(o.success);
        EXPECT_EQ(o.attempts, 1u);
    }
    EXPECT_EQ(blockcopy::test::read_file(dir_ / "dst.bin"), data_);
}

TEST_F(SchedulerTest, NeverExceedsConcurrencyWindow)
{
    make_source(24 * kBlock);
    ScriptedFaultModel faults(blockcopy::test::never_corrupt(), std::chrono::milliseconds(3));

    auto outcome = run(faults, 3);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->success);
    EXPECT_LE(faults.max_active(), 3);
    EXPECT_GE(faults.max_active(), 1);
}

TEST_F(SchedulerTest, WindowOfOneRunsSerially)
{
    make_source(8 * kBlock);
    ScriptedFaultModel faults(blockcopy::test::never_corrupt(), std::chrono::milliseconds(2));

    auto outcome = run(faults, 1);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->success);
    EXPECT_EQ(faults.max_active(), 1);
    EXPECT_EQ(blockcopy::test::read_file(dir_ / "dst.bin"), data_);
}

TEST_F(SchedulerTest, FailedBlockStopsAdmission)
{
    make_source(64 * kBlock);
    // Остальные блоки медленные, чтобы неудача блока 1 наступила раньше конца плана
    ScriptedFaultModel faults([](const BlockDescriptor& block, std::uint32_t) {
        return block.sequence_number == 1;
    }, std::chrono::milliseconds(5));

    auto outcome = run(faults, 2, false, 0, 3);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_FALSE(outcome->success);
    ASSERT_TRUE(outcome->failed_block.has_value());
    EXPECT_EQ(outcome->failed_block->sequence_number, 1u);
    EXPECT_EQ(outcome->failed_block->attempts, 3u);
    EXPECT_EQ(outcome->recovery, RecoveryAction::Delete);
    EXPECT_LT(outcome->blocks_planned, 64u);
    // Все запущенные блоки доработали до конца
    EXPECT_EQ(outcome->outcomes.size(), outcome->blocks_planned);
    EXPECT_NE(outcome->reason.find("block 1"), std::string::npos);
}

TEST_F(SchedulerTest, FailureOnPreexistingDestinationRequestsRestore)
{
    make_source(4 * kBlock);
    ScriptedFaultModel faults([](const BlockDescriptor& block, std::uint32_t) {
        return block.sequence_number == 2;
    });

    auto outcome = run(faults, 2, true, 0, 2);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_FALSE(outcome->success);
    EXPECT_EQ(outcome->recovery, RecoveryAction::Restore);
}

TEST_F(SchedulerTest, ShortSourceReadIsAnError)
{
    make_source(4 * kBlock);
    ScriptedFaultModel faults(blockcopy::test::never_corrupt());

    // План длиннее файла: чтение последнего блока обрывается
    auto outcome = run(faults, 2, false, 6 * kBlock);
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, blockcopy::infra::ErrorCode::ReadFailed);
}

TEST_F(SchedulerTest, InterruptStopsAdmission)
{
    make_source(16 * kBlock);
    ScriptedFaultModel faults(blockcopy::test::never_corrupt());

    blockcopy::infra::g_interrupted.store(true);
    auto outcome = run(faults, 2);
    blockcopy::infra::reset_interrupted();

    ASSERT_TRUE(outcome.has_value());
    EXPECT_FALSE(outcome->success);
    EXPECT_TRUE(outcome->interrupted);
    EXPECT_EQ(outcome->reason, "interrupted");
    EXPECT_EQ(outcome->blocks_planned, 0u);
}

TEST_F(SchedulerTest, EmptySourceSucceedsWithoutBlocks)
{
    make_source(0);
    ScriptedFaultModel faults(blockcopy::test::never_corrupt());

    auto outcome = run(faults, 4);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->success);
    EXPECT_TRUE(outcome->outcomes.empty());
    EXPECT_EQ(faults.calls(), 0);
}
