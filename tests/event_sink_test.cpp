#include <gtest/gtest.h>

#include "infra/monitoring/log_event_sink.hpp"

using blockcopy::infra::LogEventSink;
using blockcopy::infra::Phase;
using blockcopy::infra::TransferEvent;

TEST(LogEventSinkTest, MegabytesAreRoundedToTwoDecimals)
{
    EXPECT_DOUBLE_EQ(blockcopy::infra::megabytes_from_bytes(1024 * 1024), 1.0);
    EXPECT_DOUBLE_EQ(blockcopy::infra::megabytes_from_bytes(1572864), 1.5);
    EXPECT_DOUBLE_EQ(blockcopy::infra::megabytes_from_bytes(1234567), 1.18);
    EXPECT_DOUBLE_EQ(blockcopy::infra::megabytes_from_bytes(0), 0.0);
}

TEST(LogEventSinkTest, BlockLineCarriesPositionSizeAndHash)
{
    TransferEvent event{
        .phase = Phase::Transferring,
        .sequence_number = 3,
        .offset = 3145728,
        .size_bytes = 1572864,
        .fingerprint = "0123456789abcdef",
    };
    EXPECT_EQ(LogEventSink::format_block(event),
              "Chunk:3  Position: 3145728   Size: 1.5 MB, Hash: 0123456789abcdef");
}

TEST(LogEventSinkTest, EmitAcceptsPhaseAndBlockEvents)
{
    LogEventSink sink;
    sink.emit(TransferEvent{.phase = Phase::Init, .message = "starting"});
    sink.emit(TransferEvent{.phase = Phase::Transferring, .sequence_number = 1, .size_bytes = 10,
                            .fingerprint = "ff", .retry_count = 1, .message = "Hash mismatch. Retry 1/5.",
                            .ok = false});
    SUCCEED();
}

TEST(PhaseTest, NamesAreStable)
{
    EXPECT_EQ(blockcopy::infra::to_string(Phase::Backup), "backup");
    EXPECT_EQ(blockcopy::infra::to_string(Phase::Recovering), "recovering");
    EXPECT_EQ(blockcopy::infra::to_string(Phase::Done), "done");
}
