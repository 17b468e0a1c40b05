#include <gtest/gtest.h>

#include "core/backup/backup_manager.hpp"
#include "test_helpers.hpp"

using blockcopy::core::BackupGuard;
using blockcopy::core::BackupManager;
using blockcopy::core::BackupRecord;
using blockcopy::core::TransferJob;
using blockcopy::infra::ErrorCode;
using blockcopy::test::TempDir;
using blockcopy::test::read_file;
using blockcopy::test::write_text;

namespace {

auto as_string(const std::vector<char>& bytes) -> std::string {
    return {bytes.begin(), bytes.end()};
}

} // namespace

TEST(BackupManagerTest, BackupPathAppendsSuffix)
{
    EXPECT_EQ(BackupManager::backup_path_for("/tmp/out.bin"), std::filesystem::path("/tmp/out.bin.backup"));
}

TEST(BackupManagerTest, CreateBackupCopiesDestination)
{
    TempDir dir;
    write_text(dir / "dst", "original");

    auto record = BackupManager::create_backup(dir / "dst");
    ASSERT_TRUE(record.has_value()) << record.error().message;
    EXPECT_TRUE(record->original_existed);
    EXPECT_EQ(record->backup_path, dir / "dst.backup");
    EXPECT_EQ(as_string(read_file(record->backup_path)), "original");
}

TEST(BackupManagerTest, CreateBackupOfMissingFileFailsWithoutArtifact)
{
    TempDir dir;
    auto record = BackupManager::create_backup(dir / "missing");
    ASSERT_FALSE(record.has_value());
    EXPECT_EQ(record.error().code, ErrorCode::BackupFailed);
    EXPECT_FALSE(std::filesystem::exists(dir / "missing.backup"));
}

TEST(BackupManagerTest, PrepareSkipsNewDestination)
{
    TempDir dir;
    TransferJob job{.source_path = dir / "src", .destination_path = dir / "dst",
                    .total_bytes = 0, .destination_preexisted = false};

    auto record = BackupManager::prepare(job);
    ASSERT_TRUE(record.has_value());
    EXPECT_FALSE(record->original_existed);
    EXPECT_FALSE(std::filesystem::exists(BackupManager::backup_path_for(dir / "dst")));

    // restore и discard без копии ничего не делают
    EXPECT_TRUE(BackupManager::restore(*record).has_value());
    EXPECT_TRUE(BackupManager::discard(*record).has_value());
    EXPECT_FALSE(std::filesystem::exists(dir / "dst"));
}

TEST(BackupManagerTest, FailedBackupKeepsForeignDirectory)
{
    TempDir dir;
    write_text(dir / "dst", "original");
    std::filesystem::create_directory(dir / "dst.backup");

    auto record = BackupManager::create_backup(dir / "dst");
    ASSERT_FALSE(record.has_value());
    EXPECT_EQ(record.error().code, ErrorCode::BackupFailed);
    EXPECT_TRUE(std::filesystem::is_directory(dir / "dst.backup"));
    EXPECT_EQ(as_string(read_file(dir / "dst")), "original");
}

TEST(BackupManagerTest, RestoreOverwritesModifiedDestination)
{
    TempDir dir;
    write_text(dir / "dst", "original");
    auto record = BackupManager::create_backup(dir / "dst");
    ASSERT_TRUE(record.has_value());

    write_text(dir / "dst", "partially overwritten and longer");
    ASSERT_TRUE(BackupManager::restore(*record).has_value());
    EXPECT_EQ(as_string(read_file(dir / "dst")), "original");
}

TEST(BackupManagerTest, RestoreWithoutArtifactFails)
{
    TempDir dir;
    BackupRecord record{.original_path = dir / "dst", .backup_path = dir / "dst.backup",
                        .original_existed = true};
    auto res = BackupManager::restore(record);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::RestoreFailed);
}

TEST(BackupManagerTest, DiscardIsIdempotent)
{
    TempDir dir;
    write_text(dir / "dst", "original");
    auto record = BackupManager::create_backup(dir / "dst");
    ASSERT_TRUE(record.has_value());

    EXPECT_TRUE(BackupManager::discard(*record).has_value());
    EXPECT_FALSE(std::filesystem::exists(record->backup_path));
    EXPECT_TRUE(BackupManager::discard(*record).has_value());
    EXPECT_TRUE(std::filesystem::exists(dir / "dst"));
}

TEST(BackupGuardTest, RemovesBackupOnScopeExit)
{
    TempDir dir;
    write_text(dir / "dst", "original");
    std::filesystem::path backup_path;
    {
        auto record = BackupManager::create_backup(dir / "dst");
        ASSERT_TRUE(record.has_value());
        backup_path = record->backup_path;
        BackupGuard guard{std::move(*record)};
        EXPECT_TRUE(std::filesystem::exists(backup_path));
    }
    EXPECT_FALSE(std::filesystem::exists(backup_path));
}

TEST(BackupGuardTest, RemovesBackupWhenExceptionUnwinds)
{
    TempDir dir;
    write_text(dir / "dst", "original");
    auto record = BackupManager::create_backup(dir / "dst");
    ASSERT_TRUE(record.has_value());
    const auto backup_path = record->backup_path;

    EXPECT_THROW({
        BackupGuard guard{std::move(*record)};
        throw std::runtime_error("boom");
    }, std::runtime_error);
    EXPECT_FALSE(std::filesystem::exists(backup_path));
}

TEST(BackupGuardTest, ReleaseReportsResult)
{
    TempDir dir;
    write_text(dir / "dst", "original");
    auto record = BackupManager::create_backup(dir / "dst");
    ASSERT_TRUE(record.has_value());

    BackupGuard guard{std::move(*record)};
    EXPECT_TRUE(guard.release().has_value());
    EXPECT_FALSE(std::filesystem::exists(guard.record().backup_path));
}
