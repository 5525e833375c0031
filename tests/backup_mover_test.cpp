#include "backup_mover.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <unistd.h>

namespace fs = std::filesystem;
using testsupport::TempDir;
using testsupport::readFile;

TEST(BackupMoverTest, MovesFileUnderItsBasename) {
    TempDir dir;
    auto source = dir.write("input/nested/x.dat", "payload");
    auto backup = dir.mkdir("backup");

    auto moved = moveToBackup(source, backup);
    ASSERT_TRUE(moved.has_value());
    EXPECT_EQ(moved->target.string(), (backup / "x.dat").string());
    EXPECT_FALSE(moved->replacedExisting);
    EXPECT_FALSE(fs::exists(source));
    EXPECT_EQ(readFile(backup / "x.dat"), "payload");
}

TEST(BackupMoverTest, ReplacesExistingBackupWithSameName) {
    TempDir dir;
    auto source = dir.write("input/x.dat", "new");
    auto backup = dir.mkdir("backup");
    dir.write("backup/x.dat", "old");

    auto moved = moveToBackup(source, backup);
    ASSERT_TRUE(moved.has_value());
    EXPECT_TRUE(moved->replacedExisting);
    EXPECT_EQ(readFile(backup / "x.dat"), "new");
    EXPECT_FALSE(fs::exists(source));
}

TEST(BackupMoverTest, MissingBackupDirectoryLeavesSourceInPlace) {
    TempDir dir;
    auto source = dir.write("input/x.dat", "payload");

    auto moved = moveToBackup(source, dir.path() / "gone");
    ASSERT_FALSE(moved.has_value());
    EXPECT_EQ(moved.error().kind, ErrorKind::MoveError);
    EXPECT_NE(moved.error().message.find("x.dat"), std::string::npos);
    EXPECT_EQ(readFile(source), "payload");
}

TEST(BackupMoverTest, CopyMoveReplacesTargetAndRemovesSource) {
    TempDir dir;
    auto source = dir.write("input/x.dat", "new");
    auto target = dir.write("backup/x.dat", "old");

    auto moved = moveByCopy(source, target);
    ASSERT_TRUE(moved.has_value());
    EXPECT_EQ(readFile(target), "new");
    EXPECT_FALSE(fs::exists(source));
    EXPECT_FALSE(fs::exists(dir.path() / "backup" / "x.dat.part"));
}

TEST(BackupMoverTest, FailedCopyKeepsExistingBackup) {
    TempDir dir;
    auto target = dir.write("backup/x.dat", "old");

    auto moved = moveByCopy(dir.path() / "input" / "x.dat", target);
    ASSERT_FALSE(moved.has_value());
    EXPECT_EQ(moved.error().kind, ErrorKind::MoveError);
    EXPECT_EQ(readFile(target), "old");
    EXPECT_FALSE(fs::exists(dir.path() / "backup" / "x.dat.part"));
}

TEST(BackupMoverTest, UnremovableSourceLeavesFileOnlyInSourceTree) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "root can remove files from read-only directories";
    }
    TempDir dir;
    auto source = dir.write("input/x.dat", "new");
    auto target = dir.write("backup/x.dat", "old");
    auto inputDir = dir.path() / "input";
    fs::permissions(inputDir, fs::perms::owner_read | fs::perms::owner_exec);

    auto moved = moveByCopy(source, target);
    fs::permissions(inputDir, fs::perms::owner_all);

    ASSERT_FALSE(moved.has_value());
    EXPECT_EQ(moved.error().kind, ErrorKind::MoveError);
    EXPECT_EQ(readFile(source), "new");
    EXPECT_EQ(readFile(target), "old");
    EXPECT_FALSE(fs::exists(dir.path() / "backup" / "x.dat.part"));
}
