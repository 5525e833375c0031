#include "file_discovery.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <set>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;
using testsupport::TempDir;

namespace {

std::set<std::string> relativePaths(const std::vector<Candidate>& candidates, const fs::path& root) {
    std::set<std::string> paths;
    for (const auto& candidate : candidates) {
        paths.insert(fs::relative(candidate.path, root).string());
    }
    return paths;
}

} // namespace

TEST(FileDiscoveryTest, FindsRegularFilesAtEveryDepth) {
    TempDir dir;
    dir.write("a.csv", "a");
    dir.write("sub/b.txt", "b");
    dir.write("sub/deeper/c", "c");
    dir.mkdir("empty");

    auto result = discoverFiles(dir.path());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(relativePaths(*result, dir.path()),
              (std::set<std::string>{"a.csv", "sub/b.txt", "sub/deeper/c"}));
}

TEST(FileDiscoveryTest, FillsPathAndLowerCasedExtension) {
    TempDir dir;
    dir.write("Report.CSV", "x");

    auto result = discoverFiles(dir.path());
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 1u);
    EXPECT_EQ(result->front().path.filename().string(), "Report.CSV");
    EXPECT_EQ(result->front().extension, ".csv");
}

TEST(FileDiscoveryTest, DoesNotFollowDirectorySymlinks) {
    TempDir dir;
    TempDir outside;
    outside.write("elsewhere.csv", "x");
    dir.write("inside.csv", "y");
    fs::create_directory_symlink(outside.path(), dir.path() / "link");

    auto result = discoverFiles(dir.path());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(relativePaths(*result, dir.path()), (std::set<std::string>{"inside.csv"}));
}

TEST(FileDiscoveryTest, SkipsSpecialFiles) {
    TempDir dir;
    dir.write("a.csv", "a");
    ASSERT_EQ(::mkfifo((dir.path() / "p.csv").c_str(), 0600), 0);

    auto result = discoverFiles(dir.path());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(relativePaths(*result, dir.path()), (std::set<std::string>{"a.csv"}));
}

TEST(FileDiscoveryTest, SkipsUnreadableSubdirectories) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "root can read directories without permission bits";
    }
    TempDir dir;
    dir.write("a.csv", "a");
    dir.write("locked/hidden.csv", "h");
    auto locked = dir.path() / "locked";
    fs::permissions(locked, fs::perms::none);

    auto result = discoverFiles(dir.path());
    fs::permissions(locked, fs::perms::owner_all);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(relativePaths(*result, dir.path()), (std::set<std::string>{"a.csv"}));
}

TEST(FileDiscoveryTest, MissingRootIsDirectoryNotFound) {
    TempDir dir;
    auto result = discoverFiles(dir.path() / "missing");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::DirectoryNotFoundError);
}

TEST(FileDiscoveryTest, FileAsRootIsDirectoryNotFound) {
    TempDir dir;
    auto file = dir.write("plain.txt", "x");
    auto result = discoverFiles(file);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::DirectoryNotFoundError);
}

TEST(FileDiscoveryTest, ExtensionEdgeCases) {
    EXPECT_EQ(lowerExtension("archive.tar.GZ"), ".gz");
    EXPECT_EQ(lowerExtension(".profile"), "");
    EXPECT_EQ(lowerExtension("noext"), "");
    EXPECT_EQ(lowerExtension("trailing."), "");
}
