#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/scanners/DirectoryWalker.h"
#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

namespace secret_hunter {

class DirectoryWalkerTest : public ::testing::Test {
protected:
    fs::path temp_dir;
    fs::path root;
    fs::path outside;
    std::vector<std::string> skipped;

    void SetUp() override {
        char template_path[] = "/tmp/secret_hunter_walk_XXXXXX";
        char* made = mkdtemp(template_path);
        ASSERT_NE(made, nullptr);
        temp_dir = made;
        root = temp_dir / "root";
        outside = temp_dir / "outside";
        fs::create_directories(root);
        fs::create_directories(outside);
    }

    void TearDown() override {
        std::error_code ec;
        fs::permissions(root / "locked", fs::perms::owner_all, ec);
        fs::remove_all(temp_dir);
    }

    void touch(const fs::path& p, const std::string& content = "x\n") {
        fs::create_directories(p.parent_path());
        std::ofstream(p) << content;
    }

    // Paths relative to `root`, in the order the walker yields them
    std::vector<std::string> walk(bool follow_symlinks = false) {
        DirectoryWalker walker(root, WalkOptions{follow_symlinks},
            [this](const std::string& path, const std::string&) { skipped.push_back(path); });
        std::vector<std::string> out;
        fs::path p;
        while (walker.next(p)) out.push_back(p.lexically_relative(root).string());
        return out;
    }
};

TEST_F(DirectoryWalkerTest, EmptyDirectory) {
    EXPECT_THAT(walk(), IsEmpty());
    EXPECT_THAT(skipped, IsEmpty());
}

TEST_F(DirectoryWalkerTest, DepthFirstSortedOrder) {
    touch(root / "c.txt");
    touch(root / "b.txt");
    touch(root / "a" / "z.txt");
    touch(root / "a" / "c.txt");
    touch(root / "a" / "deeper" / "d.txt");
    EXPECT_THAT(walk(), ElementsAre("a/c.txt", "a/deeper/d.txt", "a/z.txt", "b.txt", "c.txt"));
}

TEST_F(DirectoryWalkerTest, HiddenFilesAreIncluded) {
    touch(root / ".env");
    touch(root / ".config" / "settings.ini");
    EXPECT_THAT(walk(), ElementsAre(".config/settings.ini", ".env"));
}

TEST_F(DirectoryWalkerTest, SymlinkedDirectoryNotFollowedByDefault) {
    touch(outside / "x.txt");
    fs::create_directory_symlink(outside, root / "link");
    touch(root / "own.txt");
    EXPECT_THAT(walk(false), ElementsAre("own.txt"));
}

TEST_F(DirectoryWalkerTest, SymlinkedDirectoryFollowedOnRequest) {
    touch(outside / "x.txt");
    fs::create_directory_symlink(outside, root / "link");
    touch(root / "own.txt");
    EXPECT_THAT(walk(true), ElementsAre("link/x.txt", "own.txt"));
}

TEST_F(DirectoryWalkerTest, SymlinkCycleTerminates) {
    touch(root / "f.txt");
    touch(root / "sub" / "g.txt");
    fs::create_directory_symlink(root, root / "sub" / "loop");
    EXPECT_THAT(walk(true), ElementsAre("f.txt", "sub/g.txt"));
    EXPECT_THAT(walk(false), ElementsAre("f.txt", "sub/g.txt"));
}

TEST_F(DirectoryWalkerTest, FileSymlinkIsYieldedAndDanglingIsNot) {
    touch(outside / "real.txt");
    fs::create_symlink(outside / "real.txt", root / "alias.txt");
    fs::create_symlink(outside / "gone.txt", root / "dangling.txt");
    EXPECT_THAT(walk(), ElementsAre("alias.txt"));
}

TEST_F(DirectoryWalkerTest, FifoIsNeverYielded) {
    ASSERT_EQ(mkfifo((root / "pipe.txt").c_str(), 0600), 0);
    touch(root / "plain.txt");
    EXPECT_THAT(walk(), ElementsAre("plain.txt"));
}

TEST_F(DirectoryWalkerTest, UnreadableDirectoryIsSkippedAndReported) {
    if (geteuid() == 0) GTEST_SKIP() << "root bypasses directory permissions";
    touch(root / "locked" / "hidden.txt");
    touch(root / "open.txt");
    ASSERT_EQ(chmod((root / "locked").c_str(), 0), 0);
    EXPECT_THAT(walk(), ElementsAre("open.txt"));
    EXPECT_THAT(skipped, ElementsAre((root / "locked").string()));
}

TEST_F(DirectoryWalkerTest, DeepTreeDoesNotRecurse) {
    fs::path deep = root;
    for (int i = 0; i < 200; ++i) deep /= "d";
    touch(deep / "bottom.txt");
    auto files = walk();
    ASSERT_EQ(files.size(), 1u);
    EXPECT_THAT(files[0], ::testing::EndsWith("d/bottom.txt"));
}

TEST_F(DirectoryWalkerTest, CountsEnteredDirectories) {
    touch(root / "a" / "1.txt");
    touch(root / "b" / "2.txt");
    DirectoryWalker walker(root, WalkOptions{});
    fs::path p;
    while (walker.next(p)) {}
    EXPECT_EQ(walker.directories_entered(), 3u);
}

}
