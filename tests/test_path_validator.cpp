#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/scanners/PathValidator.h"
#include "../src/core/Errors.h"
#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace secret_hunter {

class PathValidatorTest : public ::testing::Test {
protected:
    fs::path temp_dir;

    void SetUp() override {
        char template_path[] = "/tmp/secret_hunter_path_XXXXXX";
        char* made = mkdtemp(template_path);
        ASSERT_NE(made, nullptr);
        temp_dir = made;
    }

    void TearDown() override {
        std::error_code ec;
        fs::permissions(temp_dir / "locked", fs::perms::owner_all, ec);
        fs::remove_all(temp_dir);
    }

    PathError::Reason reason_for(const std::string& path) {
        try {
            PathValidator::validate(path);
        } catch (const PathError& ex) {
            return ex.reason();
        }
        ADD_FAILURE() << "expected PathError for " << path;
        return PathError::Reason::Empty;
    }
};

TEST_F(PathValidatorTest, AcceptsExistingDirectory) {
    EXPECT_EQ(PathValidator::validate(temp_dir.string()), temp_dir);
}

TEST_F(PathValidatorTest, NormalizesDotSegmentsAndTrailingSlash) {
    fs::create_directory(temp_dir / "sub");
    std::string messy = (temp_dir / "sub" / ".." / "sub" / ".").string() + "/";
    EXPECT_EQ(PathValidator::validate(messy), temp_dir / "sub");
}

TEST_F(PathValidatorTest, RelativePathResolvesAgainstWorkingDirectory) {
    EXPECT_EQ(PathValidator::validate("."), fs::current_path().lexically_normal());
}

TEST_F(PathValidatorTest, EmptyPath) {
    EXPECT_EQ(reason_for(""), PathError::Reason::Empty);
}

TEST_F(PathValidatorTest, MissingDirectory) {
    EXPECT_EQ(reason_for((temp_dir / "nope").string()), PathError::Reason::NotFound);
}

TEST_F(PathValidatorTest, RegularFileIsNotADirectory) {
    fs::path file = temp_dir / "app.py";
    std::ofstream(file) << "x\n";
    EXPECT_EQ(reason_for(file.string()), PathError::Reason::NotADirectory);
    EXPECT_EQ(reason_for((file / "below").string()), PathError::Reason::NotADirectory);
}

TEST_F(PathValidatorTest, MessageNamesThePath) {
    std::string missing = (temp_dir / "nope").string();
    try {
        PathValidator::validate(missing);
        FAIL() << "expected PathError";
    } catch (const PathError& ex) {
        EXPECT_EQ(ex.path(), missing);
        EXPECT_THAT(ex.what(), ::testing::HasSubstr(missing));
        EXPECT_THAT(ex.what(), ::testing::HasSubstr("not found"));
    }
}

TEST_F(PathValidatorTest, UnlistableDirectory) {
    if (geteuid() == 0) GTEST_SKIP() << "root bypasses directory permissions";
    fs::path locked = temp_dir / "locked";
    fs::create_directory(locked);
    ASSERT_EQ(chmod(locked.c_str(), 0), 0);
    EXPECT_EQ(reason_for(locked.string()), PathError::Reason::PermissionDenied);
}

}
