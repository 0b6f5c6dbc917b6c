#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

#include "PathValidator.h"

namespace fs = std::filesystem;
using namespace BlockSync;

class PathValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        baseDir_ = fs::temp_directory_path() / ("blocksync_path_" + std::to_string(::getpid()));
        root_ = baseDir_ / "root";
        fs::create_directories(root_ / "sub");
        std::ofstream(root_ / "sub" / "file.txt") << "x";
        std::ofstream(baseDir_ / "secret.txt") << "secret";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(baseDir_, ec);
    }

    fs::path baseDir_;
    fs::path root_;
};

TEST_F(PathValidatorTest, RelativePathResolvesUnderRoot) {
    auto resolved = PathValidator::resolve(root_, "sub/file.txt");
    ASSERT_TRUE(resolved.ok()) << resolved.error().message;
    EXPECT_EQ(*resolved, (root_ / "sub" / "file.txt").lexically_normal());
}

TEST_F(PathValidatorTest, LeadingSlashIsRelativeToRoot) {
    auto resolved = PathValidator::resolve(root_, "/sub/file.txt");
    ASSERT_TRUE(resolved.ok());
    EXPECT_EQ(*resolved, (root_ / "sub" / "file.txt").lexically_normal());
}

TEST_F(PathValidatorTest, NonexistentTargetAllowed) {
    auto resolved = PathValidator::resolve(root_, "sub/new.txt");
    ASSERT_TRUE(resolved.ok());
    EXPECT_FALSE(fs::exists(*resolved));
}

TEST_F(PathValidatorTest, InnerDotDotStaysInside) {
    auto resolved = PathValidator::resolve(root_, "sub/../sub/file.txt");
    ASSERT_TRUE(resolved.ok());
    EXPECT_EQ(*resolved, (root_ / "sub" / "file.txt").lexically_normal());
}

TEST_F(PathValidatorTest, DotDotEscapeRejected) {
    for (const char* path : {"../secret.txt", "sub/../../secret.txt", "/../secret.txt", ".."}) {
        auto resolved = PathValidator::resolve(root_, path);
        ASSERT_TRUE(resolved.isError()) << "accepted " << path;
        EXPECT_EQ(resolved.error().code, bsync::ErrorCode::PathOutsideRoot) << path;
    }
}

TEST_F(PathValidatorTest, SymlinkEscapeRejected) {
    fs::create_symlink(baseDir_, root_ / "link");
    auto resolved = PathValidator::resolve(root_, "link/secret.txt");
    ASSERT_TRUE(resolved.isError());
    EXPECT_EQ(resolved.error().code, bsync::ErrorCode::PathOutsideRoot);
}

TEST_F(PathValidatorTest, EmptyPathAndRootRejected) {
    for (const char* path : {"", "/", ".", "sub/.."}) {
        auto resolved = PathValidator::resolve(root_, path);
        ASSERT_TRUE(resolved.isError()) << "accepted '" << path << "'";
        EXPECT_EQ(resolved.error().code, bsync::ErrorCode::InvalidPath);
        EXPECT_EQ(resolved.error().kind(), bsync::ErrorKind::ProtocolError);
    }
}

TEST_F(PathValidatorTest, ForbiddenCharacters) {
    EXPECT_TRUE(PathValidator::containsForbiddenCharacters(std::string("a\0b", 3)));
    EXPECT_TRUE(PathValidator::containsForbiddenCharacters("\\\\server\\share"));
    EXPECT_TRUE(PathValidator::containsForbiddenCharacters("C:\\file"));
    EXPECT_FALSE(PathValidator::containsForbiddenCharacters("dir/file.txt"));
}
