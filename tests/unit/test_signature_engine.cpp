#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

#include "Checksum.h"
#include "SignatureEngine.h"

namespace fs = std::filesystem;
using namespace BlockSync;

class SignatureEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = fs::temp_directory_path() / ("blocksync_sig_" + std::to_string(::getpid()));
        fs::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(testDir_, ec);
    }

    fs::path createFile(const std::string& name, const std::string& content) {
        fs::path path = testDir_ / name;
        std::ofstream file(path, std::ios::binary);
        file << content;
        return path;
    }

    fs::path testDir_;
};

TEST_F(SignatureEngineTest, TwoFullBlocksOfSameByte) {
    std::string content(8192, 'A');
    auto path = createFile("a.bin", content);

    auto sigs = SignatureEngine::calculateSignature(path.string(), 4096);
    ASSERT_TRUE(sigs.ok()) << sigs.error().message;
    ASSERT_EQ(sigs->size(), 2u);

    std::string block(4096, 'A');
    auto expectedWeak = Checksum::adler32(reinterpret_cast<const uint8_t*>(block.data()), block.size());
    EXPECT_EQ((*sigs)[0].index, 0u);
    EXPECT_EQ((*sigs)[1].index, 1u);
    EXPECT_EQ((*sigs)[0].weak, expectedWeak);
    EXPECT_EQ((*sigs)[0].weak, (*sigs)[1].weak);
    EXPECT_EQ((*sigs)[0].strong, (*sigs)[1].strong);
    EXPECT_EQ((*sigs)[0].strong.size(), 64u);
}

TEST_F(SignatureEngineTest, ShortFinalBlock) {
    std::string content(10000, 'x');
    std::istringstream in(content);

    auto sigs = SignatureEngine::calculateSignature(in, 4096);
    ASSERT_TRUE(sigs.ok());
    ASSERT_EQ(sigs->size(), 3u);

    std::string tail(10000 - 2 * 4096, 'x');
    EXPECT_EQ((*sigs)[2].strong,
              Checksum::sha256Hex(reinterpret_cast<const uint8_t*>(tail.data()), tail.size()));
}

TEST_F(SignatureEngineTest, EmptyFileHasNoBlocks) {
    auto path = createFile("empty.bin", "");

    auto sigs = SignatureEngine::calculateSignature(path.string(), 4096);
    ASSERT_TRUE(sigs.ok());
    EXPECT_TRUE(sigs->empty());
}

TEST_F(SignatureEngineTest, Deterministic) {
    auto path = createFile("d.txt", "some content that spans more than one block of sixteen bytes");

    auto first = SignatureEngine::calculateSignature(path.string(), 16);
    auto second = SignatureEngine::calculateSignature(path.string(), 16);
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(*first, *second);
}

TEST_F(SignatureEngineTest, MissingFileIsIOError) {
    auto sigs = SignatureEngine::calculateSignature((testDir_ / "nope").string(), 4096);
    ASSERT_TRUE(sigs.isError());
    EXPECT_EQ(sigs.error().code, bsync::ErrorCode::FileNotFound);
    EXPECT_EQ(sigs.error().kind(), bsync::ErrorKind::IOError);
}

TEST_F(SignatureEngineTest, DirectoryIsIOError) {
    auto sigs = SignatureEngine::calculateSignature(testDir_.string(), 4096);
    ASSERT_TRUE(sigs.isError());
    EXPECT_EQ(sigs.error().kind(), bsync::ErrorKind::IOError);
}

TEST_F(SignatureEngineTest, ZeroBlockSizeRejected) {
    std::istringstream in("abc");
    auto sigs = SignatureEngine::calculateSignature(in, 0);
    ASSERT_TRUE(sigs.isError());
    EXPECT_EQ(sigs.error().code, bsync::ErrorCode::InvalidArgument);
}
