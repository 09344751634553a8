#include <gtest/gtest.h>
#include <sync/content_hasher.hpp>
#include <sync/cancellation.hpp>
#include <core/errors.hpp>
#include <openssl/evp.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

constexpr const char* EMPTY_SHA256 = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
constexpr const char* ABC_SHA256   = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

// One-shot digest of an in-memory buffer
std::string buffer_sha256(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    EVP_Digest(data.data(), data.size(), digest, &len, EVP_sha256(), nullptr);
    std::string hex;
    char byte[3];
    for (unsigned int i = 0; i < len; ++i) {
        std::snprintf(byte, sizeof(byte), "%02x", digest[i]);
        hex += byte;
    }
    return hex;
}

} // namespace

class ContentHasherTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
            (std::string("gemindex_hash_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path write_file(const std::string& name, const std::string& content) {
        auto full = test_dir / name;
        std::ofstream(full, std::ios::binary) << content;
        return full;
    }
};

TEST_F(ContentHasherTest, KnownVectors) {
    CancellationToken token;
    EXPECT_EQ(sha256_file(write_file("empty.txt", ""), token), EMPTY_SHA256);
    EXPECT_EQ(sha256_file(write_file("abc.txt", "abc"), token), ABC_SHA256);
}

TEST_F(ContentHasherTest, LargeFileSpansChunks) {
    CancellationToken token;
    std::string big(200 * 1024 + 7, 'z');
    auto path = write_file("big.bin", big);
    EXPECT_EQ(sha256_file(path, token), buffer_sha256(big));
}

TEST_F(ContentHasherTest, CancelledTokenThrows) {
    CancellationToken token;
    auto path = write_file("a.txt", "data");
    token.cancel();
    EXPECT_THROW(sha256_file(path, token), CancelledError);
}

TEST_F(ContentHasherTest, MissingFileThrows) {
    CancellationToken token;
    EXPECT_THROW(sha256_file(test_dir / "missing.txt", token), std::runtime_error);
}

TEST_F(ContentHasherTest, ComputeHashesKeysByAbsolutePath) {
    CancellationToken token;
    auto a = write_file("a.txt", "abc");
    auto b = write_file("b.txt", "");

    std::vector<LocalFile> files = {
        {"a.txt", a.string(), 3},
        {"b.txt", b.string(), 0},
    };
    auto hashes = compute_hashes(files, token);
    ASSERT_EQ(hashes.size(), 2u);
    EXPECT_EQ(hashes[a.string()], ABC_SHA256);
    EXPECT_EQ(hashes[b.string()], EMPTY_SHA256);
}
