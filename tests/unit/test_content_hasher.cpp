#include <gtest/gtest.h>
#include "ferry/crypto/content_hasher.hpp"
#include <filesystem>
#include <cctype>
#include <fstream>

using namespace ferry::crypto;
using ferry::core::ErrorCode;

class ContentHasherTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(ContentHasher::ensure_sodium());
        test_file = std::filesystem::temp_directory_path() / "ferry_hash_test.bin";
    }
    
    void TearDown() override {
        std::filesystem::remove(test_file);
    }
    
    void write_file(const std::string& content) {
        std::ofstream file(test_file, std::ios::binary);
        file << content;
    }
    
    std::filesystem::path test_file;
};

TEST_F(ContentHasherTest, KnownDigestOfEmptyInput) {
    EXPECT_EQ(ContentHasher::hash_to_hex(ContentHasher::hash(std::string())),
              "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8");
}

TEST_F(ContentHasherTest, DeterministicAndSensitive) {
    auto a = ContentHasher::hash(std::string("ferry"));
    auto b = ContentHasher::hash(std::string("ferry"));
    auto c = ContentHasher::hash(std::string("ferrY"));
    
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(ContentHasher::hash_to_hex(a).size(), CONTENT_HASH_SIZE * 2);
}

TEST_F(ContentHasherTest, StreamingMatchesOneShot) {
    std::string data(200000, 'x');
    for (std::size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<char>(i % 251);
    }
    
    ContentHasher hasher;
    ASSERT_TRUE(hasher.initialize());
    auto bytes = reinterpret_cast<const std::uint8_t*>(data.data());
    ASSERT_TRUE(hasher.update(std::span<const std::uint8_t>(bytes, 1000)));
    ASSERT_TRUE(hasher.update(std::span<const std::uint8_t>(bytes + 1000, data.size() - 1000)));
    
    ContentHash streamed{};
    ASSERT_TRUE(hasher.finalize(streamed));
    EXPECT_EQ(streamed, ContentHasher::hash(data));
}

TEST_F(ContentHasherTest, FinalizeConsumesHasher) {
    ContentHasher hasher;
    ContentHash digest{};
    
    EXPECT_EQ(hasher.update(std::span<const std::uint8_t>()).error, ErrorCode::INVALID_TRANSITION);
    
    ASSERT_TRUE(hasher.initialize());
    ASSERT_TRUE(hasher.finalize(digest));
    EXPECT_EQ(hasher.finalize(digest).error, ErrorCode::INVALID_TRANSITION);
}

TEST_F(ContentHasherTest, FileMatchesString) {
    std::string content(150000, 'q');
    write_file(content);
    
    ContentHash digest{};
    ASSERT_TRUE(ContentHasher::hash_file(test_file, digest));
    EXPECT_EQ(digest, ContentHasher::hash(content));
}

TEST_F(ContentHasherTest, FileRange) {
    write_file("0123456789abcdef");
    
    ContentHash digest{};
    ASSERT_TRUE(ContentHasher::hash_file_range(test_file, 4, 6, digest));
    EXPECT_EQ(digest, ContentHasher::hash(std::string("456789")));
    
    EXPECT_EQ(ContentHasher::hash_file_range(test_file, 10, 100, digest).error, ErrorCode::INTEGRITY_ERROR);
}

TEST_F(ContentHasherTest, MissingFile) {
    ContentHash digest{};
    EXPECT_EQ(ContentHasher::hash_file(test_file, digest).error, ErrorCode::NOT_FOUND);
}

TEST_F(ContentHasherTest, HexConversion) {
    auto digest = ContentHasher::hash(std::string("hex"));
    auto hex = ContentHasher::hash_to_hex(digest);
    
    auto parsed = ContentHasher::hash_from_hex(hex);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, digest);
    
    std::string upper = hex;
    for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    EXPECT_EQ(ContentHasher::hash_from_hex(upper), digest);
    
    EXPECT_FALSE(ContentHasher::hash_from_hex("abcd").has_value());
    EXPECT_FALSE(ContentHasher::hash_from_hex(std::string(64, 'z')).has_value());
}
