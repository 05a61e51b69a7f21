#include <gtest/gtest.h>
#include "ferry/crypto/file_verifier.hpp"
#include "ferry/crypto/content_hasher.hpp"
#include <filesystem>
#include <cctype>
#include <fstream>

using namespace ferry::crypto;
using namespace ferry::transfer;

class FileVerifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = std::filesystem::temp_directory_path() / "ferry_verifier_test";
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
        
        content = std::string(3000, '\0');
        for (std::size_t i = 0; i < content.size(); ++i) {
            content[i] = static_cast<char>('a' + i % 26);
        }
        write(dir / "payload.txt", content);
    }
    
    void TearDown() override {
        std::filesystem::remove_all(dir);
    }
    
    static void write(const std::filesystem::path& path, const std::string& data) {
        std::ofstream file(path, std::ios::binary);
        file << data;
    }
    
    TransferRecord download_record() {
        TransferRecord record;
        record.direction = Direction::DOWNLOAD;
        record.source_path = "/remote/payload.txt";
        record.destination_path = (dir / "payload.txt").string();
        record.file_name = "payload.txt";
        record.total_size = content.size();
        record.transferred_bytes = content.size();
        return record;
    }
    
    std::string hex_of(const std::string& data) {
        return ContentHasher::hash_to_hex(ContentHasher::hash(data));
    }
    
    std::filesystem::path dir;
    std::string content;
    FileVerifier verifier;
};

TEST_F(FileVerifierTest, MatchesExpectedHash) {
    auto outcome = verifier.verify(download_record(), hex_of(content));
    
    EXPECT_TRUE(outcome.matched);
    EXPECT_EQ(outcome.computed_hash, hex_of(content));
    EXPECT_TRUE(outcome.corrupted_chunks.empty());
}

TEST_F(FileVerifierTest, ExpectedHashIsCaseInsensitive) {
    auto expected = hex_of(content);
    for (auto& c : expected) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    
    EXPECT_TRUE(verifier.verify(download_record(), expected).matched);
}

TEST_F(FileVerifierTest, MismatchReported) {
    auto outcome = verifier.verify(download_record(), hex_of("something else"));
    
    EXPECT_FALSE(outcome.matched);
    EXPECT_EQ(outcome.computed_hash, hex_of(content));
    EXPECT_EQ(outcome.detail, "content hash mismatch");
}

TEST_F(FileVerifierTest, NoExpectationStillComputesHash) {
    auto outcome = verifier.verify(download_record(), std::nullopt);
    
    EXPECT_TRUE(outcome.matched);
    EXPECT_EQ(outcome.computed_hash, hex_of(content));
}

TEST_F(FileVerifierTest, SizeMismatch) {
    auto record = download_record();
    record.total_size = 5000;
    
    auto outcome = verifier.verify(record, std::nullopt);
    EXPECT_FALSE(outcome.matched);
    EXPECT_NE(outcome.detail.find("size mismatch"), std::string::npos);
}

TEST_F(FileVerifierTest, MissingFile) {
    auto record = download_record();
    record.destination_path = (dir / "nope.txt").string();
    
    auto outcome = verifier.verify(record, std::nullopt);
    EXPECT_FALSE(outcome.matched);
    EXPECT_TRUE(outcome.computed_hash.empty());
}

TEST_F(FileVerifierTest, DirectoryDestinationUsesFileName) {
    auto record = download_record();
    record.destination_path = dir.string();
    
    EXPECT_EQ(FileVerifier::local_path(record), dir / "payload.txt");
    EXPECT_TRUE(verifier.verify(record, hex_of(content)).matched);
}

TEST_F(FileVerifierTest, UploadsVerifySource) {
    TransferRecord record;
    record.direction = Direction::UPLOAD;
    record.source_path = (dir / "payload.txt").string();
    record.destination_path = "p2p://phone-1/payload.txt";
    
    EXPECT_EQ(FileVerifier::local_path(record), dir / "payload.txt");
}

TEST_F(FileVerifierTest, CorruptedChunksLocated) {
    auto record = download_record();
    auto plan = ChunkPlan::build(content.size(), 1000);
    for (const auto& chunk : plan.chunks()) {
        plan.set_chunk_hash(chunk.index, hex_of(content.substr(chunk.start_offset, chunk.size())));
    }
    
    auto damaged = content;
    damaged[1500] = '#';
    write(dir / "payload.txt", damaged);
    record.chunks = plan;
    
    auto outcome = verifier.verify(record, std::nullopt);
    EXPECT_FALSE(outcome.matched);
    ASSERT_EQ(outcome.corrupted_chunks.size(), 1u);
    EXPECT_EQ(outcome.corrupted_chunks[0], 1u);
    EXPECT_EQ(outcome.detail, "1 corrupted chunks");
}

TEST_F(FileVerifierTest, ChunksWithoutHashesAreSkipped) {
    auto plan = ChunkPlan::build(content.size(), 1000);
    EXPECT_TRUE(FileVerifier::find_corrupted_chunks(dir / "payload.txt", plan).empty());
}
