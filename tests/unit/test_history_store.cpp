#include <gtest/gtest.h>
#include "ferry/storage/history_store.hpp"
#include "ferry/transfer/transfer_history.hpp"
#include "ferry/core/utils.hpp"
#include <filesystem>

using namespace ferry::storage;
using namespace ferry::transfer;
using ferry::core::ErrorCode;
using ferry::core::utils::TimeUtils;
using namespace std::chrono_literals;

class HistoryStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_path = std::filesystem::temp_directory_path() / "ferry_test_history.db";
        std::filesystem::remove(db_path);
        base = TimeUtils::from_millis(1700000000000);
    }
    
    void TearDown() override {
        std::filesystem::remove(db_path);
    }
    
    TransferHistoryEntry make_entry(const std::string& id, TimePoint at, bool success = true) {
        TransferHistoryEntry entry;
        entry.id = id;
        entry.timestamp = at;
        entry.duration = 1500ms;
        entry.success = success;
        
        auto& t = entry.transfer;
        t.id = "transfer_" + id;
        t.protocol = Protocol::P2P;
        t.direction = Direction::UPLOAD;
        t.status = success ? TransferStatus::COMPLETED : TransferStatus::FAILED;
        t.source_path = "/home/me/" + id + ".zip";
        t.destination_path = "p2p://phone-1/" + id + ".zip";
        t.file_name = id + ".zip";
        t.total_size = 4096;
        t.transferred_bytes = success ? 4096 : 1024;
        t.average_speed = 2048.5;
        t.peak_speed = 4096.0;
        t.created_at = at - 10s;
        t.started_at = at - 5s;
        if (success) {
            t.completed_at = at;
            t.content_hash = "deadbeef";
            t.verified = true;
        } else {
            t.error = "connection reset";
        }
        t.retry_count = 2;
        t.device_id = "phone-1";
        t.priority = 3;
        return entry;
    }
    
    std::filesystem::path db_path;
    TimePoint base;
};

TEST_F(HistoryStoreTest, AppendAndLoadAllFields) {
    HistoryStore store(db_path);
    ASSERT_TRUE(store.initialize());
    
    auto entry = make_entry("one", base);
    ASSERT_TRUE(store.append(entry));
    
    std::vector<TransferHistoryEntry> loaded;
    ASSERT_TRUE(store.load(loaded));
    ASSERT_EQ(loaded.size(), 1u);
    
    const auto& e = loaded[0];
    EXPECT_EQ(e.id, "one");
    EXPECT_EQ(e.timestamp, base);
    EXPECT_EQ(e.duration, 1500ms);
    EXPECT_TRUE(e.success);
    EXPECT_EQ(e.transfer.id, "transfer_one");
    EXPECT_EQ(e.transfer.protocol, Protocol::P2P);
    EXPECT_EQ(e.transfer.direction, Direction::UPLOAD);
    EXPECT_EQ(e.transfer.status, TransferStatus::COMPLETED);
    EXPECT_EQ(e.transfer.file_name, "one.zip");
    EXPECT_EQ(e.transfer.total_size, 4096u);
    EXPECT_EQ(e.transfer.progress, 100);
    EXPECT_DOUBLE_EQ(e.transfer.average_speed, 2048.5);
    EXPECT_EQ(e.transfer.started_at, base - 5s);
    EXPECT_EQ(e.transfer.completed_at, base);
    EXPECT_FALSE(e.transfer.error.has_value());
    EXPECT_EQ(e.transfer.retry_count, 2u);
    EXPECT_FALSE(e.transfer.site_id.has_value());
    EXPECT_EQ(e.transfer.device_id, std::optional<std::string>("phone-1"));
    EXPECT_EQ(e.transfer.content_hash, std::optional<std::string>("deadbeef"));
    EXPECT_TRUE(e.transfer.verified);
    EXPECT_EQ(e.transfer.priority, 3);
}

TEST_F(HistoryStoreTest, FailedEntryKeepsError) {
    HistoryStore store(db_path);
    ASSERT_TRUE(store.initialize());
    ASSERT_TRUE(store.append(make_entry("bad", base, false)));
    
    std::vector<TransferHistoryEntry> loaded;
    ASSERT_TRUE(store.load(loaded));
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_FALSE(loaded[0].success);
    EXPECT_EQ(loaded[0].transfer.status, TransferStatus::FAILED);
    EXPECT_EQ(loaded[0].transfer.error, std::optional<std::string>("connection reset"));
    EXPECT_FALSE(loaded[0].transfer.completed_at.has_value());
}

TEST_F(HistoryStoreTest, NewestFirstWithLimit) {
    HistoryStore store(db_path);
    ASSERT_TRUE(store.initialize());
    ASSERT_TRUE(store.append(make_entry("a", base)));
    ASSERT_TRUE(store.append(make_entry("b", base + 1s)));
    ASSERT_TRUE(store.append(make_entry("c", base + 2s)));
    
    std::vector<TransferHistoryEntry> loaded;
    ASSERT_TRUE(store.load(loaded, 2));
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded[0].id, "c");
    EXPECT_EQ(loaded[1].id, "b");
    EXPECT_EQ(store.count(), 3u);
}

TEST_F(HistoryStoreTest, TrimKeepsNewest) {
    HistoryStore store(db_path);
    ASSERT_TRUE(store.initialize());
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(store.append(make_entry("e" + std::to_string(i), base + std::chrono::seconds(i))));
    }
    
    ASSERT_TRUE(store.trim(2));
    std::vector<TransferHistoryEntry> loaded;
    ASSERT_TRUE(store.load(loaded));
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded[0].id, "e4");
    EXPECT_EQ(loaded[1].id, "e3");
    
    // Zero means unbounded
    ASSERT_TRUE(store.trim(0));
    EXPECT_EQ(store.count(), 2u);
}

TEST_F(HistoryStoreTest, ClearAndReopen) {
    {
        HistoryStore store(db_path);
        ASSERT_TRUE(store.initialize());
        ASSERT_TRUE(store.append(make_entry("kept", base)));
    }
    
    HistoryStore reopened(db_path);
    ASSERT_TRUE(reopened.initialize());
    EXPECT_EQ(reopened.count(), 1u);
    
    ASSERT_TRUE(reopened.clear());
    EXPECT_EQ(reopened.count(), 0u);
}

TEST_F(HistoryStoreTest, HistoryLogWritesThrough) {
    HistoryStore store(db_path);
    ASSERT_TRUE(store.initialize());
    
    {
        HistoryLog log(2);
        log.attach_store(&store);
        for (int i = 0; i < 3; ++i) {
            log.append(make_entry("log" + std::to_string(i), base + std::chrono::seconds(i)));
        }
        EXPECT_EQ(log.size(), 2u);
    }
    EXPECT_EQ(store.count(), 2u);
    
    HistoryLog restored;
    restored.attach_store(&store);
    ASSERT_TRUE(restored.load_from_store());
    auto entries = restored.entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].id, "log2");
    
    ASSERT_TRUE(restored.clear());
    EXPECT_EQ(store.count(), 0u);
}

TEST_F(HistoryStoreTest, UninitializedStoreReportsError) {
    HistoryStore store(db_path);
    std::vector<TransferHistoryEntry> loaded;
    
    EXPECT_EQ(store.append(make_entry("x", base)).error, ErrorCode::STORAGE_ERROR);
    EXPECT_EQ(store.load(loaded).error, ErrorCode::STORAGE_ERROR);
    EXPECT_EQ(store.count(), 0u);
}
