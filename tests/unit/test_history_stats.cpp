#include <gtest/gtest.h>
#include "ferry/transfer/transfer_history.hpp"

using namespace ferry::transfer;
using namespace std::chrono_literals;

class HistoryStatsTest : public ::testing::Test {
protected:
    void SetUp() override {
        now = std::chrono::system_clock::now();
    }
    
    TransferRecord finished(const std::string& name, std::uint64_t size, TransferStatus status,
                            Direction direction = Direction::DOWNLOAD) {
        TransferRecord record;
        record.id = "transfer_" + name;
        record.protocol = Protocol::SFTP;
        record.direction = direction;
        record.status = status;
        record.file_name = name;
        record.source_path = "/remote/" + name;
        record.destination_path = "/local/" + name;
        record.total_size = size;
        record.transferred_bytes = status == TransferStatus::COMPLETED ? size : 0;
        return record;
    }
    
    void add(HistoryLog& log, const TransferRecord& record, TimePoint at) {
        log.record(record, at);
    }
    
    TimePoint now;
};

TEST_F(HistoryStatsTest, RecordBuildsEntry) {
    HistoryLog log;
    auto record = finished("movie.mkv", 1000, TransferStatus::COMPLETED);
    record.started_at = now - 90s;
    record.completed_at = now - 30s;
    record.chunks = ChunkPlan::build(1000, 100);
    
    auto entry = log.record(record, now);
    
    EXPECT_TRUE(entry.id.rfind("hist_", 0) == 0);
    EXPECT_TRUE(entry.success);
    EXPECT_EQ(entry.timestamp, now);
    EXPECT_EQ(entry.duration, std::chrono::milliseconds(60000));
    EXPECT_FALSE(entry.transfer.chunks.has_value());
    EXPECT_EQ(log.size(), 1u);
}

TEST_F(HistoryStatsTest, DurationZeroWhenNeverStarted) {
    HistoryLog log;
    auto entry = log.record(finished("queued.txt", 10, TransferStatus::CANCELLED), now);
    
    EXPECT_FALSE(entry.success);
    EXPECT_EQ(entry.duration.count(), 0);
}

TEST_F(HistoryStatsTest, DurationRunsToNowWhenNotCompleted) {
    HistoryLog log;
    auto record = finished("broken.bin", 10, TransferStatus::FAILED);
    record.started_at = now - 5s;
    
    EXPECT_EQ(log.record(record, now).duration, std::chrono::milliseconds(5000));
}

TEST_F(HistoryStatsTest, NewestFirstAndLimit) {
    HistoryLog log;
    add(log, finished("a.txt", 1, TransferStatus::COMPLETED), now - 2s);
    add(log, finished("b.txt", 1, TransferStatus::COMPLETED), now - 1s);
    add(log, finished("c.txt", 1, TransferStatus::COMPLETED), now);
    
    auto entries = log.entries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].transfer.file_name, "c.txt");
    EXPECT_EQ(entries[2].transfer.file_name, "a.txt");
    
    EXPECT_EQ(log.entries(2).size(), 2u);
}

TEST_F(HistoryStatsTest, BoundedHistoryDropsOldest) {
    HistoryLog log(2);
    add(log, finished("a.txt", 1, TransferStatus::COMPLETED), now - 2s);
    add(log, finished("b.txt", 1, TransferStatus::COMPLETED), now - 1s);
    add(log, finished("c.txt", 1, TransferStatus::COMPLETED), now);
    
    auto entries = log.entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[1].transfer.file_name, "b.txt");
    
    log.set_limit(1);
    EXPECT_EQ(log.size(), 1u);
    EXPECT_EQ(log.entries()[0].transfer.file_name, "c.txt");
}

TEST_F(HistoryStatsTest, ClearWithoutStore) {
    HistoryLog log;
    add(log, finished("a.txt", 1, TransferStatus::COMPLETED), now);
    
    EXPECT_TRUE(log.clear());
    EXPECT_EQ(log.size(), 0u);
    EXPECT_FALSE(log.load_from_store());
}

TEST_F(HistoryStatsTest, TimeWindows) {
    HistoryLog log;
    add(log, finished("today.bin", 100, TransferStatus::COMPLETED), now);
    add(log, finished("week.bin", 200, TransferStatus::COMPLETED), now - 72h);
    add(log, finished("month.bin", 400, TransferStatus::COMPLETED), now - 24h * 10);
    add(log, finished("old.bin", 800, TransferStatus::COMPLETED), now - 24h * 40);
    add(log, finished("failed.bin", 5000, TransferStatus::FAILED), now);
    
    auto stats = log.stats(now);
    EXPECT_EQ(stats.today_transferred, 100u);
    EXPECT_EQ(stats.week_transferred, 300u);
    EXPECT_EQ(stats.month_transferred, 700u);
    EXPECT_EQ(stats.all_time_transferred, 1500u);
    EXPECT_EQ(stats.failed_count, 1u);
    EXPECT_EQ(stats.downloads_count, 4u);
    EXPECT_EQ(stats.uploads_count, 0u);
}

TEST_F(HistoryStatsTest, DirectionCounts) {
    HistoryLog log;
    add(log, finished("up.txt", 1, TransferStatus::COMPLETED, Direction::UPLOAD), now);
    add(log, finished("up2.txt", 1, TransferStatus::COMPLETED, Direction::UPLOAD), now);
    add(log, finished("sync.txt", 1, TransferStatus::COMPLETED, Direction::SYNC), now);
    add(log, finished("down.txt", 1, TransferStatus::CANCELLED), now);
    
    auto stats = log.stats(now);
    EXPECT_EQ(stats.uploads_count, 2u);
    EXPECT_EQ(stats.downloads_count, 0u);
    EXPECT_EQ(stats.failed_count, 1u);
}

TEST_F(HistoryStatsTest, SpeedAggregates) {
    HistoryLog log;
    auto fast = finished("fast.bin", 10, TransferStatus::COMPLETED);
    fast.average_speed = 300.0;
    fast.peak_speed = 900.0;
    auto slow = finished("slow.bin", 10, TransferStatus::FAILED);
    slow.average_speed = 100.0;
    slow.peak_speed = 200.0;
    add(log, fast, now);
    add(log, slow, now);
    
    auto stats = log.stats(now);
    EXPECT_DOUBLE_EQ(stats.average_speed, 200.0);
    EXPECT_DOUBLE_EQ(stats.peak_speed, 900.0);
}

TEST_F(HistoryStatsTest, TopDestinations) {
    HistoryLog log;
    for (int i = 0; i < 7; ++i) {
        auto record = finished("f" + std::to_string(i) + ".txt", 10, TransferStatus::COMPLETED);
        record.site_id = "site-" + std::to_string(i);
        for (int n = 0; n <= i; ++n) {
            add(log, record, now);
        }
    }
    
    auto stats = log.stats(now);
    ASSERT_EQ(stats.top_destinations.size(), HistoryLog::TOP_DESTINATIONS);
    EXPECT_EQ(stats.top_destinations[0].name, "site-6");
    EXPECT_EQ(stats.top_destinations[0].count, 7u);
    EXPECT_EQ(stats.top_destinations[0].bytes, 70u);
    EXPECT_EQ(stats.top_destinations[4].name, "site-2");
}

TEST_F(HistoryStatsTest, DestinationNames) {
    TransferRecord record;
    record.destination_path = "/backup/file";
    EXPECT_EQ(HistoryLog::destination_name(record), "/backup/file");
    
    record.site_id = "nas";
    EXPECT_EQ(HistoryLog::destination_name(record), "nas");
    
    record.protocol = Protocol::P2P;
    record.device_id = "phone-1";
    EXPECT_EQ(HistoryLog::destination_name(record), "phone-1");
}

TEST_F(HistoryStatsTest, FileTypeBreakdown) {
    HistoryLog log;
    add(log, finished("a.JPG", 10, TransferStatus::COMPLETED), now);
    add(log, finished("b.png", 20, TransferStatus::COMPLETED), now);
    add(log, finished("c.pdf", 5, TransferStatus::COMPLETED), now);
    add(log, finished("Makefile", 1, TransferStatus::COMPLETED), now);
    
    auto stats = log.stats(now);
    ASSERT_EQ(stats.file_types.size(), 3u);
    EXPECT_EQ(stats.file_types[0].name, "image");
    EXPECT_EQ(stats.file_types[0].count, 2u);
    EXPECT_EQ(stats.file_types[0].bytes, 30u);
}

TEST_F(HistoryStatsTest, FileCategories) {
    EXPECT_EQ(HistoryLog::file_category("report.docx"), "document");
    EXPECT_EQ(HistoryLog::file_category("budget.xlsx"), "spreadsheet");
    EXPECT_EQ(HistoryLog::file_category("deck.pptx"), "presentation");
    EXPECT_EQ(HistoryLog::file_category("clip.MOV"), "video");
    EXPECT_EQ(HistoryLog::file_category("song.flac"), "audio");
    EXPECT_EQ(HistoryLog::file_category("backup.tar.gz"), "archive");
    EXPECT_EQ(HistoryLog::file_category("main.cpp"), "code");
    EXPECT_EQ(HistoryLog::file_category("README"), "other");
    EXPECT_EQ(HistoryLog::file_category("data.xyz"), "other");
}

TEST_F(HistoryStatsTest, EmptyHistory) {
    HistoryLog log;
    auto stats = log.stats(now);
    
    EXPECT_EQ(stats.all_time_transferred, 0u);
    EXPECT_DOUBLE_EQ(stats.average_speed, 0.0);
    EXPECT_TRUE(stats.top_destinations.empty());
    EXPECT_TRUE(stats.file_types.empty());
}
