#include <gtest/gtest.h>
#include "ferry/transfer/transfer_settings.hpp"
#include "ferry/core/config.hpp"

using namespace ferry::transfer;
using ferry::core::Config;
using ferry::core::ErrorCode;

TEST(TransferSettingsTest, Defaults) {
    TransferSettings settings;
    
    EXPECT_EQ(settings.default_protocol, Protocol::SFTP);
    EXPECT_EQ(settings.bandwidth_limit, 0u);
    EXPECT_EQ(settings.max_concurrent, 3u);
    EXPECT_TRUE(settings.enable_resume);
    EXPECT_EQ(settings.chunk_size, 10u * 1024 * 1024);
    EXPECT_TRUE(settings.verify_transfers);
    EXPECT_TRUE(settings.auto_retry);
    EXPECT_EQ(settings.max_retries, 3u);
    EXPECT_EQ(settings.overwrite_mode, OverwriteMode::NEWER);
    EXPECT_FALSE(settings.p2p_auto_accept_trusted);
    EXPECT_EQ(settings.history_limit, 0u);
    EXPECT_TRUE(settings.validate());
}

TEST(TransferSettingsTest, ValidateRejectsZeroConcurrency) {
    TransferSettings settings;
    settings.max_concurrent = 0;
    
    auto result = settings.validate();
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, ErrorCode::INVALID_ARGUMENT);
}

TEST(TransferSettingsTest, ValidateRejectsZeroChunkSize) {
    TransferSettings settings;
    settings.chunk_size = 0;
    EXPECT_FALSE(settings.validate());
}

TEST(TransferSettingsTest, StoreAndLoadThroughConfig) {
    TransferSettings settings;
    settings.default_protocol = Protocol::FTPS;
    settings.bandwidth_limit = 1048576;
    settings.max_concurrent = 5;
    settings.auto_retry = false;
    settings.overwrite_mode = OverwriteMode::ASK;
    settings.p2p_auto_accept_trusted = true;
    settings.history_limit = 500;
    
    Config config;
    settings.store(config);
    
    EXPECT_EQ(config.get_string("transfer.default_protocol"), "ftps");
    EXPECT_EQ(config.get_string("transfer.auto_retry"), "false");
    EXPECT_EQ(config.keys().size(), TransferSettings::keys().size());
    
    EXPECT_EQ(TransferSettings::from_config(config), settings);
}

TEST(TransferSettingsTest, FromConfigKeepsDefaultsForBadValues) {
    Config config;
    config.set("transfer.max_concurrent", "0");
    config.set("transfer.chunk_size", "lots");
    config.set("transfer.default_protocol", "gopher");
    config.set("transfer.max_retries", "7");
    
    auto settings = TransferSettings::from_config(config);
    EXPECT_EQ(settings.max_concurrent, 3u);
    EXPECT_EQ(settings.chunk_size, ChunkPlan::DEFAULT_CHUNK_SIZE);
    EXPECT_EQ(settings.default_protocol, Protocol::SFTP);
    EXPECT_EQ(settings.max_retries, 7u);
}

TEST(TransferSettingsTest, ApplySingleKey) {
    TransferSettings settings;
    
    EXPECT_TRUE(settings.apply("transfer.max_concurrent", "8"));
    EXPECT_EQ(settings.max_concurrent, 8u);
    
    EXPECT_TRUE(settings.apply("transfer.verify_transfers", "no"));
    EXPECT_FALSE(settings.verify_transfers);
    
    EXPECT_TRUE(settings.apply("transfer.overwrite_mode", "always"));
    EXPECT_EQ(settings.overwrite_mode, OverwriteMode::ALWAYS);
    
    EXPECT_TRUE(settings.apply("notify.sound_on_complete", "0"));
    EXPECT_FALSE(settings.sound_on_complete);
}

TEST(TransferSettingsTest, ApplyRejectsUnknownKey) {
    TransferSettings settings;
    auto result = settings.apply("transfer.warp_speed", "true");
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, ErrorCode::INVALID_ARGUMENT);
}

TEST(TransferSettingsTest, ApplyRejectsMalformedValues) {
    TransferSettings settings;
    
    EXPECT_FALSE(settings.apply("transfer.bandwidth_limit", "-1"));
    EXPECT_FALSE(settings.apply("transfer.max_retries", "99999999999"));
    EXPECT_FALSE(settings.apply("transfer.enable_resume", "maybe"));
    EXPECT_FALSE(settings.apply("transfer.overwrite_mode", "sometimes"));
    EXPECT_EQ(settings, TransferSettings());
}

TEST(TransferSettingsTest, OverwriteModeNames) {
    EXPECT_EQ(to_string(OverwriteMode::NEVER), "never");
    EXPECT_EQ(parse_overwrite_mode("newer"), OverwriteMode::NEWER);
    EXPECT_FALSE(parse_overwrite_mode("NEWER").has_value());
}
