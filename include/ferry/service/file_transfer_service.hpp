#pragma once

#include "ferry/transfer/transfer_scheduler.hpp"
#include "ferry/transfer/transfer_history.hpp"
#include "ferry/transfer/schedule_timer.hpp"
#include "ferry/crypto/file_verifier.hpp"
#include "ferry/storage/history_store.hpp"
#include "ferry/storage/settings_store.hpp"
#include "ferry/p2p/negotiator.hpp"
#include "ferry/p2p/device_directory.hpp"
#include <filesystem>
#include <memory>
#include <vector>

namespace ferry::service {

struct ServiceOptions {
    std::filesystem::path database_path = "ferry.db";
    std::filesystem::path download_directory = "./downloads";
    p2p::Device local_device;
    bool start_timer = true;
    transfer::TransferScheduler::Clock clock;
};

// Wires scheduler, history, settings persistence and P2P negotiation together
class FileTransferService {
public:
    explicit FileTransferService(ServiceOptions options);
    ~FileTransferService();
    
    FileTransferService(const FileTransferService&) = delete;
    FileTransferService& operator=(const FileTransferService&) = delete;
    
    bool initialize();
    void shutdown();
    bool is_initialized() const { return scheduler_ != nullptr; }
    
    transfer::TransportRegistry& transports() { return transports_; }
    p2p::StaticDeviceDirectory& devices() { return directory_; }
    
    // Transfers
    core::Result enqueue(const transfer::TransferSpec& spec, transfer::TransferRecord& out);
    core::Result pause(const std::string& transfer_id);
    core::Result resume(const std::string& transfer_id);
    core::Result cancel(const std::string& transfer_id);
    core::Result retry(const std::string& transfer_id);
    core::Result remove(const std::string& transfer_id);
    std::size_t clear_completed();
    
    std::optional<transfer::TransferRecord> get_transfer(const std::string& transfer_id) const;
    std::vector<transfer::TransferRecord> get_transfers() const;
    std::vector<transfer::TransferRecord> get_active_transfers() const;
    std::vector<transfer::TransferRecord> get_queued_transfers() const;
    std::vector<transfer::TransferRecord> get_completed_transfers() const;
    
    // History
    std::vector<transfer::TransferHistoryEntry> get_history(std::size_t limit = 100) const;
    transfer::TransferStats get_stats() const;
    core::Result clear_history();
    
    // Settings
    transfer::TransferSettings get_settings() const;
    core::Result update_settings(const transfer::TransferSettings& settings);
    
    // P2P
    core::Result send_transfer_request(const std::string& device_id,
                                       const std::vector<p2p::FileManifestEntry>& files,
                                       p2p::P2PTransferRequest& out);
    core::Result receive_transfer_request(const std::string& from_device_id,
                                          const std::vector<p2p::FileManifestEntry>& files,
                                          p2p::P2PTransferRequest& out);
    std::vector<p2p::P2PTransferRequest> get_pending_requests() const;
    core::Result accept_request(const std::string& request_id);
    core::Result reject_request(const std::string& request_id);
    void trust_device(const std::string& device_id);
    void untrust_device(const std::string& device_id);
    std::vector<p2p::Device> get_devices() const;
    
    // One p2p upload per local file
    core::Result send_to_device(const std::string& device_id,
                                const std::vector<std::filesystem::path>& files,
                                std::vector<transfer::TransferRecord>& out);
    
    transfer::TransferScheduler& scheduler() { return *scheduler_; }
    p2p::P2PNegotiator& negotiator() { return *negotiator_; }
    
private:
    ServiceOptions options_;
    
    std::unique_ptr<storage::SettingsStore> settings_store_;
    std::unique_ptr<storage::HistoryStore> history_store_;
    transfer::HistoryLog history_;
    transfer::TransportRegistry transports_;
    p2p::StaticDeviceDirectory directory_;
    crypto::FileVerifier verifier_;
    
    std::unique_ptr<transfer::TransferScheduler> scheduler_;
    std::unique_ptr<p2p::P2PNegotiator> negotiator_;
    std::unique_ptr<transfer::ScheduleTimer> timer_;
    
    void on_request_accepted(const p2p::P2PTransferRequest& request);
    transfer::TimePoint now() const;
    core::Result not_initialized() const;
};

} // namespace ferry::service
