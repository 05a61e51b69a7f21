#pragma once

#include "transfer_types.hpp"
#include "transfer_settings.hpp"
#include "transfer_channel.hpp"
#include "transfer_history.hpp"
#include "transport_backend.hpp"
#include "integrity_verifier.hpp"
#include "progress_meter.hpp"
#include "bandwidth_limiter.hpp"
#include "ferry/core/result.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ferry::transfer {

// Owns every TransferRecord and drives admission under max_concurrent.
// All mutation goes through this class; backends and verifiers are called
// with the lock released so they may call back synchronously.
class TransferScheduler {
public:
    using Clock = std::function<TimePoint()>;
    using StatusListener = std::function<void(const TransferRecord&)>;
    using SettingsPersister = std::function<core::Result(const TransferSettings&)>;

    TransferScheduler(const TransferSettings& settings,
                      TransportRegistry& transports,
                      HistoryLog& history,
                      IntegrityVerifier* verifier = nullptr,
                      Clock clock = {});
    ~TransferScheduler();

    TransferScheduler(const TransferScheduler&) = delete;
    TransferScheduler& operator=(const TransferScheduler&) = delete;

    // Transfer control
    core::Result enqueue(const TransferSpec& spec, TransferRecord& out);
    core::Result pause(const std::string& transfer_id);
    core::Result resume(const std::string& transfer_id);
    core::Result cancel(const std::string& transfer_id);
    core::Result retry(const std::string& transfer_id);
    core::Result remove(const std::string& transfer_id);
    std::size_t clear_completed();

    // Promotes elapsed pending records and fills free slots
    void poll();

    // Queries, ordered by priority then creation
    std::optional<TransferRecord> get_transfer(const std::string& transfer_id) const;
    std::vector<TransferRecord> get_transfers() const;
    std::vector<TransferRecord> get_active_transfers() const;
    std::vector<TransferRecord> get_queued_transfers() const;
    std::vector<TransferRecord> get_completed_transfers() const;

    std::size_t active_count() const;
    std::optional<TimePoint> next_scheduled_time() const;
    double current_global_speed() const;

    // Configuration
    TransferSettings get_settings() const;
    core::Result update_settings(const TransferSettings& settings);
    void set_settings_persister(SettingsPersister persister);
    void set_status_listener(StatusListener listener);

    BandwidthLimiter& bandwidth_limiter() { return limiter_; }

private:
    friend class TransferChannel;

    struct Entry {
        TransferRecord record;
        std::uint64_t generation = 0;
        std::shared_ptr<TransferChannel> channel;
        ProgressMeter meter;
        std::optional<std::string> remote_hash;
    };

    struct StartAction {
        TransportStart request;
        std::uint64_t generation;
        std::shared_ptr<TransferChannel> channel;
    };

    struct VerifyAction {
        TransferRecord record;
        std::uint64_t generation;
        std::optional<std::string> remote_hash;
    };

    // Side effects collected under the lock and run after it is released
    struct Actions {
        std::vector<std::shared_ptr<TransferChannel>> cancels;
        std::vector<std::pair<Protocol, std::string>> stops;
        std::vector<TransferRecord> notifications;
        std::vector<StartAction> starts;
        std::vector<VerifyAction> verifications;
        std::vector<std::pair<TransferRecord, TimePoint>> history;

        bool empty() const {
            return cancels.empty() && stops.empty() && notifications.empty() &&
                   starts.empty() && verifications.empty() && history.empty();
        }
    };

    // Channel callbacks
    void on_ready(const std::string& transfer_id, std::uint64_t generation);
    void on_progress(const std::string& transfer_id, std::uint64_t generation,
                     std::uint64_t bytes_transferred, double speed);
    void on_failure(const std::string& transfer_id, std::uint64_t generation, const std::string& message);
    void on_remote_hash(const std::string& transfer_id, std::uint64_t generation, const std::string& hex_hash);
    void on_chunk_hash(const std::string& transfer_id, std::uint64_t generation,
                       std::uint32_t chunk_index, const std::string& hex_hash);

    void on_start_failed(const std::string& transfer_id, std::uint64_t generation, const std::string& message);
    void on_verified(const std::string& transfer_id, std::uint64_t generation,
                     const VerificationOutcome& outcome, bool verified);

    // Lock held
    bool transition(Entry& entry, TransferStatus to, Actions& actions);
    void dispatch(Actions& actions);
    void promote_pending(TimePoint now, Actions& actions);
    void detach_channel(Entry& entry, Actions& actions);
    void finish_bytes(Entry& entry, Actions& actions);
    void fail_transport(Entry& entry, const std::string& message, Actions& actions);
    void requeue(Entry& entry, Actions& actions);
    void reset_for_retry(TransferRecord& record) const;
    void release_slot(Entry& entry);
    Entry* find_attempt(const std::string& transfer_id, std::uint64_t generation);
    std::vector<TransferRecord> collect(const std::function<bool(const TransferRecord&)>& filter) const;

    // Lock released
    void run(Actions actions);

    core::Result validate(const TransferSpec& spec) const;
    std::string generate_transfer_id();

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> transfers_;
    TransferSettings settings_;
    TransportRegistry& transports_;
    HistoryLog& history_;
    IntegrityVerifier* verifier_;
    Clock clock_;
    BandwidthLimiter limiter_;

    std::size_t active_count_ = 0;
    std::uint64_t next_sequence_ = 0;

    SettingsPersister persister_;
    StatusListener listener_;
};

} // namespace ferry::transfer
