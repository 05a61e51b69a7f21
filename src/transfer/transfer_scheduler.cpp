#include "ferry/transfer/transfer_scheduler.hpp"
#include "ferry/core/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <limits>
#include <random>
#include <sstream>

namespace ferry::transfer {

namespace {

bool dispatch_before(const TransferRecord& a, const TransferRecord& b) {
    if (a.priority != b.priority) {
        return a.priority > b.priority;
    }
    return a.sequence < b.sequence;
}

} // namespace

TransferScheduler::TransferScheduler(const TransferSettings& settings,
                                     TransportRegistry& transports,
                                     HistoryLog& history,
                                     IntegrityVerifier* verifier,
                                     Clock clock)
    : settings_(settings)
    , transports_(transports)
    , history_(history)
    , verifier_(verifier)
    , clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); }))
    , limiter_(settings.bandwidth_limit)
{
    history_.set_limit(settings_.history_limit);
}

TransferScheduler::~TransferScheduler() {
    std::vector<std::shared_ptr<TransferChannel>> channels;
    std::vector<std::pair<Protocol, std::string>> stops;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, entry] : transfers_) {
            if (entry.channel) {
                channels.push_back(std::move(entry.channel));
                stops.emplace_back(entry.record.protocol, id);
            }
        }
    }

    // Waits for any callback already inside a channel to finish
    for (auto& channel : channels) {
        channel->cancel();
    }
    for (const auto& [protocol, id] : stops) {
        if (auto backend = transports_.find(protocol)) {
            backend->stop(id);
        }
    }
}

core::Result TransferScheduler::enqueue(const TransferSpec& spec, TransferRecord& out) {
    auto valid = validate(spec);
    if (!valid) {
        return valid;
    }

    Actions actions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = clock_();

        Entry entry;
        auto& record = entry.record;
        record.id = generate_transfer_id();
        record.protocol = spec.protocol;
        record.direction = spec.direction;
        record.status = TransferStatus::PENDING;
        record.source_path = spec.source_path;
        record.destination_path = spec.destination_path;
        record.file_name = spec.file_name.empty()
            ? std::filesystem::path(spec.source_path).filename().string()
            : spec.file_name;
        record.total_size = spec.total_size;
        record.eta = std::numeric_limits<double>::infinity();
        record.created_at = now;
        record.site_id = spec.site_id;
        record.device_id = spec.device_id;
        record.content_hash = spec.content_hash;
        record.priority = spec.priority;
        record.scheduled_at = spec.scheduled_at;
        record.sequence = next_sequence_++;

        if (settings_.enable_resume && spec.total_size > settings_.chunk_size) {
            record.chunks = ChunkPlan::build(spec.total_size, settings_.chunk_size);
        }

        auto id = record.id;
        auto it = transfers_.emplace(id, std::move(entry)).first;
        auto& stored = it->second;

        if (!stored.record.scheduled_at || *stored.record.scheduled_at <= now) {
            transition(stored, TransferStatus::QUEUED, actions);
        } else {
            actions.notifications.push_back(stored.record);
        }

        LOG_INFO("Enqueued transfer {} ({} {} via {}, {} bytes, priority {})",
                 stored.record.id, to_string(stored.record.direction), stored.record.file_name,
                 to_string(stored.record.protocol), stored.record.total_size, stored.record.priority);

        out = stored.record;
        dispatch(actions);
    }

    run(std::move(actions));
    return core::Result::ok();
}

core::Result TransferScheduler::pause(const std::string& transfer_id) {
    Actions actions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = transfers_.find(transfer_id);
        if (it == transfers_.end()) {
            return core::Result(core::ErrorCode::NOT_FOUND, "Transfer not found: " + transfer_id);
        }

        auto& entry = it->second;
        if (entry.record.status != TransferStatus::TRANSFERRING) {
            return core::Result(core::ErrorCode::INVALID_TRANSITION,
                                "Cannot pause transfer in " + std::string(to_string(entry.record.status)) + " state");
        }

        entry.meter.stop(clock_());
        entry.record.current_speed = 0.0;
        entry.record.eta = std::numeric_limits<double>::infinity();
        detach_channel(entry, actions);
        transition(entry, TransferStatus::PAUSED, actions);
        LOG_INFO("Paused transfer {} at {} of {} bytes",
                 transfer_id, entry.record.transferred_bytes, entry.record.total_size);

        dispatch(actions);
    }

    run(std::move(actions));
    return core::Result::ok();
}

core::Result TransferScheduler::resume(const std::string& transfer_id) {
    Actions actions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = transfers_.find(transfer_id);
        if (it == transfers_.end()) {
            return core::Result(core::ErrorCode::NOT_FOUND, "Transfer not found: " + transfer_id);
        }

        auto& entry = it->second;
        if (entry.record.status != TransferStatus::PAUSED) {
            return core::Result(core::ErrorCode::INVALID_TRANSITION,
                                "Cannot resume transfer in " + std::string(to_string(entry.record.status)) + " state");
        }

        transition(entry, TransferStatus::QUEUED, actions);
        LOG_INFO("Resumed transfer {}", transfer_id);

        dispatch(actions);
    }

    run(std::move(actions));
    return core::Result::ok();
}

core::Result TransferScheduler::cancel(const std::string& transfer_id) {
    Actions actions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = transfers_.find(transfer_id);
        if (it == transfers_.end()) {
            return core::Result(core::ErrorCode::NOT_FOUND, "Transfer not found: " + transfer_id);
        }

        auto& entry = it->second;
        if (is_finished_status(entry.record.status)) {
            return core::Result(core::ErrorCode::INVALID_TRANSITION,
                                "Cannot cancel transfer in " + std::string(to_string(entry.record.status)) + " state");
        }

        entry.meter.stop(clock_());
        entry.record.current_speed = 0.0;
        entry.record.eta = std::numeric_limits<double>::infinity();
        detach_channel(entry, actions);
        transition(entry, TransferStatus::CANCELLED, actions);
        LOG_INFO("Cancelled transfer {}", transfer_id);

        dispatch(actions);
    }

    run(std::move(actions));
    return core::Result::ok();
}

core::Result TransferScheduler::retry(const std::string& transfer_id) {
    Actions actions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = transfers_.find(transfer_id);
        if (it == transfers_.end()) {
            return core::Result(core::ErrorCode::NOT_FOUND, "Transfer not found: " + transfer_id);
        }

        auto& entry = it->second;
        if (entry.record.status != TransferStatus::FAILED &&
            entry.record.status != TransferStatus::CANCELLED) {
            return core::Result(core::ErrorCode::INVALID_TRANSITION,
                                "Cannot retry transfer in " + std::string(to_string(entry.record.status)) + " state");
        }

        requeue(entry, actions);
        LOG_INFO("Retrying transfer {} (attempt {}) from byte {}",
                 transfer_id, entry.record.retry_count, entry.record.transferred_bytes);

        dispatch(actions);
    }

    run(std::move(actions));
    return core::Result::ok();
}

core::Result TransferScheduler::remove(const std::string& transfer_id) {
    Actions actions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = transfers_.find(transfer_id);
        if (it == transfers_.end()) {
            return core::Result(core::ErrorCode::NOT_FOUND, "Transfer not found: " + transfer_id);
        }

        auto& entry = it->second;
        detach_channel(entry, actions);
        release_slot(entry);
        transfers_.erase(it);
        LOG_INFO("Removed transfer {}", transfer_id);

        dispatch(actions);
    }

    run(std::move(actions));
    return core::Result::ok();
}

std::size_t TransferScheduler::clear_completed() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::size_t removed = 0;
    for (auto it = transfers_.begin(); it != transfers_.end();) {
        if (it->second.record.status == TransferStatus::COMPLETED) {
            it = transfers_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        LOG_DEBUG("Cleared {} completed transfers", removed);
    }
    return removed;
}

void TransferScheduler::poll() {
    Actions actions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dispatch(actions);
    }
    run(std::move(actions));
}

std::optional<TransferRecord> TransferScheduler::get_transfer(const std::string& transfer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(transfer_id);
    if (it == transfers_.end()) {
        return std::nullopt;
    }
    return it->second.record;
}

std::vector<TransferRecord> TransferScheduler::get_transfers() const {
    return collect([](const TransferRecord&) { return true; });
}

std::vector<TransferRecord> TransferScheduler::get_active_transfers() const {
    return collect([](const TransferRecord& record) { return is_active_status(record.status); });
}

std::vector<TransferRecord> TransferScheduler::get_queued_transfers() const {
    return collect([](const TransferRecord& record) {
        return record.status == TransferStatus::QUEUED || record.status == TransferStatus::PENDING;
    });
}

std::vector<TransferRecord> TransferScheduler::get_completed_transfers() const {
    return collect([](const TransferRecord& record) { return record.status == TransferStatus::COMPLETED; });
}

std::size_t TransferScheduler::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_count_;
}

std::optional<TimePoint> TransferScheduler::next_scheduled_time() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::optional<TimePoint> next;
    for (const auto& [id, entry] : transfers_) {
        const auto& record = entry.record;
        if (record.status != TransferStatus::PENDING && record.status != TransferStatus::QUEUED) {
            continue;
        }
        if (record.scheduled_at && (!next || *record.scheduled_at < *next)) {
            next = record.scheduled_at;
        }
    }
    return next;
}

double TransferScheduler::current_global_speed() const {
    std::lock_guard<std::mutex> lock(mutex_);

    double total = 0.0;
    for (const auto& [id, entry] : transfers_) {
        if (entry.record.status == TransferStatus::TRANSFERRING) {
            total += entry.record.current_speed;
        }
    }
    return total;
}

TransferSettings TransferScheduler::get_settings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

core::Result TransferScheduler::update_settings(const TransferSettings& settings) {
    auto valid = settings.validate();
    if (!valid) {
        return valid;
    }

    Actions actions;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (persister_) {
            auto persisted = persister_(settings);
            if (!persisted) {
                LOG_ERROR("Failed to persist transfer settings: {}", persisted.message);
                return persisted;
            }
        }

        settings_ = settings;
        limiter_.set_max_bandwidth(settings_.bandwidth_limit);
        history_.set_limit(settings_.history_limit);
        LOG_INFO("Transfer settings updated (max_concurrent={}, bandwidth_limit={})",
                 settings_.max_concurrent, settings_.bandwidth_limit);

        // A lowered ceiling never preempts running transfers
        dispatch(actions);
    }

    run(std::move(actions));
    return core::Result::ok();
}

void TransferScheduler::set_settings_persister(SettingsPersister persister) {
    std::lock_guard<std::mutex> lock(mutex_);
    persister_ = std::move(persister);
}

void TransferScheduler::set_status_listener(StatusListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

void TransferScheduler::on_ready(const std::string& transfer_id, std::uint64_t generation) {
    Actions actions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto* entry = find_attempt(transfer_id, generation);
        if (!entry || entry->record.status != TransferStatus::CONNECTING) {
            return;
        }

        transition(*entry, TransferStatus::TRANSFERRING, actions);
        entry->meter.start(clock_());

        if (entry->record.transferred_bytes >= entry->record.total_size) {
            finish_bytes(*entry, actions);
        }
        dispatch(actions);
    }
    run(std::move(actions));
}

void TransferScheduler::on_progress(const std::string& transfer_id, std::uint64_t generation,
                                    std::uint64_t bytes_transferred, double speed) {
    Actions actions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto* entry = find_attempt(transfer_id, generation);
        if (!entry || entry->record.status != TransferStatus::TRANSFERRING) {
            LOG_TRACE("Discarding progress tick for {}", transfer_id);
            return;
        }

        auto& record = entry->record;
        auto bytes = std::min(bytes_transferred, record.total_size);
        if (bytes < record.transferred_bytes) {
            return;
        }

        auto now = clock_();
        entry->meter.record(now, bytes - record.transferred_bytes, speed);

        record.transferred_bytes = bytes;
        if (record.chunks) {
            record.chunks->mark_completed_through(bytes);
        }
        record.current_speed = entry->meter.current_speed();
        record.average_speed = entry->meter.average_speed();
        record.peak_speed = std::max(record.peak_speed, entry->meter.peak_speed());
        record.eta = entry->meter.eta(record.remaining_bytes());
        record.update_progress();

        if (record.transferred_bytes >= record.total_size) {
            finish_bytes(*entry, actions);
            dispatch(actions);
        }
    }
    run(std::move(actions));
}

void TransferScheduler::on_failure(const std::string& transfer_id, std::uint64_t generation,
                                   const std::string& message) {
    Actions actions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto* entry = find_attempt(transfer_id, generation);
        if (!entry) {
            return;
        }

        if (!is_active_status(entry->record.status)) {
            return;
        }

        fail_transport(*entry, message, actions);
        dispatch(actions);
    }
    run(std::move(actions));
}

void TransferScheduler::on_remote_hash(const std::string& transfer_id, std::uint64_t generation,
                                       const std::string& hex_hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* entry = find_attempt(transfer_id, generation);
    if (entry && is_active_status(entry->record.status)) {
        entry->remote_hash = hex_hash;
    }
}

void TransferScheduler::on_chunk_hash(const std::string& transfer_id, std::uint64_t generation,
                                      std::uint32_t chunk_index, const std::string& hex_hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* entry = find_attempt(transfer_id, generation);
    if (!entry || !entry->record.chunks) {
        return;
    }
    if (!entry->record.chunks->set_chunk_hash(chunk_index, hex_hash)) {
        LOG_WARN("Transfer {} reported hash for unknown chunk {}", transfer_id, chunk_index);
    }
}

void TransferScheduler::on_start_failed(const std::string& transfer_id, std::uint64_t generation,
                                        const std::string& message) {
    Actions actions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto* entry = find_attempt(transfer_id, generation);
        if (!entry || entry->record.status != TransferStatus::CONNECTING) {
            return;
        }

        fail_transport(*entry, message, actions);
        dispatch(actions);
    }
    run(std::move(actions));
}

void TransferScheduler::on_verified(const std::string& transfer_id, std::uint64_t generation,
                                    const VerificationOutcome& outcome, bool verified) {
    Actions actions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto* entry = find_attempt(transfer_id, generation);
        if (!entry || entry->record.status != TransferStatus::VERIFYING) {
            return;
        }

        detach_channel(*entry, actions);

        auto& record = entry->record;
        if (outcome.matched) {
            record.verified = verified;
            if (!outcome.computed_hash.empty()) {
                record.content_hash = outcome.computed_hash;
            }
            transition(*entry, TransferStatus::COMPLETED, actions);
            LOG_INFO("Transfer {} completed ({} bytes{})", transfer_id, record.total_size,
                     record.verified ? ", verified" : "");
        } else {
            record.verified = false;
            record.error = "integrity verification failed";
            if (record.chunks) {
                if (outcome.corrupted_chunks.empty()) {
                    record.chunks->reset_all();
                } else {
                    record.chunks->mark_incomplete(outcome.corrupted_chunks);
                }
            }
            transition(*entry, TransferStatus::FAILED, actions);
            LOG_WARN("Transfer {} failed integrity verification{}{}", transfer_id,
                     outcome.detail.empty() ? "" : ": ", outcome.detail);
        }

        dispatch(actions);
    }
    run(std::move(actions));
}

bool TransferScheduler::transition(Entry& entry, TransferStatus to, Actions& actions) {
    auto& record = entry.record;
    auto from = record.status;

    if (!can_transition(from, to)) {
        LOG_ERROR("Rejected transition {} -> {} for transfer {}", to_string(from), to_string(to), record.id);
        return false;
    }

    bool was_active = is_active_status(from);
    bool now_active = is_active_status(to);
    if (was_active && !now_active) {
        active_count_--;
    } else if (!was_active && now_active) {
        active_count_++;
    }

    record.status = to;
    LOG_DEBUG("Transfer {}: {} -> {} (active {})", record.id, to_string(from), to_string(to), active_count_);

    auto now = clock_();
    if (to == TransferStatus::COMPLETED) {
        record.completed_at = now;
        record.eta = 0.0;
        record.update_progress();
    }
    if (is_finished_status(to)) {
        actions.history.emplace_back(record, now);
    }

    actions.notifications.push_back(record);
    return true;
}

void TransferScheduler::dispatch(Actions& actions) {
    auto now = clock_();
    promote_pending(now, actions);

    while (active_count_ < settings_.max_concurrent) {
        Entry* next = nullptr;
        for (auto& [id, entry] : transfers_) {
            const auto& record = entry.record;
            if (record.status != TransferStatus::QUEUED) {
                continue;
            }
            if (record.scheduled_at && *record.scheduled_at > now) {
                continue;
            }
            if (!next || dispatch_before(record, next->record)) {
                next = &entry;
            }
        }

        if (!next) {
            break;
        }

        auto& record = next->record;
        transition(*next, TransferStatus::CONNECTING, actions);
        if (!record.started_at) {
            record.started_at = now;
        }

        next->generation++;
        next->remote_hash.reset();
        next->channel = std::make_shared<TransferChannel>(this, &limiter_, record.id, next->generation);

        StartAction start;
        start.request.record = record;
        start.request.resume_offset = record.transferred_bytes;
        start.request.settings = settings_;
        start.generation = next->generation;
        start.channel = next->channel;
        actions.starts.push_back(std::move(start));

        LOG_INFO("Dispatching transfer {} via {} from byte {}",
                 record.id, to_string(record.protocol), record.transferred_bytes);
    }
}

void TransferScheduler::promote_pending(TimePoint now, Actions& actions) {
    for (auto& [id, entry] : transfers_) {
        const auto& record = entry.record;
        if (record.status != TransferStatus::PENDING) {
            continue;
        }
        if (!record.scheduled_at || *record.scheduled_at <= now) {
            transition(entry, TransferStatus::QUEUED, actions);
        }
    }
}

void TransferScheduler::detach_channel(Entry& entry, Actions& actions) {
    if (!entry.channel) {
        return;
    }
    actions.cancels.push_back(std::move(entry.channel));
    actions.stops.emplace_back(entry.record.protocol, entry.record.id);
    entry.channel.reset();
}

void TransferScheduler::finish_bytes(Entry& entry, Actions& actions) {
    auto& record = entry.record;
    entry.meter.stop(clock_());
    record.current_speed = 0.0;
    record.eta = 0.0;
    if (record.chunks) {
        record.chunks->mark_completed_through(record.transferred_bytes);
    }

    // The channel stays open while verifying so a late transport error still fails the attempt
    if (settings_.verify_transfers) {
        transition(entry, TransferStatus::VERIFYING, actions);
        actions.verifications.push_back(VerifyAction{record, entry.generation, entry.remote_hash});
        return;
    }

    detach_channel(entry, actions);
    transition(entry, TransferStatus::COMPLETED, actions);
    LOG_INFO("Transfer {} completed ({} bytes)", record.id, record.total_size);
}

void TransferScheduler::fail_transport(Entry& entry, const std::string& message, Actions& actions) {
    auto& record = entry.record;
    entry.meter.stop(clock_());
    record.current_speed = 0.0;
    record.eta = std::numeric_limits<double>::infinity();
    record.error = message;
    detach_channel(entry, actions);
    transition(entry, TransferStatus::FAILED, actions);
    LOG_WARN("Transfer {} failed: {}", record.id, message);

    if (settings_.auto_retry && record.retry_count < settings_.max_retries) {
        requeue(entry, actions);
        LOG_INFO("Auto-retrying transfer {} ({}/{})", record.id, record.retry_count, settings_.max_retries);
    }
}

void TransferScheduler::requeue(Entry& entry, Actions& actions) {
    auto& record = entry.record;
    record.retry_count++;
    record.error.reset();
    record.verified = false;
    record.completed_at.reset();
    reset_for_retry(record);
    transition(entry, TransferStatus::QUEUED, actions);
}

void TransferScheduler::reset_for_retry(TransferRecord& record) const {
    // Backends resume from a byte offset, so only a contiguous completed prefix survives
    if (settings_.enable_resume && record.chunks) {
        if (auto first = record.chunks->first_incomplete()) {
            record.chunks->reset_from(*first);
        }
        record.transferred_bytes = record.chunks->contiguous_completed_bytes();
    } else {
        record.transferred_bytes = 0;
        if (record.chunks) {
            record.chunks->reset_all();
        }
    }

    record.current_speed = 0.0;
    record.eta = record.remaining_bytes() > 0 ? std::numeric_limits<double>::infinity() : 0.0;
    record.update_progress();
}

void TransferScheduler::release_slot(Entry& entry) {
    if (is_active_status(entry.record.status)) {
        active_count_--;
    }
}

TransferScheduler::Entry* TransferScheduler::find_attempt(const std::string& transfer_id, std::uint64_t generation) {
    auto it = transfers_.find(transfer_id);
    if (it == transfers_.end() || it->second.generation != generation) {
        return nullptr;
    }
    return &it->second;
}

std::vector<TransferRecord> TransferScheduler::collect(
    const std::function<bool(const TransferRecord&)>& filter) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<TransferRecord> result;
    for (const auto& [id, entry] : transfers_) {
        if (filter(entry.record)) {
            result.push_back(entry.record);
        }
    }
    std::sort(result.begin(), result.end(), dispatch_before);
    return result;
}

void TransferScheduler::run(Actions actions) {
    if (actions.empty()) {
        return;
    }

    for (const auto& [record, when] : actions.history) {
        history_.record(record, when);
    }

    for (auto& channel : actions.cancels) {
        channel->cancel();
    }
    for (const auto& [protocol, id] : actions.stops) {
        if (auto backend = transports_.find(protocol)) {
            backend->stop(id);
        }
    }

    StatusListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = listener_;
    }
    if (listener) {
        for (const auto& record : actions.notifications) {
            listener(record);
        }
    }

    for (auto& start : actions.starts) {
        const auto& record = start.request.record;
        auto backend = transports_.find(record.protocol);
        if (!backend) {
            on_start_failed(record.id, start.generation,
                            "No transport backend registered for " + std::string(to_string(record.protocol)));
            continue;
        }

        auto result = backend->start(start.request, start.channel);
        if (!result) {
            on_start_failed(record.id, start.generation, result.message);
        }
    }

    for (const auto& verify : actions.verifications) {
        const auto& record = verify.record;
        VerificationOutcome outcome;
        bool verified = false;

        if (verifier_) {
            auto expected = record.content_hash ? record.content_hash : verify.remote_hash;
            outcome = verifier_->verify(record, expected);
            verified = outcome.matched && expected.has_value();
        } else if (record.content_hash && verify.remote_hash) {
            outcome.matched = *record.content_hash == *verify.remote_hash;
            outcome.computed_hash = *verify.remote_hash;
            outcome.detail = outcome.matched ? "" : "remote hash differs from expected";
            verified = outcome.matched;
        } else {
            // Nothing to compare against; adopt what the transport reported
            outcome.matched = true;
            outcome.computed_hash = verify.remote_hash.value_or("");
        }

        on_verified(record.id, verify.generation, outcome, verified);
    }
}

core::Result TransferScheduler::validate(const TransferSpec& spec) const {
    if (spec.source_path.empty()) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "Source path is required");
    }
    if (spec.destination_path.empty()) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "Destination path is required");
    }
    if (spec.protocol == Protocol::P2P && (!spec.device_id || spec.device_id->empty())) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "P2P transfers require a device id");
    }
    return core::Result::ok();
}

std::string TransferScheduler::generate_transfer_id() {
    static std::random_device rd;
    static std::mt19937_64 gen(rd());
    std::uniform_int_distribution<std::uint64_t> dis;

    std::ostringstream oss;
    oss << "transfer_" << std::hex << std::setw(16) << std::setfill('0') << dis(gen);
    return oss.str();
}

} // namespace ferry::transfer
