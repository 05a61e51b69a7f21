#include "ferry/service/file_transfer_service.hpp"
#include "ferry/core/logger.hpp"
#include "ferry/core/utils.hpp"
#include <optional>

namespace ferry::service {

using core::utils::FileUtils;

namespace {

std::string peer_uri(const std::string& device_id, const std::string& file_name) {
    return "p2p://" + device_id + "/" + file_name;
}

// Peer-supplied names keep only their last component and must land directly in the download directory
std::optional<std::filesystem::path> download_target(const std::filesystem::path& directory,
                                                     const std::string& manifest_name) {
    auto name = std::filesystem::path(manifest_name).filename();
    if (name.empty() || name == "." || name == "..") {
        return std::nullopt;
    }
    
    auto base = directory.lexically_normal();
    if (!base.has_filename()) {
        base = base.parent_path();
    }
    auto target = (base / name).lexically_normal();
    if (target.parent_path() != base) {
        return std::nullopt;
    }
    return target;
}

} // namespace

FileTransferService::FileTransferService(ServiceOptions options)
    : options_(std::move(options)) {
}

FileTransferService::~FileTransferService() {
    shutdown();
}

bool FileTransferService::initialize() {
    if (scheduler_) {
        LOG_WARN("File transfer service already initialized");
        return true;
    }

    settings_store_ = std::make_unique<storage::SettingsStore>(options_.database_path);
    if (!settings_store_->initialize()) {
        LOG_ERROR("Failed to initialize settings store at {}", options_.database_path.string());
        return false;
    }

    history_store_ = std::make_unique<storage::HistoryStore>(options_.database_path);
    if (!history_store_->initialize()) {
        LOG_ERROR("Failed to initialize history store at {}", options_.database_path.string());
        return false;
    }

    transfer::TransferSettings settings;
    auto loaded = settings_store_->load(settings);
    if (!loaded) {
        LOG_WARN("Using default transfer settings: {}", loaded.message);
        settings = transfer::TransferSettings();
    }

    history_.set_limit(settings.history_limit);
    history_.attach_store(history_store_.get());
    auto history_loaded = history_.load_from_store();
    if (!history_loaded) {
        LOG_WARN("Transfer history not loaded: {}", history_loaded.message);
    }

    if (!options_.download_directory.empty() && !FileUtils::create_directories(options_.download_directory)) {
        LOG_WARN("Cannot create download directory {}", options_.download_directory.string());
    }

    scheduler_ = std::make_unique<transfer::TransferScheduler>(
        settings, transports_, history_, &verifier_, options_.clock);
    scheduler_->set_settings_persister([this](const transfer::TransferSettings& updated) {
        return settings_store_->save(updated);
    });

    p2p::P2PNegotiator::Clock negotiator_clock;
    if (options_.clock) {
        negotiator_clock = options_.clock;
    }
    negotiator_ = std::make_unique<p2p::P2PNegotiator>(directory_, options_.local_device, negotiator_clock);
    negotiator_->set_auto_accept_trusted(settings.p2p_auto_accept_trusted);
    negotiator_->set_accept_handler([this](const p2p::P2PTransferRequest& request) {
        on_request_accepted(request);
    });

    if (options_.start_timer) {
        timer_ = std::make_unique<transfer::ScheduleTimer>(*scheduler_);
        timer_->start();
    }

    LOG_INFO("File transfer service ready (database {}, {} history entries)",
             options_.database_path.string(), history_.size());
    return true;
}

void FileTransferService::shutdown() {
    if (timer_) {
        timer_->stop();
        timer_.reset();
    }
    negotiator_.reset();
    scheduler_.reset();
}

core::Result FileTransferService::enqueue(const transfer::TransferSpec& spec, transfer::TransferRecord& out) {
    if (!scheduler_) return not_initialized();

    auto result = scheduler_->enqueue(spec, out);
    if (result && spec.scheduled_at && timer_) {
        timer_->wake();
    }
    return result;
}

core::Result FileTransferService::pause(const std::string& transfer_id) {
    if (!scheduler_) return not_initialized();
    return scheduler_->pause(transfer_id);
}

core::Result FileTransferService::resume(const std::string& transfer_id) {
    if (!scheduler_) return not_initialized();
    return scheduler_->resume(transfer_id);
}

core::Result FileTransferService::cancel(const std::string& transfer_id) {
    if (!scheduler_) return not_initialized();
    return scheduler_->cancel(transfer_id);
}

core::Result FileTransferService::retry(const std::string& transfer_id) {
    if (!scheduler_) return not_initialized();
    return scheduler_->retry(transfer_id);
}

core::Result FileTransferService::remove(const std::string& transfer_id) {
    if (!scheduler_) return not_initialized();
    return scheduler_->remove(transfer_id);
}

std::size_t FileTransferService::clear_completed() {
    return scheduler_ ? scheduler_->clear_completed() : 0;
}

std::optional<transfer::TransferRecord> FileTransferService::get_transfer(const std::string& transfer_id) const {
    if (!scheduler_) return std::nullopt;
    return scheduler_->get_transfer(transfer_id);
}

std::vector<transfer::TransferRecord> FileTransferService::get_transfers() const {
    return scheduler_ ? scheduler_->get_transfers() : std::vector<transfer::TransferRecord>{};
}

std::vector<transfer::TransferRecord> FileTransferService::get_active_transfers() const {
    return scheduler_ ? scheduler_->get_active_transfers() : std::vector<transfer::TransferRecord>{};
}

std::vector<transfer::TransferRecord> FileTransferService::get_queued_transfers() const {
    return scheduler_ ? scheduler_->get_queued_transfers() : std::vector<transfer::TransferRecord>{};
}

std::vector<transfer::TransferRecord> FileTransferService::get_completed_transfers() const {
    return scheduler_ ? scheduler_->get_completed_transfers() : std::vector<transfer::TransferRecord>{};
}

std::vector<transfer::TransferHistoryEntry> FileTransferService::get_history(std::size_t limit) const {
    return history_.entries(limit);
}

transfer::TransferStats FileTransferService::get_stats() const {
    return history_.stats(now());
}

core::Result FileTransferService::clear_history() {
    return history_.clear();
}

transfer::TransferSettings FileTransferService::get_settings() const {
    return scheduler_ ? scheduler_->get_settings() : transfer::TransferSettings();
}

core::Result FileTransferService::update_settings(const transfer::TransferSettings& settings) {
    if (!scheduler_) return not_initialized();

    auto result = scheduler_->update_settings(settings);
    if (result) {
        negotiator_->set_auto_accept_trusted(settings.p2p_auto_accept_trusted);
    }
    return result;
}

core::Result FileTransferService::send_transfer_request(const std::string& device_id,
                                                        const std::vector<p2p::FileManifestEntry>& files,
                                                        p2p::P2PTransferRequest& out) {
    if (!negotiator_) return not_initialized();
    return negotiator_->send_transfer_request(device_id, files, out);
}

core::Result FileTransferService::receive_transfer_request(const std::string& from_device_id,
                                                           const std::vector<p2p::FileManifestEntry>& files,
                                                           p2p::P2PTransferRequest& out) {
    if (!negotiator_) return not_initialized();
    return negotiator_->receive_transfer_request(from_device_id, files, out);
}

std::vector<p2p::P2PTransferRequest> FileTransferService::get_pending_requests() const {
    return negotiator_ ? negotiator_->get_pending_requests() : std::vector<p2p::P2PTransferRequest>{};
}

core::Result FileTransferService::accept_request(const std::string& request_id) {
    if (!negotiator_) return not_initialized();
    return negotiator_->accept_request(request_id);
}

core::Result FileTransferService::reject_request(const std::string& request_id) {
    if (!negotiator_) return not_initialized();
    return negotiator_->reject_request(request_id);
}

void FileTransferService::trust_device(const std::string& device_id) {
    if (negotiator_) negotiator_->trust_device(device_id);
}

void FileTransferService::untrust_device(const std::string& device_id) {
    if (negotiator_) negotiator_->untrust_device(device_id);
}

std::vector<p2p::Device> FileTransferService::get_devices() const {
    return negotiator_ ? negotiator_->get_devices() : directory_.list_devices();
}

core::Result FileTransferService::send_to_device(const std::string& device_id,
                                                 const std::vector<std::filesystem::path>& files,
                                                 std::vector<transfer::TransferRecord>& out) {
    if (!scheduler_) return not_initialized();

    if (!directory_.find_device(device_id)) {
        return core::Result(core::ErrorCode::DEVICE_UNAVAILABLE, "Unknown device: " + device_id);
    }
    if (files.empty()) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "No files to send");
    }

    std::vector<transfer::TransferSpec> specs;
    for (const auto& path : files) {
        auto size = FileUtils::file_size(path);
        if (!size || !FileUtils::is_file(path)) {
            return core::Result(core::ErrorCode::INVALID_ARGUMENT, "Not a readable file: " + path.string());
        }

        transfer::TransferSpec spec;
        spec.protocol = transfer::Protocol::P2P;
        spec.direction = transfer::Direction::UPLOAD;
        spec.source_path = path.string();
        spec.file_name = path.filename().string();
        spec.destination_path = peer_uri(device_id, spec.file_name);
        spec.total_size = *size;
        spec.device_id = device_id;
        specs.push_back(std::move(spec));
    }

    out.clear();
    for (const auto& spec : specs) {
        transfer::TransferRecord record;
        auto result = scheduler_->enqueue(spec, record);
        if (!result) {
            return result;
        }
        out.push_back(std::move(record));
    }

    LOG_INFO("Queued {} files for device {}", out.size(), device_id);
    return core::Result::ok();
}

void FileTransferService::on_request_accepted(const p2p::P2PTransferRequest& request) {
    if (!request.incoming || !scheduler_) {
        return;
    }

    for (const auto& file : request.files) {
        auto target = download_target(options_.download_directory, file.name);
        if (!target) {
            LOG_WARN("Skipping unusable file name '{}' in request {} from {}",
                     file.name, request.id, request.peer_device_id);
            continue;
        }
        
        transfer::TransferSpec spec;
        spec.protocol = transfer::Protocol::P2P;
        spec.direction = transfer::Direction::DOWNLOAD;
        spec.source_path = peer_uri(request.peer_device_id, file.name);
        spec.destination_path = target->string();
        spec.file_name = target->filename().string();
        spec.total_size = file.size;
        spec.device_id = request.peer_device_id;

        transfer::TransferRecord record;
        auto result = scheduler_->enqueue(spec, record);
        if (!result) {
            LOG_ERROR("Failed to queue {} from request {}: {}", file.name, request.id, result.message);
        }
    }
}

transfer::TimePoint FileTransferService::now() const {
    return options_.clock ? options_.clock() : std::chrono::system_clock::now();
}

core::Result FileTransferService::not_initialized() const {
    return core::Result(core::ErrorCode::INVALID_TRANSITION, "File transfer service not initialized");
}

} // namespace ferry::service
