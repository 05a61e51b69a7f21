#include "ferry/crypto/file_verifier.hpp"
#include "ferry/crypto/content_hasher.hpp"
#include "ferry/core/logger.hpp"
#include "ferry/core/utils.hpp"

namespace ferry::crypto {

transfer::VerificationOutcome FileVerifier::verify(const transfer::TransferRecord& record,
                                                   const std::optional<std::string>& expected_hash) {
    transfer::VerificationOutcome outcome;
    auto path = local_path(record);
    
    auto size = core::utils::FileUtils::file_size(path);
    if (!size) {
        outcome.detail = "cannot read " + path.string();
        return outcome;
    }
    if (*size != record.total_size) {
        outcome.detail = "size mismatch: expected " + std::to_string(record.total_size) +
                         " bytes, found " + std::to_string(*size);
        return outcome;
    }
    
    ContentHash digest{};
    auto result = ContentHasher::hash_file(path, digest);
    if (!result) {
        outcome.detail = result.message;
        return outcome;
    }
    outcome.computed_hash = ContentHasher::hash_to_hex(digest);
    
    if (record.chunks) {
        outcome.corrupted_chunks = find_corrupted_chunks(path, *record.chunks);
    }
    
    bool hash_matches = !expected_hash ||
        core::utils::StringUtils::to_lower(*expected_hash) == outcome.computed_hash;
    outcome.matched = hash_matches && outcome.corrupted_chunks.empty();
    
    if (!hash_matches) {
        outcome.detail = "content hash mismatch";
    } else if (!outcome.corrupted_chunks.empty()) {
        outcome.detail = std::to_string(outcome.corrupted_chunks.size()) + " corrupted chunks";
    }
    
    LOG_DEBUG("Verified {}: {} ({})", path.string(), outcome.matched ? "ok" : "mismatch", outcome.computed_hash);
    return outcome;
}

std::filesystem::path FileVerifier::local_path(const transfer::TransferRecord& record) {
    std::filesystem::path path = record.direction == transfer::Direction::DOWNLOAD
        ? record.destination_path
        : record.source_path;
    
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec) && !record.file_name.empty()) {
        path /= record.file_name;
    }
    return path;
}

std::vector<std::uint32_t> FileVerifier::find_corrupted_chunks(const std::filesystem::path& file_path,
                                                               const transfer::ChunkPlan& plan) {
    std::vector<std::uint32_t> corrupted;
    
    for (const auto& chunk : plan.chunks()) {
        if (!chunk.hash) {
            continue;
        }
        
        ContentHash digest{};
        auto result = ContentHasher::hash_file_range(file_path, chunk.start_offset, chunk.size(), digest);
        if (!result || core::utils::StringUtils::to_lower(*chunk.hash) != ContentHasher::hash_to_hex(digest)) {
            corrupted.push_back(chunk.index);
        }
    }
    
    return corrupted;
}

} // namespace ferry::crypto
