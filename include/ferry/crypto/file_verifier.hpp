#pragma once

#include "ferry/transfer/integrity_verifier.hpp"
#include <filesystem>

namespace ferry::crypto {

// Hashes the local side of a finished transfer: the destination for
// downloads, the source for uploads and sync.
class FileVerifier : public transfer::IntegrityVerifier {
public:
    FileVerifier() = default;
    
    transfer::VerificationOutcome verify(const transfer::TransferRecord& record,
                                         const std::optional<std::string>& expected_hash) override;
    
    static std::filesystem::path local_path(const transfer::TransferRecord& record);
    
    // Chunks whose recorded hash no longer matches the file contents
    static std::vector<std::uint32_t> find_corrupted_chunks(const std::filesystem::path& file_path,
                                                            const transfer::ChunkPlan& plan);
};

} // namespace ferry::crypto
