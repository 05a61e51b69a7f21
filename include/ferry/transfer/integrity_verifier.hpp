#pragma once

#include "transfer_types.hpp"
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace ferry::transfer {

struct VerificationOutcome {
    bool matched = false;
    std::string computed_hash;
    std::vector<std::uint32_t> corrupted_chunks;
    std::string detail;
};

// Post-transfer content check. With no expected hash, matched means the
// local content could be hashed at all.
class IntegrityVerifier {
public:
    virtual ~IntegrityVerifier() = default;
    
    virtual VerificationOutcome verify(const TransferRecord& record,
                                       const std::optional<std::string>& expected_hash) = 0;
};

} // namespace ferry::transfer
