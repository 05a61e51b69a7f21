#include "ferry/crypto/content_hasher.hpp"
#include "ferry/core/logger.hpp"
#include <sodium.h>
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace ferry::crypto {

namespace {

constexpr std::size_t READ_BUFFER_SIZE = 65536; // 64KB

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

struct ContentHasher::Impl {
    crypto_generichash_state state;
};

ContentHasher::ContentHasher()
    : impl_(std::make_unique<Impl>())
    , initialized_(false) {
}

ContentHasher::~ContentHasher() = default;

bool ContentHasher::ensure_sodium() {
    static const bool ready = [] {
        if (sodium_init() < 0) {
            LOG_CRITICAL("Failed to initialize libsodium");
            return false;
        }
        return true;
    }();
    return ready;
}

core::Result ContentHasher::initialize() {
    if (!ensure_sodium()) {
        return core::Result(core::ErrorCode::INTEGRITY_ERROR, "libsodium is unavailable");
    }
    
    if (crypto_generichash_init(&impl_->state, nullptr, 0, CONTENT_HASH_SIZE) != 0) {
        return core::Result(core::ErrorCode::INTEGRITY_ERROR, "Failed to initialize hasher");
    }
    
    initialized_ = true;
    return core::Result::ok();
}

core::Result ContentHasher::update(std::span<const std::uint8_t> data) {
    if (!initialized_) {
        return core::Result(core::ErrorCode::INVALID_TRANSITION, "Hasher not initialized");
    }
    
    if (crypto_generichash_update(&impl_->state, data.data(), data.size()) != 0) {
        return core::Result(core::ErrorCode::INTEGRITY_ERROR, "Failed to update hash");
    }
    
    return core::Result::ok();
}

core::Result ContentHasher::finalize(ContentHash& output) {
    if (!initialized_) {
        return core::Result(core::ErrorCode::INVALID_TRANSITION, "Hasher not initialized");
    }
    
    if (crypto_generichash_final(&impl_->state, output.data(), output.size()) != 0) {
        return core::Result(core::ErrorCode::INTEGRITY_ERROR, "Failed to finalize hash");
    }
    
    initialized_ = false; // Hasher is consumed
    return core::Result::ok();
}

ContentHash ContentHasher::hash(std::span<const std::uint8_t> data) {
    ensure_sodium();
    ContentHash result{};
    crypto_generichash(result.data(), result.size(), data.data(), data.size(), nullptr, 0);
    return result;
}

ContentHash ContentHasher::hash(const std::string& data) {
    return hash(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(data.data()), data.size()));
}

core::Result ContentHasher::hash_file(const std::filesystem::path& file_path, ContentHash& output) {
    std::error_code ec;
    auto size = std::filesystem::file_size(file_path, ec);
    if (ec) {
        return core::Result(core::ErrorCode::NOT_FOUND, "Cannot read file for hashing: " + file_path.string());
    }
    return hash_file_range(file_path, 0, size, output);
}

core::Result ContentHasher::hash_file_range(const std::filesystem::path& file_path,
                                            std::uint64_t offset, std::uint64_t length,
                                            ContentHash& output) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return core::Result(core::ErrorCode::NOT_FOUND, "Cannot open file for hashing: " + file_path.string());
    }
    
    file.seekg(static_cast<std::streamoff>(offset));
    if (!file) {
        return core::Result(core::ErrorCode::INTEGRITY_ERROR, "Cannot seek in " + file_path.string());
    }
    
    ContentHasher hasher;
    auto result = hasher.initialize();
    if (!result) {
        return result;
    }
    
    std::vector<std::uint8_t> buffer(READ_BUFFER_SIZE);
    std::uint64_t remaining = length;
    
    while (remaining > 0 && file.good()) {
        auto to_read = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, buffer.size()));
        file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(to_read));
        auto bytes_read = static_cast<std::size_t>(file.gcount());
        
        if (bytes_read == 0) {
            break;
        }
        
        result = hasher.update(std::span(buffer.data(), bytes_read));
        if (!result) {
            return result;
        }
        remaining -= bytes_read;
    }
    
    if (remaining > 0) {
        return core::Result(core::ErrorCode::INTEGRITY_ERROR,
                            "File shorter than expected: " + file_path.string());
    }
    
    return hasher.finalize(output);
}

std::string ContentHasher::hash_to_hex(const ContentHash& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : hash) {
        oss << std::setw(2) << static_cast<unsigned>(byte);
    }
    return oss.str();
}

std::optional<ContentHash> ContentHasher::hash_from_hex(const std::string& hex_string) {
    if (hex_string.length() != CONTENT_HASH_SIZE * 2) {
        return std::nullopt;
    }
    
    ContentHash hash{};
    for (std::size_t i = 0; i < CONTENT_HASH_SIZE; ++i) {
        int high = hex_value(hex_string[i * 2]);
        int low = hex_value(hex_string[i * 2 + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        hash[i] = static_cast<std::uint8_t>((high << 4) | low);
    }
    
    return hash;
}

} // namespace ferry::crypto
