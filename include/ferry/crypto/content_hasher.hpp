#pragma once

#include "ferry/core/result.hpp"
#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace ferry::crypto {

constexpr std::size_t CONTENT_HASH_SIZE = 32;
using ContentHash = std::array<std::uint8_t, CONTENT_HASH_SIZE>;

// BLAKE2b (libsodium generichash) content digests for transfer verification
class ContentHasher {
public:
    ContentHasher();
    ~ContentHasher();
    
    ContentHasher(const ContentHasher&) = delete;
    ContentHasher& operator=(const ContentHasher&) = delete;
    
    // Incremental hashing
    core::Result initialize();
    core::Result update(std::span<const std::uint8_t> data);
    core::Result finalize(ContentHash& output);
    
    static bool ensure_sodium();
    
    static ContentHash hash(std::span<const std::uint8_t> data);
    static ContentHash hash(const std::string& data);
    static core::Result hash_file(const std::filesystem::path& file_path, ContentHash& output);
    static core::Result hash_file_range(const std::filesystem::path& file_path,
                                        std::uint64_t offset, std::uint64_t length,
                                        ContentHash& output);
    
    static std::string hash_to_hex(const ContentHash& hash);
    static std::optional<ContentHash> hash_from_hex(const std::string& hex_string);
    
private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool initialized_;
};

} // namespace ferry::crypto
