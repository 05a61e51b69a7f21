#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ferry::transfer {

struct Chunk {
    std::uint32_t index;
    std::uint64_t start_offset;
    std::uint64_t end_offset; // exclusive
    bool completed;
    std::optional<std::string> hash;
    
    std::uint64_t size() const { return end_offset - start_offset; }
};

// Resumable progress bookkeeping: an ordered partition of [0, total_size)
class ChunkPlan {
public:
    static constexpr std::uint64_t DEFAULT_CHUNK_SIZE = 10ULL * 1024 * 1024; // 10MB
    
    ChunkPlan() = default;
    
    static ChunkPlan build(std::uint64_t total_size, std::uint64_t chunk_size = DEFAULT_CHUNK_SIZE);
    static std::uint64_t chunk_count_for(std::uint64_t total_size, std::uint64_t chunk_size);
    
    const std::vector<Chunk>& chunks() const { return chunks_; }
    std::size_t size() const { return chunks_.size(); }
    bool empty() const { return chunks_.empty(); }
    std::uint64_t total_size() const { return total_size_; }
    std::uint64_t chunk_size() const { return chunk_size_; }
    
    // A chunk counts as completed once the transferred byte count reaches its end offset
    void mark_completed_through(std::uint64_t transferred_bytes);
    void mark_incomplete(const std::vector<std::uint32_t>& indices);
    void reset_from(std::size_t index);
    void reset_all() { reset_from(0); }
    
    bool set_chunk_hash(std::uint32_t index, const std::string& hash);
    
    std::size_t completed_count() const;
    std::uint64_t completed_bytes() const;
    std::uint64_t contiguous_completed_bytes() const;
    std::optional<std::size_t> first_incomplete() const;
    
    bool is_valid_partition(std::uint64_t total_size) const;
    
private:
    std::vector<Chunk> chunks_;
    std::uint64_t total_size_ = 0;
    std::uint64_t chunk_size_ = 0;
};

} // namespace ferry::transfer
