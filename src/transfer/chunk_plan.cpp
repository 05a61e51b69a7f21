#include "ferry/transfer/chunk_plan.hpp"
#include <algorithm>

namespace ferry::transfer {

ChunkPlan ChunkPlan::build(std::uint64_t total_size, std::uint64_t chunk_size) {
    ChunkPlan plan;
    plan.total_size_ = total_size;
    plan.chunk_size_ = chunk_size;
    
    if (chunk_size == 0) {
        return plan;
    }
    
    plan.chunks_.reserve(static_cast<std::size_t>(chunk_count_for(total_size, chunk_size)));
    
    std::uint64_t offset = 0;
    std::uint32_t index = 0;
    while (offset < total_size) {
        std::uint64_t end = std::min(offset + chunk_size, total_size);
        plan.chunks_.push_back(Chunk{index, offset, end, false, std::nullopt});
        offset = end;
        ++index;
    }
    
    return plan;
}

std::uint64_t ChunkPlan::chunk_count_for(std::uint64_t total_size, std::uint64_t chunk_size) {
    if (chunk_size == 0) return 0;
    return (total_size + chunk_size - 1) / chunk_size;
}

void ChunkPlan::mark_completed_through(std::uint64_t transferred_bytes) {
    for (auto& chunk : chunks_) {
        if (transferred_bytes >= chunk.end_offset) {
            chunk.completed = true;
        }
    }
}

void ChunkPlan::mark_incomplete(const std::vector<std::uint32_t>& indices) {
    for (auto index : indices) {
        if (index < chunks_.size()) {
            chunks_[index].completed = false;
        }
    }
}

void ChunkPlan::reset_from(std::size_t index) {
    for (std::size_t i = index; i < chunks_.size(); ++i) {
        chunks_[i].completed = false;
    }
}

bool ChunkPlan::set_chunk_hash(std::uint32_t index, const std::string& hash) {
    if (index >= chunks_.size()) {
        return false;
    }
    chunks_[index].hash = hash;
    return true;
}

std::size_t ChunkPlan::completed_count() const {
    return static_cast<std::size_t>(std::count_if(chunks_.begin(), chunks_.end(),
        [](const Chunk& chunk) { return chunk.completed; }));
}

std::uint64_t ChunkPlan::completed_bytes() const {
    std::uint64_t total = 0;
    for (const auto& chunk : chunks_) {
        if (chunk.completed) {
            total += chunk.size();
        }
    }
    return total;
}

std::uint64_t ChunkPlan::contiguous_completed_bytes() const {
    std::uint64_t total = 0;
    for (const auto& chunk : chunks_) {
        if (!chunk.completed) {
            break;
        }
        total += chunk.size();
    }
    return total;
}

std::optional<std::size_t> ChunkPlan::first_incomplete() const {
    for (std::size_t i = 0; i < chunks_.size(); ++i) {
        if (!chunks_[i].completed) {
            return i;
        }
    }
    return std::nullopt;
}

bool ChunkPlan::is_valid_partition(std::uint64_t total_size) const {
    std::uint64_t expected_offset = 0;
    for (std::size_t i = 0; i < chunks_.size(); ++i) {
        const auto& chunk = chunks_[i];
        if (chunk.index != i || chunk.start_offset != expected_offset ||
            chunk.end_offset <= chunk.start_offset) {
            return false;
        }
        expected_offset = chunk.end_offset;
    }
    return expected_offset == total_size;
}

} // namespace ferry::transfer
