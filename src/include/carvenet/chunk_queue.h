#pragma once

#include "carvenet/chunk_plan.h"

#include <cstdint>
#include <mutex>
#include <vector>

/**
 * \file chunk_queue.h
 * \brief Thread-safe dispatch queue and resolution tracking for a chunk plan.
 */

namespace carvenet {

enum class ChunkState : uint8_t {
    Pending,
    Assigned,
    Collected,
    Failed,
};

/**
 * \brief Hands out chunks in index order and tracks how each one resolved.
 *
 * A chunk is handed out at most once; there is no reassignment. Every chunk
 * that does not end in \ref ChunkState::Collected counts as missing coverage.
 */
class ChunkQueue final {
public:
    explicit ChunkQueue(std::vector<ChunkDescriptor> plan);

    ChunkQueue(const ChunkQueue&)            = delete;
    ChunkQueue& operator=(const ChunkQueue&) = delete;

    /// Pops the next pending chunk and marks it assigned.
    bool next(ChunkDescriptor* out);

    /// Assigned -> Collected. Returns false for any other prior state.
    bool mark_collected(uint32_t chunk_index);
    /// Assigned -> Failed. Returns false for any other prior state.
    bool mark_failed(uint32_t chunk_index);
    /// Marks every still-pending chunk failed; returns their indices.
    std::vector<uint32_t> fail_pending();

    ChunkState state(uint32_t chunk_index) const;

    uint32_t total() const noexcept;
    uint32_t pending_count() const;
    uint32_t collected_count() const;
    /// Chunks collected or failed so far.
    uint32_t resolved_count() const;
    /// True when no chunk is pending or assigned.
    bool all_resolved() const;

    /// Sorted indices of chunks not collected.
    std::vector<uint32_t> missing_chunks() const;

private:
    bool transition(uint32_t chunk_index, ChunkState from, ChunkState to);

    mutable std::mutex mutex_;
    std::vector<ChunkDescriptor> plan_;
    std::vector<ChunkState> states_;
    size_t next_      = 0;
    uint32_t settled_ = 0;
};

const char*
chunk_state_name(ChunkState state) noexcept;

}  // namespace carvenet
