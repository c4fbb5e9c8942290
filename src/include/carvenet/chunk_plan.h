#pragma once

#include <cstdint>
#include <vector>

/**
 * \file chunk_plan.h
 * \brief Partitioning of a byte source into chunks with a trailing overlap.
 */

namespace carvenet {

/**
 * \brief One region of the source assigned to a single worker.
 *
 * `[primary_start, primary_end)` is the owned span. `[primary_end,
 * overlap_end)` is the overlap tail: visible to the worker so that artifacts
 * starting in the primary span can be carved in full, but owned by the next
 * chunk.
 */
struct ChunkDescriptor final {
    uint32_t chunk_index   = 0;
    uint64_t primary_start = 0;
    uint64_t primary_end   = 0;
    uint64_t overlap_end   = 0;

    uint64_t primary_length() const noexcept
    {
        return primary_end - primary_start;
    }

    /// Number of bytes sent to the worker (primary span + overlap tail).
    uint64_t transfer_length() const noexcept
    {
        return overlap_end - primary_start;
    }
};

/// Chunk layout settings.
struct PlanOptions final {
    /// Primary span length; 0 derives it from the registered worker count.
    uint64_t chunk_size = 512ULL * 1024ULL * 1024ULL;
    /// Trailing overlap, at least the largest artifact expected to straddle.
    uint64_t overlap_size = 1ULL * 1024ULL * 1024ULL;
};

/// Result status for \ref plan_chunks.
enum class PlanStatus : uint8_t {
    Ok,
    /// `chunk_size` is zero.
    InvalidChunkSize,
    /// `overlap_size` is not smaller than `chunk_size`.
    InvalidOverlap,
    /// The plan would need more than 2^32 chunks.
    TooManyChunks,
};

/**
 * \brief Lays chunks out consecutively over `[0, total_length)`.
 *
 * Chunk `i` has `primary_start = i * chunk_size`, `primary_end =
 * min((i + 1) * chunk_size, total_length)` and `overlap_end =
 * min(primary_end + overlap_size, total_length)`. The primary spans tile the
 * source exactly; the last chunk carries no overlap. An empty source yields
 * an empty plan.
 *
 * \p out is cleared first and only filled on \ref PlanStatus::Ok.
 */
PlanStatus
plan_chunks(uint64_t total_length, uint64_t chunk_size, uint64_t overlap_size,
            std::vector<ChunkDescriptor>* out);

/**
 * \brief Chunk size that splits \p total_length evenly over \p worker_count.
 *
 * Rounds up so no more than \p worker_count chunks are produced, and never
 * returns less than `overlap_size + 1`, so the result is always a valid
 * `chunk_size` for \ref plan_chunks.
 */
uint64_t
even_chunk_size(uint64_t total_length, uint32_t worker_count,
                uint64_t overlap_size) noexcept;

/// True if \p chunk's transfer bytes fit a single frame of \p max_frame_bytes.
bool
chunk_transfer_fits_frame(const ChunkDescriptor& chunk,
                          uint64_t max_frame_bytes) noexcept;

const char*
plan_status_name(PlanStatus status) noexcept;

}  // namespace carvenet
