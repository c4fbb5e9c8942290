#include "carvenet/chunk_plan.h"

#include <cstddef>
#include <limits>

namespace carvenet {

PlanStatus
plan_chunks(uint64_t total_length, uint64_t chunk_size, uint64_t overlap_size,
            std::vector<ChunkDescriptor>* out)
{
    if (out) {
        out->clear();
    }
    if (chunk_size == 0U) {
        return PlanStatus::InvalidChunkSize;
    }
    if (overlap_size >= chunk_size) {
        return PlanStatus::InvalidOverlap;
    }
    if (!out || total_length == 0U) {
        return PlanStatus::Ok;
    }

    const uint64_t count = total_length / chunk_size
                           + ((total_length % chunk_size) != 0U ? 1U : 0U);
    if (count > std::numeric_limits<uint32_t>::max()) {
        return PlanStatus::TooManyChunks;
    }
    out->reserve(static_cast<size_t>(count));

    uint64_t start = 0;
    for (uint64_t i = 0; i < count; ++i) {
        ChunkDescriptor c;
        c.chunk_index   = static_cast<uint32_t>(i);
        c.primary_start = start;
        c.primary_end   = (chunk_size > total_length - start)
                              ? total_length
                              : start + chunk_size;
        c.overlap_end   = (overlap_size > total_length - c.primary_end)
                              ? total_length
                              : c.primary_end + overlap_size;
        out->push_back(c);
        start = c.primary_end;
    }
    return PlanStatus::Ok;
}


uint64_t
even_chunk_size(uint64_t total_length, uint32_t worker_count,
                uint64_t overlap_size) noexcept
{
    const uint64_t workers = (worker_count == 0U) ? 1U : worker_count;
    uint64_t size          = total_length / workers
                    + ((total_length % workers) != 0U ? 1U : 0U);
    if (size <= overlap_size) {
        size = overlap_size + 1U;
    }
    return size;
}


bool
chunk_transfer_fits_frame(const ChunkDescriptor& chunk,
                          uint64_t max_frame_bytes) noexcept
{
    return chunk.transfer_length() <= max_frame_bytes;
}


const char*
plan_status_name(PlanStatus status) noexcept
{
    switch (status) {
    case PlanStatus::Ok: return "ok";
    case PlanStatus::InvalidChunkSize: return "invalid_chunk_size";
    case PlanStatus::InvalidOverlap: return "invalid_overlap";
    case PlanStatus::TooManyChunks: return "too_many_chunks";
    }
    return "unknown";
}

}  // namespace carvenet
