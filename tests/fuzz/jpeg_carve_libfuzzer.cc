#include "carvenet/jpeg_carve.h"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>
#include <vector>

namespace carvenet {

[[noreturn]] static void
fuzz_trap() noexcept
{
#if defined(__clang__) || defined(__GNUC__)
    __builtin_trap();
#else
    std::abort();
#endif
}

}  // namespace carvenet


extern "C" int
LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    using namespace carvenet;

    if (size < 2U) {
        return 0;
    }
    // First two bytes pick the primary/overlap split.
    const uint64_t split = (static_cast<uint64_t>(data[0]) << 8U)
                           | static_cast<uint64_t>(data[1]);
    const std::span<const std::byte> chunk(
        reinterpret_cast<const std::byte*>(data + 2), size - 2U);
    const uint64_t primary_length = split % (chunk.size() + 1U);
    const uint64_t base_offset    = 1ULL << 40U;

    CarveOptions options;
    options.limits.max_artifact_bytes  = 256U * 1024U;
    options.limits.max_artifacts       = 1024;
    options.limits.max_header_segments = 64;
    options.compute_fingerprints       = false;

    std::vector<Artifact> artifacts;
    const CarveResult r = carve_chunk(chunk, primary_length, base_offset,
                                      options, &artifacts);
    if (r.status == CarveStatus::Malformed
        || artifacts.size() != r.emitted) {
        fuzz_trap();
    }

    uint64_t last = 0;
    for (const Artifact& a : artifacts) {
        if (a.absolute_start < base_offset
            || a.absolute_start - base_offset >= primary_length
            || a.absolute_start < last
            || a.payload.size() < options.limits.min_artifact_bytes
            || a.payload.size() > options.limits.max_artifact_bytes
            || !validate_jpeg_candidate(a.payload, options.limits)) {
            fuzz_trap();
        }
        last = a.absolute_start;
    }
    return 0;
}
