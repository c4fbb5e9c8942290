#pragma once

#include "carvenet/fingerprint.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file jpeg_carve.h
 * \brief Signature-based JPEG carving over one chunk of a raw image.
 */

namespace carvenet {

/// Budgets for candidate discovery and artifact extraction.
struct CarveLimits final {
    /// Candidates whose EOI is not found within this many bytes are dropped.
    uint64_t max_artifact_bytes = 32ULL * 1024ULL * 1024ULL;
    /// Smaller candidates are rejected as noise.
    uint64_t min_artifact_bytes = 100;
    /// Cap on artifacts emitted for one chunk.
    uint32_t max_artifacts = 65536;
    /// Cap on marker segments walked before falling back to a linear EOI scan.
    uint32_t max_header_segments = 512;
};

struct CarveOptions final {
    CarveLimits limits;
    /// Compute SHA-256 fingerprints for emitted artifacts.
    bool compute_fingerprints = true;
};

/// Chunk-relative byte range `[start, end)` from SOI through EOI.
struct CarveCandidate final {
    uint64_t start = 0;
    uint64_t end   = 0;

    uint64_t size() const noexcept { return end - start; }
};

/// A recovered file, positioned in the whole source.
struct Artifact final {
    uint64_t absolute_start = 0;
    std::vector<std::byte> payload;
    Fingerprint fingerprint;
    bool has_fingerprint = false;
};

/// Outcome of locating the end of one candidate.
enum class CandidateStatus : uint8_t {
    Ok,
    /// No `FF D9` before the end of the available bytes.
    Unterminated,
    /// No `FF D9` within \ref CarveLimits::max_artifact_bytes.
    TooLarge,
};

enum class CarveStatus : uint8_t {
    Ok,
    /// More artifacts than \ref CarveLimits::max_artifacts; extras dropped.
    LimitExceeded,
    /// `primary_length` exceeds the chunk bytes.
    Malformed,
};

struct CarveResult final {
    CarveStatus status = CarveStatus::Ok;
    /// Start markers located inside the scanned range.
    uint32_t candidates = 0;
    /// Terminated candidates that failed structural validation.
    uint32_t rejected = 0;
    /// Start markers with no end marker in range (discarded, never truncated).
    uint32_t unterminated = 0;
    /// Terminated candidates starting in the overlap tail (owned by the next
    /// chunk).
    uint32_t foreign = 0;
    uint32_t emitted = 0;
    /// Valid artifacts not emitted because of \ref CarveLimits::max_artifacts.
    uint32_t dropped = 0;
};

/**
 * \brief Finds the end of the JPEG that starts with SOI at \p soi_offset.
 *
 * Well-formed marker segments after SOI are skipped as units, so markers
 * inside APPn payloads (for example the EOI of an embedded EXIF thumbnail)
 * are not mistaken for the end of the image. Once the walk reaches SOS, or
 * bytes that are not a marker segment, the first `FF D9` ends the candidate.
 */
CandidateStatus
locate_jpeg_end(std::span<const std::byte> bytes, uint64_t soi_offset,
                const CarveLimits& limits, uint64_t* end) noexcept;

/**
 * \brief Locates candidates for every `FF D8` whose offset is below
 * \p scan_end.
 *
 * Candidates are appended to \p out in offset order; unterminated ones are
 * only counted. Pass `bytes.size()` to scan everything.
 */
CarveResult
find_jpeg_candidates(std::span<const std::byte> bytes, uint64_t scan_end,
                     const CarveLimits& limits,
                     std::vector<CarveCandidate>* out);

/**
 * \brief Structural sanity checks for one candidate's bytes.
 *
 * Requires SOI, a plausible first marker segment (APPn, DQT, DHT, SOFn, DRI
 * or COM) whose length fits the candidate, a trailing EOI, and a size within
 * \p limits.
 */
bool
validate_jpeg_candidate(std::span<const std::byte> candidate,
                        const CarveLimits& limits) noexcept;

/// Boundary-ownership rule: a chunk owns candidates starting in its primary span.
inline bool
owns_candidate(const CarveCandidate& candidate,
               uint64_t primary_length) noexcept
{
    return candidate.start < primary_length;
}

/**
 * \brief Carves one chunk.
 *
 * \p chunk_bytes holds the primary span followed by the overlap tail;
 * \p primary_length is the size of the primary span and \p base_offset its
 * position in the source. Only validated candidates starting inside the
 * primary span are emitted, in offset order, with
 * `absolute_start = base_offset + start`. Malformed bytes never fail the
 * call; they simply yield no artifact.
 */
CarveResult
carve_chunk(std::span<const std::byte> chunk_bytes, uint64_t primary_length,
            uint64_t base_offset, const CarveOptions& options,
            std::vector<Artifact>* out);

const char*
carve_status_name(CarveStatus status) noexcept;

}  // namespace carvenet
