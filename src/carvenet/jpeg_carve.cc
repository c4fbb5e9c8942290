#include "carvenet/jpeg_carve.h"

#include <cstring>
#include <utility>

namespace carvenet {
namespace {

    static constexpr uint8_t u8(std::byte b) noexcept
    {
        return static_cast<uint8_t>(b);
    }


    static bool read_u16be(std::span<const std::byte> bytes, uint64_t offset,
                           uint16_t* out) noexcept
    {
        if (!out || offset + 2U > bytes.size()) {
            return false;
        }
        *out = static_cast<uint16_t>(
            (static_cast<uint16_t>(u8(bytes[offset + 0])) << 8)
            | static_cast<uint16_t>(u8(bytes[offset + 1])));
        return true;
    }


    static bool is_soi_at(std::span<const std::byte> bytes,
                          uint64_t offset) noexcept
    {
        return offset + 2U <= bytes.size() && u8(bytes[offset]) == 0xFFU
               && u8(bytes[offset + 1U]) == 0xD8U;
    }


    /// Markers that may directly follow SOI in a real image.
    static bool is_leading_segment_marker(uint8_t marker) noexcept
    {
        if (marker >= 0xE0U && marker <= 0xEFU) {  // APP0..APP15
            return true;
        }
        if (marker >= 0xC0U && marker <= 0xCFU) {  // SOFn, DHT, DAC
            return marker != 0xC8U;                // JPG (reserved)
        }
        return marker == 0xDBU      // DQT
               || marker == 0xDDU   // DRI
               || marker == 0xFEU;  // COM
    }


    /// Linear scan for `FF D9` in `[from, limit)`. Returns the EOI offset.
    static bool scan_for_eoi(std::span<const std::byte> bytes, uint64_t from,
                             uint64_t limit, uint64_t* eoi) noexcept
    {
        uint64_t pos = from;
        while (pos + 2U <= limit) {
            const void* hit = std::memchr(bytes.data() + pos, 0xFF,
                                          static_cast<size_t>(limit - pos - 1U));
            if (!hit) {
                return false;
            }
            pos = static_cast<uint64_t>(static_cast<const std::byte*>(hit)
                                        - bytes.data());
            if (u8(bytes[pos + 1U]) == 0xD9U) {
                *eoi = pos;
                return true;
            }
            pos += 1U;
        }
        return false;
    }

}  // namespace

CandidateStatus
locate_jpeg_end(std::span<const std::byte> bytes, uint64_t soi_offset,
                const CarveLimits& limits, uint64_t* end) noexcept
{
    const uint64_t size = static_cast<uint64_t>(bytes.size());
    if (!end || !is_soi_at(bytes, soi_offset)) {
        return CandidateStatus::Unterminated;
    }

    const bool capped = limits.max_artifact_bytes < size - soi_offset;
    const uint64_t limit = capped ? soi_offset + limits.max_artifact_bytes
                                  : size;
    const CandidateStatus missing = capped ? CandidateStatus::TooLarge
                                           : CandidateStatus::Unterminated;

    // Walk header segments; any surprise drops to the linear scan.
    uint64_t pos      = soi_offset + 2U;
    uint32_t segments = 0;
    while (pos + 2U <= limit && segments < limits.max_header_segments) {
        if (u8(bytes[pos]) != 0xFFU) {
            break;
        }
        uint64_t m = pos + 1U;
        while (m < limit && u8(bytes[m]) == 0xFFU) {
            m += 1U;  // fill bytes
        }
        if (m >= limit) {
            return missing;
        }
        const uint8_t marker = u8(bytes[m]);
        if (marker == 0xD9U) {
            *end = m + 1U;
            return CandidateStatus::Ok;
        }
        if ((marker >= 0xD0U && marker <= 0xD7U) || marker == 0x01U) {
            pos = m + 1U;  // standalone markers
            segments += 1U;
            continue;
        }
        if (marker == 0x00U || marker == 0xD8U) {
            break;
        }

        uint16_t seg_len = 0;
        if (!read_u16be(bytes.first(static_cast<size_t>(limit)), m + 1U,
                        &seg_len)
            || seg_len < 2U) {
            break;
        }
        const uint64_t next = m + 1U + static_cast<uint64_t>(seg_len);
        if (next > limit) {
            break;
        }
        pos = next;
        segments += 1U;
        if (marker == 0xDAU) {
            break;  // entropy-coded data follows SOS
        }
    }

    uint64_t eoi = 0;
    if (!scan_for_eoi(bytes, pos, limit, &eoi)) {
        return missing;
    }
    *end = eoi + 2U;
    return CandidateStatus::Ok;
}


CarveResult
find_jpeg_candidates(std::span<const std::byte> bytes, uint64_t scan_end,
                     const CarveLimits& limits,
                     std::vector<CarveCandidate>* out)
{
    CarveResult result;
    const uint64_t size = static_cast<uint64_t>(bytes.size());
    const uint64_t stop = (scan_end < size) ? scan_end : size;

    uint64_t pos = 0;
    while (pos < stop) {
        const void* hit = std::memchr(bytes.data() + pos, 0xFF,
                                      static_cast<size_t>(stop - pos));
        if (!hit) {
            break;
        }
        pos = static_cast<uint64_t>(static_cast<const std::byte*>(hit)
                                    - bytes.data());
        if (!is_soi_at(bytes, pos)) {
            pos += 1U;
            continue;
        }

        result.candidates += 1U;
        uint64_t end = 0;
        if (locate_jpeg_end(bytes, pos, limits, &end) == CandidateStatus::Ok) {
            if (out) {
                CarveCandidate c;
                c.start = pos;
                c.end   = end;
                out->push_back(c);
            }
        } else {
            result.unterminated += 1U;
        }
        // Every occurrence is a candidate, including ones nested in another.
        pos += 1U;
    }
    return result;
}


bool
validate_jpeg_candidate(std::span<const std::byte> candidate,
                        const CarveLimits& limits) noexcept
{
    const uint64_t size = static_cast<uint64_t>(candidate.size());
    if (size < 6U || size < limits.min_artifact_bytes
        || size > limits.max_artifact_bytes) {
        return false;
    }
    if (!is_soi_at(candidate, 0)) {
        return false;
    }
    if (u8(candidate[size - 2U]) != 0xFFU || u8(candidate[size - 1U]) != 0xD9U) {
        return false;
    }
    if (u8(candidate[2]) != 0xFFU || !is_leading_segment_marker(u8(candidate[3]))) {
        return false;
    }
    uint16_t seg_len = 0;
    if (!read_u16be(candidate, 4, &seg_len) || seg_len < 2U) {
        return false;
    }
    // The first segment must end before the EOI.
    return 4U + static_cast<uint64_t>(seg_len) <= size - 2U;
}


CarveResult
carve_chunk(std::span<const std::byte> chunk_bytes, uint64_t primary_length,
            uint64_t base_offset, const CarveOptions& options,
            std::vector<Artifact>* out)
{
    const uint64_t size = static_cast<uint64_t>(chunk_bytes.size());
    if (primary_length > size) {
        CarveResult bad;
        bad.status = CarveStatus::Malformed;
        return bad;
    }

    std::vector<CarveCandidate> candidates;
    CarveResult result = find_jpeg_candidates(chunk_bytes, size,
                                              options.limits, &candidates);

    for (const CarveCandidate& c : candidates) {
        // Candidates starting in the overlap tail belong to the next chunk.
        if (!owns_candidate(c, primary_length)) {
            result.foreign += 1U;
            continue;
        }
        const std::span<const std::byte> bytes
            = chunk_bytes.subspan(static_cast<size_t>(c.start),
                                  static_cast<size_t>(c.size()));
        if (!validate_jpeg_candidate(bytes, options.limits)) {
            result.rejected += 1U;
            continue;
        }
        if (result.emitted >= options.limits.max_artifacts) {
            result.dropped += 1U;
            result.status = CarveStatus::LimitExceeded;
            continue;
        }

        result.emitted += 1U;
        if (!out) {
            continue;
        }
        Artifact a;
        a.absolute_start = base_offset + c.start;
        a.payload.assign(bytes.begin(), bytes.end());
        if (options.compute_fingerprints) {
            a.has_fingerprint = compute_fingerprint(bytes, &a.fingerprint);
        }
        out->push_back(std::move(a));
    }
    return result;
}


const char*
carve_status_name(CarveStatus status) noexcept
{
    switch (status) {
    case CarveStatus::Ok: return "ok";
    case CarveStatus::LimitExceeded: return "limit_exceeded";
    case CarveStatus::Malformed: return "malformed";
    }
    return "unknown";
}

}  // namespace carvenet
