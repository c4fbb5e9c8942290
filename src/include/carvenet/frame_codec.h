#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file frame_codec.h
 * \brief Length-prefixed framing used for all coordinator/worker traffic.
 *
 * Every message on the wire is a 4-byte unsigned big-endian length followed
 * by exactly that many payload bytes. Control messages and binary payloads
 * share this framing; which one a frame carries is known from protocol
 * context only.
 */

namespace carvenet {

static constexpr uint32_t kFrameHeaderBytes = 4;

/// Largest payload a 4-byte length prefix can describe.
static constexpr uint64_t kMaxFramePayloadBytes = 0xFFFFFFFFULL;

/// Receiver-side framing limits.
struct FrameLimits final {
    /// Declared lengths above this are treated as malformed prefixes.
    uint64_t max_frame_bytes = 1024ULL * 1024ULL * 1024ULL;
};

enum class FrameStatus : uint8_t {
    Ok,
    /// Declared (or requested) length exceeds the frame limit.
    TooLarge,
};

/// Writes the big-endian prefix for \p payload_size into \p out[0..3].
FrameStatus
encode_frame_header(uint64_t payload_size,
                    std::span<std::byte, kFrameHeaderBytes> out) noexcept;

/// Reads the prefix in \p header and checks it against \p limits.
FrameStatus
decode_frame_header(std::span<const std::byte, kFrameHeaderBytes> header,
                    const FrameLimits& limits, uint64_t* payload_size) noexcept;

const char*
frame_status_name(FrameStatus status) noexcept;

}  // namespace carvenet
