#include "carvenet/frame_codec.h"

namespace carvenet {
namespace {

    static constexpr uint8_t u8(std::byte b) noexcept
    {
        return static_cast<uint8_t>(b);
    }


    static uint64_t effective_limit(const FrameLimits& limits) noexcept
    {
        return (limits.max_frame_bytes < kMaxFramePayloadBytes)
                   ? limits.max_frame_bytes
                   : kMaxFramePayloadBytes;
    }

}  // namespace

FrameStatus
encode_frame_header(uint64_t payload_size,
                    std::span<std::byte, kFrameHeaderBytes> out) noexcept
{
    if (payload_size > kMaxFramePayloadBytes) {
        return FrameStatus::TooLarge;
    }
    const uint32_t v = static_cast<uint32_t>(payload_size);
    out[0]           = std::byte { static_cast<uint8_t>((v >> 24) & 0xFFU) };
    out[1]           = std::byte { static_cast<uint8_t>((v >> 16) & 0xFFU) };
    out[2]           = std::byte { static_cast<uint8_t>((v >> 8) & 0xFFU) };
    out[3]           = std::byte { static_cast<uint8_t>((v >> 0) & 0xFFU) };
    return FrameStatus::Ok;
}


FrameStatus
decode_frame_header(std::span<const std::byte, kFrameHeaderBytes> header,
                    const FrameLimits& limits, uint64_t* payload_size) noexcept
{
    uint32_t v = 0;
    v |= static_cast<uint32_t>(u8(header[0])) << 24;
    v |= static_cast<uint32_t>(u8(header[1])) << 16;
    v |= static_cast<uint32_t>(u8(header[2])) << 8;
    v |= static_cast<uint32_t>(u8(header[3])) << 0;
    if (payload_size) {
        *payload_size = v;
    }
    if (static_cast<uint64_t>(v) > effective_limit(limits)) {
        return FrameStatus::TooLarge;
    }
    return FrameStatus::Ok;
}


const char*
frame_status_name(FrameStatus status) noexcept
{
    switch (status) {
    case FrameStatus::Ok: return "ok";
    case FrameStatus::TooLarge: return "too_large";
    }
    return "unknown";
}

}  // namespace carvenet
