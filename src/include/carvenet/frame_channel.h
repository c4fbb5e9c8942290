#pragma once

#include "carvenet/frame_codec.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

/**
 * \file frame_channel.h
 * \brief Blocking duplex frame transport over a connected TCP socket.
 */

namespace carvenet {

/// Transport failure classes. Any non-Ok status ends the session.
enum class TransportStatus : uint8_t {
    Ok,
    /// The peer closed the connection cleanly at a frame boundary.
    Closed,
    /// The connection ended inside a frame (header or payload).
    Truncated,
    /// The declared length exceeds \ref FrameLimits::max_frame_bytes.
    FrameTooLarge,
    /// Connect/read/write failed for another reason.
    IoError,
};

/**
 * \brief Sends and receives whole frames on one connection.
 *
 * Calls block until the full frame is transferred or the connection fails.
 * Frames are delivered FIFO; nothing survives a reconnection. A channel is
 * used by one thread at a time.
 */
class FrameChannel final {
public:
    explicit FrameChannel(boost::asio::ip::tcp::socket socket,
                          const FrameLimits& limits = FrameLimits {});

    FrameChannel(const FrameChannel&)            = delete;
    FrameChannel& operator=(const FrameChannel&) = delete;

    /// Sends one frame; the payload is written directly (no copy).
    TransportStatus send_frame(std::span<const std::byte> payload) noexcept;
    /// Sends \p text (UTF-8) as one frame.
    TransportStatus send_text(std::string_view text) noexcept;

    /**
     * \brief Receives one frame into \p out (resized to the payload length).
     *
     * A prefix above \p max_bytes (0 = the channel's frame limit) fails with
     * \ref TransportStatus::FrameTooLarge before anything is allocated. The
     * stream is then out of sync and the connection should be dropped.
     */
    TransportStatus receive_frame(std::vector<std::byte>* out,
                                  uint64_t max_bytes = 0);
    /// Receives one frame into \p out as text; \p max_bytes as above.
    TransportStatus receive_text(std::string* out, uint64_t max_bytes = 0);

    /// Shuts down and closes the socket (idempotent).
    void close() noexcept;
    bool is_open() const noexcept;

    /// `address:port` of the peer, or empty if unknown.
    std::string peer() const;

    uint64_t bytes_sent() const noexcept { return bytes_sent_; }
    uint64_t bytes_received() const noexcept { return bytes_received_; }

private:
    TransportStatus read_exact(std::byte* dst, size_t size,
                               bool frame_started) noexcept;

    boost::asio::ip::tcp::socket socket_;
    FrameLimits limits_;
    uint64_t bytes_sent_     = 0;
    uint64_t bytes_received_ = 0;
};

/// Resolves \p host and connects \p out to the first reachable endpoint.
TransportStatus
connect_tcp(boost::asio::io_context& io, std::string_view host, uint16_t port,
            boost::asio::ip::tcp::socket* out);

const char*
transport_status_name(TransportStatus status) noexcept;

}  // namespace carvenet
