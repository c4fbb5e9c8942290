#include "carvenet/frame_channel.h"

#include <array>
#include <new>
#include <string>
#include <utility>

#include <boost/asio/connect.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

namespace carvenet {

namespace asio = boost::asio;
using tcp      = asio::ip::tcp;

FrameChannel::FrameChannel(tcp::socket socket, const FrameLimits& limits)
    : socket_(std::move(socket))
    , limits_(limits)
{
    boost::system::error_code ec;
    socket_.set_option(tcp::no_delay(true), ec);
}


TransportStatus
FrameChannel::send_frame(std::span<const std::byte> payload) noexcept
{
    if (!socket_.is_open()) {
        return TransportStatus::IoError;
    }
    std::array<std::byte, kFrameHeaderBytes> header {};
    if (encode_frame_header(payload.size(), header) != FrameStatus::Ok) {
        return TransportStatus::FrameTooLarge;
    }

    const std::array<asio::const_buffer, 2> buffers = {
        asio::buffer(header.data(), header.size()),
        asio::buffer(payload.data(), payload.size()),
    };
    boost::system::error_code ec;
    const size_t n = asio::write(socket_, buffers, ec);
    bytes_sent_ += n;
    if (ec) {
        return TransportStatus::IoError;
    }
    return TransportStatus::Ok;
}


TransportStatus
FrameChannel::send_text(std::string_view text) noexcept
{
    return send_frame(std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(text.data()), text.size()));
}


TransportStatus
FrameChannel::read_exact(std::byte* dst, size_t size,
                         bool frame_started) noexcept
{
    if (size == 0U) {
        return TransportStatus::Ok;
    }
    boost::system::error_code ec;
    const size_t n = asio::read(socket_, asio::buffer(dst, size), ec);
    bytes_received_ += n;
    if (!ec && n == size) {
        return TransportStatus::Ok;
    }
    if (ec == asio::error::eof || ec == asio::error::connection_reset) {
        if (!frame_started && n == 0U) {
            return TransportStatus::Closed;
        }
        return TransportStatus::Truncated;
    }
    return TransportStatus::IoError;
}


TransportStatus
FrameChannel::receive_frame(std::vector<std::byte>* out, uint64_t max_bytes)
{
    if (!out || !socket_.is_open()) {
        return TransportStatus::IoError;
    }
    out->clear();

    std::array<std::byte, kFrameHeaderBytes> header {};
    TransportStatus s = read_exact(header.data(), header.size(), false);
    if (s != TransportStatus::Ok) {
        return s;
    }

    FrameLimits limits = limits_;
    if (max_bytes != 0U && max_bytes < limits.max_frame_bytes) {
        limits.max_frame_bytes = max_bytes;
    }
    uint64_t size = 0;
    if (decode_frame_header(header, limits, &size) != FrameStatus::Ok) {
        return TransportStatus::FrameTooLarge;
    }

    try {
        out->resize(static_cast<size_t>(size));
    } catch (const std::bad_alloc&) {
        out->clear();
        return TransportStatus::IoError;
    }
    s = read_exact(out->data(), out->size(), true);
    if (s != TransportStatus::Ok) {
        out->clear();
    }
    return s;
}


TransportStatus
FrameChannel::receive_text(std::string* out, uint64_t max_bytes)
{
    if (!out) {
        return TransportStatus::IoError;
    }
    std::vector<std::byte> payload;
    const TransportStatus s = receive_frame(&payload, max_bytes);
    out->clear();
    if (s != TransportStatus::Ok) {
        return s;
    }
    out->assign(reinterpret_cast<const char*>(payload.data()), payload.size());
    return TransportStatus::Ok;
}


void
FrameChannel::close() noexcept
{
    if (!socket_.is_open()) {
        return;
    }
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}


bool
FrameChannel::is_open() const noexcept
{
    return socket_.is_open();
}


std::string
FrameChannel::peer() const
{
    boost::system::error_code ec;
    const tcp::endpoint ep = socket_.remote_endpoint(ec);
    if (ec) {
        return std::string();
    }
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}


TransportStatus
connect_tcp(asio::io_context& io, std::string_view host, uint16_t port,
            tcp::socket* out)
{
    if (!out || host.empty()) {
        return TransportStatus::IoError;
    }
    boost::system::error_code ec;
    tcp::resolver resolver(io);
    const tcp::resolver::results_type endpoints
        = resolver.resolve(std::string(host), std::to_string(port), ec);
    if (ec) {
        return TransportStatus::IoError;
    }
    tcp::socket socket(io);
    asio::connect(socket, endpoints, ec);
    if (ec) {
        return TransportStatus::IoError;
    }
    *out = std::move(socket);
    return TransportStatus::Ok;
}


const char*
transport_status_name(TransportStatus status) noexcept
{
    switch (status) {
    case TransportStatus::Ok: return "ok";
    case TransportStatus::Closed: return "closed";
    case TransportStatus::Truncated: return "truncated";
    case TransportStatus::FrameTooLarge: return "frame_too_large";
    case TransportStatus::IoError: return "io_error";
    }
    return "unknown";
}

}  // namespace carvenet
