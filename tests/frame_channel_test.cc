#include "carvenet/frame_channel.h"

#include <gtest/gtest.h>

#include <array>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio/ip/address.hpp>
#include <boost/asio/write.hpp>

namespace carvenet {
namespace {

    namespace asio = boost::asio;
    using tcp      = asio::ip::tcp;

    // Connected loopback socket pair.
    struct Loopback final {
        asio::io_context io;
        tcp::socket client { io };
        tcp::socket server { io };

        bool open()
        {
            tcp::acceptor acceptor(io,
                                   tcp::endpoint(asio::ip::make_address(
                                                     "127.0.0.1"),
                                                 0));
            const uint16_t port = acceptor.local_endpoint().port();
            if (connect_tcp(io, "127.0.0.1", port, &client)
                != TransportStatus::Ok) {
                return false;
            }
            boost::system::error_code ec;
            acceptor.accept(server, ec);
            return !ec;
        }
    };


    static std::vector<std::byte> make_payload(size_t n)
    {
        std::vector<std::byte> out(n);
        for (size_t i = 0; i < n; ++i) {
            out[i] = std::byte { static_cast<uint8_t>((i * 31U) & 0xFFU) };
        }
        return out;
    }

}  // namespace


TEST(FrameChannel, RoundTripsEmptyLargeAndTextFrames)
{
    Loopback lb;
    ASSERT_TRUE(lb.open());
    FrameChannel tx(std::move(lb.client));
    FrameChannel rx(std::move(lb.server));

    const std::vector<std::byte> large = make_payload(6U * 1024U * 1024U + 3U);
    TransportStatus sent[3] = { TransportStatus::IoError,
                                TransportStatus::IoError,
                                TransportStatus::IoError };
    std::thread sender([&] {
        sent[0] = tx.send_frame({});
        sent[1] = tx.send_frame(large);
        sent[2] = tx.send_text("type=stop");
    });

    std::vector<std::byte> got;
    EXPECT_EQ(rx.receive_frame(&got), TransportStatus::Ok);
    EXPECT_TRUE(got.empty());
    EXPECT_EQ(rx.receive_frame(&got), TransportStatus::Ok);
    EXPECT_EQ(got, large);
    std::string text;
    EXPECT_EQ(rx.receive_text(&text), TransportStatus::Ok);
    EXPECT_EQ(text, "type=stop");
    sender.join();

    for (const TransportStatus s : sent) {
        EXPECT_EQ(s, TransportStatus::Ok);
    }
    EXPECT_EQ(tx.bytes_sent(), 3U * kFrameHeaderBytes + large.size() + 9U);
    EXPECT_EQ(rx.bytes_received(), tx.bytes_sent());
}


TEST(FrameChannel, ReportsCloseAtFrameBoundary)
{
    Loopback lb;
    ASSERT_TRUE(lb.open());
    FrameChannel tx(std::move(lb.client));
    FrameChannel rx(std::move(lb.server));

    ASSERT_EQ(tx.send_text("type=request_task"), TransportStatus::Ok);
    tx.close();
    EXPECT_FALSE(tx.is_open());

    std::string text;
    EXPECT_EQ(rx.receive_text(&text), TransportStatus::Ok);
    EXPECT_EQ(rx.receive_text(&text), TransportStatus::Closed);
    EXPECT_TRUE(text.empty());
}


TEST(FrameChannel, ReportsTruncatedPayload)
{
    Loopback lb;
    ASSERT_TRUE(lb.open());
    FrameChannel rx(std::move(lb.server));

    // Declares 100 bytes, delivers 10.
    std::vector<std::byte> raw = { std::byte { 0 }, std::byte { 0 },
                                   std::byte { 0 }, std::byte { 100 } };
    raw.resize(raw.size() + 10U, std::byte { 0x55 });
    asio::write(lb.client, asio::buffer(raw.data(), raw.size()));
    lb.client.close();

    std::vector<std::byte> got;
    EXPECT_EQ(rx.receive_frame(&got), TransportStatus::Truncated);
    EXPECT_TRUE(got.empty());
}


TEST(FrameChannel, ReportsTruncatedHeader)
{
    Loopback lb;
    ASSERT_TRUE(lb.open());
    FrameChannel rx(std::move(lb.server));

    const std::array<std::byte, 2> raw = { std::byte { 0 }, std::byte { 0 } };
    asio::write(lb.client, asio::buffer(raw.data(), raw.size()));
    lb.client.close();

    std::vector<std::byte> got;
    EXPECT_EQ(rx.receive_frame(&got), TransportStatus::Truncated);
}


TEST(FrameChannel, RejectsOversizedFrame)
{
    Loopback lb;
    ASSERT_TRUE(lb.open());
    FrameLimits limits;
    limits.max_frame_bytes = 16;
    FrameChannel tx(std::move(lb.client));
    FrameChannel rx(std::move(lb.server), limits);

    ASSERT_EQ(tx.send_frame(make_payload(17)), TransportStatus::Ok);
    std::vector<std::byte> got;
    EXPECT_EQ(rx.receive_frame(&got), TransportStatus::FrameTooLarge);
}


TEST(FrameChannel, PerCallBoundRejectsBeforeAllocating)
{
    Loopback lb;
    ASSERT_TRUE(lb.open());
    FrameChannel rx(std::move(lb.server));

    // Prefix announcing ~1 GiB, below the default frame limit, no payload.
    const std::array<uint8_t, 4> prefix = { 0x3F, 0xFF, 0xFF, 0xF0 };
    boost::system::error_code ec;
    asio::write(lb.client, asio::buffer(prefix), ec);
    ASSERT_FALSE(ec);

    std::vector<std::byte> got(8, std::byte { 1 });
    EXPECT_EQ(rx.receive_frame(&got, 200), TransportStatus::FrameTooLarge);
    EXPECT_TRUE(got.empty());
    EXPECT_EQ(rx.bytes_received(), kFrameHeaderBytes);
}


TEST(FrameChannel, TextBoundAppliesToControlFrames)
{
    Loopback lb;
    ASSERT_TRUE(lb.open());
    FrameChannel tx(std::move(lb.client));
    FrameChannel rx(std::move(lb.server));

    ASSERT_EQ(tx.send_text(std::string(64, 'x')), TransportStatus::Ok);
    ASSERT_EQ(tx.send_text(std::string(65, 'x')), TransportStatus::Ok);
    std::string text;
    EXPECT_EQ(rx.receive_text(&text, 64), TransportStatus::Ok);
    EXPECT_EQ(text.size(), 64U);
    EXPECT_EQ(rx.receive_text(&text, 64), TransportStatus::FrameTooLarge);
    EXPECT_TRUE(text.empty());
}


TEST(FrameChannel, ConnectFailsWithoutListener)
{
    asio::io_context io;
    uint16_t port = 0;
    {
        tcp::acceptor acceptor(io, tcp::endpoint(asio::ip::make_address(
                                                     "127.0.0.1"),
                                                 0));
        port = acceptor.local_endpoint().port();
    }
    tcp::socket socket(io);
    EXPECT_EQ(connect_tcp(io, "127.0.0.1", port, &socket),
              TransportStatus::IoError);
    EXPECT_EQ(connect_tcp(io, "", port, &socket), TransportStatus::IoError);
}

}  // namespace carvenet
