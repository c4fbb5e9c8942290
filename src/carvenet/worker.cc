#include "carvenet/worker.h"

#include "carvenet/control_message.h"

#include <utility>
#include <vector>

#include <unistd.h>

namespace carvenet {

namespace {

    static WorkerReport& fail_with(WorkerReport& report, WorkerStatus status,
                                   TransportStatus transport) noexcept
    {
        report.status    = status;
        report.transport = transport;
        return report;
    }


    static void add_counters(const CarveResult& r, WorkerReport* report) noexcept
    {
        report->candidates += r.candidates;
        report->rejected += r.rejected;
        report->unterminated += r.unterminated;
        report->foreign += r.foreign;
        report->dropped += r.dropped;
    }


    static TransportStatus send_artifacts(FrameChannel* channel,
                                          const std::vector<Artifact>& artifacts,
                                          WorkerReport* report)
    {
        for (const Artifact& a : artifacts) {
            ArtifactMessage msg;
            msg.offset = a.absolute_start;
            msg.size   = static_cast<uint64_t>(a.payload.size());
            msg.sha256 = a.fingerprint;
            TransportStatus s = channel->send_text(encode_message(msg));
            if (s != TransportStatus::Ok) {
                return s;
            }
            s = channel->send_frame(a.payload);
            if (s != TransportStatus::Ok) {
                return s;
            }
            report->artifacts_sent += 1U;
            report->artifact_bytes += msg.size;
        }
        return TransportStatus::Ok;
    }

}  // namespace

WorkerReport
run_worker(const WorkerOptions& options)
{
    WorkerReport report;

    boost::asio::io_context io;
    boost::asio::ip::tcp::socket socket(io);
    const TransportStatus connected = connect_tcp(io, options.host,
                                                  options.port, &socket);
    if (connected != TransportStatus::Ok) {
        return fail_with(report, WorkerStatus::ConnectFailed, connected);
    }
    FrameChannel channel(std::move(socket), options.frame_limits);

    HelloMessage hello;
    hello.worker_id = options.worker_id.empty() ? default_worker_id()
                                                : options.worker_id;
    hello.hostname  = options.hostname.empty() ? local_hostname()
                                               : options.hostname;
    TransportStatus ts = channel.send_text(encode_message(hello));
    if (ts != TransportStatus::Ok) {
        return fail_with(report, WorkerStatus::HandshakeFailed, ts);
    }

    std::string text;
    ts = channel.receive_text(&text, kMaxMessageBytes);
    if (ts != TransportStatus::Ok) {
        return fail_with(report, WorkerStatus::HandshakeFailed, ts);
    }
    if (decode_signal(text, MessageKind::Stop) == MessageStatus::Ok) {
        channel.close();
        return fail_with(report, WorkerStatus::Rejected, ts);
    }
    WelcomeMessage welcome;
    if (decode_message(text, &welcome) != MessageStatus::Ok
        || welcome.protocol != kProtocolVersion) {
        channel.close();
        return fail_with(report, WorkerStatus::HandshakeFailed, ts);
    }
    report.session_id = welcome.session_id;

    // The coordinator must not carry fingerprints it cannot verify.
    CarveOptions carve_options         = options.carve;
    carve_options.compute_fingerprints = true;

    std::vector<std::byte> chunk_bytes;
    std::vector<Artifact> artifacts;
    for (;;) {
        ts = channel.send_text(encode_signal(MessageKind::RequestTask));
        if (ts != TransportStatus::Ok) {
            return fail_with(report, WorkerStatus::TransportError, ts);
        }
        ts = channel.receive_text(&text, kMaxMessageBytes);
        if (ts != TransportStatus::Ok) {
            return fail_with(report, WorkerStatus::TransportError, ts);
        }

        MessageKind kind = MessageKind::Stop;
        if (peek_message_kind(text, &kind) != MessageStatus::Ok) {
            channel.close();
            return fail_with(report, WorkerStatus::ProtocolError, ts);
        }
        if (kind == MessageKind::Stop) {
            if (decode_signal(text, MessageKind::Stop) != MessageStatus::Ok) {
                channel.close();
                return fail_with(report, WorkerStatus::ProtocolError, ts);
            }
            break;
        }

        TaskMessage task;
        if (decode_message(text, &task) != MessageStatus::Ok) {
            channel.close();
            return fail_with(report, WorkerStatus::ProtocolError, ts);
        }
        ts = channel.receive_frame(&chunk_bytes,
                                   task.chunk.transfer_length());
        if (ts != TransportStatus::Ok) {
            return fail_with(report, WorkerStatus::TransportError, ts);
        }
        if (chunk_bytes.size() != task.chunk.transfer_length()) {
            channel.close();
            return fail_with(report, WorkerStatus::ProtocolError, ts);
        }

        artifacts.clear();
        const CarveResult carved = carve_chunk(chunk_bytes,
                                               task.chunk.primary_length(),
                                               task.chunk.primary_start,
                                               carve_options, &artifacts);
        add_counters(carved, &report);
        report.chunks_processed += 1U;
        report.chunk_bytes += static_cast<uint64_t>(chunk_bytes.size());

        ResultMessage result;
        result.chunk_index     = task.chunk.chunk_index;
        result.recovered_count = static_cast<uint32_t>(artifacts.size());
        ts = channel.send_text(encode_message(result));
        if (ts == TransportStatus::Ok) {
            ts = send_artifacts(&channel, artifacts, &report);
        }
        if (ts != TransportStatus::Ok) {
            return fail_with(report, WorkerStatus::TransportError, ts);
        }
    }

    channel.close();
    report.status    = WorkerStatus::Ok;
    report.transport = TransportStatus::Ok;
    return report;
}


std::string
local_hostname()
{
    char buf[256] = {};
    if (::gethostname(buf, sizeof(buf) - 1U) != 0 || buf[0] == '\0') {
        return "unknown";
    }
    return std::string(buf);
}


std::string
default_worker_id()
{
    return local_hostname() + "-" + std::to_string(::getpid());
}


const char*
worker_status_name(WorkerStatus status) noexcept
{
    switch (status) {
    case WorkerStatus::Ok: return "ok";
    case WorkerStatus::ConnectFailed: return "connect_failed";
    case WorkerStatus::HandshakeFailed: return "handshake_failed";
    case WorkerStatus::Rejected: return "rejected";
    case WorkerStatus::ProtocolError: return "protocol_error";
    case WorkerStatus::TransportError: return "transport_error";
    }
    return "unknown";
}

}  // namespace carvenet
