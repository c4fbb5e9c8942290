#pragma once

#include "carvenet/frame_channel.h"
#include "carvenet/jpeg_carve.h"

#include <cstdint>
#include <string>

/**
 * \file worker.h
 * \brief Worker session: pulls chunks from a coordinator and carves them.
 */

namespace carvenet {

struct WorkerOptions final {
    std::string host = "127.0.0.1";
    uint16_t port    = 5000;
    /// Sent in `hello`; defaults to `<hostname>-<pid>` when empty.
    std::string worker_id;
    /// Sent in `hello`; defaults to the local host name when empty.
    std::string hostname;

    CarveOptions carve;
    FrameLimits frame_limits;
};

enum class WorkerStatus : uint8_t {
    /// The coordinator sent `stop` after the last chunk.
    Ok,
    ConnectFailed,
    /// No `welcome` (connection dropped or malformed reply).
    HandshakeFailed,
    /// The coordinator answered `hello` with `stop`.
    Rejected,
    /// Unexpected or malformed message, or chunk bytes of the wrong length.
    ProtocolError,
    /// The connection failed mid-session.
    TransportError,
};

struct WorkerReport final {
    WorkerStatus status       = WorkerStatus::Ok;
    TransportStatus transport = TransportStatus::Ok;
    uint32_t session_id       = 0;

    uint32_t chunks_processed = 0;
    uint64_t chunk_bytes      = 0;
    uint64_t artifacts_sent   = 0;
    uint64_t artifact_bytes   = 0;

    /// Carve counters summed over all chunks.
    uint64_t candidates   = 0;
    uint64_t rejected     = 0;
    uint64_t unterminated = 0;
    uint64_t foreign      = 0;
    uint64_t dropped      = 0;
};

/**
 * \brief Runs one worker session to completion.
 *
 * Connects, sends `hello`, then repeats `request_task` -> `task` + chunk
 * bytes -> carve -> `result` + artifacts until the coordinator sends `stop`.
 * Blocks the calling thread; there is no reconnection.
 */
WorkerReport
run_worker(const WorkerOptions& options);

/// `<hostname>-<pid>`.
std::string
default_worker_id();
/// Local host name, or "unknown".
std::string
local_hostname();

const char*
worker_status_name(WorkerStatus status) noexcept;

}  // namespace carvenet
