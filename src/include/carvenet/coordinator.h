#pragma once

#include "carvenet/artifact_store.h"
#include "carvenet/byte_source.h"
#include "carvenet/chunk_plan.h"
#include "carvenet/chunk_queue.h"
#include "carvenet/frame_codec.h"
#include "carvenet/registration_window.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

/**
 * \file coordinator.h
 * \brief Coordinator: registration, chunk dispatch and artifact collection.
 */

namespace carvenet {

enum class CoordinatorState : uint8_t {
    Init,
    LoadingSource,
    AwaitingWorkers,
    Distributing,
    Collecting,
    Done,
    /// Configuration, source or listen failure before any worker interaction.
    Failed,
};

enum class CoordinatorStatus : uint8_t {
    Ok,
    InvalidConfig,
    SourceUnreadable,
    ListenFailed,
    /// Call made in the wrong state (e.g. \ref Coordinator::run before listen).
    InvalidState,
};

/// What happens to workers that finish the handshake after the window ends.
enum class LateWorkerPolicy : uint8_t {
    /// The listener is closed when the window ends; late handshakes get `stop`.
    Reject,
    /// The listener stays open while chunks remain unassigned.
    Admit,
};

struct CoordinatorOptions final {
    std::string bind_address = "0.0.0.0";
    /// 0 binds an ephemeral port (see \ref Coordinator::port).
    uint16_t port = 5000;

    PlanOptions plan;
    FrameLimits frame_limits;

    std::chrono::milliseconds registration_window { 30000 };
    /// Ends the window early once this many workers registered (0 = never).
    uint32_t expected_workers     = 0;
    LateWorkerPolicy late_workers = LateWorkerPolicy::Reject;
    /// With \ref LateWorkerPolicy::Admit, stop waiting for workers once no
    /// session has been live for this long.
    std::chrono::milliseconds late_worker_grace { 30000 };

    /// Cap on the mapped image size (0 = unlimited).
    uint64_t max_file_bytes = 0;
    /// Larger artifacts are a protocol violation (0 = frame limit only).
    uint64_t max_artifact_bytes = 0;

    /// Time source for the registration window and the late-worker grace
    /// (null = steady clock).
    const Clock* clock = nullptr;
};

enum class ProgressEventKind : uint8_t {
    WorkerRegistered,
    ChunkAssigned,
    ArtifactAdmitted,
    ChunkCollected,
    ChunkFailed,
};

/// One progress notification. Views are only valid during the callback.
struct ProgressEvent final {
    ProgressEventKind kind = ProgressEventKind::WorkerRegistered;
    uint32_t session_id    = 0;
    std::string_view worker_id;
    std::string_view hostname;
    uint32_t chunk_index = 0;

    /// ArtifactAdmitted only.
    uint64_t artifact_offset = 0;
    uint64_t artifact_size   = 0;
    AdmitStatus admit_status = AdmitStatus::Accepted;
    std::string_view artifact_name;

    /// ChunkCollected/ChunkFailed: chunks resolved so far, and the total.
    uint32_t resolved_chunks = 0;
    uint32_t total_chunks    = 0;
};

/**
 * \brief Receives progress events from a coordinator run.
 *
 * Events arrive from session threads; the coordinator serializes the calls.
 */
class ProgressListener {
public:
    virtual ~ProgressListener() = default;

    virtual void on_progress(const ProgressEvent& event) noexcept = 0;
};

struct CoordinatorReport final {
    CoordinatorState state   = CoordinatorState::Init;
    CoordinatorStatus status = CoordinatorStatus::Ok;

    uint64_t source_bytes = 0;
    uint64_t chunk_size   = 0;
    uint32_t total_chunks = 0;
    uint32_t collected_chunks = 0;
    /// Sorted indices of chunks never collected.
    std::vector<uint32_t> missing_chunks;

    uint64_t artifacts_received  = 0;
    uint64_t artifacts_accepted  = 0;
    uint64_t artifacts_duplicate = 0;
    uint64_t persist_failures    = 0;

    uint32_t workers_registered = 0;
    /// Sessions ended by a transport, protocol or verification failure.
    uint32_t workers_failed = 0;
    /// Handshakes completed after registration closed.
    uint32_t workers_rejected = 0;

    uint64_t bytes_sent = 0;
};

/**
 * \brief Drives one carving run over a byte source.
 *
 * Usage: \ref open_source (or \ref use_source), \ref listen, then \ref run.
 * \ref run blocks until every chunk is collected or failed. Each registered
 * worker is served by its own session thread pulling chunks from a shared
 * \ref ChunkQueue; artifacts are streamed into the \ref ArtifactStore as
 * they arrive, after their size and SHA-256 were verified.
 *
 * There is no retry: a chunk whose session fails is reported missing.
 */
class Coordinator final {
public:
    Coordinator(const CoordinatorOptions& options, ArtifactStore* store,
                ProgressListener* listener = nullptr);
    ~Coordinator();

    Coordinator(const Coordinator&)            = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    CoordinatorStatus open_source(const char* path);
    CoordinatorStatus use_source(ByteSource source);

    /// Validates the configuration, plans chunks and binds the listener.
    CoordinatorStatus listen();

    CoordinatorReport run();

    CoordinatorState state() const noexcept;
    /// Bound listener port (valid after a successful \ref listen).
    uint16_t port() const noexcept { return bound_port_; }
    const ByteSource& source() const noexcept { return source_; }

private:
    struct Session;

    CoordinatorStatus fail(CoordinatorStatus status) noexcept;
    bool accept_pending();
    void start_session(boost::asio::ip::tcp::socket socket);
    void serve_session(Session* session);
    /// False if the session failed; sets `rejected` on late handshakes.
    bool handshake(Session* session);
    bool serve_chunk(Session* session, const ChunkDescriptor& chunk);
    void end_session(Session* session, bool failed);
    bool plan_for_workers(uint32_t worker_count);
    void emit(const ProgressEvent& event);
    void close_listener() noexcept;

    CoordinatorOptions options_;
    ArtifactStore* store_       = nullptr;
    ProgressListener* listener_ = nullptr;

    ByteSource source_;
    std::unique_ptr<ChunkQueue> queue_;
    uint64_t chunk_size_ = 0;

    boost::asio::io_context io_;
    boost::asio::ip::tcp::acceptor acceptor_;
    uint16_t bound_port_ = 0;

    std::atomic<CoordinatorState> state_ { CoordinatorState::Init };
    CoordinatorStatus status_ = CoordinatorStatus::Ok;

    // Guards registration and dispatch gating below.
    std::mutex mutex_;
    std::condition_variable dispatch_cv_;
    RegistrationWindow window_;
    bool registration_open_ = false;
    bool admitting_late_    = false;
    bool dispatch_open_     = false;
    uint32_t next_session_id_ = 1;
    uint32_t live_sessions_   = 0;

    std::mutex listener_mutex_;

    std::vector<std::unique_ptr<Session>> sessions_;
    std::vector<std::thread> threads_;

    std::atomic<uint64_t> artifacts_received_ { 0 };
    std::atomic<uint64_t> bytes_sent_ { 0 };
    std::atomic<uint32_t> workers_failed_ { 0 };
    std::atomic<uint32_t> workers_rejected_ { 0 };
};

const char*
coordinator_state_name(CoordinatorState state) noexcept;
const char*
coordinator_status_name(CoordinatorStatus status) noexcept;
const char*
late_worker_policy_name(LateWorkerPolicy policy) noexcept;
const char*
progress_event_kind_name(ProgressEventKind kind) noexcept;

}  // namespace carvenet
