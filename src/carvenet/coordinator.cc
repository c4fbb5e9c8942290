#include "carvenet/coordinator.h"

#include "carvenet/control_message.h"
#include "carvenet/fingerprint.h"
#include "carvenet/frame_channel.h"

#include <utility>

#include <boost/asio/error.hpp>
#include <boost/asio/ip/address.hpp>

namespace carvenet {

namespace asio = boost::asio;
using tcp      = asio::ip::tcp;

namespace {

    // Poll period for the non-blocking acceptor and the dispatch wait.
    static constexpr std::chrono::milliseconds kPollInterval { 10 };

}  // namespace

struct Coordinator::Session final {
    Session(tcp::socket socket, const FrameLimits& limits)
        : channel(std::move(socket), limits)
    {
    }

    FrameChannel channel;
    uint32_t session_id = 0;
    std::string worker_id;
    std::string hostname;
    bool rejected = false;
};


Coordinator::Coordinator(const CoordinatorOptions& options,
                         ArtifactStore* store, ProgressListener* listener)
    : options_(options)
    , store_(store)
    , listener_(listener)
    , acceptor_(io_)
    , window_(options.clock,
              std::chrono::duration_cast<Clock::duration>(
                  options.registration_window),
              options.expected_workers)
{
}


Coordinator::~Coordinator()
{
    close_listener();
    for (std::thread& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
}


CoordinatorStatus
Coordinator::fail(CoordinatorStatus status) noexcept
{
    status_ = status;
    state_.store(CoordinatorState::Failed);
    return status;
}


CoordinatorState
Coordinator::state() const noexcept
{
    return state_.load();
}


CoordinatorStatus
Coordinator::open_source(const char* path)
{
    if (state_.load() != CoordinatorState::Init) {
        return CoordinatorStatus::InvalidState;
    }
    state_.store(CoordinatorState::LoadingSource);
    if (!path || !*path) {
        return fail(CoordinatorStatus::SourceUnreadable);
    }
    if (source_.open_file(path, options_.max_file_bytes)
        != ByteSourceStatus::Ok) {
        return fail(CoordinatorStatus::SourceUnreadable);
    }
    return CoordinatorStatus::Ok;
}


CoordinatorStatus
Coordinator::use_source(ByteSource source)
{
    if (state_.load() != CoordinatorState::Init) {
        return CoordinatorStatus::InvalidState;
    }
    state_.store(CoordinatorState::LoadingSource);
    if (!source.is_open()) {
        return fail(CoordinatorStatus::SourceUnreadable);
    }
    source_ = std::move(source);
    return CoordinatorStatus::Ok;
}


bool
Coordinator::plan_for_workers(uint32_t worker_count)
{
    const uint64_t overlap = options_.plan.overlap_size;
    uint64_t chunk         = options_.plan.chunk_size;
    if (chunk == 0U) {
        chunk = even_chunk_size(source_.size(), worker_count, overlap);
        const uint64_t cap = options_.frame_limits.max_frame_bytes - overlap;
        if (chunk > cap) {
            chunk = cap;
        }
    }

    std::vector<ChunkDescriptor> plan;
    if (plan_chunks(source_.size(), chunk, overlap, &plan) != PlanStatus::Ok) {
        return false;
    }
    for (const ChunkDescriptor& c : plan) {
        if (!chunk_transfer_fits_frame(c,
                                       options_.frame_limits.max_frame_bytes)) {
            return false;
        }
    }
    chunk_size_ = chunk;
    queue_      = std::make_unique<ChunkQueue>(std::move(plan));
    return true;
}


CoordinatorStatus
Coordinator::listen()
{
    if (state_.load() != CoordinatorState::LoadingSource
        || !source_.is_open()) {
        return CoordinatorStatus::InvalidState;
    }

    const uint64_t max_frame = options_.frame_limits.max_frame_bytes;
    const uint64_t overlap   = options_.plan.overlap_size;
    if (!store_ || max_frame == 0U || max_frame > kMaxFramePayloadBytes) {
        return fail(CoordinatorStatus::InvalidConfig);
    }
    if (options_.plan.chunk_size != 0U) {
        if (!plan_for_workers(1U)) {
            return fail(CoordinatorStatus::InvalidConfig);
        }
    } else if (overlap >= max_frame || max_frame - overlap <= overlap) {
        // Auto sizing needs room for a primary span longer than the overlap.
        return fail(CoordinatorStatus::InvalidConfig);
    }

    boost::system::error_code ec;
    const asio::ip::address address
        = asio::ip::make_address(options_.bind_address, ec);
    if (ec) {
        return fail(CoordinatorStatus::InvalidConfig);
    }
    const tcp::endpoint endpoint(address, options_.port);
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor_.bind(endpoint, ec);
    }
    if (!ec) {
        acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    }
    if (!ec) {
        acceptor_.non_blocking(true, ec);
    }
    if (ec) {
        close_listener();
        return fail(CoordinatorStatus::ListenFailed);
    }
    bound_port_ = acceptor_.local_endpoint(ec).port();
    if (ec) {
        close_listener();
        return fail(CoordinatorStatus::ListenFailed);
    }

    state_.store(CoordinatorState::AwaitingWorkers);
    return CoordinatorStatus::Ok;
}


void
Coordinator::close_listener() noexcept
{
    if (!acceptor_.is_open()) {
        return;
    }
    boost::system::error_code ec;
    acceptor_.close(ec);
}


bool
Coordinator::accept_pending()
{
    bool accepted = false;
    while (acceptor_.is_open()) {
        tcp::socket socket(io_);
        boost::system::error_code ec;
        acceptor_.accept(socket, ec);
        if (ec) {
            // would_block: queue drained. Anything else: retry next poll.
            break;
        }
        start_session(std::move(socket));
        accepted = true;
    }
    return accepted;
}


void
Coordinator::start_session(tcp::socket socket)
{
    std::unique_ptr<Session> session
        = std::make_unique<Session>(std::move(socket), options_.frame_limits);
    Session* s = session.get();
    sessions_.push_back(std::move(session));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        live_sessions_ += 1U;
    }
    threads_.emplace_back([this, s] { serve_session(s); });
}


void
Coordinator::emit(const ProgressEvent& event)
{
    if (!listener_) {
        return;
    }
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_->on_progress(event);
}


bool
Coordinator::handshake(Session* s)
{
    std::string text;
    if (s->channel.receive_text(&text, kMaxMessageBytes)
        != TransportStatus::Ok) {
        return false;
    }
    HelloMessage hello;
    if (decode_message(text, &hello) != MessageStatus::Ok
        || hello.protocol != kProtocolVersion) {
        return false;
    }
    s->worker_id = hello.worker_id;
    s->hostname  = hello.hostname;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        const bool allowed = admitting_late_
                             || (registration_open_ && window_.is_open());
        if (!allowed) {
            s->rejected = true;
        } else {
            s->session_id = next_session_id_++;
            window_.note_registered();
        }
    }
    if (s->rejected) {
        return s->channel.send_text(encode_signal(MessageKind::Stop))
               == TransportStatus::Ok;
    }

    ProgressEvent ev;
    ev.kind       = ProgressEventKind::WorkerRegistered;
    ev.session_id = s->session_id;
    ev.worker_id  = s->worker_id;
    ev.hostname   = s->hostname;
    emit(ev);

    WelcomeMessage welcome;
    welcome.session_id = s->session_id;
    return s->channel.send_text(encode_message(welcome))
           == TransportStatus::Ok;
}


bool
Coordinator::serve_chunk(Session* s, const ChunkDescriptor& chunk)
{
    ProgressEvent assigned;
    assigned.kind         = ProgressEventKind::ChunkAssigned;
    assigned.session_id   = s->session_id;
    assigned.worker_id    = s->worker_id;
    assigned.hostname     = s->hostname;
    assigned.chunk_index  = chunk.chunk_index;
    assigned.total_chunks = queue_->total();
    emit(assigned);

    std::span<const std::byte> bytes;
    if (source_.slice(chunk.primary_start, chunk.transfer_length(), &bytes)
        != ByteSourceStatus::Ok) {
        return false;
    }
    TaskMessage task;
    task.chunk = chunk;
    if (s->channel.send_text(encode_message(task)) != TransportStatus::Ok
        || s->channel.send_frame(bytes) != TransportStatus::Ok) {
        return false;
    }

    std::string text;
    if (s->channel.receive_text(&text, kMaxMessageBytes)
        != TransportStatus::Ok) {
        return false;
    }
    ResultMessage result;
    if (decode_message(text, &result) != MessageStatus::Ok
        || result.chunk_index != chunk.chunk_index) {
        return false;
    }

    for (uint32_t i = 0; i < result.recovered_count; ++i) {
        if (s->channel.receive_text(&text, kMaxMessageBytes)
        != TransportStatus::Ok) {
            return false;
        }
        ArtifactMessage header;
        if (decode_message(text, &header) != MessageStatus::Ok) {
            return false;
        }
        // Only artifacts starting in the primary span belong to this chunk.
        if (header.offset < chunk.primary_start
            || header.offset >= chunk.primary_end || header.size == 0U
            || header.size > chunk.overlap_end - header.offset) {
            return false;
        }
        if (options_.max_artifact_bytes != 0U
            && header.size > options_.max_artifact_bytes) {
            return false;
        }

        Artifact artifact;
        if (s->channel.receive_frame(&artifact.payload, header.size)
            != TransportStatus::Ok) {
            return false;
        }
        artifacts_received_.fetch_add(1U);
        if (artifact.payload.size() != header.size) {
            return false;
        }
        Fingerprint fp;
        if (!compute_fingerprint(artifact.payload, &fp)
            || fp != header.sha256) {
            return false;
        }
        artifact.absolute_start  = header.offset;
        artifact.fingerprint     = fp;
        artifact.has_fingerprint = true;

        const AdmitResult admitted = store_->admit(artifact);

        ProgressEvent ev;
        ev.kind            = ProgressEventKind::ArtifactAdmitted;
        ev.session_id      = s->session_id;
        ev.worker_id       = s->worker_id;
        ev.hostname        = s->hostname;
        ev.chunk_index     = chunk.chunk_index;
        ev.artifact_offset = header.offset;
        ev.artifact_size   = header.size;
        ev.admit_status    = admitted.status;
        ev.artifact_name   = admitted.name;
        emit(ev);
    }
    return true;
}


void
Coordinator::end_session(Session* s, bool failed)
{
    bytes_sent_.fetch_add(s->channel.bytes_sent());
    s->channel.close();
    if (s->rejected) {
        workers_rejected_.fetch_add(1U);
    } else if (failed) {
        workers_failed_.fetch_add(1U);
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        live_sessions_ -= 1U;
    }
    dispatch_cv_.notify_all();
}


void
Coordinator::serve_session(Session* s)
{
    if (!handshake(s)) {
        end_session(s, true);
        return;
    }
    if (s->rejected) {
        end_session(s, false);
        return;
    }

    {
        std::unique_lock<std::mutex> lock(mutex_);
        dispatch_cv_.wait(lock, [this] { return dispatch_open_; });
    }

    for (;;) {
        std::string text;
        const TransportStatus ts
            = s->channel.receive_text(&text, kMaxMessageBytes);
        if (ts == TransportStatus::Closed) {
            // The worker left between chunks; nothing was lost.
            end_session(s, false);
            return;
        }
        if (ts != TransportStatus::Ok
            || decode_signal(text, MessageKind::RequestTask)
                   != MessageStatus::Ok) {
            end_session(s, true);
            return;
        }

        ChunkDescriptor chunk;
        if (!queue_->next(&chunk)) {
            const bool sent = s->channel.send_text(
                                  encode_signal(MessageKind::Stop))
                              == TransportStatus::Ok;
            end_session(s, !sent);
            return;
        }
        dispatch_cv_.notify_all();

        ProgressEvent ev;
        ev.session_id   = s->session_id;
        ev.worker_id    = s->worker_id;
        ev.hostname     = s->hostname;
        ev.chunk_index  = chunk.chunk_index;
        ev.total_chunks = queue_->total();
        if (!serve_chunk(s, chunk)) {
            if (queue_->mark_failed(chunk.chunk_index)) {
                ev.kind            = ProgressEventKind::ChunkFailed;
                ev.resolved_chunks = queue_->resolved_count();
                emit(ev);
            }
            end_session(s, true);
            return;
        }
        if (queue_->mark_collected(chunk.chunk_index)) {
            ev.kind            = ProgressEventKind::ChunkCollected;
            ev.resolved_chunks = queue_->resolved_count();
            emit(ev);
        }
    }
}


CoordinatorReport
Coordinator::run()
{
    CoordinatorReport report;
    if (state_.load() != CoordinatorState::AwaitingWorkers) {
        report.state  = state_.load();
        report.status = (report.state == CoordinatorState::Failed)
                            ? status_
                            : CoordinatorStatus::InvalidState;
        return report;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        window_.open();
        registration_open_ = true;
    }
    for (;;) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!window_.is_open()) {
                break;
            }
        }
        accept_pending();
        std::this_thread::sleep_for(kPollInterval);
    }

    const bool admit_late = options_.late_workers == LateWorkerPolicy::Admit;
    uint32_t registered   = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        window_.close();
        registration_open_ = false;
        admitting_late_    = admit_late;
        registered         = window_.registered();
    }
    if (!admit_late) {
        close_listener();
    }

    if (!queue_ && !plan_for_workers(registered == 0U ? 1U : registered)) {
        status_ = CoordinatorStatus::InvalidConfig;
        queue_  = std::make_unique<ChunkQueue>(std::vector<ChunkDescriptor>());
    }

    state_.store(CoordinatorState::Distributing);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dispatch_open_ = true;
    }
    dispatch_cv_.notify_all();

    if (admit_late) {
        const Clock& clock = options_.clock ? *options_.clock : default_clock();
        const Clock::duration grace
            = std::chrono::duration_cast<Clock::duration>(
                options_.late_worker_grace);
        Clock::time_point idle_since = clock.now();
        while (queue_->pending_count() != 0U) {
            accept_pending();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (live_sessions_ != 0U) {
                    idle_since = clock.now();
                } else if (clock.now() - idle_since >= grace) {
                    break;
                }
            }
            std::this_thread::sleep_for(kPollInterval);
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            admitting_late_ = false;
        }
        close_listener();
    }

    {
        std::unique_lock<std::mutex> lock(mutex_);
        while (live_sessions_ != 0U && queue_->pending_count() != 0U) {
            dispatch_cv_.wait_for(lock, kPollInterval);
        }
    }
    state_.store(CoordinatorState::Collecting);

    for (std::thread& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }

    // Chunks nobody pulled (no worker left) are unresolved coverage.
    const std::vector<uint32_t> abandoned = queue_->fail_pending();
    for (const uint32_t index : abandoned) {
        ProgressEvent ev;
        ev.kind            = ProgressEventKind::ChunkFailed;
        ev.chunk_index     = index;
        ev.total_chunks    = queue_->total();
        ev.resolved_chunks = queue_->resolved_count();
        emit(ev);
    }
    state_.store(CoordinatorState::Done);

    report.state            = CoordinatorState::Done;
    report.status           = status_;
    report.source_bytes     = source_.size();
    report.chunk_size       = chunk_size_;
    report.total_chunks     = queue_->total();
    report.collected_chunks = queue_->collected_count();
    report.missing_chunks   = queue_->missing_chunks();

    report.artifacts_received  = artifacts_received_.load();
    report.artifacts_accepted  = store_->accepted_count();
    report.artifacts_duplicate = store_->duplicate_count();
    report.persist_failures    = store_->failed_count();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        report.workers_registered = window_.registered();
    }
    report.workers_failed   = workers_failed_.load();
    report.workers_rejected = workers_rejected_.load();
    report.bytes_sent       = bytes_sent_.load();
    return report;
}


const char*
coordinator_state_name(CoordinatorState state) noexcept
{
    switch (state) {
    case CoordinatorState::Init: return "init";
    case CoordinatorState::LoadingSource: return "loading_source";
    case CoordinatorState::AwaitingWorkers: return "awaiting_workers";
    case CoordinatorState::Distributing: return "distributing";
    case CoordinatorState::Collecting: return "collecting";
    case CoordinatorState::Done: return "done";
    case CoordinatorState::Failed: return "failed";
    }
    return "unknown";
}


const char*
coordinator_status_name(CoordinatorStatus status) noexcept
{
    switch (status) {
    case CoordinatorStatus::Ok: return "ok";
    case CoordinatorStatus::InvalidConfig: return "invalid_config";
    case CoordinatorStatus::SourceUnreadable: return "source_unreadable";
    case CoordinatorStatus::ListenFailed: return "listen_failed";
    case CoordinatorStatus::InvalidState: return "invalid_state";
    }
    return "unknown";
}


const char*
late_worker_policy_name(LateWorkerPolicy policy) noexcept
{
    switch (policy) {
    case LateWorkerPolicy::Reject: return "reject";
    case LateWorkerPolicy::Admit: return "admit";
    }
    return "unknown";
}


const char*
progress_event_kind_name(ProgressEventKind kind) noexcept
{
    switch (kind) {
    case ProgressEventKind::WorkerRegistered: return "worker_registered";
    case ProgressEventKind::ChunkAssigned: return "chunk_assigned";
    case ProgressEventKind::ArtifactAdmitted: return "artifact_admitted";
    case ProgressEventKind::ChunkCollected: return "chunk_collected";
    case ProgressEventKind::ChunkFailed: return "chunk_failed";
    }
    return "unknown";
}

}  // namespace carvenet
