#pragma once

#include "carvenet/chunk_plan.h"
#include "carvenet/fingerprint.h"

#include <cstdint>
#include <string>
#include <string_view>

/**
 * \file control_message.h
 * \brief Typed control messages exchanged between coordinator and workers.
 *
 * A control message is one JSON object, for example
 * `{"type":"result","chunk_index":3,"recovered_count":1}`. Every kind has its
 * own record type and decoder, and the decoder requires the exact key set of
 * its kind, so unknown, missing, mistyped or out-of-range fields are rejected
 * where the message enters the process.
 *
 * Session exchange (one frame per line item):
 * \code
 * worker                          coordinator
 *   hello                 ->
 *                         <-      welcome
 *   request_task          ->
 *                         <-      task, <chunk bytes>     (or stop)
 *   result                ->
 *   artifact, <payload>   ->      (recovered_count times)
 *   request_task          ->      ...
 * \endcode
 */

namespace carvenet {

static constexpr uint32_t kProtocolVersion = 1;

/// Longest accepted value for free-form text fields.
static constexpr size_t kMaxTextFieldBytes = 255;

/// Longest accepted control message; also the receive bound for its frame.
static constexpr size_t kMaxMessageBytes = 4096;

enum class MessageKind : uint8_t {
    Hello,
    Welcome,
    RequestTask,
    Task,
    Stop,
    Result,
    Artifact,
};

enum class MessageStatus : uint8_t {
    Ok,
    /// Not a well-formed message of any kind.
    Malformed,
    /// A well-formed message, but not of the requested kind.
    UnexpectedKind,
};

/// Worker capability handshake.
struct HelloMessage final {
    uint32_t protocol = kProtocolVersion;
    std::string worker_id;
    std::string hostname;
};

/// Coordinator's handshake reply.
struct WelcomeMessage final {
    uint32_t protocol   = kProtocolVersion;
    uint32_t session_id = 0;
};

/// Chunk assignment; followed by one binary frame with the chunk bytes.
struct TaskMessage final {
    ChunkDescriptor chunk;
};

/// Completion signal for one chunk.
struct ResultMessage final {
    uint32_t chunk_index     = 0;
    uint32_t recovered_count = 0;
};

/// Artifact header; followed by one binary frame with the payload.
struct ArtifactMessage final {
    uint64_t offset = 0;
    uint64_t size   = 0;
    Fingerprint sha256;
};

std::string
encode_message(const HelloMessage& msg);
std::string
encode_message(const WelcomeMessage& msg);
std::string
encode_message(const TaskMessage& msg);
std::string
encode_message(const ResultMessage& msg);
std::string
encode_message(const ArtifactMessage& msg);
/// Encodes a field-less message (`RequestTask` or `Stop`).
std::string
encode_signal(MessageKind kind);

/// Reads the `type` member without validating the rest of the message.
MessageStatus
peek_message_kind(std::string_view text, MessageKind* out);

MessageStatus
decode_message(std::string_view text, HelloMessage* out);
MessageStatus
decode_message(std::string_view text, WelcomeMessage* out);
MessageStatus
decode_message(std::string_view text, TaskMessage* out);
MessageStatus
decode_message(std::string_view text, ResultMessage* out);
MessageStatus
decode_message(std::string_view text, ArtifactMessage* out);
/// Validates a field-less message of \p kind.
MessageStatus
decode_signal(std::string_view text, MessageKind kind);

const char*
message_kind_name(MessageKind kind) noexcept;
const char*
message_status_name(MessageStatus status) noexcept;

}  // namespace carvenet
