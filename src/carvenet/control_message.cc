#include "carvenet/control_message.h"

#include <array>
#include <cstddef>
#include <initializer_list>
#include <limits>
#include <string>
#include <utility>

#include <boost/json.hpp>

namespace carvenet {

namespace json = boost::json;

namespace {

    static json::string_view as_json(std::string_view s) noexcept
    {
        return json::string_view(s.data(), s.size());
    }


    static bool is_text_char(char c) noexcept
    {
        const unsigned char u = static_cast<unsigned char>(c);
        return u >= 0x20U && u < 0x7FU;
    }


    // Printable ASCII only, at most kMaxTextFieldBytes.
    static std::string sanitize_text(std::string_view value)
    {
        std::string out;
        const std::string_view kept = value.substr(0, kMaxTextFieldBytes);
        out.reserve(kept.size());
        for (char c : kept) {
            out.push_back(is_text_char(c) ? c : '_');
        }
        return out;
    }


    static bool kind_from_name(std::string_view name, MessageKind* out) noexcept
    {
        static constexpr std::array<MessageKind, 7> kKinds = {
            MessageKind::Hello,  MessageKind::Welcome, MessageKind::RequestTask,
            MessageKind::Task,   MessageKind::Stop,    MessageKind::Result,
            MessageKind::Artifact,
        };
        for (MessageKind k : kKinds) {
            if (name == message_kind_name(k)) {
                *out = k;
                return true;
            }
        }
        return false;
    }


    static bool parse_object(std::string_view text, json::object* out)
    {
        if (text.empty() || text.size() > kMaxMessageBytes) {
            return false;
        }
        boost::system::error_code ec;
        json::value v = json::parse(as_json(text), ec);
        if (ec || !v.is_object()) {
            return false;
        }
        *out = std::move(v.as_object());
        return true;
    }


    static bool kind_of(const json::object& obj, MessageKind* out) noexcept
    {
        const json::value* type = obj.if_contains("type");
        if (!type || !type->is_string()) {
            return false;
        }
        const json::string& name = type->get_string();
        return kind_from_name(std::string_view(name.data(), name.size()), out);
    }


    /// True if \p obj holds exactly `type` plus \p keys.
    static bool has_exact_keys(const json::object& obj,
                               std::initializer_list<std::string_view> keys)
    {
        if (obj.size() != keys.size() + 1U) {
            return false;
        }
        for (std::string_view k : keys) {
            if (!obj.contains(as_json(k))) {
                return false;
            }
        }
        return true;
    }


    static bool take_u64(const json::object& obj, std::string_view key,
                         uint64_t* out) noexcept
    {
        const json::value* v = obj.if_contains(as_json(key));
        if (!v) {
            return false;
        }
        // Fractions, exponents and out-of-range numbers parse as double.
        if (const uint64_t* u = v->if_uint64()) {
            *out = *u;
            return true;
        }
        if (const int64_t* i = v->if_int64()) {
            if (*i < 0) {
                return false;
            }
            *out = static_cast<uint64_t>(*i);
            return true;
        }
        return false;
    }


    static bool take_u32(const json::object& obj, std::string_view key,
                         uint32_t* out) noexcept
    {
        uint64_t v = 0;
        if (!take_u64(obj, key, &v) || v > std::numeric_limits<uint32_t>::max()) {
            return false;
        }
        *out = static_cast<uint32_t>(v);
        return true;
    }


    static bool take_text(const json::object& obj, std::string_view key,
                          std::string* out)
    {
        const json::value* v = obj.if_contains(as_json(key));
        if (!v || !v->is_string()) {
            return false;
        }
        const json::string& s = v->get_string();
        if (s.size() > kMaxTextFieldBytes) {
            return false;
        }
        for (char c : s) {
            if (!is_text_char(c)) {
                return false;
            }
        }
        out->assign(s.data(), s.size());
        return true;
    }


    /// Parses \p text and checks that its type is \p expected.
    static MessageStatus open_message(std::string_view text,
                                      MessageKind expected, json::object* obj)
    {
        if (!parse_object(text, obj)) {
            return MessageStatus::Malformed;
        }
        MessageKind kind = MessageKind::Hello;
        if (!kind_of(*obj, &kind)) {
            return MessageStatus::Malformed;
        }
        if (kind != expected) {
            return MessageStatus::UnexpectedKind;
        }
        return MessageStatus::Ok;
    }


    static json::object begin_message(MessageKind kind)
    {
        json::object obj;
        obj["type"] = message_kind_name(kind);
        return obj;
    }


    static void put_text(json::object* obj, std::string_view key,
                         std::string_view value)
    {
        const std::string clean = sanitize_text(value);
        (*obj)[as_json(key)]    = as_json(clean);
    }

}  // namespace

std::string
encode_message(const HelloMessage& msg)
{
    json::object obj = begin_message(MessageKind::Hello);
    obj["protocol"]  = msg.protocol;
    put_text(&obj, "worker_id", msg.worker_id);
    put_text(&obj, "hostname", msg.hostname);
    return json::serialize(obj);
}


std::string
encode_message(const WelcomeMessage& msg)
{
    json::object obj  = begin_message(MessageKind::Welcome);
    obj["protocol"]   = msg.protocol;
    obj["session_id"] = msg.session_id;
    return json::serialize(obj);
}


std::string
encode_message(const TaskMessage& msg)
{
    json::object obj     = begin_message(MessageKind::Task);
    obj["chunk_index"]   = msg.chunk.chunk_index;
    obj["primary_start"] = msg.chunk.primary_start;
    obj["primary_end"]   = msg.chunk.primary_end;
    obj["overlap_end"]   = msg.chunk.overlap_end;
    return json::serialize(obj);
}


std::string
encode_message(const ResultMessage& msg)
{
    json::object obj       = begin_message(MessageKind::Result);
    obj["chunk_index"]     = msg.chunk_index;
    obj["recovered_count"] = msg.recovered_count;
    return json::serialize(obj);
}


std::string
encode_message(const ArtifactMessage& msg)
{
    json::object obj = begin_message(MessageKind::Artifact);
    obj["offset"]    = msg.offset;
    obj["size"]      = msg.size;
    put_text(&obj, "sha256", fingerprint_hex(msg.sha256));
    return json::serialize(obj);
}


std::string
encode_signal(MessageKind kind)
{
    return json::serialize(begin_message(kind));
}


MessageStatus
peek_message_kind(std::string_view text, MessageKind* out)
{
    json::object obj;
    if (!out || !parse_object(text, &obj) || !kind_of(obj, out)) {
        return MessageStatus::Malformed;
    }
    return MessageStatus::Ok;
}


MessageStatus
decode_message(std::string_view text, HelloMessage* out)
{
    json::object obj;
    const MessageStatus s = open_message(text, MessageKind::Hello, &obj);
    if (s != MessageStatus::Ok) {
        return s;
    }
    HelloMessage msg;
    if (!has_exact_keys(obj, { "protocol", "worker_id", "hostname" })
        || !take_u32(obj, "protocol", &msg.protocol)
        || !take_text(obj, "worker_id", &msg.worker_id)
        || msg.worker_id.empty()
        || !take_text(obj, "hostname", &msg.hostname)) {
        return MessageStatus::Malformed;
    }
    if (out) {
        *out = std::move(msg);
    }
    return MessageStatus::Ok;
}


MessageStatus
decode_message(std::string_view text, WelcomeMessage* out)
{
    json::object obj;
    const MessageStatus s = open_message(text, MessageKind::Welcome, &obj);
    if (s != MessageStatus::Ok) {
        return s;
    }
    WelcomeMessage msg;
    if (!has_exact_keys(obj, { "protocol", "session_id" })
        || !take_u32(obj, "protocol", &msg.protocol)
        || !take_u32(obj, "session_id", &msg.session_id)) {
        return MessageStatus::Malformed;
    }
    if (out) {
        *out = msg;
    }
    return MessageStatus::Ok;
}


MessageStatus
decode_message(std::string_view text, TaskMessage* out)
{
    json::object obj;
    const MessageStatus s = open_message(text, MessageKind::Task, &obj);
    if (s != MessageStatus::Ok) {
        return s;
    }
    TaskMessage msg;
    if (!has_exact_keys(obj, { "chunk_index", "primary_start", "primary_end",
                               "overlap_end" })
        || !take_u32(obj, "chunk_index", &msg.chunk.chunk_index)
        || !take_u64(obj, "primary_start", &msg.chunk.primary_start)
        || !take_u64(obj, "primary_end", &msg.chunk.primary_end)
        || !take_u64(obj, "overlap_end", &msg.chunk.overlap_end)) {
        return MessageStatus::Malformed;
    }
    if (msg.chunk.primary_start >= msg.chunk.primary_end
        || msg.chunk.primary_end > msg.chunk.overlap_end) {
        return MessageStatus::Malformed;
    }
    if (out) {
        *out = msg;
    }
    return MessageStatus::Ok;
}


MessageStatus
decode_message(std::string_view text, ResultMessage* out)
{
    json::object obj;
    const MessageStatus s = open_message(text, MessageKind::Result, &obj);
    if (s != MessageStatus::Ok) {
        return s;
    }
    ResultMessage msg;
    if (!has_exact_keys(obj, { "chunk_index", "recovered_count" })
        || !take_u32(obj, "chunk_index", &msg.chunk_index)
        || !take_u32(obj, "recovered_count", &msg.recovered_count)) {
        return MessageStatus::Malformed;
    }
    if (out) {
        *out = msg;
    }
    return MessageStatus::Ok;
}


MessageStatus
decode_message(std::string_view text, ArtifactMessage* out)
{
    json::object obj;
    const MessageStatus s = open_message(text, MessageKind::Artifact, &obj);
    if (s != MessageStatus::Ok) {
        return s;
    }
    ArtifactMessage msg;
    std::string hex;
    if (!has_exact_keys(obj, { "offset", "size", "sha256" })
        || !take_u64(obj, "offset", &msg.offset)
        || !take_u64(obj, "size", &msg.size)
        || !take_text(obj, "sha256", &hex)
        || !parse_fingerprint_hex(hex, &msg.sha256)) {
        return MessageStatus::Malformed;
    }
    if (out) {
        *out = msg;
    }
    return MessageStatus::Ok;
}


MessageStatus
decode_signal(std::string_view text, MessageKind kind)
{
    if (kind != MessageKind::RequestTask && kind != MessageKind::Stop) {
        return MessageStatus::UnexpectedKind;
    }
    json::object obj;
    const MessageStatus s = open_message(text, kind, &obj);
    if (s != MessageStatus::Ok) {
        return s;
    }
    return has_exact_keys(obj, {}) ? MessageStatus::Ok
                                   : MessageStatus::Malformed;
}


const char*
message_kind_name(MessageKind kind) noexcept
{
    switch (kind) {
    case MessageKind::Hello: return "hello";
    case MessageKind::Welcome: return "welcome";
    case MessageKind::RequestTask: return "request_task";
    case MessageKind::Task: return "task";
    case MessageKind::Stop: return "stop";
    case MessageKind::Result: return "result";
    case MessageKind::Artifact: return "artifact";
    }
    return "unknown";
}


const char*
message_status_name(MessageStatus status) noexcept
{
    switch (status) {
    case MessageStatus::Ok: return "ok";
    case MessageStatus::Malformed: return "malformed";
    case MessageStatus::UnexpectedKind: return "unexpected_kind";
    }
    return "unknown";
}

}  // namespace carvenet
