#include "carvenet/artifact_store.h"

#include <cstdio>
#include <filesystem>
#include <system_error>
#include <utility>

namespace carvenet {
namespace {

    static constexpr uint32_t kMaxNameSuffix = 1000;

    static std::string join_path(const std::string& dir, std::string_view name)
    {
        if (dir.empty()) {
            return std::string(name);
        }
        std::string out = dir;
        if (out.back() != '/') {
            out.push_back('/');
        }
        out.append(name);
        return out;
    }


    static std::string with_index_suffix(std::string_view name, uint32_t index)
    {
        const size_t dot = name.find_last_of('.');
        std::string out;
        if (dot == std::string_view::npos) {
            out.assign(name);
            out.append("_" + std::to_string(index));
            return out;
        }
        out.assign(name.substr(0, dot));
        out.append("_" + std::to_string(index));
        out.append(name.substr(dot));
        return out;
    }


    static bool write_file_bytes(const std::string& path,
                                 std::span<const std::byte> bytes)
    {
        std::FILE* f = std::fopen(path.c_str(), "wb");
        if (!f) {
            return false;
        }
        size_t written = 0;
        if (!bytes.empty()) {
            written = std::fwrite(bytes.data(), 1, bytes.size(), f);
        }
        const bool closed = std::fclose(f) == 0;
        return closed && written == bytes.size();
    }

}  // namespace

DirectorySink::DirectorySink(std::string directory)
    : directory_(std::move(directory))
{
}


bool
DirectorySink::prepare()
{
    if (directory_.empty()) {
        return true;
    }
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    return !ec && std::filesystem::is_directory(directory_, ec);
}


bool
DirectorySink::persist(std::string_view name,
                       std::span<const std::byte> payload,
                       std::string* stored_name)
{
    if (name.empty()) {
        return false;
    }
    const std::string tmp_path = join_path(directory_,
                                           "." + std::string(name) + ".part");
    if (!write_file_bytes(tmp_path, payload)) {
        std::remove(tmp_path.c_str());
        return false;
    }

    std::error_code ec;
    for (uint32_t i = 0; i < kMaxNameSuffix; ++i) {
        const std::string candidate = (i == 0) ? std::string(name)
                                               : with_index_suffix(name, i);
        const std::string path      = join_path(directory_, candidate);
        if (std::filesystem::exists(path, ec) || ec) {
            continue;
        }
        if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
            break;
        }
        if (stored_name) {
            *stored_name = candidate;
        }
        return true;
    }
    std::remove(tmp_path.c_str());
    return false;
}


bool
MemorySink::persist(std::string_view name, std::span<const std::byte> payload,
                    std::string* stored_name)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_) {
        return false;
    }
    Entry e;
    e.name.assign(name);
    e.payload.assign(payload.begin(), payload.end());
    if (stored_name) {
        *stored_name = e.name;
    }
    entries_.push_back(std::move(e));
    return true;
}


std::vector<MemorySink::Entry>
MemorySink::entries() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}


size_t
MemorySink::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}


void
MemorySink::set_fail(bool fail)
{
    std::lock_guard<std::mutex> lock(mutex_);
    fail_ = fail;
}


ArtifactStore::ArtifactStore(ArtifactSink* sink) noexcept
    : sink_(sink)
{
}


AdmitResult
ArtifactStore::admit(const Artifact& artifact)
{
    AdmitResult result;

    Fingerprint fp = artifact.fingerprint;
    if (!artifact.has_fingerprint
        && !compute_fingerprint(artifact.payload, &fp)) {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_ += 1U;
        result.status = AdmitStatus::PersistFailed;
        return result;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (seen_.find(fp) != seen_.end()) {
        duplicates_ += 1U;
        result.status = AdmitStatus::Duplicate;
        return result;
    }

    std::string stored;
    const std::string name = artifact_file_name(artifact.absolute_start, fp);
    if (!sink_ || !sink_->persist(name, artifact.payload, &stored)) {
        failures_ += 1U;
        result.status = AdmitStatus::PersistFailed;
        return result;
    }

    seen_.insert(fp);
    StoredArtifact rec;
    rec.name           = stored;
    rec.absolute_start = artifact.absolute_start;
    rec.size           = static_cast<uint64_t>(artifact.payload.size());
    rec.fingerprint    = fp;
    records_.push_back(rec);
    accepted_bytes_ += rec.size;

    result.status = AdmitStatus::Accepted;
    result.name   = std::move(stored);
    return result;
}


bool
ArtifactStore::contains(const Fingerprint& fp) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_.find(fp) != seen_.end();
}


uint64_t
ArtifactStore::accepted_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint64_t>(records_.size());
}


uint64_t
ArtifactStore::duplicate_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return duplicates_;
}


uint64_t
ArtifactStore::failed_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
}


uint64_t
ArtifactStore::accepted_bytes() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return accepted_bytes_;
}


std::vector<StoredArtifact>
ArtifactStore::records() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}


std::string
artifact_file_name(uint64_t absolute_start, const Fingerprint& fp)
{
    std::string name = "recovered_";
    name.append(std::to_string(absolute_start));
    name.push_back('_');
    name.append(fingerprint_hex(fp).substr(0, 16));
    name.append(".jpg");
    return name;
}


const char*
admit_status_name(AdmitStatus status) noexcept
{
    switch (status) {
    case AdmitStatus::Accepted: return "accepted";
    case AdmitStatus::Duplicate: return "duplicate";
    case AdmitStatus::PersistFailed: return "persist_failed";
    }
    return "unknown";
}

}  // namespace carvenet
