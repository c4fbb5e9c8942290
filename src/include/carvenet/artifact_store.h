#pragma once

#include "carvenet/fingerprint.h"
#include "carvenet/jpeg_carve.h"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

/**
 * \file artifact_store.h
 * \brief Fingerprint-keyed merge/dedup of artifacts from all workers.
 */

namespace carvenet {

/**
 * \brief Destination for persisted artifacts.
 *
 * Implementations write \p payload under \p name, or under a derived
 * collision-free name, which is returned in \p stored_name.
 */
class ArtifactSink {
public:
    virtual ~ArtifactSink() = default;

    virtual bool persist(std::string_view name,
                         std::span<const std::byte> payload,
                         std::string* stored_name)
        = 0;
};

/**
 * \brief Writes each artifact as one file in an output directory.
 *
 * Files are written under a temporary name and renamed into place; an
 * existing file is never overwritten (a `_N` suffix is added instead).
 */
class DirectorySink final : public ArtifactSink {
public:
    explicit DirectorySink(std::string directory);

    /// Creates the directory (and parents) if needed.
    bool prepare();

    bool persist(std::string_view name, std::span<const std::byte> payload,
                 std::string* stored_name) override;

    const std::string& directory() const noexcept { return directory_; }

private:
    std::string directory_;
};

/// Keeps persisted artifacts in memory.
class MemorySink final : public ArtifactSink {
public:
    struct Entry final {
        std::string name;
        std::vector<std::byte> payload;
    };

    bool persist(std::string_view name, std::span<const std::byte> payload,
                 std::string* stored_name) override;

    std::vector<Entry> entries() const;
    size_t size() const;

    /// Makes subsequent persist calls fail (for failure-path tests).
    void set_fail(bool fail);

private:
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
    bool fail_ = false;
};

enum class AdmitStatus : uint8_t {
    /// New payload; persisted.
    Accepted,
    /// A payload with the same fingerprint was already persisted.
    Duplicate,
    /// The sink (or fingerprinting) failed; the fingerprint is not recorded.
    PersistFailed,
};

struct AdmitResult final {
    AdmitStatus status = AdmitStatus::PersistFailed;
    /// Stored name for accepted artifacts.
    std::string name;
};

/// Summary of one persisted artifact.
struct StoredArtifact final {
    std::string name;
    uint64_t absolute_start = 0;
    uint64_t size           = 0;
    Fingerprint fingerprint;
};

/**
 * \brief Persists each unique payload exactly once.
 *
 * Two artifacts with identical payload bytes are never both persisted,
 * whichever chunk or worker produced them. \ref admit is thread-safe; it is
 * the only synchronization point between concurrent worker sessions.
 */
class ArtifactStore final {
public:
    explicit ArtifactStore(ArtifactSink* sink) noexcept;

    ArtifactStore(const ArtifactStore&)            = delete;
    ArtifactStore& operator=(const ArtifactStore&) = delete;

    /// Admits \p artifact, computing its fingerprint if it carries none.
    AdmitResult admit(const Artifact& artifact);

    bool contains(const Fingerprint& fp) const;

    uint64_t accepted_count() const;
    uint64_t duplicate_count() const;
    uint64_t failed_count() const;
    uint64_t accepted_bytes() const;
    std::vector<StoredArtifact> records() const;

private:
    ArtifactSink* sink_ = nullptr;
    mutable std::mutex mutex_;
    std::unordered_set<Fingerprint, FingerprintHash> seen_;
    std::vector<StoredArtifact> records_;
    uint64_t duplicates_     = 0;
    uint64_t failures_       = 0;
    uint64_t accepted_bytes_ = 0;
};

/// `recovered_<offset>_<16 hex digits of the fingerprint>.jpg`
std::string
artifact_file_name(uint64_t absolute_start, const Fingerprint& fp);

const char*
admit_status_name(AdmitStatus status) noexcept;

}  // namespace carvenet
