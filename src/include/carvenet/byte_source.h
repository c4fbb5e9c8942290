#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file byte_source.h
 * \brief Read-only, random-access view over a raw disk/volume image.
 */

namespace carvenet {

/// Status code for \ref ByteSource operations.
enum class ByteSourceStatus : uint8_t {
    Ok,
    OpenFailed,
    StatFailed,
    TooLarge,
    MapFailed,
    /// The requested slice does not lie within `[0, size())`.
    OutOfRange,
};

/**
 * \brief Immutable byte source identified by its total length.
 *
 * The image is either memory mapped read-only (\ref open_file), so multi-GB
 * images are never copied into memory, or held in an owned buffer
 * (\ref from_bytes). Slices are views into the source and stay valid until
 * the source is closed, moved from, or destroyed.
 *
 * \note All const member functions are safe to call concurrently.
 */
class ByteSource final {
public:
    ByteSource() noexcept;
    ~ByteSource() noexcept;

    ByteSource(const ByteSource&)            = delete;
    ByteSource& operator=(const ByteSource&) = delete;

    ByteSource(ByteSource&& other) noexcept;
    ByteSource& operator=(ByteSource&& other) noexcept;

    /// Maps \p path read-only. \p max_file_bytes is a hard cap (0 = unlimited).
    ByteSourceStatus open_file(const char* path,
                               uint64_t max_file_bytes = 0) noexcept;

    /// Takes ownership of an in-memory image.
    void from_bytes(std::vector<std::byte> bytes) noexcept;

    /// Releases the mapping or buffer (idempotent).
    void close() noexcept;

    bool is_open() const noexcept;
    uint64_t size() const noexcept;

    /// Full view of the source.
    std::span<const std::byte> bytes() const noexcept;

    /**
     * \brief Returns the view of `[offset, offset + length)` in \p out.
     *
     * Fails with \ref ByteSourceStatus::OutOfRange (leaving \p out empty) if
     * the range does not fit the source. A zero-length slice at `size()` is
     * valid.
     */
    ByteSourceStatus slice(uint64_t offset, uint64_t length,
                           std::span<const std::byte>* out) const noexcept;

private:
    int fd_                = -1;
    bool open_             = false;
    bool mapped_           = false;
    const std::byte* data_ = nullptr;
    uint64_t size_         = 0;
    std::vector<std::byte> owned_;
};

/// Stable lowercase name for \p status (for diagnostics).
const char*
byte_source_status_name(ByteSourceStatus status) noexcept;

}  // namespace carvenet
