#include "carvenet/byte_source.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <utility>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace carvenet {

ByteSource::ByteSource() noexcept = default;


ByteSource::~ByteSource() noexcept
{
    close();
}


ByteSource::ByteSource(ByteSource&& other) noexcept
{
    *this = std::move(other);
}


ByteSource&
ByteSource::operator=(ByteSource&& other) noexcept
{
    if (this == &other) {
        return *this;
    }
    close();

    fd_           = other.fd_;
    open_         = other.open_;
    mapped_       = other.mapped_;
    owned_        = std::move(other.owned_);
    data_         = mapped_ ? other.data_ : owned_.data();
    size_         = other.size_;
    other.fd_     = -1;
    other.open_   = false;
    other.mapped_ = false;
    other.data_   = nullptr;
    other.size_   = 0;
    other.owned_.clear();
    return *this;
}


ByteSourceStatus
ByteSource::open_file(const char* path, uint64_t max_file_bytes) noexcept
{
    close();

    if (!path || !*path) {
        return ByteSourceStatus::OpenFailed;
    }

    const int fd = ::open(path, O_RDONLY);
    if (fd < 0) {
        return ByteSourceStatus::OpenFailed;
    }

    struct stat st {};
    if (::fstat(fd, &st) != 0 || st.st_size < 0) {
        ::close(fd);
        return ByteSourceStatus::StatFailed;
    }

    const uint64_t size_u64 = static_cast<uint64_t>(st.st_size);
    if (max_file_bytes != 0U && size_u64 > max_file_bytes) {
        ::close(fd);
        return ByteSourceStatus::TooLarge;
    }
    if (size_u64 > static_cast<uint64_t>(
                       std::numeric_limits<size_t>::max())) {
        ::close(fd);
        return ByteSourceStatus::TooLarge;
    }

    if (size_u64 != 0U) {
        void* p = ::mmap(nullptr, static_cast<size_t>(size_u64), PROT_READ,
                         MAP_PRIVATE, fd, 0);
        if (p == MAP_FAILED) {
            ::close(fd);
            return ByteSourceStatus::MapFailed;
        }
        // Chunks are read front to back exactly once.
        (void)::madvise(p, static_cast<size_t>(size_u64), MADV_SEQUENTIAL);
        data_   = static_cast<const std::byte*>(p);
        mapped_ = true;
    }

    fd_   = fd;
    open_ = true;
    size_ = size_u64;
    return ByteSourceStatus::Ok;
}


void
ByteSource::from_bytes(std::vector<std::byte> bytes) noexcept
{
    close();
    owned_ = std::move(bytes);
    open_  = true;
    data_  = owned_.data();
    size_  = static_cast<uint64_t>(owned_.size());
}


void
ByteSource::close() noexcept
{
    if (mapped_ && data_ && size_ != 0U) {
        (void)::munmap(const_cast<void*>(static_cast<const void*>(data_)),
                       static_cast<size_t>(size_));
    }
    if (fd_ >= 0) {
        (void)::close(fd_);
    }
    fd_     = -1;
    open_   = false;
    mapped_ = false;
    owned_.clear();
    owned_.shrink_to_fit();
    data_ = nullptr;
    size_ = 0;
}


bool
ByteSource::is_open() const noexcept
{
    return open_;
}


uint64_t
ByteSource::size() const noexcept
{
    return size_;
}


std::span<const std::byte>
ByteSource::bytes() const noexcept
{
    if (size_ == 0U) {
        return {};
    }
    return std::span<const std::byte>(data_, static_cast<size_t>(size_));
}


ByteSourceStatus
ByteSource::slice(uint64_t offset, uint64_t length,
                  std::span<const std::byte>* out) const noexcept
{
    if (!out) {
        return ByteSourceStatus::OutOfRange;
    }
    *out = {};
    if (offset > size_ || length > size_ - offset) {
        return ByteSourceStatus::OutOfRange;
    }
    if (length == 0U) {
        return ByteSourceStatus::Ok;
    }
    *out = bytes().subspan(static_cast<size_t>(offset),
                           static_cast<size_t>(length));
    return ByteSourceStatus::Ok;
}


const char*
byte_source_status_name(ByteSourceStatus status) noexcept
{
    switch (status) {
    case ByteSourceStatus::Ok: return "ok";
    case ByteSourceStatus::OpenFailed: return "open_failed";
    case ByteSourceStatus::StatFailed: return "stat_failed";
    case ByteSourceStatus::TooLarge: return "too_large";
    case ByteSourceStatus::MapFailed: return "map_failed";
    case ByteSourceStatus::OutOfRange: return "out_of_range";
    }
    return "unknown";
}

}  // namespace carvenet
