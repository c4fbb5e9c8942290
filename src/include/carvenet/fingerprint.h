#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

/**
 * \file fingerprint.h
 * \brief SHA-256 content fingerprints used to deduplicate artifacts.
 */

namespace carvenet {

static constexpr size_t kFingerprintBytes = 32;

/// SHA-256 digest of an artifact payload.
struct Fingerprint final {
    std::array<uint8_t, kFingerprintBytes> bytes {};

    friend bool operator==(const Fingerprint&, const Fingerprint&) = default;
    friend auto operator<=>(const Fingerprint&, const Fingerprint&) = default;
};

/// Hash functor for unordered containers keyed by \ref Fingerprint.
struct FingerprintHash final {
    size_t operator()(const Fingerprint& fp) const noexcept;
};

/// Computes the SHA-256 of \p payload. Returns false if OpenSSL fails.
bool
compute_fingerprint(std::span<const std::byte> payload,
                    Fingerprint* out) noexcept;

/// Lowercase hex encoding (64 characters).
std::string
fingerprint_hex(const Fingerprint& fp);

/// Parses exactly 64 hex digits (either case).
bool
parse_fingerprint_hex(std::string_view text, Fingerprint* out) noexcept;

}  // namespace carvenet
