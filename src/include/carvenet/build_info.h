#pragma once

#include <string>
#include <string_view>

/**
 * \file build_info.h
 * \brief Runtime information about how CarveNet was built.
 */

namespace carvenet {

/**
 * \brief CarveNet build information.
 *
 * Values are compiled into the binary at build time.
 */
struct BuildInfo final {
    /// CarveNet version string (e.g. "0.2.0").
    std::string_view version;

    /// Build timestamp in UTC (ISO-8601), or empty if not recorded.
    std::string_view build_timestamp_utc;

    /// Build type string (e.g. "Release", "Debug", "multi-config").
    std::string_view build_type;

    /// Target platform (e.g. "Linux", "Darwin").
    std::string_view system_name;

    /// Target CPU architecture (e.g. "x86_64", "arm64").
    std::string_view system_processor;

    /// Compiler ID (e.g. "Clang", "GNU").
    std::string_view cxx_compiler_id;

    /// Compiler version string.
    std::string_view cxx_compiler_version;

    /// Boost version found at configure time (transport).
    std::string_view boost_version;

    /// OpenSSL version found at configure time (fingerprints).
    std::string_view openssl_version;

    /// Wire protocol version spoken by coordinator and worker.
    unsigned protocol_version = 0;
};

/// Returns build information for the linked CarveNet library.
const BuildInfo&
build_info() noexcept;

/**
 * \brief Formats a stable, human-readable build info header (2 lines).
 *
 * Output format:
 * - `CarveNet vX.Y.Z <build_type> [boost A.B, openssl C.D] protocol N`
 * - `built with <compiler> for <system>/<arch> (<timestamp>)`
 */
void
format_build_info_lines(const BuildInfo& info, std::string* line1,
                        std::string* line2) noexcept;

/// Convenience overload for the linked CarveNet library build.
void
format_build_info_lines(std::string* line1, std::string* line2) noexcept;

}  // namespace carvenet
