#include "carvenet/build_info.h"

#include "carvenet/build_info_generated.h"
#include "carvenet/control_message.h"

#include <string>

namespace carvenet {
namespace {

    static constexpr BuildInfo kBuildInfo = {
        /*version=*/CARVENET_BUILDINFO_VERSION,
        /*build_timestamp_utc=*/CARVENET_BUILDINFO_BUILD_TIMESTAMP_UTC,
        /*build_type=*/CARVENET_BUILDINFO_BUILD_TYPE,
        /*system_name=*/CARVENET_BUILDINFO_SYSTEM_NAME,
        /*system_processor=*/CARVENET_BUILDINFO_SYSTEM_PROCESSOR,
        /*cxx_compiler_id=*/CARVENET_BUILDINFO_CXX_COMPILER_ID,
        /*cxx_compiler_version=*/CARVENET_BUILDINFO_CXX_COMPILER_VERSION,
        /*boost_version=*/CARVENET_BUILDINFO_BOOST_VERSION,
        /*openssl_version=*/CARVENET_BUILDINFO_OPENSSL_VERSION,
        /*protocol_version=*/kProtocolVersion,
    };

}  // namespace

const BuildInfo&
build_info() noexcept
{
    return kBuildInfo;
}

namespace {

    static void append_sv(std::string* out, std::string_view s) noexcept
    {
        if (!out) {
            return;
        }
        out->append(s.data(), s.size());
    }

}  // namespace

void
format_build_info_lines(const BuildInfo& bi, std::string* line1,
                        std::string* line2) noexcept
{
    if (line1) {
        line1->clear();
        line1->reserve(128);
        line1->append("CarveNet v");
        append_sv(line1, bi.version);
        line1->append(" ");
        append_sv(line1, bi.build_type);
        line1->append(" [");
        bool first = true;
        if (!bi.boost_version.empty()) {
            line1->append("boost ");
            append_sv(line1, bi.boost_version);
            first = false;
        }
        if (!bi.openssl_version.empty()) {
            if (!first) {
                line1->append(", ");
            }
            line1->append("openssl ");
            append_sv(line1, bi.openssl_version);
        }
        line1->append("] protocol ");
        line1->append(std::to_string(bi.protocol_version));
    }

    if (line2) {
        line2->clear();
        line2->reserve(160);
        line2->append("built with ");
        append_sv(line2, bi.cxx_compiler_id);
        line2->append("-");
        append_sv(line2, bi.cxx_compiler_version);
        line2->append(" for ");
        append_sv(line2, bi.system_name);
        line2->append("/");
        append_sv(line2, bi.system_processor);

        if (!bi.build_timestamp_utc.empty()) {
            line2->append(" (");
            append_sv(line2, bi.build_timestamp_utc);
            line2->append(")");
        }
    }
}

void
format_build_info_lines(std::string* line1, std::string* line2) noexcept
{
    format_build_info_lines(build_info(), line1, line2);
}

}  // namespace carvenet
