#include "carvenet/build_info.h"
#include "carvenet/resource_policy.h"
#include "carvenet/worker.h"

#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <string>

namespace carvenet {
namespace {

    static constexpr uint64_t kMiB = 1024ULL * 1024ULL;

    static void usage(const char* argv0)
    {
        std::printf(
            "Usage: %s [options] <coordinator-host> [port]\n"
            "\n"
            "Connects to a carve_coordinator, carves the chunks it is given and\n"
            "returns every recovered JPEG.\n"
            "\n"
            "Options:\n"
            "  --help                 Show this help\n"
            "  --version              Print CarveNet build info\n"
            "  --no-build-info        Hide build info header\n"
            "  --worker-id <id>       Worker name (default: <hostname>-<pid>)\n"
            "  --max-artifact-mb N    Largest artifact to look for (default: 32)\n"
            "  --max-frame-mb N       Largest frame accepted (default: 1024)\n",
            argv0 ? argv0 : "carve_worker");
    }


    static bool parse_u64_arg(const char* s, uint64_t* out)
    {
        if (!s || !*s || !out) {
            return false;
        }
        char* end            = nullptr;
        unsigned long long v = std::strtoull(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint64_t>(v);
        return true;
    }


    static bool parse_mib_arg(const char* s, uint64_t* out)
    {
        uint64_t v = 0;
        if (!parse_u64_arg(s, &v) || v == 0U || v > (UINT64_MAX / kMiB)) {
            return false;
        }
        *out = v * kMiB;
        return true;
    }


    static void print_build_info_header()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        std::printf("%s\n%s\n", line1.c_str(), line2.c_str());
    }

}  // namespace
}  // namespace carvenet


int
main(int argc, char** argv)
{
    using namespace carvenet;

    bool show_build_info = true;
    CarveResourcePolicy policy;
    WorkerOptions options;
    int positional = 0;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!arg) {
            continue;
        }
        const bool has_value = i + 1 < argc;
        if (std::strcmp(arg, "--help") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_build_info_header();
            return 0;
        }
        if (std::strcmp(arg, "--no-build-info") == 0) {
            show_build_info = false;
            continue;
        }
        if (std::strcmp(arg, "--worker-id") == 0 && has_value) {
            options.worker_id = argv[++i];
            continue;
        }
        if (std::strcmp(arg, "--max-artifact-mb") == 0 && has_value) {
            if (!parse_mib_arg(argv[++i],
                               &policy.carve_limits.max_artifact_bytes)) {
                std::fprintf(stderr, "invalid --max-artifact-mb value\n");
                return 1;
            }
            continue;
        }
        if (std::strcmp(arg, "--max-frame-mb") == 0 && has_value) {
            if (!parse_mib_arg(argv[++i],
                               &policy.frame_limits.max_frame_bytes)) {
                std::fprintf(stderr, "invalid --max-frame-mb value\n");
                return 1;
            }
            if (policy.frame_limits.max_frame_bytes > kMaxFramePayloadBytes) {
                policy.frame_limits.max_frame_bytes = kMaxFramePayloadBytes;
            }
            continue;
        }
        if (arg[0] == '-' && arg[1] != '\0') {
            std::fprintf(stderr, "unknown or incomplete option: %s\n", arg);
            usage(argv[0]);
            return 1;
        }
        if (positional == 0) {
            options.host = arg;
        } else if (positional == 1) {
            uint64_t port = 0;
            if (!parse_u64_arg(arg, &port) || port == 0U || port > 65535U) {
                std::fprintf(stderr, "invalid port: %s\n", arg);
                return 1;
            }
            options.port = static_cast<uint16_t>(port);
        } else {
            std::fprintf(stderr, "unexpected argument: %s\n", arg);
            return 1;
        }
        positional += 1;
    }

    if (positional == 0) {
        usage(argv[0]);
        return 1;
    }
    if (show_build_info) {
        print_build_info_header();
    }
    apply_resource_policy(policy, &options);

    std::printf("connecting to %s:%u\n", options.host.c_str(),
                static_cast<unsigned>(options.port));
    std::fflush(stdout);

    const WorkerReport r = run_worker(options);
    std::printf("status=%s transport=%s session=%u\n",
                worker_status_name(r.status),
                transport_status_name(r.transport), r.session_id);
    std::printf("chunks=%u chunk_bytes=%" PRIu64 " artifacts=%" PRIu64
                " artifact_bytes=%" PRIu64 "\n",
                r.chunks_processed, r.chunk_bytes, r.artifacts_sent,
                r.artifact_bytes);
    std::printf("candidates=%" PRIu64 " rejected=%" PRIu64
                " unterminated=%" PRIu64 " foreign=%" PRIu64
                " dropped=%" PRIu64 "\n",
                r.candidates, r.rejected, r.unterminated, r.foreign,
                r.dropped);
    return (r.status == WorkerStatus::Ok) ? 0 : 1;
}
