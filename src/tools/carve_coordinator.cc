#include "carvenet/artifact_store.h"
#include "carvenet/build_info.h"
#include "carvenet/coordinator.h"
#include "carvenet/resource_policy.h"

#include <chrono>
#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <string>
#include <vector>

namespace carvenet {
namespace {

    static constexpr uint64_t kMiB = 1024ULL * 1024ULL;

    static void usage(const char* argv0)
    {
        std::printf(
            "Usage: %s [options] <image>\n"
            "\n"
            "Splits a raw disk/volume image into chunks, hands them to carve_worker\n"
            "processes and stores every unique recovered JPEG once.\n"
            "\n"
            "Options:\n"
            "  --help                 Show this help\n"
            "  --version              Print CarveNet build info\n"
            "  --no-build-info        Hide build info header\n"
            "  --bind <addr>          Listen address (default: 0.0.0.0)\n"
            "  --port N               Listen port (default: 5000)\n"
            "  --chunk-mb N           Chunk size in MiB (default: 512; 0=split\n"
            "                         evenly over registered workers)\n"
            "  --overlap-mb N         Overlap tail in MiB (default: 1)\n"
            "  --overlap-bytes N      Overlap tail in bytes (overrides --overlap-mb)\n"
            "  --output <dir>         Output directory (default: recovered_files)\n"
            "  --wait-seconds N       Registration window (default: 30)\n"
            "  --workers N            End registration once N workers joined\n"
            "  --admit-late           Keep accepting workers after the window,\n"
            "                         until none was live for --wait-seconds\n"
            "  --max-artifact-mb N    Largest artifact workers look for (default: 32)\n"
            "  --max-frame-mb N       Largest frame accepted (default: 1024)\n"
            "  --max-file-bytes N     Optional image mapping cap (default: 0=unlimited)\n"
            "  --quiet                Only print the final summary\n"
            "\n"
            "Exit status: 0 when every chunk was collected, 2 when chunks are\n"
            "missing, 1 on configuration errors.\n",
            argv0 ? argv0 : "carve_coordinator");
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


    static bool parse_u32_arg(const char* s, uint32_t* out)
    {
        uint64_t v = 0;
        if (!parse_u64_arg(s, &v) || v > std::numeric_limits<uint32_t>::max()) {
            return false;
        }
        *out = static_cast<uint32_t>(v);
        return true;
    }


    static bool parse_mib_arg(const char* s, uint64_t* out)
    {
        uint64_t v = 0;
        if (!parse_u64_arg(s, &v) || v > (UINT64_MAX / kMiB)) {
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


    class ConsoleProgress final : public ProgressListener {
    public:
        void on_progress(const ProgressEvent& ev) noexcept override
        {
            switch (ev.kind) {
            case ProgressEventKind::WorkerRegistered:
                std::printf("worker %u registered: %.*s (%.*s)\n",
                            ev.session_id,
                            static_cast<int>(ev.worker_id.size()),
                            ev.worker_id.data(),
                            static_cast<int>(ev.hostname.size()),
                            ev.hostname.data());
                break;
            case ProgressEventKind::ChunkAssigned:
                std::printf("chunk %u/%u -> worker %u\n", ev.chunk_index + 1U,
                            ev.total_chunks, ev.session_id);
                break;
            case ProgressEventKind::ArtifactAdmitted:
                if (ev.admit_status == AdmitStatus::Accepted) {
                    std::printf("  saved %.*s (%" PRIu64 " bytes)\n",
                                static_cast<int>(ev.artifact_name.size()),
                                ev.artifact_name.data(), ev.artifact_size);
                } else {
                    std::printf("  offset %" PRIu64 ": %s\n",
                                ev.artifact_offset,
                                admit_status_name(ev.admit_status));
                }
                break;
            case ProgressEventKind::ChunkCollected:
                std::printf("chunk %u collected (%u/%u resolved)\n",
                            ev.chunk_index, ev.resolved_chunks,
                            ev.total_chunks);
                break;
            case ProgressEventKind::ChunkFailed:
                std::fprintf(stderr, "chunk %u failed (%u/%u resolved)\n",
                             ev.chunk_index, ev.resolved_chunks,
                             ev.total_chunks);
                break;
            }
            std::fflush(stdout);
        }
    };


    static void print_summary(const CoordinatorReport& r,
                              const ArtifactStore& store,
                              const std::string& out_dir)
    {
        std::printf("\nstate=%s status=%s\n", coordinator_state_name(r.state),
                    coordinator_status_name(r.status));
        std::printf("source=%" PRIu64 " bytes chunk_size=%" PRIu64
                    " chunks=%u collected=%u\n",
                    r.source_bytes, r.chunk_size, r.total_chunks,
                    r.collected_chunks);
        std::printf("workers registered=%u failed=%u rejected=%u\n",
                    r.workers_registered, r.workers_failed,
                    r.workers_rejected);
        std::printf("artifacts received=%" PRIu64 " unique=%" PRIu64
                    " duplicates=%" PRIu64 " persist_failures=%" PRIu64 "\n",
                    r.artifacts_received, r.artifacts_accepted,
                    r.artifacts_duplicate, r.persist_failures);
        std::printf("bytes_sent=%" PRIu64 " output=%s (%" PRIu64 " bytes)\n",
                    r.bytes_sent, out_dir.c_str(), store.accepted_bytes());

        if (r.missing_chunks.empty()) {
            std::printf("coverage: complete\n");
            return;
        }
        std::fprintf(stderr, "coverage: %zu chunk(s) missing:",
                     r.missing_chunks.size());
        for (const uint32_t index : r.missing_chunks) {
            std::fprintf(stderr, " %u", index);
        }
        std::fprintf(stderr, "\n");
    }

}  // namespace
}  // namespace carvenet


int
main(int argc, char** argv)
{
    using namespace carvenet;

    bool show_build_info = true;
    bool quiet           = false;
    std::string image_path;
    std::string out_dir = "recovered_files";
    CarveResourcePolicy policy;
    CoordinatorOptions options;
    uint64_t overlap_mb_bytes = policy.plan.overlap_size;
    uint64_t overlap_bytes    = 0;
    bool have_overlap_bytes   = false;
    uint64_t wait_seconds     = 30;

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
        if (std::strcmp(arg, "--quiet") == 0) {
            quiet = true;
            continue;
        }
        if (std::strcmp(arg, "--admit-late") == 0) {
            options.late_workers = LateWorkerPolicy::Admit;
            continue;
        }
        if (std::strcmp(arg, "--bind") == 0 && has_value) {
            options.bind_address = argv[++i];
            continue;
        }
        if (std::strcmp(arg, "--output") == 0 && has_value) {
            out_dir = argv[++i];
            continue;
        }
        if (std::strcmp(arg, "--port") == 0 && has_value) {
            uint32_t port = 0;
            if (!parse_u32_arg(argv[++i], &port) || port > 65535U) {
                std::fprintf(stderr, "invalid --port value\n");
                return 1;
            }
            options.port = static_cast<uint16_t>(port);
            continue;
        }
        if (std::strcmp(arg, "--chunk-mb") == 0 && has_value) {
            if (!parse_mib_arg(argv[++i], &policy.plan.chunk_size)) {
                std::fprintf(stderr, "invalid --chunk-mb value\n");
                return 1;
            }
            continue;
        }
        if (std::strcmp(arg, "--overlap-mb") == 0 && has_value) {
            if (!parse_mib_arg(argv[++i], &overlap_mb_bytes)) {
                std::fprintf(stderr, "invalid --overlap-mb value\n");
                return 1;
            }
            continue;
        }
        if (std::strcmp(arg, "--overlap-bytes") == 0 && has_value) {
            if (!parse_u64_arg(argv[++i], &overlap_bytes)) {
                std::fprintf(stderr, "invalid --overlap-bytes value\n");
                return 1;
            }
            have_overlap_bytes = true;
            continue;
        }
        if (std::strcmp(arg, "--wait-seconds") == 0 && has_value) {
            if (!parse_u64_arg(argv[++i], &wait_seconds)
                || wait_seconds > 24ULL * 3600ULL) {
                std::fprintf(stderr, "invalid --wait-seconds value\n");
                return 1;
            }
            continue;
        }
        if (std::strcmp(arg, "--workers") == 0 && has_value) {
            if (!parse_u32_arg(argv[++i], &options.expected_workers)) {
                std::fprintf(stderr, "invalid --workers value\n");
                return 1;
            }
            continue;
        }
        if (std::strcmp(arg, "--max-artifact-mb") == 0 && has_value) {
            if (!parse_mib_arg(argv[++i],
                               &policy.carve_limits.max_artifact_bytes)
                || policy.carve_limits.max_artifact_bytes == 0U) {
                std::fprintf(stderr, "invalid --max-artifact-mb value\n");
                return 1;
            }
            continue;
        }
        if (std::strcmp(arg, "--max-frame-mb") == 0 && has_value) {
            if (!parse_mib_arg(argv[++i],
                               &policy.frame_limits.max_frame_bytes)
                || policy.frame_limits.max_frame_bytes == 0U) {
                std::fprintf(stderr, "invalid --max-frame-mb value\n");
                return 1;
            }
            if (policy.frame_limits.max_frame_bytes > kMaxFramePayloadBytes) {
                policy.frame_limits.max_frame_bytes = kMaxFramePayloadBytes;
            }
            continue;
        }
        if (std::strcmp(arg, "--max-file-bytes") == 0 && has_value) {
            if (!parse_u64_arg(argv[++i], &policy.max_file_bytes)) {
                std::fprintf(stderr, "invalid --max-file-bytes value\n");
                return 1;
            }
            continue;
        }
        if (arg[0] == '-' && arg[1] != '\0') {
            std::fprintf(stderr, "unknown or incomplete option: %s\n", arg);
            usage(argv[0]);
            return 1;
        }
        if (!image_path.empty()) {
            std::fprintf(stderr, "only one image may be given\n");
            return 1;
        }
        image_path = arg;
    }

    if (image_path.empty()) {
        usage(argv[0]);
        return 1;
    }
    if (show_build_info) {
        print_build_info_header();
    }

    policy.plan.overlap_size = have_overlap_bytes ? overlap_bytes
                                                  : overlap_mb_bytes;
    apply_resource_policy(policy, &options);
    options.registration_window = std::chrono::seconds(wait_seconds);
    options.late_worker_grace   = std::chrono::seconds(wait_seconds);

    DirectorySink sink(out_dir);
    if (!sink.prepare()) {
        std::fprintf(stderr, "cannot create output directory: %s\n",
                     out_dir.c_str());
        return 1;
    }
    ArtifactStore store(&sink);
    ConsoleProgress progress;
    Coordinator coordinator(options, &store, quiet ? nullptr : &progress);

    CoordinatorStatus status = coordinator.open_source(image_path.c_str());
    if (status != CoordinatorStatus::Ok) {
        std::fprintf(stderr, "%s: %s\n", image_path.c_str(),
                     coordinator_status_name(status));
        return 1;
    }
    status = coordinator.listen();
    if (status != CoordinatorStatus::Ok) {
        std::fprintf(stderr, "listen on %s:%u failed: %s\n",
                     options.bind_address.c_str(),
                     static_cast<unsigned>(options.port),
                     coordinator_status_name(status));
        return 1;
    }

    std::printf("image=%s size=%" PRIu64 " overlap=%" PRIu64 "\n",
                image_path.c_str(), coordinator.source().size(),
                options.plan.overlap_size);
    std::printf("listening on %s:%u; waiting %" PRIu64
                "s for workers (late workers: %s)\n",
                options.bind_address.c_str(),
                static_cast<unsigned>(coordinator.port()), wait_seconds,
                late_worker_policy_name(options.late_workers));
    std::printf("workers use: carve_worker <host> %u --max-artifact-mb %" PRIu64
                "\n",
                static_cast<unsigned>(coordinator.port()),
                policy.carve_limits.max_artifact_bytes / kMiB);
    std::fflush(stdout);

    const CoordinatorReport report = coordinator.run();
    print_summary(report, store, out_dir);

    if (report.state != CoordinatorState::Done
        || report.status != CoordinatorStatus::Ok) {
        return 1;
    }
    return report.missing_chunks.empty() ? 0 : 2;
}
