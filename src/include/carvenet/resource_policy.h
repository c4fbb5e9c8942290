#pragma once

#include "carvenet/chunk_plan.h"
#include "carvenet/coordinator.h"
#include "carvenet/frame_codec.h"
#include "carvenet/jpeg_carve.h"
#include "carvenet/worker.h"

#include <cstdint>

/**
 * \file resource_policy.h
 * \brief Resource-budget policy for one carving run.
 */

namespace carvenet {

/**
 * \brief Storage-agnostic limits shared by the coordinator and its workers.
 *
 * Multi-GB images are expected, so the image itself is uncapped by default;
 * memory per worker is bounded by the chunk transfer length and the frame
 * limit instead.
 */
struct CarveResourcePolicy final {
    /// Optional image mapping cap (0 = unlimited).
    uint64_t max_file_bytes = 0;

    /// Chunk layout. `chunk_size == 0` splits evenly over registered workers.
    PlanOptions plan;

    /// Largest frame either side accepts; bounds receive allocations.
    FrameLimits frame_limits;

    /// Per-chunk carving budgets.
    CarveLimits carve_limits;
};

inline void
apply_resource_policy(const CarveResourcePolicy& policy,
                      CoordinatorOptions* coordinator) noexcept
{
    if (coordinator) {
        coordinator->max_file_bytes     = policy.max_file_bytes;
        coordinator->max_artifact_bytes = policy.carve_limits.max_artifact_bytes;
        coordinator->plan               = policy.plan;
        coordinator->frame_limits       = policy.frame_limits;
    }
}

inline void
apply_resource_policy(const CarveResourcePolicy& policy,
                      WorkerOptions* worker) noexcept
{
    if (worker) {
        worker->frame_limits = policy.frame_limits;
        worker->carve.limits = policy.carve_limits;
    }
}

inline void
apply_resource_policy(const CarveResourcePolicy& policy,
                      CarveOptions* carve) noexcept
{
    if (carve) {
        carve->limits = policy.carve_limits;
    }
}

}  // namespace carvenet
