#pragma once

#include "mediaprobe/batch_probe.h"
#include "mediaprobe/bmff_probe.h"
#include "mediaprobe/chunk_scheduler.h"
#include "mediaprobe/classify.h"
#include "mediaprobe/host_bridge.h"
#include "mediaprobe/probe_sandbox.h"

#include <cstdint>
#include <string>
#include <vector>

/**
 * \file resource_policy.h
 * \brief Resource and validation policy for mediaprobe batch runs.
 */

namespace mediaprobe {

/**
 * \brief Storage-agnostic budgets and rules for untrusted media input.
 *
 * Peak memory is bounded by the chunk size plus the structural box budget,
 * independent of file size, so arbitrarily large inputs can be probed.
 */
struct MediaProbePolicy final {
    /// Window size and per-file timeout.
    SchedulerOptions scheduler;

    /// Container structure budgets.
    ProbeLimits probe_limits;

    /// Format/codec allow-lists and size limit.
    ValidationPolicy validation;

    /// Extensions routed through the container parser.
    std::vector<std::string> container_extensions
        = default_container_extensions();

    /// Handshake timing and frame height model.
    BridgeOptions bridge;
};

inline void
apply_resource_policy(const MediaProbePolicy& policy,
                      SchedulerOptions* scheduler) noexcept
{
    if (scheduler) {
        *scheduler        = policy.scheduler;
        scheduler->limits = policy.probe_limits;
    }
}

inline void
apply_resource_policy(const MediaProbePolicy& policy, BatchOptions* batch)
{
    if (batch) {
        apply_resource_policy(policy, &batch->scheduler);
        batch->validation           = policy.validation;
        batch->container_extensions = policy.container_extensions;
    }
}

inline void
apply_resource_policy(const MediaProbePolicy& policy, SandboxOptions* sandbox)
{
    if (sandbox) {
        apply_resource_policy(policy, &sandbox->batch);
        sandbox->bridge = policy.bridge;
    }
}

}  // namespace mediaprobe
