#pragma once

#include "mediaprobe/byte_source.h"
#include "mediaprobe/chunk_scheduler.h"
#include "mediaprobe/classify.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

/**
 * \file batch_probe.h
 * \brief Sequential probing of a list of inputs into one ordered batch.
 */

namespace mediaprobe {

class EventLoop;
class ProbeTimeline;

struct BatchOptions final {
    SchedulerOptions scheduler;
    ValidationPolicy validation;
    /// Extensions routed through the container parser.
    std::vector<std::string> container_extensions
        = default_container_extensions();
};

/**
 * \brief Probes inputs one at a time and collects one record per input.
 *
 * Only one \ref ChunkScheduler exists at any time, so at most one chunk
 * buffer is resident. Records are appended in input order. A failing or
 * timed-out input yields an error record and the batch moves on.
 */
class BatchProbe final {
public:
    using Completion = std::function<void(const std::vector<FileRecord>&)>;

    BatchProbe(EventLoop& loop, const BatchOptions& options,
               ProbeTimeline* timeline = nullptr);
    ~BatchProbe();

    BatchProbe(const BatchProbe&)            = delete;
    BatchProbe& operator=(const BatchProbe&) = delete;

    /// Starts probing \p sources; \p done runs once, from a loop task.
    /// Returns false if a run is already in progress.
    bool run(std::vector<std::unique_ptr<ByteSource>> sources,
             Completion done);

    /// Abandons the current run; no completion is delivered.
    void cancel();

    bool running() const noexcept;
    const std::vector<FileRecord>& records() const noexcept;
    /// Index of the input currently being probed.
    size_t current_index() const noexcept;

private:
    void schedule_next();
    void probe_next();
    void on_probe_done(const ProbeOutcome& outcome);

    EventLoop* loop_         = nullptr;
    ProbeTimeline* timeline_ = nullptr;
    BatchOptions options_;

    std::vector<std::unique_ptr<ByteSource>> sources_;
    std::vector<FileRecord> records_;
    std::unique_ptr<ChunkScheduler> scheduler_;
    Completion done_;
    size_t index_  = 0;
    bool running_  = false;
    std::shared_ptr<bool> alive_;
};

/// Convenience: one \ref FileByteSource per path.
std::vector<std::unique_ptr<ByteSource>>
open_file_sources(EventLoop& loop, const std::vector<std::string>& paths);

}  // namespace mediaprobe
