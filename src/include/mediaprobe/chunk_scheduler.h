#pragma once

#include "mediaprobe/bmff_probe.h"
#include "mediaprobe/event_loop.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>

/**
 * \file chunk_scheduler.h
 * \brief Drives a \ref BmffProbeParser from a \ref ByteSource in bounded windows.
 */

namespace mediaprobe {

class ByteSource;
class EventLoop;
class ProbeTimeline;

/// Per-file scheduling options.
struct SchedulerOptions final {
    /// Window size handed to the parser.
    uint32_t chunk_size = 4U * 1024U * 1024U;
    /// Whole-file budget measured from the first chunk request (0 = none).
    uint64_t timeout_ms = 45000;
    /// Jump to the end of a skipped payload box instead of reading through it.
    bool follow_skip_hints = false;
    ProbeLimits limits;
};

enum class ParsePhase : uint8_t {
    Reading,
    Ready,
    Failed,
    TimedOut,
};

/// Progress of one file.
struct ParseState final {
    uint64_t offset            = 0;
    uint64_t bytes_accumulated = 0;
    ParsePhase status          = ParsePhase::Reading;
    uint32_t chunks_read       = 0;
};

/// Failure class of a finished probe.
enum class ProbeFailure : uint8_t {
    None,
    ReadError,
    ParseError,
    TimeoutError,
};

/// Terminal result delivered to the completion callback.
struct ProbeOutcome final {
    ParsePhase status    = ParsePhase::Reading;
    ProbeFailure failure = ProbeFailure::None;
    ProbeError error     = ProbeError::None;
    ContainerInfo info;
    ParseState state;
};

const char*
parse_phase_name(ParsePhase phase) noexcept;

/// Human-readable failure reason stored in error records.
const char*
probe_failure_reason(ProbeFailure failure) noexcept;

/**
 * \brief Single-flight chunked reader with a whole-file timeout.
 *
 * The completion callback runs exactly once, from a posted loop task, so the
 * owner may destroy the scheduler from inside it. After completion no read
 * or timer callback of this scheduler fires again.
 */
class ChunkScheduler final {
public:
    using Completion = std::function<void(const ProbeOutcome& outcome)>;

    ChunkScheduler(EventLoop& loop, ByteSource& source,
                   const SchedulerOptions& options,
                   ProbeTimeline* timeline = nullptr);
    ~ChunkScheduler();

    ChunkScheduler(const ChunkScheduler&)            = delete;
    ChunkScheduler& operator=(const ChunkScheduler&) = delete;

    /// Issues the first read and arms the timeout. Call once.
    void start(Completion done);

    const ParseState& state() const noexcept;
    bool finished() const noexcept;

private:
    void request_next();
    void on_chunk(uint64_t offset, bool ok, std::span<const std::byte> bytes);
    void on_timeout();
    void finish(ParsePhase phase, ProbeFailure failure);
    void log_progress(bool last);

    EventLoop* loop_          = nullptr;
    ByteSource* source_       = nullptr;
    ProbeTimeline* timeline_  = nullptr;
    SchedulerOptions options_;
    BmffProbeParser parser_;
    ParseState state_;
    Completion done_;
    TimerId timer_  = kInvalidTimerId;
    bool started_   = false;
    bool finished_  = false;
    std::shared_ptr<bool> alive_;
};

}  // namespace mediaprobe
