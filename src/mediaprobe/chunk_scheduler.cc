#include "mediaprobe/chunk_scheduler.h"

#include "mediaprobe/byte_source.h"
#include "mediaprobe/probe_timeline.h"

#include <string>
#include <utility>

namespace mediaprobe {
namespace {

    static double to_mib(uint64_t bytes) noexcept
    {
        return static_cast<double>(bytes) / (1024.0 * 1024.0);
    }

}  // namespace


const char*
parse_phase_name(ParsePhase phase) noexcept
{
    switch (phase) {
    case ParsePhase::Reading: return "reading";
    case ParsePhase::Ready: return "ready";
    case ParsePhase::Failed: return "failed";
    case ParsePhase::TimedOut: return "timed-out";
    }
    return "unknown";
}


const char*
probe_failure_reason(ProbeFailure failure) noexcept
{
    switch (failure) {
    case ProbeFailure::None: return "";
    case ProbeFailure::ReadError: return "File read error";
    case ProbeFailure::ParseError: return "Container parse error";
    case ProbeFailure::TimeoutError: return "Processing timeout";
    }
    return "Unknown error";
}


ChunkScheduler::ChunkScheduler(EventLoop& loop, ByteSource& source,
                               const SchedulerOptions& options,
                               ProbeTimeline* timeline)
    : loop_(&loop)
    , source_(&source)
    , timeline_(timeline)
    , options_(options)
    , parser_(options.limits)
    , alive_(std::make_shared<bool>(true))
{
    if (options_.chunk_size == 0U) {
        options_.chunk_size = 1;
    }
}


ChunkScheduler::~ChunkScheduler()
{
    if (timer_ != kInvalidTimerId) {
        (void)loop_->cancel_timer(timer_);
        timer_ = kInvalidTimerId;
    }
    if (!finished_) {
        source_->cancel();
    }
}


const ParseState&
ChunkScheduler::state() const noexcept
{
    return state_;
}


bool
ChunkScheduler::finished() const noexcept
{
    return finished_;
}


void
ChunkScheduler::start(Completion done)
{
    if (started_) {
        return;
    }
    started_ = true;
    done_    = std::move(done);

    if (timeline_) {
        timeline_->appendf("Chunked parser reading %.1f MB in %.1f MB chunks.",
                           to_mib(source_->size()),
                           to_mib(options_.chunk_size));
    }
    if (!source_->ready()) {
        if (timeline_) {
            const std::string name(source_->name());
            timeline_->appendf("Cannot open %s.", name.c_str());
        }
        finish(ParsePhase::Failed, ProbeFailure::ReadError);
        return;
    }
    if (options_.timeout_ms != 0U) {
        timer_ = loop_->add_timer(options_.timeout_ms,
                                  [this]() { on_timeout(); });
    }
    request_next();
}


void
ChunkScheduler::request_next()
{
    const uint64_t total = source_->size();
    if (state_.offset >= total) {
        const ProbeStatus st = parser_.flush();
        if (st == ProbeStatus::Ready) {
            finish(ParsePhase::Ready, ProbeFailure::None);
        } else {
            finish(ParsePhase::Failed, ProbeFailure::ParseError);
        }
        return;
    }

    const uint64_t remaining = total - state_.offset;
    const uint32_t length    = remaining < options_.chunk_size
                                   ? static_cast<uint32_t>(remaining)
                                   : options_.chunk_size;
    const uint64_t offset    = state_.offset;
    source_->read_async(offset, length,
                        [this, offset](ReadStatus status,
                                       std::span<const std::byte> bytes) {
                            on_chunk(offset, status == ReadStatus::Ok, bytes);
                        });
}


void
ChunkScheduler::on_chunk(uint64_t offset, bool ok,
                         std::span<const std::byte> bytes)
{
    if (finished_) {
        return;
    }
    if (!ok) {
        if (timeline_) {
            timeline_->appendf("Read failed at offset %llu.",
                               static_cast<unsigned long long>(offset));
        }
        finish(ParsePhase::Failed, ProbeFailure::ReadError);
        return;
    }
    if (bytes.empty()) {
        // The source reported fewer bytes than its declared length.
        if (timeline_) {
            timeline_->appendf("Unexpected end of data at offset %llu.",
                               static_cast<unsigned long long>(offset));
        }
        finish(ParsePhase::Failed, ProbeFailure::ReadError);
        return;
    }

    state_.chunks_read += 1;
    state_.bytes_accumulated += bytes.size();
    state_.offset = offset + bytes.size();

    const ProbeStatus st = parser_.append(offset, bytes);

    const uint64_t total = source_->size();
    if (options_.follow_skip_hints && st == ProbeStatus::NeedMore) {
        const uint64_t hint = parser_.next_offset();
        if (hint > state_.offset) {
            state_.offset = hint < total ? hint : total;
        }
    }

    log_progress(st != ProbeStatus::NeedMore || state_.offset >= total);

    if (st == ProbeStatus::Ready) {
        finish(ParsePhase::Ready, ProbeFailure::None);
        return;
    }
    if (st == ProbeStatus::Failed) {
        if (timeline_) {
            timeline_->appendf("Parser error: %s.",
                               probe_error_name(parser_.error()));
        }
        finish(ParsePhase::Failed, ProbeFailure::ParseError);
        return;
    }
    request_next();
}


void
ChunkScheduler::on_timeout()
{
    timer_ = kInvalidTimerId;
    if (finished_) {
        return;
    }
    if (timeline_) {
        timeline_->appendf("Timed out after %llu ms.",
                           static_cast<unsigned long long>(
                               options_.timeout_ms));
    }
    finish(ParsePhase::TimedOut, ProbeFailure::TimeoutError);
}


void
ChunkScheduler::log_progress(bool last)
{
    if (!timeline_) {
        return;
    }
    const uint32_t n = state_.chunks_read;
    if (n == 1U || n % 5U == 0U || last) {
        timeline_->appendf("Read chunk %u (%.1f of %.1f MB).", n,
                           to_mib(state_.offset), to_mib(source_->size()));
    }
}


void
ChunkScheduler::finish(ParsePhase phase, ProbeFailure failure)
{
    if (finished_) {
        return;
    }
    finished_      = true;
    state_.status  = phase;
    if (timer_ != kInvalidTimerId) {
        (void)loop_->cancel_timer(timer_);
        timer_ = kInvalidTimerId;
    }
    source_->cancel();

    ProbeOutcome outcome;
    outcome.status  = phase;
    outcome.failure = failure;
    outcome.error   = parser_.error();
    outcome.state   = state_;
    if (phase == ParsePhase::Ready) {
        outcome.info = parser_.info();
    }

    const std::weak_ptr<bool> alive = alive_;
    loop_->post([this, alive, outcome = std::move(outcome)]() {
        if (alive.expired() || !done_) {
            return;
        }
        Completion done = std::move(done_);
        done_           = nullptr;
        done(outcome);
    });
}

}  // namespace mediaprobe
