#include "mediaprobe/chunk_scheduler.h"

#include "mediaprobe/byte_source.h"
#include "mediaprobe/event_loop.h"
#include "mediaprobe/probe_timeline.h"

#include "bmff_test_builder.h"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mediaprobe {
namespace {

    using namespace test_util;

    /// Never completes a read.
    class StalledSource final : public ByteSource {
    public:
        explicit StalledSource(uint64_t size)
            : size_(size)
        {
        }

        std::string_view name() const noexcept override { return "stall.mp4"; }
        uint64_t size() const noexcept override { return size_; }

        void read_async(uint64_t, uint32_t, ReadCallback done) override
        {
            reads += 1;
            pending = std::move(done);
        }
        void cancel() noexcept override { cancelled = true; }

        uint32_t reads = 0;
        bool cancelled = false;
        ReadCallback pending;

    private:
        uint64_t size_ = 0;
    };


    /// In-memory source that records requested offsets and can fail reads.
    class InstrumentedSource final : public LoopByteSource {
    public:
        InstrumentedSource(EventLoop& loop, std::vector<std::byte> bytes)
            : LoopByteSource(loop)
            , bytes_(std::move(bytes))
        {
        }

        std::string_view name() const noexcept override { return "clip.mp4"; }
        uint64_t size() const noexcept override { return bytes_.size(); }

        std::vector<uint64_t> offsets;
        uint64_t fail_from = UINT64_MAX;

    protected:
        bool read_window(uint64_t offset, std::span<std::byte> out,
                         size_t* got) override
        {
            offsets.push_back(offset);
            if (offset >= fail_from) {
                return false;
            }
            const uint64_t avail = bytes_.size() - offset;
            const size_t n = avail < out.size() ? static_cast<size_t>(avail)
                                                : out.size();
            std::memcpy(out.data(), bytes_.data() + offset, n);
            *got = n;
            return true;
        }

    private:
        std::vector<std::byte> bytes_;
    };


    /// Memory source whose every read blocks for a fixed wall-clock time.
    class SlowSource final : public LoopByteSource {
    public:
        SlowSource(EventLoop& loop, std::vector<std::byte> bytes,
                   uint32_t delay_ms)
            : LoopByteSource(loop)
            , bytes_(std::move(bytes))
            , delay_ms_(delay_ms)
        {
        }

        std::string_view name() const noexcept override { return "slow.mp4"; }
        uint64_t size() const noexcept override { return bytes_.size(); }

        uint32_t reads = 0;

    protected:
        bool read_window(uint64_t offset, std::span<std::byte> out,
                         size_t* got) override
        {
            reads += 1;
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
            const uint64_t avail = bytes_.size() - offset;
            const size_t n = avail < out.size() ? static_cast<size_t>(avail)
                                                : out.size();
            std::memcpy(out.data(), bytes_.data() + offset, n);
            *got = n;
            return true;
        }

    private:
        std::vector<std::byte> bytes_;
        uint32_t delay_ms_ = 0;
    };


    /// Source whose size is known but which cannot be read at all.
    class UnopenedSource final : public ByteSource {
    public:
        std::string_view name() const noexcept override { return "locked.mp4"; }
        uint64_t size() const noexcept override { return 8192; }
        bool ready() const noexcept override { return false; }

        void read_async(uint64_t, uint32_t, ReadCallback) override
        {
            reads += 1;
        }
        void cancel() noexcept override {}

        uint32_t reads = 0;
    };


    static bool timeline_contains(const ProbeTimeline& t, std::string_view s)
    {
        for (const TimelineEntry& e : t.entries()) {
            if (e.message.find(s) != std::string::npos) {
                return true;
            }
        }
        return false;
    }


    static std::optional<ProbeOutcome>
    run_scheduler(EventLoop& loop, ByteSource& source,
                  const SchedulerOptions& options, ProbeTimeline* timeline)
    {
        std::optional<ProbeOutcome> result;
        ChunkScheduler scheduler(loop, source, options, timeline);
        scheduler.start([&](const ProbeOutcome& o) { result = o; });
        loop.run_until([&]() { return result.has_value(); });
        return result;
    }

}  // namespace


TEST(ChunkScheduler, StopsAsSoonAsMovieIsParsed)
{
    EventLoop loop(LoopClock::Virtual);
    ProbeTimeline timeline(loop);
    Mp4Fixture f;
    f.mdat_bytes = 100000;
    InstrumentedSource source(loop, make_mp4(f));

    SchedulerOptions options;
    options.chunk_size = 1024;
    const std::optional<ProbeOutcome> out = run_scheduler(loop, source, options,
                                                          &timeline);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->status, ParsePhase::Ready);
    EXPECT_EQ(out->failure, ProbeFailure::None);
    EXPECT_EQ(out->state.chunks_read, 1U);
    EXPECT_EQ(out->info.video_codec, "avc1.64001f");
    EXPECT_EQ(source.offsets.size(), 1U);

    ASSERT_FALSE(timeline.empty());
    EXPECT_EQ(timeline.entry(0).message.rfind("Chunked parser reading", 0), 0U);
    EXPECT_TRUE(timeline_contains(timeline, "Read chunk 1 ("));
}


TEST(ChunkScheduler, ReadsToEndWhenMovieIsLast)
{
    EventLoop loop(LoopClock::Virtual);
    Mp4Fixture f;
    f.moov_first = false;
    f.mdat_bytes = 64 * 1024;
    const std::vector<std::byte> file = make_mp4(f);
    InstrumentedSource source(loop, file);

    SchedulerOptions options;
    options.chunk_size = 4096;
    const std::optional<ProbeOutcome> out = run_scheduler(loop, source, options,
                                                          nullptr);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->status, ParsePhase::Ready);
    EXPECT_EQ(out->state.chunks_read, (file.size() + 4095U) / 4096U);
    EXPECT_EQ(out->state.bytes_accumulated, file.size());
    for (size_t i = 0; i < source.offsets.size(); ++i) {
        EXPECT_EQ(source.offsets[i], i * 4096U);
    }
}


TEST(ChunkScheduler, SkipHintsJumpOverMediaData)
{
    EventLoop loop(LoopClock::Virtual);
    Mp4Fixture f;
    f.moov_first = false;
    f.mdat_bytes = 64 * 1024;
    InstrumentedSource source(loop, make_mp4(f));

    SchedulerOptions options;
    options.chunk_size        = 4096;
    options.follow_skip_hints = true;
    const std::optional<ProbeOutcome> out = run_scheduler(loop, source, options,
                                                          nullptr);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->status, ParsePhase::Ready);
    ASSERT_EQ(source.offsets.size(), 2U);
    EXPECT_EQ(source.offsets[1], out->info.movie_offset);
}


TEST(ChunkScheduler, StalledReadTimesOut)
{
    EventLoop loop(LoopClock::Virtual);
    ProbeTimeline timeline(loop);
    StalledSource source(10 * 1024 * 1024);

    SchedulerOptions options;
    options.timeout_ms = 45000;
    const std::optional<ProbeOutcome> out = run_scheduler(loop, source, options,
                                                          &timeline);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->status, ParsePhase::TimedOut);
    EXPECT_EQ(out->failure, ProbeFailure::TimeoutError);
    EXPECT_STREQ(probe_failure_reason(out->failure), "Processing timeout");
    EXPECT_EQ(loop.now_ms(), 45000U);
    EXPECT_EQ(source.reads, 1U);
    EXPECT_TRUE(source.cancelled);
    EXPECT_TRUE(timeline_contains(timeline, "Timed out after 45000 ms."));
}


TEST(ChunkScheduler, SlowReadsTimeOutOnSteadyClock)
{
    EventLoop loop(LoopClock::Steady);
    ProbeTimeline timeline(loop);
    Mp4Fixture f;
    f.moov_first = false;
    f.mdat_bytes = 64 * 1024;
    const std::vector<std::byte> file = make_mp4(f);
    SlowSource source(loop, file, 20);

    SchedulerOptions options;
    options.chunk_size = 1024;
    options.timeout_ms = 200;
    const std::optional<ProbeOutcome> out = run_scheduler(loop, source, options,
                                                          &timeline);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->status, ParsePhase::TimedOut);
    EXPECT_EQ(out->failure, ProbeFailure::TimeoutError);
    // Reading every chunk would take well over a second.
    EXPECT_LT(out->state.bytes_accumulated, file.size());
    EXPECT_LT(source.reads, 20U);
    EXPECT_LT(loop.now_ms(), 1000U);
    EXPECT_TRUE(timeline_contains(timeline, "Timed out after 200 ms."));
}


TEST(ChunkScheduler, UnopenedSourceIsReadError)
{
    EventLoop loop(LoopClock::Virtual);
    ProbeTimeline timeline(loop);
    UnopenedSource source;

    const std::optional<ProbeOutcome> out
        = run_scheduler(loop, source, SchedulerOptions {}, &timeline);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->status, ParsePhase::Failed);
    EXPECT_EQ(out->failure, ProbeFailure::ReadError);
    EXPECT_EQ(source.reads, 0U);
    EXPECT_EQ(loop.pending_timers(), 0U);
    EXPECT_TRUE(timeline_contains(timeline, "Cannot open locked.mp4."));
}


TEST(ChunkScheduler, LateReadAfterTimeoutIsIgnored)
{
    EventLoop loop(LoopClock::Virtual);
    StalledSource source(1024);

    SchedulerOptions options;
    options.timeout_ms = 100;
    int completions    = 0;
    ChunkScheduler scheduler(loop, source, options);
    scheduler.start([&](const ProbeOutcome&) { completions += 1; });
    loop.run();
    ASSERT_TRUE(scheduler.finished());
    EXPECT_EQ(scheduler.state().status, ParsePhase::TimedOut);

    // A misbehaving source delivering after cancel changes nothing.
    const std::vector<std::byte> junk(16, std::byte { 0 });
    source.pending(ReadStatus::Ok, junk);
    loop.run();
    EXPECT_EQ(completions, 1);
    EXPECT_EQ(scheduler.state().chunks_read, 0U);
}


TEST(ChunkScheduler, ReadFailureIsReported)
{
    EventLoop loop(LoopClock::Virtual);
    ProbeTimeline timeline(loop);
    Mp4Fixture f;
    f.moov_first = false;
    InstrumentedSource source(loop, make_mp4(f));
    source.fail_from = 1024;

    SchedulerOptions options;
    options.chunk_size = 1024;
    const std::optional<ProbeOutcome> out = run_scheduler(loop, source, options,
                                                          &timeline);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->status, ParsePhase::Failed);
    EXPECT_EQ(out->failure, ProbeFailure::ReadError);
    EXPECT_STREQ(probe_failure_reason(out->failure), "File read error");
    EXPECT_TRUE(timeline_contains(timeline, "Read failed at offset 1024."));
}


TEST(ChunkScheduler, ParseFailureIsReported)
{
    EventLoop loop(LoopClock::Virtual);
    std::vector<std::byte> junk(4096, std::byte { 0x01 });
    InstrumentedSource source(loop, junk);

    const std::optional<ProbeOutcome> out
        = run_scheduler(loop, source, SchedulerOptions {}, nullptr);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->status, ParsePhase::Failed);
    EXPECT_EQ(out->failure, ProbeFailure::ParseError);
    EXPECT_EQ(out->error, ProbeError::NotBmff);
}


TEST(ChunkScheduler, EmptyInputIsParseError)
{
    EventLoop loop(LoopClock::Virtual);
    InstrumentedSource source(loop, {});

    const std::optional<ProbeOutcome> out
        = run_scheduler(loop, source, SchedulerOptions {}, nullptr);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->failure, ProbeFailure::ParseError);
    EXPECT_TRUE(source.offsets.empty());
}


TEST(ChunkScheduler, OwnerMayDestroySchedulerInCompletion)
{
    EventLoop loop(LoopClock::Virtual);
    InstrumentedSource source(loop, make_mp4());

    auto scheduler = std::make_unique<ChunkScheduler>(loop, source,
                                                      SchedulerOptions {});
    bool done = false;
    scheduler->start([&](const ProbeOutcome& o) {
        EXPECT_EQ(o.status, ParsePhase::Ready);
        scheduler.reset();
        done = true;
    });
    EXPECT_FALSE(done);
    loop.run();
    EXPECT_TRUE(done);
    EXPECT_EQ(scheduler, nullptr);
    EXPECT_EQ(loop.pending_timers(), 0U);
}

}  // namespace mediaprobe
