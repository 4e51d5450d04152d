#include "mediaprobe/batch_probe.h"

#include "mediaprobe/event_loop.h"
#include "mediaprobe/probe_timeline.h"

#include <utility>

namespace mediaprobe {

BatchProbe::BatchProbe(EventLoop& loop, const BatchOptions& options,
                       ProbeTimeline* timeline)
    : loop_(&loop)
    , timeline_(timeline)
    , options_(options)
    , alive_(std::make_shared<bool>(true))
{
}


BatchProbe::~BatchProbe()
{
    cancel();
}


bool
BatchProbe::run(std::vector<std::unique_ptr<ByteSource>> sources,
                Completion done)
{
    if (running_) {
        return false;
    }
    running_ = true;
    sources_ = std::move(sources);
    done_    = std::move(done);
    records_.clear();
    records_.reserve(sources_.size());
    index_ = 0;

    if (timeline_) {
        timeline_->appendf("Processing %zu file(s).", sources_.size());
    }
    schedule_next();
    return true;
}


void
BatchProbe::cancel()
{
    // Invalidates every posted task of the current run.
    alive_   = std::make_shared<bool>(true);
    scheduler_.reset();
    running_ = false;
    done_    = nullptr;
}


bool
BatchProbe::running() const noexcept
{
    return running_;
}


const std::vector<FileRecord>&
BatchProbe::records() const noexcept
{
    return records_;
}


size_t
BatchProbe::current_index() const noexcept
{
    return index_;
}


void
BatchProbe::schedule_next()
{
    const std::weak_ptr<bool> alive = alive_;
    loop_->post([this, alive]() {
        if (alive.expired()) {
            return;
        }
        probe_next();
    });
}


void
BatchProbe::probe_next()
{
    scheduler_.reset();

    if (index_ >= sources_.size()) {
        running_ = false;
        if (timeline_) {
            timeline_->appendf("Processed %zu file(s).", records_.size());
        }
        sources_.clear();
        Completion done = std::move(done_);
        done_           = nullptr;
        if (done) {
            done(records_);
        }
        return;
    }

    ByteSource& source    = *sources_[index_];
    const std::string name(source.name());
    const uint64_t size   = source.size();
    const std::string ext = file_extension(name);

    if (timeline_) {
        timeline_->appendf("File %zu/%zu: %s (%.2f MB).", index_ + 1,
                           sources_.size(), name.c_str(),
                           static_cast<double>(size) / (1024.0 * 1024.0));
    }

    if (!is_container_extension(ext, options_.container_extensions)) {
        records_.push_back(
            make_extension_record(name, size, options_.validation));
        if (timeline_) {
            timeline_->appendf("%s: extension '%s' is not a container, "
                               "parser skipped.",
                               name.c_str(), ext.c_str());
        }
        index_ += 1;
        schedule_next();
        return;
    }

    scheduler_ = std::make_unique<ChunkScheduler>(*loop_, source,
                                                  options_.scheduler,
                                                  timeline_);
    scheduler_->start(
        [this](const ProbeOutcome& outcome) { on_probe_done(outcome); });
}


void
BatchProbe::on_probe_done(const ProbeOutcome& outcome)
{
    ByteSource& source  = *sources_[index_];
    const std::string name(source.name());
    const uint64_t size = source.size();

    if (outcome.status == ParsePhase::Ready) {
        const ContainerInfo& info = outcome.info;
        FileRecord r = classify_media(name, info.major_brand,
                                      info.video_codec, info.audio_codec,
                                      size, options_.validation);
        if (timeline_) {
            timeline_->appendf("%s: brand '%s', video '%s', audio '%s'.",
                               name.c_str(), info.major_brand.c_str(),
                               info.video_codec.c_str(),
                               info.audio_codec.c_str());
        }
        records_.push_back(std::move(r));
    } else {
        const char* reason = probe_failure_reason(outcome.failure);
        if (timeline_) {
            timeline_->appendf("%s: %s (%s).", name.c_str(), reason,
                               parse_phase_name(outcome.status));
        }
        records_.push_back(
            make_error_record(name, size, reason, options_.validation));
    }

    index_ += 1;
    // The scheduler is released by the next step, outside its own callback.
    schedule_next();
}


std::vector<std::unique_ptr<ByteSource>>
open_file_sources(EventLoop& loop, const std::vector<std::string>& paths)
{
    std::vector<std::unique_ptr<ByteSource>> out;
    out.reserve(paths.size());
    for (size_t i = 0; i < paths.size(); ++i) {
        out.push_back(std::make_unique<FileByteSource>(loop, paths[i]));
    }
    return out;
}

}  // namespace mediaprobe
