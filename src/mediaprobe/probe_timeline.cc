#include "mediaprobe/probe_timeline.h"

#include "mediaprobe/event_loop.h"

#include <cstdarg>
#include <cstdio>
#include <utility>

namespace mediaprobe {

ProbeTimeline::ProbeTimeline(const EventLoop& loop) noexcept
    : loop_(&loop)
    , origin_ms_(loop.now_ms())
{
}


void
ProbeTimeline::append(std::string_view message)
{
    TimelineEntry e;
    e.elapsed_ms = loop_->now_ms() - origin_ms_;
    e.message.assign(message.data(), message.size());
    entries_.push_back(std::move(e));

    if (listener_) {
        // Copy: the listener may append (and thus reallocate entries_).
        const TimelineEntry last = entries_.back();
        listener_(last);
    }
}


void
ProbeTimeline::appendf(const char* fmt, ...)
{
    char buf[512];
    va_list args;
    va_start(args, fmt);
    const int n = std::vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    if (n < 0) {
        return;
    }
    if (static_cast<size_t>(n) < sizeof(buf)) {
        append(std::string_view(buf, static_cast<size_t>(n)));
        return;
    }

    std::string big(static_cast<size_t>(n) + 1U, '\0');
    va_start(args, fmt);
    std::vsnprintf(big.data(), big.size(), fmt, args);
    va_end(args);
    big.resize(static_cast<size_t>(n));
    append(big);
}


size_t
ProbeTimeline::size() const noexcept
{
    return entries_.size();
}


bool
ProbeTimeline::empty() const noexcept
{
    return entries_.empty();
}


const TimelineEntry&
ProbeTimeline::entry(size_t index) const noexcept
{
    return entries_[index];
}


const std::vector<TimelineEntry>&
ProbeTimeline::entries() const noexcept
{
    return entries_;
}


std::vector<std::string>
ProbeTimeline::lines() const
{
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (size_t i = 0; i < entries_.size(); ++i) {
        out.push_back(format_timeline_entry(entries_[i]));
    }
    return out;
}


void
ProbeTimeline::set_listener(Listener listener)
{
    listener_ = std::move(listener);
}


std::string
format_timeline_entry(const TimelineEntry& entry)
{
    char prefix[48];
    std::snprintf(prefix, sizeof(prefix), "[+%llu.%03llus] ",
                  static_cast<unsigned long long>(entry.elapsed_ms / 1000U),
                  static_cast<unsigned long long>(entry.elapsed_ms % 1000U));
    std::string out(prefix);
    out.append(entry.message);
    return out;
}

}  // namespace mediaprobe
