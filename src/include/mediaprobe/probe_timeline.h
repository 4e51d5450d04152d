#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file probe_timeline.h
 * \brief Append-only diagnostic timeline shared by every probe stage.
 */

namespace mediaprobe {

class EventLoop;

struct TimelineEntry final {
    /// Milliseconds since the timeline was created.
    uint64_t elapsed_ms = 0;
    std::string message;
};

/**
 * \brief Ordered, timestamped diagnostic lines for one batch run.
 *
 * Entries are never removed or modified once appended. Indices stay valid
 * across appends; references may not.
 */
class ProbeTimeline final {
public:
    using Listener = std::function<void(const TimelineEntry&)>;

    explicit ProbeTimeline(const EventLoop& loop) noexcept;

    ProbeTimeline(const ProbeTimeline&)            = delete;
    ProbeTimeline& operator=(const ProbeTimeline&) = delete;

    void append(std::string_view message);
    /// printf-style convenience wrapper around \ref append.
    void appendf(const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
        __attribute__((format(printf, 2, 3)))
#endif
        ;

    size_t size() const noexcept;
    bool empty() const noexcept;
    const TimelineEntry& entry(size_t index) const noexcept;
    const std::vector<TimelineEntry>& entries() const noexcept;

    /// Rendered lines (`"[+S.mmms] message"`), in append order.
    std::vector<std::string> lines() const;

    /// Installs the single listener notified after each append (empty = none).
    void set_listener(Listener listener);

private:
    const EventLoop* loop_ = nullptr;
    uint64_t origin_ms_    = 0;
    std::vector<TimelineEntry> entries_;
    Listener listener_;
};

/// Renders one entry as `"[+S.mmms] message"`.
std::string
format_timeline_entry(const TimelineEntry& entry);

}  // namespace mediaprobe
