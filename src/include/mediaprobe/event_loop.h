#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>

/**
 * \file event_loop.h
 * \brief Single-threaded cooperative event loop with cancellable timers.
 */

namespace mediaprobe {

using TimerId = uint64_t;

static constexpr TimerId kInvalidTimerId = 0;

/// Time base used by an \ref EventLoop.
enum class LoopClock : uint8_t {
    /// Monotonic wall clock; the loop sleeps until the next due timer.
    Steady,
    /// Simulated clock; the loop jumps to the next due timer without sleeping.
    Virtual,
};

/**
 * \brief Cooperative task/timer loop.
 *
 * All callbacks run on the thread calling \ref run. Posted tasks run in FIFO
 * order before a timer that is due now, but a timer whose due time has
 * already passed fires before the next task. Timers with the same due time
 * fire in creation order.
 *
 * \note \ref cancel_timer takes effect immediately: a cancelled timer never
 * fires, even if its due time has already passed.
 */
class EventLoop final {
public:
    explicit EventLoop(LoopClock clock = LoopClock::Steady) noexcept;

    EventLoop(const EventLoop&)            = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /// Milliseconds since the loop was created.
    uint64_t now_ms() const noexcept;

    void post(std::function<void()> task);

    /// Schedules \p task once after \p delay_ms.
    TimerId add_timer(uint64_t delay_ms, std::function<void()> task);
    /// Schedules \p task every \p period_ms until cancelled.
    TimerId add_interval(uint64_t period_ms, std::function<void()> task);

    /// Returns false if \p id is unknown (already fired or cancelled).
    bool cancel_timer(TimerId id) noexcept;
    bool has_timer(TimerId id) const noexcept;

    size_t pending_tasks() const noexcept;
    size_t pending_timers() const noexcept;

    /// Runs one task or fires one timer. Returns false when idle.
    bool run_once();
    /// Runs until no task and no timer remain.
    void run();
    /// Runs until \p done returns true or the loop becomes idle.
    void run_until(const std::function<bool()>& done);

    /// Advances a virtual clock by \p ms without firing timers.
    void advance_virtual(uint64_t ms) noexcept;

private:
    struct Timer final {
        uint64_t due_ms    = 0;
        uint64_t period_ms = 0;
        std::function<void()> task;
    };

    uint64_t steady_now_ms() const noexcept;
    TimerId insert_timer(uint64_t delay_ms, uint64_t period_ms,
                         std::function<void()> task);
    std::map<TimerId, Timer>::iterator next_due_timer() noexcept;
    void fire_timer(std::map<TimerId, Timer>::iterator it);

    LoopClock clock_;
    uint64_t origin_ms_  = 0;
    uint64_t virtual_ms_ = 0;
    TimerId next_id_     = 1;

    std::deque<std::function<void()>> tasks_;
    std::map<TimerId, Timer> timers_;
};

}  // namespace mediaprobe
