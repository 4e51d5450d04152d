#include "mediaprobe/event_loop.h"

#include <chrono>
#include <thread>
#include <utility>

namespace mediaprobe {

EventLoop::EventLoop(LoopClock clock) noexcept
    : clock_(clock)
{
    origin_ms_ = steady_now_ms();
}


uint64_t
EventLoop::steady_now_ms() const noexcept
{
    const auto now = std::chrono::steady_clock::now().time_since_epoch();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}


uint64_t
EventLoop::now_ms() const noexcept
{
    if (clock_ == LoopClock::Virtual) {
        return virtual_ms_;
    }
    return steady_now_ms() - origin_ms_;
}


void
EventLoop::post(std::function<void()> task)
{
    if (!task) {
        return;
    }
    tasks_.push_back(std::move(task));
}


TimerId
EventLoop::insert_timer(uint64_t delay_ms, uint64_t period_ms,
                        std::function<void()> task)
{
    if (!task) {
        return kInvalidTimerId;
    }
    const TimerId id = next_id_;
    next_id_ += 1;

    Timer timer;
    timer.due_ms    = now_ms() + delay_ms;
    timer.period_ms = period_ms;
    timer.task      = std::move(task);
    timers_.emplace(id, std::move(timer));
    return id;
}


TimerId
EventLoop::add_timer(uint64_t delay_ms, std::function<void()> task)
{
    return insert_timer(delay_ms, 0, std::move(task));
}


TimerId
EventLoop::add_interval(uint64_t period_ms, std::function<void()> task)
{
    // A zero period would starve posted tasks.
    if (period_ms == 0U) {
        period_ms = 1;
    }
    return insert_timer(period_ms, period_ms, std::move(task));
}


bool
EventLoop::cancel_timer(TimerId id) noexcept
{
    if (id == kInvalidTimerId) {
        return false;
    }
    return timers_.erase(id) != 0U;
}


bool
EventLoop::has_timer(TimerId id) const noexcept
{
    return timers_.find(id) != timers_.end();
}


size_t
EventLoop::pending_tasks() const noexcept
{
    return tasks_.size();
}


size_t
EventLoop::pending_timers() const noexcept
{
    return timers_.size();
}


std::map<TimerId, EventLoop::Timer>::iterator
EventLoop::next_due_timer() noexcept
{
    auto best = timers_.end();
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        if (best == timers_.end() || it->second.due_ms < best->second.due_ms) {
            best = it;
        }
    }
    return best;
}


void
EventLoop::fire_timer(std::map<TimerId, Timer>::iterator it)
{
    const uint64_t due = it->second.due_ms;

    // The callback may cancel this timer (or others), so run a copy.
    std::function<void()> task = it->second.task;
    if (it->second.period_ms == 0U) {
        timers_.erase(it);
    } else {
        it->second.due_ms = due + it->second.period_ms;
    }
    task();
}


bool
EventLoop::run_once()
{
    auto it = next_due_timer();

    // A timer already past due fires before the next task.
    if (it != timers_.end() && it->second.due_ms < now_ms()) {
        fire_timer(it);
        return true;
    }

    if (!tasks_.empty()) {
        std::function<void()> task = std::move(tasks_.front());
        tasks_.pop_front();
        task();
        return true;
    }

    if (it == timers_.end()) {
        return false;
    }

    const uint64_t due = it->second.due_ms;
    const uint64_t now = now_ms();
    if (due > now) {
        if (clock_ == LoopClock::Virtual) {
            virtual_ms_ = due;
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(due - now));
        }
    }
    fire_timer(it);
    return true;
}


void
EventLoop::run()
{
    while (run_once()) {
    }
}


void
EventLoop::run_until(const std::function<bool()>& done)
{
    while (!done()) {
        if (!run_once()) {
            return;
        }
    }
}


void
EventLoop::advance_virtual(uint64_t ms) noexcept
{
    if (clock_ == LoopClock::Virtual) {
        virtual_ms_ += ms;
    }
}

}  // namespace mediaprobe
