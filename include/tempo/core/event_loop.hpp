#pragma once
#include <tempo/core/clock.hpp>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>

namespace tempo::core {

// Single-threaded cooperative scheduler. Work runs in discrete turns: due
// timers first, then the callbacks queued before the turn started.
class EventLoop {
public:
    using Callback = std::function<void()>;

    explicit EventLoop(ClockPtr clock = std::make_shared<SteadyClock>());
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    Clock& clock() { return *clock_; }
    Nanoseconds now() const { return clock_->now(); }

    // Run cb on the next turn
    void schedule(Callback cb);

    // One turn. Returns the number of callbacks invoked; exceptions thrown by
    // a callback propagate after it has been dequeued.
    size_t run_once();

    // Turns until no timer is armed and nothing is queued, or stop() is called.
    // Sleeps on the clock while waiting for the next deadline.
    void run();
    void stop() { stopped_ = true; }

    bool has_pending() const { return !ready_.empty() || !timers_.empty(); }
    size_t queued() const { return ready_.size(); }
    size_t armed_timers() const { return timers_.size(); }
    std::optional<Nanoseconds> next_deadline() const;

private:
    friend class Timer;

    struct TimerSlot {
        Nanoseconds deadline;
        Callback callback;
    };

    uint64_t arm(Nanoseconds deadline, Callback cb);
    void disarm(uint64_t id);
    bool is_armed(uint64_t id) const { return timers_.count(id) != 0; }

    // Expires when the loop is destroyed; timers check it before disarming
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
    ClockPtr clock_;
    std::deque<Callback> ready_;
    // Ids grow monotonically, so ordering by id is arming order
    std::map<uint64_t, TimerSlot> timers_;
    uint64_t next_timer_id_ = 1;
    bool stopped_ = false;
};

// One-shot timer handle. Re-starting replaces the previous deadline and the
// destructor disarms. The handle clears itself when the timer fires and never
// touches a loop that has already been destroyed.
class Timer {
public:
    explicit Timer(EventLoop& loop) : loop_(loop), loop_alive_(loop.alive_) {}
    ~Timer() { stop(); }

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;

    void start(Nanoseconds delay, EventLoop::Callback cb);
    void stop();
    bool is_active() const;

private:
    EventLoop& loop_;
    std::weak_ptr<bool> loop_alive_;
    uint64_t id_ = 0;
};

} // namespace tempo::core
