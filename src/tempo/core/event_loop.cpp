#include <tempo/core/event_loop.hpp>
#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>

namespace tempo::core {

EventLoop::EventLoop(ClockPtr clock) : clock_(std::move(clock)) {
    if (!clock_) {
        throw std::invalid_argument("EventLoop requires a clock");
    }
}

EventLoop::~EventLoop() {
    // Callbacks still armed may own timers; they must not disarm into a dying map
    alive_.reset();
}

void EventLoop::schedule(Callback cb) {
    if (!cb) {
        throw std::invalid_argument("Cannot schedule an empty callback");
    }
    ready_.push_back(std::move(cb));
}

uint64_t EventLoop::arm(Nanoseconds deadline, Callback cb) {
    uint64_t id = next_timer_id_++;
    timers_.emplace(id, TimerSlot{deadline, std::move(cb)});
    return id;
}

void EventLoop::disarm(uint64_t id) {
    timers_.erase(id);
}

std::optional<Nanoseconds> EventLoop::next_deadline() const {
    if (timers_.empty()) {
        return std::nullopt;
    }
    auto it = std::min_element(timers_.begin(), timers_.end(),
        [](const auto& a, const auto& b) {
            return a.second.deadline < b.second.deadline;
        });
    return it->second.deadline;
}

size_t EventLoop::run_once() {
    const Nanoseconds now = clock_->now();
    size_t invoked = 0;
    // Callbacks queued during this turn, timers included, wait for the next one
    size_t batch = ready_.size();

    std::vector<std::pair<Nanoseconds, uint64_t>> due;
    for (const auto& [id, slot] : timers_) {
        if (slot.deadline <= now) {
            due.emplace_back(slot.deadline, id);
        }
    }
    std::sort(due.begin(), due.end());

    for (const auto& [deadline, id] : due) {
        // An earlier callback in this turn may have stopped this timer
        auto it = timers_.find(id);
        if (it == timers_.end()) {
            continue;
        }
        Callback cb = std::move(it->second.callback);
        timers_.erase(it);
        ++invoked;
        cb();
    }

    while (batch-- > 0 && !ready_.empty()) {
        Callback cb = std::move(ready_.front());
        ready_.pop_front();
        ++invoked;
        cb();
    }

    return invoked;
}

void EventLoop::run() {
    stopped_ = false;
    while (!stopped_ && has_pending()) {
        if (run_once() > 0) {
            continue;
        }

        auto deadline = next_deadline();
        if (deadline) {
            Nanoseconds wait = *deadline - clock_->now();
            if (wait > Nanoseconds::zero()) {
                clock_->sleep_for(wait);
            }
        }
    }
}

void Timer::start(Nanoseconds delay, EventLoop::Callback cb) {
    if (delay < Nanoseconds::zero()) {
        throw std::invalid_argument("Timer delay must not be negative");
    }
    if (!cb) {
        throw std::invalid_argument("Timer requires a callback");
    }
    if (loop_alive_.expired()) {
        throw std::logic_error("Timer started after its event loop was destroyed");
    }
    stop();
    id_ = loop_.arm(loop_.now() + delay, [this, cb = std::move(cb)]() {
        id_ = 0;
        cb();
    });
}

void Timer::stop() {
    if (id_ != 0 && !loop_alive_.expired()) {
        loop_.disarm(id_);
    }
    id_ = 0;
}

bool Timer::is_active() const {
    return id_ != 0 && !loop_alive_.expired() && loop_.is_armed(id_);
}

} // namespace tempo::core
