#include <tempo/core/clock.hpp>
#include <stdexcept>
#include <thread>

namespace tempo::core {

Nanoseconds SteadyClock::now() const {
    return std::chrono::duration_cast<Nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()
    );
}

void SteadyClock::sleep_for(Nanoseconds duration) {
    if (duration > Nanoseconds::zero()) {
        std::this_thread::sleep_for(duration);
    }
}

void ManualClock::advance(Nanoseconds duration) {
    if (duration < Nanoseconds::zero()) {
        throw std::invalid_argument("ManualClock cannot move backwards");
    }
    now_ += duration;
}

void ManualClock::set(Nanoseconds time) {
    if (time < now_) {
        throw std::invalid_argument("ManualClock cannot move backwards");
    }
    now_ = time;
}

} // namespace tempo::core
