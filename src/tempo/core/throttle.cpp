#include <tempo/core/throttle.hpp>
#include <tempo/utils/logger.hpp>
#include <stdexcept>

namespace tempo::core {

struct Throttle::State {
    State(EventLoop& loop, std::chrono::milliseconds cooldown, Callback fn)
        : loop(loop), cooldown(cooldown), fn(std::move(fn)), timer(loop) {}

    EventLoop& loop;
    std::chrono::milliseconds cooldown;
    Callback fn;
    bool pending = false;
    bool fired_once = false;
    Timer timer;
};

Throttle::Throttle(EventLoop& loop, std::chrono::milliseconds cooldown, Callback fn) {
    if (cooldown < std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Throttle cooldown must not be negative");
    }
    if (!fn) {
        throw std::invalid_argument("Throttle requires a callback");
    }
    state_ = std::make_shared<State>(loop, cooldown, std::move(fn));
}

void Throttle::operator()() {
    if (state_->pending) {
        return;
    }

    if (!state_->fired_once) {
        state_->fn();
        state_->fired_once = true;
    }

    state_->timer.start(state_->cooldown, [state = state_]() {
        state->pending = false;
        state->loop.schedule(state->fn);
        utils::Logger::debug() << "Throttle cooldown elapsed, trailing call scheduled" << utils::Logger::endl;
    });
    state_->pending = true;
    utils::Logger::debug() << "Throttle armed for " << state_->cooldown.count() << "ms" << utils::Logger::endl;
}

bool Throttle::pending() const {
    return state_->pending;
}

bool Throttle::fired_once() const {
    return state_->fired_once;
}

std::chrono::milliseconds Throttle::cooldown() const {
    return state_->cooldown;
}

std::function<void()> make_throttle(EventLoop& loop,
                                    std::chrono::milliseconds cooldown,
                                    std::function<void()> fn) {
    auto throttle = std::make_shared<Throttle>(loop, cooldown, std::move(fn));
    return [throttle]() { (*throttle)(); };
}

} // namespace tempo::core
