#pragma once
#include <tempo/core/event_loop.hpp>
#include <chrono>
#include <functional>
#include <memory>

namespace tempo::core {

// Leading-edge throttle with a trailing call.
//
// The very first call runs fn synchronously. Any call made while idle arms a
// one-shot cooldown timer; calls made while it is armed are dropped. When the
// timer fires the throttle goes idle again and fn is scheduled for the next
// loop turn, exactly once per armed window, even if every handle to the
// throttle is gone by then. Exceptions from fn are not caught.
class Throttle {
public:
    using Callback = std::function<void()>;

    Throttle(EventLoop& loop, std::chrono::milliseconds cooldown, Callback fn);

    Throttle(const Throttle&) = delete;
    Throttle& operator=(const Throttle&) = delete;

    void operator()();

    bool pending() const;
    bool fired_once() const;
    std::chrono::milliseconds cooldown() const;

private:
    // Shared with the armed timer callback, which holds it until it fires
    struct State;

    std::shared_ptr<State> state_;
};

// Wraps fn in a shared Throttle; copies of the returned wrapper share state
std::function<void()> make_throttle(EventLoop& loop,
                                    std::chrono::milliseconds cooldown,
                                    std::function<void()> fn);

} // namespace tempo::core
