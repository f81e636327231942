#pragma once
#include <chrono>
#include <memory>

namespace tempo::core {

using Nanoseconds = std::chrono::nanoseconds;

// Monotonic time source shared by the profiler and the event loop
class Clock {
public:
    virtual ~Clock() = default;

    virtual Nanoseconds now() const = 0;
    virtual void sleep_for(Nanoseconds duration) = 0;
};

using ClockPtr = std::shared_ptr<Clock>;

class SteadyClock : public Clock {
public:
    Nanoseconds now() const override;
    void sleep_for(Nanoseconds duration) override;
};

// Time only moves when told to; sleeping advances it
class ManualClock : public Clock {
private:
    Nanoseconds now_{0};

public:
    explicit ManualClock(Nanoseconds start = Nanoseconds{0}) : now_(start) {}

    Nanoseconds now() const override { return now_; }
    void sleep_for(Nanoseconds duration) override { advance(duration); }

    void advance(Nanoseconds duration);
    void set(Nanoseconds time);
};

} // namespace tempo::core
