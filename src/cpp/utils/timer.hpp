#pragma once
// Steady-clock timing: per-cycle query timer and the sampling interval pacer
#include <chrono>
#include <cstdint>
#include <thread>

namespace nodestat {

using SteadyClock = std::chrono::steady_clock;

class Timer {
public:
    void start() noexcept { start_ = SteadyClock::now(); }

    void stop() noexcept { end_ = SteadyClock::now(); }

    [[nodiscard]] int64_t elapsed_ms() const noexcept {
        return std::chrono::duration_cast<std::chrono::milliseconds>(end_ - start_).count();
    }

    [[nodiscard]] double elapsed_sec() const noexcept {
        return std::chrono::duration<double>(end_ - start_).count();
    }

private:
    SteadyClock::time_point start_{};
    SteadyClock::time_point end_{};
};

// Paces the sampling loop. wait_next() blocks until the next cycle is due;
// now() is the clock every snapshot is stamped with.
class IntervalPacer {
public:
    virtual ~IntervalPacer() = default;

    virtual void wait_next() = 0;
    [[nodiscard]] virtual SteadyClock::time_point now() const = 0;
};

// Fixed-rate pacer on the steady clock. Deadlines advance by one interval
// per cycle; a cycle that overran its slot re-anchors at now + interval
// instead of firing a burst of catch-up cycles.
class SteadyPacer : public IntervalPacer {
public:
    explicit SteadyPacer(std::chrono::milliseconds interval)
        : interval_(interval), deadline_(SteadyClock::now() + interval) {}

    void wait_next() override {
        auto now = SteadyClock::now();
        if (deadline_ <= now) {
            deadline_ = now + interval_;
        }
        std::this_thread::sleep_until(deadline_);
        deadline_ += interval_;
    }

    [[nodiscard]] SteadyClock::time_point now() const override {
        return SteadyClock::now();
    }

private:
    std::chrono::milliseconds interval_;
    SteadyClock::time_point deadline_;
};

} // namespace nodestat
