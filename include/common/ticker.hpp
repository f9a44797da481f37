#pragma once

#include <chrono>

// Fixed-period tick schedule. Ticks fall on start + k * interval and are
// never shifted by work done between them. When the owner falls behind by
// more than one period the missed ticks collapse into one.
class Ticker {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;
    using Duration  = std::chrono::milliseconds;

    explicit Ticker(Duration interval, TimePoint start = Clock::now());

    TimePoint nextRun() const { return nextRun_; }
    Duration  interval() const { return interval_; }

    bool due(TimePoint now) const { return now >= nextRun_; }

    // Consume the pending tick; the next one is the first period boundary
    // strictly after `now`.
    void advance(TimePoint now);

private:
    Duration  interval_;
    TimePoint nextRun_;
};
