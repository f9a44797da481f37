#include "common/ticker.hpp"
#include <stdexcept>

Ticker::Ticker(Duration interval, TimePoint start)
    : interval_(interval), nextRun_(start + interval) {
    if (interval_.count() <= 0) {
        throw std::invalid_argument("Ticker: interval must be positive");
    }
}

void Ticker::advance(TimePoint now) {
    if (now < nextRun_) return;
    auto behind = (now - nextRun_) / interval_;
    nextRun_ += interval_ * (behind + 1);
}
