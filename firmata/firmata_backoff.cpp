#include "firmata_backoff.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace firmata {

ExponentialBackoff::ExponentialBackoff(const BackoffPolicy &policy, Clock clock)
    : policy_(policy)
    , clock_(std::move(clock))
{
    if (policy_.initial_interval.count() <= 0) {
        throw std::invalid_argument("backoff initial interval must be positive");
    }
    if (policy_.multiplier < 1.0) {
        throw std::invalid_argument("backoff multiplier must be at least 1");
    }
    if (policy_.max_interval < policy_.initial_interval) {
        throw std::invalid_argument("backoff max interval is below the initial interval");
    }
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
    reset();
}

void ExponentialBackoff::reset()
{
    start_ = clock_();
    current_ = policy_.initial_interval;
}

std::chrono::milliseconds ExponentialBackoff::nextInterval()
{
    const auto interval = std::chrono::ceil<std::chrono::milliseconds>(current_);

    const std::chrono::duration<double, std::milli> cap = policy_.max_interval;
    current_ = std::min(current_ * policy_.multiplier, cap);

    return interval;
}

std::chrono::milliseconds ExponentialBackoff::elapsed() const
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(clock_() - start_);
}

bool ExponentialBackoff::wouldExceed(std::chrono::milliseconds interval) const
{
    return elapsed() + interval > policy_.max_elapsed_time;
}

} // namespace firmata
