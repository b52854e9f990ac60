#pragma once

#include <chrono>
#include <functional>

namespace firmata {

struct BackoffPolicy
{
    std::chrono::milliseconds initial_interval{500};
    double multiplier = 1.5;
    std::chrono::milliseconds max_interval{5000};
    std::chrono::milliseconds max_elapsed_time{15 * 60 * 1000};
    // 0 means no limit on the number of attempts
    int max_attempts = 0;
};

// Interval generator: initial_interval, then multiplied on every step and
// capped at max_interval. The running interval keeps its fraction; returned
// intervals are rounded up to whole milliseconds and never decrease.
class ExponentialBackoff
{
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit ExponentialBackoff(const BackoffPolicy &policy, Clock clock = nullptr);

    void reset();
    std::chrono::milliseconds nextInterval();
    std::chrono::milliseconds elapsed() const;

    // True when sleeping for `interval` would overrun max_elapsed_time
    bool wouldExceed(std::chrono::milliseconds interval) const;

private:
    BackoffPolicy policy_;
    Clock clock_;
    std::chrono::steady_clock::time_point start_;
    std::chrono::duration<double, std::milli> current_;
};

} // namespace firmata
