
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>

namespace ferry {

struct ProgressSample {
    uint64_t done{0};
    uint64_t total{0};
    int percent{0};
    double speed{0};   // bytes/s, smoothed
    uint64_t eta_s{0};
};

// Throttled progress accounting shared by both directions.
class ProgressMeter {
public:
    using Clock = std::chrono::steady_clock;

    ProgressMeter(uint64_t total, std::chrono::milliseconds interval,
                  Clock::time_point start = Clock::now());

    // Returns a sample when at least one interval passed since the last one.
    std::optional<ProgressSample> update(uint64_t done, Clock::time_point now = Clock::now());
    // Unthrottled; used for the terminal 100% sample.
    ProgressSample finish(Clock::time_point now = Clock::now());

    double speed() const { return speed_; }
    static int percent_of(uint64_t done, uint64_t total);

private:
    ProgressSample sample(uint64_t done, Clock::time_point now);

    uint64_t total_;
    std::chrono::milliseconds interval_;
    Clock::time_point last_emit_;
    uint64_t last_done_{0};
    double speed_{0};
    bool seeded_{false};
};

} // namespace ferry
