
#include "progress.hpp"
#include <algorithm>
#include <cmath>

namespace ferry {

ProgressMeter::ProgressMeter(uint64_t total, std::chrono::milliseconds interval,
                             Clock::time_point start)
    : total_(total), interval_(interval), last_emit_(start) {}

int ProgressMeter::percent_of(uint64_t done, uint64_t total) {
  if (total == 0)
    return 100;
  double p = std::round((double)done * 100.0 / (double)total);
  return (int)std::min(100.0, p);
}

ProgressSample ProgressMeter::sample(uint64_t done, Clock::time_point now) {
  std::chrono::duration<double> dt = now - last_emit_;
  if (dt.count() > 0) {
    double instant = (double)(done - std::min(done, last_done_)) / dt.count();
    if (!seeded_) {
      speed_ = instant;
      seeded_ = true;
    } else {
      speed_ = speed_ * 0.7 + instant * 0.3;
    }
  }
  last_emit_ = now;
  last_done_ = done;

  ProgressSample s;
  s.done = done;
  s.total = total_;
  s.percent = percent_of(done, total_);
  s.speed = speed_;
  uint64_t remaining = total_ > done ? total_ - done : 0;
  s.eta_s = speed_ > 0 ? (uint64_t)std::ceil((double)remaining / speed_) : 0;
  return s;
}

std::optional<ProgressSample> ProgressMeter::update(uint64_t done,
                                                    Clock::time_point now) {
  if (now - last_emit_ < interval_)
    return std::nullopt;
  return sample(done, now);
}

ProgressSample ProgressMeter::finish(Clock::time_point now) {
  return sample(total_, now);
}

} // namespace ferry
