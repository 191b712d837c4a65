
#include "flow.hpp"
#include "logging.hpp"

namespace ferry {

FlowController::FlowController(asio::io_context &io, const FlowOptions &opts)
    : io_(io), opts_(opts), timer_(io), alive_(std::make_shared<bool>(true)) {}

FlowController::~FlowController() { timer_.cancel(); }

void FlowController::start(Clock::time_point now) { start_ = now; }

bool FlowController::over_high_water(const ChannelAdapter &ch) const {
  return ch.buffered_bytes() > opts_.high_water;
}

void FlowController::wait_for_room(ChannelAdapter &ch,
                                   std::function<void()> ready) {
  if (!over_high_water(ch)) {
    asio::post(io_, std::move(ready));
    return;
  }
  suspensions_++;
  pending_ = std::move(ready);
  Logger::instance().log(LogLevel::TRACE,
                         "flow: %zu bytes buffered over high-water %zu",
                         ch.buffered_bytes(), opts_.high_water);
  arm(ch);
}

void FlowController::arm(ChannelAdapter &ch) {
  std::weak_ptr<bool> token = alive_;
  ChannelAdapter *chp = &ch;
  bool notified = ch.notify_when_drained([this, token, chp]() {
    if (token.expired())
      return;
    resume_if_room(*chp);
  });
  if (!notified)
    poll_room(ch);
}

void FlowController::poll_room(ChannelAdapter &ch) {
  std::weak_ptr<bool> token = alive_;
  ChannelAdapter *chp = &ch;
  timer_.expires_after(opts_.drain_poll);
  timer_.async_wait([this, token, chp](std::error_code ec) {
    if (ec || token.expired())
      return;
    resume_if_room(*chp);
  });
}

void FlowController::resume_if_room(ChannelAdapter &ch) {
  if (!pending_)
    return;
  if (!ch.is_open() || !over_high_water(ch)) {
    auto f = std::move(pending_);
    pending_ = nullptr;
    f();
    return;
  }
  arm(ch);
}

FlowController::Clock::duration
FlowController::pacing_delay(uint64_t bytes_sent, Clock::time_point now) const {
  if (opts_.rate_limit == 0)
    return Clock::duration::zero();
  std::chrono::duration<double> expected((double)bytes_sent /
                                         (double)opts_.rate_limit);
  auto actual = now - start_;
  auto owed = std::chrono::duration_cast<Clock::duration>(expected) - actual;
  if (owed <= Clock::duration::zero())
    return Clock::duration::zero();
  return owed;
}

void FlowController::pace(uint64_t bytes_sent, std::function<void()> next) {
  auto delay = pacing_delay(bytes_sent);
  if (delay == Clock::duration::zero()) {
    asio::post(io_, std::move(next));
    return;
  }
  timer_.expires_after(delay);
  timer_.async_wait([next = std::move(next)](std::error_code ec) {
    if (ec)
      return;
    next();
  });
}

void FlowController::cancel() {
  pending_ = nullptr;
  timer_.cancel();
}

} // namespace ferry
