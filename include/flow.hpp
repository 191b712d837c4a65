
#pragma once
#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include "channel.hpp"

namespace ferry {

struct FlowOptions {
    size_t high_water{16 * 1024 * 1024};
    uint64_t rate_limit{0}; // bytes/s, 0 = unlimited
    std::chrono::milliseconds drain_poll{10};
};

// Decides when the next chunk may be produced. Suspension is asynchronous:
// the caller hands over a continuation and returns to the event loop.
class FlowController {
public:
    using Clock = std::chrono::steady_clock;

    FlowController(asio::io_context& io, const FlowOptions& opts);
    ~FlowController();
    FlowController(const FlowController&) = delete;
    FlowController& operator=(const FlowController&) = delete;

    void start(Clock::time_point now = Clock::now());
    bool over_high_water(const ChannelAdapter& ch) const;

    // Runs `ready` once the channel is back under the high-water mark, using
    // the adapter's drain notification when it has one and polling otherwise.
    void wait_for_room(ChannelAdapter& ch, std::function<void()> ready);

    // Delay owed to the rate cap after `bytes_sent` bytes in total.
    Clock::duration pacing_delay(uint64_t bytes_sent, Clock::time_point now = Clock::now()) const;
    // Runs `next` after the pacing delay; posts it when no delay is owed, so
    // every chunk boundary is a yield point.
    void pace(uint64_t bytes_sent, std::function<void()> next);

    void cancel();
    uint64_t suspensions() const { return suspensions_; }
    const FlowOptions& options() const { return opts_; }

private:
    void arm(ChannelAdapter& ch);
    void poll_room(ChannelAdapter& ch);
    void resume_if_room(ChannelAdapter& ch);

    asio::io_context& io_;
    FlowOptions opts_;
    asio::steady_timer timer_;
    Clock::time_point start_{};
    std::shared_ptr<bool> alive_;
    std::function<void()> pending_;
    uint64_t suspensions_{0};
};

} // namespace ferry
