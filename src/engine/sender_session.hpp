
#pragma once
#include <asio.hpp>
#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <system_error>
#include <vector>
#include "channel.hpp"
#include "digest.hpp"
#include "flow.hpp"
#include "framer.hpp"
#include "payload_io.hpp"
#include "progress.hpp"

namespace ferry {

struct SenderOptions {
    uint32_t chunk_size{256 * 1024};
    FlowOptions flow;
    std::chrono::milliseconds progress_interval{200};
    std::chrono::milliseconds retry_delay{50};
    // Unordered channels only: how long to wait for DONE before END is sent
    // again, how many times, and how many RESEND rounds are served.
    std::chrono::milliseconds confirm_timeout{1000};
    uint32_t confirm_attempts{10};
    uint32_t max_repair_rounds{32};
};

// Drives one outbound transfer: START, data chunks, END. On an unordered
// channel the transfer only completes when the receiver answers DONE; chunks
// it reports missing are sent again first. The session never touches
// coordinator state; it reports through its Listener.
class SenderSession : public std::enable_shared_from_this<SenderSession> {
public:
    enum class State { Idle, Streaming, Repairing, Confirming, Completed, Aborted };

    class Listener {
    public:
        virtual ~Listener() = default;
        virtual void on_send_progress(SenderSession& s, const ProgressSample& p) = 0;
        virtual void on_send_complete(SenderSession& s) = 0;
        virtual void on_send_failed(SenderSession& s, std::error_code ec, const std::string& reason) = 0;
    };

    SenderSession(asio::io_context& io, PeerId target, uint32_t transfer_id,
                  std::shared_ptr<FileSource> source, std::shared_ptr<ChannelAdapter> channel,
                  const SenderOptions& opts, Listener* listener);

    void start();
    // RESEND and DONE from the receiver. Returns false when the frame does
    // not apply to the current state.
    bool on_receipt(const DecodedFrame& f);
    // Cooperative: the flag is acted on at the next loop iteration. With
    // notify_peer a CANCEL frame carrying `reason` is sent first.
    void cancel(std::error_code ec, const std::string& reason, bool notify_peer);
    // Drops the listener; no callbacks are made afterwards.
    void detach() { listener_ = nullptr; }

    State state() const { return state_; }
    bool cancelled() const { return cancelled_; }
    const PeerId& target() const { return target_; }
    uint32_t transfer_id() const { return framer_.transfer_id(); }
    uint64_t offset() const { return offset_; }
    uint64_t total() const { return total_; }
    uint32_t chunks_sent() const { return seq_; }
    uint32_t repair_rounds() const { return repair_rounds_; }
    const FileSource& source() const { return *source_; }
    ChannelAdapter& channel() { return *channel_; }
    const FlowController& flow() const { return flow_; }

private:
    bool active() const {
        return state_ == State::Streaming || state_ == State::Repairing || state_ == State::Confirming;
    }
    StartMeta start_meta() const;
    void step();
    void send_next_chunk();
    void send_end();
    void arm_confirm();
    void repair_step();
    void resend_next();
    void complete();
    void transmit(std::vector<uint8_t> frame, bool retried, std::function<void()> on_sent);
    void abort();
    void fail(std::error_code ec, const std::string& reason);

    asio::io_context& io_;
    PeerId target_;
    std::shared_ptr<FileSource> source_;
    std::shared_ptr<ChannelAdapter> channel_;
    SenderOptions opts_;
    Listener* listener_;

    ChunkFramer framer_;
    FlowController flow_;
    ProgressMeter progress_;
    PayloadDigest digest_;
    asio::steady_timer retry_timer_;
    asio::steady_timer confirm_timer_;
    std::vector<uint8_t> chunk_buf_;

    State state_{State::Idle};
    uint64_t offset_{0};
    uint64_t total_{0};
    uint32_t seq_{0};
    EndMeta end_meta_;
    bool end_built_{false};
    std::set<uint32_t> repair_;
    bool resend_start_{false};
    uint32_t confirm_tries_{0};
    uint32_t repair_rounds_{0};
    bool cancelled_{false};
    std::error_code cancel_ec_;
    std::string cancel_reason_;
};

const char* to_string(SenderSession::State s);

} // namespace ferry
