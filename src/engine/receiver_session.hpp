
#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <system_error>
#include <vector>
#include "channel.hpp"
#include "digest.hpp"
#include "framer.hpp"
#include "payload_io.hpp"
#include "progress.hpp"

namespace ferry {

struct ReceiverOptions {
    size_t consolidate_threshold{50 * 1024 * 1024};
    std::chrono::milliseconds progress_interval{200};
};

// Reassembles one inbound transfer. Ordered channels append fragments as
// they come; sequenced frames are kept in a sparse map keyed by index and
// counted once. Whenever the unflushed total crosses the consolidation
// threshold every held fragment is written to the sink at its payload
// offset. A sequenced transfer whose END finds chunks missing asks the
// sender for them through the listener.
class ReceiverSession {
public:
    enum class State { Waiting, Receiving, Completed, Aborted };

    class Listener {
    public:
        virtual ~Listener() = default;
        virtual void on_receive_progress(ReceiverSession& s, const ProgressSample& p) = 0;
        virtual void on_receive_complete(ReceiverSession& s) = 0;
        virtual void on_receive_failed(ReceiverSession& s, std::error_code ec, const std::string& reason) = 0;
        virtual void on_receive_missing(ReceiverSession& s, const ResendMeta& missing) = 0;
    };

    ReceiverSession(PeerId sender, uint32_t transfer_id, OfferMeta offer,
                    std::unique_ptr<PayloadSink> sink, const ReceiverOptions& opts,
                    Listener* listener);
    ~ReceiverSession();

    // Returns false when the frame was ignored (wrong sender, stale transfer,
    // duplicate, or arriving after the session finished).
    bool on_frame(const PeerId& from, const DecodedFrame& f);
    // Local abort; reports through the listener unless already finished.
    void abort(std::error_code ec, const std::string& reason);
    void detach() { listener_ = nullptr; }

    State state() const { return state_; }
    bool finished() const { return state_ == State::Completed || state_ == State::Aborted; }
    const PeerId& sender() const { return sender_; }
    uint32_t transfer_id() const { return transfer_id_; }
    const OfferMeta& offer() const { return offer_; }
    uint64_t expected_total() const { return offer_.total; }
    bool sequenced() const { return sequenced_; }
    // True once an ordered START replaced an earlier sequenced attempt.
    bool restarted() const { return restarted_; }
    uint64_t bytes_received() const { return bytes_received_; }
    // Bytes already coalesced into the sink.
    uint64_t consolidated_bytes() const { return flushed_; }
    size_t fragment_count() const { return ordered_.size() + sparse_.size(); }
    uint64_t held_bytes() const;
    uint32_t consolidations() const { return consolidations_; }
    PayloadSink& sink() { return *sink_; }

private:
    bool on_data(const DecodedFrame& f);
    void on_start(const DecodedFrame& f);
    void on_end(const DecodedFrame& f);
    void evaluate_end();
    void request_missing();
    void restart();
    bool has_chunk(uint32_t seq) const { return seq < have_.size() && have_[seq]; }
    bool flush_to_sink(uint64_t offset, const uint8_t* data, size_t len);
    bool consolidate();
    bool digest_remainder();
    void finalize();
    void fail(std::error_code ec, const std::string& reason);

    PeerId sender_;
    uint32_t transfer_id_;
    OfferMeta offer_;
    std::unique_ptr<PayloadSink> sink_;
    ReceiverOptions opts_;
    Listener* listener_;
    ProgressMeter progress_;
    PayloadDigest digest_;

    State state_{State::Waiting};
    // Fixed by START, or by the first frame when START is late.
    bool mode_known_{false};
    bool sequenced_{false};
    bool start_seen_{false};
    bool restarted_{false};
    uint32_t chunk_size_{0};
    uint64_t bytes_received_{0};
    uint64_t flushed_{0};
    uint64_t unflushed_{0};
    // Bytes fed to digest_; always a prefix of the payload.
    uint64_t digested_{0};
    uint32_t consolidations_{0};

    std::vector<std::vector<uint8_t>> ordered_;
    std::map<uint32_t, std::vector<uint8_t>> sparse_;
    std::vector<bool> have_;

    bool end_seen_{false};
    EndMeta end_;
};

const char* to_string(ReceiverSession::State s);

} // namespace ferry
