
#pragma once
#include <asio.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>
#include "channel.hpp"
#include "config.hpp"
#include "events.hpp"
#include "framer.hpp"
#include "payload_io.hpp"
#include "receiver_session.hpp"
#include "sender_session.hpp"

namespace ferry {

// Offer/accept/reject transport, owned by the membership collaborator.
class SignalingLink {
public:
    virtual ~SignalingLink() = default;
    virtual void send_offer(const PeerId& target, uint32_t transfer_id, const OfferMeta& offer) = 0;
    virtual void send_accept(const PeerId& sender, uint32_t transfer_id) = 0;
    virtual void send_reject(const PeerId& sender, uint32_t transfer_id, const std::string& reason) = 0;
};

// Opens data channels towards a peer. Handlers run on the io_context thread;
// a handler may be invoked after the coordinator gave up on the attempt.
class ChannelFactory {
public:
    using OpenHandler = std::function<void(std::error_code, std::shared_ptr<ChannelAdapter>)>;
    virtual ~ChannelFactory() = default;
    virtual bool direct_possible(const PeerId& peer) const = 0;
    virtual void open_direct(const PeerId& peer, uint32_t transfer_id, OpenHandler h) = 0;
    virtual void open_relay(const PeerId& peer, uint32_t transfer_id, OpenHandler h) = 0;
    virtual void abandon_direct(const PeerId& peer) { (void)peer; }
};

enum class PairState { Idle, OfferPendingOut, OfferPendingIn, Active };

const char* to_string(PairState s);

// Owns every per-peer table: busy state, sessions, attached channels. It is
// the only writer of those tables; sessions report back through listener
// callbacks. Not thread-safe: call it from the io_context thread.
class TransferCoordinator : private SenderSession::Listener, private ReceiverSession::Listener {
public:
    using SinkFactory = std::function<std::unique_ptr<PayloadSink>(const PeerId&, const OfferMeta&)>;

    TransferCoordinator(asio::io_context& io, const TransferConfig& cfg, SignalingLink& signaling,
                        ChannelFactory& channels, std::string local_name = "ferry");
    ~TransferCoordinator() override;
    TransferCoordinator(const TransferCoordinator&) = delete;
    TransferCoordinator& operator=(const TransferCoordinator&) = delete;

    EventBus& events() { return events_; }
    void set_sink_factory(SinkFactory f) { sink_factory_ = std::move(f); }

    // Product-layer operations. Errors returned here never reach the network.
    std::error_code offer(const PeerId& target, std::shared_ptr<FileSource> source);
    std::error_code accept(const PeerId& sender);
    std::error_code reject(const PeerId& sender, const std::string& reason = "declined");
    std::error_code cancel(const PeerId& peer);

    // Membership/signaling collaborator inputs.
    void on_peer_list_changed(const std::vector<PeerId>& peers);
    void on_offer_received(const PeerId& sender, uint32_t transfer_id, const OfferMeta& offer);
    void on_offer_accepted(const PeerId& target, uint32_t transfer_id);
    void on_offer_rejected(const PeerId& target, uint32_t transfer_id, const std::string& reason);

    // Binds a channel the remote side opened (or any channel carrying frames
    // from `peer`) so its frames are routed to that peer's session.
    void attach_channel(const PeerId& peer, std::shared_ptr<ChannelAdapter> ch);
    // Entry point for frames whose adapter is owned elsewhere.
    void deliver(const PeerId& from, const std::vector<uint8_t>& frame);

    PairState state(const PeerId& peer) const;
    bool present(const PeerId& peer) const { return present_.count(peer) != 0; }
    std::shared_ptr<SenderSession> sender_session(const PeerId& peer) const;
    std::shared_ptr<ReceiverSession> receiver_session(const PeerId& peer) const;
    size_t busy_pairs() const { return pairs_.size(); }

private:
    struct Pair {
        PairState state{PairState::Idle};
        uint32_t transfer_id{0};
        OfferMeta offer;
        std::shared_ptr<FileSource> source;
        std::shared_ptr<SenderSession> sender;
        std::shared_ptr<ReceiverSession> receiver;
        std::shared_ptr<ChannelAdapter> send_channel;
        std::shared_ptr<asio::steady_timer> timer;
        std::chrono::steady_clock::time_point last_activity;
        bool peer_notified{false};
        bool relay_tried{false};
    };

    Pair* find(const PeerId& peer, uint32_t transfer_id = 0);
    void arm_offer_timer(const PeerId& peer, Pair& p);
    void arm_idle_timer(const PeerId& peer, uint32_t transfer_id, std::chrono::steady_clock::duration after);
    void select_channel(const PeerId& peer, uint32_t transfer_id);
    void open_relay(const PeerId& peer, uint32_t transfer_id);
    // Starts the transfer over from offset 0 on the relay when a direct
    // attempt hit a channel error. Returns false when no fallback remains.
    bool restart_over_relay(const PeerId& peer, Pair& p, std::error_code ec, const std::string& reason);
    void on_channel_ready(const PeerId& peer, uint32_t transfer_id, std::error_code ec,
                          std::shared_ptr<ChannelAdapter> ch);
    void on_channel_closed(const PeerId& peer, ChannelAdapter* ch, std::error_code ec);
    void notify_peer_cancel(const PeerId& peer, uint32_t transfer_id, const std::string& reason);
    // Sends a receiver-to-sender control frame, preferring an ordered channel.
    bool send_to_peer(const PeerId& peer, std::vector<uint8_t> frame);
    // Immediate transition to Idle with exactly one error event.
    void terminate(const PeerId& peer, std::error_code ec, const std::string& reason, bool notify_peer);
    void release(const PeerId& peer);

    void on_send_progress(SenderSession& s, const ProgressSample& p) override;
    void on_send_complete(SenderSession& s) override;
    void on_send_failed(SenderSession& s, std::error_code ec, const std::string& reason) override;
    void on_receive_progress(ReceiverSession& s, const ProgressSample& p) override;
    void on_receive_complete(ReceiverSession& s) override;
    void on_receive_failed(ReceiverSession& s, std::error_code ec, const std::string& reason) override;
    void on_receive_missing(ReceiverSession& s, const ResendMeta& missing) override;

    asio::io_context& io_;
    TransferConfig cfg_;
    SignalingLink& signaling_;
    ChannelFactory& factory_;
    std::string local_name_;
    EventBus events_;
    SinkFactory sink_factory_;

    std::unordered_map<PeerId, Pair> pairs_;
    std::unordered_map<PeerId, std::vector<std::shared_ptr<ChannelAdapter>>> channels_;
    std::set<PeerId> present_;
    std::shared_ptr<bool> alive_;
};

} // namespace ferry
