
#pragma once
#include <asio.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "coordinator.hpp"
#include "datagram_channel.hpp"
#include "stream_channel.hpp"

namespace ferry {

struct NodeOptions {
    std::string name{"ferry"};
    size_t high_water{16 * 1024 * 1024};
    bool direct{true};
    std::chrono::milliseconds probe_interval{250};
};

// One process's view of the network: TCP links to peers (signaling and the
// relay path) plus a UDP socket for direct channels. Presence follows the
// links: a peer is present from its HELLO until its link goes down.
class PeerNode : public SignalingLink, public ChannelFactory {
public:
    using tcp = asio::ip::tcp;
    using udp = asio::ip::udp;
    using PeerHandler = std::function<void(const PeerId& peer, const std::string& name)>;

    PeerNode(asio::io_context& io, const NodeOptions& opts);
    ~PeerNode() override;
    PeerNode(const PeerNode&) = delete;
    PeerNode& operator=(const PeerNode&) = delete;

    void attach(TransferCoordinator* coordinator) { coord_ = coordinator; }

    // Throws asio::system_error when the endpoint cannot be bound.
    void listen(const std::string& host, uint16_t port);
    void connect(const std::string& host, uint16_t port, std::function<void(std::error_code)> done);

    void on_peer_up(PeerHandler h) { up_handler_ = std::move(h); }
    void on_peer_down(PeerHandler h) { down_handler_ = std::move(h); }

    // Waits until every queued byte has been handed to the kernel, then closes.
    void close_when_drained(std::function<void()> done);
    void close();

    const PeerId& id() const { return id_; }
    std::vector<PeerId> peers() const;
    uint16_t udp_port() const;
    tcp::endpoint local_endpoint() const;

    void send_offer(const PeerId& target, uint32_t transfer_id, const OfferMeta& offer) override;
    void send_accept(const PeerId& sender, uint32_t transfer_id) override;
    void send_reject(const PeerId& sender, uint32_t transfer_id, const std::string& reason) override;

    bool direct_possible(const PeerId& peer) const override;
    void open_direct(const PeerId& peer, uint32_t transfer_id, OpenHandler h) override;
    void open_relay(const PeerId& peer, uint32_t transfer_id, OpenHandler h) override;
    void abandon_direct(const PeerId& peer) override;

private:
    struct Link {
        PeerId id;
        std::string name;
        std::shared_ptr<StreamChannel> ch;
        uint16_t udp_port{0};
        bool ready{false};
    };
    struct Probe {
        uint32_t transfer_id{0};
        udp::endpoint remote;
        OpenHandler handler;
        std::shared_ptr<asio::steady_timer> timer;
    };

    void do_accept();
    void add_link(tcp::socket sock);
    void on_link_control(const std::shared_ptr<Link>& link, const DecodedFrame& f);
    void on_link_down(const std::shared_ptr<Link>& link, std::error_code ec);
    void publish_peers();
    bool send_signal(const PeerId& peer, ControlType t, uint32_t transfer_id,
                     const std::vector<uint8_t>& meta);
    PeerMeta self_meta() const;

    void start_udp(const udp::endpoint& bind_ep);
    void do_udp_read();
    void on_datagram(size_t n);
    void send_probe(const PeerId& peer);
    void send_datagram(const udp::endpoint& to, std::vector<uint8_t> frame);
    std::shared_ptr<DatagramChannel> direct_channel(const PeerId& peer, const udp::endpoint& ep);

    std::shared_ptr<Link> link_for(const PeerId& peer) const;

    asio::io_context& io_;
    NodeOptions opts_;
    PeerId id_;
    TransferCoordinator* coord_{nullptr};
    tcp::acceptor acceptor_;
    std::shared_ptr<udp::socket> udp_;
    udp::endpoint udp_from_;
    std::vector<uint8_t> udp_buf_;
    std::vector<std::shared_ptr<Link>> links_;
    std::unordered_map<PeerId, Probe> probes_;
    std::map<udp::endpoint, std::pair<PeerId, std::shared_ptr<DatagramChannel>>> direct_;
    std::shared_ptr<asio::steady_timer> drain_timer_;
    PeerHandler up_handler_;
    PeerHandler down_handler_;
    bool closed_{false};
};

} // namespace ferry
