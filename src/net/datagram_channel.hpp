
#pragma once
#include <asio.hpp>
#include <deque>
#include <memory>
#include <vector>
#include "channel.hpp"

namespace ferry {

// Best-effort unordered channel: one frame per datagram to a single remote
// endpoint. The socket is shared; its owner reads it and hands datagrams
// from `remote()` to deliver().
class DatagramChannel : public ChannelAdapter, public std::enable_shared_from_this<DatagramChannel> {
public:
    using udp = asio::ip::udp;

    DatagramChannel(std::shared_ptr<udp::socket> sock, udp::endpoint remote, size_t high_water);

    ChannelKind kind() const override { return ChannelKind::Direct; }
    bool ordered() const override { return false; }
    SendStatus send(std::vector<uint8_t>&& frame) override;
    size_t buffered_bytes() const override { return queued_bytes_; }
    void on_data(DataHandler h) override { data_handler_ = std::move(h); }
    void on_closed(ClosedHandler h) override { closed_handler_ = std::move(h); }
    void close() override;
    bool is_open() const override { return open_; }
    std::string describe() const override;

    void deliver(const std::vector<uint8_t>& frame);
    const udp::endpoint& remote() const { return remote_; }

private:
    void do_write();

    std::shared_ptr<udp::socket> sock_;
    udp::endpoint remote_;
    size_t high_water_;
    std::deque<std::vector<uint8_t>> write_q_;
    size_t queued_bytes_{0};
    bool writing_{false};
    bool open_{true};
    DataHandler data_handler_;
    ClosedHandler closed_handler_;
};

} // namespace ferry
