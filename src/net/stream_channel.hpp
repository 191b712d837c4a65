
#pragma once
#include <asio.hpp>
#include <deque>
#include <functional>
#include <memory>
#include <vector>
#include "channel.hpp"
#include "framer.hpp"

namespace ferry {

// Reliable ordered channel over one TCP connection. Data-plane frames go to
// the on_data handler; signaling frames go to the control handler.
class StreamChannel : public ChannelAdapter, public std::enable_shared_from_this<StreamChannel> {
public:
    using tcp = asio::ip::tcp;
    using ControlHandler = std::function<void(const DecodedFrame&)>;
    using DownHandler = std::function<void(std::error_code)>;

    StreamChannel(tcp::socket sock, size_t high_water);

    void start();

    ChannelKind kind() const override { return ChannelKind::Relay; }
    bool ordered() const override { return true; }
    SendStatus send(std::vector<uint8_t>&& frame) override;
    size_t buffered_bytes() const override { return queued_bytes_; }
    void on_data(DataHandler h) override { data_handler_ = std::move(h); }
    void on_closed(ClosedHandler h) override { closed_handler_ = std::move(h); }
    bool notify_when_drained(DrainHandler h) override;
    void close() override;
    bool is_open() const override { return open_; }
    std::string describe() const override;

    void on_control(ControlHandler h) { control_handler_ = std::move(h); }
    // Runs before the closed handler; the owner of the link uses it.
    void on_down(DownHandler h) { down_handler_ = std::move(h); }
    tcp::endpoint remote_endpoint() const { return remote_; }

private:
    void do_read();
    void do_write();
    void parse_and_handle(const uint8_t* data, size_t n);
    void shutdown(std::error_code ec);

    tcp::socket sock_;
    tcp::endpoint remote_;
    size_t high_water_;
    std::vector<uint8_t> read_buf_;
    std::vector<uint8_t> inbuf_;
    std::deque<std::vector<uint8_t>> write_q_;
    size_t queued_bytes_{0};
    bool writing_{false};
    bool open_{true};

    DataHandler data_handler_;
    ClosedHandler closed_handler_;
    DrainHandler drain_handler_;
    ControlHandler control_handler_;
    DownHandler down_handler_;
};

} // namespace ferry
