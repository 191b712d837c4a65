
#include "datagram_channel.hpp"
#include "errors.hpp"
#include "logging.hpp"

namespace ferry {

// Largest UDP payload over IPv4.
static constexpr size_t kMaxDatagram = 65507;

DatagramChannel::DatagramChannel(std::shared_ptr<udp::socket> sock,
                                 udp::endpoint remote, size_t high_water)
    : sock_(std::move(sock)), remote_(std::move(remote)),
      high_water_(high_water) {}

std::string DatagramChannel::describe() const {
  return "direct(" + remote_.address().to_string() + ":" +
         std::to_string(remote_.port()) + ")";
}

SendStatus DatagramChannel::send(std::vector<uint8_t> &&frame) {
  if (!open_)
    return SendStatus::Closed;
  if (frame.size() > kMaxDatagram) {
    Logger::instance().log(LogLevel::WARN, "%zu-byte frame too large for %s",
                           frame.size(), describe().c_str());
    return SendStatus::WouldBlock;
  }
  if (queued_bytes_ >= high_water_)
    return SendStatus::WouldBlock;
  queued_bytes_ += frame.size();
  write_q_.emplace_back(std::move(frame));
  if (!writing_)
    do_write();
  return SendStatus::Ok;
}

void DatagramChannel::do_write() {
  if (write_q_.empty() || !open_) {
    writing_ = false;
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  sock_->async_send_to(
      asio::buffer(write_q_.front()), remote_,
      [this, self](std::error_code ec, std::size_t) {
        if (!open_) {
          writing_ = false;
          write_q_.clear();
          return;
        }
        // A lost datagram is not a channel failure.
        if (ec)
          Logger::instance().log(LogLevel::DEBUG, "datagram to %s: %s",
                                 describe().c_str(), ec.message().c_str());
        queued_bytes_ -= write_q_.front().size();
        write_q_.pop_front();
        do_write();
      });
}

void DatagramChannel::deliver(const std::vector<uint8_t> &frame) {
  if (open_ && data_handler_) {
    auto h = data_handler_;
    h(frame);
  }
}

void DatagramChannel::close() {
  if (!open_)
    return;
  open_ = false;
  if (!writing_)
    write_q_.clear();
  queued_bytes_ = 0;
  data_handler_ = nullptr;
  if (closed_handler_) {
    auto h = std::move(closed_handler_);
    closed_handler_ = nullptr;
    h(errc::channel_closed);
  }
}

} // namespace ferry
