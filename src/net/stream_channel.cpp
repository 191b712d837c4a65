
#include "stream_channel.hpp"
#include "errors.hpp"
#include "logging.hpp"

namespace ferry {

StreamChannel::StreamChannel(tcp::socket sock, size_t high_water)
    : sock_(std::move(sock)), high_water_(high_water), read_buf_(64 * 1024) {
  std::error_code ec;
  remote_ = sock_.remote_endpoint(ec);
  sock_.set_option(tcp::no_delay(true), ec);
}

void StreamChannel::start() { do_read(); }

std::string StreamChannel::describe() const {
  return "relay(" + remote_.address().to_string() + ":" +
         std::to_string(remote_.port()) + ")";
}

void StreamChannel::do_read() {
  auto self = shared_from_this();
  sock_.async_read_some(asio::buffer(read_buf_),
                        [this, self](std::error_code ec, std::size_t n) {
                          if (ec) {
                            if (ec != asio::error::operation_aborted)
                              Logger::instance().log(
                                  LogLevel::INFO, "link %s read: %s",
                                  describe().c_str(), ec.message().c_str());
                            shutdown(ec);
                            return;
                          }
                          parse_and_handle(read_buf_.data(), n);
                          if (open_)
                            do_read();
                        });
}

void StreamChannel::parse_and_handle(const uint8_t *data, size_t n) {
  inbuf_.insert(inbuf_.end(), data, data + n);
  size_t off = 0;
  while (open_) {
    size_t start = off;
    size_t need = ChunkFramer::next_in_stream(inbuf_, off);
    if (off != start)
      Logger::instance().log(LogLevel::DEBUG, "skipped %zu garbage bytes on %s",
                             off - start, describe().c_str());
    if (need == 0)
      break;
    auto f = ChunkFramer::decode(inbuf_.data() + off, need);
    off += need;
    if (!f)
      continue;
    if (f->kind == FrameKind::Data || is_data_plane(f->control)) {
      if (data_handler_) {
        std::vector<uint8_t> frame(inbuf_.begin() + (off - need),
                                   inbuf_.begin() + off);
        auto h = data_handler_;
        h(frame);
      }
    } else if (control_handler_) {
      auto h = control_handler_;
      h(*f);
    }
  }
  if (off > 0)
    inbuf_.erase(inbuf_.begin(), inbuf_.begin() + off);
}

SendStatus StreamChannel::send(std::vector<uint8_t> &&frame) {
  if (!open_)
    return SendStatus::Closed;
  queued_bytes_ += frame.size();
  write_q_.emplace_back(std::move(frame));
  if (!writing_)
    do_write();
  return SendStatus::Ok;
}

void StreamChannel::do_write() {
  if (write_q_.empty() || !open_) {
    writing_ = false;
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  auto &front = write_q_.front();
  asio::async_write(sock_, asio::buffer(front),
                    [this, self](std::error_code ec, std::size_t) {
                      if (ec || !open_) {
                        writing_ = false;
                        write_q_.clear();
                        if (ec && ec != asio::error::operation_aborted)
                          Logger::instance().log(
                              LogLevel::WARN, "link %s write: %s",
                              describe().c_str(), ec.message().c_str());
                        shutdown(ec);
                        return;
                      }
                      queued_bytes_ -= write_q_.front().size();
                      write_q_.pop_front();
                      if (drain_handler_ && queued_bytes_ <= high_water_ / 2) {
                        auto h = std::move(drain_handler_);
                        drain_handler_ = nullptr;
                        h();
                      }
                      do_write();
                    });
}

bool StreamChannel::notify_when_drained(DrainHandler h) {
  if (!open_ || queued_bytes_ <= high_water_ / 2) {
    asio::post(sock_.get_executor(), std::move(h));
    return true;
  }
  drain_handler_ = std::move(h);
  return true;
}

void StreamChannel::close() {
  if (!open_)
    return;
  std::error_code ec;
  sock_.shutdown(tcp::socket::shutdown_both, ec);
  shutdown(errc::channel_closed);
}

void StreamChannel::shutdown(std::error_code ec) {
  if (!open_)
    return;
  open_ = false;
  std::error_code ignored;
  sock_.close(ignored);
  if (!writing_)
    write_q_.clear();
  queued_bytes_ = 0;
  auto self = shared_from_this();
  if (down_handler_) {
    auto h = std::move(down_handler_);
    down_handler_ = nullptr;
    h(ec);
  }
  if (drain_handler_) {
    auto h = std::move(drain_handler_);
    drain_handler_ = nullptr;
    h();
  }
  if (closed_handler_) {
    auto h = std::move(closed_handler_);
    closed_handler_ = nullptr;
    h(ec);
  }
  data_handler_ = nullptr;
  control_handler_ = nullptr;
}

} // namespace ferry
