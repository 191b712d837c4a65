
#include "sender_session.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>

namespace ferry {

const char *to_string(SenderSession::State s) {
  switch (s) {
  case SenderSession::State::Idle:
    return "idle";
  case SenderSession::State::Streaming:
    return "streaming";
  case SenderSession::State::Repairing:
    return "repairing";
  case SenderSession::State::Confirming:
    return "confirming";
  case SenderSession::State::Completed:
    return "completed";
  default:
    return "aborted";
  }
}

SenderSession::SenderSession(asio::io_context &io, PeerId target,
                             uint32_t transfer_id,
                             std::shared_ptr<FileSource> source,
                             std::shared_ptr<ChannelAdapter> channel,
                             const SenderOptions &opts, Listener *listener)
    : io_(io), target_(std::move(target)), source_(std::move(source)),
      channel_(std::move(channel)), opts_(opts), listener_(listener),
      framer_(transfer_id, !channel_->ordered()), flow_(io, opts.flow),
      progress_(source_->size(), opts.progress_interval), retry_timer_(io),
      confirm_timer_(io), total_(source_->size()) {}

StartMeta SenderSession::start_meta() const {
  StartMeta m;
  m.total = total_;
  m.chunk_size = opts_.chunk_size;
  m.name = source_->name();
  m.mime = source_->mime_type();
  return m;
}

void SenderSession::start() {
  if (state_ != State::Idle)
    return;
  auto self = shared_from_this();
  if (cancelled_) {
    asio::post(io_, [self]() { self->abort(); });
    return;
  }
  state_ = State::Streaming;
  flow_.start();

  StartMeta m = start_meta();
  Logger::instance().log(
      LogLevel::INFO, "send %s (%llu bytes) to %s via %s, id=%08x chunk=%u",
      m.name.c_str(), (unsigned long long)total_, target_.c_str(),
      channel_->describe().c_str(), framer_.transfer_id(), opts_.chunk_size);
  transmit(framer_.encode_control(ControlType::START, encode_start(m)), false,
           [self]() { self->step(); });
}

void SenderSession::step() {
  if (state_ != State::Streaming)
    return;
  if (cancelled_) {
    abort();
    return;
  }
  if (offset_ >= total_) {
    send_end();
    return;
  }
  auto self = shared_from_this();
  flow_.wait_for_room(*channel_, [self]() { self->send_next_chunk(); });
}

void SenderSession::send_next_chunk() {
  if (state_ != State::Streaming)
    return;
  if (cancelled_) {
    abort();
    return;
  }
  size_t n = (size_t)std::min<uint64_t>(opts_.chunk_size, total_ - offset_);
  chunk_buf_.resize(n);
  size_t got = source_->read(offset_, chunk_buf_.data(), n);
  if (got != n) {
    fail(errc::io_error, "cannot read " + source_->name());
    return;
  }
  digest_.update(chunk_buf_.data(), got);
  auto self = shared_from_this();
  transmit(framer_.encode_data(chunk_buf_.data(), got, seq_), false,
           [self, got]() {
             self->offset_ += got;
             self->seq_++;
             if (auto p = self->progress_.update(self->offset_)) {
               if (self->listener_)
                 self->listener_->on_send_progress(*self, *p);
             }
             self->flow_.pace(self->offset_, [self]() { self->step(); });
           });
}

void SenderSession::send_end() {
  if (!end_built_) {
    end_meta_.chunk_count = seq_;
    end_meta_.digest = digest_.finish();
    end_built_ = true;
  }
  auto self = shared_from_this();
  transmit(framer_.encode_control(ControlType::END, encode_end(end_meta_)), false,
           [self]() {
             if (self->channel_->ordered()) {
               self->complete();
               return;
             }
             self->state_ = State::Confirming;
             self->arm_confirm();
           });
}

void SenderSession::complete() {
  state_ = State::Completed;
  flow_.cancel();
  confirm_timer_.cancel();
  Logger::instance().log(LogLevel::INFO, "send %s to %s complete: %u chunks",
                         source_->name().c_str(), target_.c_str(), seq_);
  if (!listener_)
    return;
  listener_->on_send_progress(*this, progress_.finish());
  if (listener_)
    listener_->on_send_complete(*this);
}

void SenderSession::arm_confirm() {
  auto self = shared_from_this();
  confirm_timer_.expires_after(opts_.confirm_timeout);
  confirm_timer_.async_wait([self](std::error_code ec) {
    if (ec || self->state_ != State::Confirming)
      return;
    if (self->cancelled_) {
      self->abort();
      return;
    }
    if (++self->confirm_tries_ > self->opts_.confirm_attempts) {
      self->fail(errc::send_failed, "no confirmation from " + self->target_);
      return;
    }
    Logger::instance().log(LogLevel::DEBUG, "END to %s unconfirmed, sending again (%u)",
                           self->target_.c_str(), self->confirm_tries_);
    self->send_end();
  });
}

bool SenderSession::on_receipt(const DecodedFrame &f) {
  if (f.kind != FrameKind::Control || f.transfer_id != framer_.transfer_id())
    return false;
  if (!active() || channel_->ordered())
    return false;
  // The receiver may hold every chunk before END has gone out.
  if (f.control == ControlType::DONE) {
    complete();
    return true;
  }
  if (f.control != ControlType::RESEND || state_ == State::Streaming)
    return false;
  auto m = decode_resend(f.payload);
  if (!m) {
    Logger::instance().log(LogLevel::WARN, "malformed RESEND from %s",
                           target_.c_str());
    return false;
  }
  for (uint32_t seq : m->seqs) {
    if (seq < seq_)
      repair_.insert(seq);
  }
  resend_start_ = resend_start_ || m->need_start;
  confirm_tries_ = 0;
  if (state_ == State::Repairing)
    return true;
  if (++repair_rounds_ > opts_.max_repair_rounds) {
    fail(errc::send_failed, "chunks still missing after " +
                                std::to_string(opts_.max_repair_rounds) +
                                " repair rounds");
    return true;
  }
  Logger::instance().log(LogLevel::DEBUG, "%s is missing %zu chunks%s, round %u",
                         target_.c_str(), repair_.size(),
                         resend_start_ ? " and START" : "", repair_rounds_);
  state_ = State::Repairing;
  confirm_timer_.cancel();
  auto self = shared_from_this();
  asio::post(io_, [self]() { self->repair_step(); });
  return true;
}

void SenderSession::repair_step() {
  if (state_ != State::Repairing)
    return;
  if (cancelled_) {
    abort();
    return;
  }
  auto self = shared_from_this();
  if (resend_start_) {
    resend_start_ = false;
    transmit(framer_.encode_control(ControlType::START, encode_start(start_meta())),
             false, [self]() { self->repair_step(); });
    return;
  }
  if (repair_.empty()) {
    send_end();
    return;
  }
  flow_.wait_for_room(*channel_, [self]() { self->resend_next(); });
}

void SenderSession::resend_next() {
  if (state_ != State::Repairing)
    return;
  if (cancelled_) {
    abort();
    return;
  }
  if (repair_.empty()) {
    send_end();
    return;
  }
  uint32_t seq = *repair_.begin();
  repair_.erase(repair_.begin());
  uint64_t off = (uint64_t)seq * opts_.chunk_size;
  size_t n = (size_t)std::min<uint64_t>(opts_.chunk_size, total_ - off);
  chunk_buf_.resize(n);
  if (source_->read(off, chunk_buf_.data(), n) != n) {
    fail(errc::io_error, "cannot read " + source_->name());
    return;
  }
  auto self = shared_from_this();
  transmit(framer_.encode_data(chunk_buf_.data(), n, seq), false, [self]() {
    asio::post(self->io_, [self]() { self->repair_step(); });
  });
}

void SenderSession::transmit(std::vector<uint8_t> frame, bool retried,
                             std::function<void()> on_sent) {
  if (!active())
    return;
  if (cancelled_) {
    abort();
    return;
  }
  switch (channel_->send(std::move(frame))) {
  case SendStatus::Ok:
    on_sent();
    return;
  case SendStatus::Closed:
    fail(errc::channel_closed, "channel closed during transfer");
    return;
  case SendStatus::WouldBlock:
    break;
  }
  if (retried) {
    fail(errc::send_failed, "channel refused a chunk twice");
    return;
  }
  Logger::instance().log(LogLevel::WARN,
                         "send to %s would block at offset %llu, retrying",
                         target_.c_str(), (unsigned long long)offset_);
  auto self = shared_from_this();
  retry_timer_.expires_after(opts_.retry_delay);
  retry_timer_.async_wait(
      [self, frame = std::move(frame),
       on_sent = std::move(on_sent)](std::error_code ec) mutable {
        if (ec)
          return;
        self->transmit(std::move(frame), true, std::move(on_sent));
      });
}

void SenderSession::cancel(std::error_code ec, const std::string &reason,
                           bool notify_peer) {
  if (state_ == State::Completed || state_ == State::Aborted || cancelled_)
    return;
  cancelled_ = true;
  cancel_ec_ = ec;
  cancel_reason_ = reason;
  if (notify_peer && channel_->is_open()) {
    auto f = framer_.encode_control(ControlType::CANCEL, encode_reason(reason));
    if (channel_->send(std::move(f)) != SendStatus::Ok)
      Logger::instance().log(LogLevel::WARN, "could not notify %s of cancel",
                             target_.c_str());
  }
  flow_.cancel();
  retry_timer_.cancel();
  confirm_timer_.cancel();
  auto self = shared_from_this();
  asio::post(io_, [self]() {
    if (self->state_ == State::Streaming)
      self->step();
    else
      self->abort();
  });
}

void SenderSession::abort() {
  if (state_ == State::Completed || state_ == State::Aborted)
    return;
  state_ = State::Aborted;
  flow_.cancel();
  retry_timer_.cancel();
  confirm_timer_.cancel();
  Logger::instance().log(LogLevel::INFO, "send to %s aborted at %llu/%llu: %s",
                         target_.c_str(), (unsigned long long)offset_,
                         (unsigned long long)total_, cancel_reason_.c_str());
  if (listener_)
    listener_->on_send_failed(*this, cancel_ec_, cancel_reason_);
}

// Channel errors are left to the owner, which may retry elsewhere.
void SenderSession::fail(std::error_code ec, const std::string &reason) {
  if (!is_channel_error(ec) && channel_->is_open()) {
    auto f = framer_.encode_control(ControlType::CANCEL, encode_reason(reason));
    if (channel_->send(std::move(f)) != SendStatus::Ok)
      Logger::instance().log(LogLevel::DEBUG, "cancel to %s not delivered",
                             target_.c_str());
  }
  cancelled_ = true;
  cancel_ec_ = ec;
  cancel_reason_ = reason;
  abort();
}

} // namespace ferry
