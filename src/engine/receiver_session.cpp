
#include "receiver_session.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>

namespace ferry {

const char *to_string(ReceiverSession::State s) {
  switch (s) {
  case ReceiverSession::State::Waiting:
    return "waiting";
  case ReceiverSession::State::Receiving:
    return "receiving";
  case ReceiverSession::State::Completed:
    return "completed";
  default:
    return "aborted";
  }
}

ReceiverSession::ReceiverSession(PeerId sender, uint32_t transfer_id,
                                 OfferMeta offer,
                                 std::unique_ptr<PayloadSink> sink,
                                 const ReceiverOptions &opts,
                                 Listener *listener)
    : sender_(std::move(sender)), transfer_id_(transfer_id),
      offer_(std::move(offer)), sink_(std::move(sink)), opts_(opts),
      listener_(listener), progress_(offer_.total, opts.progress_interval) {}

ReceiverSession::~ReceiverSession() {
  if (!finished() && sink_)
    sink_->abort();
}

uint64_t ReceiverSession::held_bytes() const {
  uint64_t n = 0;
  for (auto &f : ordered_)
    n += f.size();
  for (auto &kv : sparse_)
    n += kv.second.size();
  return n;
}

bool ReceiverSession::on_frame(const PeerId &from, const DecodedFrame &f) {
  if (from != sender_) {
    Logger::instance().log(LogLevel::WARN,
                           "ignoring frame from %s, receiving from %s",
                           from.c_str(), sender_.c_str());
    return false;
  }
  if (f.transfer_id != transfer_id_) {
    Logger::instance().log(LogLevel::DEBUG,
                           "ignoring frame for stale transfer %08x",
                           f.transfer_id);
    return false;
  }
  if (finished())
    return false;

  if (f.kind == FrameKind::Data)
    return on_data(f);

  switch (f.control) {
  case ControlType::START:
    on_start(f);
    return true;
  case ControlType::END:
    on_end(f);
    return true;
  case ControlType::CANCEL: {
    std::string why = decode_reason(f.payload);
    fail(errc::cancelled, why.empty() ? "cancelled by sender" : why);
    return true;
  }
  default:
    return false;
  }
}

void ReceiverSession::on_start(const DecodedFrame &f) {
  auto m = decode_start(f.payload);
  if (!m || m->total != offer_.total || (f.sequenced && m->chunk_size == 0)) {
    Logger::instance().log(LogLevel::WARN,
                           "START from %s does not match the accepted offer",
                           sender_.c_str());
    return;
  }
  if (mode_known_ && f.sequenced != sequenced_) {
    if (f.sequenced || restarted_) {
      Logger::instance().log(LogLevel::DEBUG, "stale START %08x from %s",
                             f.transfer_id, sender_.c_str());
      return;
    }
    restart();
  } else if (start_seen_) {
    return;
  }
  start_seen_ = true;
  mode_known_ = true;
  sequenced_ = f.sequenced;
  chunk_size_ = m->chunk_size;
  if (state_ == State::Waiting) {
    state_ = State::Receiving;
    Logger::instance().log(LogLevel::INFO, "receiving %s (%llu bytes) from %s",
                           offer_.name.c_str(), (unsigned long long)offer_.total,
                           sender_.c_str());
  }
  if (sequenced_ && bytes_received_ == offer_.total &&
      (end_seen_ || offer_.total > 0))
    finalize();
}

// The sender gave up on an unordered channel and starts over on an ordered
// one; everything from the first attempt is dropped.
void ReceiverSession::restart() {
  Logger::instance().log(LogLevel::INFO,
                         "%s restarted %s on an ordered channel after %llu bytes",
                         sender_.c_str(), offer_.name.c_str(),
                         (unsigned long long)bytes_received_);
  ordered_.clear();
  sparse_.clear();
  have_.clear();
  bytes_received_ = 0;
  flushed_ = 0;
  unflushed_ = 0;
  digested_ = 0;
  digest_.reset();
  end_seen_ = false;
  end_ = EndMeta();
  start_seen_ = false;
  restarted_ = true;
  progress_ = ProgressMeter(offer_.total, opts_.progress_interval);
}

bool ReceiverSession::on_data(const DecodedFrame &f) {
  bool seq_frame = f.seq.has_value();
  if (mode_known_ && seq_frame != sequenced_) {
    Logger::instance().log(LogLevel::DEBUG, "dropping %s chunk from %s",
                           seq_frame ? "sequenced" : "unsequenced",
                           sender_.c_str());
    return false;
  }
  if (!mode_known_) {
    mode_known_ = true;
    sequenced_ = seq_frame;
  }
  if (state_ == State::Waiting)
    state_ = State::Receiving;
  size_t len = f.payload.size();
  if (seq_frame) {
    uint32_t seq = *f.seq;
    if (has_chunk(seq)) {
      Logger::instance().log(LogLevel::TRACE, "duplicate chunk %u", seq);
      return false;
    }
    if ((uint64_t)seq >= offer_.total ||
        (start_seen_ && (uint64_t)seq * chunk_size_ + len > offer_.total)) {
      Logger::instance().log(LogLevel::WARN, "chunk %u from %s out of range",
                             seq, sender_.c_str());
      return false;
    }
  }
  if (bytes_received_ + len > offer_.total) {
    Logger::instance().log(LogLevel::WARN,
                           "dropping %zu bytes past the expected %llu from %s",
                           len, (unsigned long long)offer_.total,
                           sender_.c_str());
    return false;
  }
  if (seq_frame) {
    if (have_.size() <= *f.seq)
      have_.resize((size_t)*f.seq + 1, false);
    have_[*f.seq] = true;
    sparse_.emplace(*f.seq, f.payload);
  } else {
    ordered_.push_back(f.payload);
  }
  bytes_received_ += len;
  unflushed_ += len;

  if (unflushed_ >= opts_.consolidate_threshold && !consolidate())
    return true;
  if (auto p = progress_.update(bytes_received_)) {
    if (listener_)
      listener_->on_receive_progress(*this, *p);
  }
  if (sequenced_ && start_seen_ && bytes_received_ == offer_.total)
    finalize();
  return true;
}

void ReceiverSession::on_end(const DecodedFrame &f) {
  auto m = decode_end(f.payload);
  if (!m) {
    Logger::instance().log(LogLevel::WARN, "malformed END from %s",
                           sender_.c_str());
    return;
  }
  if (mode_known_ && f.sequenced != sequenced_) {
    Logger::instance().log(LogLevel::DEBUG, "stale END %08x from %s",
                           f.transfer_id, sender_.c_str());
    return;
  }
  if (!mode_known_) {
    mode_known_ = true;
    sequenced_ = f.sequenced;
  }
  end_seen_ = true;
  end_ = *m;
  evaluate_end();
}

void ReceiverSession::evaluate_end() {
  if (!sequenced_) {
    if (!start_seen_ && state_ == State::Waiting) {
      Logger::instance().log(LogLevel::WARN, "END before START from %s",
                             sender_.c_str());
      return;
    }
    if (bytes_received_ == offer_.total) {
      finalize();
      return;
    }
    Logger::instance().log(LogLevel::WARN, "END from %s after %llu of %llu bytes",
                           sender_.c_str(), (unsigned long long)bytes_received_,
                           (unsigned long long)offer_.total);
    fail(errc::incomplete, "transfer incomplete");
    return;
  }
  if (start_seen_ && bytes_received_ == offer_.total) {
    finalize();
    return;
  }
  request_missing();
}

void ReceiverSession::request_missing() {
  ResendMeta r;
  r.need_start = !start_seen_;
  for (uint32_t seq = 0; seq < end_.chunk_count && r.seqs.size() < kMaxResendBatch;
       seq++) {
    if (!has_chunk(seq))
      r.seqs.push_back(seq);
  }
  if (r.seqs.empty() && !r.need_start) {
    Logger::instance().log(LogLevel::WARN,
                           "all %u chunks from %s present but %llu of %llu bytes",
                           end_.chunk_count, sender_.c_str(),
                           (unsigned long long)bytes_received_,
                           (unsigned long long)offer_.total);
    fail(errc::incomplete, "transfer incomplete");
    return;
  }
  Logger::instance().log(LogLevel::DEBUG,
                         "asking %s for %zu chunks%s (%llu/%llu bytes)",
                         sender_.c_str(), r.seqs.size(),
                         r.need_start ? " and START" : "",
                         (unsigned long long)bytes_received_,
                         (unsigned long long)offer_.total);
  if (listener_)
    listener_->on_receive_missing(*this, r);
}

bool ReceiverSession::flush_to_sink(uint64_t offset, const uint8_t *data,
                                    size_t len) {
  if (offset == digested_) {
    digest_.update(data, len);
    digested_ += len;
  }
  if (!sink_->write_at(offset, data, len)) {
    fail(errc::io_error, "cannot write " + offer_.name);
    return false;
  }
  flushed_ += len;
  unflushed_ -= len;
  return true;
}

bool ReceiverSession::consolidate() {
  if (sequenced_) {
    // Offsets are unknown until START says how large a chunk is.
    if (!start_seen_)
      return true;
    for (auto it = sparse_.begin(); it != sparse_.end();) {
      uint64_t off = (uint64_t)it->first * chunk_size_;
      if (!flush_to_sink(off, it->second.data(), it->second.size()))
        return false;
      it = sparse_.erase(it);
    }
  } else {
    for (auto &frag : ordered_) {
      if (!flush_to_sink(flushed_, frag.data(), frag.size()))
        return false;
    }
    ordered_.clear();
  }
  consolidations_++;
  Logger::instance().log(LogLevel::DEBUG,
                         "consolidated %llu bytes from %s, %zu fragments held",
                         (unsigned long long)flushed_, sender_.c_str(),
                         fragment_count());
  return true;
}

// Chunks flushed ahead of a gap were not hashed; read them back in order.
bool ReceiverSession::digest_remainder() {
  if (digested_ >= offer_.total)
    return true;
  const uint64_t block = 1024 * 1024;
  std::vector<uint8_t> buf((size_t)std::min(block, offer_.total - digested_));
  while (digested_ < offer_.total) {
    size_t n = (size_t)std::min<uint64_t>(buf.size(), offer_.total - digested_);
    if (sink_->read_at(digested_, buf.data(), n) != n) {
      fail(errc::io_error, "cannot read back " + offer_.name);
      return false;
    }
    digest_.update(buf.data(), n);
    digested_ += n;
  }
  return true;
}

void ReceiverSession::finalize() {
  if (finished())
    return;
  if (!consolidate())
    return;
  if (!sparse_.empty() || flushed_ != offer_.total) {
    Logger::instance().log(LogLevel::WARN, "%s from %s has %llu of %llu bytes",
                           offer_.name.c_str(), sender_.c_str(),
                           (unsigned long long)flushed_,
                           (unsigned long long)offer_.total);
    fail(errc::incomplete, "transfer incomplete");
    return;
  }
  if (end_seen_ && !end_.digest.empty()) {
    if (!digest_remainder())
      return;
    if (end_.digest != digest_.finish()) {
      Logger::instance().log(LogLevel::WARN, "digest mismatch for %s from %s",
                             offer_.name.c_str(), sender_.c_str());
      fail(errc::integrity, "integrity check failed");
      return;
    }
  }
  if (!sink_->finish()) {
    fail(errc::io_error, "cannot finish " + offer_.name);
    return;
  }
  state_ = State::Completed;
  Logger::instance().log(LogLevel::INFO, "received %s (%llu bytes) from %s",
                         offer_.name.c_str(), (unsigned long long)flushed_,
                         sender_.c_str());
  if (!listener_)
    return;
  listener_->on_receive_progress(*this, progress_.finish());
  if (listener_)
    listener_->on_receive_complete(*this);
}

void ReceiverSession::abort(std::error_code ec, const std::string &reason) {
  fail(ec, reason);
}

void ReceiverSession::fail(std::error_code ec, const std::string &reason) {
  if (finished())
    return;
  state_ = State::Aborted;
  sink_->abort();
  ordered_.clear();
  sparse_.clear();
  have_.clear();
  Logger::instance().log(LogLevel::WARN, "receive from %s failed: %s",
                         sender_.c_str(), reason.c_str());
  if (listener_)
    listener_->on_receive_failed(*this, ec, reason);
}

} // namespace ferry
