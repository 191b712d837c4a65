
#include "coordinator.hpp"
#include "digest.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>

namespace ferry {

const char *to_string(PairState s) {
  switch (s) {
  case PairState::Idle:
    return "idle";
  case PairState::OfferPendingOut:
    return "offer-out";
  case PairState::OfferPendingIn:
    return "offer-in";
  default:
    return "active";
  }
}

TransferCoordinator::TransferCoordinator(asio::io_context &io,
                                         const TransferConfig &cfg,
                                         SignalingLink &signaling,
                                         ChannelFactory &channels,
                                         std::string local_name)
    : io_(io), cfg_(cfg), signaling_(signaling), factory_(channels),
      local_name_(std::move(local_name)),
      alive_(std::make_shared<bool>(true)) {
  sink_factory_ = [](const PeerId &, const OfferMeta &offer) {
    return std::unique_ptr<PayloadSink>(new MemorySink(offer.total));
  };
}

TransferCoordinator::~TransferCoordinator() {
  *alive_ = false;
  for (auto &kv : pairs_) {
    if (kv.second.timer)
      kv.second.timer->cancel();
    if (kv.second.sender) {
      kv.second.sender->detach();
      kv.second.sender->cancel(errc::cancelled, "shutting down", false);
    }
    if (kv.second.receiver)
      kv.second.receiver->detach();
  }
  for (auto &kv : channels_) {
    for (auto &ch : kv.second) {
      ch->on_data(nullptr);
      ch->on_closed(nullptr);
    }
  }
}

TransferCoordinator::Pair *TransferCoordinator::find(const PeerId &peer,
                                                     uint32_t transfer_id) {
  auto it = pairs_.find(peer);
  if (it == pairs_.end())
    return nullptr;
  if (transfer_id != 0 && it->second.transfer_id != transfer_id)
    return nullptr;
  return &it->second;
}

PairState TransferCoordinator::state(const PeerId &peer) const {
  auto it = pairs_.find(peer);
  return it == pairs_.end() ? PairState::Idle : it->second.state;
}

std::shared_ptr<SenderSession>
TransferCoordinator::sender_session(const PeerId &peer) const {
  auto it = pairs_.find(peer);
  return it == pairs_.end() ? nullptr : it->second.sender;
}

std::shared_ptr<ReceiverSession>
TransferCoordinator::receiver_session(const PeerId &peer) const {
  auto it = pairs_.find(peer);
  return it == pairs_.end() ? nullptr : it->second.receiver;
}

std::error_code
TransferCoordinator::offer(const PeerId &target,
                           std::shared_ptr<FileSource> source) {
  if (target.empty())
    return errc::no_target;
  if (!source || source->name().empty())
    return errc::empty_file;
  if (!present(target))
    return errc::target_not_found;
  if (state(target) != PairState::Idle)
    return errc::busy;

  Pair &p = pairs_[target];
  p.state = PairState::OfferPendingOut;
  p.transfer_id = random_transfer_id();
  p.offer.total = source->size();
  p.offer.name = source->name();
  p.offer.mime = source->mime_type();
  p.offer.sender_name = local_name_;
  p.source = std::move(source);
  arm_offer_timer(target, p);

  Logger::instance().log(LogLevel::INFO, "offering %s (%llu bytes) to %s, id=%08x",
                         p.offer.name.c_str(), (unsigned long long)p.offer.total,
                         target.c_str(), p.transfer_id);
  OfferMeta meta = p.offer;
  uint32_t id = p.transfer_id;
  signaling_.send_offer(target, id, meta);
  events_.emit(TransferPending{target, meta.name, meta.total});
  return {};
}

std::error_code TransferCoordinator::accept(const PeerId &sender) {
  Pair *p = find(sender);
  if (!p || p->state != PairState::OfferPendingIn)
    return errc::no_target;

  ReceiverOptions ro;
  ro.consolidate_threshold = cfg_.consolidate_threshold;
  ro.progress_interval = cfg_.progress_interval;
  auto sink = sink_factory_(sender, p->offer);
  if (!sink)
    return errc::io_error;

  p->state = PairState::Active;
  p->receiver = std::make_shared<ReceiverSession>(
      sender, p->transfer_id, p->offer, std::move(sink), ro,
      static_cast<ReceiverSession::Listener *>(this));
  p->last_activity = std::chrono::steady_clock::now();
  if (p->timer)
    p->timer->cancel();
  uint32_t id = p->transfer_id;
  arm_idle_timer(sender, id, cfg_.receive_idle_timeout);
  Logger::instance().log(LogLevel::INFO, "accepted %s from %s, id=%08x",
                         p->offer.name.c_str(), sender.c_str(), id);
  signaling_.send_accept(sender, id);
  return {};
}

std::error_code TransferCoordinator::reject(const PeerId &sender,
                                            const std::string &reason) {
  Pair *p = find(sender);
  if (!p || p->state != PairState::OfferPendingIn)
    return errc::no_target;
  uint32_t id = p->transfer_id;
  release(sender);
  Logger::instance().log(LogLevel::INFO, "rejected offer %08x from %s: %s", id,
                         sender.c_str(), reason.c_str());
  signaling_.send_reject(sender, id, reason);
  return {};
}

std::error_code TransferCoordinator::cancel(const PeerId &peer) {
  Pair *p = find(peer);
  if (!p)
    return errc::no_target;
  switch (p->state) {
  case PairState::OfferPendingIn:
    return reject(peer, "cancelled");
  case PairState::OfferPendingOut: {
    uint32_t id = p->transfer_id;
    // Withdrawing is signalled as a CANCEL on whatever link reaches the peer.
    notify_peer_cancel(peer, id, "offer withdrawn");
    terminate(peer, errc::cancelled, "offer withdrawn", false);
    return {};
  }
  default:
    terminate(peer, errc::cancelled,
              p->sender ? "cancelled by sender" : "cancelled by receiver", true);
    return {};
  }
}

void TransferCoordinator::on_peer_list_changed(const std::vector<PeerId> &peers) {
  present_.clear();
  present_.insert(peers.begin(), peers.end());

  std::vector<PeerId> lost;
  for (auto &kv : pairs_) {
    if (!present_.count(kv.first))
      lost.push_back(kv.first);
  }
  for (auto &peer : lost)
    terminate(peer, errc::peer_lost, "peer " + peer + " disconnected", false);

  for (auto it = channels_.begin(); it != channels_.end();) {
    if (present_.count(it->first)) {
      ++it;
      continue;
    }
    for (auto &ch : it->second) {
      ch->on_data(nullptr);
      ch->on_closed(nullptr);
    }
    it = channels_.erase(it);
  }
}

void TransferCoordinator::on_offer_received(const PeerId &sender,
                                            uint32_t transfer_id,
                                            const OfferMeta &offer) {
  if (state(sender) != PairState::Idle) {
    Logger::instance().log(LogLevel::INFO, "refusing offer from %s: %s",
                           sender.c_str(), to_string(state(sender)));
    signaling_.send_reject(sender, transfer_id, "busy");
    return;
  }
  for (auto &kv : pairs_) {
    if (kv.second.state == PairState::OfferPendingIn) {
      Logger::instance().log(LogLevel::INFO,
                             "refusing offer from %s: offer from %s pending",
                             sender.c_str(), kv.first.c_str());
      signaling_.send_reject(sender, transfer_id, "busy");
      return;
    }
  }
  present_.insert(sender);

  Pair &p = pairs_[sender];
  p.state = PairState::OfferPendingIn;
  p.transfer_id = transfer_id;
  p.offer = offer;
  arm_offer_timer(sender, p);
  Logger::instance().log(LogLevel::INFO, "offer %08x from %s: %s (%llu bytes)",
                         transfer_id, sender.c_str(), offer.name.c_str(),
                         (unsigned long long)offer.total);
  events_.emit(IncomingFile{sender, offer.sender_name, offer.name, offer.total,
                            offer.mime});
}

void TransferCoordinator::on_offer_accepted(const PeerId &target,
                                            uint32_t transfer_id) {
  Pair *p = find(target, transfer_id);
  if (!p || p->state != PairState::OfferPendingOut) {
    Logger::instance().log(LogLevel::DEBUG, "stray accept %08x from %s",
                           transfer_id, target.c_str());
    return;
  }
  p->state = PairState::Active;
  if (p->timer)
    p->timer->cancel();
  select_channel(target, transfer_id);
}

void TransferCoordinator::on_offer_rejected(const PeerId &target,
                                            uint32_t transfer_id,
                                            const std::string &reason) {
  Pair *p = find(target, transfer_id);
  if (!p || p->state != PairState::OfferPendingOut)
    return;
  release(target);
  Logger::instance().log(LogLevel::INFO, "%s rejected offer %08x: %s",
                         target.c_str(), transfer_id, reason.c_str());
  std::error_code code = reason == "busy" ? errc::target_busy : errc::rejected;
  events_.emit(TransferRejected{target, code, reason.empty() ? "rejected" : reason});
}

void TransferCoordinator::arm_offer_timer(const PeerId &peer, Pair &p) {
  if (!p.timer)
    p.timer = std::make_shared<asio::steady_timer>(io_);
  p.timer->expires_after(cfg_.offer_timeout);
  uint32_t id = p.transfer_id;
  p.timer->async_wait([this, peer, id](const std::error_code &ec) {
    if (ec)
      return;
    Pair *p = find(peer, id);
    if (!p)
      return;
    if (p->state == PairState::OfferPendingOut) {
      notify_peer_cancel(peer, id, "offer timed out");
      terminate(peer, errc::cancelled, "offer timed out", false);
    } else if (p->state == PairState::OfferPendingIn) {
      reject(peer, "offer timed out");
    }
  });
}

void TransferCoordinator::arm_idle_timer(const PeerId &peer, uint32_t transfer_id,
                                         std::chrono::steady_clock::duration after) {
  Pair *p = find(peer, transfer_id);
  if (!p)
    return;
  if (!p->timer)
    p->timer = std::make_shared<asio::steady_timer>(io_);
  p->timer->expires_after(after);
  p->timer->async_wait([this, peer, transfer_id](const std::error_code &ec) {
    if (ec)
      return;
    Pair *p = find(peer, transfer_id);
    if (!p || !p->receiver)
      return;
    auto idle = std::chrono::steady_clock::now() - p->last_activity;
    if (idle < cfg_.receive_idle_timeout) {
      arm_idle_timer(peer, transfer_id, cfg_.receive_idle_timeout - idle);
      return;
    }
    Logger::instance().log(LogLevel::WARN, "no data from %s for %lldms", peer.c_str(),
                           (long long)cfg_.receive_idle_timeout.count());
    terminate(peer, errc::stalled, "transfer stalled", true);
  });
}

void TransferCoordinator::select_channel(const PeerId &peer, uint32_t transfer_id) {
  if (!cfg_.prefer_direct || !factory_.direct_possible(peer)) {
    open_relay(peer, transfer_id);
    return;
  }
  // Whichever of the direct result and the deadline comes first wins.
  auto settled = std::make_shared<bool>(false);
  auto deadline = std::make_shared<asio::steady_timer>(io_, cfg_.establish_timeout);
  std::weak_ptr<bool> alive = alive_;
  deadline->async_wait([this, alive, peer, transfer_id, settled](const std::error_code &ec) {
    if (ec || alive.expired() || *settled)
      return;
    *settled = true;
    factory_.abandon_direct(peer);
    std::error_code tec = errc::establish_timeout;
    Logger::instance().log(LogLevel::WARN, "direct channel to %s: %s after %lldms, using relay",
                           peer.c_str(), tec.message().c_str(),
                           (long long)cfg_.establish_timeout.count());
    if (find(peer, transfer_id))
      open_relay(peer, transfer_id);
  });
  factory_.open_direct(peer, transfer_id,
                       [this, alive, peer, transfer_id, settled, deadline](
                           std::error_code ec, std::shared_ptr<ChannelAdapter> ch) {
                         if (alive.expired())
                           return;
                         if (*settled) {
                           if (ch)
                             ch->close();
                           return;
                         }
                         *settled = true;
                         deadline->cancel();
                         if (!ec && ch) {
                           on_channel_ready(peer, transfer_id, ec, std::move(ch));
                           return;
                         }
                         Logger::instance().log(
                             LogLevel::WARN, "direct channel to %s failed (%s), using relay",
                             peer.c_str(), ec ? ec.message().c_str() : "no adapter");
                         if (find(peer, transfer_id))
                           open_relay(peer, transfer_id);
                       });
}

void TransferCoordinator::open_relay(const PeerId &peer, uint32_t transfer_id) {
  if (Pair *p = find(peer, transfer_id))
    p->relay_tried = true;
  std::weak_ptr<bool> alive = alive_;
  factory_.open_relay(peer, transfer_id,
                      [this, alive, peer, transfer_id](std::error_code ec,
                                                       std::shared_ptr<ChannelAdapter> ch) {
                        if (alive.expired())
                          return;
                        if (!ec && !ch)
                          ec = errc::channel_closed;
                        on_channel_ready(peer, transfer_id, ec, std::move(ch));
                      });
}

void TransferCoordinator::on_channel_ready(const PeerId &peer, uint32_t transfer_id,
                                           std::error_code ec,
                                           std::shared_ptr<ChannelAdapter> ch) {
  Pair *p = find(peer, transfer_id);
  if (!p || p->state != PairState::Active || p->sender) {
    Logger::instance().log(LogLevel::DEBUG, "late channel for %08x to %s dropped",
                           transfer_id, peer.c_str());
    return;
  }
  if (ec) {
    terminate(peer, ec, "no channel to " + peer + ": " + ec.message(), true);
    return;
  }
  attach_channel(peer, ch);
  p = find(peer, transfer_id);
  if (!p)
    return;

  SenderOptions so;
  so.chunk_size = cfg_.chunk_size_for(ch->kind());
  so.flow.high_water = cfg_.high_water;
  so.flow.rate_limit = cfg_.rate_limit;
  so.flow.drain_poll = cfg_.drain_poll;
  so.progress_interval = cfg_.progress_interval;
  so.retry_delay = cfg_.retry_delay;
  so.confirm_timeout = cfg_.confirm_timeout;
  so.confirm_attempts = cfg_.confirm_attempts;
  so.max_repair_rounds = cfg_.max_repair_rounds;
  p->send_channel = ch;
  p->sender = std::make_shared<SenderSession>(
      io_, peer, transfer_id, p->source, ch, so,
      static_cast<SenderSession::Listener *>(this));
  auto sender = p->sender;
  events_.emit(TransferStarted{peer, p->offer.name, p->offer.total, ch->kind()});
  sender->start();
}

void TransferCoordinator::attach_channel(const PeerId &peer,
                                         std::shared_ptr<ChannelAdapter> ch) {
  if (!ch)
    return;
  auto &list = channels_[peer];
  if (std::find(list.begin(), list.end(), ch) != list.end())
    return;
  list.push_back(ch);
  ChannelAdapter *raw = ch.get();
  ch->on_data([this, peer](const std::vector<uint8_t> &frame) { deliver(peer, frame); });
  ch->on_closed([this, peer, raw](std::error_code ec) { on_channel_closed(peer, raw, ec); });
  Logger::instance().log(LogLevel::DEBUG, "%s channel attached for %s",
                         ch->describe().c_str(), peer.c_str());
}

void TransferCoordinator::on_channel_closed(const PeerId &peer, ChannelAdapter *ch,
                                            std::error_code ec) {
  auto it = channels_.find(peer);
  if (it != channels_.end()) {
    auto &list = it->second;
    list.erase(std::remove_if(list.begin(), list.end(),
                              [ch](const std::shared_ptr<ChannelAdapter> &c) {
                                return c.get() == ch;
                              }),
               list.end());
    if (list.empty())
      channels_.erase(it);
  }
  Pair *p = find(peer);
  if (!p || p->state != PairState::Active)
    return;
  std::string why = "channel to " + peer + " closed";
  if (ec && ec != errc::channel_closed)
    why += ": " + ec.message();
  if (p->sender && p->send_channel.get() == ch) {
    if (!restart_over_relay(peer, *p, errc::channel_closed, why))
      terminate(peer, errc::channel_closed, why, false);
  } else if (p->receiver && !channels_.count(peer)) {
    terminate(peer, errc::channel_closed, why, false);
  }
}

void TransferCoordinator::deliver(const PeerId &from, const std::vector<uint8_t> &frame) {
  auto f = ChunkFramer::decode(frame);
  if (!f) {
    Logger::instance().log(LogLevel::DEBUG, "undecodable frame (%zu bytes) from %s",
                           frame.size(), from.c_str());
    return;
  }
  Pair *p = find(from);
  if (!p || p->transfer_id != f->transfer_id) {
    Logger::instance().log(LogLevel::TRACE, "frame for unknown transfer %08x from %s",
                           f->transfer_id, from.c_str());
    return;
  }
  if (f->kind == FrameKind::Control && f->control == ControlType::CANCEL &&
      p->state != PairState::Active) {
    std::string why = decode_reason(f->payload);
    terminate(from, errc::cancelled, why.empty() ? "cancelled by peer" : why, false);
    return;
  }
  if (p->receiver) {
    p->last_activity = std::chrono::steady_clock::now();
    auto receiver = p->receiver;
    if (f->control == ControlType::CANCEL)
      p->peer_notified = true;
    receiver->on_frame(from, *f);
    return;
  }
  if (p->sender && f->kind == FrameKind::Control &&
      (f->control == ControlType::RESEND || f->control == ControlType::DONE)) {
    auto sender = p->sender;
    if (!sender->on_receipt(*f))
      Logger::instance().log(LogLevel::TRACE, "control %u from %s ignored in %s",
                             (unsigned)f->control, from.c_str(),
                             to_string(sender->state()));
    return;
  }
  if (p->state == PairState::Active && f->kind == FrameKind::Control &&
      f->control == ControlType::CANCEL) {
    std::string why = decode_reason(f->payload);
    auto sender = p->sender;
    if (sender)
      sender->cancel(errc::cancelled, why.empty() ? "cancelled by receiver" : why, false);
    else
      terminate(from, errc::cancelled, why.empty() ? "cancelled by receiver" : why, false);
  }
}

void TransferCoordinator::notify_peer_cancel(const PeerId &peer, uint32_t transfer_id,
                                             const std::string &reason) {
  auto it = channels_.find(peer);
  if (it == channels_.end())
    return;
  ChunkFramer framer(transfer_id, false);
  auto list = it->second;
  for (auto &ch : list) {
    if (!ch->is_open())
      continue;
    auto frame = framer.encode_control(ControlType::CANCEL, encode_reason(reason));
    if (ch->send(std::move(frame)) != SendStatus::Ok)
      Logger::instance().log(LogLevel::DEBUG, "CANCEL to %s not queued on %s",
                             peer.c_str(), ch->describe().c_str());
  }
}

bool TransferCoordinator::send_to_peer(const PeerId &peer, std::vector<uint8_t> frame) {
  auto it = channels_.find(peer);
  if (it == channels_.end())
    return false;
  std::shared_ptr<ChannelAdapter> best;
  for (auto &ch : it->second) {
    if (!ch->is_open())
      continue;
    if (ch->ordered()) {
      best = ch;
      break;
    }
    if (!best)
      best = ch;
  }
  return best && best->send(std::move(frame)) == SendStatus::Ok;
}

bool TransferCoordinator::restart_over_relay(const PeerId &peer, Pair &p,
                                             std::error_code ec,
                                             const std::string &reason) {
  if (!is_channel_error(ec) || !p.sender || p.relay_tried ||
      p.sender->channel().kind() != ChannelKind::Direct)
    return false;
  Logger::instance().log(LogLevel::WARN,
                         "direct transfer %08x to %s failed (%s), restarting over relay",
                         p.transfer_id, peer.c_str(), reason.c_str());
  auto old = std::move(p.sender);
  p.send_channel.reset();
  old->detach();
  old->cancel(ec, reason, false);
  open_relay(peer, p.transfer_id);
  return true;
}

void TransferCoordinator::release(const PeerId &peer) {
  auto it = pairs_.find(peer);
  if (it == pairs_.end())
    return;
  if (it->second.timer)
    it->second.timer->cancel();
  pairs_.erase(it);
}

void TransferCoordinator::terminate(const PeerId &peer, std::error_code ec,
                                    const std::string &reason, bool notify_peer) {
  auto it = pairs_.find(peer);
  if (it == pairs_.end())
    return;
  Pair p = std::move(it->second);
  pairs_.erase(it);
  if (p.timer)
    p.timer->cancel();

  if (p.sender) {
    p.sender->detach();
    p.sender->cancel(ec, reason, notify_peer);
  } else if (notify_peer && !p.peer_notified) {
    notify_peer_cancel(peer, p.transfer_id, reason);
  }
  if (p.receiver) {
    p.receiver->detach();
    p.receiver->abort(ec, reason);
  }
  Logger::instance().log(LogLevel::WARN, "transfer %08x with %s ended: %s",
                         p.transfer_id, peer.c_str(), reason.c_str());
  events_.emit(TransferError{peer, ec, reason});
}

void TransferCoordinator::on_send_progress(SenderSession &s, const ProgressSample &p) {
  events_.emit(TransferProgress{s.target(), p.percent, p.speed, p.done, p.total, p.eta_s});
}

void TransferCoordinator::on_send_complete(SenderSession &s) {
  Pair *p = find(s.target(), s.transfer_id());
  if (!p || p->sender.get() != &s)
    return;
  PeerId peer = s.target();
  std::string name = p->offer.name;
  auto keep = p->sender;
  release(peer);
  events_.emit(TransferComplete{peer, name});
}

void TransferCoordinator::on_send_failed(SenderSession &s, std::error_code ec,
                                         const std::string &reason) {
  Pair *p = find(s.target(), s.transfer_id());
  if (!p || p->sender.get() != &s)
    return;
  PeerId peer = s.target();
  uint32_t id = s.transfer_id();
  auto keep = p->sender;
  if (restart_over_relay(peer, *p, ec, reason))
    return;
  release(peer);
  if (is_channel_error(ec))
    notify_peer_cancel(peer, id, reason);
  events_.emit(TransferError{peer, ec, reason});
}

void TransferCoordinator::on_receive_progress(ReceiverSession &s,
                                              const ProgressSample &p) {
  events_.emit(ReceiveProgress{s.sender(), p.percent, p.speed, p.done, p.total, p.eta_s});
}

void TransferCoordinator::on_receive_complete(ReceiverSession &s) {
  Pair *p = find(s.sender(), s.transfer_id());
  if (!p || p->receiver.get() != &s)
    return;
  auto keep = p->receiver;
  PeerId peer = s.sender();
  release(peer);
  if (s.sequenced()) {
    ChunkFramer framer(s.transfer_id(), false);
    if (!send_to_peer(peer, framer.encode_control(ControlType::DONE)))
      Logger::instance().log(LogLevel::WARN, "could not confirm %08x to %s",
                             s.transfer_id(), peer.c_str());
  }
  FileReceived ev;
  ev.peer = peer;
  ev.file_name = s.offer().name;
  ev.payload = s.sink().payload();
  ev.path = s.sink().location();
  ev.size = s.consolidated_bytes();
  events_.emit(ev);
}

void TransferCoordinator::on_receive_failed(ReceiverSession &s, std::error_code ec,
                                            const std::string &reason) {
  Pair *p = find(s.sender(), s.transfer_id());
  if (!p || p->receiver.get() != &s)
    return;
  auto keep = p->receiver;
  PeerId peer = s.sender();
  uint32_t id = s.transfer_id();
  bool tell_sender = !p->peer_notified && ec != errc::peer_lost;
  release(peer);
  if (tell_sender)
    notify_peer_cancel(peer, id, reason);
  events_.emit(TransferError{peer, ec, reason});
}

void TransferCoordinator::on_receive_missing(ReceiverSession &s,
                                             const ResendMeta &missing) {
  Pair *p = find(s.sender(), s.transfer_id());
  if (!p || p->receiver.get() != &s)
    return;
  ChunkFramer framer(s.transfer_id(), false);
  if (!send_to_peer(s.sender(), framer.encode_control(ControlType::RESEND,
                                                      encode_resend(missing))))
    Logger::instance().log(LogLevel::WARN, "RESEND to %s not queued",
                           s.sender().c_str());
}

} // namespace ferry
