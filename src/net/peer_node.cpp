
#include "peer_node.hpp"
#include "digest.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>

namespace ferry {

PeerNode::PeerNode(asio::io_context &io, const NodeOptions &opts)
    : io_(io), opts_(opts), id_(random_peer_id()), acceptor_(io),
      udp_buf_(64 * 1024) {}

PeerNode::~PeerNode() {
  coord_ = nullptr;
  up_handler_ = nullptr;
  down_handler_ = nullptr;
  if (drain_timer_)
    drain_timer_->cancel();
  close();
}

void PeerNode::listen(const std::string &host, uint16_t port) {
  tcp::endpoint ep(asio::ip::make_address(host), port);
  acceptor_.open(ep.protocol());
  acceptor_.set_option(asio::socket_base::reuse_address(true));
  acceptor_.bind(ep);
  acceptor_.listen();
  if (opts_.direct)
    start_udp(udp::endpoint(ep.address(), acceptor_.local_endpoint().port()));
  Logger::instance().log(LogLevel::INFO, "node %s listening on %s:%u", id_.c_str(),
                         host.c_str(), (unsigned)acceptor_.local_endpoint().port());
  do_accept();
}

PeerNode::tcp::endpoint PeerNode::local_endpoint() const {
  std::error_code ec;
  return acceptor_.local_endpoint(ec);
}

uint16_t PeerNode::udp_port() const {
  if (!udp_)
    return 0;
  std::error_code ec;
  auto ep = udp_->local_endpoint(ec);
  return ec ? 0 : ep.port();
}

void PeerNode::do_accept() {
  auto sock = std::make_shared<tcp::socket>(io_);
  acceptor_.async_accept(*sock, [this, sock](std::error_code ec) {
    if (ec) {
      if (ec != asio::error::operation_aborted)
        Logger::instance().log(LogLevel::WARN, "accept failed: %s",
                               ec.message().c_str());
      return;
    }
    Logger::instance().log(LogLevel::DEBUG, "link accepted");
    add_link(std::move(*sock));
    do_accept();
  });
}

void PeerNode::connect(const std::string &host, uint16_t port,
                       std::function<void(std::error_code)> done) {
  auto res = std::make_shared<tcp::resolver>(io_);
  auto sock = std::make_shared<tcp::socket>(io_);
  res->async_resolve(
      host, std::to_string(port),
      [this, res, sock, done](std::error_code ec,
                              tcp::resolver::results_type results) {
        if (ec) {
          Logger::instance().log(LogLevel::ERROR, "cannot resolve: %s",
                                 ec.message().c_str());
          done(ec);
          return;
        }
        asio::async_connect(
            *sock, results,
            [this, sock, done](std::error_code ec, const tcp::endpoint &ep) {
              if (ec) {
                Logger::instance().log(LogLevel::ERROR, "connect failed: %s",
                                       ec.message().c_str());
                done(ec);
                return;
              }
              Logger::instance().log(LogLevel::INFO, "connected to %s:%u",
                                     ep.address().to_string().c_str(),
                                     (unsigned)ep.port());
              if (opts_.direct && !udp_) {
                std::error_code lec;
                auto local = sock->local_endpoint(lec);
                if (!lec)
                  start_udp(udp::endpoint(local.address(), 0));
              }
              add_link(std::move(*sock));
              done({});
            });
      });
}

PeerMeta PeerNode::self_meta() const {
  PeerMeta m;
  m.peer_id = id_;
  m.name = opts_.name;
  m.udp_port = udp_port();
  return m;
}

void PeerNode::add_link(tcp::socket sock) {
  auto link = std::make_shared<Link>();
  link->ch = std::make_shared<StreamChannel>(std::move(sock), opts_.high_water);
  links_.push_back(link);
  std::weak_ptr<Link> weak = link;
  link->ch->on_control([this, weak](const DecodedFrame &f) {
    if (auto l = weak.lock())
      on_link_control(l, f);
  });
  link->ch->on_down([this, weak](std::error_code ec) {
    if (auto l = weak.lock())
      on_link_down(l, ec);
  });
  link->ch->start();
  link->ch->send(make_frame(FrameKind::Control, ControlType::HELLO, 0, 0,
                            encode_peer(self_meta())));
}

std::shared_ptr<PeerNode::Link> PeerNode::link_for(const PeerId &peer) const {
  for (auto &l : links_) {
    if (l->ready && l->id == peer && l->ch->is_open())
      return l;
  }
  return nullptr;
}

std::vector<PeerId> PeerNode::peers() const {
  std::vector<PeerId> out;
  for (auto &l : links_) {
    if (l->ready)
      out.push_back(l->id);
  }
  return out;
}

void PeerNode::publish_peers() {
  if (coord_)
    coord_->on_peer_list_changed(peers());
}

void PeerNode::on_link_control(const std::shared_ptr<Link> &link,
                               const DecodedFrame &f) {
  if (f.control == ControlType::HELLO) {
    auto m = decode_peer(f.payload);
    if (!m || link->ready)
      return;
    if (m->peer_id == id_ || link_for(m->peer_id)) {
      Logger::instance().log(LogLevel::WARN, "duplicate peer %s, dropping link",
                             m->peer_id.c_str());
      link->ch->close();
      return;
    }
    link->id = m->peer_id;
    link->name = m->name;
    link->udp_port = m->udp_port;
    link->ready = true;
    Logger::instance().log(LogLevel::INFO, "peer %s (%s) up via %s, udp=%u",
                           link->id.c_str(), link->name.c_str(),
                           link->ch->describe().c_str(), (unsigned)link->udp_port);
    publish_peers();
    if (coord_)
      coord_->attach_channel(link->id, link->ch);
    if (up_handler_)
      up_handler_(link->id, link->name);
    return;
  }
  if (!link->ready || !coord_) {
    Logger::instance().log(LogLevel::DEBUG, "control %u before HELLO dropped",
                           (unsigned)f.control);
    return;
  }
  switch (f.control) {
  case ControlType::OFFER: {
    auto m = decode_offer(f.payload);
    if (!m) {
      Logger::instance().log(LogLevel::WARN, "malformed OFFER from %s",
                             link->id.c_str());
      return;
    }
    coord_->on_offer_received(link->id, f.transfer_id, *m);
    break;
  }
  case ControlType::ACCEPT:
    coord_->on_offer_accepted(link->id, f.transfer_id);
    break;
  case ControlType::REJECT:
    coord_->on_offer_rejected(link->id, f.transfer_id, decode_reason(f.payload));
    break;
  default:
    Logger::instance().log(LogLevel::DEBUG, "unexpected control %u on link %s",
                           (unsigned)f.control, link->id.c_str());
    break;
  }
}

void PeerNode::on_link_down(const std::shared_ptr<Link> &link, std::error_code ec) {
  links_.erase(std::remove(links_.begin(), links_.end(), link), links_.end());
  if (!link->ready)
    return;
  Logger::instance().log(LogLevel::INFO, "peer %s down: %s", link->id.c_str(),
                         ec.message().c_str());
  auto pit = probes_.find(link->id);
  if (pit != probes_.end()) {
    Probe probe = std::move(pit->second);
    probes_.erase(pit);
    probe.timer->cancel();
    probe.handler(errc::peer_lost, nullptr);
  }
  publish_peers();
  for (auto it = direct_.begin(); it != direct_.end();) {
    if (it->second.first == link->id) {
      it->second.second->close();
      it = direct_.erase(it);
    } else {
      ++it;
    }
  }
  if (down_handler_)
    down_handler_(link->id, link->name);
}

bool PeerNode::send_signal(const PeerId &peer, ControlType t, uint32_t transfer_id,
                           const std::vector<uint8_t> &meta) {
  auto link = link_for(peer);
  if (!link) {
    Logger::instance().log(LogLevel::WARN, "no link to %s for control %u",
                           peer.c_str(), (unsigned)t);
    return false;
  }
  return link->ch->send(make_frame(FrameKind::Control, t, transfer_id, 0, meta)) ==
         SendStatus::Ok;
}

void PeerNode::send_offer(const PeerId &target, uint32_t transfer_id,
                          const OfferMeta &offer) {
  send_signal(target, ControlType::OFFER, transfer_id, encode_offer(offer));
}

void PeerNode::send_accept(const PeerId &sender, uint32_t transfer_id) {
  send_signal(sender, ControlType::ACCEPT, transfer_id, {});
}

void PeerNode::send_reject(const PeerId &sender, uint32_t transfer_id,
                           const std::string &reason) {
  send_signal(sender, ControlType::REJECT, transfer_id, encode_reason(reason));
}

bool PeerNode::direct_possible(const PeerId &peer) const {
  if (!opts_.direct || !udp_)
    return false;
  auto link = link_for(peer);
  return link && link->udp_port != 0;
}

void PeerNode::open_relay(const PeerId &peer, uint32_t transfer_id, OpenHandler h) {
  auto link = link_for(peer);
  std::shared_ptr<ChannelAdapter> ch;
  if (link)
    ch = link->ch;
  Logger::instance().log(LogLevel::DEBUG, "relay for %08x to %s: %s", transfer_id,
                         peer.c_str(), ch ? ch->describe().c_str() : "none");
  asio::post(io_, [h, ch]() {
    if (ch)
      h({}, ch);
    else
      h(errc::channel_closed, nullptr);
  });
}

void PeerNode::open_direct(const PeerId &peer, uint32_t transfer_id, OpenHandler h) {
  auto link = link_for(peer);
  if (!link || !udp_) {
    asio::post(io_, [h]() { h(errc::channel_closed, nullptr); });
    return;
  }
  abandon_direct(peer);
  Probe &p = probes_[peer];
  p.transfer_id = transfer_id;
  p.remote = udp::endpoint(link->ch->remote_endpoint().address(), link->udp_port);
  p.handler = std::move(h);
  p.timer = std::make_shared<asio::steady_timer>(io_);
  send_probe(peer);
}

void PeerNode::abandon_direct(const PeerId &peer) {
  auto it = probes_.find(peer);
  if (it == probes_.end())
    return;
  it->second.timer->cancel();
  probes_.erase(it);
}

void PeerNode::send_probe(const PeerId &peer) {
  auto it = probes_.find(peer);
  if (it == probes_.end())
    return;
  Probe &p = it->second;
  Logger::instance().log(LogLevel::TRACE, "PROBE %08x to %s", p.transfer_id,
                         peer.c_str());
  send_datagram(p.remote, make_frame(FrameKind::Control, ControlType::PROBE,
                                     p.transfer_id, 0, encode_peer(self_meta())));
  uint32_t id = p.transfer_id;
  p.timer->expires_after(opts_.probe_interval);
  p.timer->async_wait([this, peer, id](const std::error_code &ec) {
    if (ec)
      return;
    auto it = probes_.find(peer);
    if (it != probes_.end() && it->second.transfer_id == id)
      send_probe(peer);
  });
}

void PeerNode::send_datagram(const udp::endpoint &to, std::vector<uint8_t> frame) {
  auto buf = std::make_shared<std::vector<uint8_t>>(std::move(frame));
  auto sock = udp_;
  udp_->async_send_to(asio::buffer(*buf), to,
                      [buf, sock](std::error_code ec, std::size_t) {
                        if (ec)
                          Logger::instance().log(LogLevel::DEBUG,
                                                 "probe datagram: %s",
                                                 ec.message().c_str());
                      });
}

void PeerNode::start_udp(const udp::endpoint &bind_ep) {
  udp_ = std::make_shared<udp::socket>(io_);
  std::error_code ec;
  udp_->open(bind_ep.protocol(), ec);
  if (!ec)
    udp_->bind(bind_ep, ec);
  if (ec) {
    Logger::instance().log(LogLevel::WARN,
                           "no direct channels, udp bind failed: %s",
                           ec.message().c_str());
    udp_.reset();
    return;
  }
  // Bursts of chunks overflow the default kernel buffers.
  std::error_code opt_ec;
  udp_->set_option(asio::socket_base::receive_buffer_size(4 << 20), opt_ec);
  if (!opt_ec)
    udp_->set_option(asio::socket_base::send_buffer_size(4 << 20), opt_ec);
  if (opt_ec)
    Logger::instance().log(LogLevel::DEBUG, "udp buffer size not applied: %s",
                           opt_ec.message().c_str());
  do_udp_read();
}

void PeerNode::do_udp_read() {
  auto sock = udp_;
  sock->async_receive_from(asio::buffer(udp_buf_), udp_from_,
                           [this, sock](std::error_code ec, std::size_t n) {
                             if (ec == asio::error::operation_aborted || closed_)
                               return;
                             if (!ec)
                               on_datagram(n);
                             do_udp_read();
                           });
}

std::shared_ptr<DatagramChannel>
PeerNode::direct_channel(const PeerId &peer, const udp::endpoint &ep) {
  auto it = direct_.find(ep);
  if (it != direct_.end() && it->second.first == peer && it->second.second->is_open())
    return it->second.second;
  auto ch = std::make_shared<DatagramChannel>(udp_, ep, opts_.high_water);
  direct_[ep] = std::make_pair(peer, ch);
  return ch;
}

void PeerNode::on_datagram(size_t n) {
  auto f = ChunkFramer::decode(udp_buf_.data(), n);
  if (!f) {
    Logger::instance().log(LogLevel::DEBUG, "undecodable datagram (%zu bytes)", n);
    return;
  }
  if (f->kind == FrameKind::Control && f->control == ControlType::PROBE) {
    auto m = decode_peer(f->payload);
    if (!m || !link_for(m->peer_id)) {
      Logger::instance().log(LogLevel::DEBUG, "PROBE from unknown peer");
      return;
    }
    send_datagram(udp_from_, make_frame(FrameKind::Control, ControlType::PROBE_ACK,
                                        f->transfer_id, 0, encode_peer(self_meta())));
    auto ch = direct_channel(m->peer_id, udp_from_);
    if (coord_)
      coord_->attach_channel(m->peer_id, ch);
    return;
  }
  if (f->kind == FrameKind::Control && f->control == ControlType::PROBE_ACK) {
    auto m = decode_peer(f->payload);
    if (!m)
      return;
    auto it = probes_.find(m->peer_id);
    if (it == probes_.end() || it->second.transfer_id != f->transfer_id)
      return;
    Probe probe = std::move(it->second);
    probes_.erase(it);
    probe.timer->cancel();
    auto ch = direct_channel(m->peer_id, udp_from_);
    Logger::instance().log(LogLevel::INFO, "direct channel to %s up: %s",
                           m->peer_id.c_str(), ch->describe().c_str());
    probe.handler({}, ch);
    return;
  }
  auto it = direct_.find(udp_from_);
  if (it == direct_.end()) {
    Logger::instance().log(LogLevel::TRACE, "datagram from unbound endpoint");
    return;
  }
  std::vector<uint8_t> frame(udp_buf_.begin(), udp_buf_.begin() + n);
  auto ch = it->second.second;
  ch->deliver(frame);
}

void PeerNode::close_when_drained(std::function<void()> done) {
  bool idle = true;
  for (auto &l : links_)
    idle = idle && l->ch->buffered_bytes() == 0;
  for (auto &kv : direct_)
    idle = idle && kv.second.second->buffered_bytes() == 0;
  if (idle) {
    close();
    done();
    return;
  }
  if (!drain_timer_)
    drain_timer_ = std::make_shared<asio::steady_timer>(io_);
  drain_timer_->expires_after(std::chrono::milliseconds(10));
  drain_timer_->async_wait([this, done](const std::error_code &ec) {
    if (!ec)
      close_when_drained(done);
  });
}

void PeerNode::close() {
  if (closed_)
    return;
  closed_ = true;
  std::error_code ec;
  acceptor_.close(ec);
  for (auto &kv : probes_)
    kv.second.timer->cancel();
  probes_.clear();
  auto links = links_;
  for (auto &l : links)
    l->ch->close();
  for (auto &kv : direct_)
    kv.second.second->close();
  direct_.clear();
  if (udp_)
    udp_->close(ec);
}

} // namespace ferry
