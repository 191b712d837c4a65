
#include "coordinator.hpp"
#include "loopback_channel.hpp"
#include "session_harness.hpp"
#include <gtest/gtest.h>
#include <set>

using namespace ferry;
using namespace ferry::test;
using namespace std::chrono_literals;

namespace {

// One side of an in-process two-peer network. Signaling is forwarded to the
// other side's coordinator on a later turn of the loop; relay traffic rides
// the always-present link pair, direct channels are fresh loopback pairs.
struct FakePeer : SignalingLink, ChannelFactory {
  // Lossy drops the frames listed in `lose`; Blackhole drops every frame.
  enum class Direct { Unavailable, Succeed, Lossy, Blackhole, Fail, Hang };

  FakePeer(asio::io_context &io, PeerId self) : io(io), self(std::move(self)) {}

  void send_offer(const PeerId &target, uint32_t id, const OfferMeta &offer) override {
    offers.push_back(target);
    if (!forward)
      return;
    FakePeer *o = other;
    PeerId from = self;
    asio::post(io, [o, from, id, offer]() { o->coord->on_offer_received(from, id, offer); });
  }
  void send_accept(const PeerId &sender, uint32_t id) override {
    accepts.push_back(sender);
    if (!forward)
      return;
    FakePeer *o = other;
    PeerId from = self;
    asio::post(io, [o, from, id]() { o->coord->on_offer_accepted(from, id); });
  }
  void send_reject(const PeerId &sender, uint32_t id, const std::string &reason) override {
    rejects.push_back(sender + ":" + reason);
    if (!forward)
      return;
    FakePeer *o = other;
    PeerId from = self;
    asio::post(io, [o, from, id, reason]() { o->coord->on_offer_rejected(from, id, reason); });
  }

  bool direct_possible(const PeerId &) const override { return direct != Direct::Unavailable; }

  void open_direct(const PeerId &, uint32_t, OpenHandler h) override {
    switch (direct) {
    case Direct::Succeed:
    case Direct::Lossy:
    case Direct::Blackhole: {
      auto mode = direct == Direct::Succeed ? LoopbackChannel::Mode::Duplicating
                                            : LoopbackChannel::Mode::Lossy;
      auto local = std::make_shared<LoopbackChannel>(io, mode, ChannelKind::Direct);
      if (direct == Direct::Lossy)
        local->lose_frames(lose);
      else if (direct == Direct::Blackhole)
        local->lose_every(1);
      auto remote = std::make_shared<LoopbackChannel>(io, LoopbackChannel::Mode::Ordered,
                                                      ChannelKind::Direct);
      LoopbackChannel::link(local, remote);
      other->coord->attach_channel(self, remote);
      direct_channels.push_back(local);
      asio::post(io, [h, local]() { h({}, local); });
      break;
    }
    case Direct::Fail:
      asio::post(io, [h]() { h(errc::channel_closed, nullptr); });
      break;
    default:
      hung = h;
      break;
    }
  }

  void open_relay(const PeerId &, uint32_t, OpenHandler h) override {
    auto ch = link;
    asio::post(io, [h, ch]() { h({}, ch); });
  }

  void abandon_direct(const PeerId &) override { abandoned++; }

  asio::io_context &io;
  PeerId self;
  FakePeer *other{nullptr};
  TransferCoordinator *coord{nullptr};
  std::shared_ptr<LoopbackChannel> link;
  bool forward{true};
  Direct direct{Direct::Unavailable};
  std::set<size_t> lose;
  OpenHandler hung;
  int abandoned{0};
  std::vector<std::shared_ptr<LoopbackChannel>> direct_channels;
  std::vector<PeerId> offers;
  std::vector<PeerId> accepts;
  std::vector<std::string> rejects;
};

struct EventLog {
  std::vector<TransferEvent> all;

  template <typename T> size_t count() const {
    size_t n = 0;
    for (auto &e : all)
      n += std::holds_alternative<T>(e) ? 1 : 0;
    return n;
  }
  template <typename T> const T *last() const {
    for (auto it = all.rbegin(); it != all.rend(); ++it) {
      if (auto *v = std::get_if<T>(&*it))
        return v;
    }
    return nullptr;
  }
};

class CoordinatorTest : public ::testing::Test {
protected:
  CoordinatorTest() : alice_(io_, "alice"), bob_(io_, "bob") {
    cfg_.direct_chunk_size = 1024;
    cfg_.relay_chunk_size = 4096;
    cfg_.drain_poll = 2ms;
    cfg_.retry_delay = 5ms;
    cfg_.progress_interval = 0ms;
    cfg_.establish_timeout = 50ms;
    cfg_.offer_timeout = 300ms;
    cfg_.receive_idle_timeout = 150ms;
    cfg_.consolidate_threshold = 8 * 1024;
    cfg_.confirm_timeout = 20ms;
    cfg_.confirm_attempts = 3;
    cfg_.max_repair_rounds = 2;
  }

  void SetUp() override { build(); }

  void rebuild() {
    a_.reset();
    b_.reset();
    build();
  }

  void build() {
    a_.reset(new TransferCoordinator(io_, cfg_, alice_, alice_, "Alice"));
    b_.reset(new TransferCoordinator(io_, cfg_, bob_, bob_, "Bob"));
    alice_.coord = a_.get();
    bob_.coord = b_.get();
    alice_.other = &bob_;
    bob_.other = &alice_;
    alice_.link = std::make_shared<LoopbackChannel>(io_);
    bob_.link = std::make_shared<LoopbackChannel>(io_);
    LoopbackChannel::link(alice_.link, bob_.link);
    a_->attach_channel("bob", alice_.link);
    b_->attach_channel("alice", bob_.link);
    a_->on_peer_list_changed({"bob"});
    b_->on_peer_list_changed({"alice"});
    a_->events().subscribe([this](const TransferEvent &e) { alice_events_.all.push_back(e); });
    b_->events().subscribe([this](const TransferEvent &e) { bob_events_.all.push_back(e); });
  }

  void run_until(const std::function<bool()> &done, int rounds = 300) {
    for (int i = 0; i < rounds && !done(); i++) {
      io_.restart();
      io_.run_for(10ms);
    }
  }

  void settle(std::chrono::milliseconds d) {
    io_.restart();
    io_.run_for(d);
  }

  std::shared_ptr<BufferSource> file(size_t n, const std::string &name = "photo.jpg") {
    data_ = pattern(n, 5);
    return std::make_shared<BufferSource>(name, data_, "image/jpeg");
  }

  // Offers from alice to bob and waits until bob has the offer pending.
  void offer_and_wait(size_t n) {
    ASSERT_FALSE(a_->offer("bob", file(n)));
    run_until([&] { return b_->state("alice") == PairState::OfferPendingIn; });
    ASSERT_EQ(b_->state("alice"), PairState::OfferPendingIn);
  }

  // Starts a rate-limited relay transfer and waits for bytes to flow.
  void start_slow_transfer() {
    cfg_.rate_limit = 50000;
    a_.reset();
    b_.reset();
    build();
    offer_and_wait(200000);
    ASSERT_FALSE(b_->accept("alice"));
    run_until([&] { return bob_events_.count<ReceiveProgress>() > 2; });
    ASSERT_EQ(a_->state("bob"), PairState::Active);
    ASSERT_EQ(b_->state("alice"), PairState::Active);
  }

  asio::io_context io_;
  TransferConfig cfg_;
  FakePeer alice_;
  FakePeer bob_;
  std::vector<uint8_t> data_;
  EventLog alice_events_;
  EventLog bob_events_;
  std::unique_ptr<TransferCoordinator> a_;
  std::unique_ptr<TransferCoordinator> b_;
};

} // namespace

TEST_F(CoordinatorTest, OfferPreconditions) {
  EXPECT_EQ(a_->offer("", file(10)), make_error_code(errc::no_target));
  EXPECT_EQ(a_->offer("bob", nullptr), make_error_code(errc::empty_file));
  EXPECT_EQ(a_->offer("bob", file(10, "")), make_error_code(errc::empty_file));
  EXPECT_EQ(a_->offer("carol", file(10)), make_error_code(errc::target_not_found));
  EXPECT_TRUE(alice_.offers.empty());
  EXPECT_TRUE(alice_events_.all.empty());

  EXPECT_FALSE(a_->offer("bob", file(10)));
  EXPECT_EQ(a_->state("bob"), PairState::OfferPendingOut);
  EXPECT_EQ(a_->offer("bob", file(10)), make_error_code(errc::busy));
  EXPECT_EQ(alice_.offers.size(), 1u);
  ASSERT_EQ(alice_events_.count<TransferPending>(), 1u);
  EXPECT_EQ(alice_events_.last<TransferPending>()->total, 10u);
}

TEST_F(CoordinatorTest, AcceptWithoutOfferFails) {
  EXPECT_EQ(b_->accept("alice"), make_error_code(errc::no_target));
  EXPECT_EQ(b_->reject("alice"), make_error_code(errc::no_target));
  EXPECT_EQ(b_->cancel("alice"), make_error_code(errc::no_target));
}

TEST_F(CoordinatorTest, RelayTransferEndToEnd) {
  offer_and_wait(50000);
  auto *incoming = bob_events_.last<IncomingFile>();
  ASSERT_TRUE(incoming);
  EXPECT_EQ(incoming->peer, "alice");
  EXPECT_EQ(incoming->sender_name, "Alice");
  EXPECT_EQ(incoming->file_name, "photo.jpg");
  EXPECT_EQ(incoming->file_size, 50000u);
  EXPECT_EQ(incoming->mime_type, "image/jpeg");

  ASSERT_FALSE(b_->accept("alice"));
  run_until([&] {
    return alice_events_.count<TransferComplete>() > 0 && bob_events_.count<FileReceived>() > 0;
  });

  ASSERT_EQ(alice_events_.count<TransferComplete>(), 1u);
  EXPECT_EQ(alice_events_.count<TransferError>(), 0u);
  auto *started = alice_events_.last<TransferStarted>();
  ASSERT_TRUE(started);
  EXPECT_EQ(started->channel, ChannelKind::Relay);

  auto *received = bob_events_.last<FileReceived>();
  ASSERT_TRUE(received);
  EXPECT_EQ(received->file_name, "photo.jpg");
  EXPECT_EQ(received->size, 50000u);
  ASSERT_TRUE(received->payload);
  EXPECT_EQ(*received->payload, data_);
  EXPECT_EQ(bob_events_.count<TransferError>(), 0u);
  EXPECT_EQ(alice_events_.last<TransferProgress>()->percent, 100);

  EXPECT_EQ(a_->state("bob"), PairState::Idle);
  EXPECT_EQ(b_->state("alice"), PairState::Idle);
  EXPECT_EQ(a_->busy_pairs() + b_->busy_pairs(), 0u);
}

TEST_F(CoordinatorTest, DirectChannelPreferredWhenAvailable) {
  alice_.direct = FakePeer::Direct::Succeed;
  offer_and_wait(20000);
  ASSERT_FALSE(b_->accept("alice"));
  run_until([&] { return bob_events_.count<FileReceived>() > 0; });

  auto *started = alice_events_.last<TransferStarted>();
  ASSERT_TRUE(started);
  EXPECT_EQ(started->channel, ChannelKind::Direct);
  ASSERT_EQ(alice_.direct_channels.size(), 1u);
  EXPECT_GT(alice_.direct_channels[0]->sent().size(), 20000u / 1024);

  auto *received = bob_events_.last<FileReceived>();
  ASSERT_TRUE(received);
  EXPECT_EQ(*received->payload, data_);
}

TEST_F(CoordinatorTest, LossyDirectChannelIsRepaired) {
  alice_.direct = FakePeer::Direct::Lossy;
  alice_.lose = {3, 11};
  offer_and_wait(20000);
  ASSERT_FALSE(b_->accept("alice"));
  run_until([&] {
    return alice_events_.count<TransferComplete>() > 0 && bob_events_.count<FileReceived>() > 0;
  });

  ASSERT_EQ(alice_.direct_channels.size(), 1u);
  EXPECT_EQ(alice_.direct_channels[0]->dropped(), 2u);
  EXPECT_EQ(alice_events_.count<TransferStarted>(), 1u);
  EXPECT_EQ(alice_events_.last<TransferStarted>()->channel, ChannelKind::Direct);
  ASSERT_EQ(alice_events_.count<TransferComplete>(), 1u);
  ASSERT_EQ(bob_events_.count<FileReceived>(), 1u);
  EXPECT_EQ(*bob_events_.last<FileReceived>()->payload, data_);
  EXPECT_EQ(alice_events_.count<TransferError>(), 0u);
  EXPECT_EQ(bob_events_.count<TransferError>(), 0u);
  EXPECT_EQ(a_->state("bob"), PairState::Idle);
  EXPECT_EQ(b_->state("alice"), PairState::Idle);
}

TEST_F(CoordinatorTest, DirectThatNeverDeliversFallsBackToRelay) {
  cfg_.receive_idle_timeout = 1000ms;
  rebuild();
  alice_.direct = FakePeer::Direct::Blackhole;
  offer_and_wait(9000);
  ASSERT_FALSE(b_->accept("alice"));
  run_until([&] {
    return alice_events_.count<TransferComplete>() > 0 && bob_events_.count<FileReceived>() > 0;
  });

  // One start per channel tried.
  ASSERT_EQ(alice_events_.count<TransferStarted>(), 2u);
  std::vector<ChannelKind> kinds;
  for (auto &e : alice_events_.all)
    if (auto *st = std::get_if<TransferStarted>(&e))
      kinds.push_back(st->channel);
  EXPECT_EQ(kinds, std::vector<ChannelKind>({ChannelKind::Direct, ChannelKind::Relay}));
  ASSERT_EQ(alice_events_.count<TransferComplete>(), 1u);
  ASSERT_EQ(bob_events_.count<FileReceived>(), 1u);
  EXPECT_EQ(*bob_events_.last<FileReceived>()->payload, data_);
  EXPECT_EQ(alice_events_.count<TransferError>(), 0u);
  EXPECT_EQ(bob_events_.count<TransferError>(), 0u);
}

TEST_F(CoordinatorTest, LossBeyondRepairLimitRestartsOverRelay) {
  cfg_.max_repair_rounds = 0;
  rebuild();
  alice_.direct = FakePeer::Direct::Lossy;
  alice_.lose = {2};
  offer_and_wait(9000);
  ASSERT_FALSE(b_->accept("alice"));
  run_until([&] {
    return alice_events_.count<TransferComplete>() > 0 && bob_events_.count<FileReceived>() > 0;
  });

  ASSERT_EQ(alice_events_.count<TransferStarted>(), 2u);
  EXPECT_EQ(alice_events_.last<TransferStarted>()->channel, ChannelKind::Relay);
  ASSERT_EQ(bob_events_.count<FileReceived>(), 1u);
  EXPECT_EQ(*bob_events_.last<FileReceived>()->payload, data_);
  EXPECT_EQ(alice_events_.count<TransferError>(), 0u);
  EXPECT_EQ(bob_events_.count<TransferError>(), 0u);
  EXPECT_EQ(a_->state("bob"), PairState::Idle);
}

TEST_F(CoordinatorTest, FailedDirectFallsBackToRelay) {
  alice_.direct = FakePeer::Direct::Fail;
  offer_and_wait(9000);
  ASSERT_FALSE(b_->accept("alice"));
  run_until([&] { return bob_events_.count<FileReceived>() > 0; });

  ASSERT_TRUE(alice_events_.last<TransferStarted>());
  EXPECT_EQ(alice_events_.last<TransferStarted>()->channel, ChannelKind::Relay);
  ASSERT_EQ(bob_events_.count<FileReceived>(), 1u);
  EXPECT_EQ(*bob_events_.last<FileReceived>()->payload, data_);
}

TEST_F(CoordinatorTest, SlowDirectTimesOutAndLateChannelIsClosed) {
  alice_.direct = FakePeer::Direct::Hang;
  offer_and_wait(9000);
  ASSERT_FALSE(b_->accept("alice"));
  run_until([&] { return alice_events_.count<TransferComplete>() > 0; });

  EXPECT_EQ(alice_.abandoned, 1);
  EXPECT_EQ(alice_events_.last<TransferStarted>()->channel, ChannelKind::Relay);
  ASSERT_TRUE(alice_.hung);

  auto late = std::make_shared<LoopbackChannel>(io_, LoopbackChannel::Mode::Ordered,
                                                ChannelKind::Direct);
  alice_.hung({}, late);
  EXPECT_FALSE(late->is_open());
  EXPECT_EQ(alice_events_.count<TransferStarted>(), 1u);
}

TEST_F(CoordinatorTest, RejectReachesSender) {
  offer_and_wait(100);
  ASSERT_FALSE(b_->reject("alice"));
  EXPECT_EQ(b_->state("alice"), PairState::Idle);
  run_until([&] { return alice_events_.count<TransferRejected>() > 0; });

  ASSERT_EQ(alice_events_.count<TransferRejected>(), 1u);
  EXPECT_EQ(alice_events_.last<TransferRejected>()->reason, "declined");
  EXPECT_EQ(alice_events_.last<TransferRejected>()->code, make_error_code(errc::rejected));
  EXPECT_EQ(alice_events_.count<TransferError>(), 0u);
  EXPECT_EQ(a_->state("bob"), PairState::Idle);
}

TEST_F(CoordinatorTest, BusyTargetRejectionCarriesCode) {
  OfferMeta other;
  other.total = 5;
  other.name = "other.txt";
  b_->on_offer_received("carol", 77, other);
  ASSERT_FALSE(a_->offer("bob", file(100)));
  run_until([&] { return alice_events_.count<TransferRejected>() > 0; });

  ASSERT_EQ(alice_events_.count<TransferRejected>(), 1u);
  EXPECT_EQ(alice_events_.last<TransferRejected>()->code, make_error_code(errc::target_busy));
  EXPECT_EQ(alice_events_.last<TransferRejected>()->reason, "busy");
  EXPECT_EQ(a_->state("bob"), PairState::Idle);
}

TEST_F(CoordinatorTest, BusyReceiverRejectsFurtherOffers) {
  offer_and_wait(100);
  OfferMeta other;
  other.total = 5;
  other.name = "other.txt";
  b_->on_offer_received("carol", 77, other);
  b_->on_offer_received("alice", 78, other);

  ASSERT_EQ(bob_.rejects.size(), 2u);
  EXPECT_EQ(bob_.rejects[0], "carol:busy");
  EXPECT_EQ(bob_.rejects[1], "alice:busy");
  EXPECT_EQ(b_->state("carol"), PairState::Idle);
  EXPECT_EQ(b_->state("alice"), PairState::OfferPendingIn);
  EXPECT_EQ(bob_events_.count<IncomingFile>(), 1u);

  // The stale reject for 78 must not disturb alice's pending offer.
  settle(30ms);
  EXPECT_EQ(a_->state("bob"), PairState::OfferPendingOut);
  EXPECT_EQ(alice_events_.count<TransferRejected>(), 0u);
}

TEST_F(CoordinatorTest, PeerLossEndsTransferExactlyOnce) {
  start_slow_transfer();
  a_->on_peer_list_changed({});
  b_->on_peer_list_changed({});
  settle(100ms);

  ASSERT_EQ(alice_events_.count<TransferError>(), 1u);
  EXPECT_EQ(alice_events_.last<TransferError>()->code, make_error_code(errc::peer_lost));
  ASSERT_EQ(bob_events_.count<TransferError>(), 1u);
  EXPECT_EQ(bob_events_.last<TransferError>()->code, make_error_code(errc::peer_lost));
  EXPECT_EQ(alice_events_.count<TransferComplete>(), 0u);
  EXPECT_EQ(bob_events_.count<FileReceived>(), 0u);
  EXPECT_EQ(a_->state("bob"), PairState::Idle);
  EXPECT_EQ(b_->state("alice"), PairState::Idle);
  EXPECT_FALSE(a_->present("bob"));
  EXPECT_EQ(a_->offer("bob", file(10)), make_error_code(errc::target_not_found));
}

TEST_F(CoordinatorTest, SenderCancelReachesReceiver) {
  start_slow_transfer();
  ASSERT_FALSE(a_->cancel("bob"));
  EXPECT_EQ(a_->state("bob"), PairState::Idle);
  run_until([&] { return bob_events_.count<TransferError>() > 0; });

  ASSERT_EQ(alice_events_.count<TransferError>(), 1u);
  EXPECT_EQ(alice_events_.last<TransferError>()->code, make_error_code(errc::cancelled));
  EXPECT_EQ(alice_events_.last<TransferError>()->reason, "cancelled by sender");
  ASSERT_EQ(bob_events_.count<TransferError>(), 1u);
  EXPECT_EQ(bob_events_.last<TransferError>()->code, make_error_code(errc::cancelled));
  EXPECT_EQ(bob_events_.last<TransferError>()->reason, "cancelled by sender");
  EXPECT_EQ(b_->state("alice"), PairState::Idle);

  settle(50ms);
  EXPECT_EQ(alice_events_.count<TransferError>(), 1u);
  EXPECT_EQ(bob_events_.count<TransferError>(), 1u);
}

TEST_F(CoordinatorTest, ReceiverCancelStopsSender) {
  start_slow_transfer();
  ASSERT_FALSE(b_->cancel("alice"));
  EXPECT_EQ(b_->state("alice"), PairState::Idle);
  ASSERT_EQ(bob_events_.count<TransferError>(), 1u);
  EXPECT_EQ(bob_events_.last<TransferError>()->reason, "cancelled by receiver");
  run_until([&] { return alice_events_.count<TransferError>() > 0; });

  ASSERT_EQ(alice_events_.count<TransferError>(), 1u);
  EXPECT_EQ(alice_events_.last<TransferError>()->code, make_error_code(errc::cancelled));
  EXPECT_EQ(alice_events_.last<TransferError>()->reason, "cancelled by receiver");
  EXPECT_EQ(a_->state("bob"), PairState::Idle);
  EXPECT_EQ(alice_events_.count<TransferComplete>(), 0u);
}

TEST_F(CoordinatorTest, ClosedChannelFailsSender) {
  start_slow_transfer();
  alice_.link->close();
  EXPECT_EQ(a_->state("bob"), PairState::Idle);
  ASSERT_EQ(alice_events_.count<TransferError>(), 1u);
  EXPECT_EQ(alice_events_.last<TransferError>()->code, make_error_code(errc::channel_closed));
}

TEST_F(CoordinatorTest, WithdrawnOfferClearsBothSides) {
  offer_and_wait(100);
  ASSERT_FALSE(a_->cancel("bob"));
  EXPECT_EQ(a_->state("bob"), PairState::Idle);
  run_until([&] { return bob_events_.count<TransferError>() > 0; });

  EXPECT_EQ(alice_events_.last<TransferError>()->reason, "offer withdrawn");
  ASSERT_EQ(bob_events_.count<TransferError>(), 1u);
  EXPECT_EQ(bob_events_.last<TransferError>()->code, make_error_code(errc::cancelled));
  EXPECT_EQ(bob_events_.last<TransferError>()->reason, "offer withdrawn");
  EXPECT_EQ(b_->state("alice"), PairState::Idle);
  EXPECT_EQ(b_->accept("alice"), make_error_code(errc::no_target));
}

TEST_F(CoordinatorTest, UnansweredOfferTimesOut) {
  alice_.forward = false;
  ASSERT_FALSE(a_->offer("bob", file(100)));
  run_until([&] { return alice_events_.count<TransferError>() > 0; });

  ASSERT_EQ(alice_events_.count<TransferError>(), 1u);
  EXPECT_EQ(alice_events_.last<TransferError>()->code, make_error_code(errc::cancelled));
  EXPECT_EQ(alice_events_.last<TransferError>()->reason, "offer timed out");
  EXPECT_EQ(a_->state("bob"), PairState::Idle);
}

TEST_F(CoordinatorTest, IgnoredIncomingOfferIsRejected) {
  OfferMeta meta;
  meta.total = 10;
  meta.name = "x.bin";
  b_->on_offer_received("alice", 5, meta);
  EXPECT_EQ(b_->state("alice"), PairState::OfferPendingIn);
  run_until([&] { return !bob_.rejects.empty(); });

  ASSERT_EQ(bob_.rejects.size(), 1u);
  EXPECT_EQ(bob_.rejects[0], "alice:offer timed out");
  EXPECT_EQ(b_->state("alice"), PairState::Idle);
}

TEST_F(CoordinatorTest, SilentSenderStallsReceiver) {
  offer_and_wait(1000);
  bob_.forward = false;
  ASSERT_FALSE(b_->accept("alice"));
  run_until([&] { return bob_events_.count<TransferError>() > 0; });

  ASSERT_EQ(bob_events_.count<TransferError>(), 1u);
  EXPECT_EQ(bob_events_.last<TransferError>()->code, make_error_code(errc::stalled));
  EXPECT_EQ(bob_events_.last<TransferError>()->reason, "transfer stalled");
  EXPECT_EQ(b_->state("alice"), PairState::Idle);

  // The stalled receiver told the sender, whose offer is withdrawn too.
  run_until([&] { return alice_events_.count<TransferError>() > 0; });
  EXPECT_EQ(alice_events_.count<TransferError>(), 1u);
  EXPECT_EQ(a_->state("bob"), PairState::Idle);
}
