
#pragma once
#include <memory>
#include <string>
#include <vector>
#include "errors.hpp"
#include "loopback_channel.hpp"
#include "receiver_session.hpp"
#include "sender_session.hpp"

namespace ferry {
namespace test {

inline std::vector<uint8_t> pattern(size_t n, uint8_t seed = 0) {
  std::vector<uint8_t> v(n);
  for (size_t i = 0; i < n; i++)
    v[i] = (uint8_t)((i * 131 + seed) ^ (i >> 8));
  return v;
}

struct SendRecorder : SenderSession::Listener {
  std::vector<ProgressSample> progress;
  int completed = 0;
  int failed = 0;
  std::error_code error;
  std::string reason;

  void on_send_progress(SenderSession &, const ProgressSample &p) override {
    progress.push_back(p);
  }
  void on_send_complete(SenderSession &) override { completed++; }
  void on_send_failed(SenderSession &, std::error_code ec,
                      const std::string &why) override {
    failed++;
    error = ec;
    reason = why;
  }
};

// Records receiver callbacks. When `reply` is set, receipts go back to the
// sender over it the way the coordinator sends them.
struct ReceiveRecorder : ReceiverSession::Listener {
  std::vector<ProgressSample> progress;
  int completed = 0;
  int failed = 0;
  int missing = 0;
  ResendMeta last_missing;
  std::error_code error;
  std::string reason;
  LoopbackChannel *reply = nullptr;

  void on_receive_progress(ReceiverSession &, const ProgressSample &p) override {
    progress.push_back(p);
  }
  void on_receive_complete(ReceiverSession &s) override {
    completed++;
    if (reply && s.sequenced())
      reply->send(ChunkFramer(s.transfer_id(), false).encode_control(ControlType::DONE));
  }
  void on_receive_failed(ReceiverSession &, std::error_code ec,
                         const std::string &why) override {
    failed++;
    error = ec;
    reason = why;
  }
  void on_receive_missing(ReceiverSession &s, const ResendMeta &m) override {
    missing++;
    last_missing = m;
    if (reply)
      reply->send(ChunkFramer(s.transfer_id(), false)
                      .encode_control(ControlType::RESEND, encode_resend(m)));
  }
};

// Decodes every frame arriving on `ch` and feeds it to the receiver as if it
// came from `from`.
inline void pipe_into(LoopbackChannel &ch, ReceiverSession &rx, const PeerId &from) {
  ch.on_data([&rx, from](const std::vector<uint8_t> &frame) {
    auto f = ChunkFramer::decode(frame);
    if (f)
      rx.on_frame(from, *f);
  });
}

// Feeds receipts arriving on `ch` back into the sender.
inline void pipe_receipts(LoopbackChannel &ch, SenderSession &tx) {
  ch.on_data([&tx](const std::vector<uint8_t> &frame) {
    auto f = ChunkFramer::decode(frame);
    if (f)
      tx.on_receipt(*f);
  });
}

inline OfferMeta offer_for(const FileSource &src) {
  OfferMeta m;
  m.total = src.size();
  m.name = src.name();
  m.mime = src.mime_type();
  m.sender_name = "alice";
  return m;
}

} // namespace test
} // namespace ferry
