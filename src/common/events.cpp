
#include "events.hpp"
#include "logging.hpp"
#include <algorithm>

namespace ferry {

namespace {
struct NameOf {
  const char *operator()(const TransferPending &) const {
    return "transferPending";
  }
  const char *operator()(const TransferStarted &) const {
    return "transferStarted";
  }
  const char *operator()(const TransferProgress &) const {
    return "transferProgress";
  }
  const char *operator()(const TransferComplete &) const {
    return "transferComplete";
  }
  const char *operator()(const TransferError &) const {
    return "transferError";
  }
  const char *operator()(const TransferRejected &) const {
    return "transferRejected";
  }
  const char *operator()(const IncomingFile &) const { return "incomingFile"; }
  const char *operator()(const FileReceived &) const { return "fileReceived"; }
  const char *operator()(const ReceiveProgress &) const {
    return "receiveProgress";
  }
};
} // namespace

const char *event_name(const TransferEvent &ev) {
  return std::visit(NameOf{}, ev);
}

EventBus::SubscriptionId EventBus::subscribe(Handler h) {
  SubscriptionId id = next_id_++;
  auto slot = std::make_shared<Slot>();
  slot->id = id;
  slot->handler = std::move(h);
  slots_.push_back(std::move(slot));
  return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
  auto it = std::find_if(
      slots_.begin(), slots_.end(),
      [id](const std::shared_ptr<Slot> &s) { return s->id == id; });
  if (it == slots_.end())
    return;
  // An emission in progress may still hold the slot in its snapshot.
  (*it)->active = false;
  slots_.erase(it);
}

void EventBus::emit(const TransferEvent &ev) {
  Logger::instance().log(LogLevel::TRACE, "event %s", event_name(ev));
  std::vector<std::shared_ptr<Slot>> snapshot(slots_);
  for (auto &s : snapshot) {
    if (s->active && s->handler)
      s->handler(ev);
  }
}

size_t EventBus::size() const { return slots_.size(); }

} // namespace ferry
