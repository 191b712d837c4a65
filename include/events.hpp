
#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <variant>
#include <vector>
#include "channel.hpp"

namespace ferry {

struct TransferPending {
    PeerId peer;
    std::string file_name;
    uint64_t total{0};
};

struct TransferStarted {
    PeerId peer;
    std::string file_name;
    uint64_t total{0};
    ChannelKind channel{ChannelKind::Relay};
};

struct TransferProgress {
    PeerId peer;
    int percent{0};
    double speed{0};
    uint64_t done{0};
    uint64_t total{0};
    uint64_t eta_s{0};
};

struct TransferComplete {
    PeerId peer;
    std::string file_name;
};

struct TransferError {
    PeerId peer;
    std::error_code code;
    std::string reason;
};

struct TransferRejected {
    PeerId peer;
    std::error_code code; // target_busy or rejected
    std::string reason;
};

struct IncomingFile {
    PeerId peer;
    std::string sender_name;
    std::string file_name;
    uint64_t file_size{0};
    std::string mime_type;
};

struct FileReceived {
    PeerId peer;
    std::string file_name;
    // Set when the payload was kept in memory.
    std::shared_ptr<const std::vector<uint8_t>> payload;
    // Set when the payload was written to disk.
    std::string path;
    uint64_t size{0};
};

struct ReceiveProgress {
    PeerId peer;
    int percent{0};
    double speed{0};
    uint64_t done{0};
    uint64_t total{0};
    uint64_t eta_s{0};
};

using TransferEvent = std::variant<TransferPending, TransferStarted, TransferProgress,
                                   TransferComplete, TransferError, TransferRejected,
                                   IncomingFile, FileReceived, ReceiveProgress>;

const char* event_name(const TransferEvent& ev);

// Synchronous observer list. Handlers run in registration order on the
// emitting thread; a handler removed during an emission is skipped for the
// rest of it, and one added during an emission first sees the next event.
class EventBus {
public:
    using Handler = std::function<void(const TransferEvent&)>;
    using SubscriptionId = size_t;

    SubscriptionId subscribe(Handler h);
    void unsubscribe(SubscriptionId id);
    void emit(const TransferEvent& ev);
    size_t size() const;

private:
    struct Slot {
        SubscriptionId id;
        Handler handler;
        bool active{true};
    };
    std::vector<std::shared_ptr<Slot>> slots_;
    SubscriptionId next_id_{1};
};

} // namespace ferry
