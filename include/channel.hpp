
#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <system_error>
#include <vector>

namespace ferry {

// Stable for the lifetime of one connection; never reused after a disconnect.
using PeerId = std::string;

enum class ChannelKind : uint8_t { Direct, Relay };

enum class SendStatus { Ok, WouldBlock, Closed };

inline const char* channel_kind_name(ChannelKind k) {
    return k == ChannelKind::Direct ? "direct" : "relay";
}

// Uniform contract over one concrete duplex channel. Implementations invoke
// their handlers on the io_context thread that owns them.
class ChannelAdapter {
public:
    using DataHandler = std::function<void(const std::vector<uint8_t>& frame)>;
    using ClosedHandler = std::function<void(std::error_code)>;
    using DrainHandler = std::function<void()>;

    virtual ~ChannelAdapter() = default;

    virtual ChannelKind kind() const = 0;
    // False when frames may arrive out of order, duplicated or not at all.
    virtual bool ordered() const = 0;

    // Queues one whole frame. The frame is moved from only on Ok, so a
    // caller may retry the same buffer after WouldBlock.
    virtual SendStatus send(std::vector<uint8_t>&& frame) = 0;
    // Bytes accepted by send() that have not yet left the process.
    virtual size_t buffered_bytes() const = 0;

    virtual void on_data(DataHandler h) = 0;
    virtual void on_closed(ClosedHandler h) = 0;
    // One-shot buffered-amount-low notification. Returns false when the
    // adapter cannot signal it, in which case callers poll buffered_bytes().
    virtual bool notify_when_drained(DrainHandler h) { (void)h; return false; }

    // Idempotent.
    virtual void close() = 0;
    virtual bool is_open() const = 0;

    virtual std::string describe() const { return channel_kind_name(kind()); }
};

} // namespace ferry
