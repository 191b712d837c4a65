
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include "channel.hpp"

namespace ferry {

struct TransferConfig {
    uint32_t direct_chunk_size{32 * 1024};
    uint32_t relay_chunk_size{256 * 1024};
    size_t high_water{16 * 1024 * 1024};
    uint64_t rate_limit{0}; // bytes/s, 0 = unlimited
    std::chrono::milliseconds progress_interval{200};
    std::chrono::milliseconds drain_poll{10};
    std::chrono::milliseconds retry_delay{50};
    size_t consolidate_threshold{50 * 1024 * 1024};
    std::chrono::milliseconds establish_timeout{5000};
    std::chrono::milliseconds offer_timeout{60000};
    std::chrono::milliseconds receive_idle_timeout{30000};
    // Direct (unordered) transfers: END is repeated every confirm_timeout
    // until DONE, at most confirm_attempts times, and at most
    // max_repair_rounds RESEND requests are served before falling back.
    std::chrono::milliseconds confirm_timeout{1000};
    uint32_t confirm_attempts{10};
    uint32_t max_repair_rounds{32};
    bool prefer_direct{true};

    uint32_t chunk_size_for(ChannelKind k) const {
        return k == ChannelKind::Direct ? direct_chunk_size : relay_chunk_size;
    }
};

} // namespace ferry
