
#pragma once
#include <string>
#include <system_error>

namespace ferry {

enum class errc {
    empty_file = 1,     // user errors: never reach the network
    no_target,
    busy,
    target_not_found,   // offer errors
    target_busy,
    rejected,
    establish_timeout,  // channel errors
    channel_closed,
    send_failed,
    peer_lost,
    cancelled,
    stalled,
    incomplete,
    integrity,
    io_error
};

} // namespace ferry

namespace std {
template <> struct is_error_code_enum<ferry::errc> : true_type {};
} // namespace std

namespace ferry {

const std::error_category& transfer_category();

inline std::error_code make_error_code(errc e) {
    return {static_cast<int>(e), transfer_category()};
}

// Channel errors are the only ones that may trigger a fallback path.
inline bool is_channel_error(std::error_code ec) {
    return ec == errc::establish_timeout || ec == errc::channel_closed || ec == errc::send_failed;
}

} // namespace ferry
