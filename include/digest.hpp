
#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ferry {

constexpr size_t kDigestSize = 32;

// Calls sodium_init() once; returns false when libsodium cannot be used.
bool init_sodium();

// Incremental BLAKE2b-256 over a payload, fed in transfer order.
class PayloadDigest {
public:
    PayloadDigest();
    ~PayloadDigest();
    PayloadDigest(const PayloadDigest&) = delete;
    PayloadDigest& operator=(const PayloadDigest&) = delete;

    void update(const uint8_t* data, size_t len);
    std::vector<uint8_t> finish();
    void reset();
private:
    struct State;
    std::unique_ptr<State> st_;
    bool finished_{false};
};

uint32_t random_transfer_id();
std::string random_peer_id();

} // namespace ferry
