
#include "digest.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <sodium.h>

namespace ferry {

struct PayloadDigest::State {
  crypto_generichash_state h;
};

bool init_sodium() {
  static const bool ok = [] {
    if (sodium_init() < 0) {
      Logger::instance().log(LogLevel::ERROR, "sodium_init failed");
      return false;
    }
    return true;
  }();
  return ok;
}

PayloadDigest::PayloadDigest() : st_(new State) {
  init_sodium();
  reset();
}

PayloadDigest::~PayloadDigest() = default;

void PayloadDigest::reset() {
  crypto_generichash_init(&st_->h, nullptr, 0, kDigestSize);
  finished_ = false;
}

void PayloadDigest::update(const uint8_t *data, size_t len) {
  if (finished_ || len == 0)
    return;
  crypto_generichash_update(&st_->h, data, len);
}

std::vector<uint8_t> PayloadDigest::finish() {
  std::vector<uint8_t> out(kDigestSize);
  if (finished_)
    return {};
  crypto_generichash_final(&st_->h, out.data(), out.size());
  finished_ = true;
  return out;
}

uint32_t random_transfer_id() {
  init_sodium();
  // 0 is reserved for frames that do not belong to a transfer.
  return randombytes_uniform(0xFFFFFFFEu) + 1;
}

std::string random_peer_id() {
  init_sodium();
  uint8_t buf[8];
  randombytes_buf(buf, sizeof(buf));
  return bytes_to_hex(buf, sizeof(buf));
}

} // namespace ferry
