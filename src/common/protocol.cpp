
#include "protocol.hpp"
#include <algorithm>
#include <array>

namespace ferry {

uint32_t crc32(const uint8_t *data, size_t len) {
  static const std::array<uint32_t, 256> table = [] {
    std::array<uint32_t, 256> t{};
    for (uint32_t i = 0; i < 256; i++) {
      uint32_t c = i;
      for (int j = 0; j < 8; j++)
        c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
      t[i] = c;
    }
    return t;
  }();
  uint32_t c = ~0u;
  for (size_t i = 0; i < len; i++)
    c = table[(c ^ data[i]) & 0xFF] ^ (c >> 8);
  return ~c;
}

static void store_u32(uint8_t *p, uint32_t v) {
  p[0] = (uint8_t)(v >> 24);
  p[1] = (uint8_t)(v >> 16);
  p[2] = (uint8_t)(v >> 8);
  p[3] = (uint8_t)(v & 0xFF);
}

uint32_t get_u32(const uint8_t *p) {
  return ((uint32_t)p[0] << 24) | ((uint32_t)p[1] << 16) |
         ((uint32_t)p[2] << 8) | (uint32_t)p[3];
}

uint32_t header_crc(const uint8_t *header_bytes) {
  return crc32(header_bytes, kHeaderSize - 4);
}

void write_header(const FrameHeader &h, uint8_t *out) {
  store_u32(out + 0, h.magic);
  out[4] = h.version;
  out[5] = h.kind;
  out[6] = h.flags;
  out[7] = h.control;
  store_u32(out + 8, h.transfer_id);
  store_u32(out + 12, h.payload_len);
  store_u32(out + 16, header_crc(out));
}

FrameHeader read_header(const uint8_t *in) {
  FrameHeader h;
  h.magic = get_u32(in + 0);
  h.version = in[4];
  h.kind = in[5];
  h.flags = in[6];
  h.control = in[7];
  h.transfer_id = get_u32(in + 8);
  h.payload_len = get_u32(in + 12);
  h.header_crc32 = get_u32(in + 16);
  return h;
}

void put_u16(std::vector<uint8_t> &out, uint16_t v) {
  out.push_back((uint8_t)(v >> 8));
  out.push_back((uint8_t)(v & 0xFF));
}

void put_u32(std::vector<uint8_t> &out, uint32_t v) {
  uint8_t b[4];
  store_u32(b, v);
  out.insert(out.end(), b, b + 4);
}

void put_u64(std::vector<uint8_t> &out, uint64_t v) {
  put_u32(out, (uint32_t)(v >> 32));
  put_u32(out, (uint32_t)(v & 0xFFFFFFFFu));
}

void put_str16(std::vector<uint8_t> &out, const std::string &s) {
  uint16_t n = (uint16_t)std::min<size_t>(s.size(), 0xFFFF);
  put_u16(out, n);
  out.insert(out.end(), s.begin(), s.begin() + n);
}

void put_bytes8(std::vector<uint8_t> &out, const std::vector<uint8_t> &b) {
  uint8_t n = (uint8_t)std::min<size_t>(b.size(), 0xFF);
  out.push_back(n);
  out.insert(out.end(), b.begin(), b.begin() + n);
}

bool MetaReader::need(size_t n) {
  if (!ok_ || (size_t)(end_ - p_) < n) {
    ok_ = false;
    return false;
  }
  return true;
}

uint8_t MetaReader::u8() {
  if (!need(1))
    return 0;
  return *p_++;
}

uint16_t MetaReader::u16() {
  if (!need(2))
    return 0;
  uint16_t v = (uint16_t)((p_[0] << 8) | p_[1]);
  p_ += 2;
  return v;
}

uint32_t MetaReader::u32() {
  if (!need(4))
    return 0;
  uint32_t v = get_u32(p_);
  p_ += 4;
  return v;
}

uint64_t MetaReader::u64() {
  uint64_t hi = u32();
  uint64_t lo = u32();
  return (hi << 32) | lo;
}

std::string MetaReader::str16() {
  uint16_t n = u16();
  if (!need(n))
    return {};
  std::string s((const char *)p_, n);
  p_ += n;
  return s;
}

std::vector<uint8_t> MetaReader::bytes8() {
  uint8_t n = u8();
  if (!need(n))
    return {};
  std::vector<uint8_t> b(p_, p_ + n);
  p_ += n;
  return b;
}

} // namespace ferry
