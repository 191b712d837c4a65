
#include "framer.hpp"
#include <cstring>

namespace ferry {

// Upper bound accepted from the wire; larger lengths are treated as garbage.
static constexpr uint32_t kMaxPayload = 64u * 1024 * 1024;

std::vector<uint8_t> make_frame(FrameKind kind, ControlType control,
                                uint32_t transfer_id, uint8_t flags,
                                const std::vector<uint8_t> &payload) {
  FrameHeader h;
  h.kind = (uint8_t)kind;
  h.flags = flags;
  h.control = (uint8_t)control;
  h.transfer_id = transfer_id;
  h.payload_len = (uint32_t)payload.size();
  std::vector<uint8_t> buf(kHeaderSize + payload.size());
  write_header(h, buf.data());
  if (!payload.empty())
    std::memcpy(buf.data() + kHeaderSize, payload.data(), payload.size());
  return buf;
}

std::vector<uint8_t> ChunkFramer::encode_data(const uint8_t *data, size_t len,
                                              uint32_t seq) const {
  FrameHeader h;
  h.kind = (uint8_t)FrameKind::Data;
  h.flags = sequenced_ ? FF_SEQUENCED : 0;
  h.transfer_id = transfer_id_;
  size_t prefix = sequenced_ ? kSeqPrefixSize : 0;
  h.payload_len = (uint32_t)(prefix + len);

  std::vector<uint8_t> buf(kHeaderSize + prefix + len);
  write_header(h, buf.data());
  if (sequenced_) {
    uint8_t *p = buf.data() + kHeaderSize;
    p[0] = (uint8_t)(seq >> 24);
    p[1] = (uint8_t)(seq >> 16);
    p[2] = (uint8_t)(seq >> 8);
    p[3] = (uint8_t)(seq & 0xFF);
  }
  if (len)
    std::memcpy(buf.data() + kHeaderSize + prefix, data, len);
  return buf;
}

std::vector<uint8_t>
ChunkFramer::encode_control(ControlType t,
                            const std::vector<uint8_t> &meta) const {
  return make_frame(FrameKind::Control, t, transfer_id_,
                    sequenced_ ? FF_SEQUENCED : 0, meta);
}

static bool header_valid(const FrameHeader &h, const uint8_t *raw) {
  if (h.magic != kMagic || h.version != kVersion)
    return false;
  if (h.kind != (uint8_t)FrameKind::Data &&
      h.kind != (uint8_t)FrameKind::Control)
    return false;
  if (h.payload_len > kMaxPayload)
    return false;
  return h.header_crc32 == header_crc(raw);
}

std::optional<DecodedFrame> ChunkFramer::decode(const uint8_t *data,
                                                size_t len) {
  if (len < kHeaderSize)
    return std::nullopt;
  FrameHeader h = read_header(data);
  if (!header_valid(h, data) || len != kHeaderSize + h.payload_len)
    return std::nullopt;

  DecodedFrame f;
  f.kind = (FrameKind)h.kind;
  f.transfer_id = h.transfer_id;
  f.sequenced = (h.flags & FF_SEQUENCED) != 0;
  const uint8_t *body = data + kHeaderSize;
  size_t body_len = h.payload_len;

  if (f.kind == FrameKind::Control) {
    f.control = (ControlType)h.control;
    if (f.control == ControlType::NONE)
      return std::nullopt;
  } else if (h.flags & FF_SEQUENCED) {
    if (body_len < kSeqPrefixSize)
      return std::nullopt;
    f.seq = get_u32(body);
    body += kSeqPrefixSize;
    body_len -= kSeqPrefixSize;
  }
  f.payload.assign(body, body + body_len);
  return f;
}

size_t ChunkFramer::next_in_stream(const std::vector<uint8_t> &buf,
                                   size_t &off) {
  while (buf.size() - off >= kHeaderSize) {
    FrameHeader h = read_header(buf.data() + off);
    if (!header_valid(h, buf.data() + off)) {
      off += 1;
      continue;
    }
    size_t need = kHeaderSize + h.payload_len;
    if (buf.size() - off < need)
      return 0;
    return need;
  }
  return 0;
}

std::vector<uint8_t> encode_start(const StartMeta &m) {
  std::vector<uint8_t> out;
  put_u64(out, m.total);
  put_u32(out, m.chunk_size);
  put_str16(out, m.name);
  put_str16(out, m.mime);
  return out;
}

std::vector<uint8_t> encode_end(const EndMeta &m) {
  std::vector<uint8_t> out;
  put_u32(out, m.chunk_count);
  put_bytes8(out, m.digest);
  return out;
}

std::vector<uint8_t> encode_reason(const std::string &reason) {
  std::vector<uint8_t> out;
  put_str16(out, reason);
  return out;
}

std::vector<uint8_t> encode_resend(const ResendMeta &m) {
  std::vector<uint8_t> out;
  size_t n = m.seqs.size() < kMaxResendBatch ? m.seqs.size() : kMaxResendBatch;
  out.reserve(5 + n * 4);
  out.push_back(m.need_start ? 1 : 0);
  put_u32(out, (uint32_t)n);
  for (size_t i = 0; i < n; i++)
    put_u32(out, m.seqs[i]);
  return out;
}

std::vector<uint8_t> encode_offer(const OfferMeta &m) {
  std::vector<uint8_t> out;
  put_u64(out, m.total);
  put_str16(out, m.name);
  put_str16(out, m.mime);
  put_str16(out, m.sender_name);
  return out;
}

std::vector<uint8_t> encode_peer(const PeerMeta &m) {
  std::vector<uint8_t> out;
  put_str16(out, m.peer_id);
  put_str16(out, m.name);
  put_u16(out, m.udp_port);
  return out;
}

std::optional<StartMeta> decode_start(const std::vector<uint8_t> &meta) {
  MetaReader r(meta.data(), meta.size());
  StartMeta m;
  m.total = r.u64();
  m.chunk_size = r.u32();
  m.name = r.str16();
  m.mime = r.str16();
  if (!r.ok())
    return std::nullopt;
  return m;
}

std::optional<EndMeta> decode_end(const std::vector<uint8_t> &meta) {
  MetaReader r(meta.data(), meta.size());
  EndMeta m;
  m.chunk_count = r.u32();
  m.digest = r.bytes8();
  if (!r.ok())
    return std::nullopt;
  return m;
}

std::string decode_reason(const std::vector<uint8_t> &meta) {
  MetaReader r(meta.data(), meta.size());
  std::string s = r.str16();
  return r.ok() ? s : std::string();
}

std::optional<ResendMeta> decode_resend(const std::vector<uint8_t> &meta) {
  MetaReader r(meta.data(), meta.size());
  ResendMeta m;
  m.need_start = (r.u8() & 1) != 0;
  uint32_t n = r.u32();
  if (!r.ok() || n > kMaxResendBatch)
    return std::nullopt;
  m.seqs.reserve(n);
  for (uint32_t i = 0; i < n; i++)
    m.seqs.push_back(r.u32());
  if (!r.ok())
    return std::nullopt;
  return m;
}

std::optional<OfferMeta> decode_offer(const std::vector<uint8_t> &meta) {
  MetaReader r(meta.data(), meta.size());
  OfferMeta m;
  m.total = r.u64();
  m.name = r.str16();
  m.mime = r.str16();
  m.sender_name = r.str16();
  if (!r.ok())
    return std::nullopt;
  return m;
}

std::optional<PeerMeta> decode_peer(const std::vector<uint8_t> &meta) {
  MetaReader r(meta.data(), meta.size());
  PeerMeta m;
  m.peer_id = r.str16();
  m.name = r.str16();
  m.udp_port = r.u16();
  if (!r.ok() || m.peer_id.empty())
    return std::nullopt;
  return m;
}

} // namespace ferry
