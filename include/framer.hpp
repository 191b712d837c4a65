
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "protocol.hpp"

namespace ferry {

struct StartMeta {
    uint64_t total{0};
    uint32_t chunk_size{0};
    std::string name;
    std::string mime;
};

struct EndMeta {
    uint32_t chunk_count{0};
    std::vector<uint8_t> digest;
};

// Receiver to sender on unordered channels: chunks still missing after END,
// and whether START never arrived.
struct ResendMeta {
    bool need_start{false};
    std::vector<uint32_t> seqs;
};

// Upper bound on the indices one RESEND carries; the rest are asked for on
// the next END.
constexpr size_t kMaxResendBatch = 4096;

struct OfferMeta {
    uint64_t total{0};
    std::string name;
    std::string mime;
    std::string sender_name;
};

// HELLO, PROBE and PROBE_ACK all carry the speaker's identity. udp_port is
// where the speaker accepts direct datagrams, 0 when it does not.
struct PeerMeta {
    std::string peer_id;
    std::string name;
    uint16_t udp_port{0};
};

struct DecodedFrame {
    FrameKind kind{FrameKind::Data};
    ControlType control{ControlType::NONE};
    uint32_t transfer_id{0};
    // Set on every frame a sequencing framer produced, control included.
    bool sequenced{false};
    std::optional<uint32_t> seq;
    std::vector<uint8_t> payload; // data bytes, or the raw control metadata
};

// Splits payloads into frames and back. A framer is bound to one transfer id
// and to whether its channel needs explicit sequencing.
class ChunkFramer {
public:
    ChunkFramer(uint32_t transfer_id, bool sequenced)
        : transfer_id_(transfer_id), sequenced_(sequenced) {}

    std::vector<uint8_t> encode_data(const uint8_t* data, size_t len, uint32_t seq) const;
    std::vector<uint8_t> encode_control(ControlType t, const std::vector<uint8_t>& meta = {}) const;

    uint32_t transfer_id() const { return transfer_id_; }
    bool sequenced() const { return sequenced_; }

    // Parses exactly one frame occupying [data, data+len).
    static std::optional<DecodedFrame> decode(const uint8_t* data, size_t len);
    static std::optional<DecodedFrame> decode(const std::vector<uint8_t>& frame) {
        return decode(frame.data(), frame.size());
    }

    // Finds the next complete frame in a byte stream starting at `off`.
    // Skips garbage (advancing `off`) until a valid header is found; returns
    // the total frame length, or 0 when more bytes are needed.
    static size_t next_in_stream(const std::vector<uint8_t>& buf, size_t& off);

private:
    uint32_t transfer_id_;
    bool sequenced_;
};

std::vector<uint8_t> make_frame(FrameKind kind, ControlType control, uint32_t transfer_id,
                                uint8_t flags, const std::vector<uint8_t>& payload);

std::vector<uint8_t> encode_start(const StartMeta& m);
std::vector<uint8_t> encode_end(const EndMeta& m);
std::vector<uint8_t> encode_reason(const std::string& reason);
std::vector<uint8_t> encode_resend(const ResendMeta& m);
std::vector<uint8_t> encode_offer(const OfferMeta& m);
std::vector<uint8_t> encode_peer(const PeerMeta& m);

std::optional<StartMeta> decode_start(const std::vector<uint8_t>& meta);
std::optional<EndMeta> decode_end(const std::vector<uint8_t>& meta);
std::string decode_reason(const std::vector<uint8_t>& meta);
std::optional<ResendMeta> decode_resend(const std::vector<uint8_t>& meta);
std::optional<OfferMeta> decode_offer(const std::vector<uint8_t>& meta);
std::optional<PeerMeta> decode_peer(const std::vector<uint8_t>& meta);

} // namespace ferry
