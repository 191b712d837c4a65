
#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace ferry {

constexpr uint32_t kMagic = 0x46525259; // 'FRRY'
constexpr uint8_t  kVersion = 1;
constexpr size_t   kHeaderSize = 20;
constexpr size_t   kSeqPrefixSize = 4;

enum class FrameKind : uint8_t { Data = 1, Control = 2 };

enum FrameFlags : uint8_t {
    FF_SEQUENCED = 0x01
};

enum class ControlType : uint8_t {
    NONE      = 0,
    START     = 1,
    END       = 2,
    CANCEL    = 3,
    RESEND    = 4,
    DONE      = 5,
    HELLO     = 16,
    OFFER     = 17,
    ACCEPT    = 18,
    REJECT    = 19,
    PROBE     = 20,
    PROBE_ACK = 21
};

// Control types that belong to a transfer (routed to sessions); the rest
// are signaling and channel-establishment messages.
inline bool is_data_plane(ControlType t) {
    return t == ControlType::START || t == ControlType::END || t == ControlType::CANCEL ||
           t == ControlType::RESEND || t == ControlType::DONE;
}

// On the wire every field is big-endian; see write_header/read_header.
struct FrameHeader {
    uint32_t magic{kMagic};
    uint8_t  version{kVersion};
    uint8_t  kind{0};
    uint8_t  flags{0};
    uint8_t  control{0};
    uint32_t transfer_id{0};
    uint32_t payload_len{0};
    uint32_t header_crc32{0};
};

void write_header(const FrameHeader& h, uint8_t* out);
FrameHeader read_header(const uint8_t* in);
uint32_t header_crc(const uint8_t* header_bytes);

uint32_t crc32(const uint8_t* data, size_t len);

void put_u16(std::vector<uint8_t>& out, uint16_t v);
void put_u32(std::vector<uint8_t>& out, uint32_t v);
void put_u64(std::vector<uint8_t>& out, uint64_t v);
uint32_t get_u32(const uint8_t* p);

// Cursor over a control payload. Every getter fails soft: once a read runs
// past the end, ok() turns false and later reads return zero values.
class MetaReader {
public:
    MetaReader(const uint8_t* data, size_t len) : p_(data), end_(data + len) {}
    uint8_t u8();
    uint16_t u16();
    uint32_t u32();
    uint64_t u64();
    std::string str16();
    std::vector<uint8_t> bytes8();
    bool ok() const { return ok_; }
private:
    bool need(size_t n);
    const uint8_t* p_;
    const uint8_t* end_;
    bool ok_{true};
};

void put_str16(std::vector<uint8_t>& out, const std::string& s);
void put_bytes8(std::vector<uint8_t>& out, const std::vector<uint8_t>& b);

} // namespace ferry
