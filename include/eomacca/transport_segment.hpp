/**
 * @file transport_segment.hpp
 * @brief Transport-segment layer: TCP-shaped header (ports, sequence numbers, flags).
 *
 * Header layout (20 bytes, options never emitted):
 *
 * | Offset | Size | Field                                 |
 * |--------|------|---------------------------------------|
 * | 0      | 2    | source port                           |
 * | 2      | 2    | destination port                      |
 * | 4      | 4    | sequence number                       |
 * | 8      | 4    | acknowledgment number                 |
 * | 12     | 1    | data offset (hi nibble, 32-bit words) |
 * | 13     | 1    | flags (FIN..URG)                      |
 * | 14     | 2    | window                                |
 * | 16     | 2    | checksum (always 0, no pseudo-header) |
 * | 18     | 2    | urgent pointer                        |
 *
 * A segment without payload is a parse failure: every EoMacca segment carries
 * the layer above it.
 */
#ifndef EOMACCA_TRANSPORT_SEGMENT_HPP
#define EOMACCA_TRANSPORT_SEGMENT_HPP

#include "eomacca/status.hpp"
#include "eomacca/wire.hpp"

namespace eomacca {
namespace transport {

static constexpr size_t   HEADER_SIZE    = 20;
static constexpr uint16_t DEFAULT_WINDOW = 8192;

// Flag bits
static constexpr uint8_t FLAG_FIN = 0x01;
static constexpr uint8_t FLAG_SYN = 0x02;
static constexpr uint8_t FLAG_RST = 0x04;
static constexpr uint8_t FLAG_PSH = 0x08;
static constexpr uint8_t FLAG_ACK = 0x10;
static constexpr uint8_t FLAG_URG = 0x20;

static constexpr uint8_t FLAGS_PUSH_ACK = FLAG_PSH | FLAG_ACK;

struct Segment {
  uint16_t src_port   = 0;
  uint16_t dst_port   = 0;
  uint32_t seq        = 0;
  uint32_t ack        = 0;
  uint8_t  header_len = 0;   ///< bytes (data offset * 4)
  uint8_t  flags      = 0;
  uint16_t window     = 0;
  Bytes    payload;
};

/// Write header + payload into @p out (cleared first). Cannot fail.
void build(const uint8_t* payload, size_t n,
           uint16_t src_port, uint16_t dst_port,
           uint8_t flags, uint32_t seq, uint32_t ack,
           Bytes& out);

inline void build(const Bytes& payload, uint16_t src_port, uint16_t dst_port,
                  uint8_t flags, uint32_t seq, uint32_t ack, Bytes& out) {
  build(payload.data(), payload.size(), src_port, dst_port, flags, seq, ack, out);
}

/**
 * @brief Parse a segment and locate its payload.
 *
 * @return
 *  - MalformedHeader  fewer than 20 bytes, data offset < 5, or data offset * 4 > n
 *  - MissingPayload   no bytes follow the header
 *  - Ok               @p out filled
 */
Status parse(const uint8_t* data, size_t n, Segment& out);

inline Status parse(const Bytes& in, Segment& out) { return parse(in.data(), in.size(), out); }

} // namespace transport
} // namespace eomacca

#endif // EOMACCA_TRANSPORT_SEGMENT_HPP
