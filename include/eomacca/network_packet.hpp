/**
 * @file network_packet.hpp
 * @brief Network-packet layer: IPv4-shaped header with a self-describing length.
 *
 * Header layout (20 bytes, options never emitted):
 *
 * | Offset | Size | Field                                   | Built value          |
 * |--------|------|-----------------------------------------|----------------------|
 * | 0      | 1    | version (hi nibble) / IHL (lo nibble)   | 0x45                 |
 * | 1      | 1    | type of service                         | 0                    |
 * | 2      | 2    | total length                            | 20 + n, or 0 if > 16 bit |
 * | 4      | 2    | identification                          | 1                    |
 * | 6      | 2    | flags / fragment offset                 | 0                    |
 * | 8      | 1    | time to live                            | 64                   |
 * | 9      | 1    | protocol (next-layer indicator)         | caller, default TCP  |
 * | 10     | 2    | header checksum                         | computed             |
 * | 12     | 4    | source address                          | caller               |
 * | 16     | 4    | destination address                     | caller               |
 *
 * The payload offset is always IHL * 4; a received packet with options is
 * accepted and the options are skipped. The total length and checksum are
 * informational on parse: payload = every byte after the header.
 */
#ifndef EOMACCA_NETWORK_PACKET_HPP
#define EOMACCA_NETWORK_PACKET_HPP

#include "eomacca/status.hpp"
#include "eomacca/wire.hpp"

namespace eomacca {
namespace network {

static constexpr size_t  HEADER_SIZE   = 20;
static constexpr uint8_t VERSION       = 4;
static constexpr uint8_t PROTO_TCP     = 6;
static constexpr uint8_t DEFAULT_TTL   = 64;
static constexpr uint16_t DEFAULT_ID   = 1;

struct Packet {
  uint8_t     header_len = 0;  ///< bytes (IHL * 4)
  uint16_t    total_len  = 0;  ///< as found on the wire
  uint16_t    id         = 0;
  uint8_t     ttl        = 0;
  uint8_t     protocol   = 0;
  uint16_t    checksum   = 0;
  Ipv4Address src        = 0;
  Ipv4Address dst        = 0;
  Bytes       payload;
};

/// RFC 1071 ones'-complement sum over @p n bytes (header checksum).
uint16_t checksum(const uint8_t* data, size_t n);

/// Write header + payload into @p out (cleared first). Cannot fail.
void build(const uint8_t* payload, size_t n,
           Ipv4Address src, Ipv4Address dst, uint8_t protocol,
           Bytes& out);

inline void build(const Bytes& payload, Ipv4Address src, Ipv4Address dst,
                  Bytes& out, uint8_t protocol = PROTO_TCP) {
  build(payload.data(), payload.size(), src, dst, protocol, out);
}

/**
 * @brief Parse a packet and locate its payload.
 *
 * @return
 *  - MalformedHeader    fewer than 20 bytes, version != 4, or IHL < 5
 *  - MissingPayload     IHL * 4 exceeds the input length
 *  - UnexpectedProtocol protocol field != @p expected_protocol
 *  - Ok                 @p out filled; payload may be empty
 */
Status parse(const uint8_t* data, size_t n, uint8_t expected_protocol, Packet& out);

inline Status parse(const Bytes& in, Packet& out, uint8_t expected_protocol = PROTO_TCP) {
  return parse(in.data(), in.size(), expected_protocol, out);
}

} // namespace network
} // namespace eomacca

#endif // EOMACCA_NETWORK_PACKET_HPP
