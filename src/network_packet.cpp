// ============================================================================
// network_packet.cpp — implementation for network_packet.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================
#include "eomacca/network_packet.hpp"

namespace eomacca {
namespace network {

static constexpr size_t OFF_TOTAL_LEN = 2;
static constexpr size_t OFF_CHECKSUM  = 10;

uint16_t checksum(const uint8_t* data, size_t n) {
  uint32_t sum = 0;
  size_t i = 0;
  for (; i + 1 < n; i += 2) sum += get_u16(data + i);
  if (i < n) sum += static_cast<uint32_t>(data[i]) << 8;  // odd tail, zero padded
  while (sum >> 16) sum = (sum & 0xFFFF) + (sum >> 16);   // fold carries
  return static_cast<uint16_t>(~sum & 0xFFFF);
}

void build(const uint8_t* payload, size_t n,
           Ipv4Address src, Ipv4Address dst, uint8_t protocol,
           Bytes& out) {
  out.clear();
  out.reserve(HEADER_SIZE + n);

  const size_t total = HEADER_SIZE + n;

  put_u8(out, static_cast<uint8_t>((VERSION << 4) | (HEADER_SIZE / 4)));
  put_u8(out, 0);                                   // type of service
  put_u16(out, total <= 0xFFFF ? static_cast<uint16_t>(total) : 0);
  put_u16(out, DEFAULT_ID);
  put_u16(out, 0);                                  // flags / fragment offset
  put_u8(out, DEFAULT_TTL);
  put_u8(out, protocol);
  put_u16(out, 0);                                  // checksum placeholder
  put_u32(out, src);
  put_u32(out, dst);

  patch_u16(out, OFF_CHECKSUM, checksum(out.data(), HEADER_SIZE));

  if (n) out.insert(out.end(), payload, payload + n);
}

Status parse(const uint8_t* data, size_t n, uint8_t expected_protocol, Packet& out) {
  out.payload.clear();
  if (n < HEADER_SIZE) return Status::MalformedHeader;

  const uint8_t version = data[0] >> 4;
  const uint8_t ihl     = data[0] & 0x0F;
  if (version != VERSION || ihl < 5) return Status::MalformedHeader;

  const size_t header_len = static_cast<size_t>(ihl) * 4;
  if (header_len > n) return Status::MissingPayload;

  out.header_len = static_cast<uint8_t>(header_len);
  out.total_len  = get_u16(data + OFF_TOTAL_LEN);
  out.id         = get_u16(data + 4);
  out.ttl        = data[8];
  out.protocol   = data[9];
  out.checksum   = get_u16(data + OFF_CHECKSUM);
  out.src        = get_u32(data + 12);
  out.dst        = get_u32(data + 16);

  if (out.protocol != expected_protocol) return Status::UnexpectedProtocol;

  out.payload.assign(data + header_len, data + n);
  return Status::Ok;
}

} // namespace network
} // namespace eomacca
