// ============================================================================
// transport_segment.cpp — implementation for transport_segment.hpp
// ============================================================================
#include "eomacca/transport_segment.hpp"

namespace eomacca {
namespace transport {

void build(const uint8_t* payload, size_t n,
           uint16_t src_port, uint16_t dst_port,
           uint8_t flags, uint32_t seq, uint32_t ack,
           Bytes& out) {
  out.clear();
  out.reserve(HEADER_SIZE + n);

  put_u16(out, src_port);
  put_u16(out, dst_port);
  put_u32(out, seq);
  put_u32(out, ack);
  put_u8(out, static_cast<uint8_t>((HEADER_SIZE / 4) << 4));  // data offset, reserved bits 0
  put_u8(out, flags);
  put_u16(out, DEFAULT_WINDOW);
  put_u16(out, 0);                                              // checksum
  put_u16(out, 0);                                              // urgent pointer

  if (n) out.insert(out.end(), payload, payload + n);
}

Status parse(const uint8_t* data, size_t n, Segment& out) {
  out.payload.clear();
  if (n < HEADER_SIZE) return Status::MalformedHeader;

  const size_t header_len = static_cast<size_t>(data[12] >> 4) * 4;
  if (header_len < HEADER_SIZE || header_len > n) return Status::MalformedHeader;

  out.src_port   = get_u16(data);
  out.dst_port   = get_u16(data + 2);
  out.seq        = get_u32(data + 4);
  out.ack        = get_u32(data + 8);
  out.header_len = static_cast<uint8_t>(header_len);
  out.flags      = data[13];
  out.window     = get_u16(data + 14);

  if (header_len == n) return Status::MissingPayload;

  out.payload.assign(data + header_len, data + n);
  return Status::Ok;
}

} // namespace transport
} // namespace eomacca
