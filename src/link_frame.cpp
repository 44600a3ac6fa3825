// ============================================================================
// link_frame.cpp — implementation for link_frame.hpp
// ============================================================================
#include "eomacca/link_frame.hpp"

namespace eomacca {
namespace link {

void build(const uint8_t* payload, size_t n,
           const MacAddress& src, const MacAddress& dst, uint16_t type,
           Bytes& out) {
  out.clear();
  out.reserve(HEADER_SIZE + n);
  put_mac(out, dst);                 // destination comes first on the wire
  put_mac(out, src);
  put_u16(out, type);
  if (n) out.insert(out.end(), payload, payload + n);
}

Status parse(const uint8_t* data, size_t n, Frame& out) {
  out.payload.clear();
  if (n < HEADER_SIZE) return Status::MalformedHeader;

  out.dst  = get_mac(data);
  out.src  = get_mac(data + MAC_LEN);
  out.type = get_u16(data + 2 * MAC_LEN);
  out.payload.assign(data + HEADER_SIZE, data + n);
  return Status::Ok;
}

} // namespace link
} // namespace eomacca
