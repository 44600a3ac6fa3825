/**
 * @file link_frame.hpp
 * @brief Link-frame layer: minimal hardware-addressed frame (outermost and innermost wrap).
 *
 * Layout (14-byte header, no trailer, no minimum size padding):
 *
 * | Offset | Size | Field                         |
 * |--------|------|-------------------------------|
 * | 0      | 6    | destination hardware address  |
 * | 6      | 6    | source hardware address       |
 * | 12     | 2    | type field (big endian)       |
 * | 14     | n    | payload                       |
 *
 * `parse()` only strips the header. The type field is reported back but not
 * checked: the inner frame carries `TYPE_LOOPBACK`, the outer one `TYPE_IPV4`,
 * and the next layer validates whatever it finds.
 */
#ifndef EOMACCA_LINK_FRAME_HPP
#define EOMACCA_LINK_FRAME_HPP

#include "eomacca/status.hpp"
#include "eomacca/wire.hpp"

namespace eomacca {
namespace link {

static constexpr size_t   HEADER_SIZE   = 14;
static constexpr uint16_t TYPE_IPV4     = 0x0800;
static constexpr uint16_t TYPE_LOOPBACK = 0x9000;

struct Frame {
  MacAddress dst{};
  MacAddress src{};
  uint16_t   type = 0;
  Bytes      payload;
};

/// Write header + @p n payload bytes into @p out (cleared first). Cannot fail.
void build(const uint8_t* payload, size_t n,
           const MacAddress& src, const MacAddress& dst, uint16_t type,
           Bytes& out);

inline void build(const Bytes& payload,
                  const MacAddress& src, const MacAddress& dst, uint16_t type,
                  Bytes& out) {
  build(payload.data(), payload.size(), src, dst, type, out);
}

/**
 * @brief Split a frame into header fields and payload.
 * @return Ok, or MalformedHeader if @p n < HEADER_SIZE. An exactly-14-byte
 *         input is valid and yields an empty payload.
 */
Status parse(const uint8_t* data, size_t n, Frame& out);

inline Status parse(const Bytes& in, Frame& out) { return parse(in.data(), in.size(), out); }

} // namespace link
} // namespace eomacca

#endif // EOMACCA_LINK_FRAME_HPP
