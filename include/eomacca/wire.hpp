/**
 * @file wire.hpp
 * @brief Byte buffer type, big-endian field access and address text forms.
 *
 * Every layer header in EoMacca is written in network byte order. The helpers
 * here append fields to a `Bytes` buffer (`put_*`) or read them from a raw
 * pointer that the caller has already bounds-checked (`get_*`).
 *
 * Addresses:
 *  - `MacAddress` is a 6-byte hardware address, text form "aa:bb:cc:dd:ee:ff".
 *  - `Ipv4Address` is a host-order `uint32_t`, text form "10.255.255.1".
 *
 * The text parsers return false on anything that is not exactly the canonical
 * form (no trailing junk, every octet in range).
 */
#ifndef EOMACCA_WIRE_HPP
#define EOMACCA_WIRE_HPP

#include "etl/array.h"
#include "etl/string.h"
#include <stdint.h>
#include <stddef.h>
#include <vector>

namespace eomacca {

using Bytes = std::vector<uint8_t>;

static constexpr size_t MAC_LEN = 6;

using MacAddress  = etl::array<uint8_t, MAC_LEN>;
using Ipv4Address = uint32_t;

using MacText  = etl::string<17>;  ///< "aa:bb:cc:dd:ee:ff"
using Ipv4Text = etl::string<15>;  ///< "255.255.255.255"

// -------- append (big-endian) --------

inline void put_u8(Bytes& b, uint8_t v) { b.push_back(v); }

inline void put_u16(Bytes& b, uint16_t v) {
  b.push_back(static_cast<uint8_t>(v >> 8));
  b.push_back(static_cast<uint8_t>(v & 0xFF));
}

inline void put_u32(Bytes& b, uint32_t v) {
  b.push_back(static_cast<uint8_t>(v >> 24));
  b.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
  b.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
  b.push_back(static_cast<uint8_t>(v & 0xFF));
}

inline void put_mac(Bytes& b, const MacAddress& m) {
  b.insert(b.end(), m.begin(), m.end());
}

/// Overwrite a 16-bit field at @p off (used for lengths and checksums filled in late).
inline void patch_u16(Bytes& b, size_t off, uint16_t v) {
  b[off]     = static_cast<uint8_t>(v >> 8);
  b[off + 1] = static_cast<uint8_t>(v & 0xFF);
}

// -------- read (caller guarantees bounds) --------

inline uint16_t get_u16(const uint8_t* p) {
  return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

inline uint32_t get_u32(const uint8_t* p) {
  return (static_cast<uint32_t>(p[0]) << 24) |
         (static_cast<uint32_t>(p[1]) << 16) |
         (static_cast<uint32_t>(p[2]) << 8)  |
          static_cast<uint32_t>(p[3]);
}

inline MacAddress get_mac(const uint8_t* p) {
  MacAddress m;
  for (size_t i = 0; i < MAC_LEN; ++i) m[i] = p[i];
  return m;
}

// -------- address text --------

/// Parse "aa:bb:cc:dd:ee:ff" (hex digits in either case). False on any deviation.
bool parse_mac(const char* text, MacAddress& out);

/// Parse dotted-quad "a.b.c.d" with each octet 0..255. False on any deviation.
bool parse_ipv4(const char* text, Ipv4Address& out);

/// Lowercase colon-separated form.
MacText format_mac(const MacAddress& m);

/// Dotted-quad form.
Ipv4Text format_ipv4(Ipv4Address a);

/// Build a MacAddress from six octets.
inline MacAddress make_mac(uint8_t a, uint8_t b, uint8_t c, uint8_t d, uint8_t e, uint8_t f) {
  MacAddress m;
  m[0] = a; m[1] = b; m[2] = c; m[3] = d; m[4] = e; m[5] = f;
  return m;
}

/// Build an Ipv4Address from four octets (a is the most significant).
inline Ipv4Address make_ipv4(uint8_t a, uint8_t b, uint8_t c, uint8_t d) {
  return (static_cast<uint32_t>(a) << 24) | (static_cast<uint32_t>(b) << 16) |
         (static_cast<uint32_t>(c) << 8)  |  static_cast<uint32_t>(d);
}

} // namespace eomacca

#endif // EOMACCA_WIRE_HPP
