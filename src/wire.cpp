// ============================================================================
// wire.cpp — implementation for wire.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================
#include "eomacca/wire.hpp"

#include <stdio.h>

namespace eomacca {

// hex_nibble(): '0'..'9', 'a'..'f', 'A'..'F' -> 0..15, anything else -> -1
static int hex_nibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool parse_mac(const char* text, MacAddress& out) {
  if (!text) return false;
  MacAddress m;
  const char* p = text;
  for (size_t i = 0; i < MAC_LEN; ++i) {
    int hi = hex_nibble(p[0]);
    if (hi < 0) return false;
    int lo = hex_nibble(p[1]);
    if (lo < 0) return false;
    m[i] = static_cast<uint8_t>((hi << 4) | lo);
    p += 2;
    if (i + 1 < MAC_LEN) {
      if (*p != ':') return false;
      ++p;
    }
  }
  if (*p != '\0') return false;     // trailing junk
  out = m;
  return true;
}

bool parse_ipv4(const char* text, Ipv4Address& out) {
  if (!text) return false;
  uint32_t addr = 0;
  const char* p = text;
  for (int octet = 0; octet < 4; ++octet) {
    // 1..3 decimal digits, value <= 255
    uint32_t v = 0;
    int digits = 0;
    while (*p >= '0' && *p <= '9') {
      v = v * 10 + static_cast<uint32_t>(*p - '0');
      ++p;
      if (++digits > 3) return false;
    }
    if (digits == 0 || v > 255) return false;
    addr = (addr << 8) | v;
    if (octet < 3) {
      if (*p != '.') return false;
      ++p;
    }
  }
  if (*p != '\0') return false;
  out = addr;
  return true;
}

MacText format_mac(const MacAddress& m) {
  char buf[18];
  snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
           m[0], m[1], m[2], m[3], m[4], m[5]);
  return MacText(buf);
}

Ipv4Text format_ipv4(Ipv4Address a) {
  char buf[16];
  snprintf(buf, sizeof(buf), "%u.%u.%u.%u",
           static_cast<unsigned>((a >> 24) & 0xFF),
           static_cast<unsigned>((a >> 16) & 0xFF),
           static_cast<unsigned>((a >> 8) & 0xFF),
           static_cast<unsigned>(a & 0xFF));
  return Ipv4Text(buf);
}

} // namespace eomacca
