// ============================================================================
// base64.cpp — implementation for base64.hpp
// ============================================================================
#include "eomacca/base64.hpp"

namespace eomacca {
namespace base64 {

static const char ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// Reverse lookup: 0..63 for alphabet characters, -1 otherwise.
static int value_of(char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '+') return 62;
  if (c == '/') return 63;
  return -1;
}

void encode(const uint8_t* in, size_t n, std::string& out) {
  out.clear();
  out.reserve(encoded_size(n));

  size_t i = 0;
  // full 3-byte groups -> 4 characters
  for (; i + 3 <= n; i += 3) {
    uint32_t v = (static_cast<uint32_t>(in[i]) << 16) |
                 (static_cast<uint32_t>(in[i + 1]) << 8) |
                  static_cast<uint32_t>(in[i + 2]);
    out += ALPHABET[(v >> 18) & 0x3F];
    out += ALPHABET[(v >> 12) & 0x3F];
    out += ALPHABET[(v >> 6) & 0x3F];
    out += ALPHABET[v & 0x3F];
  }

  // tail: 1 or 2 bytes left, pad to 4 characters
  size_t rest = n - i;
  if (rest == 1) {
    uint32_t v = static_cast<uint32_t>(in[i]) << 16;
    out += ALPHABET[(v >> 18) & 0x3F];
    out += ALPHABET[(v >> 12) & 0x3F];
    out += '=';
    out += '=';
  } else if (rest == 2) {
    uint32_t v = (static_cast<uint32_t>(in[i]) << 16) |
                 (static_cast<uint32_t>(in[i + 1]) << 8);
    out += ALPHABET[(v >> 18) & 0x3F];
    out += ALPHABET[(v >> 12) & 0x3F];
    out += ALPHABET[(v >> 6) & 0x3F];
    out += '=';
  }
}

bool decode(const char* in, size_t n, Bytes& out) {
  out.clear();
  if (n % 4 != 0) return false;
  out.reserve((n / 4) * 3);

  for (size_t i = 0; i < n; i += 4) {
    const bool last = (i + 4 == n);
    int a = value_of(in[i]);
    int b = value_of(in[i + 1]);
    if (a < 0 || b < 0) { out.clear(); return false; }

    // "xx==" and "xxx=" are only legal in the final quantum
    if (in[i + 2] == '=') {
      if (!last || in[i + 3] != '=') { out.clear(); return false; }
      out.push_back(static_cast<uint8_t>((a << 2) | (b >> 4)));
      break;
    }
    int c = value_of(in[i + 2]);
    if (c < 0) { out.clear(); return false; }

    if (in[i + 3] == '=') {
      if (!last) { out.clear(); return false; }
      out.push_back(static_cast<uint8_t>((a << 2) | (b >> 4)));
      out.push_back(static_cast<uint8_t>(((b & 0x0F) << 4) | (c >> 2)));
      break;
    }
    int d = value_of(in[i + 3]);
    if (d < 0) { out.clear(); return false; }

    out.push_back(static_cast<uint8_t>((a << 2) | (b >> 4)));
    out.push_back(static_cast<uint8_t>(((b & 0x0F) << 4) | (c >> 2)));
    out.push_back(static_cast<uint8_t>(((c & 0x03) << 6) | d));
  }
  return true;
}

} // namespace base64
} // namespace eomacca
