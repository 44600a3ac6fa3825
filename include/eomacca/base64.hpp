/**
 * @file base64.hpp
 * @brief Standard base64 (RFC 4648 alphabet, '=' padding) for the chunked message layer.
 *
 * `encode()` always emits padded output whose length is 4 * ceil(n / 3).
 * `decode()` is strict: the input length must be a multiple of 4, only the
 * standard alphabet is accepted, and padding may only appear in the last one
 * or two positions. Whitespace is not skipped.
 */
#ifndef EOMACCA_BASE64_HPP
#define EOMACCA_BASE64_HPP

#include "eomacca/wire.hpp"
#include <string>

namespace eomacca {
namespace base64 {

/// Length of the encoded form of @p n input bytes.
inline size_t encoded_size(size_t n) { return ((n + 2) / 3) * 4; }

/// Encode @p n bytes at @p in into @p out (cleared first).
void encode(const uint8_t* in, size_t n, std::string& out);

/// Decode @p n characters at @p in into @p out (cleared first). False on invalid input.
bool decode(const char* in, size_t n, Bytes& out);

inline bool decode(const std::string& in, Bytes& out) {
  return decode(in.data(), in.size(), out);
}

} // namespace base64
} // namespace eomacca

#endif // EOMACCA_BASE64_HPP
