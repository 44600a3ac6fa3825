#pragma once

/**
 * @file slip.hpp
 * @brief SLIP framing for encapsulated packets on a TCP byte stream.
 *
 * @details
 * A TCP connection delivers bytes, not packets. Every encapsulated packet that
 * the server or client exchanges is wrapped in one SLIP frame so the receiver
 * knows exactly where it ends.
 *
 * Byte values:
 *   END       (0xC0) frame boundary
 *   ESC       (0xDB) escape introducer
 *   ESC_END   (0xDC) literal END inside a frame
 *   ESC_ESC   (0xDD) literal ESC inside a frame
 *
 * Encoding: END, payload with END/ESC escaped, END.
 *
 * Decoding:
 *   - Bytes before the first END are ignored.
 *   - END closes a non-empty frame; END END is a separator and yields nothing.
 *   - ESC followed by anything other than ESC_END/ESC_ESC drops the frame.
 *   - A frame that grows past `max_frame` is dropped and the decoder waits for
 *     the next END. An encapsulated 40 KB payload is about 75 KB on the wire,
 *     the default limit leaves plenty of room above that.
 *
 * @code
 *   eomacca::Bytes wire;
 *   eomacca::slip::encode(packet, wire);
 *
 *   eomacca::slip::decoder dec;
 *   eomacca::Bytes frame;
 *   for (uint8_t b : incoming)
 *     if (dec.feed(b, frame)) handle(frame);
 * @endcode
 */

#include "eomacca/wire.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace eomacca {
namespace slip {

static constexpr uint8_t END     = 0xC0;
static constexpr uint8_t ESC     = 0xDB;
static constexpr uint8_t ESC_END = 0xDC;
static constexpr uint8_t ESC_ESC = 0xDD;

/// Default decoder limit on one decoded frame.
static constexpr size_t MAX_FRAME = 1u << 20;

/// Encode @p n bytes into one frame; @p out is cleared first.
inline void encode(const uint8_t* in, size_t n, Bytes& out) {
  out.clear();
  out.reserve(n * 2 + 2);     // worst case: every byte escapes

  out.push_back(END);
  for (size_t i = 0; i < n; ++i) {
    const uint8_t b = in[i];
    if (b == END) {
      out.push_back(ESC);
      out.push_back(ESC_END);
    } else if (b == ESC) {
      out.push_back(ESC);
      out.push_back(ESC_ESC);
    } else {
      out.push_back(b);
    }
  }
  out.push_back(END);
}

inline void encode(const Bytes& in, Bytes& out) { encode(in.data(), in.size(), out); }

/**
 * @brief Byte-at-a-time decoder. One instance per stream.
 */
struct decoder {
  Bytes  buf;
  bool   esc       = false;
  bool   in_frame  = false;
  bool   overflow  = false;   ///< current frame exceeded max_frame; skipping to next END
  size_t max_frame = MAX_FRAME;

  /// @return true when @p frame holds one complete payload.
  bool feed(uint8_t b, Bytes& frame) {
    if (b == END) {
      if (in_frame && !overflow && !buf.empty()) {
        frame.swap(buf);
        buf.clear();
        in_frame = false;
        esc = false;
        return true;
      }
      buf.clear();
      in_frame = true;
      overflow = false;
      esc = false;
      return false;
    }

    if (!in_frame || overflow) return false;

    if (esc) {
      esc = false;
      if      (b == ESC_END) b = END;
      else if (b == ESC_ESC) b = ESC;
      else {
        // malformed escape: drop and resync on next END
        buf.clear();
        in_frame = false;
        return false;
      }
    } else if (b == ESC) {
      esc = true;
      return false;
    }

    if (buf.size() >= max_frame) {
      buf.clear();
      overflow = true;
      return false;
    }
    buf.push_back(b);
    return false;
  }

  void reset() {
    buf.clear();
    esc = false;
    in_frame = false;
    overflow = false;
  }
};

} // namespace slip
} // namespace eomacca
