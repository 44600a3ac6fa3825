/**
 * @file text_envelope.hpp
 * @brief Text-protocol envelope layer: HTTP/1.1-style request head + opaque body.
 *
 * Built form:
 * @code
 *   POST /eomacca/v1/tunnel HTTP/1.1\r\n
 *   Host: eomacca.example.com\r\n
 *   Content-Type: application/dns-message\r\n
 *   Content-Length: <body size>\r\n
 *   User-Agent: EoMacca/1.0 (Unnecessarily Complex Protocol)\r\n
 *   Cookie: overhead=yes\r\n
 *   Connection: keep-alive\r\n
 *   \r\n
 *   <body, verbatim>
 * @endcode
 *
 * Parsing is separator-driven: the FIRST "\r\n\r\n" ends the head and every
 * byte after it is body, whatever it contains and whatever Content-Length says.
 * The request line and header fields are split out for inspection only; lines
 * without a colon are skipped and nothing in the head can fail the parse.
 */
#ifndef EOMACCA_TEXT_ENVELOPE_HPP
#define EOMACCA_TEXT_ENVELOPE_HPP

#include "eomacca/status.hpp"
#include "eomacca/wire.hpp"
#include <string>
#include <vector>

namespace eomacca {
namespace envelope {

static constexpr const char* METHOD       = "POST";
static constexpr const char* PATH         = "/eomacca/v1/tunnel";
static constexpr const char* HOST         = "eomacca.example.com";
static constexpr const char* VERSION      = "HTTP/1.1";
static constexpr const char* CONTENT_TYPE = "application/dns-message";
static constexpr const char* USER_AGENT   = "EoMacca/1.0 (Unnecessarily Complex Protocol)";

static constexpr const char SEPARATOR[] = "\r\n\r\n";
static constexpr size_t SEPARATOR_LEN = 4;

struct HeaderField {
  std::string key;
  std::string value;
};

struct Envelope {
  std::string              method;
  std::string              path;
  std::string              version;
  std::vector<HeaderField> headers;   ///< wire order
  Bytes                    body;
};

/// Write head + @p n body bytes into @p out (cleared first). Cannot fail.
void build(const uint8_t* body, size_t n,
           const char* method, const char* path, const char* host,
           Bytes& out);

inline void build(const Bytes& body, Bytes& out,
                  const char* method = METHOD, const char* path = PATH,
                  const char* host = HOST) {
  build(body.data(), body.size(), method, path, host, out);
}

/// @return Ok, or TruncatedMessage if no "\r\n\r\n" occurs in the input.
Status parse(const uint8_t* data, size_t n, Envelope& out);

inline Status parse(const Bytes& in, Envelope& out) { return parse(in.data(), in.size(), out); }

/// Case-insensitive header lookup; nullptr if absent. First match wins.
const std::string* find_header(const Envelope& env, const char* key);

} // namespace envelope
} // namespace eomacca

#endif // EOMACCA_TEXT_ENVELOPE_HPP
