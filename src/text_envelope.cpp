// ============================================================================
// text_envelope.cpp — implementation for text_envelope.hpp
// ============================================================================
#include "eomacca/text_envelope.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace eomacca {
namespace envelope {

// Trim leading/trailing spaces and tabs in place.
static void trim(std::string& s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.erase(0, 1);
  while (!s.empty() && (s.back()  == ' ' || s.back()  == '\t')) s.pop_back();
}

static bool iequals(const std::string& a, const char* b) {
  size_t i = 0;
  for (; i < a.size() && b[i]; ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) return false;
  }
  return i == a.size() && b[i] == '\0';
}

void build(const uint8_t* body, size_t n,
           const char* method, const char* path, const char* host,
           Bytes& out) {
  std::string head;
  head.reserve(256);
  head += method; head += ' '; head += path; head += ' '; head += VERSION; head += "\r\n";
  head += "Host: ";           head += host;                 head += "\r\n";
  head += "Content-Type: ";   head += CONTENT_TYPE;         head += "\r\n";
  head += "Content-Length: "; head += std::to_string(n);    head += "\r\n";
  head += "User-Agent: ";     head += USER_AGENT;           head += "\r\n";
  head += "Cookie: overhead=yes\r\n";
  head += "Connection: keep-alive\r\n";
  head += "\r\n";

  out.clear();
  out.reserve(head.size() + n);
  out.insert(out.end(), head.begin(), head.end());
  if (n) out.insert(out.end(), body, body + n);
}

Status parse(const uint8_t* data, size_t n, Envelope& out) {
  out.method.clear();
  out.path.clear();
  out.version.clear();
  out.headers.clear();
  out.body.clear();

  const uint8_t* end = data + n;
  const uint8_t* sep = std::search(data, end, SEPARATOR, SEPARATOR + SEPARATOR_LEN);
  if (sep == end) return Status::TruncatedMessage;

  // head: request line, then "Key: value" lines
  const std::string head(reinterpret_cast<const char*>(data),
                         static_cast<size_t>(sep - data));
  size_t line_start = 0;
  bool first = true;
  while (line_start <= head.size()) {
    size_t line_end = head.find("\r\n", line_start);
    if (line_end == std::string::npos) line_end = head.size();
    const std::string line = head.substr(line_start, line_end - line_start);

    if (first) {
      // METHOD SP PATH SP VERSION; missing parts stay empty
      const size_t a = line.find(' ');
      out.method = line.substr(0, a);
      if (a != std::string::npos) {
        const size_t b = line.find(' ', a + 1);
        out.path = line.substr(a + 1, b == std::string::npos ? std::string::npos : b - a - 1);
        if (b != std::string::npos) out.version = line.substr(b + 1);
      }
      first = false;
    } else {
      const size_t colon = line.find(':');
      if (colon != std::string::npos) {
        HeaderField f{line.substr(0, colon), line.substr(colon + 1)};
        trim(f.key);
        trim(f.value);
        out.headers.push_back(std::move(f));
      }
    }
    line_start = line_end + 2;
  }

  out.body.assign(sep + SEPARATOR_LEN, end);
  return Status::Ok;
}

const std::string* find_header(const Envelope& env, const char* key) {
  if (!key) return nullptr;
  for (const auto& f : env.headers) {
    if (iequals(f.key, key)) return &f.value;
  }
  return nullptr;
}

} // namespace envelope
} // namespace eomacca
