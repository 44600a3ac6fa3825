// ============================================================================
// chunked_message.cpp — implementation for chunked_message.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================
#include "eomacca/chunked_message.hpp"
#include "eomacca/base64.hpp"

#include <string.h>

namespace eomacca {
namespace message {

// ---------------------------------------------------------------------------
// Name helpers
// ---------------------------------------------------------------------------

// encode_name(): "a.b.c" -> 01 'a' 01 'b' 01 'c' 00
// Rejects empty labels, labels over 63 bytes and names over 255 encoded bytes.
static bool encode_name(const char* name, Bytes& out) {
  out.clear();
  if (!name) return false;

  const char* p = name;
  while (*p) {
    const char* dot = strchr(p, '.');
    size_t len = dot ? static_cast<size_t>(dot - p) : strlen(p);
    if (len == 0 || len > LABEL_MAX) return false;
    put_u8(out, static_cast<uint8_t>(len));
    out.insert(out.end(), p, p + len);
    p += len;
    if (*p == '.') ++p;
  }
  put_u8(out, 0);                          // root label
  return out.size() <= NAME_MAX + 2;
}

// read_name(): decode the name at @p pos into dotted form.
// @p next receives the offset just past the name as it sits at @p pos
// (i.e. past the first pointer if one is followed).
static bool read_name(const uint8_t* data, size_t n, size_t pos,
                      DomainName& name, size_t& next) {
  name.clear();
  bool jumped = false;
  int hops = 0;

  while (true) {
    if (pos >= n) return false;
    const uint8_t len = data[pos];

    if ((len & 0xC0) == 0xC0) {            // compression pointer
      if (pos + 1 >= n) return false;
      if (!jumped) next = pos + 2;
      jumped = true;
      if (++hops > MAX_POINTER_HOPS) return false;
      pos = (static_cast<size_t>(len & 0x3F) << 8) | data[pos + 1];
      continue;
    }
    if (len & 0xC0) return false;          // 0x40 / 0x80 label types are not in use

    if (len == 0) {
      if (!jumped) next = pos + 1;
      return true;
    }

    if (pos + 1 + len > n) return false;
    if (!name.empty()) {
      if (name.full()) return false;
      name += '.';
    }
    if (name.size() + len > name.max_size()) return false;
    name.append(reinterpret_cast<const char*>(data + pos + 1), len);
    pos += 1 + static_cast<size_t>(len);
  }
}

static size_t clamp_chunk(size_t max) {
  if (max == 0) return 1;
  if (max > TXT_STRING_MAX) return TXT_STRING_MAX;
  return max;
}

// ---------------------------------------------------------------------------
// Chunking
// ---------------------------------------------------------------------------

void split_chunks(const std::string& text, size_t max, std::vector<TxtString>& out) {
  out.clear();
  max = clamp_chunk(max);
  out.reserve((text.size() + max - 1) / max);

  for (size_t i = 0; i < text.size(); i += max) {
    const size_t len = (text.size() - i > max) ? max : (text.size() - i);
    out.push_back(TxtString(text.data() + i, len));
  }
}

void join_chunks(const std::vector<TxtString>& chunks, std::string& out) {
  out.clear();
  size_t total = 0;
  for (const auto& c : chunks) total += c.size();
  out.reserve(total);
  for (const auto& c : chunks) out.append(c.data(), c.size());
}

// ---------------------------------------------------------------------------
// Build
// ---------------------------------------------------------------------------

Status build(const uint8_t* segment, size_t n, Bytes& out,
             size_t chunk_max, const char* name) {
  out.clear();

  std::string text;
  base64::encode(segment, n, text);

  std::vector<TxtString> chunks;
  split_chunks(text, chunk_max, chunks);

  // one length byte per character string
  const size_t rdlength = text.size() + chunks.size();
  if (rdlength > RDATA_MAX) return Status::PayloadTooLarge;

  Bytes qname;
  if (!encode_name(name, qname)) return Status::MalformedHeader;

  out.reserve(HEADER_SIZE + qname.size() + 4 + 12 + rdlength);

  // header
  put_u16(out, 0);                 // id
  put_u16(out, FLAGS_RESPONSE);
  put_u16(out, 1);                 // qdcount
  put_u16(out, 1);                 // ancount
  put_u16(out, 0);                 // nscount
  put_u16(out, 0);                 // arcount

  // question
  out.insert(out.end(), qname.begin(), qname.end());
  put_u16(out, TYPE_TXT);
  put_u16(out, CLASS_IN);

  // answer: owner name points back at the question
  put_u16(out, QUESTION_POINTER);
  put_u16(out, TYPE_TXT);
  put_u16(out, CLASS_IN);
  put_u32(out, 0);                 // ttl
  put_u16(out, static_cast<uint16_t>(rdlength));

  for (const auto& c : chunks) {
    put_u8(out, static_cast<uint8_t>(c.size()));
    out.insert(out.end(), c.begin(), c.end());
  }
  return Status::Ok;
}

// ---------------------------------------------------------------------------
// Parse
// ---------------------------------------------------------------------------

Status parse_message(const uint8_t* data, size_t n, Message& out) {
  out.chunks.clear();
  out.question.clear();
  out.answer_name.clear();
  out.answer_type = 0;
  out.answer_ttl = 0;

  if (n < HEADER_SIZE) return Status::MalformedHeader;

  out.id             = get_u16(data);
  out.flags          = get_u16(data + 2);
  out.question_count = get_u16(data + 4);
  out.answer_count   = get_u16(data + 6);

  if (out.answer_count == 0) return Status::NoAnswerRecord;

  // skip every question (name + type + class), keep the first name
  size_t pos = HEADER_SIZE;
  for (uint16_t q = 0; q < out.question_count; ++q) {
    DomainName qn;
    size_t next = pos;
    if (!read_name(data, n, pos, qn, next)) return Status::MalformedHeader;
    if (next + 4 > n) return Status::MalformedHeader;
    if (q == 0) out.question = qn;
    pos = next + 4;
  }

  // first answer: name, type, class, ttl, rdlength, rdata
  size_t next = pos;
  if (!read_name(data, n, pos, out.answer_name, next)) return Status::MalformedHeader;
  if (next + 10 > n) return Status::MalformedHeader;

  out.answer_type = get_u16(data + next);
  out.answer_ttl  = get_u32(data + next + 4);
  const size_t rdlength = get_u16(data + next + 8);
  const size_t rdata    = next + 10;

  if (out.answer_type != TYPE_TXT) return Status::UnsupportedRecordType;
  if (rdata + rdlength > n) return Status::MalformedHeader;

  // character strings, in wire order
  const size_t end = rdata + rdlength;
  size_t off = rdata;
  while (off < end) {
    const size_t len = data[off];
    if (off + 1 + len > end) return Status::MalformedHeader;
    out.chunks.push_back(TxtString(reinterpret_cast<const char*>(data + off + 1), len));
    off += 1 + len;
  }
  return Status::Ok;
}

Status parse(const uint8_t* data, size_t n, Bytes& segment) {
  segment.clear();

  Message msg;
  Status st = parse_message(data, n, msg);
  if (st != Status::Ok) return st;

  std::string text;
  join_chunks(msg.chunks, text);
  if (!base64::decode(text, segment)) return Status::MalformedHeader;
  return Status::Ok;
}

} // namespace message
} // namespace eomacca
