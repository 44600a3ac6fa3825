/**
 * @file chunked_message.hpp
 * @brief Chunked-text message layer: a name-resolution response whose single text
 *        record carries the base64 form of a transport segment.
 *
 * @details
 * BUILD
 * -----
 *   segment bytes ──base64──► text ──split (≤ CHUNK_MAX chars)──► chunks
 *   chunks ──► one TXT answer record for RECORD_NAME inside a response message
 *
 * Wire layout (all 16-bit fields big endian):
 *
 *   header    id=0 flags=0x8580 (QR AA RD RA) qdcount=1 ancount=1 nscount=0 arcount=0
 *   question  <RECORD_NAME as length-prefixed labels> type=TXT(16) class=IN(1)
 *   answer    <0xC00C pointer to the question name> type=TXT class=IN ttl=0
 *             rdlength <len><chunk> <len><chunk> ...
 *
 * PARSE
 * -----
 * The first answer record is located (skipping every question), its character
 * strings are concatenated in the order they appear and the result is base64
 * decoded. Chunks are never re-sorted: stored order is the only order.
 *
 * Names may use compression pointers anywhere; pointer chains are followed
 * up to MAX_POINTER_HOPS to reject loops.
 *
 * LIMITS
 * ------
 * The record length field is 16 bits, so the chunk data (one length byte per
 * chunk plus the text) must stay within 65535 bytes. Larger inputs fail with
 * `Status::PayloadTooLarge` at build time.
 */
#ifndef EOMACCA_CHUNKED_MESSAGE_HPP
#define EOMACCA_CHUNKED_MESSAGE_HPP

#include "eomacca/status.hpp"
#include "eomacca/wire.hpp"
#include "etl/string.h"
#include <string>
#include <vector>

namespace eomacca {
namespace message {

static constexpr size_t   CHUNK_MAX        = 250;    ///< base64 characters per chunk
static constexpr size_t   TXT_STRING_MAX   = 255;    ///< wire limit of one character string
static constexpr size_t   NAME_MAX         = 253;
static constexpr size_t   LABEL_MAX        = 63;
static constexpr size_t   HEADER_SIZE      = 12;
static constexpr size_t   RDATA_MAX        = 0xFFFF;
static constexpr int      MAX_POINTER_HOPS = 16;

static constexpr uint16_t TYPE_A           = 1;
static constexpr uint16_t TYPE_TXT         = 16;
static constexpr uint16_t CLASS_IN         = 1;
static constexpr uint16_t FLAGS_RESPONSE   = 0x8580;
static constexpr uint16_t QUESTION_POINTER = 0xC000 | HEADER_SIZE;

static constexpr const char* RECORD_NAME = "data.eomacca.example.com";

using TxtString  = etl::string<TXT_STRING_MAX>;
using DomainName = etl::string<NAME_MAX>;

/// Decoded view of a message, as far as EoMacca cares about it.
struct Message {
  uint16_t               id             = 0;
  uint16_t               flags          = 0;
  uint16_t               question_count = 0;
  uint16_t               answer_count   = 0;
  DomainName             question;      ///< first question name (dotted)
  DomainName             answer_name;   ///< first answer owner name (dotted)
  uint16_t               answer_type    = 0;
  uint32_t               answer_ttl     = 0;
  std::vector<TxtString> chunks;        ///< first answer's strings, wire order
};

/**
 * @brief Split @p text into consecutive pieces of at most @p max characters.
 *
 * All pieces but the last have exactly @p max characters. Empty text yields no
 * pieces. @p max is clamped to 1..TXT_STRING_MAX.
 */
void split_chunks(const std::string& text, size_t max, std::vector<TxtString>& out);

/// Concatenate @p chunks in order into @p out (reserved once, cleared first).
void join_chunks(const std::vector<TxtString>& chunks, std::string& out);

/**
 * @brief Encode a segment as a one-answer text message.
 * @param chunk_max  characters per chunk (clamped to 1..TXT_STRING_MAX)
 * @param name       question / record owner name
 * @return Ok, PayloadTooLarge if the record data exceeds RDATA_MAX, or
 *         MalformedHeader if @p name cannot be label-encoded.
 */
Status build(const uint8_t* segment, size_t n, Bytes& out,
             size_t chunk_max = CHUNK_MAX, const char* name = RECORD_NAME);

inline Status build(const Bytes& segment, Bytes& out, size_t chunk_max = CHUNK_MAX) {
  return build(segment.data(), segment.size(), out, chunk_max);
}

/**
 * @brief Walk a message up to and including the first answer record.
 * @return MalformedHeader (truncation, bad name), NoAnswerRecord,
 *         UnsupportedRecordType, or Ok.
 */
Status parse_message(const uint8_t* data, size_t n, Message& out);

/// parse_message() + in-order reassembly + base64 decode (MalformedHeader if invalid).
Status parse(const uint8_t* data, size_t n, Bytes& segment);

inline Status parse(const Bytes& in, Bytes& segment) { return parse(in.data(), in.size(), segment); }

} // namespace message
} // namespace eomacca

#endif // EOMACCA_CHUNKED_MESSAGE_HPP
