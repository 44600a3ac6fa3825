/**
 * @file status.hpp
 * @brief EoMacca status codes shared by every layer and by the stack orchestrator.
 *
 * Every build/parse call in the core returns a `Status`. `Status::Ok` means the
 * out-parameter holds a complete result; anything else means the out-parameter
 * was cleared and must not be used.
 *
 * | Code                  | Raised by                 | Meaning                                          |
 * |-----------------------|---------------------------|--------------------------------------------------|
 * | MalformedHeader       | every layer               | fixed header truncated or internally inconsistent|
 * | MissingPayload        | network, transport        | header parsed but no payload bytes remain        |
 * | UnexpectedProtocol    | network                   | next-layer indicator is not the expected one     |
 * | NoAnswerRecord        | message                   | answer count is zero                             |
 * | UnsupportedRecordType | message                   | first answer is not a text-chunk record          |
 * | TruncatedMessage      | envelope                  | header/body separator absent                     |
 * | PayloadTooLarge       | message (build only)      | chunk data does not fit the 16-bit record length |
 *
 * `status_name()` returns the token used in `status=error reason=<token>` log lines.
 */
#ifndef EOMACCA_STATUS_HPP
#define EOMACCA_STATUS_HPP

#include <stdint.h>

namespace eomacca {

enum class Status : uint8_t {
  Ok = 0,
  MalformedHeader,
  MissingPayload,
  UnexpectedProtocol,
  NoAnswerRecord,
  UnsupportedRecordType,
  TruncatedMessage,
  PayloadTooLarge,
};

/// Stable snake_case token for logs ("malformed_header", ...). Never null.
const char* status_name(Status s);

/// Human-readable sentence for error replies ("header truncated or inconsistent").
const char* status_message(Status s);

inline bool ok(Status s) { return s == Status::Ok; }

} // namespace eomacca

#endif // EOMACCA_STATUS_HPP
