// ============================================================================
// status.cpp — implementation for status.hpp
// ============================================================================
#include "eomacca/status.hpp"

namespace eomacca {

const char* status_name(Status s) {
  switch (s) {
    case Status::Ok:                    return "ok";
    case Status::MalformedHeader:       return "malformed_header";
    case Status::MissingPayload:        return "missing_payload";
    case Status::UnexpectedProtocol:    return "unexpected_protocol";
    case Status::NoAnswerRecord:        return "no_answer_record";
    case Status::UnsupportedRecordType: return "unsupported_record_type";
    case Status::TruncatedMessage:      return "truncated_message";
    case Status::PayloadTooLarge:       return "payload_too_large";
  }
  return "unknown";
}

const char* status_message(Status s) {
  switch (s) {
    case Status::Ok:                    return "ok";
    case Status::MalformedHeader:       return "header truncated or inconsistent";
    case Status::MissingPayload:        return "no payload after header";
    case Status::UnexpectedProtocol:    return "unexpected next-layer protocol";
    case Status::NoAnswerRecord:        return "message has no answer records";
    case Status::UnsupportedRecordType: return "answer record is not a text record";
    case Status::TruncatedMessage:      return "no header terminator found";
    case Status::PayloadTooLarge:       return "payload exceeds record capacity";
  }
  return "unknown";
}

} // namespace eomacca
