// ============================================================================
// client.cpp — implementation for client.hpp
// ============================================================================
#include "eomacca/client.hpp"
#include "eomacca/tcp_io.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>

namespace eomacca {

const char* send_result_name(SendResult r) {
  switch (r) {
    case SendResult::Ok:          return "ok";
    case SendResult::EncodeError: return "encode_failed";
    case SendResult::IoError:     return "io_error";
    case SendResult::Timeout:     return "timeout";
    case SendResult::DecodeError: return "decode_failed";
  }
  return "unknown";
}

SendResult Client::send_receive(const Bytes& payload, Bytes& response,
                                double& latency_ms, std::string& err) const {
  response.clear();
  latency_ms = 0;
  err.clear();

  Bytes packet;
  Status st = stack_.encapsulate(payload, packet);
  if (st != Status::Ok) {
    err = status_message(st);
    return SendResult::EncodeError;
  }

  const auto start = std::chrono::steady_clock::now();

  int fd = connect_to(opts_.host, opts_.port, opts_.connect_timeout_ms, err);
  if (fd < 0) return SendResult::IoError;

  if (!write_frame(fd, packet)) {
    err = "write failed";
    close_socket(fd);
    return SendResult::IoError;
  }

  Bytes reply;
  ReadResult rr = read_frame(fd, reply, opts_.read_timeout_ms);
  close_socket(fd);
  if (rr != ReadResult::Frame) {
    err = std::string("read ") + read_result_name(rr);
    return rr == ReadResult::Timeout ? SendResult::Timeout : SendResult::IoError;
  }

  Stage stage = Stage::Start;
  st = stack_.decapsulate(reply, response, &stage);
  if (st != Status::Ok) {
    err = std::string(status_name(st)) + " at " + stage_name(stage);
    return SendResult::DecodeError;
  }

  latency_ms = std::chrono::duration<double, std::milli>(
      std::chrono::steady_clock::now() - start).count();
  return SendResult::Ok;
}

Bytes make_file_payload(const std::string& name, const Bytes& data) {
  Bytes out;
  out.reserve(4 + name.size() + data.size());
  put_u32(out, static_cast<uint32_t>(name.size()));
  out.insert(out.end(), name.begin(), name.end());
  out.insert(out.end(), data.begin(), data.end());
  return out;
}

static bool parse_number(const std::string& s, double& out) {
  if (s.empty()) return false;
  char* end = nullptr;
  out = std::strtod(s.c_str(), &end);
  return end == s.c_str() + s.size();
}

bool parse_ping_reply(const std::string& text, double& client_s, double& server_s) {
  const size_t comma = text.find(',');
  if (comma == std::string::npos || text.find(',', comma + 1) != std::string::npos) return false;
  return parse_number(text.substr(0, comma), client_s) &&
         parse_number(text.substr(comma + 1), server_s);
}

std::string make_ping_payload(double now_s) {
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%.6f", now_s);
  return buf;
}

} // namespace eomacca
