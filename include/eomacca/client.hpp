/**
 * @file client.hpp
 * @brief EoMacca client: one request/response exchange per connection.
 */
#pragma once

#include "eomacca/stack.hpp"

#include <string>

namespace eomacca {

enum class SendResult {
  Ok,
  EncodeError,   ///< request too large to encapsulate
  IoError,       ///< connect/write failed or the server hung up
  Timeout,       ///< no reply before the deadline
  DecodeError,   ///< reply did not decapsulate
};

const char* send_result_name(SendResult r);

struct ClientOptions {
  std::string host = "127.0.0.1";
  uint16_t    port = OUTER_DST_PORT;
  int         connect_timeout_ms = 3000;
  int         read_timeout_ms    = 10000;
};

class Client {
public:
  Client(const Stack& stack, const ClientOptions& opts) : stack_(stack), opts_(opts) {}

  /**
   * @brief Encapsulate @p payload, send it, wait for the reply and decapsulate it.
   * @param latency_ms  wall time from connect to decoded reply
   * @param err         filled on any non-Ok result
   */
  SendResult send_receive(const Bytes& payload, Bytes& response,
                          double& latency_ms, std::string& err) const;

private:
  const Stack&  stack_;
  ClientOptions opts_;
};

/// name_len[4, big-endian] name data
Bytes make_file_payload(const std::string& name, const Bytes& data);

/// Split "<client>,<server>" into its two timestamps; false if it is not exactly that.
bool parse_ping_reply(const std::string& text, double& client_s, double& server_s);

/// Current time as the decimal text a ping request carries.
std::string make_ping_payload(double now_s);

} // namespace eomacca
