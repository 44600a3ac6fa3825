/**
 * @file server.hpp
 * @brief Sequential EoMacca server: one exchange per connection.
 *
 * Loop:
 *   accept (poll timeout) -> read one SLIP frame -> decapsulate -> handler
 *   -> encapsulate reply -> write frame -> close
 *
 * A request that fails to decapsulate is answered with an encapsulated
 * "Error: <reason>" payload. The loop checks the stop flag after every accept
 * timeout, so a signal handler only needs to set it. Statistics are printed
 * as one JSON line when run() returns.
 */
#pragma once

#include "eomacca/handlers.hpp"
#include "eomacca/stack.hpp"

#include <atomic>
#include <string>

namespace eomacca {

struct ServerOptions {
  std::string host = "127.0.0.1";
  uint16_t    port = OUTER_DST_PORT;
  Mode        mode = Mode::Echo;
  int         backlog = 5;
  int         accept_timeout_ms = 1000;
  int         read_timeout_ms   = 5000;
  std::string save_dir;           ///< file mode: write received files here when non-empty
};

class Server {
public:
  Server(const Stack& stack, const ServerOptions& opts,
         std::function<double()> clock = wall_clock_seconds);

  /**
   * @brief Serve until @p stop becomes true.
   * @return false (with @p err) only if the listener could not be opened.
   */
  bool run(const std::atomic<bool>& stop, std::string& err);

  /**
   * @brief Turn one received packet into the packet to send back.
   *
   * Updates statistics. Fails only if the reply itself cannot be
   * encapsulated (reply larger than a message record can carry).
   */
  Status handle_packet(const Bytes& packet, Bytes& response);

  RequestHandler& handler() { return handler_; }
  const Statistics& stats() const { return handler_.stats(); }

private:
  void serve_client(int fd, const std::string& peer);

  const Stack&   stack_;
  ServerOptions  opts_;
  RequestHandler handler_;
};

} // namespace eomacca
