/**
 * @file tcp_io.hpp
 * @brief TCP sockets carrying SLIP-framed encapsulated packets.
 *
 * @details
 * Free functions over plain file descriptors, in the same shape for the server
 * and the client:
 *
 *   server: open_listener() -> accept_client() -> read_frame()/write_frame() -> close_socket()
 *   client: connect_to()    ->                    write_frame()/read_frame() -> close_socket()
 *
 * Timeouts are milliseconds and use poll(2). read_frame() reports why it
 * stopped so callers can tell a quiet peer from a dead one.
 *
 * Do not share one descriptor between threads without external locking.
 */
#pragma once

#include "eomacca/wire.hpp"

#include <string>

namespace eomacca {

enum class ReadResult {
  Frame,     ///< one complete frame in @p out
  Timeout,   ///< no complete frame before the deadline
  Closed,    ///< peer closed the connection first
  Error,     ///< poll/read failed
};

const char* read_result_name(ReadResult r);

/**
 * @brief Bind and listen on @p host:@p port (SO_REUSEADDR set).
 * @return listening fd, or -1 with @p err filled.
 */
int open_listener(const std::string& host, uint16_t port, int backlog, std::string& err);

/**
 * @brief Wait up to @p timeout_ms for one connection.
 * @return client fd, -1 on timeout (err left empty) or failure (err filled).
 *         @p peer receives "ip:port".
 */
int accept_client(int listen_fd, int timeout_ms, std::string& peer, std::string& err);

/**
 * @brief Resolve @p host and connect with a deadline.
 * @return connected fd (blocking mode), or -1 with @p err filled.
 */
int connect_to(const std::string& host, uint16_t port, int timeout_ms, std::string& err);

/// SLIP-encode @p payload and write all of it, looping over partial writes.
bool write_frame(int fd, const Bytes& payload);

/// Read until one SLIP frame completes, the deadline passes or the peer goes away.
ReadResult read_frame(int fd, Bytes& out, int timeout_ms = 5000);

/// Close @p fd if non-negative.
void close_socket(int fd);

} // namespace eomacca
