/**
 * @file handlers.hpp
 * @brief Server-side request handling: one handler per mode plus traffic statistics.
 *
 * The server decapsulates a request and hands the payload to
 * `RequestHandler::handle(payload, mode)`; whatever comes back is encapsulated
 * as the response. Handlers never fail: bad input yields an "Error: ..." text
 * reply, which is what travels back to the client.
 *
 *  mode  | request payload                          | reply
 *  ------|------------------------------------------|-----------------------------------
 *  echo  | anything                                 | the payload
 *  chat  | UTF-8 text                               | "Message received at HH:MM:SS"
 *  file  | name_len[4, BE] name data                | "File '<name>' received (<n> bytes)"
 *  ping  | client time, decimal seconds             | "<client>,<server>"
 *
 * Time comes from `RequestHandler::clock` (seconds since the epoch) so tests
 * can pin it.
 */
#pragma once

#include "eomacca/wire.hpp"

#include "etl/circular_buffer.h"
#include "etl/deque.h"
#include "etl/string.h"
#include "nlohmann/json.hpp"

#include <functional>
#include <map>
#include <string>

namespace eomacca {

enum class Mode { Echo, Chat, File, Ping };

const char* mode_name(Mode m);

/// "echo" | "chat" | "file" | "ping"; false on anything else.
bool parse_mode(const std::string& s, Mode& out);

/// Seconds since the epoch as a double (sub-second resolution).
double wall_clock_seconds();

/// Strict UTF-8 check: no overlongs, no surrogates, nothing above U+10FFFF.
bool valid_utf8(const uint8_t* p, size_t n);

struct Statistics {
  uint64_t packets_received = 0;
  uint64_t packets_sent     = 0;
  uint64_t bytes_received   = 0;
  uint64_t bytes_sent       = 0;
  uint64_t total_overhead   = 0;
  double   start_time       = 0;

  void update_received(size_t packet_size, size_t payload_size);
  void update_sent(size_t packet_size);
  double uptime(double now) const { return now - start_time; }

  nlohmann::json to_json(double now) const;
};

using ClockText = etl::string<8>;   ///< "HH:MM:SS"

struct ChatEntry {
  ClockText   time;
  std::string text;
};

static constexpr size_t CHAT_HISTORY_MAX = 128;
static constexpr size_t FILE_STORE_MAX   = 32;

/// Double-quoted log value; quotes, backslashes and control bytes are escaped.
std::string log_quote(const std::string& s);

class RequestHandler {
public:
  explicit RequestHandler(std::function<double()> clock = wall_clock_seconds);

  Bytes handle(const Bytes& payload, Mode mode);

  Bytes handle_echo(const Bytes& payload);
  Bytes handle_chat(const Bytes& payload);
  Bytes handle_file(const Bytes& payload);
  Bytes handle_ping(const Bytes& payload);

  /**
   * @brief Write a received file to @p dir/@p name.
   * @return false (with @p err) if the file is unknown, the name is not a plain
   *         file name, or the write fails.
   */
  bool save_file(const std::string& name, const std::string& dir, std::string& err) const;

  /// Forget a received file. Returns false if it was not stored.
  bool drop_file(const std::string& name);

  Statistics& stats() { return stats_; }
  const Statistics& stats() const { return stats_; }
  const etl::circular_buffer<ChatEntry, CHAT_HISTORY_MAX>& chat_history() const { return chat_; }
  const std::map<std::string, Bytes>& files() const { return files_; }

  double now() const { return clock_(); }

private:
  std::function<double()> clock_;
  Statistics stats_;
  etl::circular_buffer<ChatEntry, CHAT_HISTORY_MAX> chat_;   // oldest dropped when full
  std::map<std::string, Bytes> files_;                     // at most FILE_STORE_MAX
  etl::deque<std::string, FILE_STORE_MAX> file_order_;     // arrival order, oldest first
};

/// Local time of @p epoch_s as "HH:MM:SS".
ClockText format_clock(double epoch_s);

} // namespace eomacca
