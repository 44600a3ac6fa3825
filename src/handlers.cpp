// ============================================================================
// handlers.cpp — implementation for handlers.hpp
// ============================================================================
#include "eomacca/handlers.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace eomacca {

const char* mode_name(Mode m) {
  switch (m) {
    case Mode::Echo: return "echo";
    case Mode::Chat: return "chat";
    case Mode::File: return "file";
    case Mode::Ping: return "ping";
  }
  return "echo";
}

std::string log_quote(const std::string& s) {
  std::string out = "\"";
  for (unsigned char c : s) {
    switch (c) {
      case '"':  out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (c < 0x20 || c == 0x7F) {
          char buf[5];
          std::snprintf(buf, sizeof(buf), "\\x%02x", c);
          out += buf;
        } else {
          out += static_cast<char>(c);
        }
    }
  }
  out += '"';
  return out;
}

bool parse_mode(const std::string& s, Mode& out) {
  if      (s == "echo") out = Mode::Echo;
  else if (s == "chat") out = Mode::Chat;
  else if (s == "file") out = Mode::File;
  else if (s == "ping") out = Mode::Ping;
  else return false;
  return true;
}

double wall_clock_seconds() {
  using namespace std::chrono;
  return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
}

ClockText format_clock(double epoch_s) {
  std::time_t t = static_cast<std::time_t>(epoch_s);
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", tm.tm_hour, tm.tm_min, tm.tm_sec);
  return ClockText(buf);
}

bool valid_utf8(const uint8_t* p, size_t n) {
  size_t i = 0;
  while (i < n) {
    const uint8_t c = p[i];
    if (c < 0x80) { ++i; continue; }

    size_t extra;
    uint32_t cp;
    if      ((c & 0xE0) == 0xC0) { extra = 1; cp = c & 0x1F; }
    else if ((c & 0xF0) == 0xE0) { extra = 2; cp = c & 0x0F; }
    else if ((c & 0xF8) == 0xF0) { extra = 3; cp = c & 0x07; }
    else return false;

    if (i + extra >= n) return false;                        // truncated sequence
    for (size_t k = 1; k <= extra; ++k) {
      const uint8_t cc = p[i + k];
      if ((cc & 0xC0) != 0x80) return false;
      cp = (cp << 6) | (cc & 0x3F);
    }

    if ((extra == 1 && cp < 0x80) ||
        (extra == 2 && cp < 0x800) ||
        (extra == 3 && cp < 0x10000)) return false;          // overlong
    if (cp >= 0xD800 && cp <= 0xDFFF) return false;          // surrogate
    if (cp > 0x10FFFF) return false;
    i += extra + 1;
  }
  return true;
}

static Bytes text_bytes(const std::string& s) {
  return Bytes(s.begin(), s.end());
}

// ---------------------------------------------------------------------------
// Statistics
// ---------------------------------------------------------------------------

void Statistics::update_received(size_t packet_size, size_t payload_size) {
  ++packets_received;
  bytes_received += packet_size;
  total_overhead += packet_size - payload_size;
}

void Statistics::update_sent(size_t packet_size) {
  ++packets_sent;
  bytes_sent += packet_size;
}

nlohmann::json Statistics::to_json(double now) const {
  nlohmann::json j;
  j["uptime_seconds"]   = uptime(now);
  j["packets_received"] = packets_received;
  j["packets_sent"]     = packets_sent;
  j["bytes_received"]   = bytes_received;
  j["bytes_sent"]       = bytes_sent;
  j["total_overhead"]   = total_overhead;
  j["avg_overhead"]     = packets_received
      ? static_cast<double>(total_overhead) / static_cast<double>(packets_received)
      : 0.0;
  return j;
}

// ---------------------------------------------------------------------------
// RequestHandler
// ---------------------------------------------------------------------------

RequestHandler::RequestHandler(std::function<double()> clock)
: clock_(std::move(clock)) {
  stats_.start_time = clock_();
}

Bytes RequestHandler::handle(const Bytes& payload, Mode mode) {
  switch (mode) {
    case Mode::Echo: return handle_echo(payload);
    case Mode::Chat: return handle_chat(payload);
    case Mode::File: return handle_file(payload);
    case Mode::Ping: return handle_ping(payload);
  }
  return handle_echo(payload);
}

Bytes RequestHandler::handle_echo(const Bytes& payload) {
  std::cout << "event=echo bytes=" << payload.size() << "\n";
  return payload;
}

Bytes RequestHandler::handle_chat(const Bytes& payload) {
  if (!valid_utf8(payload.data(), payload.size())) {
    return text_bytes("Error: Invalid UTF-8");
  }

  ChatEntry e;
  e.time = format_clock(clock_());
  e.text.assign(payload.begin(), payload.end());
  std::cout << "event=chat time=" << e.time.c_str() << " text=" << log_quote(e.text) << "\n";

  std::string ack = "Message received at ";
  ack += e.time.c_str();
  chat_.push(std::move(e));
  return text_bytes(ack);
}

Bytes RequestHandler::handle_file(const Bytes& payload) {
  if (payload.size() < 4) return text_bytes("Error: Invalid file format");

  const size_t name_len = get_u32(payload.data());
  if (payload.size() - 4 < name_len) return text_bytes("Error: Incomplete file data");

  std::string name(payload.begin() + 4, payload.begin() + 4 + static_cast<std::ptrdiff_t>(name_len));
  Bytes data(payload.begin() + 4 + static_cast<std::ptrdiff_t>(name_len), payload.end());
  const size_t n = data.size();

  std::cout << "event=file name=" << log_quote(name) << " bytes=" << n
            << " framing=" << (payload.size() - n) << "\n";

  if (files_.find(name) == files_.end()) {
    if (file_order_.full()) {
      std::cout << "event=file_evicted name=" << log_quote(file_order_.front()) << "\n";
      files_.erase(file_order_.front());
      file_order_.pop_front();
    }
    file_order_.push_back(name);
  }
  files_[name] = std::move(data);

  return text_bytes("File '" + name + "' received (" + std::to_string(n) + " bytes)");
}

Bytes RequestHandler::handle_ping(const Bytes& payload) {
  const std::string text(payload.begin(), payload.end());
  const char* begin = text.c_str();
  char* end = nullptr;
  const double client = std::strtod(begin, &end);

  // whole payload must be one number, nothing before or after it
  if (text.empty() || end == begin || static_cast<size_t>(end - begin) != text.size()) {
    return text_bytes("Error: Invalid ping format");
  }

  char buf[96];
  std::snprintf(buf, sizeof(buf), "%.6f,%.6f", client, clock_());
  std::cout << "event=ping\n";
  return text_bytes(buf);
}

bool RequestHandler::drop_file(const std::string& name) {
  if (files_.erase(name) == 0) return false;
  for (auto it = file_order_.begin(); it != file_order_.end(); ++it) {
    if (*it == name) {
      file_order_.erase(it);
      break;
    }
  }
  return true;
}

bool RequestHandler::save_file(const std::string& name, const std::string& dir,
                               std::string& err) const {
  err.clear();
  auto it = files_.find(name);
  if (it == files_.end()) {
    err = "no such file: " + name;
    return false;
  }

  namespace fs = std::filesystem;
  const fs::path leaf(name);
  if (name.empty() || leaf.has_parent_path() || name == "." || name == "..") {
    err = "refusing to write non-plain file name: " + name;
    return false;
  }

  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    err = "mkdir " + dir + ": " + ec.message();
    return false;
  }

  const fs::path out_path = fs::path(dir) / leaf;
  std::ofstream f(out_path, std::ios::binary | std::ios::trunc);
  if (!f) {
    err = "open " + out_path.string();
    return false;
  }
  f.write(reinterpret_cast<const char*>(it->second.data()),
          static_cast<std::streamsize>(it->second.size()));
  if (!f) {
    err = "write " + out_path.string();
    return false;
  }
  std::cout << "event=saved path=" << log_quote(out_path.string()) << "\n";
  return true;
}

} // namespace eomacca
