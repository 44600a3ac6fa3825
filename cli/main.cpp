/**
 * @file main.cpp
 * @brief eomacca — command-line front end for the EoMacca stack.
 *
 * Subcommands:
 *  - encap    wrap a payload in all eight layers, print or write the packet
 *  - decap    unwrap a packet, print the payload or the failing stage
 *  - stats    overhead table for one payload or a list of sizes
 *  - layers   per-layer size trace of one encapsulation
 *  - serve    sequential TCP server (echo|chat|file|ping)
 *  - send     client: echo <text> | chat <text> | file <path> | ping
 *  - config   print the effective outer addressing as JSON
 *
 * Outer addressing comes from the defaults, then --config <json>, then the
 * per-field options (--src-ip, --dst-port, ...), last one wins.
 *
 * Exit codes: 0 ok, 1 I/O, 2 usage/config, 3 timeout, 4 decode failure.
 * Errors are single `status=error reason=<token> ...` lines on stderr.
 */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h> // isatty

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "eomacca/client.hpp"
#include "eomacca/config.hpp"
#include "eomacca/handlers.hpp"
#include "eomacca/server.hpp"
#include "eomacca/stack.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace eomacca;

enum ExitCode {
  EXIT_IO      = 1,
  EXIT_USAGE   = 2,
  EXIT_TIMEOUT = 3,
  EXIT_DECODE  = 4,
};

static std::atomic<bool> g_stop{false};

static void on_signal(int) { g_stop.store(true); }

// ---------- small utilities ----------

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold (const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim  (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string green(const std::string& s) const { return enabled ? "\033[32m"+s+"\033[0m" : s; }
  std::string cyan (const std::string& s) const { return enabled ? "\033[36m"+s+"\033[0m" : s; }
};

static std::string to_hex(const Bytes& b) {
  static const char* HEX = "0123456789abcdef";
  std::string s;
  s.reserve(b.size() * 2);
  for (uint8_t v : b) { s.push_back(HEX[v >> 4]); s.push_back(HEX[v & 0x0F]); }
  return s;
}

static int hex_val(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// Whitespace between digits is allowed so pasted dumps work.
static bool from_hex(const std::string& s, Bytes& out) {
  out.clear();
  int hi = -1;
  for (char c : s) {
    if (c == ' ' || c == '\n' || c == '\t' || c == '\r') continue;
    int v = hex_val(c);
    if (v < 0) return false;
    if (hi < 0) { hi = v; continue; }
    out.push_back(static_cast<uint8_t>((hi << 4) | v));
    hi = -1;
  }
  return hi < 0;
}

static bool read_file(const std::string& path, Bytes& out, std::string& err) {
  std::ifstream in(path, std::ios::binary);
  if (!in) { err = "cannot open " + path; return false; }
  out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  if (in.bad()) { err = "read " + path; return false; }
  return true;
}

static bool write_file(const std::string& path, const Bytes& data, std::string& err) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) { err = "cannot open " + path; return false; }
  out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  if (!out) { err = "write " + path; return false; }
  return true;
}

// Offset, 16 hex bytes, ASCII column. Stops after max_rows (0 = all).
static void print_hexdump(const Bytes& b, size_t max_rows, const Ansi& ansi) {
  const size_t rows = (b.size() + 15) / 16;
  const size_t shown = (max_rows && rows > max_rows) ? max_rows : rows;
  for (size_t r = 0; r < shown; ++r) {
    std::ostringstream line;
    line << std::hex << std::setw(6) << std::setfill('0') << r * 16 << "  ";
    std::string ascii;
    for (size_t i = 0; i < 16; ++i) {
      const size_t k = r * 16 + i;
      if (k < b.size()) {
        line << std::setw(2) << static_cast<int>(b[k]) << ' ';
        ascii.push_back((b[k] >= 0x20 && b[k] < 0x7F) ? static_cast<char>(b[k]) : '.');
      } else {
        line << "   ";
      }
    }
    std::cout << "  " << line.str() << ansi.dim(ascii) << "\n";
  }
  if (shown < rows) {
    std::cout << "  " << ansi.dim("... " + std::to_string(b.size() - shown * 16) + " more bytes") << "\n";
  }
}

static bool printable_text(const Bytes& b) {
  if (!valid_utf8(b.data(), b.size())) return false;
  for (uint8_t c : b) {
    if (c < 0x20 && c != '\n' && c != '\t' && c != '\r') return false;
  }
  return true;
}

static std::string fixed(double v, int prec) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(prec) << v;
  return os.str();
}

// Exactly one of --text/--hex/--file must be given.
struct PayloadInput {
  std::string text, hex, file;
  CLI::Option* text_opt = nullptr;

  void add_to(CLI::App* sub, const char* what) {
    text_opt = sub->add_option("--text", text, std::string(what) + " as UTF-8 text");
    sub->add_option("--hex", hex, std::string(what) + " as hex digits");
    sub->add_option("--file", file, std::string(what) + " read from a file");
  }

  bool resolve(Bytes& out, std::string& err) const {
    const int given = (text_opt && text_opt->count() ? 1 : 0) + (!hex.empty() ? 1 : 0) + (!file.empty() ? 1 : 0);
    if (given != 1) { err = "need_exactly_one_of_text_hex_file"; return false; }
    if (!file.empty()) return read_file(file, out, err);
    if (!hex.empty()) {
      if (!from_hex(hex, out)) { err = "invalid_hex"; return false; }
      return true;
    }
    out.assign(text.begin(), text.end());
    return true;
  }
};

// Per-field overrides layered over the config file.
struct OuterOverrides {
  std::string src_ip, dst_ip, src_mac, dst_mac;
  uint16_t src_port = 0, dst_port = 0;
  uint32_t seq = 0, ack = 0;
  CLI::Option *src_port_opt = nullptr, *dst_port_opt = nullptr, *seq_opt = nullptr, *ack_opt = nullptr;

  void add_to(CLI::App& app) {
    app.add_option("--src-ip",  src_ip,  "Outer source IPv4 address");
    app.add_option("--dst-ip",  dst_ip,  "Outer destination IPv4 address");
    app.add_option("--src-mac", src_mac, "Outer source MAC address");
    app.add_option("--dst-mac", dst_mac, "Outer destination MAC address");
    src_port_opt = app.add_option("--src-port", src_port, "Outer source port");
    dst_port_opt = app.add_option("--dst-port", dst_port, "Outer destination port");
    seq_opt      = app.add_option("--seq", seq, "Outer sequence number");
    ack_opt      = app.add_option("--ack", ack, "Outer acknowledgment number");
  }

  bool apply(StackConfig& cfg, std::string& err) const {
    if (!src_ip.empty()  && !parse_ipv4(src_ip.c_str(), cfg.outer_src_ip))  { err = "bad --src-ip " + src_ip; return false; }
    if (!dst_ip.empty()  && !parse_ipv4(dst_ip.c_str(), cfg.outer_dst_ip))  { err = "bad --dst-ip " + dst_ip; return false; }
    if (!src_mac.empty() && !parse_mac(src_mac.c_str(), cfg.outer_src_mac)) { err = "bad --src-mac " + src_mac; return false; }
    if (!dst_mac.empty() && !parse_mac(dst_mac.c_str(), cfg.outer_dst_mac)) { err = "bad --dst-mac " + dst_mac; return false; }
    if (src_port_opt->count()) cfg.outer_src_port = src_port;
    if (dst_port_opt->count()) cfg.outer_dst_port = dst_port;
    if (seq_opt->count())      cfg.outer_seq = seq;
    if (ack_opt->count())      cfg.outer_ack = ack;
    return true;
  }
};

static int report_status(Status st, Stage stage) {
  std::cerr << "status=error reason=" << status_name(st)
            << " stage=" << stage_name(stage) << "\n";
  return EXIT_DECODE;
}

static int exit_for(SendResult r) {
  switch (r) {
    case SendResult::Ok:          return 0;
    case SendResult::Timeout:     return EXIT_TIMEOUT;
    case SendResult::DecodeError: return EXIT_DECODE;
    case SendResult::EncodeError: return EXIT_USAGE;
    case SendResult::IoError:     return EXIT_IO;
  }
  return EXIT_IO;
}

// ---------- subcommands ----------

static int cmd_encap(const Stack& stack, const PayloadInput& in, const std::string& out_path,
                     const std::string& format, const Ansi& ansi) {
  Bytes payload, packet;
  std::string err;
  if (!in.resolve(payload, err)) {
    std::cerr << "status=error reason=" << err << "\n";
    return err.rfind("cannot", 0) == 0 || err.rfind("read", 0) == 0 ? EXIT_IO : EXIT_USAGE;
  }

  Status st = stack.encapsulate(payload, packet);
  if (st != Status::Ok) {
    std::cerr << "status=error reason=" << status_name(st) << " payload=" << payload.size() << "\n";
    return EXIT_USAGE;
  }

  if (!out_path.empty() && !write_file(out_path, packet, err)) {
    std::cerr << "status=error reason=write_failed detail=\"" << err << "\"\n";
    return EXIT_IO;
  }

  if (format == "json") {
    json j;
    j["payload_size"] = payload.size();
    j["total_size"]   = packet.size();
    if (out_path.empty()) j["packet_hex"] = to_hex(packet);
    else                  j["out"] = out_path;
    std::cout << j.dump(2) << "\n";
  } else if (format == "raw") {
    if (out_path.empty()) std::cout << to_hex(packet) << "\n";
  } else {
    std::cout << ansi.bold("encapsulated ") << payload.size() << " -> " << packet.size() << " bytes";
    if (!out_path.empty()) std::cout << ansi.dim("  (written to " + out_path + ")");
    std::cout << "\n";
    if (out_path.empty()) print_hexdump(packet, 32, ansi);
  }
  return 0;
}

static int cmd_decap(const Stack& stack, const PayloadInput& in, const std::string& out_path,
                     const std::string& format, const Ansi& ansi) {
  Bytes packet, payload;
  std::string err;
  if (!in.resolve(packet, err)) {
    std::cerr << "status=error reason=" << err << "\n";
    return err.rfind("cannot", 0) == 0 || err.rfind("read", 0) == 0 ? EXIT_IO : EXIT_USAGE;
  }

  Stage stage = Stage::Start;
  Status st = stack.decapsulate(packet, payload, &stage);
  if (st != Status::Ok) {
    if (format == "json") {
      json j;
      j["status"] = status_name(st);
      j["stage"]  = stage_name(stage);
      std::cout << j.dump(2) << "\n";
    }
    return report_status(st, stage);
  }

  if (!out_path.empty() && !write_file(out_path, payload, err)) {
    std::cerr << "status=error reason=write_failed detail=\"" << err << "\"\n";
    return EXIT_IO;
  }

  const bool text = printable_text(payload);
  if (format == "json") {
    json j;
    j["status"]       = "ok";
    j["packet_size"]  = packet.size();
    j["payload_size"] = payload.size();
    j["payload_hex"]  = to_hex(payload);
    if (text) j["payload_text"] = std::string(payload.begin(), payload.end());
    std::cout << j.dump(2) << "\n";
  } else if (format == "raw") {
    if (out_path.empty()) std::cout.write(reinterpret_cast<const char*>(payload.data()),
                                          static_cast<std::streamsize>(payload.size()));
  } else {
    std::cout << ansi.bold("decapsulated ") << packet.size() << " -> " << payload.size() << " bytes\n";
    if (out_path.empty()) {
      if (text) std::cout << "  " << std::string(payload.begin(), payload.end()) << "\n";
      else      print_hexdump(payload, 32, ansi);
    }
  }
  return 0;
}

static int cmd_stats(const Stack& stack, const PayloadInput& in, std::vector<size_t> sizes,
                     const std::string& format, const Ansi& ansi) {
  std::vector<Bytes> payloads;
  if (sizes.empty()) {
    Bytes p;
    std::string err;
    if (!in.resolve(p, err)) {
      std::cerr << "status=error reason=" << err << "\n";
      return EXIT_USAGE;
    }
    payloads.push_back(std::move(p));
  } else {
    for (size_t n : sizes) payloads.emplace_back(n, static_cast<uint8_t>('A'));
  }

  json rows = json::array();
  if (format == "pretty") {
    std::cout << ansi.bold("  payload      total    headers  efficiency   overhead") << "\n";
  }
  for (const Bytes& p : payloads) {
    OverheadStats s;
    Status st = stack.get_overhead_stats(p, s);
    if (st != Status::Ok) {
      std::cerr << "status=error reason=" << status_name(st) << " payload=" << p.size() << "\n";
      return EXIT_USAGE;
    }
    if (format == "pretty") {
      std::cout << "  " << std::setw(7) << s.payload_size
                << "  " << std::setw(9) << s.total_size
                << "  " << std::setw(9) << s.header_size
                << "  " << std::setw(9) << fixed(s.efficiency_percent, 2) << "%"
                << "  " << std::setw(8) << fixed(s.overhead_ratio, 2) << "x\n";
    } else {
      json j;
      j["payload_size"]       = s.payload_size;
      j["total_size"]         = s.total_size;
      j["header_size"]        = s.header_size;
      j["overhead_ratio"]     = s.overhead_ratio;
      j["efficiency_percent"] = s.efficiency_percent;
      rows.push_back(j);
    }
  }
  if (format != "pretty") std::cout << rows.dump(format == "json" ? 2 : -1) << "\n";
  return 0;
}

static int cmd_layers(const Stack& stack, const PayloadInput& in,
                      const std::string& format, const Ansi& ansi) {
  Bytes payload;
  std::string err;
  if (!in.resolve(payload, err)) {
    std::cerr << "status=error reason=" << err << "\n";
    return EXIT_USAGE;
  }

  std::vector<LayerTrace> steps;
  Status st = stack.trace(payload, steps);
  if (st != Status::Ok) {
    std::cerr << "status=error reason=" << status_name(st) << "\n";
    return EXIT_USAGE;
  }

  if (format != "pretty") {
    json arr = json::array();
    for (const auto& t : steps) {
      json j;
      j["stage"] = stage_name(t.stage);
      j["size"]  = t.size;
      j["added"] = t.added;
      arr.push_back(j);
    }
    std::cout << arr.dump(format == "json" ? 2 : -1) << "\n";
    return 0;
  }

  std::cout << ansi.bold("payload") << "  " << payload.size() << " bytes\n";
  size_t depth = 1;
  for (const auto& t : steps) {
    std::cout << std::string(depth * 2, ' ') << "\xE2\x94\x94 "
              << ansi.cyan(stage_name(t.stage)) << "  " << t.size << " bytes"
              << ansi.dim("  (+" + std::to_string(t.added) + ")") << "\n";
    ++depth;
  }
  if (!steps.empty()) {
    const size_t total = steps.back().size;
    std::cout << ansi.dim("total overhead " + std::to_string(total - payload.size()) + " bytes") << "\n";
  }
  return 0;
}

static int cmd_serve(const Stack& stack, const ServerOptions& opts) {
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  Server server(stack, opts);
  std::string err;
  if (!server.run(g_stop, err)) {
    std::cerr << "status=error reason=listen_failed detail=\"" << err << "\"\n";
    return EXIT_IO;
  }
  return 0;
}

static int print_reply(const Bytes& reply, double latency_ms, const std::string& format, const Ansi& ansi) {
  const std::string text(reply.begin(), reply.end());
  if (format == "json") {
    json j;
    j["status"]     = "ok";
    j["latency_ms"] = latency_ms;
    j["reply_size"] = reply.size();
    if (printable_text(reply)) j["reply"] = text;
    else                       j["reply_hex"] = to_hex(reply);
    std::cout << j.dump(2) << "\n";
  } else if (format == "raw") {
    std::cout << text << "\n";
  } else {
    std::cout << ansi.green("reply") << "  " << (printable_text(reply) ? text : to_hex(reply)) << "\n";
    std::cout << ansi.dim("round trip " + fixed(latency_ms, 2) + " ms") << "\n";
  }
  return 0;
}

static int cmd_send_once(const Client& client, const Bytes& payload,
                         const std::string& format, const Ansi& ansi) {
  Bytes reply;
  double latency = 0;
  std::string err;
  SendResult r = client.send_receive(payload, reply, latency, err);
  if (r != SendResult::Ok) {
    std::cerr << "status=error reason=" << send_result_name(r) << " detail=\"" << err << "\"\n";
    return exit_for(r);
  }
  return print_reply(reply, latency, format, ansi);
}

static int cmd_ping(const Client& client, int count, int interval_ms,
                    const std::string& format, const Ansi& ansi) {
  std::vector<double> rtts;
  int last_fail = 0;
  for (int i = 0; i < count && !g_stop.load(); ++i) {
    const std::string req = make_ping_payload(wall_clock_seconds());
    Bytes reply;
    double latency = 0;
    std::string err;
    SendResult r = client.send_receive(Bytes(req.begin(), req.end()), reply, latency, err);
    if (r != SendResult::Ok) {
      std::cerr << "status=error reason=" << send_result_name(r) << " seq=" << i
                << " detail=\"" << err << "\"\n";
      last_fail = exit_for(r);
    } else {
      double client_s = 0, server_s = 0;
      const std::string text(reply.begin(), reply.end());
      if (!parse_ping_reply(text, client_s, server_s)) {
        std::cerr << "status=error reason=bad_ping_reply seq=" << i << " reply=\"" << text << "\"\n";
        last_fail = EXIT_DECODE;
      } else {
        const double rtt = (wall_clock_seconds() - client_s) * 1000.0;
        rtts.push_back(rtt);
        if (format == "pretty") {
          std::cout << "seq=" << i << " rtt=" << ansi.bold(fixed(rtt, 2) + " ms") << "\n";
        }
      }
    }
    if (i + 1 < count) std::this_thread::sleep_for(std::chrono::milliseconds(interval_ms));
  }

  if (rtts.empty()) return last_fail ? last_fail : EXIT_IO;

  double lo = rtts.front(), hi = rtts.front(), sum = 0;
  for (double v : rtts) { lo = std::min(lo, v); hi = std::max(hi, v); sum += v; }
  const double avg = sum / static_cast<double>(rtts.size());

  if (format == "pretty") {
    std::cout << ansi.dim(std::to_string(rtts.size()) + "/" + std::to_string(count) + " replies")
              << "  min " << fixed(lo, 2) << "  avg " << fixed(avg, 2)
              << "  max " << fixed(hi, 2) << " ms\n";
  } else {
    json j;
    j["sent"]     = count;
    j["received"] = rtts.size();
    j["rtt_ms"]   = rtts;
    j["min_ms"]   = lo;
    j["avg_ms"]   = avg;
    j["max_ms"]   = hi;
    std::cout << j.dump(format == "json" ? 2 : -1) << "\n";
  }
  return 0;
}

// ---------- main ----------

int main(int argc, char** argv) {
  std::string opt_config;
  std::string opt_format = "pretty";
  bool opt_no_color = false;
  OuterOverrides overrides;

  CLI::App app{"EoMacca: Ethernet over MAC over ... eight layers of encapsulation"};
  app.require_subcommand(1);
  app.add_option("--config", opt_config, "JSON file with outer addressing");
  app.add_option("--format", opt_format, "Output format: pretty|json|raw")->check(CLI::IsMember({"pretty","json","raw"}));
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");
  overrides.add_to(app);

  // encap / decap
  PayloadInput encap_in, decap_in, stats_in, layers_in;
  std::string encap_out, decap_out;
  auto* encap = app.add_subcommand("encap", "Encapsulate a payload");
  encap_in.add_to(encap, "Payload");
  encap->add_option("--out", encap_out, "Write the packet to this file");

  auto* decap = app.add_subcommand("decap", "Decapsulate a packet");
  decap_in.add_to(decap, "Packet");
  decap->add_option("--out", decap_out, "Write the payload to this file");

  // stats / layers
  std::vector<size_t> stats_sizes;
  auto* stats = app.add_subcommand("stats", "Overhead statistics");
  stats_in.add_to(stats, "Payload");
  stats->add_option("--sizes", stats_sizes, "Synthetic payload sizes, e.g. 10,100,1000")->delimiter(',');

  auto* layers = app.add_subcommand("layers", "Trace buffer size through every layer");
  layers_in.add_to(layers, "Payload");

  // serve
  ServerOptions srv;
  std::string srv_mode = "echo";
  auto* serve = app.add_subcommand("serve", "Run the TCP server");
  serve->add_option("--host", srv.host, "Listen address")->capture_default_str();
  serve->add_option("--port", srv.port, "Listen port")->capture_default_str();
  serve->add_option("--mode", srv_mode, "echo|chat|file|ping")->check(CLI::IsMember({"echo","chat","file","ping"}))->capture_default_str();
  serve->add_option("--save-dir", srv.save_dir, "file mode: store received files here");
  serve->add_option("--read-timeout", srv.read_timeout_ms, "Per-connection read timeout (ms)")->capture_default_str();

  // send
  ClientOptions cli_opts;
  std::string send_text, send_path;
  int ping_count = 5, ping_interval_ms = 500;
  auto* send = app.add_subcommand("send", "Send one request to a server");
  send->require_subcommand(1);
  send->add_option("--host", cli_opts.host, "Server address")->capture_default_str();
  send->add_option("--port", cli_opts.port, "Server port")->capture_default_str();
  send->add_option("--timeout", cli_opts.read_timeout_ms, "Reply timeout (ms)")->capture_default_str();
  auto* send_echo = send->add_subcommand("echo", "Echo a message");
  send_echo->add_option("message", send_text, "Text to send")->required();
  auto* send_chat = send->add_subcommand("chat", "Send a chat message");
  send_chat->add_option("message", send_text, "Text to send")->required();
  auto* send_file = send->add_subcommand("file", "Send a file");
  send_file->add_option("path", send_path, "File to send")->required()->check(CLI::ExistingFile);
  auto* send_ping = send->add_subcommand("ping", "Measure round-trip time");
  send_ping->add_option("--count", ping_count, "Number of pings")->capture_default_str()->check(CLI::PositiveNumber);
  send_ping->add_option("--interval", ping_interval_ms, "Delay between pings (ms)")->capture_default_str();

  auto* config = app.add_subcommand("config", "Print the effective outer addressing");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    const int rc = app.exit(e);
    return rc == 0 ? 0 : EXIT_USAGE;
  }

  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stdout() && opt_format == "pretty";

  // defaults -> file -> per-field options
  StackConfig cfg;
  std::string err;
  if (!opt_config.empty() && !load_config(opt_config, cfg, err)) {
    std::cerr << "status=error reason=config detail=\"" << err << "\"\n";
    return EXIT_USAGE;
  }
  if (!overrides.apply(cfg, err)) {
    std::cerr << "status=error reason=config detail=\"" << err << "\"\n";
    return EXIT_USAGE;
  }
  const Stack stack(cfg);

  if (*encap)  return cmd_encap(stack, encap_in, encap_out, opt_format, ansi);
  if (*decap)  return cmd_decap(stack, decap_in, decap_out, opt_format, ansi);
  if (*stats)  return cmd_stats(stack, stats_in, stats_sizes, opt_format, ansi);
  if (*layers) return cmd_layers(stack, layers_in, opt_format, ansi);
  if (*config) {
    std::cout << config_to_json(cfg).dump(opt_format == "raw" ? -1 : 2) << "\n";
    return 0;
  }

  if (*serve) {
    if (!parse_mode(srv_mode, srv.mode)) {
      std::cerr << "status=error reason=bad_mode mode=" << srv_mode << "\n";
      return EXIT_USAGE;
    }
    return cmd_serve(stack, srv);
  }

  if (*send) {
    std::signal(SIGINT, on_signal);
    const Client client(stack, cli_opts);
    if (*send_echo || *send_chat) {
      return cmd_send_once(client, Bytes(send_text.begin(), send_text.end()), opt_format, ansi);
    }
    if (*send_file) {
      Bytes data;
      if (!read_file(send_path, data, err)) {
        std::cerr << "status=error reason=read_failed detail=\"" << err << "\"\n";
        return EXIT_IO;
      }
      const std::string name = fs::path(send_path).filename().string();
      return cmd_send_once(client, make_file_payload(name, data), opt_format, ansi);
    }
    if (*send_ping) return cmd_ping(client, ping_count, ping_interval_ms, opt_format, ansi);
  }

  std::cerr << "status=error reason=no_command\n";
  return EXIT_USAGE;
}
