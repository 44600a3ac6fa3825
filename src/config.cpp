// ============================================================================
// config.cpp — implementation for config.hpp
// ============================================================================
#include "eomacca/config.hpp"

#include <fstream>
#include <limits>

using json = nlohmann::json;

namespace eomacca {

static bool read_ip(const json& j, const char* key, Ipv4Address& out, std::string& err) {
  if (!j.contains(key)) return true;
  const json& v = j.at(key);
  if (!v.is_string() || !parse_ipv4(v.get<std::string>().c_str(), out)) {
    err = std::string(key) + ": expected dotted IPv4 address";
    return false;
  }
  return true;
}

static bool read_mac(const json& j, const char* key, MacAddress& out, std::string& err) {
  if (!j.contains(key)) return true;
  const json& v = j.at(key);
  if (!v.is_string() || !parse_mac(v.get<std::string>().c_str(), out)) {
    err = std::string(key) + ": expected aa:bb:cc:dd:ee:ff";
    return false;
  }
  return true;
}

template <typename T>
static bool read_uint(const json& j, const char* key, T& out, std::string& err) {
  if (!j.contains(key)) return true;
  const json& v = j.at(key);
  if (!v.is_number_unsigned() && !(v.is_number_integer() && v.get<int64_t>() >= 0)) {
    err = std::string(key) + ": expected non-negative integer";
    return false;
  }
  const uint64_t n = v.get<uint64_t>();
  if (n > std::numeric_limits<T>::max()) {
    err = std::string(key) + ": out of range";
    return false;
  }
  out = static_cast<T>(n);
  return true;
}

bool apply_config(const json& j, StackConfig& cfg, std::string& err) {
  err.clear();
  if (!j.is_object()) {
    err = "config root must be a JSON object";
    return false;
  }
  return read_ip  (j, "outer_src_ip",   cfg.outer_src_ip,   err) &&
         read_ip  (j, "outer_dst_ip",   cfg.outer_dst_ip,   err) &&
         read_uint(j, "outer_src_port", cfg.outer_src_port, err) &&
         read_uint(j, "outer_dst_port", cfg.outer_dst_port, err) &&
         read_mac (j, "outer_src_mac",  cfg.outer_src_mac,  err) &&
         read_mac (j, "outer_dst_mac",  cfg.outer_dst_mac,  err) &&
         read_uint(j, "outer_seq",      cfg.outer_seq,      err) &&
         read_uint(j, "outer_ack",      cfg.outer_ack,      err);
}

bool load_config(const std::string& path, StackConfig& cfg, std::string& err) {
  std::ifstream in(path);
  if (!in) {
    err = "cannot open " + path;
    return false;
  }
  json j = json::parse(in, nullptr, false);
  if (j.is_discarded()) {
    err = path + ": invalid JSON";
    return false;
  }
  if (!apply_config(j, cfg, err)) {
    err = path + ": " + err;
    return false;
  }
  return true;
}

json config_to_json(const StackConfig& cfg) {
  json j;
  j["outer_src_ip"]   = format_ipv4(cfg.outer_src_ip).c_str();
  j["outer_dst_ip"]   = format_ipv4(cfg.outer_dst_ip).c_str();
  j["outer_src_port"] = cfg.outer_src_port;
  j["outer_dst_port"] = cfg.outer_dst_port;
  j["outer_src_mac"]  = format_mac(cfg.outer_src_mac).c_str();
  j["outer_dst_mac"]  = format_mac(cfg.outer_dst_mac).c_str();
  j["outer_seq"]      = cfg.outer_seq;
  j["outer_ack"]      = cfg.outer_ack;
  return j;
}

} // namespace eomacca
