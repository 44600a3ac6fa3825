/**
 * @file config.hpp
 * @brief Outer addressing from JSON.
 *
 * File format (every key optional, unknown keys ignored):
 * @code
 * {
 *   "outer_src_ip":   "192.168.1.100",
 *   "outer_dst_ip":   "192.168.1.200",
 *   "outer_src_port": 54321,
 *   "outer_dst_port": 9999,
 *   "outer_src_mac":  "00:11:22:33:44:55",
 *   "outer_dst_mac":  "aa:bb:cc:dd:ee:ff",
 *   "outer_seq":      2000,
 *   "outer_ack":      2000
 * }
 * @endcode
 * Fields not present keep whatever value @p cfg already holds, so a file can
 * be layered over the defaults and CLI options layered over the file.
 */
#pragma once

#include "eomacca/stack.hpp"

#include "nlohmann/json.hpp"
#include <string>

namespace eomacca {

/// Apply the keys of @p j onto @p cfg. False (with @p err naming the key) on a bad value.
bool apply_config(const nlohmann::json& j, StackConfig& cfg, std::string& err);

/// Read and apply a JSON file.
bool load_config(const std::string& path, StackConfig& cfg, std::string& err);

/// Effective outer addressing in the same shape load_config() reads.
nlohmann::json config_to_json(const StackConfig& cfg);

} // namespace eomacca
