/**
 * @file stack.hpp
 * @brief EoMacca Stack: the fixed eight-layer encapsulation pipeline.
 *
 * @details
 * ## Pipeline
 * ```
 *  encapsulate ─►                                                   ◄─ decapsulate
 *
 *  payload
 *   └ LINK             inner frame    de:ad:be:ef:ca:fe → fe:ed:fa:ce:de:ad  (type 0x9000)
 *    └ NETWORK         inner packet   10.255.255.1 → 10.255.255.2            (proto TCP)
 *     └ TRANSPORT      inner segment  31337 → 31338, PSH|ACK, seq/ack 1000
 *      └ MESSAGE       TXT answer for data.eomacca.example.com, base64 chunks ≤ 250
 *       └ ENVELOPE     POST /eomacca/v1/tunnel HTTP/1.1 ... \r\n\r\n <message>
 *        └ OUTER_TRANSPORT  config ports, PSH|ACK, seq/ack 2000
 *         └ OUTER_NETWORK   config addresses (proto TCP)
 *          └ OUTER_LINK     config hardware addresses (type 0x0800)
 * ```
 *
 * Each step is one entry of a fixed `std::array<Layer, 8>`; `Layer` is a
 * variant over the five layer kinds, each exposing
 * `Status build(const Bytes& in, Bytes& out) const` and
 * `Status parse(const Bytes& in, Bytes& out) const`.
 * Encode visits the array front to back, decode back to front. There is no
 * branching and no recovery: the first non-Ok status ends the run, the output
 * buffer is cleared and the failing stage is reported.
 *
 * ## Configuration
 * `StackConfig` is a flat value. The outer fields are caller addressing; the
 * `inner` block and `chunk_max` hold the fixed constants (defaults below) and
 * are carried in the same value so the pipeline has no globals.
 *
 * ## Threading
 * A constructed Stack is immutable. Every public member is const and
 * allocation-local, so one instance may be shared across threads.
 *
 * ## Example
 * @code
 * eomacca::Stack stack;                       // default addressing
 * eomacca::Bytes wire, back;
 * if (stack.encapsulate(payload, wire) == eomacca::Status::Ok &&
 *     stack.decapsulate(wire, back) == eomacca::Status::Ok) {
 *   // back == payload
 * }
 * @endcode
 */
#ifndef EOMACCA_STACK_HPP
#define EOMACCA_STACK_HPP

#include "eomacca/status.hpp"
#include "eomacca/wire.hpp"
#include "eomacca/link_frame.hpp"
#include "eomacca/network_packet.hpp"
#include "eomacca/transport_segment.hpp"
#include "eomacca/chunked_message.hpp"
#include "eomacca/text_envelope.hpp"

#include <array>
#include <string>
#include <variant>
#include <vector>

namespace eomacca {

// -------- constants --------

static constexpr uint16_t INNER_SRC_PORT = 31337;
static constexpr uint16_t INNER_DST_PORT = 31338;
static constexpr uint32_t INNER_SEQ      = 1000;
static constexpr uint32_t INNER_ACK      = 1000;

static constexpr uint16_t OUTER_SRC_PORT = 54321;
static constexpr uint16_t OUTER_DST_PORT = 9999;
static constexpr uint32_t OUTER_SEQ      = 2000;
static constexpr uint32_t OUTER_ACK      = 2000;

/// Fixed addressing of the inner link/network/transport trio.
struct InnerAddressing {
  MacAddress  src_mac  = make_mac(0xde, 0xad, 0xbe, 0xef, 0xca, 0xfe);
  MacAddress  dst_mac  = make_mac(0xfe, 0xed, 0xfa, 0xce, 0xde, 0xad);
  Ipv4Address src_ip   = make_ipv4(10, 255, 255, 1);
  Ipv4Address dst_ip   = make_ipv4(10, 255, 255, 2);
  uint16_t    src_port = INNER_SRC_PORT;
  uint16_t    dst_port = INNER_DST_PORT;
  uint32_t    seq      = INNER_SEQ;
  uint32_t    ack      = INNER_ACK;
};

/// Caller configuration. Every field has a default and can be overridden alone.
struct StackConfig {
  Ipv4Address outer_src_ip   = make_ipv4(192, 168, 1, 100);
  Ipv4Address outer_dst_ip   = make_ipv4(192, 168, 1, 200);
  uint16_t    outer_src_port = OUTER_SRC_PORT;
  uint16_t    outer_dst_port = OUTER_DST_PORT;
  MacAddress  outer_src_mac  = make_mac(0x00, 0x11, 0x22, 0x33, 0x44, 0x55);
  MacAddress  outer_dst_mac  = make_mac(0xaa, 0xbb, 0xcc, 0xdd, 0xee, 0xff);
  uint32_t    outer_seq      = OUTER_SEQ;
  uint32_t    outer_ack      = OUTER_ACK;

  InnerAddressing inner{};
  size_t          chunk_max = message::CHUNK_MAX;
};

// -------- pipeline stages --------

enum class Stage : uint8_t {
  Start = 0,
  Link,
  Network,
  Transport,
  Message,
  Envelope,
  OuterTransport,
  OuterNetwork,
  OuterLink,
  Done,
};

/// "link", "outer_transport", ...
const char* stage_name(Stage s);

// -------- layer kinds --------

namespace layer {

struct Link {
  MacAddress src{};
  MacAddress dst{};
  uint16_t   type = link::TYPE_IPV4;
  Status build(const Bytes& in, Bytes& out) const;
  Status parse(const Bytes& in, Bytes& out) const;
};

struct Network {
  Ipv4Address src = 0;
  Ipv4Address dst = 0;
  uint8_t     protocol = network::PROTO_TCP;
  Status build(const Bytes& in, Bytes& out) const;
  Status parse(const Bytes& in, Bytes& out) const;
};

struct Transport {
  uint16_t src_port = 0;
  uint16_t dst_port = 0;
  uint8_t  flags = transport::FLAGS_PUSH_ACK;
  uint32_t seq = 0;
  uint32_t ack = 0;
  Status build(const Bytes& in, Bytes& out) const;
  Status parse(const Bytes& in, Bytes& out) const;
};

struct Message {
  size_t chunk_max = message::CHUNK_MAX;
  Status build(const Bytes& in, Bytes& out) const;
  Status parse(const Bytes& in, Bytes& out) const;
};

struct Envelope {
  std::string method = envelope::METHOD;
  std::string path   = envelope::PATH;
  std::string host   = envelope::HOST;
  Status build(const Bytes& in, Bytes& out) const;
  Status parse(const Bytes& in, Bytes& out) const;
};

} // namespace layer

using Layer = std::variant<layer::Link, layer::Network, layer::Transport,
                           layer::Message, layer::Envelope>;

// -------- results --------

struct OverheadStats {
  size_t payload_size       = 0;
  size_t total_size         = 0;
  size_t header_size        = 0;   ///< total_size - payload_size
  double overhead_ratio     = 0;   ///< header / payload, 0 for an empty payload
  double efficiency_percent = 0;   ///< payload / total * 100
};

/// One encode step as seen by trace().
struct LayerTrace {
  Stage  stage = Stage::Start;
  size_t size  = 0;   ///< buffer size after this step
  size_t added = 0;   ///< bytes this step added
};

// -------- orchestrator --------

class Stack {
public:
  static constexpr size_t LAYER_COUNT = 8;

  explicit Stack(const StackConfig& cfg = StackConfig());

  const StackConfig& config() const { return cfg_; }

  /// Run all eight build steps. Only PayloadTooLarge can fail (message step).
  Status encapsulate(const Bytes& payload, Bytes& out) const;

  /**
   * @brief Run all eight parse steps in reverse.
   * @param failed_stage  if non-null, receives the stage that failed (Done on success)
   */
  Status decapsulate(const Bytes& packet, Bytes& out, Stage* failed_stage = nullptr) const;

  /// Encapsulate once and report sizes.
  Status get_overhead_stats(const Bytes& payload, OverheadStats& out) const;

  /// Encapsulate once, recording the buffer size after every step (8 entries).
  Status trace(const Bytes& payload, std::vector<LayerTrace>& out) const;

  /// Stage served by pipeline slot @p i (0 = Link ... 7 = OuterLink).
  static Stage stage_at(size_t i) { return static_cast<Stage>(i + 1); }

private:
  Status run_encode(const Bytes& payload, Bytes& out, std::vector<LayerTrace>* trace) const;

  StackConfig                     cfg_;
  std::array<Layer, LAYER_COUNT>  pipeline_;
};

} // namespace eomacca

#endif // EOMACCA_STACK_HPP
