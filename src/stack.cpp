// -----------------------------------------------------------------------------
// stack.cpp — Implementation of the EoMacca Stack
//
// API & pipeline description:
//   see include/eomacca/stack.hpp
//
// Usage tests:
//   see tests/test_stack.cpp
// -----------------------------------------------------------------------------
#include "eomacca/stack.hpp"

namespace eomacca {

const char* stage_name(Stage s) {
  switch (s) {
    case Stage::Start:          return "start";
    case Stage::Link:           return "link";
    case Stage::Network:        return "network";
    case Stage::Transport:      return "transport";
    case Stage::Message:        return "message";
    case Stage::Envelope:       return "envelope";
    case Stage::OuterTransport: return "outer_transport";
    case Stage::OuterNetwork:   return "outer_network";
    case Stage::OuterLink:      return "outer_link";
    case Stage::Done:           return "done";
  }
  return "unknown";
}

// ---------- layer kinds ----------

namespace layer {

Status Link::build(const Bytes& in, Bytes& out) const {
  link::build(in, src, dst, type, out);
  return Status::Ok;
}

Status Link::parse(const Bytes& in, Bytes& out) const {
  link::Frame f;
  Status st = link::parse(in, f);
  if (st == Status::Ok) out.swap(f.payload);
  return st;
}

Status Network::build(const Bytes& in, Bytes& out) const {
  network::build(in, src, dst, out, protocol);
  return Status::Ok;
}

Status Network::parse(const Bytes& in, Bytes& out) const {
  network::Packet p;
  Status st = network::parse(in, p, protocol);
  if (st == Status::Ok) out.swap(p.payload);
  return st;
}

Status Transport::build(const Bytes& in, Bytes& out) const {
  transport::build(in, src_port, dst_port, flags, seq, ack, out);
  return Status::Ok;
}

Status Transport::parse(const Bytes& in, Bytes& out) const {
  transport::Segment s;
  Status st = transport::parse(in, s);
  if (st == Status::Ok) out.swap(s.payload);
  return st;
}

Status Message::build(const Bytes& in, Bytes& out) const {
  return message::build(in, out, chunk_max);
}

Status Message::parse(const Bytes& in, Bytes& out) const {
  return message::parse(in, out);
}

Status Envelope::build(const Bytes& in, Bytes& out) const {
  envelope::build(in.data(), in.size(), method.c_str(), path.c_str(), host.c_str(), out);
  return Status::Ok;
}

Status Envelope::parse(const Bytes& in, Bytes& out) const {
  envelope::Envelope e;
  Status st = envelope::parse(in, e);
  if (st == Status::Ok) out.swap(e.body);
  return st;
}

} // namespace layer

// ---------- pipeline ----------

// Slot i serves Stage(i + 1); the order below is the encode order.
static std::array<Layer, Stack::LAYER_COUNT> make_pipeline(const StackConfig& cfg) {
  const InnerAddressing& in = cfg.inner;

  layer::Link inner_link;
  inner_link.src  = in.src_mac;
  inner_link.dst  = in.dst_mac;
  inner_link.type = link::TYPE_LOOPBACK;

  layer::Network inner_net;
  inner_net.src = in.src_ip;
  inner_net.dst = in.dst_ip;

  layer::Transport inner_tcp;
  inner_tcp.src_port = in.src_port;
  inner_tcp.dst_port = in.dst_port;
  inner_tcp.seq      = in.seq;
  inner_tcp.ack      = in.ack;

  layer::Message msg;
  msg.chunk_max = cfg.chunk_max;

  layer::Transport outer_tcp;
  outer_tcp.src_port = cfg.outer_src_port;
  outer_tcp.dst_port = cfg.outer_dst_port;
  outer_tcp.seq      = cfg.outer_seq;
  outer_tcp.ack      = cfg.outer_ack;

  layer::Network outer_net;
  outer_net.src = cfg.outer_src_ip;
  outer_net.dst = cfg.outer_dst_ip;

  layer::Link outer_link;
  outer_link.src  = cfg.outer_src_mac;
  outer_link.dst  = cfg.outer_dst_mac;
  outer_link.type = link::TYPE_IPV4;

  return {{inner_link, inner_net, inner_tcp, msg, layer::Envelope{},
           outer_tcp, outer_net, outer_link}};
}

Stack::Stack(const StackConfig& cfg)
: cfg_(cfg), pipeline_(make_pipeline(cfg)) {
}

Status Stack::run_encode(const Bytes& payload, Bytes& out,
                         std::vector<LayerTrace>* trace) const {
  out.clear();
  if (trace) trace->clear();

  Bytes cur(payload);
  Bytes next;
  for (size_t i = 0; i < LAYER_COUNT; ++i) {
    Status st = std::visit([&](const auto& l) { return l.build(cur, next); }, pipeline_[i]);
    if (st != Status::Ok) {
      if (trace) trace->clear();
      return st;
    }
    if (trace) trace->push_back({stage_at(i), next.size(), next.size() - cur.size()});
    cur.swap(next);
  }
  out.swap(cur);
  return Status::Ok;
}

Status Stack::encapsulate(const Bytes& payload, Bytes& out) const {
  return run_encode(payload, out, nullptr);
}

Status Stack::decapsulate(const Bytes& packet, Bytes& out, Stage* failed_stage) const {
  out.clear();

  Bytes cur(packet);
  Bytes next;
  for (size_t i = LAYER_COUNT; i-- > 0;) {
    Status st = std::visit([&](const auto& l) { return l.parse(cur, next); }, pipeline_[i]);
    if (st != Status::Ok) {
      if (failed_stage) *failed_stage = stage_at(i);
      return st;
    }
    cur.swap(next);
  }

  if (failed_stage) *failed_stage = Stage::Done;
  out.swap(cur);
  return Status::Ok;
}

Status Stack::get_overhead_stats(const Bytes& payload, OverheadStats& out) const {
  out = OverheadStats{};

  Bytes wire;
  Status st = encapsulate(payload, wire);
  if (st != Status::Ok) return st;

  out.payload_size = payload.size();
  out.total_size   = wire.size();
  out.header_size  = out.total_size - out.payload_size;
  out.overhead_ratio = out.payload_size > 0
      ? static_cast<double>(out.header_size) / static_cast<double>(out.payload_size)
      : 0.0;
  out.efficiency_percent = out.total_size > 0
      ? static_cast<double>(out.payload_size) / static_cast<double>(out.total_size) * 100.0
      : 0.0;
  return Status::Ok;
}

Status Stack::trace(const Bytes& payload, std::vector<LayerTrace>& out) const {
  Bytes wire;
  return run_encode(payload, wire, &out);
}

} // namespace eomacca
