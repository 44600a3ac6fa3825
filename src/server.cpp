// ============================================================================
// server.cpp — implementation for server.hpp
// ============================================================================
#include "eomacca/server.hpp"
#include "eomacca/tcp_io.hpp"

#include <iostream>

namespace eomacca {

Server::Server(const Stack& stack, const ServerOptions& opts, std::function<double()> clock)
: stack_(stack), opts_(opts), handler_(std::move(clock)) {
}

Status Server::handle_packet(const Bytes& packet, Bytes& response) {
  Bytes payload;
  Stage stage = Stage::Start;
  Status st = stack_.decapsulate(packet, payload, &stage);

  Bytes reply;
  if (st != Status::Ok) {
    std::cerr << "status=error reason=" << status_name(st)
              << " stage=" << stage_name(stage)
              << " bytes=" << packet.size() << "\n";
    const std::string msg = std::string("Error: ") + status_message(st);
    reply.assign(msg.begin(), msg.end());
  } else {
    handler_.stats().update_received(packet.size(), payload.size());
    std::cout << "event=decapsulated packet=" << packet.size()
              << " payload=" << payload.size() << "\n";
    reply = handler_.handle(payload, opts_.mode);

    if (opts_.mode == Mode::File && !opts_.save_dir.empty() && payload.size() >= 4) {
      const size_t name_len = get_u32(payload.data());
      if (payload.size() - 4 >= name_len) {
        const std::string name(payload.begin() + 4,
                               payload.begin() + 4 + static_cast<std::ptrdiff_t>(name_len));
        std::string err;
        if (handler_.save_file(name, opts_.save_dir, err)) {
          handler_.drop_file(name);
        } else {
          std::cerr << "status=error reason=save_failed detail=" << log_quote(err) << "\n";
        }
      }
    }
  }

  Status est = stack_.encapsulate(reply, response);
  if (est != Status::Ok) {
    std::cerr << "status=error reason=" << status_name(est) << " stage=encapsulate\n";
    return est;
  }
  handler_.stats().update_sent(response.size());
  return Status::Ok;
}

void Server::serve_client(int fd, const std::string& peer) {
  std::cout << "event=connect peer=" << peer << "\n";

  Bytes packet;
  ReadResult rr = read_frame(fd, packet, opts_.read_timeout_ms);
  if (rr != ReadResult::Frame) {
    std::cerr << "status=error reason=read_" << read_result_name(rr)
              << " peer=" << peer << "\n";
    close_socket(fd);
    return;
  }

  Bytes response;
  if (handle_packet(packet, response) == Status::Ok) {
    if (!write_frame(fd, response)) {
      std::cerr << "status=error reason=write_failed peer=" << peer << "\n";
    } else {
      std::cout << "event=reply peer=" << peer << " bytes=" << response.size() << "\n";
    }
  }
  close_socket(fd);
}

bool Server::run(const std::atomic<bool>& stop, std::string& err) {
  int lfd = open_listener(opts_.host, opts_.port, opts_.backlog, err);
  if (lfd < 0) return false;

  std::cout << "event=listening host=" << opts_.host << " port=" << opts_.port
            << " mode=" << mode_name(opts_.mode) << "\n";

  while (!stop.load()) {
    std::string peer, aerr;
    int cfd = accept_client(lfd, opts_.accept_timeout_ms, peer, aerr);
    if (cfd < 0) {
      if (!aerr.empty()) std::cerr << "status=error reason=accept detail=" << log_quote(aerr) << "\n";
      continue;
    }
    serve_client(cfd, peer);
  }

  close_socket(lfd);
  std::cout << "event=shutdown stats=" << handler_.stats().to_json(handler_.now()).dump() << "\n";
  return true;
}

} // namespace eomacca
