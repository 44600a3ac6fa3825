#include <doctest/doctest.h>
#include "eomacca/client.hpp"
#include "eomacca/server.hpp"
#include "eomacca/slip.hpp"
#include "eomacca/tcp_io.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <filesystem>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <unistd.h>

using namespace eomacca;

static Bytes B(const std::string& s) { return Bytes(s.begin(), s.end()); }
static std::string S(const Bytes& b) { return std::string(b.begin(), b.end()); }
static double fixed_clock() { return 1700000000.0; }

static Bytes exchange(Server& server, const Stack& stack, const Bytes& payload) {
    Bytes request, response, reply;
    REQUIRE(stack.encapsulate(payload, request) == Status::Ok);
    REQUIRE(server.handle_packet(request, response) == Status::Ok);
    REQUIRE(stack.decapsulate(response, reply) == Status::Ok);
    return reply;
}

TEST_CASE("Server echo mode answers with the same payload") {
    const Stack stack;
    ServerOptions opts;
    Server server(stack, opts, fixed_clock);

    CHECK(S(exchange(server, stack, B("hello"))) == "hello");
    CHECK(server.stats().packets_received == 1);
    CHECK(server.stats().packets_sent == 1);
    CHECK(server.stats().total_overhead > 0);
}

TEST_CASE("Server file mode stores the upload") {
    const Stack stack;
    ServerOptions opts;
    opts.mode = Mode::File;
    Server server(stack, opts, fixed_clock);

    const Bytes reply = exchange(server, stack, make_file_payload("a.txt", B("content")));
    CHECK(S(reply) == "File 'a.txt' received (7 bytes)");
    CHECK(server.handler().files().count("a.txt") == 1);
}

TEST_CASE("Server file mode with a save directory writes the upload and forgets it") {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / ("eomacca_srv_" + std::to_string(::getpid()));

    const Stack stack;
    ServerOptions opts;
    opts.mode = Mode::File;
    opts.save_dir = dir.string();
    Server server(stack, opts, fixed_clock);

    CHECK(S(exchange(server, stack, make_file_payload("b.txt", B("xyz")))) == "File 'b.txt' received (3 bytes)");
    CHECK(fs::file_size(dir / "b.txt") == 3);
    CHECK(server.handler().files().empty());

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST_CASE("Server answers an undecodable packet with an encapsulated error") {
    const Stack stack;
    ServerOptions opts;
    Server server(stack, opts, fixed_clock);

    Bytes response, reply;
    REQUIRE(server.handle_packet(B("not a valid packet"), response) == Status::Ok);
    REQUIRE(stack.decapsulate(response, reply) == Status::Ok);
    CHECK(S(reply).rfind("Error: ", 0) == 0);
    CHECK(server.stats().packets_received == 0);
    CHECK(server.stats().packets_sent == 1);
}

TEST_CASE("make_file_payload prefixes a big-endian name length") {
    const Bytes p = make_file_payload("ab", Bytes{9});
    REQUIRE(p.size() == 7);
    CHECK(get_u32(p.data()) == 2);
    CHECK(p[4] == 'a');
    CHECK(p[5] == 'b');
    CHECK(p[6] == 9);
}

TEST_CASE("ping payload and reply parsing") {
    CHECK(make_ping_payload(12.5) == "12.500000");

    double c = 0, s = 0;
    REQUIRE(parse_ping_reply("12.500000,13.250000", c, s));
    CHECK(c == doctest::Approx(12.5));
    CHECK(s == doctest::Approx(13.25));

    CHECK_FALSE(parse_ping_reply("Error: Invalid ping format", c, s));
    CHECK_FALSE(parse_ping_reply("1,2,3", c, s));
    CHECK_FALSE(parse_ping_reply("1,", c, s));
}

TEST_CASE("write_frame and read_frame carry a packet over a socket") {
    int sv[2];
    REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv) == 0);

    Bytes packet(5000);
    for (size_t i = 0; i < packet.size(); ++i) packet[i] = static_cast<uint8_t>(i);
    REQUIRE(write_frame(sv[0], packet));

    Bytes got;
    CHECK(read_frame(sv[1], got, 1000) == ReadResult::Frame);
    CHECK(got == packet);

    close_socket(sv[0]);
    close_socket(sv[1]);
}

TEST_CASE("read_frame distinguishes timeout from a closed peer") {
    int sv[2];
    REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv) == 0);

    Bytes got;
    CHECK(read_frame(sv[1], got, 50) == ReadResult::Timeout);

    close_socket(sv[0]);
    CHECK(read_frame(sv[1], got, 50) == ReadResult::Closed);
    close_socket(sv[1]);
}

TEST_CASE("connect_to reaches a loopback listener and leaves the socket blocking") {
    std::string err;
    const int lfd = open_listener("127.0.0.1", 0, 1, err);
    REQUIRE(lfd >= 0);

    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    REQUIRE(::getsockname(lfd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    const uint16_t port = ntohs(addr.sin_port);

    const int cfd = connect_to("127.0.0.1", port, 1000, err);
    REQUIRE(cfd >= 0);
    CHECK(err.empty());
    const int flags = ::fcntl(cfd, F_GETFL, 0);
    REQUIRE(flags >= 0);
    CHECK((flags & O_NONBLOCK) == 0);

    std::string peer;
    const int afd = accept_client(lfd, 1000, peer, err);
    REQUIRE(afd >= 0);
    REQUIRE(write_frame(cfd, B("over tcp")));
    Bytes got;
    CHECK(read_frame(afd, got, 1000) == ReadResult::Frame);
    CHECK(S(got) == "over tcp");

    close_socket(afd);
    close_socket(cfd);
    close_socket(lfd);

    // the port is free again, so connecting must fail with a reason
    CHECK(connect_to("127.0.0.1", port, 1000, err) < 0);
    CHECK_FALSE(err.empty());
}
