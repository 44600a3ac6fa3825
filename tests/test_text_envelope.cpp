#include <doctest/doctest.h>
#include "eomacca/text_envelope.hpp"

#include <string>

using namespace eomacca;

static std::string as_text(const Bytes& b) { return std::string(b.begin(), b.end()); }

TEST_CASE("envelope build writes request line and fixed headers in order") {
    Bytes out;
    envelope::build(Bytes{'a', 'b', 'c'}, out);
    const std::string s = as_text(out);

    CHECK(s.rfind("POST /eomacca/v1/tunnel HTTP/1.1\r\n", 0) == 0);
    const size_t host = s.find("Host: eomacca.example.com\r\n");
    const size_t ctype = s.find("Content-Type: application/dns-message\r\n");
    const size_t clen = s.find("Content-Length: 3\r\n");
    const size_t ua = s.find("User-Agent: EoMacca/1.0 (Unnecessarily Complex Protocol)\r\n");
    const size_t cookie = s.find("Cookie: overhead=yes\r\n");
    const size_t conn = s.find("Connection: keep-alive\r\n\r\nabc");
    REQUIRE(conn != std::string::npos);
    CHECK(host < ctype);
    CHECK(ctype < clen);
    CHECK(clen < ua);
    CHECK(ua < cookie);
    CHECK(cookie < conn);
}

TEST_CASE("envelope parse splits head and body") {
    Bytes wire;
    envelope::build(Bytes{1, 2, 3, 4}, wire);

    envelope::Envelope e;
    REQUIRE(envelope::parse(wire, e) == Status::Ok);
    CHECK(e.method == "POST");
    CHECK(e.path == envelope::PATH);
    CHECK(e.version == "HTTP/1.1");
    CHECK(e.headers.size() == 6);
    CHECK(e.body == Bytes{1, 2, 3, 4});

    const std::string* len = envelope::find_header(e, "content-length");
    REQUIRE(len != nullptr);
    CHECK(*len == "4");
    CHECK(envelope::find_header(e, "X-Missing") == nullptr);
}

TEST_CASE("envelope body may contain the separator itself") {
    const std::string tricky = "before\r\n\r\nafter\r\n\r\n";
    Bytes body(tricky.begin(), tricky.end());
    body.push_back(0);
    body.push_back(0xFF);

    Bytes wire;
    envelope::build(body, wire);
    envelope::Envelope e;
    REQUIRE(envelope::parse(wire, e) == Status::Ok);
    CHECK(e.body == body);
}

TEST_CASE("envelope with an empty body") {
    Bytes wire;
    envelope::build(Bytes{}, wire);
    envelope::Envelope e;
    REQUIRE(envelope::parse(wire, e) == Status::Ok);
    CHECK(e.body.empty());
}

TEST_CASE("envelope without a blank line is TruncatedMessage") {
    const std::string s = "POST / HTTP/1.1\r\nHost: x\r\n";
    envelope::Envelope e;
    CHECK(envelope::parse(Bytes(s.begin(), s.end()), e) == Status::TruncatedMessage);
    CHECK(e.body.empty());
}

TEST_CASE("envelope ignores a wrong Content-Length") {
    const std::string s = "POST / HTTP/1.1\r\nContent-Length: 999\r\nbogus line\r\n\r\nxyz";
    envelope::Envelope e;
    REQUIRE(envelope::parse(Bytes(s.begin(), s.end()), e) == Status::Ok);
    CHECK(as_text(e.body) == "xyz");
    CHECK(e.headers.size() == 1);
}
