#include <doctest/doctest.h>
#include "eomacca/network_packet.hpp"

using namespace eomacca;

static const Ipv4Address SRC = make_ipv4(10, 255, 255, 1);
static const Ipv4Address DST = make_ipv4(10, 255, 255, 2);

TEST_CASE("network build writes a valid IPv4 header") {
    Bytes payload(100, 0x5A);
    Bytes out;
    network::build(payload, SRC, DST, out);

    REQUIRE(out.size() == 120);
    CHECK(out[0] == 0x45);                       // version 4, IHL 5
    CHECK(get_u16(out.data() + 2) == 120);       // total length
    CHECK(out[8] == network::DEFAULT_TTL);
    CHECK(out[9] == network::PROTO_TCP);
    CHECK(get_u32(out.data() + 12) == SRC);
    CHECK(get_u32(out.data() + 16) == DST);

    // summing a header that carries its own checksum gives zero
    CHECK(network::checksum(out.data(), network::HEADER_SIZE) == 0);
}

TEST_CASE("network checksum matches a known header") {
    // classic example header from RFC 1071 walkthroughs; checksum field zeroed
    const uint8_t hdr[20] = {0x45, 0x00, 0x00, 0x73, 0x00, 0x00, 0x40, 0x00, 0x40, 0x11,
                             0x00, 0x00, 0xc0, 0xa8, 0x00, 0x01, 0xc0, 0xa8, 0x00, 0xc7};
    CHECK(network::checksum(hdr, sizeof(hdr)) == 0xb861);
}

TEST_CASE("network parse recovers fields and payload") {
    Bytes wire;
    network::build(Bytes{9, 8, 7}, SRC, DST, wire);

    network::Packet p;
    REQUIRE(network::parse(wire, p) == Status::Ok);
    CHECK(p.header_len == 20);
    CHECK(p.total_len == 23);
    CHECK(p.protocol == network::PROTO_TCP);
    CHECK(p.src == SRC);
    CHECK(p.dst == DST);
    CHECK(p.payload == Bytes{9, 8, 7});
}

TEST_CASE("network parse accepts an empty payload") {
    Bytes wire;
    network::build(Bytes{}, SRC, DST, wire);
    network::Packet p;
    CHECK(network::parse(wire, p) == Status::Ok);
    CHECK(p.payload.empty());
}

TEST_CASE("network parse error taxonomy") {
    Bytes wire;
    network::build(Bytes{1, 2, 3, 4}, SRC, DST, wire);
    network::Packet p;

    SUBCASE("short input") {
        Bytes shortw(wire.begin(), wire.begin() + 19);
        CHECK(network::parse(shortw, p) == Status::MalformedHeader);
    }
    SUBCASE("wrong version") {
        wire[0] = 0x65;
        CHECK(network::parse(wire, p) == Status::MalformedHeader);
    }
    SUBCASE("IHL below minimum") {
        wire[0] = 0x44;
        CHECK(network::parse(wire, p) == Status::MalformedHeader);
    }
    SUBCASE("IHL past the end of input") {
        wire[0] = 0x4F;                          // 60-byte header, only 24 bytes present
        CHECK(network::parse(wire, p) == Status::MissingPayload);
    }
    SUBCASE("protocol mismatch") {
        wire[9] = 17;
        CHECK(network::parse(wire, p) == Status::UnexpectedProtocol);
    }
}

TEST_CASE("network total length field is zero when the packet exceeds 16 bits") {
    Bytes big(70000, 0);
    Bytes wire;
    network::build(big, SRC, DST, wire);
    CHECK(get_u16(wire.data() + 2) == 0);

    network::Packet p;
    REQUIRE(network::parse(wire, p) == Status::Ok);
    CHECK(p.payload.size() == 70000);
}
