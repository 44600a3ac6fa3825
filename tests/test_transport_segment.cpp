#include <doctest/doctest.h>
#include "eomacca/transport_segment.hpp"

using namespace eomacca;

TEST_CASE("transport build writes ports, numbers, offset and flags") {
    Bytes out;
    transport::build(Bytes{'x'}, 31337, 31338, transport::FLAGS_PUSH_ACK, 1000, 1000, out);

    REQUIRE(out.size() == 21);
    CHECK(get_u16(out.data()) == 31337);
    CHECK(get_u16(out.data() + 2) == 31338);
    CHECK(get_u32(out.data() + 4) == 1000);
    CHECK(get_u32(out.data() + 8) == 1000);
    CHECK((out[12] >> 4) == 5);
    CHECK(out[13] == 0x18);
    CHECK(get_u16(out.data() + 14) == transport::DEFAULT_WINDOW);
    CHECK(out[20] == 'x');
}

TEST_CASE("transport parse recovers the segment") {
    Bytes wire;
    transport::build(Bytes{1, 2, 3}, 54321, 9999, transport::FLAGS_PUSH_ACK, 2000, 2000, wire);

    transport::Segment s;
    REQUIRE(transport::parse(wire, s) == Status::Ok);
    CHECK(s.src_port == 54321);
    CHECK(s.dst_port == 9999);
    CHECK(s.seq == 2000);
    CHECK(s.ack == 2000);
    CHECK(s.header_len == 20);
    CHECK(s.flags == transport::FLAGS_PUSH_ACK);
    CHECK(s.payload == Bytes{1, 2, 3});
}

TEST_CASE("transport parse error taxonomy") {
    Bytes wire;
    transport::build(Bytes{1, 2, 3, 4}, 1, 2, transport::FLAGS_PUSH_ACK, 0, 0, wire);
    transport::Segment s;

    SUBCASE("short input") {
        Bytes shortw(wire.begin(), wire.begin() + 10);
        CHECK(transport::parse(shortw, s) == Status::MalformedHeader);
    }
    SUBCASE("data offset below minimum") {
        wire[12] = 0x40;
        CHECK(transport::parse(wire, s) == Status::MalformedHeader);
    }
    SUBCASE("data offset past the end of input") {
        wire[12] = 0xF0;
        CHECK(transport::parse(wire, s) == Status::MalformedHeader);
    }
    SUBCASE("header with nothing after it") {
        Bytes bare;
        transport::build(Bytes{}, 1, 2, transport::FLAGS_PUSH_ACK, 0, 0, bare);
        CHECK(transport::parse(bare, s) == Status::MissingPayload);
    }
}
