#include <doctest/doctest.h>
#include "eomacca/slip.hpp"

using namespace eomacca;

static bool feed_all(slip::decoder& dec, const Bytes& wire, Bytes& frame) {
    bool got = false;
    for (uint8_t b : wire) got = dec.feed(b, frame) || got;
    return got;
}

TEST_CASE("slip encode escapes END and ESC") {
    Bytes out;
    slip::encode(Bytes{'h', 'i', 0xC0, 0xDB, 't'}, out);
    const Bytes expect = {0xC0, 'h', 'i', 0xDB, 0xDC, 0xDB, 0xDD, 't', 0xC0};
    CHECK(out == expect);
}

TEST_CASE("slip decoder restores a frame fed byte by byte") {
    Bytes payload(300);
    for (size_t i = 0; i < payload.size(); ++i) payload[i] = static_cast<uint8_t>(i);

    Bytes wire;
    slip::encode(payload, wire);
    slip::decoder dec;
    Bytes frame;
    REQUIRE(feed_all(dec, wire, frame));
    CHECK(frame == payload);
}

TEST_CASE("slip decoder separates back-to-back frames") {
    Bytes a, b;
    slip::encode(Bytes{1, 2}, a);
    slip::encode(Bytes{3}, b);
    a.insert(a.end(), b.begin(), b.end());

    slip::decoder dec;
    Bytes frame;
    std::vector<Bytes> got;
    for (uint8_t x : a) if (dec.feed(x, frame)) got.push_back(frame);
    REQUIRE(got.size() == 2);
    CHECK(got[0] == Bytes{1, 2});
    CHECK(got[1] == Bytes{3});
}

TEST_CASE("slip decoder ignores noise before the first END and empty frames") {
    const Bytes wire = {'n', 'o', 'i', 's', 'e', 0xC0, 0xC0, 0xC0, 'o', 'k', 0xC0};
    slip::decoder dec;
    Bytes frame;
    REQUIRE(feed_all(dec, wire, frame));
    CHECK(frame == Bytes{'o', 'k'});
}

TEST_CASE("slip decoder drops a frame with a bad escape and resyncs") {
    const Bytes wire = {0xC0, 'x', 0xDB, 0x01, 'y', 0xC0, 0xC0, 'z', 0xC0};
    slip::decoder dec;
    Bytes frame;
    std::vector<Bytes> got;
    for (uint8_t x : wire) if (dec.feed(x, frame)) got.push_back(frame);
    REQUIRE(got.size() == 1);
    CHECK(got[0] == Bytes{'z'});
}

TEST_CASE("slip decoder drops frames over the size limit") {
    slip::decoder dec;
    dec.max_frame = 4;
    Bytes big, small;
    slip::encode(Bytes(10, 'a'), big);
    slip::encode(Bytes{'b'}, small);
    big.insert(big.end(), small.begin(), small.end());

    Bytes frame;
    std::vector<Bytes> got;
    for (uint8_t x : big) if (dec.feed(x, frame)) got.push_back(frame);
    REQUIRE(got.size() == 1);
    CHECK(got[0] == Bytes{'b'});
}
