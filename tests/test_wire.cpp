#include <doctest/doctest.h>
#include "eomacca/wire.hpp"
#include "eomacca/base64.hpp"

#include <string>

using namespace eomacca;

TEST_CASE("put_* writes big-endian and get_* reads it back") {
    Bytes b;
    put_u8(b, 0xAB);
    put_u16(b, 0x1234);
    put_u32(b, 0xDEADBEEF);
    REQUIRE(b.size() == 7);
    CHECK(b[0] == 0xAB);
    CHECK(b[1] == 0x12);
    CHECK(b[2] == 0x34);
    CHECK(b[3] == 0xDE);
    CHECK(b[6] == 0xEF);
    CHECK(get_u16(b.data() + 1) == 0x1234);
    CHECK(get_u32(b.data() + 3) == 0xDEADBEEF);

    patch_u16(b, 1, 0xBEEF);
    CHECK(get_u16(b.data() + 1) == 0xBEEF);
}

TEST_CASE("parse_mac accepts canonical text and formats lowercase") {
    MacAddress m{};
    REQUIRE(parse_mac("DE:AD:be:ef:CA:fe", m));
    CHECK(m == make_mac(0xde, 0xad, 0xbe, 0xef, 0xca, 0xfe));
    CHECK(std::string(format_mac(m).c_str()) == "de:ad:be:ef:ca:fe");
}

TEST_CASE("parse_mac rejects malformed text and leaves output untouched") {
    MacAddress m = make_mac(1, 2, 3, 4, 5, 6);
    CHECK_FALSE(parse_mac("de:ad:be:ef:ca", m));
    CHECK_FALSE(parse_mac("de:ad:be:ef:ca:fe:00", m));
    CHECK_FALSE(parse_mac("de-ad-be-ef-ca-fe", m));
    CHECK_FALSE(parse_mac("zz:ad:be:ef:ca:fe", m));
    CHECK_FALSE(parse_mac(nullptr, m));
    CHECK(m == make_mac(1, 2, 3, 4, 5, 6));
}

TEST_CASE("parse_ipv4 round-trips dotted quads") {
    Ipv4Address a = 0;
    REQUIRE(parse_ipv4("10.255.255.1", a));
    CHECK(a == make_ipv4(10, 255, 255, 1));
    CHECK(std::string(format_ipv4(a).c_str()) == "10.255.255.1");

    REQUIRE(parse_ipv4("0.0.0.0", a));
    CHECK(a == 0u);
}

TEST_CASE("parse_ipv4 rejects out-of-range or partial addresses") {
    Ipv4Address a = 7;
    CHECK_FALSE(parse_ipv4("256.1.1.1", a));
    CHECK_FALSE(parse_ipv4("1.2.3", a));
    CHECK_FALSE(parse_ipv4("1.2.3.4.5", a));
    CHECK_FALSE(parse_ipv4("1.2.3.4 ", a));
    CHECK_FALSE(parse_ipv4("1..3.4", a));
    CHECK_FALSE(parse_ipv4("0001.2.3.4", a));
    CHECK(a == 7u);
}

TEST_CASE("base64 encodes the RFC 4648 test vectors") {
    auto enc = [](const std::string& s) {
        std::string out;
        base64::encode(reinterpret_cast<const uint8_t*>(s.data()), s.size(), out);
        return out;
    };
    CHECK(enc("") == "");
    CHECK(enc("f") == "Zg==");
    CHECK(enc("fo") == "Zm8=");
    CHECK(enc("foo") == "Zm9v");
    CHECK(enc("foob") == "Zm9vYg==");
    CHECK(enc("fooba") == "Zm9vYmE=");
    CHECK(enc("foobar") == "Zm9vYmFy");
    CHECK(base64::encoded_size(1000) == 1336);
}

TEST_CASE("base64 decode restores every byte value") {
    Bytes all(256);
    for (size_t i = 0; i < all.size(); ++i) all[i] = static_cast<uint8_t>(i);

    std::string text;
    base64::encode(all.data(), all.size(), text);
    Bytes back;
    REQUIRE(base64::decode(text, back));
    CHECK(back == all);
}

TEST_CASE("base64 decode is strict about length, alphabet and padding") {
    Bytes out;
    CHECK_FALSE(base64::decode(std::string("Zm9"), out));        // not a multiple of 4
    CHECK_FALSE(base64::decode(std::string("Zm9v!A=="), out));   // bad character
    CHECK_FALSE(base64::decode(std::string("Zg==Zm9v"), out));   // padding before the end
    CHECK(out.empty());

    REQUIRE(base64::decode(std::string(""), out));
    CHECK(out.empty());
}
