#include <doctest/doctest.h>
#include "eomacca/chunked_message.hpp"
#include "eomacca/base64.hpp"

#include <string>

using namespace eomacca;

TEST_CASE("split_chunks cuts at the limit and keeps order") {
    const std::string text(620, 'q');
    std::vector<message::TxtString> chunks;
    message::split_chunks(text, 250, chunks);
    REQUIRE(chunks.size() == 3);
    CHECK(chunks[0].size() == 250);
    CHECK(chunks[1].size() == 250);
    CHECK(chunks[2].size() == 120);

    std::string joined;
    message::join_chunks(chunks, joined);
    CHECK(joined == text);
}

TEST_CASE("split_chunks of empty text yields no chunks") {
    std::vector<message::TxtString> chunks;
    message::split_chunks(std::string(), 250, chunks);
    CHECK(chunks.empty());
}

TEST_CASE("split_chunks clamps the limit to what one string can hold") {
    std::vector<message::TxtString> chunks;
    message::split_chunks(std::string(600, 'a'), 10000, chunks);
    REQUIRE(chunks.size() == 3);
    CHECK(chunks[0].size() == message::TXT_STRING_MAX);

    message::split_chunks(std::string(3, 'a'), 0, chunks);
    CHECK(chunks.size() == 3);
}

TEST_CASE("message build: 1000 bytes become six ordered chunks") {
    const Bytes seg(1000, 'X');
    Bytes wire;
    REQUIRE(message::build(seg, wire) == Status::Ok);

    message::Message m;
    REQUIRE(message::parse_message(wire.data(), wire.size(), m) == Status::Ok);
    CHECK(m.flags == message::FLAGS_RESPONSE);
    CHECK(m.question_count == 1);
    CHECK(m.answer_count == 1);
    CHECK(std::string(m.question.c_str()) == message::RECORD_NAME);
    CHECK(std::string(m.answer_name.c_str()) == message::RECORD_NAME);   // via compression pointer
    CHECK(m.answer_type == message::TYPE_TXT);
    REQUIRE(m.chunks.size() == 6);
    for (size_t i = 0; i + 1 < m.chunks.size(); ++i) CHECK(m.chunks[i].size() == 250);
    CHECK(m.chunks.back().size() == 1336 - 5 * 250);

    Bytes back;
    REQUIRE(message::parse(wire, back) == Status::Ok);
    CHECK(back == seg);
}

TEST_CASE("message round trip for small and empty segments") {
    for (size_t n : {0u, 1u, 2u, 3u, 187u}) {
        Bytes seg(n);
        for (size_t i = 0; i < n; ++i) seg[i] = static_cast<uint8_t>(i * 7);
        Bytes wire, back;
        REQUIRE(message::build(seg, wire) == Status::Ok);
        REQUIRE(message::parse(wire, back) == Status::Ok);
        CHECK(back == seg);
    }
}

TEST_CASE("message build refuses a segment that overflows the record length") {
    Bytes seg(60000, 1);
    Bytes wire;
    CHECK(message::build(seg, wire) == Status::PayloadTooLarge);
    CHECK(wire.empty());
}

// Header + question for RECORD_NAME, answer of the given type, no rdata.
static Bytes hand_built(uint16_t ancount, uint16_t answer_type) {
    Bytes b;
    put_u16(b, 0x1234);
    put_u16(b, message::FLAGS_RESPONSE);
    put_u16(b, 1);
    put_u16(b, ancount);
    put_u16(b, 0);
    put_u16(b, 0);
    const char* labels[] = {"data", "eomacca", "example", "com"};
    for (const char* l : labels) {
        const std::string s(l);
        put_u8(b, static_cast<uint8_t>(s.size()));
        b.insert(b.end(), s.begin(), s.end());
    }
    put_u8(b, 0);
    put_u16(b, message::TYPE_TXT);
    put_u16(b, message::CLASS_IN);
    if (ancount) {
        put_u16(b, message::QUESTION_POINTER);
        put_u16(b, answer_type);
        put_u16(b, message::CLASS_IN);
        put_u32(b, 60);
        put_u16(b, 4);
        put_u32(b, 0x7F000001);
    }
    return b;
}

TEST_CASE("message parse: zero answers is NoAnswerRecord") {
    Bytes seg;
    CHECK(message::parse(hand_built(0, message::TYPE_TXT), seg) == Status::NoAnswerRecord);
    CHECK(seg.empty());
}

TEST_CASE("message parse: non-text answer is UnsupportedRecordType") {
    Bytes seg;
    CHECK(message::parse(hand_built(1, message::TYPE_A), seg) == Status::UnsupportedRecordType);
}

TEST_CASE("message parse: short or inconsistent input is MalformedHeader") {
    Bytes seg;
    CHECK(message::parse(Bytes(11, 0), seg) == Status::MalformedHeader);

    Bytes wire;
    REQUIRE(message::build(Bytes(40, 'z'), wire) == Status::Ok);
    wire.resize(wire.size() - 5);                    // rdata cut short
    CHECK(message::parse(wire, seg) == Status::MalformedHeader);
}

TEST_CASE("message parse: chunk text that is not base64 is MalformedHeader") {
    Bytes wire;
    REQUIRE(message::build(Bytes(6, 'z'), wire) == Status::Ok);
    wire.back() = '!';
    Bytes seg;
    CHECK(message::parse(wire, seg) == Status::MalformedHeader);
}

TEST_CASE("message parse: a self-referencing name pointer is rejected") {
    Bytes b;
    put_u16(b, 0);
    put_u16(b, message::FLAGS_RESPONSE);
    put_u16(b, 1);
    put_u16(b, 1);
    put_u16(b, 0);
    put_u16(b, 0);
    put_u16(b, message::QUESTION_POINTER);           // question name points at itself
    put_u16(b, message::TYPE_TXT);
    put_u16(b, message::CLASS_IN);
    Bytes seg;
    CHECK(message::parse(b, seg) == Status::MalformedHeader);
}
