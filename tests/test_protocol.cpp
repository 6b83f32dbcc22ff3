/*
* @license
* (C) zachbabanov
*
*/

#include <catch2/catch.hpp>

#include <protocol.hpp>

#include <cstring>
#include <string>
#include <vector>

using namespace framecast::protocol;

static ParsedPacket parse(const std::vector<char> &v) {
    return parse_packet(v.data(), v.size());
}

static ParsedPacket parse(const std::string &s) {
    return parse_packet(s.data(), s.size());
}

TEST_CASE("FRAME_START layout is tag plus three big-endian u32", "[protocol]") {
    auto pkt = encode_frame_start(0x01020304u, 3000, 3);
    REQUIRE(pkt.size() == 23);
    REQUIRE(std::string(pkt.data(), 11) == "FRAME_START");

    const unsigned char expected[12] = {
            0x01, 0x02, 0x03, 0x04,   // frame_id
            0x00, 0x00, 0x0B, 0xB8,   // 3000
            0x00, 0x00, 0x00, 0x03    // chunk_count
    };
    REQUIRE(std::memcmp(pkt.data() + 11, expected, sizeof(expected)) == 0);

    ParsedPacket p = parse(pkt);
    REQUIRE(p.type == PacketType::FRAME_START);
    REQUIRE(p.frame_id == 0x01020304u);
    REQUIRE(p.frame_size == 3000);
    REQUIRE(p.chunk_count == 3);
}

TEST_CASE("CHUNK layout is tag, ids, then raw payload", "[protocol]") {
    const char payload[] = "abcdef";
    auto pkt = encode_chunk(7, 2, payload, 6);
    REQUIRE(pkt.size() == 13 + 6);
    REQUIRE(std::string(pkt.data(), 5) == "CHUNK");
    REQUIRE((unsigned char)pkt[8] == 7);
    REQUIRE((unsigned char)pkt[12] == 2);

    ParsedPacket p = parse(pkt);
    REQUIRE(p.type == PacketType::CHUNK);
    REQUIRE(p.frame_id == 7);
    REQUIRE(p.chunk_index == 2);
    REQUIRE(p.payload_len == 6);
    REQUIRE(std::string(p.payload, p.payload_len) == "abcdef");
}

TEST_CASE("CHUNK with an empty payload is still a chunk", "[protocol]") {
    auto pkt = encode_chunk(1, 0, nullptr, 0);
    REQUIRE(pkt.size() == CHUNK_HEADER_SIZE);
    ParsedPacket p = parse(pkt);
    REQUIRE(p.type == PacketType::CHUNK);
    REQUIRE(p.payload_len == 0);
}

TEST_CASE("control packets are the bare tags", "[protocol]") {
    REQUIRE(parse(std::string("REGISTER_CLIENT")).type == PacketType::REGISTER_CLIENT);
    REQUIRE(parse(std::string("REGISTERED")).type == PacketType::REGISTERED);
    REQUIRE(parse(std::string("KEEPALIVE")).type == PacketType::KEEPALIVE);
    REQUIRE(parse(std::string("DISCONNECT")).type == PacketType::DISCONNECT);

    auto reg = encode_control(PacketType::REGISTER_CLIENT);
    REQUIRE(std::string(reg.begin(), reg.end()) == "REGISTER_CLIENT");
    REQUIRE(encode_control(PacketType::CHUNK).empty());
}

TEST_CASE("wrong lengths and unknown tags are malformed", "[protocol]") {
    // FRAME_START one byte short / long
    auto fs = encode_frame_start(1, 2, 1);
    REQUIRE(parse_packet(fs.data(), fs.size() - 1).type == PacketType::MALFORMED);
    fs.push_back(0);
    REQUIRE(parse(fs).type == PacketType::MALFORMED);

    // CHUNK header truncated
    auto ch = encode_chunk(1, 0, "x", 1);
    REQUIRE(parse_packet(ch.data(), 12).type == PacketType::MALFORMED);

    // control tags must match exactly
    REQUIRE(parse(std::string("KEEPALIVE\n")).type == PacketType::MALFORMED);
    REQUIRE(parse(std::string("REGISTER")).type == PacketType::MALFORMED);
    REQUIRE(parse(std::string("HELLO")).type == PacketType::MALFORMED);
    REQUIRE(parse_packet(nullptr, 0).type == PacketType::MALFORMED);
}
