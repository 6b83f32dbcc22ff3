/*
* @license
* (C) zachbabanov
*
*/

#include <catch2/catch.hpp>

#include <chunker.hpp>
#include <protocol.hpp>

#include <vector>

using namespace framecast::chunk;
using namespace framecast::protocol;

static std::vector<char> pattern(size_t n) {
    std::vector<char> v(n);
    for (size_t i = 0; i < n; ++i) v[i] = (char)(i * 31 + 7);
    return v;
}

TEST_CASE("3000 bytes at 1200 per chunk", "[chunker]") {
    ChunkPlan plan = make_plan(3000, 1200);
    REQUIRE(plan.chunk_count == 3);
    REQUIRE(plan.range(0).first == 0);
    REQUIRE(plan.range(0).second == 1200);
    REQUIRE(plan.range(1).first == 1200);
    REQUIRE(plan.range(1).second == 2400);
    REQUIRE(plan.range(2).first == 2400);
    REQUIRE(plan.range(2).second == 3000);
}

TEST_CASE("exact multiple and single-byte frames", "[chunker]") {
    REQUIRE(make_plan(2400, 1200).chunk_count == 2);
    REQUIRE(make_plan(1, 1200).chunk_count == 1);
    REQUIRE(make_plan(1201, 1200).chunk_count == 2);
    REQUIRE(make_plan(0, 1200).chunk_count == 0);
}

TEST_CASE("payload size 0 falls back to the default", "[chunker]") {
    REQUIRE(effective_payload_size(0) == 1200);
    REQUIRE(effective_payload_size(500) == 500);

    auto data = pattern(1201);
    auto chunks = fragment(data.data(), data.size(), 0);
    REQUIRE(chunks.size() == 2);
    REQUIRE(chunks[0].payload.size() == 1200);
    REQUIRE(chunks[1].payload.size() == 1);
}

TEST_CASE("fragment covers the frame exactly once, in order", "[chunker]") {
    auto data = pattern(2500);
    auto chunks = fragment(data.data(), data.size(), 1000);
    REQUIRE(chunks.size() == 3);

    std::vector<char> joined;
    for (size_t i = 0; i < chunks.size(); ++i) {
        REQUIRE(chunks[i].index == i);
        joined.insert(joined.end(), chunks[i].payload.begin(), chunks[i].payload.end());
    }
    REQUIRE(joined == data);
    REQUIRE(chunks.back().payload.size() == 500);
}

TEST_CASE("build_frame_packets emits FRAME_START then every CHUNK", "[chunker]") {
    auto data = pattern(2500);
    auto packets = build_frame_packets(data.data(), data.size(), 42, 1000);
    REQUIRE(packets.size() == 4);

    ParsedPacket start = parse_packet(packets[0].data(), packets[0].size());
    REQUIRE(start.type == PacketType::FRAME_START);
    REQUIRE(start.frame_id == 42);
    REQUIRE(start.frame_size == 2500);
    REQUIRE(start.chunk_count == 3);

    for (size_t i = 1; i < packets.size(); ++i) {
        ParsedPacket c = parse_packet(packets[i].data(), packets[i].size());
        REQUIRE(c.type == PacketType::CHUNK);
        REQUIRE(c.frame_id == 42);
        REQUIRE(c.chunk_index == i - 1);
        REQUIRE(packets[i].size() <= CHUNK_HEADER_SIZE + 1000);
    }
}
