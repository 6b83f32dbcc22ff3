/*
* @license
* (C) zachbabanov
*
*/

#include <chunker.hpp>
#include <common.hpp>
#include <protocol.hpp>

#include <algorithm>

using namespace framecast::chunk;

std::pair<size_t, size_t> ChunkPlan::range(size_t index) const {
    size_t first = index * payload_size;
    size_t last = std::min(first + payload_size, frame_size);
    return {first, last};
}

size_t framecast::chunk::effective_payload_size(size_t payload_size) {
    return payload_size == 0 ? framecast::common::DEFAULT_PAYLOAD_SIZE : payload_size;
}

ChunkPlan framecast::chunk::make_plan(size_t frame_size, size_t payload_size) {
    ChunkPlan plan;
    plan.frame_size = frame_size;
    plan.payload_size = effective_payload_size(payload_size);
    plan.chunk_count = (frame_size + plan.payload_size - 1) / plan.payload_size;
    return plan;
}

std::vector<Chunk> framecast::chunk::fragment(const char *data, size_t len, size_t payload_size) {
    ChunkPlan plan = make_plan(len, payload_size);
    std::vector<Chunk> chunks;
    chunks.reserve(plan.chunk_count);
    for (size_t i = 0; i < plan.chunk_count; ++i) {
        auto r = plan.range(i);
        Chunk c;
        c.index = (uint32_t)i;
        c.payload.assign(data + r.first, data + r.second);
        chunks.push_back(std::move(c));
    }
    return chunks;
}

std::vector<std::vector<char>> framecast::chunk::build_frame_packets(const char *data, size_t len, uint32_t frame_id, size_t payload_size) {
    ChunkPlan plan = make_plan(len, payload_size);

    std::vector<std::vector<char>> packets;
    packets.reserve(plan.chunk_count + 1);
    packets.push_back(protocol::encode_frame_start(frame_id, (uint32_t)len, (uint32_t)plan.chunk_count));

    // payloads are copied once, straight from the frame buffer into each datagram
    for (size_t i = 0; i < plan.chunk_count; ++i) {
        auto r = plan.range(i);
        packets.push_back(protocol::encode_chunk(frame_id, (uint32_t)i, data + r.first, r.second - r.first));
    }
    return packets;
}
