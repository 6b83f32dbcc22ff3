/*
* @license
* (C) zachbabanov
*
*/

#include <protocol.hpp>
#include <common.hpp>

#include <cstring>

using namespace framecast::common;
using namespace framecast::protocol;

static bool tag_equals(const char *data, size_t len, const char *tag) {
    size_t tag_len = std::strlen(tag);
    return len == tag_len && std::memcmp(data, tag, tag_len) == 0;
}

static bool has_prefix(const char *data, size_t len, const char *tag, size_t tag_len) {
    return len >= tag_len && std::memcmp(data, tag, tag_len) == 0;
}

std::vector<char> framecast::protocol::encode_frame_start(uint32_t frame_id, uint32_t frame_size, uint32_t chunk_count) {
    FrameStartFields f{};
    f.frame_id = hton_u32(frame_id);
    f.frame_size = hton_u32(frame_size);
    f.chunk_count = hton_u32(chunk_count);

    std::vector<char> out;
    out.reserve(FRAME_START_PACKET_SIZE);
    out.insert(out.end(), TAG_FRAME_START, TAG_FRAME_START + FRAME_START_TAG_LEN);
    out.insert(out.end(), (const char*)&f, ((const char*)&f) + sizeof(f));
    return out;
}

std::vector<char> framecast::protocol::encode_chunk(uint32_t frame_id, uint32_t chunk_index, const char *payload, size_t len) {
    ChunkFields f{};
    f.frame_id = hton_u32(frame_id);
    f.chunk_index = hton_u32(chunk_index);

    std::vector<char> out;
    out.reserve(CHUNK_HEADER_SIZE + len);
    out.insert(out.end(), TAG_CHUNK, TAG_CHUNK + CHUNK_TAG_LEN);
    out.insert(out.end(), (const char*)&f, ((const char*)&f) + sizeof(f));
    if (payload && len > 0) out.insert(out.end(), payload, payload + len);
    return out;
}

std::vector<char> framecast::protocol::encode_control(PacketType type) {
    const char *tag = nullptr;
    switch (type) {
        case PacketType::REGISTER_CLIENT: tag = TAG_REGISTER_CLIENT; break;
        case PacketType::REGISTERED:      tag = TAG_REGISTERED; break;
        case PacketType::KEEPALIVE:       tag = TAG_KEEPALIVE; break;
        case PacketType::DISCONNECT:      tag = TAG_DISCONNECT; break;
        default: return {};
    }
    return std::vector<char>(tag, tag + std::strlen(tag));
}

ParsedPacket framecast::protocol::parse_packet(const char *data, size_t len) {
    ParsedPacket pkt;
    if (!data || len == 0) return pkt;

    if (has_prefix(data, len, TAG_FRAME_START, FRAME_START_TAG_LEN)) {
        if (len != FRAME_START_PACKET_SIZE) return pkt;
        FrameStartFields f;
        memcpy(&f, data + FRAME_START_TAG_LEN, sizeof(f));
        pkt.type = PacketType::FRAME_START;
        pkt.frame_id = ntoh_u32(f.frame_id);
        pkt.frame_size = ntoh_u32(f.frame_size);
        pkt.chunk_count = ntoh_u32(f.chunk_count);
        return pkt;
    }

    if (has_prefix(data, len, TAG_CHUNK, CHUNK_TAG_LEN)) {
        if (len < CHUNK_HEADER_SIZE) return pkt;
        ChunkFields f;
        memcpy(&f, data + CHUNK_TAG_LEN, sizeof(f));
        pkt.type = PacketType::CHUNK;
        pkt.frame_id = ntoh_u32(f.frame_id);
        pkt.chunk_index = ntoh_u32(f.chunk_index);
        pkt.payload = data + CHUNK_HEADER_SIZE;
        pkt.payload_len = len - CHUNK_HEADER_SIZE;
        return pkt;
    }

    if (tag_equals(data, len, TAG_REGISTER_CLIENT)) pkt.type = PacketType::REGISTER_CLIENT;
    else if (tag_equals(data, len, TAG_REGISTERED)) pkt.type = PacketType::REGISTERED;
    else if (tag_equals(data, len, TAG_KEEPALIVE)) pkt.type = PacketType::KEEPALIVE;
    else if (tag_equals(data, len, TAG_DISCONNECT)) pkt.type = PacketType::DISCONNECT;
    return pkt;
}

const char *framecast::protocol::packet_type_name(PacketType type) {
    switch (type) {
        case PacketType::FRAME_START:     return "FRAME_START";
        case PacketType::CHUNK:           return "CHUNK";
        case PacketType::REGISTER_CLIENT: return "REGISTER_CLIENT";
        case PacketType::REGISTERED:      return "REGISTERED";
        case PacketType::KEEPALIVE:       return "KEEPALIVE";
        case PacketType::DISCONNECT:      return "DISCONNECT";
        case PacketType::MALFORMED:       return "MALFORMED";
    }
    return "MALFORMED";
}
