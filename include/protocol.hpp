/*
 * @license
 * (C) zachbabanov
 *
 */

#ifndef FRAMECAST_PROTOCOL_HPP
#define FRAMECAST_PROTOCOL_HPP

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace framecast::protocol {

/**
 * @brief Datagram kinds carried on the stream socket.
 *
 * Every datagram starts with an ASCII tag. Data packets append fixed-width
 * integer fields in network byte order (big-endian):
 *
 *   FRAME_START  "FRAME_START" | frame_id:u32 | frame_size:u32 | chunk_count:u32   (23 bytes)
 *   CHUNK        "CHUNK"       | frame_id:u32 | chunk_index:u32 | payload           (13 + n bytes)
 *
 * Control packets (REGISTER_CLIENT, REGISTERED, KEEPALIVE, DISCONNECT) are the
 * bare tag and nothing else.
 */
    enum class PacketType {
        FRAME_START,
        CHUNK,
        REGISTER_CLIENT,
        REGISTERED,
        KEEPALIVE,
        DISCONNECT,
        MALFORMED
    };

    constexpr char TAG_FRAME_START[] = "FRAME_START";
    constexpr char TAG_CHUNK[] = "CHUNK";
    constexpr char TAG_REGISTER_CLIENT[] = "REGISTER_CLIENT";
    constexpr char TAG_REGISTERED[] = "REGISTERED";
    constexpr char TAG_KEEPALIVE[] = "KEEPALIVE";
    constexpr char TAG_DISCONNECT[] = "DISCONNECT";

    constexpr size_t FRAME_START_TAG_LEN = sizeof(TAG_FRAME_START) - 1; // 11
    constexpr size_t CHUNK_TAG_LEN = sizeof(TAG_CHUNK) - 1;             // 5

#pragma pack(push,1)
    struct FrameStartFields {
        uint32_t frame_id;
        uint32_t frame_size;
        uint32_t chunk_count;
    };

    struct ChunkFields {
        uint32_t frame_id;
        uint32_t chunk_index;
    };
#pragma pack(pop)

    constexpr size_t FRAME_START_PACKET_SIZE = FRAME_START_TAG_LEN + sizeof(FrameStartFields); // 23
    constexpr size_t CHUNK_HEADER_SIZE = CHUNK_TAG_LEN + sizeof(ChunkFields);                 // 13

    static_assert(FRAME_START_PACKET_SIZE == 23, "FRAME_START must be 23 bytes");
    static_assert(CHUNK_HEADER_SIZE == 13, "CHUNK header must be 13 bytes");

    /**
     * @brief Result of classifying one datagram. Fields not relevant to `type` stay zero.
     *
     * For CHUNK, `payload` points into the caller's receive buffer and is only valid
     * while that buffer is.
     */
    struct ParsedPacket {
        PacketType type = PacketType::MALFORMED;
        uint32_t frame_id = 0;
        uint32_t frame_size = 0;
        uint32_t chunk_count = 0;
        uint32_t chunk_index = 0;
        const char *payload = nullptr;
        size_t payload_len = 0;
    };

    std::vector<char> encode_frame_start(uint32_t frame_id, uint32_t frame_size, uint32_t chunk_count);

    std::vector<char> encode_chunk(uint32_t frame_id, uint32_t chunk_index, const char *payload, size_t len);

    /// Bare-tag control packet. Returns an empty vector for FRAME_START/CHUNK/MALFORMED.
    std::vector<char> encode_control(PacketType type);

    ParsedPacket parse_packet(const char *data, size_t len);

    const char *packet_type_name(PacketType type);

} // namespace framecast::protocol

#endif // FRAMECAST_PROTOCOL_HPP
