/*
* @license
* (C) zachbabanov
*
*/

#ifndef FRAMECAST_CHUNKER_HPP
#define FRAMECAST_CHUNKER_HPP

#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace framecast::chunk {

/**
 * @brief Chunk layout derived from (frame_size, payload_size). Never stored on the wire.
 *
 * chunk_count = ceil(frame_size / payload_size); chunk i covers
 * [i*payload_size, min((i+1)*payload_size, frame_size)).
 */
    struct ChunkPlan {
        size_t frame_size = 0;
        size_t payload_size = 0;
        size_t chunk_count = 0;

        /// Half-open byte range [first, second) of chunk `index`. Caller keeps index < chunk_count.
        std::pair<size_t, size_t> range(size_t index) const;
    };

    struct Chunk {
        uint32_t index;
        std::vector<char> payload;
    };

    /// payload_size == 0 selects DEFAULT_PAYLOAD_SIZE.
    size_t effective_payload_size(size_t payload_size);

    ChunkPlan make_plan(size_t frame_size, size_t payload_size);

    /// Split `data` into ordered chunks. An empty buffer yields no chunks.
    std::vector<Chunk> fragment(const char *data, size_t len, size_t payload_size);

    /**
     * @brief Full packet sequence for one frame: FRAME_START followed by one CHUNK per plan entry.
     *
     * `len` must fit the 32-bit frame_size field; the transmitter checks that before calling.
     */
    std::vector<std::vector<char>> build_frame_packets(const char *data, size_t len, uint32_t frame_id, size_t payload_size);

} // namespace framecast::chunk

#endif // FRAMECAST_CHUNKER_HPP
