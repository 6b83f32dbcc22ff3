/*
* @license
* (C) zachbabanov
*
*/

#ifndef FRAMECAST_REASSEMBLER_HPP
#define FRAMECAST_REASSEMBLER_HPP

#pragma once

#include <common.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace framecast::assembly {

    using framecast::common::Clock;

    struct ReassemblerConfig {
        size_t payload_size = framecast::common::DEFAULT_PAYLOAD_SIZE;
        std::chrono::milliseconds stale_after = framecast::common::STALE_FRAME_AFTER;
        size_t max_frame_bytes = framecast::common::MAX_REASSEMBLY_BYTES;
        size_t max_pending_frames = framecast::common::MAX_PENDING_FRAMES;
    };

    //
    // PendingFrame: one frame between FRAME_START and its last CHUNK
    //
    struct PendingFrame {
        uint32_t frame_id = 0;
        uint32_t total_size = 0;
        uint32_t expected_chunk_count = 0;
        uint32_t remaining_count = 0;

        std::vector<char> buffer;         // size == total_size, zero-filled
        std::vector<char> chunk_received; // per-chunk marker (0/1)
        Clock::time_point created_at;
    };

    struct CompletedFrame {
        uint32_t frame_id = 0;
        std::vector<char> data;
        Clock::time_point started_at;
        Clock::time_point completed_at;
    };

    enum class StartResult {
        Started,
        Replaced, // an unfinished frame with the same id was discarded
        Rejected
    };

    enum class ChunkResult {
        Accepted,
        Completed,
        Duplicate,
        UnknownFrame,
        OutOfRange
    };

    struct ReassemblerStats {
        uint64_t frames_started = 0;
        uint64_t frames_completed = 0;
        uint64_t frames_replaced = 0;
        uint64_t frames_expired = 0;
        uint64_t frames_evicted = 0;  // pushed out by max_pending_frames
        uint64_t starts_rejected = 0;
        uint64_t chunks_accepted = 0;
        uint64_t chunks_rejected = 0;
        uint64_t chunks_unknown = 0;
        uint64_t chunks_duplicate = 0;
        uint64_t malformed = 0;
    };

    /**
     * @brief Receiver-side frame reassembly, keyed by frame id.
     *
     * Absent -> Assembling on FRAME_START; Assembling -> Complete when every chunk index
     * has been written; Complete hands the buffer out exactly once and forgets the id.
     * Assembling entries older than stale_after are dropped by expire_stale() without
     * being emitted. A FRAME_START for an id already Assembling restarts it from scratch.
     *
     * Not thread-safe: owned by the single receive loop.
     */
    class FrameReassembler {
    public:
        explicit FrameReassembler(const ReassemblerConfig &cfg = ReassemblerConfig());

        StartResult on_frame_start(uint32_t frame_id, uint32_t total_size, uint32_t chunk_count,
                                   Clock::time_point now);

        /// On ChunkResult::Completed `out` receives the assembled frame.
        ChunkResult on_chunk(uint32_t frame_id, uint32_t chunk_index, const char *payload, size_t len,
                             Clock::time_point now, CompletedFrame &out);

        /// Classify one datagram and feed it in. Control packets are ignored here.
        std::optional<CompletedFrame> handle_datagram(const char *data, size_t len, Clock::time_point now);

        /// Drop frames that stayed incomplete for longer than stale_after. Returns how many.
        size_t expire_stale(Clock::time_point now);

        /// Discard everything without emitting (shutdown / cancellation).
        void reset();

        size_t pending_count() const { return pending_.size(); }
        bool is_pending(uint32_t frame_id) const { return pending_.count(frame_id) != 0; }
        const PendingFrame *find(uint32_t frame_id) const;

        const ReassemblerStats &stats() const { return stats_; }
        const ReassemblerConfig &config() const { return cfg_; }

    private:
        void evict_oldest();

        ReassemblerConfig cfg_;
        std::unordered_map<uint32_t, PendingFrame> pending_;
        ReassemblerStats stats_;
    };

} // namespace framecast::assembly

#endif // FRAMECAST_REASSEMBLER_HPP
