/*
* @license
* (C) zachbabanov
*
*/

#ifndef FRAMECAST_FRAME_TRANSMITTER_HPP
#define FRAMECAST_FRAME_TRANSMITTER_HPP

#pragma once

#include <client_registry.hpp>
#include <udp_socket.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace framecast::transmit {

    struct FrameSendStats {
        bool sent = false;        // false: frame skipped (no clients, empty or oversized)
        uint32_t frame_id = 0;
        size_t chunk_count = 0;
        size_t destinations = 0;
        size_t packets_sent = 0;
        size_t packets_dropped = 0;
    };

    /**
     * @brief Fans one frame out to every live client: FRAME_START then CHUNK 0..n-1.
     *
     * Only the producer thread calls send_frame(). Nothing is acknowledged or retried;
     * when a destination's send would block, the rest of that frame for that
     * destination is dropped.
     */
    class FrameTransmitter {
    public:
        FrameTransmitter(framecast::net::DatagramSink &sink,
                         const framecast::registry::ClientRegistry &registry,
                         size_t payload_size);

        FrameSendStats send_frame(const char *data, size_t len);

        uint32_t next_frame_id() const { return next_frame_id_; }
        void set_next_frame_id(uint32_t id) { next_frame_id_ = id; }
        size_t payload_size() const { return payload_size_; }

        uint64_t frames_sent() const { return frames_sent_.load(); }
        uint64_t packets_sent() const { return packets_sent_.load(); }
        uint64_t packets_dropped() const { return packets_dropped_.load(); }

    private:
        framecast::net::DatagramSink &sink_;
        const framecast::registry::ClientRegistry &registry_;
        size_t payload_size_;
        uint32_t next_frame_id_;

        // read by the status reporter on another thread
        std::atomic<uint64_t> frames_sent_;
        std::atomic<uint64_t> packets_sent_;
        std::atomic<uint64_t> packets_dropped_;
    };

} // namespace framecast::transmit

#endif // FRAMECAST_FRAME_TRANSMITTER_HPP
