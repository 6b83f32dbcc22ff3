/*
* @license
* (C) zachbabanov
*
*/

#ifndef FRAMECAST_COMMON_HPP
#define FRAMECAST_COMMON_HPP

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#define INVALID_SOCK (-1)

namespace framecast {
    namespace common {
        using sock_t = int;

        using Clock = std::chrono::steady_clock;

// Constants used across server/client
        constexpr uint16_t DEFAULT_PORT = 9999;
        constexpr size_t DEFAULT_PAYLOAD_SIZE = 1200;               // keeps datagrams under a typical path MTU
        constexpr size_t MAX_UDP_DATAGRAM = 65507;                  // largest IPv4 UDP payload
        constexpr size_t MAX_CLIENTS = 16;
        constexpr size_t MAX_REASSEMBLY_BYTES = 16 * 1024 * 1024;   // 16 MiB per pending frame
        constexpr size_t MAX_PENDING_FRAMES = 8;
        constexpr size_t MAX_PLAYER_BUFFER = 4 * 1024 * 1024;       // 4 MB soft
        constexpr size_t MAX_PLAYER_BUFFER_HARD = 16 * 1024 * 1024; // 16 MB hard

        constexpr std::chrono::seconds CLIENT_TIMEOUT{30};
        constexpr std::chrono::seconds KEEPALIVE_INTERVAL{15};
        constexpr std::chrono::seconds SWEEP_INTERVAL{5};
        constexpr std::chrono::seconds STATUS_INTERVAL{10};
        constexpr std::chrono::milliseconds STALE_FRAME_AFTER{500};
        constexpr int POLL_TICK_MS = 200;

//
// Utility functions
//
        int setSocketNonBlocking(sock_t fd);
        void closeSocket(sock_t fd);
        int setSocketBuffers(sock_t fd, int bytes);

        uint32_t ntoh_u32(uint32_t v);
        uint16_t ntoh_u16(uint16_t v);
        uint32_t hton_u32(uint32_t v);
        uint16_t hton_u16(uint16_t v);

        /// Milliseconds between two steady clock points, clamped at zero.
        inline int64_t elapsed_ms(Clock::time_point from, Clock::time_point to) {
            if (to <= from) return 0;
            return std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count();
        }

    } // namespace common
} // namespace framecast

#endif // FRAMECAST_COMMON_HPP
