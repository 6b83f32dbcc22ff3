/*
* @license
* (C) zachbabanov
*
*/

#ifndef FRAMECAST_CLIENT_HPP
#define FRAMECAST_CLIENT_HPP

#pragma once

#include <common.hpp>
#include <config.hpp>
#include <frame_sink.hpp>
#include <protocol.hpp>
#include <reassembler.hpp>
#include <udp_socket.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace framecast {
    namespace client {

        using framecast::common::Clock;

        /**
         * @brief Receiver side: registers with the server, keeps the session alive and
         * hands every reassembled frame to a FrameSink.
         *
         * run() owns the reassembler; the keepalive thread only sends. Call stop() from the
         * thread that called run(), after it has returned (request_stop() is the cross-thread way).
         */
        class ViewerClient {
        public:
            ViewerClient(const framecast::config::ClientConfig &cfg, framecast::video::FrameSink &sink);
            ~ViewerClient();

            ViewerClient(const ViewerClient&) = delete;
            ViewerClient& operator=(const ViewerClient&) = delete;

            /// Resolve the server, send REGISTER_CLIENT and wait for REGISTERED (with retries).
            bool connect();

            /// Receive loop. Returns false on socket failure or when the sink gives up.
            bool run();

            /// Only flips an atomic flag: safe from a signal handler.
            void request_stop() { stop_.store(true); }

            /// Sends DISCONNECT, joins the keepalive thread and discards unfinished frames.
            void stop();

            bool registered() const { return registered_.load(); }
            uint64_t frames_completed() const { return frames_completed_; }
            const framecast::assembly::FrameReassembler &reassembler() const { return reassembler_; }

        private:
            bool waitForRegistered(std::chrono::milliseconds timeout);
            bool sendControl(framecast::protocol::PacketType type);
            void keepaliveLoop();
            void reportStats(Clock::time_point now);

        private:
            framecast::config::ClientConfig cfg_;
            framecast::video::FrameSink &sink_;
            framecast::net::UdpSocket socket_;
            framecast::net::Endpoint server_;
            framecast::assembly::FrameReassembler reassembler_;

            std::atomic<bool> stop_;
            std::atomic<bool> registered_;

            std::thread keepalive_thread_;
            std::mutex ka_mtx_;
            std::condition_variable ka_cv_;

            // receive loop only
            uint64_t frames_completed_;
            uint64_t frames_at_last_stats_;
            Clock::time_point last_stats_;
            Clock::time_point last_rx_;
            Clock::time_point last_reregister_;
        };

    } // namespace client
} // namespace framecast

#endif // FRAMECAST_CLIENT_HPP
