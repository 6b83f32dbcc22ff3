/*
* @license
* (C) zachbabanov
*
*/

#ifndef FRAMECAST_SERVER_HPP
#define FRAMECAST_SERVER_HPP

#pragma once

#include <common.hpp>
#include <config.hpp>
#include <client_registry.hpp>
#include <frame_source.hpp>
#include <frame_transmitter.hpp>
#include <udp_socket.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>

namespace framecast {
    namespace server {

        using framecast::common::Clock;

        namespace helpers {

            enum class ControlAction {
                Registered,
                Refreshed,        // already known, REGISTERED sent again
                Refused,          // registry full, no reply
                KeepaliveAccepted,
                KeepaliveUnknown,
                Disconnected,
                DisconnectUnknown,
                Ignored,          // data or REGISTERED packets arriving at the server
                Malformed
            };

            /**
             * @brief Apply one datagram received on the server socket to the registry.
             *
             * REGISTER_CLIENT is answered with REGISTERED to `src` unless refused.
             */
            ControlAction handle_control_datagram(framecast::registry::ClientRegistry &registry,
                                                  framecast::net::DatagramSink &sink,
                                                  const char *data, size_t len,
                                                  const framecast::net::Endpoint &src,
                                                  Clock::time_point now);

        } // namespace helpers

        /**
         * @brief Sender side: one UDP socket, a control thread for registrations and
         * sweeping, and a producer loop pulling frames from a FrameSource.
         */
        class StreamServer {
        public:
            explicit StreamServer(const framecast::config::ServerConfig &cfg);
            ~StreamServer();

            StreamServer(const StreamServer&) = delete;
            StreamServer& operator=(const StreamServer&) = delete;

            /// Bind the UDP port and start the control thread. False if the socket cannot be bound.
            bool start();

            /// Stream `source` until it is exhausted or stop is requested.
            bool run(framecast::video::FrameSource &source);

            /// Only flips an atomic flag: safe from a signal handler.
            void request_stop() { stop_.store(true); }

            /// Idempotent: joins the control thread and closes the socket.
            void stop();

            bool stopping() const { return stop_.load(); }
            uint16_t bound_port() const { return socket_.local_port(); }
            const framecast::registry::ClientRegistry &registry() const { return registry_; }
            const framecast::transmit::FrameTransmitter &transmitter() const { return transmitter_; }

        private:
            void controlLoop();
            void reportStatus(Clock::time_point now);

        private:
            framecast::config::ServerConfig cfg_;
            framecast::net::UdpSocket socket_;
            framecast::registry::ClientRegistry registry_;
            framecast::transmit::FrameTransmitter transmitter_;

            std::thread control_thread_;
            std::atomic<bool> stop_;
            bool started_;

            // status reporting (control thread only)
            Clock::time_point last_status_;
            uint64_t frames_at_last_status_;
        };

    } // namespace server
} // namespace framecast

#endif // FRAMECAST_SERVER_HPP
