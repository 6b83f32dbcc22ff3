/*
* @license
* (C) zachbabanov
*
*/

#ifndef FRAMECAST_CLIENT_REGISTRY_HPP
#define FRAMECAST_CLIENT_REGISTRY_HPP

#pragma once

#include <common.hpp>
#include <udp_socket.hpp>

#include <chrono>
#include <cstddef>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace framecast::registry {

    using framecast::common::Clock;
    using framecast::net::Endpoint;

    struct ClientSession {
        Endpoint address;
        Clock::time_point registered_at;
        Clock::time_point last_seen_at;
    };

    enum class RegisterResult {
        Registered, // new session
        Refreshed,  // already live, last_seen_at updated
        Refused     // registry full; no reply must be sent
    };

    /**
     * @brief Viewer table keyed by the exact observed source address.
     *
     * All operations lock one mutex; the map itself never leaves the class. The frame
     * transmitter iterates a snapshot copy, so fan-out never races with register/sweep.
     * Liveness changes only through register_client (insert) and sweep/disconnect (remove).
     */
    class ClientRegistry {
    public:
        explicit ClientRegistry(std::chrono::milliseconds timeout = framecast::common::CLIENT_TIMEOUT,
                                size_t max_clients = framecast::common::MAX_CLIENTS);

        RegisterResult register_client(const Endpoint &addr, Clock::time_point now);

        /// Refresh an existing session. Unknown addresses are ignored (no implicit registration).
        bool keepalive(const Endpoint &addr, Clock::time_point now);

        bool disconnect(const Endpoint &addr);

        /// Remove sessions silent for longer than the timeout; returns the evicted addresses.
        std::vector<Endpoint> sweep(Clock::time_point now);

        std::vector<Endpoint> snapshot() const;

        bool contains(const Endpoint &addr) const;
        size_t size() const;
        std::chrono::milliseconds timeout() const { return timeout_; }
        size_t max_clients() const { return max_clients_; }

    private:
        const std::chrono::milliseconds timeout_;
        const size_t max_clients_;

        mutable std::mutex mtx_;
        std::unordered_map<Endpoint, ClientSession, framecast::net::EndpointHash> sessions_;
    };

} // namespace framecast::registry

#endif // FRAMECAST_CLIENT_REGISTRY_HPP
