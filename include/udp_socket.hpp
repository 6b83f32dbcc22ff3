/*
* @license
* (C) zachbabanov
*
*/

#ifndef FRAMECAST_UDP_SOCKET_HPP
#define FRAMECAST_UDP_SOCKET_HPP

#pragma once

#include <common.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

#include <sys/types.h>
#include <netinet/in.h>

namespace framecast::net {

    using framecast::common::sock_t;

    /**
     * @brief IPv4 address + UDP port as observed on the wire. Both fields in host byte order.
     */
    struct Endpoint {
        uint32_t ip = 0;
        uint16_t port = 0;

        static Endpoint from_sockaddr(const sockaddr_in &sa);
        sockaddr_in to_sockaddr() const;
        std::string to_string() const;

        bool operator==(const Endpoint &o) const { return ip == o.ip && port == o.port; }
        bool operator!=(const Endpoint &o) const { return !(*this == o); }
        bool operator<(const Endpoint &o) const { return ip != o.ip ? ip < o.ip : port < o.port; }
    };

    struct EndpointHash {
        size_t operator()(const Endpoint &e) const noexcept {
            return (size_t)(((uint64_t)e.ip << 16) | e.port);
        }
    };

    /// Resolve host (dotted quad or name) to an IPv4 endpoint.
    bool resolve_endpoint(const std::string &host, uint16_t port, Endpoint &out);

    enum class SendResult {
        Sent,
        WouldBlock, // kernel buffer full, datagram dropped
        Failed
    };

    /**
     * @brief Outbound datagram seam. UdpSocket is the production implementation; tests capture
     * datagrams through their own sink.
     */
    class DatagramSink {
    public:
        virtual ~DatagramSink() = default;
        virtual SendResult send_to(const Endpoint &dst, const char *data, size_t len) = 0;
    };

    /**
     * @brief Owns one AF_INET datagram socket. Sends never block; receives wait at most timeout_ms.
     */
    class UdpSocket : public DatagramSink {
    public:
        UdpSocket();
        ~UdpSocket() override;

        UdpSocket(const UdpSocket&) = delete;
        UdpSocket& operator=(const UdpSocket&) = delete;

        /// Create an unbound socket (client side; the kernel picks the source port on first send).
        bool open();

        /// Create the socket and bind it to 0.0.0.0:port. Failure is fatal for the caller.
        bool bind_any(uint16_t port);

        void close();
        bool is_open() const { return fd_ != INVALID_SOCK; }
        sock_t fd() const { return fd_; }
        uint16_t local_port() const;

        SendResult send_to(const Endpoint &dst, const char *data, size_t len) override;

        /**
         * @brief Receive one datagram.
         * @return bytes received, 0 on timeout (or interrupted wait), -1 on socket error.
         */
        ssize_t recv_from(char *buf, size_t cap, Endpoint &src, int timeout_ms);

    private:
        bool create();

        sock_t fd_;
    };

} // namespace framecast::net

#endif // FRAMECAST_UDP_SOCKET_HPP
