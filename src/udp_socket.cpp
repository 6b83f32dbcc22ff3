/*
* @license
* (C) zachbabanov
*
*/

#include <udp_socket.hpp>
#include <common.hpp>
#include <logger.hpp>

#include <cerrno>
#include <cstring>

#include <sys/socket.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>

using namespace framecast::net;
using namespace framecast::common;
using namespace framecast::log;

Endpoint Endpoint::from_sockaddr(const sockaddr_in &sa) {
    Endpoint e;
    e.ip = ntoh_u32(sa.sin_addr.s_addr);
    e.port = ntoh_u16(sa.sin_port);
    return e;
}

sockaddr_in Endpoint::to_sockaddr() const {
    sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_addr.s_addr = hton_u32(ip);
    sa.sin_port = hton_u16(port);
    return sa;
}

std::string Endpoint::to_string() const {
    in_addr a{};
    a.s_addr = hton_u32(ip);
    char hostbuf[INET_ADDRSTRLEN];
    if (!inet_ntop(AF_INET, &a, hostbuf, sizeof(hostbuf))) return "?:" + std::to_string(port);
    return std::string(hostbuf) + ":" + std::to_string(port);
}

bool framecast::net::resolve_endpoint(const std::string &host, uint16_t port, Endpoint &out) {
    in_addr a{};
    if (inet_pton(AF_INET, host.c_str(), &a) == 1) {
        out.ip = ntoh_u32(a.s_addr);
        out.port = port;
        return true;
    }

    addrinfo hints{};
    addrinfo *res = nullptr;
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    int rc = getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if (rc != 0 || !res) {
        LOG_NET_ERROR("getaddrinfo failed for {}: {}", host, gai_strerror(rc));
        return false;
    }
    const sockaddr_in *sa = (const sockaddr_in*)res->ai_addr;
    out.ip = ntoh_u32(sa->sin_addr.s_addr);
    out.port = port;
    freeaddrinfo(res);
    return true;
}

UdpSocket::UdpSocket() : fd_(INVALID_SOCK) {}

UdpSocket::~UdpSocket() {
    close();
}

bool UdpSocket::create() {
    close();
    fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd_ == INVALID_SOCK) {
        LOG_NET_ERROR("UDP socket creation failed: {}", strerror(errno));
        return false;
    }

    // Larger kernel buffers absorb chunk bursts from one frame
    setSocketBuffers(fd_, 4 * 1024 * 1024);

    if (setSocketNonBlocking(fd_) < 0) {
        closeSocket(fd_);
        fd_ = INVALID_SOCK;
        return false;
    }
    return true;
}

bool UdpSocket::open() {
    return create();
}

bool UdpSocket::bind_any(uint16_t port) {
    if (!create()) return false;

    int opt = 1;
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, (char*)&opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = hton_u16(port);
    if (bind(fd_, (sockaddr*)&addr, sizeof(addr)) < 0) {
        LOG_NET_ERROR("UDP bind failed on port {}: {}", port, strerror(errno));
        closeSocket(fd_);
        fd_ = INVALID_SOCK;
        return false;
    }
    LOG_NET_INFO("UDP socket bound on 0.0.0.0:{}", port);
    return true;
}

void UdpSocket::close() {
    if (fd_ != INVALID_SOCK) {
        closeSocket(fd_);
        fd_ = INVALID_SOCK;
    }
}

uint16_t UdpSocket::local_port() const {
    if (fd_ == INVALID_SOCK) return 0;
    sockaddr_in sa{};
    socklen_t sl = sizeof(sa);
    if (getsockname(fd_, (sockaddr*)&sa, &sl) != 0) return 0;
    return ntoh_u16(sa.sin_port);
}

SendResult UdpSocket::send_to(const Endpoint &dst, const char *data, size_t len) {
    if (fd_ == INVALID_SOCK) return SendResult::Failed;
    sockaddr_in sa = dst.to_sockaddr();
    ssize_t rc = sendto(fd_, data, len, MSG_DONTWAIT, (sockaddr*)&sa, sizeof(sa));
    if (rc < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == ENOBUFS) {
            return SendResult::WouldBlock;
        }
        LOG_NET_DEBUG("sendto {} failed: {}", dst.to_string(), strerror(errno));
        return SendResult::Failed;
    }
    if ((size_t)rc != len) {
        LOG_NET_DEBUG("sendto {} truncated ({}/{})", dst.to_string(), rc, len);
        return SendResult::Failed;
    }
    return SendResult::Sent;
}

ssize_t UdpSocket::recv_from(char *buf, size_t cap, Endpoint &src, int timeout_ms) {
    if (fd_ == INVALID_SOCK) return -1;

    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    int pr = poll(&pfd, 1, timeout_ms);
    if (pr < 0) {
        if (errno == EINTR) return 0;
        LOG_NET_ERROR("poll failed fd={}: {}", fd_, strerror(errno));
        return -1;
    }
    if (pr == 0) return 0;
    if (pfd.revents & (POLLERR | POLLNVAL)) {
        LOG_NET_ERROR("socket error reported by poll fd={} revents={}", fd_, pfd.revents);
        return -1;
    }

    sockaddr_in sa{};
    socklen_t sl = sizeof(sa);
    ssize_t n = recvfrom(fd_, buf, cap, 0, (sockaddr*)&sa, &sl);
    if (n < 0) {
        // ECONNREFUSED: ICMP port unreachable from an earlier send, not fatal for UDP
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR || errno == ECONNREFUSED) return 0;
        LOG_NET_ERROR("recvfrom failed fd={}: {}", fd_, strerror(errno));
        return -1;
    }
    src = Endpoint::from_sockaddr(sa);
    return n;
}
