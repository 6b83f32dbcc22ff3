/*
* @license
* (C) zachbabanov
*
*/

#include <common.hpp>
#include <logger.hpp>

#include <cerrno>
#include <cstring>

#include <unistd.h>
#include <fcntl.h>
#include <sys/socket.h>
#include <arpa/inet.h>

namespace framecast {
    namespace common {

        using namespace framecast::log;

        int setSocketNonBlocking(sock_t fd) {
            int flags = fcntl(fd, F_GETFL, 0);
            if (flags == -1) {
                LOG_NET_WARN("fcntl F_GETFL failed: fd={} err={}", fd, strerror(errno));
                return -1;
            }
            if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
                LOG_NET_WARN("fcntl F_SETFL failed: fd={} err={}", fd, strerror(errno));
                return -1;
            }
            return 0;
        }

        void closeSocket(sock_t fd) {
            if (fd >= 0) {
                close(fd);
                LOG_NET_DEBUG("socket closed: {}", fd);
            }
        }

        int setSocketBuffers(sock_t fd, int bytes) {
            int rc = 0;
            // best-effort: the kernel may clamp to its configured maximum
            if (setsockopt(fd, SOL_SOCKET, SO_RCVBUF, (const char*)&bytes, sizeof(bytes)) != 0) {
                LOG_NET_DEBUG("setsockopt(SO_RCVBUF={}) failed fd={} err={}", bytes, (long long)fd, strerror(errno));
                rc = -1;
            }
            if (setsockopt(fd, SOL_SOCKET, SO_SNDBUF, (const char*)&bytes, sizeof(bytes)) != 0) {
                LOG_NET_DEBUG("setsockopt(SO_SNDBUF={}) failed fd={} err={}", bytes, (long long)fd, strerror(errno));
                rc = -1;
            }
            return rc;
        }

        uint32_t ntoh_u32(uint32_t v) { return ntohl(v); }
        uint16_t ntoh_u16(uint16_t v) { return ntohs(v); }
        uint32_t hton_u32(uint32_t v) { return htonl(v); }
        uint16_t hton_u16(uint16_t v) { return htons(v); }

    } // namespace common
} // namespace framecast
