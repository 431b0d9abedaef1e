#include <cerrno>
#include <cstring>
#include <cstdio>
#include <string>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/time.h>
#include <unistd.h>

#include "wtftp.hpp"

static uint8_t recvbuffer[WTFTP_MAX_PACKET_SIZE];

int wtftp_resolve(const char *host, uint16_t port, bool passive, struct addrinfo **addrs) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_DGRAM;
    hints.ai_protocol = IPPROTO_UDP;
    if (passive) hints.ai_flags = AI_PASSIVE;

    std::string service = std::to_string(port);
    int r = getaddrinfo(host, service.c_str(), &hints, addrs);
    if (r != 0)
        return wtftp_set_sys_error(WTFTP_SYSERR_RESOLV, r);
    if (*addrs == NULL)
        return wtftp_set_error(WTFTP_SYSERR_NOIP);
    return WTFTP_OK;
}

int wtftp_open(const struct addrinfo *addr) {
    int fd = ::socket(addr->ai_family, addr->ai_socktype, addr->ai_protocol);
    if (fd < 0) {
        wtftp_set_sys_error(WTFTP_SYSERR_SOCKET, errno);
        return -1;
    }
    return fd;
}

int wtftp_bind(const struct addrinfo *addr) {
    int fd = wtftp_open(addr);
    if (fd < 0) return -1;

    int yes = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) < 0) {
        wtftp_set_sys_error(WTFTP_SYSERR_SOCKET, errno);
        close(fd);
        return -1;
    }

    if (::bind(fd, addr->ai_addr, addr->ai_addrlen) < 0) {
        wtftp_set_sys_error(WTFTP_SYSERR_BIND, errno);
        close(fd);
        return -1;
    }

    return fd;
}

int wtftp_get_sa_addr_str(const struct sockaddr *addr, char *str, size_t strlen) {
    char ip[INET6_ADDRSTRLEN];
    uint16_t port = 0;
    int n = 0;

    if (addr->sa_family == AF_INET) {
        const struct sockaddr_in *sin = (const struct sockaddr_in*)addr;
        inet_ntop(AF_INET, &sin->sin_addr, ip, sizeof(ip));
        port = ntohs(sin->sin_port);
        n = std::snprintf(str, strlen, "%s:%u", ip, port);
    } else if (addr->sa_family == AF_INET6) {
        const struct sockaddr_in6 *sin6 = (const struct sockaddr_in6*)addr;
        inet_ntop(AF_INET6, &sin6->sin6_addr, ip, sizeof(ip));
        port = ntohs(sin6->sin6_port);
        n = std::snprintf(str, strlen, "[%s]:%u", ip, port);
    } else {
        return wtftp_set_error(WTFTP_SYSERR_NOIP);
    }

    if (n < 0 || (size_t)n >= strlen)
        return wtftp_set_error(WTFTP_IERR_BSIZE);
    return WTFTP_OK;
}

int wtftp_set_timeout(int fd, int seconds) {
    struct timeval timeout;
    timeout.tv_sec = seconds;
    timeout.tv_usec = 0;
    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) < 0)
        return wtftp_set_sys_error(WTFTP_SYSERR_SOCKET, errno);
    return WTFTP_OK;
}

int wtftp_send_packet(int fd, const struct sockaddr *to, socklen_t tolen, const packet_t& packet) {
    std::vector<uint8_t> buf;
    int e = wtftp_encode(packet, &buf);
    if (e != WTFTP_OK) return e;

    ssize_t n = ::sendto(fd, buf.data(), buf.size(), 0, to, tolen);
    if (n < 0)
        return wtftp_set_sys_error(WTFTP_SYSERR_SEND, errno);
    return WTFTP_OK;
}

int wtftp_recv_packet(int fd, struct sockaddr_storage *from, socklen_t *fromlen, packet_t *packet) {
    *fromlen = sizeof(struct sockaddr_storage);
    ssize_t n = ::recvfrom(fd, recvbuffer, sizeof(recvbuffer), 0, (struct sockaddr*)from, fromlen);
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return wtftp_set_sys_error(WTFTP_SYSERR_TIMEOUT, errno);
        return wtftp_set_sys_error(WTFTP_SYSERR_RECV, errno);
    }

    return wtftp_decode(recvbuffer, (size_t)n, packet);
}

int wtftp_close(int fd) {
    if (::close(fd) < 0)
        return wtftp_set_sys_error(WTFTP_SYSERR_CLOSE, errno);
    return WTFTP_OK;
}
