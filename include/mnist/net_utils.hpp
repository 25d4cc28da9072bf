#pragma once

#include <cerrno>
#include <cstring>
#include <string>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include "mnist/errors.hpp"

namespace mnist {

using socket_t = int;
constexpr socket_t invalid_socket = -1;

inline void net_close(socket_t s) { ::close(s); }
inline ssize_t net_read(socket_t s, void* buf, size_t len) { return ::recv(s, buf, len, 0); }
inline ssize_t net_write(socket_t s, const void* buf, size_t len) {
    return ::send(s, buf, len, MSG_NOSIGNAL);
}

/// Write the whole buffer, looping over short sends.
inline bool net_write_all(socket_t s, const void* buf, size_t len) {
    const char* p = static_cast<const char*>(buf);
    while (len > 0) {
        ssize_t n = net_write(s, p, len);
        if (n <= 0)
            return false;
        p += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

/**
 * @brief Resolve @p host and open a blocking TCP connection to @p port.
 *
 * Every address returned by the resolver is tried in order. Throws a
 * transport LoadError when none of them accepts the connection.
 */
inline socket_t net_connect(const std::string& host, unsigned short port) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (rc != 0)
        throw LoadError(ErrorKind::Transport,
                        "failed to resolve " + host + ": " + ::gai_strerror(rc));

    socket_t fd = invalid_socket;
    int last_errno = 0;
    for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd == invalid_socket) {
            last_errno = errno;
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0)
            break;
        last_errno = errno;
        net_close(fd);
        fd = invalid_socket;
    }
    ::freeaddrinfo(res);
    if (fd == invalid_socket)
        throw LoadError(ErrorKind::Transport, "failed to connect to " + host + ":" + service +
                                                  ": " + std::strerror(last_errno));
    return fd;
}

} // namespace mnist
