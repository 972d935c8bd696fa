#include "tcp_probe.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace {

bool connectWithTimeout(const addrinfo* address, std::chrono::milliseconds timeout) {
    int fd = ::socket(address->ai_family, address->ai_socktype | SOCK_CLOEXEC, address->ai_protocol);
    if (fd < 0) {
        return false;
    }

    int flags = ::fcntl(fd, F_GETFL, 0);
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    bool open = false;
    int rc = ::connect(fd, address->ai_addr, address->ai_addrlen);
    if (rc == 0) {
        open = true;
    }
    else if (errno == EINPROGRESS) {
        pollfd pfd{fd, POLLOUT, 0};
        rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (rc == 1) {
            int error = 0;
            socklen_t length = sizeof(error);
            if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &error, &length) == 0 && error == 0) {
                open = true;
            }
        }
    }

    ::close(fd);
    return open;
}

} // namespace

bool isPortOpen(const std::string& host, int port, std::chrono::milliseconds timeout) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    int rc = ::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &result);
    if (rc != 0) {
        spdlog::debug("[TcpProbe] Cannot resolve {}: {}", host, gai_strerror(rc));
        return false;
    }

    bool open = false;
    for (addrinfo* address = result; address != nullptr && !open; address = address->ai_next) {
        open = connectWithTimeout(address, timeout);
    }
    ::freeaddrinfo(result);
    return open;
}
