// src/tcp_transport.cpp
// TCP transport with auto-reconnect.

#include "tcp_transport.hpp"
#include "logging.hpp"
#include "datrack/error.hpp"

#include <cstring>
#include <vector>

// POSIX sockets
#include <sys/time.h>
#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>
#include <poll.h>

namespace datrack {

TcpTransport::TcpTransport(std::string endpoint, std::chrono::milliseconds timeout)
    : endpoint_(std::move(endpoint)), timeout_(timeout) {
    auto colon = endpoint_.rfind(':');
    if (colon == std::string::npos || colon == 0) {
        throw TrackerError::configuration("endpoint must be host:port, got: " + endpoint_);
    }
    host_ = endpoint_.substr(0, colon);
    int port_int = 0;
    try {
        port_int = std::stoi(endpoint_.substr(colon + 1));
    } catch (const std::exception&) {
        throw TrackerError::configuration("endpoint port is not a valid number: " + endpoint_);
    }
    if (port_int <= 0 || port_int > 65535) {
        throw TrackerError::configuration("endpoint port must be 1-65535, got: " + std::to_string(port_int));
    }
    port_ = static_cast<uint16_t>(port_int);
}

TcpTransport::~TcpTransport() {
    close_connection();
}

void TcpTransport::close_connection() {
    if (socket_fd_ >= 0) {
        ::close(socket_fd_);
        socket_fd_ = -1;
    }
}

bool TcpTransport::ensure_connected() {
    if (socket_fd_ >= 0) return true;
    return connect();
}

bool TcpTransport::connect() {
    struct addrinfo hints{}, *res = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    auto port_str = std::to_string(port_);
    int err = ::getaddrinfo(host_.c_str(), port_str.c_str(), &hints, &res);
    if (err != 0 || res == nullptr) {
        DATRACK_LOG_WARN("dns resolution failed", {logging::string_field("host", host_)});
        return false;
    }

    // Try each resolved address (IPv6/IPv4) until one connects.
    int fd = -1;
    for (struct addrinfo* rp = res; rp != nullptr; rp = rp->ai_next) {
        fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (fd < 0) continue;

        int flags = ::fcntl(fd, F_GETFL, 0);
        if (flags < 0) {
            ::close(fd);
            fd = -1;
            continue;
        }
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        int ret = ::connect(fd, rp->ai_addr, rp->ai_addrlen);
        if (ret != 0) {
            if (errno != EINPROGRESS) {
                ::close(fd);
                fd = -1;
                continue;
            }

            struct pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLOUT;

            int poll_ret = ::poll(&pfd, 1, static_cast<int>(timeout_.count()));
            if (poll_ret <= 0) {
                ::close(fd);
                fd = -1;
                continue;
            }

            int so_error = 0;
            socklen_t len = sizeof(so_error);
            ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
            if (so_error != 0) {
                ::close(fd);
                fd = -1;
                continue;
            }
        }

        // Connected: restore blocking mode
        ::fcntl(fd, F_SETFL, flags);
        ::freeaddrinfo(res);
        configure_socket(fd);
        socket_fd_ = fd;
        return true;
    }

    ::freeaddrinfo(res);
    DATRACK_LOG_WARN("connect failed", {logging::string_field("endpoint", endpoint_)});
    return false;
}

void TcpTransport::configure_socket(int fd) {
    int nodelay = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));

    int keepalive = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &keepalive, sizeof(keepalive));

    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout_.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout_.count() % 1000) * 1000);
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

bool TcpTransport::write_all(const uint8_t* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        ssize_t n = ::send(socket_fd_, data + sent, len - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            close_connection();
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

bool TcpTransport::read_exact(uint8_t* out, size_t len) {
    size_t got = 0;
    while (got < len) {
        ssize_t n = ::recv(socket_fd_, out + got, len - got, 0);
        if (n <= 0) {
            close_connection();
            return false;
        }
        got += static_cast<size_t>(n);
    }
    return true;
}

SendResult TcpTransport::send_batch(const uint8_t* data, size_t len) {
    if (len > UINT32_MAX) return SendResult::Failed;
    if (!ensure_connected()) return SendResult::Failed;

    // Length prefix (4 bytes, big-endian)
    uint32_t frame_len = static_cast<uint32_t>(len);
    uint8_t header[4] = {
        static_cast<uint8_t>(frame_len >> 24),
        static_cast<uint8_t>(frame_len >> 16),
        static_cast<uint8_t>(frame_len >> 8),
        static_cast<uint8_t>(frame_len),
    };

    if (!write_all(header, 4)) return SendResult::Failed;
    if (!write_all(data, len)) return SendResult::Failed;

    uint8_t resp_header[4];
    if (!read_exact(resp_header, 4)) return SendResult::Failed;
    uint32_t resp_len = (static_cast<uint32_t>(resp_header[0]) << 24)
                      | (static_cast<uint32_t>(resp_header[1]) << 16)
                      | (static_cast<uint32_t>(resp_header[2]) << 8)
                      | static_cast<uint32_t>(resp_header[3]);
    if (resp_len == 0 || resp_len > MAX_RESPONSE_SIZE) {
        close_connection();
        return SendResult::Failed;
    }

    std::vector<uint8_t> response(resp_len);
    if (!read_exact(response.data(), response.size())) return SendResult::Failed;

    return response[0] == 0 ? SendResult::Accepted : SendResult::Rejected;
}

} // namespace datrack
