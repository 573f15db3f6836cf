// src/tcp_transport.hpp
// TCP transport with auto-reconnect and acknowledged frames.

#pragma once

#include "datrack/transport.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace datrack {

// Single persistent connection to the collector.
//
// Request:  [4 bytes BE length][batch]
// Response: [4 bytes BE length][status byte][optional detail]
// Status 0 means the batch was accepted; any other status is a rejection.
class TcpTransport : public Transport {
public:
    // Throws TrackerError (Configuration) if endpoint is not host:port.
    TcpTransport(std::string endpoint, std::chrono::milliseconds timeout);
    ~TcpTransport() override;

    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    SendResult send_batch(const uint8_t* data, size_t len) override;
    void close_connection() override;

    const std::string& endpoint() const noexcept { return endpoint_; }
    const std::string& host() const noexcept { return host_; }
    uint16_t port() const noexcept { return port_; }
    std::chrono::milliseconds timeout() const noexcept { return timeout_; }

    static constexpr size_t MAX_RESPONSE_SIZE = 64 * 1024;

private:
    bool ensure_connected();
    bool connect();
    void configure_socket(int fd);
    bool write_all(const uint8_t* data, size_t len);
    bool read_exact(uint8_t* out, size_t len);

    std::string endpoint_;
    std::string host_;
    uint16_t port_ = 0;
    std::chrono::milliseconds timeout_;
    int socket_fd_ = -1;
};

} // namespace datrack
