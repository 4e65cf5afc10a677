#pragma once
#include "transport.hpp"
#include <cstdint>
#include <string>

namespace motionlink {

class TcpConnection : public Connection {
public:
    explicit TcpConnection(int fd) : fd_(fd) {}
    ~TcpConnection() override;

    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    void send_frame(const FrameBytes& bytes) override;
    FrameBytes recv_frame() override;

private:
    int fd_;
};

class TcpConnector : public Connector {
public:
    TcpConnector(std::string host, uint16_t port);

    // Blocking connect, no timeout.
    std::unique_ptr<Connection> open() override;

    const std::string& host() const { return host_; }
    uint16_t port() const { return port_; }

private:
    std::string host_;
    uint16_t port_;
};

// Shared by both ends of the link: loop until len bytes are written/read.
void write_all(int fd, const uint8_t* data, size_t len);
// Returns false on clean EOF before the first byte; throws on errors and on EOF mid-frame.
bool read_exact(int fd, uint8_t* data, size_t len);

} // namespace motionlink
