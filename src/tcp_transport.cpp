#include "tcp_transport.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>

namespace motionlink {

namespace {

std::string errno_text(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

} // namespace

void write_all(int fd, const uint8_t* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        ssize_t n = ::send(fd, data + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw TransportError(errno_text("send failed"));
        }
        sent += static_cast<size_t>(n);
    }
}

bool read_exact(int fd, uint8_t* data, size_t len) {
    size_t got = 0;
    while (got < len) {
        ssize_t n = ::recv(fd, data + got, len - got, 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw TransportError(errno_text("recv failed"));
        }
        if (n == 0) {
            if (got == 0) return false;
            throw TransportError("peer closed mid-frame after " + std::to_string(got) + " bytes");
        }
        got += static_cast<size_t>(n);
    }
    return true;
}

TcpConnection::~TcpConnection() {
    if (fd_ >= 0) ::close(fd_);
}

void TcpConnection::send_frame(const FrameBytes& bytes) {
    write_all(fd_, bytes.data(), bytes.size());
}

FrameBytes TcpConnection::recv_frame() {
    FrameBytes bytes{};
    if (!read_exact(fd_, bytes.data(), bytes.size())) {
        throw TransportError("peer closed before reply frame");
    }
    return bytes;
}

TcpConnector::TcpConnector(std::string host, uint16_t port)
    : host_(std::move(host)), port_(port) {}

std::unique_ptr<Connection> TcpConnector::open() {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    std::string service = std::to_string(port_);
    int rc = ::getaddrinfo(host_.c_str(), service.c_str(), &hints, &res);
    if (rc != 0) {
        throw TransportError("resolve " + host_ + " failed: " + ::gai_strerror(rc));
    }

    std::string last_error = "no address for " + host_;
    int fd = -1;
    for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_error = errno_text("socket failed");
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) break;
        last_error = errno_text("connect failed");
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(res);

    if (fd < 0) {
        throw TransportError(last_error + " (" + host_ + ":" + service + ")");
    }
    return std::make_unique<TcpConnection>(fd);
}

} // namespace motionlink
