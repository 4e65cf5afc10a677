#include "job_source_server.hpp"
#include "include/frame_codec.hpp"
#include "tcp_transport.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <netinet/in.h>
#include <poll.h>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>

namespace motionlink {

namespace {

constexpr int kPollTimeoutMs = 50;

// Encodes the full int32, top byte included.
void put_value(CommandFrame& f, int32_t value) {
    uint32_t u = static_cast<uint32_t>(value);
    f.payload[0] = static_cast<uint8_t>(u >> 24);
    f.payload[1] = static_cast<uint8_t>(u >> 16);
    f.payload[2] = static_cast<uint8_t>(u >> 8);
    f.payload[3] = static_cast<uint8_t>(u);
}

} // namespace

JobSourceServer::JobSourceServer(VariableTable& table, std::string bind_host, uint16_t port)
    : table_(table), bind_host_(std::move(bind_host)), port_(port) {}

JobSourceServer::~JobSourceServer() {
    stop();
}

void JobSourceServer::start() {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port_);
    if (::inet_pton(AF_INET, bind_host_.c_str(), &addr.sin_addr) != 1) {
        throw TransportError("bad bind address: " + bind_host_);
    }

    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) throw TransportError(std::string("socket failed: ") + std::strerror(errno));

    int one = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) < 0 ||
        ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
        ::listen(fd, 16) < 0) {
        std::string err = std::strerror(errno);
        ::close(fd);
        throw TransportError("listen on " + bind_host_ + ":" + std::to_string(port_) + " failed: " + err);
    }

    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        std::string err = std::strerror(errno);
        ::close(fd);
        throw TransportError("getsockname failed: " + err);
    }
    port_ = ntohs(addr.sin_port);
    listen_fd_ = fd;

    running_.store(true);
    th_ = std::thread(&JobSourceServer::loop, this);
    std::cout << "[JobSourceServer] LISTENING " << bind_host_ << ":" << port_ << "\n";
}

void JobSourceServer::stop() {
    running_.store(false);
    if (th_.joinable()) th_.join();
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
        std::cout << "[JobSourceServer] STOPPED frames=" << frames_.load() << "\n";
    }
}

void JobSourceServer::require_selector(uint8_t selector) const {
    if (selector >= table_.size()) {
        throw std::out_of_range("selector " + std::to_string(selector) + " outside table of " + std::to_string(table_.size()));
    }
}

bool JobSourceServer::handle_frame(const CommandFrame& request, CommandFrame& reply) {
    reply = CommandFrame();
    reply.argument = request.argument;
    switch (request.opcode) {
        case OP_QUERY:
            reply.opcode = OP_QUERY_REPLY;
            put_value(reply, table_.get(request.argument));
            return true;
        case OP_RELEASE:
            require_selector(request.argument);
            reply.opcode = OP_RELEASE_REPLY;
            std::cout << "[JobSourceServer] READ_RELEASED idx=" << int(request.argument) << "\n";
            return true;
        case OP_SELECT:
            require_selector(request.argument);
            reply.opcode = OP_SELECT_REPLY;
            return true;
        case OP_COMMIT: {
            int32_t value = read_payload(request);
            table_.set(request.argument, value);
            reply.opcode = OP_COMMIT_REPLY;
            std::cout << "[JobSourceServer] WRITE_COMMITTED idx=" << int(request.argument) << " val=" << value << "\n";
            return true;
        }
        default:
            std::cerr << "[JobSourceServer] UNKNOWN_OPCODE op=0x" << std::hex << int(request.opcode) << std::dec << "\n";
            return false;
    }
}

void JobSourceServer::serve_connection(int fd) {
    try {
        FrameBytes in{};
        size_t got = 0;
        // A frame may arrive in pieces; poll between reads so stop() is seen mid-frame.
        while (running_.load()) {
            pollfd p{fd, POLLIN, 0};
            int rc = ::poll(&p, 1, kPollTimeoutMs);
            if (rc < 0) {
                if (errno == EINTR) continue;
                throw TransportError(std::string("poll failed: ") + std::strerror(errno));
            }
            if (rc == 0) continue;

            ssize_t n = ::recv(fd, in.data() + got, in.size() - got, 0);
            if (n < 0) {
                if (errno == EINTR) continue;
                throw TransportError(std::string("recv failed: ") + std::strerror(errno));
            }
            if (n == 0) {
                if (got == 0) break;
                throw TransportError("peer closed mid-frame after " + std::to_string(got) + " bytes");
            }
            got += static_cast<size_t>(n);
            if (got < in.size()) continue;

            got = 0;
            ++frames_;
            CommandFrame reply;
            if (handle_frame(parse_frame(in), reply)) {
                FrameBytes out = serialize_frame(reply);
                write_all(fd, out.data(), out.size());
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[JobSourceServer] CONNECTION_DROPPED reason=" << e.what() << "\n";
    }
    ::close(fd);
}

void JobSourceServer::loop() {
    while (running_.load()) {
        pollfd p{listen_fd_, POLLIN, 0};
        int rc = ::poll(&p, 1, kPollTimeoutMs);
        if (rc < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[JobSourceServer] ACCEPT_POLL_FAILED " << std::strerror(errno) << "\n";
            return;
        }
        if (rc == 0) continue;

        int fd = ::accept(listen_fd_, nullptr, nullptr);
        if (fd < 0) {
            std::cerr << "[JobSourceServer] ACCEPT_FAILED " << std::strerror(errno) << "\n";
            continue;
        }
        serve_connection(fd);
    }
}

} // namespace motionlink
