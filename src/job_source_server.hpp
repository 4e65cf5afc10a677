#pragma once
#include "include/motionlink.hpp"
#include "variable_table.hpp"
#include <atomic>
#include <cstdint>
#include <string>
#include <thread>

namespace motionlink {

// Serves a VariableTable over the 8-byte frame protocol.
// Connections are handled one at a time on the accept thread.
class JobSourceServer {
public:
    JobSourceServer(VariableTable& table, std::string bind_host = "0.0.0.0", uint16_t port = 1400);
    ~JobSourceServer();

    JobSourceServer(const JobSourceServer&) = delete;
    JobSourceServer& operator=(const JobSourceServer&) = delete;

    // Binds and listens, then spawns the accept thread. Throws TransportError.
    void start();
    void stop();

    // Bound port; differs from the requested one when 0 was requested.
    uint16_t port() const { return port_; }
    uint64_t frames_handled() const { return frames_.load(); }

    // Reply to one request, or false when the opcode gets no reply.
    // Throws std::out_of_range for a selector outside the table.
    bool handle_frame(const CommandFrame& request, CommandFrame& reply);

private:
    void loop();
    void serve_connection(int fd);
    void require_selector(uint8_t selector) const;

    VariableTable& table_;
    std::string bind_host_;
    uint16_t port_;
    int listen_fd_ = -1;
    std::thread th_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> frames_{0};
};

} // namespace motionlink
