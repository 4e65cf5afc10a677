#pragma once
#include "include/motionlink.hpp"
#include <memory>

namespace motionlink {

// One open transport connection. Closed when destroyed.
// Both calls block until complete and throw TransportError on failure.
class Connection {
public:
    virtual ~Connection() = default;
    virtual void send_frame(const FrameBytes& bytes) = 0;
    virtual FrameBytes recv_frame() = 0;
};

// Opens connections to the fixed remote endpoint.
class Connector {
public:
    virtual ~Connector() = default;
    virtual std::unique_ptr<Connection> open() = 0;
};

} // namespace motionlink
