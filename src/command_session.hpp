#pragma once
#include "include/motionlink.hpp"
#include "transport.hpp"
#include <cstdint>
#include <memory>

namespace motionlink {

// CommandSession: exactly one connection for exactly one request/response.
// The connection opens in the constructor and closes on destruction, on every path.
class CommandSession {
public:
    explicit CommandSession(Connector& connector);

    CommandSession(const CommandSession&) = delete;
    CommandSession& operator=(const CommandSession&) = delete;

    // Sends request, blocks for the full 8-byte reply. Callable once.
    CommandFrame exchange(const CommandFrame& request);

private:
    std::unique_ptr<Connection> conn_;
    bool used_ = false;
};

// Remote variable access as seen by the poll loop and dispatcher.
class RemoteVariables {
public:
    virtual ~RemoteVariables() = default;
    // Throws EncodeRangeError before touching the wire if value is outside int32.
    virtual void set(uint8_t selector, int64_t value) = 0;
    virtual int32_t query(uint8_t selector) = 0;
};

class CommandClient : public RemoteVariables {
public:
    explicit CommandClient(Connector& connector);

    // select (0x50) then commit (0x52), one session each; replies discarded.
    void set(uint8_t selector, int64_t value) override;
    // query (0x40), decode reply payload, then release (0x42); one session each.
    int32_t query(uint8_t selector) override;

    uint64_t sessions_opened() const { return sessions_; }

private:
    CommandFrame run_session(const CommandFrame& request);

    Connector& connector_;
    uint64_t sessions_ = 0;
};

} // namespace motionlink
