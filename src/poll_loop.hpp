#pragma once
#include "command_session.hpp"
#include <chrono>
#include <cstdint>
#include <functional>

namespace motionlink {

class PollLoop {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    // sleeper defaults to std::this_thread::sleep_for
    PollLoop(RemoteVariables& remote, uint8_t flag_selector,
             std::chrono::milliseconds interval = std::chrono::milliseconds(500),
             Sleeper sleeper = Sleeper());

    // Blocks until the flag reads non-zero. Returns the number of waits taken.
    // No retry cap and no cancellation.
    uint64_t wait_for_work();

    std::chrono::milliseconds interval() const { return interval_; }

private:
    RemoteVariables& remote_;
    uint8_t flag_selector_;
    std::chrono::milliseconds interval_;
    Sleeper sleeper_;
};

} // namespace motionlink
