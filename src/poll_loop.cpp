#include "poll_loop.hpp"
#include <iostream>
#include <thread>
#include <utility>

namespace motionlink {

PollLoop::PollLoop(RemoteVariables& remote, uint8_t flag_selector,
                   std::chrono::milliseconds interval, Sleeper sleeper)
    : remote_(remote), flag_selector_(flag_selector), interval_(interval), sleeper_(std::move(sleeper))
{
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

uint64_t PollLoop::wait_for_work() {
    uint64_t waits = 0;
    while (remote_.query(flag_selector_) == 0) {
        sleeper_(interval_);
        ++waits;
    }
    std::cout << "[PollLoop] FLAG_RAISED selector=" << int(flag_selector_) << " waits=" << waits << "\n";
    return waits;
}

} // namespace motionlink
