#pragma once
#include "command_session.hpp"
#include "config.hpp"
#include "include/slot_counter.hpp"
#include "motion_executor.hpp"
#include "poll_loop.hpp"
#include <atomic>
#include <cstdint>

namespace motionlink {

enum class DispatchState {
    Idle,
    Polling,
    FetchingIndex,
    Dispatching,
    Rearming,
    Released,
};

const char* to_string(DispatchState s);

// Raised from the poll wait once run()'s shutdown flag is set.
class ShutdownRequested : public Error {
public:
    ShutdownRequested() : Error("shutdown requested") {}
};

class Dispatcher {
public:
    Dispatcher(RemoteVariables& remote, MotionJobExecutor& executor, const DispatcherConfig& cfg,
               PollLoop::Sleeper sleeper = PollLoop::Sleeper());

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // Arming set (arm selector := arm value). Idle -> Polling.
    void prepare();

    // One full cycle: poll, fetch index, advance slot, execute, rearm.
    // Must be called after prepare().
    void run_cycle();

    // prepare(), then cycles until shutdown is raised, then release().
    // The flag is checked between cycles and after every poll wait, so an idle
    // dispatcher stops within one poll interval. Other errors propagate without release.
    void run(const std::atomic<bool>& shutdown);

    // Closing set (arm selector := release value).
    void release();

    DispatchState state() const { return state_; }
    uint64_t cycles() const { return cycles_; }
    const SlotCounter& slots() const { return slots_; }

private:
    void transition(DispatchState next);
    void arm(int32_t value);
    void wait_interval(const PollLoop::Sleeper& sleeper, std::chrono::milliseconds d);

    RemoteVariables& remote_;
    MotionJobExecutor& executor_;
    DispatcherConfig cfg_;
    const std::atomic<bool>* shutdown_ = nullptr;
    PollLoop poll_;
    SlotCounter slots_;
    DispatchState state_ = DispatchState::Idle;
    uint64_t cycles_ = 0;
};

} // namespace motionlink
