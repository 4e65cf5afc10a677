#include "dispatcher.hpp"
#include <iostream>
#include <stdexcept>
#include <thread>

namespace motionlink {

const char* to_string(DispatchState s) {
    switch (s) {
        case DispatchState::Idle: return "Idle";
        case DispatchState::Polling: return "Polling";
        case DispatchState::FetchingIndex: return "FetchingIndex";
        case DispatchState::Dispatching: return "Dispatching";
        case DispatchState::Rearming: return "Rearming";
        case DispatchState::Released: return "Released";
    }
    return "?";
}

Dispatcher::Dispatcher(RemoteVariables& remote, MotionJobExecutor& executor, const DispatcherConfig& cfg,
                       PollLoop::Sleeper sleeper)
    : remote_(remote),
      executor_(executor),
      cfg_(cfg),
      poll_(remote, cfg.ready_selector, std::chrono::milliseconds(cfg.poll_interval_ms),
            [this, sleeper](std::chrono::milliseconds d) { wait_interval(sleeper, d); }),
      slots_(cfg.slot_modulus) {}

void Dispatcher::transition(DispatchState next) {
    std::cout << "[Dispatcher] STATE " << to_string(state_) << " -> " << to_string(next) << "\n";
    state_ = next;
}

void Dispatcher::wait_interval(const PollLoop::Sleeper& sleeper, std::chrono::milliseconds d) {
    if (sleeper) {
        sleeper(d);
    } else {
        std::this_thread::sleep_for(d);
    }
    if (shutdown_ && shutdown_->load()) {
        throw ShutdownRequested();
    }
}

void Dispatcher::arm(int32_t value) {
    remote_.set(cfg_.arm_selector, value);
}

void Dispatcher::prepare() {
    if (state_ != DispatchState::Idle) {
        throw std::logic_error(std::string("prepare() from state ") + to_string(state_));
    }
    arm(cfg_.arm_value);
    std::cout << "[Dispatcher] SYSTEM_PREPARED arm=" << int(cfg_.arm_selector) << " value=" << cfg_.arm_value << "\n";
    transition(DispatchState::Polling);
}

void Dispatcher::run_cycle() {
    if (state_ != DispatchState::Polling) {
        throw std::logic_error(std::string("run_cycle() from state ") + to_string(state_));
    }
    poll_.wait_for_work();

    transition(DispatchState::FetchingIndex);
    int index = remote_.query(cfg_.job_selector);

    transition(DispatchState::Dispatching);
    int slot = slots_.advance(index);
    std::cout << "[Dispatcher] JOB_DISPATCHED index=" << index << " slot=" << slot << "\n";
    executor_.execute_job(index, slot);

    transition(DispatchState::Rearming);
    arm(cfg_.arm_value);
    ++cycles_;

    transition(DispatchState::Polling);
}

void Dispatcher::run(const std::atomic<bool>& shutdown) {
    shutdown_ = &shutdown;
    try {
        prepare();
        while (!shutdown.load()) {
            run_cycle();
        }
    } catch (const ShutdownRequested&) {
        std::cout << "[Dispatcher] SHUTDOWN_WHILE_POLLING cycles=" << cycles_ << "\n";
    }
    release();
}

void Dispatcher::release() {
    arm(cfg_.release_value);
    std::cout << "[Dispatcher] SYSTEM_RELEASED arm=" << int(cfg_.arm_selector) << " value=" << cfg_.release_value
              << " cycles=" << cycles_ << "\n";
    transition(DispatchState::Released);
}

} // namespace motionlink
