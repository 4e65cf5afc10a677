#pragma once
#include "include/motionlink.hpp"
#include <functional>
#include <map>

namespace motionlink {

// External collaborator performing the physical action for (index, slot).
// Blocks until the motion completes; throws if it cannot.
class MotionJobExecutor {
public:
    virtual ~MotionJobExecutor() = default;
    virtual void execute_job(int index, int slot) = 0;
};

class UnknownJobError : public Error {
public:
    explicit UnknownJobError(int index)
        : Error("no routine registered for job index " + std::to_string(index)), index_(index) {}
    int index() const { return index_; }

private:
    int index_;
};

// Executor backed by a table of routines keyed by job index.
class RoutineTable : public MotionJobExecutor {
public:
    using Routine = std::function<void(int slot)>;

    void add(int index, Routine routine);
    bool has(int index) const { return routines_.count(index) != 0; }
    size_t size() const { return routines_.size(); }

    void execute_job(int index, int slot) override;

private:
    std::map<int, Routine> routines_;
};

} // namespace motionlink
