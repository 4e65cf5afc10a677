#include "motion_executor.hpp"
#include <iostream>
#include <utility>

namespace motionlink {

void RoutineTable::add(int index, Routine routine) {
    routines_[index] = std::move(routine);
}

void RoutineTable::execute_job(int index, int slot) {
    auto it = routines_.find(index);
    if (it == routines_.end()) {
        std::cerr << "[RoutineTable] UNKNOWN_JOB index=" << index << "\n";
        throw UnknownJobError(index);
    }
    std::cout << "[RoutineTable] RUN index=" << index << " slot=" << slot << "\n";
    it->second(slot);
}

} // namespace motionlink
