#include "include/slot_counter.hpp"
#include <stdexcept>
#include <string>

namespace motionlink {

SlotCounter::SlotCounter(int modulus) : modulus_(modulus) {
    if (modulus <= 0) {
        throw std::invalid_argument("slot modulus must be positive, got " + std::to_string(modulus));
    }
}

int SlotCounter::advance(int index) {
    int& counter = counters_[index];
    int slot = counter;
    ++counter;
    if (counter >= modulus_) counter = 0;
    return slot;
}

int SlotCounter::peek(int index) const {
    auto it = counters_.find(index);
    return it == counters_.end() ? 0 : it->second;
}

} // namespace motionlink
