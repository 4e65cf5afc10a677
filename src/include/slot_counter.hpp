#pragma once
#include <unordered_map>

namespace motionlink {

// Rotating per-job slot counter: advance() on a fixed index yields 0,1,...,modulus-1,0,...
class SlotCounter {
public:
    explicit SlotCounter(int modulus = 3);

    // Returns the current slot for index, then steps it (wrapping at modulus).
    int advance(int index);

    // Slot the next advance(index) would return.
    int peek(int index) const;

    int modulus() const { return modulus_; }

private:
    int modulus_;
    std::unordered_map<int, int> counters_;
};

} // namespace motionlink
