#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

namespace motionlink {

// Fixed-size table of int32 variables addressed by selector.
class VariableTable {
public:
    using ChangeCallback = std::function<void(size_t index, int32_t value)>;

    explicit VariableTable(size_t size = 100);

    // Both throw std::out_of_range for index >= size().
    int32_t get(size_t index) const;
    void set(size_t index, int32_t value);

    // Called outside the lock, only when a value actually changes.
    void on_change(ChangeCallback cb);

    size_t size() const { return size_; }

private:
    void check(size_t index) const;

    const size_t size_;
    mutable std::mutex mtx_;
    std::vector<int32_t> vals_;
    ChangeCallback on_change_;
};

} // namespace motionlink
