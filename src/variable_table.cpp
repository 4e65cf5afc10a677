#include "variable_table.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace motionlink {

VariableTable::VariableTable(size_t size) : size_(size), vals_(size, 0) {}

void VariableTable::check(size_t index) const {
    if (index >= size_) {
        throw std::out_of_range("index " + std::to_string(index) + " out of range [0, " + std::to_string(size_) + ")");
    }
}

int32_t VariableTable::get(size_t index) const {
    check(index);
    std::lock_guard<std::mutex> lk(mtx_);
    return vals_[index];
}

void VariableTable::set(size_t index, int32_t value) {
    check(index);
    ChangeCallback cb;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (vals_[index] == value) return;
        vals_[index] = value;
        cb = on_change_;
    }
    if (cb) cb(index, value);
}

void VariableTable::on_change(ChangeCallback cb) {
    std::lock_guard<std::mutex> lk(mtx_);
    on_change_ = std::move(cb);
}

} // namespace motionlink
