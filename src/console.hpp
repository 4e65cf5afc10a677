#pragma once
#include "variable_table.hpp"
#include <atomic>
#include <string>

namespace motionlink {

// Applies one "idx val" line to the table. Blank lines are accepted and ignored.
// Returns false with error set for malformed input or an index outside the table.
bool apply_console_line(VariableTable& table, const std::string& line, std::string& error);

// Reads "idx val" lines from fd until shutdown is set. End of input closes the
// console only; the call keeps waiting for shutdown so the server stays up.
void run_console(int fd, VariableTable& table, const std::atomic<bool>& shutdown);

} // namespace motionlink
