#include "console.hpp"
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <poll.h>
#include <unistd.h>

namespace motionlink {

namespace {

constexpr int kConsolePollMs = 100;

void apply_and_report(VariableTable& table, const std::string& line) {
    std::string error;
    if (!apply_console_line(table, line, error)) {
        std::cerr << "[Console] REJECTED line=\"" << line << "\" reason=" << error << "\n";
    }
}

} // namespace

bool apply_console_line(VariableTable& table, const std::string& line, std::string& error) {
    std::istringstream ss(line);
    std::string extra;
    if (!(ss >> extra)) return true;

    ss.clear();
    ss.str(line);
    long long idx = -1, val = 0;
    if (!(ss >> idx >> val) || (ss >> extra)) {
        error = "expected: <idx> <val>";
        return false;
    }
    if (idx < 0 || val < INT32_MIN || val > INT32_MAX) {
        error = "value out of range";
        return false;
    }
    try {
        table.set(static_cast<size_t>(idx), static_cast<int32_t>(val));
    } catch (const std::out_of_range& e) {
        error = e.what();
        return false;
    }
    return true;
}

void run_console(int fd, VariableTable& table, const std::atomic<bool>& shutdown) {
    std::string pending;
    bool open = true;
    char buf[256];

    while (!shutdown.load()) {
        if (!open) {
            std::this_thread::sleep_for(std::chrono::milliseconds(kConsolePollMs));
            continue;
        }
        pollfd p{fd, POLLIN, 0};
        int rc = ::poll(&p, 1, kConsolePollMs);
        if (rc < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[Console] POLL_FAILED " << std::strerror(errno) << "\n";
            open = false;
            continue;
        }
        if (rc == 0) continue;

        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[Console] READ_FAILED " << std::strerror(errno) << "\n";
            open = false;
            continue;
        }
        if (n == 0) {
            if (!pending.empty()) {
                apply_and_report(table, pending);
                pending.clear();
            }
            std::cout << "[Console] CONSOLE_CLOSED serving until signalled\n";
            open = false;
            continue;
        }

        pending.append(buf, static_cast<size_t>(n));
        size_t pos;
        while ((pos = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, pos);
            pending.erase(0, pos + 1);
            apply_and_report(table, line);
        }
    }
}

} // namespace motionlink
