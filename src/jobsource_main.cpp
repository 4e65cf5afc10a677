#include "console.hpp"
#include "job_source_server.hpp"
#include "variable_table.hpp"
#include <atomic>
#include <csignal>
#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <unistd.h>

using namespace motionlink;

namespace {

std::atomic<bool> g_shutdown{false};

void on_signal(int) {
    g_shutdown.store(true);
}

} // namespace

// Job source for bench runs: serves the variable table and takes
// "idx val" lines on stdin to change variables by hand. Runs until
// SIGINT/SIGTERM; closing stdin only ends the console.
int main(int argc, char** argv) {
    std::string host = "0.0.0.0";
    int port = 1400;
    size_t table_size = 100;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next = [&](int& idx){ return (idx+1 < argc) ? std::string(argv[++idx]) : ""; };
        try {
            if (a == "--host") host = next(i);
            else if (a == "--port") port = std::stoi(next(i));
            else if (a == "--size") table_size = static_cast<size_t>(std::stoul(next(i)));
            else {
                std::cerr << "unknown option " << a << "\n";
                return 2;
            }
        } catch (const std::exception& e) {
            std::cerr << "bad value for " << a << ": " << e.what() << "\n";
            return 2;
        }
    }
    if (port < 0 || port > 65535) {
        std::cerr << "bad port " << port << "\n";
        return 2;
    }

    VariableTable table(table_size);
    table.on_change([](size_t idx, int32_t val) {
        std::cout << "[VariableTable] CHANGED idx=" << idx << " val=" << val << "\n";
    });

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    JobSourceServer server(table, host, static_cast<uint16_t>(port));
    try {
        server.start();
    } catch (const std::exception& e) {
        std::cerr << "Failed to start job source: " << e.what() << "\n";
        return 1;
    }

    run_console(STDIN_FILENO, table, g_shutdown);

    server.stop();
    std::cout << "exiting\n";
    return 0;
}
