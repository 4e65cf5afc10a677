#include "command_session.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "motion_executor.hpp"
#include "tcp_transport.hpp"
#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>
#include <string>

using namespace motionlink;

namespace {

std::atomic<bool> g_shutdown{false};

void on_signal(int) {
    g_shutdown.store(true);
}

// Stand-ins for the controller's motion routines: one per job index, each with
// slot-many equivalent variants (e.g. alternate pick positions).
void register_routines(RoutineTable& table, int slots) {
    static const char* names[] = {"home", "pick", "place", "inspect"};
    for (int index = 0; index < 4; ++index) {
        std::string name = names[index];
        table.add(index, [name, slots](int slot) {
            std::cout << "[Motion] routine=" << name << " variant=" << slot << "/" << slots << "\n";
        });
    }
}

} // namespace

int main(int argc, char** argv) {
    DispatcherConfig cfg;
    std::string error;
    if (!parse_config_args(argc, argv, cfg, error)) {
        std::cerr << error << "\n" << usage(argv[0]);
        return 2;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    TcpConnector connector(cfg.host, cfg.port);
    CommandClient client(connector);
    RoutineTable routines;
    register_routines(routines, cfg.slot_modulus);
    Dispatcher dispatcher(client, routines, cfg);

    std::cout << "[main] job source " << cfg.host << ":" << cfg.port
              << " ready=" << int(cfg.ready_selector) << " job=" << int(cfg.job_selector)
              << " arm=" << int(cfg.arm_selector) << "\n";

    try {
        dispatcher.run(g_shutdown);
    } catch (const std::exception& e) {
        std::cerr << "[main] FATAL state=" << to_string(dispatcher.state()) << " error=" << e.what() << "\n";
        if (dispatcher.state() != DispatchState::Idle) {
            try {
                dispatcher.release();
            } catch (const std::exception& re) {
                std::cerr << "[main] RELEASE_FAILED error=" << re.what() << "\n";
            }
        }
        return 1;
    }
    std::cout << "exiting\n";
    return 0;
}
