#include "command_session.hpp"
#include "dispatcher.hpp"
#include "job_source_server.hpp"
#include "motion_executor.hpp"
#include "tcp_transport.hpp"
#include "variable_table.hpp"
#include <arpa/inet.h>
#include <cassert>
#include <chrono>
#include <iostream>
#include <netinet/in.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace motionlink;

// Dispatcher and client against a real job source on 127.0.0.1.
int main() {
    VariableTable table(100);
    JobSourceServer server(table, "127.0.0.1", 0);
    server.start();
    assert(server.port() != 0);

    TcpConnector connector("127.0.0.1", server.port());
    assert(connector.host() == "127.0.0.1" && connector.port() == server.port());
    CommandClient client(connector);

    // Plain set/query through the server.
    client.set(30, 12345);
    assert(table.get(30) == 12345);
    assert(client.query(30) == 12345);
    assert(client.sessions_opened() == 4);
    assert(server.frames_handled() == 4);

    // The client drops the top payload byte; the server keeps all four.
    client.set(31, -1);
    assert(table.get(31) == 16777215);
    assert(client.query(31) == 16777215);
    table.set(32, -7);
    assert(client.query(32) == -7);

    // One full dispatch cycle.
    DispatcherConfig cfg;
    cfg.ready_selector = 9;
    cfg.job_selector = 10;
    cfg.arm_selector = 11;
    table.set(9, 0);
    table.set(10, 2);

    std::vector<std::pair<int, int>> ran;
    RoutineTable routines;
    routines.add(2, [&](int slot) {
        ran.push_back(std::make_pair(2, slot));
        // Job source lowers the flag and gating while the job runs.
        table.set(9, 0);
        table.set(11, 0);
    });

    int waits = 0;
    Dispatcher d(client, routines, cfg, [&](std::chrono::milliseconds) {
        if (++waits == 2) table.set(9, 1);
    });
    d.prepare();
    assert(table.get(11) == 1);

    d.run_cycle();
    assert(waits == 2);
    assert(ran.size() == 1 && ran[0].first == 2 && ran[0].second == 0);
    assert(table.get(11) == 1);   // rearmed
    assert(d.state() == DispatchState::Polling);

    d.release();
    assert(table.get(11) == 0);

    // Selector outside the table: server drops the connection, client sees a transport error.
    bool threw = false;
    try {
        client.query(200);
    } catch (const TransportError&) {
        threw = true;
    }
    assert(threw);

    // A peer stalled mid-frame must not hold up stop().
    int raw = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(raw >= 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(server.port());
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    assert(::connect(raw, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    const uint8_t partial[3] = {0x40, 9, 0};
    assert(::send(raw, partial, sizeof(partial), 0) == 3);
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    auto t0 = std::chrono::steady_clock::now();
    server.stop();
    auto took = std::chrono::steady_clock::now() - t0;
    assert(took < std::chrono::seconds(2));
    ::close(raw);

    // Nothing listening any more.
    threw = false;
    try {
        client.query(9);
    } catch (const TransportError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "Loopback test PASSED\n";
    return 0;
}
