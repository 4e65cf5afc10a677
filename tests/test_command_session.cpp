#include "command_session.hpp"
#include "fakes.hpp"
#include <cassert>
#include <iostream>
#include <stdexcept>

using namespace motionlink;
using namespace motionlink::testing;

static FrameBytes reply(uint8_t op, uint8_t arg, uint8_t b4, uint8_t b5, uint8_t b6, uint8_t b7) {
    FrameBytes r{};
    r[0] = op; r[1] = arg; r[4] = b4; r[5] = b5; r[6] = b6; r[7] = b7;
    return r;
}

int main() {
    // Set: select then commit, one connection each, never two open at once.
    {
        WireLog log;
        FakeConnector conn(log);
        CommandClient client(conn);
        client.set(11, 0x0A0B0C);

        assert(log.opened == 2 && log.closed == 2);
        assert(log.max_open == 1);
        assert(client.sessions_opened() == 2);
        assert(log.sent.size() == 2);

        const FrameBytes& sel = log.sent[0];
        assert(sel[0] == 0x50 && sel[1] == 11);
        for (int i = 2; i < 8; ++i) assert(sel[i] == 0);

        const FrameBytes& commit = log.sent[1];
        assert(commit[0] == 0x52 && commit[1] == 11);
        assert(commit[2] == 0 && commit[3] == 0 && commit[4] == 0);
        assert(commit[5] == 0x0A && commit[6] == 0x0B && commit[7] == 0x0C);
    }

    // Query: decode the 0x41 payload, then release with 0x42 on a fresh connection.
    {
        WireLog log;
        log.replies.push_back(reply(0x41, 10, 0x00, 0x00, 0x01, 0x02));
        FakeConnector conn(log);
        CommandClient client(conn);
        int32_t v = client.query(10);

        assert(v == 0x0102);
        assert(log.opened == 2 && log.closed == 2 && log.max_open == 1);
        assert(log.sent[0][0] == 0x40 && log.sent[0][1] == 10);
        assert(log.sent[1][0] == 0x42 && log.sent[1][1] == 10);
        for (int i = 2; i < 8; ++i) {
            assert(log.sent[0][i] == 0);
            assert(log.sent[1][i] == 0);
        }
    }

    // Query decodes all four bytes, top byte included.
    {
        WireLog log;
        log.replies.push_back(reply(0x41, 3, 0xFF, 0xFF, 0xFF, 0xFE));
        FakeConnector conn(log);
        CommandClient client(conn);
        assert(client.query(3) == -2);
    }

    // Mismatched reply opcode or argument: logged, value still used as received.
    {
        WireLog log;
        log.replies.push_back(reply(0x99, 4, 0x00, 0x00, 0x00, 0x05));
        log.replies.push_back(reply(0x43, 10, 0, 0, 0, 0));
        log.replies.push_back(reply(0x41, 77, 0xFF, 0xFF, 0xFF, 0xFD));
        FakeConnector conn(log);
        CommandClient client(conn);
        assert(client.query(10) == 5);
        assert(client.query(10) == -3);
        assert(log.opened == 4 && log.closed == 4);
        assert(log.sent[1][0] == 0x42 && log.sent[3][0] == 0x42);
    }

    // Out-of-range set fails before any connection is opened.
    {
        WireLog log;
        FakeConnector conn(log);
        CommandClient client(conn);
        bool threw = false;
        try {
            client.set(1, 2147483648LL);
        } catch (const EncodeRangeError& e) {
            threw = true;
            assert(e.value() == 2147483648LL);
        }
        assert(threw);
        assert(log.opened == 0 && log.sent.empty());
    }

    // Transport failures propagate and the connection is still closed.
    {
        WireLog log;
        log.fail_recv = true;
        FakeConnector conn(log);
        CommandClient client(conn);
        bool threw = false;
        try {
            client.query(9);
        } catch (const TransportError&) {
            threw = true;
        }
        assert(threw);
        assert(log.opened == 1 && log.closed == 1 && log.open_now == 0);
    }
    {
        WireLog log;
        log.fail_connect = true;
        FakeConnector conn(log);
        CommandClient client(conn);
        bool threw = false;
        try {
            client.set(9, 1);
        } catch (const TransportError&) {
            threw = true;
        }
        assert(threw);
        assert(log.sent.empty());
    }

    // A session carries exactly one exchange.
    {
        WireLog log;
        FakeConnector conn(log);
        CommandSession session(conn);
        CommandFrame req;
        req.opcode = OP_QUERY;
        CommandFrame r = session.exchange(req);
        assert(r.opcode == OP_QUERY_REPLY);
        bool threw = false;
        try {
            session.exchange(req);
        } catch (const std::logic_error&) {
            threw = true;
        }
        assert(threw);
        assert(log.sent.size() == 1);
    }

    std::cout << "Command session test PASSED\n";
    return 0;
}
