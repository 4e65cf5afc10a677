#pragma once
#include "command_session.hpp"
#include "motion_executor.hpp"
#include "transport.hpp"
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace motionlink {
namespace testing {

// Records every frame sent, answers with request opcode + 1 and a scripted payload.
struct WireLog {
    int opened = 0;
    int closed = 0;
    int open_now = 0;
    int max_open = 0;
    std::vector<FrameBytes> sent;
    std::deque<FrameBytes> replies;   // optional scripted replies, consumed in order
    bool fail_connect = false;
    bool fail_recv = false;
};

class FakeConnection : public Connection {
public:
    explicit FakeConnection(WireLog& log) : log_(log) {}
    ~FakeConnection() override {
        ++log_.closed;
        --log_.open_now;
    }

    void send_frame(const FrameBytes& bytes) override {
        log_.sent.push_back(bytes);
        last_ = bytes;
    }

    FrameBytes recv_frame() override {
        if (log_.fail_recv) throw TransportError("fake recv failure");
        if (!log_.replies.empty()) {
            FrameBytes r = log_.replies.front();
            log_.replies.pop_front();
            return r;
        }
        FrameBytes r{};
        r[0] = static_cast<uint8_t>(last_[0] + 1);
        r[1] = last_[1];
        return r;
    }

private:
    WireLog& log_;
    FrameBytes last_{};
};

class FakeConnector : public Connector {
public:
    explicit FakeConnector(WireLog& log) : log_(log) {}
    std::unique_ptr<Connection> open() override {
        if (log_.fail_connect) throw TransportError("fake connect failure");
        ++log_.opened;
        ++log_.open_now;
        if (log_.open_now > log_.max_open) log_.max_open = log_.open_now;
        return std::make_unique<FakeConnection>(log_);
    }

private:
    WireLog& log_;
};

// RemoteVariables with scripted query answers per selector and a call journal.
class ScriptedRemote : public RemoteVariables {
public:
    void script(uint8_t selector, std::vector<int32_t> answers) {
        answers_[selector] = std::deque<int32_t>(answers.begin(), answers.end());
    }

    void set(uint8_t selector, int64_t value) override {
        journal.push_back("set " + std::to_string(selector) + "=" + std::to_string(value));
    }

    int32_t query(uint8_t selector) override {
        journal.push_back("query " + std::to_string(selector));
        auto& q = answers_[selector];
        if (q.empty()) return 0;
        int32_t v = q.front();
        if (q.size() > 1) q.pop_front();
        return v;
    }

    std::vector<std::string> journal;

private:
    std::map<uint8_t, std::deque<int32_t>> answers_;
};

class RecordingExecutor : public MotionJobExecutor {
public:
    void execute_job(int index, int slot) override {
        calls.push_back(std::make_pair(index, slot));
    }
    std::vector<std::pair<int, int>> calls;
};

} // namespace testing
} // namespace motionlink
