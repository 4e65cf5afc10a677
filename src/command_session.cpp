#include "command_session.hpp"
#include "include/frame_codec.hpp"
#include <iostream>
#include <stdexcept>

namespace motionlink {

CommandSession::CommandSession(Connector& connector) : conn_(connector.open()) {
    if (!conn_) throw TransportError("connector returned no connection");
}

CommandFrame CommandSession::exchange(const CommandFrame& request) {
    if (used_) throw std::logic_error("CommandSession already used");
    used_ = true;

    FrameBytes frame{};
    frame = serialize_frame(request);
    conn_->send_frame(frame);

    frame.fill(0);
    frame = conn_->recv_frame();
    return parse_frame(frame);
}

CommandClient::CommandClient(Connector& connector) : connector_(connector) {}

CommandFrame CommandClient::run_session(const CommandFrame& request) {
    ++sessions_;
    CommandSession session(connector_);
    CommandFrame reply = session.exchange(request);
    if (reply.opcode != static_cast<uint8_t>(request.opcode + 1) || reply.argument != request.argument) {
        // No resync exists; a stray reply is only reported.
        std::cerr << "[CommandClient] UNEXPECTED_REPLY sent=0x" << std::hex << int(request.opcode)
                  << " got=0x" << int(reply.opcode) << std::dec
                  << " arg=" << int(reply.argument) << "\n";
    }
    return reply;
}

void CommandClient::set(uint8_t selector, int64_t value) {
    EncodeResult enc = encode_value(value);
    if (!enc.ok) {
        std::cerr << "[CommandClient] ENCODE_RANGE_ERROR selector=" << int(selector) << " value=" << value << "\n";
        throw EncodeRangeError(value);
    }

    CommandFrame select;
    select.opcode = OP_SELECT;
    select.argument = selector;
    run_session(select);

    CommandFrame commit;
    commit.opcode = OP_COMMIT;
    commit.argument = selector;
    write_payload(commit, enc);
    run_session(commit);

    std::cout << "[CommandClient] SET selector=" << int(selector) << " value=" << value << "\n";
}

int32_t CommandClient::query(uint8_t selector) {
    CommandFrame req;
    req.opcode = OP_QUERY;
    req.argument = selector;
    int32_t value = read_payload(run_session(req));

    CommandFrame release;
    release.opcode = OP_RELEASE;
    release.argument = selector;
    run_session(release);

    return value;
}

} // namespace motionlink
