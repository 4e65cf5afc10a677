#include "include/frame_codec.hpp"

namespace motionlink {

EncodeResult encode_value(int64_t value) {
    EncodeResult out;
    if (value < INT32_MIN || value > INT32_MAX) {
        return out;
    }
    uint32_t u = value < 0 ? static_cast<uint32_t>(value + (int64_t(1) << 32))
                           : static_cast<uint32_t>(value);
    out.bytes[0] = static_cast<uint8_t>((u >> 16) & 0xFF);
    out.bytes[1] = static_cast<uint8_t>((u >> 8) & 0xFF);
    out.bytes[2] = static_cast<uint8_t>(u & 0xFF);
    out.ok = true;
    return out;
}

int32_t decode_value(uint8_t b0, uint8_t b1, uint8_t b2, uint8_t b3) {
    uint32_t u = (uint32_t(b0) << 24) | (uint32_t(b1) << 16) | (uint32_t(b2) << 8) | uint32_t(b3);
    if (u >= 0x80000000u) {
        return static_cast<int32_t>(int64_t(u) - (int64_t(1) << 32));
    }
    return static_cast<int32_t>(u);
}

void write_payload(CommandFrame& frame, const EncodeResult& encoded) {
    frame.payload[1] = encoded.bytes[0];
    frame.payload[2] = encoded.bytes[1];
    frame.payload[3] = encoded.bytes[2];
}

int32_t read_payload(const CommandFrame& frame) {
    return decode_value(frame.payload[0], frame.payload[1], frame.payload[2], frame.payload[3]);
}

FrameBytes serialize_frame(const CommandFrame& frame) {
    FrameBytes b{};
    b[0] = frame.opcode;
    b[1] = frame.argument;
    b[2] = static_cast<uint8_t>(frame.reserved >> 8);
    b[3] = static_cast<uint8_t>(frame.reserved & 0xFF);
    for (size_t i = 0; i < kPayloadSize; ++i) b[4 + i] = frame.payload[i];
    return b;
}

CommandFrame parse_frame(const FrameBytes& bytes) {
    CommandFrame f;
    f.opcode = bytes[0];
    f.argument = bytes[1];
    f.reserved = static_cast<uint16_t>((uint16_t(bytes[2]) << 8) | bytes[3]);
    for (size_t i = 0; i < kPayloadSize; ++i) f.payload[i] = bytes[4 + i];
    return f;
}

} // namespace motionlink
