#pragma once
#include "motionlink.hpp"
#include <array>
#include <cstdint>

namespace motionlink {

// Result of encode_value. bytes[0..2] go to payload[1..3]; payload[0] is never written.
struct EncodeResult {
    std::array<uint8_t, 3> bytes{};
    bool ok{false};
};

// Packs the low 24 bits of value. Fails outside [-2^31, 2^31-1].
// Values needing the top byte lose it silently: only 0..16777215 round-trip.
EncodeResult encode_value(int64_t value);

// Big-endian uint32 from all four bytes (b0 = MSB), reinterpreted as int32.
int32_t decode_value(uint8_t b0, uint8_t b1, uint8_t b2, uint8_t b3);

// Writes an encoded value into a frame's payload, leaving payload[0] untouched.
void write_payload(CommandFrame& frame, const EncodeResult& encoded);
int32_t read_payload(const CommandFrame& frame);

FrameBytes serialize_frame(const CommandFrame& frame);
CommandFrame parse_frame(const FrameBytes& bytes);

} // namespace motionlink
