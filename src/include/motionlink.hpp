#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace motionlink {

constexpr size_t kFrameSize = 8;
constexpr size_t kPayloadSize = 4;

using FrameBytes = std::array<uint8_t, kFrameSize>;

// Opcodes carried in byte 0. Replies are request + 1.
enum Opcode : uint8_t {
    OP_QUERY = 0x40,          // query-value
    OP_QUERY_REPLY = 0x41,
    OP_RELEASE = 0x42,        // acknowledge/release
    OP_RELEASE_REPLY = 0x43,
    OP_SELECT = 0x50,         // select-for-set
    OP_SELECT_REPLY = 0x51,
    OP_COMMIT = 0x52,         // commit-set-with-value
    OP_COMMIT_REPLY = 0x53,
};

// CommandFrame: one 8-byte request or response.
// Layout: [0]=opcode [1]=argument [2..3]=reserved [4..7]=payload (payload[0] is MSB)
struct CommandFrame {
    uint8_t opcode{0};
    uint8_t argument{0};
    uint16_t reserved{0};
    std::array<uint8_t, kPayloadSize> payload{};
};

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Connect, send or receive failure. Not recoverable locally.
class TransportError : public Error {
public:
    explicit TransportError(const std::string& what) : Error(what) {}
};

// Value outside the signed 32-bit domain handed to a set operation.
class EncodeRangeError : public Error {
public:
    explicit EncodeRangeError(int64_t value)
        : Error("value out of int32 range: " + std::to_string(value)), value_(value) {}
    int64_t value() const { return value_; }

private:
    int64_t value_;
};

} // namespace motionlink
