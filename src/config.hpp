#pragma once
#include <cstdint>
#include <string>

namespace motionlink {

struct DispatcherConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 1400;
    int poll_interval_ms = 500;
    uint8_t ready_selector = 9;    // non-zero when a job is waiting
    uint8_t job_selector = 10;     // job index
    uint8_t arm_selector = 11;     // dispatch gating
    int32_t arm_value = 1;
    int32_t release_value = 0;
    int slot_modulus = 3;
};

// Parses --host --port --poll-ms --ready --job --arm --arm-value --release-value --slots.
// On failure returns false and fills error; cfg may be partially updated.
bool parse_config_args(int argc, char** argv, DispatcherConfig& cfg, std::string& error);

std::string usage(const char* prog);

} // namespace motionlink
