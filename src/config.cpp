#include "config.hpp"
#include <climits>
#include <stdexcept>

namespace motionlink {

namespace {

bool to_long(const std::string& s, long long lo, long long hi, long long& out) {
    if (s.empty()) return false;
    size_t pos = 0;
    try {
        out = std::stoll(s, &pos);
    } catch (const std::exception&) {
        return false;
    }
    return pos == s.size() && out >= lo && out <= hi;
}

} // namespace

bool parse_config_args(int argc, char** argv, DispatcherConfig& cfg, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (i + 1 >= argc) {
            error = "missing value for " + a;
            return false;
        }
        std::string v = argv[++i];
        long long n = 0;
        auto number = [&](long long lo, long long hi) {
            if (to_long(v, lo, hi, n)) return true;
            error = "bad value for " + a + ": '" + v + "' (expected " + std::to_string(lo) + ".." + std::to_string(hi) + ")";
            return false;
        };

        if (a == "--host") {
            if (v.empty()) { error = "empty --host"; return false; }
            cfg.host = v;
        }
        else if (a == "--port") { if (!number(1, 65535)) return false; cfg.port = static_cast<uint16_t>(n); }
        else if (a == "--poll-ms") { if (!number(0, INT_MAX)) return false; cfg.poll_interval_ms = static_cast<int>(n); }
        else if (a == "--ready") { if (!number(0, 255)) return false; cfg.ready_selector = static_cast<uint8_t>(n); }
        else if (a == "--job") { if (!number(0, 255)) return false; cfg.job_selector = static_cast<uint8_t>(n); }
        else if (a == "--arm") { if (!number(0, 255)) return false; cfg.arm_selector = static_cast<uint8_t>(n); }
        else if (a == "--arm-value") { if (!number(INT32_MIN, INT32_MAX)) return false; cfg.arm_value = static_cast<int32_t>(n); }
        else if (a == "--release-value") { if (!number(INT32_MIN, INT32_MAX)) return false; cfg.release_value = static_cast<int32_t>(n); }
        else if (a == "--slots") { if (!number(1, INT_MAX)) return false; cfg.slot_modulus = static_cast<int>(n); }
        else {
            error = "unknown option " + a;
            return false;
        }
    }
    return true;
}

std::string usage(const char* prog) {
    return std::string("usage: ") + prog +
           " [--host H] [--port P] [--poll-ms MS] [--ready SEL] [--job SEL] [--arm SEL]"
           " [--arm-value V] [--release-value V] [--slots N]\n";
}

} // namespace motionlink
