#include "common.h"

#include <chrono>
#include <cstdio>

namespace swarm {

const char * error_type_to_str(error_type type) {
    switch (type) {
        case ERROR_TYPE_VALIDATION:      return "validation";
        case ERROR_TYPE_ROUTING:         return "routing";
        case ERROR_TYPE_CHECKSUM:        return "checksum";
        case ERROR_TYPE_TIMEOUT:         return "timeout";
        case ERROR_TYPE_CAPACITY:        return "capacity";
        case ERROR_TYPE_RETRY_EXHAUSTED: return "retry_exhausted";
        case ERROR_TYPE_CODEC:           return "codec";
        case ERROR_TYPE_CONFIG:          return "config";
        default:                         return "unknown";
    }
}

int64_t get_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

clock_fn system_clock() {
    return []() { return get_timestamp_ms(); };
}

std::string generate_id(const std::string & prefix, int64_t now_ms, std::mt19937 & rng) {
    char suffix[16];
    snprintf(suffix, sizeof(suffix), "%08x", static_cast<unsigned>(rng()));
    return prefix + "-" + std::to_string(now_ms) + "-" + suffix;
}

} // namespace swarm
