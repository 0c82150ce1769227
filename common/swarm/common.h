#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <random>
#include <stdexcept>
#include <string>

namespace swarm {

using json = nlohmann::ordered_json;

// ============================================================================
// Errors
// ============================================================================

enum error_type {
    ERROR_TYPE_VALIDATION,       // malformed command input
    ERROR_TYPE_ROUTING,          // target unknown or unreachable
    ERROR_TYPE_CHECKSUM,         // integrity check failed
    ERROR_TYPE_TIMEOUT,          // consensus or message deadline passed
    ERROR_TYPE_CAPACITY,         // no eligible agent or queue full
    ERROR_TYPE_RETRY_EXHAUSTED,  // task ran out of retries
    ERROR_TYPE_CODEC,            // compression, encryption or encoding failure
    ERROR_TYPE_CONFIG            // invalid configuration
};

const char * error_type_to_str(error_type type);

class swarm_error : public std::runtime_error {
private:
    error_type err_type;

public:
    swarm_error(error_type type, const std::string & message)
        : std::runtime_error(message), err_type(type) {}

    error_type type() const { return err_type; }
};

// ============================================================================
// Time and identifiers
// ============================================================================

// source of "now" in milliseconds; every component reads time through one of these
using clock_fn = std::function<int64_t()>;

int64_t get_timestamp_ms();

clock_fn system_clock();

// "<prefix>-<now>-<8 hex digits>"
std::string generate_id(const std::string & prefix, int64_t now_ms, std::mt19937 & rng);

} // namespace swarm
