#pragma once

#include "common.h"

#include <cstdint>
#include <string>

namespace swarm {

// Communication substrate settings
struct protocol_config {
    std::string node_id = "node-0";
    std::string address = "127.0.0.1";
    int port = 7400;
    std::string version = "1.0";

    int64_t heartbeat_interval_ms = 5000;
    int64_t gossip_interval_ms = 2000;
    int64_t message_timeout_ms = 30000;    // default message TTL
    int64_t consensus_timeout_ms = 10000;
    int64_t process_interval_ms = 100;     // message drain tick
    int64_t cleanup_interval_ms = 60000;

    int max_messages_per_priority = 10;    // drained per class per tick
    size_t max_message_history = 10000;
    int max_hops = 5;

    bool enable_compression = true;
    size_t compression_threshold = 1024;   // bytes of serialized data
    int compression_level = 6;
    bool enable_encryption = false;

    int gossip_fanout = 3;
    double quorum_ratio = 0.67;

    uint32_t seed = 42;                    // mixed with node_id for id generation and peer sampling

    json to_json() const;
    static protocol_config from_json(const json & j);
    void validate() const;
};

// Task distribution settings
struct distribution_config {
    int64_t process_interval_ms = 1000;
    int max_concurrent_tasks = 100;
    double min_trust_score = 0.5;

    double weight_capability = 0.3;
    double weight_performance = 0.3;
    double weight_load = 0.2;
    double weight_trust = 0.2;

    bool enable_dynamic_rebalancing = true;
    double imbalance_threshold = 0.3;      // utilisation distance from the fleet mean
    double rebalance_severity = 0.3;

    int default_max_retries = 3;
    double stuck_factor = 2.0;             // runtime / estimate that marks a task stuck
    int64_t no_progress_timeout_ms = 900000;
    size_t max_failure_history = 1000;

    json to_json() const;
    static distribution_config from_json(const json & j);
    void validate() const;
};

struct swarm_config {
    protocol_config protocol;
    distribution_config distribution;

    json to_json() const;
    static swarm_config from_json(const json & j);
    void validate() const;
};

// throws swarm_error(ERROR_TYPE_CONFIG) when the file is missing, malformed or invalid
swarm_config load_swarm_config(const std::string & path);

} // namespace swarm
