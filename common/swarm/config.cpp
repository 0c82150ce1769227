#include "config.h"

#include <fstream>

namespace swarm {

static void require(bool cond, const std::string & what) {
    if (!cond) {
        throw swarm_error(ERROR_TYPE_CONFIG, "invalid config: " + what);
    }
}

// ============================================================================
// protocol_config
// ============================================================================

json protocol_config::to_json() const {
    return json{
        {"node_id", node_id},
        {"address", address},
        {"port", port},
        {"version", version},
        {"heartbeat_interval_ms", heartbeat_interval_ms},
        {"gossip_interval_ms", gossip_interval_ms},
        {"message_timeout_ms", message_timeout_ms},
        {"consensus_timeout_ms", consensus_timeout_ms},
        {"process_interval_ms", process_interval_ms},
        {"cleanup_interval_ms", cleanup_interval_ms},
        {"max_messages_per_priority", max_messages_per_priority},
        {"max_message_history", max_message_history},
        {"max_hops", max_hops},
        {"enable_compression", enable_compression},
        {"compression_threshold", compression_threshold},
        {"compression_level", compression_level},
        {"enable_encryption", enable_encryption},
        {"gossip_fanout", gossip_fanout},
        {"quorum_ratio", quorum_ratio},
        {"seed", seed}
    };
}

protocol_config protocol_config::from_json(const json & j) {
    protocol_config d;
    protocol_config c;
    c.node_id                   = j.value("node_id", d.node_id);
    c.address                   = j.value("address", d.address);
    c.port                      = j.value("port", d.port);
    c.version                   = j.value("version", d.version);
    c.heartbeat_interval_ms     = j.value("heartbeat_interval_ms", d.heartbeat_interval_ms);
    c.gossip_interval_ms        = j.value("gossip_interval_ms", d.gossip_interval_ms);
    c.message_timeout_ms        = j.value("message_timeout_ms", d.message_timeout_ms);
    c.consensus_timeout_ms      = j.value("consensus_timeout_ms", d.consensus_timeout_ms);
    c.process_interval_ms       = j.value("process_interval_ms", d.process_interval_ms);
    c.cleanup_interval_ms       = j.value("cleanup_interval_ms", d.cleanup_interval_ms);
    c.max_messages_per_priority = j.value("max_messages_per_priority", d.max_messages_per_priority);
    c.max_message_history       = j.value("max_message_history", d.max_message_history);
    c.max_hops                  = j.value("max_hops", d.max_hops);
    c.enable_compression        = j.value("enable_compression", d.enable_compression);
    c.compression_threshold     = j.value("compression_threshold", d.compression_threshold);
    c.compression_level         = j.value("compression_level", d.compression_level);
    c.enable_encryption         = j.value("enable_encryption", d.enable_encryption);
    c.gossip_fanout             = j.value("gossip_fanout", d.gossip_fanout);
    c.quorum_ratio              = j.value("quorum_ratio", d.quorum_ratio);
    c.seed                      = j.value("seed", d.seed);
    return c;
}

void protocol_config::validate() const {
    require(!node_id.empty(), "node_id must not be empty");
    require(port >= 0 && port <= 65535, "port out of range");
    require(heartbeat_interval_ms > 0, "heartbeat_interval_ms must be positive");
    require(gossip_interval_ms > 0, "gossip_interval_ms must be positive");
    require(message_timeout_ms > 0, "message_timeout_ms must be positive");
    require(consensus_timeout_ms > 0, "consensus_timeout_ms must be positive");
    require(process_interval_ms > 0, "process_interval_ms must be positive");
    require(cleanup_interval_ms > 0, "cleanup_interval_ms must be positive");
    require(max_messages_per_priority > 0, "max_messages_per_priority must be positive");
    require(max_message_history > 0, "max_message_history must be positive");
    require(max_hops > 0, "max_hops must be positive");
    require(compression_level >= 0 && compression_level <= 9, "compression_level must be in [0, 9]");
    require(gossip_fanout > 0, "gossip_fanout must be positive");
    require(quorum_ratio > 0.0 && quorum_ratio <= 1.0, "quorum_ratio must be in (0, 1]");
}

// ============================================================================
// distribution_config
// ============================================================================

json distribution_config::to_json() const {
    return json{
        {"process_interval_ms", process_interval_ms},
        {"max_concurrent_tasks", max_concurrent_tasks},
        {"min_trust_score", min_trust_score},
        {"weights", {
            {"capability", weight_capability},
            {"performance", weight_performance},
            {"load", weight_load},
            {"trust", weight_trust}
        }},
        {"enable_dynamic_rebalancing", enable_dynamic_rebalancing},
        {"imbalance_threshold", imbalance_threshold},
        {"rebalance_severity", rebalance_severity},
        {"default_max_retries", default_max_retries},
        {"stuck_factor", stuck_factor},
        {"no_progress_timeout_ms", no_progress_timeout_ms},
        {"max_failure_history", max_failure_history}
    };
}

distribution_config distribution_config::from_json(const json & j) {
    distribution_config d;
    distribution_config c;
    c.process_interval_ms        = j.value("process_interval_ms", d.process_interval_ms);
    c.max_concurrent_tasks       = j.value("max_concurrent_tasks", d.max_concurrent_tasks);
    c.min_trust_score            = j.value("min_trust_score", d.min_trust_score);
    c.enable_dynamic_rebalancing = j.value("enable_dynamic_rebalancing", d.enable_dynamic_rebalancing);
    c.imbalance_threshold        = j.value("imbalance_threshold", d.imbalance_threshold);
    c.rebalance_severity         = j.value("rebalance_severity", d.rebalance_severity);
    c.default_max_retries        = j.value("default_max_retries", d.default_max_retries);
    c.stuck_factor               = j.value("stuck_factor", d.stuck_factor);
    c.no_progress_timeout_ms     = j.value("no_progress_timeout_ms", d.no_progress_timeout_ms);
    c.max_failure_history        = j.value("max_failure_history", d.max_failure_history);

    if (j.contains("weights")) {
        const auto & w = j["weights"];
        c.weight_capability  = w.value("capability", d.weight_capability);
        c.weight_performance = w.value("performance", d.weight_performance);
        c.weight_load        = w.value("load", d.weight_load);
        c.weight_trust       = w.value("trust", d.weight_trust);
    }
    return c;
}

void distribution_config::validate() const {
    require(process_interval_ms > 0, "process_interval_ms must be positive");
    require(max_concurrent_tasks > 0, "max_concurrent_tasks must be positive");
    require(min_trust_score >= 0.0 && min_trust_score <= 1.0, "min_trust_score must be in [0, 1]");
    require(weight_capability >= 0.0 && weight_performance >= 0.0 && weight_load >= 0.0 && weight_trust >= 0.0,
            "scoring weights must not be negative");
    require(weight_capability + weight_performance + weight_load + weight_trust > 0.0,
            "scoring weights must not all be zero");
    require(imbalance_threshold >= 0.0 && imbalance_threshold <= 1.0, "imbalance_threshold must be in [0, 1]");
    require(rebalance_severity >= 0.0 && rebalance_severity <= 1.0, "rebalance_severity must be in [0, 1]");
    require(default_max_retries >= 0, "default_max_retries must not be negative");
    require(stuck_factor >= 1.0, "stuck_factor must be at least 1");
    require(no_progress_timeout_ms > 0, "no_progress_timeout_ms must be positive");
    require(max_failure_history > 0, "max_failure_history must be positive");
}

// ============================================================================
// swarm_config
// ============================================================================

json swarm_config::to_json() const {
    return json{
        {"protocol", protocol.to_json()},
        {"distribution", distribution.to_json()}
    };
}

swarm_config swarm_config::from_json(const json & j) {
    if (!j.is_object()) {
        throw swarm_error(ERROR_TYPE_CONFIG, "invalid config: top level must be an object");
    }

    swarm_config c;
    try {
        c.protocol     = protocol_config::from_json(j.value("protocol", json::object()));
        c.distribution = distribution_config::from_json(j.value("distribution", json::object()));
    } catch (const json::type_error & e) {
        throw swarm_error(ERROR_TYPE_CONFIG, std::string("invalid config: ") + e.what());
    }
    return c;
}

void swarm_config::validate() const {
    protocol.validate();
    distribution.validate();
}

swarm_config load_swarm_config(const std::string & path) {
    std::ifstream file(path);
    if (!file) {
        throw swarm_error(ERROR_TYPE_CONFIG, "cannot open config file: " + path);
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::parse_error & e) {
        throw swarm_error(ERROR_TYPE_CONFIG, "cannot parse config file " + path + ": " + e.what());
    }

    swarm_config config = swarm_config::from_json(j);
    config.validate();
    return config;
}

} // namespace swarm
