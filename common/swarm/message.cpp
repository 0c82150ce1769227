#include "message.h"
#include "codec.h"

namespace swarm {

std::string message_type_to_str(message_type type) {
    switch (type) {
        case MSG_TYPE_BROADCAST:    return "broadcast";
        case MSG_TYPE_MULTICAST:    return "multicast";
        case MSG_TYPE_UNICAST:      return "unicast";
        case MSG_TYPE_GOSSIP:       return "gossip";
        case MSG_TYPE_HEARTBEAT:    return "heartbeat";
        case MSG_TYPE_CONSENSUS:    return "consensus";
        case MSG_TYPE_ELECTION:     return "election";
        case MSG_TYPE_COORDINATION: return "coordination";
        case MSG_TYPE_DATA:         return "data";
        case MSG_TYPE_CONTROL:      return "control";
        case MSG_TYPE_EMERGENCY:    return "emergency";
        default:                    return "unknown";
    }
}

std::string message_priority_to_str(message_priority priority) {
    switch (priority) {
        case MSG_PRIORITY_EMERGENCY:  return "emergency";
        case MSG_PRIORITY_HIGH:       return "high";
        case MSG_PRIORITY_NORMAL:     return "normal";
        case MSG_PRIORITY_LOW:        return "low";
        case MSG_PRIORITY_BACKGROUND: return "background";
        default:                      return "unknown";
    }
}

std::string routing_strategy_to_str(routing_strategy strategy) {
    switch (strategy) {
        case ROUTING_DIRECT:    return "direct";
        case ROUTING_FLOODING:  return "flooding";
        case ROUTING_GOSSIP:    return "gossip";
        case ROUTING_MULTIPATH: return "multipath";
        case ROUTING_ADAPTIVE:  return "adaptive";
        default:                return "unknown";
    }
}

std::string delivery_guarantee_to_str(delivery_guarantee delivery) {
    switch (delivery) {
        case DELIVERY_AT_MOST_ONCE:  return "at-most-once";
        case DELIVERY_AT_LEAST_ONCE: return "at-least-once";
        case DELIVERY_EXACTLY_ONCE:  return "exactly-once";
        default:                     return "unknown";
    }
}

message_type str_to_message_type(const std::string & str) {
    if (str == "broadcast")    return MSG_TYPE_BROADCAST;
    if (str == "multicast")    return MSG_TYPE_MULTICAST;
    if (str == "unicast")      return MSG_TYPE_UNICAST;
    if (str == "gossip")       return MSG_TYPE_GOSSIP;
    if (str == "heartbeat")    return MSG_TYPE_HEARTBEAT;
    if (str == "consensus")    return MSG_TYPE_CONSENSUS;
    if (str == "election")     return MSG_TYPE_ELECTION;
    if (str == "coordination") return MSG_TYPE_COORDINATION;
    if (str == "control")      return MSG_TYPE_CONTROL;
    if (str == "emergency")    return MSG_TYPE_EMERGENCY;
    return MSG_TYPE_DATA;
}

message_priority str_to_message_priority(const std::string & str) {
    if (str == "emergency")  return MSG_PRIORITY_EMERGENCY;
    if (str == "high")       return MSG_PRIORITY_HIGH;
    if (str == "low")        return MSG_PRIORITY_LOW;
    if (str == "background") return MSG_PRIORITY_BACKGROUND;
    return MSG_PRIORITY_NORMAL;
}

routing_strategy str_to_routing_strategy(const std::string & str) {
    if (str == "direct")    return ROUTING_DIRECT;
    if (str == "flooding")  return ROUTING_FLOODING;
    if (str == "gossip")    return ROUTING_GOSSIP;
    if (str == "multipath") return ROUTING_MULTIPATH;
    return ROUTING_ADAPTIVE;
}

delivery_guarantee str_to_delivery_guarantee(const std::string & str) {
    if (str == "at-most-once") return DELIVERY_AT_MOST_ONCE;
    if (str == "exactly-once") return DELIVERY_EXACTLY_ONCE;
    return DELIVERY_AT_LEAST_ONCE;
}

// ============================================================================
// Envelope serialization
// ============================================================================

json message_payload::to_json() const {
    return json{
        {"data", data},
        {"metadata", metadata},
        {"content_type", content_type},
        {"encoding", encoding},
        {"version", version}
    };
}

message_payload message_payload::from_json(const json & j) {
    message_payload p;
    p.data         = j.value("data", json());
    p.metadata     = j.value("metadata", json::object());
    p.content_type = j.value("content_type", "application/json");
    p.encoding     = j.value("encoding", "utf8");
    p.version      = j.value("version", "1.0");
    return p;
}

json swarm_message::to_json() const {
    return json{
        {"id", id},
        {"type", message_type_to_str(type)},
        {"sender", sender},
        {"recipients", recipients},
        {"payload", payload.to_json()},
        {"priority", message_priority_to_str(priority)},
        {"encryption", {
            {"enabled", encryption.enabled},
            {"algorithm", encryption.algorithm},
            {"key_id", encryption.key_id}
        }},
        {"compression", {
            {"enabled", compression.enabled},
            {"algorithm", compression.algorithm == COMPRESSION_GZIP ? "gzip" : "none"},
            {"level", compression.level},
            {"threshold", compression.threshold}
        }},
        {"routing", {
            {"strategy", routing_strategy_to_str(routing.strategy)},
            {"max_hops", routing.max_hops},
            {"delivery", delivery_guarantee_to_str(routing.delivery)},
            {"acknowledgment", routing.acknowledgment},
            {"timeout_ms", routing.timeout_ms}
        }},
        {"qos", {
            {"reliability", qos.reliability},
            {"max_latency_ms", qos.max_latency_ms},
            {"ordered", qos.ordered},
            {"deduplication", qos.deduplication}
        }},
        {"timestamp", timestamp},
        {"ttl_ms", ttl_ms},
        {"checksum", checksum},
        {"hops", hops}
    };
}

swarm_message swarm_message::from_json(const json & j) {
    swarm_message msg;
    msg.id         = j.value("id", "");
    msg.type       = str_to_message_type(j.value("type", "data"));
    msg.sender     = j.value("sender", "");
    msg.recipients = j.value("recipients", std::vector<std::string>{});
    msg.payload    = message_payload::from_json(j.value("payload", json::object()));
    msg.priority   = str_to_message_priority(j.value("priority", "normal"));
    msg.timestamp  = j.value("timestamp", int64_t(0));
    msg.ttl_ms     = j.value("ttl_ms", int64_t(0));
    msg.checksum   = j.value("checksum", "");
    msg.hops       = j.value("hops", 0);

    if (j.contains("encryption")) {
        const auto & e = j["encryption"];
        msg.encryption.enabled   = e.value("enabled", false);
        msg.encryption.algorithm = e.value("algorithm", "");
        msg.encryption.key_id    = e.value("key_id", "");
    }
    if (j.contains("compression")) {
        const auto & c = j["compression"];
        msg.compression.enabled   = c.value("enabled", true);
        msg.compression.algorithm = c.value("algorithm", "gzip") == "gzip" ? COMPRESSION_GZIP : COMPRESSION_NONE;
        msg.compression.level     = c.value("level", 6);
        msg.compression.threshold = c.value("threshold", size_t(0));
    }
    if (j.contains("routing")) {
        const auto & r = j["routing"];
        msg.routing.strategy       = str_to_routing_strategy(r.value("strategy", "adaptive"));
        msg.routing.max_hops       = r.value("max_hops", 0);
        msg.routing.delivery       = str_to_delivery_guarantee(r.value("delivery", "at-least-once"));
        msg.routing.acknowledgment = r.value("acknowledgment", true);
        msg.routing.timeout_ms     = r.value("timeout_ms", int64_t(0));
    }
    if (j.contains("qos")) {
        const auto & q = j["qos"];
        msg.qos.reliability    = q.value("reliability", 0.95);
        msg.qos.max_latency_ms = q.value("max_latency_ms", int64_t(0));
        msg.qos.ordered        = q.value("ordered", false);
        msg.qos.deduplication  = q.value("deduplication", true);
    }
    return msg;
}

std::string compute_checksum(const swarm_message & msg) {
    json canonical = {
        {"sender", msg.sender},
        {"recipients", msg.recipients},
        {"payload", msg.payload.to_json()},
        {"timestamp", msg.timestamp}
    };
    return crc32_hex(canonical.dump());
}

bool verify_checksum(const swarm_message & msg) {
    if (msg.checksum.empty()) {
        return false;
    }
    try {
        return msg.checksum == compute_checksum(msg);
    } catch (const json::type_error &) {
        // invalid UTF-8 cannot match any checksum we produced
        return false;
    }
}

// ============================================================================
// Gossip and consensus records
// ============================================================================

json gossip_state::to_json() const {
    return json{
        {"key", key},
        {"version", version},
        {"data", data},
        {"timestamp", timestamp},
        {"checksum", checksum}
    };
}

gossip_state gossip_state::from_json(const json & j) {
    gossip_state s;
    s.key       = j.value("key", "");
    s.version   = j.value("version", int64_t(0));
    s.data      = j.value("data", json());
    s.timestamp = j.value("timestamp", int64_t(0));
    s.checksum  = j.value("checksum", "");
    return s;
}

std::string proposal_type_to_str(proposal_type type) {
    switch (type) {
        case PROPOSAL_VALUE:         return "value";
        case PROPOSAL_LEADER:        return "leader";
        case PROPOSAL_CONFIGURATION: return "configuration";
        default:                     return "unknown";
    }
}

std::string vote_decision_to_str(vote_decision decision) {
    switch (decision) {
        case VOTE_ACCEPT:  return "accept";
        case VOTE_REJECT:  return "reject";
        case VOTE_ABSTAIN: return "abstain";
        default:           return "unknown";
    }
}

proposal_type str_to_proposal_type(const std::string & str) {
    if (str == "leader")        return PROPOSAL_LEADER;
    if (str == "configuration") return PROPOSAL_CONFIGURATION;
    return PROPOSAL_VALUE;
}

vote_decision str_to_vote_decision(const std::string & str) {
    if (str == "accept") return VOTE_ACCEPT;
    if (str == "reject") return VOTE_REJECT;
    return VOTE_ABSTAIN;
}

json consensus_proposal::to_json() const {
    return json{
        {"id", id},
        {"type", proposal_type_to_str(type)},
        {"proposer", proposer},
        {"value", value},
        {"round", round},
        {"timestamp", timestamp},
        {"signatures", signatures}
    };
}

consensus_proposal consensus_proposal::from_json(const json & j) {
    consensus_proposal p;
    p.id         = j.value("id", "");
    p.type       = str_to_proposal_type(j.value("type", "value"));
    p.proposer   = j.value("proposer", "");
    p.value      = j.value("value", json());
    p.round      = j.value("round", 1);
    p.timestamp  = j.value("timestamp", int64_t(0));
    p.signatures = j.value("signatures", std::vector<std::string>{});
    return p;
}

json consensus_vote::to_json() const {
    return json{
        {"proposal_id", proposal_id},
        {"voter", voter},
        {"decision", vote_decision_to_str(decision)},
        {"reasoning", reasoning},
        {"timestamp", timestamp},
        {"signature", signature}
    };
}

consensus_vote consensus_vote::from_json(const json & j) {
    consensus_vote v;
    v.proposal_id = j.value("proposal_id", "");
    v.voter       = j.value("voter", "");
    v.decision    = str_to_vote_decision(j.value("decision", "abstain"));
    v.reasoning   = j.value("reasoning", "");
    v.timestamp   = j.value("timestamp", int64_t(0));
    v.signature   = j.value("signature", "");
    return v;
}

} // namespace swarm
