#pragma once

#include "common.h"

#include <cstdint>
#include <string>
#include <vector>

namespace swarm {

// ============================================================================
// Message enums
// ============================================================================

enum message_type {
    MSG_TYPE_BROADCAST,
    MSG_TYPE_MULTICAST,
    MSG_TYPE_UNICAST,
    MSG_TYPE_GOSSIP,
    MSG_TYPE_HEARTBEAT,
    MSG_TYPE_CONSENSUS,
    MSG_TYPE_ELECTION,
    MSG_TYPE_COORDINATION,
    MSG_TYPE_DATA,
    MSG_TYPE_CONTROL,
    MSG_TYPE_EMERGENCY
};

// declaration order is drain order
enum message_priority {
    MSG_PRIORITY_EMERGENCY,
    MSG_PRIORITY_HIGH,
    MSG_PRIORITY_NORMAL,
    MSG_PRIORITY_LOW,
    MSG_PRIORITY_BACKGROUND
};

constexpr int MSG_PRIORITY_COUNT = 5;

enum routing_strategy {
    ROUTING_DIRECT,
    ROUTING_FLOODING,
    ROUTING_GOSSIP,
    ROUTING_MULTIPATH,
    ROUTING_ADAPTIVE
};

enum delivery_guarantee {
    DELIVERY_AT_MOST_ONCE,
    DELIVERY_AT_LEAST_ONCE,
    DELIVERY_EXACTLY_ONCE
};

enum compression_algorithm {
    COMPRESSION_NONE,
    COMPRESSION_GZIP
};

std::string message_type_to_str(message_type type);
std::string message_priority_to_str(message_priority priority);
std::string routing_strategy_to_str(routing_strategy strategy);
std::string delivery_guarantee_to_str(delivery_guarantee delivery);

message_type       str_to_message_type(const std::string & str);
message_priority   str_to_message_priority(const std::string & str);
routing_strategy   str_to_routing_strategy(const std::string & str);
delivery_guarantee str_to_delivery_guarantee(const std::string & str);

// ============================================================================
// Envelope
// ============================================================================

struct message_payload {
    json data;
    json metadata = json::object();
    std::string content_type = "application/json";
    std::string encoding = "utf8";
    std::string version = "1.0";

    json to_json() const;
    static message_payload from_json(const json & j);
};

struct encryption_config {
    bool enabled = false;
    std::string algorithm;
    std::string key_id;
};

// threshold 0 means "router default"
struct compression_config {
    bool enabled = true;
    compression_algorithm algorithm = COMPRESSION_GZIP;
    int level = 6;
    size_t threshold = 0;
};

// max_hops / timeout_ms 0 means "router default"
struct routing_config {
    routing_strategy strategy = ROUTING_ADAPTIVE;
    int max_hops = 0;
    delivery_guarantee delivery = DELIVERY_AT_LEAST_ONCE;
    bool acknowledgment = true;
    int64_t timeout_ms = 0;
};

struct qos_config {
    double reliability = 0.95;
    int64_t max_latency_ms = 0;
    bool ordered = false;
    bool deduplication = true;
};

struct swarm_message {
    std::string id;
    message_type type = MSG_TYPE_DATA;
    std::string sender;
    std::vector<std::string> recipients;
    message_payload payload;
    message_priority priority = MSG_PRIORITY_NORMAL;
    encryption_config encryption;
    compression_config compression;
    routing_config routing;
    qos_config qos;
    int64_t timestamp = 0;
    int64_t ttl_ms = 0;
    std::string checksum;
    int hops = 0;

    bool expired(int64_t now_ms) const { return ttl_ms > 0 && now_ms - timestamp > ttl_ms; }

    json to_json() const;
    static swarm_message from_json(const json & j);
};

// CRC-32 over sender, recipients, payload and timestamp, as 8 lowercase hex digits
std::string compute_checksum(const swarm_message & msg);

bool verify_checksum(const swarm_message & msg);

// ============================================================================
// Gossip and consensus wire records
// ============================================================================

struct gossip_state {
    std::string key;
    int64_t version = 0;
    json data;
    int64_t timestamp = 0;
    std::string checksum;  // CRC-32 of data

    json to_json() const;
    static gossip_state from_json(const json & j);
};

enum proposal_type {
    PROPOSAL_VALUE,
    PROPOSAL_LEADER,
    PROPOSAL_CONFIGURATION
};

enum vote_decision {
    VOTE_ACCEPT,
    VOTE_REJECT,
    VOTE_ABSTAIN
};

std::string proposal_type_to_str(proposal_type type);
std::string vote_decision_to_str(vote_decision decision);

proposal_type str_to_proposal_type(const std::string & str);
vote_decision str_to_vote_decision(const std::string & str);

struct consensus_proposal {
    std::string id;
    proposal_type type = PROPOSAL_VALUE;
    std::string proposer;
    json value;
    int round = 1;
    int64_t timestamp = 0;
    std::vector<std::string> signatures;

    json to_json() const;
    static consensus_proposal from_json(const json & j);
};

struct consensus_vote {
    std::string proposal_id;
    std::string voter;
    vote_decision decision = VOTE_ABSTAIN;
    std::string reasoning;
    int64_t timestamp = 0;
    std::string signature;

    json to_json() const;
    static consensus_vote from_json(const json & j);
};

} // namespace swarm
