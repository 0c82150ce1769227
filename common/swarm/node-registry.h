#pragma once

#include "event-bus.h"

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace swarm {

enum node_status {
    NODE_STATUS_ONLINE,
    NODE_STATUS_DEGRADED,
    NODE_STATUS_OFFLINE
};

std::string node_status_to_str(node_status status);

struct node_capabilities {
    int max_connections = 100;
    std::vector<std::string> protocols = {"tcp"};
    bool supports_encryption = false;
    bool supports_compression = true;
    int64_t bandwidth = 0;       // bytes/s, 0 = unknown
    size_t buffer_size = 65536;

    json to_json() const;
};

struct node_metrics {
    uint64_t messages_sent = 0;
    uint64_t messages_received = 0;
    uint64_t bytes_transferred = 0;
    double average_latency_ms = 0.0;
    double error_rate = 0.0;
    uint64_t packets_lost = 0;
    double throughput = 0.0;     // messages/s over the node's lifetime
    int64_t last_updated = 0;

    json to_json() const;
};

struct communication_node {
    std::string id;
    std::string address;
    int port = 0;
    std::string version = "1.0";
    node_capabilities capabilities;
    node_metrics metrics;
    int64_t registered_at = 0;
    int64_t last_seen = 0;
    node_status status = NODE_STATUS_ONLINE;

    json to_json() const;
    static communication_node from_json(const json & j);
};

// offline past 3x the heartbeat interval, degraded past 2x
node_status derive_node_status(int64_t last_seen, int64_t now_ms, int64_t heartbeat_interval_ms);

// ============================================================================
// Node Registry
// ============================================================================

class node_registry {
private:
    std::map<std::string, communication_node> nodes;  // ordered by id
    std::string local_id;
    int64_t heartbeat_interval_ms;
    event_bus & bus;

    std::function<void()> on_membership_change;

    void membership_changed();
    void set_status(communication_node & node, node_status status, int64_t now_ms);

public:
    node_registry(const std::string & local_id, int64_t heartbeat_interval_ms, event_bus & bus);

    // re-registering an id refreshes its descriptor and liveness
    void register_node(const communication_node & node, int64_t now_ms);
    bool unregister_node(const std::string & node_id, int64_t now_ms);

    // heartbeat receipt
    bool touch(const std::string & node_id, int64_t now_ms);

    // recompute derived status of every peer; returns ids whose status changed
    std::vector<std::string> refresh_status(int64_t now_ms);

    bool contains(const std::string & node_id) const;
    bool get(const std::string & node_id, communication_node & node) const;
    node_status status_of(const std::string & node_id) const;
    bool is_reachable(const std::string & node_id) const;

    std::vector<std::string> node_ids() const;
    std::vector<std::string> peer_ids() const;            // every node but the local one
    std::vector<std::string> reachable_peer_ids() const;  // peers that are not offline
    std::vector<communication_node> list() const;

    size_t size() const { return nodes.size(); }
    size_t online_count() const;

    void record_sent(const std::string & node_id, size_t bytes, int64_t now_ms);
    void record_received(const std::string & node_id, size_t bytes, int64_t latency_ms, int64_t now_ms);
    void record_error(const std::string & node_id, int64_t now_ms);

    const std::string & local_node_id() const { return local_id; }
    int64_t heartbeat_interval() const { return heartbeat_interval_ms; }

    void set_membership_callback(std::function<void()> callback) {
        on_membership_change = callback;
    }
};

} // namespace swarm
