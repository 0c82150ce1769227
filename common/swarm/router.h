#pragma once

#include "broadcast-tree.h"
#include "codec.h"
#include "config.h"
#include "event-bus.h"
#include "message.h"
#include "node-registry.h"
#include "transport.h"

#include <array>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace swarm {

using message_handler = std::function<void(const swarm_message &)>;

struct router_stats {
    uint64_t enqueued = 0;
    uint64_t routed = 0;
    uint64_t failed = 0;
    uint64_t received = 0;
    uint64_t dropped_checksum = 0;
    uint64_t dropped_expired = 0;
    uint64_t dropped_duplicate = 0;
    uint64_t dropped_codec = 0;

    json to_json() const;
};

// ============================================================================
// Message Router
// ============================================================================

class message_router {
private:
    protocol_config config;
    node_registry & registry;
    transport & net;
    event_bus & bus;
    clock_fn clock;
    std::mt19937 & rng;

    std::array<std::deque<swarm_message>, MSG_PRIORITY_COUNT> queues;
    std::deque<swarm_message> history;                  // bounded FIFO of sent envelopes
    std::unordered_map<std::string, int64_t> seen;      // inbound message id -> first seen
    broadcast_tree tree;

    std::map<message_type, std::vector<message_handler>> handlers;
    std::map<message_type, message_handler> system_handlers;

    std::shared_ptr<payload_cipher> cipher;
    bool warned_no_cipher = false;

    router_stats stats;

    void route(const swarm_message & msg);
    void forward(const swarm_message & msg, const std::string & target);
    void forward_all(const swarm_message & msg, const std::vector<std::string> & targets);
    void remember(const swarm_message & msg);
    void encode(swarm_message & msg);
    swarm_message make_message(message_type type, const std::vector<std::string> & recipients,
                               const json & data, message_priority priority) const;

public:
    message_router(const protocol_config & config, node_registry & registry, transport & net,
                   event_bus & bus, clock_fn clock, std::mt19937 & rng);

    // Fills defaults on a partially built envelope, encodes and checksums it, records it
    // in history and queues it by priority. Returns the message id.
    std::string send_message(swarm_message msg);

    std::string send(message_type type, const std::vector<std::string> & recipients,
                     const json & data, message_priority priority = MSG_PRIORITY_NORMAL);

    // every registered peer, over the broadcast tree
    std::string broadcast(const json & data, message_priority priority = MSG_PRIORITY_NORMAL);
    std::string multicast(const std::vector<std::string> & recipients, const json & data,
                          message_priority priority = MSG_PRIORITY_NORMAL);
    std::string unicast(const std::string & recipient, const json & data,
                        message_priority priority = MSG_PRIORITY_NORMAL);

    // user handlers run in registration order; exceptions are logged
    void register_handler(message_type type, message_handler handler);

    // built-in handling for a message type (heartbeat, gossip, consensus, ...)
    void set_system_handler(message_type type, message_handler handler);

    void set_cipher(std::shared_ptr<payload_cipher> c) { cipher = std::move(c); }

    // One drain tick: up to max_messages_per_priority per class in priority order.
    // A class that is still backlogged after its batch ends the tick.
    size_t process_queues();

    // inbound pipeline: checksum, TTL, dedup, decrypt, decompress, dispatch
    void receive(const swarm_message & msg);

    // drop expired history and dedup entries; returns the number purged
    size_t sweep();

    void rebuild_tree();
    const broadcast_tree & get_tree() const { return tree; }

    void clear_queues();

    size_t queued(message_priority priority) const { return queues[priority].size(); }
    size_t total_queued() const;
    size_t history_size() const { return history.size(); }
    bool in_history(const std::string & message_id) const;
    const router_stats & get_stats() const { return stats; }

    json get_routing_info() const;
};

} // namespace swarm
