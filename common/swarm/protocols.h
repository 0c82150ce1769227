#pragma once

#include "config.h"
#include "consensus.h"
#include "event-bus.h"
#include "gossip.h"
#include "node-registry.h"
#include "router.h"
#include "transport.h"

#include <memory>
#include <random>
#include <string>
#include <vector>

namespace swarm {

// ============================================================================
// Communication Protocols
// ============================================================================

// Owns the per-node substrate: registry, router, broadcast tree, gossip and
// consensus. Periodic work runs from advance(), which reads the injected clock.
class communication_protocols {
private:
    protocol_config config;
    event_bus & bus;
    clock_fn clock;
    std::mt19937 rng;

    node_registry registry;
    message_router router;
    gossip_engine gossip;
    consensus_engine consensus;

    int64_t last_process   = 0;
    int64_t last_gossip    = 0;
    int64_t last_heartbeat = 0;
    int64_t last_cleanup   = 0;
    bool running = true;

    void on_heartbeat(const swarm_message & msg);

public:
    communication_protocols(const protocol_config & config, transport & net, event_bus & bus,
                            clock_fn clock = system_clock());

    // membership
    void register_node(const communication_node & node);
    bool unregister_node(const std::string & node_id);

    // messaging
    std::string send_message(const swarm_message & msg) { return router.send_message(msg); }
    std::string send(message_type type, const std::vector<std::string> & recipients, const json & data,
                     message_priority priority = MSG_PRIORITY_NORMAL) {
        return router.send(type, recipients, data, priority);
    }
    std::string broadcast(const json & data, message_priority priority = MSG_PRIORITY_NORMAL);
    std::string multicast(const std::vector<std::string> & recipients, const json & data,
                          message_priority priority = MSG_PRIORITY_NORMAL);
    std::string unicast(const std::string & recipient, const json & data,
                        message_priority priority = MSG_PRIORITY_NORMAL);
    void register_handler(message_type type, message_handler handler);
    void set_cipher(std::shared_ptr<payload_cipher> cipher) { router.set_cipher(std::move(cipher)); }

    // inbound entry point for the transport
    void receive(const swarm_message & msg);

    // gossip and consensus
    gossip_state start_gossip(const std::string & key, const json & data);
    std::string initiate_consensus(proposal_type type, const json & value,
                                   const std::vector<std::string> & participants = {});
    void vote(const std::string & proposal_id, vote_decision decision, const std::string & reasoning = "");
    void set_consensus_evaluator(const consensus_evaluator & evaluator) { consensus.set_evaluator(evaluator); }

    // runs whichever periodic steps are due
    void advance();

    // individual periodic steps
    size_t process_messages();
    size_t gossip_round();
    void send_heartbeat();
    size_t cleanup();

    json get_metrics() const;
    json get_routing_info() const { return router.get_routing_info(); }

    void shutdown();
    bool is_running() const { return running; }

    const std::string & node_id() const { return config.node_id; }
    const protocol_config & get_config() const { return config; }

    node_registry    & get_registry()  { return registry; }
    message_router   & get_router()    { return router; }
    gossip_engine    & get_gossip()    { return gossip; }
    consensus_engine & get_consensus() { return consensus; }
};

} // namespace swarm
