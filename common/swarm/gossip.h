#pragma once

#include "event-bus.h"
#include "message.h"
#include "node-registry.h"
#include "router.h"

#include <map>
#include <random>
#include <string>
#include <vector>

namespace swarm {

// ============================================================================
// Gossip Engine
// ============================================================================

// Versioned key/value anti-entropy. Last writer wins by version; an incoming
// state replaces the local one only when its version is strictly greater.
class gossip_engine {
private:
    std::map<std::string, gossip_state> states;
    int fanout;

    message_router & router;
    node_registry & registry;
    event_bus & bus;
    clock_fn clock;
    std::mt19937 & rng;

    std::vector<std::string> pick_peers();
    void propagate(const std::vector<gossip_state> & batch, const std::vector<std::string> & peers);

public:
    gossip_engine(int fanout, message_router & router, node_registry & registry,
                  event_bus & bus, clock_fn clock, std::mt19937 & rng);

    // version = max(local + 1, now); spreads immediately to a random subset of peers
    gossip_state start_gossip(const std::string & key, const json & data);

    // sends every known key to min(fanout, peers) random peers
    size_t run_round();

    // returns true when the state was adopted
    bool apply(const gossip_state & incoming);

    // system handler for gossip messages
    void on_message(const swarm_message & msg);

    bool get(const std::string & key, gossip_state & state) const;
    size_t size() const { return states.size(); }

    json to_json() const;
};

} // namespace swarm
