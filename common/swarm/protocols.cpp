#include "protocols.h"

#include "log.h"

#include <functional>

namespace swarm {

communication_protocols::communication_protocols(const protocol_config & config, transport & net,
                                                 event_bus & bus, clock_fn clock)
    : config(config),
      bus(bus),
      clock(std::move(clock)),
      rng(config.seed ^ (uint32_t) std::hash<std::string>{}(config.node_id)),
      registry(config.node_id, config.heartbeat_interval_ms, bus),
      router(config, registry, net, bus, this->clock, rng),
      gossip(config.gossip_fanout, router, registry, bus, this->clock, rng),
      consensus(config.quorum_ratio, config.consensus_timeout_ms, router, registry, bus, this->clock, rng) {
    config.validate();

    registry.set_membership_callback([this]() { router.rebuild_tree(); });

    router.set_system_handler(MSG_TYPE_HEARTBEAT, [this](const swarm_message & msg) { on_heartbeat(msg); });
    router.set_system_handler(MSG_TYPE_GOSSIP,    [this](const swarm_message & msg) { gossip.on_message(msg); });
    router.set_system_handler(MSG_TYPE_CONSENSUS, [this](const swarm_message & msg) { consensus.on_message(msg); });
    router.set_system_handler(MSG_TYPE_ELECTION,  [](const swarm_message & msg) {
        LOG_INF("election message %s from %s\n", msg.id.c_str(), msg.sender.c_str());
    });

    const int64_t now = this->clock();

    communication_node self;
    self.id      = config.node_id;
    self.address = config.address;
    self.port    = config.port;
    self.version = config.version;
    self.capabilities.supports_compression = config.enable_compression;
    self.capabilities.supports_encryption  = config.enable_encryption;
    registry.register_node(self, now);

    last_process = last_gossip = last_heartbeat = last_cleanup = now;

    LOG_INF("communication protocols initialized for node %s\n", config.node_id.c_str());
}

void communication_protocols::register_node(const communication_node & node) {
    registry.register_node(node, clock());
}

bool communication_protocols::unregister_node(const std::string & node_id) {
    return registry.unregister_node(node_id, clock());
}

std::string communication_protocols::broadcast(const json & data, message_priority priority) {
    return router.broadcast(data, priority);
}

std::string communication_protocols::multicast(const std::vector<std::string> & recipients, const json & data,
                                               message_priority priority) {
    return router.multicast(recipients, data, priority);
}

std::string communication_protocols::unicast(const std::string & recipient, const json & data,
                                             message_priority priority) {
    return router.unicast(recipient, data, priority);
}

void communication_protocols::register_handler(message_type type, message_handler handler) {
    router.register_handler(type, std::move(handler));
}

void communication_protocols::receive(const swarm_message & msg) {
    if (!running) {
        return;
    }
    router.receive(msg);
}

gossip_state communication_protocols::start_gossip(const std::string & key, const json & data) {
    return gossip.start_gossip(key, data);
}

std::string communication_protocols::initiate_consensus(proposal_type type, const json & value,
                                                        const std::vector<std::string> & participants) {
    return consensus.initiate(type, value, participants);
}

void communication_protocols::vote(const std::string & proposal_id, vote_decision decision,
                                   const std::string & reasoning) {
    consensus.vote(proposal_id, decision, reasoning);
}

void communication_protocols::on_heartbeat(const swarm_message & msg) {
    if (!registry.touch(msg.sender, clock())) {
        LOG_DBG("heartbeat from unknown node %s\n", msg.sender.c_str());
    }
}

// ============================================================================
// Periodic work
// ============================================================================

void communication_protocols::advance() {
    if (!running) {
        return;
    }

    const int64_t now = clock();
    registry.refresh_status(now);

    if (now - last_heartbeat >= config.heartbeat_interval_ms) {
        last_heartbeat = now;
        send_heartbeat();
    }
    if (now - last_gossip >= config.gossip_interval_ms) {
        last_gossip = now;
        gossip_round();
    }
    if (now - last_process >= config.process_interval_ms) {
        last_process = now;
        process_messages();
        consensus.sweep();
    }
    if (now - last_cleanup >= config.cleanup_interval_ms) {
        last_cleanup = now;
        cleanup();
    }
}

size_t communication_protocols::process_messages() {
    return router.process_queues();
}

size_t communication_protocols::gossip_round() {
    return gossip.run_round();
}

void communication_protocols::send_heartbeat() {
    const auto peers = registry.peer_ids();
    if (peers.empty()) {
        return;
    }

    const int64_t now = clock();
    json data = {
        {"node_id", config.node_id},
        {"timestamp", now},
        {"status", "online"},
        {"queued", router.total_queued()}
    };
    router.send(MSG_TYPE_HEARTBEAT, peers, data, MSG_PRIORITY_BACKGROUND);
}

size_t communication_protocols::cleanup() {
    const size_t purged = router.sweep() + consensus.sweep();
    if (purged > 0) {
        LOG_DBG("cleanup purged %zu record(s)\n", purged);
    }
    return purged;
}

json communication_protocols::get_metrics() const {
    const size_t total  = registry.size();
    const size_t online = registry.online_count();

    return json{
        {"node_id", config.node_id},
        {"nodes", total},
        {"online_nodes", online},
        {"messages_in_queues", router.total_queued()},
        {"message_history", router.history_size()},
        {"gossip_states", gossip.size()},
        {"active_consensus", consensus.active()},
        {"network_health", total > 0 ? (double) online / (double) total : 0.0},
        {"router", router.get_stats().to_json()}
    };
}

void communication_protocols::shutdown() {
    if (!running) {
        return;
    }
    running = false;
    router.clear_queues();

    LOG_INF("communication protocols for node %s shut down\n", config.node_id.c_str());
    bus.publish(EVENT_SHUTDOWN, clock());
}

} // namespace swarm
