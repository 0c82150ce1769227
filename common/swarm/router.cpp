#include "router.h"

#include "log.h"

#include <algorithm>
#include <set>

namespace swarm {

json router_stats::to_json() const {
    return json{
        {"enqueued", enqueued},
        {"routed", routed},
        {"failed", failed},
        {"received", received},
        {"dropped_checksum", dropped_checksum},
        {"dropped_expired", dropped_expired},
        {"dropped_duplicate", dropped_duplicate},
        {"dropped_codec", dropped_codec}
    };
}

static message_event make_message_event(const swarm_message & msg, const std::string & error = "") {
    message_event e;
    e.message_id = msg.id;
    e.type       = msg.type;
    e.sender     = msg.sender;
    e.recipients = msg.recipients;
    e.error      = error;
    return e;
}

static std::string join(const std::vector<std::string> & items, const char * sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); i++) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

message_router::message_router(const protocol_config & config, node_registry & registry, transport & net,
                               event_bus & bus, clock_fn clock, std::mt19937 & rng)
    : config(config), registry(registry), net(net), bus(bus), clock(std::move(clock)), rng(rng) {}

// ============================================================================
// Outbound
// ============================================================================

swarm_message message_router::make_message(message_type type, const std::vector<std::string> & recipients,
                                           const json & data, message_priority priority) const {
    swarm_message msg;
    msg.type         = type;
    msg.recipients   = recipients;
    msg.payload.data = data;
    msg.priority     = priority;
    return msg;
}

// compress first, then encrypt; the checksum covers the payload as transmitted
void message_router::encode(swarm_message & msg) {
    if (msg.compression.enabled && config.enable_compression && !payload_is_compressed(msg.payload)) {
        msg.payload = compress_payload(msg.payload, msg.compression.threshold, msg.compression.level);
    }

    if (msg.encryption.enabled || config.enable_encryption) {
        if (cipher) {
            msg.encryption.enabled = true;
            if (msg.encryption.algorithm.empty()) {
                msg.encryption.algorithm = cipher->name();
            }
            msg.payload = encrypt_payload(msg.payload, msg.encryption, *cipher);
        } else {
            if (!warned_no_cipher) {
                LOG_WRN("encryption requested but no cipher is installed, sending in clear\n");
                warned_no_cipher = true;
            }
            msg.encryption.enabled = false;
        }
    }

    msg.hops     = 0;
    msg.checksum = compute_checksum(msg);
}

std::string message_router::send_message(swarm_message msg) {
    const int64_t now = clock();

    if (msg.type == MSG_TYPE_UNICAST && msg.recipients.size() != 1) {
        throw swarm_error(ERROR_TYPE_VALIDATION,
                          "unicast requires exactly one recipient, got " + std::to_string(msg.recipients.size()));
    }
    if (msg.priority < MSG_PRIORITY_EMERGENCY || msg.priority > MSG_PRIORITY_BACKGROUND) {
        throw swarm_error(ERROR_TYPE_VALIDATION, "invalid message priority");
    }

    if (msg.id.empty())                 msg.id = generate_id("msg", now, rng);
    if (msg.sender.empty())             msg.sender = registry.local_node_id();
    if (msg.timestamp == 0)             msg.timestamp = now;
    if (msg.ttl_ms <= 0)                msg.ttl_ms = config.message_timeout_ms;
    if (msg.routing.max_hops <= 0)      msg.routing.max_hops = config.max_hops;
    if (msg.routing.timeout_ms <= 0)    msg.routing.timeout_ms = config.message_timeout_ms;
    if (msg.compression.threshold == 0) msg.compression.threshold = config.compression_threshold;

    try {
        encode(msg);
    } catch (const json::type_error & e) {
        throw swarm_error(ERROR_TYPE_VALIDATION, "message " + msg.id + " is not serializable: " + e.what());
    }

    remember(msg);
    queues[msg.priority].push_back(msg);
    stats.enqueued++;

    LOG_DBG("queued %s message %s (%s) for %zu recipient(s)\n",
            message_type_to_str(msg.type).c_str(), msg.id.c_str(),
            message_priority_to_str(msg.priority).c_str(), msg.recipients.size());

    return msg.id;
}

std::string message_router::send(message_type type, const std::vector<std::string> & recipients,
                                 const json & data, message_priority priority) {
    return send_message(make_message(type, recipients, data, priority));
}

std::string message_router::broadcast(const json & data, message_priority priority) {
    swarm_message msg = make_message(MSG_TYPE_BROADCAST, registry.peer_ids(), data, priority);
    msg.routing.strategy = ROUTING_MULTIPATH;
    msg.routing.max_hops = 3;
    return send_message(std::move(msg));
}

std::string message_router::multicast(const std::vector<std::string> & recipients, const json & data,
                                      message_priority priority) {
    if (recipients.empty()) {
        throw swarm_error(ERROR_TYPE_VALIDATION, "multicast requires at least one recipient");
    }
    swarm_message msg = make_message(MSG_TYPE_MULTICAST, recipients, data, priority);
    msg.routing.strategy = ROUTING_DIRECT;
    msg.routing.max_hops = 2;
    return send_message(std::move(msg));
}

std::string message_router::unicast(const std::string & recipient, const json & data,
                                    message_priority priority) {
    swarm_message msg = make_message(MSG_TYPE_UNICAST, {recipient}, data, priority);
    msg.routing.strategy = ROUTING_DIRECT;
    msg.routing.max_hops = 1;
    msg.routing.delivery = DELIVERY_EXACTLY_ONCE;
    return send_message(std::move(msg));
}

void message_router::remember(const swarm_message & msg) {
    history.push_back(msg);
    while (history.size() > config.max_message_history) {
        history.pop_front();
    }
}

void message_router::register_handler(message_type type, message_handler handler) {
    handlers[type].push_back(std::move(handler));
}

void message_router::set_system_handler(message_type type, message_handler handler) {
    system_handlers[type] = std::move(handler);
}

// ============================================================================
// Routing
// ============================================================================

size_t message_router::process_queues() {
    const int64_t now = clock();
    size_t processed = 0;

    for (int p = 0; p < MSG_PRIORITY_COUNT; p++) {
        auto & queue = queues[p];
        int batch = 0;

        while (!queue.empty() && batch < config.max_messages_per_priority) {
            swarm_message msg = std::move(queue.front());
            queue.pop_front();
            batch++;
            processed++;

            if (msg.expired(now)) {
                stats.dropped_expired++;
                LOG_DBG("message %s expired before routing\n", msg.id.c_str());
                bus.publish(EVENT_MESSAGE_FAILED, now, make_message_event(msg, "ttl expired"));
                continue;
            }

            try {
                route(msg);
                stats.routed++;
                bus.publish(EVENT_MESSAGE_SENT, now, make_message_event(msg));
            } catch (const std::exception & e) {
                stats.failed++;
                LOG_WRN("failed to route message %s (%s): %s\n",
                        msg.id.c_str(), message_type_to_str(msg.type).c_str(), e.what());
                bus.publish(EVENT_MESSAGE_FAILED, now, make_message_event(msg, e.what()));
            }
        }

        // lower classes wait until this one is drained
        if (!queue.empty()) {
            break;
        }
    }

    return processed;
}

void message_router::route(const swarm_message & msg) {
    switch (msg.type) {
        case MSG_TYPE_BROADCAST: {
            std::vector<std::string> order = broadcast_order(tree);
            if (!msg.recipients.empty()) {
                const std::set<std::string> wanted(msg.recipients.begin(), msg.recipients.end());
                order.erase(std::remove_if(order.begin(), order.end(),
                                           [&wanted](const std::string & id) { return wanted.count(id) == 0; }),
                            order.end());
                // recipients outside the tree (offline or just joined) are still attempted
                const std::set<std::string> in_tree(order.begin(), order.end());
                for (const auto & r : msg.recipients) {
                    if (in_tree.count(r) == 0) {
                        order.push_back(r);
                    }
                }
            }
            forward_all(msg, order);
            break;
        }
        case MSG_TYPE_UNICAST:
            if (msg.recipients.size() != 1) {
                throw swarm_error(ERROR_TYPE_VALIDATION, "unicast requires exactly one recipient");
            }
            forward(msg, msg.recipients[0]);
            break;
        default:
            forward_all(msg, msg.recipients);
            break;
    }
}

void message_router::forward(const swarm_message & msg, const std::string & target) {
    if (target == registry.local_node_id()) {
        return;
    }

    // heartbeats double as liveness probes and may target nodes we consider offline
    const bool reachable = msg.type == MSG_TYPE_HEARTBEAT ? registry.contains(target)
                                                          : registry.is_reachable(target);
    if (!reachable) {
        throw swarm_error(ERROR_TYPE_ROUTING, "Target node " + target + " is unreachable");
    }

    swarm_message out = msg;
    out.hops++;
    if (out.hops > out.routing.max_hops) {
        throw swarm_error(ERROR_TYPE_ROUTING, "hop limit exceeded for message " + msg.id);
    }

    const int64_t now = clock();
    try {
        net.deliver(target, out);
    } catch (const swarm_error & e) {
        registry.record_error(target, now);
        throw;
    }
    registry.record_sent(target, out.payload.data.dump().size(), now);
}

void message_router::forward_all(const swarm_message & msg, const std::vector<std::string> & targets) {
    std::vector<std::string> unreachable;
    for (const auto & target : targets) {
        try {
            forward(msg, target);
        } catch (const swarm_error & e) {
            LOG_DBG("message %s not delivered to %s: %s\n", msg.id.c_str(), target.c_str(), e.what());
            unreachable.push_back(target);
        }
    }
    if (!unreachable.empty()) {
        throw swarm_error(ERROR_TYPE_ROUTING, "unreachable targets: " + join(unreachable, ", "));
    }
}

// ============================================================================
// Inbound
// ============================================================================

void message_router::receive(const swarm_message & msg) {
    const int64_t now = clock();

    if (!verify_checksum(msg)) {
        stats.dropped_checksum++;
        LOG_WRN("checksum mismatch on message %s from %s, dropping\n", msg.id.c_str(), msg.sender.c_str());
        return;
    }

    if (msg.expired(now)) {
        stats.dropped_expired++;
        LOG_DBG("message %s from %s expired in transit\n", msg.id.c_str(), msg.sender.c_str());
        return;
    }

    if (msg.qos.deduplication) {
        if (seen.count(msg.id) > 0) {
            stats.dropped_duplicate++;
            LOG_DBG("duplicate message %s from %s\n", msg.id.c_str(), msg.sender.c_str());
            return;
        }
        seen[msg.id] = now;
    }

    swarm_message decoded = msg;
    try {
        if (payload_is_encrypted(decoded.payload)) {
            if (!cipher) {
                throw swarm_error(ERROR_TYPE_CODEC, "encrypted payload but no cipher is installed");
            }
            decoded.payload = decrypt_payload(decoded.payload, *cipher);
        }
        decoded.payload = decompress_payload(decoded.payload);
    } catch (const swarm_error & e) {
        stats.dropped_codec++;
        LOG_WRN("cannot decode message %s from %s: %s\n", msg.id.c_str(), msg.sender.c_str(), e.what());
        bus.publish(EVENT_MESSAGE_FAILED, now, make_message_event(msg, e.what()));
        return;
    }

    stats.received++;
    registry.record_received(msg.sender, msg.payload.data.dump().size(), now - msg.timestamp, now);

    auto it = handlers.find(decoded.type);
    if (it != handlers.end()) {
        const auto listeners = it->second;
        for (const auto & handler : listeners) {
            try {
                handler(decoded);
            } catch (const std::exception & e) {
                LOG_ERR("handler for %s message %s threw: %s\n",
                        message_type_to_str(decoded.type).c_str(), decoded.id.c_str(), e.what());
            }
        }
    }

    auto sys = system_handlers.find(decoded.type);
    if (sys != system_handlers.end()) {
        const message_handler handler = sys->second;
        try {
            handler(decoded);
        } catch (const std::exception & e) {
            LOG_ERR("built-in handling of %s message %s failed: %s\n",
                    message_type_to_str(decoded.type).c_str(), decoded.id.c_str(), e.what());
        }
    }

    bus.publish(EVENT_MESSAGE_RECEIVED, now, make_message_event(decoded));
}

// ============================================================================
// Maintenance
// ============================================================================

size_t message_router::sweep() {
    const int64_t now = clock();
    const size_t before = history.size() + seen.size();

    history.erase(std::remove_if(history.begin(), history.end(),
                                 [now](const swarm_message & m) { return m.expired(now); }),
                  history.end());

    for (auto it = seen.begin(); it != seen.end();) {
        if (now - it->second > config.message_timeout_ms) {
            it = seen.erase(it);
        } else {
            ++it;
        }
    }

    const size_t purged = before - (history.size() + seen.size());
    if (purged > 0) {
        LOG_DBG("swept %zu expired message record(s)\n", purged);
    }
    return purged;
}

void message_router::rebuild_tree() {
    tree = build_broadcast_tree(registry.local_node_id(), registry.reachable_peer_ids());
    LOG_DBG("broadcast tree rebuilt: %zu member(s), depth %d\n", tree.size(), tree.depth);
}

void message_router::clear_queues() {
    for (auto & q : queues) {
        q.clear();
    }
}

size_t message_router::total_queued() const {
    size_t n = 0;
    for (const auto & q : queues) {
        n += q.size();
    }
    return n;
}

bool message_router::in_history(const std::string & message_id) const {
    return std::any_of(history.begin(), history.end(),
                       [&message_id](const swarm_message & m) { return m.id == message_id; });
}

json message_router::get_routing_info() const {
    json routes = json::array();
    for (const auto & node : registry.list()) {
        if (node.id == registry.local_node_id()) {
            continue;
        }
        auto p = tree.parent.find(node.id);
        routes.push_back({
            {"target", node.id},
            {"next_hop", node.id},
            {"hops", 1},
            {"status", node_status_to_str(node.status)},
            {"tree_parent", p != tree.parent.end() ? p->second : std::string()}
        });
    }

    json queued_by_priority = json::object();
    for (int p = 0; p < MSG_PRIORITY_COUNT; p++) {
        queued_by_priority[message_priority_to_str(static_cast<message_priority>(p))] = queues[p].size();
    }

    return json{
        {"node_id", registry.local_node_id()},
        {"tree", tree.to_json()},
        {"routes", routes},
        {"queued", queued_by_priority},
        {"stats", stats.to_json()}
    };
}

} // namespace swarm
