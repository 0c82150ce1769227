#include "node-registry.h"

#include "log.h"

namespace swarm {

std::string node_status_to_str(node_status status) {
    switch (status) {
        case NODE_STATUS_ONLINE:   return "online";
        case NODE_STATUS_DEGRADED: return "degraded";
        case NODE_STATUS_OFFLINE:  return "offline";
        default:                   return "unknown";
    }
}

static node_status str_to_node_status(const std::string & str) {
    if (str == "degraded") return NODE_STATUS_DEGRADED;
    if (str == "offline")  return NODE_STATUS_OFFLINE;
    return NODE_STATUS_ONLINE;
}

json node_capabilities::to_json() const {
    return json{
        {"max_connections", max_connections},
        {"protocols", protocols},
        {"supports_encryption", supports_encryption},
        {"supports_compression", supports_compression},
        {"bandwidth", bandwidth},
        {"buffer_size", buffer_size}
    };
}

json node_metrics::to_json() const {
    return json{
        {"messages_sent", messages_sent},
        {"messages_received", messages_received},
        {"bytes_transferred", bytes_transferred},
        {"average_latency_ms", average_latency_ms},
        {"error_rate", error_rate},
        {"packets_lost", packets_lost},
        {"throughput", throughput},
        {"last_updated", last_updated}
    };
}

json communication_node::to_json() const {
    return json{
        {"id", id},
        {"address", address},
        {"port", port},
        {"version", version},
        {"capabilities", capabilities.to_json()},
        {"metrics", metrics.to_json()},
        {"registered_at", registered_at},
        {"last_seen", last_seen},
        {"status", node_status_to_str(status)}
    };
}

communication_node communication_node::from_json(const json & j) {
    communication_node node;
    node.id        = j.value("id", "");
    node.address   = j.value("address", "");
    node.port      = j.value("port", 0);
    node.version   = j.value("version", "1.0");
    node.last_seen = j.value("last_seen", int64_t(0));
    node.status    = str_to_node_status(j.value("status", "online"));

    if (j.contains("capabilities")) {
        const auto & c = j["capabilities"];
        node.capabilities.max_connections      = c.value("max_connections", 100);
        node.capabilities.protocols            = c.value("protocols", std::vector<std::string>{"tcp"});
        node.capabilities.supports_encryption  = c.value("supports_encryption", false);
        node.capabilities.supports_compression = c.value("supports_compression", true);
        node.capabilities.bandwidth            = c.value("bandwidth", int64_t(0));
        node.capabilities.buffer_size          = c.value("buffer_size", size_t(65536));
    }
    return node;
}

node_status derive_node_status(int64_t last_seen, int64_t now_ms, int64_t heartbeat_interval_ms) {
    const int64_t silence = now_ms - last_seen;
    if (silence > 3 * heartbeat_interval_ms) {
        return NODE_STATUS_OFFLINE;
    }
    if (silence > 2 * heartbeat_interval_ms) {
        return NODE_STATUS_DEGRADED;
    }
    return NODE_STATUS_ONLINE;
}

// ============================================================================
// Node Registry Implementation
// ============================================================================

node_registry::node_registry(const std::string & local_id, int64_t heartbeat_interval_ms, event_bus & bus)
    : local_id(local_id), heartbeat_interval_ms(heartbeat_interval_ms), bus(bus) {}

void node_registry::membership_changed() {
    if (on_membership_change) {
        on_membership_change();
    }
}

void node_registry::set_status(communication_node & node, node_status status, int64_t now_ms) {
    const node_status previous = node.status;
    if (previous == status) {
        return;
    }
    node.status = status;

    LOG_DBG("node %s: %s -> %s\n", node.id.c_str(),
            node_status_to_str(previous).c_str(), node_status_to_str(status).c_str());

    if (status == NODE_STATUS_OFFLINE) {
        LOG_WRN("node %s is offline (last seen %lld ms ago)\n",
                node.id.c_str(), (long long) (now_ms - node.last_seen));
        bus.publish(EVENT_NODE_DISCONNECTED, now_ms, node_event{node.id, node_status_to_str(status)});
        membership_changed();
    } else if (previous == NODE_STATUS_OFFLINE) {
        LOG_INF("node %s reconnected\n", node.id.c_str());
        bus.publish(EVENT_NODE_CONNECTED, now_ms, node_event{node.id, node_status_to_str(status)});
        membership_changed();
    }
}

void node_registry::register_node(const communication_node & node, int64_t now_ms) {
    if (node.id.empty()) {
        throw swarm_error(ERROR_TYPE_VALIDATION, "node id must not be empty");
    }

    auto it = nodes.find(node.id);
    if (it != nodes.end()) {
        const node_metrics metrics = it->second.metrics;
        const int64_t registered_at = it->second.registered_at;
        it->second = node;
        it->second.metrics = metrics;
        it->second.registered_at = registered_at;
        it->second.last_seen = now_ms;
        it->second.status = NODE_STATUS_ONLINE;
        LOG_DBG("node %s re-registered\n", node.id.c_str());
        membership_changed();
        return;
    }

    communication_node entry = node;
    entry.registered_at = now_ms;
    entry.last_seen     = now_ms;
    entry.status        = NODE_STATUS_ONLINE;
    nodes[node.id] = entry;

    LOG_INF("node registered: %s (%s:%d)\n", node.id.c_str(), node.address.c_str(), node.port);
    bus.publish(EVENT_NODE_REGISTERED, now_ms, node_event{node.id, node_status_to_str(NODE_STATUS_ONLINE)});
    membership_changed();
}

bool node_registry::unregister_node(const std::string & node_id, int64_t now_ms) {
    if (node_id == local_id) {
        throw swarm_error(ERROR_TYPE_VALIDATION, "cannot unregister the local node");
    }

    auto it = nodes.find(node_id);
    if (it == nodes.end()) {
        return false;
    }
    nodes.erase(it);

    LOG_INF("node unregistered: %s\n", node_id.c_str());
    bus.publish(EVENT_NODE_UNREGISTERED, now_ms, node_event{node_id, node_status_to_str(NODE_STATUS_OFFLINE)});
    membership_changed();
    return true;
}

bool node_registry::touch(const std::string & node_id, int64_t now_ms) {
    auto it = nodes.find(node_id);
    if (it == nodes.end()) {
        return false;
    }
    it->second.last_seen = now_ms;
    set_status(it->second, NODE_STATUS_ONLINE, now_ms);
    return true;
}

std::vector<std::string> node_registry::refresh_status(int64_t now_ms) {
    std::vector<std::pair<std::string, node_status>> transitions;
    for (const auto & [id, node] : nodes) {
        if (id == local_id) {
            continue;
        }
        const node_status status = derive_node_status(node.last_seen, now_ms, heartbeat_interval_ms);
        if (status != node.status) {
            transitions.emplace_back(id, status);
        }
    }

    // event handlers may mutate the registry, so apply after the scan
    std::vector<std::string> changed;
    for (const auto & [id, status] : transitions) {
        auto it = nodes.find(id);
        if (it != nodes.end()) {
            set_status(it->second, status, now_ms);
            changed.push_back(id);
        }
    }
    return changed;
}

bool node_registry::contains(const std::string & node_id) const {
    return nodes.find(node_id) != nodes.end();
}

bool node_registry::get(const std::string & node_id, communication_node & node) const {
    auto it = nodes.find(node_id);
    if (it == nodes.end()) {
        return false;
    }
    node = it->second;
    return true;
}

node_status node_registry::status_of(const std::string & node_id) const {
    auto it = nodes.find(node_id);
    return it == nodes.end() ? NODE_STATUS_OFFLINE : it->second.status;
}

bool node_registry::is_reachable(const std::string & node_id) const {
    auto it = nodes.find(node_id);
    return it != nodes.end() && it->second.status != NODE_STATUS_OFFLINE;
}

std::vector<std::string> node_registry::node_ids() const {
    std::vector<std::string> ids;
    ids.reserve(nodes.size());
    for (const auto & [id, _] : nodes) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<std::string> node_registry::peer_ids() const {
    std::vector<std::string> ids;
    for (const auto & [id, _] : nodes) {
        if (id != local_id) {
            ids.push_back(id);
        }
    }
    return ids;
}

std::vector<std::string> node_registry::reachable_peer_ids() const {
    std::vector<std::string> ids;
    for (const auto & [id, node] : nodes) {
        if (id != local_id && node.status != NODE_STATUS_OFFLINE) {
            ids.push_back(id);
        }
    }
    return ids;
}

std::vector<communication_node> node_registry::list() const {
    std::vector<communication_node> out;
    out.reserve(nodes.size());
    for (const auto & [_, node] : nodes) {
        out.push_back(node);
    }
    return out;
}

size_t node_registry::online_count() const {
    size_t n = 0;
    for (const auto & [_, node] : nodes) {
        if (node.status == NODE_STATUS_ONLINE) n++;
    }
    return n;
}

static void update_throughput(communication_node & node, int64_t now_ms) {
    const int64_t lifetime = now_ms - node.registered_at;
    const uint64_t total = node.metrics.messages_sent + node.metrics.messages_received;
    node.metrics.throughput   = lifetime > 0 ? (double) total * 1000.0 / (double) lifetime : 0.0;
    node.metrics.last_updated = now_ms;
}

void node_registry::record_sent(const std::string & node_id, size_t bytes, int64_t now_ms) {
    auto it = nodes.find(node_id);
    if (it == nodes.end()) {
        return;
    }
    auto & m = it->second.metrics;
    m.messages_sent++;
    m.bytes_transferred += bytes;
    update_throughput(it->second, now_ms);
}

void node_registry::record_received(const std::string & node_id, size_t bytes, int64_t latency_ms, int64_t now_ms) {
    auto it = nodes.find(node_id);
    if (it == nodes.end()) {
        return;
    }
    auto & m = it->second.metrics;
    m.messages_received++;
    m.bytes_transferred += bytes;
    // running mean over received messages
    m.average_latency_ms += ((double) latency_ms - m.average_latency_ms) / (double) m.messages_received;
    update_throughput(it->second, now_ms);
}

void node_registry::record_error(const std::string & node_id, int64_t now_ms) {
    auto it = nodes.find(node_id);
    if (it == nodes.end()) {
        return;
    }
    auto & m = it->second.metrics;
    m.packets_lost++;
    const uint64_t attempts = m.messages_sent + m.packets_lost;
    m.error_rate = attempts > 0 ? (double) m.packets_lost / (double) attempts : 0.0;
    m.last_updated = now_ms;
}

} // namespace swarm
