#include "coordinator.h"

#include "log.h"

namespace swarm {

swarm_coordinator::swarm_coordinator(communication_protocols & protocols, task_distribution_engine & engine,
                                     event_bus & bus)
    : protocols(protocols), engine(engine), bus(bus) {
    subscriptions.push_back(bus.subscribe(EVENT_TASK_ASSIGNED,     [this](const swarm_event & ev) { on_task_assigned(ev); }));
    subscriptions.push_back(bus.subscribe(EVENT_TASK_CANCELLED,    [this](const swarm_event & ev) { on_task_cancelled(ev); }));
    subscriptions.push_back(bus.subscribe(EVENT_TASK_REASSIGNED,   [this](const swarm_event & ev) { on_task_reassigned(ev); }));
    subscriptions.push_back(bus.subscribe(EVENT_NODE_DISCONNECTED, [this](const swarm_event & ev) { on_node_disconnected(ev); }));

    protocols.register_handler(MSG_TYPE_CONTROL, [this](const swarm_message & msg) { on_control(msg); });

    LOG_INF("swarm coordinator attached to node %s\n", protocols.node_id().c_str());
}

swarm_coordinator::~swarm_coordinator() {
    for (int id : subscriptions) {
        bus.unsubscribe(id);
    }
}

void swarm_coordinator::register_agent(const agent_capability & agent, const std::string & node_id) {
    if (node_id.empty()) {
        throw swarm_error(ERROR_TYPE_VALIDATION, "agent " + agent.agent_id + " needs a hosting node");
    }
    engine.register_agent(agent);
    agent_nodes[agent.agent_id] = node_id;
}

std::string swarm_coordinator::node_of(const std::string & agent_id) const {
    auto it = agent_nodes.find(agent_id);
    return it != agent_nodes.end() ? it->second : std::string();
}

// ============================================================================
// Engine events -> messages
// ============================================================================

void swarm_coordinator::on_task_assigned(const swarm_event & ev) {
    const auto * te = std::get_if<task_event>(&ev.payload);
    if (!te) {
        return;
    }
    const std::string node = node_of(te->agent_id);
    if (node.empty()) {
        LOG_WRN("agent %s has no hosting node, assignment of %s not dispatched\n",
                te->agent_id.c_str(), te->task_id.c_str());
        return;
    }

    const task_record * rec = engine.get_task(te->task_id);
    json data = {
        {"kind", "task_assignment"},
        {"task", rec ? rec->task.to_json() : json::object()},
        {"assignment", te->data}
    };
    protocols.unicast(node, data, MSG_PRIORITY_HIGH);
    dispatched++;
}

void swarm_coordinator::on_task_cancelled(const swarm_event & ev) {
    const auto * te = std::get_if<task_event>(&ev.payload);
    if (!te || te->agent_id.empty()) {
        return;
    }
    const std::string node = node_of(te->agent_id);
    if (node.empty()) {
        return;
    }
    json data = {
        {"kind", "task_cancel"},
        {"task_id", te->task_id},
        {"agent_id", te->agent_id},
        {"reason", te->reason}
    };
    protocols.unicast(node, data, MSG_PRIORITY_HIGH);
}

void swarm_coordinator::on_task_reassigned(const swarm_event & ev) {
    const auto * te = std::get_if<task_event>(&ev.payload);
    if (!te || te->previous_agent.empty()) {
        return;
    }
    const std::string node = node_of(te->previous_agent);
    if (node.empty() || !protocols.get_registry().is_reachable(node)) {
        return;
    }
    json data = {
        {"kind", "task_cancel"},
        {"task_id", te->task_id},
        {"agent_id", te->previous_agent},
        {"reason", te->reason}
    };
    protocols.unicast(node, data, MSG_PRIORITY_HIGH);
}

void swarm_coordinator::on_node_disconnected(const swarm_event & ev) {
    const auto * ne = std::get_if<node_event>(&ev.payload);
    if (!ne) {
        return;
    }
    std::vector<std::string> hosted;
    for (const auto & kv : agent_nodes) {
        if (kv.second == ne->node_id) {
            hosted.push_back(kv.first);
        }
    }
    for (const auto & agent_id : hosted) {
        engine.handle_agent_unavailable(agent_id);
    }
}

// ============================================================================
// Messages -> engine
// ============================================================================

void swarm_coordinator::on_control(const swarm_message & msg) {
    const json & data = msg.payload.data;
    if (!data.is_object() || !data.contains("kind") || !data.contains("task_id")) {
        return;
    }
    control_received++;

    const std::string kind    = data.value("kind", "");
    const std::string task_id = data.value("task_id", "");

    // only the agent holding the assignment may report on it
    const task_assignment * a = engine.get_assignment(task_id);
    if (!a || node_of(a->agent_id) != msg.sender) {
        control_rejected++;
        LOG_WRN("ignoring %s for task %s from node %s\n", kind.c_str(), task_id.c_str(), msg.sender.c_str());
        return;
    }

    if (kind == "task_progress") {
        engine.handle_task_progress(task_id, data.value("progress", 0.0), data.value("data", json::object()));
    } else if (kind == "task_completed") {
        engine.handle_task_completion(task_id, data.value("result", json::object()), data.value("quality", 0.8));
    } else if (kind == "task_failed") {
        engine.handle_task_failure(task_id, data.value("error", std::string("unknown error")));
    } else {
        control_rejected++;
        LOG_WRN("unknown control kind %s from node %s\n", kind.c_str(), msg.sender.c_str());
    }
}

// ============================================================================
// Periodic work
// ============================================================================

void swarm_coordinator::advance() {
    protocols.advance();
    engine.advance();
}

json swarm_coordinator::get_status() const {
    json agents = json::object();
    for (const auto & kv : agent_nodes) {
        agents[kv.first] = kv.second;
    }
    return json{
        {"node_id", protocols.node_id()},
        {"agents", agents},
        {"dispatched", dispatched},
        {"control_received", control_received},
        {"control_rejected", control_rejected},
        {"queue", engine.get_queue_status()},
        {"metrics", engine.get_metrics().to_json()},
        {"network", protocols.get_metrics()}
    };
}

} // namespace swarm
