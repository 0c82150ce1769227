#include "event-bus.h"

#include "log.h"

#include <algorithm>

namespace swarm {

std::string event_type_to_str(event_type type) {
    switch (type) {
        case EVENT_NODE_REGISTERED:     return "node:registered";
        case EVENT_NODE_UNREGISTERED:   return "node:unregistered";
        case EVENT_NODE_CONNECTED:      return "node:connected";
        case EVENT_NODE_DISCONNECTED:   return "node:disconnected";
        case EVENT_MESSAGE_SENT:        return "message:sent";
        case EVENT_MESSAGE_RECEIVED:    return "message:received";
        case EVENT_MESSAGE_FAILED:      return "message:failed";
        case EVENT_TASK_SUBMITTED:      return "task:submitted";
        case EVENT_TASK_ASSIGNED:       return "task:assigned";
        case EVENT_TASK_PROGRESS:       return "task:progress";
        case EVENT_TASK_COMPLETED:      return "task:completed";
        case EVENT_TASK_FAILED:         return "task:failed";
        case EVENT_TASK_CANCELLED:      return "task:cancelled";
        case EVENT_TASK_REASSIGNED:     return "task:reassigned";
        case EVENT_CONSENSUS_INITIATED: return "consensus:initiated";
        case EVENT_CONSENSUS_REACHED:   return "consensus:reached";
        case EVENT_VOTE_CAST:           return "vote:cast";
        case EVENT_GOSSIP_STARTED:      return "gossip:started";
        case EVENT_METRICS_UPDATED:     return "metrics:updated";
        case EVENT_SHUTDOWN:            return "shutdown";
        default:                        return "unknown";
    }
}

json swarm_event::to_json() const {
    json j = {
        {"type", event_type_to_str(type)},
        {"timestamp", timestamp}
    };

    if (const auto * e = std::get_if<node_event>(&payload)) {
        j["node_id"] = e->node_id;
        j["status"]  = e->status;
    } else if (const auto * e = std::get_if<message_event>(&payload)) {
        j["message_id"] = e->message_id;
        j["message_type"] = message_type_to_str(e->type);
        j["sender"]     = e->sender;
        j["recipients"] = e->recipients;
        if (!e->error.empty()) {
            j["error"] = e->error;
        }
    } else if (const auto * e = std::get_if<task_event>(&payload)) {
        j["task_id"]  = e->task_id;
        j["agent_id"] = e->agent_id;
        if (!e->previous_agent.empty()) j["previous_agent"] = e->previous_agent;
        if (!e->reason.empty())         j["reason"] = e->reason;
        if (type == EVENT_TASK_PROGRESS) j["progress"] = e->progress;
        if (type == EVENT_TASK_FAILED)   j["permanent"] = e->permanent;
        if (!e->data.is_null())          j["data"] = e->data;
    } else if (const auto * e = std::get_if<consensus_event>(&payload)) {
        j["proposal_id"]   = e->proposal_id;
        j["proposal_type"] = proposal_type_to_str(e->type);
        if (!e->result.empty()) {
            j["result"] = e->result;
            j["votes"]  = e->votes;
        }
        j["value"] = e->value;
    } else if (const auto * e = std::get_if<vote_event>(&payload)) {
        j["proposal_id"] = e->proposal_id;
        j["voter"]       = e->voter;
        j["decision"]    = vote_decision_to_str(e->decision);
    } else if (const auto * e = std::get_if<gossip_event>(&payload)) {
        j["key"]     = e->key;
        j["version"] = e->version;
    } else if (const auto * e = std::get_if<metrics_event>(&payload)) {
        j["metrics"] = e->metrics;
    }

    return j;
}

int event_bus::subscribe(event_type type, handler_fn handler) {
    const int id = next_id++;
    subscriptions.push_back({id, false, type, std::move(handler)});
    return id;
}

int event_bus::subscribe_all(handler_fn handler) {
    const int id = next_id++;
    subscriptions.push_back({id, true, EVENT_SHUTDOWN, std::move(handler)});
    return id;
}

bool event_bus::unsubscribe(int id) {
    auto it = std::find_if(subscriptions.begin(), subscriptions.end(),
                           [id](const subscription & s) { return s.id == id; });
    if (it == subscriptions.end()) {
        return false;
    }
    subscriptions.erase(it);
    return true;
}

void event_bus::publish(event_type type, int64_t timestamp, event_payload payload) {
    swarm_event ev;
    ev.type      = type;
    ev.timestamp = timestamp;
    ev.payload   = std::move(payload);

    published++;

    // handlers may subscribe or unsubscribe while we iterate
    const auto snapshot = subscriptions;
    for (const auto & sub : snapshot) {
        if (!sub.all && sub.type != type) {
            continue;
        }
        // skip handlers removed by an earlier handler of this event
        const bool live = std::any_of(subscriptions.begin(), subscriptions.end(),
                                      [&sub](const subscription & s) { return s.id == sub.id; });
        if (!live) {
            continue;
        }
        try {
            sub.handler(ev);
        } catch (const std::exception & e) {
            LOG_ERR("event handler for %s threw: %s\n", event_type_to_str(type).c_str(), e.what());
        }
    }
}

} // namespace swarm
