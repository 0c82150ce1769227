#pragma once

#include "message.h"

#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace swarm {

enum event_type {
    EVENT_NODE_REGISTERED,
    EVENT_NODE_UNREGISTERED,
    EVENT_NODE_CONNECTED,
    EVENT_NODE_DISCONNECTED,
    EVENT_MESSAGE_SENT,
    EVENT_MESSAGE_RECEIVED,
    EVENT_MESSAGE_FAILED,
    EVENT_TASK_SUBMITTED,
    EVENT_TASK_ASSIGNED,
    EVENT_TASK_PROGRESS,
    EVENT_TASK_COMPLETED,
    EVENT_TASK_FAILED,
    EVENT_TASK_CANCELLED,
    EVENT_TASK_REASSIGNED,
    EVENT_CONSENSUS_INITIATED,
    EVENT_CONSENSUS_REACHED,
    EVENT_VOTE_CAST,
    EVENT_GOSSIP_STARTED,
    EVENT_METRICS_UPDATED,
    EVENT_SHUTDOWN
};

// "node:registered", "task:assigned", ...
std::string event_type_to_str(event_type type);

// ============================================================================
// Event payloads
// ============================================================================

struct node_event {
    std::string node_id;
    std::string status;
};

struct message_event {
    std::string message_id;
    message_type type = MSG_TYPE_DATA;
    std::string sender;
    std::vector<std::string> recipients;
    std::string error;
    json data;
};

struct task_event {
    std::string task_id;
    std::string agent_id;
    std::string previous_agent;
    std::string reason;
    double progress = 0.0;
    bool permanent = false;
    json data;
};

struct consensus_event {
    std::string proposal_id;
    proposal_type type = PROPOSAL_VALUE;
    std::string result;  // "accepted" / "rejected", empty on initiation
    int votes = 0;
    json value;
};

struct vote_event {
    std::string proposal_id;
    std::string voter;
    vote_decision decision = VOTE_ABSTAIN;
};

struct gossip_event {
    std::string key;
    int64_t version = 0;
};

struct metrics_event {
    json metrics;
};

using event_payload = std::variant<std::monostate, node_event, message_event, task_event,
                                   consensus_event, vote_event, gossip_event, metrics_event>;

struct swarm_event {
    event_type type;
    int64_t timestamp = 0;
    event_payload payload;

    json to_json() const;
};

// ============================================================================
// Event Bus
// ============================================================================

class event_bus {
public:
    using handler_fn = std::function<void(const swarm_event &)>;

private:
    struct subscription {
        int id;
        bool all;
        event_type type;
        handler_fn handler;
    };

    std::vector<subscription> subscriptions;
    int next_id = 1;
    uint64_t published = 0;

public:
    event_bus() = default;

    int subscribe(event_type type, handler_fn handler);
    int subscribe_all(handler_fn handler);
    bool unsubscribe(int id);

    // handler exceptions are logged and do not reach the publisher
    void publish(event_type type, int64_t timestamp, event_payload payload = std::monostate{});

    size_t subscriber_count() const { return subscriptions.size(); }
    uint64_t published_count() const { return published; }
};

} // namespace swarm
