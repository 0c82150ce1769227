#pragma once

#include "distribution.h"
#include "event-bus.h"
#include "protocols.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace swarm {

// ============================================================================
// Swarm Coordinator
// ============================================================================

// Connects the distribution engine to the message substrate. Assignments and
// cancellations go out as unicasts to the agent's node; agents answer with
// CONTROL messages carrying {"kind": "task_progress" | "task_completed" | "task_failed"}.
// A node going offline makes its agents unavailable.
class swarm_coordinator {
private:
    communication_protocols & protocols;
    task_distribution_engine & engine;
    event_bus & bus;

    std::map<std::string, std::string> agent_nodes;  // agent id -> node id
    std::vector<int> subscriptions;

    uint64_t dispatched = 0;
    uint64_t control_received = 0;
    uint64_t control_rejected = 0;

    std::string node_of(const std::string & agent_id) const;

    void on_task_assigned(const swarm_event & ev);
    void on_task_cancelled(const swarm_event & ev);
    void on_task_reassigned(const swarm_event & ev);
    void on_node_disconnected(const swarm_event & ev);
    void on_control(const swarm_message & msg);

public:
    swarm_coordinator(communication_protocols & protocols, task_distribution_engine & engine, event_bus & bus);
    ~swarm_coordinator();

    swarm_coordinator(const swarm_coordinator &) = delete;
    swarm_coordinator & operator=(const swarm_coordinator &) = delete;

    // registers the agent with the engine and remembers which node hosts it
    void register_agent(const agent_capability & agent, const std::string & node_id);

    std::string submit_task(const task_definition & task) { return engine.submit_task(task); }

    // advances messaging first so agent replies land before assignment
    void advance();

    json get_status() const;
};

} // namespace swarm
