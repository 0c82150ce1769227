#include "decomposer.h"

#include <algorithm>

namespace swarm {

std::string execution_strategy_to_str(execution_strategy strategy) {
    switch (strategy) {
        case EXECUTION_SEQUENTIAL: return "sequential";
        case EXECUTION_PARALLEL:   return "parallel";
        case EXECUTION_PIPELINE:   return "pipeline";
        case EXECUTION_ADAPTIVE:   return "adaptive";
        default:                   return "unknown";
    }
}

std::string coordination_type_to_str(coordination_type type) {
    switch (type) {
        case COORDINATION_CENTRALIZED:  return "centralized";
        case COORDINATION_DISTRIBUTED:  return "distributed";
        case COORDINATION_HIERARCHICAL: return "hierarchical";
        case COORDINATION_PEER_TO_PEER: return "peer_to_peer";
        default:                        return "unknown";
    }
}

json sub_task::to_json() const {
    return json{
        {"id", id},
        {"name", name},
        {"description", description},
        {"type", type},
        {"required_capabilities", required_capabilities},
        {"estimated_duration_ms", estimated_duration_ms},
        {"dependencies", dependencies},
        {"order", order},
        {"parallelizable", parallelizable},
        {"critical_path", critical_path}
    };
}

json execution_plan::to_json() const {
    json j_phases = json::array();
    for (const auto & p : phases) {
        j_phases.push_back({
            {"id", p.id},
            {"tasks", p.tasks},
            {"parallel", p.parallel},
            {"estimated_duration_ms", p.estimated_duration_ms}
        });
    }
    json j_checkpoints = json::array();
    for (const auto & c : checkpoints) {
        j_checkpoints.push_back({
            {"id", c.id},
            {"after_phase", c.after_phase},
            {"condition", c.condition}
        });
    }
    return json{
        {"strategy", execution_strategy_to_str(strategy)},
        {"phases", j_phases},
        {"checkpoints", j_checkpoints},
        {"rollback_steps", rollback_steps}
    };
}

json coordination_strategy::to_json() const {
    return json{
        {"type", coordination_type_to_str(type)},
        {"communication_pattern", communication_pattern},
        {"sync_points", sync_points},
        {"conflict_resolution", conflict_resolution}
    };
}

json decomposed_task::to_json() const {
    json j_subtasks = json::array();
    for (const auto & s : subtasks) {
        j_subtasks.push_back(s.to_json());
    }
    return json{
        {"parent_id", parent_id},
        {"subtasks", j_subtasks},
        {"execution_plan", plan.to_json()},
        {"coordination", coordination.to_json()},
        {"total_estimated_ms", total_estimated_ms}
    };
}

bool requires_decomposition(const task_definition & task) {
    return task.complexity == TASK_COMPLEXITY_COMPLEX || task.complexity == TASK_COMPLEXITY_EXPERT;
}

task_definition subtask_to_task(const sub_task & sub, const task_definition & parent, int64_t now_ms) {
    task_definition t;
    t.id          = sub.id;
    t.name        = sub.name;
    t.description = sub.description;
    t.type        = sub.type;
    t.priority    = parent.priority;
    t.complexity  = TASK_COMPLEXITY_SIMPLE;

    t.requirements.capabilities    = sub.required_capabilities;
    t.requirements.excluded_agents = parent.requirements.excluded_agents;
    t.requirements.resources       = parent.requirements.resources;
    t.requirements.quality         = parent.requirements.quality;

    t.constraints.max_retries = 3;
    t.constraints.timeout_ms  = sub.estimated_duration_ms * 2;
    t.constraints.isolation   = ISOLATION_PROCESS;
    t.constraints.security    = SECURITY_MEDIUM;

    for (const auto & dep : sub.dependencies) {
        t.dependencies.push_back({dep, DEPENDENCY_BLOCKING, 1.0});
    }

    t.estimated_duration_ms = sub.estimated_duration_ms;
    t.metadata     = json{{"parent_id", parent.id}, {"order", sub.order}};
    t.created      = now_ms;
    t.submitted_by = parent.submitted_by;
    return t;
}

// ============================================================================
// Default decomposer
// ============================================================================

decomposed_task default_decomposer::decompose(const task_definition & task) {
    const bool pipeline = task.complexity == TASK_COMPLEXITY_EXPERT;

    struct work_item {
        std::string label;
        std::vector<std::string> capabilities;
    };
    std::vector<work_item> work;
    if (!task.requirements.capabilities.empty()) {
        for (const auto & cap : task.requirements.capabilities) {
            work.push_back({cap, {cap}});
        }
    } else {
        const int parts = pipeline ? 5 : 3;
        for (int i = 1; i <= parts; i++) {
            work.push_back({"part " + std::to_string(i), {}});
        }
    }

    const int64_t slice = std::max<int64_t>(task.estimated_duration_ms / (int64_t) (work.size() + 1), 1000);

    decomposed_task d;
    d.parent_id = task.id;

    std::vector<std::string> work_ids;
    for (size_t i = 0; i < work.size(); i++) {
        sub_task s;
        s.id                    = task.id + "-sub-" + std::to_string(i + 1);
        s.name                  = task.name + ": " + work[i].label;
        s.description           = "Work on " + work[i].label + " for " + task.name;
        s.type                  = task.type;
        s.required_capabilities = work[i].capabilities;
        s.estimated_duration_ms = slice;
        s.order                 = (int) i + 1;
        s.parallelizable        = !pipeline;
        s.critical_path         = pipeline || i == 0;
        if (pipeline && i > 0) {
            s.dependencies.push_back(work_ids.back());
        }
        work_ids.push_back(s.id);
        d.subtasks.push_back(s);
    }

    sub_task integration;
    integration.id                    = task.id + "-sub-" + std::to_string(work.size() + 1);
    integration.name                  = task.name + ": integration";
    integration.description           = "Integrate subtask results for " + task.name;
    integration.type                  = task.type;
    integration.estimated_duration_ms = slice;
    integration.dependencies          = work_ids;
    integration.order                 = (int) work.size() + 1;
    integration.parallelizable        = false;
    integration.critical_path         = true;
    d.subtasks.push_back(integration);

    // execution plan
    if (pipeline) {
        d.plan.strategy = EXECUTION_PIPELINE;
        for (const auto & s : d.subtasks) {
            d.plan.phases.push_back({"phase-" + std::to_string(s.order), {s.id}, false, s.estimated_duration_ms});
        }
    } else {
        d.plan.strategy = EXECUTION_PARALLEL;
        d.plan.phases.push_back({"phase-1", work_ids, true, slice});
        d.plan.phases.push_back({"phase-2", {integration.id}, false, slice});
    }
    for (const auto & phase : d.plan.phases) {
        d.plan.checkpoints.push_back({"checkpoint-" + phase.id, phase.id, "all phase tasks completed"});
        d.total_estimated_ms += phase.estimated_duration_ms;
    }
    for (auto it = d.subtasks.rbegin(); it != d.subtasks.rend(); ++it) {
        d.plan.rollback_steps.push_back("cancel " + it->id);
    }

    // coordination
    if (pipeline) {
        d.coordination.type                  = COORDINATION_HIERARCHICAL;
        d.coordination.communication_pattern = "tree";
        for (const auto & phase : d.plan.phases) {
            d.coordination.sync_points.push_back(phase.id);
        }
        d.coordination.conflict_resolution = "escalate_to_parent";
    } else {
        d.coordination.type                  = COORDINATION_CENTRALIZED;
        d.coordination.communication_pattern = "hub_and_spoke";
        d.coordination.sync_points           = {integration.id};
        d.coordination.conflict_resolution   = "coordinator_decides";
    }

    return d;
}

} // namespace swarm
