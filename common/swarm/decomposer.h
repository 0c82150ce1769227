#pragma once

#include "task.h"

#include <string>
#include <vector>

namespace swarm {

enum execution_strategy {
    EXECUTION_SEQUENTIAL,
    EXECUTION_PARALLEL,
    EXECUTION_PIPELINE,
    EXECUTION_ADAPTIVE
};

enum coordination_type {
    COORDINATION_CENTRALIZED,
    COORDINATION_DISTRIBUTED,
    COORDINATION_HIERARCHICAL,
    COORDINATION_PEER_TO_PEER
};

std::string execution_strategy_to_str(execution_strategy strategy);
std::string coordination_type_to_str(coordination_type type);

struct sub_task {
    std::string id;
    std::string name;
    std::string description;
    std::string type;
    std::vector<std::string> required_capabilities;
    int64_t estimated_duration_ms = 0;
    std::vector<std::string> dependencies;  // sibling subtask ids, blocking
    int order = 0;
    bool parallelizable = false;
    bool critical_path = false;

    json to_json() const;
};

struct execution_phase {
    std::string id;
    std::vector<std::string> tasks;
    bool parallel = false;
    int64_t estimated_duration_ms = 0;
};

struct execution_checkpoint {
    std::string id;
    std::string after_phase;
    std::string condition;
};

struct execution_plan {
    execution_strategy strategy = EXECUTION_SEQUENTIAL;
    std::vector<execution_phase> phases;
    std::vector<execution_checkpoint> checkpoints;
    std::vector<std::string> rollback_steps;

    json to_json() const;
};

struct coordination_strategy {
    coordination_type type = COORDINATION_CENTRALIZED;
    std::string communication_pattern;
    std::vector<std::string> sync_points;
    std::string conflict_resolution;

    json to_json() const;
};

struct decomposed_task {
    std::string parent_id;
    std::vector<sub_task> subtasks;  // in execution order
    execution_plan plan;
    coordination_strategy coordination;
    int64_t total_estimated_ms = 0;  // along the critical path

    json to_json() const;
};

// complex and expert tasks are split before queueing
bool requires_decomposition(const task_definition & task);

// Turns one subtask into a queueable task carrying metadata.parent_id / metadata.order
task_definition subtask_to_task(const sub_task & sub, const task_definition & parent, int64_t now_ms);

// ============================================================================
// Decomposition policies
// ============================================================================

class task_decomposer {
public:
    virtual ~task_decomposer() = default;

    virtual decomposed_task decompose(const task_definition & task) = 0;
};

// One work subtask per required capability (or a fixed count of generic parts),
// closed by an integration subtask that depends on all of them. Complex tasks
// run work in parallel under a central coordinator; expert tasks chain work as a
// pipeline under hierarchical coordination.
class default_decomposer : public task_decomposer {
public:
    decomposed_task decompose(const task_definition & task) override;
};

} // namespace swarm
