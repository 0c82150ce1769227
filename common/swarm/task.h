#pragma once

#include "common.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace swarm {

// ============================================================================
// Task enums
// ============================================================================

enum task_priority {
    TASK_PRIORITY_LOW,
    TASK_PRIORITY_NORMAL,
    TASK_PRIORITY_HIGH,
    TASK_PRIORITY_URGENT,
    TASK_PRIORITY_CRITICAL
};

enum task_complexity {
    TASK_COMPLEXITY_TRIVIAL,
    TASK_COMPLEXITY_SIMPLE,
    TASK_COMPLEXITY_MODERATE,
    TASK_COMPLEXITY_COMPLEX,
    TASK_COMPLEXITY_EXPERT
};

enum dependency_type {
    DEPENDENCY_BLOCKING,
    DEPENDENCY_SOFT,
    DEPENDENCY_DATA,
    DEPENDENCY_RESOURCE
};

enum isolation_level {
    ISOLATION_NONE,
    ISOLATION_PROCESS,
    ISOLATION_CONTAINER,
    ISOLATION_VM
};

enum security_level {
    SECURITY_LOW,
    SECURITY_MEDIUM,
    SECURITY_HIGH,
    SECURITY_CRITICAL
};

enum task_status {
    TASK_STATUS_PENDING,     // queued, waiting for dependencies or an agent
    TASK_STATUS_DECOMPOSED,  // parent of queued subtasks
    TASK_STATUS_ASSIGNED,
    TASK_STATUS_COMPLETED,
    TASK_STATUS_FAILED,
    TASK_STATUS_CANCELLED
};

enum cancellation_reason {
    CANCEL_USER_REQUEST,
    CANCEL_TIMEOUT,
    CANCEL_RESOURCE_UNAVAILABLE,
    CANCEL_DEPENDENCY_FAILURE,
    CANCEL_PRIORITY_OVERRIDE,
    CANCEL_SYSTEM_SHUTDOWN,
    CANCEL_AGENT_FAILURE,
    CANCEL_TASK_STUCK,
    CANCEL_AGENT_UNAVAILABLE,
    CANCEL_NO_PROGRESS
};

enum availability_status {
    AGENT_AVAILABLE,
    AGENT_BUSY,
    AGENT_MAINTENANCE,
    AGENT_OFFLINE
};

std::string task_priority_to_str(task_priority priority);
std::string task_complexity_to_str(task_complexity complexity);
std::string dependency_type_to_str(dependency_type type);
std::string isolation_level_to_str(isolation_level level);
std::string security_level_to_str(security_level level);
std::string task_status_to_str(task_status status);
std::string cancellation_reason_to_str(cancellation_reason reason);
std::string availability_status_to_str(availability_status status);

task_priority       str_to_task_priority(const std::string & str);
task_complexity     str_to_task_complexity(const std::string & str);
dependency_type     str_to_dependency_type(const std::string & str);
isolation_level     str_to_isolation_level(const std::string & str);
security_level      str_to_security_level(const std::string & str);
cancellation_reason str_to_cancellation_reason(const std::string & str);
availability_status str_to_availability_status(const std::string & str);

inline bool task_status_is_terminal(task_status status) {
    return status == TASK_STATUS_COMPLETED || status == TASK_STATUS_FAILED || status == TASK_STATUS_CANCELLED;
}

// ============================================================================
// Task definition
// ============================================================================

// normalised to [0, 1] of one agent's capacity
struct resource_requirements {
    double cpu = 0.1;
    double memory = 0.1;
    double network = 0.1;
    double storage = 0.1;
    std::optional<double> gpu;

    json to_json() const;
    static resource_requirements from_json(const json & j);
};

struct quality_requirements {
    double accuracy = 0.8;
    double speed = 0.5;
    double reliability = 0.8;
    double completeness = 0.9;

    json to_json() const;
    static quality_requirements from_json(const json & j);
};

struct task_requirements {
    std::vector<std::string> capabilities;
    int min_agents = 1;
    int max_agents = 1;
    std::vector<std::string> preferred_agents;
    std::vector<std::string> excluded_agents;
    resource_requirements resources;
    quality_requirements quality;

    json to_json() const;
    static task_requirements from_json(const json & j);
};

struct task_constraints {
    int max_retries = 3;
    int64_t timeout_ms = 300000;
    isolation_level isolation = ISOLATION_PROCESS;
    security_level security = SECURITY_MEDIUM;

    json to_json() const;
    static task_constraints from_json(const json & j);
};

struct task_dependency {
    std::string task_id;
    dependency_type type = DEPENDENCY_BLOCKING;
    double weight = 1.0;

    // blocking and data dependencies hold a task in the queue
    bool gates() const { return type == DEPENDENCY_BLOCKING || type == DEPENDENCY_DATA; }
};

struct task_definition {
    std::string id;
    std::string name;
    std::string description;
    std::string type;
    task_priority priority = TASK_PRIORITY_NORMAL;
    task_complexity complexity = TASK_COMPLEXITY_SIMPLE;
    task_requirements requirements;
    task_constraints constraints;
    std::vector<task_dependency> dependencies;
    int64_t estimated_duration_ms = 0;
    json metadata = json::object();
    int64_t created = 0;
    std::string submitted_by;

    // "" when the task is not a subtask
    std::string parent_id() const {
        return metadata.is_object() ? metadata.value("parent_id", "") : std::string();
    }

    json to_json() const;
    static task_definition from_json(const json & j);
};

// ============================================================================
// Agents
// ============================================================================

struct performance_stats {
    double success_rate = 0.8;
    double average_time_ms = 0.0;
    double quality_score = 0.8;
    double efficiency = 0.8;
    double reliability = 0.8;
    int sample_size = 0;

    // fold one observation into the running means
    void record(bool success, int64_t duration_ms, int64_t estimated_ms, double quality);

    json to_json() const;
    static performance_stats from_json(const json & j);
};

struct agent_capability {
    std::string agent_id;
    std::vector<std::string> capabilities;
    int current_load = 0;
    int max_load = 1;
    std::map<std::string, performance_stats> performance_by_type;
    performance_stats overall;
    availability_status status = AGENT_AVAILABLE;
    double trust_score = 1.0;
    std::vector<std::string> specializations;
    double cost = 1.0;

    bool has_capability(const std::string & capability) const;
    bool has_capacity() const { return current_load < max_load; }
    double utilization() const { return max_load > 0 ? (double) current_load / (double) max_load : 0.0; }

    json to_json() const;
    static agent_capability from_json(const json & j);
};

} // namespace swarm
