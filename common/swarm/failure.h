#pragma once

#include "assignment.h"
#include "config.h"
#include "task.h"

#include <cstdint>
#include <deque>
#include <string>
#include <vector>

namespace swarm {

// Failure policy configuration
struct failure_policy {
    bool retry_failed_tasks;        // requeue while the task's retry budget lasts
    double stuck_factor;            // runtime / estimate that marks a task stuck
    int64_t no_progress_timeout_ms; // silence before an assignment is escalated
    size_t max_history;             // failure records kept

    static failure_policy default_policy();

    // reassigns sooner
    static failure_policy aggressive_policy();

    // tolerates slow agents longer
    static failure_policy conservative_policy();

    static failure_policy from_config(const distribution_config & config);
};

enum failure_action {
    FAILURE_ACTION_RETRY,
    FAILURE_ACTION_FAIL
};

std::string failure_action_to_str(failure_action action);

struct failure_record {
    std::string task_id;
    std::string agent_id;
    std::string error;
    int64_t timestamp = 0;
    int retries_left = 0;
    bool permanent = false;

    json to_json() const;
};

// a running assignment the health scan wants reassigned
struct health_issue {
    std::string task_id;
    std::string agent_id;
    cancellation_reason reason = CANCEL_TASK_STUCK;
    int64_t elapsed_ms = 0;
};

// ============================================================================
// Failure Handler
// ============================================================================

class failure_handler {
private:
    failure_policy policy;
    std::deque<failure_record> history;
    uint64_t retried = 0;
    uint64_t permanent = 0;

public:
    explicit failure_handler(const failure_policy & policy = failure_policy::default_policy());

    // Spends one unit of the task's retry budget. Returns FAILURE_ACTION_FAIL
    // once the budget is exhausted (or retries are disabled).
    failure_action on_failure(task_definition & task, const std::string & agent_id,
                              const std::string & error, int64_t now_ms);

    // Stuck runs (estimate > 0, runtime > stuck_factor x estimate) take precedence
    // over silent ones (no progress for no_progress_timeout_ms).
    std::vector<health_issue> scan(const std::vector<task_assignment> & active, int64_t now_ms) const;

    const std::deque<failure_record> & get_history() const { return history; }
    uint64_t retry_count() const { return retried; }
    uint64_t permanent_count() const { return permanent; }

    const failure_policy & get_policy() const { return policy; }
    void set_policy(const failure_policy & p);
};

} // namespace swarm
