#include "failure.h"

#include "log.h"

namespace swarm {

// failure_policy implementation
failure_policy failure_policy::default_policy() {
    failure_policy p;
    p.retry_failed_tasks = true;
    p.stuck_factor = 2.0;
    p.no_progress_timeout_ms = 900000;
    p.max_history = 1000;
    return p;
}

failure_policy failure_policy::aggressive_policy() {
    failure_policy p;
    p.retry_failed_tasks = true;
    p.stuck_factor = 1.5;
    p.no_progress_timeout_ms = 300000;
    p.max_history = 1000;
    return p;
}

failure_policy failure_policy::conservative_policy() {
    failure_policy p;
    p.retry_failed_tasks = true;
    p.stuck_factor = 3.0;
    p.no_progress_timeout_ms = 1800000;
    p.max_history = 1000;
    return p;
}

failure_policy failure_policy::from_config(const distribution_config & config) {
    failure_policy p = default_policy();
    p.stuck_factor = config.stuck_factor;
    p.no_progress_timeout_ms = config.no_progress_timeout_ms;
    p.max_history = config.max_failure_history;
    return p;
}

std::string failure_action_to_str(failure_action action) {
    switch (action) {
        case FAILURE_ACTION_RETRY: return "retry";
        case FAILURE_ACTION_FAIL:  return "fail";
        default:                   return "unknown";
    }
}

json failure_record::to_json() const {
    return json{
        {"task_id", task_id},
        {"agent_id", agent_id},
        {"error", error},
        {"timestamp", timestamp},
        {"retries_left", retries_left},
        {"permanent", permanent}
    };
}

// ============================================================================
// Failure Handler Implementation
// ============================================================================

failure_handler::failure_handler(const failure_policy & policy) : policy(policy) {}

void failure_handler::set_policy(const failure_policy & p) {
    policy = p;
    while (history.size() > policy.max_history) {
        history.pop_front();
    }
}

failure_action failure_handler::on_failure(task_definition & task, const std::string & agent_id,
                                           const std::string & error, int64_t now_ms) {
    failure_record record;
    record.task_id   = task.id;
    record.agent_id  = agent_id;
    record.error     = error;
    record.timestamp = now_ms;

    failure_action action = FAILURE_ACTION_FAIL;
    if (policy.retry_failed_tasks && task.constraints.max_retries > 0) {
        task.constraints.max_retries--;
        action = FAILURE_ACTION_RETRY;
        retried++;
    } else {
        permanent++;
    }

    record.retries_left = task.constraints.max_retries;
    record.permanent    = action == FAILURE_ACTION_FAIL;

    LOG_DBG("task failure: task=%s agent=%s action=%s retries_left=%d error=%s\n",
            task.id.c_str(), agent_id.c_str(), failure_action_to_str(action).c_str(),
            record.retries_left, error.c_str());

    history.push_back(std::move(record));
    while (history.size() > policy.max_history) {
        history.pop_front();
    }
    return action;
}

std::vector<health_issue> failure_handler::scan(const std::vector<task_assignment> & active, int64_t now_ms) const {
    std::vector<health_issue> issues;
    for (const auto & a : active) {
        const int64_t estimate = a.expected_completion - a.assigned_at;
        const int64_t runtime  = now_ms - a.assigned_at;

        if (estimate > 0 && (double) runtime > policy.stuck_factor * (double) estimate) {
            issues.push_back({a.task_id, a.agent_id, CANCEL_TASK_STUCK, runtime});
            continue;
        }

        const int64_t silent = now_ms - a.last_progress_at;
        if (policy.no_progress_timeout_ms > 0 && silent > policy.no_progress_timeout_ms) {
            issues.push_back({a.task_id, a.agent_id, CANCEL_NO_PROGRESS, silent});
        }
    }
    return issues;
}

} // namespace swarm
