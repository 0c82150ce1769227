#pragma once

#include "assignment.h"
#include "balancer.h"
#include "config.h"
#include "decomposer.h"
#include "event-bus.h"
#include "failure.h"
#include "task-queue.h"
#include "task.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace swarm {

// Lifecycle bookkeeping for one submitted task (or subtask)
struct task_record {
    task_definition task;
    task_status status = TASK_STATUS_PENDING;
    uint64_t seq = 0;                    // queue position, kept across requeues
    std::string agent_id;                // current or last agent
    int64_t submitted_at = 0;
    int64_t started_at = 0;
    int64_t finished_at = 0;
    int attempts = 0;
    json result;
    std::string error;
    std::vector<std::string> subtasks;   // set on decomposed parents

    json to_json() const;
};

struct distribution_metrics {
    size_t total_tasks = 0;
    size_t queued_tasks = 0;
    size_t running_tasks = 0;
    size_t completed_tasks = 0;
    size_t failed_tasks = 0;
    size_t cancelled_tasks = 0;
    double avg_wait_ms = 0.0;
    double avg_execution_ms = 0.0;
    double success_rate = 1.0;
    double load_balance = 1.0;
    double resource_efficiency = 0.0;
    std::map<std::string, double> agent_utilization;

    json to_json() const;
};

// ============================================================================
// Task Distribution Engine
// ============================================================================

// Queues tasks, assigns them to agents and drives retries, reassignment and
// health checks. Periodic work runs from advance(), which reads the injected clock.
class task_distribution_engine {
private:
    distribution_config config;
    event_bus & bus;
    clock_fn clock;

    task_queue queue;
    std::map<std::string, task_record> tasks;
    std::map<std::string, task_assignment> assignments;
    std::map<std::string, decomposed_task> decompositions;
    std::vector<agent_capability> agents;  // registration order breaks score ties

    std::unique_ptr<task_decomposer> decomposer;
    assignment_optimizer optimizer;
    workload_balancer balancer;
    failure_handler failures;

    uint64_t id_counter = 0;
    int64_t last_process = 0;
    bool running = true;

    agent_capability * find_agent(const std::string & agent_id);
    void occupy(const std::string & agent_id);
    void release(const std::string & agent_id);

    bool is_ready(const task_definition & task) const;
    void enqueue_record(task_record & rec);
    void requeue_record(task_record & rec);

    void finish_cancel(const std::string & task_id, cancellation_reason reason, bool cascade_to_parent);
    void cancel_dependents(const std::string & task_id);
    void on_subtask_completed(const std::string & parent_id);
    void on_subtask_failed(const std::string & parent_id, const std::string & error);

    std::vector<task_assignment> active_assignments() const;

public:
    task_distribution_engine(const distribution_config & config, event_bus & bus, clock_fn clock = system_clock());

    // Validates and queues a task; complex and expert tasks are decomposed first
    // and their subtasks queued in their place. Returns the task id.
    std::string submit_task(task_definition task);

    void register_agent(const agent_capability & agent);
    bool update_agent_capabilities(const std::string & agent_id, const std::vector<std::string> & capabilities);
    bool update_agent_performance(const std::string & agent_id, const performance_stats & overall);
    bool set_agent_status(const std::string & agent_id, availability_status status);

    // agent feedback
    bool handle_task_progress(const std::string & task_id, double progress, const json & data = json::object());
    bool handle_task_completion(const std::string & task_id, const json & result = json::object(), double quality = 0.8);
    bool handle_task_failure(const std::string & task_id, const std::string & error);

    // marks the agent offline and requeues its running tasks; returns how many moved
    size_t handle_agent_unavailable(const std::string & agent_id);

    bool cancel_task(const std::string & task_id, cancellation_reason reason);
    bool reassign_task(const std::string & task_id, cancellation_reason reason);

    // periodic steps, also callable directly
    void advance();
    void tick();
    size_t process_queue();
    size_t perform_health_checks();
    distribution_metrics update_metrics();

    std::optional<task_status> get_task_status(const std::string & task_id) const;
    const task_record * get_task(const std::string & task_id) const;
    const task_assignment * get_assignment(const std::string & task_id) const;
    const agent_capability * get_agent(const std::string & agent_id) const;
    const decomposed_task * get_decomposition(const std::string & task_id) const;
    const std::vector<agent_capability> & list_agents() const { return agents; }

    json get_queue_status() const;
    distribution_metrics get_metrics() const;

    void set_decomposer(std::unique_ptr<task_decomposer> d);
    void set_scorer(const assignment_scorer & scorer) { optimizer.set_scorer(scorer); }
    void set_predictor(const success_predictor & predictor) { optimizer.set_predictor(predictor); }
    void set_failure_policy(const failure_policy & policy) { failures.set_policy(policy); }
    void set_rebalance_callback(workload_balancer::rebalance_fn fn) { balancer.set_rebalance_callback(std::move(fn)); }

    const failure_handler & get_failure_handler() const { return failures; }
    const distribution_config & get_config() const { return config; }

    void shutdown();
    bool is_running() const { return running; }
};

} // namespace swarm
