#include "distribution.h"

#include "log.h"

#include <algorithm>
#include <cstdio>

namespace swarm {

json task_record::to_json() const {
    return json{
        {"task", task.to_json()},
        {"status", task_status_to_str(status)},
        {"seq", seq},
        {"agent_id", agent_id},
        {"submitted_at", submitted_at},
        {"started_at", started_at},
        {"finished_at", finished_at},
        {"attempts", attempts},
        {"result", result},
        {"error", error},
        {"subtasks", subtasks}
    };
}

json distribution_metrics::to_json() const {
    json utilization = json::object();
    for (const auto & kv : agent_utilization) {
        utilization[kv.first] = kv.second;
    }
    return json{
        {"total_tasks", total_tasks},
        {"queued_tasks", queued_tasks},
        {"running_tasks", running_tasks},
        {"completed_tasks", completed_tasks},
        {"failed_tasks", failed_tasks},
        {"cancelled_tasks", cancelled_tasks},
        {"avg_wait_ms", avg_wait_ms},
        {"avg_execution_ms", avg_execution_ms},
        {"success_rate", success_rate},
        {"load_balance", load_balance},
        {"resource_efficiency", resource_efficiency},
        {"agent_utilization", utilization}
    };
}

task_distribution_engine::task_distribution_engine(const distribution_config & config, event_bus & bus,
                                                   clock_fn clock)
    : config(config),
      bus(bus),
      clock(std::move(clock)),
      decomposer(std::make_unique<default_decomposer>()),
      optimizer(config.min_trust_score,
                assignment_scorer::weighted(config.weight_capability, config.weight_performance,
                                            config.weight_load, config.weight_trust)),
      balancer(config),
      failures(failure_policy::from_config(config)) {
    config.validate();
    last_process = this->clock();
    LOG_INF("task distribution engine initialized (max_concurrent=%d)\n", config.max_concurrent_tasks);
}

// ============================================================================
// Agents
// ============================================================================

agent_capability * task_distribution_engine::find_agent(const std::string & agent_id) {
    for (auto & a : agents) {
        if (a.agent_id == agent_id) {
            return &a;
        }
    }
    return nullptr;
}

const agent_capability * task_distribution_engine::get_agent(const std::string & agent_id) const {
    for (const auto & a : agents) {
        if (a.agent_id == agent_id) {
            return &a;
        }
    }
    return nullptr;
}

void task_distribution_engine::occupy(const std::string & agent_id) {
    agent_capability * agent = find_agent(agent_id);
    if (!agent) {
        return;
    }
    agent->current_load++;
    if (agent->status == AGENT_AVAILABLE && !agent->has_capacity()) {
        agent->status = AGENT_BUSY;
    }
}

void task_distribution_engine::release(const std::string & agent_id) {
    agent_capability * agent = find_agent(agent_id);
    if (!agent) {
        return;
    }
    agent->current_load = std::max(0, agent->current_load - 1);
    if (agent->status == AGENT_BUSY && agent->has_capacity()) {
        agent->status = AGENT_AVAILABLE;
    }
}

void task_distribution_engine::register_agent(const agent_capability & agent) {
    if (agent.agent_id.empty()) {
        throw swarm_error(ERROR_TYPE_VALIDATION, "agent id must not be empty");
    }
    if (agent.max_load < 1) {
        throw swarm_error(ERROR_TYPE_VALIDATION, "agent " + agent.agent_id + " must accept at least one task");
    }

    agent_capability * existing = find_agent(agent.agent_id);
    if (existing) {
        const int load = existing->current_load;
        *existing = agent;
        existing->current_load = load;
    } else {
        agents.push_back(agent);
        existing = &agents.back();
    }
    if (existing->status == AGENT_AVAILABLE && !existing->has_capacity()) {
        existing->status = AGENT_BUSY;
    }

    LOG_INF("registered agent %s (capabilities=%zu, max_load=%d)\n",
            agent.agent_id.c_str(), agent.capabilities.size(), agent.max_load);
}

bool task_distribution_engine::update_agent_capabilities(const std::string & agent_id,
                                                         const std::vector<std::string> & capabilities) {
    agent_capability * agent = find_agent(agent_id);
    if (!agent) {
        return false;
    }
    agent->capabilities = capabilities;
    return true;
}

bool task_distribution_engine::update_agent_performance(const std::string & agent_id,
                                                        const performance_stats & overall) {
    agent_capability * agent = find_agent(agent_id);
    if (!agent) {
        return false;
    }
    agent->overall = overall;
    return true;
}

bool task_distribution_engine::set_agent_status(const std::string & agent_id, availability_status status) {
    agent_capability * agent = find_agent(agent_id);
    if (!agent) {
        return false;
    }
    agent->status = status;
    if (status == AGENT_AVAILABLE && !agent->has_capacity()) {
        agent->status = AGENT_BUSY;
    }
    return true;
}

// ============================================================================
// Submission
// ============================================================================

bool task_distribution_engine::is_ready(const task_definition & task) const {
    for (const auto & dep : task.dependencies) {
        if (!dep.gates()) {
            continue;
        }
        auto it = tasks.find(dep.task_id);
        if (it == tasks.end() || it->second.status != TASK_STATUS_COMPLETED) {
            return false;
        }
    }
    return true;
}

void task_distribution_engine::enqueue_record(task_record & rec) {
    rec.status = TASK_STATUS_PENDING;
    rec.seq    = queue.enqueue(rec.task);
}

void task_distribution_engine::requeue_record(task_record & rec) {
    rec.status = TASK_STATUS_PENDING;
    queued_task entry;
    entry.task   = rec.task;
    entry.weight = task_priority_weight(rec.task.priority);
    entry.seq    = rec.seq;
    queue.requeue(entry);
}

std::string task_distribution_engine::submit_task(task_definition task) {
    if (!running) {
        throw swarm_error(ERROR_TYPE_VALIDATION, "distribution engine is shut down");
    }

    const int64_t now = clock();
    if (task.id.empty()) {
        char buf[64];
        snprintf(buf, sizeof(buf), "task-%lld-%llu", (long long) now, (unsigned long long) ++id_counter);
        task.id = buf;
    }

    if (tasks.count(task.id)) {
        throw swarm_error(ERROR_TYPE_VALIDATION, "Duplicate task id: " + task.id);
    }
    const auto & req = task.requirements;
    if (req.min_agents < 1 || req.max_agents < req.min_agents) {
        throw swarm_error(ERROR_TYPE_VALIDATION, "invalid agent bounds for task " + task.id);
    }
    if (task.constraints.max_retries < 0 || task.estimated_duration_ms < 0) {
        throw swarm_error(ERROR_TYPE_VALIDATION, "negative retry budget or estimate for task " + task.id);
    }
    for (const auto & dep : task.dependencies) {
        if (!tasks.count(dep.task_id)) {
            throw swarm_error(ERROR_TYPE_VALIDATION, "Unknown dependency " + dep.task_id + " for task " + task.id);
        }
    }
    if (task.created == 0) {
        task.created = now;
    }

    decomposed_task decomposition;
    const bool split = requires_decomposition(task);
    if (split) {
        decomposition = decomposer->decompose(task);
        for (const auto & sub : decomposition.subtasks) {
            if (tasks.count(sub.id)) {
                throw swarm_error(ERROR_TYPE_VALIDATION, "Duplicate task id: " + sub.id);
            }
        }
    }

    task_record & rec = tasks[task.id];
    rec.task         = task;
    rec.submitted_at = now;

    task_event ev;
    ev.task_id = task.id;
    ev.data = {
        {"priority", task_priority_to_str(task.priority)},
        {"complexity", task_complexity_to_str(task.complexity)},
        {"decomposed", split && !decomposition.subtasks.empty()}
    };

    if (split && !decomposition.subtasks.empty()) {
        rec.status = TASK_STATUS_DECOMPOSED;
        for (const auto & sub : decomposition.subtasks) {
            task_definition t = subtask_to_task(sub, task, now);
            t.constraints.max_retries = config.default_max_retries;
            if (t.dependencies.empty()) {
                t.dependencies = task.dependencies;
            }

            task_record & sub_rec = tasks[t.id];
            sub_rec.task         = t;
            sub_rec.submitted_at = now;
            enqueue_record(sub_rec);
            rec.subtasks.push_back(t.id);
        }
        ev.data["subtasks"] = rec.subtasks;
        decompositions[task.id] = std::move(decomposition);

        LOG_INF("task %s decomposed into %zu subtasks\n", task.id.c_str(), rec.subtasks.size());
    } else {
        enqueue_record(rec);
        LOG_INF("task %s queued (priority=%s)\n", task.id.c_str(), task_priority_to_str(task.priority).c_str());
    }

    bus.publish(EVENT_TASK_SUBMITTED, now, ev);

    // a dependency that already failed can never be satisfied
    for (const auto & dep : task.dependencies) {
        if (!dep.gates()) {
            continue;
        }
        const task_status st = tasks.at(dep.task_id).status;
        if (st == TASK_STATUS_FAILED || st == TASK_STATUS_CANCELLED) {
            finish_cancel(task.id, CANCEL_DEPENDENCY_FAILURE, false);
            break;
        }
    }

    return task.id;
}

// ============================================================================
// Assignment
// ============================================================================

size_t task_distribution_engine::process_queue() {
    if (!running || queue.empty()) {
        return 0;
    }

    const size_t available = std::count_if(agents.begin(), agents.end(), [](const agent_capability & a) {
        return a.status == AGENT_AVAILABLE && a.has_capacity();
    });
    const size_t active = assignments.size();
    const size_t limit  = (size_t) std::max(0, config.max_concurrent_tasks);
    if (available == 0 || active >= limit) {
        return 0;
    }

    const size_t batch = std::min(available, limit - active);
    std::vector<queued_task> ready = queue.get_next(batch, [this](const task_definition & t) { return is_ready(t); });

    const int64_t now = clock();
    size_t assigned = 0;
    std::vector<std::string> chosen;  // each agent takes at most one new task per tick
    for (auto & item : ready) {
        auto it = tasks.find(item.task.id);
        // cancelled by an event handler earlier in this batch
        if (it == tasks.end() || it->second.status != TASK_STATUS_PENDING) {
            continue;
        }
        task_record & rec = it->second;

        std::vector<agent_capability> candidates;
        for (const auto & agent : agents) {
            if (std::find(chosen.begin(), chosen.end(), agent.agent_id) == chosen.end()) {
                candidates.push_back(agent);
            }
        }

        task_assignment a;
        if (!optimizer.select(rec.task, candidates, now, a)) {
            LOG_DBG("no eligible agent for task %s, requeued\n", rec.task.id.c_str());
            queue.requeue(item);
            continue;
        }

        occupy(a.agent_id);
        chosen.push_back(a.agent_id);
        rec.status     = TASK_STATUS_ASSIGNED;
        rec.agent_id   = a.agent_id;
        rec.started_at = now;
        rec.attempts++;

        LOG_INF("task %s assigned to %s (score=%.3f, confidence=%.2f)\n",
                rec.task.id.c_str(), a.agent_id.c_str(), a.score, a.confidence);

        task_event ev;
        ev.task_id  = rec.task.id;
        ev.agent_id = a.agent_id;
        ev.data     = a.to_json();
        assignments[rec.task.id] = std::move(a);
        assigned++;

        bus.publish(EVENT_TASK_ASSIGNED, now, ev);
    }
    return assigned;
}

// ============================================================================
// Agent feedback
// ============================================================================

bool task_distribution_engine::handle_task_progress(const std::string & task_id, double progress, const json & data) {
    auto it = assignments.find(task_id);
    if (it == assignments.end()) {
        return false;
    }

    const int64_t now = clock();
    it->second.progress         = std::clamp(progress, 0.0, 1.0);
    it->second.last_progress_at = now;

    task_event ev;
    ev.task_id  = task_id;
    ev.agent_id = it->second.agent_id;
    ev.progress = it->second.progress;
    ev.data     = data;
    bus.publish(EVENT_TASK_PROGRESS, now, ev);
    return true;
}

bool task_distribution_engine::handle_task_completion(const std::string & task_id, const json & result, double quality) {
    auto it = assignments.find(task_id);
    if (it == assignments.end()) {
        LOG_WRN("completion reported for unassigned task %s\n", task_id.c_str());
        return false;
    }

    const int64_t now = clock();
    const std::string agent_id = it->second.agent_id;
    assignments.erase(it);
    release(agent_id);

    task_record & rec = tasks.at(task_id);
    rec.status      = TASK_STATUS_COMPLETED;
    rec.finished_at = now;
    rec.result      = result;

    agent_capability * agent = find_agent(agent_id);
    if (agent) {
        const int64_t duration = now - rec.started_at;
        agent->overall.record(true, duration, rec.task.estimated_duration_ms, quality);
        if (!rec.task.type.empty()) {
            agent->performance_by_type[rec.task.type].record(true, duration, rec.task.estimated_duration_ms, quality);
        }
    }

    LOG_INF("task %s completed by %s\n", task_id.c_str(), agent_id.c_str());

    task_event ev;
    ev.task_id  = task_id;
    ev.agent_id = agent_id;
    ev.progress = 1.0;
    ev.data     = result;
    bus.publish(EVENT_TASK_COMPLETED, now, ev);

    const std::string parent_id = rec.task.parent_id();
    if (!parent_id.empty()) {
        on_subtask_completed(parent_id);
    }
    return true;
}

bool task_distribution_engine::handle_task_failure(const std::string & task_id, const std::string & error) {
    auto it = assignments.find(task_id);
    if (it == assignments.end()) {
        LOG_WRN("failure reported for unassigned task %s\n", task_id.c_str());
        return false;
    }

    const int64_t now = clock();
    const std::string agent_id = it->second.agent_id;
    assignments.erase(it);
    release(agent_id);

    task_record & rec = tasks.at(task_id);
    rec.error = error;

    agent_capability * agent = find_agent(agent_id);
    if (agent) {
        const int64_t duration = now - rec.started_at;
        agent->overall.record(false, duration, rec.task.estimated_duration_ms, 0.0);
        if (!rec.task.type.empty()) {
            agent->performance_by_type[rec.task.type].record(false, duration, rec.task.estimated_duration_ms, 0.0);
        }
    }

    const failure_action action = failures.on_failure(rec.task, agent_id, error, now);

    task_event ev;
    ev.task_id  = task_id;
    ev.agent_id = agent_id;
    ev.reason   = error;
    ev.data     = {{"retries_left", rec.task.constraints.max_retries}};

    if (action == FAILURE_ACTION_RETRY) {
        requeue_record(rec);
        LOG_WRN("task %s failed on %s, requeued (retries_left=%d): %s\n",
                task_id.c_str(), agent_id.c_str(), rec.task.constraints.max_retries, error.c_str());
        ev.permanent = false;
        bus.publish(EVENT_TASK_FAILED, now, ev);
        return true;
    }

    rec.status      = TASK_STATUS_FAILED;
    rec.finished_at = now;
    LOG_ERR("task %s failed permanently on %s: %s\n", task_id.c_str(), agent_id.c_str(), error.c_str());
    ev.permanent = true;
    bus.publish(EVENT_TASK_FAILED, now, ev);

    const std::string parent_id = rec.task.parent_id();
    if (!parent_id.empty()) {
        on_subtask_failed(parent_id, error);
    }
    cancel_dependents(task_id);
    return true;
}

size_t task_distribution_engine::handle_agent_unavailable(const std::string & agent_id) {
    agent_capability * agent = find_agent(agent_id);
    if (!agent) {
        return 0;
    }
    agent->status = AGENT_OFFLINE;

    std::vector<std::string> affected;
    for (const auto & kv : assignments) {
        if (kv.second.agent_id == agent_id) {
            affected.push_back(kv.first);
        }
    }

    LOG_WRN("agent %s unavailable, reassigning %zu tasks\n", agent_id.c_str(), affected.size());

    for (const auto & task_id : affected) {
        reassign_task(task_id, CANCEL_AGENT_UNAVAILABLE);
    }
    return affected.size();
}

// ============================================================================
// Decomposed parents
// ============================================================================

void task_distribution_engine::on_subtask_completed(const std::string & parent_id) {
    auto it = tasks.find(parent_id);
    if (it == tasks.end() || it->second.status != TASK_STATUS_DECOMPOSED) {
        return;
    }
    task_record & parent = it->second;

    json results = json::object();
    for (const auto & sub_id : parent.subtasks) {
        const task_record & sub = tasks.at(sub_id);
        if (sub.status != TASK_STATUS_COMPLETED) {
            return;
        }
        results[sub_id] = sub.result;
    }

    const int64_t now = clock();
    parent.status      = TASK_STATUS_COMPLETED;
    parent.finished_at = now;
    parent.result      = {{"subtasks", results}};

    LOG_INF("task %s completed (%zu subtasks)\n", parent_id.c_str(), parent.subtasks.size());

    task_event ev;
    ev.task_id  = parent_id;
    ev.progress = 1.0;
    ev.data     = parent.result;
    bus.publish(EVENT_TASK_COMPLETED, now, ev);

    const std::string grandparent = parent.task.parent_id();
    if (!grandparent.empty()) {
        on_subtask_completed(grandparent);
    }
}

void task_distribution_engine::on_subtask_failed(const std::string & parent_id, const std::string & error) {
    auto it = tasks.find(parent_id);
    if (it == tasks.end() || it->second.status != TASK_STATUS_DECOMPOSED) {
        return;
    }
    task_record & parent = it->second;

    const int64_t now = clock();
    parent.status      = TASK_STATUS_FAILED;
    parent.finished_at = now;
    parent.error       = error;

    LOG_ERR("task %s failed: subtask failure: %s\n", parent_id.c_str(), error.c_str());

    const std::vector<std::string> subs = parent.subtasks;
    for (const auto & sub_id : subs) {
        finish_cancel(sub_id, CANCEL_DEPENDENCY_FAILURE, false);
    }

    task_event ev;
    ev.task_id   = parent_id;
    ev.reason    = error;
    ev.permanent = true;
    bus.publish(EVENT_TASK_FAILED, now, ev);

    cancel_dependents(parent_id);
}

// ============================================================================
// Cancellation and reassignment
// ============================================================================

bool task_distribution_engine::cancel_task(const std::string & task_id, cancellation_reason reason) {
    auto it = tasks.find(task_id);
    if (it == tasks.end() || task_status_is_terminal(it->second.status)) {
        return false;
    }
    finish_cancel(task_id, reason, true);
    return true;
}

void task_distribution_engine::finish_cancel(const std::string & task_id, cancellation_reason reason,
                                             bool cascade_to_parent) {
    auto it = tasks.find(task_id);
    if (it == tasks.end() || task_status_is_terminal(it->second.status)) {
        return;
    }
    task_record & rec = it->second;
    const int64_t now = clock();

    std::string agent_id;
    auto a = assignments.find(task_id);
    if (a != assignments.end()) {
        agent_id = a->second.agent_id;
        assignments.erase(a);
        release(agent_id);
    }
    queue.remove(task_id);

    const bool was_parent = rec.status == TASK_STATUS_DECOMPOSED;
    rec.status      = TASK_STATUS_CANCELLED;
    rec.finished_at = now;
    rec.error       = cancellation_reason_to_str(reason);

    LOG_INF("task %s cancelled: reason=%s\n", task_id.c_str(), rec.error.c_str());

    task_event ev;
    ev.task_id  = task_id;
    ev.agent_id = agent_id;
    ev.reason   = rec.error;
    bus.publish(EVENT_TASK_CANCELLED, now, ev);

    if (was_parent) {
        const std::vector<std::string> subs = rec.subtasks;
        for (const auto & sub_id : subs) {
            finish_cancel(sub_id, reason, false);
        }
    }

    cancel_dependents(task_id);

    if (cascade_to_parent) {
        const std::string parent_id = rec.task.parent_id();
        if (!parent_id.empty()) {
            finish_cancel(parent_id, CANCEL_DEPENDENCY_FAILURE, true);
        }
    }
}

void task_distribution_engine::cancel_dependents(const std::string & task_id) {
    std::vector<std::string> blocked;
    for (const auto & kv : tasks) {
        if (task_status_is_terminal(kv.second.status)) {
            continue;
        }
        for (const auto & dep : kv.second.task.dependencies) {
            if (dep.gates() && dep.task_id == task_id) {
                blocked.push_back(kv.first);
                break;
            }
        }
    }
    for (const auto & id : blocked) {
        finish_cancel(id, CANCEL_DEPENDENCY_FAILURE, true);
    }
}

bool task_distribution_engine::reassign_task(const std::string & task_id, cancellation_reason reason) {
    auto a = assignments.find(task_id);
    if (a == assignments.end()) {
        return false;
    }

    const int64_t now = clock();
    const std::string previous = a->second.agent_id;
    assignments.erase(a);
    release(previous);

    task_record & rec = tasks.at(task_id);
    requeue_record(rec);

    LOG_INF("task %s reassigned from %s: reason=%s\n",
            task_id.c_str(), previous.c_str(), cancellation_reason_to_str(reason).c_str());

    task_event ev;
    ev.task_id        = task_id;
    ev.previous_agent = previous;
    ev.reason         = cancellation_reason_to_str(reason);
    bus.publish(EVENT_TASK_REASSIGNED, now, ev);
    return true;
}

// ============================================================================
// Periodic work
// ============================================================================

std::vector<task_assignment> task_distribution_engine::active_assignments() const {
    std::vector<task_assignment> out;
    out.reserve(assignments.size());
    for (const auto & kv : assignments) {
        out.push_back(kv.second);
    }
    return out;
}

size_t task_distribution_engine::perform_health_checks() {
    const auto issues = failures.scan(active_assignments(), clock());
    for (const auto & issue : issues) {
        LOG_WRN("task %s potentially stuck on %s: elapsed=%lld reason=%s\n",
                issue.task_id.c_str(), issue.agent_id.c_str(), (long long) issue.elapsed_ms,
                cancellation_reason_to_str(issue.reason).c_str());
        reassign_task(issue.task_id, issue.reason);
    }
    return issues.size();
}

distribution_metrics task_distribution_engine::get_metrics() const {
    distribution_metrics m;
    m.total_tasks   = tasks.size();
    m.queued_tasks  = queue.size();
    m.running_tasks = assignments.size();

    double wait_total = 0.0;
    size_t wait_count = 0;
    double exec_total = 0.0;
    size_t exec_count = 0;
    for (const auto & kv : tasks) {
        const task_record & rec = kv.second;
        switch (rec.status) {
            case TASK_STATUS_COMPLETED: m.completed_tasks++; break;
            case TASK_STATUS_FAILED:    m.failed_tasks++;    break;
            case TASK_STATUS_CANCELLED: m.cancelled_tasks++; break;
            default: break;
        }
        if (rec.started_at > 0) {
            wait_total += (double) (rec.started_at - rec.submitted_at);
            wait_count++;
        }
        if (rec.status == TASK_STATUS_COMPLETED && rec.started_at > 0) {
            exec_total += (double) (rec.finished_at - rec.started_at);
            exec_count++;
        }
    }
    m.avg_wait_ms      = wait_count > 0 ? wait_total / (double) wait_count : 0.0;
    m.avg_execution_ms = exec_count > 0 ? exec_total / (double) exec_count : 0.0;

    const size_t finished = m.completed_tasks + m.failed_tasks;
    m.success_rate = finished > 0 ? (double) m.completed_tasks / (double) finished : 1.0;

    m.load_balance        = load_balance_score(agents);
    m.resource_efficiency = resource_efficiency(agents);
    for (const auto & a : agents) {
        m.agent_utilization[a.agent_id] = a.utilization();
    }
    return m;
}

distribution_metrics task_distribution_engine::update_metrics() {
    distribution_metrics m = get_metrics();
    bus.publish(EVENT_METRICS_UPDATED, clock(), metrics_event{m.to_json()});
    return m;
}

void task_distribution_engine::tick() {
    process_queue();
    update_metrics();
    perform_health_checks();
    balancer.check(agents);
}

void task_distribution_engine::advance() {
    if (!running) {
        return;
    }
    const int64_t now = clock();
    if (now - last_process >= config.process_interval_ms) {
        last_process = now;
        tick();
    }
}

// ============================================================================
// Queries
// ============================================================================

std::optional<task_status> task_distribution_engine::get_task_status(const std::string & task_id) const {
    auto it = tasks.find(task_id);
    if (it == tasks.end()) {
        return std::nullopt;
    }
    return it->second.status;
}

const task_record * task_distribution_engine::get_task(const std::string & task_id) const {
    auto it = tasks.find(task_id);
    return it != tasks.end() ? &it->second : nullptr;
}

const task_assignment * task_distribution_engine::get_assignment(const std::string & task_id) const {
    auto it = assignments.find(task_id);
    return it != assignments.end() ? &it->second : nullptr;
}

const decomposed_task * task_distribution_engine::get_decomposition(const std::string & task_id) const {
    auto it = decompositions.find(task_id);
    return it != decompositions.end() ? &it->second : nullptr;
}

json task_distribution_engine::get_queue_status() const {
    size_t available = 0;
    size_t busy = 0;
    size_t offline = 0;
    size_t maintenance = 0;
    json utilization = json::object();
    for (const auto & a : agents) {
        utilization[a.agent_id] = a.utilization();
        switch (a.status) {
            case AGENT_AVAILABLE:   available++;   break;
            case AGENT_BUSY:        busy++;        break;
            case AGENT_OFFLINE:     offline++;     break;
            case AGENT_MAINTENANCE: maintenance++; break;
        }
    }
    return json{
        {"pending", queue.size()},
        {"processing", assignments.size()},
        {"agents", {
            {"available", available},
            {"busy", busy},
            {"offline", offline},
            {"maintenance", maintenance},
            {"utilization", utilization}
        }}
    };
}

void task_distribution_engine::set_decomposer(std::unique_ptr<task_decomposer> d) {
    if (d) {
        decomposer = std::move(d);
    } else {
        decomposer = std::make_unique<default_decomposer>();
    }
}

void task_distribution_engine::shutdown() {
    if (!running) {
        return;
    }
    running = false;
    LOG_INF("task distribution engine shutdown (pending=%zu, processing=%zu)\n", queue.size(), assignments.size());
    bus.publish(EVENT_SHUTDOWN, clock());
}

} // namespace swarm
