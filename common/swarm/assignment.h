#pragma once

#include "task.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace swarm {

// ============================================================================
// Assignment records
// ============================================================================

struct resource_allocation {
    double cpu = 0.0;
    double memory = 0.0;
    double network = 0.0;
    double storage = 0.0;
    std::optional<double> gpu;
    double priority_weight = 0.4;

    json to_json() const;
};

struct quality_expectation {
    double accuracy = 0.0;
    double speed = 0.0;
    double completeness = 0.0;
    double confidence = 0.8;

    json to_json() const;
};

struct quality_check {
    std::string metric;
    int64_t interval_ms = 0;
    double threshold = 0.0;
    std::string action;
};

struct escalation_trigger {
    std::string condition;
    double threshold = 0.0;  // ms for time-based triggers, ratio otherwise
    std::string action;
};

struct monitoring_plan {
    int64_t check_interval_ms = 30000;
    std::vector<quality_check> quality_checks;
    std::vector<escalation_trigger> escalation_triggers;

    json to_json() const;
};

struct agent_alternative {
    std::string agent_id;
    double score = 0.0;
};

struct task_assignment {
    std::string task_id;
    std::string agent_id;
    int64_t assigned_at = 0;
    int64_t expected_completion = 0;
    double confidence = 0.0;
    double score = 0.0;
    std::vector<std::string> reasoning;
    std::vector<agent_alternative> alternatives;  // at most three, best first
    resource_allocation allocation;
    quality_expectation quality;
    monitoring_plan monitoring;
    double progress = 0.0;
    int64_t last_progress_at = 0;

    json to_json() const;
};

// critical 1.0, urgent 0.8, high 0.6, normal 0.4, low 0.2
double priority_allocation_weight(task_priority priority);

// ============================================================================
// Scoring policies
// ============================================================================

// fraction of the required capabilities the agent has (1.0 when none are required)
double capability_match(const task_definition & task, const agent_capability & agent);

// success rate x efficiency for the task type when known, otherwise overall success rate
double performance_score(const task_definition & task, const agent_capability & agent);

// 1 - load / max_load
double load_availability(const agent_capability & agent);

bool is_eligible(const task_definition & task, const agent_capability & agent, double min_trust);

class assignment_scorer {
public:
    using score_fn = std::function<double(const task_definition &, const agent_capability &)>;

private:
    double w_capability = 0.3;
    double w_performance = 0.3;
    double w_load = 0.2;
    double w_trust = 0.2;
    score_fn fn;

public:
    // weighted sum of capability match, performance, load availability and trust
    static assignment_scorer weighted(double capability = 0.3, double performance = 0.3,
                                      double load = 0.2, double trust = 0.2);
    static assignment_scorer custom(score_fn fn);

    double score(const task_definition & task, const agent_capability & agent) const;
};

class success_predictor {
public:
    using predict_fn = std::function<double(const task_definition &, const agent_capability &)>;

private:
    enum kind {
        PREDICTOR_PERFORMANCE_HISTORY,
        PREDICTOR_FIXED,
        PREDICTOR_CUSTOM
    };

    kind k = PREDICTOR_PERFORMANCE_HISTORY;
    double fixed_value = 0.8;
    predict_fn fn;

public:
    // task-type success rate when known, otherwise the overall rate
    static success_predictor performance_history();
    static success_predictor fixed(double confidence);
    static success_predictor custom(predict_fn fn);

    double predict(const task_definition & task, const agent_capability & agent) const;
};

// ============================================================================
// Assignment Optimizer
// ============================================================================

class assignment_optimizer {
private:
    double min_trust;
    assignment_scorer scorer;
    success_predictor predictor;

public:
    explicit assignment_optimizer(double min_trust,
                                  assignment_scorer scorer = assignment_scorer::weighted(),
                                  success_predictor predictor = success_predictor::performance_history());

    // Picks the highest-scoring eligible agent (first on ties) and fills the
    // assignment record. Returns false when no agent is eligible.
    bool select(const task_definition & task, const std::vector<agent_capability> & agents,
                int64_t now_ms, task_assignment & assignment) const;

    void set_scorer(const assignment_scorer & s) { scorer = s; }
    void set_predictor(const success_predictor & p) { predictor = p; }
    void set_min_trust(double t) { min_trust = t; }
};

} // namespace swarm
