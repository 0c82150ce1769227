#include "assignment.h"

#include <algorithm>
#include <cstdio>

namespace swarm {

json resource_allocation::to_json() const {
    json j = {
        {"cpu", cpu},
        {"memory", memory},
        {"network", network},
        {"storage", storage},
        {"priority_weight", priority_weight}
    };
    if (gpu) {
        j["gpu"] = *gpu;
    }
    return j;
}

json quality_expectation::to_json() const {
    return json{
        {"accuracy", accuracy},
        {"speed", speed},
        {"completeness", completeness},
        {"confidence", confidence}
    };
}

json monitoring_plan::to_json() const {
    json checks = json::array();
    for (const auto & c : quality_checks) {
        checks.push_back({
            {"metric", c.metric},
            {"interval_ms", c.interval_ms},
            {"threshold", c.threshold},
            {"action", c.action}
        });
    }
    json triggers = json::array();
    for (const auto & t : escalation_triggers) {
        triggers.push_back({
            {"condition", t.condition},
            {"threshold", t.threshold},
            {"action", t.action}
        });
    }
    return json{
        {"check_interval_ms", check_interval_ms},
        {"quality_checks", checks},
        {"escalation_triggers", triggers}
    };
}

json task_assignment::to_json() const {
    json alts = json::array();
    for (const auto & a : alternatives) {
        alts.push_back({{"agent_id", a.agent_id}, {"score", a.score}});
    }
    return json{
        {"task_id", task_id},
        {"agent_id", agent_id},
        {"assigned_at", assigned_at},
        {"expected_completion", expected_completion},
        {"confidence", confidence},
        {"score", score},
        {"reasoning", reasoning},
        {"alternatives", alts},
        {"resource_allocation", allocation.to_json()},
        {"quality_expectation", quality.to_json()},
        {"monitoring", monitoring.to_json()},
        {"progress", progress},
        {"last_progress_at", last_progress_at}
    };
}

double priority_allocation_weight(task_priority priority) {
    switch (priority) {
        case TASK_PRIORITY_CRITICAL: return 1.0;
        case TASK_PRIORITY_URGENT:   return 0.8;
        case TASK_PRIORITY_HIGH:     return 0.6;
        case TASK_PRIORITY_NORMAL:   return 0.4;
        case TASK_PRIORITY_LOW:      return 0.2;
        default:                     return 0.4;
    }
}

// ============================================================================
// Scoring
// ============================================================================

double capability_match(const task_definition & task, const agent_capability & agent) {
    const auto & required = task.requirements.capabilities;
    if (required.empty()) {
        return 1.0;
    }
    size_t matched = 0;
    for (const auto & cap : required) {
        if (agent.has_capability(cap)) matched++;
    }
    return (double) matched / (double) required.size();
}

double performance_score(const task_definition & task, const agent_capability & agent) {
    auto it = agent.performance_by_type.find(task.type);
    if (it != agent.performance_by_type.end()) {
        return it->second.success_rate * it->second.efficiency;
    }
    return agent.overall.success_rate;
}

double load_availability(const agent_capability & agent) {
    return agent.max_load > 0 ? 1.0 - agent.utilization() : 0.0;
}

bool is_eligible(const task_definition & task, const agent_capability & agent, double min_trust) {
    if (agent.status != AGENT_AVAILABLE || !agent.has_capacity()) {
        return false;
    }
    for (const auto & cap : task.requirements.capabilities) {
        if (!agent.has_capability(cap)) {
            return false;
        }
    }
    const auto & excluded = task.requirements.excluded_agents;
    if (std::find(excluded.begin(), excluded.end(), agent.agent_id) != excluded.end()) {
        return false;
    }
    if (agent.trust_score < min_trust) {
        return false;
    }
    const auto & res = task.requirements.resources;
    return res.cpu <= 1.0 && res.memory <= 1.0;
}

assignment_scorer assignment_scorer::weighted(double capability, double performance, double load, double trust) {
    assignment_scorer s;
    s.w_capability  = capability;
    s.w_performance = performance;
    s.w_load        = load;
    s.w_trust       = trust;
    return s;
}

assignment_scorer assignment_scorer::custom(score_fn fn) {
    assignment_scorer s;
    s.fn = std::move(fn);
    return s;
}

double assignment_scorer::score(const task_definition & task, const agent_capability & agent) const {
    if (fn) {
        return fn(task, agent);
    }
    double s = w_capability  * capability_match(task, agent)
             + w_performance * performance_score(task, agent)
             + w_load        * load_availability(agent)
             + w_trust       * agent.trust_score;

    const auto & preferred = task.requirements.preferred_agents;
    if (std::find(preferred.begin(), preferred.end(), agent.agent_id) != preferred.end() && s < 1.0) {
        s = std::min(s + 0.05, 1.0);
    }
    return s;
}

success_predictor success_predictor::performance_history() {
    success_predictor p;
    p.k = PREDICTOR_PERFORMANCE_HISTORY;
    return p;
}

success_predictor success_predictor::fixed(double confidence) {
    success_predictor p;
    p.k           = PREDICTOR_FIXED;
    p.fixed_value = confidence;
    return p;
}

success_predictor success_predictor::custom(predict_fn fn) {
    success_predictor p;
    p.k  = PREDICTOR_CUSTOM;
    p.fn = std::move(fn);
    return p;
}

double success_predictor::predict(const task_definition & task, const agent_capability & agent) const {
    switch (k) {
        case PREDICTOR_FIXED:
            return fixed_value;
        case PREDICTOR_CUSTOM:
            return fn ? fn(task, agent) : fixed_value;
        case PREDICTOR_PERFORMANCE_HISTORY:
        default: {
            auto it = agent.performance_by_type.find(task.type);
            return it != agent.performance_by_type.end() ? it->second.success_rate : agent.overall.success_rate;
        }
    }
}

// ============================================================================
// Assignment Optimizer Implementation
// ============================================================================

static std::string percent_line(const char * label, double value) {
    char buf[64];
    snprintf(buf, sizeof(buf), "%s: %.0f%%", label, value * 100.0);
    return buf;
}

assignment_optimizer::assignment_optimizer(double min_trust, assignment_scorer scorer, success_predictor predictor)
    : min_trust(min_trust), scorer(std::move(scorer)), predictor(std::move(predictor)) {}

bool assignment_optimizer::select(const task_definition & task, const std::vector<agent_capability> & agents,
                                  int64_t now_ms, task_assignment & assignment) const {
    std::vector<std::pair<double, size_t>> ranked;
    for (size_t i = 0; i < agents.size(); i++) {
        if (is_eligible(task, agents[i], min_trust)) {
            ranked.emplace_back(scorer.score(task, agents[i]), i);
        }
    }
    if (ranked.empty()) {
        return false;
    }

    // highest score first; earlier registration wins ties
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const std::pair<double, size_t> & a, const std::pair<double, size_t> & b) {
                         return a.first > b.first;
                     });

    const agent_capability & best = agents[ranked[0].second];

    task_assignment a;
    a.task_id             = task.id;
    a.agent_id            = best.agent_id;
    a.assigned_at         = now_ms;
    a.expected_completion = now_ms + task.estimated_duration_ms;
    a.confidence          = predictor.predict(task, best);
    a.score               = ranked[0].first;
    a.last_progress_at    = now_ms;

    a.reasoning.push_back(percent_line("Capability match", capability_match(task, best)));
    a.reasoning.push_back(percent_line("Performance score", performance_score(task, best)));
    a.reasoning.push_back(percent_line("Load availability", load_availability(best)));

    for (size_t i = 1; i < ranked.size() && a.alternatives.size() < 3; i++) {
        a.alternatives.push_back({agents[ranked[i].second].agent_id, ranked[i].first});
    }

    const auto & res = task.requirements.resources;
    a.allocation.cpu     = std::min(res.cpu, 1.0);
    a.allocation.memory  = std::min(res.memory, 1.0);
    a.allocation.network = std::min(res.network, 1.0);
    a.allocation.storage = std::min(res.storage, 1.0);
    if (res.gpu) {
        a.allocation.gpu = std::min(*res.gpu, 1.0);
    }
    a.allocation.priority_weight = priority_allocation_weight(task.priority);

    auto perf = best.performance_by_type.find(task.type);
    const double type_quality = perf != best.performance_by_type.end() ? perf->second.quality_score
                                                                       : best.overall.quality_score;
    a.quality.accuracy     = std::min(task.requirements.quality.accuracy, type_quality);
    a.quality.speed        = task.requirements.quality.speed;
    a.quality.completeness = task.requirements.quality.completeness;
    a.quality.confidence   = 0.8;

    a.monitoring.check_interval_ms = task.estimated_duration_ms > 0
        ? std::min<int64_t>(task.estimated_duration_ms / 10, 30000)
        : 30000;
    a.monitoring.quality_checks = {
        {"progress",    60000,  0.1, "warn"},
        {"performance", 120000, 0.5, "escalate"}
    };
    a.monitoring.escalation_triggers = {
        {"no_progress_15min",       900000.0, "reassign"},
        {"quality_below_threshold", 0.3,      "add_agents"}
    };

    assignment = std::move(a);
    return true;
}

} // namespace swarm
