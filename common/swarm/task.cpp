#include "task.h"

#include <algorithm>

namespace swarm {

std::string task_priority_to_str(task_priority priority) {
    switch (priority) {
        case TASK_PRIORITY_LOW:      return "low";
        case TASK_PRIORITY_NORMAL:   return "normal";
        case TASK_PRIORITY_HIGH:     return "high";
        case TASK_PRIORITY_URGENT:   return "urgent";
        case TASK_PRIORITY_CRITICAL: return "critical";
        default:                     return "unknown";
    }
}

std::string task_complexity_to_str(task_complexity complexity) {
    switch (complexity) {
        case TASK_COMPLEXITY_TRIVIAL:  return "trivial";
        case TASK_COMPLEXITY_SIMPLE:   return "simple";
        case TASK_COMPLEXITY_MODERATE: return "moderate";
        case TASK_COMPLEXITY_COMPLEX:  return "complex";
        case TASK_COMPLEXITY_EXPERT:   return "expert";
        default:                       return "unknown";
    }
}

std::string dependency_type_to_str(dependency_type type) {
    switch (type) {
        case DEPENDENCY_BLOCKING: return "blocking";
        case DEPENDENCY_SOFT:     return "soft";
        case DEPENDENCY_DATA:     return "data";
        case DEPENDENCY_RESOURCE: return "resource";
        default:                  return "unknown";
    }
}

std::string isolation_level_to_str(isolation_level level) {
    switch (level) {
        case ISOLATION_NONE:      return "none";
        case ISOLATION_PROCESS:   return "process";
        case ISOLATION_CONTAINER: return "container";
        case ISOLATION_VM:        return "vm";
        default:                  return "unknown";
    }
}

std::string security_level_to_str(security_level level) {
    switch (level) {
        case SECURITY_LOW:      return "low";
        case SECURITY_MEDIUM:   return "medium";
        case SECURITY_HIGH:     return "high";
        case SECURITY_CRITICAL: return "critical";
        default:                return "unknown";
    }
}

std::string task_status_to_str(task_status status) {
    switch (status) {
        case TASK_STATUS_PENDING:    return "pending";
        case TASK_STATUS_DECOMPOSED: return "decomposed";
        case TASK_STATUS_ASSIGNED:   return "assigned";
        case TASK_STATUS_COMPLETED:  return "completed";
        case TASK_STATUS_FAILED:     return "failed";
        case TASK_STATUS_CANCELLED:  return "cancelled";
        default:                     return "unknown";
    }
}

std::string cancellation_reason_to_str(cancellation_reason reason) {
    switch (reason) {
        case CANCEL_USER_REQUEST:         return "user_request";
        case CANCEL_TIMEOUT:              return "timeout";
        case CANCEL_RESOURCE_UNAVAILABLE: return "resource_unavailable";
        case CANCEL_DEPENDENCY_FAILURE:   return "dependency_failure";
        case CANCEL_PRIORITY_OVERRIDE:    return "priority_override";
        case CANCEL_SYSTEM_SHUTDOWN:      return "system_shutdown";
        case CANCEL_AGENT_FAILURE:        return "agent_failure";
        case CANCEL_TASK_STUCK:           return "task_stuck";
        case CANCEL_AGENT_UNAVAILABLE:    return "agent_unavailable";
        case CANCEL_NO_PROGRESS:          return "no_progress";
        default:                          return "unknown";
    }
}

std::string availability_status_to_str(availability_status status) {
    switch (status) {
        case AGENT_AVAILABLE:   return "available";
        case AGENT_BUSY:        return "busy";
        case AGENT_MAINTENANCE: return "maintenance";
        case AGENT_OFFLINE:     return "offline";
        default:                return "unknown";
    }
}

task_priority str_to_task_priority(const std::string & str) {
    if (str == "low")      return TASK_PRIORITY_LOW;
    if (str == "high")     return TASK_PRIORITY_HIGH;
    if (str == "urgent")   return TASK_PRIORITY_URGENT;
    if (str == "critical") return TASK_PRIORITY_CRITICAL;
    return TASK_PRIORITY_NORMAL;
}

task_complexity str_to_task_complexity(const std::string & str) {
    if (str == "trivial")  return TASK_COMPLEXITY_TRIVIAL;
    if (str == "moderate") return TASK_COMPLEXITY_MODERATE;
    if (str == "complex")  return TASK_COMPLEXITY_COMPLEX;
    if (str == "expert")   return TASK_COMPLEXITY_EXPERT;
    return TASK_COMPLEXITY_SIMPLE;
}

dependency_type str_to_dependency_type(const std::string & str) {
    if (str == "soft")     return DEPENDENCY_SOFT;
    if (str == "data")     return DEPENDENCY_DATA;
    if (str == "resource") return DEPENDENCY_RESOURCE;
    return DEPENDENCY_BLOCKING;
}

isolation_level str_to_isolation_level(const std::string & str) {
    if (str == "none")      return ISOLATION_NONE;
    if (str == "container") return ISOLATION_CONTAINER;
    if (str == "vm")        return ISOLATION_VM;
    return ISOLATION_PROCESS;
}

security_level str_to_security_level(const std::string & str) {
    if (str == "low")      return SECURITY_LOW;
    if (str == "high")     return SECURITY_HIGH;
    if (str == "critical") return SECURITY_CRITICAL;
    return SECURITY_MEDIUM;
}

cancellation_reason str_to_cancellation_reason(const std::string & str) {
    if (str == "timeout")              return CANCEL_TIMEOUT;
    if (str == "resource_unavailable") return CANCEL_RESOURCE_UNAVAILABLE;
    if (str == "dependency_failure")   return CANCEL_DEPENDENCY_FAILURE;
    if (str == "priority_override")    return CANCEL_PRIORITY_OVERRIDE;
    if (str == "system_shutdown")      return CANCEL_SYSTEM_SHUTDOWN;
    if (str == "agent_failure")        return CANCEL_AGENT_FAILURE;
    if (str == "task_stuck")           return CANCEL_TASK_STUCK;
    if (str == "agent_unavailable")    return CANCEL_AGENT_UNAVAILABLE;
    if (str == "no_progress")          return CANCEL_NO_PROGRESS;
    return CANCEL_USER_REQUEST;
}

availability_status str_to_availability_status(const std::string & str) {
    if (str == "busy")        return AGENT_BUSY;
    if (str == "maintenance") return AGENT_MAINTENANCE;
    if (str == "offline")     return AGENT_OFFLINE;
    return AGENT_AVAILABLE;
}

// ============================================================================
// Task definition serialization
// ============================================================================

json resource_requirements::to_json() const {
    json j = {
        {"cpu", cpu},
        {"memory", memory},
        {"network", network},
        {"storage", storage}
    };
    if (gpu) {
        j["gpu"] = *gpu;
    }
    return j;
}

resource_requirements resource_requirements::from_json(const json & j) {
    resource_requirements r;
    r.cpu     = j.value("cpu", r.cpu);
    r.memory  = j.value("memory", r.memory);
    r.network = j.value("network", r.network);
    r.storage = j.value("storage", r.storage);
    if (j.contains("gpu") && j["gpu"].is_number()) {
        r.gpu = j["gpu"].get<double>();
    }
    return r;
}

json quality_requirements::to_json() const {
    return json{
        {"accuracy", accuracy},
        {"speed", speed},
        {"reliability", reliability},
        {"completeness", completeness}
    };
}

quality_requirements quality_requirements::from_json(const json & j) {
    quality_requirements q;
    q.accuracy     = j.value("accuracy", q.accuracy);
    q.speed        = j.value("speed", q.speed);
    q.reliability  = j.value("reliability", q.reliability);
    q.completeness = j.value("completeness", q.completeness);
    return q;
}

json task_requirements::to_json() const {
    return json{
        {"capabilities", capabilities},
        {"min_agents", min_agents},
        {"max_agents", max_agents},
        {"preferred_agents", preferred_agents},
        {"excluded_agents", excluded_agents},
        {"resources", resources.to_json()},
        {"quality", quality.to_json()}
    };
}

task_requirements task_requirements::from_json(const json & j) {
    task_requirements r;
    r.capabilities     = j.value("capabilities", std::vector<std::string>{});
    r.min_agents       = j.value("min_agents", 1);
    r.max_agents       = j.value("max_agents", 1);
    r.preferred_agents = j.value("preferred_agents", std::vector<std::string>{});
    r.excluded_agents  = j.value("excluded_agents", std::vector<std::string>{});
    r.resources        = resource_requirements::from_json(j.value("resources", json::object()));
    r.quality          = quality_requirements::from_json(j.value("quality", json::object()));
    return r;
}

json task_constraints::to_json() const {
    return json{
        {"max_retries", max_retries},
        {"timeout_ms", timeout_ms},
        {"isolation_level", isolation_level_to_str(isolation)},
        {"security_level", security_level_to_str(security)}
    };
}

task_constraints task_constraints::from_json(const json & j) {
    task_constraints c;
    c.max_retries = j.value("max_retries", c.max_retries);
    c.timeout_ms  = j.value("timeout_ms", c.timeout_ms);
    c.isolation   = str_to_isolation_level(j.value("isolation_level", "process"));
    c.security    = str_to_security_level(j.value("security_level", "medium"));
    return c;
}

json task_definition::to_json() const {
    json deps = json::array();
    for (const auto & d : dependencies) {
        deps.push_back({
            {"task_id", d.task_id},
            {"type", dependency_type_to_str(d.type)},
            {"weight", d.weight}
        });
    }

    return json{
        {"id", id},
        {"name", name},
        {"description", description},
        {"type", type},
        {"priority", task_priority_to_str(priority)},
        {"complexity", task_complexity_to_str(complexity)},
        {"requirements", requirements.to_json()},
        {"constraints", constraints.to_json()},
        {"dependencies", deps},
        {"estimated_duration_ms", estimated_duration_ms},
        {"metadata", metadata},
        {"created", created},
        {"submitted_by", submitted_by}
    };
}

task_definition task_definition::from_json(const json & j) {
    task_definition t;
    t.id                    = j.value("id", "");
    t.name                  = j.value("name", "");
    t.description           = j.value("description", "");
    t.type                  = j.value("type", "");
    t.priority              = str_to_task_priority(j.value("priority", "normal"));
    t.complexity            = str_to_task_complexity(j.value("complexity", "simple"));
    t.requirements          = task_requirements::from_json(j.value("requirements", json::object()));
    t.constraints           = task_constraints::from_json(j.value("constraints", json::object()));
    t.estimated_duration_ms = j.value("estimated_duration_ms", int64_t(0));
    t.metadata              = j.value("metadata", json::object());
    t.created               = j.value("created", int64_t(0));
    t.submitted_by          = j.value("submitted_by", "");

    for (const auto & d : j.value("dependencies", json::array())) {
        task_dependency dep;
        dep.task_id = d.value("task_id", "");
        dep.type    = str_to_dependency_type(d.value("type", "blocking"));
        dep.weight  = d.value("weight", 1.0);
        t.dependencies.push_back(dep);
    }
    return t;
}

// ============================================================================
// Agents
// ============================================================================

void performance_stats::record(bool success, int64_t duration_ms, int64_t estimated_ms, double quality) {
    const double s = success ? 1.0 : 0.0;
    double eff = s;
    if (estimated_ms > 0 && duration_ms > 0) {
        eff = std::min(1.0, (double) estimated_ms / (double) duration_ms);
    }

    if (sample_size == 0) {
        success_rate    = s;
        average_time_ms = (double) duration_ms;
        quality_score   = quality;
        efficiency      = eff;
        reliability     = s;
    } else {
        const double n = (double) sample_size + 1.0;
        success_rate    += (s - success_rate) / n;
        average_time_ms += ((double) duration_ms - average_time_ms) / n;
        quality_score   += (quality - quality_score) / n;
        efficiency      += (eff - efficiency) / n;
        // recent outcomes weigh more than the lifetime mean
        reliability      = 0.8 * reliability + 0.2 * s;
    }
    sample_size++;
}

json performance_stats::to_json() const {
    return json{
        {"success_rate", success_rate},
        {"average_time_ms", average_time_ms},
        {"quality_score", quality_score},
        {"efficiency", efficiency},
        {"reliability", reliability},
        {"sample_size", sample_size}
    };
}

performance_stats performance_stats::from_json(const json & j) {
    performance_stats p;
    p.success_rate    = j.value("success_rate", p.success_rate);
    p.average_time_ms = j.value("average_time_ms", p.average_time_ms);
    p.quality_score   = j.value("quality_score", p.quality_score);
    p.efficiency      = j.value("efficiency", p.efficiency);
    p.reliability     = j.value("reliability", p.reliability);
    p.sample_size     = j.value("sample_size", 0);
    return p;
}

bool agent_capability::has_capability(const std::string & capability) const {
    return std::find(capabilities.begin(), capabilities.end(), capability) != capabilities.end();
}

json agent_capability::to_json() const {
    json by_type = json::object();
    for (const auto & [type, stats] : performance_by_type) {
        by_type[type] = stats.to_json();
    }

    return json{
        {"agent_id", agent_id},
        {"capabilities", capabilities},
        {"current_load", current_load},
        {"max_load", max_load},
        {"performance", {
            {"by_task_type", by_type},
            {"overall", overall.to_json()}
        }},
        {"status", availability_status_to_str(status)},
        {"trust_score", trust_score},
        {"specializations", specializations},
        {"cost", cost}
    };
}

agent_capability agent_capability::from_json(const json & j) {
    agent_capability a;
    a.agent_id        = j.value("agent_id", "");
    a.capabilities    = j.value("capabilities", std::vector<std::string>{});
    a.current_load    = j.value("current_load", 0);
    a.max_load        = j.value("max_load", 1);
    a.status          = str_to_availability_status(j.value("status", "available"));
    a.trust_score     = j.value("trust_score", 1.0);
    a.specializations = j.value("specializations", std::vector<std::string>{});
    a.cost            = j.value("cost", 1.0);

    if (j.contains("performance")) {
        const auto & p = j["performance"];
        a.overall = performance_stats::from_json(p.value("overall", json::object()));
        const json by_type = p.value("by_task_type", json::object());
        for (auto it = by_type.begin(); it != by_type.end(); ++it) {
            a.performance_by_type[it.key()] = performance_stats::from_json(it.value());
        }
    }
    return a;
}

} // namespace swarm
